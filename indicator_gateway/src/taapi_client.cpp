#include "taapi_client.hpp"
#include "error_classifier.hpp"
#include <spdlog/spdlog.h>

TaapiClient::TaapiClient(const std::string& base_url,
                         const std::string& secret,
                         std::shared_ptr<HttpClient> http,
                         int request_timeout_ms,
                         int bulk_timeout_ms)
    : base_url_(base_url)
    , secret_(secret)
    , http_(http)
    , request_timeout_ms_(request_timeout_ms)
    , bulk_timeout_ms_(bulk_timeout_ms)
{}

ProviderResponse TaapiClient::to_provider_response(const HttpResult& http) {
    ProviderResponse response;
    response.status = http.status;
    response.error = http.error;
    response.timed_out = http.timed_out;

    if (!http.error.empty() || http.body.empty()) {
        return response;
    }

    try {
        response.body = nlohmann::json::parse(http.body);
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse TAAPI response: {}", e.what());
        response.error = "invalid JSON in provider response";
        return response;
    }

    if (!response.ok() && response.status != 0) {
        spdlog::warn("TAAPI returned HTTP {}: {}", response.status, extract_error_message(response.body));
    }

    return response;
}

ProviderResponse TaapiClient::fetch_indicator(const std::string& provider_symbol,
                                              const std::string& interval,
                                              const std::string& exchange,
                                              const IndicatorSpec& spec) {
    std::vector<std::pair<std::string, std::string>> params = {
        {"secret", secret_},
        {"exchange", exchange},
        {"symbol", provider_symbol},
        {"interval", interval}
    };

    for (const auto& [key, value] : spec.params.items()) {
        params.emplace_back(key, value.is_string() ? value.get<std::string>() : value.dump());
    }

    spdlog::debug("TAAPI {} for {} ({})", spec.indicator, provider_symbol, interval);
    auto http = http_->get(base_url_ + "/" + spec.indicator, params, request_timeout_ms_);
    return to_provider_response(http);
}

ProviderResponse TaapiClient::fetch_bulk(const nlohmann::json& constructs) {
    nlohmann::json payload = {
        {"secret", secret_},
        {"construct", constructs}
    };

    spdlog::debug("TAAPI bulk request with {} constructs", constructs.size());
    auto http = http_->post_json(base_url_ + "/bulk", payload.dump(), bulk_timeout_ms_);
    return to_provider_response(http);
}

ProviderResponse TaapiClient::fetch_exchange_symbols(const std::string& exchange) {
    std::vector<std::pair<std::string, std::string>> params = {
        {"secret", secret_},
        {"exchange", exchange}
    };

    auto http = http_->get(base_url_ + "/exchange-symbols", params, request_timeout_ms_ + 5000);
    return to_provider_response(http);
}
