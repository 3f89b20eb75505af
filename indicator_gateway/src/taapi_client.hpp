#pragma once

#include "indicator_provider.hpp"
#include "http_client.hpp"
#include <memory>
#include <string>

class TaapiClient : public IndicatorProvider {
public:
    TaapiClient(const std::string& base_url,
                const std::string& secret,
                std::shared_ptr<HttpClient> http,
                int request_timeout_ms = 10000,
                int bulk_timeout_ms = 30000);

    ProviderResponse fetch_indicator(const std::string& provider_symbol,
                                     const std::string& interval,
                                     const std::string& exchange,
                                     const IndicatorSpec& spec) override;

    ProviderResponse fetch_bulk(const nlohmann::json& constructs) override;

    ProviderResponse fetch_exchange_symbols(const std::string& exchange) override;

private:
    std::string base_url_;
    std::string secret_;
    std::shared_ptr<HttpClient> http_;
    int request_timeout_ms_;
    int bulk_timeout_ms_;

    static ProviderResponse to_provider_response(const HttpResult& http);
};
