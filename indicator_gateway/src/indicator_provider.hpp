#pragma once

#include "indicator_set.hpp"
#include <string>
#include <nlohmann/json.hpp>

struct ProviderResponse {
    long status = 0;           // HTTP status, 0 when no response arrived
    nlohmann::json body;
    std::string error;         // transport or parse error
    bool timed_out = false;

    bool ok() const { return status >= 200 && status < 300 && error.empty(); }
};

// Seam between the scheduler and the indicator API
class IndicatorProvider {
public:
    virtual ~IndicatorProvider() = default;

    virtual ProviderResponse fetch_indicator(const std::string& provider_symbol,
                                             const std::string& interval,
                                             const std::string& exchange,
                                             const IndicatorSpec& spec) = 0;

    virtual ProviderResponse fetch_bulk(const nlohmann::json& constructs) = 0;

    virtual ProviderResponse fetch_exchange_symbols(const std::string& exchange) = 0;
};
