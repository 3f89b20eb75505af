#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

struct IndicatorSpec {
    std::string tag;        // key in snapshot values, e.g. "ema50"
    std::string indicator;  // provider endpoint name, e.g. "ema"
    nlohmann::json params = nlohmann::json::object();
};

namespace indicator_set {
    // Full set requested per symbol in a bulk construct
    const std::vector<IndicatorSpec>& bulk_set();

    // Reduced set fetched one call at a time on plans without bulk access
    const std::vector<IndicatorSpec>& essential_set();

    // Converts one provider result into snapshot value form.
    // Returns nullopt when the result lacks the fields the indicator needs.
    std::optional<nlohmann::json> parse_result(const IndicatorSpec& spec, const nlohmann::json& result);
}
