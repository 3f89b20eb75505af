#include "indicator_set.hpp"

namespace indicator_set {

namespace {

std::optional<double> number_field(const nlohmann::json& result, const char* field) {
    if (!result.is_object() || !result.contains(field) || !result[field].is_number()) {
        return std::nullopt;
    }
    return result[field].get<double>();
}

} // namespace

const std::vector<IndicatorSpec>& bulk_set() {
    static const std::vector<IndicatorSpec> specs = {
        {"rsi", "rsi", {{"period", 14}}},
        {"macd", "macd", {{"optInFastPeriod", 12}, {"optInSlowPeriod", 26}, {"optInSignalPeriod", 9}}},
        {"ema20", "ema", {{"period", 20}}},
        {"ema50", "ema", {{"period", 50}}},
        {"ema200", "ema", {{"period", 200}}},
        {"bbands", "bbands", {{"period", 20}, {"stddev", 2}}},
        {"adx", "adx", {{"period", 14}}},
        {"atr", "atr", {{"period", 14}}},
        {"mfi", "mfi", {{"period", 14}}},
        {"stochrsi", "stochrsi", {{"period", 14}}}
    };
    return specs;
}

const std::vector<IndicatorSpec>& essential_set() {
    static const std::vector<IndicatorSpec> specs = {
        {"rsi", "rsi", {{"period", 14}}},
        {"macd", "macd", nlohmann::json::object()},
        {"bbands", "bbands", {{"period", 20}}},
        {"ema20", "ema", {{"period", 20}}}
    };
    return specs;
}

std::optional<nlohmann::json> parse_result(const IndicatorSpec& spec, const nlohmann::json& result) {
    if (spec.indicator == "macd") {
        auto macd = number_field(result, "valueMACD");
        auto signal = number_field(result, "valueMACDSignal");
        auto hist = number_field(result, "valueMACDHist");
        if (!macd || !signal || !hist) return std::nullopt;
        return nlohmann::json{{"macd", *macd}, {"signal", *signal}, {"histogram", *hist}};
    }

    if (spec.indicator == "bbands") {
        auto upper = number_field(result, "valueUpperBand");
        auto middle = number_field(result, "valueMiddleBand");
        auto lower = number_field(result, "valueLowerBand");
        if (!upper || !middle || !lower) return std::nullopt;
        return nlohmann::json{{"upper", *upper}, {"middle", *middle}, {"lower", *lower}};
    }

    if (spec.indicator == "stochrsi") {
        auto k = number_field(result, "valueFastK");
        auto d = number_field(result, "valueFastD");
        if (!k || !d) return std::nullopt;
        return nlohmann::json{{"k", *k}, {"d", *d}};
    }

    auto value = number_field(result, "value");
    if (!value) return std::nullopt;
    return nlohmann::json(*value);
}

} // namespace indicator_set
