#include "fallback_provider.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

nlohmann::json FallbackProvider::neutral_values() {
    // Oscillators sit mid-range, trend and volatility fields are zeroed
    return {
        {"rsi", 50.0},
        {"macd", {{"macd", 0.0}, {"signal", 0.0}, {"histogram", 0.0}}},
        {"ema20", 0.0},
        {"ema50", 0.0},
        {"ema200", 0.0},
        {"bbands", {{"upper", 0.0}, {"middle", 0.0}, {"lower", 0.0}}},
        {"adx", 20.0},
        {"atr", 0.0},
        {"mfi", 50.0},
        {"stochrsi", {{"k", 50.0}, {"d", 50.0}}}
    };
}

IndicatorSnapshot FallbackProvider::build(const std::string& symbol, const std::string& reason) const {
    spdlog::debug("Using fallback data for {} ({})", symbol, reason);

    IndicatorSnapshot snapshot;
    snapshot.symbol = symbol;
    snapshot.values = neutral_values();
    snapshot.source = SnapshotSource::FALLBACK;
    snapshot.is_fallback_data = true;
    snapshot.real_indicator_count = 0;
    snapshot.timestamp_ms = util::current_timestamp_ms();
    snapshot.fallback_reason = reason;

    return snapshot;
}
