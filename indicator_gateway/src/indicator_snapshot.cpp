#include "indicator_snapshot.hpp"

std::string source_to_string(SnapshotSource source) {
    switch (source) {
        case SnapshotSource::LIVE: return "live";
        case SnapshotSource::BATCH: return "batch";
        case SnapshotSource::FALLBACK: return "fallback";
    }
    return "fallback";
}

nlohmann::json IndicatorSnapshot::to_json() const {
    nlohmann::json j = {
        {"symbol", symbol},
        {"values", values},
        {"source", source_to_string(source)},
        {"isFallbackData", is_fallback_data},
        {"realIndicators", real_indicator_count},
        {"timestamp", timestamp_ms}
    };

    if (is_fallback_data) {
        j["fallback_reason"] = fallback_reason;
    }

    return j;
}
