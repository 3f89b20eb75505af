#pragma once

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

enum class SnapshotSource {
    LIVE,
    BATCH,
    FALLBACK
};

std::string source_to_string(SnapshotSource source);

// Indicator values for one symbol. Passed by value and never mutated once
// handed to a caller.
struct IndicatorSnapshot {
    std::string symbol;
    nlohmann::json values = nlohmann::json::object();
    SnapshotSource source = SnapshotSource::FALLBACK;
    bool is_fallback_data = true;
    int real_indicator_count = 0;
    int64_t timestamp_ms = 0;
    std::string fallback_reason;

    nlohmann::json to_json() const;
};
