#pragma once

#include "indicator_snapshot.hpp"
#include <string>
#include <unordered_map>
#include <optional>
#include <mutex>
#include <chrono>

struct CacheEntry {
    IndicatorSnapshot snapshot;
    std::chrono::steady_clock::time_point stored_at;
};

class ResultCache {
public:
    explicit ResultCache(std::chrono::milliseconds ttl,
                         std::chrono::milliseconds sweep_interval = std::chrono::milliseconds(0));

    std::optional<IndicatorSnapshot> get(const std::string& key);
    void set(const std::string& key, const IndicatorSnapshot& snapshot);

    size_t sweep();
    void clear();
    size_t size() const;

private:
    std::chrono::milliseconds ttl_;
    std::chrono::milliseconds sweep_interval_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, CacheEntry> entries_;
    std::chrono::steady_clock::time_point last_sweep_;

    bool is_expired(const CacheEntry& entry, std::chrono::steady_clock::time_point now) const;
    size_t sweep_locked(std::chrono::steady_clock::time_point now);
};
