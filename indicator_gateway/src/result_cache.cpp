#include "result_cache.hpp"
#include <spdlog/spdlog.h>

ResultCache::ResultCache(std::chrono::milliseconds ttl, std::chrono::milliseconds sweep_interval)
    : ttl_(ttl)
    , sweep_interval_(sweep_interval.count() > 0 ? sweep_interval : ttl)
    , last_sweep_(std::chrono::steady_clock::now())
{}

bool ResultCache::is_expired(const CacheEntry& entry, std::chrono::steady_clock::time_point now) const {
    return now - entry.stored_at >= ttl_;
}

std::optional<IndicatorSnapshot> ResultCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }

    if (is_expired(it->second, std::chrono::steady_clock::now())) {
        entries_.erase(it);
        return std::nullopt;
    }

    return it->second.snapshot;
}

void ResultCache::set(const std::string& key, const IndicatorSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::steady_clock::now();
    entries_[key] = CacheEntry{snapshot, now};

    if (now - last_sweep_ >= sweep_interval_) {
        sweep_locked(now);
    }
}

size_t ResultCache::sweep_locked(std::chrono::steady_clock::time_point now) {
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (is_expired(it->second, now)) {
            it = entries_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    last_sweep_ = now;

    if (removed > 0) {
        spdlog::debug("Cache sweep removed {} expired entries", removed);
    }
    return removed;
}

size_t ResultCache::sweep() {
    std::lock_guard<std::mutex> lock(mutex_);
    return sweep_locked(std::chrono::steady_clock::now());
}

void ResultCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t ResultCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}
