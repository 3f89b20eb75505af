#pragma once

#include <mutex>
#include <condition_variable>
#include <chrono>
#include <cstdint>

enum class Clearance {
    GRANTED,
    THROTTLED,
    INTERRUPTED
};

class RateLimiter {
public:
    RateLimiter(std::chrono::milliseconds min_delay, std::chrono::milliseconds throttle_cooldown);

    // Blocks until the minimum spacing since the last granted call has elapsed.
    // Never waits while the provider has throttled us.
    Clearance await_clearance();

    void engage_throttle();
    bool is_rate_limited();
    void relax_backoff();

    void set_min_delay(std::chrono::milliseconds min_delay);
    std::chrono::milliseconds min_delay() const;
    double backoff_multiplier() const;

    // Wakes any caller blocked in await_clearance()
    void interrupt();
    void reset();

private:
    std::chrono::milliseconds min_delay_;
    std::chrono::milliseconds throttle_cooldown_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::chrono::steady_clock::time_point last_call_at_;
    bool has_called_;
    bool is_rate_limited_;
    std::chrono::steady_clock::time_point rate_limited_until_;
    double backoff_multiplier_;
    uint64_t interrupt_generation_;

    bool check_rate_limit_locked(std::chrono::steady_clock::time_point now);
};
