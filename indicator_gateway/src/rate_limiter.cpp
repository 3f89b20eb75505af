#include "rate_limiter.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {
constexpr double kMaxBackoffMultiplier = 8.0;
constexpr double kBackoffRelaxFactor = 0.8;
}

RateLimiter::RateLimiter(std::chrono::milliseconds min_delay, std::chrono::milliseconds throttle_cooldown)
    : min_delay_(min_delay)
    , throttle_cooldown_(throttle_cooldown)
    , has_called_(false)
    , is_rate_limited_(false)
    , backoff_multiplier_(1.0)
    , interrupt_generation_(0)
{}

bool RateLimiter::check_rate_limit_locked(std::chrono::steady_clock::time_point now) {
    if (is_rate_limited_ && now >= rate_limited_until_) {
        is_rate_limited_ = false;
        spdlog::info("Provider rate limit period ended, resuming requests");
    }
    return is_rate_limited_;
}

Clearance RateLimiter::await_clearance() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (check_rate_limit_locked(std::chrono::steady_clock::now())) {
        return Clearance::THROTTLED;
    }

    if (has_called_) {
        auto spacing = std::chrono::duration_cast<std::chrono::milliseconds>(
            min_delay_ * backoff_multiplier_);
        auto ready_at = last_call_at_ + spacing;

        if (std::chrono::steady_clock::now() < ready_at) {
            spdlog::debug("Rate limiting: waiting {}ms",
                          std::chrono::duration_cast<std::chrono::milliseconds>(
                              ready_at - std::chrono::steady_clock::now()).count());

            uint64_t generation = interrupt_generation_;
            bool interrupted = cv_.wait_until(lock, ready_at, [&] {
                return interrupt_generation_ != generation;
            });
            if (interrupted) {
                return Clearance::INTERRUPTED;
            }
        }
    }

    // A throttle may have been engaged while we slept
    auto now = std::chrono::steady_clock::now();
    if (check_rate_limit_locked(now)) {
        return Clearance::THROTTLED;
    }

    last_call_at_ = now;
    has_called_ = true;
    return Clearance::GRANTED;
}

void RateLimiter::engage_throttle() {
    std::lock_guard<std::mutex> lock(mutex_);
    is_rate_limited_ = true;
    rate_limited_until_ = std::chrono::steady_clock::now() + throttle_cooldown_;
    backoff_multiplier_ = std::min(backoff_multiplier_ * 2.0, kMaxBackoffMultiplier);
    spdlog::warn("Provider rate limited, backing off for {}s (backoff x{:.2f})",
                 std::chrono::duration_cast<std::chrono::seconds>(throttle_cooldown_).count(),
                 backoff_multiplier_);
}

bool RateLimiter::is_rate_limited() {
    std::lock_guard<std::mutex> lock(mutex_);
    return check_rate_limit_locked(std::chrono::steady_clock::now());
}

void RateLimiter::relax_backoff() {
    std::lock_guard<std::mutex> lock(mutex_);
    backoff_multiplier_ = std::max(backoff_multiplier_ * kBackoffRelaxFactor, 1.0);
}

void RateLimiter::set_min_delay(std::chrono::milliseconds min_delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_delay_ = min_delay;
}

std::chrono::milliseconds RateLimiter::min_delay() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_delay_;
}

double RateLimiter::backoff_multiplier() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backoff_multiplier_;
}

void RateLimiter::interrupt() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        interrupt_generation_++;
    }
    cv_.notify_all();
}

void RateLimiter::reset() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        is_rate_limited_ = false;
        backoff_multiplier_ = 1.0;
        has_called_ = false;
        interrupt_generation_++;
    }
    cv_.notify_all();
    spdlog::info("Rate limiter reset");
}
