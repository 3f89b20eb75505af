#include "circuit_breaker.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

std::string breaker_state_to_string(BreakerState state) {
    return state == BreakerState::OPEN ? "open" : "closed";
}

CircuitBreaker::CircuitBreaker(int max_consecutive_errors,
                               std::chrono::milliseconds reset_window,
                               double decay_factor)
    : max_consecutive_errors_(max_consecutive_errors)
    , reset_window_(reset_window)
    , decay_factor_(decay_factor)
    , state_(BreakerState::CLOSED)
    , consecutive_errors_(0)
{}

void CircuitBreaker::transition(BreakerState next, std::chrono::steady_clock::time_point now) {
    if (next == state_) return;

    if (next == BreakerState::OPEN) {
        reopen_at_ = now + reset_window_;
        spdlog::error("Circuit breaker OPENED after {} consecutive errors, retry in {}s",
                      consecutive_errors_,
                      std::chrono::duration_cast<std::chrono::seconds>(reset_window_).count());
    } else {
        consecutive_errors_ = 0;
        spdlog::info("Circuit breaker CLOSED, resuming provider calls");
    }

    state_ = next;
}

void CircuitBreaker::refresh(std::chrono::steady_clock::time_point now) {
    if (state_ == BreakerState::OPEN && now >= reopen_at_) {
        transition(BreakerState::CLOSED, now);
    }
}

bool CircuitBreaker::is_open() {
    std::lock_guard<std::mutex> lock(mutex_);
    refresh(std::chrono::steady_clock::now());
    return state_ == BreakerState::OPEN;
}

BreakerState CircuitBreaker::state() {
    std::lock_guard<std::mutex> lock(mutex_);
    refresh(std::chrono::steady_clock::now());
    return state_;
}

bool CircuitBreaker::record_failure(int weight) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::steady_clock::now();
    refresh(now);

    if (weight <= 0 || state_ == BreakerState::OPEN) {
        return false;
    }

    consecutive_errors_ += weight;
    spdlog::debug("Provider failure recorded (weight {}), consecutive errors: {}",
                  weight, consecutive_errors_);

    if (consecutive_errors_ >= max_consecutive_errors_) {
        transition(BreakerState::OPEN, now);
        return true;
    }

    return false;
}

void CircuitBreaker::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    refresh(std::chrono::steady_clock::now());

    if (state_ == BreakerState::CLOSED && consecutive_errors_ > 0) {
        consecutive_errors_ = static_cast<int>(std::floor(consecutive_errors_ * decay_factor_));
    }
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = BreakerState::CLOSED;
    consecutive_errors_ = 0;
    spdlog::info("Circuit breaker reset");
}

int CircuitBreaker::consecutive_errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_errors_;
}

std::chrono::milliseconds CircuitBreaker::remaining_open_time() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    refresh(now);

    if (state_ == BreakerState::CLOSED) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(reopen_at_ - now);
}
