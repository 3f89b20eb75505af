#pragma once

#include <string>
#include <mutex>
#include <chrono>

enum class BreakerState {
    CLOSED,
    OPEN
};

std::string breaker_state_to_string(BreakerState state);

class CircuitBreaker {
public:
    CircuitBreaker(int max_consecutive_errors,
                   std::chrono::milliseconds reset_window,
                   double decay_factor = 0.5);

    // Applies the time-based Open -> Closed transition before answering
    bool is_open();
    BreakerState state();

    // Returns true when this failure opened the breaker
    bool record_failure(int weight = 1);
    void record_success();
    void reset();

    int consecutive_errors() const;
    std::chrono::milliseconds remaining_open_time();

private:
    int max_consecutive_errors_;
    std::chrono::milliseconds reset_window_;
    double decay_factor_;

    mutable std::mutex mutex_;
    BreakerState state_;
    int consecutive_errors_;
    std::chrono::steady_clock::time_point reopen_at_;

    void transition(BreakerState next, std::chrono::steady_clock::time_point now);
    void refresh(std::chrono::steady_clock::time_point now);
};
