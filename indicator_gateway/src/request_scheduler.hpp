#pragma once

#include "indicator_provider.hpp"
#include "indicator_snapshot.hpp"
#include "indicator_set.hpp"
#include "symbol_manager.hpp"
#include "result_cache.hpp"
#include "circuit_breaker.hpp"
#include "rate_limiter.hpp"
#include "fallback_provider.hpp"
#include "batch_aggregator.hpp"
#include "error_classifier.hpp"
#include <string>
#include <vector>
#include <deque>
#include <unordered_map>
#include <memory>
#include <future>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <optional>
#include <functional>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

struct Config;

struct SchedulerOptions {
    std::string default_interval = "1h";
    std::string default_exchange = "binance";

    std::chrono::milliseconds cache_ttl{300000};

    // nullopt = derive the spacing from the detected plan's request budget
    std::optional<std::chrono::milliseconds> min_call_delay;
    std::chrono::milliseconds inter_call_pause{2000};
    std::chrono::milliseconds throttle_cooldown{60000};

    int max_consecutive_errors = 3;
    std::chrono::milliseconds breaker_reset_window{300000};
    double breaker_decay_factor = 0.5;
    int auth_failure_weight = 2;

    bool bulk_enabled = true;
    size_t batch_size = 20;
    std::chrono::milliseconds batch_window{250};

    std::vector<IndicatorSpec> single_call_indicators = indicator_set::essential_set();
    std::vector<IndicatorSpec> bulk_indicators = indicator_set::bulk_set();

    static SchedulerOptions from_config(const Config& cfg);
};

enum class SchedulerState {
    IDLE,
    DRAINING,
    STOPPED
};

std::string scheduler_state_to_string(SchedulerState state);

struct SchedulerHealth {
    bool breaker_open;
    int consecutive_errors;
    bool rate_limited;
    size_t queue_length;
    size_t cache_size;
    PlanTier plan_tier;
    SchedulerState state;
    size_t in_flight;
    double backoff_multiplier;
    size_t blacklisted_count;
    bool batching_enabled;

    nlohmann::json to_json() const;
};

struct PendingRequest {
    std::string symbol;
    std::string provider_symbol;
    std::string interval;
    std::string exchange;
    std::string cache_key;
    std::chrono::steady_clock::time_point created_at;
    std::vector<std::promise<IndicatorSnapshot>> waiters;
};

class RequestScheduler {
public:
    RequestScheduler(const SchedulerOptions& options,
                     std::shared_ptr<IndicatorProvider> provider,
                     std::shared_ptr<SymbolCapabilityManager> symbols);
    ~RequestScheduler();

    RequestScheduler(const RequestScheduler&) = delete;
    RequestScheduler& operator=(const RequestScheduler&) = delete;

    void start();
    void stop();

    // Never throws. Failures come back as fallback snapshots.
    std::future<IndicatorSnapshot> enqueue(const std::string& symbol,
                                           const std::string& interval = "",
                                           const std::string& exchange = "");
    IndicatorSnapshot fetch(const std::string& symbol,
                            const std::string& interval = "",
                            const std::string& exchange = "");

    SchedulerHealth get_health();

    // Operator escape hatch: clears breaker, limiter and cache, then drains the
    // queue with fallback data
    void force_reset();
    void force_flush();

    static std::string make_cache_key(const std::string& symbol,
                                      const std::string& interval,
                                      const std::string& exchange);

private:
    using PendingPtr = std::shared_ptr<PendingRequest>;

    SchedulerOptions options_;
    std::shared_ptr<IndicatorProvider> provider_;
    std::shared_ptr<SymbolCapabilityManager> symbols_;

    ResultCache cache_;
    CircuitBreaker breaker_;
    RateLimiter limiter_;
    FallbackProvider fallback_;
    BatchAggregator batcher_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<PendingPtr> queue_;
    std::unordered_map<std::string, PendingPtr> in_flight_;
    SchedulerState state_;
    bool running_;
    bool flush_requested_;
    uint64_t reset_generation_;
    std::atomic<bool> batching_enabled_;
    std::thread worker_;

    void drain_loop();
    void wait_for_batch(std::unique_lock<std::mutex>& lock);
    std::vector<PendingPtr> take_next_locked();

    void process_single(const PendingPtr& request);
    void process_batch(const std::vector<PendingPtr>& batch);

    bool acquire_clearance(const std::vector<PendingPtr>& requests);
    ProviderResponse call_provider(const std::function<ProviderResponse()>& call);

    void handle_success(const PendingPtr& request, const IndicatorSnapshot& snapshot);
    void handle_failure(const PendingPtr& request, ErrorClass cls, const std::string& detail);
    bool apply_error_policy(ErrorClass cls, const std::string& blacklist_symbol);

    void resolve(const PendingPtr& request, const IndicatorSnapshot& snapshot);
    void resolve_with_fallback(const PendingPtr& request, const std::string& reason);
    size_t drain_with_fallback(const std::string& reason);

    void apply_plan_limits();
    void maybe_refresh_capabilities();
    void pause(std::chrono::milliseconds duration);
    std::string interruption_reason();

    static std::future<IndicatorSnapshot> ready_future(const IndicatorSnapshot& snapshot);
    static std::string describe(const ProviderResponse& response);
};
