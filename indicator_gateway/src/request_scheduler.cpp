#include "request_scheduler.hpp"
#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <stdexcept>

namespace {

std::chrono::milliseconds delay_for(const PlanLimits& limits) {
    if (limits.requests_per_minute <= 0) {
        return std::chrono::milliseconds(15000);
    }
    return std::chrono::milliseconds(60000 / limits.requests_per_minute);
}

} // namespace

SchedulerOptions SchedulerOptions::from_config(const Config& cfg) {
    SchedulerOptions options;

    options.default_interval = cfg.default_interval;
    options.default_exchange = cfg.default_exchange;
    options.cache_ttl = std::chrono::seconds(cfg.cache_ttl_seconds);

    if (cfg.rate_limit_delay_ms > 0) {
        options.min_call_delay = std::chrono::milliseconds(cfg.rate_limit_delay_ms);
    }
    options.inter_call_pause = std::chrono::milliseconds(cfg.inter_call_pause_ms);
    options.throttle_cooldown = std::chrono::seconds(cfg.throttle_cooldown_seconds);

    options.max_consecutive_errors = cfg.breaker_max_errors;
    options.breaker_reset_window = std::chrono::seconds(cfg.breaker_reset_seconds);
    options.breaker_decay_factor = cfg.breaker_decay_pct / 100.0;
    options.auth_failure_weight = cfg.auth_failure_weight;

    options.bulk_enabled = cfg.bulk_enabled;
    options.batch_size = static_cast<size_t>(cfg.batch_size);
    options.batch_window = std::chrono::milliseconds(cfg.batch_window_ms);

    return options;
}

std::string scheduler_state_to_string(SchedulerState state) {
    switch (state) {
        case SchedulerState::IDLE: return "idle";
        case SchedulerState::DRAINING: return "draining";
        case SchedulerState::STOPPED: return "stopped";
    }
    return "unknown";
}

nlohmann::json SchedulerHealth::to_json() const {
    return {
        {"breaker_open", breaker_open},
        {"consecutive_errors", consecutive_errors},
        {"rate_limited", rate_limited},
        {"queue_length", queue_length},
        {"cache_size", cache_size},
        {"plan_tier", plan_tier_to_string(plan_tier)},
        {"state", scheduler_state_to_string(state)},
        {"in_flight", in_flight},
        {"backoff_multiplier", backoff_multiplier},
        {"blacklisted_count", blacklisted_count},
        {"batching_enabled", batching_enabled}
    };
}

RequestScheduler::RequestScheduler(const SchedulerOptions& options,
                                   std::shared_ptr<IndicatorProvider> provider,
                                   std::shared_ptr<SymbolCapabilityManager> symbols)
    : options_(options)
    , provider_(provider)
    , symbols_(symbols)
    , cache_(options.cache_ttl)
    , breaker_(options.max_consecutive_errors, options.breaker_reset_window, options.breaker_decay_factor)
    , limiter_(options.min_call_delay.value_or(std::chrono::milliseconds(0)), options.throttle_cooldown)
    , batcher_(options.batch_size, options.batch_window)
    , state_(SchedulerState::IDLE)
    , running_(false)
    , flush_requested_(false)
    , reset_generation_(0)
    , batching_enabled_(false)
{
    if (!provider_ || !symbols_) {
        throw std::runtime_error("RequestScheduler requires a provider and a symbol manager");
    }
}

RequestScheduler::~RequestScheduler() {
    stop();
}

void RequestScheduler::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) return;
        running_ = true;
        state_ = SchedulerState::IDLE;
    }

    apply_plan_limits();
    worker_ = std::thread(&RequestScheduler::drain_loop, this);

    spdlog::info("Request scheduler started (plan: {}, min delay: {}ms, batching: {})",
                 plan_tier_to_string(symbols_->plan_tier()),
                 limiter_.min_delay().count(),
                 batching_enabled_ ? "on" : "off");
}

void RequestScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    limiter_.interrupt();

    if (worker_.joinable()) {
        worker_.join();
    }

    drain_with_fallback("scheduler_stopped");

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SchedulerState::STOPPED;
    }
    spdlog::info("Request scheduler stopped");
}

std::string RequestScheduler::make_cache_key(const std::string& symbol,
                                             const std::string& interval,
                                             const std::string& exchange) {
    return fmt::format("{}_{}_{}", symbol, interval, exchange);
}

std::future<IndicatorSnapshot> RequestScheduler::ready_future(const IndicatorSnapshot& snapshot) {
    std::promise<IndicatorSnapshot> promise;
    promise.set_value(snapshot);
    return promise.get_future();
}

std::future<IndicatorSnapshot> RequestScheduler::enqueue(const std::string& symbol,
                                                         const std::string& interval,
                                                         const std::string& exchange) {
    std::string normalized = SymbolCapabilityManager::normalize(symbol);

    try {
        if (normalized.empty()) {
            return ready_future(fallback_.build(normalized, "malformed_symbol"));
        }

        const std::string& iv = interval.empty() ? options_.default_interval : interval;
        const std::string& ex = exchange.empty() ? options_.default_exchange : exchange;
        std::string key = make_cache_key(normalized, iv, ex);

        if (auto cached = cache_.get(key)) {
            spdlog::debug("Cache hit for {}", key);
            return ready_future(*cached);
        }

        SymbolRoute route = symbols_->route(normalized);
        if (route.strategy == RouteStrategy::FALLBACK_ONLY) {
            spdlog::debug("{} routed to fallback ({})", normalized, route.reason);
            return ready_future(fallback_.build(normalized, route.reason));
        }

        if (breaker_.is_open()) {
            return ready_future(fallback_.build(normalized, "circuit_open"));
        }

        std::promise<IndicatorSnapshot> promise;
        auto future = promise.get_future();

        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (!running_) {
                return ready_future(fallback_.build(normalized, "scheduler_stopped"));
            }

            auto it = in_flight_.find(key);
            if (it != in_flight_.end()) {
                it->second->waiters.push_back(std::move(promise));
                spdlog::debug("Attached to in-flight request {} ({} waiters)",
                              key, it->second->waiters.size());
                return future;
            }

            auto request = std::make_shared<PendingRequest>();
            request->symbol = normalized;
            request->provider_symbol = route.provider_symbol;
            request->interval = iv;
            request->exchange = ex;
            request->cache_key = key;
            request->created_at = std::chrono::steady_clock::now();
            request->waiters.push_back(std::move(promise));

            in_flight_[key] = request;
            queue_.push_back(request);
            spdlog::debug("Queued {} (queue length {})", key, queue_.size());
        }

        cv_.notify_all();
        return future;

    } catch (const std::exception& e) {
        spdlog::error("Failed to enqueue {}: {}", symbol, e.what());
        return ready_future(fallback_.build(normalized, "internal_error"));
    }
}

IndicatorSnapshot RequestScheduler::fetch(const std::string& symbol,
                                          const std::string& interval,
                                          const std::string& exchange) {
    return enqueue(symbol, interval, exchange).get();
}

SchedulerHealth RequestScheduler::get_health() {
    SchedulerHealth health;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        health.queue_length = queue_.size();
        health.in_flight = in_flight_.size();
        health.state = state_;
    }

    health.breaker_open = breaker_.is_open();
    health.consecutive_errors = breaker_.consecutive_errors();
    health.rate_limited = limiter_.is_rate_limited();
    health.backoff_multiplier = limiter_.backoff_multiplier();
    health.cache_size = cache_.size();
    health.plan_tier = symbols_->plan_tier();
    health.blacklisted_count = symbols_->blacklisted_count();
    health.batching_enabled = batching_enabled_;

    return health;
}

void RequestScheduler::force_reset() {
    spdlog::warn("Force reset requested");

    breaker_.reset();
    limiter_.reset();
    cache_.clear();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        reset_generation_++;
    }
    cv_.notify_all();

    size_t drained = drain_with_fallback("reset");
    spdlog::info("Force reset complete, {} queued request(s) released", drained);
}

void RequestScheduler::force_flush() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        flush_requested_ = true;
    }
    cv_.notify_all();
    spdlog::info("Forced flush of pending requests");
}

void RequestScheduler::apply_plan_limits() {
    PlanLimits limits = symbols_->plan_limits();

    std::chrono::milliseconds delay = options_.min_call_delay.value_or(delay_for(limits));
    limiter_.set_min_delay(delay);

    size_t batch_size = options_.batch_size;
    if (limits.max_batch_symbols > 0) {
        batch_size = std::min(batch_size, static_cast<size_t>(limits.max_batch_symbols));
    }
    batcher_.set_batch_size(batch_size);

    batching_enabled_ = options_.bulk_enabled && limits.supports_bulk;

    spdlog::debug("Plan limits applied: {} rpm, delay {}ms, batch size {}, bulk {}",
                  limits.requests_per_minute, delay.count(), batcher_.batch_size(),
                  batching_enabled_ ? "enabled" : "disabled");
}

void RequestScheduler::maybe_refresh_capabilities() {
    if (!symbols_->refresh_due()) return;

    // Symbol discovery is a provider call like any other
    if (limiter_.await_clearance() != Clearance::GRANTED) {
        spdlog::debug("Deferring symbol refresh, no rate limit clearance");
        return;
    }

    if (symbols_->refresh()) {
        apply_plan_limits();
    }
}

void RequestScheduler::pause(std::chrono::milliseconds duration) {
    if (duration.count() <= 0) return;

    std::unique_lock<std::mutex> lock(mutex_);
    uint64_t generation = reset_generation_;
    cv_.wait_for(lock, duration, [&] {
        return !running_ || reset_generation_ != generation;
    });
}

std::string RequestScheduler::interruption_reason() {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_ ? "reset" : "scheduler_stopped";
}

void RequestScheduler::drain_loop() {
    spdlog::info("Drain loop running");

    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });
            if (!running_) break;

            if (batching_enabled_) {
                wait_for_batch(lock);
                if (!running_) break;
            }

            if (queue_.empty()) {
                state_ = SchedulerState::IDLE;
                continue;
            }
            state_ = SchedulerState::DRAINING;
        }

        maybe_refresh_capabilities();

        if (breaker_.is_open()) {
            drain_with_fallback("circuit_open");
            continue;
        }

        std::vector<PendingPtr> work;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            work = take_next_locked();
        }
        if (work.empty()) continue;

        if (batching_enabled_) {
            process_batch(work);
        } else {
            for (const auto& request : work) {
                process_single(request);
            }
            pause(options_.inter_call_pause);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty()) {
                state_ = SchedulerState::IDLE;
            }
        }
    }

    spdlog::info("Drain loop exited");
}

void RequestScheduler::wait_for_batch(std::unique_lock<std::mutex>& lock) {
    if (queue_.empty()) return;

    auto deadline = queue_.front()->created_at + batcher_.collection_window();
    cv_.wait_until(lock, deadline, [&] {
        if (!running_ || flush_requested_ || queue_.empty()) return true;
        auto oldest_age = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - queue_.front()->created_at);
        return batcher_.ready(queue_.size(), oldest_age);
    });

    flush_requested_ = false;
}

std::vector<RequestScheduler::PendingPtr> RequestScheduler::take_next_locked() {
    std::vector<PendingPtr> taken;
    if (queue_.empty()) return taken;

    taken.push_back(queue_.front());
    queue_.pop_front();

    if (!batching_enabled_) return taken;

    // Contiguous run only, later submissions never overtake earlier ones
    PendingPtr head = taken.front();
    while (!queue_.empty() && taken.size() < batcher_.batch_size()) {
        PendingPtr next = queue_.front();
        if (next->interval != head->interval || next->exchange != head->exchange) break;
        taken.push_back(next);
        queue_.pop_front();
    }

    return taken;
}

ProviderResponse RequestScheduler::call_provider(const std::function<ProviderResponse()>& call) {
    try {
        return call();
    } catch (const std::exception& e) {
        spdlog::error("Provider call threw: {}", e.what());
        ProviderResponse response;
        response.error = e.what();
        return response;
    }
}

std::string RequestScheduler::describe(const ProviderResponse& response) {
    if (response.timed_out) {
        return "request timed out";
    }
    if (!response.error.empty()) {
        return fmt::format("HTTP {}: {}", response.status, response.error);
    }
    return fmt::format("HTTP {}: {}", response.status, extract_error_message(response.body));
}

void RequestScheduler::process_single(const PendingPtr& request) {
    IndicatorSnapshot snapshot;
    snapshot.symbol = request->symbol;
    snapshot.source = SnapshotSource::LIVE;
    snapshot.is_fallback_data = false;

    for (const auto& spec : options_.single_call_indicators) {
        if (breaker_.is_open()) {
            resolve_with_fallback(request, "circuit_open");
            return;
        }

        Clearance clearance = limiter_.await_clearance();
        if (clearance == Clearance::THROTTLED) {
            resolve_with_fallback(request, "rate_limited");
            return;
        }
        if (clearance == Clearance::INTERRUPTED) {
            resolve_with_fallback(request, interruption_reason());
            return;
        }

        spdlog::debug("Fetching {} for {}", spec.tag, request->provider_symbol);
        ProviderResponse response = call_provider([&] {
            return provider_->fetch_indicator(request->provider_symbol, request->interval,
                                              request->exchange, spec);
        });

        if (!response.ok()) {
            handle_failure(request, classify(response), describe(response));
            return;
        }

        auto value = indicator_set::parse_result(spec, response.body);
        if (value) {
            snapshot.values[spec.tag] = *value;
            snapshot.real_indicator_count++;
        } else {
            spdlog::warn("Unparsable {} result for {}: {}", spec.tag, request->symbol,
                         response.body.dump());
        }
    }

    if (snapshot.real_indicator_count == 0) {
        handle_failure(request, ErrorClass::TRANSIENT, "no parsable indicator values");
        return;
    }

    snapshot.timestamp_ms = util::current_timestamp_ms();
    handle_success(request, snapshot);
}

void RequestScheduler::process_batch(const std::vector<PendingPtr>& batch) {
    const auto& head = batch.front();

    std::vector<BatchMember> members;
    members.reserve(batch.size());
    for (const auto& request : batch) {
        members.push_back({request->symbol, request->provider_symbol});
    }

    if (breaker_.is_open()) {
        for (const auto& request : batch) {
            resolve_with_fallback(request, "circuit_open");
        }
        return;
    }

    Clearance clearance = limiter_.await_clearance();
    if (clearance != Clearance::GRANTED) {
        std::string reason = clearance == Clearance::THROTTLED ? "rate_limited" : interruption_reason();
        for (const auto& request : batch) {
            resolve_with_fallback(request, reason);
        }
        return;
    }

    nlohmann::json constructs = batcher_.build_request(members, head->interval, head->exchange,
                                                       options_.bulk_indicators);
    ProviderResponse response = call_provider([&] {
        return provider_->fetch_bulk(constructs);
    });

    if (!response.ok()) {
        ErrorClass cls = classify(response);

        // A bulk level rejection does not say which symbol is at fault
        if (batch.size() > 1 &&
            (cls == ErrorClass::ENTITLEMENT_DENIED || cls == ErrorClass::MALFORMED_SYMBOL)) {
            spdlog::warn("Bulk request rejected ({}), retrying {} symbols individually",
                         describe(response), batch.size());
            for (const auto& request : batch) {
                process_batch({request});
            }
            return;
        }

        spdlog::warn("Bulk request for {} symbols failed ({}): {}", batch.size(),
                     error_class_to_string(cls), describe(response));

        bool opened = apply_error_policy(cls, batch.size() == 1 ? head->symbol : "");
        for (const auto& request : batch) {
            resolve_with_fallback(request, error_class_to_string(cls));
        }
        if (opened) {
            drain_with_fallback("circuit_open");
        }
        return;
    }

    if (!BatchAggregator::well_formed(response.body)) {
        spdlog::warn("Bulk response has no data array, using fallback for {} symbols", batch.size());
        bool opened = apply_error_policy(ErrorClass::TRANSIENT, "");
        for (const auto& request : batch) {
            resolve_with_fallback(request, "malformed_batch_entry");
        }
        if (opened) {
            drain_with_fallback("circuit_open");
        }
        return;
    }

    SnapshotSource source = batch.size() > 1 ? SnapshotSource::BATCH : SnapshotSource::LIVE;
    auto outcomes = batcher_.demultiplex(response.body, members, options_.bulk_indicators, source);

    int delivered = 0;
    for (size_t i = 0; i < batch.size(); ++i) {
        const auto& request = batch[i];
        const auto& outcome = outcomes[i];

        if (outcome.ok) {
            cache_.set(request->cache_key, outcome.snapshot);
            resolve(request, outcome.snapshot);
            delivered++;
            continue;
        }

        // Per item errors never feed the breaker, the call itself succeeded
        if (outcome.error) {
            ErrorPolicy policy = policy_for(*outcome.error, options_.auth_failure_weight);
            if (policy.blacklist) {
                symbols_->mark_unsupported(request->symbol, outcome.reason);
            }
            if (policy.throttle) {
                limiter_.engage_throttle();
            }
        }
        resolve_with_fallback(request, outcome.reason);
    }

    breaker_.record_success();
    limiter_.relax_backoff();

    spdlog::info("Bulk call delivered {}/{} symbols", delivered, batch.size());
}

bool RequestScheduler::apply_error_policy(ErrorClass cls, const std::string& blacklist_symbol) {
    ErrorPolicy policy = policy_for(cls, options_.auth_failure_weight);

    if (policy.throttle) {
        limiter_.engage_throttle();
    }
    if (policy.blacklist && !blacklist_symbol.empty()) {
        symbols_->mark_unsupported(blacklist_symbol, error_class_to_string(cls));
    }

    return breaker_.record_failure(policy.breaker_weight);
}

void RequestScheduler::handle_success(const PendingPtr& request, const IndicatorSnapshot& snapshot) {
    breaker_.record_success();
    limiter_.relax_backoff();
    cache_.set(request->cache_key, snapshot);

    spdlog::info("Fetched {} indicators for {}", snapshot.real_indicator_count, request->symbol);
    resolve(request, snapshot);
}

void RequestScheduler::handle_failure(const PendingPtr& request, ErrorClass cls, const std::string& detail) {
    if (cls == ErrorClass::TRANSIENT) {
        spdlog::warn("Provider call for {} failed: {}", request->symbol, detail);
    } else {
        spdlog::error("Provider call for {} failed ({}): {}", request->symbol,
                      error_class_to_string(cls), detail);
    }

    bool opened = apply_error_policy(cls, request->symbol);
    resolve_with_fallback(request, error_class_to_string(cls));

    if (opened) {
        drain_with_fallback("circuit_open");
    }
}

void RequestScheduler::resolve(const PendingPtr& request, const IndicatorSnapshot& snapshot) {
    std::vector<std::promise<IndicatorSnapshot>> waiters;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = in_flight_.find(request->cache_key);
        if (it != in_flight_.end() && it->second == request) {
            in_flight_.erase(it);
        }
        waiters = std::move(request->waiters);
        request->waiters.clear();
    }

    for (auto& waiter : waiters) {
        waiter.set_value(snapshot);
    }
    spdlog::debug("Resolved {} waiter(s) for {}", waiters.size(), request->cache_key);
}

void RequestScheduler::resolve_with_fallback(const PendingPtr& request, const std::string& reason) {
    resolve(request, fallback_.build(request->symbol, reason));
}

size_t RequestScheduler::drain_with_fallback(const std::string& reason) {
    std::deque<PendingPtr> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(queue_);
    }

    for (const auto& request : drained) {
        resolve_with_fallback(request, reason);
    }

    if (!drained.empty()) {
        spdlog::warn("Drained {} queued request(s) with fallback data ({})", drained.size(), reason);
    }
    return drained.size();
}
