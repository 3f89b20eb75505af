#include <catch2/catch_test_macros.hpp>
#include "../src/request_scheduler.hpp"
#include "../src/config.hpp"
#include "fake_provider.hpp"
#include <future>
#include <mutex>
#include <thread>

using namespace std::chrono_literals;

namespace {

SchedulerOptions fast_options() {
    SchedulerOptions options;
    options.min_call_delay = 1ms;
    options.inter_call_pause = 0ms;
    options.throttle_cooldown = 300ms;
    options.breaker_reset_window = 150ms;
    options.cache_ttl = 5000ms;
    options.batch_window = 50ms;
    options.single_call_indicators = {IndicatorSpec{"rsi", "rsi", {{"period", 14}}}};
    return options;
}

struct SchedulerHarness {
    std::shared_ptr<FakeProvider> provider = std::make_shared<FakeProvider>();
    std::shared_ptr<SymbolCapabilityManager> symbols;
    std::shared_ptr<RequestScheduler> scheduler;

    explicit SchedulerHarness(PlanTier tier, const SchedulerOptions& options = fast_options()) {
        symbols = std::make_shared<SymbolCapabilityManager>(provider, "binance",
                                                            std::chrono::hours(24), tier);
        symbols->initialize();
        scheduler = std::make_shared<RequestScheduler>(options, provider, symbols);
        scheduler->start();
    }
};

bool is_ready(std::future<IndicatorSnapshot>& future, std::chrono::milliseconds timeout = 0ms) {
    return future.wait_for(timeout) == std::future_status::ready;
}

} // namespace

TEST_CASE("Concurrent requests for one key share a provider call", "[scheduler]") {
    SchedulerHarness harness(PlanTier::FREE);
    harness.provider->latency = 100ms;

    std::vector<std::future<IndicatorSnapshot>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(std::async(std::launch::async, [&harness] {
            return harness.scheduler->fetch("BTCUSDT");
        }));
    }

    std::vector<IndicatorSnapshot> snapshots;
    for (auto& future : futures) {
        snapshots.push_back(future.get());
    }

    REQUIRE(harness.provider->indicator_calls == 1);
    for (const auto& snapshot : snapshots) {
        REQUIRE_FALSE(snapshot.is_fallback_data);
        REQUIRE(snapshot.source == SnapshotSource::LIVE);
        REQUIRE(snapshot.timestamp_ms == snapshots.front().timestamp_ms);
        REQUIRE(snapshot.values["rsi"] == 42.0);
    }
}

TEST_CASE("Free plan fetches the essential set one call at a time", "[scheduler]") {
    auto options = fast_options();
    options.single_call_indicators = indicator_set::essential_set();

    SchedulerHarness harness(PlanTier::FREE, options);
    harness.provider->on_indicator = [](const std::string&, const IndicatorSpec& spec) {
        return FakeProvider::ok(FakeProvider::result_for(spec.indicator));
    };

    auto snapshot = harness.scheduler->fetch("ethusdt");

    REQUIRE(harness.provider->indicator_calls == 4);
    REQUIRE(harness.provider->bulk_calls == 0);
    REQUIRE(snapshot.symbol == "ETHUSDT");
    REQUIRE(snapshot.real_indicator_count == 4);
    REQUIRE(snapshot.values["bbands"]["upper"] == 110.0);
    REQUIRE(harness.provider->fetched_symbols().front() == "ETH/USDT");
}

TEST_CASE("Results are cached until the TTL expires", "[scheduler]") {
    auto options = fast_options();
    options.cache_ttl = 100ms;
    SchedulerHarness harness(PlanTier::FREE, options);

    auto first = harness.scheduler->fetch("BTCUSDT");
    auto second = harness.scheduler->fetch("BTCUSDT");

    REQUIRE(harness.provider->indicator_calls == 1);
    REQUIRE(second.timestamp_ms == first.timestamp_ms);
    REQUIRE(harness.scheduler->get_health().cache_size == 1);

    SECTION("Interval and exchange are part of the key") {
        harness.scheduler->fetch("BTCUSDT", "4h");
        REQUIRE(harness.provider->indicator_calls == 2);
    }

    SECTION("Expired entries are fetched again") {
        std::this_thread::sleep_for(150ms);
        harness.scheduler->fetch("BTCUSDT");
        REQUIRE(harness.provider->indicator_calls == 2);
    }
}

TEST_CASE("Fallback snapshots are never cached", "[scheduler]") {
    SchedulerHarness harness(PlanTier::FREE);

    std::atomic<int> attempts{0};
    harness.provider->on_indicator = [&attempts](const std::string&, const IndicatorSpec&) {
        if (attempts++ == 0) return FakeProvider::timeout();
        return FakeProvider::ok({{"value", 30.0}});
    };

    auto failed = harness.scheduler->fetch("BTCUSDT");
    REQUIRE(failed.is_fallback_data);
    REQUIRE(failed.fallback_reason == "transient");

    auto recovered = harness.scheduler->fetch("BTCUSDT");
    REQUIRE_FALSE(recovered.is_fallback_data);
    REQUIRE(recovered.values["rsi"] == 30.0);
    REQUIRE(harness.provider->indicator_calls == 2);
}

TEST_CASE("Circuit breaker trips and recovers", "[scheduler]") {
    SchedulerHarness harness(PlanTier::FREE);
    harness.provider->on_indicator = [](const std::string&, const IndicatorSpec&) {
        return FakeProvider::timeout();
    };

    for (const char* symbol : {"BTCUSDT", "ETHUSDT", "XRPUSDT"}) {
        auto snapshot = harness.scheduler->fetch(symbol);
        REQUIRE(snapshot.fallback_reason == "transient");
    }

    auto health = harness.scheduler->get_health();
    REQUIRE(health.breaker_open);
    REQUIRE(health.consecutive_errors == 3);

    SECTION("Requests while open get fallbacks without provider calls") {
        auto future = harness.scheduler->enqueue("LTCUSDT");
        REQUIRE(is_ready(future));

        auto snapshot = future.get();
        REQUIRE(snapshot.is_fallback_data);
        REQUIRE(snapshot.fallback_reason == "circuit_open");
        REQUIRE(harness.provider->indicator_calls == 3);
    }

    SECTION("The next request after the reset window reaches the provider") {
        harness.provider->on_indicator = [](const std::string&, const IndicatorSpec&) {
            return FakeProvider::ok({{"value", 55.0}});
        };
        std::this_thread::sleep_for(200ms);

        auto snapshot = harness.scheduler->fetch("BTCUSDT");
        REQUIRE_FALSE(snapshot.is_fallback_data);
        REQUIRE(harness.provider->indicator_calls == 4);
        REQUIRE_FALSE(harness.scheduler->get_health().breaker_open);
    }

    SECTION("Auth failures count double") {
        harness.scheduler->force_reset();
        harness.provider->on_indicator = [](const std::string&, const IndicatorSpec&) {
            return FakeProvider::error(401, "Invalid secret");
        };

        auto snapshot = harness.scheduler->fetch("BTCUSDT");
        REQUIRE(snapshot.fallback_reason == "auth_failure");
        REQUIRE(harness.scheduler->get_health().consecutive_errors == 2);
    }
}

TEST_CASE("Opening the breaker drains queued requests", "[scheduler]") {
    auto options = fast_options();
    options.max_consecutive_errors = 1;
    SchedulerHarness harness(PlanTier::FREE, options);

    harness.provider->latency = 100ms;
    harness.provider->on_indicator = [](const std::string&, const IndicatorSpec&) {
        return FakeProvider::timeout();
    };

    auto first = harness.scheduler->enqueue("BTCUSDT");
    auto second = harness.scheduler->enqueue("ETHUSDT");
    auto third = harness.scheduler->enqueue("XRPUSDT");

    REQUIRE(first.get().fallback_reason == "transient");
    REQUIRE(second.get().fallback_reason == "circuit_open");
    REQUIRE(third.get().fallback_reason == "circuit_open");
    REQUIRE(harness.provider->indicator_calls == 1);
}

TEST_CASE("Only entitlement and malformed symbol errors blacklist", "[scheduler]") {
    auto options = fast_options();
    options.max_consecutive_errors = 10;
    options.bulk_enabled = false;
    SchedulerHarness harness(PlanTier::STARTER, options);

    harness.provider->on_indicator = [](const std::string&, const IndicatorSpec&) {
        return FakeProvider::timeout();
    };

    for (int i = 0; i < 3; ++i) {
        auto snapshot = harness.scheduler->fetch("DOGEUSDT");
        REQUIRE(snapshot.fallback_reason == "transient");
    }
    REQUIRE_FALSE(harness.symbols->is_blacklisted("DOGEUSDT"));
    REQUIRE(harness.symbols->is_servable("DOGEUSDT"));

    harness.provider->on_indicator = [](const std::string&, const IndicatorSpec&) {
        return FakeProvider::error(403, "Symbol not available on your plan");
    };

    auto denied = harness.scheduler->fetch("DOGEUSDT");
    REQUIRE(denied.fallback_reason == "entitlement_denied");
    REQUIRE(harness.symbols->is_blacklisted("DOGEUSDT"));
    REQUIRE(harness.scheduler->get_health().blacklisted_count == 1);

    SECTION("Blacklisted symbols short-circuit without touching the provider") {
        int calls = harness.provider->indicator_calls;

        auto future = harness.scheduler->enqueue("DOGEUSDT");
        REQUIRE(is_ready(future));
        REQUIRE(future.get().fallback_reason == "blacklisted");
        REQUIRE(harness.provider->indicator_calls == calls);
        REQUIRE(harness.scheduler->get_health().queue_length == 0);
    }

    SECTION("Malformed symbols are blacklisted without tripping the breaker") {
        harness.provider->on_indicator = [](const std::string&, const IndicatorSpec&) {
            return FakeProvider::error(400, "Invalid symbol");
        };

        auto snapshot = harness.scheduler->fetch("FOOUSDT");
        REQUIRE(snapshot.fallback_reason == "malformed_symbol");
        REQUIRE(harness.symbols->is_blacklisted("FOOUSDT"));
        REQUIRE(harness.scheduler->get_health().consecutive_errors == 4);
    }
}

TEST_CASE("Free plan refuses symbols outside its entitlement", "[scheduler]") {
    SchedulerHarness harness(PlanTier::FREE);

    auto future = harness.scheduler->enqueue("DOGEUSDT");
    REQUIRE(is_ready(future));

    auto snapshot = future.get();
    REQUIRE(snapshot.fallback_reason == "plan_limitation");
    REQUIRE(harness.provider->indicator_calls == 0);
}

TEST_CASE("Throttling engages the rate limiter", "[scheduler]") {
    SchedulerHarness harness(PlanTier::FREE);
    harness.provider->on_indicator = [](const std::string&, const IndicatorSpec&) {
        return FakeProvider::error(429, "Too many requests");
    };

    auto throttled = harness.scheduler->fetch("BTCUSDT");
    REQUIRE(throttled.fallback_reason == "throttled");

    auto health = harness.scheduler->get_health();
    REQUIRE(health.rate_limited);
    REQUIRE(health.backoff_multiplier == 2.0);
    REQUIRE(health.consecutive_errors == 0);

    auto refused = harness.scheduler->fetch("ETHUSDT");
    REQUIRE(refused.fallback_reason == "rate_limited");
    REQUIRE(harness.provider->indicator_calls == 1);
}

TEST_CASE("Bulk calls are demultiplexed per symbol", "[scheduler][batch]") {
    auto options = fast_options();
    options.batch_window = 100ms;
    SchedulerHarness harness(PlanTier::PRO, options);

    harness.provider->on_bulk = [](const nlohmann::json& constructs) {
        return FakeProvider::ok(FakeProvider::bulk_payload(constructs, {"LTCUSDT"}));
    };

    std::vector<std::string> symbols = {"BTCUSDT", "ETHUSDT", "XRPUSDT", "LTCUSDT", "XMRUSDT"};
    std::vector<std::future<IndicatorSnapshot>> futures;
    for (const auto& symbol : symbols) {
        futures.push_back(harness.scheduler->enqueue(symbol));
    }

    for (size_t i = 0; i < symbols.size(); ++i) {
        auto snapshot = futures[i].get();
        REQUIRE(snapshot.symbol == symbols[i]);

        if (symbols[i] == "LTCUSDT") {
            REQUIRE(snapshot.is_fallback_data);
            REQUIRE(snapshot.fallback_reason == "missing_from_batch");
        } else {
            REQUIRE_FALSE(snapshot.is_fallback_data);
            REQUIRE(snapshot.source == SnapshotSource::BATCH);
            REQUIRE(snapshot.real_indicator_count == 10);
        }
    }

    REQUIRE(harness.provider->bulk_calls == 1);
    REQUIRE(harness.provider->indicator_calls == 0);
    REQUIRE_FALSE(harness.symbols->is_blacklisted("LTCUSDT"));
    REQUIRE(harness.scheduler->get_health().batching_enabled);
}

TEST_CASE("Bulk level rejections are retried per symbol", "[scheduler][batch]") {
    auto options = fast_options();
    options.batch_window = 100ms;
    SchedulerHarness harness(PlanTier::PRO, options);

    harness.provider->on_bulk = [](const nlohmann::json& constructs) {
        if (constructs.size() > 1 || constructs[0]["symbol"] == "DOGE/USDT") {
            return FakeProvider::error(403, "Symbol not available on your plan");
        }
        return FakeProvider::ok(FakeProvider::bulk_payload(constructs, {}));
    };

    auto btc = harness.scheduler->enqueue("BTCUSDT");
    auto doge = harness.scheduler->enqueue("DOGEUSDT");
    auto eth = harness.scheduler->enqueue("ETHUSDT");

    auto btc_snapshot = btc.get();
    REQUIRE_FALSE(btc_snapshot.is_fallback_data);
    REQUIRE(btc_snapshot.source == SnapshotSource::LIVE);
    REQUIRE(doge.get().fallback_reason == "entitlement_denied");
    REQUIRE_FALSE(eth.get().is_fallback_data);

    REQUIRE(harness.provider->bulk_calls == 4);
    REQUIRE(harness.symbols->is_blacklisted("DOGEUSDT"));
    REQUIRE_FALSE(harness.symbols->is_blacklisted("BTCUSDT"));
}

TEST_CASE("A breaker trip during per symbol retries stops further calls", "[scheduler][batch]") {
    auto options = fast_options();
    options.batch_window = 100ms;
    options.max_consecutive_errors = 3;
    options.breaker_reset_window = 5000ms;
    SchedulerHarness harness(PlanTier::PRO, options);

    harness.provider->on_bulk = [](const nlohmann::json&) {
        return FakeProvider::error(403, "Symbol not available on your plan");
    };

    std::vector<std::string> symbols = {"BTCUSDT", "ETHUSDT", "XRPUSDT", "LTCUSDT", "XMRUSDT"};
    std::vector<std::future<IndicatorSnapshot>> futures;
    for (const auto& symbol : symbols) {
        futures.push_back(harness.scheduler->enqueue(symbol));
    }

    std::vector<std::string> reasons;
    for (auto& future : futures) {
        REQUIRE(is_ready(future, 2000ms));
        reasons.push_back(future.get().fallback_reason);
    }

    // One rejected bulk call, then three single symbol retries open the breaker
    REQUIRE(harness.provider->bulk_calls == 4);
    REQUIRE(harness.scheduler->get_health().breaker_open);
    REQUIRE(reasons[0] == "entitlement_denied");
    REQUIRE(reasons[2] == "entitlement_denied");
    REQUIRE(reasons[3] == "circuit_open");
    REQUIRE(reasons[4] == "circuit_open");
    REQUIRE_FALSE(harness.symbols->is_blacklisted("XMRUSDT"));
}

TEST_CASE("Batches take a contiguous run of matching requests", "[scheduler][batch]") {
    auto options = fast_options();
    options.batch_window = 100ms;
    SchedulerHarness harness(PlanTier::PRO, options);

    std::mutex sizes_mutex;
    std::vector<size_t> batch_sizes;
    harness.provider->on_bulk = [&](const nlohmann::json& constructs) {
        {
            std::lock_guard<std::mutex> lock(sizes_mutex);
            batch_sizes.push_back(constructs.size());
        }
        return FakeProvider::ok(FakeProvider::bulk_payload(constructs, {}));
    };

    std::vector<std::future<IndicatorSnapshot>> futures;
    for (const char* symbol : {"BTCUSDT", "ETHUSDT", "XRPUSDT", "LTCUSDT", "XMRUSDT"}) {
        futures.push_back(harness.scheduler->enqueue(symbol));
    }
    futures.push_back(harness.scheduler->enqueue("BTCUSDT", "4h"));

    for (auto& future : futures) {
        REQUIRE_FALSE(future.get().is_fallback_data);
    }

    std::lock_guard<std::mutex> lock(sizes_mutex);
    REQUIRE(batch_sizes.size() == 2);
    REQUIRE(batch_sizes[0] == 5);
    REQUIRE(batch_sizes[1] == 1);
}

TEST_CASE("Force flush skips the collection window", "[scheduler][batch]") {
    auto options = fast_options();
    options.batch_window = 5000ms;
    SchedulerHarness harness(PlanTier::PRO, options);

    auto future = harness.scheduler->enqueue("BTCUSDT");
    REQUIRE_FALSE(is_ready(future, 50ms));

    harness.scheduler->force_flush();
    REQUIRE(is_ready(future, 1000ms));
    REQUIRE_FALSE(future.get().is_fallback_data);
}

TEST_CASE("An unreachable provider never leaves callers hanging", "[scheduler]") {
    auto options = fast_options();
    options.bulk_enabled = false;
    SchedulerHarness harness(PlanTier::PRO, options);

    harness.provider->latency = 5ms;
    harness.provider->on_indicator = [](const std::string&, const IndicatorSpec&) {
        return FakeProvider::timeout();
    };

    std::vector<std::future<IndicatorSnapshot>> futures;
    for (int i = 0; i < 100; ++i) {
        futures.push_back(harness.scheduler->enqueue("SYM" + std::to_string(i) + "USDT"));
    }

    for (auto& future : futures) {
        REQUIRE(is_ready(future, 5000ms));
        REQUIRE(future.get().is_fallback_data);
    }

    REQUIRE(harness.provider->indicator_calls <= 3);
    REQUIRE(harness.scheduler->get_health().queue_length == 0);
}

TEST_CASE("Force reset clears state and releases queued requests", "[scheduler]") {
    SchedulerHarness harness(PlanTier::FREE);
    harness.provider->latency = 200ms;

    auto in_flight = harness.scheduler->enqueue("BTCUSDT");
    auto queued = harness.scheduler->enqueue("ETHUSDT");
    std::this_thread::sleep_for(50ms);

    harness.scheduler->force_reset();

    REQUIRE(is_ready(queued, 100ms));
    REQUIRE(queued.get().fallback_reason == "reset");
    REQUIRE_FALSE(in_flight.get().is_fallback_data);

    auto health = harness.scheduler->get_health();
    REQUIRE_FALSE(health.breaker_open);
    REQUIRE(health.consecutive_errors == 0);
    REQUIRE_FALSE(health.rate_limited);
}

TEST_CASE("Stopping the scheduler resolves outstanding requests", "[scheduler]") {
    SchedulerHarness harness(PlanTier::FREE);
    harness.provider->latency = 100ms;

    auto in_flight = harness.scheduler->enqueue("BTCUSDT");
    auto queued = harness.scheduler->enqueue("ETHUSDT");
    std::this_thread::sleep_for(30ms);

    harness.scheduler->stop();

    REQUIRE(is_ready(queued));
    REQUIRE(queued.get().fallback_reason == "scheduler_stopped");
    REQUIRE(is_ready(in_flight));

    auto late = harness.scheduler->enqueue("XRPUSDT");
    REQUIRE(late.get().fallback_reason == "scheduler_stopped");
    REQUIRE(harness.scheduler->get_health().state == SchedulerState::STOPPED);
}

TEST_CASE("Scheduler options from configuration", "[scheduler][config]") {
    Config cfg;
    cfg.default_interval = "4h";
    cfg.default_exchange = "binance";
    cfg.cache_ttl_seconds = 120;
    cfg.rate_limit_delay_ms = 0;
    cfg.inter_call_pause_ms = 1500;
    cfg.throttle_cooldown_seconds = 30;
    cfg.breaker_max_errors = 5;
    cfg.breaker_reset_seconds = 60;
    cfg.breaker_decay_pct = 25;
    cfg.auth_failure_weight = 3;
    cfg.bulk_enabled = true;
    cfg.batch_size = 10;
    cfg.batch_window_ms = 400;

    auto options = SchedulerOptions::from_config(cfg);

    REQUIRE(options.default_interval == "4h");
    REQUIRE(options.cache_ttl == 120000ms);
    REQUIRE_FALSE(options.min_call_delay.has_value());
    REQUIRE(options.max_consecutive_errors == 5);
    REQUIRE(options.breaker_decay_factor == 0.25);
    REQUIRE(options.batch_size == 10);

    cfg.rate_limit_delay_ms = 2500;
    REQUIRE(SchedulerOptions::from_config(cfg).min_call_delay == 2500ms);
}
