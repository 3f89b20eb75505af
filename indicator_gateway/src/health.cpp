#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(std::shared_ptr<RedisBus> redis,
                         std::shared_ptr<RequestScheduler> scheduler,
                         std::shared_ptr<SymbolCapabilityManager> symbols)
    : redis_(redis), scheduler_(scheduler), symbols_(symbols) {}

nlohmann::json HealthCheck::get_status() const {
    bool redis_ok = redis_ ? redis_->ping() : true;
    SchedulerHealth scheduler = scheduler_->get_health();

    // An open breaker degrades the service but callers still get fallback data
    std::string provider = "up";
    if (scheduler.breaker_open) {
        provider = "circuit_open";
    } else if (scheduler.rate_limited) {
        provider = "rate_limited";
    }

    nlohmann::json status = {
        {"ok", redis_ok && scheduler.state != SchedulerState::STOPPED},
        {"redis", redis_ ? nlohmann::json(redis_ok) : nlohmann::json("disabled")},
        {"provider", provider},
        {"scheduler", scheduler.to_json()},
        {"symbols", {
            {"plan", plan_tier_to_string(symbols_->plan_tier())},
            {"supported", symbols_->supported_count()},
            {"blacklisted", symbols_->blacklisted_count()}
        }},
        {"ts", util::current_iso8601()}
    };

    return status;
}

bool HealthCheck::is_healthy() const {
    bool redis_ok = redis_ ? redis_->ping() : true;
    return redis_ok && scheduler_->get_health().state != SchedulerState::STOPPED;
}
