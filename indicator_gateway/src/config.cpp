#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    std::string s = util::to_upper(val);
    return s == "1" || s == "TRUE" || s == "YES";
}

Config Config::from_env() {
    Config cfg;

    cfg.taapi_secret = get_env("TAAPI_SECRET");
    cfg.taapi_base_url = get_env("TAAPI_BASE_URL", "https://api.taapi.io");
    cfg.default_exchange = get_env("TAAPI_EXCHANGE", "binance");
    cfg.default_interval = get_env("TAAPI_INTERVAL", "1h");
    cfg.plan_override = get_env("TAAPI_PLAN", "auto");
    cfg.bulk_enabled = get_env_bool("TAAPI_BULK_ENABLED", true);

    // 0 = derive from detected plan
    cfg.rate_limit_delay_ms = get_env_int("RATE_LIMIT_DELAY_MS", 0);
    cfg.inter_call_pause_ms = get_env_int("INTER_CALL_PAUSE_MS", 2000);
    cfg.throttle_cooldown_seconds = get_env_int("THROTTLE_COOLDOWN_SECONDS", 60);
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 10000);
    cfg.bulk_timeout_ms = get_env_int("BULK_TIMEOUT_MS", 30000);

    cfg.cache_ttl_seconds = get_env_int("CACHE_TTL_SECONDS", 300);

    cfg.breaker_max_errors = get_env_int("BREAKER_MAX_ERRORS", 3);
    cfg.breaker_reset_seconds = get_env_int("BREAKER_RESET_SECONDS", 300);
    cfg.breaker_decay_pct = get_env_int("BREAKER_DECAY_PCT", 50);
    cfg.auth_failure_weight = get_env_int("AUTH_FAILURE_WEIGHT", 2);

    cfg.batch_size = get_env_int("BATCH_SIZE", 20);
    cfg.batch_window_ms = get_env_int("BATCH_WINDOW_MS", 250);

    cfg.symbol_refresh_hours = get_env_int("SYMBOL_REFRESH_HOURS", 24);

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_req = get_env("STREAM_REQ", "soul.indicators.requests");
    cfg.stream_rep = get_env("STREAM_REP", "soul.indicators.replies");

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", "indicator-gateway");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (taapi_secret.empty()) {
        throw std::runtime_error("TAAPI_SECRET is required");
    }
    if (plan_override != "auto" && plan_override != "free" &&
        plan_override != "starter" && plan_override != "pro") {
        throw std::runtime_error("TAAPI_PLAN must be one of auto, free, starter, pro");
    }
    if (breaker_max_errors < 1) {
        throw std::runtime_error("BREAKER_MAX_ERRORS must be at least 1");
    }
    if (breaker_decay_pct < 0 || breaker_decay_pct > 100) {
        throw std::runtime_error("BREAKER_DECAY_PCT must be within 0..100");
    }
    if (batch_size < 1) {
        throw std::runtime_error("BATCH_SIZE must be at least 1");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Provider: {} (secret {})", taapi_base_url, util::redact_secret(taapi_secret));
    spdlog::info("  Plan: {}, bulk {}", plan_override, bulk_enabled ? "enabled" : "disabled");
    spdlog::info("  Breaker: {} errors, {}s reset window", breaker_max_errors, breaker_reset_seconds);
    spdlog::info("  Cache TTL: {}s, batch size: {}", cache_ttl_seconds, batch_size);
}
