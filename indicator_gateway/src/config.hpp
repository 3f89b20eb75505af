#pragma once

#include <string>
#include <cstdlib>

struct Config {
    // Provider
    std::string taapi_secret;
    std::string taapi_base_url;
    std::string default_exchange;
    std::string default_interval;
    std::string plan_override;
    bool bulk_enabled;

    // Pacing
    int rate_limit_delay_ms;
    int inter_call_pause_ms;
    int throttle_cooldown_seconds;
    int request_timeout_ms;
    int bulk_timeout_ms;

    // Cache
    int cache_ttl_seconds;

    // Circuit breaker
    int breaker_max_errors;
    int breaker_reset_seconds;
    int breaker_decay_pct;
    int auth_failure_weight;

    // Batching
    int batch_size;
    int batch_window_ms;

    // Symbols
    int symbol_refresh_hours;

    // Redis
    std::string redis_url;
    std::string stream_req;
    std::string stream_rep;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static bool get_env_bool(const char* name, bool default_val);
};
