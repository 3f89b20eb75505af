#pragma once

#include "indicator_provider.hpp"
#include <string>
#include <set>
#include <vector>
#include <memory>
#include <mutex>
#include <chrono>
#include <nlohmann/json.hpp>

enum class PlanTier {
    UNKNOWN,
    FREE,
    STARTER,
    PRO
};

std::string plan_tier_to_string(PlanTier tier);
PlanTier plan_tier_from_string(const std::string& name);

struct PlanLimits {
    int max_symbols;          // -1 = unlimited
    int requests_per_minute;
    bool supports_bulk;
    int max_batch_symbols;
};

PlanLimits limits_for(PlanTier tier);

enum class RouteStrategy {
    LIVE,
    FALLBACK_ONLY
};

struct SymbolRoute {
    RouteStrategy strategy;
    std::string symbol;           // normalized, e.g. BTCUSDT
    std::string provider_symbol;  // provider form, e.g. BTC/USDT
    std::string reason;
};

class SymbolCapabilityManager {
public:
    SymbolCapabilityManager(std::shared_ptr<IndicatorProvider> provider,
                            const std::string& exchange,
                            std::chrono::milliseconds refresh_ttl = std::chrono::hours(24),
                            PlanTier forced_tier = PlanTier::UNKNOWN);

    // Startup discovery; returns false when the provider could not be queried
    bool initialize();
    bool refresh(bool force = false);
    bool refresh_due() const;

    bool is_servable(const std::string& symbol);
    SymbolRoute route(const std::string& symbol);

    // Only for confirmed plan-limitation or invalid-symbol responses
    void mark_unsupported(const std::string& symbol, const std::string& reason);

    bool is_supported(const std::string& symbol) const;
    bool is_blacklisted(const std::string& symbol) const;
    size_t supported_count() const;
    size_t blacklisted_count() const;

    PlanTier plan_tier() const;
    PlanLimits plan_limits() const;

    nlohmann::json stats() const;

    static std::string normalize(const std::string& symbol);
    static std::string to_provider_format(const std::string& symbol);

private:
    std::shared_ptr<IndicatorProvider> provider_;
    std::string exchange_;
    std::chrono::milliseconds refresh_ttl_;
    PlanTier forced_tier_;

    mutable std::mutex mutex_;
    std::set<std::string> supported_;
    std::set<std::string> blacklisted_;
    PlanTier plan_tier_;
    std::chrono::steady_clock::time_point next_refresh_at_;
    std::string last_update_;

    void seed_default_symbols();
    void apply_symbol_list(const nlohmann::json& symbols);
    bool handle_plan_limitation(const std::string& message);
    void detect_plan_tier(size_t symbol_count);
    std::vector<std::string> recommendations() const;
};
