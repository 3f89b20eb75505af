#include "symbol_manager.hpp"
#include "error_classifier.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <regex>

std::string plan_tier_to_string(PlanTier tier) {
    switch (tier) {
        case PlanTier::FREE: return "free";
        case PlanTier::STARTER: return "starter";
        case PlanTier::PRO: return "pro";
        case PlanTier::UNKNOWN: return "unknown";
    }
    return "unknown";
}

PlanTier plan_tier_from_string(const std::string& name) {
    if (name == "free") return PlanTier::FREE;
    if (name == "starter") return PlanTier::STARTER;
    if (name == "pro") return PlanTier::PRO;
    return PlanTier::UNKNOWN;
}

PlanLimits limits_for(PlanTier tier) {
    switch (tier) {
        case PlanTier::STARTER: return PlanLimits{100, 30, true, 5};
        case PlanTier::PRO: return PlanLimits{-1, 120, true, 20};
        case PlanTier::FREE:
        case PlanTier::UNKNOWN:
            break;
    }
    // Unknown plans are paced like the free tier
    return PlanLimits{5, 4, false, 1};
}

SymbolCapabilityManager::SymbolCapabilityManager(std::shared_ptr<IndicatorProvider> provider,
                                                 const std::string& exchange,
                                                 std::chrono::milliseconds refresh_ttl,
                                                 PlanTier forced_tier)
    : provider_(provider)
    , exchange_(exchange)
    , refresh_ttl_(refresh_ttl)
    , forced_tier_(forced_tier)
    , plan_tier_(forced_tier)
    , next_refresh_at_(std::chrono::steady_clock::now())
{
    seed_default_symbols();
}

void SymbolCapabilityManager::seed_default_symbols() {
    // Known free plan symbols until the provider tells us otherwise
    for (const char* symbol : {"BTCUSDT", "ETHUSDT", "XRPUSDT", "LTCUSDT", "XMRUSDT"}) {
        supported_.insert(symbol);
    }
    spdlog::info("Symbol manager seeded with {} default symbols", supported_.size());
}

std::string SymbolCapabilityManager::normalize(const std::string& symbol) {
    std::string normalized = util::to_upper(symbol);
    normalized.erase(std::remove(normalized.begin(), normalized.end(), '/'), normalized.end());
    normalized.erase(std::remove(normalized.begin(), normalized.end(), ' '), normalized.end());
    return normalized;
}

std::string SymbolCapabilityManager::to_provider_format(const std::string& symbol) {
    std::string normalized = normalize(symbol);

    for (const char* quote : {"USDT", "USDC", "FDUSD", "BUSD", "BTC", "ETH", "BNB"}) {
        std::string q(quote);
        if (normalized.size() > q.size() &&
            normalized.compare(normalized.size() - q.size(), q.size(), q) == 0) {
            return normalized.substr(0, normalized.size() - q.size()) + "/" + q;
        }
    }

    return normalized;
}

bool SymbolCapabilityManager::initialize() {
    spdlog::info("Fetching supported symbols for {}", exchange_);
    bool ok = refresh(true);

    spdlog::info("Plan: {} ({} supported symbols)",
                 plan_tier_to_string(plan_tier()), supported_count());
    return ok;
}

bool SymbolCapabilityManager::refresh_due() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::chrono::steady_clock::now() >= next_refresh_at_;
}

bool SymbolCapabilityManager::refresh(bool force) {
    if (!force && !refresh_due()) {
        spdlog::debug("Using cached symbol list");
        return true;
    }

    ProviderResponse response;
    try {
        response = provider_->fetch_exchange_symbols(exchange_);
    } catch (const std::exception& e) {
        response.error = e.what();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();

    if (force) {
        blacklisted_.clear();
    }

    if (response.ok() && response.body.is_array()) {
        apply_symbol_list(response.body);
        next_refresh_at_ = now + refresh_ttl_;
        last_update_ = util::current_iso8601();
        return true;
    }

    // Retry sooner than the full TTL after a failed refresh
    next_refresh_at_ = now + std::min<std::chrono::milliseconds>(refresh_ttl_, std::chrono::minutes(15));

    if (classify(response) == ErrorClass::ENTITLEMENT_DENIED &&
        handle_plan_limitation(extract_error_message(response.body))) {
        last_update_ = util::current_iso8601();
        return true;
    }

    spdlog::error("Failed to fetch symbols from provider: HTTP {} {}",
                  response.status,
                  response.error.empty() ? extract_error_message(response.body) : response.error);
    return false;
}

void SymbolCapabilityManager::apply_symbol_list(const nlohmann::json& symbols) {
    supported_.clear();

    for (const auto& entry : symbols) {
        if (!entry.is_string()) continue;
        std::string normalized = normalize(entry.get<std::string>());
        if (blacklisted_.count(normalized) == 0) {
            supported_.insert(normalized);
        }
    }

    spdlog::info("Provider returned {} symbols", symbols.size());
    detect_plan_tier(symbols.size());
}

bool SymbolCapabilityManager::handle_plan_limitation(const std::string& message) {
    if (util::to_upper(message).find("FREE PLAN") == std::string::npos) {
        return false;
    }

    if (forced_tier_ == PlanTier::UNKNOWN) {
        plan_tier_ = PlanTier::FREE;
    }

    // Entitlements are only reported inside the error text: "... [BTC/USDT, ETH/USDT]"
    static const std::regex list_pattern(R"(\[(.*?)\])");
    std::smatch match;
    if (!std::regex_search(message, match, list_pattern)) {
        spdlog::warn("Free plan detected but no symbol list in error payload");
        return true;
    }

    supported_.clear();
    for (const auto& symbol : util::split(match[1].str(), ',')) {
        std::string normalized = normalize(symbol);
        if (blacklisted_.count(normalized) == 0) {
            supported_.insert(normalized);
        }
    }

    spdlog::warn("Free plan detected, limited to {} symbols", supported_.size());
    return true;
}

void SymbolCapabilityManager::detect_plan_tier(size_t symbol_count) {
    if (forced_tier_ != PlanTier::UNKNOWN) {
        return;
    }

    if (symbol_count <= 5) {
        plan_tier_ = PlanTier::FREE;
    } else if (symbol_count <= 100) {
        plan_tier_ = PlanTier::STARTER;
    } else {
        plan_tier_ = PlanTier::PRO;
    }

    spdlog::info("Plan detected: {} ({} symbols)", plan_tier_to_string(plan_tier_), symbol_count);
}

SymbolRoute SymbolCapabilityManager::route(const std::string& symbol) {
    std::string normalized = normalize(symbol);

    std::lock_guard<std::mutex> lock(mutex_);

    SymbolRoute route;
    route.symbol = normalized;
    route.provider_symbol = to_provider_format(normalized);

    if (blacklisted_.count(normalized) > 0) {
        route.strategy = RouteStrategy::FALLBACK_ONLY;
        route.reason = "blacklisted";
        return route;
    }

    if (supported_.count(normalized) > 0) {
        route.strategy = RouteStrategy::LIVE;
        route.reason = "supported";
        return route;
    }

    // Free plans are restricted to the discovered list; paid plans are tried
    // live and rejected symbols land on the blacklist.
    if (plan_tier_ == PlanTier::FREE) {
        route.strategy = RouteStrategy::FALLBACK_ONLY;
        route.reason = "plan_limitation";
        return route;
    }

    route.strategy = RouteStrategy::LIVE;
    route.reason = "unverified";
    return route;
}

bool SymbolCapabilityManager::is_servable(const std::string& symbol) {
    return route(symbol).strategy == RouteStrategy::LIVE;
}

void SymbolCapabilityManager::mark_unsupported(const std::string& symbol, const std::string& reason) {
    std::string normalized = normalize(symbol);

    std::lock_guard<std::mutex> lock(mutex_);
    supported_.erase(normalized);
    if (blacklisted_.insert(normalized).second) {
        spdlog::warn("Symbol {} blacklisted ({})", normalized, reason);
    }
}

bool SymbolCapabilityManager::is_supported(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return supported_.count(normalize(symbol)) > 0;
}

bool SymbolCapabilityManager::is_blacklisted(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blacklisted_.count(normalize(symbol)) > 0;
}

size_t SymbolCapabilityManager::supported_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return supported_.size();
}

size_t SymbolCapabilityManager::blacklisted_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blacklisted_.size();
}

PlanTier SymbolCapabilityManager::plan_tier() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return plan_tier_;
}

PlanLimits SymbolCapabilityManager::plan_limits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limits_for(plan_tier_);
}

std::vector<std::string> SymbolCapabilityManager::recommendations() const {
    std::vector<std::string> recs;

    if (plan_tier_ == PlanTier::FREE) {
        recs.push_back("Free plan detected - consider upgrading for more symbols");
    }
    if (blacklisted_.size() > 10) {
        recs.push_back("Many symbols unsupported - optimize symbol selection");
    }
    if (supported_.size() < 10) {
        recs.push_back("Limited symbol coverage - refresh symbol list or upgrade plan");
    }

    return recs;
}

nlohmann::json SymbolCapabilityManager::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto limits = limits_for(plan_tier_);

    nlohmann::json sample = nlohmann::json::array();
    for (const auto& symbol : supported_) {
        if (sample.size() >= 20) break;
        sample.push_back(symbol);
    }

    return {
        {"plan_type", plan_tier_to_string(plan_tier_)},
        {"plan_limitations", {
            {"symbols", limits.max_symbols},
            {"requests_per_minute", limits.requests_per_minute},
            {"bulk", limits.supports_bulk},
            {"max_batch_symbols", limits.max_batch_symbols}
        }},
        {"supported_symbols_count", supported_.size()},
        {"supported_symbols", sample},
        {"blacklisted_count", blacklisted_.size()},
        {"last_update", last_update_},
        {"recommendations", recommendations()}
    };
}
