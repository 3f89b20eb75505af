#pragma once

#include "redis_bus.hpp"
#include "request_scheduler.hpp"
#include "symbol_manager.hpp"
#include <nlohmann/json.hpp>
#include <memory>

class HealthCheck {
public:
    // redis may be null when the stream consumer is disabled
    HealthCheck(std::shared_ptr<RedisBus> redis,
                std::shared_ptr<RequestScheduler> scheduler,
                std::shared_ptr<SymbolCapabilityManager> symbols);

    nlohmann::json get_status() const;
    bool is_healthy() const;

private:
    std::shared_ptr<RedisBus> redis_;
    std::shared_ptr<RequestScheduler> scheduler_;
    std::shared_ptr<SymbolCapabilityManager> symbols_;
};
