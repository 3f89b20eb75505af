#include "redis_bus.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>
#include <iterator>
#include <chrono>

RedisBus::RedisBus(const std::string& redis_url) {
    try {
        redis_ = std::make_shared<sw::redis::Redis>(redis_url);
        spdlog::info("Connected to Redis: {}", redis_url);
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        throw;
    }
}

void RedisBus::create_consumer_group(const std::string& stream, const std::string& group) {
    try {
        redis_->xgroup_create(stream, group, "$", true);
        spdlog::info("Created consumer group {} on stream {}", group, stream);
    } catch (const sw::redis::Error& e) {
        spdlog::debug("Consumer group {} already present: {}", group, e.what());
    }
}

std::vector<std::pair<std::string, nlohmann::json>>
RedisBus::read_requests(const std::string& stream, const std::string& group,
                        const std::string& consumer, int count, int block_ms) {
    std::vector<std::pair<std::string, nlohmann::json>> results;

    try {
        std::unordered_map<std::string, sw::redis::ItemStream> items;

        redis_->xreadgroup(group, consumer,
            stream, ">",
            count,
            std::chrono::milliseconds(block_ms),
            std::inserter(items, items.end()));

        for (const auto& [stream_name, item_stream] : items) {
            for (const auto& item : item_stream) {
                nlohmann::json payload;

                auto it = item.second.find("data");
                if (it == item.second.end()) {
                    spdlog::warn("Message {} on {} has no data field", item.first, stream_name);
                } else {
                    try {
                        payload = nlohmann::json::parse(it->second);
                    } catch (const std::exception& e) {
                        spdlog::error("Failed to parse request {}: {}", item.first, e.what());
                    }
                }

                results.emplace_back(item.first, payload);
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to read requests: {}", e.what());
    }

    return results;
}

void RedisBus::publish_reply(const std::string& stream, const nlohmann::json& data) {
    try {
        std::unordered_map<std::string, std::string> fields;
        fields["data"] = data.dump();

        redis_->xadd(stream, "*", fields.begin(), fields.end());
        spdlog::debug("Published reply to {}", stream);
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish reply: {}", e.what());
        throw;
    }
}

void RedisBus::ack_message(const std::string& stream, const std::string& group,
                           const std::string& msg_id) {
    try {
        redis_->xack(stream, group, msg_id);
    } catch (const std::exception& e) {
        spdlog::error("Failed to ack message {}: {}", msg_id, e.what());
    }
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Redis ping failed: {}", e.what());
        return false;
    }
}
