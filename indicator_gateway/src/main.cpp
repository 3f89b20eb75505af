#include "config.hpp"
#include "http_client.hpp"
#include "taapi_client.hpp"
#include "symbol_manager.hpp"
#include "request_scheduler.hpp"
#include "redis_bus.hpp"
#include "health.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <curl/curl.h>
#include <signal.h>
#include <atomic>
#include <thread>
#include <future>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("indicator-gateway", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

struct PendingReply {
    std::string msg_id;
    std::string corr_id;
    std::future<IndicatorSnapshot> snapshot;
};

void publish_error(RedisBus& redis, const Config& config,
                   const std::string& corr_id, const std::string& message) {
    nlohmann::json reply = {
        {"corr_id", corr_id},
        {"ok", false},
        {"message", message},
        {"ts", util::current_iso8601()}
    };
    redis.publish_reply(config.stream_rep, reply);
}

void request_consumer_loop(std::shared_ptr<Config> config,
                           std::shared_ptr<RedisBus> redis,
                           std::shared_ptr<RequestScheduler> scheduler,
                           std::atomic<bool>& running) {

    spdlog::info("Starting indicator request consumer");
    redis->create_consumer_group(config->stream_req, config->service_name);

    while (running) {
        try {
            auto requests = redis->read_requests(config->stream_req, config->service_name,
                                                 "consumer1", 20, 1000);

            // Enqueue the whole read first so the scheduler can dedupe and batch it
            std::vector<PendingReply> pending;

            for (const auto& [msg_id, req] : requests) {
                std::string corr_id;

                try {
                    if (req.is_object() && req.contains("corr_id") && req["corr_id"].is_string()) {
                        corr_id = req["corr_id"].get<std::string>();
                    }

                    if (!req.is_object() || req.value("cmd", "") != "indicators") {
                        spdlog::warn("Ignoring unsupported request {}", msg_id);
                        if (!corr_id.empty()) {
                            publish_error(*redis, *config, corr_id, "Unsupported command");
                        }
                        redis->ack_message(config->stream_req, config->service_name, msg_id);
                        continue;
                    }

                    nlohmann::json args = req.value("args", nlohmann::json::object());
                    std::string symbol = args.value("symbol", "");
                    if (symbol.empty()) {
                        if (!corr_id.empty()) {
                            publish_error(*redis, *config, corr_id, "Usage: indicators {symbol, interval, exchange}");
                        }
                        redis->ack_message(config->stream_req, config->service_name, msg_id);
                        continue;
                    }

                    pending.push_back({msg_id, corr_id,
                                       scheduler->enqueue(symbol,
                                                          args.value("interval", ""),
                                                          args.value("exchange", ""))});

                } catch (const std::exception& e) {
                    spdlog::error("Failed to process request {}: {}", msg_id, e.what());
                }
            }

            for (auto& entry : pending) {
                try {
                    IndicatorSnapshot snapshot = entry.snapshot.get();

                    nlohmann::json reply = {
                        {"corr_id", entry.corr_id},
                        {"ok", true},
                        {"data", snapshot.to_json()},
                        {"ts", util::current_iso8601()}
                    };
                    redis->publish_reply(config->stream_rep, reply);
                    redis->ack_message(config->stream_req, config->service_name, entry.msg_id);

                    spdlog::info("Replied to {} for {} ({})", entry.corr_id, snapshot.symbol,
                                 source_to_string(snapshot.source));

                } catch (const std::exception& e) {
                    spdlog::error("Failed to reply to {}: {}", entry.corr_id, e.what());
                }
            }

        } catch (const std::exception& e) {
            spdlog::error("Request consumer error: {}", e.what());
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }

    spdlog::info("Request consumer stopped");
}

int main(int argc, char* argv[]) {
    try {
        auto config = std::make_shared<Config>(Config::from_env());
        setup_logging(config->log_level);

        spdlog::info("==============================================");
        spdlog::info("SoulScout Indicator Gateway v1.0");
        spdlog::info("==============================================");

        config->validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        curl_global_init(CURL_GLOBAL_DEFAULT);

        // Initialize components
        auto http = std::make_shared<HttpClient>(config->request_timeout_ms);
        auto provider = std::make_shared<TaapiClient>(config->taapi_base_url, config->taapi_secret, http,
                                                      config->request_timeout_ms, config->bulk_timeout_ms);
        auto symbols = std::make_shared<SymbolCapabilityManager>(
            provider, config->default_exchange,
            std::chrono::hours(config->symbol_refresh_hours),
            plan_tier_from_string(config->plan_override));

        if (!symbols->initialize()) {
            spdlog::warn("Symbol discovery failed, continuing with default symbols");
        }

        auto scheduler = std::make_shared<RequestScheduler>(SchedulerOptions::from_config(*config),
                                                            provider, symbols);
        scheduler->start();

        std::shared_ptr<RedisBus> redis;
        if (!config->redis_url.empty()) {
            redis = std::make_shared<RedisBus>(config->redis_url);
        } else {
            spdlog::warn("REDIS_URL not set, stream consumer disabled");
        }

        auto health = std::make_shared<HealthCheck>(redis, scheduler, symbols);

        // Start request consumer
        std::atomic<bool> consumer_running{true};
        std::thread consumer_thread;
        if (redis) {
            consumer_thread = std::thread(request_consumer_loop, config, redis, scheduler,
                                          std::ref(consumer_running));
        }

        // Start HTTP server
        httplib::Server server;

        server.Get("/health", [health](const httplib::Request&, httplib::Response& res) {
            auto status = health->get_status();
            res.set_content(status.dump(), "application/json");
            res.status = health->is_healthy() ? 200 : 503;
        });

        server.Get("/indicators", [scheduler](const httplib::Request& req, httplib::Response& res) {
            if (!req.has_param("symbol")) {
                nlohmann::json error = {{"error", "symbol parameter is required"}};
                res.set_content(error.dump(), "application/json");
                res.status = 400;
                return;
            }

            IndicatorSnapshot snapshot = scheduler->fetch(req.get_param_value("symbol"),
                                                          req.get_param_value("interval"),
                                                          req.get_param_value("exchange"));
            res.set_content(snapshot.to_json().dump(), "application/json");
        });

        server.Get("/symbols", [symbols](const httplib::Request&, httplib::Response& res) {
            res.set_content(symbols->stats().dump(), "application/json");
        });

        server.Post("/reset", [scheduler](const httplib::Request&, httplib::Response& res) {
            scheduler->force_reset();
            nlohmann::json body = {{"ok", true}, {"health", scheduler->get_health().to_json()}};
            res.set_content(body.dump(), "application/json");
        });

        server.Post("/flush", [scheduler](const httplib::Request&, httplib::Response& res) {
            scheduler->force_flush();
            nlohmann::json body = {{"ok", true}};
            res.set_content(body.dump(), "application/json");
        });

        std::thread http_thread([&server, config]() {
            spdlog::info("Starting HTTP server on {}:{}", config->listen_addr, config->listen_port);
            if (!server.listen(config->listen_addr.c_str(), config->listen_port)) {
                spdlog::error("HTTP server failed to listen on {}:{}", config->listen_addr, config->listen_port);
                shutdown_requested = true;
            }
        });

        spdlog::info("Indicator gateway started");

        // Main loop
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        // Shutdown
        spdlog::info("Stopping services...");
        consumer_running = false;
        server.stop();

        if (consumer_thread.joinable()) consumer_thread.join();
        if (http_thread.joinable()) http_thread.join();

        scheduler->stop();
        curl_global_cleanup();

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
