#include "config.hpp"
#include "redis_bus.hpp"
#include "postgres_store.hpp"
#include "http_client.hpp"
#include "rates_api_client.hpp"
#include "chart_client.hpp"
#include "exchange_rate_resolver.hpp"
#include "price_resolver.hpp"
#include "performance.hpp"
#include "performance_service.hpp"
#include "result_cache.hpp"
#include "rate_refresher.hpp"
#include "command_router.hpp"
#include "health.hpp"
#include "util.hpp"
#include <httplib.h>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("followfolio", console_sink);

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

void request_consumer_loop(std::shared_ptr<Config> config,
                           std::shared_ptr<RedisBus> redis,
                           std::shared_ptr<CommandRouter> router,
                           std::atomic<bool>& running) {
    const std::string group = config->service_name;

    spdlog::info("Starting request consumer");
    redis->create_consumer_group(config->stream_req, group);

    while (running) {
        try {
            auto requests = redis->read_requests(config->stream_req, group, "consumer1", 10, 1000);

            for (const auto& [msg_id, request] : requests) {
                try {
                    if (!request.is_null()) {
                        auto reply = router->handle(request);
                        redis->publish_reply(config->stream_rep, reply);
                        spdlog::info("Processed {} -> ok={}", request.value("cmd", ""), reply["ok"].get<bool>());
                    }
                    redis->ack_message(config->stream_req, group, msg_id);

                } catch (const std::exception& e) {
                    spdlog::error("Failed to process request {}: {}", msg_id, e.what());
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
        spdlog::info("FollowFolio Market Data Service v1.0");
        spdlog::info("==============================================");

        config->validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        curl_global_init(CURL_GLOBAL_DEFAULT);

        // Initialize components
        auto clock = std::make_shared<SystemClock>();
        auto redis = std::make_shared<RedisBus>(config->redis_url);
        auto pg = std::make_shared<PostgresStore>(config->pg_dsn);

        auto rates_http = std::make_shared<HttpClient>(config->request_timeout_ms);
        auto chart_http = std::make_shared<HttpClient>(config->request_timeout_ms);
        auto rates_api = std::make_shared<RatesApiClient>(config->rates_api_base, rates_http);
        auto chart = std::make_shared<ChartClient>(config->chart_api_base, chart_http, clock);

        auto rate_resolver = std::make_shared<ExchangeRateResolver>(
            pg, rates_api, chart, clock, std::chrono::hours(config->rate_freshness_hours));
        auto price_resolver = std::make_shared<PriceResolver>(
            pg, chart, clock, std::chrono::hours(config->price_freshness_hours));

        auto calculator = std::make_shared<PerformanceCalculator>(price_resolver, rate_resolver);
        auto cache = std::make_shared<ResultCache>(clock, std::chrono::seconds(config->result_cache_ttl_sec));
        auto performance = std::make_shared<PerformanceService>(pg, calculator, cache);

        RefreshPolicy policy;
        policy.startup_delay = std::chrono::seconds(config->refresh_startup_delay_sec);
        policy.interval = std::chrono::hours(config->refresh_interval_hours);
        policy.max_retries = config->refresh_max_retries;
        policy.initial_backoff = std::chrono::minutes(config->refresh_backoff_min);

        auto pairs = config->tracked_pairs;
        auto refresher = std::make_shared<RateRefresher>(
            [rate_resolver, pairs]() { return rate_resolver->update_all(pairs); },
            policy, clock);

        auto router = std::make_shared<CommandRouter>(
            rate_resolver, price_resolver, performance,
            [refresher]() { refresher->trigger_now(); },
            clock);
        auto health = std::make_shared<HealthCheck>(redis, pg, refresher);

        // Initialize database schema
        pg->init_schema();

        refresher->start();

        // Start request consumer
        std::atomic<bool> consumer_running{true};
        std::thread consumer_thread(request_consumer_loop, config, redis, router,
                                    std::ref(consumer_running));

        // Start HTTP health server
        httplib::Server server;

        server.Get("/health", [health](const httplib::Request&, httplib::Response& res) {
            auto status = health->get_status();
            res.set_content(status.dump(), "application/json");
            res.status = status["ok"].get<bool>() ? 200 : 503;
        });

        std::thread http_thread([&server, config]() {
            spdlog::info("Starting HTTP server on {}:{}", config->listen_addr, config->listen_port);
            server.listen(config->listen_addr.c_str(), config->listen_port);
        });

        spdlog::info("Market data service started, tracking {} currency pairs", pairs.size());

        // Main loop
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        // Shutdown
        spdlog::info("Stopping services...");
        refresher->stop();
        consumer_running = false;
        server.stop();

        if (consumer_thread.joinable()) consumer_thread.join();
        if (http_thread.joinable()) http_thread.join();

        curl_global_cleanup();
        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
