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

std::vector<CurrencyPair> Config::parse_pairs(const std::string& text) {
    std::vector<CurrencyPair> pairs;

    for (const auto& entry : util::split(text, ',')) {
        auto item = util::to_upper(util::trim(entry));
        if (item.empty()) continue;

        auto parts = util::split(item, ':');
        if (parts.size() != 2 || parts[0].size() != 3 || parts[1].size() != 3) {
            throw std::runtime_error("Invalid currency pair in TRACKED_PAIRS: " + item);
        }
        pairs.push_back({parts[0], parts[1]});
    }

    return pairs;
}

Config Config::from_env() {
    Config cfg;

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_req = get_env("STREAM_REQ", "folio.market.requests");
    cfg.stream_rep = get_env("STREAM_REP", "folio.market.replies");

    cfg.pg_dsn = get_env("PG_DSN");

    cfg.rates_api_base = get_env("RATES_API_BASE", "https://open.er-api.com/v6");
    cfg.chart_api_base = get_env("CHART_API_BASE", "https://query1.finance.yahoo.com/v8/finance/chart");
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 8000);

    cfg.rate_freshness_hours = get_env_int("RATE_FRESHNESS_HOURS", 24);
    cfg.price_freshness_hours = get_env_int("PRICE_FRESHNESS_HOURS", 4);

    cfg.tracked_pairs = parse_pairs(
        get_env("TRACKED_PAIRS", "CAD:USD,BRL:USD,CAD:BRL,USD:CAD,USD:BRL,BRL:CAD"));
    cfg.refresh_interval_hours = get_env_int("REFRESH_INTERVAL_HOURS", 24);
    cfg.refresh_startup_delay_sec = get_env_int("REFRESH_STARTUP_DELAY_SEC", 120);
    cfg.refresh_max_retries = get_env_int("REFRESH_MAX_RETRIES", 3);
    cfg.refresh_backoff_min = get_env_int("REFRESH_BACKOFF_MIN", 5);

    cfg.result_cache_ttl_sec = get_env_int("RESULT_CACHE_TTL_SEC", 3600);

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", "market_data");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (pg_dsn.empty()) {
        throw std::runtime_error("PG_DSN is required");
    }
    if (request_timeout_ms <= 0) {
        throw std::runtime_error("REQUEST_TIMEOUT_MS must be positive");
    }
    if (rate_freshness_hours <= 0 || price_freshness_hours <= 0) {
        throw std::runtime_error("Freshness windows must be positive");
    }
    if (refresh_interval_hours <= 0 || refresh_max_retries < 0 || refresh_backoff_min <= 0) {
        throw std::runtime_error("Invalid refresh schedule");
    }
    if (result_cache_ttl_sec <= 0) {
        throw std::runtime_error("RESULT_CACHE_TTL_SEC must be positive");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Freshness: rates={}h, prices={}h", rate_freshness_hours, price_freshness_hours);
    spdlog::info("  Tracked pairs: {}", tracked_pairs.size());
    spdlog::info("  Refresh: every {}h, startup delay {}s, {} retries from {}min",
                 refresh_interval_hours, refresh_startup_delay_sec,
                 refresh_max_retries, refresh_backoff_min);
}
