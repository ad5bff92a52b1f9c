#pragma once

#include "market_types.hpp"
#include <string>
#include <vector>

struct Config {
    // Redis
    std::string redis_url;
    std::string stream_req;
    std::string stream_rep;

    // Postgres
    std::string pg_dsn;

    // Providers
    std::string rates_api_base;
    std::string chart_api_base;
    int request_timeout_ms;

    // Freshness windows
    int rate_freshness_hours;
    int price_freshness_hours;

    // Scheduled refresh
    std::vector<CurrencyPair> tracked_pairs;
    int refresh_interval_hours;
    int refresh_startup_delay_sec;
    int refresh_max_retries;
    int refresh_backoff_min;

    // Result cache
    int result_cache_ttl_sec;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    static std::vector<CurrencyPair> parse_pairs(const std::string& text);
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
