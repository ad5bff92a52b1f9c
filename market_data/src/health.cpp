#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(std::shared_ptr<RedisBus> redis,
                         std::shared_ptr<PostgresStore> pg,
                         std::shared_ptr<RateRefresher> refresher)
    : redis_(redis), pg_(pg), refresher_(refresher) {}

nlohmann::json HealthCheck::get_status() const {
    bool redis_ok = redis_->ping();
    bool pg_ok = pg_->ping();

    auto last_success = refresher_->last_success();
    auto last_error = refresher_->last_error();

    nlohmann::json status = {
        {"ok", redis_ok && pg_ok},
        {"redis", redis_ok},
        {"postgres", pg_ok},
        {"rate_refresher", {
            {"running", refresher_->is_running()},
            {"state", refresher_state_to_string(refresher_->state())},
            {"last_success", last_success ? nlohmann::json(util::to_iso8601(*last_success))
                                          : nlohmann::json(nullptr)},
            {"last_error", last_error.empty() ? nlohmann::json(nullptr) : nlohmann::json(last_error)}
        }},
        {"ts", util::current_iso8601()}
    };

    return status;
}
