#pragma once

#include "postgres_store.hpp"
#include "rate_refresher.hpp"
#include "redis_bus.hpp"
#include <nlohmann/json.hpp>
#include <memory>

class HealthCheck {
public:
    HealthCheck(std::shared_ptr<RedisBus> redis,
                std::shared_ptr<PostgresStore> pg,
                std::shared_ptr<RateRefresher> refresher);

    nlohmann::json get_status() const;

private:
    std::shared_ptr<RedisBus> redis_;
    std::shared_ptr<PostgresStore> pg_;
    std::shared_ptr<RateRefresher> refresher_;
};
