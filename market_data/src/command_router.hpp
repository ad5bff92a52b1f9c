#pragma once

#include "clock.hpp"
#include "exchange_rate_resolver.hpp"
#include "performance_service.hpp"
#include "price_resolver.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

// Raised for a request that is well-formed but cannot be answered
class CommandFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Dispatches bus requests {cmd, corr_id, args} to the resolvers and builds the
// reply {corr_id, ok, data | message, ts}. Never throws.
class CommandRouter {
public:
    CommandRouter(std::shared_ptr<ExchangeRateResolver> rates,
                  std::shared_ptr<PriceResolver> prices,
                  std::shared_ptr<PerformanceService> performance,
                  std::function<void()> trigger_refresh,
                  std::shared_ptr<Clock> clock);

    nlohmann::json handle(const nlohmann::json& request);

    static nlohmann::json price_row_json(const SecurityPrice& row);

private:
    std::shared_ptr<ExchangeRateResolver> rates_;
    std::shared_ptr<PriceResolver> prices_;
    std::shared_ptr<PerformanceService> performance_;
    std::function<void()> trigger_refresh_;
    std::shared_ptr<Clock> clock_;

    nlohmann::json dispatch(const std::string& cmd, const nlohmann::json& args);

    nlohmann::json handle_rate(const nlohmann::json& args);
    nlohmann::json handle_convert(const nlohmann::json& args);
    nlohmann::json handle_price(const nlohmann::json& args);
    nlohmann::json handle_price_series(const nlohmann::json& args);
    nlohmann::json handle_purge_prices(const nlohmann::json& args);

    nlohmann::json ok_reply(const std::string& corr_id, const nlohmann::json& data) const;
    nlohmann::json error_reply(const std::string& corr_id, const std::string& message) const;
};
