#pragma once

#include "clock.hpp"
#include "market_store.hpp"
#include "providers.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class ExchangeRateResolver {
public:
    ExchangeRateResolver(std::shared_ptr<RateStore> store,
                         std::shared_ptr<RateProvider> primary,
                         std::shared_ptr<RateProvider> secondary,
                         std::shared_ptr<Clock> clock,
                         std::chrono::seconds freshness = std::chrono::hours(24));

    // Stored rate while fresh, otherwise primary then secondary provider.
    // nullopt when both providers fail; nothing is written in that case.
    std::optional<double> get_rate(const std::string& from, const std::string& to);

    // Refetches every pair regardless of freshness. Throws
    // MarketDataError(NoRateAvailable) when a non-empty batch refreshed nothing.
    RefreshReport update_all(const std::vector<CurrencyPair>& pairs);

    // Throws MarketDataError(NoRateAvailable) when no rate can be resolved
    double convert(double amount, const std::string& from, const std::string& to);

    // Stored rates inside the freshness window, keyed "{FROM}{TO}"
    std::map<std::string, double> current_rates();

private:
    std::shared_ptr<RateStore> store_;
    std::shared_ptr<RateProvider> primary_;
    std::shared_ptr<RateProvider> secondary_;
    std::shared_ptr<Clock> clock_;
    std::chrono::seconds freshness_;

    bool is_fresh(const ExchangeRate& rate) const;
    std::optional<double> fetch_and_store(const std::string& from, const std::string& to);
    std::optional<double> try_provider(RateProvider& provider, const std::string& from, const std::string& to);
};
