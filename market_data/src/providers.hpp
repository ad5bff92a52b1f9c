#pragma once

#include "market_types.hpp"
#include <string>
#include <vector>

// Upstream market data sources. Implementations throw MarketDataError with
// ProviderUnavailable or ParseError; resolvers decide how to degrade.
class RateProvider {
public:
    virtual ~RateProvider() = default;

    virtual std::string name() const = 0;
    virtual double fetch_rate(const std::string& from, const std::string& to) = 0;
};

class QuoteProvider {
public:
    virtual ~QuoteProvider() = default;

    virtual std::string name() const = 0;

    // Daily bars for [start_date, end_date], ordered by date. May be empty
    // when the market was closed for the whole range.
    virtual std::vector<SecurityPrice> fetch_daily_prices(const std::string& symbol,
                                                          const std::string& start_date,
                                                          const std::string& end_date) = 0;
};
