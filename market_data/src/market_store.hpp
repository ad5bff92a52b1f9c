#pragma once

#include "market_types.hpp"
#include <optional>
#include <string>
#include <vector>

// Cached exchange rates, one row per ordered pair
class RateStore {
public:
    virtual ~RateStore() = default;

    virtual std::optional<ExchangeRate> find_rate(const std::string& from, const std::string& to) = 0;
    virtual void upsert_rate(const ExchangeRate& rate) = 0;
    virtual std::vector<ExchangeRate> rates_updated_since(TimePoint since) = 0;
};

// Daily security prices, one row per (symbol, price_date)
class PriceStore {
public:
    virtual ~PriceStore() = default;

    virtual std::optional<SecurityPrice> find_price(const std::string& symbol, const std::string& date) = 0;
    virtual std::optional<SecurityPrice> latest_price(const std::string& symbol) = 0;
    virtual std::vector<SecurityPrice> prices_in_range(const std::string& symbol,
                                                       const std::string& start_date,
                                                       const std::string& end_date) = 0;
    // Keeps created_at of an existing row, replaces everything else
    virtual void upsert_price(const SecurityPrice& price) = 0;
    virtual std::vector<std::string> known_symbols() = 0;
    virtual size_t delete_prices(const std::string& symbol, const std::optional<std::string>& date) = 0;
};

// Read-only view of the accounts and holdings owned by the CRUD layer
class HoldingSource {
public:
    virtual ~HoldingSource() = default;

    virtual std::vector<Account> accounts_for_user(int64_t user_id) = 0;
};
