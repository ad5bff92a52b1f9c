#pragma once

#include "market_store.hpp"
#include <pqxx/pqxx>
#include <string>

class PostgresStore : public RateStore, public PriceStore, public HoldingSource {
public:
    explicit PostgresStore(const std::string& dsn);

    void init_schema();

    // RateStore
    std::optional<ExchangeRate> find_rate(const std::string& from, const std::string& to) override;
    void upsert_rate(const ExchangeRate& rate) override;
    std::vector<ExchangeRate> rates_updated_since(TimePoint since) override;

    // PriceStore
    std::optional<SecurityPrice> find_price(const std::string& symbol, const std::string& date) override;
    std::optional<SecurityPrice> latest_price(const std::string& symbol) override;
    std::vector<SecurityPrice> prices_in_range(const std::string& symbol,
                                               const std::string& start_date,
                                               const std::string& end_date) override;
    void upsert_price(const SecurityPrice& price) override;
    std::vector<std::string> known_symbols() override;
    size_t delete_prices(const std::string& symbol, const std::optional<std::string>& date) override;

    // HoldingSource
    std::vector<Account> accounts_for_user(int64_t user_id) override;

    bool ping();

private:
    std::string dsn_;

    pqxx::connection make_connection();

    static ExchangeRate rate_from_row(const pqxx::row& row);
    static SecurityPrice price_from_row(const pqxx::row& row);
};
