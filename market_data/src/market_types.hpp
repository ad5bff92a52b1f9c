#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using TimePoint = std::chrono::system_clock::time_point;

// Decimal places kept by the exchange_rates.rate and security_prices columns
constexpr int kRateScale = 8;
constexpr int kPriceScale = 4;

struct ExchangeRate {
    std::string from_currency;
    std::string to_currency;
    double rate = 0.0;
    TimePoint last_updated;

    std::string pair_key() const { return from_currency + to_currency; }
};

struct CurrencyPair {
    std::string from;
    std::string to;
};

struct SecurityPrice {
    std::string symbol;
    std::string price_date;     // YYYY-MM-DD
    std::optional<double> open;
    std::optional<double> high;
    std::optional<double> low;
    double close = 0.0;
    std::optional<int64_t> volume;
    std::optional<std::string> currency;
    std::optional<std::string> exchange_name;
    TimePoint created_at;
    TimePoint updated_at;
};

enum class Category {
    RendaFixa,
    Stocks,
    FIIs,
    ETF,
    Bonds,
    ManagedPortfolio,
    Cash,
    ManagedPortfolioBlock
};

std::string category_to_string(Category category);
std::optional<Category> category_from_string(const std::string& text);
bool is_tradable(Category category);

struct Holding {
    int64_t id = 0;
    int64_t account_id = 0;
    std::string name;
    double quantity = 0.0;
    double purchase_value = 0.0;   // unit price paid
    std::string currency;
    Category category = Category::Stocks;
    std::string purchase_date;     // YYYY-MM-DD
};

struct Account {
    int64_t id = 0;
    std::string name;
    int sort_order = 0;
    std::vector<Holding> holdings;
};

enum class PriceOrigin {
    Cache,      // today's row, inside the freshness window
    Live,       // fetched from the provider just now
    LastKnown   // provider failed, most recent persisted row served
};

std::string origin_to_string(PriceOrigin origin);

struct ResolvedPrice {
    std::string symbol;
    double close = 0.0;
    std::string price_date;
    PriceOrigin origin = PriceOrigin::Cache;
    bool stale = false;
};

struct RefreshReport {
    std::vector<std::string> refreshed;
    std::vector<std::string> failed;
};
