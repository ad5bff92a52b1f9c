#pragma once

#include "exchange_rate_resolver.hpp"
#include "market_types.hpp"
#include "price_resolver.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct HoldingPerformance {
    int64_t holding_id = 0;
    std::string name;
    std::string symbol;            // empty when unmappable or not tradable
    std::string category;
    std::string currency;
    double quantity = 0.0;
    double purchase_price = 0.0;
    std::optional<double> current_price;
    std::optional<std::string> price_date;
    bool price_stale = false;
    double total_invested = 0.0;
    double current_value = 0.0;
    double gain_loss = 0.0;
    double gain_loss_percentage = 0.0;
    bool has_current_price = false;

    nlohmann::json to_json() const;
};

struct AccountPerformance {
    int64_t account_id = 0;
    std::string account_name;
    int sort_order = 0;
    std::vector<HoldingPerformance> investments;
    double total_invested = 0.0;
    double current_value = 0.0;
    double total_gain_loss = 0.0;
    double total_gain_loss_percentage = 0.0;

    nlohmann::json to_json() const;
};

struct ConvertedHolding {
    int64_t holding_id = 0;
    std::string name;
    std::string account;
    double quantity = 0.0;
    std::string purchase_date;
    double original_value = 0.0;
    std::string original_currency;
    double converted_value = 0.0;

    nlohmann::json to_json() const;
};

struct ConvertedPortfolio {
    std::string currency;
    double total = 0.0;
    std::map<std::string, double> by_source_currency;   // already converted
    std::vector<ConvertedHolding> investments;

    nlohmann::json to_json() const;
};

class PerformanceCalculator {
public:
    PerformanceCalculator(std::shared_ptr<PriceResolver> prices,
                          std::shared_ptr<ExchangeRateResolver> rates);

    HoldingPerformance holding_performance(const Holding& holding);
    AccountPerformance account_performance(const Account& account);

    // Ordered by (sort_order, name); ties keep input order
    std::vector<AccountPerformance> all_accounts(const std::vector<Account>& accounts);

    // Book value of every holding expressed in one currency. A missing rate
    // propagates as MarketDataError(NoRateAvailable).
    ConvertedPortfolio convert_portfolio(const std::vector<Account>& accounts, const std::string& target);

    static HoldingPerformance evaluate(const Holding& holding,
                                       const std::optional<ResolvedPrice>& price,
                                       const std::string& symbol);
    static AccountPerformance summarize(const Account& account, std::vector<HoldingPerformance> investments);

private:
    std::shared_ptr<PriceResolver> prices_;
    std::shared_ptr<ExchangeRateResolver> rates_;
};
