#include "performance.hpp"
#include "util.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace {

double percentage(double gain_loss, double invested) {
    return invested > 0.0 ? gain_loss / invested * 100.0 : 0.0;
}

} // namespace

nlohmann::json HoldingPerformance::to_json() const {
    return {
        {"investment_id", holding_id},
        {"name", name},
        {"symbol", symbol},
        {"category", category},
        {"currency", currency},
        {"quantity", quantity},
        {"purchase_price", purchase_price},
        {"current_price", current_price ? nlohmann::json(*current_price) : nlohmann::json(nullptr)},
        {"price_date", price_date ? nlohmann::json(*price_date) : nlohmann::json(nullptr)},
        {"price_stale", price_stale},
        {"total_invested", total_invested},
        {"current_value", current_value},
        {"gain_loss", gain_loss},
        {"gain_loss_percentage", gain_loss_percentage},
        {"has_current_price", has_current_price}
    };
}

nlohmann::json AccountPerformance::to_json() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& inv : investments) {
        items.push_back(inv.to_json());
    }

    return {
        {"account_id", account_id},
        {"account_name", account_name},
        {"investments", items},
        {"total_invested", total_invested},
        {"current_value", current_value},
        {"total_gain_loss", total_gain_loss},
        {"total_gain_loss_percentage", total_gain_loss_percentage}
    };
}

nlohmann::json ConvertedHolding::to_json() const {
    return {
        {"investment_id", holding_id},
        {"name", name},
        {"account", account},
        {"quantity", quantity},
        {"date", purchase_date},
        {"original_value", original_value},
        {"original_currency", original_currency},
        {"converted_value", converted_value}
    };
}

nlohmann::json ConvertedPortfolio::to_json() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& inv : investments) {
        items.push_back(inv.to_json());
    }

    return {
        {"currency", currency},
        {"total", total},
        {"by_source_currency", by_source_currency},
        {"investments", items}
    };
}

PerformanceCalculator::PerformanceCalculator(std::shared_ptr<PriceResolver> prices,
                                             std::shared_ptr<ExchangeRateResolver> rates)
    : prices_(std::move(prices))
    , rates_(std::move(rates))
{}

HoldingPerformance PerformanceCalculator::evaluate(const Holding& holding,
                                                   const std::optional<ResolvedPrice>& price,
                                                   const std::string& symbol) {
    HoldingPerformance perf;
    perf.holding_id = holding.id;
    perf.name = holding.name;
    perf.symbol = symbol;
    perf.category = category_to_string(holding.category);
    perf.currency = holding.currency;
    perf.quantity = holding.quantity;
    perf.purchase_price = holding.purchase_value;

    perf.total_invested = holding.quantity * holding.purchase_value;

    if (price) {
        perf.current_price = price->close;
        perf.price_date = price->price_date;
        perf.price_stale = price->stale;
        perf.has_current_price = true;
        perf.current_value = holding.quantity * price->close;
    } else {
        // No price means no change, never zero
        perf.current_value = perf.total_invested;
    }

    perf.gain_loss = perf.current_value - perf.total_invested;
    perf.gain_loss_percentage = percentage(perf.gain_loss, perf.total_invested);

    return perf;
}

AccountPerformance PerformanceCalculator::summarize(const Account& account,
                                                    std::vector<HoldingPerformance> investments) {
    AccountPerformance perf;
    perf.account_id = account.id;
    perf.account_name = account.name;
    perf.sort_order = account.sort_order;

    for (const auto& inv : investments) {
        perf.total_invested += inv.total_invested;
        perf.current_value += inv.current_value;
        perf.total_gain_loss += inv.gain_loss;
    }
    perf.total_gain_loss_percentage = percentage(perf.total_gain_loss, perf.total_invested);
    perf.investments = std::move(investments);

    return perf;
}

HoldingPerformance PerformanceCalculator::holding_performance(const Holding& holding) {
    auto price = prices_->get_current_price(holding);

    std::string symbol;
    if (price) {
        symbol = price->symbol;
    } else if (auto mapped = prices_->mapper().map_to_symbol(holding.name, holding.currency)) {
        symbol = *mapped;
    }

    return evaluate(holding, price, symbol);
}

AccountPerformance PerformanceCalculator::account_performance(const Account& account) {
    std::vector<HoldingPerformance> investments;
    investments.reserve(account.holdings.size());

    for (const auto& holding : account.holdings) {
        investments.push_back(holding_performance(holding));
    }

    auto perf = summarize(account, std::move(investments));
    spdlog::debug("Account {} '{}': invested {:.2f}, value {:.2f}",
                  perf.account_id, perf.account_name, perf.total_invested, perf.current_value);
    return perf;
}

std::vector<AccountPerformance> PerformanceCalculator::all_accounts(const std::vector<Account>& accounts) {
    std::vector<const Account*> ordered;
    ordered.reserve(accounts.size());
    for (const auto& account : accounts) {
        ordered.push_back(&account);
    }

    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const Account* a, const Account* b) {
                         if (a->sort_order != b->sort_order) return a->sort_order < b->sort_order;
                         return a->name < b->name;
                     });

    std::vector<AccountPerformance> result;
    result.reserve(ordered.size());
    for (const auto* account : ordered) {
        result.push_back(account_performance(*account));
    }
    return result;
}

ConvertedPortfolio PerformanceCalculator::convert_portfolio(const std::vector<Account>& accounts,
                                                            const std::string& target) {
    ConvertedPortfolio portfolio;
    portfolio.currency = util::to_upper(util::trim(target));

    for (const auto& account : accounts) {
        for (const auto& holding : account.holdings) {
            ConvertedHolding item;
            item.holding_id = holding.id;
            item.name = holding.name;
            item.account = account.name;
            item.quantity = holding.quantity;
            item.purchase_date = holding.purchase_date;
            item.original_value = holding.quantity * holding.purchase_value;
            item.original_currency = util::to_upper(util::trim(holding.currency));
            item.converted_value = rates_->convert(item.original_value, item.original_currency, portfolio.currency);

            portfolio.total += item.converted_value;
            portfolio.by_source_currency[item.original_currency] += item.converted_value;
            portfolio.investments.push_back(item);
        }
    }

    spdlog::debug("Converted {} holdings to {}: {}", portfolio.investments.size(), portfolio.currency, portfolio.total);
    return portfolio;
}
