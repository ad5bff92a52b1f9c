#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/performance.hpp"
#include "fakes.hpp"

using Catch::Approx;
using namespace std::chrono;

namespace {

struct PerformanceFixture {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(test_epoch());
    std::shared_ptr<InMemoryPriceStore> prices = std::make_shared<InMemoryPriceStore>();
    std::shared_ptr<FakeQuoteProvider> quotes = std::make_shared<FakeQuoteProvider>();
    std::shared_ptr<InMemoryRateStore> rates = std::make_shared<InMemoryRateStore>();
    std::shared_ptr<std::vector<std::string>> calls = std::make_shared<std::vector<std::string>>();
    std::shared_ptr<ScriptedRateProvider> primary = std::make_shared<ScriptedRateProvider>("rates-api", calls);
    std::shared_ptr<ScriptedRateProvider> secondary = std::make_shared<ScriptedRateProvider>("chart-api", calls);

    std::shared_ptr<PriceResolver> price_resolver =
        std::make_shared<PriceResolver>(prices, quotes, clock);
    std::shared_ptr<ExchangeRateResolver> rate_resolver =
        std::make_shared<ExchangeRateResolver>(rates, primary, secondary, clock);
    PerformanceCalculator calculator{price_resolver, rate_resolver};

    PerformanceFixture() {
        quotes->fail = true;
    }
};

Holding make_holding(int64_t id, const std::string& name, double qty, double value,
                     const std::string& currency, Category category) {
    Holding h;
    h.id = id;
    h.account_id = 1;
    h.name = name;
    h.quantity = qty;
    h.purchase_value = value;
    h.currency = currency;
    h.category = category;
    h.purchase_date = "2024-06-03";
    return h;
}

Account make_account(int64_t id, const std::string& name, int sort_order) {
    Account a;
    a.id = id;
    a.name = name;
    a.sort_order = sort_order;
    return a;
}

} // namespace

TEST_CASE("Holding performance", "[performance]") {
    PerformanceFixture f;

    SECTION("Resolved price drives current value") {
        f.prices->seed("XYZ.TO", "2025-03-12", 7.0, test_epoch());
        auto perf = f.calculator.holding_performance(make_holding(1, "XYZ", 10, 5, "CAD", Category::Stocks));

        REQUIRE(perf.symbol == "XYZ.TO");
        REQUIRE(perf.has_current_price);
        REQUIRE(perf.total_invested == Approx(50.0));
        REQUIRE(perf.current_value == Approx(70.0));
        REQUIRE(perf.gain_loss == Approx(20.0));
        REQUIRE(perf.gain_loss_percentage == Approx(40.0));
    }

    SECTION("Missing price means no change") {
        auto perf = f.calculator.holding_performance(make_holding(2, "XYZ", 10, 5, "CAD", Category::Stocks));

        REQUIRE_FALSE(perf.has_current_price);
        REQUIRE(perf.symbol == "XYZ.TO");
        REQUIRE(perf.current_value == Approx(50.0));
        REQUIRE(perf.gain_loss == 0.0);
        REQUIRE(perf.gain_loss_percentage == 0.0);
    }

    SECTION("Non-tradable holding keeps its book value") {
        auto perf = f.calculator.holding_performance(
            make_holding(3, "CDB Banco Inter 2027", 1, 1000, "BRL", Category::RendaFixa));

        REQUIRE_FALSE(perf.has_current_price);
        REQUIRE(perf.current_value == Approx(1000.0));
        REQUIRE(perf.category == "RendaFixa");
    }

    SECTION("Zero invested never divides") {
        ResolvedPrice price{"XYZ.TO", 7.0, "2025-03-12", PriceOrigin::Cache, false};

        auto free_shares = PerformanceCalculator::evaluate(
            make_holding(4, "XYZ", 10, 0, "CAD", Category::Stocks), price, "XYZ.TO");
        REQUIRE(free_shares.total_invested == 0.0);
        REQUIRE(free_shares.gain_loss == Approx(70.0));
        REQUIRE(free_shares.gain_loss_percentage == 0.0);

        auto empty = PerformanceCalculator::evaluate(
            make_holding(5, "XYZ", 0, 5, "CAD", Category::Stocks), price, "XYZ.TO");
        REQUIRE(empty.gain_loss_percentage == 0.0);
    }

    SECTION("Stale price is flagged") {
        ResolvedPrice price{"XYZ.TO", 6.0, "2025-03-07", PriceOrigin::LastKnown, true};
        auto perf = PerformanceCalculator::evaluate(
            make_holding(6, "XYZ", 10, 5, "CAD", Category::Stocks), price, "XYZ.TO");

        REQUIRE(perf.price_stale);
        REQUIRE(perf.price_date == std::string("2025-03-07"));
        REQUIRE(perf.gain_loss_percentage == Approx(20.0));
    }
}

TEST_CASE("Account performance", "[performance]") {
    PerformanceFixture f;
    f.prices->seed("XYZ.TO", "2025-03-12", 7.0, test_epoch());

    SECTION("Totals are sums of holdings") {
        auto account = make_account(1, "TFSA", 0);
        account.holdings.push_back(make_holding(1, "XYZ", 10, 5, "CAD", Category::Stocks));
        account.holdings.push_back(make_holding(2, "GIC 2026", 4, 25, "CAD", Category::RendaFixa));

        auto perf = f.calculator.account_performance(account);

        REQUIRE(perf.investments.size() == 2);
        REQUIRE(perf.total_invested == Approx(150.0));
        REQUIRE(perf.current_value == Approx(170.0));
        REQUIRE(perf.total_gain_loss == Approx(20.0));
        REQUIRE(perf.total_gain_loss_percentage == Approx(20.0 / 150.0 * 100.0));
    }

    SECTION("Empty account") {
        auto perf = f.calculator.account_performance(make_account(2, "Empty", 0));
        REQUIRE(perf.total_invested == 0.0);
        REQUIRE(perf.total_gain_loss_percentage == 0.0);
    }

    SECTION("Accounts ordered by sort order then name") {
        std::vector<Account> accounts = {
            make_account(1, "Brokerage", 2),
            make_account(2, "Zeta", 1),
            make_account(3, "Alpha", 1),
            make_account(4, "Alpha", 1),
        };

        auto first = f.calculator.all_accounts(accounts);
        REQUIRE(first.size() == 4);
        REQUIRE(first[0].account_id == 3);
        REQUIRE(first[1].account_id == 4);
        REQUIRE(first[2].account_id == 2);
        REQUIRE(first[3].account_id == 1);

        auto second = f.calculator.all_accounts(accounts);
        nlohmann::json a = nlohmann::json::array();
        nlohmann::json b = nlohmann::json::array();
        for (const auto& p : first) a.push_back(p.to_json());
        for (const auto& p : second) b.push_back(p.to_json());
        REQUIRE(a.dump() == b.dump());
    }

    SECTION("Serialized view") {
        auto account = make_account(7, "RRSP", 0);
        account.holdings.push_back(make_holding(1, "Tesouro Selic", 1, 100, "BRL", Category::Bonds));

        auto json = f.calculator.account_performance(account).to_json();

        REQUIRE(json["account_id"] == 7);
        REQUIRE(json["investments"].size() == 1);
        REQUIRE(json["investments"][0]["current_price"].is_null());
        REQUIRE(json["investments"][0]["has_current_price"] == false);
    }
}

TEST_CASE("Portfolio conversion", "[performance]") {
    PerformanceFixture f;
    f.rates->seed("CAD", "USD", 0.7, test_epoch());

    auto account = make_account(1, "TFSA", 0);
    account.holdings = {
        make_holding(1, "XYZ", 10, 10, "CAD", Category::Stocks),
        make_holding(2, "AAPL", 1, 50, "USD", Category::Stocks),
    };
    std::vector<Account> accounts = {account};

    SECTION("Book values summed in the target currency") {
        auto portfolio = f.calculator.convert_portfolio(accounts, "usd");

        REQUIRE(portfolio.currency == "USD");
        REQUIRE(portfolio.total == Approx(120.0));
        REQUIRE(portfolio.by_source_currency["CAD"] == Approx(70.0));
        REQUIRE(portfolio.by_source_currency["USD"] == Approx(50.0));
    }

    SECTION("Each holding carries its original and converted value") {
        auto portfolio = f.calculator.convert_portfolio(accounts, "USD");

        REQUIRE(portfolio.investments.size() == 2);
        REQUIRE(portfolio.investments[0].holding_id == 1);
        REQUIRE(portfolio.investments[0].account == "TFSA");
        REQUIRE(portfolio.investments[0].original_value == Approx(100.0));
        REQUIRE(portfolio.investments[0].original_currency == "CAD");
        REQUIRE(portfolio.investments[0].converted_value == Approx(70.0));
        REQUIRE(portfolio.investments[1].converted_value == Approx(50.0));

        auto json = portfolio.to_json();
        REQUIRE(json["investments"][0]["date"] == "2024-06-03");
    }

    SECTION("Missing rate propagates") {
        accounts[0].holdings.push_back(make_holding(3, "PETR4", 10, 30, "BRL", Category::Stocks));

        try {
            f.calculator.convert_portfolio(accounts, "USD");
            FAIL("conversion should have thrown");
        } catch (const MarketDataError& e) {
            REQUIRE(e.kind() == ErrorKind::NoRateAvailable);
        }
    }
}
