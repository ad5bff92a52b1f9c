#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/command_router.hpp"
#include "fakes.hpp"

using Catch::Approx;
using namespace std::chrono;

namespace {

struct RouterFixture {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(test_epoch());
    std::shared_ptr<InMemoryRateStore> rates = std::make_shared<InMemoryRateStore>();
    std::shared_ptr<InMemoryPriceStore> prices = std::make_shared<InMemoryPriceStore>();
    std::shared_ptr<FakeQuoteProvider> quotes = std::make_shared<FakeQuoteProvider>();
    std::shared_ptr<InMemoryHoldingSource> holdings = std::make_shared<InMemoryHoldingSource>();
    std::shared_ptr<std::vector<std::string>> calls = std::make_shared<std::vector<std::string>>();
    std::shared_ptr<ScriptedRateProvider> primary = std::make_shared<ScriptedRateProvider>("rates-api", calls);
    std::shared_ptr<ScriptedRateProvider> secondary = std::make_shared<ScriptedRateProvider>("chart-api", calls);
    int refresh_triggers = 0;

    std::shared_ptr<ExchangeRateResolver> rate_resolver =
        std::make_shared<ExchangeRateResolver>(rates, primary, secondary, clock);
    std::shared_ptr<PriceResolver> price_resolver =
        std::make_shared<PriceResolver>(prices, quotes, clock);
    std::shared_ptr<PerformanceService> performance = std::make_shared<PerformanceService>(
        holdings,
        std::make_shared<PerformanceCalculator>(price_resolver, rate_resolver),
        std::make_shared<ResultCache>(clock));

    CommandRouter router{rate_resolver, price_resolver, performance,
                         [this]() { refresh_triggers++; }, clock};

    nlohmann::json send(const std::string& cmd, const nlohmann::json& args = nlohmann::json::object()) {
        return router.handle({{"cmd", cmd}, {"corr_id", "c-1"}, {"args", args}});
    }
};

} // namespace

TEST_CASE("Rate commands", "[router]") {
    RouterFixture f;
    f.rates->seed("CAD", "USD", 0.7, test_epoch());

    SECTION("Rate lookup") {
        auto reply = f.send("rate", {{"from", "cad"}, {"to", "USD"}});

        REQUIRE(reply["ok"] == true);
        REQUIRE(reply["corr_id"] == "c-1");
        REQUIRE(reply["data"]["rate"].get<double>() == Approx(0.7));
        REQUIRE(reply["ts"] == "2025-03-12T15:00:00Z");
    }

    SECTION("Unavailable rate") {
        auto reply = f.send("rate", {{"from", "BRL"}, {"to", "USD"}});

        REQUIRE(reply["ok"] == false);
        REQUIRE(reply["message"].get<std::string>().find("not found") != std::string::npos);
    }

    SECTION("Conversion") {
        auto reply = f.send("convert", {{"amount", 200}, {"from", "CAD"}, {"to", "USD"}});

        REQUIRE(reply["ok"] == true);
        REQUIRE(reply["data"]["converted"].get<double>() == Approx(140.0));
    }

    SECTION("Conversion without a rate is an error reply") {
        auto reply = f.send("convert", {{"amount", 200}, {"from", "BRL"}, {"to", "USD"}});

        REQUIRE(reply["ok"] == false);
        REQUIRE(reply["message"].get<std::string>().find("NoRateAvailable") != std::string::npos);
    }

    SECTION("Current rates") {
        auto reply = f.send("rates");
        REQUIRE(reply["data"]["CADUSD"].get<double>() == Approx(0.7));
    }

    SECTION("Refresh trigger") {
        auto reply = f.send("refresh_rates");
        REQUIRE(reply["ok"] == true);
        REQUIRE(f.refresh_triggers == 1);
    }
}

TEST_CASE("Price commands", "[router]") {
    RouterFixture f;
    f.prices->seed("PETR4.SA", "2025-03-12", 38.2, test_epoch());
    f.prices->seed("PETR4.SA", "2025-03-11", 37.9, test_epoch() - hours(24));

    SECTION("Current price for a named holding") {
        auto reply = f.send("price", {{"name", "Petrobras PN"}, {"currency", "BRL"}, {"category", "Stocks"}});

        REQUIRE(reply["ok"] == true);
        REQUIRE(reply["data"]["symbol"] == "PETR4.SA");
        REQUIRE(reply["data"]["origin"] == "cache");
    }

    SECTION("No price is a null result, not an error") {
        auto reply = f.send("price", {{"name", "Tesouro IPCA"}, {"currency", "BRL"}, {"category", "RendaFixa"}});

        REQUIRE(reply["ok"] == true);
        REQUIRE(reply["data"].is_null());
    }

    SECTION("Unknown category") {
        auto reply = f.send("price", {{"name", "PETR4"}, {"currency", "BRL"}, {"category", "Crypto"}});
        REQUIRE(reply["ok"] == false);
    }

    SECTION("Series") {
        auto reply = f.send("price_series", {{"symbol", "petr4.sa"}, {"start", "2025-03-11"}, {"end", "2025-03-12"}});

        REQUIRE(reply["ok"] == true);
        REQUIRE(reply["data"].size() == 2);
        REQUIRE(reply["data"][0]["date"] == "2025-03-11");
        REQUIRE(f.quotes->calls == 0);
    }

    SECTION("Series defaults to the last 30 days") {
        f.send("price_series", {{"symbol", "PETR4.SA"}, {"force_refresh", true}});

        REQUIRE(f.quotes->calls == 1);
        REQUIRE(f.quotes->last_start == "2025-02-10");
        REQUIRE(f.quotes->last_end == "2025-03-12");
    }

    SECTION("Bad series range") {
        auto reply = f.send("price_series", {{"symbol", "PETR4.SA"}, {"start", "2025-03-12"}, {"end", "2025-03-01"}});
        REQUIRE(reply["ok"] == false);
    }

    SECTION("Known symbols and purge") {
        REQUIRE(f.send("symbols")["data"] == nlohmann::json::array({"PETR4.SA"}));

        auto reply = f.send("purge_prices", {{"symbol", "PETR4.SA"}, {"date", "2025-03-11"}});
        REQUIRE(reply["data"]["deleted"] == 1);
        REQUIRE(f.prices->rows["PETR4.SA"].size() == 1);
    }
}

TEST_CASE("Performance commands", "[router]") {
    RouterFixture f;
    f.prices->seed("XYZ.TO", "2025-03-12", 7.0, test_epoch());

    Account account;
    account.id = 3;
    account.name = "TFSA";
    Holding h;
    h.id = 30;
    h.account_id = 3;
    h.name = "XYZ";
    h.quantity = 10;
    h.purchase_value = 5;
    h.currency = "CAD";
    h.category = Category::ETF;
    account.holdings.push_back(h);
    f.holdings->accounts[42] = {account};

    SECTION("Portfolio view") {
        auto reply = f.send("portfolio_performance", {{"user_id", 42}});

        REQUIRE(reply["ok"] == true);
        REQUIRE(reply["data"].size() == 1);
        REQUIRE(reply["data"][0]["total_gain_loss_percentage"].get<double>() == Approx(40.0));
    }

    SECTION("Account view and invalidation") {
        REQUIRE(f.send("account_performance", {{"user_id", 42}, {"account_id", 3}})["ok"] == true);
        REQUIRE(f.send("account_performance", {{"user_id", 42}, {"account_id", 3}})["ok"] == true);
        REQUIRE(f.holdings->loads == 1);

        auto reply = f.send("holdings_changed", {{"user_id", 42}});
        REQUIRE(reply["data"]["evicted"] == 1);

        f.send("account_performance", {{"user_id", 42}, {"account_id", 3}});
        REQUIRE(f.holdings->loads == 2);
    }

    SECTION("Portfolio in another currency") {
        f.rates->seed("CAD", "USD", 0.7, test_epoch());
        auto reply = f.send("portfolio_in_currency", {{"user_id", 42}, {"currency", "usd"}});

        REQUIRE(reply["ok"] == true);
        REQUIRE(reply["data"]["currency"] == "USD");
        REQUIRE(reply["data"]["total"].get<double>() == Approx(35.0));
        REQUIRE(reply["data"]["investments"][0]["account"] == "TFSA");
        REQUIRE(reply["data"]["investments"][0]["converted_value"].get<double>() == Approx(35.0));
    }

    SECTION("Portfolio conversion without a rate") {
        auto reply = f.send("portfolio_in_currency", {{"user_id", 42}, {"currency", "BRL"}});

        REQUIRE(reply["ok"] == false);
        REQUIRE(reply["message"].get<std::string>().find("NoRateAvailable") != std::string::npos);
    }

    SECTION("Foreign account") {
        auto reply = f.send("account_performance", {{"user_id", 7}, {"account_id", 3}});
        REQUIRE(reply["ok"] == false);
    }

    SECTION("Missing user id") {
        auto reply = f.send("portfolio_performance");
        REQUIRE(reply["ok"] == false);
        REQUIRE(reply["message"] == "missing argument: user_id");
    }
}

TEST_CASE("Malformed requests", "[router]") {
    RouterFixture f;

    SECTION("Unknown command") {
        auto reply = f.send("balance");
        REQUIRE(reply["ok"] == false);
        REQUIRE(reply["corr_id"] == "c-1");
    }

    SECTION("Not an object") {
        auto reply = f.router.handle(nlohmann::json::array());
        REQUIRE(reply["ok"] == false);
        REQUIRE(reply["corr_id"] == "");
    }

    SECTION("Wrong argument types") {
        auto reply = f.send("convert", {{"amount", "lots"}, {"from", "CAD"}, {"to", "USD"}});
        REQUIRE(reply["ok"] == false);
    }
}
