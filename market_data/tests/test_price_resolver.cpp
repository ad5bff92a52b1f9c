#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/price_resolver.hpp"
#include "fakes.hpp"
#include <stdexcept>

using Catch::Approx;
using namespace std::chrono;

namespace {

struct PriceFixture {
    std::shared_ptr<InMemoryPriceStore> store = std::make_shared<InMemoryPriceStore>();
    std::shared_ptr<FakeQuoteProvider> quotes = std::make_shared<FakeQuoteProvider>();
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(test_epoch());
    PriceResolver resolver{store, quotes, clock};
};

Holding make_holding(const std::string& name, const std::string& currency, Category category) {
    Holding h;
    h.id = 1;
    h.account_id = 1;
    h.name = name;
    h.quantity = 10.0;
    h.purchase_value = 5.0;
    h.currency = currency;
    h.category = category;
    h.purchase_date = "2024-01-15";
    return h;
}

const std::string kToday = "2025-03-12";

} // namespace

TEST_CASE("Current price resolution", "[prices]") {
    PriceFixture f;
    auto vfv = make_holding("VFV - S&P 500 ETF", "CAD", Category::ETF);

    SECTION("Non-tradable categories are never priced") {
        for (auto category : {Category::RendaFixa, Category::Bonds, Category::Cash,
                              Category::ManagedPortfolio, Category::ManagedPortfolioBlock}) {
            auto h = make_holding("VFV", "CAD", category);
            REQUIRE_FALSE(f.resolver.get_current_price(h).has_value());
        }
        REQUIRE(f.quotes->calls == 0);
    }

    SECTION("Unmappable names are absent, not errors") {
        auto h = make_holding("Tesouro Selic 2029", "BRL", Category::Stocks);
        REQUIRE_FALSE(f.resolver.get_current_price(h).has_value());
        REQUIRE(f.quotes->calls == 0);
    }

    SECTION("Today's row inside the 4h window is served from the store") {
        f.store->seed("VFV.TO", kToday, 120.5, test_epoch() - hours(3) - minutes(59));

        auto price = f.resolver.get_current_price(vfv);

        REQUIRE(price.has_value());
        REQUIRE(price->symbol == "VFV.TO");
        REQUIRE(price->close == Approx(120.5));
        REQUIRE(price->origin == PriceOrigin::Cache);
        REQUIRE_FALSE(price->stale);
        REQUIRE(f.quotes->calls == 0);
    }

    SECTION("Today's row past the 4h window is refetched") {
        auto seeded_at = test_epoch() - hours(4) - minutes(1);
        f.store->seed("VFV.TO", kToday, 120.5, seeded_at);
        f.quotes->add_bar("VFV.TO", kToday, 121.25);

        auto price = f.resolver.get_current_price(vfv);

        REQUIRE(price.has_value());
        REQUIRE(price->close == Approx(121.25));
        REQUIRE(price->origin == PriceOrigin::Live);
        REQUIRE(f.quotes->calls == 1);
        REQUIRE(f.quotes->last_start == kToday);
        REQUIRE(f.quotes->last_end == kToday);

        const auto& row = f.store->rows["VFV.TO"][kToday];
        REQUIRE(row.close == Approx(121.25));
        REQUIRE(row.updated_at == test_epoch());
        REQUIRE(row.created_at == seeded_at);
    }

    SECTION("Live close matches the close later served from the store") {
        f.quotes->add_bar("VFV.TO", kToday, 121.25000762939453);

        auto live = f.resolver.get_current_price(vfv);
        f.clock->advance(hours(1));
        auto cached = f.resolver.get_current_price(vfv);

        REQUIRE(live.has_value());
        REQUIRE(cached.has_value());
        REQUIRE(live->origin == PriceOrigin::Live);
        REQUIRE(cached->origin == PriceOrigin::Cache);
        REQUIRE(live->close == cached->close);
        REQUIRE(live->close == 121.25);
        REQUIRE(f.quotes->calls == 1);
    }

    SECTION("Provider failure serves the last known close") {
        f.store->seed("VFV.TO", "2025-03-10", 118.0, test_epoch() - hours(48));
        f.store->seed("VFV.TO", "2025-03-11", 119.0, test_epoch() - hours(24));
        f.quotes->fail = true;

        auto price = f.resolver.get_current_price(vfv);

        REQUIRE(price.has_value());
        REQUIRE(price->close == Approx(119.0));
        REQUIRE(price->price_date == "2025-03-11");
        REQUIRE(price->origin == PriceOrigin::LastKnown);
        REQUIRE(price->stale);
    }

    SECTION("No bar for today also falls back to the last known close") {
        f.store->seed("VFV.TO", "2025-03-07", 117.0, test_epoch() - hours(120));
        f.quotes->add_bar("VFV.TO", "2025-03-07", 117.0);

        auto price = f.resolver.get_current_price(vfv);

        REQUIRE(price.has_value());
        REQUIRE(price->origin == PriceOrigin::LastKnown);
        REQUIRE(f.store->upserts == 0);
    }

    SECTION("Nothing live and nothing stored") {
        f.quotes->fail = true;
        REQUIRE_FALSE(f.resolver.get_current_price(vfv).has_value());
    }
}

TEST_CASE("Price series", "[prices]") {
    PriceFixture f;
    auto long_ago = test_epoch() - hours(24 * 7);

    SECTION("Invalid requests are rejected") {
        REQUIRE_THROWS_AS(f.resolver.get_price_series("  ", "2025-03-01", "2025-03-05"), std::invalid_argument);
        REQUIRE_THROWS_AS(f.resolver.get_price_series("VFV.TO", "2025-03-06", "2025-03-05"), std::invalid_argument);
        REQUIRE_THROWS_AS(f.resolver.get_price_series("VFV.TO", "2025/03/01", "2025-03-05"), std::invalid_argument);
        REQUIRE(f.quotes->calls == 0);
    }

    SECTION("Covered past range is served from the store") {
        for (auto d : {"2025-03-03", "2025-03-04", "2025-03-05"}) {
            f.store->seed("VFV.TO", d, 100.0, long_ago);
        }

        auto rows = f.resolver.get_price_series("vfv.to", "2025-03-03", "2025-03-05");

        REQUIRE(rows.size() == 3);
        REQUIRE(rows.front().price_date == "2025-03-03");
        REQUIRE(rows.back().price_date == "2025-03-05");
        REQUIRE(f.quotes->calls == 0);
    }

    SECTION("Uncovered upper bound triggers a refetch") {
        f.store->seed("VFV.TO", "2025-03-03", 100.0, long_ago);
        for (auto d : {"2025-03-03", "2025-03-04", "2025-03-05", "2025-03-06", "2025-03-07"}) {
            f.quotes->add_bar("VFV.TO", d, 101.0);
        }

        auto rows = f.resolver.get_price_series("VFV.TO", "2025-03-03", "2025-03-07");

        REQUIRE(f.quotes->calls == 1);
        REQUIRE(rows.size() == 5);
        REQUIRE(rows.front().close == Approx(101.0));
        REQUIRE(rows.back().price_date == "2025-03-07");
    }

    SECTION("Future upper bound does not force a refetch") {
        f.store->seed("VFV.TO", "2025-03-11", 100.0, long_ago);
        f.store->seed("VFV.TO", kToday, 101.0, test_epoch() - hours(1));

        auto rows = f.resolver.get_price_series("VFV.TO", "2025-03-10", "2025-03-20");

        REQUIRE(rows.size() == 2);
        REQUIRE(f.quotes->calls == 0);
    }

    SECTION("Stale bar for today triggers a refetch") {
        f.store->seed("VFV.TO", kToday, 101.0, test_epoch() - hours(5));
        f.quotes->add_bar("VFV.TO", kToday, 102.0);

        auto rows = f.resolver.get_price_series("VFV.TO", "2025-03-10", kToday);

        REQUIRE(f.quotes->calls == 1);
        REQUIRE(rows.size() == 1);
        REQUIRE(rows[0].close == Approx(102.0));
    }

    SECTION("Refetch failure returns what is persisted") {
        f.store->seed("VFV.TO", "2025-03-03", 100.0, long_ago);
        f.quotes->fail = true;

        auto rows = f.resolver.get_price_series("VFV.TO", "2025-03-03", "2025-03-07");

        REQUIRE(f.quotes->calls == 1);
        REQUIRE(rows.size() == 1);
    }

    SECTION("Forced refresh always refetches") {
        f.store->seed("VFV.TO", "2025-03-05", 100.0, long_ago);
        f.quotes->add_bar("VFV.TO", "2025-03-05", 100.5);

        auto rows = f.resolver.get_price_series("VFV.TO", "2025-03-05", "2025-03-05", true);

        REQUIRE(f.quotes->calls == 1);
        REQUIRE(rows.size() == 1);
        REQUIRE(rows[0].close == Approx(100.5));
    }
}

TEST_CASE("Price maintenance", "[prices]") {
    PriceFixture f;
    f.store->seed("VFV.TO", "2025-03-10", 100.0, test_epoch());
    f.store->seed("VFV.TO", "2025-03-11", 101.0, test_epoch());
    f.store->seed("PETR4.SA", "2025-03-11", 38.0, test_epoch());

    SECTION("Known symbols") {
        REQUIRE(f.resolver.known_symbols() == std::vector<std::string>{"PETR4.SA", "VFV.TO"});
    }

    SECTION("Purge one day") {
        REQUIRE(f.resolver.purge_prices("vfv.to", std::string("2025-03-10")) == 1);
        REQUIRE(f.store->rows["VFV.TO"].size() == 1);
    }

    SECTION("Purge a whole symbol") {
        REQUIRE(f.resolver.purge_prices("VFV.TO") == 2);
        REQUIRE(f.resolver.known_symbols() == std::vector<std::string>{"PETR4.SA"});
    }

    SECTION("Purge rejects a malformed date") {
        REQUIRE_THROWS_AS(f.resolver.purge_prices("VFV.TO", std::string("10/03/2025")), std::invalid_argument);
    }
}
