#include "price_resolver.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

PriceResolver::PriceResolver(std::shared_ptr<PriceStore> store,
                             std::shared_ptr<QuoteProvider> provider,
                             std::shared_ptr<Clock> clock,
                             std::chrono::seconds freshness)
    : store_(std::move(store))
    , provider_(std::move(provider))
    , clock_(std::move(clock))
    , freshness_(freshness)
{}

bool PriceResolver::is_fresh(const SecurityPrice& price) const {
    return clock_->now() - price.updated_at <= freshness_;
}

SecurityPrice PriceResolver::stamp(SecurityPrice row) const {
    auto to_scale = [](std::optional<double>& v) {
        if (v) v = util::round_to(*v, kPriceScale);
    };
    to_scale(row.open);
    to_scale(row.high);
    to_scale(row.low);
    row.close = util::round_to(row.close, kPriceScale);

    auto now = clock_->now();
    row.created_at = now;
    row.updated_at = now;
    return row;
}

std::optional<ResolvedPrice> PriceResolver::get_current_price(const Holding& holding) {
    if (!is_tradable(holding.category)) {
        return std::nullopt;
    }

    auto symbol = mapper_.map_to_symbol(holding.name, holding.currency);
    if (!symbol) {
        spdlog::warn("{}: could not map '{}' ({}) to a symbol",
                     error_kind_name(ErrorKind::UnmappableSymbol), holding.name, holding.currency);
        return std::nullopt;
    }

    return get_symbol_price(*symbol);
}

std::optional<ResolvedPrice> PriceResolver::get_symbol_price(const std::string& symbol) {
    auto sym = util::to_upper(util::trim(symbol));
    if (sym.empty()) {
        return std::nullopt;
    }

    try {
        auto today = util::format_date(clock_->now());

        auto cached = store_->find_price(sym, today);
        if (cached && is_fresh(*cached)) {
            return ResolvedPrice{sym, cached->close, cached->price_date, PriceOrigin::Cache, false};
        }

        try {
            for (const auto& row : provider_->fetch_daily_prices(sym, today, today)) {
                if (row.price_date != today) continue;

                auto fresh = stamp(row);
                fresh.symbol = sym;
                store_->upsert_price(fresh);
                spdlog::debug("Price {} = {} via {}", sym, fresh.close, provider_->name());
                return ResolvedPrice{sym, fresh.close, fresh.price_date, PriceOrigin::Live, false};
            }
            spdlog::info("{} has no bar for {} on {}", provider_->name(), sym, today);
        } catch (const MarketDataError& e) {
            spdlog::warn("Quote for {} from {} failed: {}", sym, provider_->name(), e.what());
        }

        // Last-known value regardless of age
        auto last = store_->latest_price(sym);
        if (!last) {
            return std::nullopt;
        }

        spdlog::warn("{}: {} served from {} close {}",
                     error_kind_name(ErrorKind::StaleDataServed), sym, last->price_date, last->close);
        return ResolvedPrice{sym, last->close, last->price_date, PriceOrigin::LastKnown, true};

    } catch (const std::exception& e) {
        spdlog::error("Price lookup for {} failed: {}", sym, e.what());
        return std::nullopt;
    }
}

bool PriceResolver::series_needs_refresh(const std::vector<SecurityPrice>& rows,
                                         const std::string& end_date,
                                         const std::string& today) const {
    if (rows.empty()) {
        return true;
    }

    const auto& latest = rows.back();

    // Upper bound not covered yet, and not in the future
    if (latest.price_date < end_date && end_date <= today) {
        return true;
    }

    // Today's bar moves during the session
    if (latest.price_date == today && !is_fresh(latest)) {
        return true;
    }

    return false;
}

bool PriceResolver::refetch(const std::string& symbol, const std::string& start_date, const std::string& end_date) {
    std::vector<SecurityPrice> rows;
    try {
        rows = provider_->fetch_daily_prices(symbol, start_date, end_date);
    } catch (const MarketDataError& e) {
        spdlog::warn("Series {} [{} .. {}] from {} failed: {}",
                     symbol, start_date, end_date, provider_->name(), e.what());
        return false;
    }

    for (const auto& row : rows) {
        auto fresh = stamp(row);
        fresh.symbol = symbol;
        store_->upsert_price(fresh);
    }

    spdlog::info("Stored {} bars for {} [{} .. {}]", rows.size(), symbol, start_date, end_date);
    return true;
}

std::vector<SecurityPrice> PriceResolver::get_price_series(const std::string& symbol,
                                                           const std::string& start_date,
                                                           const std::string& end_date,
                                                           bool force_refresh) {
    auto sym = util::to_upper(util::trim(symbol));
    if (sym.empty()) {
        throw std::invalid_argument("symbol is required");
    }
    if (!util::is_valid_date(start_date) || !util::is_valid_date(end_date)) {
        throw std::invalid_argument("dates must be YYYY-MM-DD");
    }
    if (start_date > end_date) {
        throw std::invalid_argument("start date " + start_date + " is after end date " + end_date);
    }

    if (force_refresh) {
        refetch(sym, start_date, end_date);
        return store_->prices_in_range(sym, start_date, end_date);
    }

    auto rows = store_->prices_in_range(sym, start_date, end_date);
    auto today = util::format_date(clock_->now());

    if (series_needs_refresh(rows, end_date, today) && refetch(sym, start_date, end_date)) {
        rows = store_->prices_in_range(sym, start_date, end_date);
    }

    return rows;
}

std::vector<std::string> PriceResolver::known_symbols() {
    return store_->known_symbols();
}

size_t PriceResolver::purge_prices(const std::string& symbol, const std::optional<std::string>& date) {
    auto sym = util::to_upper(util::trim(symbol));
    if (sym.empty()) {
        throw std::invalid_argument("symbol is required");
    }
    if (date && !util::is_valid_date(*date)) {
        throw std::invalid_argument("date must be YYYY-MM-DD");
    }
    return store_->delete_prices(sym, date);
}
