#include "exchange_rate_resolver.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

ExchangeRateResolver::ExchangeRateResolver(std::shared_ptr<RateStore> store,
                                           std::shared_ptr<RateProvider> primary,
                                           std::shared_ptr<RateProvider> secondary,
                                           std::shared_ptr<Clock> clock,
                                           std::chrono::seconds freshness)
    : store_(std::move(store))
    , primary_(std::move(primary))
    , secondary_(std::move(secondary))
    , clock_(std::move(clock))
    , freshness_(freshness)
{}

bool ExchangeRateResolver::is_fresh(const ExchangeRate& rate) const {
    return clock_->now() - rate.last_updated <= freshness_;
}

std::optional<double> ExchangeRateResolver::try_provider(RateProvider& provider,
                                                         const std::string& from,
                                                         const std::string& to) {
    try {
        double rate = provider.fetch_rate(from, to);
        if (rate <= 0.0) {
            throw MarketDataError(ErrorKind::ParseError, "non-positive rate " + std::to_string(rate));
        }
        return rate;
    } catch (const MarketDataError& e) {
        spdlog::warn("Rate {}{} from {} failed: {}", from, to, provider.name(), e.what());
        return std::nullopt;
    }
}

std::optional<double> ExchangeRateResolver::fetch_and_store(const std::string& from, const std::string& to) {
    // Primary always before secondary
    auto rate = try_provider(*primary_, from, to);
    std::string source = primary_->name();

    if (!rate) {
        rate = try_provider(*secondary_, from, to);
        source = secondary_->name();
    }

    if (!rate) {
        spdlog::error("No provider could resolve {}{}", from, to);
        return std::nullopt;
    }

    ExchangeRate row;
    row.from_currency = from;
    row.to_currency = to;
    row.rate = util::round_to(*rate, kRateScale);
    row.last_updated = clock_->now();
    store_->upsert_rate(row);

    spdlog::info("Rate {} = {} via {}", row.pair_key(), row.rate, source);
    return row.rate;
}

std::optional<double> ExchangeRateResolver::get_rate(const std::string& from, const std::string& to) {
    auto src = util::to_upper(util::trim(from));
    auto dst = util::to_upper(util::trim(to));

    if (src == dst) {
        return 1.0;
    }

    auto cached = store_->find_rate(src, dst);
    if (cached && is_fresh(*cached)) {
        spdlog::debug("Rate {}{} served from store", src, dst);
        return cached->rate;
    }

    return fetch_and_store(src, dst);
}

RefreshReport ExchangeRateResolver::update_all(const std::vector<CurrencyPair>& pairs) {
    RefreshReport report;

    for (const auto& pair : pairs) {
        auto src = util::to_upper(util::trim(pair.from));
        auto dst = util::to_upper(util::trim(pair.to));
        std::string key = src + dst;

        if (src == dst) {
            report.refreshed.push_back(key);
            continue;
        }

        try {
            if (fetch_and_store(src, dst)) {
                report.refreshed.push_back(key);
            } else {
                report.failed.push_back(key);
            }
        } catch (const std::exception& e) {
            // Store failure for one pair must not abort the batch
            spdlog::error("Refresh of {} failed: {}", key, e.what());
            report.failed.push_back(key);
        }
    }

    spdlog::info("Rate refresh: {} updated, {} failed", report.refreshed.size(), report.failed.size());

    if (!pairs.empty() && report.refreshed.empty()) {
        throw MarketDataError(ErrorKind::NoRateAvailable,
                              "none of " + std::to_string(pairs.size()) + " pairs could be refreshed");
    }

    return report;
}

double ExchangeRateResolver::convert(double amount, const std::string& from, const std::string& to) {
    auto src = util::to_upper(util::trim(from));
    auto dst = util::to_upper(util::trim(to));

    if (src == dst) {
        return amount;
    }

    auto rate = get_rate(src, dst);
    if (!rate) {
        throw MarketDataError(ErrorKind::NoRateAvailable, "no rate for " + src + dst);
    }
    return amount * *rate;
}

std::map<std::string, double> ExchangeRateResolver::current_rates() {
    std::map<std::string, double> rates;
    for (const auto& row : store_->rates_updated_since(clock_->now() - freshness_)) {
        rates[row.pair_key()] = row.rate;
    }
    return rates;
}
