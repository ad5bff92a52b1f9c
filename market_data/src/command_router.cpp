#include "command_router.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace {

std::string required_string(const nlohmann::json& args, const char* key) {
    if (!args.is_object() || !args.contains(key) || !args[key].is_string()) {
        throw std::invalid_argument(std::string("missing argument: ") + key);
    }
    return args[key].get<std::string>();
}

int64_t required_int(const nlohmann::json& args, const char* key) {
    if (!args.is_object() || !args.contains(key) || !args[key].is_number_integer()) {
        throw std::invalid_argument(std::string("missing argument: ") + key);
    }
    return args[key].get<int64_t>();
}

std::optional<std::string> optional_string(const nlohmann::json& args, const char* key) {
    if (!args.is_object() || !args.contains(key) || args[key].is_null()) {
        return std::nullopt;
    }
    return args[key].get<std::string>();
}

} // namespace

CommandRouter::CommandRouter(std::shared_ptr<ExchangeRateResolver> rates,
                             std::shared_ptr<PriceResolver> prices,
                             std::shared_ptr<PerformanceService> performance,
                             std::function<void()> trigger_refresh,
                             std::shared_ptr<Clock> clock)
    : rates_(std::move(rates))
    , prices_(std::move(prices))
    , performance_(std::move(performance))
    , trigger_refresh_(std::move(trigger_refresh))
    , clock_(std::move(clock))
{}

nlohmann::json CommandRouter::ok_reply(const std::string& corr_id, const nlohmann::json& data) const {
    return {
        {"corr_id", corr_id},
        {"ok", true},
        {"data", data},
        {"ts", util::to_iso8601(clock_->now())}
    };
}

nlohmann::json CommandRouter::error_reply(const std::string& corr_id, const std::string& message) const {
    return {
        {"corr_id", corr_id},
        {"ok", false},
        {"message", message},
        {"ts", util::to_iso8601(clock_->now())}
    };
}

nlohmann::json CommandRouter::price_row_json(const SecurityPrice& row) {
    auto opt = [](const std::optional<double>& v) {
        return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
    };

    return {
        {"symbol", row.symbol},
        {"date", row.price_date},
        {"open", opt(row.open)},
        {"high", opt(row.high)},
        {"low", opt(row.low)},
        {"close", row.close},
        {"volume", row.volume ? nlohmann::json(*row.volume) : nlohmann::json(nullptr)},
        {"currency", row.currency ? nlohmann::json(*row.currency) : nlohmann::json(nullptr)},
        {"exchange", row.exchange_name ? nlohmann::json(*row.exchange_name) : nlohmann::json(nullptr)},
        {"updated_at", util::to_iso8601(row.updated_at)}
    };
}

nlohmann::json CommandRouter::handle(const nlohmann::json& request) {
    std::string corr_id;

    try {
        if (!request.is_object()) {
            return error_reply(corr_id, "malformed request");
        }

        if (request.contains("corr_id") && request["corr_id"].is_string()) {
            corr_id = request["corr_id"].get<std::string>();
        }
        std::string cmd = request.value("cmd", "");
        nlohmann::json args = request.contains("args") ? request["args"] : nlohmann::json::object();

        auto data = dispatch(cmd, args);
        spdlog::debug("Handled {} ({})", cmd, corr_id);
        return ok_reply(corr_id, data);

    } catch (const CommandFailure& e) {
        return error_reply(corr_id, e.what());
    } catch (const std::invalid_argument& e) {
        spdlog::warn("Rejected request {}: {}", corr_id, e.what());
        return error_reply(corr_id, e.what());
    } catch (const MarketDataError& e) {
        spdlog::warn("Request {} failed: {}", corr_id, e.what());
        return error_reply(corr_id, e.what());
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Request {} has bad arguments: {}", corr_id, e.what());
        return error_reply(corr_id, std::string("invalid arguments: ") + e.what());
    } catch (const std::exception& e) {
        spdlog::error("Request {} failed: {}", corr_id, e.what());
        return error_reply(corr_id, "internal error");
    }
}

nlohmann::json CommandRouter::dispatch(const std::string& cmd, const nlohmann::json& args) {
    if (cmd == "rate") {
        return handle_rate(args);
    }
    if (cmd == "rates") {
        return rates_->current_rates();
    }
    if (cmd == "convert") {
        return handle_convert(args);
    }
    if (cmd == "refresh_rates") {
        trigger_refresh_();
        return {{"triggered", true}};
    }
    if (cmd == "price") {
        return handle_price(args);
    }
    if (cmd == "price_series") {
        return handle_price_series(args);
    }
    if (cmd == "symbols") {
        return prices_->known_symbols();
    }
    if (cmd == "purge_prices") {
        return handle_purge_prices(args);
    }
    if (cmd == "portfolio_performance") {
        return performance_->accounts_view(required_int(args, "user_id"));
    }
    if (cmd == "account_performance") {
        return performance_->account_view(required_int(args, "user_id"),
                                          required_int(args, "account_id"));
    }
    if (cmd == "portfolio_in_currency") {
        auto currency = util::to_upper(util::trim(required_string(args, "currency")));
        if (currency.size() != 3) {
            throw std::invalid_argument("invalid currency: " + currency);
        }
        return performance_->portfolio_in_currency(required_int(args, "user_id"), currency);
    }
    if (cmd == "holdings_changed") {
        auto evicted = performance_->invalidate_user(required_int(args, "user_id"));
        return {{"evicted", evicted}};
    }

    throw CommandFailure("unknown command: " + cmd);
}

nlohmann::json CommandRouter::handle_rate(const nlohmann::json& args) {
    auto from = util::to_upper(util::trim(required_string(args, "from")));
    auto to = util::to_upper(util::trim(required_string(args, "to")));

    auto rate = rates_->get_rate(from, to);
    if (!rate) {
        throw CommandFailure("Exchange rate not found for " + from + " to " + to);
    }

    return {{"from", from}, {"to", to}, {"rate", *rate}};
}

nlohmann::json CommandRouter::handle_convert(const nlohmann::json& args) {
    if (!args.is_object() || !args.contains("amount") || !args["amount"].is_number()) {
        throw std::invalid_argument("missing argument: amount");
    }
    double amount = args["amount"].get<double>();
    auto from = util::to_upper(util::trim(required_string(args, "from")));
    auto to = util::to_upper(util::trim(required_string(args, "to")));

    double converted = rates_->convert(amount, from, to);
    return {{"amount", amount}, {"from", from}, {"to", to}, {"converted", converted}};
}

nlohmann::json CommandRouter::handle_price(const nlohmann::json& args) {
    Holding holding;
    holding.name = required_string(args, "name");
    holding.currency = util::to_upper(util::trim(required_string(args, "currency")));

    auto category_text = required_string(args, "category");
    auto category = category_from_string(category_text);
    if (!category) {
        throw std::invalid_argument("unknown category: " + category_text);
    }
    holding.category = *category;

    auto price = prices_->get_current_price(holding);
    if (!price) {
        return nullptr;
    }

    return {
        {"symbol", price->symbol},
        {"close", price->close},
        {"date", price->price_date},
        {"origin", origin_to_string(price->origin)},
        {"stale", price->stale}
    };
}

nlohmann::json CommandRouter::handle_price_series(const nlohmann::json& args) {
    auto symbol = required_string(args, "symbol");

    auto today = util::format_date(clock_->now());
    auto end = optional_string(args, "end").value_or(today);
    auto start = optional_string(args, "start").value_or(util::add_days(end, -30));
    bool force = args.is_object() && args.value("force_refresh", false);

    nlohmann::json rows = nlohmann::json::array();
    for (const auto& row : prices_->get_price_series(symbol, start, end, force)) {
        rows.push_back(price_row_json(row));
    }
    return rows;
}

nlohmann::json CommandRouter::handle_purge_prices(const nlohmann::json& args) {
    auto symbol = required_string(args, "symbol");
    auto date = optional_string(args, "date");

    auto deleted = prices_->purge_prices(symbol, date);
    return {{"symbol", util::to_upper(util::trim(symbol))}, {"deleted", deleted}};
}
