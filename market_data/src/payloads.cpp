#include "payloads.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace {

std::optional<double> optional_number(const nlohmann::json& series, size_t i) {
    if (!series.is_array() || i >= series.size() || !series[i].is_number()) {
        return std::nullopt;
    }
    return series[i].get<double>();
}

// Negative volumes and volumes outside the int64 range are dropped
std::optional<int64_t> optional_volume(const nlohmann::json& series, size_t i) {
    if (!series.is_array() || i >= series.size()) {
        return std::nullopt;
    }

    const auto& v = series[i];
    if (v.is_number_unsigned()) {
        auto n = v.get<uint64_t>();
        if (n > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return std::nullopt;
        return static_cast<int64_t>(n);
    }
    if (v.is_number_integer()) {
        auto n = v.get<int64_t>();
        if (n < 0) return std::nullopt;
        return n;
    }
    if (v.is_number_float()) {
        double d = v.get<double>();
        // 2^63 is exactly representable; anything at or above it does not fit
        if (!std::isfinite(d) || d < 0.0 || d >= 9223372036854775808.0) return std::nullopt;
        return static_cast<int64_t>(d);
    }
    return std::nullopt;
}

std::optional<std::string> optional_text(const std::string& value, size_t max_len) {
    if (value.empty()) return std::nullopt;
    return value.substr(0, max_len);
}

} // namespace

double Payloads::parse_base_rate(const nlohmann::json& payload,
                                 const std::string& from,
                                 const std::string& to) {
    if (!payload.is_object()) {
        throw MarketDataError(ErrorKind::ParseError, "rates payload is not an object");
    }

    if (payload.contains("result") && payload["result"] == "error") {
        std::string detail = payload.contains("error-type") ? payload["error-type"].dump() : "unknown";
        throw MarketDataError(ErrorKind::ProviderUnavailable, "rates provider error: " + detail);
    }

    std::string base;
    if (payload.contains("base") && payload["base"].is_string()) {
        base = payload["base"].get<std::string>();
    } else if (payload.contains("base_code") && payload["base_code"].is_string()) {
        base = payload["base_code"].get<std::string>();
    }
    if (!base.empty() && util::to_upper(base) != from) {
        throw MarketDataError(ErrorKind::ParseError,
                              "rates payload base " + base + " does not match " + from);
    }

    if (!payload.contains("rates") || !payload["rates"].is_object()) {
        throw MarketDataError(ErrorKind::ParseError, "rates payload has no rates table");
    }

    const auto& rates = payload["rates"];
    if (!rates.contains(to) || !rates[to].is_number()) {
        throw MarketDataError(ErrorKind::ParseError, "no " + to + " rate in " + from + " table");
    }

    double rate = rates[to].get<double>();
    if (rate <= 0.0) {
        throw MarketDataError(ErrorKind::ParseError, "non-positive rate for " + from + to);
    }
    return rate;
}

ChartData Payloads::parse_chart(const nlohmann::json& payload, TimePoint fetched_at) {
    if (!payload.is_object() || !payload.contains("chart") || !payload["chart"].is_object()) {
        throw MarketDataError(ErrorKind::ParseError, "chart payload has no chart object");
    }

    const auto& chart = payload["chart"];

    if (chart.contains("error") && !chart["error"].is_null()) {
        const auto& error = chart["error"];
        std::string description = error.is_object() ? error.value("description", "unknown")
                                                    : error.dump();
        throw MarketDataError(ErrorKind::ProviderUnavailable, "chart error: " + description);
    }

    if (!chart.contains("result") || !chart["result"].is_array() || chart["result"].empty()) {
        throw MarketDataError(ErrorKind::ParseError, "chart payload has no result");
    }

    const auto& result = chart["result"][0];
    if (!result.contains("meta") || !result["meta"].is_object()) {
        throw MarketDataError(ErrorKind::ParseError, "chart result has no meta");
    }

    ChartData data;

    try {
        const auto& meta = result["meta"];
        data.symbol = meta.value("symbol", "");
        data.currency = meta.value("currency", "");
        data.exchange_name = meta.value("exchangeName", "");
        if (meta.contains("regularMarketPrice") && meta["regularMarketPrice"].is_number()) {
            data.regular_market_price = meta["regularMarketPrice"].get<double>();
        }

        if (!result.contains("timestamp") || !result["timestamp"].is_array()) {
            return data;
        }

        const auto& timestamps = result["timestamp"];
        const auto& indicators = result.value("indicators", nlohmann::json::object());
        if (!indicators.contains("quote") || !indicators["quote"].is_array() ||
            indicators["quote"].empty()) {
            return data;
        }

        const auto& quote = indicators["quote"][0];
        auto series = [&quote](const char* name) {
            return quote.contains(name) ? quote[name] : nlohmann::json::array();
        };
        auto open = series("open");
        auto high = series("high");
        auto low = series("low");
        auto close = series("close");
        auto volume = series("volume");

        for (size_t i = 0; i < timestamps.size(); i++) {
            auto close_price = optional_number(close, i);
            if (!close_price) {
                continue;
            }

            SecurityPrice row;
            row.symbol = data.symbol;
            row.price_date = util::format_date(util::from_unix_seconds(timestamps[i].get<int64_t>()));
            row.open = optional_number(open, i);
            row.high = optional_number(high, i);
            row.low = optional_number(low, i);
            row.close = *close_price;
            row.volume = optional_volume(volume, i);
            row.currency = optional_text(data.currency, 3);
            row.exchange_name = optional_text(data.exchange_name, 10);
            row.created_at = fetched_at;
            row.updated_at = fetched_at;

            data.rows.push_back(row);
        }
    } catch (const nlohmann::json::exception& e) {
        throw MarketDataError(ErrorKind::ParseError, std::string("chart payload: ") + e.what());
    }

    std::stable_sort(data.rows.begin(), data.rows.end(),
                     [](const SecurityPrice& a, const SecurityPrice& b) {
                         return a.price_date < b.price_date;
                     });

    return data;
}
