#include "chart_client.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

ChartClient::ChartClient(const std::string& base_url,
                         std::shared_ptr<HttpClient> http,
                         std::shared_ptr<Clock> clock)
    : base_url_(base_url)
    , http_(std::move(http))
    , clock_(std::move(clock))
{}

std::string ChartClient::build_url(const std::string& symbol,
                                   const std::string& start_date,
                                   const std::string& end_date) const {
    int64_t period1 = util::date_to_unix(start_date);
    int64_t period2 = util::date_to_unix(end_date) + 86399;   // end of the last day

    return fmt::format("{}/{}?interval=1d&period1={}&period2={}",
                       base_url_, HttpClient::url_encode(symbol), period1, period2);
}

ChartData ChartClient::fetch_chart(const std::string& url, const std::string& symbol) {
    auto response = http_->get(url);
    if (!response.ok()) {
        throw MarketDataError(ErrorKind::ProviderUnavailable,
                              fmt::format("{} returned HTTP {} for {}", name(), response.status, symbol));
    }

    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(response.body);
    } catch (const std::exception& e) {
        throw MarketDataError(ErrorKind::ParseError,
                              fmt::format("{} body for {}: {}", name(), symbol, e.what()));
    }

    return Payloads::parse_chart(payload, clock_->now());
}

double ChartClient::fetch_rate(const std::string& from, const std::string& to) {
    std::string pair = pair_symbol(from, to);
    std::string url = fmt::format("{}/{}?interval=1d&range=1d", base_url_, HttpClient::url_encode(pair));

    auto chart = fetch_chart(url, pair);
    if (!chart.regular_market_price || *chart.regular_market_price <= 0.0) {
        throw MarketDataError(ErrorKind::ParseError, "no regularMarketPrice for " + pair);
    }

    spdlog::debug("{} rate {} = {}", name(), pair, *chart.regular_market_price);
    return *chart.regular_market_price;
}

std::vector<SecurityPrice> ChartClient::fetch_daily_prices(const std::string& symbol,
                                                           const std::string& start_date,
                                                           const std::string& end_date) {
    auto chart = fetch_chart(build_url(symbol, start_date, end_date), symbol);

    // Rows are keyed by the requested symbol, not whatever casing the provider echoes
    for (auto& row : chart.rows) {
        row.symbol = symbol;
    }

    spdlog::debug("{} returned {} bars for {} [{} .. {}]",
                  name(), chart.rows.size(), symbol, start_date, end_date);
    return chart.rows;
}
