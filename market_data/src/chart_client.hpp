#pragma once

#include "clock.hpp"
#include "http_client.hpp"
#include "payloads.hpp"
#include "providers.hpp"
#include <memory>
#include <string>

// Provider B: quote/chart API. Serves both security bars and currency pairs
// through synthetic "{FROM}{TO}=X" symbols.
class ChartClient : public RateProvider, public QuoteProvider {
public:
    ChartClient(const std::string& base_url,
                std::shared_ptr<HttpClient> http,
                std::shared_ptr<Clock> clock);

    std::string name() const override { return "chart-api"; }

    double fetch_rate(const std::string& from, const std::string& to) override;

    std::vector<SecurityPrice> fetch_daily_prices(const std::string& symbol,
                                                  const std::string& start_date,
                                                  const std::string& end_date) override;

    std::string build_url(const std::string& symbol,
                          const std::string& start_date,
                          const std::string& end_date) const;

    static std::string pair_symbol(const std::string& from, const std::string& to) {
        return from + to + "=X";
    }

private:
    std::string base_url_;
    std::shared_ptr<HttpClient> http_;
    std::shared_ptr<Clock> clock_;

    ChartData fetch_chart(const std::string& url, const std::string& symbol);
};
