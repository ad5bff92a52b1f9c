#pragma once

#include "market_types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct ChartData {
    std::string symbol;
    std::string currency;
    std::string exchange_name;
    std::optional<double> regular_market_price;
    std::vector<SecurityPrice> rows;   // ordered by price_date
};

// Payload interpretation for both providers. Malformed input throws
// MarketDataError(ParseError); a provider-reported error throws
// MarketDataError(ProviderUnavailable).
class Payloads {
public:
    // {date, base|base_code, rates: {CCY: rate}}
    static double parse_base_rate(const nlohmann::json& payload,
                                  const std::string& from,
                                  const std::string& to);

    // {chart: {result: [{meta, timestamp, indicators: {quote: [...]}}], error}}
    static ChartData parse_chart(const nlohmann::json& payload, TimePoint fetched_at);
};
