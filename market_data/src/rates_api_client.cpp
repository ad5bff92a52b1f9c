#include "rates_api_client.hpp"
#include "errors.hpp"
#include "payloads.hpp"
#include <spdlog/spdlog.h>

RatesApiClient::RatesApiClient(const std::string& base_url, std::shared_ptr<HttpClient> http)
    : base_url_(base_url)
    , http_(std::move(http))
{}

double RatesApiClient::fetch_rate(const std::string& from, const std::string& to) {
    std::string url = base_url_ + "/latest/" + HttpClient::url_encode(from);

    auto response = http_->get(url);
    if (!response.ok()) {
        throw MarketDataError(ErrorKind::ProviderUnavailable,
                              fmt::format("{} returned HTTP {} for base {}", name(), response.status, from));
    }

    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(response.body);
    } catch (const std::exception& e) {
        throw MarketDataError(ErrorKind::ParseError,
                              fmt::format("{} body for base {}: {}", name(), from, e.what()));
    }

    double rate = Payloads::parse_base_rate(payload, from, to);
    spdlog::debug("{} rate {}{} = {}", name(), from, to, rate);
    return rate;
}
