#pragma once

#include "http_client.hpp"
#include "providers.hpp"
#include <memory>
#include <string>

// Provider A: full rate table for one base currency
class RatesApiClient : public RateProvider {
public:
    RatesApiClient(const std::string& base_url, std::shared_ptr<HttpClient> http);

    std::string name() const override { return "rates-api"; }
    double fetch_rate(const std::string& from, const std::string& to) override;

private:
    std::string base_url_;
    std::shared_ptr<HttpClient> http_;
};
