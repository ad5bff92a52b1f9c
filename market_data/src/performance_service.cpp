#include "performance_service.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

PerformanceService::PerformanceService(std::shared_ptr<HoldingSource> holdings,
                                       std::shared_ptr<PerformanceCalculator> calculator,
                                       std::shared_ptr<ResultCache> cache)
    : holdings_(std::move(holdings))
    , calculator_(std::move(calculator))
    , cache_(std::move(cache))
{}

std::string PerformanceService::user_prefix(int64_t user_id) {
    return "perf:user:" + std::to_string(user_id) + ":";
}

std::string PerformanceService::accounts_key(int64_t user_id) {
    return user_prefix(user_id) + "accounts";
}

std::string PerformanceService::account_key(int64_t user_id, int64_t account_id) {
    return user_prefix(user_id) + "account:" + std::to_string(account_id);
}

nlohmann::json PerformanceService::accounts_view(int64_t user_id) {
    auto key = accounts_key(user_id);
    if (auto cached = cache_->get(key)) {
        spdlog::debug("Cache hit {}", key);
        return nlohmann::json::parse(*cached);
    }

    nlohmann::json view = nlohmann::json::array();
    for (const auto& account : calculator_->all_accounts(holdings_->accounts_for_user(user_id))) {
        view.push_back(account.to_json());
    }

    cache_->set(key, view.dump());
    return view;
}

nlohmann::json PerformanceService::account_view(int64_t user_id, int64_t account_id) {
    auto key = account_key(user_id, account_id);
    if (auto cached = cache_->get(key)) {
        spdlog::debug("Cache hit {}", key);
        return nlohmann::json::parse(*cached);
    }

    for (const auto& account : holdings_->accounts_for_user(user_id)) {
        if (account.id != account_id) continue;

        auto view = calculator_->account_performance(account).to_json();
        cache_->set(key, view.dump());
        return view;
    }

    throw std::invalid_argument("Account with ID " + std::to_string(account_id) + " not found");
}

nlohmann::json PerformanceService::portfolio_in_currency(int64_t user_id, const std::string& currency) {
    auto accounts = holdings_->accounts_for_user(user_id);
    auto view = calculator_->convert_portfolio(accounts, currency).to_json();
    spdlog::debug("Portfolio of user {} in {}: {}", user_id, currency, view["total"].get<double>());
    return view;
}

size_t PerformanceService::invalidate_user(int64_t user_id) {
    auto removed = cache_->remove_by_prefix(user_prefix(user_id));
    spdlog::info("Invalidated {} cached views for user {}", removed, user_id);
    return removed;
}
