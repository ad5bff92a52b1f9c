#pragma once

#include "market_store.hpp"
#include "performance.hpp"
#include "result_cache.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

// Dashboard aggregates per user, memoized in the ResultCache until the
// user's holdings change or the entry expires.
class PerformanceService {
public:
    PerformanceService(std::shared_ptr<HoldingSource> holdings,
                       std::shared_ptr<PerformanceCalculator> calculator,
                       std::shared_ptr<ResultCache> cache);

    nlohmann::json accounts_view(int64_t user_id);

    // Throws std::invalid_argument when the account does not belong to the user
    nlohmann::json account_view(int64_t user_id, int64_t account_id);

    // Book value of every holding of the user in one currency; not cached
    nlohmann::json portfolio_in_currency(int64_t user_id, const std::string& currency);

    // Drops every cached view of the user; returns the number of entries removed
    size_t invalidate_user(int64_t user_id);

    static std::string user_prefix(int64_t user_id);
    static std::string accounts_key(int64_t user_id);
    static std::string account_key(int64_t user_id, int64_t account_id);

private:
    std::shared_ptr<HoldingSource> holdings_;
    std::shared_ptr<PerformanceCalculator> calculator_;
    std::shared_ptr<ResultCache> cache_;
};
