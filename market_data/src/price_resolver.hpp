#pragma once

#include "clock.hpp"
#include "market_store.hpp"
#include "providers.hpp"
#include "symbol_mapper.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class PriceResolver {
public:
    PriceResolver(std::shared_ptr<PriceStore> store,
                  std::shared_ptr<QuoteProvider> provider,
                  std::shared_ptr<Clock> clock,
                  std::chrono::seconds freshness = std::chrono::hours(4));

    // nullopt for non-tradable categories, unmappable names, and symbols
    // with neither a live quote nor any persisted row
    std::optional<ResolvedPrice> get_current_price(const Holding& holding);
    std::optional<ResolvedPrice> get_symbol_price(const std::string& symbol);

    // Throws std::invalid_argument for an empty symbol, malformed dates or start > end
    std::vector<SecurityPrice> get_price_series(const std::string& symbol,
                                                const std::string& start_date,
                                                const std::string& end_date,
                                                bool force_refresh = false);

    std::vector<std::string> known_symbols();
    size_t purge_prices(const std::string& symbol, const std::optional<std::string>& date = std::nullopt);

    const SymbolMapper& mapper() const { return mapper_; }

private:
    std::shared_ptr<PriceStore> store_;
    std::shared_ptr<QuoteProvider> provider_;
    std::shared_ptr<Clock> clock_;
    std::chrono::seconds freshness_;
    SymbolMapper mapper_;

    bool is_fresh(const SecurityPrice& price) const;
    bool series_needs_refresh(const std::vector<SecurityPrice>& rows,
                              const std::string& end_date,
                              const std::string& today) const;
    bool refetch(const std::string& symbol, const std::string& start_date, const std::string& end_date);
    SecurityPrice stamp(SecurityPrice row) const;
};
