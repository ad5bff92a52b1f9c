#include "market_types.hpp"
#include <algorithm>
#include <cctype>

std::string category_to_string(Category category) {
    switch (category) {
        case Category::RendaFixa: return "RendaFixa";
        case Category::Stocks: return "Stocks";
        case Category::FIIs: return "FIIs";
        case Category::ETF: return "ETF";
        case Category::Bonds: return "Bonds";
        case Category::ManagedPortfolio: return "ManagedPortfolio";
        case Category::Cash: return "Cash";
        case Category::ManagedPortfolioBlock: return "ManagedPortfolioBlock";
        default: return "UNKNOWN";
    }
}

std::optional<Category> category_from_string(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::pair<const char*, Category> names[] = {
        {"rendafixa", Category::RendaFixa},
        {"stocks", Category::Stocks},
        {"fiis", Category::FIIs},
        {"etf", Category::ETF},
        {"bonds", Category::Bonds},
        {"managedportfolio", Category::ManagedPortfolio},
        {"cash", Category::Cash},
        {"managedportfolioblock", Category::ManagedPortfolioBlock},
    };

    for (const auto& [name, category] : names) {
        if (lowered == name) {
            return category;
        }
    }

    // Numeric enum values are accepted as well
    if (!lowered.empty() && lowered.size() <= 2 && std::all_of(lowered.begin(), lowered.end(), ::isdigit)) {
        int ordinal = std::stoi(lowered);
        if (ordinal >= 0 && ordinal <= static_cast<int>(Category::ManagedPortfolioBlock)) {
            return static_cast<Category>(ordinal);
        }
    }

    return std::nullopt;
}

bool is_tradable(Category category) {
    return category == Category::Stocks ||
           category == Category::ETF ||
           category == Category::FIIs;
}

std::string origin_to_string(PriceOrigin origin) {
    switch (origin) {
        case PriceOrigin::Cache: return "cache";
        case PriceOrigin::Live: return "live";
        case PriceOrigin::LastKnown: return "last_known";
        default: return "unknown";
    }
}
