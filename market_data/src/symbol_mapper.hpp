#pragma once

#include <optional>
#include <string>
#include <vector>

struct SymbolAlias {
    std::string alias;    // one or more upper-case words
    std::string symbol;
};

// Maps free-text investment names to provider tickers. Rules, first match wins:
//   1. name already carries an exchange suffix (.TO, .SA)
//   2. curated alias for the holding's currency, matched on whole words
//   3. first token of 2-6 alphanumerics plus the currency's exchange suffix
class SymbolMapper {
public:
    SymbolMapper();

    std::optional<std::string> map_to_symbol(const std::string& name, const std::string& currency) const;

    // "" for USD, nullopt when the currency has no known market convention
    static std::optional<std::string> exchange_suffix(const std::string& currency);

    const std::vector<SymbolAlias>& aliases_for(const std::string& currency) const;

private:
    std::vector<SymbolAlias> cad_aliases_;
    std::vector<SymbolAlias> brl_aliases_;
    std::vector<SymbolAlias> none_;

    static bool has_exchange_suffix(const std::string& name);
    static bool contains_words(const std::vector<std::string>& words, const std::vector<std::string>& run);
    static std::vector<std::string> words_of(const std::string& text);
};
