#include "symbol_mapper.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>

SymbolMapper::SymbolMapper()
    : cad_aliases_{
          {"SHOP", "SHOP.TO"},
          {"SHOPIFY", "SHOP.TO"},
          {"RY", "RY.TO"},
          {"ROYAL BANK", "RY.TO"},
          {"TD", "TD.TO"},
          {"CNR", "CNR.TO"},
          {"VFV", "VFV.TO"},
          {"XQQ", "XQQ.TO"},
          {"ZWB", "ZWB.TO"},
          {"BRE", "BRE.TO"},
      }
    , brl_aliases_{
          {"PETR4", "PETR4.SA"},
          {"PETROBRAS", "PETR4.SA"},
          {"ITUB4", "ITUB4.SA"},
          {"ITAU", "ITUB4.SA"},
          {"RBRF11", "RBRF11.SA"},
          {"HGLG11", "HGLG11.SA"},
          {"BTLG11", "BTLG11.SA"},
      }
{}

std::optional<std::string> SymbolMapper::exchange_suffix(const std::string& currency) {
    auto ccy = util::to_upper(util::trim(currency));
    if (ccy == "CAD") return std::string(".TO");
    if (ccy == "BRL") return std::string(".SA");
    if (ccy == "USD") return std::string();
    return std::nullopt;
}

const std::vector<SymbolAlias>& SymbolMapper::aliases_for(const std::string& currency) const {
    auto ccy = util::to_upper(util::trim(currency));
    if (ccy == "CAD") return cad_aliases_;
    if (ccy == "BRL") return brl_aliases_;
    return none_;
}

bool SymbolMapper::has_exchange_suffix(const std::string& name) {
    auto ends_with = [&name](const std::string& suffix) {
        return name.size() > suffix.size() &&
               name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    return ends_with(".TO") || ends_with(".SA");
}

std::vector<std::string> SymbolMapper::words_of(const std::string& text) {
    std::vector<std::string> words;
    std::string current;

    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            current += c;
        } else if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(current);
    }

    return words;
}

bool SymbolMapper::contains_words(const std::vector<std::string>& words, const std::vector<std::string>& run) {
    if (run.empty() || run.size() > words.size()) {
        return false;
    }
    return std::search(words.begin(), words.end(), run.begin(), run.end()) != words.end();
}

std::optional<std::string> SymbolMapper::map_to_symbol(const std::string& name, const std::string& currency) const {
    auto upper = util::to_upper(util::trim(name));
    if (upper.empty()) {
        return std::nullopt;
    }

    // 1. Already a listed ticker
    if (has_exchange_suffix(upper)) {
        return upper;
    }

    // 2. Curated aliases
    auto words = words_of(upper);
    for (const auto& entry : aliases_for(currency)) {
        if (contains_words(words, words_of(entry.alias))) {
            return entry.symbol;
        }
    }

    // 3. Leading ticker-like token, e.g. "VFV - S&P 500"
    auto suffix = exchange_suffix(currency);
    if (!suffix) {
        return std::nullopt;
    }

    auto tokens = util::split_any(upper, " -:|");
    if (tokens.empty()) {
        return std::nullopt;
    }

    const auto& first = tokens.front();
    bool alnum = std::all_of(first.begin(), first.end(),
                             [](char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; });
    if (first.size() >= 2 && first.size() <= 6 && alnum) {
        return first + *suffix;
    }

    return std::nullopt;
}
