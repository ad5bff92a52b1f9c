#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    ProviderUnavailable,   // transport failure, timeout, non-2xx status
    ParseError,            // payload could not be interpreted
    UnmappableSymbol,      // symbol heuristics exhausted
    NoRateAvailable,       // providers and cache exhausted for a pair
    StaleDataServed        // soft: last-known value used
};

std::string error_kind_name(ErrorKind kind);

class MarketDataError : public std::runtime_error {
public:
    MarketDataError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};
