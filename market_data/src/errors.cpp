#include "errors.hpp"

std::string error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ProviderUnavailable: return "ProviderUnavailable";
        case ErrorKind::ParseError: return "ParseError";
        case ErrorKind::UnmappableSymbol: return "UnmappableSymbol";
        case ErrorKind::NoRateAvailable: return "NoRateAvailable";
        case ErrorKind::StaleDataServed: return "StaleDataServed";
        default: return "Unknown";
    }
}

MarketDataError::MarketDataError(ErrorKind kind, const std::string& message)
    : std::runtime_error(error_kind_name(kind) + ": " + message)
    , kind_(kind)
{}
