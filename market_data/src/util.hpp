#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace util {
    std::string current_iso8601();
    std::string to_iso8601(std::chrono::system_clock::time_point tp);

    // Calendar dates are UTC, formatted YYYY-MM-DD
    std::string format_date(std::chrono::system_clock::time_point tp);
    std::string add_days(const std::string& date, int days);
    int64_t date_to_unix(const std::string& date);
    bool is_valid_date(const std::string& date);

    int64_t to_unix_seconds(std::chrono::system_clock::time_point tp);
    std::chrono::system_clock::time_point from_unix_seconds(int64_t seconds);

    // Half away from zero, as NUMERIC(p, decimals) stores it
    double round_to(double value, int decimals);

    std::string trim(const std::string& str);
    std::string to_upper(const std::string& str);
    std::vector<std::string> split(const std::string& str, char delim);
    std::vector<std::string> split_any(const std::string& str, const std::string& delims);
    std::string redact_dsn(const std::string& dsn);
}
