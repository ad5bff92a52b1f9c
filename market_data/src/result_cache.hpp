#pragma once

#include "clock.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// Serialized aggregate views keyed by identity scope, each written with a fixed TTL
class ResultCache {
public:
    explicit ResultCache(std::shared_ptr<Clock> clock,
                         std::chrono::seconds ttl = std::chrono::hours(1));

    std::optional<std::string> get(const std::string& key);
    void set(const std::string& key, const std::string& value);
    void remove(const std::string& key);
    size_t remove_by_prefix(const std::string& prefix);
    size_t size();

private:
    struct Entry {
        std::string value;
        TimePoint expires_at;
    };

    std::shared_ptr<Clock> clock_;
    std::chrono::seconds ttl_;
    std::mutex mutex_;
    std::unordered_map<std::string, Entry> cache_;
};
