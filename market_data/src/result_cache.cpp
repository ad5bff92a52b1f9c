#include "result_cache.hpp"
#include <spdlog/spdlog.h>

ResultCache::ResultCache(std::shared_ptr<Clock> clock, std::chrono::seconds ttl)
    : clock_(std::move(clock))
    , ttl_(ttl)
{}

std::optional<std::string> ResultCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return std::nullopt;
    }

    if (clock_->now() >= it->second.expires_at) {
        cache_.erase(it);
        return std::nullopt;
    }

    return it->second.value;
}

void ResultCache::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_->now();

    // Sweep entries past their expiry, read or not
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (now >= it->second.expires_at) {
            it = cache_.erase(it);
        } else {
            ++it;
        }
    }

    cache_[key] = Entry{value, now + ttl_};
}

void ResultCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.erase(key);
}

size_t ResultCache::remove_by_prefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t removed = 0;
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (it->first.compare(0, prefix.size(), prefix) == 0) {
            it = cache_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    spdlog::debug("Evicted {} cached views under '{}'", removed, prefix);
    return removed;
}

size_t ResultCache::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}
