#include "InMemoryCache.hpp"
#include "../Errors.hpp"

namespace geotrack::adapters {

InMemoryCache::InMemoryCache(std::shared_ptr<IClock> clock, std::chrono::milliseconds timeout)
    : clock_(std::move(clock)), timeout_(timeout) {
}

std::unique_lock<std::timed_mutex> InMemoryCache::acquire(const char* operation) {
    if (outage_) {
        throw TrackingError(ErrorKind::CacheUnavailable,
                            std::string("Cache unavailable during ") + operation);
    }
    std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
    if (!lock.try_lock_for(timeout_)) {
        throw TrackingError(ErrorKind::CacheUnavailable,
                            std::string("Cache timed out during ") + operation);
    }
    return lock;
}

std::optional<std::string> InMemoryCache::get(const std::string& key) {
    auto lock = acquire("get");
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (clock_->now() >= it->second.expiresAt) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

void InMemoryCache::set(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    auto lock = acquire("set");
    entries_[key] = Entry{value, clock_->now() + ttl};
}

void InMemoryCache::erase(const std::string& key) {
    auto lock = acquire("erase");
    entries_.erase(key);
}

std::size_t InMemoryCache::size() {
    auto lock = acquire("size");
    auto now = clock_->now();
    std::size_t live = 0;
    for (const auto& [key, entry] : entries_) {
        if (now < entry.expiresAt) ++live;
    }
    return live;
}

} // namespace geotrack::adapters
