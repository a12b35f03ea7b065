#pragma once

#include "../ports/ICache.hpp"
#include "../IClock.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace geotrack::adapters {

/// TTL cache; entries expire against the injected clock.
class InMemoryCache : public ports::ICache {
public:
    InMemoryCache(std::shared_ptr<IClock> clock,
                  std::chrono::milliseconds timeout = std::chrono::milliseconds(250));
    ~InMemoryCache() override = default;

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
    void erase(const std::string& key) override;

    void simulateOutage(bool down) { outage_ = down; }
    std::size_t size();

private:
    struct Entry {
        std::string value;
        Timestamp expiresAt;
    };

    std::unique_lock<std::timed_mutex> acquire(const char* operation);

    std::shared_ptr<IClock> clock_;
    std::chrono::milliseconds timeout_;
    std::atomic<bool> outage_{false};
    std::timed_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace geotrack::adapters
