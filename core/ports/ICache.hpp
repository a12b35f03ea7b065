#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace geotrack::ports {

/// Key/value cache with per-entry expiry. Failures and timeouts throw
/// TrackingError(ErrorKind::CacheUnavailable).
class ICache {
public:
    virtual ~ICache() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const std::string& value, std::chrono::seconds ttl) = 0;
    virtual void erase(const std::string& key) = 0;
};

} // namespace geotrack::ports
