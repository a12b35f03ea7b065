#pragma once

#include "../ports/ICache.hpp"
#include "../ports/ITrackingStore.hpp"
#include "PrivacyFilter.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace geotrack::domain {

/**
 * @brief Latest privacy-filtered position per trip and per (trip, user)
 *
 * Keys: current_location:{tripId} and current_location:{tripId}:{userId}.
 * Cache failures never fail the caller: writes are dropped with a log line,
 * reads fall back to the store and re-populate the cache.
 */
class CurrentLocationCache {
public:
    CurrentLocationCache(std::shared_ptr<ports::ICache> cache,
                         std::shared_ptr<ports::ITrackingStore> store,
                         std::shared_ptr<PrivacyFilter> privacyFilter,
                         std::chrono::seconds ttl = std::chrono::seconds(300));

    /// Store an already filtered sample under both keys. Returns false if the cache refused it.
    bool put(const LocationSample& filtered);

    /**
     * @brief Latest position for a trip, or for one user on the trip
     *
     * On a miss the newest stored sample is filtered at @p level before it is
     * returned and cached.
     *
     * @throws TrackingError(StorageUnavailable) when the fallback read fails
     */
    std::optional<LocationSample> get(const std::string& tripId,
                                      const std::optional<std::string>& userId,
                                      TrackingLevel level);

    void clear(const std::string& tripId, const std::string& userId);

    static std::string tripKey(const std::string& tripId);
    static std::string userKey(const std::string& tripId, const std::string& userId);

private:
    std::optional<LocationSample> readCached(const std::string& key);

    std::shared_ptr<ports::ICache> cache_;
    std::shared_ptr<ports::ITrackingStore> store_;
    std::shared_ptr<PrivacyFilter> privacyFilter_;
    std::chrono::seconds ttl_;
};

} // namespace geotrack::domain
