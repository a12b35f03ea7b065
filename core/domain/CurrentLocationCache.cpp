#include "CurrentLocationCache.hpp"
#include "../Errors.hpp"
#include "../JsonCodec.hpp"
#include <iostream>

namespace geotrack::domain {

CurrentLocationCache::CurrentLocationCache(std::shared_ptr<ports::ICache> cache,
                                           std::shared_ptr<ports::ITrackingStore> store,
                                           std::shared_ptr<PrivacyFilter> privacyFilter,
                                           std::chrono::seconds ttl)
    : cache_(std::move(cache)), store_(std::move(store)),
      privacyFilter_(std::move(privacyFilter)), ttl_(ttl) {
}

std::string CurrentLocationCache::tripKey(const std::string& tripId) {
    return "current_location:" + tripId;
}

std::string CurrentLocationCache::userKey(const std::string& tripId, const std::string& userId) {
    return "current_location:" + tripId + ":" + userId;
}

bool CurrentLocationCache::put(const LocationSample& filtered) {
    const std::string value = JsonCodec::serialize(filtered);
    try {
        cache_->set(userKey(filtered.tripId, filtered.userId), value, ttl_);
        cache_->set(tripKey(filtered.tripId), value, ttl_);
        return true;
    } catch (const TrackingError& e) {
        std::cerr << "[LocationCache] Write skipped for trip " << filtered.tripId
                  << ": " << e.what() << std::endl;
        return false;
    }
}

std::optional<LocationSample> CurrentLocationCache::readCached(const std::string& key) {
    std::optional<std::string> raw;
    try {
        raw = cache_->get(key);
    } catch (const TrackingError& e) {
        std::cerr << "[LocationCache] Read failed, falling back to storage: " << e.what() << std::endl;
        return std::nullopt;
    }
    if (!raw) {
        return std::nullopt;
    }

    try {
        return JsonCodec::deserializeSample(*raw);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[LocationCache] Discarding unreadable entry " << key << ": " << e.what() << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[LocationCache] Discarding unreadable entry " << key << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<LocationSample> CurrentLocationCache::get(const std::string& tripId,
                                                        const std::optional<std::string>& userId,
                                                        TrackingLevel level) {
    const std::string key = userId ? userKey(tripId, *userId) : tripKey(tripId);

    if (auto cached = readCached(key)) {
        return cached;
    }

    auto stored = userId ? store_->lastSample(tripId, *userId) : store_->latestSampleForTrip(tripId);
    if (!stored) {
        return std::nullopt;
    }

    LocationSample filtered = privacyFilter_->apply(*stored, level);
    put(filtered);
    return filtered;
}

void CurrentLocationCache::clear(const std::string& tripId, const std::string& userId) {
    try {
        cache_->erase(tripKey(tripId));
        cache_->erase(userKey(tripId, userId));
    } catch (const TrackingError& e) {
        std::cerr << "[LocationCache] Clear failed for trip " << tripId << ": " << e.what() << std::endl;
    }
}

} // namespace geotrack::domain
