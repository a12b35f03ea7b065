#include "InMemoryTrackingStore.hpp"
#include "../Errors.hpp"
#include <algorithm>

namespace geotrack::adapters {

namespace {

Timestamp sampleTime(const LocationSample& sample) {
    return sample.timestamp.value_or(Timestamp{});
}

} // namespace

InMemoryTrackingStore::InMemoryTrackingStore(std::chrono::milliseconds timeout)
    : timeout_(timeout) {
}

std::unique_lock<std::timed_mutex> InMemoryTrackingStore::acquire(const char* operation) {
    if (outage_) {
        throw TrackingError(ErrorKind::StorageUnavailable,
                            std::string("Storage unavailable during ") + operation);
    }
    std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
    if (!lock.try_lock_for(timeout_)) {
        throw TrackingError(ErrorKind::StorageUnavailable,
                            std::string("Storage timed out during ") + operation);
    }
    return lock;
}

void InMemoryTrackingStore::appendSample(const LocationSample& sample) {
    auto lock = acquire("appendSample");
    samplesByTrip_[sample.tripId].push_back(sample);
}

void InMemoryTrackingStore::appendSamples(const std::vector<LocationSample>& samples) {
    auto lock = acquire("appendSamples");
    for (const auto& sample : samples) {
        samplesByTrip_[sample.tripId].push_back(sample);
    }
}

std::optional<LocationSample> InMemoryTrackingStore::lastSample(const std::string& tripId,
                                                                const std::string& userId) {
    auto lock = acquire("lastSample");
    auto it = samplesByTrip_.find(tripId);
    if (it == samplesByTrip_.end()) {
        return std::nullopt;
    }

    const LocationSample* latest = nullptr;
    for (const auto& sample : it->second) {
        if (sample.userId != userId) continue;
        if (!latest || sampleTime(sample) >= sampleTime(*latest)) {
            latest = &sample;
        }
    }
    if (!latest) {
        return std::nullopt;
    }
    return *latest;
}

std::optional<LocationSample> InMemoryTrackingStore::latestSampleForTrip(const std::string& tripId) {
    auto lock = acquire("latestSampleForTrip");
    auto it = samplesByTrip_.find(tripId);
    if (it == samplesByTrip_.end() || it->second.empty()) {
        return std::nullopt;
    }

    auto latest = std::max_element(it->second.begin(), it->second.end(),
        [](const LocationSample& a, const LocationSample& b) {
            return sampleTime(a) < sampleTime(b);
        });
    return *latest;
}

std::vector<LocationSample> InMemoryTrackingStore::samplesInRange(const std::string& tripId,
                                                                  Timestamp from, Timestamp to) {
    auto lock = acquire("samplesInRange");
    std::vector<LocationSample> result;

    auto it = samplesByTrip_.find(tripId);
    if (it == samplesByTrip_.end()) {
        return result;
    }

    for (const auto& sample : it->second) {
        auto at = sampleTime(sample);
        if (at >= from && at <= to) {
            result.push_back(sample);
        }
    }

    std::stable_sort(result.begin(), result.end(),
        [](const LocationSample& a, const LocationSample& b) {
            return sampleTime(a) < sampleTime(b);
        });
    return result;
}

void InMemoryTrackingStore::saveSession(const TrackingSession& session) {
    auto lock = acquire("saveSession");
    sessions_[session.tripId] = session;
}

std::optional<TrackingSession> InMemoryTrackingStore::findSession(const std::string& tripId) {
    auto lock = acquire("findSession");
    auto it = sessions_.find(tripId);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<TrackingSession> InMemoryTrackingStore::listSessions() {
    auto lock = acquire("listSessions");
    std::vector<TrackingSession> result;
    result.reserve(sessions_.size());
    for (const auto& [tripId, session] : sessions_) {
        result.push_back(session);
    }
    return result;
}

void InMemoryTrackingStore::saveGeofence(const Geofence& geofence) {
    auto lock = acquire("saveGeofence");
    geofences_[geofence.id] = geofence;
}

std::optional<Geofence> InMemoryTrackingStore::findGeofence(const std::string& geofenceId) {
    auto lock = acquire("findGeofence");
    auto it = geofences_.find(geofenceId);
    if (it == geofences_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Geofence> InMemoryTrackingStore::geofencesForTrip(const std::string& tripId) {
    auto lock = acquire("geofencesForTrip");
    std::vector<Geofence> result;
    for (const auto& [id, geofence] : geofences_) {
        if (geofence.tripId && *geofence.tripId == tripId) {
            result.push_back(geofence);
        }
    }
    return result;
}

std::vector<Geofence> InMemoryTrackingStore::listGeofences() {
    auto lock = acquire("listGeofences");
    std::vector<Geofence> result;
    result.reserve(geofences_.size());
    for (const auto& [id, geofence] : geofences_) {
        result.push_back(geofence);
    }
    return result;
}

std::optional<ContainmentState> InMemoryTrackingStore::getContainmentState(const std::string& userId,
                                                                           const std::string& geofenceId) {
    auto lock = acquire("getContainmentState");
    auto it = containment_.find({userId, geofenceId});
    if (it == containment_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryTrackingStore::putContainmentState(const ContainmentState& state) {
    auto lock = acquire("putContainmentState");
    containment_[{state.userId, state.geofenceId}] = state;
}

void InMemoryTrackingStore::appendGeofenceEvent(const GeofenceEvent& event) {
    auto lock = acquire("appendGeofenceEvent");
    eventsByTrip_[event.tripId].push_back(event);
}

std::vector<GeofenceEvent> InMemoryTrackingStore::geofenceEventsForTrip(const std::string& tripId) {
    auto lock = acquire("geofenceEventsForTrip");
    auto it = eventsByTrip_.find(tripId);
    if (it == eventsByTrip_.end()) {
        return {};
    }
    return it->second;
}

std::size_t InMemoryTrackingStore::sampleCount() {
    auto lock = acquire("sampleCount");
    std::size_t count = 0;
    for (const auto& [tripId, samples] : samplesByTrip_) {
        count += samples.size();
    }
    return count;
}

} // namespace geotrack::adapters
