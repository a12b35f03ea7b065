#pragma once

#include "../ports/ITrackingStore.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace geotrack::adapters {

/**
 * @brief Process-local implementation of the storage port
 *
 * All state sits behind one timed mutex; a call that cannot take it within
 * the configured timeout throws StorageUnavailable. simulateOutage() makes
 * every call fail the same way, for exercising failure paths.
 */
class InMemoryTrackingStore : public ports::ITrackingStore {
public:
    explicit InMemoryTrackingStore(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));
    ~InMemoryTrackingStore() override = default;

    void appendSample(const LocationSample& sample) override;
    void appendSamples(const std::vector<LocationSample>& samples) override;
    std::optional<LocationSample> lastSample(const std::string& tripId,
                                             const std::string& userId) override;
    std::optional<LocationSample> latestSampleForTrip(const std::string& tripId) override;
    std::vector<LocationSample> samplesInRange(const std::string& tripId,
                                               Timestamp from, Timestamp to) override;

    void saveSession(const TrackingSession& session) override;
    std::optional<TrackingSession> findSession(const std::string& tripId) override;
    std::vector<TrackingSession> listSessions() override;

    void saveGeofence(const Geofence& geofence) override;
    std::optional<Geofence> findGeofence(const std::string& geofenceId) override;
    std::vector<Geofence> geofencesForTrip(const std::string& tripId) override;
    std::vector<Geofence> listGeofences() override;

    std::optional<ContainmentState> getContainmentState(const std::string& userId,
                                                        const std::string& geofenceId) override;
    void putContainmentState(const ContainmentState& state) override;

    void appendGeofenceEvent(const GeofenceEvent& event) override;
    std::vector<GeofenceEvent> geofenceEventsForTrip(const std::string& tripId) override;

    void simulateOutage(bool down) { outage_ = down; }
    std::size_t sampleCount();

private:
    std::unique_lock<std::timed_mutex> acquire(const char* operation);

    std::chrono::milliseconds timeout_;
    std::atomic<bool> outage_{false};
    std::timed_mutex mutex_;

    std::unordered_map<std::string, std::vector<LocationSample>> samplesByTrip_;
    std::unordered_map<std::string, TrackingSession> sessions_;
    std::map<std::string, Geofence> geofences_;
    std::map<std::pair<std::string, std::string>, ContainmentState> containment_;
    std::unordered_map<std::string, std::vector<GeofenceEvent>> eventsByTrip_;
};

} // namespace geotrack::adapters
