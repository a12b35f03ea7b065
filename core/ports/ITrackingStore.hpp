#pragma once

#include "../Types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace geotrack::ports {

/**
 * @brief Persistence port for samples, sessions, geofences and containment
 *
 * Implementations must bound every call; a call that cannot complete in time
 * throws TrackingError(ErrorKind::StorageUnavailable).
 */
class ITrackingStore {
public:
    virtual ~ITrackingStore() = default;

    virtual void appendSample(const LocationSample& sample) = 0;
    /// Single bulk write; either all samples are stored or none.
    virtual void appendSamples(const std::vector<LocationSample>& samples) = 0;
    /// Latest by timestamp, not by insertion order.
    virtual std::optional<LocationSample> lastSample(const std::string& tripId,
                                                     const std::string& userId) = 0;
    virtual std::optional<LocationSample> latestSampleForTrip(const std::string& tripId) = 0;
    /// Inclusive range, ascending by timestamp.
    virtual std::vector<LocationSample> samplesInRange(const std::string& tripId,
                                                       Timestamp from, Timestamp to) = 0;

    virtual void saveSession(const TrackingSession& session) = 0;
    virtual std::optional<TrackingSession> findSession(const std::string& tripId) = 0;
    virtual std::vector<TrackingSession> listSessions() = 0;

    virtual void saveGeofence(const Geofence& geofence) = 0;
    virtual std::optional<Geofence> findGeofence(const std::string& geofenceId) = 0;
    virtual std::vector<Geofence> geofencesForTrip(const std::string& tripId) = 0;
    virtual std::vector<Geofence> listGeofences() = 0;

    virtual std::optional<ContainmentState> getContainmentState(const std::string& userId,
                                                                const std::string& geofenceId) = 0;
    virtual void putContainmentState(const ContainmentState& state) = 0;

    virtual void appendGeofenceEvent(const GeofenceEvent& event) = 0;
    virtual std::vector<GeofenceEvent> geofenceEventsForTrip(const std::string& tripId) = 0;
};

} // namespace geotrack::ports
