#pragma once

#include "../ports/INotificationSink.hpp"
#include "../ports/ITrackingStore.hpp"
#include "ContainmentStateStore.hpp"
#include "../Errors.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace geotrack::domain {

struct GeofenceInspection {
    std::string geofenceId;
    bool isInside = false;
    double distanceM = 0.0;     ///< 0 when inside
};

struct GeofenceEvaluation {
    std::vector<GeofenceEvent> events;
    std::vector<std::string> failedGeofenceIds;   ///< event log unavailable, containment state left as it was
    std::optional<ErrorKind> error;
};

/**
 * @brief Stateful enter/exit/dwell detection for one position update
 *
 * For each active geofence of the trip whose window covers the sample time:
 * - outside -> inside raises enter
 * - inside -> outside raises exit
 * - inside -> inside raises dwell once per inside period, when dwell is
 *   enabled and the period has lasted at least the dwell duration
 *
 * Every event is appended to the event log before the containment state
 * moves, so a transition whose append fails is raised again by the next
 * sample. Storage failures are reported in the result rather than thrown.
 * A sample older than the stored state's timestamp changes nothing.
 *
 * The notification sink only hears about kinds the geofence's policy
 * enables, and its failures are logged without failing the evaluation.
 */
class GeofenceEvaluator {
public:
    GeofenceEvaluator(std::shared_ptr<ports::ITrackingStore> store,
                      std::shared_ptr<ContainmentStateStore> containment,
                      std::shared_ptr<ports::INotificationSink> notificationSink = nullptr);

    GeofenceEvaluation evaluate(const std::string& tripId, const std::string& userId,
                                const Coordinates& coordinates, Timestamp at);

    /**
     * @brief Containment and distance for a point against the given geofences
     * @throws TrackingError(GeofenceNotFound) for an unknown id
     */
    std::vector<GeofenceInspection> inspect(const Coordinates& coordinates,
                                            const std::vector<std::string>& geofenceIds);

    static bool contains(const Geofence& geofence, const Coordinates& coordinates);
    static double distanceTo(const Geofence& geofence, const Coordinates& coordinates);
    static bool shouldNotify(const NotificationPolicy& policy, GeofenceEventKind kind);

private:
    std::optional<GeofenceEvent> evaluateOne(const Geofence& geofence, const std::string& tripId,
                                             const std::string& userId,
                                             const Coordinates& coordinates, Timestamp at);
    void dispatch(const GeofenceEvent& event, const Geofence& geofence);

    std::shared_ptr<ports::ITrackingStore> store_;
    std::shared_ptr<ContainmentStateStore> containment_;
    std::shared_ptr<ports::INotificationSink> notificationSink_;
};

} // namespace geotrack::domain
