#include "GeofenceEvaluator.hpp"
#include "../Errors.hpp"
#include "../Geo.hpp"
#include "../IClock.hpp"
#include "../../crypto/Uuid.hpp"
#include <algorithm>
#include <iostream>

namespace geotrack::domain {

GeofenceEvaluator::GeofenceEvaluator(std::shared_ptr<ports::ITrackingStore> store,
                                     std::shared_ptr<ContainmentStateStore> containment,
                                     std::shared_ptr<ports::INotificationSink> notificationSink)
    : store_(std::move(store)), containment_(std::move(containment)),
      notificationSink_(std::move(notificationSink)) {
}

bool GeofenceEvaluator::contains(const Geofence& geofence, const Coordinates& coordinates) {
    if (const auto* circle = std::get_if<Circle>(&geofence.geometry)) {
        return Geo::isInsideCircle(coordinates, circle->center, circle->radiusM);
    }
    return Geo::isInsidePolygon(coordinates, std::get<Polygon>(geofence.geometry).ring);
}

double GeofenceEvaluator::distanceTo(const Geofence& geofence, const Coordinates& coordinates) {
    if (const auto* circle = std::get_if<Circle>(&geofence.geometry)) {
        return std::max(0.0, Geo::distanceMeters(coordinates, circle->center) - circle->radiusM);
    }

    const auto& ring = std::get<Polygon>(geofence.geometry).ring;
    if (Geo::isInsidePolygon(coordinates, ring)) {
        return 0.0;
    }
    return Geo::distanceToRingMeters(coordinates, ring);
}

bool GeofenceEvaluator::shouldNotify(const NotificationPolicy& policy, GeofenceEventKind kind) {
    switch (kind) {
        case GeofenceEventKind::Enter: return policy.onEntry;
        case GeofenceEventKind::Exit:  return policy.onExit;
        case GeofenceEventKind::Dwell: return policy.onDwell.enabled;
    }
    return false;
}

GeofenceEvaluation GeofenceEvaluator::evaluate(const std::string& tripId, const std::string& userId,
                                               const Coordinates& coordinates, Timestamp at) {
    GeofenceEvaluation evaluation;

    std::vector<Geofence> geofences;
    try {
        geofences = store_->geofencesForTrip(tripId);
    } catch (const TrackingError& e) {
        if (e.kind() != ErrorKind::StorageUnavailable) throw;
        std::cerr << "[Geofence] Skipped evaluation for trip " << tripId << ": " << e.what() << std::endl;
        evaluation.error = e.kind();
        return evaluation;
    }

    for (const auto& geofence : geofences) {
        if (!geofence.active || !geofence.activeWindow.contains(at)) {
            continue;
        }

        std::optional<GeofenceEvent> event;
        try {
            event = evaluateOne(geofence, tripId, userId, coordinates, at);
        } catch (const TrackingError& e) {
            if (e.kind() != ErrorKind::StorageUnavailable) throw;
            std::cerr << "[Geofence] " << geofence.id << " not evaluated: " << e.what() << std::endl;
            evaluation.failedGeofenceIds.push_back(geofence.id);
            evaluation.error = e.kind();
            continue;
        }

        if (!event) {
            continue;
        }

        dispatch(*event, geofence);
        evaluation.events.push_back(std::move(*event));
    }

    return evaluation;
}

std::optional<GeofenceEvent> GeofenceEvaluator::evaluateOne(const Geofence& geofence, const std::string& tripId,
                                                            const std::string& userId,
                                                            const Coordinates& coordinates, Timestamp at) {
    const bool isInside = contains(geofence, coordinates);
    std::optional<GeofenceEvent> raised;

    containment_->update(userId, geofence.id, [&](const std::optional<ContainmentState>& previous) {
        if (previous && at < previous->sinceTimestamp) {
            return *previous;
        }

        const bool wasInside = previous && previous->isInside;
        std::optional<GeofenceEventKind> kind;
        std::optional<int64_t> dwellSeconds;
        ContainmentState next;

        if (isInside != wasInside) {
            kind = isInside ? GeofenceEventKind::Enter : GeofenceEventKind::Exit;
            next.isInside = isInside;
            next.sinceTimestamp = at;
            next.dwellNotified = false;
        } else if (!previous) {
            // A first observation outside still records the baseline.
            next.isInside = false;
            next.sinceTimestamp = at;
        } else {
            next = *previous;
            const auto& dwell = geofence.notificationPolicy.onDwell;
            if (isInside && dwell.enabled && !next.dwellNotified) {
                const int64_t elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                    at - next.sinceTimestamp).count();
                if (elapsed >= dwell.durationSec) {
                    kind = GeofenceEventKind::Dwell;
                    dwellSeconds = elapsed;
                    next.dwellNotified = true;
                }
            }
        }

        if (kind) {
            GeofenceEvent event;
            event.id = Uuid::generateV4();
            event.geofenceId = geofence.id;
            event.userId = userId;
            event.tripId = tripId;
            event.kind = *kind;
            event.coordinates = coordinates;
            event.dwellSeconds = dwellSeconds;
            event.triggeredAt = at;

            // Must precede the state write.
            store_->appendGeofenceEvent(event);
            raised = std::move(event);
        }
        return next;
    });

    return raised;
}

void GeofenceEvaluator::dispatch(const GeofenceEvent& event, const Geofence& geofence) {
    std::cout << "[Geofence] " << geofenceEventKindToString(event.kind) << " " << geofence.name
              << " user=" << event.userId << " at " << formatIso8601(event.triggeredAt) << std::endl;

    if (!notificationSink_ || !shouldNotify(geofence.notificationPolicy, event.kind)) {
        return;
    }

    try {
        notificationSink_->notify(event, geofence);
    } catch (const std::exception& e) {
        std::cerr << "[Geofence] Notification for " << geofence.id << " failed: " << e.what() << std::endl;
    }
}

std::vector<GeofenceInspection> GeofenceEvaluator::inspect(const Coordinates& coordinates,
                                                           const std::vector<std::string>& geofenceIds) {
    if (!Geo::isValid(coordinates)) {
        throw TrackingError(ErrorKind::InvalidCoordinates, "Coordinates out of range");
    }

    std::vector<GeofenceInspection> result;
    result.reserve(geofenceIds.size());

    for (const auto& id : geofenceIds) {
        auto geofence = store_->findGeofence(id);
        if (!geofence) {
            throw TrackingError(ErrorKind::GeofenceNotFound, "Geofence not found: " + id);
        }

        GeofenceInspection inspection;
        inspection.geofenceId = id;
        inspection.isInside = contains(*geofence, coordinates);
        inspection.distanceM = inspection.isInside ? 0.0 : distanceTo(*geofence, coordinates);
        result.push_back(inspection);
    }

    return result;
}

} // namespace geotrack::domain
