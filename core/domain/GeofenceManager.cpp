#include "GeofenceManager.hpp"
#include "../Errors.hpp"
#include "../Geo.hpp"
#include "../../crypto/Uuid.hpp"
#include <cmath>
#include <iostream>

namespace geotrack::domain {

namespace {

constexpr std::size_t kMinPolygonVertices = 4;

bool sameVertex(const Coordinates& a, const Coordinates& b) {
    return a.lat == b.lat && a.lon == b.lon;
}

GeofenceDraft deliveryCircle(const std::string& tripId, GeofenceKind kind, const std::string& name,
                             const Coordinates& center, double radiusM, bool onExit, int64_t dwellSec) {
    GeofenceDraft draft;
    draft.name = name;
    draft.tripId = tripId;
    draft.kind = kind;
    draft.geometry = Circle{center, radiusM};
    draft.notificationPolicy.onEntry = true;
    draft.notificationPolicy.onExit = onExit;
    draft.notificationPolicy.onDwell = DwellPolicy{true, dwellSec};
    return draft;
}

} // namespace

GeofenceManager::GeofenceManager(std::shared_ptr<ports::ITrackingStore> store, std::shared_ptr<IClock> clock)
    : store_(std::move(store)), clock_(std::move(clock)) {
}

void GeofenceManager::validateGeometry(const GeofenceGeometry& geometry) {
    if (const auto* circle = std::get_if<Circle>(&geometry)) {
        if (!Geo::isValid(circle->center)) {
            throw TrackingError(ErrorKind::GeofenceGeometryError, "Circle center is not a valid coordinate");
        }
        if (!(circle->radiusM > 0.0) || circle->radiusM > MAX_RADIUS_METERS) {
            throw TrackingError(ErrorKind::GeofenceGeometryError,
                                "Radius must be between 0 and 10000 meters");
        }
        return;
    }

    const auto& ring = std::get<Polygon>(geometry).ring;
    if (ring.size() < kMinPolygonVertices) {
        throw TrackingError(ErrorKind::GeofenceGeometryError, "Polygon must have at least 4 points");
    }
    if (!sameVertex(ring.front(), ring.back())) {
        throw TrackingError(ErrorKind::GeofenceGeometryError, "Polygon ring must be closed");
    }
    for (const auto& vertex : ring) {
        if (!Geo::isValid(vertex)) {
            throw TrackingError(ErrorKind::GeofenceGeometryError, "Polygon vertex is not a valid coordinate");
        }
    }
}

void GeofenceManager::validateSchedule(const ActiveWindow& window) {
    if (!parseUtcOffsetMinutes(window.timezone)) {
        throw TrackingError(ErrorKind::InvalidSchedule, "Unsupported timezone: " + window.timezone);
    }
    if (window.startAt && window.endAt && *window.startAt > *window.endAt) {
        throw TrackingError(ErrorKind::InvalidSchedule, "Active window ends before it starts");
    }
}

Geofence GeofenceManager::create(const GeofenceDraft& draft) {
    validateGeometry(draft.geometry);
    validateSchedule(draft.activeWindow);

    Geofence geofence;
    geofence.id = Uuid::generateV4();
    geofence.name = draft.name;
    geofence.tripId = draft.tripId;
    geofence.kind = draft.kind;
    geofence.geometry = draft.geometry;
    geofence.notificationPolicy = draft.notificationPolicy;
    geofence.activeWindow = draft.activeWindow;
    geofence.active = draft.active;
    geofence.createdAt = clock_->now();

    store_->saveGeofence(geofence);

    std::cout << "[Geofence] Created " << geofenceKindToString(geofence.kind) << " '" << geofence.name
              << "' (" << geofence.id << ")" << std::endl;
    return geofence;
}

Geofence GeofenceManager::deactivate(const std::string& geofenceId) {
    auto geofence = store_->findGeofence(geofenceId);
    if (!geofence) {
        throw TrackingError(ErrorKind::GeofenceNotFound, "Geofence not found: " + geofenceId);
    }
    geofence->active = false;
    store_->saveGeofence(*geofence);
    return *geofence;
}

std::optional<Geofence> GeofenceManager::get(const std::string& geofenceId) {
    return store_->findGeofence(geofenceId);
}

std::vector<Geofence> GeofenceManager::forTrip(const std::string& tripId) {
    return store_->geofencesForTrip(tripId);
}

std::size_t GeofenceManager::expire(Timestamp now) {
    std::size_t expired = 0;
    for (auto& geofence : store_->listGeofences()) {
        if (!geofence.active || !geofence.activeWindow.endAt || *geofence.activeWindow.endAt >= now) {
            continue;
        }
        geofence.active = false;
        store_->saveGeofence(geofence);
        ++expired;
    }

    if (expired > 0) {
        std::cout << "[Geofence] Expired " << expired << " geofence(s)" << std::endl;
    }
    return expired;
}

std::vector<Geofence> GeofenceManager::createDeliveryGeofences(const std::string& tripId,
                                                               const std::optional<Coordinates>& pickup,
                                                               const std::optional<Coordinates>& dropoff,
                                                               double radiusM) {
    std::vector<Geofence> created;

    if (pickup) {
        created.push_back(create(deliveryCircle(tripId, GeofenceKind::Pickup, "Pickup - " + tripId,
                                                *pickup, radiusM, true, 300)));
    }

    if (dropoff) {
        created.push_back(create(deliveryCircle(tripId, GeofenceKind::Delivery, "Delivery - " + tripId,
                                                *dropoff, radiusM, false, 600)));
    }

    return created;
}

} // namespace geotrack::domain
