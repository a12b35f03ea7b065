#pragma once

#include "../ports/ITrackingStore.hpp"
#include "../IClock.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace geotrack::domain {

/// Caller-supplied part of a geofence; id and createdAt are assigned on create.
struct GeofenceDraft {
    std::string name;
    std::optional<std::string> tripId;
    GeofenceKind kind = GeofenceKind::Delivery;
    GeofenceGeometry geometry;
    NotificationPolicy notificationPolicy;
    ActiveWindow activeWindow;
    bool active = true;
};

class GeofenceManager {
public:
    static constexpr double MAX_RADIUS_METERS = 10000.0;
    static constexpr double DEFAULT_DELIVERY_RADIUS_METERS = 100.0;

    GeofenceManager(std::shared_ptr<ports::ITrackingStore> store, std::shared_ptr<IClock> clock);

    /**
     * @brief Validate and persist a new geofence
     * @throws TrackingError(GeofenceGeometryError) for a degenerate shape
     * @throws TrackingError(InvalidSchedule) for an unknown timezone or an
     *         inverted window
     */
    Geofence create(const GeofenceDraft& draft);

    Geofence deactivate(const std::string& geofenceId);
    std::optional<Geofence> get(const std::string& geofenceId);
    std::vector<Geofence> forTrip(const std::string& tripId);

    /// Deactivate geofences whose window ended before @p now.
    std::size_t expire(Timestamp now);

    /**
     * @brief Standard pickup and drop-off circles for a delivery trip
     *
     * Pickup notifies on entry, exit and after 5 minutes inside. Drop-off
     * notifies on entry and after 10 minutes inside.
     */
    std::vector<Geofence> createDeliveryGeofences(const std::string& tripId,
                                                  const std::optional<Coordinates>& pickup,
                                                  const std::optional<Coordinates>& dropoff,
                                                  double radiusM = DEFAULT_DELIVERY_RADIUS_METERS);

    static void validateGeometry(const GeofenceGeometry& geometry);
    static void validateSchedule(const ActiveWindow& window);

private:
    std::shared_ptr<ports::ITrackingStore> store_;
    std::shared_ptr<IClock> clock_;
};

} // namespace geotrack::domain
