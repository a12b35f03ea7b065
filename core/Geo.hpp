#pragma once

#include "Types.hpp"
#include <vector>

namespace geotrack {

struct ClosestPoint {
    Coordinates point;
    double distanceMeters = 0.0;
};

/**
 * @brief Spherical geometry helpers on WGS84 decimal degrees
 *
 * Distances use the haversine great-circle formula on a sphere of radius
 * 6371 km. Polygon tests work in planar lat/lon space, which is adequate for
 * geofences a few kilometres across.
 */
class Geo {
public:
    static double distanceMeters(double lat1, double lon1, double lat2, double lon2);
    static double distanceMeters(const Coordinates& a, const Coordinates& b);
    static double distanceKm(const Coordinates& a, const Coordinates& b);

    static double bearingDegrees(double lat1, double lon1, double lat2, double lon2);

    static Coordinates destination(const Coordinates& from, double bearingDeg, double distanceMeters);

    /// Boundary counts as inside.
    static bool isInsideCircle(const Coordinates& point, const Coordinates& center, double radiusMeters);

    /// Even-odd ray casting; points on an edge or vertex count as inside.
    static bool isInsidePolygon(const Coordinates& point, const std::vector<Coordinates>& ring);

    static bool isOnSegment(const Coordinates& point, const Coordinates& a, const Coordinates& b);

    static ClosestPoint closestPointOnSegment(const Coordinates& point,
                                              const Coordinates& a,
                                              const Coordinates& b);

    static double distanceToRingMeters(const Coordinates& point, const std::vector<Coordinates>& ring);

    static double routeDistanceKm(const std::vector<Coordinates>& route);

    static bool isValid(const Coordinates& coordinates);
    static double normalizeLongitude(double longitude);

    static constexpr double EARTH_RADIUS_METERS = 6371000.0;

    static double toRadians(double degrees);
    static double toDegrees(double radians);
};

} // namespace geotrack
