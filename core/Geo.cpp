#include "Geo.hpp"
#include <cmath>
#include <algorithm>
#include <limits>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace geotrack {

namespace {

// Tolerance for collinearity in squared-degree units.
constexpr double kEdgeEpsilon = 1e-12;

} // namespace

double Geo::distanceMeters(double lat1, double lon1, double lat2, double lon2) {
    double dLat = toRadians(lat2 - lat1);
    double dLon = toRadians(lon2 - lon1);

    double a = std::sin(dLat/2) * std::sin(dLat/2) +
               std::cos(toRadians(lat1)) * std::cos(toRadians(lat2)) *
               std::sin(dLon/2) * std::sin(dLon/2);

    double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1-a));
    return EARTH_RADIUS_METERS * c;
}

double Geo::distanceMeters(const Coordinates& a, const Coordinates& b) {
    return distanceMeters(a.lat, a.lon, b.lat, b.lon);
}

double Geo::distanceKm(const Coordinates& a, const Coordinates& b) {
    return distanceMeters(a, b) / 1000.0;
}

double Geo::bearingDegrees(double lat1, double lon1, double lat2, double lon2) {
    double dLon = toRadians(lon2 - lon1);
    double y = std::sin(dLon) * std::cos(toRadians(lat2));
    double x = std::cos(toRadians(lat1)) * std::sin(toRadians(lat2)) -
               std::sin(toRadians(lat1)) * std::cos(toRadians(lat2)) * std::cos(dLon);

    double bearing = toDegrees(std::atan2(y, x));
    return std::fmod(bearing + 360.0, 360.0);
}

Coordinates Geo::destination(const Coordinates& from, double bearingDeg, double distanceMeters) {
    double bearing = toRadians(bearingDeg);
    double d = distanceMeters / EARTH_RADIUS_METERS;

    double lat1 = toRadians(from.lat);
    double lon1 = toRadians(from.lon);

    double lat2 = std::asin(std::sin(lat1) * std::cos(d) +
                           std::cos(lat1) * std::sin(d) * std::cos(bearing));

    double lon2 = lon1 + std::atan2(std::sin(bearing) * std::sin(d) * std::cos(lat1),
                                   std::cos(d) - std::sin(lat1) * std::sin(lat2));

    Coordinates result;
    result.lat = toDegrees(lat2);
    result.lon = normalizeLongitude(toDegrees(lon2));
    return result;
}

bool Geo::isInsideCircle(const Coordinates& point, const Coordinates& center, double radiusMeters) {
    return distanceMeters(point, center) <= radiusMeters;
}

bool Geo::isOnSegment(const Coordinates& point, const Coordinates& a, const Coordinates& b) {
    double cross = (b.lon - a.lon) * (point.lat - a.lat) - (b.lat - a.lat) * (point.lon - a.lon);
    if (std::abs(cross) > kEdgeEpsilon) {
        return false;
    }

    return point.lat >= std::min(a.lat, b.lat) - kEdgeEpsilon &&
           point.lat <= std::max(a.lat, b.lat) + kEdgeEpsilon &&
           point.lon >= std::min(a.lon, b.lon) - kEdgeEpsilon &&
           point.lon <= std::max(a.lon, b.lon) + kEdgeEpsilon;
}

bool Geo::isInsidePolygon(const Coordinates& point, const std::vector<Coordinates>& ring) {
    if (ring.size() < 3) return false;

    for (size_t i = 0; i + 1 < ring.size(); ++i) {
        if (isOnSegment(point, ring[i], ring[i + 1])) {
            return true;
        }
    }

    bool inside = false;
    size_t j = ring.size() - 1;

    for (size_t i = 0; i < ring.size(); ++i) {
        const auto& vi = ring[i];
        const auto& vj = ring[j];
        if (((vi.lat > point.lat) != (vj.lat > point.lat)) &&
            (point.lon < (vj.lon - vi.lon) * (point.lat - vi.lat) / (vj.lat - vi.lat) + vi.lon)) {
            inside = !inside;
        }
        j = i;
    }

    return inside;
}

ClosestPoint Geo::closestPointOnSegment(const Coordinates& point,
                                        const Coordinates& a,
                                        const Coordinates& b) {
    // Local equirectangular projection centred on the query point.
    const double metersPerDegree = EARTH_RADIUS_METERS * M_PI / 180.0;
    const double lonScale = std::cos(toRadians(point.lat));

    double ax = (a.lon - point.lon) * lonScale * metersPerDegree;
    double ay = (a.lat - point.lat) * metersPerDegree;
    double bx = (b.lon - point.lon) * lonScale * metersPerDegree;
    double by = (b.lat - point.lat) * metersPerDegree;

    double dx = bx - ax;
    double dy = by - ay;
    double lengthSq = dx * dx + dy * dy;

    double t = 0.0;
    if (lengthSq > 0.0) {
        t = std::clamp(-(ax * dx + ay * dy) / lengthSq, 0.0, 1.0);
    }

    ClosestPoint result;
    result.point.lat = a.lat + (b.lat - a.lat) * t;
    result.point.lon = a.lon + (b.lon - a.lon) * t;
    result.distanceMeters = distanceMeters(point, result.point);
    return result;
}

double Geo::distanceToRingMeters(const Coordinates& point, const std::vector<Coordinates>& ring) {
    double minDistance = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i + 1 < ring.size(); ++i) {
        minDistance = std::min(minDistance, closestPointOnSegment(point, ring[i], ring[i + 1]).distanceMeters);
    }
    return minDistance;
}

double Geo::routeDistanceKm(const std::vector<Coordinates>& route) {
    double total = 0.0;
    for (size_t i = 1; i < route.size(); ++i) {
        total += distanceKm(route[i - 1], route[i]);
    }
    return total;
}

bool Geo::isValid(const Coordinates& coordinates) {
    return std::isfinite(coordinates.lat) && std::isfinite(coordinates.lon) &&
           coordinates.lat >= -90.0 && coordinates.lat <= 90.0 &&
           coordinates.lon >= -180.0 && coordinates.lon <= 180.0;
}

double Geo::normalizeLongitude(double longitude) {
    while (longitude > 180.0) longitude -= 360.0;
    while (longitude < -180.0) longitude += 360.0;
    return longitude;
}

double Geo::toRadians(double degrees) {
    return degrees * M_PI / 180.0;
}

double Geo::toDegrees(double radians) {
    return radians * 180.0 / M_PI;
}

} // namespace geotrack
