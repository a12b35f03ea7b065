#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace geotrack {

using Timestamp = std::chrono::system_clock::time_point;

struct Coordinates {
    double lat = 0.0;
    double lon = 0.0;
};

enum class TrackingLevel {
    Precise,
    Approximate,
    Minimal
};

enum class SessionStatus {
    Active,
    Paused,
    Stopped,
    Completed
};

enum class GeofenceKind {
    Pickup,
    Delivery,
    Restricted,
    SafeZone
};

enum class GeofenceEventKind {
    Enter,
    Exit,
    Dwell
};

/**
 * @brief One GPS fix reported by a courier device
 *
 * Optional fields are absent when the device did not report them. The
 * timestamp is optional only on raw input; validation stamps missing ones.
 */
struct LocationSample {
    std::string id;
    std::string tripId;
    std::string userId;

    Coordinates coordinates;
    std::optional<double> accuracyM;
    std::optional<double> altitudeM;
    std::optional<double> bearingDeg;
    std::optional<double> speedMps;
    std::optional<double> batteryPct;
    std::optional<std::string> networkType;

    std::optional<Timestamp> timestamp;
};

struct TrackingSettings {
    int intervalSec = 30;
    std::string accuracyTier = "high";
    bool batteryOptimization = true;
    bool backgroundTracking = true;
};

struct PrivacySettings {
    TrackingLevel trackingLevel = TrackingLevel::Precise;
};

struct TrackingSession {
    std::string id;
    std::string tripId;
    std::string userId;
    SessionStatus status = SessionStatus::Active;

    Timestamp startedAt;
    std::optional<Timestamp> stoppedAt;
    Timestamp lastUpdateAt;

    uint64_t totalUpdates = 0;
    double totalDistanceKm = 0.0;
    int64_t totalDurationMin = 0;

    TrackingSettings settings;
    PrivacySettings privacySettings;
    std::optional<std::string> stopReason;
};

struct Circle {
    Coordinates center;
    double radiusM = 0.0;
};

/// Closed ring: first vertex repeated as the last one.
struct Polygon {
    std::vector<Coordinates> ring;
};

using GeofenceGeometry = std::variant<Circle, Polygon>;

struct DwellPolicy {
    bool enabled = false;
    int64_t durationSec = 300;
};

struct NotificationPolicy {
    bool onEntry = false;
    bool onExit = false;
    DwellPolicy onDwell;
};

struct ActiveWindow {
    std::optional<Timestamp> startAt;
    std::optional<Timestamp> endAt;
    std::string timezone = "UTC";

    bool contains(Timestamp at) const {
        if (startAt && at < *startAt) return false;
        if (endAt && at > *endAt) return false;
        return true;
    }
};

struct Geofence {
    std::string id;
    std::string name;
    std::optional<std::string> tripId;
    GeofenceKind kind = GeofenceKind::Delivery;
    GeofenceGeometry geometry;
    NotificationPolicy notificationPolicy;
    ActiveWindow activeWindow;
    bool active = true;
    Timestamp createdAt;
};

struct ContainmentState {
    std::string userId;
    std::string geofenceId;
    bool isInside = false;
    Timestamp sinceTimestamp;
    bool dwellNotified = false;   ///< dwell already raised for the current inside period
};

struct GeofenceEvent {
    std::string id;
    std::string geofenceId;
    std::string userId;
    std::string tripId;
    GeofenceEventKind kind = GeofenceEventKind::Enter;
    Coordinates coordinates;
    std::optional<int64_t> dwellSeconds;
    Timestamp triggeredAt;
};

std::string trackingLevelToString(TrackingLevel level);
TrackingLevel stringToTrackingLevel(const std::string& str);

std::string sessionStatusToString(SessionStatus status);
SessionStatus stringToSessionStatus(const std::string& str);

std::string geofenceKindToString(GeofenceKind kind);
GeofenceKind stringToGeofenceKind(const std::string& str);

std::string geofenceEventKindToString(GeofenceEventKind kind);
GeofenceEventKind stringToGeofenceEventKind(const std::string& str);

} // namespace geotrack
