#include "Types.hpp"
#include <stdexcept>
#include <unordered_map>

namespace geotrack {

std::string trackingLevelToString(TrackingLevel level) {
    switch (level) {
        case TrackingLevel::Precise: return "precise";
        case TrackingLevel::Approximate: return "approximate";
        case TrackingLevel::Minimal: return "minimal";
    }
    return "precise";
}

TrackingLevel stringToTrackingLevel(const std::string& str) {
    static const std::unordered_map<std::string, TrackingLevel> levelMap = {
        {"precise", TrackingLevel::Precise},
        {"approximate", TrackingLevel::Approximate},
        {"minimal", TrackingLevel::Minimal}
    };

    auto it = levelMap.find(str);
    if (it == levelMap.end()) {
        throw std::invalid_argument("Unknown tracking level: " + str);
    }
    return it->second;
}

std::string sessionStatusToString(SessionStatus status) {
    switch (status) {
        case SessionStatus::Active: return "active";
        case SessionStatus::Paused: return "paused";
        case SessionStatus::Stopped: return "stopped";
        case SessionStatus::Completed: return "completed";
    }
    return "stopped";
}

SessionStatus stringToSessionStatus(const std::string& str) {
    static const std::unordered_map<std::string, SessionStatus> statusMap = {
        {"active", SessionStatus::Active},
        {"paused", SessionStatus::Paused},
        {"stopped", SessionStatus::Stopped},
        {"completed", SessionStatus::Completed}
    };

    auto it = statusMap.find(str);
    if (it == statusMap.end()) {
        throw std::invalid_argument("Unknown session status: " + str);
    }
    return it->second;
}

std::string geofenceKindToString(GeofenceKind kind) {
    switch (kind) {
        case GeofenceKind::Pickup: return "pickup";
        case GeofenceKind::Delivery: return "delivery";
        case GeofenceKind::Restricted: return "restricted";
        case GeofenceKind::SafeZone: return "safe_zone";
    }
    return "delivery";
}

GeofenceKind stringToGeofenceKind(const std::string& str) {
    static const std::unordered_map<std::string, GeofenceKind> kindMap = {
        {"pickup", GeofenceKind::Pickup},
        {"delivery", GeofenceKind::Delivery},
        {"restricted", GeofenceKind::Restricted},
        {"safe_zone", GeofenceKind::SafeZone}
    };

    auto it = kindMap.find(str);
    if (it == kindMap.end()) {
        throw std::invalid_argument("Unknown geofence kind: " + str);
    }
    return it->second;
}

std::string geofenceEventKindToString(GeofenceEventKind kind) {
    switch (kind) {
        case GeofenceEventKind::Enter: return "enter";
        case GeofenceEventKind::Exit: return "exit";
        case GeofenceEventKind::Dwell: return "dwell";
    }
    return "enter";
}

GeofenceEventKind stringToGeofenceEventKind(const std::string& str) {
    static const std::unordered_map<std::string, GeofenceEventKind> kindMap = {
        {"enter", GeofenceEventKind::Enter},
        {"exit", GeofenceEventKind::Exit},
        {"dwell", GeofenceEventKind::Dwell}
    };

    auto it = kindMap.find(str);
    if (it == kindMap.end()) {
        throw std::invalid_argument("Unknown geofence event kind: " + str);
    }
    return it->second;
}

} // namespace geotrack
