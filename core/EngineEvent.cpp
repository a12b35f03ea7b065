#include "EngineEvent.hpp"
#include <stdexcept>
#include <unordered_map>

namespace geotrack {

std::string engineEventTypeToString(EngineEventType type) {
    static const std::unordered_map<EngineEventType, std::string> typeMap = {
        {EngineEventType::TrackingStarted, "tracking_started"},
        {EngineEventType::LocationUpdated, "location_updated"},
        {EngineEventType::BatchLocationsUpdated, "batch_locations_updated"},
        {EngineEventType::TrackingPaused, "tracking_paused"},
        {EngineEventType::TrackingResumed, "tracking_resumed"},
        {EngineEventType::TrackingStopped, "tracking_stopped"},
        {EngineEventType::GeofenceTriggered, "geofence_event"}
    };

    auto it = typeMap.find(type);
    return (it != typeMap.end()) ? it->second : "unknown";
}

EngineEventType stringToEngineEventType(const std::string& str) {
    static const std::unordered_map<std::string, EngineEventType> stringMap = {
        {"tracking_started", EngineEventType::TrackingStarted},
        {"location_updated", EngineEventType::LocationUpdated},
        {"batch_locations_updated", EngineEventType::BatchLocationsUpdated},
        {"tracking_paused", EngineEventType::TrackingPaused},
        {"tracking_resumed", EngineEventType::TrackingResumed},
        {"tracking_stopped", EngineEventType::TrackingStopped},
        {"geofence_event", EngineEventType::GeofenceTriggered}
    };

    auto it = stringMap.find(str);
    if (it == stringMap.end()) {
        throw std::invalid_argument("Unknown engine event type: " + str);
    }
    return it->second;
}

} // namespace geotrack
