#pragma once

#include "Types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace geotrack {

enum class EngineEventType {
    TrackingStarted,
    LocationUpdated,
    BatchLocationsUpdated,
    TrackingPaused,
    TrackingResumed,
    TrackingStopped,
    GeofenceTriggered
};

/// Message for the transport layer; payload shape depends on type.
struct EngineEvent {
    EngineEventType type = EngineEventType::LocationUpdated;
    std::string tripId;
    nlohmann::json payload;
    Timestamp emittedAt;
};

std::string engineEventTypeToString(EngineEventType type);
EngineEventType stringToEngineEventType(const std::string& str);

} // namespace geotrack
