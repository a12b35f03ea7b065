#pragma once

#include "Types.hpp"
#include "EngineEvent.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace geotrack {

/**
 * @brief JSON mapping for the engine's wire and cache representations
 *
 * Timestamps travel as ISO-8601 strings ("ts"). Absent optional fields are
 * omitted on output and tolerated on input. Decoders throw
 * nlohmann::json::exception on type mismatches and std::invalid_argument on
 * unknown enum names or malformed timestamps.
 */
class JsonCodec {
public:
    static std::string serialize(const LocationSample& sample);
    static LocationSample deserializeSample(const std::string& json);

    static nlohmann::json coordinatesToJson(const Coordinates& coordinates);
    static Coordinates jsonToCoordinates(const nlohmann::json& json);

    static nlohmann::json sampleToJson(const LocationSample& sample);
    static LocationSample jsonToSample(const nlohmann::json& json);

    static nlohmann::json settingsToJson(const TrackingSettings& settings);
    static TrackingSettings jsonToSettings(const nlohmann::json& json);

    static nlohmann::json privacyToJson(const PrivacySettings& privacy);
    static PrivacySettings jsonToPrivacy(const nlohmann::json& json);

    static nlohmann::json sessionToJson(const TrackingSession& session);
    static TrackingSession jsonToSession(const nlohmann::json& json);

    static nlohmann::json sessionSummaryToJson(const TrackingSession& session);

    static nlohmann::json geometryToJson(const GeofenceGeometry& geometry);
    static GeofenceGeometry jsonToGeometry(const nlohmann::json& json);

    static nlohmann::json geofenceToJson(const Geofence& geofence);
    /// Wall-clock window bounds without offset are read in the geofence's timezone.
    static Geofence jsonToGeofence(const nlohmann::json& json);

    static nlohmann::json geofenceEventToJson(const GeofenceEvent& event);

    static nlohmann::json engineEventToJson(const EngineEvent& event);
};

} // namespace geotrack
