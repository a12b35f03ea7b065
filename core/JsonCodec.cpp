#include "JsonCodec.hpp"
#include "Errors.hpp"
#include "IClock.hpp"

namespace geotrack {

namespace {

template <typename T>
std::optional<T> optionalValue(const nlohmann::json& json, const char* key) {
    if (!json.contains(key) || json[key].is_null()) {
        return std::nullopt;
    }
    return json[key].get<T>();
}

template <typename T>
void putOptional(nlohmann::json& json, const char* key, const std::optional<T>& value) {
    if (value) {
        json[key] = *value;
    }
}

std::optional<Timestamp> optionalTimestamp(const nlohmann::json& json, const char* key,
                                           int defaultOffsetMinutes = 0) {
    if (!json.contains(key) || json[key].is_null()) {
        return std::nullopt;
    }
    return parseIso8601(json[key].get<std::string>(), defaultOffsetMinutes);
}

} // namespace

std::string JsonCodec::serialize(const LocationSample& sample) {
    return sampleToJson(sample).dump();
}

LocationSample JsonCodec::deserializeSample(const std::string& json) {
    return jsonToSample(nlohmann::json::parse(json));
}

nlohmann::json JsonCodec::coordinatesToJson(const Coordinates& coordinates) {
    nlohmann::json j;
    j["lat"] = coordinates.lat;
    j["lon"] = coordinates.lon;
    return j;
}

Coordinates JsonCodec::jsonToCoordinates(const nlohmann::json& json) {
    Coordinates coordinates;
    coordinates.lat = json.at("lat").get<double>();
    coordinates.lon = json.at("lon").get<double>();
    return coordinates;
}

nlohmann::json JsonCodec::sampleToJson(const LocationSample& sample) {
    nlohmann::json j;

    if (!sample.id.empty()) j["id"] = sample.id;
    if (!sample.tripId.empty()) j["tripId"] = sample.tripId;
    if (!sample.userId.empty()) j["userId"] = sample.userId;

    j["coordinates"] = coordinatesToJson(sample.coordinates);
    putOptional(j, "accuracy", sample.accuracyM);
    putOptional(j, "altitude", sample.altitudeM);
    putOptional(j, "bearing", sample.bearingDeg);
    putOptional(j, "speed", sample.speedMps);
    putOptional(j, "battery", sample.batteryPct);
    putOptional(j, "network", sample.networkType);

    if (sample.timestamp) {
        j["ts"] = formatIso8601(*sample.timestamp);
    }

    return j;
}

LocationSample JsonCodec::jsonToSample(const nlohmann::json& json) {
    LocationSample sample;

    sample.id = json.value("id", "");
    sample.tripId = json.value("tripId", "");
    sample.userId = json.value("userId", "");

    sample.coordinates = jsonToCoordinates(json.at("coordinates"));
    sample.accuracyM = optionalValue<double>(json, "accuracy");
    sample.altitudeM = optionalValue<double>(json, "altitude");
    sample.bearingDeg = optionalValue<double>(json, "bearing");
    sample.speedMps = optionalValue<double>(json, "speed");
    sample.batteryPct = optionalValue<double>(json, "battery");
    sample.networkType = optionalValue<std::string>(json, "network");
    sample.timestamp = optionalTimestamp(json, "ts");

    return sample;
}

nlohmann::json JsonCodec::settingsToJson(const TrackingSettings& settings) {
    nlohmann::json j;
    j["interval"] = settings.intervalSec;
    j["accuracy"] = settings.accuracyTier;
    j["batteryOptimization"] = settings.batteryOptimization;
    j["backgroundTracking"] = settings.backgroundTracking;
    return j;
}

TrackingSettings JsonCodec::jsonToSettings(const nlohmann::json& json) {
    TrackingSettings settings;
    settings.intervalSec = json.value("interval", 30);
    settings.accuracyTier = json.value("accuracy", "high");
    settings.batteryOptimization = json.value("batteryOptimization", true);
    settings.backgroundTracking = json.value("backgroundTracking", true);
    return settings;
}

nlohmann::json JsonCodec::privacyToJson(const PrivacySettings& privacy) {
    nlohmann::json j;
    j["trackingLevel"] = trackingLevelToString(privacy.trackingLevel);
    return j;
}

PrivacySettings JsonCodec::jsonToPrivacy(const nlohmann::json& json) {
    PrivacySettings privacy;
    privacy.trackingLevel = stringToTrackingLevel(json.value("trackingLevel", "precise"));
    return privacy;
}

nlohmann::json JsonCodec::sessionToJson(const TrackingSession& session) {
    nlohmann::json j;

    j["id"] = session.id;
    j["tripId"] = session.tripId;
    j["userId"] = session.userId;
    j["status"] = sessionStatusToString(session.status);
    j["startedAt"] = formatIso8601(session.startedAt);
    if (session.stoppedAt) {
        j["stoppedAt"] = formatIso8601(*session.stoppedAt);
    }
    j["lastUpdateAt"] = formatIso8601(session.lastUpdateAt);
    j["totalUpdates"] = session.totalUpdates;
    j["totalDistanceKm"] = session.totalDistanceKm;
    j["totalDurationMin"] = session.totalDurationMin;
    j["settings"] = settingsToJson(session.settings);
    j["privacySettings"] = privacyToJson(session.privacySettings);
    putOptional(j, "stopReason", session.stopReason);

    return j;
}

TrackingSession JsonCodec::jsonToSession(const nlohmann::json& json) {
    TrackingSession session;

    session.id = json.value("id", "");
    session.tripId = json.at("tripId").get<std::string>();
    session.userId = json.value("userId", "");
    session.status = stringToSessionStatus(json.value("status", "active"));
    session.startedAt = parseIso8601(json.at("startedAt").get<std::string>());
    session.stoppedAt = optionalTimestamp(json, "stoppedAt");
    session.lastUpdateAt = parseIso8601(json.at("lastUpdateAt").get<std::string>());
    session.totalUpdates = json.value("totalUpdates", 0ULL);
    session.totalDistanceKm = json.value("totalDistanceKm", 0.0);
    session.totalDurationMin = json.value("totalDurationMin", 0LL);

    if (json.contains("settings")) {
        session.settings = jsonToSettings(json["settings"]);
    }
    if (json.contains("privacySettings")) {
        session.privacySettings = jsonToPrivacy(json["privacySettings"]);
    }
    session.stopReason = optionalValue<std::string>(json, "stopReason");

    return session;
}

nlohmann::json JsonCodec::sessionSummaryToJson(const TrackingSession& session) {
    nlohmann::json j;
    j["sessionId"] = session.id;
    j["totalUpdates"] = session.totalUpdates;
    j["totalDistanceKm"] = session.totalDistanceKm;
    j["totalDurationMin"] = session.totalDurationMin;
    j["startedAt"] = formatIso8601(session.startedAt);
    if (session.stoppedAt) {
        j["stoppedAt"] = formatIso8601(*session.stoppedAt);
    }
    putOptional(j, "reason", session.stopReason);
    return j;
}

nlohmann::json JsonCodec::geometryToJson(const GeofenceGeometry& geometry) {
    nlohmann::json j;

    if (const auto* circle = std::get_if<Circle>(&geometry)) {
        j["type"] = "circle";
        j["center"] = coordinatesToJson(circle->center);
        j["radius"] = circle->radiusM;
    } else {
        const auto& polygon = std::get<Polygon>(geometry);
        j["type"] = "polygon";
        nlohmann::json ring = nlohmann::json::array();
        for (const auto& vertex : polygon.ring) {
            ring.push_back(coordinatesToJson(vertex));
        }
        j["ring"] = ring;
    }

    return j;
}

GeofenceGeometry JsonCodec::jsonToGeometry(const nlohmann::json& json) {
    const std::string type = json.value("type", "");

    if (type == "circle") {
        if (!json.contains("center") || !json.contains("radius")) {
            throw TrackingError(ErrorKind::GeofenceGeometryError,
                                "Circle geometry requires center and radius");
        }
        Circle circle;
        circle.center = jsonToCoordinates(json["center"]);
        circle.radiusM = json["radius"].get<double>();
        return circle;
    }

    if (type == "polygon") {
        if (!json.contains("ring") || !json["ring"].is_array()) {
            throw TrackingError(ErrorKind::GeofenceGeometryError,
                                "Polygon geometry requires a ring array");
        }
        Polygon polygon;
        for (const auto& vertex : json["ring"]) {
            polygon.ring.push_back(jsonToCoordinates(vertex));
        }
        return polygon;
    }

    throw TrackingError(ErrorKind::GeofenceGeometryError, "Unsupported geometry type: " + type);
}

nlohmann::json JsonCodec::geofenceToJson(const Geofence& geofence) {
    nlohmann::json j;

    j["id"] = geofence.id;
    j["name"] = geofence.name;
    putOptional(j, "tripId", geofence.tripId);
    j["kind"] = geofenceKindToString(geofence.kind);
    j["geometry"] = geometryToJson(geofence.geometry);

    const auto& policy = geofence.notificationPolicy;
    j["notifications"] = {
        {"onEntry", policy.onEntry},
        {"onExit", policy.onExit},
        {"onDwell", {{"enabled", policy.onDwell.enabled}, {"duration", policy.onDwell.durationSec}}}
    };

    nlohmann::json schedule;
    schedule["timezone"] = geofence.activeWindow.timezone;
    if (geofence.activeWindow.startAt) {
        schedule["startAt"] = formatIso8601(*geofence.activeWindow.startAt);
    }
    if (geofence.activeWindow.endAt) {
        schedule["endAt"] = formatIso8601(*geofence.activeWindow.endAt);
    }
    j["schedule"] = schedule;

    j["active"] = geofence.active;
    j["createdAt"] = formatIso8601(geofence.createdAt);
    return j;
}

Geofence JsonCodec::jsonToGeofence(const nlohmann::json& json) {
    Geofence geofence;

    geofence.id = json.value("id", "");
    geofence.name = json.value("name", "");
    geofence.tripId = optionalValue<std::string>(json, "tripId");
    geofence.kind = stringToGeofenceKind(json.value("kind", "delivery"));

    if (!json.contains("geometry")) {
        throw TrackingError(ErrorKind::GeofenceGeometryError, "Geometry is required");
    }
    geofence.geometry = jsonToGeometry(json["geometry"]);

    if (json.contains("notifications")) {
        const auto& n = json["notifications"];
        geofence.notificationPolicy.onEntry = n.value("onEntry", false);
        geofence.notificationPolicy.onExit = n.value("onExit", false);
        if (n.contains("onDwell")) {
            geofence.notificationPolicy.onDwell.enabled = n["onDwell"].value("enabled", false);
            geofence.notificationPolicy.onDwell.durationSec = n["onDwell"].value("duration", 300LL);
        }
    }

    if (json.contains("schedule")) {
        const auto& s = json["schedule"];
        geofence.activeWindow.timezone = s.value("timezone", "UTC");

        auto offset = parseUtcOffsetMinutes(geofence.activeWindow.timezone);
        if (!offset) {
            throw TrackingError(ErrorKind::InvalidSchedule,
                                "Unsupported timezone: " + geofence.activeWindow.timezone);
        }

        try {
            geofence.activeWindow.startAt = optionalTimestamp(s, "startAt", *offset);
            geofence.activeWindow.endAt = optionalTimestamp(s, "endAt", *offset);
        } catch (const std::invalid_argument& e) {
            throw TrackingError(ErrorKind::InvalidSchedule, e.what());
        }
    }

    geofence.active = json.value("active", true);
    if (auto createdAt = optionalTimestamp(json, "createdAt")) {
        geofence.createdAt = *createdAt;
    }

    return geofence;
}

nlohmann::json JsonCodec::geofenceEventToJson(const GeofenceEvent& event) {
    nlohmann::json j;
    j["id"] = event.id;
    j["geofenceId"] = event.geofenceId;
    j["userId"] = event.userId;
    j["tripId"] = event.tripId;
    j["kind"] = geofenceEventKindToString(event.kind);
    j["coordinates"] = coordinatesToJson(event.coordinates);
    putOptional(j, "dwellSeconds", event.dwellSeconds);
    j["triggeredAt"] = formatIso8601(event.triggeredAt);
    return j;
}

nlohmann::json JsonCodec::engineEventToJson(const EngineEvent& event) {
    nlohmann::json j;
    j["type"] = engineEventTypeToString(event.type);
    j["tripId"] = event.tripId;
    j["ts"] = formatIso8601(event.emittedAt);
    j["data"] = event.payload;
    return j;
}

} // namespace geotrack
