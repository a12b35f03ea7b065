#include "CommandRunner.hpp"
#include "Errors.hpp"
#include "IClock.hpp"
#include "JsonCodec.hpp"
#include <iostream>

namespace geotrack {

CommandRunner::CommandRunner(domain::TrackingEngine& engine) : engine_(engine) {}

nlohmann::json CommandRunner::errorResponse(const std::string& error, const std::string& message) {
    return {{"ok", false}, {"error", error}, {"message", message}};
}

nlohmann::json CommandRunner::eventsToJson(const std::vector<EngineEvent>& events) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& event : events) {
        array.push_back(JsonCodec::engineEventToJson(event));
    }
    return array;
}

nlohmann::json CommandRunner::sessionResult(const TrackingSession& session) {
    return JsonCodec::sessionToJson(session);
}

nlohmann::json CommandRunner::ingestResult(const domain::IngestResult& result) {
    nlohmann::json j;
    j["sampleId"] = result.sampleId;
    j["location"] = JsonCodec::sampleToJson(result.filteredSample);
    j["distanceDeltaKm"] = result.distanceDeltaKm;
    if (result.speedKmh) {
        j["speedKmh"] = *result.speedKmh;
    }
    j["totalDistanceKm"] = result.totalDistanceKm;
    j["latest"] = result.latest;
    if (result.geofenceError) {
        j["geofenceError"] = errorKindToString(*result.geofenceError);
    }
    return j;
}

nlohmann::json CommandRunner::batchResult(const domain::BatchResult& result) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& item : result.items) {
        nlohmann::json entry;
        entry["index"] = item.index;
        entry["success"] = item.success;
        if (item.sampleId) {
            entry["sampleId"] = *item.sampleId;
        }
        if (item.error) {
            entry["error"] = errorKindToString(*item.error);
            entry["message"] = item.errorMessage;
            entry["input"] = JsonCodec::sampleToJson(item.input);
        }
        items.push_back(entry);
    }

    nlohmann::json j;
    j["items"] = items;
    j["processed"] = result.processed;
    j["successful"] = result.successful;
    j["failed"] = result.failed;
    j["distanceKm"] = result.distanceKm;
    j["totalDistanceKm"] = result.totalDistanceKm;
    if (result.geofenceError) {
        j["geofenceError"] = errorKindToString(*result.geofenceError);
    }
    return j;
}

nlohmann::json CommandRunner::historyResult(const domain::TripHistory& history) {
    nlohmann::json locations = nlohmann::json::array();
    for (const auto& sample : history.samples) {
        locations.push_back(JsonCodec::sampleToJson(sample));
    }

    nlohmann::json j;
    j["tripId"] = history.tripId;
    j["locations"] = locations;
    j["summary"] = {
        {"totalPoints", history.summary.totalPoints},
        {"totalDistanceKm", history.summary.totalDistanceKm},
        {"durationMin", history.summary.durationMin},
        {"averageSpeedKmh", history.summary.averageSpeedKmh},
        {"maxSpeedKmh", history.summary.maxSpeedKmh}
    };
    return j;
}

nlohmann::json CommandRunner::dispatch(const std::string& cmd, const nlohmann::json& command, nlohmann::json& events) {
    if (cmd == "start") {
        TrackingSettings settings;
        PrivacySettings privacy;
        if (command.contains("settings")) settings = JsonCodec::jsonToSettings(command["settings"]);
        if (command.contains("privacy")) privacy = JsonCodec::jsonToPrivacy(command["privacy"]);

        auto response = engine_.startTracking(command.at("tripId").get<std::string>(),
                                              command.at("userId").get<std::string>(), settings, privacy);
        events = eventsToJson(response.events);
        return sessionResult(response.session);
    }

    if (cmd == "ingest") {
        auto response = engine_.ingestLocation(command.at("tripId").get<std::string>(),
                                               command.at("userId").get<std::string>(),
                                               JsonCodec::jsonToSample(command.at("sample")));
        events = eventsToJson(response.events);
        return ingestResult(response.result);
    }

    if (cmd == "batch") {
        std::vector<LocationSample> samples;
        for (const auto& entry : command.at("samples")) {
            samples.push_back(JsonCodec::jsonToSample(entry));
        }
        auto response = engine_.ingestLocationBatch(command.at("tripId").get<std::string>(),
                                                    command.at("userId").get<std::string>(), samples);
        events = eventsToJson(response.events);
        return batchResult(response.result);
    }

    if (cmd == "stop" || cmd == "pause" || cmd == "resume" || cmd == "complete") {
        const std::string tripId = command.at("tripId").get<std::string>();
        domain::SessionResponse response;
        if (cmd == "stop") {
            std::optional<std::string> reason;
            if (command.contains("reason")) reason = command["reason"].get<std::string>();
            response = engine_.stopTracking(tripId, reason);
        } else if (cmd == "pause") {
            response = engine_.pauseTracking(tripId);
        } else if (cmd == "resume") {
            response = engine_.resumeTracking(tripId);
        } else {
            response = engine_.completeTracking(tripId);
        }
        events = eventsToJson(response.events);
        return sessionResult(response.session);
    }

    if (cmd == "geofence") {
        Geofence parsed = JsonCodec::jsonToGeofence(command.at("geofence"));
        domain::GeofenceDraft draft;
        draft.name = parsed.name;
        draft.tripId = parsed.tripId;
        draft.kind = parsed.kind;
        draft.geometry = parsed.geometry;
        draft.notificationPolicy = parsed.notificationPolicy;
        draft.activeWindow = parsed.activeWindow;
        draft.active = parsed.active;
        return JsonCodec::geofenceToJson(engine_.geofences().create(draft));
    }

    if (cmd == "delivery_geofences") {
        std::optional<Coordinates> pickup;
        std::optional<Coordinates> dropoff;
        if (command.contains("pickup")) pickup = JsonCodec::jsonToCoordinates(command["pickup"]);
        if (command.contains("dropoff")) dropoff = JsonCodec::jsonToCoordinates(command["dropoff"]);

        auto created = engine_.geofences().createDeliveryGeofences(
            command.at("tripId").get<std::string>(), pickup, dropoff,
            command.value("radius", domain::GeofenceManager::DEFAULT_DELIVERY_RADIUS_METERS));

        nlohmann::json result = nlohmann::json::array();
        for (const auto& geofence : created) {
            result.push_back(JsonCodec::geofenceToJson(geofence));
        }
        return result;
    }

    if (cmd == "current") {
        std::optional<std::string> userId;
        if (command.contains("userId")) userId = command["userId"].get<std::string>();
        auto location = engine_.getCurrentLocation(command.at("tripId").get<std::string>(), userId);
        return location ? JsonCodec::sampleToJson(*location) : nlohmann::json(nullptr);
    }

    if (cmd == "history") {
        const Timestamp from = command.contains("from")
            ? parseIso8601(command["from"].get<std::string>()) : Timestamp{};
        const Timestamp to = command.contains("to")
            ? parseIso8601(command["to"].get<std::string>()) : Timestamp::max();
        return historyResult(engine_.getHistory(command.at("tripId").get<std::string>(), from, to));
    }

    if (cmd == "inspect") {
        std::vector<std::string> ids = command.at("geofenceIds").get<std::vector<std::string>>();
        auto inspections = engine_.evaluator().inspect(JsonCodec::jsonToCoordinates(command.at("point")), ids);

        nlohmann::json result = nlohmann::json::array();
        for (const auto& inspection : inspections) {
            result.push_back({{"geofenceId", inspection.geofenceId},
                              {"isInside", inspection.isInside},
                              {"distanceM", inspection.distanceM}});
        }
        return result;
    }

    if (cmd == "sweep") {
        return {{"staleSessionsStopped", engine_.stopStaleSessions()},
                {"geofencesExpired", engine_.expireGeofences()}};
    }

    throw std::invalid_argument("Unknown command: " + cmd);
}

nlohmann::json CommandRunner::execute(const nlohmann::json& command) {
    if (!command.is_object() || !command.contains("cmd") || !command["cmd"].is_string()) {
        return errorResponse("bad_request", "Command must be an object with a \"cmd\" string");
    }

    const std::string cmd = command["cmd"].get<std::string>();
    try {
        nlohmann::json events = nlohmann::json::array();
        nlohmann::json result = dispatch(cmd, command, events);
        return {{"ok", true}, {"cmd", cmd}, {"result", result}, {"events", events}};
    } catch (const TrackingError& e) {
        return errorResponse(errorKindToString(e.kind()), e.what());
    } catch (const nlohmann::json::exception& e) {
        return errorResponse("bad_request", e.what());
    } catch (const std::invalid_argument& e) {
        return errorResponse("bad_request", e.what());
    }
}

nlohmann::json CommandRunner::executeLine(const std::string& line) {
    nlohmann::json command;
    try {
        command = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        return errorResponse("bad_request", e.what());
    }
    return execute(command);
}

std::size_t CommandRunner::run(std::istream& input, std::ostream& output) {
    std::size_t failures = 0;
    std::string line;

    while (std::getline(input, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        auto response = executeLine(line);
        if (!response.value("ok", false)) {
            ++failures;
        }
        output << response.dump() << std::endl;
    }

    return failures;
}

} // namespace geotrack
