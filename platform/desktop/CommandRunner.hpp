#pragma once

#include "domain/TrackingEngine.hpp"
#include <nlohmann/json.hpp>
#include <istream>
#include <ostream>
#include <string>

namespace geotrack {

/**
 * @brief Executes JSON-lines commands against a TrackingEngine
 *
 * One command object per line, one response object per line:
 *   {"cmd":"start","tripId":"t1","userId":"u1","privacy":{"trackingLevel":"precise"}}
 *   {"cmd":"ingest","tripId":"t1","userId":"u1","sample":{"coordinates":{"lat":..,"lon":..}}}
 * Responses are {"ok":true,"result":...,"events":[...]} or
 * {"ok":false,"error":"<error kind>","message":"..."}.
 */
class CommandRunner {
public:
    explicit CommandRunner(domain::TrackingEngine& engine);

    nlohmann::json execute(const nlohmann::json& command);

    /// Parse and execute one line; malformed JSON yields an error response.
    nlohmann::json executeLine(const std::string& line);

    /// Run every non-empty line of @p input; returns the number of failed commands.
    std::size_t run(std::istream& input, std::ostream& output);

private:
    nlohmann::json dispatch(const std::string& cmd, const nlohmann::json& command, nlohmann::json& events);

    static nlohmann::json sessionResult(const TrackingSession& session);
    static nlohmann::json ingestResult(const domain::IngestResult& result);
    static nlohmann::json batchResult(const domain::BatchResult& result);
    static nlohmann::json historyResult(const domain::TripHistory& history);
    static nlohmann::json eventsToJson(const std::vector<EngineEvent>& events);
    static nlohmann::json errorResponse(const std::string& error, const std::string& message);

    domain::TrackingEngine& engine_;
};

} // namespace geotrack
