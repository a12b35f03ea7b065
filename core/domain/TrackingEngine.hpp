#pragma once

#include "../EngineConfig.hpp"
#include "../EngineEvent.hpp"
#include "../IClock.hpp"
#include "../IRng.hpp"
#include "../ports/ICache.hpp"
#include "../ports/IEventPublisher.hpp"
#include "../ports/INotificationSink.hpp"
#include "../ports/ITrackingStore.hpp"
#include "ContainmentStateStore.hpp"
#include "CurrentLocationCache.hpp"
#include "GeofenceEvaluator.hpp"
#include "GeofenceManager.hpp"
#include "LocationIngestionPipeline.hpp"
#include "PrivacyFilter.hpp"
#include "TrackingSessionManager.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace geotrack::domain {

struct RouteSummary {
    std::size_t totalPoints = 0;
    double totalDistanceKm = 0.0;
    double durationMin = 0.0;
    double averageSpeedKmh = 0.0;
    double maxSpeedKmh = 0.0;
};

struct TripHistory {
    std::string tripId;
    std::vector<LocationSample> samples;   ///< Ascending by timestamp, privacy filtered
    RouteSummary summary;
};

struct SessionResponse {
    TrackingSession session;
    std::vector<EngineEvent> events;
};

struct IngestResponse {
    IngestResult result;
    std::vector<EngineEvent> events;
};

struct BatchResponse {
    BatchResult result;
    std::vector<EngineEvent> events;
};

/**
 * @brief Public entry point of the tracking engine
 *
 * Wires the session manager, ingestion pipeline, privacy filter, location
 * cache and geofence components over the injected ports. Every operation
 * returns the engine events it produced; when a publisher is attached the
 * same events are also broadcast.
 */
class TrackingEngine {
public:
    TrackingEngine(EngineConfig config,
                   std::shared_ptr<ports::ITrackingStore> store,
                   std::shared_ptr<ports::ICache> cache,
                   std::shared_ptr<IClock> clock,
                   std::shared_ptr<IRng> rng,
                   std::shared_ptr<ports::INotificationSink> notificationSink = nullptr,
                   std::shared_ptr<ports::IEventPublisher> publisher = nullptr);

    SessionResponse startTracking(const std::string& tripId, const std::string& userId,
                                  const TrackingSettings& settings = {},
                                  const PrivacySettings& privacySettings = {});

    IngestResponse ingestLocation(const std::string& tripId, const std::string& userId,
                                  const LocationSample& sample);

    BatchResponse ingestLocationBatch(const std::string& tripId, const std::string& userId,
                                      const std::vector<LocationSample>& samples);

    SessionResponse stopTracking(const std::string& tripId, const std::optional<std::string>& reason = std::nullopt);
    SessionResponse pauseTracking(const std::string& tripId);
    SessionResponse resumeTracking(const std::string& tripId);
    SessionResponse completeTracking(const std::string& tripId);

    /**
     * @brief Latest privacy-filtered position of a trip or of one user on it
     * @throws TrackingError(SessionNotFound) for an unknown trip
     */
    std::optional<LocationSample> getCurrentLocation(const std::string& tripId,
                                                     const std::optional<std::string>& userId = std::nullopt);

    TripHistory getHistory(const std::string& tripId, Timestamp from, Timestamp to);

    std::size_t stopStaleSessions();
    std::size_t expireGeofences();

    static RouteSummary summarizeRoute(const std::vector<LocationSample>& samples);

    TrackingSessionManager& sessions() { return *sessions_; }
    GeofenceManager& geofences() { return *geofenceManager_; }
    GeofenceEvaluator& evaluator() { return *evaluator_; }
    const EngineConfig& config() const { return config_; }

private:
    EngineEvent makeEvent(EngineEventType type, const std::string& tripId, nlohmann::json payload) const;
    std::vector<EngineEvent> geofenceEvents(const std::vector<GeofenceEvent>& events) const;
    void broadcast(const std::vector<EngineEvent>& events);

    EngineConfig config_;
    std::shared_ptr<ports::ITrackingStore> store_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<ports::IEventPublisher> publisher_;

    std::shared_ptr<PrivacyFilter> privacyFilter_;
    std::shared_ptr<CurrentLocationCache> locationCache_;
    std::shared_ptr<TrackingSessionManager> sessions_;
    std::shared_ptr<ContainmentStateStore> containment_;
    std::shared_ptr<GeofenceEvaluator> evaluator_;
    std::shared_ptr<GeofenceManager> geofenceManager_;
    std::unique_ptr<LocationIngestionPipeline> pipeline_;
};

} // namespace geotrack::domain
