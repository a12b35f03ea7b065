#include "TrackingEngine.hpp"
#include "../Errors.hpp"
#include "../Geo.hpp"
#include "../JsonCodec.hpp"
#include <algorithm>
#include <iostream>

namespace geotrack::domain {

TrackingEngine::TrackingEngine(EngineConfig config,
                               std::shared_ptr<ports::ITrackingStore> store,
                               std::shared_ptr<ports::ICache> cache,
                               std::shared_ptr<IClock> clock,
                               std::shared_ptr<IRng> rng,
                               std::shared_ptr<ports::INotificationSink> notificationSink,
                               std::shared_ptr<ports::IEventPublisher> publisher)
    : config_(std::move(config)), store_(store), clock_(clock), publisher_(std::move(publisher)) {

    privacyFilter_ = std::make_shared<PrivacyFilter>(std::move(rng), config_.privacyStrategy);
    locationCache_ = std::make_shared<CurrentLocationCache>(cache, store, privacyFilter_,
                                                            config_.currentLocationTtl);
    sessions_ = std::make_shared<TrackingSessionManager>(store, cache, clock, config_.sessionSnapshotTtl);
    containment_ = std::make_shared<ContainmentStateStore>(store);
    evaluator_ = std::make_shared<GeofenceEvaluator>(store, containment_, std::move(notificationSink));
    geofenceManager_ = std::make_shared<GeofenceManager>(store, clock);
    pipeline_ = std::make_unique<LocationIngestionPipeline>(store, sessions_, privacyFilter_, locationCache_,
                                                            evaluator_, clock, config_.maxBatchSize,
                                                            config_.lowAccuracyWarningM);
}

EngineEvent TrackingEngine::makeEvent(EngineEventType type, const std::string& tripId,
                                      nlohmann::json payload) const {
    EngineEvent event;
    event.type = type;
    event.tripId = tripId;
    event.payload = std::move(payload);
    event.emittedAt = clock_->now();
    return event;
}

std::vector<EngineEvent> TrackingEngine::geofenceEvents(const std::vector<GeofenceEvent>& events) const {
    std::vector<EngineEvent> result;
    result.reserve(events.size());
    for (const auto& event : events) {
        result.push_back(makeEvent(EngineEventType::GeofenceTriggered, event.tripId,
                                   JsonCodec::geofenceEventToJson(event)));
    }
    return result;
}

void TrackingEngine::broadcast(const std::vector<EngineEvent>& events) {
    if (!publisher_) {
        return;
    }
    for (const auto& event : events) {
        try {
            publisher_->publish(event);
        } catch (const std::exception& e) {
            std::cerr << "[Engine] Broadcast of " << engineEventTypeToString(event.type)
                      << " failed: " << e.what() << std::endl;
        }
    }
}

SessionResponse TrackingEngine::startTracking(const std::string& tripId, const std::string& userId,
                                              const TrackingSettings& settings,
                                              const PrivacySettings& privacySettings) {
    SessionResponse response;
    response.session = sessions_->start(tripId, userId, settings, privacySettings);

    nlohmann::json payload;
    payload["tripId"] = tripId;
    payload["userId"] = response.session.userId;
    payload["sessionId"] = response.session.id;
    payload["settings"] = JsonCodec::settingsToJson(response.session.settings);
    response.events.push_back(makeEvent(EngineEventType::TrackingStarted, tripId, payload));

    broadcast(response.events);
    return response;
}

IngestResponse TrackingEngine::ingestLocation(const std::string& tripId, const std::string& userId,
                                              const LocationSample& sample) {
    IngestResponse response;
    response.result = pipeline_->ingestOne(tripId, userId, sample);

    const auto& result = response.result;
    nlohmann::json payload;
    payload["tripId"] = tripId;
    payload["userId"] = userId;
    payload["sampleId"] = result.sampleId;
    payload["location"] = JsonCodec::sampleToJson(result.filteredSample);
    payload["distanceDeltaKm"] = result.distanceDeltaKm;
    if (result.speedKmh) {
        payload["speedKmh"] = *result.speedKmh;
    }
    payload["totalDistanceKm"] = result.totalDistanceKm;
    payload["events"] = nlohmann::json::array();
    for (const auto& event : result.events) {
        payload["events"].push_back(JsonCodec::geofenceEventToJson(event));
    }
    response.events.push_back(makeEvent(EngineEventType::LocationUpdated, tripId, payload));

    for (auto& event : geofenceEvents(result.events)) {
        response.events.push_back(std::move(event));
    }

    broadcast(response.events);
    return response;
}

BatchResponse TrackingEngine::ingestLocationBatch(const std::string& tripId, const std::string& userId,
                                                  const std::vector<LocationSample>& samples) {
    BatchResponse response;
    response.result = pipeline_->ingestBatch(tripId, userId, samples);

    const auto& result = response.result;
    if (result.successful == 0) {
        return response;
    }

    nlohmann::json payload;
    payload["tripId"] = tripId;
    payload["userId"] = userId;
    payload["processed"] = result.processed;
    payload["successful"] = result.successful;
    payload["failed"] = result.failed;
    payload["distanceKm"] = result.distanceKm;
    payload["totalDistanceKm"] = result.totalDistanceKm;
    if (result.latestFiltered) {
        payload["location"] = JsonCodec::sampleToJson(*result.latestFiltered);
    }
    response.events.push_back(makeEvent(EngineEventType::BatchLocationsUpdated, tripId, payload));

    for (auto& event : geofenceEvents(result.events)) {
        response.events.push_back(std::move(event));
    }

    broadcast(response.events);
    return response;
}

SessionResponse TrackingEngine::stopTracking(const std::string& tripId, const std::optional<std::string>& reason) {
    SessionResponse response;
    response.session = sessions_->stop(tripId, reason);
    locationCache_->clear(tripId, response.session.userId);

    nlohmann::json payload;
    payload["tripId"] = tripId;
    payload["status"] = sessionStatusToString(response.session.status);
    payload["summary"] = JsonCodec::sessionSummaryToJson(response.session);
    response.events.push_back(makeEvent(EngineEventType::TrackingStopped, tripId, payload));

    broadcast(response.events);
    return response;
}

SessionResponse TrackingEngine::completeTracking(const std::string& tripId) {
    SessionResponse response;
    response.session = sessions_->complete(tripId);
    locationCache_->clear(tripId, response.session.userId);

    nlohmann::json payload;
    payload["tripId"] = tripId;
    payload["status"] = sessionStatusToString(response.session.status);
    payload["summary"] = JsonCodec::sessionSummaryToJson(response.session);
    response.events.push_back(makeEvent(EngineEventType::TrackingStopped, tripId, payload));

    broadcast(response.events);
    return response;
}

SessionResponse TrackingEngine::pauseTracking(const std::string& tripId) {
    SessionResponse response;
    response.session = sessions_->pause(tripId);

    nlohmann::json payload;
    payload["tripId"] = tripId;
    payload["sessionId"] = response.session.id;
    response.events.push_back(makeEvent(EngineEventType::TrackingPaused, tripId, payload));

    broadcast(response.events);
    return response;
}

SessionResponse TrackingEngine::resumeTracking(const std::string& tripId) {
    SessionResponse response;
    response.session = sessions_->resume(tripId);

    nlohmann::json payload;
    payload["tripId"] = tripId;
    payload["sessionId"] = response.session.id;
    response.events.push_back(makeEvent(EngineEventType::TrackingResumed, tripId, payload));

    broadcast(response.events);
    return response;
}

std::optional<LocationSample> TrackingEngine::getCurrentLocation(const std::string& tripId,
                                                                 const std::optional<std::string>& userId) {
    auto session = sessions_->get(tripId);
    if (!session) {
        throw TrackingError(ErrorKind::SessionNotFound, "No tracking session for trip " + tripId);
    }
    return locationCache_->get(tripId, userId, session->privacySettings.trackingLevel);
}

TripHistory TrackingEngine::getHistory(const std::string& tripId, Timestamp from, Timestamp to) {
    TripHistory history;
    history.tripId = tripId;

    auto raw = store_->samplesInRange(tripId, from, to);
    history.summary = summarizeRoute(raw);

    auto session = sessions_->get(tripId);
    const TrackingLevel level = session ? session->privacySettings.trackingLevel : TrackingLevel::Precise;

    history.samples.reserve(raw.size());
    for (const auto& sample : raw) {
        history.samples.push_back(privacyFilter_->apply(sample, level));
    }
    return history;
}

RouteSummary TrackingEngine::summarizeRoute(const std::vector<LocationSample>& samples) {
    RouteSummary summary;
    summary.totalPoints = samples.size();
    if (samples.size() < 2) {
        return summary;
    }

    std::vector<Coordinates> route;
    route.reserve(samples.size());
    for (const auto& sample : samples) {
        route.push_back(sample.coordinates);
    }
    summary.totalDistanceKm = Geo::routeDistanceKm(route);

    const auto& first = samples.front().timestamp;
    const auto& last = samples.back().timestamp;
    if (first && last) {
        summary.durationMin = std::max(0.0, std::chrono::duration<double, std::ratio<60>>(*last - *first).count());
    }

    double speedSum = 0.0;
    std::size_t speedCount = 0;
    for (const auto& sample : samples) {
        if (!sample.speedMps) continue;
        const double kmh = *sample.speedMps * 3.6;
        speedSum += kmh;
        summary.maxSpeedKmh = std::max(summary.maxSpeedKmh, kmh);
        ++speedCount;
    }
    if (speedCount > 0) {
        summary.averageSpeedKmh = speedSum / static_cast<double>(speedCount);
    }

    return summary;
}

std::size_t TrackingEngine::stopStaleSessions() {
    return sessions_->stopStaleSessions(config_.staleSessionThreshold);
}

std::size_t TrackingEngine::expireGeofences() {
    return geofenceManager_->expire(clock_->now());
}

} // namespace geotrack::domain
