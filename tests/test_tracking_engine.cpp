#include <gtest/gtest.h>
#include "../core/domain/TrackingEngine.hpp"
#include "../core/adapters/InMemoryTrackingStore.hpp"
#include "../core/adapters/InMemoryCache.hpp"
#include "../core/adapters/QueueEventChannel.hpp"
#include "../core/sim/RecordingNotificationSink.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include "../core/Errors.hpp"
#include "../core/Geo.hpp"
#include <memory>

using namespace geotrack;

namespace {

const Coordinates kPickup{51.5074, -0.1278};

} // namespace

class TrackingEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        store_ = std::make_shared<adapters::InMemoryTrackingStore>();
        cache_ = std::make_shared<adapters::InMemoryCache>(clock_);
        sink_ = std::make_shared<sim::RecordingNotificationSink>();
        channel_ = std::make_shared<adapters::QueueEventChannel>();

        EngineConfig config;
        config.rngSeed = 99;
        engine_ = std::make_unique<domain::TrackingEngine>(
            config, store_, cache_, clock_, std::make_shared<StandardRng>(99), sink_, channel_);
    }

    LocationSample sampleAt(const Coordinates& where, int64_t seconds, std::optional<double> speedMps = std::nullopt) {
        LocationSample sample;
        sample.coordinates = where;
        sample.speedMps = speedMps;
        sample.timestamp = clock_->now() + std::chrono::seconds(seconds);
        return sample;
    }

    static std::vector<EngineEventType> typesOf(const std::vector<EngineEvent>& events) {
        std::vector<EngineEventType> types;
        for (const auto& event : events) {
            types.push_back(event.type);
        }
        return types;
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<adapters::InMemoryTrackingStore> store_;
    std::shared_ptr<adapters::InMemoryCache> cache_;
    std::shared_ptr<sim::RecordingNotificationSink> sink_;
    std::shared_ptr<adapters::QueueEventChannel> channel_;
    std::unique_ptr<domain::TrackingEngine> engine_;
};

TEST_F(TrackingEngineTest, LifecycleEmitsEvents) {
    auto started = engine_->startTracking("trip-1", "courier-1");
    ASSERT_EQ(started.events.size(), 1u);
    EXPECT_EQ(started.events[0].type, EngineEventType::TrackingStarted);
    EXPECT_EQ(started.events[0].payload["sessionId"], started.session.id);

    auto paused = engine_->pauseTracking("trip-1");
    EXPECT_EQ(paused.events[0].type, EngineEventType::TrackingPaused);
    auto resumed = engine_->resumeTracking("trip-1");
    EXPECT_EQ(resumed.events[0].type, EngineEventType::TrackingResumed);

    auto stopped = engine_->stopTracking("trip-1", std::string("shift_over"));
    ASSERT_EQ(stopped.events.size(), 1u);
    EXPECT_EQ(stopped.events[0].type, EngineEventType::TrackingStopped);
    EXPECT_EQ(stopped.events[0].payload["status"], "stopped");
    EXPECT_TRUE(stopped.events[0].payload.contains("summary"));

    EXPECT_EQ(channel_->size(), 4u);
}

TEST_F(TrackingEngineTest, IngestionBroadcastsLocationAndGeofenceEvents) {
    engine_->startTracking("trip-1", "courier-1");
    engine_->geofences().createDeliveryGeofences("trip-1", kPickup, std::nullopt);
    channel_->drain();

    auto response = engine_->ingestLocation("trip-1", "courier-1", sampleAt(kPickup, 0));

    std::vector<EngineEventType> expected = {EngineEventType::LocationUpdated, EngineEventType::GeofenceTriggered};
    EXPECT_EQ(typesOf(response.events), expected);
    EXPECT_EQ(response.events[1].payload["kind"], "enter");

    const auto& embedded = response.events[0].payload["events"];
    ASSERT_EQ(embedded.size(), 1u);
    EXPECT_EQ(embedded[0]["kind"], "enter");
    EXPECT_EQ(embedded[0]["id"], response.events[1].payload["id"]);

    auto again = engine_->ingestLocation("trip-1", "courier-1", sampleAt(kPickup, 10));
    EXPECT_TRUE(again.events[0].payload["events"].is_array());
    EXPECT_TRUE(again.events[0].payload["events"].empty());

    int geofenceEvents = 0;
    channel_->subscribe(EngineEventType::GeofenceTriggered, [&](const EngineEvent&) { ++geofenceEvents; });
    EXPECT_EQ(channel_->processEvents(), 2u);
    EXPECT_EQ(geofenceEvents, 1);

    ASSERT_EQ(sink_->notifications().size(), 1u);
    EXPECT_EQ(sink_->notifications()[0].geofence.name, "Pickup - trip-1");
}

TEST_F(TrackingEngineTest, BatchEmitsSingleSummaryEvent) {
    engine_->startTracking("trip-1", "courier-1");
    auto response = engine_->ingestLocationBatch("trip-1", "courier-1", {
        sampleAt(kPickup, 0),
        sampleAt(Geo::destination(kPickup, 90.0, 300.0), 30),
    });

    ASSERT_EQ(response.events.size(), 1u);
    EXPECT_EQ(response.events[0].type, EngineEventType::BatchLocationsUpdated);
    EXPECT_EQ(response.events[0].payload["successful"], 2);
}

TEST_F(TrackingEngineTest, CurrentLocationFallsBackToStorage) {
    engine_->startTracking("trip-1", "courier-1");
    engine_->ingestLocation("trip-1", "courier-1", sampleAt(kPickup, 0));

    auto cached = engine_->getCurrentLocation("trip-1");
    ASSERT_TRUE(cached.has_value());
    EXPECT_DOUBLE_EQ(cached->coordinates.lat, kPickup.lat);

    cache_->simulateOutage(true);
    auto fromStore = engine_->getCurrentLocation("trip-1", std::string("courier-1"));
    ASSERT_TRUE(fromStore.has_value());
    EXPECT_DOUBLE_EQ(fromStore->coordinates.lon, kPickup.lon);
}

TEST_F(TrackingEngineTest, CurrentLocationRespectsPrivacyLevel) {
    PrivacySettings privacy;
    privacy.trackingLevel = TrackingLevel::Minimal;
    engine_->startTracking("trip-1", "courier-1", TrackingSettings{}, privacy);
    engine_->ingestLocation("trip-1", "courier-1", sampleAt(kPickup, 0, 10.0));

    auto location = engine_->getCurrentLocation("trip-1");
    ASSERT_TRUE(location.has_value());
    EXPECT_FALSE(location->speedMps.has_value());
    EXPECT_LE(Geo::distanceMeters(location->coordinates, kPickup), 5000.0);
}

TEST_F(TrackingEngineTest, CurrentLocationForUnknownTrip) {
    try {
        engine_->getCurrentLocation("nope");
        FAIL() << "expected SessionNotFound";
    } catch (const TrackingError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SessionNotFound);
    }

    engine_->startTracking("trip-1", "courier-1");
    EXPECT_FALSE(engine_->getCurrentLocation("trip-1").has_value());
}

TEST_F(TrackingEngineTest, StopClearsCurrentLocation) {
    engine_->startTracking("trip-1", "courier-1");
    engine_->ingestLocation("trip-1", "courier-1", sampleAt(kPickup, 0));
    engine_->stopTracking("trip-1");

    EXPECT_FALSE(cache_->get(domain::CurrentLocationCache::tripKey("trip-1")).has_value());
    // Still answerable from storage
    EXPECT_TRUE(engine_->getCurrentLocation("trip-1").has_value());
}

TEST_F(TrackingEngineTest, HistorySummary) {
    engine_->startTracking("trip-1", "courier-1");
    const Coordinates second = Geo::destination(kPickup, 0.0, 1000.0);
    const Coordinates third = Geo::destination(second, 0.0, 1000.0);

    engine_->ingestLocation("trip-1", "courier-1", sampleAt(kPickup, 0, 10.0));
    engine_->ingestLocation("trip-1", "courier-1", sampleAt(third, 240, 20.0));
    engine_->ingestLocation("trip-1", "courier-1", sampleAt(second, 120, 30.0));

    auto history = engine_->getHistory("trip-1", Timestamp{}, Timestamp::max());
    ASSERT_EQ(history.samples.size(), 3u);
    EXPECT_EQ(history.samples[1].coordinates.lat, second.lat);

    EXPECT_EQ(history.summary.totalPoints, 3u);
    EXPECT_NEAR(history.summary.totalDistanceKm, 2.0, 0.001);
    EXPECT_DOUBLE_EQ(history.summary.durationMin, 4.0);
    EXPECT_NEAR(history.summary.averageSpeedKmh, 72.0, 1e-9);
    EXPECT_NEAR(history.summary.maxSpeedKmh, 108.0, 1e-9);

    auto window = engine_->getHistory("trip-1", clock_->now() + std::chrono::seconds(100), Timestamp::max());
    EXPECT_EQ(window.samples.size(), 2u);
}

TEST_F(TrackingEngineTest, SummaryOfShortRouteIsEmpty) {
    auto summary = domain::TrackingEngine::summarizeRoute({sampleAt(kPickup, 0, 5.0)});
    EXPECT_EQ(summary.totalPoints, 1u);
    EXPECT_DOUBLE_EQ(summary.totalDistanceKm, 0.0);
    EXPECT_DOUBLE_EQ(summary.averageSpeedKmh, 0.0);
}

TEST_F(TrackingEngineTest, SweepStopsStaleSessionsAndExpiresGeofences) {
    engine_->startTracking("trip-1", "courier-1");

    domain::GeofenceDraft draft;
    draft.name = "Lunch rush";
    draft.tripId = "trip-1";
    draft.geometry = Circle{kPickup, 200.0};
    draft.activeWindow.endAt = clock_->now() + std::chrono::hours(2);
    engine_->geofences().create(draft);

    clock_->advance(std::chrono::hours(25));
    EXPECT_EQ(engine_->stopStaleSessions(), 1u);
    EXPECT_EQ(engine_->expireGeofences(), 1u);
    EXPECT_EQ(engine_->sessions().get("trip-1")->status, SessionStatus::Stopped);
}
