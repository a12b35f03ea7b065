#include <gtest/gtest.h>
#include "../core/JsonCodec.hpp"
#include "../core/Errors.hpp"
#include "../core/IClock.hpp"

using namespace geotrack;

TEST(JsonCodecTest, SampleOmitsAbsentFields) {
    LocationSample sample;
    sample.coordinates = {1.5, 2.5};
    sample.speedMps = 3.0;

    auto j = JsonCodec::sampleToJson(sample);
    EXPECT_DOUBLE_EQ(j["coordinates"]["lat"].get<double>(), 1.5);
    EXPECT_DOUBLE_EQ(j["speed"].get<double>(), 3.0);
    EXPECT_FALSE(j.contains("accuracy"));
    EXPECT_FALSE(j.contains("ts"));
    EXPECT_FALSE(j.contains("id"));
}

TEST(JsonCodecTest, SampleReadsWireFormat) {
    auto sample = JsonCodec::jsonToSample(nlohmann::json::parse(R"({
        "coordinates": {"lat": 40.0, "lon": -73.5},
        "accuracy": 12.5,
        "network": "wifi",
        "ts": "2024-05-01T08:30:00.250Z"
    })"));

    EXPECT_DOUBLE_EQ(sample.coordinates.lon, -73.5);
    EXPECT_EQ(sample.accuracyM, std::optional<double>(12.5));
    EXPECT_EQ(sample.networkType, std::optional<std::string>("wifi"));
    EXPECT_FALSE(sample.bearingDeg.has_value());
    ASSERT_TRUE(sample.timestamp.has_value());
    EXPECT_EQ(formatIso8601(*sample.timestamp), "2024-05-01T08:30:00.250Z");
}

TEST(JsonCodecTest, SampleWithoutCoordinatesIsRejected) {
    EXPECT_THROW(JsonCodec::jsonToSample(nlohmann::json::parse(R"({"accuracy": 3})")),
                 nlohmann::json::exception);
}

TEST(JsonCodecTest, SessionKeepsStateAcrossSnapshot) {
    TrackingSession session;
    session.id = "s-1";
    session.tripId = "trip-1";
    session.userId = "courier-1";
    session.status = SessionStatus::Paused;
    session.startedAt = parseIso8601("2024-05-01T08:00:00Z");
    session.lastUpdateAt = parseIso8601("2024-05-01T08:20:00Z");
    session.totalUpdates = 17;
    session.totalDistanceKm = 4.25;
    session.privacySettings.trackingLevel = TrackingLevel::Approximate;

    auto restored = JsonCodec::jsonToSession(JsonCodec::sessionToJson(session));
    EXPECT_EQ(restored.status, SessionStatus::Paused);
    EXPECT_EQ(restored.totalUpdates, 17u);
    EXPECT_DOUBLE_EQ(restored.totalDistanceKm, 4.25);
    EXPECT_EQ(restored.privacySettings.trackingLevel, TrackingLevel::Approximate);
    EXPECT_EQ(restored.lastUpdateAt, session.lastUpdateAt);
    EXPECT_FALSE(restored.stoppedAt.has_value());
}

TEST(JsonCodecTest, CircleAndPolygonGeometry) {
    auto circle = JsonCodec::jsonToGeometry(nlohmann::json::parse(
        R"({"type":"circle","center":{"lat":1.0,"lon":2.0},"radius":150})"));
    ASSERT_TRUE(std::holds_alternative<Circle>(circle));
    EXPECT_DOUBLE_EQ(std::get<Circle>(circle).radiusM, 150.0);

    auto polygon = JsonCodec::jsonToGeometry(nlohmann::json::parse(
        R"({"type":"polygon","ring":[{"lat":0,"lon":0},{"lat":0,"lon":1},{"lat":1,"lon":1},{"lat":0,"lon":0}]})"));
    ASSERT_TRUE(std::holds_alternative<Polygon>(polygon));
    EXPECT_EQ(std::get<Polygon>(polygon).ring.size(), 4u);

    try {
        JsonCodec::jsonToGeometry(nlohmann::json::parse(R"({"type":"hexagon"})"));
        FAIL() << "expected GeofenceGeometryError";
    } catch (const TrackingError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::GeofenceGeometryError);
    }
}

TEST(JsonCodecTest, ScheduleWallTimeUsesGeofenceTimezone) {
    auto geofence = JsonCodec::jsonToGeofence(nlohmann::json::parse(R"({
        "name": "Evening window",
        "geometry": {"type":"circle","center":{"lat":1.0,"lon":2.0},"radius":100},
        "schedule": {"timezone":"UTC+02:00","startAt":"2024-05-01T18:00:00","endAt":"2024-05-01T21:00:00Z"}
    })"));

    ASSERT_TRUE(geofence.activeWindow.startAt.has_value());
    EXPECT_EQ(formatIso8601(*geofence.activeWindow.startAt), "2024-05-01T16:00:00.000Z");
    EXPECT_EQ(formatIso8601(*geofence.activeWindow.endAt), "2024-05-01T21:00:00.000Z");
    EXPECT_TRUE(geofence.active);
}

TEST(JsonCodecTest, UnknownTimezoneIsInvalidSchedule) {
    const auto input = nlohmann::json::parse(R"({
        "geometry": {"type":"circle","center":{"lat":1.0,"lon":2.0},"radius":100},
        "schedule": {"timezone":"Atlantis/Central"}
    })");

    try {
        JsonCodec::jsonToGeofence(input);
        FAIL() << "expected InvalidSchedule";
    } catch (const TrackingError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidSchedule);
    }
}

TEST(JsonCodecTest, MalformedWindowIsInvalidSchedule) {
    const auto input = nlohmann::json::parse(R"({
        "geometry": {"type":"circle","center":{"lat":1.0,"lon":2.0},"radius":100},
        "schedule": {"timezone":"UTC","startAt":"tomorrow-ish"}
    })");

    try {
        JsonCodec::jsonToGeofence(input);
        FAIL() << "expected InvalidSchedule";
    } catch (const TrackingError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidSchedule);
    }
}

TEST(JsonCodecTest, EngineEventEnvelope) {
    EngineEvent event;
    event.type = EngineEventType::GeofenceTriggered;
    event.tripId = "trip-7";
    event.payload = {{"kind", "exit"}};
    event.emittedAt = parseIso8601("2024-05-01T08:00:00Z");

    auto j = JsonCodec::engineEventToJson(event);
    EXPECT_EQ(j["type"], "geofence_event");
    EXPECT_EQ(j["tripId"], "trip-7");
    EXPECT_EQ(j["ts"], "2024-05-01T08:00:00.000Z");
    EXPECT_EQ(j["data"]["kind"], "exit");
}

TEST(Iso8601Test, OffsetsAndErrors) {
    EXPECT_EQ(parseIso8601("2024-05-01T10:00:00+02:00"), parseIso8601("2024-05-01T08:00:00Z"));
    EXPECT_EQ(parseIso8601("2024-05-01T08:00:00", -60), parseIso8601("2024-05-01T09:00:00Z"));
    EXPECT_THROW(parseIso8601("2024-13-01T00:00:00Z"), std::invalid_argument);
    EXPECT_THROW(parseIso8601("yesterday"), std::invalid_argument);

    EXPECT_EQ(parseUtcOffsetMinutes("UTC"), std::optional<int>(0));
    EXPECT_EQ(parseUtcOffsetMinutes("UTC-05:30"), std::optional<int>(-330));
    EXPECT_EQ(parseUtcOffsetMinutes("+01:00"), std::optional<int>(60));
    EXPECT_FALSE(parseUtcOffsetMinutes("Europe/Paris").has_value());
}
