#include <gtest/gtest.h>
#include "../core/domain/PrivacyFilter.hpp"
#include "../core/Geo.hpp"
#include "../core/IClock.hpp"
#include <memory>

using namespace geotrack;

class PrivacyFilterTest : public ::testing::Test {
protected:
    void SetUp() override {
        rng_ = std::make_shared<StandardRng>(42);
        filter_ = std::make_unique<domain::PrivacyFilter>(rng_, PrivacyStrategy::RandomOffset);

        sample_.id = "s1";
        sample_.tripId = "trip-1";
        sample_.userId = "courier-1";
        sample_.coordinates = {40.7128, -74.0060};
        sample_.accuracyM = 8.0;
        sample_.altitudeM = 12.0;
        sample_.bearingDeg = 270.0;
        sample_.speedMps = 6.5;
        sample_.batteryPct = 81.0;
        sample_.networkType = "4g";
        sample_.timestamp = parseIso8601("2024-03-01T10:17:42Z");
    }

    std::shared_ptr<StandardRng> rng_;
    std::unique_ptr<domain::PrivacyFilter> filter_;
    LocationSample sample_;
};

TEST_F(PrivacyFilterTest, PreciseLeavesSampleUntouched) {
    auto filtered = filter_->apply(sample_, TrackingLevel::Precise);

    EXPECT_DOUBLE_EQ(filtered.coordinates.lat, sample_.coordinates.lat);
    EXPECT_DOUBLE_EQ(filtered.coordinates.lon, sample_.coordinates.lon);
    EXPECT_EQ(filtered.timestamp, sample_.timestamp);
    EXPECT_EQ(filtered.bearingDeg, sample_.bearingDeg);
    EXPECT_EQ(filtered.networkType, sample_.networkType);
    EXPECT_EQ(filtered.accuracyM, sample_.accuracyM);
}

TEST_F(PrivacyFilterTest, ApproximateDropsDeviceDetailsAndBucketsTime) {
    auto filtered = filter_->apply(sample_, TrackingLevel::Approximate);

    EXPECT_LE(Geo::distanceMeters(filtered.coordinates, sample_.coordinates), 500.0);
    EXPECT_EQ(filtered.timestamp, parseIso8601("2024-03-01T10:15:00Z"));
    EXPECT_FALSE(filtered.bearingDeg.has_value());
    EXPECT_FALSE(filtered.batteryPct.has_value());
    EXPECT_FALSE(filtered.networkType.has_value());
    ASSERT_TRUE(filtered.accuracyM.has_value());
    EXPECT_DOUBLE_EQ(*filtered.accuracyM, 500.0);

    // Speed and altitude survive at this level
    EXPECT_EQ(filtered.speedMps, sample_.speedMps);
    EXPECT_EQ(filtered.altitudeM, sample_.altitudeM);
    EXPECT_EQ(filtered.id, sample_.id);
}

TEST_F(PrivacyFilterTest, MinimalAlsoDropsSpeedAndAltitude) {
    auto filtered = filter_->apply(sample_, TrackingLevel::Minimal);

    EXPECT_EQ(filtered.timestamp, parseIso8601("2024-03-01T10:00:00Z"));
    EXPECT_FALSE(filtered.speedMps.has_value());
    EXPECT_FALSE(filtered.altitudeM.has_value());
    EXPECT_FALSE(filtered.bearingDeg.has_value());
    EXPECT_DOUBLE_EQ(*filtered.accuracyM, 5000.0);
}

TEST_F(PrivacyFilterTest, WorseDeviceAccuracyIsKept) {
    sample_.accuracyM = 900.0;
    auto filtered = filter_->apply(sample_, TrackingLevel::Approximate);
    EXPECT_DOUBLE_EQ(*filtered.accuracyM, 900.0);
}

TEST_F(PrivacyFilterTest, MinimalOffsetNeverExceedsRadius) {
    double maxSeen = 0.0;
    for (int i = 0; i < 10000; ++i) {
        auto filtered = filter_->apply(sample_, TrackingLevel::Minimal);
        maxSeen = std::max(maxSeen, Geo::distanceMeters(filtered.coordinates, sample_.coordinates));
    }
    EXPECT_LE(maxSeen, 5000.0);
    EXPECT_GT(maxSeen, 0.0);
}

TEST_F(PrivacyFilterTest, SeededRandomOffsetIsReproducible) {
    domain::PrivacyFilter first(std::make_shared<StandardRng>(7));
    domain::PrivacyFilter second(std::make_shared<StandardRng>(7));

    auto a = first.generalize(sample_.coordinates, 500.0);
    auto b = second.generalize(sample_.coordinates, 500.0);
    EXPECT_DOUBLE_EQ(a.lat, b.lat);
    EXPECT_DOUBLE_EQ(a.lon, b.lon);
}

TEST_F(PrivacyFilterTest, GridSnapIsDeterministicAndBounded) {
    domain::PrivacyFilter grid(nullptr, PrivacyStrategy::GridSnap);

    auto a = grid.generalize(sample_.coordinates, 500.0);
    auto b = grid.generalize(sample_.coordinates, 500.0);
    EXPECT_DOUBLE_EQ(a.lat, b.lat);
    EXPECT_DOUBLE_EQ(a.lon, b.lon);

    // Snapped to a cell centre: at most half a cell diagonal away
    EXPECT_LE(Geo::distanceMeters(a, sample_.coordinates), 500.0);

    // Nearby points in the same cell share the snapped position
    Coordinates neighbour{sample_.coordinates.lat + 1e-7, sample_.coordinates.lon + 1e-7};
    auto c = grid.generalize(neighbour, 500.0);
    EXPECT_NEAR(c.lat, a.lat, 1e-6);
}

TEST_F(PrivacyFilterTest, RandomOffsetRequiresRandomSource) {
    EXPECT_THROW(domain::PrivacyFilter(nullptr, PrivacyStrategy::RandomOffset), std::invalid_argument);
}

TEST_F(PrivacyFilterTest, PolarLatitudeStaysInRange) {
    sample_.coordinates = {89.9999, 10.0};
    for (int i = 0; i < 200; ++i) {
        auto filtered = filter_->apply(sample_, TrackingLevel::Minimal);
        EXPECT_TRUE(Geo::isValid(filtered.coordinates));
    }
}

TEST(PrivacyBucketTest, RoundDownToBucket) {
    const Timestamp t = parseIso8601("2024-03-01T10:29:59Z");
    EXPECT_EQ(domain::PrivacyFilter::roundDown(t, std::chrono::minutes(5)), parseIso8601("2024-03-01T10:25:00Z"));
    EXPECT_EQ(domain::PrivacyFilter::roundDown(t, std::chrono::minutes(30)), parseIso8601("2024-03-01T10:00:00Z"));
    EXPECT_EQ(domain::PrivacyFilter::roundDown(t, std::chrono::minutes(0)), t);
}
