#include <gtest/gtest.h>
#include "../core/Geo.hpp"
#include "../crypto/Uuid.hpp"
#include <set>

using namespace geotrack;

namespace {

const Coordinates kNewYork{40.7128, -74.0060};
const Coordinates kBoston{42.3601, -71.0589};

std::vector<Coordinates> unitSquare() {
    return {{0.0, 0.0}, {0.0, 0.01}, {0.01, 0.01}, {0.01, 0.0}, {0.0, 0.0}};
}

} // namespace

TEST(GeoTest, HaversineNewYorkToBoston) {
    const double km = Geo::distanceKm(kNewYork, kBoston);
    EXPECT_NEAR(km, 306.0, 306.0 * 0.01);
}

TEST(GeoTest, DistanceIsSymmetricAndZeroForSamePoint) {
    EXPECT_DOUBLE_EQ(Geo::distanceMeters(kNewYork, kBoston), Geo::distanceMeters(kBoston, kNewYork));
    EXPECT_DOUBLE_EQ(Geo::distanceMeters(kNewYork, kNewYork), 0.0);
}

TEST(GeoTest, DestinationTravelsRequestedDistance) {
    const Coordinates end = Geo::destination(kNewYork, 90.0, 1000.0);
    EXPECT_NEAR(Geo::distanceMeters(kNewYork, end), 1000.0, 0.5);
    EXPECT_GT(end.lon, kNewYork.lon);
}

TEST(GeoTest, CircleBoundaryCountsAsInside) {
    const Coordinates edge = Geo::destination(kNewYork, 45.0, 100.0);
    const double radius = Geo::distanceMeters(kNewYork, edge);

    EXPECT_TRUE(Geo::isInsideCircle(edge, kNewYork, radius));
    EXPECT_FALSE(Geo::isInsideCircle(edge, kNewYork, radius - 0.01));
}

TEST(GeoTest, PolygonInteriorEdgeAndVertexAreInside) {
    const auto ring = unitSquare();

    EXPECT_TRUE(Geo::isInsidePolygon({0.005, 0.005}, ring));
    EXPECT_TRUE(Geo::isInsidePolygon({0.0, 0.005}, ring));
    EXPECT_TRUE(Geo::isInsidePolygon({0.01, 0.01}, ring));
    EXPECT_FALSE(Geo::isInsidePolygon({0.02, 0.005}, ring));
    EXPECT_FALSE(Geo::isInsidePolygon({-0.001, -0.001}, ring));
}

TEST(GeoTest, ClosestPointOnSegmentClampsToEndpoints) {
    const Coordinates a{0.0, 0.0};
    const Coordinates b{0.0, 0.01};

    auto middle = Geo::closestPointOnSegment({0.001, 0.005}, a, b);
    EXPECT_NEAR(middle.point.lon, 0.005, 1e-9);
    EXPECT_NEAR(middle.distanceMeters, Geo::distanceMeters({0.001, 0.005}, {0.0, 0.005}), 1.0);

    auto beyond = Geo::closestPointOnSegment({0.0, 0.02}, a, b);
    EXPECT_NEAR(beyond.point.lon, 0.01, 1e-9);
}

TEST(GeoTest, DistanceToRingUsesNearestEdge) {
    const double meters = Geo::distanceToRingMeters({0.005, 0.02}, unitSquare());
    EXPECT_NEAR(meters, Geo::distanceMeters({0.005, 0.02}, {0.005, 0.01}), 2.0);
}

TEST(GeoTest, RouteDistanceSumsLegs) {
    const Coordinates middle = Geo::destination(kNewYork, 0.0, 500.0);
    const Coordinates end = Geo::destination(middle, 0.0, 500.0);

    EXPECT_NEAR(Geo::routeDistanceKm({kNewYork, middle, end}), 1.0, 0.001);
    EXPECT_DOUBLE_EQ(Geo::routeDistanceKm({kNewYork}), 0.0);
    EXPECT_DOUBLE_EQ(Geo::routeDistanceKm({}), 0.0);
}

TEST(GeoTest, ValidityAndLongitudeNormalization) {
    EXPECT_TRUE(Geo::isValid({90.0, 180.0}));
    EXPECT_FALSE(Geo::isValid({95.0, 0.0}));
    EXPECT_FALSE(Geo::isValid({0.0, -181.0}));

    EXPECT_NEAR(Geo::normalizeLongitude(190.0), -170.0, 1e-9);
    EXPECT_NEAR(Geo::normalizeLongitude(-190.0), 170.0, 1e-9);
    EXPECT_NEAR(Geo::normalizeLongitude(45.0), 45.0, 1e-9);
}

TEST(UuidTest, GeneratesDistinctCanonicalV4) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        const std::string id = Uuid::generateV4();
        EXPECT_TRUE(Uuid::isCanonical(id)) << id;
        EXPECT_EQ(id[14], '4');
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 100u);

    EXPECT_FALSE(Uuid::isCanonical("not-a-uuid"));
}
