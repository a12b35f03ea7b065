#include "PrivacyFilter.hpp"
#include "../Geo.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace geotrack::domain {

namespace {

constexpr double kApproximateRadiusM = 500.0;
constexpr double kMinimalRadiusM = 5000.0;

// Below this cos(lat) longitude offsets are meaningless; only latitude moves.
constexpr double kPolarCosine = 1e-6;

Coordinates clampCoordinates(double lat, double lon) {
    return Coordinates{std::clamp(lat, -90.0, 90.0), Geo::normalizeLongitude(lon)};
}

} // namespace

PrivacyFilter::PrivacyFilter(std::shared_ptr<IRng> rng, PrivacyStrategy strategy)
    : rng_(std::move(rng)), strategy_(strategy) {
    if (!rng_ && strategy_ == PrivacyStrategy::RandomOffset) {
        throw std::invalid_argument("PrivacyFilter: random_offset requires a random source");
    }
}

double PrivacyFilter::radiusFor(TrackingLevel level) {
    switch (level) {
        case TrackingLevel::Approximate: return kApproximateRadiusM;
        case TrackingLevel::Minimal:     return kMinimalRadiusM;
        case TrackingLevel::Precise:     return 0.0;
    }
    return 0.0;
}

std::chrono::minutes PrivacyFilter::bucketFor(TrackingLevel level) {
    switch (level) {
        case TrackingLevel::Approximate: return std::chrono::minutes(5);
        case TrackingLevel::Minimal:     return std::chrono::minutes(30);
        case TrackingLevel::Precise:     return std::chrono::minutes(0);
    }
    return std::chrono::minutes(0);
}

Timestamp PrivacyFilter::roundDown(Timestamp time, std::chrono::minutes bucket) {
    if (bucket.count() <= 0) {
        return time;
    }
    const auto step = std::chrono::duration_cast<Timestamp::duration>(bucket);
    auto remainder = time.time_since_epoch() % step;
    if (remainder < Timestamp::duration::zero()) {
        remainder += step;
    }
    return time - remainder;
}

LocationSample PrivacyFilter::apply(const LocationSample& sample, TrackingLevel level) const {
    if (level == TrackingLevel::Precise) {
        return sample;
    }

    LocationSample filtered = sample;
    const double radius = radiusFor(level);

    filtered.coordinates = generalize(sample.coordinates, radius);
    if (sample.timestamp) {
        filtered.timestamp = roundDown(*sample.timestamp, bucketFor(level));
    }

    filtered.bearingDeg.reset();
    filtered.batteryPct.reset();
    filtered.networkType.reset();
    filtered.accuracyM = std::max(sample.accuracyM.value_or(0.0), radius);

    if (level == TrackingLevel::Minimal) {
        filtered.speedMps.reset();
        filtered.altitudeM.reset();
    }

    return filtered;
}

Coordinates PrivacyFilter::generalize(const Coordinates& coordinates, double radiusMeters) const {
    if (radiusMeters <= 0.0) {
        return coordinates;
    }
    return strategy_ == PrivacyStrategy::GridSnap
        ? gridSnap(coordinates, radiusMeters)
        : randomOffset(coordinates, radiusMeters);
}

Coordinates PrivacyFilter::randomOffset(const Coordinates& coordinates, double radiusMeters) const {
    const double angle = rng_->uniform(0.0, 2.0 * M_PI);
    const double distance = rng_->uniform(0.0, radiusMeters);

    const double latOffset = distance * std::cos(angle) / METERS_PER_DEGREE;

    double lonOffset = 0.0;
    const double cosLat = std::cos(Geo::toRadians(coordinates.lat));
    if (std::abs(cosLat) > kPolarCosine) {
        lonOffset = distance * std::sin(angle) / (METERS_PER_DEGREE * cosLat);
    }

    return clampCoordinates(coordinates.lat + latOffset, coordinates.lon + lonOffset);
}

Coordinates PrivacyFilter::gridSnap(const Coordinates& coordinates, double radiusMeters) const {
    const double latCell = radiusMeters / METERS_PER_DEGREE;
    const double lat = (std::floor(coordinates.lat / latCell) + 0.5) * latCell;

    // Longitude cells are sized at the snapped row so every point in the row shares one grid
    const double cosLat = std::cos(Geo::toRadians(std::clamp(lat, -90.0, 90.0)));
    if (std::abs(cosLat) <= kPolarCosine) {
        return clampCoordinates(lat, coordinates.lon);
    }
    const double lonCell = radiusMeters / (METERS_PER_DEGREE * cosLat);
    const double lon = (std::floor(coordinates.lon / lonCell) + 0.5) * lonCell;

    return clampCoordinates(lat, lon);
}

} // namespace geotrack::domain
