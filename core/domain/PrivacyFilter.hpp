#pragma once

#include "../Types.hpp"
#include "../IRng.hpp"
#include "../EngineConfig.hpp"
#include <chrono>
#include <memory>

namespace geotrack::domain {

/**
 * @brief Produces the externally visible form of a location sample
 *
 * - precise: unchanged
 * - approximate: position within 500 m, 5 minute time buckets, no bearing,
 *   battery or network type, accuracy at least 500 m
 * - minimal: position within 5000 m, 30 minute time buckets, no speed,
 *   bearing, altitude, battery or network type, accuracy at least 5000 m
 */
class PrivacyFilter {
public:
    PrivacyFilter(std::shared_ptr<IRng> rng, PrivacyStrategy strategy = PrivacyStrategy::RandomOffset);

    LocationSample apply(const LocationSample& sample, TrackingLevel level) const;

    /// Displaced point no farther than radiusMeters from the input.
    Coordinates generalize(const Coordinates& coordinates, double radiusMeters) const;

    PrivacyStrategy strategy() const { return strategy_; }

    static double radiusFor(TrackingLevel level);
    static std::chrono::minutes bucketFor(TrackingLevel level);
    static Timestamp roundDown(Timestamp time, std::chrono::minutes bucket);

    static constexpr double METERS_PER_DEGREE = 111320.0;

private:
    Coordinates randomOffset(const Coordinates& coordinates, double radiusMeters) const;
    Coordinates gridSnap(const Coordinates& coordinates, double radiusMeters) const;

    std::shared_ptr<IRng> rng_;
    PrivacyStrategy strategy_;
};

} // namespace geotrack::domain
