#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace geotrack {

enum class PrivacyStrategy {
    RandomOffset,
    GridSnap
};

struct MqttBroadcastConfig {
    std::string host;                         ///< Broker hostname; empty disables broadcasting
    uint16_t port = 1883;
    bool useTls = false;
    std::string clientId = "geotrack-engine";
    std::string username;
    std::string password;
    std::string topicPrefix = "geotrack";
    std::string caPath;

    bool enabled() const { return !host.empty(); }
};

/**
 * @brief Runtime parameters of the tracking engine
 *
 * Defaults match production behaviour: 5 minute current-location TTL,
 * 1 hour session snapshot TTL, batches of at most 100 samples.
 */
struct EngineConfig {
    std::chrono::seconds currentLocationTtl{300};
    std::chrono::seconds sessionSnapshotTtl{3600};
    std::size_t maxBatchSize = 100;

    std::chrono::milliseconds storageTimeout{2000};
    std::chrono::milliseconds cacheTimeout{250};

    std::chrono::hours staleSessionThreshold{24};

    PrivacyStrategy privacyStrategy = PrivacyStrategy::RandomOffset;
    std::optional<uint64_t> rngSeed;          ///< Fixed seed for reproducible generalization

    double lowAccuracyWarningM = 100.0;

    MqttBroadcastConfig mqtt;
};

inline std::string privacyStrategyToString(PrivacyStrategy strategy) {
    return strategy == PrivacyStrategy::GridSnap ? "grid_snap" : "random_offset";
}

inline std::optional<PrivacyStrategy> stringToPrivacyStrategy(const std::string& str) {
    if (str == "random_offset") return PrivacyStrategy::RandomOffset;
    if (str == "grid_snap") return PrivacyStrategy::GridSnap;
    return std::nullopt;
}

} // namespace geotrack
