/**
 * @file TomlConfig.hpp
 * @brief TOML configuration file parser for the geotrack engine
 *
 * Supported Sections:
 * - [engine]: batch limit, cache TTLs, stale-session threshold
 * - [privacy]: generalization strategy and optional RNG seed
 * - [timeouts]: storage and cache call bounds
 * - [mqtt]: optional broker for engine event broadcast
 *
 * Environment variables override file values:
 * GEOTRACK_MAX_BATCH, GEOTRACK_PRIVACY_STRATEGY, GEOTRACK_RNG_SEED,
 * GEOTRACK_MQTT_HOST, GEOTRACK_MQTT_PORT.
 *
 * @note Simple line-based parser; no arrays or inline tables
 */

#pragma once

#include "EngineConfig.hpp"
#include <fstream>
#include <functional>
#include <iostream>
#include <istream>
#include <stdexcept>
#include <string>

namespace geotrack {

/**
 * @brief TOML configuration loader for EngineConfig
 *
 * Unknown sections and keys are ignored. Malformed values for known keys
 * throw std::invalid_argument naming the offending key.
 */
class TomlConfig {
public:
    using EnvLookup = std::function<std::string(const char*)>;

    /**
     * @brief Load configuration from a file
     * @return Parsed configuration, or defaults if the file cannot be opened
     * @throws std::invalid_argument on a malformed value
     */
    static EngineConfig loadFromFile(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            std::cerr << "[Config] Could not open config file: " << filename << ", using defaults" << std::endl;
            return EngineConfig{};
        }
        return parse(file);
    }

    static EngineConfig parse(std::istream& input) {
        EngineConfig config;
        std::string currentSection;
        std::string line;

        while (std::getline(input, line)) {
            // Remove comments and trim whitespace
            size_t commentPos = line.find('#');
            if (commentPos != std::string::npos) {
                line = line.substr(0, commentPos);
            }
            trim(line);

            if (line.empty()) {
                continue;
            }

            if (line[0] == '[') {
                if (line.back() == ']') {
                    currentSection = line.substr(1, line.length() - 2);
                    trim(currentSection);
                }
                continue;
            }

            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                continue;
            }

            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            trim(key);
            trim(value);
            unquote(value);

            applyValue(config, currentSection, key, value);
        }

        return config;
    }

    /**
     * @brief Apply GEOTRACK_* environment overrides
     * @throws std::invalid_argument on a malformed value
     */
    static void applyEnvironment(EngineConfig& config, const EnvLookup& getEnv) {
        std::string maxBatch = getEnv("GEOTRACK_MAX_BATCH");
        std::string strategy = getEnv("GEOTRACK_PRIVACY_STRATEGY");
        std::string seed = getEnv("GEOTRACK_RNG_SEED");
        std::string mqttHost = getEnv("GEOTRACK_MQTT_HOST");
        std::string mqttPort = getEnv("GEOTRACK_MQTT_PORT");

        if (!maxBatch.empty()) config.maxBatchSize = toSize("GEOTRACK_MAX_BATCH", maxBatch);
        if (!strategy.empty()) config.privacyStrategy = toStrategy("GEOTRACK_PRIVACY_STRATEGY", strategy);
        if (!seed.empty()) config.rngSeed = toUnsigned("GEOTRACK_RNG_SEED", seed);
        if (!mqttHost.empty()) config.mqtt.host = mqttHost;
        if (!mqttPort.empty()) config.mqtt.port = toPort("GEOTRACK_MQTT_PORT", mqttPort);
    }

private:
    static void applyValue(EngineConfig& config, const std::string& section,
                           const std::string& key, const std::string& value) {
        const std::string name = section + "." + key;

        if (section == "engine") {
            if (key == "max_batch_size") {
                config.maxBatchSize = toSize(name, value);
            } else if (key == "current_location_ttl_seconds") {
                config.currentLocationTtl = std::chrono::seconds(toUnsigned(name, value));
            } else if (key == "session_snapshot_ttl_seconds") {
                config.sessionSnapshotTtl = std::chrono::seconds(toUnsigned(name, value));
            } else if (key == "stale_session_hours") {
                config.staleSessionThreshold = std::chrono::hours(toUnsigned(name, value));
            } else if (key == "low_accuracy_warning_m") {
                config.lowAccuracyWarningM = toDouble(name, value);
            }
        } else if (section == "privacy") {
            if (key == "strategy") {
                config.privacyStrategy = toStrategy(name, value);
            } else if (key == "rng_seed") {
                config.rngSeed = toUnsigned(name, value);
            }
        } else if (section == "timeouts") {
            if (key == "storage_ms") {
                config.storageTimeout = std::chrono::milliseconds(toUnsigned(name, value));
            } else if (key == "cache_ms") {
                config.cacheTimeout = std::chrono::milliseconds(toUnsigned(name, value));
            }
        } else if (section == "mqtt") {
            if (key == "host") {
                config.mqtt.host = value;
            } else if (key == "port") {
                config.mqtt.port = toPort(name, value);
            } else if (key == "use_tls") {
                config.mqtt.useTls = (value == "true" || value == "1");
            } else if (key == "client_id") {
                config.mqtt.clientId = value;
            } else if (key == "username") {
                config.mqtt.username = value;
            } else if (key == "password") {
                config.mqtt.password = value;
            } else if (key == "topic_prefix") {
                config.mqtt.topicPrefix = value;
            } else if (key == "ca_path") {
                config.mqtt.caPath = value;
            }
        }
    }

    static uint64_t toUnsigned(const std::string& name, const std::string& value) {
        if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
            throw std::invalid_argument("Invalid value for " + name + ": " + value);
        }
        try {
            return std::stoull(value);
        } catch (const std::out_of_range&) {
            throw std::invalid_argument("Value out of range for " + name + ": " + value);
        }
    }

    static std::size_t toSize(const std::string& name, const std::string& value) {
        auto parsed = toUnsigned(name, value);
        if (parsed == 0) {
            throw std::invalid_argument(name + " must be positive");
        }
        return static_cast<std::size_t>(parsed);
    }

    static uint16_t toPort(const std::string& name, const std::string& value) {
        auto parsed = toUnsigned(name, value);
        if (parsed == 0 || parsed > 65535) {
            throw std::invalid_argument("Invalid port for " + name + ": " + value);
        }
        return static_cast<uint16_t>(parsed);
    }

    static double toDouble(const std::string& name, const std::string& value) {
        try {
            size_t consumed = 0;
            double parsed = std::stod(value, &consumed);
            if (consumed != value.size()) {
                throw std::invalid_argument(value);
            }
            return parsed;
        } catch (const std::logic_error&) {
            throw std::invalid_argument("Invalid value for " + name + ": " + value);
        }
    }

    static PrivacyStrategy toStrategy(const std::string& name, const std::string& value) {
        auto strategy = stringToPrivacyStrategy(value);
        if (!strategy) {
            throw std::invalid_argument("Unknown privacy strategy for " + name + ": " + value);
        }
        return *strategy;
    }

    static void trim(std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    }

    static void unquote(std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
    }
};

} // namespace geotrack
