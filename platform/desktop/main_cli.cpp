/**
 * @file main_cli.cpp
 * @brief Command-line driver for the geotrack engine
 *
 * Replays a JSON-lines command script (or stdin) against an engine backed by
 * the in-memory store and cache, printing one JSON response per command.
 * Engine events are broadcast over MQTT when a broker is configured.
 */

#include "CommandRunner.hpp"
#include "TomlConfig.hpp"
#include "PahoMqttClient.hpp"
#include "IClock.hpp"
#include "IRng.hpp"
#include "adapters/InMemoryCache.hpp"
#include "adapters/InMemoryTrackingStore.hpp"
#include "adapters/LoggingNotificationSink.hpp"
#include "adapters/MqttEventPublisher.hpp"
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <thread>

using namespace geotrack;

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options] [script.jsonl]\n"
              << "Options:\n"
              << "  --config [file]    Configuration file (default: geotrack.toml)\n"
              << "  --help             Show this help message\n"
              << "\nWithout a script, commands are read from stdin, one JSON object per line:\n"
              << "  {\"cmd\":\"start\",\"tripId\":\"t1\",\"userId\":\"u1\"}\n"
              << "  {\"cmd\":\"ingest\",\"tripId\":\"t1\",\"userId\":\"u1\",\n"
              << "   \"sample\":{\"coordinates\":{\"lat\":40.7128,\"lon\":-74.006}}}\n"
              << "  {\"cmd\":\"stop\",\"tripId\":\"t1\"}\n"
              << "Commands: start ingest batch pause resume stop complete geofence\n"
              << "          delivery_geofences current history inspect sweep\n"
              << "\nEnvironment overrides: GEOTRACK_MAX_BATCH GEOTRACK_PRIVACY_STRATEGY\n"
              << "  GEOTRACK_RNG_SEED GEOTRACK_MQTT_HOST GEOTRACK_MQTT_PORT\n"
              << std::endl;
}

std::string safeGetEnv(const char* name) {
#ifdef _WIN32
    char* buffer = nullptr;
    size_t size = 0;
    if (_dupenv_s(&buffer, &size, name) == 0 && buffer != nullptr) {
        std::string result(buffer);
        free(buffer);
        return result;
    }
    return "";
#else
    const char* value = std::getenv(name);
    return value ? std::string(value) : "";
#endif
}

int main(int argc, char* argv[]) {
    std::string configFile = "geotrack.toml";
    std::string scriptFile;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 < argc) {
                configFile = argv[++i];
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        } else {
            scriptFile = arg;
        }
    }

    EngineConfig config;
    try {
        config = TomlConfig::loadFromFile(configFile);
        TomlConfig::applyEnvironment(config, safeGetEnv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[Config] " << e.what() << std::endl;
        return 1;
    }

    std::cerr << "[Engine] Privacy strategy: " << privacyStrategyToString(config.privacyStrategy)
              << ", max batch: " << config.maxBatchSize << std::endl;

    auto clock = std::make_shared<SystemClock>();
    std::shared_ptr<IRng> rng = config.rngSeed
        ? std::make_shared<StandardRng>(*config.rngSeed)
        : std::make_shared<StandardRng>();

    auto store = std::make_shared<adapters::InMemoryTrackingStore>(config.storageTimeout);
    auto cache = std::make_shared<adapters::InMemoryCache>(clock, config.cacheTimeout);
    auto sink = std::make_shared<adapters::LoggingNotificationSink>();

    std::shared_ptr<PahoMqttClient> mqttClient;
    std::shared_ptr<adapters::MqttEventPublisher> publisher;
    if (config.mqtt.enabled()) {
        mqttClient = std::make_shared<PahoMqttClient>();
        publisher = std::make_shared<adapters::MqttEventPublisher>(mqttClient, config.mqtt.topicPrefix);

        MqttConnectOptions options;
        options.host = config.mqtt.host;
        options.port = config.mqtt.port;
        options.clientId = config.mqtt.clientId;
        options.username = config.mqtt.username;
        options.password = config.mqtt.password;
        options.useTls = config.mqtt.useTls;
        options.caPath = config.mqtt.caPath;

        if (!mqttClient->connect(options)) {
            std::cerr << "[Engine] MQTT broadcast unavailable, continuing without broker" << std::endl;
        }
    }

    domain::TrackingEngine engine(config, store, cache, clock, rng, sink, publisher);
    CommandRunner runner(engine);

    std::size_t failures = 0;
    if (scriptFile.empty()) {
        failures = runner.run(std::cin, std::cout);
    } else {
        std::ifstream script(scriptFile);
        if (!script.is_open()) {
            std::cerr << "Could not open script: " << scriptFile << std::endl;
            return 1;
        }
        failures = runner.run(script, std::cout);
    }

    if (mqttClient) {
        // Give queued QoS 1 publishes a moment to leave before disconnecting
        std::this_thread::sleep_for(std::chrono::seconds(1));
        mqttClient->disconnect();
        std::cerr << "[Engine] Broadcast " << publisher->publishedCount() << " event(s), "
                  << publisher->failedCount() << " failed" << std::endl;
    }

    return failures == 0 ? 0 : 2;
}
