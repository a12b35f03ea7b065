#pragma once

#include "../ports/IEventPublisher.hpp"
#include "../IMqttClient.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace geotrack::adapters {

/**
 * @brief Broadcasts engine events over MQTT
 *
 * Topic layout: {prefix}/trips/{tripId}/{eventType}, QoS 1, JSON payload.
 * A failed hand-off is logged and counted; it never propagates to ingestion.
 */
class MqttEventPublisher : public ports::IEventPublisher {
public:
    MqttEventPublisher(std::shared_ptr<IMqttClient> mqttClient, std::string topicPrefix = "geotrack");
    ~MqttEventPublisher() override = default;

    void publish(const EngineEvent& event) override;

    std::string buildTopic(const EngineEvent& event) const;

    uint64_t publishedCount() const { return published_; }
    uint64_t failedCount() const { return failed_; }

private:
    void onMqttConnection(bool connected, const std::string& reason);

    std::shared_ptr<IMqttClient> mqttClient_;
    std::string topicPrefix_;
    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace geotrack::adapters
