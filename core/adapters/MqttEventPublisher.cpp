#include "MqttEventPublisher.hpp"
#include "../JsonCodec.hpp"
#include <iostream>

namespace geotrack::adapters {

MqttEventPublisher::MqttEventPublisher(std::shared_ptr<IMqttClient> mqttClient, std::string topicPrefix)
    : mqttClient_(std::move(mqttClient)), topicPrefix_(std::move(topicPrefix)) {

    mqttClient_->setConnectionCallback([this](bool connected, const std::string& reason) {
        onMqttConnection(connected, reason);
    });
}

std::string MqttEventPublisher::buildTopic(const EngineEvent& event) const {
    return topicPrefix_ + "/trips/" + event.tripId + "/" + engineEventTypeToString(event.type);
}

void MqttEventPublisher::publish(const EngineEvent& event) {
    const std::string topic = buildTopic(event);
    const std::string payload = JsonCodec::engineEventToJson(event).dump();

    if (mqttClient_->publish(topic, payload, 1, false)) {
        ++published_;
        return;
    }

    ++failed_;
    if (!mqttClient_->isConnected()) {
        std::cout << "[Broadcast] Offline, queued " << topic << std::endl;
    } else {
        std::cerr << "[Broadcast] Failed to publish " << topic << std::endl;
    }
}

void MqttEventPublisher::onMqttConnection(bool connected, const std::string& reason) {
    std::cout << "[Broadcast] Broker " << (connected ? "connected" : "disconnected")
              << ": " << reason << std::endl;
}

} // namespace geotrack::adapters
