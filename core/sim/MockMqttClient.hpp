#pragma once

#include "../IMqttClient.hpp"
#include <vector>

namespace geotrack::sim {

/// In-process IMqttClient that records what would have gone to the broker.
class MockMqttClient : public IMqttClient {
public:
    bool connect(const MqttConnectOptions& options) override {
        lastOptions_ = options;
        connected_ = true;
        if (connectionCallback_) {
            connectionCallback_(true, "Mock connected");
        }
        return true;
    }

    void disconnect() override {
        connected_ = false;
        if (connectionCallback_) {
            connectionCallback_(false, "Mock disconnected");
        }
    }

    bool isConnected() const override { return connected_; }

    bool publish(const std::string& topic, const std::string& payload,
                 int qos = 0, bool retained = false) override {
        if (!connected_ || failPublish_) {
            return false;
        }
        publishedMessages_.push_back({topic, payload, qos, retained});
        return true;
    }

    void setConnectionCallback(ConnectionCallback callback) override {
        connectionCallback_ = std::move(callback);
    }

    const std::vector<MqttMessage>& getPublishedMessages() const { return publishedMessages_; }
    const MqttConnectOptions& lastOptions() const { return lastOptions_; }
    void setFailPublish(bool fail) { failPublish_ = fail; }

private:
    bool connected_ = false;
    bool failPublish_ = false;
    ConnectionCallback connectionCallback_;
    std::vector<MqttMessage> publishedMessages_;
    MqttConnectOptions lastOptions_;
};

} // namespace geotrack::sim
