/**
 * @file PahoMqttClient.hpp
 * @brief Eclipse Paho MQTT C implementation of IMqttClient
 *
 * Asynchronous client with an offline queue that is flushed once the broker
 * connection comes up.
 */

#pragma once

#include "../../core/IMqttClient.hpp"
#include <MQTTAsync.h>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <queue>
#include <string>

namespace geotrack {

/**
 * @brief Paho MQTT C library implementation for desktop and server builds
 *
 * Features:
 * - Offline message queuing with a bounded size (oldest dropped first)
 * - Plain TCP or TLS transport
 * - Thread-safe callback handling
 */
class PahoMqttClient : public IMqttClient {
public:
    PahoMqttClient();

    /**
     * @brief Destructor - disconnects and releases the Paho handle
     */
    ~PahoMqttClient() override;

    PahoMqttClient(const PahoMqttClient&) = delete;
    PahoMqttClient& operator=(const PahoMqttClient&) = delete;

    bool connect(const MqttConnectOptions& options) override;
    void disconnect() override;
    bool isConnected() const override;

    bool publish(const std::string& topic, const std::string& payload,
                 int qos = 0, bool retained = false) override;

    void setConnectionCallback(ConnectionCallback callback) override;

    std::size_t queuedMessages();

private:
    /// Maximum number of messages to queue when offline
    static constexpr std::size_t kMaxOfflineQueueSize = 1000;

    static constexpr int kKeepAliveIntervalSeconds = 60;
    static constexpr int kConnectionTimeoutSeconds = 30;

    MQTTAsync client_;                      ///< Paho MQTT client handle
    std::atomic<bool> connected_{false};

    ConnectionCallback connectionCallback_;

    std::queue<MqttMessage> offlineQueue_;
    std::mutex queueMutex_;

    // Strings referenced by the Paho option structs must outlive connect()
    MqttConnectOptions options_;

    bool send(const MqttMessage& message);

    static void onConnected(void* context, MQTTAsync_successData* response);
    static void onConnectFailure(void* context, MQTTAsync_failureData* response);
    static void connectionLost(void* context, char* cause);
    static void onDisconnected(void* context, MQTTAsync_successData* response);
    static int messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message);

    /**
     * @brief Send all queued messages when connection is restored
     */
    void flushOfflineQueue();

    void queueMessage(const MqttMessage& message);
};

} // namespace geotrack
