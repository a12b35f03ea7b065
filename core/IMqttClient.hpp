/**
 * @file IMqttClient.hpp
 * @brief MQTT client interface used to broadcast engine events
 *
 * Keeps the domain free of any particular MQTT library. The desktop build
 * binds it to the Eclipse Paho C asynchronous client; tests bind it to an
 * in-process recorder.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace geotrack {

/**
 * @brief Outbound MQTT message
 *
 * @note QoS levels: 0 (at most once), 1 (at least once), 2 (exactly once)
 */
struct MqttMessage {
    std::string topic;              ///< e.g. "geotrack/trips/{tripId}/location_updated"
    std::string payload;            ///< JSON engine event
    int qos = 0;
    bool retained = false;
};

/**
 * @brief Broker connection parameters
 */
struct MqttConnectOptions {
    std::string host;
    std::uint16_t port = 1883;
    std::string clientId;
    std::string username;           ///< Empty for anonymous brokers
    std::string password;
    bool useTls = false;            ///< ssl:// instead of tcp://
    std::string caPath;             ///< Optional trust store when useTls is set
};

/**
 * @brief Platform-independent MQTT publisher interface
 *
 * @note connect() only initiates the connection; the connection callback
 *       reports the outcome.
 */
class IMqttClient {
public:
    virtual ~IMqttClient() = default;

    /// Callback function type for connection state changes
    using ConnectionCallback = std::function<void(bool connected, const std::string& reason)>;

    /**
     * @brief Start connecting to the broker
     * @return true if the connection attempt was initiated
     */
    virtual bool connect(const MqttConnectOptions& options) = 0;

    virtual void disconnect() = 0;

    virtual bool isConnected() const = 0;

    /**
     * @brief Publish message to MQTT topic
     * @return true if the message was handed to the client library
     * @note Messages published while offline are queued and flushed on connect
     */
    virtual bool publish(const std::string& topic, const std::string& payload,
                         int qos = 0, bool retained = false) = 0;

    /**
     * @brief Set callback for connection state changes
     * @note Called from the MQTT library thread
     */
    virtual void setConnectionCallback(ConnectionCallback callback) = 0;

protected:
    IMqttClient() = default;
    IMqttClient(const IMqttClient&) = default;
    IMqttClient& operator=(const IMqttClient&) = default;
};

} // namespace geotrack
