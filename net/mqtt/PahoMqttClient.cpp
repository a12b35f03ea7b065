#include "PahoMqttClient.hpp"
#include <iostream>

namespace geotrack {

PahoMqttClient::PahoMqttClient() : client_(nullptr) {}

PahoMqttClient::~PahoMqttClient() {
    disconnect();
    if (client_) {
        MQTTAsync_destroy(&client_);
    }
}

bool PahoMqttClient::connect(const MqttConnectOptions& options) {
    options_ = options;

    const std::string scheme = options_.useTls ? "ssl://" : "tcp://";
    const std::string serverURI = scheme + options_.host + ":" + std::to_string(options_.port);

    std::cout << "[MQTT] Connecting to " << serverURI << " as " << options_.clientId << std::endl;

    if (client_) {
        MQTTAsync_destroy(&client_);
        client_ = nullptr;
    }

    int rc = MQTTAsync_create(&client_, serverURI.c_str(), options_.clientId.c_str(),
                              MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Failed to create client, error code: " << rc << std::endl;
        return false;
    }

    MQTTAsync_setCallbacks(client_, this, connectionLost, messageArrived, nullptr);

    MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
    MQTTAsync_SSLOptions ssl_opts = MQTTAsync_SSLOptions_initializer;

    conn_opts.keepAliveInterval = kKeepAliveIntervalSeconds;
    conn_opts.cleansession = 1;
    conn_opts.connectTimeout = kConnectionTimeoutSeconds;
    conn_opts.automaticReconnect = 1;
    conn_opts.onSuccess = onConnected;
    conn_opts.onFailure = onConnectFailure;
    conn_opts.context = this;

    if (!options_.username.empty()) {
        conn_opts.username = options_.username.c_str();
        conn_opts.password = options_.password.c_str();
    }

    if (options_.useTls) {
        if (!options_.caPath.empty()) {
            ssl_opts.trustStore = options_.caPath.c_str();
        }
        ssl_opts.enableServerCertAuth = options_.caPath.empty() ? 0 : 1;
        ssl_opts.sslVersion = MQTT_SSL_VERSION_TLS_1_2;
        conn_opts.ssl = &ssl_opts;
    }

    rc = MQTTAsync_connect(client_, &conn_opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Connection attempt failed, error code: " << rc << std::endl;
        return false;
    }
    return true;
}

void PahoMqttClient::disconnect() {
    if (client_ && connected_) {
        MQTTAsync_disconnectOptions disc_opts = MQTTAsync_disconnectOptions_initializer;
        disc_opts.onSuccess = onDisconnected;
        disc_opts.context = this;

        int rc = MQTTAsync_disconnect(client_, &disc_opts);
        if (rc != MQTTASYNC_SUCCESS) {
            std::cerr << "[MQTT] Disconnect failed, error code: " << rc << std::endl;
        }
        connected_ = false;
    }
}

bool PahoMqttClient::isConnected() const {
    return connected_;
}

bool PahoMqttClient::publish(const std::string& topic, const std::string& payload,
                             int qos, bool retained) {
    MqttMessage message{topic, payload, qos, retained};

    if (!connected_) {
        queueMessage(message);
        return false;
    }
    return send(message);
}

bool PahoMqttClient::send(const MqttMessage& message) {
    MQTTAsync_message pubmsg = MQTTAsync_message_initializer;
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;

    pubmsg.payload = const_cast<void*>(static_cast<const void*>(message.payload.c_str()));
    pubmsg.payloadlen = static_cast<int>(message.payload.length());
    pubmsg.qos = message.qos;
    pubmsg.retained = message.retained ? 1 : 0;

    int rc = MQTTAsync_sendMessage(client_, message.topic.c_str(), &pubmsg, &opts);
    return rc == MQTTASYNC_SUCCESS;
}

void PahoMqttClient::setConnectionCallback(ConnectionCallback callback) {
    connectionCallback_ = std::move(callback);
}

std::size_t PahoMqttClient::queuedMessages() {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return offlineQueue_.size();
}

int PahoMqttClient::messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message) {
    (void)context;
    (void)topicLen;

    // Publisher only; nothing subscribes, but Paho requires the callback.
    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topicName);
    return 1;
}

void PahoMqttClient::onConnected(void* context, MQTTAsync_successData* response) {
    (void)response;

    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = true;
    std::cout << "[MQTT] Connected" << std::endl;

    if (client->connectionCallback_) {
        client->connectionCallback_(true, "Connected successfully");
    }

    client->flushOfflineQueue();
}

void PahoMqttClient::onConnectFailure(void* context, MQTTAsync_failureData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;

    std::string reason = "Connection failed";
    if (response) {
        reason = "CONNACK return code " + std::to_string(response->code);
        if (response->message) {
            reason += " (" + std::string(response->message) + ")";
        }
    }
    std::cerr << "[MQTT] " << reason << std::endl;

    if (client->connectionCallback_) {
        client->connectionCallback_(false, reason);
    }
}

void PahoMqttClient::connectionLost(void* context, char* cause) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;

    std::string reason = cause ? std::string(cause) : "Connection lost";
    std::cerr << "[MQTT] " << reason << std::endl;

    if (client->connectionCallback_) {
        client->connectionCallback_(false, reason);
    }
}

void PahoMqttClient::onDisconnected(void* context, MQTTAsync_successData* response) {
    (void)response;

    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;
}

void PahoMqttClient::flushOfflineQueue() {
    std::lock_guard<std::mutex> lock(queueMutex_);

    while (!offlineQueue_.empty() && connected_) {
        if (!send(offlineQueue_.front())) {
            break;
        }
        offlineQueue_.pop();
    }
}

void PahoMqttClient::queueMessage(const MqttMessage& message) {
    std::lock_guard<std::mutex> lock(queueMutex_);

    if (offlineQueue_.size() >= kMaxOfflineQueueSize) {
        offlineQueue_.pop();
    }
    offlineQueue_.push(message);
}

} // namespace geotrack
