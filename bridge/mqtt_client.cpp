#include "mqtt_client.hpp"
#include "logger.hpp"
#include <mosquitto.h>
#include <cerrno>
#include <cstring>
#include <mutex>

namespace {

// mosquitto_lib_init() is process wide and must run before mosquitto_new().
void init_mosquitto_library() {
    static std::once_flag once;
    std::call_once(once, [] {
        int rc = mosquitto_lib_init();
        if (rc != MOSQ_ERR_SUCCESS) {
            throw TelemetryError(std::string("Cannot initialize libmosquitto: ") + mosquitto_strerror(rc));
        }
    });
}

}

MqttClient::MqttClient(const std::string& client_id, std::chrono::seconds keepalive_interval)
    : keepalive(keepalive_interval) {
    init_mosquitto_library();

    mosq = mosquitto_new(client_id.c_str(), true, this);
    if (!mosq) {
        throw TelemetryError("Cannot create MQTT client " + client_id);
    }
    mosquitto_connect_callback_set(mosq, &MqttClient::connect_callback);
    mosquitto_disconnect_callback_set(mosq, &MqttClient::disconnect_callback);
    mosquitto_log_callback_set(mosq, &MqttClient::log_callback);
    mosquitto_reconnect_delay_set(mosq, kMinReconnectDelay, kMaxReconnectDelay, true);
}

MqttClient::~MqttClient() {
    // No mosquitto_disconnect(): dropping the session makes the broker
    // publish the will.
    if (loop_running) {
        mosquitto_loop_stop(mosq, true);
    }
    mosquitto_destroy(mosq);
}

void MqttClient::set_last_will(const std::string& topic, const std::string& payload, bool retain) {
    int rc = mosquitto_will_set(mosq, topic.c_str(), static_cast<int>(payload.size()),
                                payload.data(), kQos, retain);
    if (rc != MOSQ_ERR_SUCCESS) {
        throw TelemetryError("Cannot set last will on " + topic + ": " + mosquitto_strerror(rc));
    }
}

void MqttClient::on_connect(ConnectHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex);
    connect_handlers.push_back(std::move(handler));
}

void MqttClient::connect(const std::string& hostname, int port) {
    Logger::info("Connecting to MQTT broker " + hostname + ":" + std::to_string(port));
    int rc = mosquitto_connect(mosq, hostname.c_str(), port, static_cast<int>(keepalive.count()));
    if (rc != MOSQ_ERR_SUCCESS) {
        const char* reason = rc == MOSQ_ERR_ERRNO ? std::strerror(errno) : mosquitto_strerror(rc);
        throw TelemetryError("Cannot connect to " + hostname + ":" + std::to_string(port) + ": " + reason);
    }
}

void MqttClient::start_background_loop() {
    if (loop_running) return;
    int rc = mosquitto_loop_start(mosq);
    if (rc != MOSQ_ERR_SUCCESS) {
        throw TelemetryError(std::string("Cannot start MQTT network thread: ") + mosquitto_strerror(rc));
    }
    loop_running = true;
}

bool MqttClient::publish(const std::string& topic, const std::string& payload, bool retain) {
    int rc = mosquitto_publish(mosq, nullptr, topic.c_str(), static_cast<int>(payload.size()),
                               payload.data(), kQos, retain);
    if (rc != MOSQ_ERR_SUCCESS) {
        Logger::warning("Publish to " + topic + " failed: " + mosquitto_strerror(rc));
        return false;
    }
    Logger::debug("Queued " + std::to_string(payload.size()) + " bytes for " + topic);
    return true;
}

void MqttClient::handle_connack(int rc) {
    if (rc != 0) {
        Logger::warning(std::string("MQTT broker refused connection: ") + mosquitto_connack_string(rc));
        return;
    }
    connected.store(true);
    Logger::success("Connected to MQTT broker");

    std::vector<ConnectHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex);
        handlers = connect_handlers;
    }
    for (auto& handler : handlers) {
        handler();
    }
}

void MqttClient::handle_disconnect(int rc) {
    connected.store(false);
    if (rc != 0) {
        Logger::warning("MQTT connection lost (" + std::string(mosquitto_strerror(rc)) + "), reconnecting");
    }
}

void MqttClient::connect_callback(struct mosquitto*, void* obj, int rc) {
    static_cast<MqttClient*>(obj)->handle_connack(rc);
}

void MqttClient::disconnect_callback(struct mosquitto*, void* obj, int rc) {
    static_cast<MqttClient*>(obj)->handle_disconnect(rc);
}

void MqttClient::log_callback(struct mosquitto*, void*, int level, const char* message) {
    if (level == MOSQ_LOG_ERR) {
        Logger::error(std::string("mosquitto: ") + message);
    } else if (level == MOSQ_LOG_WARNING) {
        Logger::warning(std::string("mosquitto: ") + message);
    } else if (level != MOSQ_LOG_DEBUG) {
        Logger::debug(std::string("mosquitto: ") + message);
    }
}
