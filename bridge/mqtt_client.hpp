// bridge/mqtt_client.hpp
#pragma once
#include "telemetry_client.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

struct mosquitto;

// TelemetryClient on libmosquitto. After start_background_loop() the
// library's network thread owns the socket: it sends queued publishes,
// keeps the session alive and reconnects with exponential backoff.
class MqttClient : public TelemetryClient {
private:
    struct mosquitto* mosq{nullptr};
    std::chrono::seconds keepalive;
    bool loop_running{false};

    std::mutex handlers_mutex;
    std::vector<ConnectHandler> connect_handlers;
    std::atomic<bool> connected{false};

    static void connect_callback(struct mosquitto* mosq, void* obj, int rc);
    static void disconnect_callback(struct mosquitto* mosq, void* obj, int rc);
    static void log_callback(struct mosquitto* mosq, void* obj, int level, const char* message);

public:
    // Publishes and the will go out at QoS 1 so the library keeps them
    // queued across a reconnect.
    static constexpr int kQos = 1;
    static constexpr unsigned int kMinReconnectDelay = 1;
    static constexpr unsigned int kMaxReconnectDelay = 60;

    MqttClient(const std::string& client_id, std::chrono::seconds keepalive_interval);
    ~MqttClient() override;

    MqttClient(const MqttClient&) = delete;
    MqttClient& operator=(const MqttClient&) = delete;

    void set_last_will(const std::string& topic, const std::string& payload, bool retain) override;
    void on_connect(ConnectHandler handler) override;
    void connect(const std::string& hostname, int port) override;
    void start_background_loop() override;
    bool publish(const std::string& topic, const std::string& payload, bool retain) override;
    bool is_connected() const override { return connected.load(); }

    // What the network thread runs when the broker answers CONNECT or the
    // session drops. rc is the CONNACK code or the disconnect reason.
    void handle_connack(int rc);
    void handle_disconnect(int rc);
};
