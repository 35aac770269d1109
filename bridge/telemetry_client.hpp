// bridge/telemetry_client.hpp
#pragma once
#include <functional>
#include <stdexcept>
#include <string>

class TelemetryError : public std::runtime_error {
public:
    explicit TelemetryError(const std::string& msg) : std::runtime_error(msg) {}
};

// Publish side of the telemetry bus. The last will has to be registered
// before connect(); connect handlers run after the initial connect and
// after every automatic reconnect.
class TelemetryClient {
public:
    using ConnectHandler = std::function<void()>;

    virtual ~TelemetryClient() = default;

    virtual void set_last_will(const std::string& topic, const std::string& payload, bool retain) = 0;
    virtual void on_connect(ConnectHandler handler) = 0;
    // Throws TelemetryError when the broker cannot be reached.
    virtual void connect(const std::string& host, int port) = 0;
    virtual void start_background_loop() = 0;
    // Queues the message for delivery and returns without waiting on the network.
    virtual bool publish(const std::string& topic, const std::string& payload, bool retain) = 0;
    virtual bool is_connected() const = 0;
};
