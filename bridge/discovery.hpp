// bridge/discovery.hpp
#pragma once
#include "telemetry_client.hpp"
#include "../common/readings.hpp"
#include <nlohmann/json.hpp>
#include <string>

// <prefix>/sensor/<app>-<meter>/... for one meter installation.
class TopicLayout {
private:
    std::string base;

public:
    TopicLayout(const std::string& discovery_prefix, const std::string& app_id, const std::string& meter_mac);

    std::string availability() const;
    std::string config(ReadingKind kind) const;
    std::string state(ReadingKind kind) const;
};

// Home Assistant MQTT discovery for the two meter sensors, plus the
// online/offline availability signal they share.
class DiscoveryPublisher {
private:
    TelemetryClient& client;
    TopicLayout topics;
    DeviceInfo device;
    std::string meter_mac;
    bool descriptors_published{false};

public:
    static constexpr const char* kOnline = "online";
    static constexpr const char* kOffline = "offline";
    static constexpr const char* kDisplayPrefix = "EMU-2";

    DiscoveryPublisher(TelemetryClient& telemetry, TopicLayout layout, DeviceInfo info, std::string meter);

    nlohmann::json device_block() const;
    nlohmann::json descriptor(ReadingKind kind) const;

    // Must run before the client connects: registers the "offline" will and
    // subscribes the "online" publish to every connect event.
    void register_availability();
    void publish_descriptors();
    bool published() const { return descriptors_published; }
};
