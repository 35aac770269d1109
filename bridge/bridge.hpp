// bridge/bridge.hpp
#pragma once
#include "config.hpp"
#include "discovery.hpp"
#include "meter_device.hpp"
#include "poller.hpp"
#include "telemetry_client.hpp"
#include <memory>
#include <optional>
#include <string>

// Startup sequence and polling loop over an abstract device and telemetry
// client. start() opens the device before the client is touched, so a
// device that cannot be reached never produces a will or a publish.
class Bridge {
private:
    const BridgeConfig& config;
    MeterDevice& device;
    TelemetryClient& client;
    Poller::SleepFn sleep;

    std::optional<TopicLayout> topics;
    std::unique_ptr<DiscoveryPublisher> discovery;
    std::unique_ptr<Poller> poller;
    PollingSession session;

    DeviceInfo open_device();
    std::string read_meter_id();

public:
    Bridge(const BridgeConfig& bridge_config, MeterDevice& meter, TelemetryClient& telemetry,
           Poller::SleepFn sleep_fn = nullptr);

    // Throws DeviceError if the device cannot be opened or identified, and
    // TelemetryError if the broker cannot be reached.
    void start();

    CycleOutcome poll_once();

    // Never returns normally.
    void run();

    const PollingSession& polling_session() const { return session; }
    bool started() const { return poller != nullptr; }
};
