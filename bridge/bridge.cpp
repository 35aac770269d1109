#include "bridge.hpp"
#include "logger.hpp"
#include <stdexcept>

Bridge::Bridge(const BridgeConfig& bridge_config, MeterDevice& meter, TelemetryClient& telemetry,
               Poller::SleepFn sleep_fn)
    : config(bridge_config), device(meter), client(telemetry), sleep(std::move(sleep_fn)) {}

DeviceInfo Bridge::open_device() {
    Logger::info("Initializing " + config.serial_path);
    if (!device.connect(config.serial_path)) {
        throw DeviceError("Failed to initialize device on " + config.serial_path);
    }

    // Clear whatever push schedule a previous run may have left behind.
    device.reset_schedule_to_default();

    Logger::info("Getting device info...");
    auto info = device.get_device_info();
    if (!info) {
        throw DeviceError("Device on " + config.serial_path + " did not report its info");
    }
    Logger::success("Device " + info->model_id + " firmware " + info->fw_version +
                    " (" + info->device_mac + ")");
    return *info;
}

// The meter id comes from a demand reading; get_meter_info times out too often.
std::string Bridge::read_meter_id() {
    Logger::info("Getting initial demand...");
    auto demand = device.get_instantaneous_demand();
    if (!demand || demand->meter_mac.empty()) {
        throw DeviceError("Device did not report a meter id");
    }
    Logger::success("Meter " + demand->meter_mac);
    return demand->meter_mac;
}

void Bridge::start() {
    if (poller) {
        throw std::logic_error("Bridge already started");
    }

    DeviceInfo info = open_device();
    std::string meter_mac = read_meter_id();
    topics.emplace(config.discovery_prefix, config.app_id, meter_mac);

    discovery = std::make_unique<DiscoveryPublisher>(client, *topics, info, meter_mac);
    discovery->register_availability();

    client.connect(config.mqtt_hostname, config.mqtt_port);
    client.start_background_loop();
    discovery->publish_descriptors();

    PollerSettings settings;
    settings.serial_path = config.serial_path;
    settings.interval = config.poll_interval;
    settings.unresponsive_max = config.unresponsive_max;
    poller = std::make_unique<Poller>(device, client, *topics, settings, sleep);
}

CycleOutcome Bridge::poll_once() {
    if (!poller) {
        throw std::logic_error("Bridge polled before start()");
    }
    return poller->run_cycle(session);
}

void Bridge::run() {
    if (!poller) {
        start();
    }
    poller->run(session);
}
