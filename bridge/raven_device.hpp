// bridge/raven_device.hpp
#pragma once
#include "meter_device.hpp"
#include "raven_parser.hpp"
#include "serial_port.hpp"
#include <chrono>
#include <optional>
#include <string>

// MeterDevice speaking the Rainforest RAVEn XML API over a USB CDC tty,
// as found on the EMU-2 display.
class RavenDevice : public MeterDevice {
private:
    SerialPort port;
    RavenParser parser;
    std::chrono::seconds timeout;

    bool send_command(const std::string& name, bool refresh);
    std::optional<RavenFragment> wait_for(const std::string& fragment_name);

public:
    static constexpr int kBaudRate = 115200;

    explicit RavenDevice(std::chrono::seconds request_timeout);

    bool connect(const std::string& device) override;
    void disconnect() override;
    bool is_connected() const override { return port.is_open(); }

    void reset_schedule_to_default() override;
    std::optional<DeviceInfo> get_device_info() override;
    std::optional<RawReading> get_current_summation() override;
    std::optional<RawReading> get_instantaneous_demand() override;

    static std::string build_command(const std::string& name, bool refresh);
    static std::optional<DeviceInfo> decode_device_info(const RavenFragment& fragment);
    static std::optional<RawReading> decode_current_summation(const RavenFragment& fragment);
    static std::optional<RawReading> decode_instantaneous_demand(const RavenFragment& fragment);
};
