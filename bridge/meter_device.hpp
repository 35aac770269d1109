// bridge/meter_device.hpp
#pragma once
#include "../common/readings.hpp"
#include <optional>
#include <stdexcept>
#include <string>

class DeviceError : public std::runtime_error {
public:
    explicit DeviceError(const std::string& msg) : std::runtime_error(msg) {}
};

// Synchronous request/response access to the energy monitor. Every request
// blocks for at most the driver's configured timeout and returns an empty
// optional when nothing usable arrived in time.
class MeterDevice {
public:
    virtual ~MeterDevice() = default;

    virtual bool connect(const std::string& port) = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;

    virtual void reset_schedule_to_default() = 0;
    virtual std::optional<DeviceInfo> get_device_info() = 0;
    virtual std::optional<RawReading> get_current_summation() = 0;
    virtual std::optional<RawReading> get_instantaneous_demand() = 0;
};
