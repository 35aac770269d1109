#include "raven_device.hpp"
#include "logger.hpp"
#include <limits>

namespace {

// The RAVEn API documents a zero multiplier or divisor as "treat as one".
int64_t scale_or_one(const RavenFragment& fragment, const std::string& field) {
    auto value = fragment.hex(field);
    if (!value || *value == 0 || *value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return 1;
    }
    return static_cast<int64_t>(*value);
}

std::optional<uint32_t> fragment_timestamp(const RavenFragment& fragment) {
    auto value = fragment.hex("TimeStamp");
    if (!value || *value == 0 || *value > std::numeric_limits<uint32_t>::max()) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(*value);
}

}

RavenDevice::RavenDevice(std::chrono::seconds request_timeout) : timeout(request_timeout) {}

bool RavenDevice::connect(const std::string& device) {
    parser.reset();
    if (!port.open(device, kBaudRate)) {
        return false;
    }
    Logger::success("Connected to RAVEn device on " + device);
    return true;
}

void RavenDevice::disconnect() {
    port.close();
    parser.reset();
}

std::string RavenDevice::build_command(const std::string& name, bool refresh) {
    std::string cmd = "<Command>\n<Name>" + name + "</Name>\n";
    if (refresh) {
        cmd += "<Refresh>Y</Refresh>\n";
    }
    cmd += "</Command>\n";
    return cmd;
}

bool RavenDevice::send_command(const std::string& name, bool refresh) {
    if (!port.is_open()) {
        Logger::warning("Cannot send " + name + ": device not connected");
        return false;
    }
    Logger::debug("Sending " + name);
    return port.write_all(build_command(name, refresh));
}

std::optional<RavenFragment> RavenDevice::wait_for(const std::string& fragment_name) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        while (auto fragment = parser.next()) {
            if (fragment->name == fragment_name) {
                return fragment;
            }
            Logger::debug("Skipping unsolicited <" + fragment->name + "> while waiting for " + fragment_name);
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            Logger::debug("Timed out waiting for " + fragment_name);
            return std::nullopt;
        }

        std::string chunk;
        ssize_t n = port.read_some(chunk, remaining);
        if (n < 0) {
            return std::nullopt;
        }
        if (n > 0) {
            parser.feed(chunk);
        }
    }
}

void RavenDevice::reset_schedule_to_default() {
    if (!send_command("set_schedule_default", false)) {
        Logger::warning("Failed to reset device schedule");
    }
}

std::optional<DeviceInfo> RavenDevice::get_device_info() {
    if (!send_command("get_device_info", false)) return std::nullopt;
    auto fragment = wait_for("DeviceInfo");
    if (!fragment) return std::nullopt;
    return decode_device_info(*fragment);
}

std::optional<RawReading> RavenDevice::get_current_summation() {
    if (!send_command("get_current_summation_delivered", true)) return std::nullopt;
    auto fragment = wait_for("CurrentSummationDelivered");
    if (!fragment) return std::nullopt;
    return decode_current_summation(*fragment);
}

std::optional<RawReading> RavenDevice::get_instantaneous_demand() {
    if (!send_command("get_instantaneous_demand", true)) return std::nullopt;
    auto fragment = wait_for("InstantaneousDemand");
    if (!fragment) return std::nullopt;
    return decode_instantaneous_demand(*fragment);
}

std::optional<DeviceInfo> RavenDevice::decode_device_info(const RavenFragment& fragment) {
    auto mac = fragment.text("DeviceMacId");
    if (!mac || mac->empty()) {
        Logger::warning("DeviceInfo without DeviceMacId");
        return std::nullopt;
    }

    DeviceInfo info;
    info.device_mac = *mac;
    info.manufacturer = fragment.text("Manufacturer").value_or("");
    info.model_id = fragment.text("ModelId").value_or("");
    info.fw_version = fragment.text("FWVersion").value_or("");
    return info;
}

std::optional<RawReading> RavenDevice::decode_current_summation(const RavenFragment& fragment) {
    auto delivered = fragment.hex("SummationDelivered");
    if (!delivered || *delivered > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        Logger::warning("CurrentSummationDelivered without a usable SummationDelivered field");
        return RawReading{};
    }

    RawReading reading;
    reading.value = static_cast<int64_t>(*delivered);
    reading.multiplier = scale_or_one(fragment, "Multiplier");
    reading.divisor = scale_or_one(fragment, "Divisor");
    reading.timestamp = fragment_timestamp(fragment);
    reading.meter_mac = fragment.text("MeterMacId").value_or("");
    return reading;
}

std::optional<RawReading> RavenDevice::decode_instantaneous_demand(const RavenFragment& fragment) {
    auto demand = fragment.hex("Demand");
    if (!demand || *demand > std::numeric_limits<uint32_t>::max()) {
        Logger::warning("InstantaneousDemand without a usable Demand field");
        return RawReading{};
    }

    RawReading reading;
    // Demand is signed; power exported to the grid reads negative.
    reading.value = static_cast<int32_t>(static_cast<uint32_t>(*demand));
    reading.multiplier = scale_or_one(fragment, "Multiplier");
    reading.divisor = scale_or_one(fragment, "Divisor");
    reading.timestamp = fragment_timestamp(fragment);
    reading.meter_mac = fragment.text("MeterMacId").value_or("");
    return reading;
}
