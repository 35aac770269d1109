// common/readings.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string>

struct DeviceInfo {
    std::string manufacturer;
    std::string model_id;
    std::string fw_version;
    std::string device_mac;
};

// One answer from the meter. A missing timestamp means the device
// answered without data and the reading must not be used.
struct RawReading {
    int64_t value{0};
    int64_t multiplier{1};
    int64_t divisor{1};
    std::optional<uint32_t> timestamp;
    std::string meter_mac;
};

enum class ReadingKind {
    CurrentSummation,
    InstantaneousDemand
};

inline const char* reading_kind_id(ReadingKind kind) {
    switch (kind) {
        case ReadingKind::CurrentSummation: return "current_summation";
        case ReadingKind::InstantaneousDemand: return "instantaneous_demand";
    }
    return "unknown";
}
