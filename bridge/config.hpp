// bridge/config.hpp
#pragma once
#include <chrono>
#include <istream>
#include <stdexcept>
#include <string>

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

struct BridgeConfig {
    // [emu]
    std::string serial_path;
    std::chrono::seconds request_timeout{10};

    // [mqtt]
    std::string mqtt_hostname;
    int mqtt_port{1883};
    std::string mqtt_client_id{"emu_bridge"};
    std::string discovery_prefix{"homeassistant"};
    std::chrono::seconds mqtt_keepalive{60};

    // [general]
    std::chrono::seconds poll_interval{10};
    std::string app_id{"emu_bridge"};
    int unresponsive_max{3};
};

// Reads an INI document with [emu], [mqtt] and [general] sections.
// Throws ConfigError on missing required keys or malformed values.
BridgeConfig parse_config(std::istream& in, const std::string& source_name = "<config>");
BridgeConfig load_config(const std::string& path);
