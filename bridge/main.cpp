// bridge/main.cpp
#include "bridge.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "mqtt_client.hpp"
#include "raven_device.hpp"
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "Bridge an EMU-2 energy monitor to MQTT with Home Assistant discovery.\n"
              << "Options:\n"
              << "  -c, --config PATH   Path to config file (default: config.ini)\n"
              << "  -q, --quiet         Suppress debug logs\n"
              << "  -v, --version       Print version and exit\n"
              << "  -h, --help          Show this help\n";
}

void log_exception_chain(const std::exception& e, int depth = 0) {
    Logger::error(std::string(depth * 2, ' ') + e.what());
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& nested) {
        log_exception_chain(nested, depth + 1);
    }
}

// The MQTT session is already gone without a DISCONNECT by the time we get
// here, so the broker publishes the "offline" will on our behalf.
void die(const std::exception& e) {
    Logger::error("Fatal error, exiting");
    log_exception_chain(e);
    Logger::flush();
    std::_Exit(1);
}

// Everything stays alive until die() exits, so the MQTT network thread never
// sees a destroyed handler.
void run_bridge(const BridgeConfig& config) {
    Logger::info("Starting emu_bridge " EMU_BRIDGE_VERSION);

    RavenDevice device(config.request_timeout);
    MqttClient mqtt(config.mqtt_client_id, config.mqtt_keepalive);
    Bridge bridge(config, device, mqtt);

    try {
        bridge.run();
    } catch (const std::exception& e) {
        die(e);
    }
}

int main(int argc, char* argv[]) {
    std::string config_path = "config.ini";
    bool quiet = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << "emu_bridge " EMU_BRIDGE_VERSION << std::endl;
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "-q" || arg == "--quiet") {
            quiet = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 2;
        }
    }

    Logger::set_verbose(!quiet);

    BridgeConfig config;
    try {
        config = load_config(config_path);
    } catch (const ConfigError& e) {
        Logger::error(e.what());
        return 2;
    }

    try {
        run_bridge(config);
    } catch (const std::exception& e) {
        die(e);
    }
    return 1;
}
