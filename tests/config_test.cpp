#include "config.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace {

BridgeConfig parse(const std::string& text) {
    std::istringstream in(text);
    return parse_config(in, "test.ini");
}

}

TEST(ConfigTest, ReadsAllSections) {
    BridgeConfig config = parse(
        "; bridge settings\n"
        "[emu]\n"
        "serial = /dev/ttyACM1\n"
        "timeout_s = 5\n"
        "\n"
        "[mqtt]\n"
        "# local broker\n"
        "hostname = broker.lan\n"
        "port = 8883\n"
        "client_id = emu-garage\n"
        "discovery_prefix = ha\n"
        "keepalive_s = 30\n"
        "[general]\n"
        "interval_s = 15\n"
        "app_id = flying_emu\n"
        "unresponsive_max = 5\n");

    EXPECT_EQ(config.serial_path, "/dev/ttyACM1");
    EXPECT_EQ(config.request_timeout, std::chrono::seconds(5));
    EXPECT_EQ(config.mqtt_hostname, "broker.lan");
    EXPECT_EQ(config.mqtt_port, 8883);
    EXPECT_EQ(config.mqtt_client_id, "emu-garage");
    EXPECT_EQ(config.discovery_prefix, "ha");
    EXPECT_EQ(config.mqtt_keepalive, std::chrono::seconds(30));
    EXPECT_EQ(config.poll_interval, std::chrono::seconds(15));
    EXPECT_EQ(config.app_id, "flying_emu");
    EXPECT_EQ(config.unresponsive_max, 5);
}

TEST(ConfigTest, AppliesDefaults) {
    BridgeConfig config = parse("[emu]\nserial=/dev/ttyACM0\n[mqtt]\nhostname=localhost\n");

    EXPECT_EQ(config.request_timeout, std::chrono::seconds(10));
    EXPECT_EQ(config.mqtt_port, 1883);
    EXPECT_EQ(config.mqtt_client_id, "emu_bridge");
    EXPECT_EQ(config.discovery_prefix, "homeassistant");
    EXPECT_EQ(config.poll_interval, std::chrono::seconds(10));
    EXPECT_EQ(config.app_id, "emu_bridge");
    EXPECT_EQ(config.unresponsive_max, 3);
}

TEST(ConfigTest, RequiresSerialAndHostname) {
    EXPECT_THROW(parse("[mqtt]\nhostname=localhost\n"), ConfigError);
    EXPECT_THROW(parse("[emu]\nserial=/dev/ttyACM0\n"), ConfigError);
    EXPECT_THROW(parse("[emu]\nserial=\n[mqtt]\nhostname=localhost\n"), ConfigError);
}

TEST(ConfigTest, RejectsMalformedIntegers) {
    const std::string base = "[emu]\nserial=/dev/ttyACM0\n[mqtt]\nhostname=localhost\n";
    EXPECT_THROW(parse(base + "port=18x3\n"), ConfigError);
    EXPECT_THROW(parse(base + "port=70000\n"), ConfigError);
    EXPECT_THROW(parse(base + "[general]\ninterval_s=-1\n"), ConfigError);
}

TEST(ConfigTest, RejectsBrokenSyntax) {
    EXPECT_THROW(parse("serial=/dev/ttyACM0\n"), ConfigError);
    EXPECT_THROW(parse("[emu\nserial=/dev/ttyACM0\n"), ConfigError);
    EXPECT_THROW(parse("[emu]\nserial\n"), ConfigError);
}

TEST(ConfigTest, MissingFileIsAConfigError) {
    EXPECT_THROW(load_config("/nonexistent/emu_bridge.ini"), ConfigError);
}

TEST(ConfigTest, KeepsCommentCharactersInsideValues) {
    BridgeConfig config = parse(
        "[emu]\n"
        "  ; indented comment\n"
        "serial = /dev/serial/by-id/usb-Rainforest#1\n"
        "[mqtt]\n"
        "hostname = localhost\n"
        "client_id = emu;kitchen\n");

    EXPECT_EQ(config.serial_path, "/dev/serial/by-id/usb-Rainforest#1");
    EXPECT_EQ(config.mqtt_client_id, "emu;kitchen");
}
