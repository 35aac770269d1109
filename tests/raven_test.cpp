#include "raven_device.hpp"
#include "raven_parser.hpp"
#include <gtest/gtest.h>

namespace {

const char* kSummation =
    "<CurrentSummationDelivered>\r\n"
    "  <DeviceMacId>0xd8d5b90000001234</DeviceMacId>\r\n"
    "  <MeterMacId>0x00135003002f1234</MeterMacId>\r\n"
    "  <TimeStamp>0x1c531d6b</TimeStamp>\r\n"
    "  <SummationDelivered>0x0000000001cc8a3</SummationDelivered>\r\n"
    "  <SummationReceived>0x0000000000000000</SummationReceived>\r\n"
    "  <Multiplier>0x00000001</Multiplier>\r\n"
    "  <Divisor>0x000003e8</Divisor>\r\n"
    "  <DigitsRight>0x01</DigitsRight>\r\n"
    "  <DigitsLeft>0x06</DigitsLeft>\r\n"
    "  <SuppressLeadingZero>Y</SuppressLeadingZero>\r\n"
    "</CurrentSummationDelivered>\r\n";

RavenFragment single_fragment(const std::string& xml) {
    RavenParser parser;
    parser.feed(xml);
    auto fragment = parser.next();
    EXPECT_TRUE(fragment.has_value());
    return fragment.value_or(RavenFragment{});
}

}

TEST(RavenParserTest, ReassemblesFragmentsSplitAcrossReads) {
    RavenParser parser;
    std::string xml = kSummation;
    parser.feed(xml.substr(0, 40));
    EXPECT_FALSE(parser.next().has_value());
    parser.feed(xml.substr(40));

    auto fragment = parser.next();
    ASSERT_TRUE(fragment.has_value());
    EXPECT_EQ(fragment->name, "CurrentSummationDelivered");
    EXPECT_EQ(fragment->text("SuppressLeadingZero"), "Y");
    EXPECT_FALSE(parser.next().has_value());
}

TEST(RavenParserTest, SkipsNoiseBetweenFragments) {
    RavenParser parser;
    parser.feed("garbage\r\n</Stale>\r\n<?xml version=\"1.0\"?><Empty/>");
    parser.feed("<ConnectionStatus><Status>Connected</Status></ConnectionStatus>junk");
    parser.feed("<TimeCluster><UTCTime>0x1c531d6b</UTCTime></TimeCluster>");

    auto first = parser.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->name, "ConnectionStatus");
    EXPECT_EQ(first->text("Status"), "Connected");

    auto second = parser.next();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->name, "TimeCluster");
    EXPECT_EQ(parser.buffered(), 0u);
}

TEST(RavenParserTest, ParsesHexFields) {
    RavenFragment fragment = single_fragment(kSummation);
    EXPECT_EQ(fragment.hex("Divisor"), 1000u);
    EXPECT_EQ(fragment.hex("SummationDelivered"), 0x1cc8a3u);
    EXPECT_FALSE(fragment.hex("SuppressLeadingZero").has_value());
    EXPECT_FALSE(fragment.hex("Missing").has_value());
}

TEST(RavenDeviceTest, BuildsCommands) {
    EXPECT_EQ(RavenDevice::build_command("get_device_info", false),
              "<Command>\n<Name>get_device_info</Name>\n</Command>\n");
    EXPECT_EQ(RavenDevice::build_command("get_instantaneous_demand", true),
              "<Command>\n<Name>get_instantaneous_demand</Name>\n<Refresh>Y</Refresh>\n</Command>\n");
}

TEST(RavenDeviceTest, DecodesCurrentSummation) {
    auto reading = RavenDevice::decode_current_summation(single_fragment(kSummation));
    ASSERT_TRUE(reading.has_value());
    EXPECT_EQ(reading->value, 0x1cc8a3);
    EXPECT_EQ(reading->multiplier, 1);
    EXPECT_EQ(reading->divisor, 1000);
    EXPECT_EQ(reading->timestamp, 0x1c531d6bu);
    EXPECT_EQ(reading->meter_mac, "0x00135003002f1234");
}

TEST(RavenDeviceTest, DecodesNegativeDemand) {
    auto reading = RavenDevice::decode_instantaneous_demand(single_fragment(
        "<InstantaneousDemand>"
        "<MeterMacId>0x00135003002f1234</MeterMacId>"
        "<TimeStamp>0x1c531d6b</TimeStamp>"
        "<Demand>0xfffffe0c</Demand>"
        "<Multiplier>0x00000001</Multiplier>"
        "<Divisor>0x000003e8</Divisor>"
        "</InstantaneousDemand>"));
    ASSERT_TRUE(reading.has_value());
    EXPECT_EQ(reading->value, -500);
}

TEST(RavenDeviceTest, ZeroScaleFieldsMeanOne) {
    auto reading = RavenDevice::decode_instantaneous_demand(single_fragment(
        "<InstantaneousDemand>"
        "<TimeStamp>0x1c531d6b</TimeStamp>"
        "<Demand>0x0000032d</Demand>"
        "<Multiplier>0x00000000</Multiplier>"
        "<Divisor>0x00000000</Divisor>"
        "</InstantaneousDemand>"));
    ASSERT_TRUE(reading.has_value());
    EXPECT_EQ(reading->value, 813);
    EXPECT_EQ(reading->multiplier, 1);
    EXPECT_EQ(reading->divisor, 1);
}

TEST(RavenDeviceTest, ZeroTimestampMeansNoAnswer) {
    auto reading = RavenDevice::decode_instantaneous_demand(single_fragment(
        "<InstantaneousDemand>"
        "<TimeStamp>0x00000000</TimeStamp>"
        "<Demand>0x0000032d</Demand>"
        "</InstantaneousDemand>"));
    ASSERT_TRUE(reading.has_value());
    EXPECT_FALSE(reading->timestamp.has_value());
}

TEST(RavenDeviceTest, DecodesDeviceInfo) {
    auto info = RavenDevice::decode_device_info(single_fragment(
        "<DeviceInfo>"
        "<DeviceMacId>0xd8d5b90000001234</DeviceMacId>"
        "<FWVersion>2.0.0 (7400)</FWVersion>"
        "<Manufacturer>Rainforest Automation, Inc.</Manufacturer>"
        "<ModelId>Z105-2-EMU2-LEDD_JM</ModelId>"
        "</DeviceInfo>"));
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->device_mac, "0xd8d5b90000001234");
    EXPECT_EQ(info->fw_version, "2.0.0 (7400)");
    EXPECT_EQ(info->manufacturer, "Rainforest Automation, Inc.");
    EXPECT_EQ(info->model_id, "Z105-2-EMU2-LEDD_JM");
}

TEST(RavenDeviceTest, DisconnectedDeviceIsSilent) {
    RavenDevice device(std::chrono::seconds(1));
    EXPECT_FALSE(device.is_connected());
    EXPECT_FALSE(device.get_current_summation().has_value());
    EXPECT_FALSE(device.connect("/nonexistent/tty"));
}
