#include "discovery.hpp"
#include "logger.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace {

struct SensorTraits {
    const char* title;
    const char* unit;
    const char* state_class;
    const char* device_class;
};

SensorTraits traits_for(ReadingKind kind) {
    switch (kind) {
        case ReadingKind::CurrentSummation:
            return {"Current Summation", "kWh", "total_increasing", "energy"};
        case ReadingKind::InstantaneousDemand:
            return {"Instantaneous Demand", "kW", "measurement", "power"};
    }
    throw std::logic_error("Unknown reading kind");
}

}

TopicLayout::TopicLayout(const std::string& discovery_prefix, const std::string& app_id, const std::string& meter_mac)
    : base(discovery_prefix + "/sensor/" + app_id + "-" + meter_mac) {}

std::string TopicLayout::availability() const {
    return base + "/availability";
}

std::string TopicLayout::config(ReadingKind kind) const {
    return base + "/" + reading_kind_id(kind) + "/config";
}

std::string TopicLayout::state(ReadingKind kind) const {
    return base + "/" + reading_kind_id(kind) + "/state";
}

DiscoveryPublisher::DiscoveryPublisher(TelemetryClient& telemetry, TopicLayout layout, DeviceInfo info, std::string meter)
    : client(telemetry),
      topics(std::move(layout)),
      device(std::move(info)),
      meter_mac(std::move(meter)) {}

json DiscoveryPublisher::device_block() const {
    return {
        {"manufacturer", device.manufacturer},
        {"model", device.model_id},
        {"name", device.model_id},
        {"sw_version", device.fw_version},
        {"identifiers", json::array({device.device_mac})},
    };
}

json DiscoveryPublisher::descriptor(ReadingKind kind) const {
    SensorTraits traits = traits_for(kind);
    return {
        {"name", std::string(kDisplayPrefix) + " " + traits.title + " " + meter_mac},
        {"unique_id", meter_mac + "_" + reading_kind_id(kind)},
        {"state_topic", topics.state(kind)},
        {"availability_topic", topics.availability()},
        {"device", device_block()},
        {"unit_of_measurement", traits.unit},
        {"state_class", traits.state_class},
        {"device_class", traits.device_class},
        {"value_template", "{{ value_json.reading }}"},
    };
}

void DiscoveryPublisher::register_availability() {
    client.set_last_will(topics.availability(), kOffline, true);

    std::string topic = topics.availability();
    TelemetryClient& telemetry = client;
    client.on_connect([&telemetry, topic] {
        Logger::info("Announcing availability on " + topic);
        telemetry.publish(topic, kOnline, true);
    });
}

void DiscoveryPublisher::publish_descriptors() {
    if (descriptors_published) {
        Logger::warning("Discovery descriptors already published for meter " + meter_mac);
        return;
    }

    for (ReadingKind kind : {ReadingKind::CurrentSummation, ReadingKind::InstantaneousDemand}) {
        std::string topic = topics.config(kind);
        client.publish(topic, descriptor(kind).dump(), true);
        Logger::info("Published discovery config to " + topic);
    }
    descriptors_published = true;
}
