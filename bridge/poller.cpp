#include "poller.hpp"
#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <thread>

namespace {

const char* reading_title(ReadingKind kind) {
    return kind == ReadingKind::CurrentSummation ? "current summation" : "instantaneous demand";
}

}

Poller::Poller(MeterDevice& meter, TelemetryClient& telemetry, TopicLayout layout,
               PollerSettings poller_settings, SleepFn sleep_fn)
    : device(meter),
      client(telemetry),
      topics(std::move(layout)),
      settings(std::move(poller_settings)),
      sleep(std::move(sleep_fn)) {
    if (!sleep) {
        sleep = [](std::chrono::seconds duration) { std::this_thread::sleep_for(duration); };
    }
}

bool Poller::answered(const std::optional<RawReading>& reading) {
    return reading.has_value() && reading->timestamp.has_value();
}

std::string Poller::state_payload(const Decimal& value) {
    return nlohmann::json{{"reading", value.to_double()}}.dump();
}

CycleOutcome Poller::run_cycle(PollingSession& session) {
    session.cycles++;

    // Readings are requested one by one instead of through the device's
    // own push schedule, which does not deliver reliably.
    Logger::info("Requesting data...");
    auto summation_response = device.get_current_summation();
    if (!answered(summation_response)) {
        return handle_non_response(session, ReadingKind::CurrentSummation);
    }
    session.unresponsive = 0;
    Decimal summation = convert_reading(summation_response->value,
                                        summation_response->multiplier,
                                        summation_response->divisor);

    auto demand_response = device.get_instantaneous_demand();
    if (!answered(demand_response)) {
        return handle_non_response(session, ReadingKind::InstantaneousDemand);
    }
    session.unresponsive = 0;
    Decimal demand = convert_reading(demand_response->value,
                                     demand_response->multiplier,
                                     demand_response->divisor);

    publish_reading(ReadingKind::CurrentSummation, summation);
    publish_reading(ReadingKind::InstantaneousDemand, demand);
    session.published++;

    Logger::debug("Sleeping...");
    sleep(settings.interval);
    return CycleOutcome::Published;
}

CycleOutcome Poller::handle_non_response(PollingSession& session, ReadingKind kind) {
    session.unresponsive++;

    if (session.unresponsive > settings.unresponsive_max) {
        Logger::warning("Too many non-responses (" + std::to_string(session.unresponsive) +
                        "), resetting connection to " + settings.serial_path);
        reset_connection(session);
        return CycleOutcome::Reset;
    }

    Logger::info(std::string("Empty ") + reading_title(kind) + " response, going back to sleep");
    sleep(settings.interval);
    return CycleOutcome::BackedOff;
}

void Poller::reset_connection(PollingSession& session) {
    session.state = PollState::Resetting;
    device.disconnect();
    if (!device.connect(settings.serial_path)) {
        throw DeviceError("Failed to reopen device on " + settings.serial_path);
    }
    session.unresponsive = 0;
    session.resets++;
    session.state = PollState::Polling;
    Logger::info("Device link reset " + std::to_string(session.resets) + " time(s) in " +
                 std::to_string(session.cycles) + " cycles");
}

void Poller::publish_reading(ReadingKind kind, const Decimal& value) {
    if (kind == ReadingKind::CurrentSummation) {
        Logger::info("Current summation delivered: " + value.to_string() + " kWh");
    } else {
        Logger::info("Instantaneous demand: " + value.to_string() + " kW");
    }
    client.publish(topics.state(kind), state_payload(value), true);
}

void Poller::run(PollingSession& session) {
    if (!device.is_connected()) {
        throw DeviceError("Polling started without a device connection");
    }
    if (!client.is_connected()) {
        Logger::warning("Telemetry client not connected yet; readings will queue until it is");
    }
    Logger::info("Polling every " + std::to_string(settings.interval.count()) + "s, resetting after " +
                 std::to_string(settings.unresponsive_max) + " consecutive non-responses");
    while (true) {
        run_cycle(session);
    }
}
