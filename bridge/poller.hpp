// bridge/poller.hpp
#pragma once
#include "decimal.hpp"
#include "discovery.hpp"
#include "meter_device.hpp"
#include "telemetry_client.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

enum class PollState {
    Polling,
    Resetting
};

enum class CycleOutcome {
    Published,   // both readings went out, then slept
    BackedOff,   // non-response under the threshold, slept
    Reset        // threshold exceeded, link reopened, no sleep
};

// Everything the loop mutates between cycles. Only the polling thread
// touches it.
struct PollingSession {
    int unresponsive{0};
    PollState state{PollState::Polling};
    uint64_t cycles{0};
    uint64_t published{0};
    uint64_t resets{0};
};

struct PollerSettings {
    std::string serial_path;
    std::chrono::seconds interval{10};
    int unresponsive_max{3};
};

class Poller {
public:
    using SleepFn = std::function<void(std::chrono::seconds)>;

private:
    MeterDevice& device;
    TelemetryClient& client;
    TopicLayout topics;
    PollerSettings settings;
    SleepFn sleep;

    CycleOutcome handle_non_response(PollingSession& session, ReadingKind kind);
    void reset_connection(PollingSession& session);
    void publish_reading(ReadingKind kind, const Decimal& value);

public:
    Poller(MeterDevice& meter, TelemetryClient& telemetry, TopicLayout layout,
           PollerSettings poller_settings, SleepFn sleep_fn = nullptr);

    // One request/convert/publish pass over both readings. Throws DeviceError
    // if the link has to be reset and cannot be reopened.
    CycleOutcome run_cycle(PollingSession& session);

    // Never returns normally.
    void run(PollingSession& session);

    static bool answered(const std::optional<RawReading>& reading);
    static std::string state_payload(const Decimal& value);
};
