#pragma once

#include <optional>
#include <string>

#include "common/models.hpp"

namespace hourglass {

// Produces one heartbeat per sampling tick, or nothing when no sample is
// available this tick.
class HeartbeatSource {
public:
    virtual ~HeartbeatSource() = default;
    virtual std::optional<Heartbeat> next() = 0;
};

// Runs an external sensor command each tick and reads one JSON object from
// its stdout.
class CommandHeartbeatSource : public HeartbeatSource {
public:
    CommandHeartbeatSource(std::string command, int timeoutMs);

    std::optional<Heartbeat> next() override;

private:
    std::string m_command;
    int m_timeoutMs = 0;
};

// Parses the sensor payload. Keys: appName (required), bundleId, windowTitle,
// url, extra, idle, idleSeconds, timestamp (ISO-8601, default now).
std::optional<Heartbeat> parseHeartbeatJson(const std::string &payload);

} // namespace hourglass
