#include "daemon/heartbeat_source.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>
#include <utility>

#include <QDateTime>
#include <QProcess>
#include <QStringList>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace hourglass {

namespace {

std::optional<std::string> optionalString(const nlohmann::json &j, const char *key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    const std::string value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::chrono::system_clock::time_point parseTimestamp(const nlohmann::json &j)
{
    const std::optional<std::string> text = optionalString(j, "timestamp");
    if (!text) {
        return std::chrono::system_clock::now();
    }
    const QDateTime parsed = QDateTime::fromString(QString::fromStdString(*text), Qt::ISODateWithMs);
    if (!parsed.isValid()) {
        return std::chrono::system_clock::now();
    }
    return std::chrono::system_clock::time_point(
        std::chrono::milliseconds(parsed.toMSecsSinceEpoch()));
}

void logSensorProblem(const char *what, const char *why, nlohmann::json context)
{
    HGLOG_WARN("sensor",
               "CommandHeartbeatSource::next",
               what,
               why,
               "QProcess",
               ::hourglass::logging::defaultWho(),
               "",
               context);
}

} // namespace

std::optional<Heartbeat> parseHeartbeatJson(const std::string &payload)
{
    const nlohmann::json j = nlohmann::json::parse(payload, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    const std::optional<std::string> appName = optionalString(j, "appName");
    if (!appName) {
        return std::nullopt;
    }

    Heartbeat heartbeat;
    heartbeat.appName = *appName;
    heartbeat.bundleId = optionalString(j, "bundleId").value_or(std::string());
    heartbeat.windowTitle = optionalString(j, "windowTitle").value_or(std::string());
    heartbeat.url = optionalString(j, "url");
    heartbeat.extraInfo = optionalString(j, "extra");
    if (auto it = j.find("idle"); it != j.end() && it->is_boolean()) {
        heartbeat.idle = it->get<bool>();
    }
    if (auto it = j.find("idleSeconds"); it != j.end() && it->is_number_integer()) {
        const std::int64_t seconds = it->is_number_unsigned()
            ? static_cast<std::int64_t>(std::min<std::uint64_t>(it->get<std::uint64_t>(),
                                                                 std::numeric_limits<int>::max()))
            : it->get<std::int64_t>();
        heartbeat.idleSeconds = static_cast<int>(
            std::clamp<std::int64_t>(seconds, 0, std::numeric_limits<int>::max()));
    }
    heartbeat.timestamp = parseTimestamp(j);
    return heartbeat;
}

CommandHeartbeatSource::CommandHeartbeatSource(std::string command, int timeoutMs)
    : m_command(std::move(command))
    , m_timeoutMs(timeoutMs)
{
}

std::optional<Heartbeat> CommandHeartbeatSource::next()
{
    QStringList parts = QProcess::splitCommand(QString::fromStdString(m_command));
    if (parts.isEmpty()) {
        return std::nullopt;
    }
    const QString program = parts.takeFirst();

    QProcess process;
    process.start(program, parts);
    if (!process.waitForStarted(m_timeoutMs)) {
        logSensorProblem("sensor_start_failed", "sensor command did not start",
                         nlohmann::json{{"command", m_command}});
        return std::nullopt;
    }
    process.closeWriteChannel();

    if (!process.waitForFinished(m_timeoutMs)) {
        process.kill();
        process.waitForFinished();
        logSensorProblem("sensor_timeout", "sensor command exceeded timeout",
                         nlohmann::json{{"command", m_command}, {"timeoutMs", m_timeoutMs}});
        return std::nullopt;
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        logSensorProblem("sensor_failed", "sensor command exited with an error",
                         nlohmann::json{{"command", m_command}, {"exitCode", process.exitCode()}});
        return std::nullopt;
    }

    const std::string output = process.readAllStandardOutput().trimmed().toStdString();
    std::optional<Heartbeat> heartbeat = parseHeartbeatJson(output);
    if (!heartbeat) {
        logSensorProblem("sensor_output_invalid", "sensor output is not a heartbeat object",
                         nlohmann::json{{"command", m_command}});
    }
    return heartbeat;
}

} // namespace hourglass
