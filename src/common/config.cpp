#include "common/config.hpp"

#include <filesystem>
#include <fstream>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace hourglass {

namespace {

std::string homeDir()
{
    const QString home = qEnvironmentVariable("HOME");
    return home.isEmpty() ? std::string(".") : home.toStdString();
}

std::set<std::string> defaultPassiveBundleIds()
{
    return {
        "org.videolan.vlc",
        "mpv",
        "com.apple.QuickTimePlayerX",
        "com.apple.Preview",
        "org.gnome.Evince",
        "org.kde.okular"
    };
}

std::set<std::string> defaultIgnoredDomains()
{
    return {
        "google.com",
        "github.com",
        "stackoverflow.com",
        "apple.com",
        "youtube.com",
        "twitter.com",
        "x.com",
        "reddit.com",
        "localhost",
        "127.0.0.1",
        "chatgpt.com",
        "claude.ai"
    };
}

std::set<std::string> stringSet(const nlohmann::json &value)
{
    std::set<std::string> out;
    if (!value.is_array()) {
        return out;
    }
    for (const auto &item : value) {
        if (item.is_string()) {
            out.insert(item.get<std::string>());
        }
    }
    return out;
}

int positiveOr(int value, int fallback)
{
    return value > 0 ? value : fallback;
}

HourglassConfig defaults()
{
    HourglassConfig config;
    config.databasePath = defaultDatabasePath();
    config.passiveBundleIds = defaultPassiveBundleIds();
    config.suggestionIgnoredDomains = defaultIgnoredDomains();
    return config;
}

void applyJson(HourglassConfig &config, const nlohmann::json &j)
{
    config.sampleIntervalSeconds = positiveOr(
        j.value("sampleIntervalSeconds", config.sampleIntervalSeconds),
        config.sampleIntervalSeconds);
    config.idleThresholdSeconds = positiveOr(
        j.value("idleThresholdSeconds", config.idleThresholdSeconds),
        config.idleThresholdSeconds);
    config.sensorCommand = j.value("sensorCommand", config.sensorCommand);
    config.sensorTimeoutMs = positiveOr(
        j.value("sensorTimeoutMs", config.sensorTimeoutMs),
        config.sensorTimeoutMs);
    config.databasePath = j.value("databasePath", config.databasePath);
    if (j.contains("passiveBundleIds")) {
        config.passiveBundleIds = stringSet(j.at("passiveBundleIds"));
    }
    config.suggestionMinActivities = positiveOr(
        j.value("suggestionMinActivities", config.suggestionMinActivities),
        config.suggestionMinActivities);
    config.suggestionMinApps = positiveOr(
        j.value("suggestionMinApps", config.suggestionMinApps),
        config.suggestionMinApps);
    if (j.contains("suggestionIgnoredDomains")) {
        config.suggestionIgnoredDomains = stringSet(j.at("suggestionIgnoredDomains"));
    }
}

void applyEnvironment(HourglassConfig &config)
{
    const QString dbPath = qEnvironmentVariable("HOURGLASS_DB_PATH");
    if (!dbPath.isEmpty()) {
        config.databasePath = dbPath.toStdString();
    }
    const QString sensor = qEnvironmentVariable("HOURGLASS_SENSOR_COMMAND");
    if (!sensor.isEmpty()) {
        config.sensorCommand = sensor.toStdString();
    }
    bool ok = false;
    const int interval = qEnvironmentVariableIntValue("HOURGLASS_SAMPLE_INTERVAL", &ok);
    if (ok && interval > 0) {
        config.sampleIntervalSeconds = interval;
    }
}

} // namespace

std::string configFilePath()
{
    return homeDir() + "/.config/hourglass/config.json";
}

std::string defaultDatabasePath()
{
    return homeDir() + "/.local/share/hourglass/hourglass.db";
}

HourglassConfig loadConfigFromFile(const std::string &path)
{
    HourglassConfig config = defaults();
    if (!std::filesystem::exists(path)) {
        return config;
    }

    try {
        std::ifstream in(path);
        nlohmann::json j;
        in >> j;
        if (!j.is_object()) {
            throw std::runtime_error("top-level value is not an object");
        }
        applyJson(config, j);
    } catch (const std::exception &ex) {
        HGLOG_WARN("config",
                   "loadConfigFromFile",
                   "config_parse_failed",
                   "config file is malformed",
                   "nlohmann::json",
                   ::hourglass::logging::defaultWho(),
                   "",
                   (nlohmann::json{{"path", path}, {"error", ex.what()}}));
        config = defaults();
    }
    return config;
}

HourglassConfig loadConfig()
{
    HourglassConfig config = loadConfigFromFile(configFilePath());
    applyEnvironment(config);
    return config;
}

} // namespace hourglass
