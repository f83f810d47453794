#pragma once

#include <set>
#include <string>

namespace hourglass {

struct HourglassConfig {
    int sampleIntervalSeconds = 2;
    int idleThresholdSeconds = 600;
    std::string sensorCommand;
    int sensorTimeoutMs = 1500;
    std::string databasePath;
    std::set<std::string> passiveBundleIds;
    int suggestionMinActivities = 2;
    int suggestionMinApps = 1;
    std::set<std::string> suggestionIgnoredDomains;
};

// $HOME/.config/hourglass/config.json
std::string configFilePath();

// $HOME/.local/share/hourglass/hourglass.db
std::string defaultDatabasePath();

// Defaults, then the config file, then HOURGLASS_* environment overrides.
// A missing file is not an error; a malformed one is logged and ignored.
HourglassConfig loadConfig();

HourglassConfig loadConfigFromFile(const std::string &path);

} // namespace hourglass
