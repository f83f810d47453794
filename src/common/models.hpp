#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace hourglass {

// One contiguous session of a single window identity. Timestamps are stored
// with millisecond precision; date is the local calendar day of timestamp.
struct ActivityRecord {
    std::int64_t id = 0;
    std::chrono::system_clock::time_point timestamp;
    std::string appName;
    std::string bundleId;
    std::string windowTitle;
    std::optional<std::string> url;
    std::optional<std::string> extraInfo;
    int durationSeconds = 0;
    std::string date;
    std::optional<std::int64_t> projectId;
    std::optional<ProjectSource> projectSource;
};

struct Brand {
    std::int64_t id = 0;
    std::string name;
    std::string color;
    int sortOrder = 0;
};

struct Project {
    std::int64_t id = 0;
    std::int64_t brandId = 0;
    std::string name;
    std::string color;
    int sortOrder = 0;
};

struct ProjectRule {
    std::int64_t id = 0;
    std::int64_t projectId = 0;
    RuleType ruleType = RuleType::WindowTitle;
    std::string pattern;
    bool isRegex = false;
    int priority = 0;
};

// One sensor sample. idleSeconds, when present, is compared against the
// configured idle threshold; otherwise the idle flag alone decides.
struct Heartbeat {
    std::string appName;
    std::string bundleId;
    std::string windowTitle;
    std::optional<std::string> url;
    std::optional<std::string> extraInfo;
    bool idle = false;
    std::optional<int> idleSeconds;
    std::chrono::system_clock::time_point timestamp;
};

struct WindowDetail {
    std::string title;
    std::optional<std::string> url;
    std::optional<std::string> extraInfo;
    int totalSeconds = 0;
    std::vector<std::int64_t> activityIds;
};

struct AppSummary {
    std::string appName;
    std::string bundleId;
    int totalSeconds = 0;
    std::vector<WindowDetail> windows;
};

struct DaySummary {
    std::string date;
    int totalSeconds = 0;
    std::vector<AppSummary> apps;
    int wallClockSeconds = 0;
    int activeTrackingSeconds = 0;
    std::optional<std::string> firstActivity;
    std::optional<std::string> lastActivity;
};

struct DayTotal {
    std::string date;
    int totalSeconds = 0;
};

struct AppDetailReport {
    std::string appName;
    int totalSeconds = 0;
    std::vector<DayTotal> days;
    std::vector<WindowDetail> topWindows;
};

struct AppBreakdownEntry {
    std::string appName;
    int seconds = 0;
};

struct ProjectSummary {
    std::int64_t projectId = 0;
    std::string projectName;
    std::string color;
    int totalSeconds = 0;
    std::vector<AppBreakdownEntry> appBreakdown;
};

struct BrandSummary {
    std::int64_t brandId = 0;
    std::string brandName;
    std::string color;
    int totalSeconds = 0;
    std::vector<ProjectSummary> projects;
};

struct SuggestedRule {
    RuleType ruleType = RuleType::WindowTitle;
    std::string pattern;
    bool isRegex = false;
};

struct DetectedProject {
    std::string token;
    std::string suggestedName;
    int activityCount = 0;
    int totalSeconds = 0;
    std::vector<std::string> apps;
    std::vector<std::int64_t> activityIds;
    std::vector<SuggestedRule> suggestedRules;
};

struct DetectedBrand {
    std::string rootToken;
    std::string suggestedName;
    std::vector<DetectedProject> projects;
    int totalActivities = 0;
    int totalSeconds = 0;
};

// Either existingProjectId or brandName must be set. An empty projectName
// falls back to the brand name.
struct AcceptRequest {
    std::optional<std::int64_t> existingProjectId;
    std::string brandName;
    std::string projectName;
    std::string color;
    std::vector<SuggestedRule> rules;
};

} // namespace hourglass
