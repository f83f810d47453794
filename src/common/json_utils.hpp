#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace hourglass {

inline std::tm toLocalTm(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    localtime_r(&time, &tm);
    return tm;
}

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

// Local calendar day, "YYYY-MM-DD".
inline std::string localDateString(std::chrono::system_clock::time_point timestamp)
{
    const std::tm tm = toLocalTm(timestamp);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d");
    return out.str();
}

// Local wall-clock label, "HH:MM".
inline std::string localTimeLabel(std::chrono::system_clock::time_point timestamp)
{
    const std::tm tm = toLocalTm(timestamp);
    std::ostringstream out;
    out << std::put_time(&tm, "%H:%M");
    return out.str();
}

inline std::string todayLocalDate()
{
    return localDateString(std::chrono::system_clock::now());
}

inline std::int64_t toEpochMillis(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               timestamp.time_since_epoch())
        .count();
}

inline std::chrono::system_clock::time_point fromEpochMillis(std::int64_t millis)
{
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
}

inline std::optional<std::tm> parseDateString(const std::string &value)
{
    if (value.size() != 10 || value[4] != '-' || value[7] != '-') {
        return std::nullopt;
    }
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%d");
    if (in.fail()) {
        return std::nullopt;
    }
    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31) {
        return std::nullopt;
    }
    return tm;
}

inline bool isValidDateString(const std::string &value)
{
    return parseDateString(value).has_value();
}

// Shifts a "YYYY-MM-DD" date by whole days. Computed at local noon so DST
// transitions never skip or repeat a day.
inline std::string addDays(const std::string &date, int days)
{
    std::optional<std::tm> parsed = parseDateString(date);
    if (!parsed) {
        return date;
    }
    std::tm tm = *parsed;
    tm.tm_mday += days;
    tm.tm_hour = 12;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    tm.tm_isdst = -1;
    const std::time_t time = std::mktime(&tm);
    return localDateString(std::chrono::system_clock::from_time_t(time));
}

inline std::string toRuleTypeString(RuleType type)
{
    switch (type) {
    case RuleType::TerminalFolder:
        return "terminal-folder";
    case RuleType::UrlDomain:
        return "url-domain";
    case RuleType::UrlPath:
        return "url-path";
    case RuleType::PageTitle:
        return "page-title";
    case RuleType::DesignFile:
        return "design-file";
    case RuleType::BundleId:
        return "bundle-id";
    case RuleType::WindowTitle:
        return "window-title";
    }
    return "window-title";
}

inline std::optional<RuleType> parseRuleTypeString(const std::string &value)
{
    if (value == "terminal-folder") {
        return RuleType::TerminalFolder;
    }
    if (value == "url-domain") {
        return RuleType::UrlDomain;
    }
    if (value == "url-path") {
        return RuleType::UrlPath;
    }
    if (value == "page-title") {
        return RuleType::PageTitle;
    }
    if (value == "design-file") {
        return RuleType::DesignFile;
    }
    if (value == "bundle-id") {
        return RuleType::BundleId;
    }
    if (value == "window-title") {
        return RuleType::WindowTitle;
    }
    return std::nullopt;
}

inline std::string toProjectSourceString(ProjectSource source)
{
    switch (source) {
    case ProjectSource::Auto:
        return "auto";
    case ProjectSource::Manual:
        return "manual";
    case ProjectSource::Suggestion:
        return "suggestion";
    }
    return "auto";
}

inline std::optional<ProjectSource> parseProjectSourceString(const std::string &value)
{
    if (value == "auto") {
        return ProjectSource::Auto;
    }
    if (value == "manual") {
        return ProjectSource::Manual;
    }
    if (value == "suggestion") {
        return ProjectSource::Suggestion;
    }
    return std::nullopt;
}

template <typename T>
nlohmann::json optionalToJson(const std::optional<T> &value)
{
    if (!value) {
        return nullptr;
    }
    return nlohmann::json(*value);
}

inline void to_json(nlohmann::json &j, const RuleType &type)
{
    j = toRuleTypeString(type);
}

inline void to_json(nlohmann::json &j, const ProjectSource &source)
{
    j = toProjectSourceString(source);
}

inline void to_json(nlohmann::json &j, const ActivityRecord &record)
{
    j = nlohmann::json{
        {"id", record.id},
        {"timestamp", toIso8601Utc(record.timestamp)},
        {"time", localTimeLabel(record.timestamp)},
        {"appName", record.appName},
        {"bundleId", record.bundleId},
        {"windowTitle", record.windowTitle},
        {"url", optionalToJson(record.url)},
        {"extraInfo", optionalToJson(record.extraInfo)},
        {"durationSeconds", record.durationSeconds},
        {"date", record.date},
        {"projectId", optionalToJson(record.projectId)},
        {"projectSource", optionalToJson(record.projectSource)}
    };
}

inline void to_json(nlohmann::json &j, const Brand &brand)
{
    j = nlohmann::json{
        {"id", brand.id},
        {"name", brand.name},
        {"color", brand.color},
        {"sortOrder", brand.sortOrder}
    };
}

inline void to_json(nlohmann::json &j, const Project &project)
{
    j = nlohmann::json{
        {"id", project.id},
        {"brandId", project.brandId},
        {"name", project.name},
        {"color", project.color},
        {"sortOrder", project.sortOrder}
    };
}

inline void to_json(nlohmann::json &j, const ProjectRule &rule)
{
    j = nlohmann::json{
        {"id", rule.id},
        {"projectId", rule.projectId},
        {"ruleType", rule.ruleType},
        {"pattern", rule.pattern},
        {"isRegex", rule.isRegex},
        {"priority", rule.priority}
    };
}

inline void to_json(nlohmann::json &j, const WindowDetail &window)
{
    j = nlohmann::json{
        {"title", window.title},
        {"url", optionalToJson(window.url)},
        {"extraInfo", optionalToJson(window.extraInfo)},
        {"totalSeconds", window.totalSeconds},
        {"activityIds", window.activityIds}
    };
}

inline void to_json(nlohmann::json &j, const AppSummary &app)
{
    j = nlohmann::json{
        {"appName", app.appName},
        {"bundleId", app.bundleId},
        {"totalSeconds", app.totalSeconds},
        {"windows", app.windows}
    };
}

inline void to_json(nlohmann::json &j, const DaySummary &day)
{
    j = nlohmann::json{
        {"date", day.date},
        {"totalSeconds", day.totalSeconds},
        {"apps", day.apps},
        {"wallClockSeconds", day.wallClockSeconds},
        {"activeTrackingSeconds", day.activeTrackingSeconds},
        {"firstActivity", optionalToJson(day.firstActivity)},
        {"lastActivity", optionalToJson(day.lastActivity)}
    };
}

inline void to_json(nlohmann::json &j, const DayTotal &day)
{
    j = nlohmann::json{{"date", day.date}, {"totalSeconds", day.totalSeconds}};
}

inline void to_json(nlohmann::json &j, const AppDetailReport &report)
{
    j = nlohmann::json{
        {"appName", report.appName},
        {"totalSeconds", report.totalSeconds},
        {"days", report.days},
        {"topWindows", report.topWindows}
    };
}

inline void to_json(nlohmann::json &j, const AppBreakdownEntry &entry)
{
    j = nlohmann::json{{"appName", entry.appName}, {"seconds", entry.seconds}};
}

inline void to_json(nlohmann::json &j, const ProjectSummary &project)
{
    j = nlohmann::json{
        {"projectId", project.projectId},
        {"projectName", project.projectName},
        {"color", project.color},
        {"totalSeconds", project.totalSeconds},
        {"appBreakdown", project.appBreakdown}
    };
}

inline void to_json(nlohmann::json &j, const BrandSummary &brand)
{
    j = nlohmann::json{
        {"brandId", brand.brandId},
        {"brandName", brand.brandName},
        {"color", brand.color},
        {"totalSeconds", brand.totalSeconds},
        {"projects", brand.projects}
    };
}

inline void to_json(nlohmann::json &j, const SuggestedRule &rule)
{
    j = nlohmann::json{
        {"ruleType", rule.ruleType},
        {"pattern", rule.pattern},
        {"isRegex", rule.isRegex}
    };
}

inline void to_json(nlohmann::json &j, const DetectedProject &project)
{
    j = nlohmann::json{
        {"token", project.token},
        {"suggestedName", project.suggestedName},
        {"activityCount", project.activityCount},
        {"totalSeconds", project.totalSeconds},
        {"apps", project.apps},
        {"activityIds", project.activityIds},
        {"suggestedRules", project.suggestedRules}
    };
}

inline void to_json(nlohmann::json &j, const DetectedBrand &brand)
{
    j = nlohmann::json{
        {"rootToken", brand.rootToken},
        {"suggestedName", brand.suggestedName},
        {"projects", brand.projects},
        {"totalActivities", brand.totalActivities},
        {"totalSeconds", brand.totalSeconds}
    };
}

} // namespace hourglass
