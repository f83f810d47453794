#include "report/ReportCli.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <map>
#include <optional>
#include <vector>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"
#include "daemon/activity_store.hpp"
#include "daemon/rule_engine.hpp"
#include "daemon/suggestion_engine.hpp"

namespace hourglass {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  hourglass-report day [--date YYYY-MM-DD] [--format markdown|json]\n"
        "  hourglass-report week [--today YYYY-MM-DD] [--format markdown|json]\n"
        "  hourglass-report month [--month YYYY-MM] [--format markdown|json]\n"
        "  hourglass-report range --from YYYY-MM-DD --to YYYY-MM-DD [--format markdown|json]\n"
        "  hourglass-report app --name APP [--format markdown|json]\n"
        "  hourglass-report timeline [--date YYYY-MM-DD] [--format markdown|json]\n"
        "  hourglass-report projects [--date YYYY-MM-DD] [--format markdown|json]\n"
        "  hourglass-report unassigned [--date YYYY-MM-DD] [--min-seconds N] [--format markdown|json]\n"
        "  hourglass-report brand add --name NAME [--color HEX]\n"
        "  hourglass-report brand update --id ID [--name NAME] [--color HEX] [--sort N]\n"
        "  hourglass-report brand delete --id ID\n"
        "  hourglass-report brand merge --source ID --target ID\n"
        "  hourglass-report brand list\n"
        "  hourglass-report project add --brand-id ID --name NAME [--color HEX]\n"
        "  hourglass-report project update --id ID [--name NAME] [--color HEX] [--brand-id ID] [--sort N]\n"
        "  hourglass-report project delete --id ID\n"
        "  hourglass-report project list\n"
        "  hourglass-report rule add --project-id ID --type TYPE --pattern P [--regex] [--priority N]\n"
        "  hourglass-report rule update --id ID [--pattern P] [--regex true|false] [--priority N]\n"
        "  hourglass-report rule delete --id ID\n"
        "  hourglass-report rule list [--project-id ID]\n"
        "  hourglass-report classify --project-id ID --ids ID,ID,... [--rule-type TYPE --pattern P]\n"
        "  hourglass-report auto-assign [--date YYYY-MM-DD]\n"
        "  hourglass-report suggest detect\n"
        "  hourglass-report suggest accept (--project-id ID | --brand NAME [--project NAME])\n"
        "                                  [--color HEX] --rule TYPE=PATTERN [--regex-rule TYPE=PATTERN]\n"
        "  hourglass-report suggest dismiss --token TOKEN\n"
        "  hourglass-report suggest restore --token TOKEN\n"
        "  hourglass-report suggest dismissed\n"
        "\n"
        "Rule types: terminal-folder, url-domain, url-path, page-title, design-file,\n"
        "            bundle-id, window-title\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QStringList getArgValues(const QStringList &args, const QString &key)
{
    QStringList values;
    for (int i = 0; i + 1 < args.size(); ++i) {
        if (args.at(i) == key) {
            values.push_back(args.at(i + 1));
        }
    }
    return values;
}

bool hasFlag(const QStringList &args, const QString &key)
{
    return args.contains(key);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("markdown");
    }
    return value.toLower();
}

void requireFormat(const QString &format)
{
    if (format != QStringLiteral("markdown") && format != QStringLiteral("json")) {
        throw ValidationError("invalid format, use markdown or json");
    }
}

std::optional<std::string> optionalArg(const QStringList &args, const QString &key)
{
    if (!hasFlag(args, key)) {
        return std::nullopt;
    }
    return getArgValue(args, key).toStdString();
}

std::string requireArg(const QStringList &args, const QString &key)
{
    const QString value = getArgValue(args, key);
    if (value.isEmpty()) {
        throw ValidationError("missing required argument " + key.toStdString());
    }
    return value.toStdString();
}

std::optional<long long> optionalIntArg(const QStringList &args, const QString &key)
{
    if (!hasFlag(args, key)) {
        return std::nullopt;
    }
    bool ok = false;
    const long long value = getArgValue(args, key).toLongLong(&ok);
    if (!ok) {
        throw ValidationError("invalid number for " + key.toStdString());
    }
    return value;
}

long long requireIntArg(const QStringList &args, const QString &key)
{
    const std::optional<long long> value = optionalIntArg(args, key);
    if (!value) {
        throw ValidationError("missing required argument " + key.toStdString());
    }
    return *value;
}

std::optional<int> optionalSmallIntArg(const QStringList &args, const QString &key)
{
    const std::optional<long long> value = optionalIntArg(args, key);
    if (!value) {
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

std::string dateArg(const QStringList &args, const QString &key)
{
    const QString value = getArgValue(args, key);
    const std::string date = value.isEmpty() ? todayLocalDate() : value.toStdString();
    if (!isValidDateString(date)) {
        throw ValidationError("invalid date '" + date + "', expected YYYY-MM-DD");
    }
    return date;
}

RuleType ruleTypeArg(const std::string &value)
{
    const std::optional<RuleType> type = parseRuleTypeString(value);
    if (!type) {
        throw ValidationError("unknown rule type '" + value + "'");
    }
    return *type;
}

// "url-domain=acme.com" -> rule
SuggestedRule parseRuleArg(const QString &text, bool isRegex)
{
    const int eq = text.indexOf(QLatin1Char('='));
    if (eq <= 0) {
        throw ValidationError("rule must be written TYPE=PATTERN, got '" + text.toStdString() + "'");
    }
    SuggestedRule rule;
    rule.ruleType = ruleTypeArg(text.left(eq).toStdString());
    rule.pattern = text.mid(eq + 1).toStdString();
    rule.isRegex = isRegex;
    return rule;
}

std::string formatDuration(int seconds)
{
    const int hours = seconds / 3600;
    const int minutes = (seconds % 3600) / 60;
    char buffer[32] = {};
    if (hours > 0) {
        std::snprintf(buffer, sizeof(buffer), "%dh %02dm", hours, minutes);
    } else if (minutes > 0) {
        std::snprintf(buffer, sizeof(buffer), "%dm", minutes);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%ds", seconds);
    }
    return buffer;
}

void printJson(const nlohmann::json &payload)
{
    std::cout << payload.dump(2) << std::endl;
}

void renderDayMarkdown(const DaySummary &day)
{
    std::cout << "# Hourglass Day Report\n\n";
    std::cout << "Date: " << day.date << "\n";
    std::cout << "Active: " << formatDuration(day.activeTrackingSeconds) << "\n";
    std::cout << "Wall clock: " << formatDuration(day.wallClockSeconds) << "\n";
    if (day.firstActivity && day.lastActivity) {
        std::cout << "Span: " << *day.firstActivity << " - " << *day.lastActivity << "\n";
    }
    std::cout << "\n## Apps\n\n";

    if (day.apps.empty()) {
        std::cout << "No activity on this day.\n";
        return;
    }

    for (const auto &app : day.apps) {
        std::cout << "- " << app.appName << ": " << formatDuration(app.totalSeconds) << "\n";
        for (const auto &window : app.windows) {
            if (window.totalSeconds <= 0) {
                continue;
            }
            std::cout << "  - " << (window.title.empty() ? "(untitled)" : window.title)
                      << ": " << formatDuration(window.totalSeconds) << "\n";
        }
    }
}

void renderDaysMarkdown(const std::string &heading, const std::vector<DaySummary> &days)
{
    std::cout << "# " << heading << "\n\n";
    int total = 0;
    std::map<std::string, int> perApp;
    for (const auto &day : days) {
        total += day.totalSeconds;
        for (const auto &app : day.apps) {
            perApp[app.appName] += app.totalSeconds;
        }
    }
    std::cout << "Total: " << formatDuration(total) << "\n\n";
    std::cout << "## Days\n\n";
    if (days.empty()) {
        std::cout << "No activity in this period.\n";
        return;
    }
    for (const auto &day : days) {
        std::cout << "- " << day.date << ": " << formatDuration(day.totalSeconds) << "\n";
    }

    std::vector<std::pair<std::string, int>> apps(perApp.begin(), perApp.end());
    std::stable_sort(apps.begin(), apps.end(), [](const auto &a, const auto &b) {
        return a.second > b.second;
    });
    std::cout << "\n## Top Apps\n\n";
    for (const auto &[name, seconds] : apps) {
        std::cout << "- " << name << ": " << formatDuration(seconds) << "\n";
    }
}

void renderDays(const QString &format, const std::string &heading,
                const std::vector<DaySummary> &days)
{
    if (format == QStringLiteral("json")) {
        printJson(nlohmann::json{{"days", days}});
    } else {
        renderDaysMarkdown(heading, days);
    }
}

void logCommand(const char *where, const char *what, const nlohmann::json &context)
{
    HGLOG_INFO(QStringLiteral("ReportCli"),
               where,
               what,
               QStringLiteral("user_invocation"),
               QStringLiteral("sqlite_query"),
               ::hourglass::logging::defaultWho(),
               QString(),
               context);
}

} // namespace

int ReportCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    HGLOG_INFO(QStringLiteral("ReportCli"),
               QStringLiteral("run"),
               QStringLiteral("report_cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               ::hourglass::logging::defaultWho(),
               QString(),
               nlohmann::json{{"command", command.toStdString()}});

    try {
        return dispatch(command, args);
    } catch (const ValidationError &ex) {
        std::cerr << "error: " << ex.what() << std::endl;
        return 2;
    } catch (const std::exception &ex) {
        HGLOG_ERROR(QStringLiteral("ReportCli"),
                    QStringLiteral("run"),
                    QStringLiteral("report_cli_failed"),
                    QStringLiteral("command threw"),
                    QStringLiteral("cli"),
                    ::hourglass::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"command", command.toStdString()}, {"error", ex.what()}}));
        std::cerr << "error: " << ex.what() << std::endl;
        return 1;
    }
}

int ReportCli::dispatch(const QString &command, const QStringList &args)
{
    if (command == QStringLiteral("help") || command == QStringLiteral("--help")) {
        std::cout << usageText().toStdString();
        return 0;
    }

    const HourglassConfig config = loadConfig();
    ActivityStore store(config.databasePath);

    if (command == QStringLiteral("day")) {
        return runDayReport(store, args);
    }
    if (command == QStringLiteral("week")) {
        return runWeekReport(store, args);
    }
    if (command == QStringLiteral("month")) {
        return runMonthReport(store, args);
    }
    if (command == QStringLiteral("range")) {
        return runRangeReport(store, args);
    }
    if (command == QStringLiteral("app")) {
        return runAppReport(store, args);
    }
    if (command == QStringLiteral("timeline")) {
        return runTimelineReport(store, args);
    }
    if (command == QStringLiteral("projects")) {
        return runProjectsReport(store, args);
    }
    if (command == QStringLiteral("unassigned")) {
        return runUnassignedReport(store, args);
    }
    if (command == QStringLiteral("brand")) {
        return runBrandCommand(store, args);
    }
    if (command == QStringLiteral("project")) {
        return runProjectCommand(store, args);
    }
    if (command == QStringLiteral("rule")) {
        return runRuleCommand(store, args);
    }
    if (command == QStringLiteral("classify")) {
        return runClassify(store, args);
    }
    if (command == QStringLiteral("auto-assign")) {
        return runAutoAssign(store, args);
    }
    if (command == QStringLiteral("suggest")) {
        return runSuggestCommand(store, args);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int ReportCli::runDayReport(ActivityStore &store, const QStringList &args)
{
    const QString format = getFormat(args);
    requireFormat(format);
    const DaySummary day = store.queryDay(dateArg(args, QStringLiteral("--date")));

    logCommand("runDayReport", "report_day",
               nlohmann::json{{"date", day.date}, {"apps", day.apps.size()}});
    if (format == QStringLiteral("json")) {
        printJson(day);
    } else {
        renderDayMarkdown(day);
    }
    return 0;
}

int ReportCli::runWeekReport(ActivityStore &store, const QStringList &args)
{
    const QString format = getFormat(args);
    requireFormat(format);
    const std::string today = dateArg(args, QStringLiteral("--today"));
    const auto days = store.queryWeek(today);

    logCommand("runWeekReport", "report_week", nlohmann::json{{"days", days.size()}});
    renderDays(format, "Hourglass Week Report (ending " + today + ")", days);
    return 0;
}

int ReportCli::runMonthReport(ActivityStore &store, const QStringList &args)
{
    const QString format = getFormat(args);
    requireFormat(format);
    const std::string today = todayLocalDate();
    QString month = getArgValue(args, QStringLiteral("--month"));
    if (month.isEmpty()) {
        month = QString::fromStdString(today.substr(0, 7));
    }
    const QStringList parts = month.split(QLatin1Char('-'));
    bool yearOk = false;
    bool monthOk = false;
    const int year = parts.size() == 2 ? parts.at(0).toInt(&yearOk) : 0;
    const int monthNumber = parts.size() == 2 ? parts.at(1).toInt(&monthOk) : 0;
    if (!yearOk || !monthOk) {
        throw ValidationError("invalid month '" + month.toStdString() + "', expected YYYY-MM");
    }

    const auto days = store.queryMonth(year, monthNumber, today);
    logCommand("runMonthReport", "report_month",
               nlohmann::json{{"month", month.toStdString()}, {"days", days.size()}});
    renderDays(format, "Hourglass Month Report (" + month.toStdString() + ")", days);
    return 0;
}

int ReportCli::runRangeReport(ActivityStore &store, const QStringList &args)
{
    const QString format = getFormat(args);
    requireFormat(format);
    const std::string from = requireArg(args, QStringLiteral("--from"));
    const std::string to = requireArg(args, QStringLiteral("--to"));
    const auto days = store.queryDays(from, to);

    logCommand("runRangeReport", "report_range",
               nlohmann::json{{"from", from}, {"to", to}, {"days", days.size()}});
    renderDays(format, "Hourglass Report " + from + " -> " + to, days);
    return 0;
}

int ReportCli::runAppReport(ActivityStore &store, const QStringList &args)
{
    const QString format = getFormat(args);
    requireFormat(format);
    const AppDetailReport report = store.queryApp(requireArg(args, QStringLiteral("--name")));

    logCommand("runAppReport", "report_app",
               nlohmann::json{{"app", report.appName}, {"days", report.days.size()}});
    if (format == QStringLiteral("json")) {
        printJson(report);
        return 0;
    }

    std::cout << "# Hourglass App Report: " << report.appName << "\n\n";
    std::cout << "Total: " << formatDuration(report.totalSeconds) << "\n\n";
    std::cout << "## Days\n\n";
    if (report.days.empty()) {
        std::cout << "No activity recorded for this app.\n";
        return 0;
    }
    for (const auto &day : report.days) {
        std::cout << "- " << day.date << ": " << formatDuration(day.totalSeconds) << "\n";
    }
    std::cout << "\n## Top Windows\n\n";
    for (const auto &window : report.topWindows) {
        std::cout << "- " << (window.title.empty() ? "(untitled)" : window.title) << ": "
                  << formatDuration(window.totalSeconds) << "\n";
    }
    return 0;
}

int ReportCli::runTimelineReport(ActivityStore &store, const QStringList &args)
{
    const QString format = getFormat(args);
    requireFormat(format);
    const std::string date = dateArg(args, QStringLiteral("--date"));
    const auto activities = store.queryTimeline(date);

    logCommand("runTimelineReport", "report_timeline",
               nlohmann::json{{"date", date}, {"activities", activities.size()}});
    if (format == QStringLiteral("json")) {
        printJson(nlohmann::json{{"date", date}, {"activities", activities}});
        return 0;
    }

    std::cout << "# Hourglass Timeline: " << date << "\n\n";
    if (activities.empty()) {
        std::cout << "No activity on this day.\n";
        return 0;
    }
    for (const auto &activity : activities) {
        std::cout << "- [" << localTimeLabel(activity.timestamp) << "] " << activity.appName;
        if (!activity.windowTitle.empty()) {
            std::cout << " - " << activity.windowTitle;
        }
        std::cout << " (" << formatDuration(activity.durationSeconds) << ")\n";
    }
    return 0;
}

int ReportCli::runProjectsReport(ActivityStore &store, const QStringList &args)
{
    const QString format = getFormat(args);
    requireFormat(format);
    const std::string date = dateArg(args, QStringLiteral("--date"));
    const auto brands = store.queryDayByProject(date);

    logCommand("runProjectsReport", "report_projects",
               nlohmann::json{{"date", date}, {"brands", brands.size()}});
    if (format == QStringLiteral("json")) {
        printJson(nlohmann::json{{"date", date}, {"brands", brands}});
        return 0;
    }

    std::cout << "# Hourglass Projects: " << date << "\n\n";
    if (brands.empty()) {
        std::cout << "No assigned activity on this day.\n";
        return 0;
    }
    for (const auto &brand : brands) {
        std::cout << "## " << brand.brandName << " (" << formatDuration(brand.totalSeconds) << ")\n\n";
        for (const auto &project : brand.projects) {
            std::cout << "- " << project.projectName << ": "
                      << formatDuration(project.totalSeconds) << "\n";
            for (const auto &entry : project.appBreakdown) {
                std::cout << "  - " << entry.appName << ": " << formatDuration(entry.seconds) << "\n";
            }
        }
        std::cout << "\n";
    }
    return 0;
}

int ReportCli::runUnassignedReport(ActivityStore &store, const QStringList &args)
{
    const QString format = getFormat(args);
    requireFormat(format);
    const std::string date = dateArg(args, QStringLiteral("--date"));
    const int minSeconds = optionalSmallIntArg(args, QStringLiteral("--min-seconds")).value_or(0);
    const auto activities = store.queryUnassignedActivities(date, minSeconds);

    logCommand("runUnassignedReport", "report_unassigned",
               nlohmann::json{{"date", date}, {"activities", activities.size()}});
    if (format == QStringLiteral("json")) {
        printJson(nlohmann::json{{"date", date}, {"activities", activities}});
        return 0;
    }

    std::cout << "# Hourglass Unassigned: " << date << "\n\n";
    if (activities.empty()) {
        std::cout << "Everything on this day is assigned.\n";
        return 0;
    }
    for (const auto &activity : activities) {
        std::cout << "- #" << activity.id << " " << activity.appName;
        if (!activity.windowTitle.empty()) {
            std::cout << " - " << activity.windowTitle;
        }
        std::cout << " (" << formatDuration(activity.durationSeconds) << ")\n";
    }
    return 0;
}

int ReportCli::runBrandCommand(ActivityStore &store, const QStringList &args)
{
    const QString action = args.size() > 2 ? args.at(2) : QString();
    if (action == QStringLiteral("add")) {
        const std::int64_t id = store.insertBrand(requireArg(args, QStringLiteral("--name")),
                                                  getArgValue(args, QStringLiteral("--color")).toStdString());
        printJson(nlohmann::json{{"id", id}});
        return 0;
    }
    if (action == QStringLiteral("update")) {
        const std::int64_t id = requireIntArg(args, QStringLiteral("--id"));
        store.updateBrand(id,
                          optionalArg(args, QStringLiteral("--name")),
                          optionalArg(args, QStringLiteral("--color")),
                          optionalSmallIntArg(args, QStringLiteral("--sort")));
        printJson(nlohmann::json{{"updated", id}});
        return 0;
    }
    if (action == QStringLiteral("delete")) {
        const std::int64_t id = requireIntArg(args, QStringLiteral("--id"));
        store.deleteBrand(id);
        printJson(nlohmann::json{{"deleted", id}});
        return 0;
    }
    if (action == QStringLiteral("merge")) {
        const std::int64_t source = requireIntArg(args, QStringLiteral("--source"));
        const std::int64_t target = requireIntArg(args, QStringLiteral("--target"));
        store.mergeBrand(source, target);
        printJson(nlohmann::json{{"merged", source}, {"into", target}});
        return 0;
    }
    if (action == QStringLiteral("list")) {
        const auto projects = store.allProjects();
        nlohmann::json out = nlohmann::json::array();
        for (const Brand &brand : store.allBrands()) {
            nlohmann::json entry = brand;
            entry["projects"] = nlohmann::json::array();
            for (const Project &project : projects) {
                if (project.brandId == brand.id) {
                    entry["projects"].push_back(project);
                }
            }
            out.push_back(entry);
        }
        printJson(out);
        return 0;
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int ReportCli::runProjectCommand(ActivityStore &store, const QStringList &args)
{
    const QString action = args.size() > 2 ? args.at(2) : QString();
    if (action == QStringLiteral("add")) {
        const std::int64_t id = store.insertProject(requireIntArg(args, QStringLiteral("--brand-id")),
                                                    requireArg(args, QStringLiteral("--name")),
                                                    getArgValue(args, QStringLiteral("--color")).toStdString());
        printJson(nlohmann::json{{"id", id}});
        return 0;
    }
    if (action == QStringLiteral("update")) {
        const std::int64_t id = requireIntArg(args, QStringLiteral("--id"));
        std::optional<std::int64_t> brandId;
        if (const auto value = optionalIntArg(args, QStringLiteral("--brand-id"))) {
            brandId = *value;
        }
        store.updateProject(id,
                            optionalArg(args, QStringLiteral("--name")),
                            optionalArg(args, QStringLiteral("--color")),
                            brandId,
                            optionalSmallIntArg(args, QStringLiteral("--sort")));
        printJson(nlohmann::json{{"updated", id}});
        return 0;
    }
    if (action == QStringLiteral("delete")) {
        const std::int64_t id = requireIntArg(args, QStringLiteral("--id"));
        store.deleteProject(id);
        printJson(nlohmann::json{{"deleted", id}});
        return 0;
    }
    if (action == QStringLiteral("list")) {
        std::map<std::int64_t, std::string> brandNames;
        for (const Brand &brand : store.allBrands()) {
            brandNames[brand.id] = brand.name;
        }
        nlohmann::json out = nlohmann::json::array();
        for (const Project &project : store.allProjects()) {
            nlohmann::json entry = project;
            entry["brandName"] = brandNames[project.brandId];
            out.push_back(entry);
        }
        printJson(out);
        return 0;
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int ReportCli::runRuleCommand(ActivityStore &store, const QStringList &args)
{
    RuleEngine engine(store);
    const QString action = args.size() > 2 ? args.at(2) : QString();
    if (action == QStringLiteral("add")) {
        ProjectRule rule;
        rule.projectId = requireIntArg(args, QStringLiteral("--project-id"));
        rule.ruleType = ruleTypeArg(requireArg(args, QStringLiteral("--type")));
        rule.pattern = requireArg(args, QStringLiteral("--pattern"));
        rule.isRegex = hasFlag(args, QStringLiteral("--regex"));
        rule.priority = optionalSmallIntArg(args, QStringLiteral("--priority")).value_or(0);
        printJson(nlohmann::json{{"id", engine.addRule(rule)}});
        return 0;
    }
    if (action == QStringLiteral("update")) {
        const std::int64_t id = requireIntArg(args, QStringLiteral("--id"));
        std::optional<bool> isRegex;
        if (const auto value = optionalArg(args, QStringLiteral("--regex"))) {
            if (*value != "true" && *value != "false") {
                throw ValidationError("--regex takes true or false");
            }
            isRegex = *value == "true";
        }
        engine.updateRule(id,
                          optionalArg(args, QStringLiteral("--pattern")),
                          isRegex,
                          optionalSmallIntArg(args, QStringLiteral("--priority")));
        printJson(nlohmann::json{{"updated", id}});
        return 0;
    }
    if (action == QStringLiteral("delete")) {
        const std::int64_t id = requireIntArg(args, QStringLiteral("--id"));
        engine.removeRule(id);
        printJson(nlohmann::json{{"deleted", id}});
        return 0;
    }
    if (action == QStringLiteral("list")) {
        const auto projectId = optionalIntArg(args, QStringLiteral("--project-id"));
        const auto rules = projectId ? store.rulesForProject(*projectId) : store.loadAllProjectRules();
        printJson(rules);
        return 0;
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int ReportCli::runClassify(ActivityStore &store, const QStringList &args)
{
    const std::int64_t projectId = requireIntArg(args, QStringLiteral("--project-id"));
    std::vector<std::int64_t> ids;
    for (const QString &part : QString::fromStdString(requireArg(args, QStringLiteral("--ids")))
                                   .split(QLatin1Char(','), Qt::SkipEmptyParts)) {
        bool ok = false;
        const long long id = part.trimmed().toLongLong(&ok);
        if (!ok) {
            throw ValidationError("invalid activity id '" + part.toStdString() + "'");
        }
        ids.push_back(id);
    }

    const std::optional<std::string> ruleTypeValue = optionalArg(args, QStringLiteral("--rule-type"));
    std::optional<RuleType> ruleType;
    if (ruleTypeValue) {
        ruleType = ruleTypeArg(*ruleTypeValue);
    }
    const std::string pattern = getArgValue(args, QStringLiteral("--pattern")).toStdString();

    RuleEngine engine(store);
    const int assigned = engine.classify(ids, projectId, ruleType.has_value(), ruleType, pattern);
    logCommand("runClassify", "classify",
               nlohmann::json{{"projectId", projectId}, {"assigned", assigned}});
    printJson(nlohmann::json{{"assigned", assigned}});
    return 0;
}

int ReportCli::runAutoAssign(ActivityStore &store, const QStringList &args)
{
    std::optional<std::string> date;
    if (hasFlag(args, QStringLiteral("--date"))) {
        date = dateArg(args, QStringLiteral("--date"));
    }
    RuleEngine engine(store);
    printJson(nlohmann::json{{"assigned", engine.autoAssignUnclassified(date)}});
    return 0;
}

int ReportCli::runSuggestCommand(ActivityStore &store, const QStringList &args)
{
    const HourglassConfig config = loadConfig();
    SuggestionSettings settings;
    settings.minActivities = config.suggestionMinActivities;
    settings.minApps = config.suggestionMinApps;
    settings.ignoredDomains = config.suggestionIgnoredDomains;

    RuleEngine engine(store);
    SuggestionEngine suggestions(store, engine, settings);

    const QString action = args.size() > 2 ? args.at(2) : QString();
    if (action == QStringLiteral("detect")) {
        printJson(suggestions.detect());
        return 0;
    }
    if (action == QStringLiteral("accept")) {
        AcceptRequest request;
        if (const auto projectId = optionalIntArg(args, QStringLiteral("--project-id"))) {
            request.existingProjectId = *projectId;
        }
        request.brandName = getArgValue(args, QStringLiteral("--brand")).toStdString();
        request.projectName = getArgValue(args, QStringLiteral("--project")).toStdString();
        request.color = getArgValue(args, QStringLiteral("--color")).toStdString();
        for (const QString &text : getArgValues(args, QStringLiteral("--rule"))) {
            request.rules.push_back(parseRuleArg(text, false));
        }
        for (const QString &text : getArgValues(args, QStringLiteral("--regex-rule"))) {
            request.rules.push_back(parseRuleArg(text, true));
        }
        printJson(nlohmann::json{{"assigned", suggestions.accept(request)}});
        return 0;
    }
    if (action == QStringLiteral("dismiss")) {
        const std::string token = requireArg(args, QStringLiteral("--token"));
        suggestions.dismiss(token);
        printJson(nlohmann::json{{"dismissed", token}});
        return 0;
    }
    if (action == QStringLiteral("restore")) {
        const std::string token = requireArg(args, QStringLiteral("--token"));
        printJson(nlohmann::json{{"restored", suggestions.restore(token)}});
        return 0;
    }
    if (action == QStringLiteral("dismissed")) {
        printJson(suggestions.dismissedTokens());
        return 0;
    }

    std::cerr << usageText().toStdString();
    return 1;
}

} // namespace hourglass
