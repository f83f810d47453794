#include "daemon/activity_store.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <regex>
#include <tuple>
#include <utility>

#include <sqlite3.h>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/string_utils.hpp"

namespace hourglass {

namespace {

constexpr const char *kDefaultColor = "#6366f1";
constexpr int kTopWindowLimit = 20;
constexpr int kBusyTimeoutMs = 5000;

constexpr const char *kCreateBrandsTable =
    "CREATE TABLE IF NOT EXISTS brands ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    name TEXT NOT NULL UNIQUE COLLATE NOCASE,"
    "    color TEXT NOT NULL DEFAULT '#6366f1',"
    "    sort_order INTEGER NOT NULL DEFAULT 0,"
    "    created_at INTEGER NOT NULL"
    ");";

constexpr const char *kCreateProjectsTable =
    "CREATE TABLE IF NOT EXISTS projects ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    brand_id INTEGER NOT NULL REFERENCES brands(id) ON DELETE CASCADE,"
    "    name TEXT NOT NULL COLLATE NOCASE,"
    "    color TEXT NOT NULL DEFAULT '#6366f1',"
    "    sort_order INTEGER NOT NULL DEFAULT 0,"
    "    created_at INTEGER NOT NULL,"
    "    UNIQUE(brand_id, name)"
    ");";

constexpr const char *kCreateRulesTable =
    "CREATE TABLE IF NOT EXISTS project_rules ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    project_id INTEGER NOT NULL REFERENCES projects(id) ON DELETE CASCADE,"
    "    rule_type TEXT NOT NULL,"
    "    pattern TEXT NOT NULL,"
    "    is_regex INTEGER NOT NULL DEFAULT 0,"
    "    priority INTEGER NOT NULL DEFAULT 0,"
    "    created_at INTEGER NOT NULL"
    ");";

constexpr const char *kCreateActivitiesTable =
    "CREATE TABLE IF NOT EXISTS activities ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    timestamp INTEGER NOT NULL,"
    "    app_name TEXT NOT NULL,"
    "    bundle_id TEXT NOT NULL DEFAULT '',"
    "    window_title TEXT NOT NULL DEFAULT '',"
    "    url TEXT,"
    "    extra_info TEXT,"
    "    duration_seconds INTEGER NOT NULL DEFAULT 0,"
    "    date TEXT NOT NULL,"
    "    project_id INTEGER REFERENCES projects(id) ON DELETE SET NULL"
    ");";

constexpr const char *kCreateDismissedTable =
    "CREATE TABLE IF NOT EXISTS dismissed_suggestions ("
    "    token TEXT PRIMARY KEY,"
    "    dismissed_at INTEGER NOT NULL"
    ");";

constexpr const char *kCreateIndexes =
    "CREATE INDEX IF NOT EXISTS idx_activities_date ON activities(date);"
    "CREATE INDEX IF NOT EXISTS idx_activities_app ON activities(app_name);"
    "CREATE INDEX IF NOT EXISTS idx_activities_project ON activities(project_id);"
    "CREATE INDEX IF NOT EXISTS idx_projects_brand ON projects(brand_id);"
    "CREATE INDEX IF NOT EXISTS idx_rules_project ON project_rules(project_id);";

constexpr const char *kActivityColumns =
    "id, timestamp, app_name, bundle_id, window_title, url, extra_info, "
    "duration_seconds, date, project_id, project_source";

class Statement {
public:
    Statement(sqlite3 *db, const std::string &sql)
    {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw StoreError(message);
    }
}

// Runs a statement that returns no rows. Constraint violations surface as
// ValidationError, anything else as StoreError.
void stepDone(sqlite3 *db, const Statement &stmt, const char *what)
{
    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return;
    }
    const std::string message = std::string(what) + ": " + sqlite3_errmsg(db);
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        throw ValidationError(message);
    }
    throw StoreError(message);
}

// Returns true while rows remain.
bool stepRow(sqlite3 *db, const Statement &stmt)
{
    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw StoreError(std::string("sqlite step failed: ") + sqlite3_errmsg(db));
}

class Transaction {
public:
    explicit Transaction(sqlite3 *db)
        : m_db(db)
    {
        execOrThrow(m_db, "BEGIN IMMEDIATE;");
    }

    ~Transaction()
    {
        if (!m_committed) {
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    void commit()
    {
        execOrThrow(m_db, "COMMIT;");
        m_committed = true;
    }

private:
    sqlite3 *m_db = nullptr;
    bool m_committed = false;
};

bool columnExists(sqlite3 *db, const std::string &table, const std::string &column)
{
    Statement stmt(db, "PRAGMA table_info(" + table + ");");
    while (stepRow(db, stmt)) {
        const char *name = reinterpret_cast<const char *>(sqlite3_column_text(stmt.get(), 1));
        if (name && column == name) {
            return true;
        }
    }
    return false;
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt *stmt, int index, const std::optional<std::string> &value)
{
    if (!value) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, *value);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

std::optional<std::string> columnOptionalText(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return columnText(stmt, index);
}

std::int64_t nowMillis()
{
    return toEpochMillis(std::chrono::system_clock::now());
}

std::string requireName(const std::string &value, const char *what)
{
    std::string name = trim(value);
    if (name.empty()) {
        throw ValidationError(std::string(what) + " name must not be empty");
    }
    return name;
}

void validateRulePattern(const std::string &pattern, bool isRegex)
{
    if (trim(pattern).empty()) {
        throw ValidationError("rule pattern must not be empty");
    }
    if (!isRegex) {
        return;
    }
    try {
        std::regex compiled(pattern, std::regex::ECMAScript);
        (void)compiled;
    } catch (const std::regex_error &ex) {
        throw ValidationError("invalid regex pattern '" + pattern + "': " + ex.what());
    }
}

ActivityRecord readActivity(sqlite3_stmt *stmt)
{
    ActivityRecord record;
    record.id = sqlite3_column_int64(stmt, 0);
    record.timestamp = fromEpochMillis(sqlite3_column_int64(stmt, 1));
    record.appName = columnText(stmt, 2);
    record.bundleId = columnText(stmt, 3);
    record.windowTitle = columnText(stmt, 4);
    record.url = columnOptionalText(stmt, 5);
    record.extraInfo = columnOptionalText(stmt, 6);
    record.durationSeconds = sqlite3_column_int(stmt, 7);
    record.date = columnText(stmt, 8);
    if (sqlite3_column_type(stmt, 9) != SQLITE_NULL) {
        record.projectId = sqlite3_column_int64(stmt, 9);
    }
    if (const auto source = columnOptionalText(stmt, 10)) {
        record.projectSource = parseProjectSourceString(*source);
    }
    return record;
}

std::vector<ActivityRecord> readActivities(sqlite3 *db, const Statement &stmt)
{
    std::vector<ActivityRecord> records;
    while (stepRow(db, stmt)) {
        records.push_back(readActivity(stmt.get()));
    }
    return records;
}

Brand readBrand(sqlite3_stmt *stmt)
{
    Brand brand;
    brand.id = sqlite3_column_int64(stmt, 0);
    brand.name = columnText(stmt, 1);
    brand.color = columnText(stmt, 2);
    brand.sortOrder = sqlite3_column_int(stmt, 3);
    return brand;
}

Project readProject(sqlite3_stmt *stmt)
{
    Project project;
    project.id = sqlite3_column_int64(stmt, 0);
    project.brandId = sqlite3_column_int64(stmt, 1);
    project.name = columnText(stmt, 2);
    project.color = columnText(stmt, 3);
    project.sortOrder = sqlite3_column_int(stmt, 4);
    return project;
}

// Rows whose rule_type is not a known type are reported and left out.
std::optional<ProjectRule> readRule(sqlite3_stmt *stmt)
{
    ProjectRule rule;
    rule.id = sqlite3_column_int64(stmt, 0);
    rule.projectId = sqlite3_column_int64(stmt, 1);
    const std::string type = columnText(stmt, 2);
    const std::optional<RuleType> ruleType = parseRuleTypeString(type);
    if (!ruleType) {
        HGLOG_WARN("store",
                   "ActivityStore::readRule",
                   "rule_skipped",
                   "unknown rule type",
                   "sqlite3",
                   ::hourglass::logging::defaultWho(),
                   "",
                   (nlohmann::json{{"ruleId", rule.id}, {"ruleType", type}}));
        return std::nullopt;
    }
    rule.ruleType = *ruleType;
    rule.pattern = columnText(stmt, 3);
    rule.isRegex = sqlite3_column_int(stmt, 4) != 0;
    rule.priority = sqlite3_column_int(stmt, 5);
    return rule;
}

std::optional<Brand> selectBrand(sqlite3 *db, std::int64_t id)
{
    Statement stmt(db, "SELECT id, name, color, sort_order FROM brands WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, id);
    if (!stepRow(db, stmt)) {
        return std::nullopt;
    }
    return readBrand(stmt.get());
}

std::optional<Brand> selectBrandByName(sqlite3 *db, const std::string &name)
{
    Statement stmt(db, "SELECT id, name, color, sort_order FROM brands WHERE name = ?;");
    bindText(stmt.get(), 1, name);
    if (!stepRow(db, stmt)) {
        return std::nullopt;
    }
    return readBrand(stmt.get());
}

std::optional<Project> selectProject(sqlite3 *db, std::int64_t id)
{
    Statement stmt(db,
                   "SELECT id, brand_id, name, color, sort_order FROM projects WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, id);
    if (!stepRow(db, stmt)) {
        return std::nullopt;
    }
    return readProject(stmt.get());
}

std::optional<Project> selectProjectByName(sqlite3 *db,
                                           std::int64_t brandId,
                                           const std::string &name)
{
    Statement stmt(db,
                   "SELECT id, brand_id, name, color, sort_order FROM projects "
                   "WHERE brand_id = ? AND name = ?;");
    sqlite3_bind_int64(stmt.get(), 1, brandId);
    bindText(stmt.get(), 2, name);
    if (!stepRow(db, stmt)) {
        return std::nullopt;
    }
    return readProject(stmt.get());
}

Brand requireBrand(sqlite3 *db, std::int64_t id)
{
    std::optional<Brand> brand = selectBrand(db, id);
    if (!brand) {
        throw ValidationError("brand " + std::to_string(id) + " does not exist");
    }
    return *brand;
}

Project requireProject(sqlite3 *db, std::int64_t id)
{
    std::optional<Project> project = selectProject(db, id);
    if (!project) {
        throw ValidationError("project " + std::to_string(id) + " does not exist");
    }
    return *project;
}

int countRows(sqlite3 *db, const char *sql, std::int64_t param)
{
    Statement stmt(db, sql);
    sqlite3_bind_int64(stmt.get(), 1, param);
    return stepRow(db, stmt) ? sqlite3_column_int(stmt.get(), 0) : 0;
}

using WindowKey = std::tuple<std::string, std::optional<std::string>, std::optional<std::string>>;

struct WindowAccumulator {
    std::vector<WindowDetail> windows;
    std::map<WindowKey, std::size_t> index;

    void add(const ActivityRecord &record)
    {
        const WindowKey key{record.windowTitle, record.url, record.extraInfo};
        auto it = index.find(key);
        if (it == index.end()) {
            WindowDetail detail;
            detail.title = record.windowTitle;
            detail.url = record.url;
            detail.extraInfo = record.extraInfo;
            it = index.emplace(key, windows.size()).first;
            windows.push_back(detail);
        }
        WindowDetail &detail = windows[it->second];
        detail.totalSeconds += record.durationSeconds;
        detail.activityIds.push_back(record.id);
    }

    std::vector<WindowDetail> sorted() const
    {
        std::vector<WindowDetail> out = windows;
        std::stable_sort(out.begin(), out.end(), [](const WindowDetail &a, const WindowDetail &b) {
            if (a.totalSeconds != b.totalSeconds) {
                return a.totalSeconds > b.totalSeconds;
            }
            return a.title < b.title;
        });
        return out;
    }
};

DaySummary buildDaySummary(const std::string &date, const std::vector<ActivityRecord> &records)
{
    DaySummary summary;
    summary.date = date;

    struct AppAccumulator {
        std::string bundleId;
        int totalSeconds = 0;
        WindowAccumulator windows;
    };
    std::map<std::string, AppAccumulator> apps;

    std::optional<std::int64_t> firstStartMs;
    std::optional<std::int64_t> lastStartMs;
    for (const ActivityRecord &record : records) {
        AppAccumulator &app = apps[record.appName];
        if (app.bundleId.empty()) {
            app.bundleId = record.bundleId;
        }
        app.totalSeconds += record.durationSeconds;
        app.windows.add(record);
        summary.totalSeconds += record.durationSeconds;

        const std::int64_t startMs = toEpochMillis(record.timestamp);
        if (!firstStartMs || startMs < *firstStartMs) {
            firstStartMs = startMs;
        }
        if (!lastStartMs || startMs > *lastStartMs) {
            lastStartMs = startMs;
        }
    }

    for (const auto &[name, app] : apps) {
        if (app.totalSeconds <= 0) {
            continue;
        }
        AppSummary out;
        out.appName = name;
        out.bundleId = app.bundleId;
        out.totalSeconds = app.totalSeconds;
        out.windows = app.windows.sorted();
        summary.apps.push_back(std::move(out));
    }
    std::stable_sort(summary.apps.begin(), summary.apps.end(),
                     [](const AppSummary &a, const AppSummary &b) {
                         return a.totalSeconds > b.totalSeconds;
                     });

    summary.activeTrackingSeconds = summary.totalSeconds;
    if (firstStartMs && lastStartMs) {
        summary.wallClockSeconds = static_cast<int>((*lastStartMs - *firstStartMs) / 1000);
        summary.firstActivity = localTimeLabel(fromEpochMillis(*firstStartMs));
        summary.lastActivity = localTimeLabel(fromEpochMillis(*lastStartMs));
    }
    return summary;
}

sqlite3 *openConnection(const std::string &path, int flags)
{
    sqlite3 *db = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        const std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw StoreError("failed to open hourglass database '" + path + "': " + message);
    }
    sqlite3_busy_timeout(db, kBusyTimeoutMs);
    return db;
}

} // namespace

struct ActivityStore::Impl {
    std::string path;
    sqlite3 *db = nullptr;
    sqlite3 *readDb = nullptr;
    std::mutex writeMutex;
    std::mutex readMutex;

    ~Impl()
    {
        if (readDb && readDb != db) {
            sqlite3_close(readDb);
        }
        if (db) {
            sqlite3_close(db);
        }
    }

    std::unique_lock<std::mutex> lockWrite()
    {
        return std::unique_lock<std::mutex>(writeMutex);
    }

    std::unique_lock<std::mutex> lockRead()
    {
        return std::unique_lock<std::mutex>(readDb == db ? writeMutex : readMutex);
    }

    void open(const std::string &dbPath);
};

void ActivityStore::Impl::open(const std::string &dbPath)
{
    path = dbPath;
    const bool inMemory = dbPath == ":memory:";
    if (!inMemory) {
        const std::filesystem::path parent = std::filesystem::path(dbPath).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                throw StoreError("failed to create database directory '" + parent.string()
                                 + "': " + ec.message());
            }
        }
    }

    db = openConnection(dbPath, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    if (!inMemory) {
        execOrThrow(db, "PRAGMA journal_mode=WAL;");
    }
    execOrThrow(db, "PRAGMA foreign_keys=ON;");

    execOrThrow(db, kCreateBrandsTable);
    execOrThrow(db, kCreateProjectsTable);
    execOrThrow(db, kCreateRulesTable);
    execOrThrow(db, kCreateActivitiesTable);
    execOrThrow(db, kCreateDismissedTable);

    // Databases created before manual and suggested assignment existed lack
    // the source column.
    if (!columnExists(db, "activities", "project_source")) {
        execOrThrow(db, "ALTER TABLE activities ADD COLUMN project_source TEXT;");
        execOrThrow(db,
                    "UPDATE activities SET project_source = 'auto' "
                    "WHERE project_id IS NOT NULL;");
    }
    execOrThrow(db, kCreateIndexes);

    readDb = inMemory ? db : openConnection(dbPath, SQLITE_OPEN_READONLY);
}

ActivityStore::ActivityStore()
    : ActivityStore(defaultDatabasePath())
{
}

ActivityStore::ActivityStore(const std::string &dbPath)
    : impl(std::make_unique<Impl>())
{
    impl->open(dbPath);
    HGLOG_DEBUG("store",
                "ActivityStore::ActivityStore",
                "store_opened",
                "",
                "sqlite3",
                ::hourglass::logging::defaultWho(),
                "",
                (nlohmann::json{{"path", dbPath}}));
}

ActivityStore::~ActivityStore() = default;

const std::string &ActivityStore::path() const
{
    return impl->path;
}

std::int64_t ActivityStore::insertActivity(const ActivityRecord &record)
{
    const std::string date = record.date.empty() ? localDateString(record.timestamp) : record.date;

    auto lock = impl->lockWrite();
    Statement stmt(impl->db,
                   "INSERT INTO activities (timestamp, app_name, bundle_id, window_title, url, "
                   "extra_info, duration_seconds, date, project_id, project_source) "
                   "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    sqlite3_bind_int64(stmt.get(), 1, toEpochMillis(record.timestamp));
    bindText(stmt.get(), 2, record.appName);
    bindText(stmt.get(), 3, record.bundleId);
    bindText(stmt.get(), 4, record.windowTitle);
    bindOptionalText(stmt.get(), 5, record.url);
    bindOptionalText(stmt.get(), 6, record.extraInfo);
    sqlite3_bind_int(stmt.get(), 7, std::max(0, record.durationSeconds));
    bindText(stmt.get(), 8, date);
    if (record.projectId) {
        sqlite3_bind_int64(stmt.get(), 9, *record.projectId);
        bindText(stmt.get(), 10, toProjectSourceString(record.projectSource.value_or(ProjectSource::Auto)));
    } else {
        sqlite3_bind_null(stmt.get(), 9);
        sqlite3_bind_null(stmt.get(), 10);
    }
    stepDone(impl->db, stmt, "failed to insert activity");
    return sqlite3_last_insert_rowid(impl->db);
}

void ActivityStore::updateDuration(std::int64_t id, int durationSeconds)
{
    auto lock = impl->lockWrite();
    Statement stmt(impl->db, "UPDATE activities SET duration_seconds = ? WHERE id = ?;");
    sqlite3_bind_int(stmt.get(), 1, std::max(0, durationSeconds));
    sqlite3_bind_int64(stmt.get(), 2, id);
    stepDone(impl->db, stmt, "failed to update activity duration");
}

std::optional<ActivityRecord> ActivityStore::getActivity(std::int64_t id) const
{
    auto lock = impl->lockRead();
    Statement stmt(impl->readDb,
                   std::string("SELECT ") + kActivityColumns + " FROM activities WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, id);
    if (!stepRow(impl->readDb, stmt)) {
        return std::nullopt;
    }
    return readActivity(stmt.get());
}

int ActivityStore::assignProject(const std::vector<std::int64_t> &activityIds,
                                 std::int64_t projectId,
                                 ProjectSource source)
{
    auto lock = impl->lockWrite();
    requireProject(impl->db, projectId);
    if (activityIds.empty()) {
        return 0;
    }

    Transaction tx(impl->db);
    Statement stmt(impl->db,
                   "UPDATE activities SET project_id = ?, project_source = ? WHERE id = ?;");
    const std::string sourceText = toProjectSourceString(source);
    int changed = 0;
    for (const std::int64_t id : activityIds) {
        sqlite3_reset(stmt.get());
        sqlite3_bind_int64(stmt.get(), 1, projectId);
        bindText(stmt.get(), 2, sourceText);
        sqlite3_bind_int64(stmt.get(), 3, id);
        stepDone(impl->db, stmt, "failed to assign project");
        changed += sqlite3_changes(impl->db);
    }
    tx.commit();
    return changed;
}

std::int64_t ActivityStore::insertBrand(const std::string &name, const std::string &color)
{
    const std::string brandName = requireName(name, "brand");

    auto lock = impl->lockWrite();
    if (selectBrandByName(impl->db, brandName)) {
        throw ValidationError("brand '" + brandName + "' already exists");
    }
    int sortOrder = 0;
    {
        Statement count(impl->db, "SELECT COUNT(*) FROM brands;");
        if (stepRow(impl->db, count)) {
            sortOrder = sqlite3_column_int(count.get(), 0);
        }
    }

    Statement stmt(impl->db,
                   "INSERT INTO brands (name, color, sort_order, created_at) VALUES (?, ?, ?, ?);");
    bindText(stmt.get(), 1, brandName);
    bindText(stmt.get(), 2, color.empty() ? std::string(kDefaultColor) : color);
    sqlite3_bind_int(stmt.get(), 3, sortOrder);
    sqlite3_bind_int64(stmt.get(), 4, nowMillis());
    stepDone(impl->db, stmt, "failed to insert brand");
    return sqlite3_last_insert_rowid(impl->db);
}

void ActivityStore::updateBrand(std::int64_t id,
                                const std::optional<std::string> &name,
                                const std::optional<std::string> &color,
                                const std::optional<int> &sortOrder)
{
    auto lock = impl->lockWrite();
    Brand brand = requireBrand(impl->db, id);
    if (name) {
        const std::string brandName = requireName(*name, "brand");
        const std::optional<Brand> existing = selectBrandByName(impl->db, brandName);
        if (existing && existing->id != id) {
            throw ValidationError("brand '" + brandName + "' already exists");
        }
        brand.name = brandName;
    }
    if (color) {
        if (color->empty()) {
            throw ValidationError("brand color must not be empty");
        }
        brand.color = *color;
    }
    if (sortOrder) {
        brand.sortOrder = *sortOrder;
    }

    Statement stmt(impl->db,
                   "UPDATE brands SET name = ?, color = ?, sort_order = ? WHERE id = ?;");
    bindText(stmt.get(), 1, brand.name);
    bindText(stmt.get(), 2, brand.color);
    sqlite3_bind_int(stmt.get(), 3, brand.sortOrder);
    sqlite3_bind_int64(stmt.get(), 4, id);
    stepDone(impl->db, stmt, "failed to update brand");
}

void ActivityStore::deleteBrand(std::int64_t id)
{
    auto lock = impl->lockWrite();
    requireBrand(impl->db, id);

    Transaction tx(impl->db);
    {
        Statement stmt(impl->db,
                       "DELETE FROM project_rules WHERE project_id IN "
                       "(SELECT id FROM projects WHERE brand_id = ?);");
        sqlite3_bind_int64(stmt.get(), 1, id);
        stepDone(impl->db, stmt, "failed to delete brand rules");
    }
    {
        Statement stmt(impl->db,
                       "UPDATE activities SET project_id = NULL, project_source = NULL "
                       "WHERE project_id IN (SELECT id FROM projects WHERE brand_id = ?);");
        sqlite3_bind_int64(stmt.get(), 1, id);
        stepDone(impl->db, stmt, "failed to unassign brand activities");
    }
    {
        Statement stmt(impl->db, "DELETE FROM projects WHERE brand_id = ?;");
        sqlite3_bind_int64(stmt.get(), 1, id);
        stepDone(impl->db, stmt, "failed to delete brand projects");
    }
    {
        Statement stmt(impl->db, "DELETE FROM brands WHERE id = ?;");
        sqlite3_bind_int64(stmt.get(), 1, id);
        stepDone(impl->db, stmt, "failed to delete brand");
    }
    tx.commit();
}

void ActivityStore::mergeBrand(std::int64_t sourceId, std::int64_t targetId)
{
    if (sourceId == targetId) {
        throw ValidationError("cannot merge a brand into itself");
    }

    auto lock = impl->lockWrite();
    requireBrand(impl->db, sourceId);
    requireBrand(impl->db, targetId);

    {
        Statement stmt(impl->db,
                       "SELECT s.name FROM projects s JOIN projects t ON t.name = s.name "
                       "WHERE s.brand_id = ? AND t.brand_id = ? LIMIT 1;");
        sqlite3_bind_int64(stmt.get(), 1, sourceId);
        sqlite3_bind_int64(stmt.get(), 2, targetId);
        if (stepRow(impl->db, stmt)) {
            throw ValidationError("target brand already has a project named '"
                                  + columnText(stmt.get(), 0) + "'");
        }
    }

    Transaction tx(impl->db);
    {
        Statement stmt(impl->db, "UPDATE projects SET brand_id = ? WHERE brand_id = ?;");
        sqlite3_bind_int64(stmt.get(), 1, targetId);
        sqlite3_bind_int64(stmt.get(), 2, sourceId);
        stepDone(impl->db, stmt, "failed to move projects");
    }
    {
        Statement stmt(impl->db, "DELETE FROM brands WHERE id = ?;");
        sqlite3_bind_int64(stmt.get(), 1, sourceId);
        stepDone(impl->db, stmt, "failed to delete merged brand");
    }
    tx.commit();
}

std::vector<Brand> ActivityStore::allBrands() const
{
    auto lock = impl->lockRead();
    Statement stmt(impl->readDb,
                   "SELECT id, name, color, sort_order FROM brands ORDER BY sort_order, id;");
    std::vector<Brand> brands;
    while (stepRow(impl->readDb, stmt)) {
        brands.push_back(readBrand(stmt.get()));
    }
    return brands;
}

std::optional<Brand> ActivityStore::getBrand(std::int64_t id) const
{
    auto lock = impl->lockRead();
    return selectBrand(impl->readDb, id);
}

std::optional<Brand> ActivityStore::findBrandByName(const std::string &name) const
{
    auto lock = impl->lockRead();
    return selectBrandByName(impl->readDb, trim(name));
}

std::int64_t ActivityStore::insertProject(std::int64_t brandId,
                                          const std::string &name,
                                          const std::string &color)
{
    const std::string projectName = requireName(name, "project");

    auto lock = impl->lockWrite();
    const Brand brand = requireBrand(impl->db, brandId);
    if (selectProjectByName(impl->db, brandId, projectName)) {
        throw ValidationError("project '" + projectName + "' already exists in brand '"
                              + brand.name + "'");
    }
    const int sortOrder = countRows(impl->db,
                                    "SELECT COUNT(*) FROM projects WHERE brand_id = ?;",
                                    brandId);

    Statement stmt(impl->db,
                   "INSERT INTO projects (brand_id, name, color, sort_order, created_at) "
                   "VALUES (?, ?, ?, ?, ?);");
    sqlite3_bind_int64(stmt.get(), 1, brandId);
    bindText(stmt.get(), 2, projectName);
    bindText(stmt.get(), 3, color.empty() ? brand.color : color);
    sqlite3_bind_int(stmt.get(), 4, sortOrder);
    sqlite3_bind_int64(stmt.get(), 5, nowMillis());
    stepDone(impl->db, stmt, "failed to insert project");
    return sqlite3_last_insert_rowid(impl->db);
}

void ActivityStore::updateProject(std::int64_t id,
                                  const std::optional<std::string> &name,
                                  const std::optional<std::string> &color,
                                  const std::optional<std::int64_t> &brandId,
                                  const std::optional<int> &sortOrder)
{
    auto lock = impl->lockWrite();
    Project project = requireProject(impl->db, id);
    if (brandId) {
        requireBrand(impl->db, *brandId);
        project.brandId = *brandId;
    }
    if (name) {
        project.name = requireName(*name, "project");
    }
    const std::optional<Project> clash = selectProjectByName(impl->db, project.brandId, project.name);
    if (clash && clash->id != id) {
        throw ValidationError("project '" + project.name + "' already exists in that brand");
    }
    if (color) {
        if (color->empty()) {
            throw ValidationError("project color must not be empty");
        }
        project.color = *color;
    }
    if (sortOrder) {
        project.sortOrder = *sortOrder;
    }

    Statement stmt(impl->db,
                   "UPDATE projects SET brand_id = ?, name = ?, color = ?, sort_order = ? "
                   "WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, project.brandId);
    bindText(stmt.get(), 2, project.name);
    bindText(stmt.get(), 3, project.color);
    sqlite3_bind_int(stmt.get(), 4, project.sortOrder);
    sqlite3_bind_int64(stmt.get(), 5, id);
    stepDone(impl->db, stmt, "failed to update project");
}

void ActivityStore::deleteProject(std::int64_t id)
{
    auto lock = impl->lockWrite();
    requireProject(impl->db, id);

    Transaction tx(impl->db);
    {
        Statement stmt(impl->db, "DELETE FROM project_rules WHERE project_id = ?;");
        sqlite3_bind_int64(stmt.get(), 1, id);
        stepDone(impl->db, stmt, "failed to delete project rules");
    }
    {
        Statement stmt(impl->db,
                       "UPDATE activities SET project_id = NULL, project_source = NULL "
                       "WHERE project_id = ?;");
        sqlite3_bind_int64(stmt.get(), 1, id);
        stepDone(impl->db, stmt, "failed to unassign project activities");
    }
    {
        Statement stmt(impl->db, "DELETE FROM projects WHERE id = ?;");
        sqlite3_bind_int64(stmt.get(), 1, id);
        stepDone(impl->db, stmt, "failed to delete project");
    }
    tx.commit();
}

std::vector<Project> ActivityStore::allProjects() const
{
    auto lock = impl->lockRead();
    Statement stmt(impl->readDb,
                   "SELECT id, brand_id, name, color, sort_order FROM projects "
                   "ORDER BY sort_order, id;");
    std::vector<Project> projects;
    while (stepRow(impl->readDb, stmt)) {
        projects.push_back(readProject(stmt.get()));
    }
    return projects;
}

std::optional<Project> ActivityStore::getProject(std::int64_t id) const
{
    auto lock = impl->lockRead();
    return selectProject(impl->readDb, id);
}

std::optional<Project> ActivityStore::findProjectByName(std::int64_t brandId,
                                                        const std::string &name) const
{
    auto lock = impl->lockRead();
    return selectProjectByName(impl->readDb, brandId, trim(name));
}

std::int64_t ActivityStore::insertRule(std::int64_t projectId,
                                       RuleType type,
                                       const std::string &pattern,
                                       bool isRegex,
                                       int priority)
{
    validateRulePattern(pattern, isRegex);

    auto lock = impl->lockWrite();
    requireProject(impl->db, projectId);

    Statement stmt(impl->db,
                   "INSERT INTO project_rules (project_id, rule_type, pattern, is_regex, "
                   "priority, created_at) VALUES (?, ?, ?, ?, ?, ?);");
    sqlite3_bind_int64(stmt.get(), 1, projectId);
    bindText(stmt.get(), 2, toRuleTypeString(type));
    bindText(stmt.get(), 3, pattern);
    sqlite3_bind_int(stmt.get(), 4, isRegex ? 1 : 0);
    sqlite3_bind_int(stmt.get(), 5, priority);
    sqlite3_bind_int64(stmt.get(), 6, nowMillis());
    stepDone(impl->db, stmt, "failed to insert rule");
    return sqlite3_last_insert_rowid(impl->db);
}

void ActivityStore::updateRule(std::int64_t id,
                               const std::optional<std::string> &pattern,
                               const std::optional<bool> &isRegex,
                               const std::optional<int> &priority)
{
    auto lock = impl->lockWrite();
    Statement select(impl->db,
                     "SELECT id, project_id, rule_type, pattern, is_regex, priority "
                     "FROM project_rules WHERE id = ?;");
    sqlite3_bind_int64(select.get(), 1, id);
    if (!stepRow(impl->db, select)) {
        throw ValidationError("rule " + std::to_string(id) + " does not exist");
    }
    std::optional<ProjectRule> stored = readRule(select.get());
    if (!stored) {
        throw StoreError("rule " + std::to_string(id) + " has an unknown rule type");
    }
    ProjectRule rule = *stored;
    if (pattern) {
        rule.pattern = *pattern;
    }
    if (isRegex) {
        rule.isRegex = *isRegex;
    }
    if (priority) {
        rule.priority = *priority;
    }
    validateRulePattern(rule.pattern, rule.isRegex);

    Statement stmt(impl->db,
                   "UPDATE project_rules SET pattern = ?, is_regex = ?, priority = ? WHERE id = ?;");
    bindText(stmt.get(), 1, rule.pattern);
    sqlite3_bind_int(stmt.get(), 2, rule.isRegex ? 1 : 0);
    sqlite3_bind_int(stmt.get(), 3, rule.priority);
    sqlite3_bind_int64(stmt.get(), 4, id);
    stepDone(impl->db, stmt, "failed to update rule");
}

void ActivityStore::deleteRule(std::int64_t id)
{
    auto lock = impl->lockWrite();
    Statement stmt(impl->db, "DELETE FROM project_rules WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, id);
    stepDone(impl->db, stmt, "failed to delete rule");
    if (sqlite3_changes(impl->db) == 0) {
        throw ValidationError("rule " + std::to_string(id) + " does not exist");
    }
}

std::vector<ProjectRule> ActivityStore::loadAllProjectRules() const
{
    auto lock = impl->lockRead();
    Statement stmt(impl->readDb,
                   "SELECT id, project_id, rule_type, pattern, is_regex, priority "
                   "FROM project_rules ORDER BY priority ASC, id ASC;");
    std::vector<ProjectRule> rules;
    while (stepRow(impl->readDb, stmt)) {
        if (std::optional<ProjectRule> rule = readRule(stmt.get())) {
            rules.push_back(std::move(*rule));
        }
    }
    return rules;
}

std::vector<ProjectRule> ActivityStore::rulesForProject(std::int64_t projectId) const
{
    auto lock = impl->lockRead();
    Statement stmt(impl->readDb,
                   "SELECT id, project_id, rule_type, pattern, is_regex, priority "
                   "FROM project_rules WHERE project_id = ? ORDER BY priority ASC, id ASC;");
    sqlite3_bind_int64(stmt.get(), 1, projectId);
    std::vector<ProjectRule> rules;
    while (stepRow(impl->readDb, stmt)) {
        if (std::optional<ProjectRule> rule = readRule(stmt.get())) {
            rules.push_back(std::move(*rule));
        }
    }
    return rules;
}

DaySummary ActivityStore::queryDay(const std::string &date) const
{
    if (!isValidDateString(date)) {
        throw ValidationError("invalid date '" + date + "', expected YYYY-MM-DD");
    }

    auto lock = impl->lockRead();
    Statement stmt(impl->readDb,
                   std::string("SELECT ") + kActivityColumns
                       + " FROM activities WHERE date = ? ORDER BY timestamp ASC, id ASC;");
    bindText(stmt.get(), 1, date);
    return buildDaySummary(date, readActivities(impl->readDb, stmt));
}

std::vector<DaySummary> ActivityStore::queryDays(const std::string &from,
                                                 const std::string &to) const
{
    if (!isValidDateString(from) || !isValidDateString(to)) {
        throw ValidationError("invalid date range, expected YYYY-MM-DD");
    }

    std::vector<DaySummary> days;
    for (std::string date = from; date <= to; date = addDays(date, 1)) {
        DaySummary day = queryDay(date);
        if (day.totalSeconds > 0) {
            days.push_back(std::move(day));
        }
    }
    return days;
}

std::vector<DaySummary> ActivityStore::queryWeek(const std::optional<std::string> &today) const
{
    const std::string end = today.value_or(todayLocalDate());
    return queryDays(addDays(end, -6), end);
}

std::vector<DaySummary> ActivityStore::queryMonth(int year,
                                                  int month,
                                                  const std::optional<std::string> &today) const
{
    if (month < 1 || month > 12 || year < 1970 || year > 9999) {
        throw ValidationError("invalid month " + std::to_string(year) + "-"
                              + std::to_string(month));
    }

    char first[11] = {};
    std::snprintf(first, sizeof(first), "%04d-%02d-01", year, month);
    char next[11] = {};
    std::snprintf(next, sizeof(next), "%04d-%02d-01",
                  month == 12 ? year + 1 : year,
                  month == 12 ? 1 : month + 1);

    const std::string end = today.value_or(todayLocalDate());
    const std::string last = std::min(addDays(next, -1), end);
    if (last < first) {
        return {};
    }
    return queryDays(first, last);
}

AppDetailReport ActivityStore::queryApp(const std::string &appName) const
{
    std::vector<ActivityRecord> records;
    {
        auto lock = impl->lockRead();
        Statement stmt(impl->readDb,
                       std::string("SELECT ") + kActivityColumns
                           + " FROM activities WHERE app_name = ? ORDER BY timestamp ASC, id ASC;");
        bindText(stmt.get(), 1, appName);
        records = readActivities(impl->readDb, stmt);
    }

    AppDetailReport report;
    report.appName = appName;
    std::map<std::string, int, std::greater<std::string>> perDay;
    WindowAccumulator windows;
    for (const ActivityRecord &record : records) {
        report.totalSeconds += record.durationSeconds;
        perDay[record.date] += record.durationSeconds;
        windows.add(record);
    }
    for (const auto &[date, seconds] : perDay) {
        if (seconds > 0) {
            report.days.push_back(DayTotal{date, seconds});
        }
    }
    report.topWindows = windows.sorted();
    if (report.topWindows.size() > static_cast<std::size_t>(kTopWindowLimit)) {
        report.topWindows.resize(kTopWindowLimit);
    }
    return report;
}

std::vector<ActivityRecord> ActivityStore::queryTimeline(const std::string &date) const
{
    auto lock = impl->lockRead();
    Statement stmt(impl->readDb,
                   std::string("SELECT ") + kActivityColumns
                       + " FROM activities WHERE date = ? ORDER BY timestamp ASC, id ASC;");
    bindText(stmt.get(), 1, date);
    return readActivities(impl->readDb, stmt);
}

std::vector<BrandSummary> ActivityStore::queryDayByProject(const std::string &date) const
{
    auto lock = impl->lockRead();
    Statement stmt(impl->readDb,
                   "SELECT b.id, b.name, b.color, p.id, p.name, p.color, a.app_name, "
                   "SUM(a.duration_seconds) "
                   "FROM activities a "
                   "JOIN projects p ON p.id = a.project_id "
                   "JOIN brands b ON b.id = p.brand_id "
                   "WHERE a.date = ? "
                   "GROUP BY p.id, a.app_name;");
    bindText(stmt.get(), 1, date);

    std::map<std::int64_t, BrandSummary> brands;
    std::map<std::int64_t, ProjectSummary> projects;
    std::map<std::int64_t, std::int64_t> projectBrand;
    while (stepRow(impl->readDb, stmt)) {
        const int seconds = sqlite3_column_int(stmt.get(), 7);
        if (seconds <= 0) {
            continue;
        }
        const std::int64_t brandId = sqlite3_column_int64(stmt.get(), 0);
        const std::int64_t projectId = sqlite3_column_int64(stmt.get(), 3);

        BrandSummary &brand = brands[brandId];
        brand.brandId = brandId;
        brand.brandName = columnText(stmt.get(), 1);
        brand.color = columnText(stmt.get(), 2);
        brand.totalSeconds += seconds;

        ProjectSummary &project = projects[projectId];
        project.projectId = projectId;
        project.projectName = columnText(stmt.get(), 4);
        project.color = columnText(stmt.get(), 5);
        project.totalSeconds += seconds;
        project.appBreakdown.push_back(AppBreakdownEntry{columnText(stmt.get(), 6), seconds});
        projectBrand[projectId] = brandId;
    }

    for (auto &[projectId, project] : projects) {
        std::stable_sort(project.appBreakdown.begin(), project.appBreakdown.end(),
                         [](const AppBreakdownEntry &a, const AppBreakdownEntry &b) {
                             return a.seconds > b.seconds;
                         });
        brands[projectBrand[projectId]].projects.push_back(std::move(project));
    }

    std::vector<BrandSummary> out;
    for (auto &[brandId, brand] : brands) {
        std::stable_sort(brand.projects.begin(), brand.projects.end(),
                         [](const ProjectSummary &a, const ProjectSummary &b) {
                             return a.totalSeconds > b.totalSeconds;
                         });
        out.push_back(std::move(brand));
    }
    std::stable_sort(out.begin(), out.end(), [](const BrandSummary &a, const BrandSummary &b) {
        return a.totalSeconds > b.totalSeconds;
    });
    return out;
}

std::vector<ActivityRecord> ActivityStore::queryUnassignedActivities(const std::string &date,
                                                                     int minDurationSeconds) const
{
    auto lock = impl->lockRead();
    Statement stmt(impl->readDb,
                   std::string("SELECT ") + kActivityColumns
                       + " FROM activities WHERE date = ? AND project_id IS NULL "
                         "AND duration_seconds >= ? ORDER BY duration_seconds DESC, id ASC;");
    bindText(stmt.get(), 1, date);
    sqlite3_bind_int(stmt.get(), 2, minDurationSeconds);
    return readActivities(impl->readDb, stmt);
}

std::vector<ActivityRecord> ActivityStore::queryUnassignedRaw(
    const std::optional<std::string> &date) const
{
    auto lock = impl->lockRead();
    if (date) {
        Statement stmt(impl->readDb,
                       std::string("SELECT ") + kActivityColumns
                           + " FROM activities WHERE project_id IS NULL AND date = ? "
                             "ORDER BY id ASC;");
        bindText(stmt.get(), 1, *date);
        return readActivities(impl->readDb, stmt);
    }
    Statement stmt(impl->readDb,
                   std::string("SELECT ") + kActivityColumns
                       + " FROM activities WHERE project_id IS NULL ORDER BY id ASC;");
    return readActivities(impl->readDb, stmt);
}

std::vector<std::string> ActivityStore::queryRecentDates(int limit) const
{
    auto lock = impl->lockRead();
    Statement stmt(impl->readDb,
                   "SELECT DISTINCT date FROM activities ORDER BY date DESC LIMIT ?;");
    sqlite3_bind_int(stmt.get(), 1, limit);
    std::vector<std::string> dates;
    while (stepRow(impl->readDb, stmt)) {
        dates.push_back(columnText(stmt.get(), 0));
    }
    return dates;
}

void ActivityStore::addDismissedToken(const std::string &token)
{
    auto lock = impl->lockWrite();
    Statement stmt(impl->db,
                   "INSERT OR IGNORE INTO dismissed_suggestions (token, dismissed_at) "
                   "VALUES (?, ?);");
    bindText(stmt.get(), 1, token);
    sqlite3_bind_int64(stmt.get(), 2, nowMillis());
    stepDone(impl->db, stmt, "failed to dismiss suggestion");
}

bool ActivityStore::removeDismissedToken(const std::string &token)
{
    auto lock = impl->lockWrite();
    Statement stmt(impl->db, "DELETE FROM dismissed_suggestions WHERE token = ?;");
    bindText(stmt.get(), 1, token);
    stepDone(impl->db, stmt, "failed to restore suggestion");
    return sqlite3_changes(impl->db) > 0;
}

std::set<std::string> ActivityStore::dismissedTokens() const
{
    auto lock = impl->lockRead();
    Statement stmt(impl->readDb, "SELECT token FROM dismissed_suggestions;");
    std::set<std::string> tokens;
    while (stepRow(impl->readDb, stmt)) {
        tokens.insert(columnText(stmt.get(), 0));
    }
    return tokens;
}

bool ActivityStore::integrityCheck(std::string *message) const
{
    auto lock = impl->lockRead();
    Statement stmt(impl->readDb, "PRAGMA integrity_check;");

    if (!stepRow(impl->readDb, stmt)) {
        if (message) {
            *message = "integrity_check failed to return a result";
        }
        return false;
    }

    const std::string result = columnText(stmt.get(), 0);
    if (message) {
        *message = result;
    }
    return result == "ok";
}

} // namespace hourglass
