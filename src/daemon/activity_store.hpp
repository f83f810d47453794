#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace hourglass {

// ActivityStore is the SQLite access layer for activities, the
// brand/project/rule taxonomy and dismissed suggestion tokens.
//
// Writes go through one serialized connection. Reads use a second
// connection so reports never wait on the sampling loop (both share one
// connection for ":memory:"). Storage failures throw StoreError; invalid
// taxonomy input throws ValidationError and leaves the database untouched.
class ActivityStore {
public:
    // Opens $HOME/.local/share/hourglass/hourglass.db.
    ActivityStore();
    explicit ActivityStore(const std::string &dbPath);
    ~ActivityStore();

    ActivityStore(const ActivityStore &) = delete;
    ActivityStore &operator=(const ActivityStore &) = delete;

    const std::string &path() const;

    // Activities. An empty record.date is filled from the timestamp.
    std::int64_t insertActivity(const ActivityRecord &record);
    void updateDuration(std::int64_t id, int durationSeconds);
    std::optional<ActivityRecord> getActivity(std::int64_t id) const;

    // Sets project id and source on every listed activity. Returns the number
    // of rows changed.
    int assignProject(const std::vector<std::int64_t> &activityIds,
                      std::int64_t projectId,
                      ProjectSource source);

    // Brands.
    std::int64_t insertBrand(const std::string &name, const std::string &color = {});
    void updateBrand(std::int64_t id,
                     const std::optional<std::string> &name,
                     const std::optional<std::string> &color,
                     const std::optional<int> &sortOrder = std::nullopt);
    // Removes the brand, its projects and their rules; affected activities
    // become unassigned.
    void deleteBrand(std::int64_t id);
    // Moves every project of source under target, then deletes source.
    void mergeBrand(std::int64_t sourceId, std::int64_t targetId);
    std::vector<Brand> allBrands() const;
    std::optional<Brand> getBrand(std::int64_t id) const;
    std::optional<Brand> findBrandByName(const std::string &name) const;

    // Projects.
    std::int64_t insertProject(std::int64_t brandId,
                               const std::string &name,
                               const std::string &color = {});
    void updateProject(std::int64_t id,
                       const std::optional<std::string> &name,
                       const std::optional<std::string> &color,
                       const std::optional<std::int64_t> &brandId = std::nullopt,
                       const std::optional<int> &sortOrder = std::nullopt);
    void deleteProject(std::int64_t id);
    std::vector<Project> allProjects() const;
    std::optional<Project> getProject(std::int64_t id) const;
    std::optional<Project> findProjectByName(std::int64_t brandId,
                                             const std::string &name) const;

    // Rules. Regex patterns are compiled before insertion; a pattern that does
    // not compile is rejected with ValidationError.
    std::int64_t insertRule(std::int64_t projectId,
                            RuleType type,
                            const std::string &pattern,
                            bool isRegex,
                            int priority = 0);
    void updateRule(std::int64_t id,
                    const std::optional<std::string> &pattern,
                    const std::optional<bool> &isRegex,
                    const std::optional<int> &priority);
    void deleteRule(std::int64_t id);
    // Ordered by priority ascending, then id ascending.
    std::vector<ProjectRule> loadAllProjectRules() const;
    std::vector<ProjectRule> rulesForProject(std::int64_t projectId) const;

    // Reports.
    DaySummary queryDay(const std::string &date) const;
    // Inclusive range; days without tracked seconds are omitted.
    std::vector<DaySummary> queryDays(const std::string &from, const std::string &to) const;
    // The seven days ending at today (local date when not given).
    std::vector<DaySummary> queryWeek(const std::optional<std::string> &today = std::nullopt) const;
    // Calendar month, clipped to today.
    std::vector<DaySummary> queryMonth(int year,
                                       int month,
                                       const std::optional<std::string> &today = std::nullopt) const;
    AppDetailReport queryApp(const std::string &appName) const;
    std::vector<ActivityRecord> queryTimeline(const std::string &date) const;
    std::vector<BrandSummary> queryDayByProject(const std::string &date) const;
    // Unassigned activities of one day, longest first.
    std::vector<ActivityRecord> queryUnassignedActivities(const std::string &date,
                                                          int minDurationSeconds = 0) const;
    // Unassigned activities in id order, optionally restricted to one day.
    std::vector<ActivityRecord> queryUnassignedRaw(
        const std::optional<std::string> &date = std::nullopt) const;
    // Most recent dates holding activity, newest first.
    std::vector<std::string> queryRecentDates(int limit) const;

    // Suggestion tokens the user rejected.
    void addDismissedToken(const std::string &token);
    bool removeDismissedToken(const std::string &token);
    std::set<std::string> dismissedTokens() const;

    bool integrityCheck(std::string *message) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace hourglass
