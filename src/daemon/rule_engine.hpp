#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "daemon/activity_store.hpp"

namespace hourglass {

struct CompiledRule {
    ProjectRule rule;
    std::optional<std::regex> regex;
};

using CompiledRuleSet = std::vector<CompiledRule>;

// RuleCache holds the compiled rule set. Readers take an immutable snapshot,
// so a reload never disturbs a classification already in progress.
class RuleCache {
public:
    explicit RuleCache(ActivityStore &store);

    // Loads from the store on first use or after invalidate().
    std::shared_ptr<const CompiledRuleSet> snapshot();
    void invalidate();
    void reload();

private:
    ActivityStore &m_store;
    std::mutex m_mutex;
    std::shared_ptr<const CompiledRuleSet> m_rules;
};

// RuleEngine maps an activity to a project by evaluating rules in
// (priority, id) order; the first rule whose field matches wins.
class RuleEngine {
public:
    explicit RuleEngine(ActivityStore &store);

    std::optional<std::int64_t> match(const ActivityRecord &activity);
    std::optional<ProjectRule> matchingRule(const ActivityRecord &activity);

    // Assigns every unassigned activity (optionally one day only) that a rule
    // matches, with source auto. Returns the number assigned.
    int autoAssignUnclassified(const std::optional<std::string> &date = std::nullopt);

    void reloadRules();

    // Manual classification. Optionally records a literal rule so similar
    // activities classify automatically from now on. Returns the number of
    // activities assigned.
    int classify(const std::vector<std::int64_t> &activityIds,
                 std::int64_t projectId,
                 bool createRule = false,
                 const std::optional<RuleType> &ruleType = std::nullopt,
                 const std::string &pattern = std::string());

    std::int64_t addRule(const ProjectRule &rule);
    void updateRule(std::int64_t id,
                    const std::optional<std::string> &pattern,
                    const std::optional<bool> &isRegex,
                    const std::optional<int> &priority);
    void removeRule(std::int64_t id);

    static CompiledRuleSet compileRules(const std::vector<ProjectRule> &rules);
    static const CompiledRule *firstMatch(const CompiledRuleSet &rules,
                                          const ActivityRecord &activity);
    static bool ruleMatches(const CompiledRule &rule, const ActivityRecord &activity);

private:
    ActivityStore &m_store;
    RuleCache m_cache;
};

} // namespace hourglass
