#include "daemon/rule_engine.hpp"

#include <algorithm>
#include <exception>
#include <map>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/string_utils.hpp"

namespace hourglass {

namespace {

std::string stripTrailingSlashes(std::string value)
{
    while (value.size() > 1 && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

std::string lastPathSegment(const std::string &path)
{
    const std::string stripped = stripTrailingSlashes(path);
    const auto pos = stripped.find_last_of('/');
    return pos == std::string::npos ? stripped : stripped.substr(pos + 1);
}

// Values a rule type inspects. Empty when the activity does not populate
// the field, in which case the rule is skipped.
std::vector<std::string> candidateFields(RuleType type, const ActivityRecord &activity)
{
    std::vector<std::string> fields;
    switch (type) {
    case RuleType::TerminalFolder:
        if (activity.extraInfo && !activity.extraInfo->empty()) {
            fields.push_back(*activity.extraInfo);
        }
        break;
    case RuleType::UrlDomain:
        if (activity.url && !activity.url->empty()) {
            const std::string host = urlHost(*activity.url);
            if (!host.empty()) {
                fields.push_back(host);
            }
        }
        break;
    case RuleType::UrlPath:
        if (activity.url && !activity.url->empty()) {
            const std::string path = urlPath(*activity.url);
            if (!path.empty()) {
                fields.push_back(path);
            }
        }
        break;
    case RuleType::PageTitle:
    case RuleType::WindowTitle:
        if (!activity.windowTitle.empty()) {
            fields.push_back(activity.windowTitle);
        }
        break;
    case RuleType::DesignFile:
        if (activity.extraInfo && !activity.extraInfo->empty()) {
            fields.push_back(*activity.extraInfo);
        }
        if (activity.url && !activity.url->empty()) {
            fields.push_back(*activity.url);
        }
        break;
    case RuleType::BundleId:
        if (!activity.bundleId.empty()) {
            fields.push_back(activity.bundleId);
        }
        break;
    }
    return fields;
}

// host equals pattern or is a subdomain of it; a leading "www." on the
// pattern is ignored.
bool domainMatches(const std::string &host, std::string pattern)
{
    pattern = toLower(trim(pattern));
    if (startsWith(pattern, "www.")) {
        pattern = pattern.substr(4);
    }
    const std::string lowered = toLower(host);
    if (lowered == pattern) {
        return true;
    }
    return endsWith(lowered, "." + pattern);
}

// Without a slash the pattern names the last folder. With one it names a
// trailing run of segments.
bool folderMatches(const std::string &path, const std::string &pattern)
{
    const std::string wanted = toLower(stripTrailingSlashes(trim(pattern)));
    if (wanted.empty()) {
        return false;
    }
    if (wanted.find('/') == std::string::npos) {
        return toLower(lastPathSegment(path)) == wanted;
    }
    const std::string lowered = toLower(stripTrailingSlashes(path));
    if (lowered == wanted) {
        return true;
    }
    const std::string tail = wanted.front() == '/' ? wanted : "/" + wanted;
    return endsWith(lowered, tail);
}

bool literalMatches(RuleType type, const std::string &field, const std::string &pattern)
{
    switch (type) {
    case RuleType::UrlDomain:
        return domainMatches(field, pattern);
    case RuleType::TerminalFolder:
        return folderMatches(field, pattern);
    case RuleType::UrlPath:
        if (startsWith(pattern, "/")) {
            return startsWith(toLower(field), toLower(pattern));
        }
        return containsCaseInsensitive(field, pattern);
    case RuleType::BundleId:
        return field == pattern;
    case RuleType::PageTitle:
    case RuleType::WindowTitle:
    case RuleType::DesignFile:
        return containsCaseInsensitive(field, pattern);
    }
    return false;
}

} // namespace

RuleCache::RuleCache(ActivityStore &store)
    : m_store(store)
{
}

std::shared_ptr<const CompiledRuleSet> RuleCache::snapshot()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_rules) {
        m_rules = std::make_shared<const CompiledRuleSet>(
            RuleEngine::compileRules(m_store.loadAllProjectRules()));
    }
    return m_rules;
}

void RuleCache::invalidate()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_rules.reset();
}

void RuleCache::reload()
{
    auto fresh = std::make_shared<const CompiledRuleSet>(
        RuleEngine::compileRules(m_store.loadAllProjectRules()));
    std::lock_guard<std::mutex> lock(m_mutex);
    m_rules = std::move(fresh);
}

RuleEngine::RuleEngine(ActivityStore &store)
    : m_store(store)
    , m_cache(store)
{
}

CompiledRuleSet RuleEngine::compileRules(const std::vector<ProjectRule> &rules)
{
    CompiledRuleSet compiled;
    compiled.reserve(rules.size());
    for (const ProjectRule &rule : rules) {
        CompiledRule entry;
        entry.rule = rule;
        if (rule.isRegex) {
            try {
                entry.regex.emplace(rule.pattern, std::regex::ECMAScript);
            } catch (const std::regex_error &ex) {
                HGLOG_WARN("rules",
                           "RuleEngine::compileRules",
                           "rule_skipped",
                           "stored regex does not compile",
                           "std::regex",
                           ::hourglass::logging::defaultWho(),
                           "",
                           (nlohmann::json{{"ruleId", rule.id},
                                           {"pattern", rule.pattern},
                                           {"error", ex.what()}}));
                continue;
            }
        }
        compiled.push_back(std::move(entry));
    }
    std::stable_sort(compiled.begin(), compiled.end(),
                     [](const CompiledRule &a, const CompiledRule &b) {
                         if (a.rule.priority != b.rule.priority) {
                             return a.rule.priority < b.rule.priority;
                         }
                         return a.rule.id < b.rule.id;
                     });
    return compiled;
}

bool RuleEngine::ruleMatches(const CompiledRule &rule, const ActivityRecord &activity)
{
    const RuleType type = rule.rule.ruleType;
    for (std::string field : candidateFields(type, activity)) {
        if (rule.regex) {
            if (type == RuleType::TerminalFolder) {
                field = lastPathSegment(field);
            }
            if (std::regex_search(field, *rule.regex)) {
                return true;
            }
        } else if (literalMatches(type, field, rule.rule.pattern)) {
            return true;
        }
    }
    return false;
}

const CompiledRule *RuleEngine::firstMatch(const CompiledRuleSet &rules,
                                           const ActivityRecord &activity)
{
    for (const CompiledRule &rule : rules) {
        if (ruleMatches(rule, activity)) {
            return &rule;
        }
    }
    return nullptr;
}

std::optional<ProjectRule> RuleEngine::matchingRule(const ActivityRecord &activity)
{
    const auto rules = m_cache.snapshot();
    const CompiledRule *hit = firstMatch(*rules, activity);
    if (!hit) {
        return std::nullopt;
    }
    return hit->rule;
}

std::optional<std::int64_t> RuleEngine::match(const ActivityRecord &activity)
{
    const std::optional<ProjectRule> rule = matchingRule(activity);
    if (!rule) {
        return std::nullopt;
    }
    return rule->projectId;
}

int RuleEngine::autoAssignUnclassified(const std::optional<std::string> &date)
{
    m_cache.reload();
    const auto rules = m_cache.snapshot();
    if (rules->empty()) {
        return 0;
    }

    std::map<std::int64_t, std::vector<std::int64_t>> byProject;
    for (const ActivityRecord &activity : m_store.queryUnassignedRaw(date)) {
        if (const CompiledRule *hit = firstMatch(*rules, activity)) {
            byProject[hit->rule.projectId].push_back(activity.id);
        }
    }

    int assigned = 0;
    for (const auto &[projectId, ids] : byProject) {
        assigned += m_store.assignProject(ids, projectId, ProjectSource::Auto);
    }

    HGLOG_INFO("rules",
               "RuleEngine::autoAssignUnclassified",
               "auto_assign_completed",
               "classify unassigned activities",
               "rule cache",
               ::hourglass::logging::defaultWho(),
               "",
               (nlohmann::json{{"date", date ? nlohmann::json(*date) : nlohmann::json(nullptr)},
                               {"assigned", assigned}}));
    return assigned;
}

void RuleEngine::reloadRules()
{
    m_cache.reload();
}

int RuleEngine::classify(const std::vector<std::int64_t> &activityIds,
                         std::int64_t projectId,
                         bool createRule,
                         const std::optional<RuleType> &ruleType,
                         const std::string &pattern)
{
    if (!m_store.getProject(projectId)) {
        throw ValidationError("project " + std::to_string(projectId) + " does not exist");
    }
    if (createRule && (!ruleType || trim(pattern).empty())) {
        throw ValidationError("creating a rule requires a rule type and a pattern");
    }

    // The rule is only written once the assignment has gone through.
    const int assigned = m_store.assignProject(activityIds, projectId, ProjectSource::Manual);
    if (createRule) {
        m_store.insertRule(projectId, *ruleType, pattern, false, 0);
        m_cache.reload();
    }
    return assigned;
}

std::int64_t RuleEngine::addRule(const ProjectRule &rule)
{
    const std::int64_t id = m_store.insertRule(rule.projectId,
                                               rule.ruleType,
                                               rule.pattern,
                                               rule.isRegex,
                                               rule.priority);
    m_cache.invalidate();
    return id;
}

void RuleEngine::updateRule(std::int64_t id,
                            const std::optional<std::string> &pattern,
                            const std::optional<bool> &isRegex,
                            const std::optional<int> &priority)
{
    m_store.updateRule(id, pattern, isRegex, priority);
    m_cache.invalidate();
}

void RuleEngine::removeRule(std::int64_t id)
{
    m_store.deleteRule(id);
    m_cache.invalidate();
}

} // namespace hourglass
