#include "daemon/suggestion_engine.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <regex>
#include <utility>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/string_utils.hpp"

namespace hourglass {

namespace {

constexpr std::size_t kMinTokenLength = 3;
constexpr std::size_t kMaxTitleWords = 5;

const std::set<std::string> kGenericFolders = {
    "projects", "project", "src", "code", "dev", "developer", "repos", "repositories",
    "work", "workspace", "documents", "desktop", "downloads", "home", "users", "git",
    "github", "sites", "tmp"
};

const std::set<std::string> kHomeContainers = {"home", "users"};

// Second-level labels under two-letter country codes, as in example.co.uk.
const std::set<std::string> kSecondLevelLabels = {"co", "com", "org", "net", "ac", "gov", "edu"};

const std::set<std::string> kTitleStopwords = {
    "untitled", "home", "new tab", "unknown", "settings", "welcome", "inbox",
    "loading", "start page", "preferences"
};

// Apps whose extra context names the open design file.
const std::set<std::string> kDesignBundleIds = {
    "com.figma.Desktop", "com.bohemiancoding.sketch3", "com.adobe.illustrator"
};

const std::vector<std::string> kTitleSeparators = {" \xE2\x80\x94 ", " \xE2\x80\x93 ", " - ", " | ", ": "};

std::string join(const std::vector<std::string> &parts, std::size_t begin, std::size_t end,
                 const std::string &separator)
{
    std::string out;
    for (std::size_t i = begin; i < end && i < parts.size(); ++i) {
        if (!out.empty()) {
            out += separator;
        }
        out += parts[i];
    }
    return out;
}

bool isAllDigits(const std::string &value)
{
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isdigit(c) || c == '.';
    });
}

// Lower-cased words of value, with '-', '_' and '.' treated as spaces.
std::vector<std::string> normalizedWords(const std::string &value)
{
    return splitNonEmpty(toLower(value), " \t-_.");
}

// Name of the part of words that follows root, or root itself.
std::string nameAfterRoot(const std::vector<std::string> &words, const std::string &root)
{
    if (words.size() > 1 && words.front() == root) {
        return SuggestionEngine::smartCapitalize(join(words, 1, words.size(), " "));
    }
    if (words.size() == 1 && words.front() == root) {
        return SuggestionEngine::smartCapitalize(root);
    }
    return SuggestionEngine::smartCapitalize(join(words, 0, words.size(), " "));
}

std::optional<ActivityToken> domainToken(const std::string &url,
                                         const std::set<std::string> &ignoredDomains)
{
    std::string host = urlHost(url);
    if (startsWith(host, "www.")) {
        host = host.substr(4);
    }
    if (host.empty() || isAllDigits(host)) {
        return std::nullopt;
    }
    for (const std::string &ignored : ignoredDomains) {
        const std::string lowered = toLower(ignored);
        if (host == lowered || endsWith(host, "." + lowered)) {
            return std::nullopt;
        }
    }

    const std::vector<std::string> labels = splitNonEmpty(host, ".");
    if (labels.size() < 2) {
        return std::nullopt;
    }
    std::size_t rootIndex = labels.size() - 2;
    if (labels.size() >= 3 && labels.back().size() == 2
        && kSecondLevelLabels.count(labels[rootIndex]) > 0) {
        --rootIndex;
    }
    const std::string root = labels[rootIndex];
    if (root.size() < kMinTokenLength) {
        return std::nullopt;
    }

    ActivityToken token;
    token.token = "domain:" + host;
    token.brandKey = "root:" + root;
    token.brandName = SuggestionEngine::smartCapitalize(root);
    const std::string sub = join(labels, 0, rootIndex, " ");
    token.projectName = sub.empty() ? token.brandName : SuggestionEngine::smartCapitalize(sub);
    token.rule = SuggestedRule{RuleType::UrlDomain, host, false};
    return token;
}

std::optional<ActivityToken> folderToken(const std::string &extraInfo)
{
    const std::string value = trim(extraInfo);
    if (value.find('/') == std::string::npos && !startsWith(value, "~")) {
        return std::nullopt;
    }

    std::vector<std::string> segments;
    for (const std::string &segment : splitNonEmpty(value, "/")) {
        if (segment != "~" && segment != "." && segment != "..") {
            segments.push_back(segment);
        }
    }
    if (segments.empty()) {
        return std::nullopt;
    }

    const std::string leaf = toLower(segments.back());
    const std::size_t n = segments.size();
    const std::string parent = n >= 2 ? toLower(segments[n - 2]) : std::string();
    const bool parentIsUser = n >= 3 && kHomeContainers.count(toLower(segments[n - 3])) > 0;
    const bool useParent = parent.size() >= kMinTokenLength
        && kGenericFolders.count(parent) == 0
        && !parentIsUser
        && !(n == 2 && kHomeContainers.count(parent) > 0);

    if (!useParent && (kGenericFolders.count(leaf) > 0 || leaf.size() < kMinTokenLength)) {
        return std::nullopt;
    }

    const std::vector<std::string> leafWords = normalizedWords(leaf);
    if (leafWords.empty()) {
        return std::nullopt;
    }

    ActivityToken token;
    std::string root;
    if (useParent) {
        root = parent;
        token.token = "folder:" + parent + "/" + leaf;
        token.projectName = nameAfterRoot(leafWords, root);
        token.rule = SuggestedRule{RuleType::TerminalFolder, parent + "/" + leaf, false};
    } else {
        root = leafWords.front();
        token.token = "folder:" + leaf;
        token.projectName = nameAfterRoot(leafWords, root);
        token.rule = SuggestedRule{RuleType::TerminalFolder, leaf, false};
    }
    token.brandKey = "root:" + root;
    token.brandName = SuggestionEngine::smartCapitalize(join(normalizedWords(root), 0, 8, " "));
    return token;
}

std::optional<ActivityToken> titleToken(const std::string &appName, const std::string &title)
{
    const std::string value = trim(title);
    if (value.empty()) {
        return std::nullopt;
    }

    std::size_t cut = std::string::npos;
    for (const std::string &separator : kTitleSeparators) {
        const std::size_t pos = value.find(separator);
        if (pos != std::string::npos && pos < cut) {
            cut = pos;
        }
    }

    const std::vector<std::string> words =
        splitNonEmpty(toLower(cut == std::string::npos ? value : value.substr(0, cut)), " \t");
    if (words.empty() || words.size() > kMaxTitleWords) {
        return std::nullopt;
    }
    const std::string leading = join(words, 0, words.size(), " ");
    if (leading.size() < kMinTokenLength
        || kTitleStopwords.count(leading) > 0
        || leading == toLower(trim(appName))
        || isAllDigits(leading)) {
        return std::nullopt;
    }

    const std::string root = words.front();
    ActivityToken token;
    token.token = "title:" + leading;
    token.brandKey = "root:" + root;
    token.brandName = SuggestionEngine::smartCapitalize(root);
    token.projectName = nameAfterRoot(words, root);
    token.rule = SuggestedRule{RuleType::WindowTitle, leading, false};
    return token;
}

bool isDesignApp(const ActivityRecord &activity)
{
    return kDesignBundleIds.count(activity.bundleId) > 0;
}

// File name of the design document in extra context, "Acme Landing.fig".
std::optional<std::string> designFileName(const std::string &extraInfo)
{
    const std::vector<std::string> segments = splitNonEmpty(trim(extraInfo), "/");
    if (segments.empty()) {
        return std::nullopt;
    }
    const std::string name = trim(segments.back());
    if (name.size() < kMinTokenLength) {
        return std::nullopt;
    }
    return name;
}

// Rules for every field of activity that can identify a project on its own:
// the URL host, the terminal folder, and the design file for design apps.
std::vector<SuggestedRule> distinguishingFields(const ActivityRecord &activity,
                                                const std::set<std::string> &ignoredDomains)
{
    std::vector<SuggestedRule> fields;
    if (activity.url && !activity.url->empty()) {
        if (auto token = domainToken(*activity.url, ignoredDomains)) {
            fields.push_back(token->rule);
        }
    }
    if (activity.extraInfo && !activity.extraInfo->empty()) {
        if (isDesignApp(activity)) {
            if (auto name = designFileName(*activity.extraInfo)) {
                fields.push_back(SuggestedRule{RuleType::DesignFile, *name, false});
            }
        } else if (auto token = folderToken(*activity.extraInfo)) {
            fields.push_back(token->rule);
        }
    }
    return fields;
}

using RuleKey = std::pair<RuleType, std::string>;

RuleKey ruleKey(const SuggestedRule &rule)
{
    return {rule.ruleType, toLower(rule.pattern)};
}

struct ObservedField {
    SuggestedRule rule;
    int count = 0;
};

struct TokenGroup {
    ActivityToken sample;
    int count = 0;
    int seconds = 0;
    std::set<std::string> apps;
    std::vector<std::int64_t> ids;
    std::map<RuleKey, ObservedField> fields;
};

} // namespace

SuggestionEngine::SuggestionEngine(ActivityStore &store,
                                   RuleEngine &ruleEngine,
                                   SuggestionSettings settings)
    : m_store(store)
    , m_ruleEngine(ruleEngine)
    , m_settings(std::move(settings))
{
}

std::string SuggestionEngine::smartCapitalize(const std::string &input)
{
    std::string out;
    bool startOfWord = true;
    for (const char c : input) {
        if (c == ' ') {
            startOfWord = true;
            out.push_back(c);
            continue;
        }
        out.push_back(startOfWord ? static_cast<char>(std::toupper(static_cast<unsigned char>(c)))
                                  : c);
        startOfWord = false;
    }
    return out;
}

std::optional<ActivityToken> SuggestionEngine::tokenFor(const ActivityRecord &activity,
                                                        const std::set<std::string> &ignoredDomains)
{
    if (activity.url && !activity.url->empty()) {
        if (auto token = domainToken(*activity.url, ignoredDomains)) {
            return token;
        }
    }
    if (activity.extraInfo && !activity.extraInfo->empty() && !isDesignApp(activity)) {
        if (auto token = folderToken(*activity.extraInfo)) {
            return token;
        }
    }
    return titleToken(activity.appName, activity.windowTitle);
}

std::vector<DetectedBrand> SuggestionEngine::detect() const
{
    const std::set<std::string> dismissed = m_store.dismissedTokens();

    std::set<RuleKey> existingRules;
    for (const ProjectRule &rule : m_store.loadAllProjectRules()) {
        existingRules.emplace(rule.ruleType, toLower(rule.pattern));
    }

    std::map<std::string, TokenGroup> groups;
    for (const ActivityRecord &activity : m_store.queryUnassignedRaw()) {
        std::optional<ActivityToken> token = tokenFor(activity, m_settings.ignoredDomains);
        if (!token || dismissed.count(token->token) > 0 || dismissed.count(token->brandKey) > 0) {
            continue;
        }
        TokenGroup &group = groups[token->token];
        if (group.count == 0) {
            group.sample = *token;
        }
        ++group.count;
        group.seconds += activity.durationSeconds;
        group.apps.insert(activity.appName);
        group.ids.push_back(activity.id);
        for (const SuggestedRule &field : distinguishingFields(activity, m_settings.ignoredDomains)) {
            ObservedField &observed = group.fields[ruleKey(field)];
            if (observed.count == 0) {
                observed.rule = field;
            }
            ++observed.count;
        }
    }

    // A secondary field must recur as often as a project must.
    const int minFieldCount = std::max(1, m_settings.minActivities);

    std::map<std::string, DetectedBrand> brands;
    for (const auto &[key, group] : groups) {
        if (group.count < m_settings.minActivities
            || static_cast<int>(group.apps.size()) < m_settings.minApps) {
            continue;
        }
        std::vector<SuggestedRule> rules;
        std::set<RuleKey> proposed;
        auto propose = [&](const SuggestedRule &rule) {
            const RuleKey key = ruleKey(rule);
            if (existingRules.count(key) == 0 && proposed.insert(key).second) {
                rules.push_back(rule);
            }
        };
        propose(group.sample.rule);
        for (const auto &entry : group.fields) {
            if (entry.second.count >= minFieldCount) {
                propose(entry.second.rule);
            }
        }
        if (rules.empty()) {
            continue;
        }

        DetectedProject project;
        project.token = key;
        project.suggestedName = group.sample.projectName;
        project.activityCount = group.count;
        project.totalSeconds = group.seconds;
        project.apps.assign(group.apps.begin(), group.apps.end());
        project.activityIds = group.ids;
        project.suggestedRules = std::move(rules);

        DetectedBrand &brand = brands[group.sample.brandKey];
        brand.rootToken = group.sample.brandKey;
        brand.suggestedName = group.sample.brandName;
        brand.totalActivities += project.activityCount;
        brand.totalSeconds += project.totalSeconds;
        brand.projects.push_back(std::move(project));
    }

    std::vector<DetectedBrand> out;
    for (auto &[key, brand] : brands) {
        std::sort(brand.projects.begin(), brand.projects.end(),
                  [](const DetectedProject &a, const DetectedProject &b) {
                      if (a.activityCount != b.activityCount) {
                          return a.activityCount > b.activityCount;
                      }
                      return a.token < b.token;
                  });
        out.push_back(std::move(brand));
    }
    std::sort(out.begin(), out.end(), [](const DetectedBrand &a, const DetectedBrand &b) {
        if (a.totalActivities != b.totalActivities) {
            return a.totalActivities > b.totalActivities;
        }
        return a.rootToken < b.rootToken;
    });

    HGLOG_INFO("suggest",
               "SuggestionEngine::detect",
               "detection_completed",
               "propose projects for unassigned activity",
               "token grouping",
               ::hourglass::logging::defaultWho(),
               "",
               (nlohmann::json{{"groups", groups.size()}, {"brands", out.size()}}));
    return out;
}

int SuggestionEngine::accept(const AcceptRequest &request)
{
    for (const SuggestedRule &rule : request.rules) {
        if (trim(rule.pattern).empty()) {
            throw ValidationError("suggested rule pattern must not be empty");
        }
        if (rule.isRegex) {
            try {
                std::regex compiled(rule.pattern, std::regex::ECMAScript);
                (void)compiled;
            } catch (const std::regex_error &ex) {
                throw ValidationError("invalid regex pattern '" + rule.pattern + "': " + ex.what());
            }
        }
    }

    std::int64_t projectId = 0;
    if (request.existingProjectId) {
        if (!m_store.getProject(*request.existingProjectId)) {
            throw ValidationError("project " + std::to_string(*request.existingProjectId)
                                  + " does not exist");
        }
        projectId = *request.existingProjectId;
    } else {
        const std::string brandName = trim(request.brandName);
        if (brandName.empty()) {
            throw ValidationError("accepting a suggestion requires a brand name or a project id");
        }
        std::int64_t brandId = 0;
        if (const std::optional<Brand> brand = m_store.findBrandByName(brandName)) {
            brandId = brand->id;
        } else {
            brandId = m_store.insertBrand(brandName, request.color);
        }

        const std::string projectName = trim(request.projectName).empty()
            ? brandName
            : trim(request.projectName);
        if (const std::optional<Project> project = m_store.findProjectByName(brandId, projectName)) {
            projectId = project->id;
        } else {
            projectId = m_store.insertProject(brandId, projectName, request.color);
        }
    }

    std::vector<ProjectRule> inserted;
    for (const SuggestedRule &suggested : request.rules) {
        ProjectRule rule;
        rule.projectId = projectId;
        rule.ruleType = suggested.ruleType;
        rule.pattern = suggested.pattern;
        rule.isRegex = suggested.isRegex;
        rule.id = m_store.insertRule(projectId, rule.ruleType, rule.pattern, rule.isRegex, 0);
        inserted.push_back(rule);
    }
    m_ruleEngine.reloadRules();

    const CompiledRuleSet newRules = RuleEngine::compileRules(inserted);
    std::vector<std::int64_t> matched;
    if (!newRules.empty()) {
        for (const ActivityRecord &activity : m_store.queryUnassignedRaw()) {
            if (RuleEngine::firstMatch(newRules, activity)) {
                matched.push_back(activity.id);
            }
        }
    }
    const int assigned = m_store.assignProject(matched, projectId, ProjectSource::Suggestion);

    HGLOG_INFO("suggest",
               "SuggestionEngine::accept",
               "suggestion_accepted",
               "user accepted a proposal",
               "store + rule engine",
               ::hourglass::logging::defaultWho(),
               "",
               (nlohmann::json{{"projectId", projectId},
                               {"rules", inserted.size()},
                               {"assigned", assigned}}));
    return assigned;
}

void SuggestionEngine::dismiss(const std::string &token)
{
    if (trim(token).empty()) {
        throw ValidationError("token must not be empty");
    }
    m_store.addDismissedToken(token);
}

bool SuggestionEngine::restore(const std::string &token)
{
    return m_store.removeDismissedToken(token);
}

std::vector<std::string> SuggestionEngine::dismissedTokens() const
{
    const std::set<std::string> tokens = m_store.dismissedTokens();
    return std::vector<std::string>(tokens.begin(), tokens.end());
}

} // namespace hourglass
