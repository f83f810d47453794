#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "daemon/activity_store.hpp"
#include "daemon/rule_engine.hpp"

namespace hourglass {

struct SuggestionSettings {
    int minActivities = 2;
    int minApps = 1;
    // Hosts too generic to name a project; their activities fall back to
    // folder or title tokens.
    std::set<std::string> ignoredDomains;
};

// Grouping key derived from one activity. token identifies the candidate
// project ("domain:app.acme.com", "folder:acme/api", "title:quarterly plan");
// brandKey groups candidates that share a root ("root:acme").
struct ActivityToken {
    std::string token;
    std::string brandKey;
    std::string brandName;
    std::string projectName;
    SuggestedRule rule;
};

// SuggestionEngine mines unassigned activity for recurring tokens and
// proposes brands, projects and rules. Accepting a proposal creates the
// taxonomy and assigns the activities the new rules match.
class SuggestionEngine {
public:
    SuggestionEngine(ActivityStore &store,
                     RuleEngine &ruleEngine,
                     SuggestionSettings settings = SuggestionSettings());

    // Read-only. Same data in, same proposals out.
    std::vector<DetectedBrand> detect() const;

    // Returns the number of activities assigned with source suggestion.
    int accept(const AcceptRequest &request);

    void dismiss(const std::string &token);
    bool restore(const std::string &token);
    std::vector<std::string> dismissedTokens() const;

    static std::optional<ActivityToken> tokenFor(const ActivityRecord &activity,
                                                 const std::set<std::string> &ignoredDomains);
    // "saasbridge web" -> "Saasbridge Web"
    static std::string smartCapitalize(const std::string &input);

private:
    ActivityStore &m_store;
    RuleEngine &m_ruleEngine;
    SuggestionSettings m_settings;
};

} // namespace hourglass
