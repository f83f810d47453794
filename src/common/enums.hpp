#pragma once

namespace hourglass {

// Field a project rule inspects. Persisted by name, see toRuleTypeString().
enum class RuleType {
    TerminalFolder,
    UrlDomain,
    UrlPath,
    PageTitle,
    DesignFile,
    BundleId,
    WindowTitle
};

// How an activity's current project id was set.
enum class ProjectSource {
    Auto,
    Manual,
    Suggestion
};

} // namespace hourglass
