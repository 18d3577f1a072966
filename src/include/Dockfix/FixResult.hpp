#pragma once
#include <string>
#include <unordered_map>
#include <vector>

#include "Dockfix/Location.hpp"

namespace Dockfix
{

/// Why a fix candidate was not applied
enum struct SkipReason
{
    Conflict,
    Safety,
    RuleFilter,
    ResolveError,
    NoEdits,
    FixMode,
    InvalidRange,
};
NLOHMANN_JSON_SERIALIZE_ENUM(SkipReason, {
                                             {SkipReason::Conflict, "conflict"},
                                             {SkipReason::Safety, "safety"},
                                             {SkipReason::RuleFilter, "rule-filter"},
                                             {SkipReason::ResolveError, "resolve-error"},
                                             {SkipReason::NoEdits, "no-edits"},
                                             {SkipReason::FixMode, "fix-mode"},
                                             {SkipReason::InvalidRange, "invalid-range"},
                                         })

/// Human readable description of a skip reason
std::string toString(SkipReason reason);

struct AppliedFix
{
    std::string ruleCode;
    std::string description;
    Location location;
    /// The fix's edits in the coordinates of the content they were computed against (before drift adjustment)
    std::vector<TextEdit> edits;
};

struct SkippedFix
{
    std::string ruleCode;
    SkipReason reason = SkipReason::Conflict;
    Location location;
    /// Diagnostic text, set for resolver failures
    std::string error;
};

// Per-file accumulator for one fixer run
struct FileChange
{
    /// The path as the caller spelled it
    std::string path;
    std::string originalContent;
    std::string modifiedContent;
    std::vector<AppliedFix> fixesApplied;
    std::vector<SkippedFix> fixesSkipped;

    /// Whether any fix was applied to this file
    bool hasChanges() const
    {
        return !fixesApplied.empty();
    }

    /// Whether the file's bytes differ from what the caller handed in
    bool isModified() const
    {
        return modifiedContent != originalContent;
    }
};

struct FixResult
{
    /// Keyed by normalized file path
    std::unordered_map<std::string, FileChange> changes;

    size_t totalApplied() const;
    size_t totalSkipped() const;
    /// Number of files whose bytes were actually changed
    size_t filesModified() const;

    const FileChange* find(const std::string& path) const;
};

void to_json(nlohmann::json& j, const AppliedFix& fix);
void to_json(nlohmann::json& j, const SkippedFix& fix);
void to_json(nlohmann::json& j, const FileChange& change);
void to_json(nlohmann::json& j, const FixResult& result);

} // namespace Dockfix
