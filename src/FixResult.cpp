#include "Dockfix/FixResult.hpp"
#include "Dockfix/FixerConfiguration.hpp"

namespace Dockfix
{

std::string toString(SkipReason reason)
{
    switch (reason)
    {
    case SkipReason::Conflict:
        return "conflicts with another fix";
    case SkipReason::Safety:
        return "below safety threshold";
    case SkipReason::RuleFilter:
        return "rule not in fix-rule list";
    case SkipReason::ResolveError:
        return "resolver failed";
    case SkipReason::NoEdits:
        return "no edits in fix";
    case SkipReason::FixMode:
        return "disabled by fix mode config";
    case SkipReason::InvalidRange:
        return "edit range outside file";
    }
    return "unknown reason";
}

size_t FixResult::totalApplied() const
{
    size_t count = 0;
    for (const auto& [_, change] : changes)
        count += change.fixesApplied.size();
    return count;
}

size_t FixResult::totalSkipped() const
{
    size_t count = 0;
    for (const auto& [_, change] : changes)
        count += change.fixesSkipped.size();
    return count;
}

size_t FixResult::filesModified() const
{
    size_t count = 0;
    for (const auto& [_, change] : changes)
    {
        if (change.isModified())
            count++;
    }
    return count;
}

const FileChange* FixResult::find(const std::string& path) const
{
    auto it = changes.find(normalizePath(path));
    if (it == changes.end())
        return nullptr;
    return &it->second;
}

void to_json(nlohmann::json& j, const AppliedFix& fix)
{
    j = nlohmann::json{{"rule", fix.ruleCode}, {"description", fix.description}, {"location", fix.location}, {"edits", fix.edits}};
}

void to_json(nlohmann::json& j, const SkippedFix& fix)
{
    j = nlohmann::json{{"rule", fix.ruleCode}, {"reason", fix.reason}, {"message", toString(fix.reason)}, {"location", fix.location}};
    if (!fix.error.empty())
        j["error"] = fix.error;
}

// File contents are left out: callers read them from the FileChange directly
void to_json(nlohmann::json& j, const FileChange& change)
{
    j = nlohmann::json{
        {"path", change.path},
        {"modified", change.isModified()},
        {"applied", change.fixesApplied},
        {"skipped", change.fixesSkipped},
    };
}

void to_json(nlohmann::json& j, const FixResult& result)
{
    auto files = nlohmann::json::object();
    for (const auto& [path, change] : result.changes)
        files[path] = change;

    j = nlohmann::json{
        {"files", files},
        {"totalApplied", result.totalApplied()},
        {"totalSkipped", result.totalSkipped()},
        {"filesModified", result.filesModified()},
    };
}

} // namespace Dockfix
