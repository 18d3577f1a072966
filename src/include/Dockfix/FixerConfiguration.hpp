#pragma once
#include <string>
#include <unordered_map>
#include <vector>

#include "nlohmann/json.hpp"
#include "Dockfix/Violation.hpp"

namespace Dockfix
{

/// Per-file, per-rule policy controlling when a rule's fixes may be applied
enum struct FixMode
{
    /// Apply whenever the safety threshold admits the fix (default)
    Always,
    /// Never apply
    Never,
    /// Only apply when the rule is named in the rule filter
    Explicit,
    /// Only apply when the safety threshold admits unsafe fixes
    UnsafeOnly,
};
// Unrecognized strings deserialize to the first entry, so unknown modes fail open to Always
NLOHMANN_JSON_SERIALIZE_ENUM(FixMode, {
                                          {FixMode::Always, "always"},
                                          {FixMode::Never, "never"},
                                          {FixMode::Explicit, "explicit"},
                                          {FixMode::UnsafeOnly, "unsafe-only"},
                                      })

enum struct ResolveStrategy
{
    /// Resolve all deferred fixes concurrently against the content left by synchronous fixes
    Parallel,
    /// Resolve and apply deferred fixes one at a time, each seeing the previous one's output
    Sequential,
};
NLOHMANN_JSON_SERIALIZE_ENUM(ResolveStrategy, {
                                                  {ResolveStrategy::Parallel, "parallel"},
                                                  {ResolveStrategy::Sequential, "sequential"},
                                              })

/// rule code -> fix mode
using RuleFixModes = std::unordered_map<std::string, FixMode>;

struct FixerConfiguration
{
    /// Only fixes at or below this safety level are applied
    FixSafety safetyThreshold = FixSafety::Safe;
    /// Rule codes whose fixes may be applied. Empty means every rule.
    std::vector<std::string> ruleFilter{};
    /// normalized file path -> per-rule fix modes. Missing entries mean FixMode::Always.
    std::unordered_map<std::string, RuleFixModes> fixModes{};
    /// Upper bound on concurrently running resolvers
    size_t concurrency = 4;
    ResolveStrategy resolveStrategy = ResolveStrategy::Parallel;

    /// Installs the fix modes for one file, keyed by its normalized path
    void setFileFixModes(const std::string& path, RuleFixModes modes);

    /// The effective fix mode of `ruleCode` in `path`
    FixMode fixModeFor(const std::string& path, const std::string& ruleCode) const;
};

void to_json(nlohmann::json& j, const FixerConfiguration& config);
void from_json(const nlohmann::json& j, FixerConfiguration& config);

/// Lexically normalizes a path so that different spellings of one file share a map key
std::string normalizePath(const std::string& path);

/// Extracts per-rule fix modes from a rules section shaped { "<namespace>": { "<rule>": { "fix": "<mode>" } } }.
/// Keys of the result are "<namespace>/<rule>". Rules without a "fix" entry are left out.
RuleFixModes buildFixModes(const nlohmann::json& rules);

} // namespace Dockfix
