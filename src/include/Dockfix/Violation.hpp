#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "Dockfix/Location.hpp"

namespace Dockfix
{

/// How reliable a fix is. Ordered: a threshold admits every level at or below it.
enum struct FixSafety
{
    /// Always correct and behavior preserving
    Safe = 0,
    /// Likely correct but worth a review
    Suggestion = 1,
    /// Might change behavior significantly
    Unsafe = 2,
};
NLOHMANN_JSON_SERIALIZE_ENUM(FixSafety, {
                                            {FixSafety::Safe, "safe"},
                                            {FixSafety::Suggestion, "suggestion"},
                                            {FixSafety::Unsafe, "unsafe"},
                                        })

enum struct Severity
{
    Error,
    Warning,
    Info,
    Style,
    Off,
};
NLOHMANN_JSON_SERIALIZE_ENUM(Severity, {
                                           {Severity::Warning, "warning"},
                                           {Severity::Error, "error"},
                                           {Severity::Info, "info"},
                                           {Severity::Style, "style"},
                                           {Severity::Off, "off"},
                                       })

std::string toString(FixSafety safety);
std::string toString(Severity severity);

enum struct NewlineMode
{
    /// Blank line between instructions of different kinds, none between the same kind
    Grouped,
    /// At least one blank line between every pair of instructions
    Always,
    /// No blank lines between instructions
    Never,
};
NLOHMANN_JSON_SERIALIZE_ENUM(NewlineMode, {
                                              {NewlineMode::Grouped, "grouped"},
                                              {NewlineMode::Always, "always"},
                                              {NewlineMode::Never, "never"},
                                          })

struct NewlineResolveData
{
    NewlineMode mode = NewlineMode::Grouped;
};

enum struct HeredocFixKind
{
    /// Several consecutive RUN instructions
    Consecutive,
    /// One RUN with commands chained by &&
    Chained,
};

struct HeredocResolveData
{
    HeredocFixKind kind = HeredocFixKind::Consecutive;
    int stageIndex = 0;
    /// First command of the target RUN(s), used to find them again in the rewritten content
    std::string fingerprint;
    std::vector<std::string> originalCommands;
    int minCommands = 3;
};

struct EpilogueOrderResolveData
{
    int stageIndex = 0;
};

/// Resolver-specific payload carried by a deferred fix. Each resolver owns one alternative.
using ResolverData = std::variant<std::monostate, NewlineResolveData, HeredocResolveData, EpilogueOrderResolveData>;

// A proposed correction attached to one violation.
// Synchronous fixes carry their edits directly. Deferred fixes set needsResolve and name the
// resolver that computes their edits from the file content at application time.
struct SuggestedFix
{
    std::string description;
    std::vector<TextEdit> edits;
    FixSafety safety = FixSafety::Safe;
    bool isPreferred = false;
    /// Lower values are applied first (content fixes before structural rewrites)
    int priority = 0;

    bool needsResolve = false;
    std::string resolverId;
    ResolverData resolverData;
};

void to_json(nlohmann::json& j, const SuggestedFix& fix);
void from_json(const nlohmann::json& j, SuggestedFix& fix);

// A finding produced by a rule. Read-only to the fixer.
struct Violation
{
    Location location;
    std::string ruleCode;
    std::string message;
    std::string detail;
    Severity severity = Severity::Warning;
    std::string docUrl;
    std::string sourceCode;
    std::optional<SuggestedFix> suggestedFix;

    const std::string& file() const
    {
        return location.file;
    }

    int line() const
    {
        return location.start.line;
    }
};

void to_json(nlohmann::json& j, const Violation& violation);
void from_json(const nlohmann::json& j, Violation& violation);

} // namespace Dockfix
