#include "Dockfix/Violation.hpp"

namespace Dockfix
{

std::string toString(FixSafety safety)
{
    switch (safety)
    {
    case FixSafety::Safe:
        return "safe";
    case FixSafety::Suggestion:
        return "suggestion";
    case FixSafety::Unsafe:
        return "unsafe";
    }
    return "unknown";
}

std::string toString(Severity severity)
{
    switch (severity)
    {
    case Severity::Error:
        return "error";
    case Severity::Warning:
        return "warning";
    case Severity::Info:
        return "info";
    case Severity::Style:
        return "style";
    case Severity::Off:
        return "off";
    }
    return "unknown";
}

// The resolver payload stays in memory: it only has meaning to the resolver that consumes it
void to_json(nlohmann::json& j, const SuggestedFix& fix)
{
    j = nlohmann::json{{"description", fix.description}, {"edits", fix.edits}, {"safety", fix.safety}, {"priority", fix.priority}};
    if (fix.isPreferred)
        j["isPreferred"] = true;
    if (fix.needsResolve)
    {
        j["needsResolve"] = true;
        j["resolverId"] = fix.resolverId;
    }
}

void from_json(const nlohmann::json& j, SuggestedFix& fix)
{
    if (j.contains("description"))
        j.at("description").get_to(fix.description);
    if (j.contains("edits"))
        j.at("edits").get_to(fix.edits);
    if (j.contains("safety"))
        j.at("safety").get_to(fix.safety);
    if (j.contains("isPreferred"))
        j.at("isPreferred").get_to(fix.isPreferred);
    if (j.contains("priority"))
        j.at("priority").get_to(fix.priority);
    if (j.contains("needsResolve"))
        j.at("needsResolve").get_to(fix.needsResolve);
    if (j.contains("resolverId"))
        j.at("resolverId").get_to(fix.resolverId);
}

void to_json(nlohmann::json& j, const Violation& violation)
{
    j = nlohmann::json{
        {"location", violation.location},
        {"rule", violation.ruleCode},
        {"message", violation.message},
        {"severity", violation.severity},
    };
    if (!violation.detail.empty())
        j["detail"] = violation.detail;
    if (!violation.docUrl.empty())
        j["docUrl"] = violation.docUrl;
    if (!violation.sourceCode.empty())
        j["sourceCode"] = violation.sourceCode;
    if (violation.suggestedFix)
        j["suggestedFix"] = *violation.suggestedFix;
}

void from_json(const nlohmann::json& j, Violation& violation)
{
    j.at("location").get_to(violation.location);
    j.at("rule").get_to(violation.ruleCode);
    if (j.contains("message"))
        j.at("message").get_to(violation.message);
    if (j.contains("detail"))
        j.at("detail").get_to(violation.detail);
    if (j.contains("severity"))
        j.at("severity").get_to(violation.severity);
    if (j.contains("docUrl"))
        j.at("docUrl").get_to(violation.docUrl);
    if (j.contains("sourceCode"))
        j.at("sourceCode").get_to(violation.sourceCode);
    if (j.contains("suggestedFix") && !j.at("suggestedFix").is_null())
        violation.suggestedFix = j.at("suggestedFix").get<SuggestedFix>();
}

} // namespace Dockfix
