#include "Fixture.h"

#include "doctest.h"

#include <stdexcept>

namespace Dockfix::Test
{
TextEdit makeEdit(const std::string& file, int startLine, int startColumn, int endLine, int endColumn, const std::string& newText)
{
    return TextEdit{Location::range(file, startLine, startColumn, endLine, endColumn), newText};
}

SuggestedFix makeFix(const std::string& description, std::vector<TextEdit> edits, FixSafety safety, int priority)
{
    SuggestedFix fix;
    fix.description = description;
    fix.edits = std::move(edits);
    fix.safety = safety;
    fix.priority = priority;
    return fix;
}

SuggestedFix makeDeferredFix(const std::string& resolverId, ResolverData data, int priority)
{
    SuggestedFix fix;
    fix.description = "resolved by " + resolverId;
    fix.needsResolve = true;
    fix.resolverId = resolverId;
    fix.resolverData = std::move(data);
    fix.priority = priority;
    return fix;
}

Violation makeViolation(const std::string& file, const std::string& ruleCode, int line, std::optional<SuggestedFix> fix)
{
    Violation violation;
    violation.location = Location::range(file, line, 0, line, 0);
    violation.ruleCode = ruleCode;
    violation.message = ruleCode + " violated";
    violation.suggestedFix = std::move(fix);
    return violation;
}

StaticResolver::StaticResolver(std::string resolverId, std::vector<TextEdit> edits)
    : resolverId(std::move(resolverId))
    , edits(std::move(edits))
{
}

std::string StaticResolver::id() const
{
    return resolverId;
}

ResolveResult StaticResolver::resolve(const CancellationTokenPtr& cancellationToken, const ResolveContext& context, const SuggestedFix& fix) const
{
    std::lock_guard<std::mutex> guard(mutex);
    seen.push_back(context.content);
    return edits;
}

std::vector<std::string> StaticResolver::seenContents() const
{
    std::lock_guard<std::mutex> guard(mutex);
    return seen;
}

ResolveResult ThrowingResolver::resolve(const CancellationTokenPtr& cancellationToken, const ResolveContext& context, const SuggestedFix& fix) const
{
    throw std::runtime_error("resolver blew up");
}

ResolveResult ThrowingValueResolver::resolve(const CancellationTokenPtr& cancellationToken, const ResolveContext& context, const SuggestedFix& fix) const
{
    throw 42;
}

ResolveResult CancellingResolver::resolve(const CancellationTokenPtr& cancellationToken, const ResolveContext& context, const SuggestedFix& fix) const
{
    cancellationToken->cancel();
    return std::vector<TextEdit>{};
}

void RecordingLogger::sendLogMessage(MessageType type, const std::string& message)
{
    std::lock_guard<std::mutex> guard(mutex);
    messages.emplace_back(type, message);
}

bool RecordingLogger::contains(MessageType type, const std::string& fragment)
{
    std::lock_guard<std::mutex> guard(mutex);
    for (const auto& [messageType, message] : messages)
    {
        if (messageType == type && message.find(fragment) != std::string::npos)
            return true;
    }
    return false;
}
} // namespace Dockfix::Test

Fixture::Fixture()
{
    Dockfix::registerBuiltinResolvers(registry);
}

void Fixture::addSource(const std::string& path, const std::string& content)
{
    sources[path] = content;
}

Dockfix::FixResult Fixture::fix(const std::vector<Dockfix::Violation>& violations)
{
    Dockfix::Fixer fixer(config, registry, &logger);
    return fixer.apply(cancellationToken, violations, sources);
}

std::string Fixture::modified(const Dockfix::FixResult& result, const std::string& path)
{
    auto change = result.find(path);
    REQUIRE(change);
    return change->modifiedContent;
}
