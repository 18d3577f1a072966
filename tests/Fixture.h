#pragma once

#include "Dockfix/Fixer.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Dockfix::Test
{
TextEdit makeEdit(const std::string& file, int startLine, int startColumn, int endLine, int endColumn, const std::string& newText);
SuggestedFix makeFix(const std::string& description, std::vector<TextEdit> edits, FixSafety safety = FixSafety::Safe, int priority = 0);
SuggestedFix makeDeferredFix(const std::string& resolverId, ResolverData data = std::monostate{}, int priority = 0);
Violation makeViolation(const std::string& file, const std::string& ruleCode, int line, std::optional<SuggestedFix> fix);

// Returns the same edits whatever it is given, remembering the content of every call
class StaticResolver : public FixResolver
{
    std::string resolverId;
    std::vector<TextEdit> edits;

    mutable std::mutex mutex;
    mutable std::vector<std::string> seen;

public:
    StaticResolver(std::string resolverId, std::vector<TextEdit> edits);

    std::string id() const override;
    ResolveResult resolve(const CancellationTokenPtr& cancellationToken, const ResolveContext& context, const SuggestedFix& fix) const override;

    std::vector<std::string> seenContents() const;
};

class FailingResolver : public FixResolver
{
public:
    std::string id() const override
    {
        return "failing";
    }

    ResolveResult resolve(const CancellationTokenPtr& cancellationToken, const ResolveContext& context, const SuggestedFix& fix) const override
    {
        return ResolveError{"could not find the target instruction"};
    }
};

class ThrowingResolver : public FixResolver
{
public:
    std::string id() const override
    {
        return "throwing";
    }

    ResolveResult resolve(const CancellationTokenPtr& cancellationToken, const ResolveContext& context, const SuggestedFix& fix) const override;
};

// Throws something that is not a std::exception
class ThrowingValueResolver : public FixResolver
{
public:
    std::string id() const override
    {
        return "throwing-value";
    }

    ResolveResult resolve(const CancellationTokenPtr& cancellationToken, const ResolveContext& context, const SuggestedFix& fix) const override;
};

// Cancels the run's token from inside the first resolution
class CancellingResolver : public FixResolver
{
public:
    std::string id() const override
    {
        return "cancelling";
    }

    ResolveResult resolve(const CancellationTokenPtr& cancellationToken, const ResolveContext& context, const SuggestedFix& fix) const override;
};

struct RecordingLogger : FixLogger
{
    std::mutex mutex;
    std::vector<std::pair<MessageType, std::string>> messages;

    void sendLogMessage(MessageType type, const std::string& message) override;

    bool contains(MessageType type, const std::string& fragment);
};
} // namespace Dockfix::Test

struct Fixture
{
    Dockfix::FixerConfiguration config;
    Dockfix::ResolverRegistry registry;
    Dockfix::Test::RecordingLogger logger;
    Dockfix::SourceMap sources;
    Dockfix::CancellationTokenPtr cancellationToken = std::make_shared<Dockfix::CancellationToken>();

    Fixture();

    void addSource(const std::string& path, const std::string& content);
    Dockfix::FixResult fix(const std::vector<Dockfix::Violation>& violations);

    /// The modified content of `path`, which must be part of `result`
    std::string modified(const Dockfix::FixResult& result, const std::string& path);
};
