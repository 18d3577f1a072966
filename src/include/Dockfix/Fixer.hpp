#pragma once
#include <string>
#include <unordered_map>
#include <vector>

#include "Dockfix/FixResult.hpp"
#include "Dockfix/FixerConfiguration.hpp"
#include "Dockfix/Logger.hpp"
#include "Dockfix/Resolver.hpp"
#include "Dockfix/Violation.hpp"

namespace Dockfix
{

/// file path -> original content
using SourceMap = std::unordered_map<std::string, std::string>;

// A violation paired with the fix that will be applied for it.
// `fix` is the fixer's own copy, so resolution never touches the caller's violations.
struct FixCandidate
{
    const Violation* violation = nullptr;
    SuggestedFix fix;
    /// Set when resolution failed
    std::string resolveError;
};

// Applies the suggested fixes of a batch of violations to in-memory sources.
//
// Synchronous fixes are applied first. Deferred fixes are then resolved against the content
// those fixes produced and applied in a second pass. Within a pass, candidates are accepted
// atomically in priority order and never overlap an accepted candidate.
class Fixer
{
    FixerConfiguration config;
    const ResolverRegistry* registry;
    FixLogger* logger;

public:
    explicit Fixer(FixerConfiguration config, const ResolverRegistry& registry = defaultResolverRegistry(), FixLogger* logger = nullptr);

    FixResult apply(const CancellationTokenPtr& cancellationToken, const std::vector<Violation>& violations, const SourceMap& sources) const;

    const FixerConfiguration& configuration() const
    {
        return config;
    }

private:
    bool ruleAllowed(const std::string& ruleCode) const;
    bool fixModeAllowed(const std::string& file, const std::string& ruleCode) const;

    void classifyViolations(const std::vector<Violation>& violations, FixResult& result, std::vector<FixCandidate>& synchronous,
        std::vector<FixCandidate>& deferred) const;

    /// Groups candidates by file and runs one conflict/application pass per file
    void applyCandidates(FixResult& result, std::vector<FixCandidate>& candidates) const;
    void applyCandidatesToFile(FileChange& change, const std::vector<FixCandidate*>& candidates) const;

    void resolveParallel(const CancellationTokenPtr& cancellationToken, FixResult& result, std::vector<FixCandidate>& deferred) const;
    void resolveSequential(const CancellationTokenPtr& cancellationToken, FixResult& result, std::vector<FixCandidate>& deferred) const;
    /// Runs the candidate's resolver. On success the fix's edits are filled in and needsResolve is cleared.
    void resolveCandidate(const CancellationTokenPtr& cancellationToken, const ResolveContext& context, FixCandidate& candidate) const;

    void sendLogMessage(MessageType type, const std::string& message) const;
};

} // namespace Dockfix
