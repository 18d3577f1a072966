#include "Dockfix/Fixer.hpp"
#include "Dockfix/Conflict.hpp"
#include "Dockfix/EditApplier.hpp"

#include <algorithm>
#include <atomic>
#include <optional>
#include <system_error>
#include <thread>

namespace Dockfix
{

static std::string describeLocation(const Location& location)
{
    return location.file + ":" + std::to_string(location.start.line) + ":" + std::to_string(location.start.column);
}

static void recordSkipped(FileChange& change, const Violation& violation, SkipReason reason, const std::string& error = "")
{
    change.fixesSkipped.push_back(SkippedFix{violation.ruleCode, reason, violation.location, error});
}

static void recordSkipped(FixResult& result, const Violation& violation, SkipReason reason, const std::string& error = "")
{
    auto it = result.changes.find(normalizePath(violation.file()));
    if (it != result.changes.end())
        recordSkipped(it->second, violation, reason, error);
}

Fixer::Fixer(FixerConfiguration config, const ResolverRegistry& registry, FixLogger* logger)
    : config(std::move(config))
    , registry(&registry)
    , logger(logger)
{
}

FixResult Fixer::apply(const CancellationTokenPtr& cancellationToken, const std::vector<Violation>& violations, const SourceMap& sources) const
{
    FixResult result;
    for (const auto& [path, content] : sources)
        result.changes[normalizePath(path)] = FileChange{path, content, content, {}, {}};

    std::vector<FixCandidate> synchronous;
    std::vector<FixCandidate> deferred;
    classifyViolations(violations, result, synchronous, deferred);

    // Synchronous fixes go first so that deferred fixes are resolved against their output
    applyCandidates(result, synchronous);

    if (!deferred.empty())
    {
        if (config.resolveStrategy == ResolveStrategy::Sequential)
            resolveSequential(cancellationToken, result, deferred);
        else
            resolveParallel(cancellationToken, result, deferred);
    }

    sendLogMessage(MessageType::Info, "applied " + std::to_string(result.totalApplied()) + " fix(es), skipped " +
                                          std::to_string(result.totalSkipped()) + ", modified " + std::to_string(result.filesModified()) +
                                          " file(s)");
    return result;
}

bool Fixer::ruleAllowed(const std::string& ruleCode) const
{
    if (config.ruleFilter.empty())
        return true;
    return std::find(config.ruleFilter.begin(), config.ruleFilter.end(), ruleCode) != config.ruleFilter.end();
}

bool Fixer::fixModeAllowed(const std::string& file, const std::string& ruleCode) const
{
    switch (config.fixModeFor(file, ruleCode))
    {
    case FixMode::Never:
        return false;
    case FixMode::Explicit:
        return !config.ruleFilter.empty() && ruleAllowed(ruleCode);
    case FixMode::UnsafeOnly:
        return config.safetyThreshold >= FixSafety::Unsafe;
    case FixMode::Always:
        return true;
    }
    return true;
}

void Fixer::classifyViolations(const std::vector<Violation>& violations, FixResult& result, std::vector<FixCandidate>& synchronous,
    std::vector<FixCandidate>& deferred) const
{
    synchronous.reserve(violations.size());

    for (const auto& violation : violations)
    {
        if (!violation.suggestedFix)
            continue;

        // Only files handed to us are touched. Anything else is dropped without a trace.
        if (result.changes.find(normalizePath(violation.file())) == result.changes.end())
            continue;

        const auto& fix = *violation.suggestedFix;
        if (!ruleAllowed(violation.ruleCode))
        {
            recordSkipped(result, violation, SkipReason::RuleFilter);
            continue;
        }
        if (fix.safety > config.safetyThreshold)
        {
            recordSkipped(result, violation, SkipReason::Safety);
            continue;
        }
        if (!fixModeAllowed(violation.file(), violation.ruleCode))
        {
            recordSkipped(result, violation, SkipReason::FixMode);
            continue;
        }

        if (fix.needsResolve)
            deferred.push_back(FixCandidate{&violation, fix, ""});
        else
            synchronous.push_back(FixCandidate{&violation, fix, ""});
    }
}

void Fixer::applyCandidates(FixResult& result, std::vector<FixCandidate>& candidates) const
{
    std::vector<std::string> files;
    std::unordered_map<std::string, std::vector<FixCandidate*>> byFile;

    for (auto& candidate : candidates)
    {
        if (candidate.fix.edits.empty())
        {
            recordSkipped(result, *candidate.violation, SkipReason::NoEdits);
            continue;
        }

        auto file = normalizePath(candidate.violation->file());
        if (result.changes.find(file) == result.changes.end())
            continue;

        auto& group = byFile[file];
        if (group.empty())
            files.push_back(file);
        group.push_back(&candidate);
    }

    for (const auto& file : files)
        applyCandidatesToFile(result.changes.at(file), byFile.at(file));
}

void Fixer::applyCandidatesToFile(FileChange& change, const std::vector<FixCandidate*>& candidates) const
{
    struct PendingEdit
    {
        const TextEdit* edit;
        size_t candidate;
    };

    std::vector<PendingEdit> pending;
    for (size_t i = 0; i < candidates.size(); i++)
    {
        for (const auto& edit : candidates[i]->fix.edits)
            pending.push_back(PendingEdit{&edit, i});
    }

    // Lower priorities first. Within a priority, bottom of the file first so that the positions
    // of edits still waiting in that priority stay valid. Of two edits starting at one point the
    // longer goes first, leaving an insertion at that point in front of the replacement.
    std::stable_sort(pending.begin(), pending.end(),
        [&](const PendingEdit& a, const PendingEdit& b)
        {
            int aPriority = candidates[a.candidate]->fix.priority;
            int bPriority = candidates[b.candidate]->fix.priority;
            if (aPriority != bPriority)
                return aPriority < bPriority;
            if (a.edit->location.start != b.edit->location.start)
                return editStartsBefore(*b.edit, *a.edit);
            return b.edit->location.end < a.edit->location.end;
        });

    enum struct State
    {
        Unchecked,
        Accepted,
        Rejected,
    };
    std::vector<State> states(candidates.size(), State::Unchecked);

    // Every edit of every accepted candidate, reserved as soon as the candidate is accepted
    std::vector<const TextEdit*> reserved;
    // Shifts of finished priorities. Edits of the running priority only shift once it is done,
    // since bottom-up order already keeps their coordinates valid.
    std::vector<EditShift> shifts;
    std::vector<EditShift> priorityShifts;
    std::optional<int> currentPriority;
    std::string content = change.modifiedContent;

    for (const auto& item : pending)
    {
        int priority = candidates[item.candidate]->fix.priority;
        if (currentPriority != priority)
        {
            shifts.insert(shifts.end(), priorityShifts.begin(), priorityShifts.end());
            priorityShifts.clear();
            currentPriority = priority;
        }

        auto& state = states[item.candidate];
        if (state == State::Rejected)
            continue;

        // A candidate is accepted or rejected as a whole the first time one of its edits comes up
        if (state == State::Unchecked)
        {
            const auto& candidate = *candidates[item.candidate];
            const auto& edits = candidate.fix.edits;

            bool inRange = std::all_of(edits.begin(), edits.end(),
                [&](const TextEdit& edit)
                {
                    return isEditInRange(change.modifiedContent, edit);
                });
            if (!inRange)
            {
                state = State::Rejected;
                recordSkipped(change, *candidate.violation, SkipReason::InvalidRange);
                sendLogMessage(MessageType::Log,
                    "skipped fix for " + candidate.violation->ruleCode + " at " + describeLocation(candidate.violation->location) + ": " +
                        toString(SkipReason::InvalidRange));
                continue;
            }

            bool conflicts = std::any_of(edits.begin(), edits.end(),
                [&](const TextEdit& edit)
                {
                    return std::any_of(reserved.begin(), reserved.end(),
                        [&](const TextEdit* other)
                        {
                            // All edits in this pass address the same file
                            return rangesConflict(edit.location, other->location);
                        });
                });
            if (conflicts)
            {
                state = State::Rejected;
                recordSkipped(change, *candidate.violation, SkipReason::Conflict);
                sendLogMessage(MessageType::Log,
                    "skipped fix for " + candidate.violation->ruleCode + " at " + describeLocation(candidate.violation->location) + ": " +
                        toString(SkipReason::Conflict));
                continue;
            }

            for (const auto& edit : edits)
                reserved.push_back(&edit);
            state = State::Accepted;
        }

        // Translate through the earlier priorities, then splice
        auto edit = adjustEdit(*item.edit, shifts);
        content = applyEdit(content, edit);
        if (auto shift = shiftForEdit(edit))
            priorityShifts.push_back(*shift);
    }

    change.modifiedContent = std::move(content);

    for (size_t i = 0; i < candidates.size(); i++)
    {
        if (states[i] != State::Accepted)
            continue;

        const auto& candidate = *candidates[i];
        change.fixesApplied.push_back(AppliedFix{candidate.violation->ruleCode, candidate.fix.description, candidate.violation->location, candidate.fix.edits});
    }
}

void Fixer::resolveCandidate(const CancellationTokenPtr& cancellationToken, const ResolveContext& context, FixCandidate& candidate) const
{
    if (cancellationToken && cancellationToken->requested())
    {
        candidate.resolveError = "resolution cancelled";
        return;
    }

    const auto* resolver = registry->find(candidate.fix.resolverId);
    if (!resolver)
    {
        candidate.resolveError = "no resolver registered for '" + candidate.fix.resolverId + "'";
        return;
    }

    try
    {
        auto result = resolver->resolve(cancellationToken, context, candidate.fix);
        if (auto* error = std::get_if<ResolveError>(&result))
        {
            candidate.resolveError = error->message.empty() ? toString(SkipReason::ResolveError) : error->message;
            return;
        }

        candidate.fix.edits = std::move(std::get<std::vector<TextEdit>>(result));
        candidate.fix.needsResolve = false;
    }
    catch (const std::exception& e)
    {
        candidate.resolveError = e.what();
    }
    catch (...)
    {
        candidate.resolveError = "resolver threw an unknown exception";
    }
}

void Fixer::resolveParallel(const CancellationTokenPtr& cancellationToken, FixResult& result, std::vector<FixCandidate>& deferred) const
{
    // Snapshot the post-synchronous content. Workers read their context and write only their own candidate.
    std::vector<ResolveContext> contexts;
    contexts.reserve(deferred.size());
    for (const auto& candidate : deferred)
    {
        const auto& change = result.changes.at(normalizePath(candidate.violation->file()));
        contexts.push_back(ResolveContext{change.path, change.modifiedContent});
    }

    std::atomic<size_t> next{0};
    auto work = [&]
    {
        for (size_t i = next++; i < deferred.size(); i = next++)
            resolveCandidate(cancellationToken, contexts[i], deferred[i]);
    };

    // The calling thread is one of the workers
    size_t workerCount = std::min(std::max<size_t>(config.concurrency, 1), deferred.size());
    std::vector<std::thread> workers;
    workers.reserve(workerCount - 1);
    try
    {
        for (size_t i = 1; i < workerCount; i++)
            workers.emplace_back(work);
    }
    catch (const std::system_error& e)
    {
        sendLogMessage(MessageType::Warning, "resolving with " + std::to_string(workers.size() + 1) + " worker(s): " + e.what());
    }

    work();
    for (auto& worker : workers)
        worker.join();

    std::vector<FixCandidate> resolved;
    resolved.reserve(deferred.size());
    for (auto& candidate : deferred)
    {
        if (candidate.fix.needsResolve)
        {
            sendLogMessage(MessageType::Warning, "could not resolve fix for " + candidate.violation->ruleCode + " at " +
                                                     describeLocation(candidate.violation->location) + ": " + candidate.resolveError);
            recordSkipped(result, *candidate.violation, SkipReason::ResolveError, candidate.resolveError);
            continue;
        }
        resolved.push_back(std::move(candidate));
    }

    applyCandidates(result, resolved);
}

void Fixer::resolveSequential(const CancellationTokenPtr& cancellationToken, FixResult& result, std::vector<FixCandidate>& deferred) const
{
    for (auto& candidate : deferred)
    {
        auto& change = result.changes.at(normalizePath(candidate.violation->file()));

        // Current content, including every deferred fix applied before this one
        resolveCandidate(cancellationToken, ResolveContext{change.path, change.modifiedContent}, candidate);

        if (candidate.fix.needsResolve)
        {
            sendLogMessage(MessageType::Warning, "could not resolve fix for " + candidate.violation->ruleCode + " at " +
                                                     describeLocation(candidate.violation->location) + ": " + candidate.resolveError);
            recordSkipped(change, *candidate.violation, SkipReason::ResolveError, candidate.resolveError);
            continue;
        }
        if (candidate.fix.edits.empty())
        {
            recordSkipped(change, *candidate.violation, SkipReason::NoEdits);
            continue;
        }

        applyCandidatesToFile(change, {&candidate});
    }
}

void Fixer::sendLogMessage(MessageType type, const std::string& message) const
{
    if (logger)
        logger->sendLogMessage(type, message);
}

} // namespace Dockfix
