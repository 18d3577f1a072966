#pragma once
#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "Dockfix/Violation.hpp"

namespace Dockfix
{

struct CancellationToken
{
    void cancel()
    {
        cancelled.store(true);
    }

    bool requested() const
    {
        return cancelled.load();
    }

private:
    std::atomic<bool> cancelled{false};
};
using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

/// The file a deferred fix is resolved against
struct ResolveContext
{
    std::string filePath;
    /// File content after every fix applied before this resolution
    std::string content;
};

struct ResolveError
{
    std::string message;
};

using ResolveResult = std::variant<std::vector<TextEdit>, ResolveError>;

// Computes the edits of a deferred fix.
// Implementations must derive edits from ResolveContext::content, never from the violation's
// location, since earlier fixes may have moved or removed the text it pointed at.
// Resolving content that is already in the target shape must return no edits.
// resolve() may run concurrently on several threads.
class FixResolver
{
public:
    virtual ~FixResolver() = default;

    /// Matches SuggestedFix::resolverId
    virtual std::string id() const = 0;

    virtual ResolveResult resolve(const CancellationTokenPtr& cancellationToken, const ResolveContext& context, const SuggestedFix& fix) const = 0;
};
using FixResolverPtr = std::shared_ptr<const FixResolver>;

class DuplicateResolverError : public std::logic_error
{
public:
    explicit DuplicateResolverError(const std::string& id)
        : std::logic_error("duplicate resolver registration: " + id)
    {
    }
};

// Resolvers known to a fixer, keyed by id.
// Populated before any run and read-only while fixers use it.
class ResolverRegistry
{
    std::unordered_map<std::string, FixResolverPtr> resolvers;

public:
    /// Throws DuplicateResolverError if a resolver with the same id is already present
    void add(FixResolverPtr resolver);

    /// nullptr when no resolver is registered under `id`
    const FixResolver* find(const std::string& id) const;

    /// Registered ids, sorted
    std::vector<std::string> ids() const;

    size_t size() const
    {
        return resolvers.size();
    }

    bool empty() const
    {
        return resolvers.empty();
    }
};

/// Adds the resolvers shipped with this library
void registerBuiltinResolvers(ResolverRegistry& registry);

// Process-wide registry holding the built-in resolvers.
// Built by the first call rather than at process start; the function-local static makes that first
// call thread-safe. Call it once during startup to have it ready before any fixer runs.
const ResolverRegistry& defaultResolverRegistry();

} // namespace Dockfix
