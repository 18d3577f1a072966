#include "Dockfix/Resolver.hpp"
#include "Dockfix/NewlineResolver.hpp"

#include <algorithm>

namespace Dockfix
{

void ResolverRegistry::add(FixResolverPtr resolver)
{
    if (!resolver)
        throw std::invalid_argument("cannot register a null resolver");

    auto id = resolver->id();
    if (resolvers.find(id) != resolvers.end())
        throw DuplicateResolverError(id);

    resolvers.emplace(std::move(id), std::move(resolver));
}

const FixResolver* ResolverRegistry::find(const std::string& id) const
{
    auto it = resolvers.find(id);
    if (it == resolvers.end())
        return nullptr;
    return it->second.get();
}

std::vector<std::string> ResolverRegistry::ids() const
{
    std::vector<std::string> result;
    result.reserve(resolvers.size());
    for (const auto& [id, _] : resolvers)
        result.push_back(id);
    std::sort(result.begin(), result.end());
    return result;
}

void registerBuiltinResolvers(ResolverRegistry& registry)
{
    registry.add(std::make_shared<NewlineResolver>());
}

const ResolverRegistry& defaultResolverRegistry()
{
    static const ResolverRegistry registry = []
    {
        ResolverRegistry builtins;
        registerBuiltinResolvers(builtins);
        return builtins;
    }();
    return registry;
}

} // namespace Dockfix
