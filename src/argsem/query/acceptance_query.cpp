#include "argsem/query/acceptance_query.hpp"
#include "argsem/common/errors.hpp"

namespace argsem
{

namespace
{

const ArgumentGraph& family_graph(const ExtensionFamily& family)
{
    if (!family.graph)
    {
        throw AfError(AfErrorCode::InvalidRequest, "Extension family has no graph");
    }
    return *family.graph;
}

} // namespace

bool is_credulously_accepted(const std::vector<Extension>& extensions, ArgIdx target)
{
    return std::any_of(extensions.begin(), extensions.end(),
                       [target](const Extension& e) { return e.contains(target); });
}

bool is_skeptically_accepted(const std::vector<Extension>& extensions, ArgIdx target)
{
    if (extensions.empty())
    {
        return false;
    }
    return std::all_of(extensions.begin(), extensions.end(),
                       [target](const Extension& e) { return e.contains(target); });
}

Coverage coverage_of(const std::vector<Extension>& extensions, ArgIdx target)
{
    Coverage result;
    result.total = extensions.size();
    result.containing = static_cast<size_t>(
        std::count_if(extensions.begin(), extensions.end(),
                      [target](const Extension& e) { return e.contains(target); }));
    return result;
}

bool query(const ExtensionFamily& family, SemanticsKind kind, const std::string& target,
           AcceptanceMode mode)
{
    const std::vector<Extension>& extensions = family.at(kind);
    ArgIdx idx = family_graph(family).index_of(target);
    switch (mode)
    {
        case AcceptanceMode::Credulous:
            return is_credulously_accepted(extensions, idx);
        case AcceptanceMode::Skeptical:
            return is_skeptically_accepted(extensions, idx);
    }
    throw AfError(AfErrorCode::InvalidRequest, "Unknown acceptance mode");
}

Coverage coverage(const ExtensionFamily& family, SemanticsKind kind, const std::string& target)
{
    const std::vector<Extension>& extensions = family.at(kind);
    return coverage_of(extensions, family_graph(family).index_of(target));
}

std::vector<ArgIdx> grounded_roadblocks(const ArgumentGraph& graph, const ArgSet& grounded,
                                        ArgIdx target)
{
    std::vector<ArgIdx> result;
    if (grounded.contains(target))
    {
        return result;
    }
    for (ArgIdx attacker : graph.attackers_of(target))
    {
        if (!graph.attacker_set(attacker).intersects(grounded))
        {
            result.push_back(attacker);
        }
    }
    return result;
}

std::vector<std::pair<ArgIdx, size_t>> attacker_frequencies(
    const ArgumentGraph& graph, const std::vector<Extension>& extensions, ArgIdx target)
{
    std::vector<std::pair<ArgIdx, size_t>> result;
    for (ArgIdx attacker : graph.attackers_of(target))
    {
        result.emplace_back(attacker, coverage_of(extensions, attacker).containing);
    }
    return result;
}

Insights insights(const ArgumentGraph& graph, const ExtensionFamily& family,
                  const std::string& target)
{
    if (family.graph.get() != &graph)
    {
        throw AfError(AfErrorCode::InvalidRequest,
                      "Extension family was computed on a different graph");
    }
    const ArgIdx t = graph.index_of(target);
    const Extension& grounded = family.grounded();
    const std::vector<Extension>& preferred = family.at(SemanticsKind::Preferred);

    Insights result;
    result.target = target;
    result.in_grounded = grounded.contains(t);
    if (family.defense_depth)
    {
        result.target_depth = (*family.defense_depth)[t];
    }
    result.preferred_count = preferred.size();

    for (ArgIdx b : grounded_roadblocks(graph, grounded.members(), t))
    {
        result.grounded_roadblocks.push_back(graph.id(b));
    }

    for (const auto& [attacker, count] : attacker_frequencies(graph, preferred, t))
    {
        result.attacker_frequencies.emplace_back(graph.id(attacker), count);
        if (count == 0)
        {
            continue;
        }
        if (count == preferred.size())
        {
            result.persistent_attackers.push_back(graph.id(attacker));
        }
        else
        {
            result.soft_attackers.push_back(graph.id(attacker));
        }
    }
    return result;
}

} // namespace argsem
