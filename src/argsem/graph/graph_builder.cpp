#include "argsem/graph/graph_builder.hpp"

#include <cctype>

namespace argsem
{

bool GraphBuilder::is_valid_id(const std::string& id) noexcept
{
    if (id.empty())
    {
        return false;
    }
    for (char c : id)
    {
        if (std::isspace(static_cast<unsigned char>(c)) || c == ',')
        {
            return false;
        }
    }
    return true;
}

ArgIdx GraphBuilder::add_argument(const std::string& id)
{
    if (!is_valid_id(id))
    {
        throw AfError(
            AfErrorCode::InvalidArgumentId,
            "Invalid argument id '" + id + "': must be non-empty without whitespace or ','");
    }
    if (has_argument(id))
    {
        throw AfError(
            AfErrorCode::DuplicateArgument,
            "Argument '" + id + "' is declared more than once");
    }
    return m_ids.insert(id);
}

void GraphBuilder::add_attack(const std::string& attacker, const std::string& target,
                              EdgeProvenance provenance)
{
    size_t attacker_idx = m_ids.find(attacker);
    if (attacker_idx == IdIndex::npos)
    {
        throw AfError(
            AfErrorCode::UnknownArgumentInAttack,
            "Attack " + attacker + " -> " + target + " references unknown attacker '" +
                attacker + "'");
    }
    size_t target_idx = m_ids.find(target);
    if (target_idx == IdIndex::npos)
    {
        throw AfError(
            AfErrorCode::UnknownArgumentInAttack,
            "Attack " + attacker + " -> " + target + " references unknown target '" +
                target + "'");
    }
    m_attacks.push_back(Attack{attacker_idx, target_idx, provenance});
}

void GraphBuilder::add_attack(ArgIdx attacker, ArgIdx target, EdgeProvenance provenance)
{
    if (attacker >= m_ids.size() || target >= m_ids.size())
    {
        throw AfError(
            AfErrorCode::UnknownArgumentInAttack,
            "Attack " + std::to_string(attacker) + " -> " + std::to_string(target) +
                " references an undeclared argument index");
    }
    m_attacks.push_back(Attack{attacker, target, provenance});
}

GraphPtr GraphBuilder::build() const
{
    // ArgumentGraph's constructor is private; GraphBuilder is a friend
    std::shared_ptr<ArgumentGraph> graph(new ArgumentGraph());
    const size_t n = m_ids.size();

    graph->m_ids = m_ids;
    graph->m_attackers.assign(n, {});
    graph->m_targets.assign(n, {});
    graph->m_attacker_sets.assign(n, ArgSet(n));
    graph->m_target_sets.assign(n, ArgSet(n));

    // Stable sort keeps the first provenance among duplicates
    std::vector<Attack> sorted = m_attacks;
    std::stable_sort(sorted.begin(), sorted.end(), [](const Attack& a, const Attack& b) {
        return std::make_pair(a.attacker, a.target) < std::make_pair(b.attacker, b.target);
    });

    for (const Attack& attack : sorted)
    {
        if (!graph->m_attacks.empty() &&
            graph->m_attacks.back().attacker == attack.attacker &&
            graph->m_attacks.back().target == attack.target)
        {
            continue;
        }
        graph->m_attacks.push_back(attack);
        graph->m_targets[attack.attacker].push_back(attack.target);
        graph->m_attackers[attack.target].push_back(attack.attacker);
        graph->m_target_sets[attack.attacker].insert(attack.target);
        graph->m_attacker_sets[attack.target].insert(attack.attacker);
    }

    // Both adjacency lists come out ascending since edges are visited in sorted order

    return graph;
}

GraphPtr build_graph(const std::vector<std::string>& ids,
                     const std::vector<AttackIdPair>& attacks)
{
    GraphBuilder builder;
    for (const auto& id : ids)
    {
        builder.add_argument(id);
    }
    for (const auto& [attacker, target] : attacks)
    {
        builder.add_attack(attacker, target);
    }
    return builder.build();
}

} // namespace argsem
