/**
 * @file argument_graph.cpp
 */
#include "argsem/graph/argument_graph.hpp"
#include "argsem/graph/graph_builder.hpp"

namespace argsem
{

void ArgumentGraph::check_index(ArgIdx idx) const
{
    if (idx >= argument_count())
    {
        throw AfError(
            AfErrorCode::UnknownArgument,
            "Argument index " + std::to_string(idx) + " does not exist");
    }
}

const std::string& ArgumentGraph::id(ArgIdx idx) const
{
    check_index(idx);
    return m_ids.at(idx);
}

std::optional<ArgIdx> ArgumentGraph::find(const std::string& id) const noexcept
{
    size_t idx = m_ids.find(id);
    if (idx == IdIndex::npos)
    {
        return std::nullopt;
    }
    return idx;
}

ArgIdx ArgumentGraph::index_of(const std::string& id) const
{
    size_t idx = m_ids.find(id);
    if (idx == IdIndex::npos)
    {
        throw AfError(AfErrorCode::UnknownArgument, "Unknown argument '" + id + "'");
    }
    return idx;
}

const std::vector<ArgIdx>& ArgumentGraph::attackers_of(ArgIdx idx) const
{
    check_index(idx);
    return m_attackers[idx];
}

const std::vector<ArgIdx>& ArgumentGraph::targets_of(ArgIdx idx) const
{
    check_index(idx);
    return m_targets[idx];
}

const ArgSet& ArgumentGraph::attacker_set(ArgIdx idx) const
{
    check_index(idx);
    return m_attacker_sets[idx];
}

const ArgSet& ArgumentGraph::target_set(ArgIdx idx) const
{
    check_index(idx);
    return m_target_sets[idx];
}

bool ArgumentGraph::attacks(ArgIdx attacker, ArgIdx target) const
{
    check_index(attacker);
    check_index(target);
    return m_target_sets[attacker].contains(target);
}

std::optional<EdgeProvenance> ArgumentGraph::provenance(ArgIdx attacker, ArgIdx target) const
{
    if (!attacks(attacker, target))
    {
        return std::nullopt;
    }
    auto it = std::lower_bound(
        m_attacks.begin(), m_attacks.end(), std::make_pair(attacker, target),
        [](const Attack& a, const std::pair<ArgIdx, ArgIdx>& key) {
            return std::make_pair(a.attacker, a.target) < key;
        });
    return it->provenance;
}

std::vector<std::string> ArgumentGraph::ids_of(const ArgSet& set) const
{
    std::vector<std::string> result;
    result.reserve(set.size());
    set.for_each([this, &result](ArgIdx i) { result.push_back(id(i)); });
    return result;
}

ArgSet ArgumentGraph::set_of(const std::vector<std::string>& ids) const
{
    ArgSet result = empty_set();
    for (const auto& id : ids)
    {
        result.insert(index_of(id));
    }
    return result;
}

GraphPtr ArgumentGraph::with_additions(const std::vector<std::string>& new_ids,
                                       const std::vector<AttackIdPair>& new_attacks,
                                       EdgeProvenance provenance) const
{
    GraphBuilder builder;
    for (const auto& id : m_ids.ids())
    {
        builder.add_argument(id);
    }
    for (const auto& attack : m_attacks)
    {
        builder.add_attack(attack.attacker, attack.target, attack.provenance);
    }
    for (const auto& id : new_ids)
    {
        builder.add_argument(id);
    }
    for (const auto& [attacker, target] : new_attacks)
    {
        builder.add_attack(attacker, target, provenance);
    }
    return builder.build();
}

} // namespace argsem
