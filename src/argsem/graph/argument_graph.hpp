/**
 * @file argument_graph.hpp
 */
#pragma once
#include "argsem/common/common.hpp"
#include "argsem/common/arg_set.hpp"
#include "argsem/common/errors.hpp"
#include "argsem/graph/graph_enums.hpp"
#include "argsem/graph/id_index.hpp"

namespace argsem
{

class ArgumentGraph;

/**
 * @brief Shared handle to an immutable argument graph.
 */
using GraphPtr = std::shared_ptr<const ArgumentGraph>;

/**
 * @brief An immutable abstract argumentation framework (arguments and attacks).
 *
 * @details
 * `ArgumentGraph` is the Graph Model consumed by the semantics engine and the
 * repair planner. It is produced by `GraphBuilder::build()` (or `build_graph()`)
 * and never changes afterwards. Adding arguments produces a new graph through
 * `with_additions()`, leaving the original intact for before/after comparison.
 *
 * @par Storage
 * Attacks are stored in both directions:
 * - forward: for each argument, the arguments it attacks;
 * - reverse: for each argument, the arguments attacking it.
 * Each direction is held both as a sorted index list and as an `ArgSet` row,
 * so conflict and defense checks are bitset operations.
 *
 * @par Invariants
 * - Every attack references arguments present in the graph.
 * - Attacks are unique by (attacker, target) and sorted by that pair.
 * - Self-attacks are allowed and reported by `is_self_attacking()`.
 *
 * @par Thread safety
 * - Immutable after construction; concurrent reads are safe.
 */
class ArgumentGraph
{
public:
    /**
     * @brief Number of arguments.
     */
    size_t argument_count() const noexcept
    {
        return m_ids.size();
    }

    /**
     * @brief Number of distinct attack edges.
     */
    size_t attack_count() const noexcept
    {
        return m_attacks.size();
    }

    /**
     * @brief All argument ids in index order.
     */
    const std::vector<std::string>& ids() const noexcept
    {
        return m_ids.ids();
    }

    /**
     * @brief All attacks, sorted by (attacker, target) index.
     */
    const std::vector<Attack>& attacks() const noexcept
    {
        return m_attacks;
    }

    /**
     * @brief The id of an argument.
     * @throw AfError with `UnknownArgument` if the index is out of range.
     */
    const std::string& id(ArgIdx idx) const;

    /**
     * @brief Look up an argument by id.
     * @return The index, or `std::nullopt` if the id is unknown.
     */
    std::optional<ArgIdx> find(const std::string& id) const noexcept;

    /**
     * @brief Look up an argument by id.
     * @throw AfError with `UnknownArgument` if the id is unknown.
     */
    ArgIdx index_of(const std::string& id) const;

    bool contains(const std::string& id) const noexcept
    {
        return find(id).has_value();
    }

    /**
     * @brief Arguments attacking `idx`, ascending.
     */
    const std::vector<ArgIdx>& attackers_of(ArgIdx idx) const;

    /**
     * @brief Arguments attacked by `idx`, ascending.
     */
    const std::vector<ArgIdx>& targets_of(ArgIdx idx) const;

    /**
     * @brief Arguments attacking `idx`, as a set.
     */
    const ArgSet& attacker_set(ArgIdx idx) const;

    /**
     * @brief Arguments attacked by `idx`, as a set.
     */
    const ArgSet& target_set(ArgIdx idx) const;

    /**
     * @brief True if `attacker` attacks `target`.
     */
    bool attacks(ArgIdx attacker, ArgIdx target) const;

    bool is_self_attacking(ArgIdx idx) const
    {
        return attacks(idx, idx);
    }

    /**
     * @brief Provenance of the edge (attacker, target), if present.
     */
    std::optional<EdgeProvenance> provenance(ArgIdx attacker, ArgIdx target) const;

    /**
     * @brief An empty set over this graph's universe.
     */
    ArgSet empty_set() const
    {
        return ArgSet(argument_count());
    }

    /**
     * @brief The set of all arguments.
     */
    ArgSet all_arguments() const
    {
        return ArgSet::full(argument_count());
    }

    /**
     * @brief Translate a set into ids, in index order.
     */
    std::vector<std::string> ids_of(const ArgSet& set) const;

    /**
     * @brief Translate ids into a set.
     * @throw AfError with `UnknownArgument` if any id is unknown.
     */
    ArgSet set_of(const std::vector<std::string>& ids) const;

    /**
     * @brief Produce a new graph with extra arguments and attacks.
     *
     * @details
     * The new graph keeps every existing argument at its current index and
     * every existing attack unchanged. New arguments are appended in the given
     * order. New attacks may reference existing or new arguments.
     *
     * @throw AfError with `DuplicateArgument` or `UnknownArgumentInAttack`.
     */
    GraphPtr with_additions(const std::vector<std::string>& new_ids,
                            const std::vector<AttackIdPair>& new_attacks,
                            EdgeProvenance provenance = EdgeProvenance::Explicit) const;

    // Constructed by GraphBuilder
    friend class GraphBuilder;

private:
    ArgumentGraph() = default;

    void check_index(ArgIdx idx) const;

    IdIndex m_ids;
    std::vector<Attack> m_attacks;

    /// Reverse adjacency: attackers of each argument.
    std::vector<std::vector<ArgIdx>> m_attackers;

    /// Forward adjacency: targets of each argument.
    std::vector<std::vector<ArgIdx>> m_targets;

    /// Bitset rows parallel to m_attackers and m_targets.
    std::vector<ArgSet> m_attacker_sets;
    std::vector<ArgSet> m_target_sets;
};

} // namespace argsem
