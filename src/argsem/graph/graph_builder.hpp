/**
 * @file graph_builder.hpp
 * @brief GraphBuilder turns argument ids and attack pairs into an ArgumentGraph.
 */
#pragma once
#include "argsem/common/common.hpp"
#include "argsem/graph/argument_graph.hpp"

namespace argsem
{

/**
 * @brief Mutable builder producing immutable `ArgumentGraph` instances.
 *
 * @details
 * GraphBuilder validates every argument and attack as it is added, so a
 * malformed graph fails at construction and never reaches the semantics
 * engine.
 *
 * @par Usage
 * 1. Create a GraphBuilder.
 * 2. Declare arguments via add_argument() - indices are assigned in order.
 * 3. Add attacks via add_attack() - both endpoints must already be declared.
 * 4. Call build() to obtain a shared immutable graph.
 *
 * @par Argument ids
 * An id must be non-empty and must not contain whitespace or ','.
 *
 * @par Duplicate attacks
 * Adding the same (attacker, target) pair twice keeps one edge; the first
 * provenance wins.
 *
 * @par Thread Safety
 * - No internal synchronization.
 * - build() may be called repeatedly; each call returns an independent graph.
 */
class GraphBuilder
{
public:
    GraphBuilder() = default;

    /**
     * @brief Declare an argument.
     * @return The index assigned to the argument.
     * @throw AfError with `InvalidArgumentId` if the id is malformed, or
     *        `DuplicateArgument` if it is already declared.
     */
    ArgIdx add_argument(const std::string& id);

    /**
     * @brief Add an attack between two declared arguments.
     * @throw AfError with `UnknownArgumentInAttack` if either id is undeclared.
     */
    void add_attack(const std::string& attacker, const std::string& target,
                    EdgeProvenance provenance = EdgeProvenance::Explicit);

    /**
     * @brief Add an attack by index.
     * @throw AfError with `UnknownArgumentInAttack` if either index is undeclared.
     */
    void add_attack(ArgIdx attacker, ArgIdx target,
                    EdgeProvenance provenance = EdgeProvenance::Explicit);

    bool has_argument(const std::string& id) const noexcept
    {
        return m_ids.find(id) != IdIndex::npos;
    }

    size_t argument_count() const noexcept
    {
        return m_ids.size();
    }

    /**
     * @brief Produce the immutable graph.
     */
    GraphPtr build() const;

    /**
     * @brief True if `id` is acceptable as an argument id.
     */
    static bool is_valid_id(const std::string& id) noexcept;

private:
    IdIndex m_ids{};
    std::vector<Attack> m_attacks{};
};

/**
 * @brief Build a graph from an id list and an attack list.
 * @throw AfError with `DuplicateArgument`, `InvalidArgumentId` or
 *        `UnknownArgumentInAttack` on malformed input.
 */
GraphPtr build_graph(const std::vector<std::string>& ids,
                     const std::vector<AttackIdPair>& attacks);

} // namespace argsem
