/**
 * @file extension.hpp
 */
#pragma once
#include "argsem/common/common.hpp"
#include "argsem/common/arg_set.hpp"
#include "argsem/common/errors.hpp"
#include "argsem/graph/argument_graph.hpp"
#include "argsem/semantics/semantics_kind.hpp"

#include <map>

namespace argsem
{

/**
 * @brief An immutable snapshot of a set of arguments satisfying some criterion.
 *
 * @details
 * An extension holds its members both as an `ArgSet` (for set operations) and
 * as ids in index order (for reporting). Extensions are only created from
 * conflict-free sets.
 */
class Extension
{
public:
    Extension(ArgSet members, std::vector<std::string> ids)
        : m_members(std::move(members))
        , m_ids(std::move(ids))
    {
    }

    /**
     * @brief Snapshot `members` using the ids of `graph`.
     */
    static Extension from_set(const ArgumentGraph& graph, const ArgSet& members)
    {
        return Extension(members, graph.ids_of(members));
    }

    const ArgSet& members() const noexcept
    {
        return m_members;
    }

    /**
     * @brief Member ids in index order.
     */
    const std::vector<std::string>& ids() const noexcept
    {
        return m_ids;
    }

    size_t size() const noexcept
    {
        return m_ids.size();
    }

    bool empty() const noexcept
    {
        return m_ids.empty();
    }

    bool contains(ArgIdx idx) const noexcept
    {
        return m_members.contains(idx);
    }

    friend bool operator==(const Extension& lhs, const Extension& rhs) noexcept
    {
        return lhs.m_members == rhs.m_members;
    }

    friend bool operator!=(const Extension& lhs, const Extension& rhs) noexcept
    {
        return !(lhs == rhs);
    }

    /// Lexicographic by member index sequence.
    friend bool operator<(const Extension& lhs, const Extension& rhs)
    {
        return lhs.m_members < rhs.m_members;
    }

private:
    ArgSet m_members;
    std::vector<std::string> m_ids;
};

/**
 * @brief Defense depth per argument, indexed by `ArgIdx`.
 *
 * @details
 * `depth[a]` is the 1-based iteration of the characteristic function at which
 * argument `a` first enters the grounded extension, or `std::nullopt` if it
 * never does. Unattacked arguments have depth 1.
 */
using DefenseDepth = std::vector<std::optional<size_t>>;

/**
 * @brief The extensions computed for one graph, per semantics kind.
 *
 * @details
 * `ExtensionFamily` is produced by the semantics engine. For each requested
 * kind it holds an ordered list of extensions; the order is lexicographic by
 * member index sequence, so output is reproducible.
 *
 * @par Empty lists
 * An empty list for a kind that was computed (for example stable on an odd
 * cycle) means no extension exists. It is a valid result, distinct from a kind
 * that was not requested, which `has()` reports as false.
 *
 * @par Thread safety
 * - Once constructed, the data is conceptually immutable.
 * - Concurrent reads are safe.
 */
struct ExtensionFamily
{
    /**
     * @brief The graph the extensions were computed on.
     */
    GraphPtr graph;

    /**
     * @brief Extensions per computed kind.
     */
    std::map<SemanticsKind, std::vector<Extension>> extensions;

    /**
     * @brief Defense depth, present whenever grounded was computed.
     */
    std::optional<DefenseDepth> defense_depth;

    bool has(SemanticsKind kind) const noexcept
    {
        return extensions.find(kind) != extensions.end();
    }

    /**
     * @brief Extensions of a computed kind.
     * @throw AfError with `InvalidRequest` if the kind was not computed.
     */
    const std::vector<Extension>& at(SemanticsKind kind) const
    {
        auto it = extensions.find(kind);
        if (it == extensions.end())
        {
            throw AfError(AfErrorCode::InvalidRequest,
                          std::string("Semantics '") + to_string(kind) +
                              "' was not computed for this family");
        }
        return it->second;
    }

    /**
     * @brief The unique grounded extension.
     * @throw AfError with `InvalidRequest` if grounded was not computed.
     */
    const Extension& grounded() const
    {
        return at(SemanticsKind::Grounded).front();
    }
};

} // namespace argsem
