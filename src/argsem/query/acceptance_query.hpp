/**
 * @file acceptance_query.hpp
 * @brief Membership questions and diagnostic insights over extension families.
 */
#pragma once
#include "argsem/common/common.hpp"
#include "argsem/graph/argument_graph.hpp"
#include "argsem/semantics/extension.hpp"
#include "argsem/semantics/semantics_kind.hpp"

namespace argsem
{

/**
 * @brief How many extensions of a family contain a target, as k of n.
 */
struct Coverage
{
    size_t containing{0};
    size_t total{0};

    /**
     * @brief k / n, or 0 when the family is empty.
     */
    double ratio() const noexcept
    {
        return total == 0 ? 0.0 : static_cast<double>(containing) / static_cast<double>(total);
    }

    /**
     * @brief `k/n`, for logging.
     */
    std::string to_string() const
    {
        return std::to_string(containing) + "/" + std::to_string(total);
    }

    friend bool operator==(const Coverage& lhs, const Coverage& rhs) noexcept
    {
        return lhs.containing == rhs.containing && lhs.total == rhs.total;
    }

    friend bool operator!=(const Coverage& lhs, const Coverage& rhs) noexcept
    {
        return !(lhs == rhs);
    }
};

/**
 * @brief True if some extension contains `target`.
 */
bool is_credulously_accepted(const std::vector<Extension>& extensions, ArgIdx target);

/**
 * @brief True if every extension contains `target`; false for an empty list.
 */
bool is_skeptically_accepted(const std::vector<Extension>& extensions, ArgIdx target);

Coverage coverage_of(const std::vector<Extension>& extensions, ArgIdx target);

/**
 * @brief Answer a credulous or skeptical membership question.
 * @throw AfError with `InvalidRequest` if `kind` was not computed, or
 *        `UnknownArgument` if `target` is not in the family's graph.
 */
bool query(const ExtensionFamily& family, SemanticsKind kind, const std::string& target,
           AcceptanceMode mode);

/**
 * @brief Coverage of `target` within the extensions of `kind`.
 * @throw AfError as for `query()`.
 */
Coverage coverage(const ExtensionFamily& family, SemanticsKind kind, const std::string& target);

/**
 * @brief Attackers of `target` that `grounded` does not counter-attack.
 * @return Ascending indices; empty when `target` is itself in `grounded`.
 */
std::vector<ArgIdx> grounded_roadblocks(const ArgumentGraph& graph, const ArgSet& grounded,
                                        ArgIdx target);

/**
 * @brief For each direct attacker of `target`, the number of `extensions`
 *        containing it, as (attacker, count) in attacker index order.
 */
std::vector<std::pair<ArgIdx, size_t>> attacker_frequencies(
    const ArgumentGraph& graph, const std::vector<Extension>& extensions, ArgIdx target);

/**
 * @brief Diagnostic view of why a target is or is not accepted.
 *
 * @details
 * - `grounded_roadblocks`: attackers of the target not attacked by anything in
 *   the grounded extension.
 * - `persistent_attackers`: attackers of the target present in every
 *   preferred extension.
 * - `soft_attackers`: attackers present in some, but not all, preferred
 *   extensions.
 * - `attacker_frequencies`: per attacker, the number of preferred extensions
 *   containing it.
 * - `target_depth`: defense depth of the target, if it is grounded.
 *
 * All id lists are in index order.
 */
struct Insights
{
    std::string target;
    bool in_grounded{false};
    std::optional<size_t> target_depth;
    size_t preferred_count{0};
    std::vector<std::string> grounded_roadblocks;
    std::vector<std::string> persistent_attackers;
    std::vector<std::string> soft_attackers;
    std::vector<std::pair<std::string, size_t>> attacker_frequencies;
};

/**
 * @brief Compute insights for `target`.
 * @param graph The graph the family was computed on.
 * @param family Must contain grounded and preferred extensions.
 * @throw AfError with `InvalidRequest` if the family lacks grounded or
 *        preferred, or belongs to another graph; `UnknownArgument` if
 *        `target` is unknown.
 */
Insights insights(const ArgumentGraph& graph, const ExtensionFamily& family,
                  const std::string& target);

} // namespace argsem
