/**
 * @file subset_enumerator.hpp
 */
#pragma once
#include "argsem/common/common.hpp"
#include "argsem/common/arg_set.hpp"
#include "argsem/graph/argument_graph.hpp"
#include "argsem/semantics/engine_config.hpp"

namespace argsem
{

/**
 * @brief Predicate deciding whether a complete candidate set is kept.
 * @details Called concurrently from worker threads; must not mutate shared state.
 */
using CandidateFilter = std::function<bool(const ArgSet&)>;

/**
 * @brief Branch-and-prune enumeration of conflict-free sets.
 *
 * @details
 * `SubsetEnumerator` enumerates every conflict-free set S with
 * `base ⊆ S ⊆ base ∪ undecided` by deciding the undecided arguments one at a
 * time (include, then exclude). An include branch is pruned as soon as the
 * argument is self-attacking or conflicts with the set built so far, so
 * conflicting supersets are never visited.
 *
 * @par Parallelism
 * With more than one thread, the search tree is split at its top levels into
 * independent subtrees which workers claim from a shared counter. Each worker
 * collects its own results; the merged list is sorted before it is returned,
 * so the output does not depend on the thread count.
 *
 * @par Cap
 * Every leaf counts as one candidate. When `EngineConfig::max_candidates` is
 * exceeded, or `EngineConfig::deadline` has passed, all workers stop and
 * `enumerate()` throws `AfError` with `SearchExhausted`.
 *
 * @par Thread safety
 * - `enumerate()` is const and may be called concurrently.
 * - Exceptions thrown by the filter are captured per worker and rethrown on
 *   the calling thread after all workers have joined.
 */
class SubsetEnumerator
{
public:
    SubsetEnumerator(const ArgumentGraph& graph, EngineConfig config);

    /**
     * @brief Enumerate conflict-free sets between `base` and `base ∪ undecided`.
     * @param base Arguments forced into every candidate. Must be conflict-free.
     * @param undecided Arguments to branch on, in branching order. Must be
     *        disjoint from `base`.
     * @param accept Filter applied to each candidate.
     * @return The accepted candidates, sorted lexicographically.
     * @throw AfError with `SearchExhausted` if the candidate cap is exceeded.
     */
    std::vector<ArgSet> enumerate(const ArgSet& base,
                                  const std::vector<ArgIdx>& undecided,
                                  const CandidateFilter& accept) const;

private:
    struct SearchState;

    void search(SearchState& state, size_t pos, ArgSet& current,
                std::vector<ArgSet>& out) const;

    bool can_include(const ArgSet& current, ArgIdx arg) const;

    size_t effective_thread_count() const;

    const ArgumentGraph& m_graph;
    EngineConfig m_config;
};

} // namespace argsem
