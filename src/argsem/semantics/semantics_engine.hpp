/**
 * @file semantics_engine.hpp
 */
#pragma once
#include "argsem/common/common.hpp"
#include "argsem/common/arg_set.hpp"
#include "argsem/graph/argument_graph.hpp"
#include "argsem/semantics/engine_config.hpp"
#include "argsem/semantics/extension.hpp"
#include "argsem/semantics/semantics_kind.hpp"

namespace argsem
{

/**
 * @brief Result of the grounded fixed-point iteration.
 */
struct GroundedResult
{
    ArgSet extension;
    DefenseDepth depth;

    /// Number of waves that added at least one argument.
    size_t iterations{0};
};

/**
 * @brief Computes Dung-style extensions of an argument graph.
 *
 * @details
 * `SemanticsEngine` evaluates the acceptance criteria of `SemanticsKind` on
 * one immutable graph. All operations are pure functions of the graph and the
 * configuration.
 *
 * @par Definitions
 * - Conflict-free S: no a, b in S with a attacking b.
 * - S defends a: every attacker of a is attacked by some member of S.
 * - Admissible: conflict-free and defends every member.
 * - F(S) = { a : S defends a }; grounded is the least fixed point of F.
 * - Complete: conflict-free and F(S) = S.
 * - Preferred: admissible sets maximal under set inclusion.
 * - Stable: conflict-free and attacks every argument outside itself.
 * - Range(S) = S ∪ S+, where S+ is the set of arguments attacked by S.
 * - Stage: conflict-free sets whose range is maximal under set inclusion.
 * - Semi-stable: complete sets whose range is maximal under set inclusion.
 *
 * @par Candidate generation
 * Every complete extension contains the grounded extension G and is
 * conflict-free with it, so complete candidates start from G and branch only on
 * arguments that neither belong to G, attack G, nor are attacked by G.
 * Preferred, stable and semi-stable are filtered from the complete family.
 * Admissible candidates branch on the same undecided arguments plus the
 * members of G. Stage extensions are filtered from the maximal conflict-free
 * sets, since range grows with the set.
 *
 * @par Ordering
 * Every returned list is sorted lexicographically by member index sequence.
 *
 * @par Thread safety
 * - Const methods may be called concurrently.
 * - Enumeration itself may use `EngineConfig::thread_count` worker threads.
 */
class SemanticsEngine
{
public:
    explicit SemanticsEngine(GraphPtr graph, EngineConfig config = {});

    const ArgumentGraph& graph() const noexcept
    {
        return *m_graph;
    }

    const EngineConfig& config() const noexcept
    {
        return m_config;
    }

    // -------------------------------------------------------------------------
    // Set predicates
    // -------------------------------------------------------------------------

    bool is_conflict_free(const ArgSet& set) const;

    /**
     * @brief S+: the arguments attacked by some member of `set`.
     */
    ArgSet attacked_by(const ArgSet& set) const;

    /**
     * @brief Range: `set` ∪ `attacked_by(set)`.
     */
    ArgSet range(const ArgSet& set) const;

    bool defends(const ArgSet& set, ArgIdx arg) const;

    /**
     * @brief The characteristic function F(S).
     */
    ArgSet characteristic(const ArgSet& set) const;

    bool is_admissible(const ArgSet& set) const;
    bool is_complete(const ArgSet& set) const;
    bool is_stable(const ArgSet& set) const;

    // -------------------------------------------------------------------------
    // Families
    // -------------------------------------------------------------------------

    /**
     * @brief Iterate F from the empty set to its least fixed point.
     * @details Terminates after at most `argument_count()` waves.
     */
    GroundedResult grounded() const;

    std::vector<ArgSet> conflict_free_sets() const;

    /**
     * @brief Conflict-free sets maximal under set inclusion.
     */
    std::vector<ArgSet> naive_sets() const;

    std::vector<ArgSet> admissible_sets() const;
    std::vector<ArgSet> complete_sets() const;
    std::vector<ArgSet> preferred_sets() const;
    std::vector<ArgSet> stable_sets() const;
    std::vector<ArgSet> stage_sets() const;
    std::vector<ArgSet> semi_stable_sets() const;

    /**
     * @brief Extensions of one kind, as snapshots.
     */
    std::vector<Extension> extensions(SemanticsKind kind) const;

    /**
     * @brief Compute one kind. Grounded also fills the defense depth.
     */
    ExtensionFamily compute(SemanticsKind kind) const;

    /**
     * @brief Compute several kinds, sharing the grounded and complete work.
     */
    ExtensionFamily compute(const std::vector<SemanticsKind>& kinds) const;

    ExtensionFamily compute_all() const;

    /**
     * @brief Keep the members of `sets` not strictly contained in another member.
     * @throw AfError with `SearchExhausted` if `EngineConfig::deadline` passes.
     */
    std::vector<ArgSet> maximal_by_inclusion(const std::vector<ArgSet>& sets) const;

    /**
     * @brief Keep the members of `sets` whose range is not strictly contained
     *        in the range of another member.
     */
    std::vector<ArgSet> maximal_by_range(const std::vector<ArgSet>& sets) const;

private:
    void check_deadline(const char* stage) const;

    /// Arguments that may join a superset of the grounded extension.
    std::vector<ArgIdx> undecided_after(const ArgSet& grounded) const;

    std::vector<ArgSet> complete_from(const ArgSet& grounded) const;

    std::vector<ArgSet> stable_from(const std::vector<ArgSet>& complete) const;

    std::vector<Extension> snapshot(const std::vector<ArgSet>& sets) const;

    GraphPtr m_graph;
    EngineConfig m_config;
};

/**
 * @brief Compute one kind on a graph.
 */
ExtensionFamily compute(GraphPtr graph, SemanticsKind kind, EngineConfig config = {});

/**
 * @brief Compute a selection given by name: a kind name, or `all`.
 * @throw AfError with `InvalidSemanticsKind` for unknown names.
 */
ExtensionFamily compute(GraphPtr graph, const std::string& selection, EngineConfig config = {});

} // namespace argsem
