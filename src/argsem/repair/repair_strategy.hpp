/**
 * @file repair_strategy.hpp
 * @brief IRepairStrategy interface and shared planning helpers.
 */
#pragma once
#include "argsem/common/common.hpp"
#include "argsem/graph/argument_graph.hpp"
#include "argsem/repair/repair_config.hpp"
#include "argsem/repair/repair_result.hpp"

namespace argsem
{

/**
 * @brief Analysis shared by every strategy for one repair request.
 *
 * @details
 * Built by `RepairPlanner` after it has ruled out the trivial cases: the
 * target is not self-attacking, has at least one blocker, and either misses
 * the goal or planning was forced.
 */
struct RepairContext
{
    GraphPtr graph;
    ArgIdx target;
    RepairGoal goal;
    RepairConfig config;

    /**
     * @brief Direct attackers of the target, most persistent first.
     */
    std::vector<ArgIdx> blockers;

    Coverage before;
};

/**
 * @brief A candidate checked against the goal on the augmented graph.
 */
struct Verification
{
    std::vector<Defender> defenders;
    GraphPtr after_graph;
    Coverage after;
    bool goal_met{false};
};

/**
 * @brief Interface for repair search strategies.
 *
 * @details
 * Every strategy must satisfy the same postcondition: a `Planned` result
 * carries a plan whose after-state was verified by re-running the semantics
 * engine on the augmented graph.
 */
class IRepairStrategy
{
public:
    virtual ~IRepairStrategy() = default;

    /**
     * @brief Search for a plan.
     * @throw AfError with `SearchExhausted` if the engine's candidate cap is hit.
     */
    virtual RepairResult plan(const RepairContext& context) = 0;

    virtual RepairStrategyKind kind() const noexcept = 0;
};

/**
 * @brief Base class for strategy implementations.
 *
 * @details
 * Provides the steps every strategy shares: naming defenders, building the
 * augmented graph, verifying it, and packaging results.
 */
class RepairStrategy : public IRepairStrategy
{
public:
    virtual ~RepairStrategy() = default;

protected:
    /**
     * @brief Number of defenders needed to attack `blocker_count` blockers.
     */
    static size_t groups_needed(size_t blocker_count, size_t fanout) noexcept;

    /**
     * @brief Split blockers into consecutive groups of at most `fanout`.
     */
    static std::vector<std::vector<ArgIdx>> partition(const std::vector<ArgIdx>& blockers,
                                                      size_t fanout);

    /**
     * @brief The `budget exhausted, ...` reason text.
     */
    static std::string budget_reason(size_t blocker_count, size_t groups, size_t k);

    /**
     * @brief The first `n` ids `<prefix><i>`, i = 1, 2, ..., unused in `graph`.
     */
    static std::vector<std::string> next_defender_ids(const ArgumentGraph& graph, size_t n,
                                                      const std::string& prefix);

    /**
     * @brief Add one defender per group and check the goal on the result.
     */
    Verification verify(const RepairContext& context,
                        const std::vector<std::vector<ArgIdx>>& groups) const;

    /**
     * @brief Package a verified candidate as a `Planned` result.
     */
    RepairResult planned(const RepairContext& context, Verification verification,
                         size_t iterations) const;

    /**
     * @brief Package a failure outcome.
     */
    static RepairResult failed(const RepairContext& context, RepairStatus status,
                               std::string reason, size_t iterations);
};

} // namespace argsem
