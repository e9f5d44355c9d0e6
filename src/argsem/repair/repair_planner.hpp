/**
 * @file repair_planner.hpp
 * @brief Entry point for add-nodes-only repair planning.
 */
#pragma once
#include "argsem/common/common.hpp"
#include "argsem/graph/argument_graph.hpp"
#include "argsem/repair/repair_config.hpp"
#include "argsem/repair/repair_result.hpp"
#include "argsem/repair/repair_strategy.hpp"

namespace argsem
{

/**
 * @brief Create the strategy for `kind`.
 */
std::unique_ptr<IRepairStrategy> make_repair_strategy(RepairStrategyKind kind);

/**
 * @brief Plans new defender arguments that make a target meet a goal.
 *
 * @details
 * The planner analyses the original graph, handles the trivial outcomes, and
 * hands the rest to the configured strategy.
 *
 * @par Outcomes
 * - Goal already met and `force` unset: `AlreadySatisfied`, empty plan,
 *   after state equal to before state.
 * - Self-attacking target: `Infeasible`, since no admissible set can contain it.
 * - No blockers: `AlreadySatisfied` if the goal is met, `Infeasible` otherwise.
 * - Otherwise the strategy's result. An engine candidate cap or
 *   `RepairConfig::time_limit` hit anywhere in the request becomes
 *   `SearchExhausted`, keeping the before coverage once it is known.
 *
 * The original graph is never modified; a plan carries a new graph instance.
 */
class RepairPlanner
{
public:
    explicit RepairPlanner(RepairConfig config = {});

    const RepairConfig& config() const noexcept
    {
        return m_config;
    }

    /**
     * @brief Plan a repair for `target`.
     * @throw AfError with `InvalidRequest` for a null graph or malformed goal,
     *        `UnknownArgument` if `target` is not in the graph.
     */
    RepairResult plan(GraphPtr graph, const std::string& target, const RepairGoal& goal) const;

private:
    RepairConfig m_config;
};

/**
 * @brief Convenience wrapper around `RepairPlanner::plan()`.
 */
RepairResult plan_repair(GraphPtr graph, const std::string& target, const RepairGoal& goal,
                         const RepairConfig& config = {});

} // namespace argsem
