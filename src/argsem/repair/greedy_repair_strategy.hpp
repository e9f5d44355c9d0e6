/**
 * @file greedy_repair_strategy.hpp
 */
#pragma once
#include "argsem/repair/repair_strategy.hpp"

namespace argsem
{

/**
 * @brief Groups all blockers by fanout and verifies the single resulting plan.
 *
 * @par Behavior
 * - Blockers are chunked in ranked order into groups of `fanout` (all in one
 *   group when fanout is 0), one defender per group.
 * - If the group count exceeds `k`, the result is `Infeasible` without any
 *   verification.
 * - Otherwise exactly one candidate is verified.
 */
class GreedyRepairStrategy : public RepairStrategy
{
public:
    RepairResult plan(const RepairContext& context) override;

    RepairStrategyKind kind() const noexcept override
    {
        return RepairStrategyKind::Greedy;
    }
};

} // namespace argsem
