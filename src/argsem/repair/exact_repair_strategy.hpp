/**
 * @file exact_repair_strategy.hpp
 */
#pragma once
#include "argsem/repair/repair_strategy.hpp"

namespace argsem
{

/**
 * @brief Cost-minimal search over subsets of the blockers.
 *
 * @details
 * Candidates are subsets of the ranked blockers, visited in order of
 * defender cost (the number of fanout groups the subset needs), then subset
 * size, then lexicographic order of ranks. The first candidate that verifies
 * is cost-minimal, so the search stops there. Costs above `k` are never
 * visited.
 *
 * @par Caps
 * - `RepairConfig::max_iterations` bounds the number of verifications.
 * - `RepairConfig::time_limit`, turned into `EngineConfig::deadline` by the
 *   planner, bounds wall-clock time between and within verifications.
 * - Hitting either cap before a verified plan is found or the candidate
 *   space is exhausted yields `SearchExhausted`.
 */
class ExactRepairStrategy : public RepairStrategy
{
public:
    RepairResult plan(const RepairContext& context) override;

    RepairStrategyKind kind() const noexcept override
    {
        return RepairStrategyKind::Exact;
    }
};

} // namespace argsem
