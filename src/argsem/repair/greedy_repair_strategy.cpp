#include "argsem/repair/greedy_repair_strategy.hpp"
#include "argsem/common/logging.hpp"

namespace argsem
{

RepairResult GreedyRepairStrategy::plan(const RepairContext& context)
{
    const size_t n = context.blockers.size();
    const size_t groups = groups_needed(n, context.config.fanout);
    if (groups > context.config.k)
    {
        return failed(context, RepairStatus::Infeasible,
                      budget_reason(n, groups, context.config.k), 0);
    }

    auto partitioned = partition(context.blockers, context.config.fanout);
    logger()->debug("greedy repair: {} blocker(s) in {} group(s), fanout={}", n,
                    partitioned.size(), context.config.fanout);

    Verification verification = verify(context, partitioned);
    if (!verification.goal_met)
    {
        return failed(context, RepairStatus::Infeasible,
                      "verification failed: coverage " + verification.after.to_string() +
                          " after countering all " + std::to_string(n) +
                          " blockers does not meet " + describe(context.goal),
                      1);
    }
    return planned(context, std::move(verification), 1);
}

} // namespace argsem
