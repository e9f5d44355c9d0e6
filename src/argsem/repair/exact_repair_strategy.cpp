#include "argsem/repair/exact_repair_strategy.hpp"
#include "argsem/common/logging.hpp"

namespace argsem
{

namespace
{

/**
 * @brief Advance `combo` to the next `r`-combination of `[0, n)` in
 *        lexicographic order. Returns false after the last one.
 */
bool next_combination(std::vector<size_t>& combo, size_t n)
{
    const size_t r = combo.size();
    for (size_t i = r; i-- > 0;)
    {
        if (combo[i] < n - r + i)
        {
            ++combo[i];
            for (size_t j = i + 1; j < r; ++j)
            {
                combo[j] = combo[j - 1] + 1;
            }
            return true;
        }
    }
    return false;
}

} // namespace

RepairResult ExactRepairStrategy::plan(const RepairContext& context)
{
    using Clock = std::chrono::steady_clock;

    const RepairConfig& config = context.config;
    const size_t n = context.blockers.size();
    const size_t full_groups = groups_needed(n, config.fanout);
    if (config.k == 0)
    {
        return failed(context, RepairStatus::Infeasible, budget_reason(n, full_groups, 0), 0);
    }

    const std::optional<Clock::time_point>& deadline = config.engine.deadline;
    size_t iterations = 0;

    for (size_t size = 1; size <= n; ++size)
    {
        // Sizes are visited in increasing order, so cost never decreases
        if (groups_needed(size, config.fanout) > config.k)
        {
            break;
        }

        std::vector<size_t> combo(size);
        for (size_t i = 0; i < size; ++i)
        {
            combo[i] = i;
        }
        do
        {
            if (config.max_iterations != 0 && iterations >= config.max_iterations)
            {
                return failed(context, RepairStatus::SearchExhausted,
                              "search exhausted after " + std::to_string(iterations) +
                                  " candidate(s), iteration limit reached",
                              iterations);
            }
            if (deadline && Clock::now() >= *deadline)
            {
                return failed(context, RepairStatus::SearchExhausted,
                              "search exhausted after " + std::to_string(iterations) +
                                  " candidate(s), time limit reached",
                              iterations);
            }

            std::vector<ArgIdx> subset;
            subset.reserve(size);
            for (size_t rank : combo)
            {
                subset.push_back(context.blockers[rank]);
            }
            ++iterations;
            Verification verification = verify(context, partition(subset, config.fanout));
            if (verification.goal_met)
            {
                logger()->debug("exact repair: {} of {} blocker(s) suffice after {} candidate(s)",
                                size, n, iterations);
                return planned(context, std::move(verification), iterations);
            }
        } while (next_combination(combo, n));
    }

    if (full_groups > config.k)
    {
        return failed(context, RepairStatus::Infeasible, budget_reason(n, full_groups, config.k),
                      iterations);
    }
    return failed(context, RepairStatus::Infeasible,
                  "verification failed: no subset of " + std::to_string(n) +
                      " blockers meets " + describe(context.goal) + " within k=" +
                      std::to_string(config.k),
                  iterations);
}

} // namespace argsem
