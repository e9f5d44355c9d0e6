#include "argsem/repair/repair_planner.hpp"
#include "argsem/common/errors.hpp"
#include "argsem/common/logging.hpp"
#include "argsem/repair/exact_repair_strategy.hpp"
#include "argsem/repair/greedy_repair_strategy.hpp"
#include "argsem/semantics/semantics_engine.hpp"

namespace argsem
{

const char* to_string(RepairStatus status) noexcept
{
    switch (status)
    {
        case RepairStatus::Planned: return "planned";
        case RepairStatus::AlreadySatisfied: return "already-satisfied";
        case RepairStatus::Infeasible: return "infeasible";
        case RepairStatus::SearchExhausted: return "search-exhausted";
    }
    return "unknown";
}

std::unique_ptr<IRepairStrategy> make_repair_strategy(RepairStrategyKind kind)
{
    switch (kind)
    {
        case RepairStrategyKind::Greedy:
            return std::make_unique<GreedyRepairStrategy>();
        case RepairStrategyKind::Exact:
            return std::make_unique<ExactRepairStrategy>();
    }
    throw AfError(AfErrorCode::InvalidRequest, "Unknown repair strategy");
}

namespace
{

// ============================================================================
// Outcome helpers
// ============================================================================

RepairResult unchanged(const GraphPtr& graph, const std::string& target, const RepairGoal& goal,
                       const Coverage& before, std::string reason,
                       std::vector<std::string> blockers)
{
    RepairPlan plan;
    plan.target = target;
    plan.goal = goal;
    plan.blockers = std::move(blockers);
    plan.before_graph = graph;
    plan.after_graph = graph;
    plan.before = before;
    plan.after = before;

    RepairResult result;
    result.status = RepairStatus::AlreadySatisfied;
    result.reason = std::move(reason);
    result.before = before;
    result.plan = std::move(plan);
    return result;
}

RepairResult infeasible(const Coverage& before, std::string reason)
{
    RepairResult result;
    result.status = RepairStatus::Infeasible;
    result.reason = std::move(reason);
    result.before = before;
    return result;
}

void log_outcome(const RepairResult& result)
{
    switch (result.status)
    {
        case RepairStatus::Planned:
        case RepairStatus::AlreadySatisfied:
            logger()->info("{}", result.summary());
            break;
        case RepairStatus::Infeasible:
        case RepairStatus::SearchExhausted:
            logger()->warn("{}", result.summary());
            break;
    }
}

} // namespace

RepairPlanner::RepairPlanner(RepairConfig config)
    : m_config(std::move(config))
{
}

RepairResult RepairPlanner::plan(GraphPtr graph, const std::string& target,
                                 const RepairGoal& goal) const
{
    if (!graph)
    {
        throw AfError(AfErrorCode::InvalidRequest, "RepairPlanner::plan: null graph");
    }
    validate_goal(goal);
    const ArgIdx t = graph->index_of(target);

    // The time limit covers every engine run of this request
    RepairConfig config = m_config;
    if (config.time_limit.count() > 0)
    {
        auto deadline = std::chrono::steady_clock::now() + config.time_limit;
        if (!config.engine.deadline || deadline < *config.engine.deadline)
        {
            config.engine.deadline = deadline;
        }
    }

    RepairResult result;
    std::optional<Coverage> known_before;
    try
    {
        // Preferred is always needed to rank blockers
        SemanticsEngine engine(graph, config.engine);
        std::vector<SemanticsKind> kinds{goal.kind};
        if (goal.kind != SemanticsKind::Preferred)
        {
            kinds.push_back(SemanticsKind::Preferred);
        }
        ExtensionFamily family = engine.compute(kinds);
        const Coverage before = coverage_of(family.at(goal.kind), t);
        known_before = before;
        const bool met = goal_met(goal, before);

        if (graph->is_self_attacking(t))
        {
            result = infeasible(before, "self-attack: no admissible set can contain " + target);
            log_outcome(result);
            return result;
        }

        // Rank blockers: most frequent across preferred first, then by index
        const auto frequencies = attacker_frequencies(*graph, family.at(SemanticsKind::Preferred), t);
        std::vector<std::pair<ArgIdx, size_t>> ranked(frequencies.begin(), frequencies.end());
        std::stable_sort(ranked.begin(), ranked.end(),
                         [](const auto& lhs, const auto& rhs) { return lhs.second > rhs.second; });
        std::vector<ArgIdx> blockers;
        std::vector<std::string> blocker_ids;
        for (const auto& entry : ranked)
        {
            blockers.push_back(entry.first);
            blocker_ids.push_back(graph->id(entry.first));
        }

        if (met && !config.force)
        {
            result = unchanged(graph, target, goal, before,
                               "goal already met: " + describe(goal) + " at " + before.to_string(),
                               std::move(blocker_ids));
            log_outcome(result);
            return result;
        }
        if (blockers.empty())
        {
            if (met)
            {
                result = unchanged(graph, target, goal, before, "already accepted", {});
            }
            else
            {
                result = infeasible(before, "no blockers to counter, but " + describe(goal) +
                                                " is unmet at " + before.to_string());
            }
            log_outcome(result);
            return result;
        }

        RepairContext context;
        context.graph = graph;
        context.target = t;
        context.goal = goal;
        context.config = config;
        context.blockers = std::move(blockers);
        context.before = before;

        logger()->debug("repair '{}': {} blocker(s), goal {}, strategy {}, k={}, fanout={}",
                        target, context.blockers.size(), describe(goal),
                        to_string(config.strategy), config.k, config.fanout);
        result = make_repair_strategy(config.strategy)->plan(context);
    }
    catch (const AfError& e)
    {
        if (e.code() != AfErrorCode::SearchExhausted)
        {
            throw;
        }
        result = RepairResult{};
        result.status = RepairStatus::SearchExhausted;
        result.reason = e.what();
        if (known_before)
        {
            result.before = *known_before;
        }
    }
    log_outcome(result);
    return result;
}

RepairResult plan_repair(GraphPtr graph, const std::string& target, const RepairGoal& goal,
                         const RepairConfig& config)
{
    return RepairPlanner(config).plan(std::move(graph), target, goal);
}

} // namespace argsem
