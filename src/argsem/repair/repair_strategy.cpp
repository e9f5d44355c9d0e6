#include "argsem/repair/repair_strategy.hpp"
#include "argsem/common/logging.hpp"
#include "argsem/semantics/semantics_engine.hpp"


namespace argsem
{

size_t RepairStrategy::groups_needed(size_t blocker_count, size_t fanout) noexcept
{
    if (blocker_count == 0)
    {
        return 0;
    }
    if (fanout == 0)
    {
        return 1;
    }
    return (blocker_count + fanout - 1) / fanout;
}

std::vector<std::vector<ArgIdx>> RepairStrategy::partition(const std::vector<ArgIdx>& blockers,
                                                           size_t fanout)
{
    std::vector<std::vector<ArgIdx>> groups;
    if (blockers.empty())
    {
        return groups;
    }
    if (fanout == 0)
    {
        groups.push_back(blockers);
        return groups;
    }
    for (size_t i = 0; i < blockers.size(); i += fanout)
    {
        size_t end = std::min(blockers.size(), i + fanout);
        groups.emplace_back(blockers.begin() + i, blockers.begin() + end);
    }
    return groups;
}

std::string RepairStrategy::budget_reason(size_t blocker_count, size_t groups, size_t k)
{
    return "budget exhausted, " + std::to_string(blocker_count) + " blockers require at least " +
           std::to_string(groups) + (groups == 1 ? " group" : " groups") +
           " but k=" + std::to_string(k);
}

std::vector<std::string> RepairStrategy::next_defender_ids(const ArgumentGraph& graph, size_t n,
                                                           const std::string& prefix)
{
    std::vector<std::string> result;
    for (size_t i = 1; result.size() < n; ++i)
    {
        std::string candidate = prefix + std::to_string(i);
        if (!graph.contains(candidate))
        {
            result.push_back(std::move(candidate));
        }
    }
    return result;
}

Verification RepairStrategy::verify(const RepairContext& context,
                                    const std::vector<std::vector<ArgIdx>>& groups) const
{
    const ArgumentGraph& graph = *context.graph;
    Verification result;

    std::vector<std::string> ids =
        next_defender_ids(graph, groups.size(), context.config.defender_prefix);
    std::vector<AttackIdPair> edges;
    for (size_t g = 0; g < groups.size(); ++g)
    {
        Defender defender;
        defender.id = ids[g];
        for (ArgIdx blocker : groups[g])
        {
            defender.attacks.push_back(graph.id(blocker));
            edges.emplace_back(defender.id, graph.id(blocker));
        }
        result.defenders.push_back(std::move(defender));
    }

    // Only the declared defender edges are added; nothing is re-inferred
    result.after_graph = graph.with_additions(ids, edges, EdgeProvenance::Explicit);

    SemanticsEngine engine(result.after_graph, context.config.engine);
    ExtensionFamily family = engine.compute(context.goal.kind);
    result.after = coverage_of(family.at(context.goal.kind), context.target);
    result.goal_met = goal_met(context.goal, result.after);

    logger()->debug("verified {} defender(s) for '{}': coverage {} ({})",
                    groups.size(), graph.id(context.target), result.after.to_string(),
                    result.goal_met ? "goal met" : "goal unmet");
    return result;
}

RepairResult RepairStrategy::planned(const RepairContext& context, Verification verification,
                                     size_t iterations) const
{
    const ArgumentGraph& graph = *context.graph;
    RepairPlan plan;
    plan.target = graph.id(context.target);
    plan.goal = context.goal;
    for (ArgIdx b : context.blockers)
    {
        plan.blockers.push_back(graph.id(b));
    }
    plan.defenders = std::move(verification.defenders);
    plan.before_graph = context.graph;
    plan.after_graph = std::move(verification.after_graph);
    plan.before = context.before;
    plan.after = verification.after;

    RepairResult result;
    result.status = RepairStatus::Planned;
    result.reason = "verified: " + std::to_string(plan.defenders.size()) +
                    " defender(s) raise coverage from " + context.before.to_string() + " to " +
                    plan.after.to_string();
    result.before = context.before;
    result.iterations = iterations;
    result.plan = std::move(plan);
    return result;
}

RepairResult RepairStrategy::failed(const RepairContext& context, RepairStatus status,
                                    std::string reason, size_t iterations)
{
    RepairResult result;
    result.status = status;
    result.reason = std::move(reason);
    result.before = context.before;
    result.iterations = iterations;
    return result;
}

} // namespace argsem
