/**
 * @file repair_planner_tests.cpp
 * Unit tests for argsem::RepairPlanner and the repair strategies
 */
#include <gtest/gtest.h>
#include "argsem/graph/graph_builder.hpp"
#include "argsem/repair/repair_planner.hpp"
#include "argsem/semantics/semantics_engine.hpp"

#include <chrono>
#include <random>
#include <string>
#include <vector>

using namespace argsem;

namespace
{

using Strings = std::vector<std::string>;

/// A2 -> A1, A3 -> A1, A4 isolated.
GraphPtr two_blocker_graph()
{
    return build_graph({"A1", "A2", "A3", "A4"}, {{"A2", "A1"}, {"A3", "A1"}});
}

/// T attacked by B1, B2, B3, all unattacked.
GraphPtr three_blocker_graph()
{
    return build_graph({"T", "B1", "B2", "B3"}, {{"B1", "T"}, {"B2", "T"}, {"B3", "T"}});
}

RepairGoal credulous_preferred()
{
    return RepairGoal{};
}

RepairGoal skeptical(SemanticsKind kind, double min_coverage)
{
    RepairGoal goal;
    goal.kind = kind;
    goal.mode = AcceptanceMode::Skeptical;
    goal.min_coverage = min_coverage;
    return goal;
}

RepairConfig config_with(size_t k, size_t fanout)
{
    RepairConfig config;
    config.k = k;
    config.fanout = fanout;
    return config;
}

} // namespace

// ============================================================================
// Goals
// ============================================================================

TEST(RepairGoalTests, Validate_SkepticalNeedsMinCoverage)
{
    RepairGoal goal;
    goal.mode = AcceptanceMode::Skeptical;
    EXPECT_THROW(validate_goal(goal), AfError);
    goal.min_coverage = 1.0;
    EXPECT_NO_THROW(validate_goal(goal));
}

TEST(RepairGoalTests, Validate_MinCoverageRange)
{
    RepairGoal goal;
    goal.min_coverage = 0.0;
    EXPECT_THROW(validate_goal(goal), AfError);
    goal.min_coverage = 1.5;
    EXPECT_THROW(validate_goal(goal), AfError);
    goal.min_coverage = 0.5;
    EXPECT_NO_THROW(validate_goal(goal));
}

TEST(RepairGoalTests, GoalMet_CredulousAndSkeptical)
{
    EXPECT_TRUE(goal_met(credulous_preferred(), Coverage{1, 3}));
    EXPECT_FALSE(goal_met(credulous_preferred(), Coverage{0, 3}));

    RepairGoal half = skeptical(SemanticsKind::Preferred, 0.5);
    EXPECT_TRUE(goal_met(half, Coverage{1, 2}));
    EXPECT_FALSE(goal_met(half, Coverage{1, 3}));
    EXPECT_FALSE(goal_met(half, Coverage{0, 0}));

    RepairGoal credulous_two_thirds;
    credulous_two_thirds.min_coverage = 2.0 / 3.0;
    EXPECT_FALSE(goal_met(credulous_two_thirds, Coverage{1, 2}));
    EXPECT_TRUE(goal_met(credulous_two_thirds, Coverage{3, 3}));
}

// ============================================================================
// Worked examples
// ============================================================================

TEST(RepairPlannerTests, TwoBlockers_OneDefenderAttacksBoth)
{
    auto g = two_blocker_graph();
    RepairResult r = plan_repair(g, "A1", credulous_preferred(), config_with(1, 0));

    ASSERT_EQ(r.status, RepairStatus::Planned) << r.reason;
    ASSERT_TRUE(r.plan.has_value());
    const RepairPlan& plan = *r.plan;
    ASSERT_EQ(plan.defenders.size(), 1u);
    EXPECT_EQ(plan.defenders[0].id, "R1");
    EXPECT_EQ(plan.defenders[0].attacks, (Strings{"A2", "A3"}));
    EXPECT_EQ(plan.blockers, (Strings{"A2", "A3"}));
    EXPECT_EQ(plan.before, (Coverage{0, 1}));
    EXPECT_EQ(plan.after, (Coverage{1, 1}));
    EXPECT_EQ(r.before, plan.before);
    EXPECT_DOUBLE_EQ(plan.after.ratio(), 1.0);

    auto after = compute(plan.after_graph, SemanticsKind::Preferred);
    EXPECT_TRUE(query(after, SemanticsKind::Preferred, "A1", AcceptanceMode::Credulous));
}

TEST(RepairPlannerTests, TwoBlockers_ZeroBudgetIsInfeasible)
{
    RepairResult r = plan_repair(two_blocker_graph(), "A1", credulous_preferred(),
                                 config_with(0, 0));
    EXPECT_EQ(r.status, RepairStatus::Infeasible);
    EXPECT_EQ(r.reason, "budget exhausted, 2 blockers require at least 1 group but k=0");
    EXPECT_FALSE(r.plan.has_value());
    EXPECT_FALSE(r.ok());
}

TEST(RepairPlannerTests, SelfAttackingTargetIsInfeasible)
{
    auto g = build_graph({"A1"}, {{"A1", "A1"}});
    RepairResult r = plan_repair(g, "A1", credulous_preferred(), config_with(5, 0));
    EXPECT_EQ(r.status, RepairStatus::Infeasible);
    EXPECT_EQ(r.reason, "self-attack: no admissible set can contain A1");
}

TEST(RepairPlannerTests, UnknownTargetThrows)
{
    try
    {
        plan_repair(two_blocker_graph(), "Q", credulous_preferred());
        FAIL() << "Expected AfError";
    }
    catch (const AfError& e)
    {
        EXPECT_EQ(e.code(), AfErrorCode::UnknownArgument);
    }
}

// ============================================================================
// No-op and force
// ============================================================================

TEST(RepairPlannerTests, AlreadySatisfied_IsNoOp)
{
    auto g = two_blocker_graph();
    RepairResult r = plan_repair(g, "A2", credulous_preferred(), config_with(1, 0));
    ASSERT_EQ(r.status, RepairStatus::AlreadySatisfied);
    ASSERT_TRUE(r.plan.has_value());
    EXPECT_TRUE(r.plan->empty());
    EXPECT_EQ(r.plan->before, r.plan->after);
    EXPECT_EQ(r.plan->after_graph, g);
    EXPECT_TRUE(r.ok());
}

TEST(RepairPlannerTests, Force_PlansEvenWhenSatisfied)
{
    auto g = build_graph({"A", "B"}, {{"A", "B"}, {"B", "A"}});
    RepairConfig config = config_with(1, 0);
    config.force = true;
    RepairResult r = plan_repair(g, "A", credulous_preferred(), config);
    ASSERT_EQ(r.status, RepairStatus::Planned) << r.reason;
    EXPECT_EQ(r.plan->before, (Coverage{1, 2}));
    EXPECT_EQ(r.plan->after, (Coverage{1, 1}));
    EXPECT_EQ(r.plan->defenders[0].attacks, (Strings{"B"}));
}

TEST(RepairPlannerTests, Force_WithoutBlockersIsAlreadyAccepted)
{
    RepairConfig config = config_with(1, 0);
    config.force = true;
    RepairResult r = plan_repair(two_blocker_graph(), "A4", credulous_preferred(), config);
    EXPECT_EQ(r.status, RepairStatus::AlreadySatisfied);
    EXPECT_EQ(r.reason, "already accepted");
    EXPECT_TRUE(r.plan->empty());
}

// ============================================================================
// Fanout
// ============================================================================

TEST(RepairPlannerTests, Fanout_OneDefenderPerBlocker)
{
    RepairResult r = plan_repair(three_blocker_graph(), "T", credulous_preferred(),
                                 config_with(3, 1));
    ASSERT_EQ(r.status, RepairStatus::Planned) << r.reason;
    ASSERT_EQ(r.plan->defenders.size(), 3u);
    auto edges = r.plan->edge_map();
    EXPECT_EQ(edges["R1"], (Strings{"B1"}));
    EXPECT_EQ(edges["R2"], (Strings{"B2"}));
    EXPECT_EQ(edges["R3"], (Strings{"B3"}));
    EXPECT_EQ(r.plan->new_attacks().size(), 3u);
}

TEST(RepairPlannerTests, Fanout_BudgetTooSmallForGroups)
{
    RepairResult r = plan_repair(three_blocker_graph(), "T", credulous_preferred(),
                                 config_with(2, 1));
    EXPECT_EQ(r.status, RepairStatus::Infeasible);
    EXPECT_EQ(r.reason, "budget exhausted, 3 blockers require at least 3 groups but k=2");
}

TEST(RepairPlannerTests, Fanout_ConsecutiveGroups)
{
    RepairResult r = plan_repair(three_blocker_graph(), "T", credulous_preferred(),
                                 config_with(2, 2));
    ASSERT_EQ(r.status, RepairStatus::Planned) << r.reason;
    ASSERT_EQ(r.plan->defenders.size(), 2u);
    EXPECT_EQ(r.plan->defenders[0].attacks, (Strings{"B1", "B2"}));
    EXPECT_EQ(r.plan->defenders[1].attacks, (Strings{"B3"}));
}

TEST(RepairPlannerTests, DefenderIdsSkipExistingNames)
{
    auto g = build_graph({"T", "R1", "X"}, {{"R1", "T"}});
    RepairResult r = plan_repair(g, "T", credulous_preferred(), config_with(1, 0));
    ASSERT_EQ(r.status, RepairStatus::Planned) << r.reason;
    EXPECT_EQ(r.plan->defenders[0].id, "R2");
}

TEST(RepairPlannerTests, BlockersRankedByPersistence)
{
    // B2 is in every preferred extension, B1 only in one
    auto g = build_graph({"T", "B1", "B2", "C"},
                         {{"B1", "T"}, {"B2", "T"}, {"C", "B1"}, {"B1", "C"}});
    RepairResult r = plan_repair(g, "T", credulous_preferred(), config_with(2, 1));
    ASSERT_EQ(r.status, RepairStatus::Planned) << r.reason;
    EXPECT_EQ(r.plan->blockers, (Strings{"B2", "B1"}));
    EXPECT_EQ(r.plan->defenders[0].attacks, (Strings{"B2"}));
    EXPECT_EQ(r.plan->defenders[1].attacks, (Strings{"B1"}));
}

// ============================================================================
// Skeptical goals
// ============================================================================

TEST(RepairPlannerTests, Skeptical_RaisesCoverageToOne)
{
    auto g = build_graph({"A", "B"}, {{"A", "B"}, {"B", "A"}});
    RepairResult r = plan_repair(g, "A", skeptical(SemanticsKind::Preferred, 1.0),
                                 config_with(1, 0));
    ASSERT_EQ(r.status, RepairStatus::Planned) << r.reason;
    EXPECT_EQ(r.before, (Coverage{1, 2}));
    EXPECT_EQ(r.plan->after, (Coverage{1, 1}));
}

TEST(RepairPlannerTests, Skeptical_HalfCoverageAlreadyMet)
{
    auto g = build_graph({"A", "B"}, {{"A", "B"}, {"B", "A"}});
    RepairResult r = plan_repair(g, "A", skeptical(SemanticsKind::Preferred, 0.5),
                                 config_with(1, 0));
    EXPECT_EQ(r.status, RepairStatus::AlreadySatisfied);
}

TEST(RepairPlannerTests, Skeptical_WithoutThresholdThrows)
{
    RepairGoal goal;
    goal.mode = AcceptanceMode::Skeptical;
    EXPECT_THROW(plan_repair(two_blocker_graph(), "A1", goal), AfError);
}

TEST(RepairPlannerTests, VerificationFailureIsNeverSuccess)
{
    // An odd cycle elsewhere leaves no stable extension after any repair
    auto g = build_graph({"T", "B", "C1", "C2", "C3"},
                         {{"B", "T"}, {"C1", "C2"}, {"C2", "C3"}, {"C3", "C1"}});
    RepairGoal goal = skeptical(SemanticsKind::Stable, 1.0);
    for (RepairStrategyKind strategy : {RepairStrategyKind::Greedy, RepairStrategyKind::Exact})
    {
        RepairConfig config = config_with(1, 0);
        config.strategy = strategy;
        RepairResult r = plan_repair(g, "T", goal, config);
        EXPECT_EQ(r.status, RepairStatus::Infeasible) << to_string(strategy);
        EXPECT_EQ(r.reason.rfind("verification failed", 0), 0u) << r.reason;
        EXPECT_FALSE(r.plan.has_value());
    }
}

// ============================================================================
// Exact strategy
// ============================================================================

TEST(ExactRepairTests, CountersOnlyTheBlockersThatMatter)
{
    // B2 is already defeated by the unattacked X
    auto g = build_graph({"T", "B1", "B2", "X"}, {{"B1", "T"}, {"B2", "T"}, {"X", "B2"}});
    RepairConfig config = config_with(1, 1);

    RepairResult greedy = plan_repair(g, "T", credulous_preferred(), config);
    EXPECT_EQ(greedy.status, RepairStatus::Infeasible);

    config.strategy = RepairStrategyKind::Exact;
    RepairResult exact = plan_repair(g, "T", credulous_preferred(), config);
    ASSERT_EQ(exact.status, RepairStatus::Planned) << exact.reason;
    ASSERT_EQ(exact.plan->defenders.size(), 1u);
    EXPECT_EQ(exact.plan->defenders[0].attacks, (Strings{"B1"}));
    EXPECT_EQ(exact.iterations, 1u);
}

TEST(ExactRepairTests, VisitsSubsetsInIncreasingSize)
{
    auto g = build_graph({"T", "B1", "B2"}, {{"B1", "T"}, {"B2", "T"}});
    RepairConfig config = config_with(1, 0);
    config.strategy = RepairStrategyKind::Exact;
    RepairResult r = plan_repair(g, "T", credulous_preferred(), config);
    ASSERT_EQ(r.status, RepairStatus::Planned) << r.reason;
    EXPECT_EQ(r.plan->defenders[0].attacks, (Strings{"B1", "B2"}));
    EXPECT_EQ(r.iterations, 3u);
}

TEST(ExactRepairTests, IterationCapIsSearchExhausted)
{
    auto g = build_graph({"T", "B1", "B2"}, {{"B1", "T"}, {"B2", "T"}});
    RepairConfig config = config_with(1, 0);
    config.strategy = RepairStrategyKind::Exact;
    config.max_iterations = 1;
    RepairResult r = plan_repair(g, "T", credulous_preferred(), config);
    EXPECT_EQ(r.status, RepairStatus::SearchExhausted);
    EXPECT_EQ(r.iterations, 1u);
    EXPECT_FALSE(r.plan.has_value());
}

TEST(ExactRepairTests, ZeroBudgetMatchesGreedyReason)
{
    RepairConfig config = config_with(0, 0);
    config.strategy = RepairStrategyKind::Exact;
    RepairResult r = plan_repair(two_blocker_graph(), "A1", credulous_preferred(), config);
    EXPECT_EQ(r.status, RepairStatus::Infeasible);
    EXPECT_EQ(r.reason, "budget exhausted, 2 blockers require at least 1 group but k=0");
}

TEST(RepairPlannerTests, EngineCapIsSearchExhausted)
{
    auto g = build_graph({"A", "B", "C"}, {{"A", "B"}, {"B", "A"}, {"A", "C"}});
    RepairConfig config = config_with(1, 0);
    config.engine.max_candidates = 1;
    RepairResult r = plan_repair(g, "C", credulous_preferred(), config);
    EXPECT_EQ(r.status, RepairStatus::SearchExhausted);
    EXPECT_FALSE(r.reason.empty());
}

// ============================================================================
// Properties on random graphs
// ============================================================================

TEST(RepairPlannerTests, Random_PlansAreSoundAndAddNodesOnly)
{
    std::mt19937 rng(31337u);
    std::bernoulli_distribution edge(0.25);
    size_t planned = 0;
    for (int trial = 0; trial < 40; ++trial)
    {
        const size_t n = 3 + trial % 6;
        GraphBuilder builder;
        for (size_t i = 0; i < n; ++i)
        {
            builder.add_argument("a" + std::to_string(i));
        }
        for (size_t a = 0; a < n; ++a)
        {
            for (size_t b = 0; b < n; ++b)
            {
                if (a != b && edge(rng))
                {
                    builder.add_attack(a, b);
                }
            }
        }
        auto g = builder.build();
        const std::string target = g->id(trial % n);

        RepairConfig config = config_with(n, trial % 3);
        config.strategy = trial % 2 == 0 ? RepairStrategyKind::Greedy : RepairStrategyKind::Exact;
        RepairResult r = plan_repair(g, target, credulous_preferred(), config);
        ASSERT_TRUE(r.ok()) << r.summary();
        if (r.status != RepairStatus::Planned)
        {
            continue;
        }
        ++planned;

        const ArgumentGraph& after = *r.plan->after_graph;
        EXPECT_EQ(g->argument_count(), n);
        EXPECT_EQ(after.argument_count(), n + r.plan->defenders.size());
        for (const auto& defender : r.plan->defenders)
        {
            ArgIdx d = after.index_of(defender.id);
            EXPECT_GE(d, n);
            EXPECT_TRUE(after.attackers_of(d).empty());
            for (ArgIdx t : after.targets_of(d))
            {
                EXPECT_LT(t, n);
            }
        }
        auto family = compute(r.plan->after_graph, SemanticsKind::Preferred);
        EXPECT_TRUE(query(family, SemanticsKind::Preferred, target, AcceptanceMode::Credulous));
    }
    EXPECT_GT(planned, 0u);
}

// ============================================================================
// Time limit
// ============================================================================

TEST(RepairPlannerTests, TimeLimitBoundsLargeRepair)
{
    // Twelve independent two-cycles, one side of each attacking T
    GraphBuilder builder;
    builder.add_argument("T");
    for (int i = 0; i < 12; ++i)
    {
        const std::string x = "X" + std::to_string(i);
        const std::string y = "Y" + std::to_string(i);
        builder.add_argument(x);
        builder.add_argument(y);
        builder.add_attack(x, y);
        builder.add_attack(y, x);
        builder.add_attack(x, "T");
    }
    auto g = builder.build();

    for (RepairStrategyKind strategy : {RepairStrategyKind::Greedy, RepairStrategyKind::Exact})
    {
        RepairConfig config = config_with(12, 0);
        config.strategy = strategy;
        config.time_limit = std::chrono::milliseconds(50);

        const auto start = std::chrono::steady_clock::now();
        RepairResult r = plan_repair(g, "T", credulous_preferred(), config);
        const auto elapsed = std::chrono::steady_clock::now() - start;

        EXPECT_EQ(r.status, RepairStatus::SearchExhausted) << to_string(strategy);
        EXPECT_FALSE(r.plan.has_value());
        EXPECT_LT(elapsed, std::chrono::seconds(10)) << to_string(strategy);
    }
}

TEST(RepairPlannerTests, SearchExhaustedKeepsBeforeCoverage)
{
    // The cap admits the original conflict-free sets but not the augmented ones
    auto g = build_graph({"T", "B"}, {{"B", "T"}});
    RepairGoal goal;
    goal.kind = SemanticsKind::ConflictFree;
    RepairConfig config = config_with(1, 0);
    config.force = true;
    config.engine.max_candidates = 3;

    RepairResult r = plan_repair(g, "T", goal, config);
    EXPECT_EQ(r.status, RepairStatus::SearchExhausted);
    EXPECT_EQ(r.before, (Coverage{1, 3}));
    EXPECT_NE(r.summary().find("before=1/3"), std::string::npos) << r.summary();
}
