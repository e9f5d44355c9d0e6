/**
 * @file acceptance_query_tests.cpp
 * Unit tests for acceptance queries and insights
 */
#include <gtest/gtest.h>
#include "argsem/graph/graph_builder.hpp"
#include "argsem/query/acceptance_query.hpp"
#include "argsem/semantics/semantics_engine.hpp"

#include <string>
#include <vector>

using namespace argsem;

namespace
{

using Strings = std::vector<std::string>;

/// B1 -> T, B2 -> T, and an even cycle between B2 and C.
GraphPtr blocked_target_graph()
{
    return build_graph({"T", "B1", "B2", "C"},
                       {{"B1", "T"}, {"B2", "T"}, {"C", "B2"}, {"B2", "C"}});
}

} // namespace

// ============================================================================
// Coverage
// ============================================================================

TEST(CoverageTests, Ratio_EmptyFamilyIsZero)
{
    Coverage c;
    EXPECT_DOUBLE_EQ(c.ratio(), 0.0);
    EXPECT_EQ(c.to_string(), "0/0");
}

TEST(CoverageTests, Ratio_PartialCoverage)
{
    Coverage c{1, 4};
    EXPECT_DOUBLE_EQ(c.ratio(), 0.25);
    EXPECT_EQ(c.to_string(), "1/4");
    EXPECT_EQ(c, (Coverage{1, 4}));
    EXPECT_NE(c, (Coverage{2, 4}));
}

// ============================================================================
// Query
// ============================================================================

TEST(AcceptanceQueryTests, Query_CredulousAndSkeptical)
{
    auto g = blocked_target_graph();
    auto family = compute(g, "all");

    EXPECT_FALSE(query(family, SemanticsKind::Preferred, "T", AcceptanceMode::Credulous));
    EXPECT_TRUE(query(family, SemanticsKind::Preferred, "C", AcceptanceMode::Credulous));
    EXPECT_FALSE(query(family, SemanticsKind::Preferred, "C", AcceptanceMode::Skeptical));
    EXPECT_TRUE(query(family, SemanticsKind::Preferred, "B1", AcceptanceMode::Skeptical));
    EXPECT_TRUE(query(family, SemanticsKind::Grounded, "B1", AcceptanceMode::Skeptical));

    EXPECT_EQ(coverage(family, SemanticsKind::Preferred, "C"), (Coverage{1, 2}));
    EXPECT_EQ(coverage(family, SemanticsKind::Preferred, "T"), (Coverage{0, 2}));
}

TEST(AcceptanceQueryTests, Query_SkepticalFalseOnEmptyFamily)
{
    auto g = build_graph({"A1", "A2", "A3"}, {{"A1", "A2"}, {"A2", "A3"}, {"A3", "A1"}});
    auto family = compute(g, SemanticsKind::Stable);
    ASSERT_TRUE(family.at(SemanticsKind::Stable).empty());
    EXPECT_FALSE(query(family, SemanticsKind::Stable, "A1", AcceptanceMode::Skeptical));
    EXPECT_FALSE(query(family, SemanticsKind::Stable, "A1", AcceptanceMode::Credulous));
}

TEST(AcceptanceQueryTests, Query_UnknownTargetThrows)
{
    auto family = compute(blocked_target_graph(), SemanticsKind::Preferred);
    try
    {
        query(family, SemanticsKind::Preferred, "Z", AcceptanceMode::Credulous);
        FAIL() << "Expected AfError";
    }
    catch (const AfError& e)
    {
        EXPECT_EQ(e.code(), AfErrorCode::UnknownArgument);
    }
}

TEST(AcceptanceQueryTests, Query_UncomputedKindThrows)
{
    auto family = compute(blocked_target_graph(), SemanticsKind::Preferred);
    try
    {
        query(family, SemanticsKind::Stage, "T", AcceptanceMode::Credulous);
        FAIL() << "Expected AfError";
    }
    catch (const AfError& e)
    {
        EXPECT_EQ(e.code(), AfErrorCode::InvalidRequest);
    }
}

TEST(AcceptanceQueryTests, Query_ParseMode)
{
    EXPECT_EQ(parse_acceptance_mode("Skeptical"), AcceptanceMode::Skeptical);
    EXPECT_EQ(parse_acceptance_mode("credulous"), AcceptanceMode::Credulous);
    EXPECT_THROW(parse_acceptance_mode("sceptical-ish"), AfError);
}

// ============================================================================
// Insights
// ============================================================================

TEST(InsightsTests, BlockedTarget)
{
    auto g = blocked_target_graph();
    auto family = compute(g, "all");
    Insights info = insights(*g, family, "T");

    EXPECT_EQ(info.target, "T");
    EXPECT_FALSE(info.in_grounded);
    EXPECT_FALSE(info.target_depth.has_value());
    EXPECT_EQ(info.preferred_count, 2u);
    EXPECT_EQ(info.grounded_roadblocks, (Strings{"B1", "B2"}));
    EXPECT_EQ(info.persistent_attackers, (Strings{"B1"}));
    EXPECT_EQ(info.soft_attackers, (Strings{"B2"}));
    ASSERT_EQ(info.attacker_frequencies.size(), 2u);
    EXPECT_EQ(info.attacker_frequencies[0], (std::pair<std::string, size_t>{"B1", 2}));
    EXPECT_EQ(info.attacker_frequencies[1], (std::pair<std::string, size_t>{"B2", 1}));
}

TEST(InsightsTests, GroundedTargetHasNoRoadblocks)
{
    auto g = build_graph({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}});
    auto family = compute(g, "all");
    Insights info = insights(*g, family, "c");
    EXPECT_TRUE(info.in_grounded);
    EXPECT_EQ(info.target_depth, std::optional<size_t>(2));
    EXPECT_TRUE(info.grounded_roadblocks.empty());
    // b is in no preferred extension
    EXPECT_TRUE(info.persistent_attackers.empty());
    EXPECT_TRUE(info.soft_attackers.empty());
    ASSERT_EQ(info.attacker_frequencies.size(), 1u);
    EXPECT_EQ(info.attacker_frequencies[0].second, 0u);
}

TEST(InsightsTests, RoadblocksSkipCounteredAttackers)
{
    // g -> x -> t and y -> t: x is countered by the grounded g, y is not
    auto g = build_graph({"t", "x", "y", "g"}, {{"x", "t"}, {"y", "t"}, {"g", "x"}});
    auto family = compute(g, "all");
    EXPECT_EQ(insights(*g, family, "t").grounded_roadblocks, (Strings{"y"}));
}

TEST(InsightsTests, RequiresGroundedAndPreferred)
{
    auto g = blocked_target_graph();
    auto family = compute(g, SemanticsKind::Preferred);
    EXPECT_THROW(insights(*g, family, "T"), AfError);
}

TEST(InsightsTests, RejectsFamilyOfAnotherGraph)
{
    auto g = blocked_target_graph();
    auto other = blocked_target_graph();
    auto family = compute(other, "all");
    try
    {
        insights(*g, family, "T");
        FAIL() << "Expected AfError";
    }
    catch (const AfError& e)
    {
        EXPECT_EQ(e.code(), AfErrorCode::InvalidRequest);
    }
}
