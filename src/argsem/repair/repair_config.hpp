/**
 * @file repair_config.hpp
 * @brief Repair goals and planner configuration.
 */
#pragma once
#include "argsem/common/common.hpp"
#include "argsem/query/acceptance_query.hpp"
#include "argsem/semantics/engine_config.hpp"
#include "argsem/semantics/semantics_kind.hpp"

namespace argsem
{

/**
 * @brief What the repair must achieve for the target.
 *
 * @details
 * - Credulous: the target must belong to at least one extension of `kind`.
 *   If `min_coverage` is set, the fraction of extensions containing the
 *   target must also reach it.
 * - Skeptical: the fraction of extensions of `kind` containing the target
 *   must reach `min_coverage`, which is required (use 1.0 for "every
 *   extension"). An empty family never satisfies a skeptical goal.
 */
struct RepairGoal
{
    SemanticsKind kind{SemanticsKind::Preferred};
    AcceptanceMode mode{AcceptanceMode::Credulous};
    std::optional<double> min_coverage;
};

/**
 * @brief Check that a goal is well formed.
 * @throw AfError with `InvalidRequest` if `min_coverage` is outside (0, 1] or a
 *        skeptical goal has no `min_coverage`.
 */
void validate_goal(const RepairGoal& goal);

/**
 * @brief True if `coverage` satisfies `goal`.
 */
bool goal_met(const RepairGoal& goal, const Coverage& coverage) noexcept;

/**
 * @brief Human-readable form of a goal, e.g. `credulous preferred`.
 */
std::string describe(const RepairGoal& goal);

/**
 * @brief The search strategy behind `plan_repair()`.
 */
enum class RepairStrategyKind
{
    /// Group blockers by fanout and verify once.
    Greedy,
    /// Search blocker subsets in increasing cost order until one verifies.
    Exact
};

const char* to_string(RepairStrategyKind kind) noexcept;

/**
 * @brief Configuration for repair planning.
 */
struct RepairConfig
{
    /**
     * @brief Node budget: maximum number of new defender arguments.
     */
    size_t k{1};

    /**
     * @brief Maximum number of blockers one defender attacks.
     * @details 0 means unlimited (one defender may attack all blockers).
     *          1 means one defender per blocker.
     */
    size_t fanout{0};

    /**
     * @brief Plan even if the goal is already satisfied.
     */
    bool force{false};

    RepairStrategyKind strategy{RepairStrategyKind::Greedy};

    /**
     * @brief Maximum number of candidate verifications. 0 means unlimited.
     */
    size_t max_iterations{10000};

    /**
     * @brief Wall-clock limit for the whole request. Zero means unlimited.
     * @details Applied as `EngineConfig::deadline` to every engine run, so
     *          analysis and verification stop too, not just the search loop.
     */
    std::chrono::milliseconds time_limit{0};

    /**
     * @brief Prefix of generated defender ids (`R1`, `R2`, ...).
     */
    std::string defender_prefix{"R"};

    /**
     * @brief Engine configuration used for the before and after analysis.
     */
    EngineConfig engine{};
};

} // namespace argsem
