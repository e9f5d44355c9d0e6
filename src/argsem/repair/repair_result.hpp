/**
 * @file repair_result.hpp
 * @brief Definition of RepairPlan and RepairResult returned by plan_repair().
 */
#pragma once
#include "argsem/common/common.hpp"
#include "argsem/graph/argument_graph.hpp"
#include "argsem/query/acceptance_query.hpp"
#include "argsem/repair/repair_config.hpp"

#include <map>

namespace argsem
{

/**
 * @brief A new, unattacked argument added to rescue the target.
 */
struct Defender
{
    std::string id;

    /**
     * @brief Ids of the existing blockers this defender attacks.
     */
    std::vector<std::string> attacks;
};

/**
 * @brief An add-nodes-only edit plan with its before and after state.
 *
 * @details
 * The plan never edits existing edges. Each defender attacks only existing
 * arguments and is attacked by nothing, so defenders act as unconditional
 * counter-attackers of the target's blockers.
 */
struct RepairPlan
{
    std::string target;
    RepairGoal goal;

    /**
     * @brief Direct attackers of the target, most persistent first.
     */
    std::vector<std::string> blockers;

    /**
     * @brief New defenders, in id order. Empty for a no-op plan.
     */
    std::vector<Defender> defenders;

    GraphPtr before_graph;

    /**
     * @brief Original graph plus defenders and their edges.
     * @details Same instance as `before_graph` for a no-op plan.
     */
    GraphPtr after_graph;

    Coverage before;
    Coverage after;

    bool empty() const noexcept
    {
        return defenders.empty();
    }

    /**
     * @brief Defender id to attacked blocker ids.
     */
    std::map<std::string, std::vector<std::string>> edge_map() const
    {
        std::map<std::string, std::vector<std::string>> result;
        for (const auto& d : defenders)
        {
            result[d.id] = d.attacks;
        }
        return result;
    }

    /**
     * @brief All new attack edges as (defender, blocker) pairs.
     */
    std::vector<AttackIdPair> new_attacks() const
    {
        std::vector<AttackIdPair> result;
        for (const auto& d : defenders)
        {
            for (const auto& b : d.attacks)
            {
                result.emplace_back(d.id, b);
            }
        }
        return result;
    }
};

/**
 * @brief Outcome category of a repair request.
 */
enum class RepairStatus
{
    /// A non-empty plan was found and verified.
    Planned,
    /// The goal already holds; the plan is empty.
    AlreadySatisfied,
    /// No plan exists under the given budget, or the target cannot be defended.
    Infeasible,
    /// An iteration or time cap was hit before a definitive answer.
    SearchExhausted
};

const char* to_string(RepairStatus status) noexcept;

/**
 * @brief Result of a repair request.
 *
 * @details
 * `Infeasible` and `SearchExhausted` are normal outcomes, not errors; `reason`
 * always says why. `plan` is present exactly for `Planned` and
 * `AlreadySatisfied`.
 */
struct RepairResult
{
    RepairStatus status{RepairStatus::Infeasible};
    std::string reason;
    std::optional<RepairPlan> plan;

    /**
     * @brief Coverage of the target before any change, for every outcome.
     */
    Coverage before;

    /**
     * @brief Number of candidate plans verified.
     */
    size_t iterations{0};

    bool ok() const noexcept
    {
        return status == RepairStatus::Planned || status == RepairStatus::AlreadySatisfied;
    }

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::string result = std::string("Repair ") + to_string(status) + ": " + reason;
        result += " (before=" + before.to_string();
        if (plan)
        {
            result += ", after=" + plan->after.to_string();
            result += ", defenders=" + std::to_string(plan->defenders.size());
        }
        result += ", iterations=" + std::to_string(iterations) + ")";
        return result;
    }
};

} // namespace argsem
