#include "argsem/repair/repair_config.hpp"
#include "argsem/common/errors.hpp"

#include <sstream>

namespace argsem
{

void validate_goal(const RepairGoal& goal)
{
    if (goal.min_coverage)
    {
        double c = *goal.min_coverage;
        if (!(c > 0.0 && c <= 1.0))
        {
            throw AfError(AfErrorCode::InvalidRequest,
                          "min_coverage must be in (0, 1], got " + std::to_string(c));
        }
    }
    else if (goal.mode == AcceptanceMode::Skeptical)
    {
        throw AfError(AfErrorCode::InvalidRequest,
                      "A skeptical repair goal requires an explicit min_coverage");
    }
}

bool goal_met(const RepairGoal& goal, const Coverage& coverage) noexcept
{
    switch (goal.mode)
    {
        case AcceptanceMode::Credulous:
            if (coverage.containing == 0)
            {
                return false;
            }
            return !goal.min_coverage || coverage.ratio() >= *goal.min_coverage;
        case AcceptanceMode::Skeptical:
            if (coverage.total == 0 || !goal.min_coverage)
            {
                return false;
            }
            return coverage.ratio() >= *goal.min_coverage;
    }
    return false;
}

std::string describe(const RepairGoal& goal)
{
    std::ostringstream oss;
    oss << to_string(goal.mode) << ' ' << to_string(goal.kind);
    if (goal.min_coverage)
    {
        oss << " (min coverage " << *goal.min_coverage << ')';
    }
    return oss.str();
}

const char* to_string(RepairStrategyKind kind) noexcept
{
    switch (kind)
    {
        case RepairStrategyKind::Greedy: return "greedy";
        case RepairStrategyKind::Exact: return "exact";
    }
    return "unknown";
}

} // namespace argsem
