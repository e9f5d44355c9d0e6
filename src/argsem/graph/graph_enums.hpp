/**
 * @file graph_enums.hpp
 */
#pragma once
#include "argsem/common/common.hpp"
#include "argsem/common/arg_set.hpp"

namespace argsem
{

/**
 * @brief Where an attack edge came from.
 *
 * @details
 * Attack edges are produced upstream, either stated explicitly by the author
 * of the arguments, inferred by a token-overlap heuristic, or proposed by an
 * external component such as a language model. The tag is kept with the edge
 * so callers can audit it.
 *
 * @par Semantics
 * The semantics engine treats every edge identically regardless of its
 * provenance. Repair planning adds `Explicit` edges only.
 */
enum class EdgeProvenance
{
    Explicit,
    Heuristic,
    External
};

inline const char* to_string(EdgeProvenance provenance) noexcept
{
    switch (provenance)
    {
        case EdgeProvenance::Explicit: return "explicit";
        case EdgeProvenance::Heuristic: return "heuristic";
        case EdgeProvenance::External: return "external";
    }
    return "unknown";
}

/**
 * @brief A directed attack edge, as (attacker, target).
 */
struct Attack
{
    ArgIdx attacker;
    ArgIdx target;
    EdgeProvenance provenance{EdgeProvenance::Explicit};
};

/**
 * @brief An attack edge expressed by argument ids, as (attacker, target).
 */
using AttackIdPair = std::pair<std::string, std::string>;

} // namespace argsem
