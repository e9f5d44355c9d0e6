/**
 * @file semantics_kind.hpp
 */
#pragma once
#include "argsem/common/common.hpp"

namespace argsem
{

/**
 * @brief The acceptance criteria computed by the semantics engine.
 *
 * @details
 * The enumeration is closed. Each kind has a precise membership test; the
 * maximality-based kinds (preferred, stage, semi-stable) additionally keep
 * only the maximal members of their base family.
 */
enum class SemanticsKind
{
    ConflictFree,
    Admissible,
    Complete,
    Grounded,
    Preferred,
    Stable,
    Stage,
    SemiStable
};

/**
 * @brief Every kind, in declaration order.
 */
const std::vector<SemanticsKind>& all_semantics_kinds();

/**
 * @brief Canonical text name, e.g. `semi-stable`.
 */
const char* to_string(SemanticsKind kind) noexcept;

/**
 * @brief Parse a kind name.
 *
 * @details
 * Accepts the canonical names (`conflict-free`, `admissible`, `complete`,
 * `grounded`, `preferred`, `stable`, `stage`, `semi-stable`) and the alias
 * `semistable`, case-insensitively.
 *
 * @throw AfError with `InvalidSemanticsKind` for anything else.
 */
SemanticsKind parse_semantics_kind(const std::string& name);

/**
 * @brief Parse a selection: a kind name, or `all` for every kind.
 * @throw AfError with `InvalidSemanticsKind` for unknown names.
 */
std::vector<SemanticsKind> parse_semantics_selection(const std::string& name);

/**
 * @brief Acceptance mode of a membership question.
 */
enum class AcceptanceMode
{
    Credulous,
    Skeptical
};

const char* to_string(AcceptanceMode mode) noexcept;

/**
 * @throw AfError with `InvalidRequest` for anything but `credulous` or `skeptical`.
 */
AcceptanceMode parse_acceptance_mode(const std::string& name);

} // namespace argsem
