/**
 * @file apx_format.hpp
 * @brief APX fact-format serialization of argument graphs.
 */
#pragma once
#include "argsem/common/common.hpp"
#include "argsem/graph/argument_graph.hpp"

#include <iosfwd>

namespace argsem
{

/**
 * @brief Write a graph as APX facts: `arg(a).` and `att(a,b).`, one per line.
 * @throw AfError with `InvalidArgumentId` if an id contains one of `(),.%`,
 *        which cannot be represented in APX.
 */
void write_apx(std::ostream& out, const ArgumentGraph& graph);

std::string to_apx(const ArgumentGraph& graph);

/**
 * @brief Read APX facts.
 *
 * @details
 * `%` starts a comment running to the end of the line. Statements end with
 * '.'; whitespace is free. Arguments named only inside `att(...)` are
 * declared implicitly, after the explicitly declared ones, in order of first
 * appearance. Repeated `arg(...)` facts for the same id are merged.
 *
 * @throw AfError with `ParseError` (with line number) for anything that is
 *        not an `arg` or `att` fact.
 */
GraphPtr read_apx(std::istream& in);

GraphPtr parse_apx(const std::string& text);

} // namespace argsem
