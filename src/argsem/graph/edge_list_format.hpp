/**
 * @file edge_list_format.hpp
 * @brief Line-based text serialization of argument graphs.
 */
#pragma once
#include "argsem/common/common.hpp"
#include "argsem/graph/argument_graph.hpp"

#include <iosfwd>

namespace argsem
{

/**
 * @brief Write a graph in the edge-list format.
 *
 * @details
 * The format has one record per line:
 * - `args: A1 A2 A3` declares arguments (whitespace separated; may repeat);
 * - `A2,A1` declares an attack from `A2` to `A1`;
 * - `#` starts a comment; blank lines are ignored.
 *
 * The writer emits a single `args:` line with the arguments in index order,
 * followed by the attacks sorted by (attacker, target) index. Provenance is
 * not part of the format; edges read back are `Explicit`.
 *
 * @throw AfError with `InvalidArgumentId` if an id contains `#`.
 */
void write_edge_list(std::ostream& out, const ArgumentGraph& graph);

/**
 * @brief Serialize a graph to an edge-list string.
 */
std::string to_edge_list(const ArgumentGraph& graph);

/**
 * @brief Read a graph in the edge-list format.
 *
 * @details
 * A line containing ',' is an attack; otherwise it must start with `args:`.
 * Attacks may appear before the declaration of their arguments as long as the
 * arguments are declared somewhere in the input.
 *
 * @throw AfError with `ParseError` (with line number) for malformed lines,
 *        `DuplicateArgument` for repeated declarations, or
 *        `UnknownArgumentInAttack` for attacks on undeclared arguments.
 */
GraphPtr read_edge_list(std::istream& in);

/**
 * @brief Parse a graph from an edge-list string.
 */
GraphPtr parse_edge_list(const std::string& text);

} // namespace argsem
