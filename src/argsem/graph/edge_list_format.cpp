#include "argsem/graph/edge_list_format.hpp"
#include "argsem/graph/graph_builder.hpp"

#include <istream>
#include <ostream>
#include <sstream>

namespace argsem
{

namespace
{

const char* const k_args_prefix = "args:";

std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos)
    {
        return std::string();
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

AfError parse_error(size_t line_no, const std::string& detail)
{
    return AfError(AfErrorCode::ParseError,
                   "edge list line " + std::to_string(line_no) + ": " + detail);
}

} // namespace

void write_edge_list(std::ostream& out, const ArgumentGraph& graph)
{
    // '#' would start a comment on read
    for (const auto& id : graph.ids())
    {
        if (id.find('#') != std::string::npos)
        {
            throw AfError(AfErrorCode::InvalidArgumentId,
                          "Argument id '" + id + "' cannot be written as an edge list");
        }
    }
    out << k_args_prefix;
    for (const auto& id : graph.ids())
    {
        out << ' ' << id;
    }
    out << '\n';
    for (const Attack& attack : graph.attacks())
    {
        out << graph.id(attack.attacker) << ',' << graph.id(attack.target) << '\n';
    }
}

std::string to_edge_list(const ArgumentGraph& graph)
{
    std::ostringstream oss;
    write_edge_list(oss, graph);
    return oss.str();
}

GraphPtr read_edge_list(std::istream& in)
{
    GraphBuilder builder;
    std::vector<std::pair<AttackIdPair, size_t>> pending_attacks;

    std::string raw;
    size_t line_no = 0;
    while (std::getline(in, raw))
    {
        ++line_no;
        std::string line = raw;
        size_t hash = line.find('#');
        if (hash != std::string::npos)
        {
            line.erase(hash);
        }
        line = trim(line);
        if (line.empty())
        {
            continue;
        }

        size_t comma = line.find(',');
        if (comma != std::string::npos)
        {
            if (line.find(',', comma + 1) != std::string::npos)
            {
                throw parse_error(line_no, "expected 'attacker,target', got '" + line + "'");
            }
            std::string attacker = trim(line.substr(0, comma));
            std::string target = trim(line.substr(comma + 1));
            if (attacker.empty() || target.empty())
            {
                throw parse_error(line_no, "attack is missing an endpoint: '" + line + "'");
            }
            pending_attacks.emplace_back(AttackIdPair{attacker, target}, line_no);
            continue;
        }

        if (line.compare(0, std::char_traits<char>::length(k_args_prefix), k_args_prefix) != 0)
        {
            throw parse_error(line_no, "expected 'args:' declaration or attack, got '" + line + "'");
        }
        std::istringstream ids(line.substr(std::char_traits<char>::length(k_args_prefix)));
        std::string id;
        while (ids >> id)
        {
            builder.add_argument(id);
        }
    }

    for (const auto& [pair, attack_line] : pending_attacks)
    {
        if (!builder.has_argument(pair.first) || !builder.has_argument(pair.second))
        {
            throw AfError(
                AfErrorCode::UnknownArgumentInAttack,
                "edge list line " + std::to_string(attack_line) + ": attack " + pair.first +
                    " -> " + pair.second + " references an undeclared argument");
        }
        builder.add_attack(pair.first, pair.second);
    }
    return builder.build();
}

GraphPtr parse_edge_list(const std::string& text)
{
    std::istringstream iss(text);
    return read_edge_list(iss);
}

} // namespace argsem
