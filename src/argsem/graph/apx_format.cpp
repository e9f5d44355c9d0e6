#include "argsem/graph/apx_format.hpp"
#include "argsem/graph/graph_builder.hpp"

#include <cctype>
#include <istream>
#include <iterator>
#include <ostream>
#include <sstream>

namespace argsem
{

namespace
{

bool is_apx_safe(const std::string& id)
{
    return id.find_first_of("(),.%") == std::string::npos;
}

/// One '.'-terminated statement with the line it started on.
struct Statement
{
    std::string text;
    size_t line_no;
};

std::vector<Statement> split_statements(const std::string& input)
{
    std::vector<Statement> result;
    std::string current;
    size_t line_no = 1;
    size_t start_line = 1;
    bool in_comment = false;
    for (char c : input)
    {
        if (c == '\n')
        {
            ++line_no;
            in_comment = false;
            current.push_back(' ');
            continue;
        }
        if (in_comment)
        {
            continue;
        }
        if (c == '%')
        {
            in_comment = true;
            continue;
        }
        if (c == '.')
        {
            result.push_back(Statement{current, start_line});
            current.clear();
            start_line = line_no;
            continue;
        }
        if (current.find_first_not_of(" \t\r") == std::string::npos &&
            !std::isspace(static_cast<unsigned char>(c)))
        {
            start_line = line_no;
        }
        current.push_back(c);
    }
    if (current.find_first_not_of(" \t\r") != std::string::npos)
    {
        throw AfError(AfErrorCode::ParseError,
                      "apx line " + std::to_string(start_line) +
                          ": statement is not terminated by '.'");
    }
    return result;
}

std::string strip_spaces(const std::string& s)
{
    std::string out;
    for (char c : s)
    {
        if (!std::isspace(static_cast<unsigned char>(c)))
        {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace

void write_apx(std::ostream& out, const ArgumentGraph& graph)
{
    for (const auto& id : graph.ids())
    {
        if (!is_apx_safe(id))
        {
            throw AfError(AfErrorCode::InvalidArgumentId,
                          "Argument id '" + id + "' cannot be written as APX");
        }
    }
    for (const auto& id : graph.ids())
    {
        out << "arg(" << id << ").\n";
    }
    for (const Attack& attack : graph.attacks())
    {
        out << "att(" << graph.id(attack.attacker) << ',' << graph.id(attack.target) << ").\n";
    }
}

std::string to_apx(const ArgumentGraph& graph)
{
    std::ostringstream oss;
    write_apx(oss, graph);
    return oss.str();
}

GraphPtr read_apx(std::istream& in)
{
    std::string input((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    std::vector<std::string> declared;
    std::vector<std::string> implicit;
    std::vector<AttackIdPair> attacks;

    for (const Statement& stmt : split_statements(input))
    {
        std::string body = strip_spaces(stmt.text);
        if (body.empty())
        {
            continue;
        }
        auto fail = [&stmt](const std::string& detail) {
            return AfError(AfErrorCode::ParseError,
                           "apx line " + std::to_string(stmt.line_no) + ": " + detail);
        };
        size_t open = body.find('(');
        if (open == std::string::npos || body.back() != ')')
        {
            throw fail("expected arg(x) or att(x,y), got '" + body + "'");
        }
        std::string head = body.substr(0, open);
        std::string inner = body.substr(open + 1, body.size() - open - 2);
        if (head == "arg")
        {
            if (inner.empty() || inner.find_first_of("(),") != std::string::npos)
            {
                throw fail("malformed argument '" + inner + "'");
            }
            declared.push_back(inner);
        }
        else if (head == "att")
        {
            size_t comma = inner.find(',');
            if (comma == std::string::npos || inner.find(',', comma + 1) != std::string::npos)
            {
                throw fail("malformed attack '" + inner + "'");
            }
            std::string attacker = inner.substr(0, comma);
            std::string target = inner.substr(comma + 1);
            if (attacker.empty() || target.empty() ||
                attacker.find_first_of("()") != std::string::npos ||
                target.find_first_of("()") != std::string::npos)
            {
                throw fail("malformed attack '" + inner + "'");
            }
            attacks.emplace_back(attacker, target);
            implicit.push_back(attacker);
            implicit.push_back(target);
        }
        else
        {
            throw fail("unknown fact '" + head + "'");
        }
    }

    GraphBuilder builder;
    for (const auto& id : declared)
    {
        if (!builder.has_argument(id))
        {
            builder.add_argument(id);
        }
    }
    for (const auto& id : implicit)
    {
        if (!builder.has_argument(id))
        {
            builder.add_argument(id);
        }
    }
    for (const auto& [attacker, target] : attacks)
    {
        builder.add_attack(attacker, target);
    }
    return builder.build();
}

GraphPtr parse_apx(const std::string& text)
{
    std::istringstream iss(text);
    return read_apx(iss);
}

} // namespace argsem
