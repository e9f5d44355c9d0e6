#include "argsem/common/errors.hpp"
#include "argsem/common/logging.hpp"
#include "argsem/graph/apx_format.hpp"
#include "argsem/graph/edge_list_format.hpp"
#include "argsem/query/acceptance_query.hpp"
#include "argsem/repair/repair_planner.hpp"
#include "argsem/semantics/semantics_engine.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace
{

const char* const k_usage =
    "usage: argsem_cli <file> [--format edges|apx] [--sem KIND|all] [--target ID]\n"
    "                  [--mode credulous|skeptical] [--repair] [--k N] [--fanout N]\n"
    "                  [--force] [--min-coverage X] [--exact] [--threads N] [-v]\n";

struct CliOptions
{
    std::string path;
    std::string format{"edges"};
    std::string selection{"all"};
    std::string target;
    argsem::AcceptanceMode mode{argsem::AcceptanceMode::Credulous};
    bool repair{false};
    bool verbose{false};
    std::optional<double> min_coverage;
    argsem::RepairConfig repair_config;
};

size_t parse_count(const std::string& flag, const std::string& value)
{
    size_t pos = 0;
    unsigned long long parsed = 0;
    try
    {
        parsed = std::stoull(value, &pos);
    }
    catch (const std::logic_error&)
    {
        pos = 0;
    }
    if (pos == 0 || pos != value.size() || value[0] == '-')
    {
        throw argsem::AfError(argsem::AfErrorCode::InvalidRequest,
                              flag + " expects a non-negative integer, got '" + value + "'");
    }
    return static_cast<size_t>(parsed);
}

double parse_ratio(const std::string& flag, const std::string& value)
{
    size_t pos = 0;
    double parsed = 0.0;
    try
    {
        parsed = std::stod(value, &pos);
    }
    catch (const std::logic_error&)
    {
        pos = 0;
    }
    if (pos == 0 || pos != value.size())
    {
        throw argsem::AfError(argsem::AfErrorCode::InvalidRequest,
                              flag + " expects a number, got '" + value + "'");
    }
    return parsed;
}

CliOptions parse_args(int argc, char** argv)
{
    CliOptions options;
    auto value_of = [&](int& i) -> std::string {
        if (i + 1 >= argc)
        {
            throw argsem::AfError(argsem::AfErrorCode::InvalidRequest,
                                  std::string(argv[i]) + " expects a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--format")
        {
            options.format = value_of(i);
            if (options.format != "edges" && options.format != "apx")
            {
                throw argsem::AfError(argsem::AfErrorCode::InvalidRequest,
                                      "--format must be 'edges' or 'apx'");
            }
        }
        else if (arg == "--sem")
        {
            options.selection = value_of(i);
        }
        else if (arg == "--target")
        {
            options.target = value_of(i);
        }
        else if (arg == "--mode")
        {
            options.mode = argsem::parse_acceptance_mode(value_of(i));
        }
        else if (arg == "--repair")
        {
            options.repair = true;
        }
        else if (arg == "--k")
        {
            options.repair_config.k = parse_count(arg, value_of(i));
        }
        else if (arg == "--fanout")
        {
            options.repair_config.fanout = parse_count(arg, value_of(i));
        }
        else if (arg == "--force")
        {
            options.repair_config.force = true;
        }
        else if (arg == "--min-coverage")
        {
            options.min_coverage = parse_ratio(arg, value_of(i));
        }
        else if (arg == "--exact")
        {
            options.repair_config.strategy = argsem::RepairStrategyKind::Exact;
        }
        else if (arg == "--threads")
        {
            options.repair_config.engine.thread_count = parse_count(arg, value_of(i));
        }
        else if (arg == "-v")
        {
            options.verbose = true;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            throw argsem::AfError(argsem::AfErrorCode::InvalidRequest, "Unknown option " + arg);
        }
        else if (options.path.empty())
        {
            options.path = arg;
        }
        else
        {
            throw argsem::AfError(argsem::AfErrorCode::InvalidRequest,
                                  "Unexpected argument " + arg);
        }
    }
    if (options.path.empty())
    {
        throw argsem::AfError(argsem::AfErrorCode::InvalidRequest, "No input file given");
    }
    if (options.repair && options.target.empty())
    {
        throw argsem::AfError(argsem::AfErrorCode::InvalidRequest, "--repair requires --target");
    }
    return options;
}

void configure_logging(bool verbose)
{
    if (verbose)
    {
        argsem::set_log_level(spdlog::level::debug);
        return;
    }
    if (const char* env = std::getenv("ARGSEM_LOG_LEVEL"))
    {
        argsem::set_log_level(spdlog::level::from_str(env));
    }
}

void print_ids(std::ostream& out, const std::vector<std::string>& ids)
{
    out << '{';
    for (size_t i = 0; i < ids.size(); ++i)
    {
        out << (i == 0 ? "" : ", ") << ids[i];
    }
    out << '}';
}

void print_extensions(const argsem::ExtensionFamily& family,
                      const std::vector<argsem::SemanticsKind>& kinds)
{
    for (argsem::SemanticsKind kind : kinds)
    {
        const auto& extensions = family.at(kind);
        std::cout << argsem::to_string(kind) << " (" << extensions.size() << "):";
        for (const auto& ext : extensions)
        {
            std::cout << ' ';
            print_ids(std::cout, ext.ids());
        }
        std::cout << "\n";
    }
}

void print_insights(const argsem::Insights& info)
{
    std::cout << "insights for " << info.target << ":\n";
    std::cout << "  in grounded: " << (info.in_grounded ? "yes" : "no");
    if (info.target_depth)
    {
        std::cout << " (depth " << *info.target_depth << ")";
    }
    std::cout << "\n  preferred extensions: " << info.preferred_count;
    std::cout << "\n  grounded roadblocks: ";
    print_ids(std::cout, info.grounded_roadblocks);
    std::cout << "\n  persistent attackers: ";
    print_ids(std::cout, info.persistent_attackers);
    std::cout << "\n  soft attackers: ";
    print_ids(std::cout, info.soft_attackers);
    std::cout << "\n  attacker frequencies:";
    for (const auto& entry : info.attacker_frequencies)
    {
        std::cout << ' ' << entry.first << '=' << entry.second;
    }
    std::cout << "\n";
}

void print_repair(const argsem::RepairResult& result)
{
    std::cout << "repair: " << argsem::to_string(result.status) << "\n";
    std::cout << "  reason: " << result.reason << "\n";
    std::cout << "  before: " << result.before.to_string() << "\n";
    if (!result.plan)
    {
        return;
    }
    std::cout << "  after: " << result.plan->after.to_string() << "\n";
    for (const auto& defender : result.plan->defenders)
    {
        std::cout << "  " << defender.id << " attacks ";
        print_ids(std::cout, defender.attacks);
        std::cout << "\n";
    }
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        CliOptions options = parse_args(argc, argv);
        configure_logging(options.verbose);

        std::ifstream in(options.path);
        if (!in)
        {
            throw std::runtime_error("Cannot open " + options.path);
        }
        argsem::GraphPtr graph =
            options.format == "apx" ? argsem::read_apx(in) : argsem::read_edge_list(in);
        std::cout << "arguments: " << graph->argument_count()
                  << ", attacks: " << graph->attack_count() << "\n";

        std::vector<argsem::SemanticsKind> shown = argsem::parse_semantics_selection(options.selection);
        std::vector<argsem::SemanticsKind> kinds = shown;
        if (!options.target.empty())
        {
            for (auto kind : {argsem::SemanticsKind::Grounded, argsem::SemanticsKind::Preferred})
            {
                if (std::find(kinds.begin(), kinds.end(), kind) == kinds.end())
                {
                    kinds.push_back(kind);
                }
            }
        }

        argsem::SemanticsEngine engine(graph, options.repair_config.engine);
        argsem::ExtensionFamily family = engine.compute(kinds);
        print_extensions(family, shown);

        if (!options.target.empty())
        {
            for (argsem::SemanticsKind kind : shown)
            {
                bool accepted = argsem::query(family, kind, options.target, options.mode);
                std::cout << argsem::to_string(options.mode) << ' ' << argsem::to_string(kind)
                          << ": " << (accepted ? "accepted" : "not accepted") << " ("
                          << argsem::coverage(family, kind, options.target).to_string() << ")\n";
            }
            print_insights(argsem::insights(*graph, family, options.target));
        }

        if (options.repair)
        {
            argsem::RepairGoal goal;
            goal.kind = shown.size() == 1 ? shown.front() : argsem::SemanticsKind::Preferred;
            goal.mode = options.mode;
            goal.min_coverage = options.min_coverage;
            print_repair(argsem::plan_repair(graph, options.target, goal, options.repair_config));
        }
    }
    catch (const argsem::AfError& e)
    {
        std::cerr << "Error [" << argsem::to_string(e.code()) << "]: " << e.what() << "\n"
                  << k_usage << std::flush;
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
