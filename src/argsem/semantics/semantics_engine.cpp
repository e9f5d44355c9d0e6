/**
 * @file semantics_engine.cpp
 */
#include "argsem/semantics/semantics_engine.hpp"
#include "argsem/common/errors.hpp"
#include "argsem/common/logging.hpp"
#include "argsem/semantics/subset_enumerator.hpp"

#include <numeric>

namespace argsem
{

// ============================================================================
// Constructor
// ============================================================================

SemanticsEngine::SemanticsEngine(GraphPtr graph, EngineConfig config)
    : m_graph(std::move(graph))
    , m_config(std::move(config))
{
    if (!m_graph)
    {
        throw AfError(AfErrorCode::InvalidRequest, "SemanticsEngine requires a graph");
    }
}

// ============================================================================
// Set predicates
// ============================================================================

bool SemanticsEngine::is_conflict_free(const ArgSet& set) const
{
    bool conflict = false;
    set.for_each([&](ArgIdx a) {
        if (!conflict && m_graph->target_set(a).intersects(set))
        {
            conflict = true;
        }
    });
    return !conflict;
}

ArgSet SemanticsEngine::attacked_by(const ArgSet& set) const
{
    ArgSet result = m_graph->empty_set();
    set.for_each([&](ArgIdx a) { result |= m_graph->target_set(a); });
    return result;
}

ArgSet SemanticsEngine::range(const ArgSet& set) const
{
    return set | attacked_by(set);
}

bool SemanticsEngine::defends(const ArgSet& set, ArgIdx arg) const
{
    return m_graph->attacker_set(arg).is_subset_of(attacked_by(set));
}

ArgSet SemanticsEngine::characteristic(const ArgSet& set) const
{
    const ArgSet counter = attacked_by(set);
    ArgSet result = m_graph->empty_set();
    for (ArgIdx a = 0; a < m_graph->argument_count(); ++a)
    {
        if (m_graph->attacker_set(a).is_subset_of(counter))
        {
            result.insert(a);
        }
    }
    return result;
}

bool SemanticsEngine::is_admissible(const ArgSet& set) const
{
    return is_conflict_free(set) && set.is_subset_of(characteristic(set));
}

bool SemanticsEngine::is_complete(const ArgSet& set) const
{
    return is_conflict_free(set) && characteristic(set) == set;
}

bool SemanticsEngine::is_stable(const ArgSet& set) const
{
    return is_conflict_free(set) && range(set) == m_graph->all_arguments();
}

// ============================================================================
// Grounded
// ============================================================================

GroundedResult SemanticsEngine::grounded() const
{
    GroundedResult result;
    result.extension = m_graph->empty_set();
    result.depth.assign(m_graph->argument_count(), std::nullopt);

    // F is monotonic, so each wave only adds arguments
    while (true)
    {
        ArgSet next = characteristic(result.extension);
        if (next == result.extension)
        {
            break;
        }
        ++result.iterations;
        (next - result.extension).for_each([&](ArgIdx a) { result.depth[a] = result.iterations; });
        result.extension = std::move(next);
    }

    logger()->debug("grounded extension has {} argument(s) after {} wave(s)",
                    result.extension.size(), result.iterations);
    return result;
}

// ============================================================================
// Enumerated families
// ============================================================================

std::vector<ArgIdx> SemanticsEngine::undecided_after(const ArgSet& grounded) const
{
    const ArgSet grounded_plus = attacked_by(grounded);
    std::vector<ArgIdx> result;
    for (ArgIdx a = 0; a < m_graph->argument_count(); ++a)
    {
        if (grounded.contains(a) || grounded_plus.contains(a) || m_graph->is_self_attacking(a))
        {
            continue;
        }
        // Attackers of G are always in G+, since G defends its members
        result.push_back(a);
    }
    return result;
}

std::vector<ArgSet> SemanticsEngine::conflict_free_sets() const
{
    std::vector<ArgIdx> all(m_graph->argument_count());
    std::iota(all.begin(), all.end(), ArgIdx{0});
    SubsetEnumerator enumerator(*m_graph, m_config);
    return enumerator.enumerate(m_graph->empty_set(), all, [](const ArgSet&) { return true; });
}

std::vector<ArgSet> SemanticsEngine::naive_sets() const
{
    std::vector<ArgIdx> all(m_graph->argument_count());
    std::iota(all.begin(), all.end(), ArgIdx{0});
    const ArgumentGraph& graph = *m_graph;
    SubsetEnumerator enumerator(graph, m_config);
    return enumerator.enumerate(m_graph->empty_set(), all, [&graph](const ArgSet& set) {
        for (ArgIdx x = 0; x < graph.argument_count(); ++x)
        {
            if (set.contains(x) || graph.is_self_attacking(x))
            {
                continue;
            }
            if (!graph.target_set(x).intersects(set) && !graph.attacker_set(x).intersects(set))
            {
                return false;
            }
        }
        return true;
    });
}

std::vector<ArgSet> SemanticsEngine::admissible_sets() const
{
    const ArgSet g = grounded().extension;
    std::vector<ArgIdx> undecided = undecided_after(g);
    g.for_each([&undecided](ArgIdx a) { undecided.push_back(a); });
    std::sort(undecided.begin(), undecided.end());

    SubsetEnumerator enumerator(*m_graph, m_config);
    return enumerator.enumerate(m_graph->empty_set(), undecided, [this](const ArgSet& set) {
        return set.is_subset_of(characteristic(set));
    });
}

std::vector<ArgSet> SemanticsEngine::complete_from(const ArgSet& grounded) const
{
    SubsetEnumerator enumerator(*m_graph, m_config);
    return enumerator.enumerate(grounded, undecided_after(grounded), [this](const ArgSet& set) {
        return characteristic(set) == set;
    });
}

std::vector<ArgSet> SemanticsEngine::stable_from(const std::vector<ArgSet>& complete) const
{
    const ArgSet all = m_graph->all_arguments();
    std::vector<ArgSet> result;
    for (const ArgSet& set : complete)
    {
        if (range(set) == all)
        {
            result.push_back(set);
        }
    }
    return result;
}

std::vector<ArgSet> SemanticsEngine::complete_sets() const
{
    return complete_from(grounded().extension);
}

std::vector<ArgSet> SemanticsEngine::preferred_sets() const
{
    return maximal_by_inclusion(complete_sets());
}

std::vector<ArgSet> SemanticsEngine::stable_sets() const
{
    return stable_from(complete_sets());
}

std::vector<ArgSet> SemanticsEngine::stage_sets() const
{
    return maximal_by_range(naive_sets());
}

std::vector<ArgSet> SemanticsEngine::semi_stable_sets() const
{
    return maximal_by_range(complete_sets());
}

// ============================================================================
// Maximality filters
// ============================================================================

void SemanticsEngine::check_deadline(const char* stage) const
{
    if (m_config.deadline && std::chrono::steady_clock::now() >= *m_config.deadline)
    {
        throw AfError(AfErrorCode::SearchExhausted,
                      std::string("Deadline passed during ") + stage);
    }
}

std::vector<ArgSet> SemanticsEngine::maximal_by_inclusion(const std::vector<ArgSet>& sets) const
{
    std::vector<size_t> order(sets.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&sets](size_t a, size_t b) {
        return sets[a].size() > sets[b].size();
    });

    // A strict superset is strictly larger, so it is visited first
    std::vector<ArgSet> kept;
    for (size_t i : order)
    {
        check_deadline("inclusion filtering");
        bool dominated = false;
        for (const ArgSet& k : kept)
        {
            if (sets[i].is_proper_subset_of(k))
            {
                dominated = true;
                break;
            }
        }
        if (!dominated)
        {
            kept.push_back(sets[i]);
        }
    }
    std::sort(kept.begin(), kept.end());
    return kept;
}

std::vector<ArgSet> SemanticsEngine::maximal_by_range(const std::vector<ArgSet>& sets) const
{
    std::vector<ArgSet> ranges;
    ranges.reserve(sets.size());
    for (const ArgSet& set : sets)
    {
        ranges.push_back(range(set));
    }

    std::vector<size_t> order(sets.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&ranges](size_t a, size_t b) {
        return ranges[a].size() > ranges[b].size();
    });

    std::vector<size_t> kept;
    for (size_t i : order)
    {
        check_deadline("range filtering");
        bool dominated = false;
        for (size_t k : kept)
        {
            if (ranges[i].is_proper_subset_of(ranges[k]))
            {
                dominated = true;
                break;
            }
        }
        if (!dominated)
        {
            kept.push_back(i);
        }
    }

    std::vector<ArgSet> result;
    result.reserve(kept.size());
    for (size_t k : kept)
    {
        result.push_back(sets[k]);
    }
    std::sort(result.begin(), result.end());
    return result;
}

// ============================================================================
// Families as extensions
// ============================================================================

std::vector<Extension> SemanticsEngine::snapshot(const std::vector<ArgSet>& sets) const
{
    std::vector<Extension> result;
    result.reserve(sets.size());
    for (const ArgSet& set : sets)
    {
        result.push_back(Extension::from_set(*m_graph, set));
    }
    return result;
}

std::vector<Extension> SemanticsEngine::extensions(SemanticsKind kind) const
{
    return compute(kind).at(kind);
}

ExtensionFamily SemanticsEngine::compute(SemanticsKind kind) const
{
    return compute(std::vector<SemanticsKind>{kind});
}

ExtensionFamily SemanticsEngine::compute_all() const
{
    return compute(all_semantics_kinds());
}

ExtensionFamily SemanticsEngine::compute(const std::vector<SemanticsKind>& kinds) const
{
    ExtensionFamily family;
    family.graph = m_graph;

    const GroundedResult g = grounded();
    std::optional<std::vector<ArgSet>> complete;
    auto complete_family = [&]() -> const std::vector<ArgSet>& {
        if (!complete)
        {
            complete = complete_from(g.extension);
        }
        return *complete;
    };

    for (SemanticsKind kind : kinds)
    {
        if (family.has(kind))
        {
            continue;
        }
        std::vector<ArgSet> sets;
        switch (kind)
        {
            case SemanticsKind::ConflictFree:
                sets = conflict_free_sets();
                break;
            case SemanticsKind::Admissible:
                sets = admissible_sets();
                break;
            case SemanticsKind::Complete:
                sets = complete_family();
                break;
            case SemanticsKind::Grounded:
                sets = {g.extension};
                family.defense_depth = g.depth;
                break;
            case SemanticsKind::Preferred:
                sets = maximal_by_inclusion(complete_family());
                break;
            case SemanticsKind::Stable:
                sets = stable_from(complete_family());
                break;
            case SemanticsKind::Stage:
                sets = stage_sets();
                break;
            case SemanticsKind::SemiStable:
                sets = maximal_by_range(complete_family());
                break;
            default:
                throw AfError(
                    AfErrorCode::InvalidSemanticsKind,
                    "Unknown semantics kind value " +
                        std::to_string(static_cast<int>(kind)));
        }
        logger()->debug("{}: {} extension(s)", to_string(kind), sets.size());
        family.extensions.emplace(kind, snapshot(sets));
    }
    return family;
}

// ============================================================================
// Free functions
// ============================================================================

ExtensionFamily compute(GraphPtr graph, SemanticsKind kind, EngineConfig config)
{
    SemanticsEngine engine(std::move(graph), std::move(config));
    return engine.compute(kind);
}

ExtensionFamily compute(GraphPtr graph, const std::string& selection, EngineConfig config)
{
    std::vector<SemanticsKind> kinds = parse_semantics_selection(selection);
    SemanticsEngine engine(std::move(graph), std::move(config));
    return engine.compute(kinds);
}

} // namespace argsem
