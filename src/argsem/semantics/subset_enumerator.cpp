#include "argsem/semantics/subset_enumerator.hpp"
#include "argsem/common/errors.hpp"
#include "argsem/common/logging.hpp"

#include <thread>

namespace argsem
{

struct SubsetEnumerator::SearchState
{
    const std::vector<ArgIdx>& undecided;
    const CandidateFilter& accept;
    std::atomic<size_t>& candidates;
    std::atomic<bool>& stop;
};

SubsetEnumerator::SubsetEnumerator(const ArgumentGraph& graph, EngineConfig config)
    : m_graph(graph)
    , m_config(std::move(config))
{
}

size_t SubsetEnumerator::effective_thread_count() const
{
    if (m_config.thread_count == 0)
    {
        size_t hw = std::thread::hardware_concurrency();
        return hw == 0 ? 1 : hw;
    }
    return m_config.thread_count;
}

bool SubsetEnumerator::can_include(const ArgSet& current, ArgIdx arg) const
{
    if (m_graph.is_self_attacking(arg))
    {
        return false;
    }
    return !current.intersects(m_graph.target_set(arg)) &&
           !current.intersects(m_graph.attacker_set(arg));
}

void SubsetEnumerator::search(SearchState& state, size_t pos, ArgSet& current,
                              std::vector<ArgSet>& out) const
{
    if (state.stop.load(std::memory_order_relaxed))
    {
        return;
    }

    if (pos == state.undecided.size())
    {
        size_t seen = state.candidates.fetch_add(1, std::memory_order_relaxed) + 1;
        if (m_config.max_candidates != 0 && seen > m_config.max_candidates)
        {
            state.stop.store(true, std::memory_order_relaxed);
            throw AfError(
                AfErrorCode::SearchExhausted,
                "Enumeration exceeded the cap of " + std::to_string(m_config.max_candidates) +
                    " candidate sets");
        }
        // The clock is sampled on the first leaf and every 256th after it
        if (m_config.deadline && (seen & 0xFFu) == 1u &&
            std::chrono::steady_clock::now() >= *m_config.deadline)
        {
            state.stop.store(true, std::memory_order_relaxed);
            throw AfError(
                AfErrorCode::SearchExhausted,
                "Enumeration passed its deadline after " + std::to_string(seen) +
                    " candidate sets");
        }
        if (state.accept(current))
        {
            out.push_back(current);
        }
        return;
    }

    ArgIdx arg = state.undecided[pos];
    if (can_include(current, arg))
    {
        current.insert(arg);
        search(state, pos + 1, current, out);
        current.erase(arg);
    }
    search(state, pos + 1, current, out);
}

std::vector<ArgSet> SubsetEnumerator::enumerate(const ArgSet& base,
                                                const std::vector<ArgIdx>& undecided,
                                                const CandidateFilter& accept) const
{
    std::atomic<size_t> candidates{0};
    std::atomic<bool> stop{false};
    SearchState state{undecided, accept, candidates, stop};

    std::vector<ArgSet> result;
    const size_t threads = effective_thread_count();

    if (threads <= 1 || undecided.size() < 2)
    {
        ArgSet current = base;
        search(state, 0, current, result);
    }
    else
    {
        // Split the tree at a depth giving several subtrees per worker
        size_t split_depth = 0;
        while (split_depth < undecided.size() && (size_t{1} << split_depth) < threads * 8)
        {
            ++split_depth;
        }

        std::vector<ArgSet> prefixes{base};
        for (size_t pos = 0; pos < split_depth; ++pos)
        {
            std::vector<ArgSet> next;
            next.reserve(prefixes.size() * 2);
            for (const ArgSet& prefix : prefixes)
            {
                if (can_include(prefix, undecided[pos]))
                {
                    ArgSet with = prefix;
                    with.insert(undecided[pos]);
                    next.push_back(std::move(with));
                }
                next.push_back(prefix);
            }
            prefixes = std::move(next);
        }

        std::atomic<size_t> next_prefix{0};
        std::vector<std::vector<ArgSet>> partial(threads);
        std::vector<std::exception_ptr> errors(threads);
        std::vector<std::thread> workers;
        workers.reserve(threads);

        for (size_t w = 0; w < threads; ++w)
        {
            workers.emplace_back([&, w]() {
                try
                {
                    while (!stop.load(std::memory_order_relaxed))
                    {
                        size_t idx = next_prefix.fetch_add(1, std::memory_order_relaxed);
                        if (idx >= prefixes.size())
                        {
                            break;
                        }
                        ArgSet current = prefixes[idx];
                        search(state, split_depth, current, partial[w]);
                    }
                }
                catch (...)
                {
                    errors[w] = std::current_exception();
                    stop.store(true, std::memory_order_relaxed);
                }
            });
        }
        for (auto& worker : workers)
        {
            worker.join();
        }
        for (const auto& error : errors)
        {
            if (error)
            {
                std::rethrow_exception(error);
            }
        }
        for (auto& part : partial)
        {
            result.insert(result.end(), std::make_move_iterator(part.begin()),
                          std::make_move_iterator(part.end()));
        }
    }

    std::sort(result.begin(), result.end());
    logger()->debug("enumerated {} candidate set(s) over {} undecided argument(s), kept {}",
                    candidates.load(), undecided.size(), result.size());
    return result;
}

} // namespace argsem
