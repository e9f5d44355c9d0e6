/**
 * @file arg_set.hpp
 */
#pragma once
#include "argsem/common/common.hpp"

#include <bitset>

namespace argsem
{

/**
 * @brief Type alias for argument indices.
 *
 * @details
 * `ArgIdx` is a type alias for `size_t` used to identify arguments within one
 * graph. Indices are assigned sequentially from 0 in declaration order. This
 * alias exists for clarity in API signatures, not for compile-time type safety.
 */
using ArgIdx = size_t;

/**
 * @brief A set of argument indices over a fixed universe, stored as a bitset.
 *
 * @details
 * `ArgSet` is the working representation for every set-valued computation in
 * the semantics engine. Membership, union, intersection and subset tests run
 * one 64-bit word at a time.
 *
 * @par Universe
 * - The universe size is fixed at construction (usually the argument count of
 *   the owning graph).
 * - Binary operations require both operands to share the same universe size;
 *   mixing universes throws `std::invalid_argument`.
 *
 * @par Ordering
 * `operator<` orders sets lexicographically by their ascending member index
 * sequences, so `{0} < {0, 1} < {1}`. This is the order used for every
 * reported extension list.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent reads are safe.
 */
class ArgSet
{
public:
    ArgSet() = default;

    /**
     * @brief Construct an empty set over a universe of `universe_size` arguments.
     */
    explicit ArgSet(size_t universe_size)
        : m_universe_size(universe_size)
        , m_words((universe_size + k_word_bits - 1) / k_word_bits, 0u)
    {
    }

    /**
     * @brief Construct a set containing every argument of the universe.
     */
    static ArgSet full(size_t universe_size)
    {
        ArgSet result(universe_size);
        for (ArgIdx i = 0; i < universe_size; ++i)
        {
            result.insert(i);
        }
        return result;
    }

    /**
     * @brief Construct a set from a list of indices.
     * @throw std::out_of_range if any index is outside the universe.
     */
    static ArgSet of(size_t universe_size, const std::vector<ArgIdx>& members)
    {
        ArgSet result(universe_size);
        for (ArgIdx i : members)
        {
            result.insert(i);
        }
        return result;
    }

    size_t universe_size() const noexcept
    {
        return m_universe_size;
    }

    /**
     * @brief Number of members.
     */
    size_t size() const noexcept
    {
        size_t count = 0;
        for (std::uint64_t w : m_words)
        {
            count += std::bitset<k_word_bits>(w).count();
        }
        return count;
    }

    bool empty() const noexcept
    {
        for (std::uint64_t w : m_words)
        {
            if (w != 0u)
            {
                return false;
            }
        }
        return true;
    }

    bool contains(ArgIdx i) const noexcept
    {
        if (i >= m_universe_size)
        {
            return false;
        }
        return (m_words[i / k_word_bits] >> (i % k_word_bits)) & 1u;
    }

    /**
     * @throw std::out_of_range if `i` is outside the universe.
     */
    void insert(ArgIdx i)
    {
        check_index(i);
        m_words[i / k_word_bits] |= (std::uint64_t{1} << (i % k_word_bits));
    }

    /**
     * @throw std::out_of_range if `i` is outside the universe.
     */
    void erase(ArgIdx i)
    {
        check_index(i);
        m_words[i / k_word_bits] &= ~(std::uint64_t{1} << (i % k_word_bits));
    }

    void clear() noexcept
    {
        std::fill(m_words.begin(), m_words.end(), 0u);
    }

    ArgSet& operator|=(const ArgSet& other)
    {
        check_universe(other);
        for (size_t w = 0; w < m_words.size(); ++w)
        {
            m_words[w] |= other.m_words[w];
        }
        return *this;
    }

    ArgSet& operator&=(const ArgSet& other)
    {
        check_universe(other);
        for (size_t w = 0; w < m_words.size(); ++w)
        {
            m_words[w] &= other.m_words[w];
        }
        return *this;
    }

    /// Set difference.
    ArgSet& operator-=(const ArgSet& other)
    {
        check_universe(other);
        for (size_t w = 0; w < m_words.size(); ++w)
        {
            m_words[w] &= ~other.m_words[w];
        }
        return *this;
    }

    friend ArgSet operator|(ArgSet lhs, const ArgSet& rhs)
    {
        lhs |= rhs;
        return lhs;
    }

    friend ArgSet operator&(ArgSet lhs, const ArgSet& rhs)
    {
        lhs &= rhs;
        return lhs;
    }

    friend ArgSet operator-(ArgSet lhs, const ArgSet& rhs)
    {
        lhs -= rhs;
        return lhs;
    }

    /**
     * @brief Complement within the universe.
     */
    ArgSet complement() const
    {
        return full(m_universe_size) - *this;
    }

    /**
     * @brief True if the two sets share at least one member.
     */
    bool intersects(const ArgSet& other) const
    {
        check_universe(other);
        for (size_t w = 0; w < m_words.size(); ++w)
        {
            if ((m_words[w] & other.m_words[w]) != 0u)
            {
                return true;
            }
        }
        return false;
    }

    bool is_subset_of(const ArgSet& other) const
    {
        check_universe(other);
        for (size_t w = 0; w < m_words.size(); ++w)
        {
            if ((m_words[w] & ~other.m_words[w]) != 0u)
            {
                return false;
            }
        }
        return true;
    }

    bool is_proper_subset_of(const ArgSet& other) const
    {
        return is_subset_of(other) && m_words != other.m_words;
    }

    /**
     * @brief Invoke `func(ArgIdx)` for every member in ascending order.
     */
    template <typename Func>
    void for_each(Func&& func) const
    {
        static_assert(std::is_invocable_v<Func&, ArgIdx>,
            "Func must be callable as f(ArgIdx)");
        for (size_t w = 0; w < m_words.size(); ++w)
        {
            std::uint64_t bits = m_words[w];
            while (bits != 0u)
            {
                std::uint64_t lowest = bits & (~bits + 1u);
                size_t offset = std::bitset<k_word_bits>(lowest - 1u).count();
                func(w * k_word_bits + offset);
                bits &= bits - 1u;
            }
        }
    }

    /**
     * @brief Members in ascending index order.
     */
    std::vector<ArgIdx> members() const
    {
        std::vector<ArgIdx> result;
        for_each([&result](ArgIdx i) { result.push_back(i); });
        return result;
    }

    friend bool operator==(const ArgSet& lhs, const ArgSet& rhs) noexcept
    {
        return lhs.m_universe_size == rhs.m_universe_size && lhs.m_words == rhs.m_words;
    }

    friend bool operator!=(const ArgSet& lhs, const ArgSet& rhs) noexcept
    {
        return !(lhs == rhs);
    }

    /**
     * @brief Lexicographic order on ascending member sequences.
     */
    friend bool operator<(const ArgSet& lhs, const ArgSet& rhs) noexcept
    {
        // Members below the lowest differing bit are shared. The side owning
        // that bit is smaller unless the other side has nothing after it.
        const size_t words = std::max(lhs.m_words.size(), rhs.m_words.size());
        for (size_t w = 0; w < words; ++w)
        {
            const std::uint64_t a = lhs.word_at(w);
            const std::uint64_t b = rhs.word_at(w);
            const std::uint64_t diff = a ^ b;
            if (diff == 0u)
            {
                continue;
            }
            const std::uint64_t lowest = diff & (~diff + 1u);
            const std::uint64_t above = ~(lowest | (lowest - 1u));
            if ((a & lowest) != 0u)
            {
                return (b & above) != 0u || rhs.any_from_word(w + 1);
            }
            return (a & above) == 0u && !lhs.any_from_word(w + 1);
        }
        return false;
    }

private:
    static constexpr size_t k_word_bits = 64;

    std::uint64_t word_at(size_t w) const noexcept
    {
        return w < m_words.size() ? m_words[w] : 0u;
    }

    bool any_from_word(size_t w) const noexcept
    {
        for (; w < m_words.size(); ++w)
        {
            if (m_words[w] != 0u)
            {
                return true;
            }
        }
        return false;
    }

    void check_index(ArgIdx i) const
    {
        if (i >= m_universe_size)
        {
            throw std::out_of_range("ArgSet: index " + std::to_string(i) +
                                    " outside universe of size " +
                                    std::to_string(m_universe_size));
        }
    }

    void check_universe(const ArgSet& other) const
    {
        if (other.m_universe_size != m_universe_size)
        {
            throw std::invalid_argument("ArgSet: universe size mismatch");
        }
    }

    size_t m_universe_size = 0;
    std::vector<std::uint64_t> m_words;
};

} // namespace argsem
