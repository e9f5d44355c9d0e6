/**
 * @file id_index.hpp
 */
#pragma once
#include "argsem/common/common.hpp"
#include "argsem/common/arg_set.hpp"

namespace argsem
{

/**
 * @brief A list of unique argument ids with insertion-order preservation.
 *
 * @details
 * `IdIndex` maps argument ids to dense indices and back. It combines a
 * `std::vector` (for ordered storage) with a `std::unordered_map` (for
 * id-to-index lookup).
 *
 * @par Duplicate handling
 * - `insert()` returns the existing index if the id is already present.
 * - Duplicate insertions do not modify the list or change insertion order.
 * - Callers that must reject duplicates check `find()` first.
 *
 * @par Invariants
 * - For all `i` in `[0, size())`: `find(at(i)) == i`.
 * - Ids are enumerated in insertion order.
 *
 * @par Thread safety
 * - No internal synchronization; concurrent reads are safe.
 */
class IdIndex
{
public:
    /**
     * @brief Sentinel value indicating "not found" (equal to `SIZE_MAX`).
     */
    static constexpr std::size_t npos = ~static_cast<std::size_t>(0);

    /**
     * @brief Insert an id if not already present.
     * @return The index of the id: new index if inserted, existing index if duplicate.
     * @note Strong exception guarantee.
     */
    ArgIdx insert(const std::string& id)
    {
        auto it = m_map.find(id);
        if (it != m_map.end())
        {
            return it->second;
        }
        ArgIdx index = m_list.size();
        m_list.push_back(id);
        try
        {
            m_map.emplace(id, index);
        }
        catch (...)
        {
            m_list.pop_back();
            throw;
        }
        return index;
    }

    /**
     * @brief Find the index of an id.
     * @return The index if found; otherwise `npos`.
     */
    std::size_t find(const std::string& id) const noexcept
    {
        auto it = m_map.find(id);
        if (it != m_map.end())
        {
            return it->second;
        }
        return npos;
    }

    /**
     * @throw std::out_of_range if `index >= size()`.
     */
    const std::string& at(ArgIdx index) const
    {
        if (index >= m_list.size())
        {
            throw std::out_of_range("IdIndex::at: index out of range");
        }
        return m_list[index];
    }

    std::size_t size() const noexcept
    {
        return m_list.size();
    }

    const std::vector<std::string>& ids() const noexcept
    {
        return m_list;
    }

private:
    std::vector<std::string> m_list;
    std::unordered_map<std::string, ArgIdx> m_map;
};

} // namespace argsem
