/**
 * @file engine_config.hpp
 */
#pragma once
#include "argsem/common/common.hpp"

namespace argsem
{

/**
 * @brief Configuration for semantics engine behavior.
 */
struct EngineConfig
{
    /**
     * @brief Number of worker threads for subset enumeration.
     * @details 0 means use std::thread::hardware_concurrency().
     *          1 means enumerate on the calling thread.
     */
    size_t thread_count{1};

    /**
     * @brief Maximum number of candidate sets examined by one enumeration.
     * @details 0 means unlimited. When the cap is hit the enumeration throws
     *          `AfError` with `SearchExhausted`; no partial family is returned.
     */
    size_t max_candidates{0};

    /**
     * @brief Wall-clock point after which enumeration and filtering stop.
     * @details Unset means no limit. Passing the deadline throws `AfError`
     *          with `SearchExhausted`, like the candidate cap.
     */
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

} // namespace argsem
