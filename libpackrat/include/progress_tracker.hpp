//
// Created by the packrat authors on 18/10/26.
//

/**
 * @file progress_tracker.hpp
 * @brief Per-request progress accounting.
 */

#ifndef PACKRAT_PROGRESS_TRACKER_HPP
#define PACKRAT_PROGRESS_TRACKER_HPP

#include "options.hpp"
#include <atomic>
#include <cstdint>
#include <string>

namespace packrat {

/**
 * @brief Accumulates processed bytes against a precomputed total and
 * forwards the percentage to the caller's observer.
 *
 * @details One instance belongs to one pack/unpack call. The counter is
 * atomic so that entries could be processed concurrently within a call
 * without losing increments. With a total of zero every notification
 * reports 100%.
 */
class ProgressTracker {
public:
    ProgressTracker(std::uintmax_t total, ProgressObserver observer);

    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    /**
     * @brief Adds @p size bytes and notifies the observer, if any.
     * @param label Path of the unit of work just completed.
     * @param size Bytes it accounted for (0 for directories).
     */
    void advance(const std::string& label, std::uintmax_t size);

    [[nodiscard]] std::uintmax_t total() const noexcept { return total_; }
    [[nodiscard]] std::uintmax_t processed() const noexcept { return processed_.load(); }

    /**
     * @brief processed / total * 100, or 100 when total is zero.
     * Not clamped: a size that grew after estimation can push it past 100.
     */
    [[nodiscard]] static double percentage(std::uintmax_t processed, std::uintmax_t total) noexcept;

private:
    const std::uintmax_t total_;
    std::atomic<std::uintmax_t> processed_{0};
    const ProgressObserver observer_;
};

} // namespace packrat

#endif // PACKRAT_PROGRESS_TRACKER_HPP
