//
// Created by the packrat authors on 18/10/26.
//

#include "../../include/progress_tracker.hpp"
#include <utility>

namespace packrat {

ProgressTracker::ProgressTracker(const std::uintmax_t total, ProgressObserver observer)
    : total_(total),
      observer_(std::move(observer)) {}

void ProgressTracker::advance(const std::string& label, const std::uintmax_t size) {
    const std::uintmax_t now = processed_.fetch_add(size) + size;
    if (observer_) {
        observer_(percentage(now, total_), label);
    }
}

double ProgressTracker::percentage(const std::uintmax_t processed, const std::uintmax_t total) noexcept {
    if (total == 0) {
        return 100.0;
    }
    return static_cast<double>(processed) / static_cast<double>(total) * 100.0;
}

} // namespace packrat
