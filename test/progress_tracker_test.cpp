//
// Created by the packrat authors on 18/10/26.
//

#include <gtest/gtest.h>
#include "../libpackrat/include/progress_tracker.hpp"
#include <string>
#include <thread>
#include <utility>
#include <vector>

using packrat::ProgressTracker;

namespace {
struct Call {
    double percent;
    std::string label;
};
} // namespace

TEST(ProgressTrackerTest, ReportsPercentageOfTotal) {
    std::vector<Call> calls;
    ProgressTracker tracker(20, [&](double p, const std::string& l) { calls.push_back({p, l}); });

    tracker.advance("a", 5);
    tracker.advance("dir", 0);
    tracker.advance("b", 15);

    ASSERT_EQ(calls.size(), 3u);
    EXPECT_DOUBLE_EQ(calls[0].percent, 25.0);
    EXPECT_EQ(calls[0].label, "a");
    EXPECT_DOUBLE_EQ(calls[1].percent, 25.0);
    EXPECT_EQ(calls[2].percent, 100.0);
    EXPECT_EQ(tracker.processed(), 20u);
}

TEST(ProgressTrackerTest, ZeroTotalReportsHundred) {
    std::vector<Call> calls;
    ProgressTracker tracker(0, [&](double p, const std::string& l) { calls.push_back({p, l}); });

    tracker.advance("empty", 0);

    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].percent, 100.0);
}

TEST(ProgressTrackerTest, OvershootIsNotClamped) {
    EXPECT_DOUBLE_EQ(ProgressTracker::percentage(15, 10), 150.0);
}

TEST(ProgressTrackerTest, WithoutObserverOnlyCounts) {
    ProgressTracker tracker(10, nullptr);
    tracker.advance("a", 4);
    EXPECT_EQ(tracker.processed(), 4u);
    EXPECT_EQ(tracker.total(), 10u);
}

TEST(ProgressTrackerTest, ConcurrentAdvancesAreNotLost) {
    ProgressTracker tracker(8000, nullptr);

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&tracker]() {
            for (int i = 0; i < 1000; ++i) tracker.advance("x", 1);
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(tracker.processed(), 8000u);
}
