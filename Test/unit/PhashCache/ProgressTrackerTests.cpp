#include <gtest/gtest.h>

#include "progress_tracker.hpp"

#include <chrono>
#include <thread>
#include <vector>

namespace PhashCache {

using namespace phashcache;
using namespace std::chrono_literals;

TEST(ProgressInfoTests, FinishedCountsEveryFinalState) {
    ProgressInfo info;
    info.totalImages = 10;
    info.hashedCompleted = 6;
    info.writtenCompleted = 4;
    info.failedImages = 2;
    info.rejectedImages = 1;

    EXPECT_EQ(info.finished(), 7u);
}

TEST(ProgressTrackerTests, CountsAccumulate) {
    ProgressTracker tracker(5);

    tracker.update(PipelineStage::Hash, 3);
    tracker.update(PipelineStage::Write, 2);
    tracker.updateFailed(1);
    tracker.updateRejected(1);

    const auto info = tracker.getProgress();
    EXPECT_EQ(info.totalImages, 5u);
    EXPECT_EQ(info.hashedCompleted, 3u);
    EXPECT_EQ(info.writtenCompleted, 2u);
    EXPECT_EQ(info.failedImages, 1u);
    EXPECT_EQ(info.rejectedImages, 1u);
}

TEST(ProgressTrackerTests, CallbackIsRateLimited) {
    int calls = 0;
    ProgressTracker tracker(1000, [&calls](const ProgressInfo&) { ++calls; }, 1h);

    for (int i = 0; i < 1000; ++i) tracker.update(PipelineStage::Write, 1);

    EXPECT_EQ(calls, 0);
}

TEST(ProgressTrackerTests, ForceUpdateReportsLatestState) {
    ProgressInfo last;
    ProgressTracker tracker(3, [&last](const ProgressInfo& info) { last = info; }, 1h);

    tracker.update(PipelineStage::Write, 2);
    tracker.updateFailed(1);
    tracker.forceUpdate();

    EXPECT_EQ(last.finished(), last.totalImages);
}

TEST(ProgressTrackerTests, ConcurrentUpdatesAreNotLost) {
    ProgressTracker tracker(4000, [](const ProgressInfo&) {}, 0ms);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&tracker] {
            for (int i = 0; i < 1000; ++i) {
                tracker.update(PipelineStage::Hash, 1);
                tracker.update(PipelineStage::Write, 1);
            }
        });
    }
    for (auto& thread : threads) thread.join();

    const auto info = tracker.getProgress();
    EXPECT_EQ(info.hashedCompleted, 4000u);
    EXPECT_EQ(info.writtenCompleted, 4000u);
}

} // namespace PhashCache
