#include "d2p/pipeline/stability_detector.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <set>
#include <string>
#include <vector>

using d2p::core::StopToken;
using d2p::core::TaskGroup;
using d2p::pipeline::Channel;
using d2p::pipeline::StabilityDetector;
using d2p::pipeline::StabilitySettings;
using d2p::pipeline::StabilityState;
using d2p::pipeline::UploadMetrics;
using d2p::test_support::FakeFileSystem;
using d2p::test_support::wait_until;
using namespace std::chrono_literals;

TEST(StabilityState, FirstSampleOnlySetsBaseline) {
    StabilityState state(2);

    EXPECT_FALSE(state.observe(100));
    EXPECT_EQ(state.stable_readings(), 0);
    ASSERT_TRUE(state.last_size().has_value());
    EXPECT_EQ(state.last_size().value(), 100u);

    EXPECT_FALSE(state.observe(100));
    EXPECT_EQ(state.stable_readings(), 1);

    EXPECT_TRUE(state.observe(100));
    EXPECT_EQ(state.stable_readings(), 2);
}

TEST(StabilityState, ZeroSizedFileNeedsSameNumberOfReadings) {
    StabilityState state(1);

    EXPECT_FALSE(state.observe(0));
    EXPECT_TRUE(state.observe(0));
}

TEST(StabilityState, SizeChangeResetsCounter) {
    StabilityState state(3);

    state.observe(10);
    state.observe(10);
    state.observe(10);
    EXPECT_EQ(state.stable_readings(), 2);

    EXPECT_FALSE(state.observe(20));
    EXPECT_EQ(state.stable_readings(), 0);

    // Shrinking counts as a change too
    state.observe(20);
    EXPECT_FALSE(state.observe(5));
    EXPECT_EQ(state.stable_readings(), 0);
}

class StabilityDetectorTest : public ::testing::Test {
protected:
    StabilityDetector make_detector(int readings) {
        return StabilityDetector(fs_, stable_, metrics_, tasks_, StabilitySettings{5ms, readings});
    }

    void TearDown() override {
        tasks_.shutdown();
    }

    FakeFileSystem fs_;
    Channel<std::string> stable_;
    UploadMetrics metrics_;
    TaskGroup tasks_;
};

TEST_F(StabilityDetectorTest, EmitsOnceAfterRequiredUnchangedReadings) {
    fs_.set_size_script("/in/a.pdf", {100, 100, 100, 100});
    auto detector = make_detector(3);

    StopToken stop;
    EXPECT_TRUE(detector.watch_until_stable("/in/a.pdf", stop));

    EXPECT_EQ(fs_.stat_calls("/in/a.pdf"), 4);
    EXPECT_EQ(stable_.size(), 1u);
    EXPECT_EQ(stable_.try_receive().value(), "/in/a.pdf");
    EXPECT_EQ(metrics_.snapshot().abandoned_files, 0u);
}

TEST_F(StabilityDetectorTest, GrowingFileWaitsUntilItSettles) {
    fs_.set_size_script("/in/scan.pdf", {10, 20, 30, 30, 30});
    auto detector = make_detector(2);

    StopToken stop;
    EXPECT_TRUE(detector.watch_until_stable("/in/scan.pdf", stop));

    EXPECT_EQ(fs_.stat_calls("/in/scan.pdf"), 5);
    EXPECT_EQ(stable_.size(), 1u);
}

TEST_F(StabilityDetectorTest, NeverEmitsWhileSizeKeepsChanging) {
    std::vector<std::uint64_t> sizes;
    for (std::uint64_t size = 1; size <= 1000; ++size) {
        sizes.push_back(size);
    }
    fs_.set_size_script("/in/busy.pdf", sizes);
    auto detector = make_detector(2);
    detector.track("/in/busy.pdf");

    ASSERT_TRUE(wait_until([&]() { return fs_.stat_calls("/in/busy.pdf") >= 20; }));
    EXPECT_TRUE(stable_.empty());

    tasks_.shutdown();
    EXPECT_TRUE(stable_.empty());
}

TEST_F(StabilityDetectorTest, MissingFileIsAbandonedAndCounted) {
    auto detector = make_detector(3);

    StopToken stop;
    EXPECT_FALSE(detector.watch_until_stable("/in/gone.pdf", stop));

    EXPECT_TRUE(stable_.empty());
    EXPECT_EQ(metrics_.snapshot().abandoned_files, 1u);
}

TEST_F(StabilityDetectorTest, FileDeletedMidCheckIsAbandoned) {
    fs_.set_size_script("/in/temp.pdf", {50});
    auto detector = make_detector(1000);
    detector.track("/in/temp.pdf");

    ASSERT_TRUE(wait_until([&]() { return fs_.stat_calls("/in/temp.pdf") >= 2; }));
    fs_.delete_externally("/in/temp.pdf");

    ASSERT_TRUE(wait_until([&]() { return metrics_.snapshot().abandoned_files == 1; }));
    EXPECT_TRUE(stable_.empty());
}

TEST_F(StabilityDetectorTest, FilesAreTrackedIndependently) {
    fs_.set_size_script("/in/big.pdf", {100});
    fs_.set_size_script("/in/small.pdf", {10});
    auto detector = make_detector(3);

    detector.track("/in/big.pdf");
    detector.track("/in/small.pdf");

    ASSERT_TRUE(wait_until([&]() { return stable_.size() == 2; }));

    std::set<std::string> emitted;
    while (auto path = stable_.try_receive()) {
        emitted.insert(*path);
    }
    EXPECT_EQ(emitted, (std::set<std::string>{"/in/big.pdf", "/in/small.pdf"}));
}

TEST_F(StabilityDetectorTest, ShutdownCancelsCheckWithoutEmitting) {
    fs_.set_size_script("/in/slow.pdf", {42});
    StabilityDetector detector(fs_, stable_, metrics_, tasks_, StabilitySettings{10s, 5});
    detector.track("/in/slow.pdf");

    ASSERT_TRUE(wait_until([&]() { return fs_.stat_calls("/in/slow.pdf") >= 1; }));

    auto start = std::chrono::steady_clock::now();
    tasks_.shutdown();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

    EXPECT_TRUE(stable_.empty());
    EXPECT_EQ(metrics_.snapshot().abandoned_files, 0u);
}
