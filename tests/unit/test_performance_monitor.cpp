#include <gtest/gtest.h>
#include "puresend/transfer/performance_monitor.hpp"

using namespace puresend::transfer;
using namespace std::chrono_literals;

class PerformanceMonitorTest : public ::testing::Test {
protected:
    PerformanceMonitor monitor_{2s};
    PerformanceMonitor::Clock::time_point start_ = PerformanceMonitor::Clock::now();
};

TEST_F(PerformanceMonitorTest, SpeedOverWindow) {
    monitor_.start_session("t1", 10'000'000, 0, start_);

    monitor_.on_bytes_transferred("t1", 1'000'000, start_ + 500ms);
    monitor_.on_bytes_transferred("t1", 1'000'000, start_ + 1000ms);

    auto stats = monitor_.get_session_stats("t1", start_ + 1000ms);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->bytes_transferred, 2'000'000u);
    EXPECT_EQ(stats->current_speed_bps, 2'000'000u);
    EXPECT_EQ(stats->average_speed_bps, 2'000'000u);
    EXPECT_DOUBLE_EQ(stats->percentage_complete, 20.0);
    ASSERT_TRUE(stats->estimated_time_remaining.has_value());
    EXPECT_EQ(*stats->estimated_time_remaining, 4000ms);
}

TEST_F(PerformanceMonitorTest, OldSamplesLeaveTheWindow) {
    monitor_.start_session("t1", 10'000'000, 0, start_);
    monitor_.on_bytes_transferred("t1", 4'000'000, start_ + 100ms);

    auto stats = monitor_.get_session_stats("t1", start_ + 5s);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->current_speed_bps, 0u);
    EXPECT_EQ(stats->average_speed_bps, 800'000u);
    // Falls back to the average once the window is empty.
    EXPECT_EQ(*stats->estimated_time_remaining, 7500ms);
}

TEST_F(PerformanceMonitorTest, ResumedBytesDoNotCountAsSpeed) {
    monitor_.start_session("t1", 9'400'000, 6'000'000, start_);

    auto stats = monitor_.get_session_stats("t1", start_ + 1s);
    EXPECT_EQ(stats->bytes_transferred, 6'000'000u);
    EXPECT_EQ(stats->average_speed_bps, 0u);
    EXPECT_FALSE(stats->estimated_time_remaining.has_value());
    EXPECT_EQ(monitor_.get_total_bytes_transferred(), 0u);

    monitor_.on_bytes_transferred("t1", 1'000'000, start_ + 1s);
    EXPECT_EQ(monitor_.get_total_bytes_transferred(), 1'000'000u);
}

TEST_F(PerformanceMonitorTest, CompleteSessionHasZeroRemaining) {
    monitor_.start_session("t1", 1000, 0, start_);
    monitor_.on_bytes_transferred("t1", 5000, start_ + 10ms);

    auto stats = monitor_.get_session_stats("t1", start_ + 10ms);
    EXPECT_EQ(stats->bytes_transferred, 1000u);
    EXPECT_EQ(*stats->estimated_time_remaining, 0ms);
}

TEST_F(PerformanceMonitorTest, SessionLifecycle) {
    monitor_.start_session("a", 100, 0, start_);
    monitor_.start_session("b", 100, 0, start_);
    EXPECT_TRUE(monitor_.has_session("a"));
    EXPECT_EQ(monitor_.get_all_session_stats(start_).size(), 2u);

    monitor_.end_session("a");
    EXPECT_FALSE(monitor_.has_session("a"));
    EXPECT_FALSE(monitor_.get_session_stats("a").has_value());

    // Unknown sessions are ignored.
    monitor_.on_bytes_transferred("a", 10, start_);
    EXPECT_EQ(monitor_.get_all_session_stats(start_).size(), 1u);
}
