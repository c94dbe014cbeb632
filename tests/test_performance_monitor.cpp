#include <gtest/gtest.h>
#include "performance_monitor.h"

using namespace GazeGuard;

namespace
{
    Timestamp at(int ms)
    {
        return Timestamp() + std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms));
    }
}

TEST(PerformanceMonitorTest, StartsEmpty)
{
    PerformanceMonitor monitor(30);
    EXPECT_DOUBLE_EQ(monitor.getFps(), 0.0);
    EXPECT_DOUBLE_EQ(monitor.getLatencyMs(), 0.0);
    EXPECT_DOUBLE_EQ(monitor.getAverageLatencyMs(), 0.0);
    EXPECT_EQ(monitor.getTotalFrames(), 0u);
}

TEST(PerformanceMonitorTest, FpsFromFrameSpacing)
{
    PerformanceMonitor monitor(30);
    monitor.endFrame(at(0), at(10));
    EXPECT_DOUBLE_EQ(monitor.getFps(), 0.0);

    for (int i = 1; i <= 10; ++i)
        monitor.endFrame(at(i * 50), at(i * 50 + 10));
    EXPECT_NEAR(monitor.getFps(), 20.0, 1e-6);
}

TEST(PerformanceMonitorTest, FpsUsesOnlyRecentWindow)
{
    PerformanceMonitor monitor(5);
    // slow start, then 100 fps
    for (int i = 0; i < 5; ++i)
        monitor.endFrame(at(i * 500), at(i * 500));
    for (int i = 1; i <= 10; ++i)
        monitor.endFrame(at(2000 + i * 10), at(2000 + i * 10));
    EXPECT_NEAR(monitor.getFps(), 100.0, 1e-6);
}

TEST(PerformanceMonitorTest, LatencyOfLastAndAverage)
{
    PerformanceMonitor monitor(2);
    monitor.endFrame(at(0), at(10));
    monitor.endFrame(at(100), at(120));
    monitor.endFrame(at(200), at(230));

    EXPECT_NEAR(monitor.getLatencyMs(), 30.0, 1e-9);
    EXPECT_NEAR(monitor.getAverageLatencyMs(), 25.0, 1e-9);
    EXPECT_EQ(monitor.getTotalFrames(), 3u);
}

TEST(PerformanceMonitorTest, RealClockLatencyIsNonNegative)
{
    PerformanceMonitor monitor(30);
    Timestamp start = monitor.startFrame();
    monitor.endFrame(start);
    EXPECT_GE(monitor.getLatencyMs(), 0.0);
}

TEST(PerformanceMonitorTest, ZeroWindowIsRejected)
{
    EXPECT_THROW(PerformanceMonitor(0), ConfigurationError);
}
