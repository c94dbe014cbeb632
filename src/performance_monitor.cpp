#include "../include/performance_monitor.h"
#include <numeric>

namespace GazeGuard
{
    PerformanceMonitor::PerformanceMonitor(size_t window_size) : window_size_(window_size)
    {
        if (window_size_ < 1)
            throw ConfigurationError("FPS window size must be >= 1");
    }

    void PerformanceMonitor::endFrame(Timestamp start)
    {
        endFrame(start, Clock::now());
    }

    void PerformanceMonitor::endFrame(Timestamp start, Timestamp end)
    {
        last_latency_ms_ = std::chrono::duration<double, std::milli>(end - start).count();
        ++total_frames_;

        frame_ends_.push_back(end);
        latencies_ms_.push_back(last_latency_ms_);
        // one extra timestamp: N intervals need N + 1 points
        while (frame_ends_.size() > window_size_ + 1)
            frame_ends_.pop_front();
        while (latencies_ms_.size() > window_size_)
            latencies_ms_.pop_front();
    }

    double PerformanceMonitor::getFps() const
    {
        if (frame_ends_.size() < 2)
            return 0.0;

        double span = std::chrono::duration<double>(frame_ends_.back() - frame_ends_.front()).count();
        if (span <= 0.0)
            return 0.0;
        return static_cast<double>(frame_ends_.size() - 1) / span;
    }

    double PerformanceMonitor::getAverageLatencyMs() const
    {
        if (latencies_ms_.empty())
            return 0.0;
        return std::accumulate(latencies_ms_.begin(), latencies_ms_.end(), 0.0) /
               static_cast<double>(latencies_ms_.size());
    }
}
