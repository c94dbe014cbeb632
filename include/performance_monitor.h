#ifndef GAZE_GUARD_PERFORMANCE_MONITOR_H
#define GAZE_GUARD_PERFORMANCE_MONITOR_H

#include <chrono>
#include <deque>
#include "safety_monitor.h"

namespace GazeGuard
{
    // Rolling FPS and per-frame processing latency.
    class PerformanceMonitor
    {
    private:
        size_t window_size_;
        std::deque<Timestamp> frame_ends_;
        std::deque<double> latencies_ms_;
        double last_latency_ms_ = 0.0;
        size_t total_frames_ = 0;

    public:
        explicit PerformanceMonitor(size_t window_size);

        Timestamp startFrame() const { return Clock::now(); }
        void endFrame(Timestamp start);
        void endFrame(Timestamp start, Timestamp end);

        // Frames per second over the window, 0 until two frames completed.
        double getFps() const;
        double getLatencyMs() const { return last_latency_ms_; }
        double getAverageLatencyMs() const;
        size_t getTotalFrames() const { return total_frames_; }
    };
}

#endif // GAZE_GUARD_PERFORMANCE_MONITOR_H
