#ifndef GAZE_GUARD_SYSTEM_H
#define GAZE_GUARD_SYSTEM_H

#include <memory>
#include <string>
#include <opencv2/opencv.hpp>
#include "config.h"
#include "eye_analyzer.h"
#include "frame_grabber.h"
#include "performance_monitor.h"
#include "safety_monitor.h"
#include "tracker.h"

namespace GazeGuard
{
    class GazeGuardSystem
    {
    private:
        Config config_;
        std::unique_ptr<Tracker> tracker_;
        std::unique_ptr<EyeAnalyzer> analyzer_;
        std::unique_ptr<FrameGrabber> grabber_;
        SafetyMonitor safety_monitor_;
        PerformanceMonitor performance_monitor_;
        SafetyStatus last_status_;

        static constexpr const char *WINDOW_NAME = "Gaze Guard";
        static constexpr int SWITCH_TRACKER_KEY = 't';

    public:
        // Throws ConfigurationError for an invalid config or unknown tracker type.
        explicit GazeGuardSystem(const Config &config);
        bool initialize();
        int run();

        // One pipeline step on an already captured frame; draws onto it when annotations are on.
        SafetyStatus processFrame(cv::Mat &frame, Timestamp timestamp);

        // Replaces the tracker backend and restarts both alarm monitors.
        // Returns false, keeping the current backend, when the new one fails to initialize.
        bool switchTracker(const std::string &name);
        std::string getTrackerName() const { return tracker_->name(); }

        const SafetyMonitor &getSafetyMonitor() const { return safety_monitor_; }
        const PerformanceMonitor &getPerformanceMonitor() const { return performance_monitor_; }

    private:
        void reportTransitions(const SafetyStatus &status, const cv::Mat &frame);
        void logFrame(const FrameAnalysis &analysis, const SafetyStatus &status);

        void drawVisualization(cv::Mat &frame, const FrameAnalysis &analysis, const SafetyStatus &status);
        void drawEye(cv::Mat &frame, const EyeAnalysis &eye);
        void drawAlarms(cv::Mat &frame, const SafetyStatus &status);
        void drawDebugInfo(cv::Mat &frame, const FrameAnalysis &analysis, const SafetyStatus &status);
        void cleanup();
    };
}

#endif // GAZE_GUARD_SYSTEM_H
