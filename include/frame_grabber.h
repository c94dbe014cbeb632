#ifndef GAZE_GUARD_FRAME_GRABBER_H
#define GAZE_GUARD_FRAME_GRABBER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>
#include <opencv2/opencv.hpp>
#include "config.h"

namespace GazeGuard
{
    // Single-frame handoff between a producer and a consumer. A frame that is
    // overwritten before it was taken counts as dropped.
    class LatestFrameSlot
    {
    private:
        mutable std::mutex mutex_;
        std::condition_variable ready_;
        cv::Mat frame_;
        uint64_t latest_sequence_ = 0;
        uint64_t taken_sequence_ = 0;
        uint64_t dropped_ = 0;
        bool closed_ = false;

    public:
        void put(const cv::Mat &frame);

        // Waits up to `timeout` for a frame newer than the last one taken.
        // A frame put before close() is still handed out; after that, returns false.
        bool take(cv::Mat &frame, std::chrono::milliseconds timeout);

        void close();
        void reopen();

        bool isClosed() const;
        uint64_t getDropped() const;
    };

    /**
     * @brief Background capture holding only the most recent frame
     *
     * The capture thread overwrites a single slot. A frame that is replaced
     * before the processing loop takes it is counted as dropped.
     */
    class FrameGrabber
    {
    private:
        Config config_;
        cv::VideoCapture capture_;
        bool from_file_ = false;

        std::thread capture_thread_;
        std::atomic<bool> should_stop_{false};
        std::atomic<bool> finished_{false};

        LatestFrameSlot slot_;
        std::atomic<uint64_t> frames_captured_{0};

        void captureLoop();

    public:
        explicit FrameGrabber(const Config &config);
        ~FrameGrabber();

        FrameGrabber(const FrameGrabber &) = delete;
        FrameGrabber &operator=(const FrameGrabber &) = delete;

        // Opens the video file if it exists, otherwise the camera.
        bool initialize();
        void start();
        void stop();

        // Returns false on timeout or once the source is exhausted and drained.
        bool takeLatest(cv::Mat &frame, std::chrono::milliseconds timeout);

        bool isFinished() const { return finished_; }
        bool isFileSource() const { return from_file_; }
        uint64_t getFramesCaptured() const { return frames_captured_; }
        uint64_t getFramesDropped() const { return slot_.getDropped(); }
    };
}

#endif // GAZE_GUARD_FRAME_GRABBER_H
