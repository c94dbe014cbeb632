#include "../include/frame_grabber.h"
#include <filesystem>
#include <iostream>

namespace GazeGuard
{
    void LatestFrameSlot::put(const cv::Mat &frame)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (latest_sequence_ > taken_sequence_)
                dropped_++;
            frame.copyTo(frame_);
            latest_sequence_++;
        }
        ready_.notify_one();
    }

    bool LatestFrameSlot::take(cv::Mat &frame, std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait_for(lock, timeout, [this]()
                        { return latest_sequence_ > taken_sequence_ || closed_; });
        if (latest_sequence_ == taken_sequence_)
            return false;

        frame_.copyTo(frame);
        taken_sequence_ = latest_sequence_;
        return true;
    }

    void LatestFrameSlot::close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    void LatestFrameSlot::reopen()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = false;
    }

    bool LatestFrameSlot::isClosed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    uint64_t LatestFrameSlot::getDropped() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

    FrameGrabber::FrameGrabber(const Config &config) : config_(config)
    {
    }

    FrameGrabber::~FrameGrabber()
    {
        stop();
    }

    bool FrameGrabber::initialize()
    {
        if (!config_.video_path.empty() && std::filesystem::exists(config_.video_path))
        {
            from_file_ = true;
            capture_.open(config_.video_path);
        }
        else
        {
            if (!config_.video_path.empty())
                std::cerr << "FrameGrabber: " << config_.video_path << " not found, using camera "
                          << config_.camera_index << std::endl;
            capture_.open(config_.camera_index);
            if (capture_.isOpened())
            {
                capture_.set(cv::CAP_PROP_FRAME_WIDTH, config_.frame_width);
                capture_.set(cv::CAP_PROP_FRAME_HEIGHT, config_.frame_height);
                capture_.set(cv::CAP_PROP_FPS, config_.capture_fps);
            }
        }

        if (!capture_.isOpened())
        {
            std::cerr << "FrameGrabber: Failed to open video source" << std::endl;
            return false;
        }
        return true;
    }

    void FrameGrabber::start()
    {
        if (capture_thread_.joinable())
            return;
        should_stop_ = false;
        finished_ = false;
        slot_.reopen();
        capture_thread_ = std::thread(&FrameGrabber::captureLoop, this);
    }

    void FrameGrabber::stop()
    {
        should_stop_ = true;
        slot_.close();
        if (capture_thread_.joinable())
            capture_thread_.join();
        if (capture_.isOpened())
            capture_.release();
    }

    void FrameGrabber::captureLoop()
    {
        // Files are read at their nominal rate so that skipping matches a live camera
        double file_fps = from_file_ ? capture_.get(cv::CAP_PROP_FPS) : 0.0;
        auto frame_period = std::chrono::microseconds(
            file_fps > 0.0 ? static_cast<long long>(1e6 / file_fps) : 0);
        auto next_read = std::chrono::steady_clock::now();

        cv::Mat frame;
        while (!should_stop_)
        {
            if (!capture_.read(frame) || frame.empty())
                break;
            frames_captured_++;
            slot_.put(frame);

            if (frame_period.count() > 0)
            {
                next_read += frame_period;
                std::this_thread::sleep_until(next_read);
            }
        }

        finished_ = true;
        slot_.close();
    }

    bool FrameGrabber::takeLatest(cv::Mat &frame, std::chrono::milliseconds timeout)
    {
        return slot_.take(frame, timeout);
    }
}
