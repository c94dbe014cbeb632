#include "../include/gaze_guard_system.h"
#include "../include/constants.h"
#include "../include/cv_utils.h"
#include "../include/logger.h"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <vector>

namespace GazeGuard
{
    namespace
    {
        const Config &validatedConfig(const Config &config)
        {
            config.validate();
            return config;
        }
    }

    GazeGuardSystem::GazeGuardSystem(const Config &config)
        : config_(validatedConfig(config)),
          tracker_(TrackerRegistry::instance().create(config.tracker_type)),
          analyzer_(std::make_unique<EyeAnalyzer>(*tracker_, config_)),
          grabber_(std::make_unique<FrameGrabber>(config_)),
          safety_monitor_(config_.safety),
          performance_monitor_(static_cast<size_t>(config_.fps_window_size))
    {
    }

    bool GazeGuardSystem::initialize()
    {
        if (!tracker_->initialize(config_))
        {
            std::cerr << "GazeGuardSystem: Failed to initialize tracker '" << tracker_->name() << "'" << std::endl;
            return false;
        }
        return grabber_->initialize();
    }

    int GazeGuardSystem::run()
    {
        grabber_->start();

        std::cout << "Gaze Guard Started (tracker: " << tracker_->name() << ")" << std::endl;
        if (config_.show_window)
            std::cout << "Press ESC to exit, t to switch tracker" << std::endl;

        cv::Mat frame;
        while (true)
        {
            if (!grabber_->takeLatest(frame, std::chrono::milliseconds(500)))
            {
                if (grabber_->isFinished())
                    break;
                continue;
            }

            processFrame(frame, Clock::now());

            if (config_.show_window)
            {
                cv::imshow(WINDOW_NAME, frame);
                int key = cv::waitKey(Constants::WAIT_KEY_MS);
                if (key == Constants::ESC_KEY)
                    break;
                if (key == SWITCH_TRACKER_KEY)
                {
                    std::vector<std::string> names = TrackerRegistry::instance().available();
                    auto current = std::find(names.begin(), names.end(), tracker_->name());
                    size_t next = current == names.end() ? 0 : (current - names.begin() + 1) % names.size();
                    switchTracker(names[next]);
                }
            }
        }

        std::cout << "Processed Frames: " << performance_monitor_.getTotalFrames()
                  << ", Captured: " << grabber_->getFramesCaptured()
                  << ", Skipped: " << grabber_->getFramesDropped() << std::endl;
        std::cout << "Average latency: " << CVUtils::formatDouble(performance_monitor_.getAverageLatencyMs(), 2)
                  << " ms" << std::endl;
        cleanup();
        return EXIT_SUCCESS;
    }

    SafetyStatus GazeGuardSystem::processFrame(cv::Mat &frame, Timestamp timestamp)
    {
        Timestamp start = performance_monitor_.startFrame();

        FrameAnalysis analysis = analyzer_->analyze(frame);
        safety_monitor_.update(analysis.faceDetected(), analysis.fused_state, timestamp);
        SafetyStatus status = safety_monitor_.getStatus();

        performance_monitor_.endFrame(start);

        reportTransitions(status, frame);
        logFrame(analysis, status);

        if (config_.show_annotations)
            drawVisualization(frame, analysis, status);

        last_status_ = status;
        return status;
    }

    bool GazeGuardSystem::switchTracker(const std::string &name)
    {
        std::unique_ptr<Tracker> next = TrackerRegistry::instance().create(name);
        if (!next->initialize(config_))
        {
            std::cerr << "GazeGuardSystem: Failed to initialize tracker '" << name << "', keeping '"
                      << tracker_->name() << "'" << std::endl;
            return false;
        }

        // the analyzer borrows the tracker, so it goes first
        analyzer_.reset();
        tracker_ = std::move(next);
        analyzer_ = std::make_unique<EyeAnalyzer>(*tracker_, config_);

        safety_monitor_.reset();
        SafetyStatus status = safety_monitor_.getStatus();
        reportTransitions(status, cv::Mat());
        last_status_ = status;

        std::cout << "GazeGuardSystem: Switched to tracker '" << tracker_->name() << "'" << std::endl;
        return true;
    }

    void GazeGuardSystem::reportTransitions(const SafetyStatus &status, const cv::Mat &frame)
    {
        if (status.drowsiness_alarm != last_status_.drowsiness_alarm)
        {
            AlarmEvent event;
            event.type = AlarmType::DROWSINESS;
            event.active = status.drowsiness_alarm;
            event.drowsiness_score = status.drowsiness_score;
            Logger::logAlarm(event, frame);
        }
        if (status.out_of_frame_alarm != last_status_.out_of_frame_alarm)
        {
            AlarmEvent event;
            event.type = AlarmType::OUT_OF_FRAME;
            event.active = status.out_of_frame_alarm;
            event.drowsiness_score = status.drowsiness_score;
            Logger::logAlarm(event, frame);
        }
    }

    void GazeGuardSystem::logFrame(const FrameAnalysis &analysis, const SafetyStatus &status)
    {
        FrameRecord record;
        record.tracker_method = tracker_->name();
        if (analysis.left)
        {
            record.left_pupil = analysis.left->pupilInFrame();
            if (analysis.left->pupil)
                record.left_diameter = analysis.left->pupil->diameter;
        }
        if (analysis.right)
        {
            record.right_pupil = analysis.right->pupilInFrame();
            if (analysis.right->pupil)
                record.right_diameter = analysis.right->pupil->diameter;
        }
        record.eye_state = analysis.fused_state;
        record.drowsiness_score = status.drowsiness_score;
        record.fps = performance_monitor_.getFps();
        record.face_detected = analysis.faceDetected();
        record.processing_latency_ms = performance_monitor_.getLatencyMs();
        Logger::logFrame(record);
    }

    void GazeGuardSystem::drawVisualization(cv::Mat &frame, const FrameAnalysis &analysis, const SafetyStatus &status)
    {
        if (analysis.face)
            cv::rectangle(frame, *analysis.face, CVUtils::getStatusColor(status, config_), 2);

        if (analysis.left)
            drawEye(frame, *analysis.left);
        if (analysis.right)
            drawEye(frame, *analysis.right);

        drawAlarms(frame, status);
        if (config_.show_debug_info)
            drawDebugInfo(frame, analysis, status);
    }

    void GazeGuardSystem::drawEye(cv::Mat &frame, const EyeAnalysis &eye)
    {
        cv::Point eye_center(eye.region.origin.x + eye.region.image.cols / 2,
                             eye.region.origin.y + eye.region.image.rows / 2);
        cv::circle(frame, eye_center, 3, config_.eye_center_color, -1);

        // Pupils of closed eyes are not drawn
        auto pupil = eye.pupilInFrame();
        if (!pupil || eye.decision.state != EyeState::OPEN)
            return;

        int radius = 5;
        if (eye.pupil->diameter)
            radius = std::max(3, static_cast<int>(*eye.pupil->diameter / 2.0));
        cv::circle(frame, *pupil, radius, config_.pupil_color, 2);
    }

    void GazeGuardSystem::drawAlarms(cv::Mat &frame, const SafetyStatus &status)
    {
        int y = 40;
        if (status.out_of_frame_alarm)
        {
            cv::putText(frame, "OUT OF FRAME", cv::Point(20, y),
                        cv::FONT_HERSHEY_SIMPLEX, 1.0, config_.danger_color, 3);
            y += 40;
        }
        if (status.drowsiness_alarm)
        {
            cv::putText(frame, "DROWSINESS ALARM", cv::Point(20, y),
                        cv::FONT_HERSHEY_SIMPLEX, 1.0, config_.danger_color, 3);
        }
    }

    void GazeGuardSystem::drawDebugInfo(cv::Mat &frame, const FrameAnalysis &analysis, const SafetyStatus &status)
    {
        const cv::Scalar text_color(255, 255, 255);
        const auto &drowsiness = safety_monitor_.drowsinessMonitor();
        int y = frame.rows - 100;

        cv::putText(frame, "PERCLOS: " + CVUtils::formatDouble(status.drowsiness_score, 2) +
                               " / " + CVUtils::formatDouble(config_.safety.perclos_threshold, 2),
                    cv::Point(20, y), cv::FONT_HERSHEY_SIMPLEX, 0.6, text_color, 1);
        cv::putText(frame, "State: " + drowsinessStateToString(drowsiness.getState()) +
                               "  Eyes: " + (analysis.fused_state == EyeState::OPEN ? "OPEN" : "CLOSED"),
                    cv::Point(20, y + 20), cv::FONT_HERSHEY_SIMPLEX, 0.6, text_color, 1);
        cv::putText(frame, "Missed frames: " + std::to_string(safety_monitor_.outOfFrameMonitor().getConsecutiveMisses()),
                    cv::Point(20, y + 40), cv::FONT_HERSHEY_SIMPLEX, 0.6, text_color, 1);
        cv::putText(frame, "FPS: " + CVUtils::formatDouble(performance_monitor_.getFps(), 1) +
                               "  Latency: " + CVUtils::formatDouble(performance_monitor_.getLatencyMs(), 1) + " ms",
                    cv::Point(20, y + 60), cv::FONT_HERSHEY_SIMPLEX, 0.6, text_color, 1);
    }

    void GazeGuardSystem::cleanup()
    {
        grabber_->stop();
        if (config_.show_window)
            cv::destroyAllWindows();
        Logger::shutdown();
        std::cout << "System shutdown complete" << std::endl;
    }
}
