#ifndef GAZE_GUARD_LOGGER_H
#define GAZE_GUARD_LOGGER_H

#include <string>
#include <chrono>
#include <optional>
#include <queue>
#include <mutex>
#include <thread>
#include <atomic>
#include <memory>
#include <fstream>
#include <opencv2/opencv.hpp>
#include <nlohmann/json.hpp>
#include "config.h"
#include "eye_types.h"
#include "message_publisher.h"

namespace GazeGuard
{
    // One row of the per-frame data log. Field order is the column order.
    struct FrameRecord
    {
        std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
        std::string tracker_method;
        std::optional<cv::Point> left_pupil;
        std::optional<cv::Point> right_pupil;
        std::optional<double> left_diameter;
        std::optional<double> right_diameter;
        EyeState eye_state = EyeState::OPEN;
        double drowsiness_score = 0.0;
        double fps = 0.0;
        bool face_detected = false;
        double processing_latency_ms = 0.0;
    };

    enum class AlarmType
    {
        OUT_OF_FRAME,
        DROWSINESS
    };

    struct AlarmEvent
    {
        std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
        AlarmType type = AlarmType::DROWSINESS;
        bool active = false;
        double drowsiness_score = 0.0;
        std::string image_filename;
    };

    class Logger
    {
    private:
        struct QueuedEntry
        {
            bool is_alarm;
            FrameRecord record;
            AlarmEvent event;
        };

        // Static members for singleton
        static std::unique_ptr<Logger> instance_;
        static std::once_flag once_flag_;
        static std::mutex instance_mutex_;

        std::unique_ptr<MessagePublisher> message_publisher_;

        // Statistics
        std::atomic<size_t> frames_logged_{0};
        std::atomic<size_t> alarms_logged_{0};
        std::atomic<size_t> images_saved_{0};

        // Instance members
        std::queue<QueuedEntry> log_queue_;
        std::mutex queue_mutex_;
        std::thread worker_thread_;
        std::atomic<bool> should_stop_{false};
        std::atomic<bool> is_initialized_{false};
        std::atomic<bool> warned_uninitialized_{false};
        Config config_;
        std::string frame_log_path_;
        std::string event_log_path_;

        Logger() = default;

        Logger(const Logger &) = delete;
        Logger &operator=(const Logger &) = delete;
        Logger(Logger &&) = delete;
        Logger &operator=(Logger &&) = delete;

    public:
        static Logger &getInstance();

        // Must be called before logging; a second call is ignored until shutdown().
        void setupConfig(const Config &config);

        static void logFrame(const FrameRecord &record);
        static void logAlarm(AlarmEvent event, const cv::Mat &frame);

        void getStats(size_t &frames_logged, size_t &alarms_logged, size_t &images_saved,
                      size_t &messages_sent, size_t &messages_failed) const;

        // Flushes the queue and stops the worker.
        static void shutdown();

        bool isInitialized() const { return is_initialized_; }

        ~Logger();

        const std::string &getFrameLogPath() const { return frame_log_path_; }
        const std::string &getEventLogPath() const { return event_log_path_; }

        // Serialization, shared by the worker and the tests
        static std::string alarmTypeToString(AlarmType type);
        static nlohmann::ordered_json frameRecordToJson(const FrameRecord &record);
        static nlohmann::ordered_json alarmEventToJson(const AlarmEvent &event);
        static std::string csvHeader();
        static std::string frameRecordToCsvRow(const FrameRecord &record);
        static std::string formatLogTimestamp(const std::chrono::system_clock::time_point &tp);

    private:
        void shutdownImpl();
        bool checkInitialized();
        void enqueue(QueuedEntry entry);
        void setupDirectories();
        std::string GetCurrentTimeStamp();
        std::string saveSnapshot(const cv::Mat &frame, AlarmType type);
        void printToConsole(const AlarmEvent &event);
        void processLogQueue();
        void publishMessage(const std::string &topic, const std::string &json_entry);
    };
}

#endif // GAZE_GUARD_LOGGER_H
