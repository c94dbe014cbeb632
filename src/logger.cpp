#include "../include/logger.h"
#include "../include/constants.h"
#include "../include/cv_utils.h"
#include <ctime>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <filesystem>

namespace GazeGuard
{
    // Static member definitions
    std::unique_ptr<Logger> Logger::instance_ = nullptr;
    std::once_flag Logger::once_flag_;
    std::mutex Logger::instance_mutex_;

    namespace
    {
        std::string optionalToCsv(const std::optional<double> &value, int precision)
        {
            return value ? CVUtils::formatDouble(*value, precision) : "";
        }
    }

    Logger &Logger::getInstance()
    {
        std::call_once(once_flag_, []()
                       { instance_ = std::unique_ptr<Logger>(new Logger()); });
        return *instance_;
    }

    void Logger::setupConfig(const Config &config)
    {
        std::lock_guard<std::mutex> lock(instance_mutex_);

        if (is_initialized_)
        {
            std::cerr << "Warning: Logger already initialized. Config changes ignored." << "\n";
            return;
        }

        config_ = config;
        should_stop_ = false;
        setupDirectories();

        std::string extension = config_.log_format == "csv" ? ".csv" : ".jsonl";
        frame_log_path_ = config_.log_path + config_.frame_log_basename + "_" + GetCurrentTimeStamp() + extension;
        event_log_path_ = config_.log_path + config_.event_log_filename;

        if (config_.enable_publishing_)
        {
            message_publisher_ = std::make_unique<MessagePublisher>();
            if (!message_publisher_->initialize(config_.zmq_endpoint))
            {
                std::cerr << "Logger: Failed to initialize ZeroMQ publisher, continuing without publishing" << "\n";
                message_publisher_.reset();
            }
            else
            {
                std::cout << "Logger: ZeroMQ publishing enabled on " << config_.zmq_endpoint << "\n";
            }
        }

        if (config_.enable_file_logging || message_publisher_)
        {
            worker_thread_ = std::thread(&Logger::processLogQueue, this);
        }

        is_initialized_ = true;
        std::cout << "Logger initialized successfully" << "\n";
    }

    void Logger::logFrame(const FrameRecord &record)
    {
        Logger &logger = getInstance();
        if (!logger.checkInitialized())
            return;
        if (!logger.config_.enable_file_logging)
            return;

        logger.enqueue({false, record, AlarmEvent()});
    }

    void Logger::logAlarm(AlarmEvent event, const cv::Mat &frame)
    {
        Logger &logger = getInstance();
        if (!logger.checkInitialized())
            return;

        if (logger.config_.save_snapshots && event.active && !frame.empty())
        {
            event.image_filename = logger.saveSnapshot(frame, event.type);
            if (!event.image_filename.empty())
                logger.images_saved_++;
        }

        if (logger.config_.enable_console_logging)
            logger.printToConsole(event);

        logger.enqueue({true, FrameRecord(), event});
    }

    bool Logger::checkInitialized()
    {
        if (is_initialized_)
            return true;
        // once per process, callers may log every frame
        if (!warned_uninitialized_.exchange(true))
            std::cerr << "Error: Logger not initialized. Call setupConfig() first." << "\n";
        return false;
    }

    void Logger::enqueue(QueuedEntry entry)
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        log_queue_.push(std::move(entry));

        // Prevent queue from growing too large
        while (log_queue_.size() > static_cast<size_t>(Constants::MAX_LOG_ENTRIES))
        {
            log_queue_.pop();
        }
    }

    void Logger::shutdown()
    {
        std::lock_guard<std::mutex> lock(instance_mutex_);
        if (instance_ && instance_->is_initialized_)
        {
            instance_->shutdownImpl();
        }
    }

    Logger::~Logger()
    {
        if (is_initialized_)
        {
            shutdownImpl();
        }
    }

    void Logger::shutdownImpl()
    {
        should_stop_ = true;
        if (worker_thread_.joinable())
        {
            worker_thread_.join();
        }
        is_initialized_ = false;

        if (message_publisher_)
        {
            message_publisher_->shutdown();
            message_publisher_.reset();
        }

        std::cout << "Logger shutdown complete" << "\n";
    }

    void Logger::setupDirectories()
    {
        if (config_.save_snapshots && !std::filesystem::exists(config_.snapshot_path))
        {
            std::filesystem::create_directories(config_.snapshot_path);
        }
        if (config_.enable_file_logging && !std::filesystem::exists(config_.log_path))
        {
            std::filesystem::create_directories(config_.log_path);
        }
    }

    std::string Logger::GetCurrentTimeStamp()
    {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
        std::stringstream ss;

        ss << std::put_time(std::localtime(&time_t), "%b%d_%Y_%Hh%Mm%Ss");
        ss << "_" << std::setw(3) << std::setfill('0') << ms.count();
        return ss.str();
    }

    std::string Logger::saveSnapshot(const cv::Mat &frame, AlarmType type)
    {
        std::string prefix = type == AlarmType::DROWSINESS ? "drowsy_detected_" : "out_of_frame_";
        std::string filename = config_.snapshot_path + prefix + GetCurrentTimeStamp() + ".jpg";
        try
        {
            if (cv::imwrite(filename, frame))
                return filename;
        }
        catch (const cv::Exception &e)
        {
            std::cerr << "Logger: " << e.what() << std::endl;
        }
        std::cerr << "Logger: Error saving image " << filename << std::endl;
        return "";
    }

    void Logger::printToConsole(const AlarmEvent &event)
    {
        std::cout << formatLogTimestamp(event.timestamp)
                  << " | " << alarmTypeToString(event.type)
                  << " | " << (event.active ? "RAISED" : "CLEARED")
                  << " | PERCLOS: " << std::fixed << std::setprecision(3) << event.drowsiness_score << "\n";
    }

    void Logger::processLogQueue()
    {
        std::ofstream frame_file;
        std::ofstream event_file;
        if (config_.enable_file_logging)
        {
            frame_file.open(frame_log_path_, std::ios::app);
            event_file.open(event_log_path_, std::ios::app);
            if (!frame_file.is_open() || !event_file.is_open())
                std::cerr << "Logger: Cannot open log files in " << config_.log_path << std::endl;
            if (frame_file.is_open() && config_.log_format == "csv")
                frame_file << csvHeader() << "\n";
        }

        while (true)
        {
            std::queue<QueuedEntry> temp_queue;
            bool stopping = should_stop_;
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                temp_queue.swap(log_queue_);
            }

            while (!temp_queue.empty())
            {
                const auto &entry = temp_queue.front();
                if (entry.is_alarm)
                {
                    std::string json_entry = alarmEventToJson(entry.event).dump();
                    if (event_file.is_open())
                        event_file << json_entry << "\n";
                    alarms_logged_++;
                    publishMessage(MessagePublisher::topicFor(alarmTypeToString(entry.event.type)), json_entry);
                }
                else if (frame_file.is_open())
                {
                    if (config_.log_format == "csv")
                        frame_file << frameRecordToCsvRow(entry.record) << "\n";
                    else
                        frame_file << frameRecordToJson(entry.record).dump() << "\n";
                    frames_logged_++;
                }
                temp_queue.pop();
            }

            frame_file.flush();
            event_file.flush();

            // the queue was drained after the stop flag was seen
            if (stopping)
                break;
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }

    void Logger::publishMessage(const std::string &topic, const std::string &json_entry)
    {
        if (message_publisher_ && message_publisher_->isReady())
        {
            message_publisher_->publish(topic, json_entry);
        }
    }

    void Logger::getStats(size_t &frames_logged, size_t &alarms_logged, size_t &images_saved,
                          size_t &messages_sent, size_t &messages_failed) const
    {
        frames_logged = frames_logged_;
        alarms_logged = alarms_logged_;
        images_saved = images_saved_;

        if (message_publisher_)
        {
            message_publisher_->getStats(messages_sent, messages_failed);
        }
        else
        {
            messages_sent = 0;
            messages_failed = 0;
        }
    }

    std::string Logger::formatLogTimestamp(const std::chrono::system_clock::time_point &tp)
    {
        std::time_t time_t = std::chrono::system_clock::to_time_t(tp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
        std::stringstream ss;
        ss << std::put_time(std::localtime(&time_t), "%Y-%m-%dT%H:%M:%S");
        ss << "." << std::setw(3) << std::setfill('0') << ms.count();
        return ss.str();
    }

    std::string Logger::alarmTypeToString(AlarmType type)
    {
        switch (type)
        {
        case AlarmType::OUT_OF_FRAME:
            return "OUT_OF_FRAME";
        case AlarmType::DROWSINESS:
            return "DROWSINESS";
        default:
            return "UNKNOWN";
        }
    }

    nlohmann::ordered_json Logger::frameRecordToJson(const FrameRecord &record)
    {
        nlohmann::ordered_json j;
        j["timestamp"] = formatLogTimestamp(record.timestamp);
        j["tracker_method"] = record.tracker_method;
        j["left_pupil"] = record.left_pupil ? nlohmann::ordered_json::array({record.left_pupil->x, record.left_pupil->y})
                                            : nlohmann::ordered_json(nullptr);
        j["right_pupil"] = record.right_pupil ? nlohmann::ordered_json::array({record.right_pupil->x, record.right_pupil->y})
                                              : nlohmann::ordered_json(nullptr);
        j["left_pupil_diameter"] = record.left_diameter ? nlohmann::ordered_json(*record.left_diameter) : nlohmann::ordered_json(nullptr);
        j["right_pupil_diameter"] = record.right_diameter ? nlohmann::ordered_json(*record.right_diameter) : nlohmann::ordered_json(nullptr);
        j["eye_state"] = eyeStateToInt(record.eye_state);
        j["drowsiness_score"] = record.drowsiness_score;
        j["fps"] = record.fps;
        j["face_detected"] = record.face_detected;
        j["processing_latency_ms"] = record.processing_latency_ms;
        return j;
    }

    nlohmann::ordered_json Logger::alarmEventToJson(const AlarmEvent &event)
    {
        nlohmann::ordered_json j;
        j["timestamp"] = formatLogTimestamp(event.timestamp);
        j["alarm"] = alarmTypeToString(event.type);
        j["active"] = event.active;
        j["drowsiness_score"] = event.drowsiness_score;
        if (!event.image_filename.empty())
            j["image"] = event.image_filename;
        return j;
    }

    std::string Logger::csvHeader()
    {
        return "timestamp,tracker_method,left_pupil_x,left_pupil_y,right_pupil_x,right_pupil_y,"
               "left_pupil_diameter,right_pupil_diameter,eye_state,drowsiness_score,fps,"
               "face_detected,processing_latency_ms";
    }

    std::string Logger::frameRecordToCsvRow(const FrameRecord &record)
    {
        std::ostringstream row;
        row << formatLogTimestamp(record.timestamp) << ","
            << record.tracker_method << ",";
        if (record.left_pupil)
            row << record.left_pupil->x << "," << record.left_pupil->y << ",";
        else
            row << ",,";
        if (record.right_pupil)
            row << record.right_pupil->x << "," << record.right_pupil->y << ",";
        else
            row << ",,";
        row << optionalToCsv(record.left_diameter, 3) << ","
            << optionalToCsv(record.right_diameter, 3) << ","
            << eyeStateToInt(record.eye_state) << ","
            << CVUtils::formatDouble(record.drowsiness_score, 4) << ","
            << CVUtils::formatDouble(record.fps, 2) << ","
            << (record.face_detected ? 1 : 0) << ","
            << CVUtils::formatDouble(record.processing_latency_ms, 3);
        return row.str();
    }
}
