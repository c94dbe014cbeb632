#include "../include/config.h"
#include "../include/constants.h"
#include <cmath>
#include <fstream>
#include <vector>
#include <nlohmann/json.hpp>

namespace GazeGuard
{
    namespace
    {
        void require(bool condition, const std::string &message)
        {
            if (!condition)
                throw ConfigurationError(message);
        }

        bool isRatio(double value)
        {
            return value >= 0.0 && value <= 1.0;
        }

        bool isDuration(double seconds)
        {
            return std::isfinite(seconds) && seconds >= 0.0 && seconds <= Constants::MAX_DURATION_SECONDS;
        }

        template <typename T>
        void readField(const nlohmann::json &section, const char *key, T &field)
        {
            if (section.contains(key))
                field = section.at(key).get<T>();
        }

        cv::Scalar readColor(const nlohmann::json &section, const char *key, const cv::Scalar &fallback)
        {
            if (!section.contains(key))
                return fallback;
            std::vector<double> bgr = section.at(key).get<std::vector<double>>();
            if (bgr.size() != 3)
                throw ConfigurationError(std::string("Color '") + key + "' must have 3 components (B, G, R)");
            return cv::Scalar(bgr[0], bgr[1], bgr[2]);
        }
    }

    void PupilConfig::validate() const
    {
        require(detection_threshold >= 0 && detection_threshold <= 255,
                "pupil.detection_threshold must be in [0, 255]");
        require(search_top_margin >= 0.0 && search_top_margin < 1.0,
                "pupil.search_top_margin must be in [0, 1)");
        require(isRatio(min_area_ratio) && isRatio(max_area_ratio) && min_area_ratio <= max_area_ratio,
                "pupil area ratios must satisfy 0 <= min <= max <= 1");
        require(max_center_offset >= 0.0, "pupil.max_center_offset must be >= 0");
        require(min_circularity >= 0.0, "pupil.min_circularity must be >= 0");
        require(hint_max_distance >= 0.0, "pupil.hint_max_distance must be >= 0");
    }

    void EyeStateConfig::validate() const
    {
        require(ear_threshold_closed >= 0.0, "eye_state.ear_threshold_closed must be >= 0");
        require(histogram_threshold >= 0.0, "eye_state.histogram_threshold must be >= 0");
        require(isRatio(contour_area_threshold), "eye_state.contour_area_threshold must be in [0, 1]");
    }

    void SafetyConfig::validate() const
    {
        require(out_of_frame_threshold >= 1, "safety.out_of_frame_threshold must be >= 1");
        require(isRatio(perclos_threshold), "safety.perclos_threshold must be in [0, 1]");
        require(window_size >= 1, "safety.window_size must be >= 1");
        require(isDuration(sustained_seconds), "safety.sustained_seconds must be in [0, 1e9]");
        require(isDuration(cooldown_seconds), "safety.cooldown_seconds must be in [0, 1e9]");
    }

    void Config::validate() const
    {
        pupil.validate();
        eye_state.validate();
        safety.validate();
        require(tracker_type.size() > 0, "tracker_type must not be empty");
        require(tracker_ear_threshold >= 0.0, "tracker_ear_threshold must be >= 0");
        require(fps_window_size >= 1, "fps_window_size must be >= 1");
        require(log_format == "jsonl" || log_format == "csv", "log_format must be 'jsonl' or 'csv'");
    }

    Config loadConfig(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
            throw ConfigurationError("Cannot open config file: " + path);

        Config config;
        try
        {
            nlohmann::json root = nlohmann::json::parse(file);

            if (root.contains("pupil"))
            {
                const auto &p = root.at("pupil");
                readField(p, "detection_threshold", config.pupil.detection_threshold);
                readField(p, "search_top_margin", config.pupil.search_top_margin);
                readField(p, "min_area_ratio", config.pupil.min_area_ratio);
                readField(p, "max_area_ratio", config.pupil.max_area_ratio);
                readField(p, "max_center_offset", config.pupil.max_center_offset);
                readField(p, "min_circularity", config.pupil.min_circularity);
                readField(p, "hint_max_distance", config.pupil.hint_max_distance);
            }
            if (root.contains("eye_state"))
            {
                const auto &e = root.at("eye_state");
                readField(e, "ear_threshold_closed", config.eye_state.ear_threshold_closed);
                readField(e, "use_tracker_eye_state", config.eye_state.use_tracker_eye_state);
                readField(e, "use_multi_method_detection", config.eye_state.use_multi_method_detection);
                readField(e, "histogram_threshold", config.eye_state.histogram_threshold);
                readField(e, "contour_area_threshold", config.eye_state.contour_area_threshold);
            }
            if (root.contains("safety"))
            {
                const auto &s = root.at("safety");
                readField(s, "out_of_frame_threshold", config.safety.out_of_frame_threshold);
                readField(s, "perclos_threshold", config.safety.perclos_threshold);
                readField(s, "window_size", config.safety.window_size);
                readField(s, "sustained_seconds", config.safety.sustained_seconds);
                readField(s, "cooldown_seconds", config.safety.cooldown_seconds);
            }

            readField(root, "tracker_type", config.tracker_type);
            readField(root, "model_path", config.model_path);
            readField(root, "face_cascade_path", config.face_cascade_path);
            readField(root, "tracker_ear_threshold", config.tracker_ear_threshold);
            readField(root, "use_tracker_pupil_hint", config.use_tracker_pupil_hint);
            readField(root, "video_path", config.video_path);
            readField(root, "camera_index", config.camera_index);
            readField(root, "frame_width", config.frame_width);
            readField(root, "frame_height", config.frame_height);
            readField(root, "capture_fps", config.capture_fps);
            readField(root, "fps_window_size", config.fps_window_size);
            readField(root, "enable_console_logging", config.enable_console_logging);
            readField(root, "enable_file_logging", config.enable_file_logging);
            readField(root, "save_snapshots", config.save_snapshots);
            readField(root, "log_format", config.log_format);
            readField(root, "snapshot_path", config.snapshot_path);
            readField(root, "log_path", config.log_path);
            readField(root, "frame_log_basename", config.frame_log_basename);
            readField(root, "event_log_filename", config.event_log_filename);
            readField(root, "zmq_endpoint", config.zmq_endpoint);
            readField(root, "enable_publishing", config.enable_publishing_);
            readField(root, "show_window", config.show_window);
            readField(root, "show_annotations", config.show_annotations);
            readField(root, "show_debug_info", config.show_debug_info);
            config.pupil_color = readColor(root, "pupil_color", config.pupil_color);
            config.eye_center_color = readColor(root, "eye_center_color", config.eye_center_color);
            config.alert_color = readColor(root, "alert_color", config.alert_color);
            config.danger_color = readColor(root, "danger_color", config.danger_color);
        }
        catch (const nlohmann::json::exception &e)
        {
            throw ConfigurationError("Invalid config file " + path + ": " + e.what());
        }

        config.validate();
        return config;
    }
}
