#ifndef GAZE_GUARD_CONFIG_H
#define GAZE_GUARD_CONFIG_H

#include <string>
#include <stdexcept>
#include <opencv2/opencv.hpp>

namespace GazeGuard
{
    // Thrown for invalid construction parameters, before any frame is processed.
    class ConfigurationError : public std::invalid_argument
    {
    public:
        explicit ConfigurationError(const std::string &what) : std::invalid_argument(what) {}
    };

    struct PupilConfig
    {
        // Intensity ceiling for pupil pixels (255 = no ceiling)
        int detection_threshold = 255;
        double search_top_margin = 0.4;  // skip eyebrow/shadow band
        double min_area_ratio = 0.01;
        double max_area_ratio = 0.3;
        double max_center_offset = 0.4;  // fraction of the half-width
        double min_circularity = 0.3;
        double hint_max_distance = 5.0;  // pixels

        void validate() const;
    };

    struct EyeStateConfig
    {
        double ear_threshold_closed = 0.02;
        bool use_tracker_eye_state = false;
        bool use_multi_method_detection = false;
        double histogram_threshold = 0.2;
        double contour_area_threshold = 0.05;

        void validate() const;
    };

    struct SafetyConfig
    {
        int out_of_frame_threshold = 5;   // consecutive frames without a face
        double perclos_threshold = 0.7;
        int window_size = 120;            // PERCLOS samples
        double sustained_seconds = 3.0;
        double cooldown_seconds = 10.0;

        void validate() const;
    };

    struct Config
    {
        PupilConfig pupil;
        EyeStateConfig eye_state;
        SafetyConfig safety;

        // Tracker backend
        std::string tracker_type = "dlib";
        std::string model_path = "models/shape_predictor_68_face_landmarks.dat";
        std::string face_cascade_path = "models/haarcascade_frontalface_default.xml";
        double tracker_ear_threshold = 0.22;  // landmark EAR above this = open
        bool use_tracker_pupil_hint = false;  // hinted pupil mode from tracker landmarks

        // Video source: file path if it exists, otherwise the camera index
        std::string video_path = "";
        int camera_index = 0;
        int frame_width = 640;
        int frame_height = 480;
        int capture_fps = 30;

        // Performance
        int fps_window_size = 30;

        // logging options
        bool enable_console_logging = false;
        bool enable_file_logging = true;
        bool save_snapshots = true;
        std::string log_format = "jsonl"; // "jsonl" or "csv"

        // Paths
        std::string snapshot_path = "snapshots/";
        std::string log_path = "logs/";
        std::string frame_log_basename = "frames";
        std::string event_log_filename = "alarm_events.jsonl";

        // Zero Mq Configurations
        std::string zmq_endpoint = "tcp://*:5556";
        bool enable_publishing_ = false;

        // Display settings
        bool show_window = true;
        bool show_annotations = true;
        bool show_debug_info = true;
        cv::Scalar pupil_color = cv::Scalar(0, 255, 0);
        cv::Scalar eye_center_color = cv::Scalar(255, 255, 0);
        cv::Scalar alert_color = cv::Scalar(0, 255, 0);
        cv::Scalar danger_color = cv::Scalar(0, 0, 255);

        // Checks every section; throws ConfigurationError.
        void validate() const;
    };

    // Loads defaults overridden by the JSON object stored at `path`.
    Config loadConfig(const std::string &path);
}

#endif // GAZE_GUARD_CONFIG_H
