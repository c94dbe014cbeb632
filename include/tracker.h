#ifndef GAZE_GUARD_TRACKER_H
#define GAZE_GUARD_TRACKER_H

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/opencv.hpp>
#include "config.h"
#include "eye_types.h"

namespace GazeGuard
{
    struct EyeRegions
    {
        std::optional<EyeRegion> left;
        std::optional<EyeRegion> right;
    };

    /**
     * @brief Face and eye detection backend
     *
     * detectFace() runs first on every frame; the other calls refer to the face
     * it found. The optional capabilities return std::nullopt when a backend
     * cannot provide them.
     */
    class Tracker
    {
    public:
        virtual ~Tracker() = default;

        virtual std::string name() const = 0;
        virtual bool initialize(const Config &config) = 0;

        virtual std::optional<cv::Rect> detectFace(const cv::Mat &frame) = 0;
        virtual EyeRegions detectEyes(const cv::Mat &frame, const cv::Rect &face) = 0;

        // Coarse open/closed from the backend's own model.
        virtual std::optional<EyeState> getEyeState(const EyeRegion &eye)
        {
            (void)eye;
            return std::nullopt;
        }

        // Pupil center local to the eye region returned by detectEyes().
        virtual std::optional<PupilHint> getPupilLocation(const cv::Mat &frame, const cv::Rect &face, EyeSide side)
        {
            (void)frame;
            (void)face;
            (void)side;
            return std::nullopt;
        }
    };

    // Name -> factory table of tracker backends.
    class TrackerRegistry
    {
    public:
        using Factory = std::function<std::unique_ptr<Tracker>()>;

        // Registry preloaded with the built-in backends ("dlib", "haar").
        static TrackerRegistry &instance();

        void registerTracker(const std::string &name, Factory factory);

        // Throws ConfigurationError for unknown names.
        std::unique_ptr<Tracker> create(const std::string &name) const;

        std::vector<std::string> available() const;
        bool contains(const std::string &name) const;

    private:
        std::map<std::string, Factory> factories_;
    };
}

#endif // GAZE_GUARD_TRACKER_H
