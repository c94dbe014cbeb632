#ifndef GAZE_GUARD_EYE_TYPES_H
#define GAZE_GUARD_EYE_TYPES_H

#include <optional>
#include <string>
#include <opencv2/opencv.hpp>

namespace GazeGuard
{
    // Encoded as 0 = closed, 1 = open in logs and the PERCLOS window.
    enum class EyeState
    {
        CLOSED = 0,
        OPEN = 1
    };

    enum class EyeSide
    {
        LEFT,
        RIGHT
    };

    struct EyeRegion
    {
        cv::Mat image;      // grayscale crop
        cv::Point origin;   // top-left corner in the parent frame
        EyeSide side = EyeSide::LEFT;

        bool isValid() const { return !image.empty() && image.rows > 0 && image.cols > 0; }
    };

    // Pupil position local to its eye region. A present diameter is always > 0.
    struct PupilEstimate
    {
        cv::Point2f center;
        std::optional<double> diameter;
    };

    // Pupil location reported by a tracker, local to the eye region.
    struct PupilHint
    {
        cv::Point2f center;
        std::optional<double> diameter;
    };

    inline int eyeStateToInt(EyeState state)
    {
        return state == EyeState::OPEN ? 1 : 0;
    }

    inline std::string eyeSideToString(EyeSide side)
    {
        return side == EyeSide::LEFT ? "left" : "right";
    }
}

#endif // GAZE_GUARD_EYE_TYPES_H
