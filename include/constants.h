#ifndef GAZE_GUARD_CONSTANTS_H
#define GAZE_GUARD_CONSTANTS_H

namespace GazeGuard
{
    namespace Constants
    {
        constexpr int ESC_KEY = 27;
        constexpr int WAIT_KEY_MS = 1;
        constexpr double EPSILON = 1e-6;
        constexpr int MAX_LOG_ENTRIES = 1000;
        constexpr int FACE_LANDMARK_COUNT = 68;
        constexpr int MAX_PIXEL_VALUE = 255;
        // Longest accepted sustained/cooldown duration, well inside steady_clock's range
        constexpr double MAX_DURATION_SECONDS = 1.0e9;
    }

    namespace LandmarkIndices
    {
        // dlib 68-point model, subject's left eye is on the image right
        constexpr int LEFT_EYE_START = 42, LEFT_EYE_END = 47;
        constexpr int RIGHT_EYE_START = 36, RIGHT_EYE_END = 41;
    }

    namespace PupilConstants
    {
        constexpr int BILATERAL_DIAMETER = 9;
        constexpr double BILATERAL_SIGMA = 75.0;
        constexpr int ADAPTIVE_BLOCK_SIZE = 11;
        constexpr double ADAPTIVE_OFFSET = 2.0;
        constexpr int MORPH_KERNEL_SIZE = 3;
        constexpr int CLOSE_ITERATIONS = 2;
        constexpr int OPEN_ITERATIONS = 1;
        constexpr int MIN_ELLIPSE_POINTS = 5;
        constexpr double AREA_WEIGHT = 0.7;
        constexpr double CENTRALITY_WEIGHT = 0.3;
    }

    namespace EyeRegionConstants
    {
        constexpr int LANDMARK_MARGIN = 5;
        // Haar backend: eye boxes as fractions of the face box
        constexpr double EYE_TOP = 0.25;
        constexpr double EYE_HEIGHT = 0.22;
        constexpr double EYE_SIDE_INSET = 0.13;
        constexpr double EYE_WIDTH = 0.30;
    }
}

#endif // GAZE_GUARD_CONSTANTS_H
