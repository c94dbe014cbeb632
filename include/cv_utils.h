#ifndef GAZE_GUARD_CV_UTILS_H
#define GAZE_GUARD_CV_UTILS_H

#include <vector>
#include <string>
#include <opencv2/opencv.hpp>
#include "config.h"
#include "safety_monitor.h"

namespace GazeGuard
{
    namespace CVUtils
    {
        // Landmark Eye Aspect Ratio over the 6 dlib eye points, 0 on bad input.
        double calculateEAR(const std::vector<cv::Point2f> &eye_points);
        cv::Scalar getStatusColor(const SafetyStatus &status, const Config &config);
        std::string formatDouble(double value, int precision = 3);
    }
}

#endif // GAZE_GUARD_CV_UTILS_H
