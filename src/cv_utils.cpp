#include "../include/cv_utils.h"
#include "../include/constants.h"
#include <sstream>
#include <iomanip>

namespace GazeGuard
{
    namespace CVUtils
    {
        double calculateEAR(const std::vector<cv::Point2f> &eye_points)
        {
            if (eye_points.size() != 6)
                return 0.0;

            double vertical1 = cv::norm(eye_points[1] - eye_points[5]);
            double vertical2 = cv::norm(eye_points[2] - eye_points[4]);
            double horizontal = cv::norm(eye_points[0] - eye_points[3]);

            return (horizontal < Constants::EPSILON) ? 0.0 : (vertical1 + vertical2) / (2.0 * horizontal);
        }

        cv::Scalar getStatusColor(const SafetyStatus &status, const Config &config)
        {
            if (status.drowsiness_alarm || status.out_of_frame_alarm)
                return config.danger_color;
            return config.alert_color;
        }

        std::string formatDouble(double value, int precision)
        {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(precision) << value;
            return oss.str();
        }
    }
}
