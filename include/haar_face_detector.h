#ifndef GAZE_GUARD_HAAR_FACE_DETECTOR_H
#define GAZE_GUARD_HAAR_FACE_DETECTOR_H

#include <string>
#include <opencv2/opencv.hpp>
#include <opencv2/objdetect.hpp>
#include "tracker.h"

namespace GazeGuard
{
    // "haar" backend: cascade face detector, eye boxes placed by face geometry.
    class HaarFaceDetector : public Tracker
    {
    private:
        cv::CascadeClassifier face_cascade_;
        bool is_initialized_ = false;

    public:
        std::string name() const override { return "haar"; }
        bool initialize(const Config &config) override;

        std::optional<cv::Rect> detectFace(const cv::Mat &frame) override;
        EyeRegions detectEyes(const cv::Mat &frame, const cv::Rect &face) override;

        // Eye box inside `face` for one side, clipped to `frame_size`.
        static cv::Rect eyeBox(const cv::Rect &face, EyeSide side, const cv::Size &frame_size);
    };
}

#endif // GAZE_GUARD_HAAR_FACE_DETECTOR_H
