#ifndef GAZE_GUARD_FACIAL_LANDMARK_DETECTOR_H
#define GAZE_GUARD_FACIAL_LANDMARK_DETECTOR_H

#include <string>
#include <vector>
#include <opencv2/opencv.hpp>
#include <dlib/opencv.h>
#include <dlib/image_processing/frontal_face_detector.h>
#include <dlib/image_processing.h>
#include "tracker.h"

namespace GazeGuard
{
    // "dlib" backend: HOG face detector + 68-point shape predictor.
    class FacialLandmarkDetector : public Tracker
    {
    private:
        dlib::frontal_face_detector face_detector_;
        dlib::shape_predictor landmark_predictor_;
        bool is_initialized_ = false;
        double ear_threshold_ = 0.22;

        // Landmarks of the last detected face, frame coordinates
        bool have_landmarks_ = false;
        std::vector<cv::Point2f> left_eye_points_;
        std::vector<cv::Point2f> right_eye_points_;
        cv::Point left_origin_;
        cv::Point right_origin_;
        bool have_regions_ = false;

        void extractEyePoints(const dlib::full_object_detection &landmarks, int start, int end,
                              std::vector<cv::Point2f> &eye_points);
        EyeRegion cropEye(const cv::Mat &gray, const std::vector<cv::Point2f> &eye_points, EyeSide side) const;
        const std::vector<cv::Point2f> &eyePoints(EyeSide side) const;

    public:
        std::string name() const override { return "dlib"; }
        bool initialize(const Config &config) override;

        std::optional<cv::Rect> detectFace(const cv::Mat &frame) override;
        EyeRegions detectEyes(const cv::Mat &frame, const cv::Rect &face) override;
        std::optional<EyeState> getEyeState(const EyeRegion &eye) override;
        std::optional<PupilHint> getPupilLocation(const cv::Mat &frame, const cv::Rect &face, EyeSide side) override;
    };
}

#endif // GAZE_GUARD_FACIAL_LANDMARK_DETECTOR_H
