#include "../include/facial_landmark_detector.h"
#include "../include/constants.h"
#include "../include/cv_utils.h"
#include <iostream>
#include <algorithm>

namespace GazeGuard
{
    bool FacialLandmarkDetector::initialize(const Config &config)
    {
        ear_threshold_ = config.tracker_ear_threshold;
        try
        {
            face_detector_ = dlib::get_frontal_face_detector();
            dlib::deserialize(config.model_path) >> landmark_predictor_;
            is_initialized_ = true;
            return true;
        }
        catch (const std::exception &e)
        {
            std::cerr << "FacialLandmarkDetector: Failed to initialize face detector: " << e.what() << std::endl;
            return false;
        }
    }

    std::optional<cv::Rect> FacialLandmarkDetector::detectFace(const cv::Mat &frame)
    {
        have_landmarks_ = false;
        have_regions_ = false;
        if (!is_initialized_ || frame.empty())
            return std::nullopt;

        try
        {
            cv::Mat bgr;
            if (frame.channels() == 1)
                cv::cvtColor(frame, bgr, cv::COLOR_GRAY2BGR);
            else
                bgr = frame;

            dlib::cv_image<dlib::bgr_pixel> dlib_img(bgr);
            std::vector<dlib::rectangle> faces = face_detector_(dlib_img);
            if (faces.empty())
                return std::nullopt;

            // Single subject: keep the largest face
            dlib::rectangle face = *std::max_element(faces.begin(), faces.end(),
                                                     [](const dlib::rectangle &a, const dlib::rectangle &b)
                                                     {
                                                         return a.area() < b.area();
                                                     });

            dlib::full_object_detection landmarks = landmark_predictor_(dlib_img, face);
            if (landmarks.num_parts() != Constants::FACE_LANDMARK_COUNT)
                return std::nullopt;

            extractEyePoints(landmarks, LandmarkIndices::LEFT_EYE_START, LandmarkIndices::LEFT_EYE_END, left_eye_points_);
            extractEyePoints(landmarks, LandmarkIndices::RIGHT_EYE_START, LandmarkIndices::RIGHT_EYE_END, right_eye_points_);
            have_landmarks_ = true;

            cv::Rect face_rect = cv::Rect(face.left(), face.top(), face.width(), face.height()) &
                                 cv::Rect(0, 0, frame.cols, frame.rows);
            if (face_rect.area() == 0)
                return std::nullopt;
            return face_rect;
        }
        catch (const std::exception &e)
        {
            std::cerr << "FacialLandmarkDetector: Error in face detection: " << e.what() << std::endl;
            have_landmarks_ = false;
            return std::nullopt;
        }
    }

    EyeRegions FacialLandmarkDetector::detectEyes(const cv::Mat &frame, const cv::Rect &face)
    {
        (void)face;
        EyeRegions regions;
        if (!have_landmarks_ || frame.empty())
            return regions;

        cv::Mat gray;
        if (frame.channels() == 3)
            cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
        else
            gray = frame;

        EyeRegion left = cropEye(gray, left_eye_points_, EyeSide::LEFT);
        EyeRegion right = cropEye(gray, right_eye_points_, EyeSide::RIGHT);
        left_origin_ = left.origin;
        right_origin_ = right.origin;
        have_regions_ = true;

        if (left.isValid())
            regions.left = left;
        if (right.isValid())
            regions.right = right;
        return regions;
    }

    EyeRegion FacialLandmarkDetector::cropEye(const cv::Mat &gray, const std::vector<cv::Point2f> &eye_points,
                                              EyeSide side) const
    {
        EyeRegion region;
        region.side = side;

        std::vector<cv::Point> polygon;
        for (const auto &p : eye_points)
            polygon.emplace_back(cvRound(p.x), cvRound(p.y));

        const int margin = EyeRegionConstants::LANDMARK_MARGIN;
        cv::Rect box = cv::boundingRect(polygon);
        box.x -= margin;
        box.y -= margin;
        box.width += 2 * margin;
        box.height += 2 * margin;
        box &= cv::Rect(0, 0, gray.cols, gray.rows);
        if (box.area() == 0)
            return region;

        // Black out skin and eyebrow around the eye polygon
        cv::Mat mask = cv::Mat::zeros(box.size(), CV_8U);
        std::vector<cv::Point> local;
        for (const auto &p : polygon)
            local.emplace_back(p.x - box.x, p.y - box.y);
        cv::fillPoly(mask, std::vector<std::vector<cv::Point>>{local}, cv::Scalar(255));

        region.image = cv::Mat::zeros(box.size(), CV_8U);
        gray(box).copyTo(region.image, mask);
        region.origin = box.tl();
        return region;
    }

    const std::vector<cv::Point2f> &FacialLandmarkDetector::eyePoints(EyeSide side) const
    {
        return side == EyeSide::LEFT ? left_eye_points_ : right_eye_points_;
    }

    std::optional<EyeState> FacialLandmarkDetector::getEyeState(const EyeRegion &eye)
    {
        if (!have_landmarks_)
            return std::nullopt;

        double ear = CVUtils::calculateEAR(eyePoints(eye.side));
        if (ear <= Constants::EPSILON)
            return std::nullopt;
        return ear > ear_threshold_ ? EyeState::OPEN : EyeState::CLOSED;
    }

    std::optional<PupilHint> FacialLandmarkDetector::getPupilLocation(const cv::Mat &frame, const cv::Rect &face,
                                                                      EyeSide side)
    {
        (void)frame;
        (void)face;
        if (!have_landmarks_ || !have_regions_)
            return std::nullopt;

        // No iris landmarks in the 68-point model: the eye contour centroid stands in
        const std::vector<cv::Point2f> &points = eyePoints(side);
        if (points.empty())
            return std::nullopt;

        cv::Point2f centroid(0.0f, 0.0f);
        for (const auto &p : points)
            centroid += p;
        centroid *= 1.0f / static_cast<float>(points.size());

        cv::Point origin = side == EyeSide::LEFT ? left_origin_ : right_origin_;
        PupilHint hint;
        hint.center = cv::Point2f(centroid.x - origin.x, centroid.y - origin.y);
        return hint;
    }

    void FacialLandmarkDetector::extractEyePoints(const dlib::full_object_detection &landmarks, int start, int end,
                                                  std::vector<cv::Point2f> &eye_points)
    {
        eye_points.clear();
        for (int i = start; i <= end; ++i)
        {
            eye_points.emplace_back(landmarks.part(i).x(), landmarks.part(i).y());
        }
    }
}
