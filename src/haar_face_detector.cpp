#include "../include/haar_face_detector.h"
#include "../include/constants.h"
#include <iostream>
#include <algorithm>
#include <vector>

namespace GazeGuard
{
    bool HaarFaceDetector::initialize(const Config &config)
    {
        try
        {
            if (!face_cascade_.load(config.face_cascade_path))
            {
                std::cerr << "HaarFaceDetector: Failed to load cascade " << config.face_cascade_path << std::endl;
                return false;
            }
            is_initialized_ = true;
            return true;
        }
        catch (const cv::Exception &e)
        {
            std::cerr << "HaarFaceDetector: Error loading cascade: " << e.what() << std::endl;
            return false;
        }
    }

    std::optional<cv::Rect> HaarFaceDetector::detectFace(const cv::Mat &frame)
    {
        if (!is_initialized_ || frame.empty())
            return std::nullopt;

        try
        {
            cv::Mat gray;
            if (frame.channels() == 3)
                cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
            else
                gray = frame.clone();
            cv::equalizeHist(gray, gray);

            std::vector<cv::Rect> faces;
            face_cascade_.detectMultiScale(gray, faces, 1.1, 3, 0, cv::Size(60, 60));
            if (faces.empty())
                return std::nullopt;

            cv::Rect face = *std::max_element(faces.begin(), faces.end(),
                                              [](const cv::Rect &a, const cv::Rect &b)
                                              {
                                                  return a.area() < b.area();
                                              });
            return face & cv::Rect(0, 0, frame.cols, frame.rows);
        }
        catch (const cv::Exception &e)
        {
            std::cerr << "HaarFaceDetector: Error in face detection: " << e.what() << std::endl;
            return std::nullopt;
        }
    }

    cv::Rect HaarFaceDetector::eyeBox(const cv::Rect &face, EyeSide side, const cv::Size &frame_size)
    {
        int width = static_cast<int>(face.width * EyeRegionConstants::EYE_WIDTH);
        int height = static_cast<int>(face.height * EyeRegionConstants::EYE_HEIGHT);
        int inset = static_cast<int>(face.width * EyeRegionConstants::EYE_SIDE_INSET);
        int y = face.y + static_cast<int>(face.height * EyeRegionConstants::EYE_TOP);

        // Subject's left eye appears on the right of the image
        int x = side == EyeSide::LEFT ? face.x + face.width - inset - width : face.x + inset;
        return cv::Rect(x, y, width, height) & cv::Rect(cv::Point(0, 0), frame_size);
    }

    EyeRegions HaarFaceDetector::detectEyes(const cv::Mat &frame, const cv::Rect &face)
    {
        EyeRegions regions;
        if (frame.empty())
            return regions;

        cv::Mat gray;
        if (frame.channels() == 3)
            cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
        else
            gray = frame;

        for (EyeSide side : {EyeSide::LEFT, EyeSide::RIGHT})
        {
            cv::Rect box = eyeBox(face, side, frame.size());
            if (box.area() == 0)
                continue;

            EyeRegion region;
            region.image = gray(box).clone();
            region.origin = box.tl();
            region.side = side;
            if (side == EyeSide::LEFT)
                regions.left = region;
            else
                regions.right = region;
        }
        return regions;
    }
}
