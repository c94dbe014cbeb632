#include "../include/pupil_locator.h"
#include "../include/constants.h"
#include <iostream>
#include <cmath>
#include <limits>
#include <algorithm>

namespace GazeGuard
{
    PupilLocator::PupilLocator(const PupilConfig &config) : config_(config)
    {
        config_.validate();
    }

    std::optional<PupilEstimate> PupilLocator::locate(const cv::Mat &eye_image, int threshold,
                                                      const std::optional<cv::Point2f> &hint) const
    {
        if (eye_image.empty() || eye_image.rows == 0 || eye_image.cols == 0)
            return std::nullopt;

        try
        {
            cv::Mat gray;
            if (eye_image.channels() == 3)
                cv::cvtColor(eye_image, gray, cv::COLOR_BGR2GRAY);
            else
                gray = eye_image;

            if (gray.depth() != CV_8U)
                gray.convertTo(gray, CV_8U);

            if (hint)
                return locateHinted(gray, threshold, *hint);
            return locateBlind(gray, threshold);
        }
        catch (const cv::Exception &e)
        {
            std::cerr << "PupilLocator: Error while locating pupil: " << e.what() << std::endl;
            return std::nullopt;
        }
    }

    cv::Mat PupilLocator::binarize(const cv::Mat &gray, int threshold)
    {
        cv::Mat filtered;
        cv::bilateralFilter(gray, filtered, PupilConstants::BILATERAL_DIAMETER,
                            PupilConstants::BILATERAL_SIGMA, PupilConstants::BILATERAL_SIGMA);

        cv::Mat binary;
        cv::adaptiveThreshold(filtered, binary, Constants::MAX_PIXEL_VALUE, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                              cv::THRESH_BINARY_INV, PupilConstants::ADAPTIVE_BLOCK_SIZE,
                              PupilConstants::ADAPTIVE_OFFSET);

        if (threshold < Constants::MAX_PIXEL_VALUE)
        {
            cv::Mat dark;
            cv::threshold(filtered, dark, threshold, Constants::MAX_PIXEL_VALUE, cv::THRESH_BINARY_INV);
            cv::bitwise_and(binary, dark, binary);
        }

        cv::Mat kernel = cv::Mat::ones(PupilConstants::MORPH_KERNEL_SIZE, PupilConstants::MORPH_KERNEL_SIZE, CV_8U);
        cv::morphologyEx(binary, binary, cv::MORPH_CLOSE, kernel, cv::Point(-1, -1), PupilConstants::CLOSE_ITERATIONS);
        cv::morphologyEx(binary, binary, cv::MORPH_OPEN, kernel, cv::Point(-1, -1), PupilConstants::OPEN_ITERATIONS);
        return binary;
    }

    std::optional<PupilEstimate> PupilLocator::locateBlind(const cv::Mat &gray, int threshold) const
    {
        int top_margin = static_cast<int>(gray.rows * config_.search_top_margin);
        if (top_margin >= gray.rows)
            return std::nullopt;

        cv::Mat roi = gray(cv::Rect(0, top_margin, gray.cols, gray.rows - top_margin));
        cv::Mat binary = binarize(roi, threshold);

        std::vector<std::vector<cv::Point>> contours;
        cv::findContours(binary, contours, cv::RETR_TREE, cv::CHAIN_APPROX_NONE);
        if (contours.empty())
            return std::nullopt;

        std::vector<Candidate> candidates = filterCandidates(contours, roi.size());
        if (candidates.empty())
            return std::nullopt;

        const Candidate *best = nullptr;
        double best_score = -std::numeric_limits<double>::infinity();
        for (const auto &candidate : candidates)
        {
            double score = scoreCandidate(candidate, roi.size());
            if (score > best_score)
            {
                best_score = score;
                best = &candidate;
            }
        }

        PupilEstimate estimate;
        estimate.center = cv::Point2f(best->centroid.x, best->centroid.y + top_margin);
        estimate.diameter = estimateDiameter(best->contour);
        return estimate;
    }

    std::vector<PupilLocator::Candidate> PupilLocator::filterCandidates(
        const std::vector<std::vector<cv::Point>> &contours, const cv::Size &region) const
    {
        std::vector<Candidate> candidates;
        double region_area = static_cast<double>(region.area());
        double min_area = region_area * config_.min_area_ratio;
        double max_area = region_area * config_.max_area_ratio;
        double center_x = region.width / 2.0;
        double max_offset = config_.max_center_offset * (region.width / 2.0);

        for (const auto &contour : contours)
        {
            double area = cv::contourArea(contour);
            if (area < min_area || area > max_area)
                continue;

            cv::Moments m = cv::moments(contour);
            if (std::abs(m.m00) < Constants::EPSILON)
                continue;
            cv::Point2f centroid(static_cast<float>(m.m10 / m.m00), static_cast<float>(m.m01 / m.m00));

            if (std::abs(centroid.x - center_x) > max_offset)
                continue;

            double perimeter = cv::arcLength(contour, true);
            if (perimeter < Constants::EPSILON)
                continue;

            double circularity = 4.0 * CV_PI * area / (perimeter * perimeter);
            if (circularity < config_.min_circularity)
                continue;

            candidates.push_back({contour, area, centroid});
        }
        return candidates;
    }

    double PupilLocator::scoreCandidate(const Candidate &candidate, const cv::Size &region) const
    {
        double half_w = region.width * 0.5;
        double half_h = region.height * 0.5;
        double dx = std::abs(candidate.centroid.x - half_w) / half_w;
        double dy = std::abs(candidate.centroid.y - half_h) / half_h;
        double centrality = std::max(0.0, 1.0 - (dx + dy) / 2.0);

        // centrality is scaled to the area range so both terms weigh comparably
        double max_area = region.area() * config_.max_area_ratio;
        return candidate.area * PupilConstants::AREA_WEIGHT +
               centrality * max_area * PupilConstants::CENTRALITY_WEIGHT;
    }

    PupilEstimate PupilLocator::locateHinted(const cv::Mat &gray, int threshold, const cv::Point2f &hint) const
    {
        PupilEstimate estimate;
        estimate.center = hint;

        cv::Mat binary = binarize(gray, threshold);
        std::vector<std::vector<cv::Point>> contours;
        cv::findContours(binary, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

        std::optional<size_t> index = selectContourForHint(contours, hint, config_.hint_max_distance);
        if (index)
            estimate.diameter = estimateDiameter(contours[*index]);
        return estimate;
    }

    std::optional<size_t> PupilLocator::selectContourForHint(const std::vector<std::vector<cv::Point>> &contours,
                                                             const cv::Point2f &hint, double max_distance)
    {
        std::optional<size_t> closest;
        double min_distance = std::numeric_limits<double>::infinity();

        for (size_t i = 0; i < contours.size(); ++i)
        {
            if (contours[i].empty())
                continue;

            // signed distance: positive inside, zero on the boundary
            double distance = cv::pointPolygonTest(contours[i], hint, true);
            if (distance >= 0.0)
                return i;

            if (-distance < min_distance)
            {
                min_distance = -distance;
                closest = i;
            }
        }

        if (closest && min_distance <= max_distance)
            return closest;
        return std::nullopt;
    }

    std::optional<double> PupilLocator::estimateDiameter(const std::vector<cv::Point> &contour)
    {
        if (contour.empty())
            return std::nullopt;

        cv::Point2f circle_center;
        float radius = 0.0f;
        cv::minEnclosingCircle(contour, circle_center, radius);
        double diameter_circle = 2.0 * radius;

        cv::Rect box = cv::boundingRect(contour);
        double diameter_box = std::max(box.width, box.height);

        double area = cv::contourArea(contour);
        double diameter_area = area > 0.0 ? 2.0 * std::sqrt(area / CV_PI) : 0.0;

        double diameter_ellipse = diameter_circle;
        if (contour.size() >= static_cast<size_t>(PupilConstants::MIN_ELLIPSE_POINTS))
        {
            try
            {
                cv::RotatedRect ellipse = cv::fitEllipse(contour);
                diameter_ellipse = std::max(ellipse.size.width, ellipse.size.height);
            }
            catch (const cv::Exception &)
            {
                diameter_ellipse = diameter_circle;
            }
        }

        double sum = 0.0;
        int count = 0;
        for (double d : {diameter_circle, diameter_box, diameter_area, diameter_ellipse})
        {
            if (d > 0.0 && std::isfinite(d))
            {
                sum += d;
                ++count;
            }
        }

        if (count == 0)
            return std::nullopt;
        return sum / count;
    }
}
