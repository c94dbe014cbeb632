#ifndef GAZE_GUARD_PUPIL_LOCATOR_H
#define GAZE_GUARD_PUPIL_LOCATOR_H

#include <optional>
#include <vector>
#include <opencv2/opencv.hpp>
#include "config.h"
#include "eye_types.h"

namespace GazeGuard
{
    /**
     * @brief Finds the pupil inside a cropped eye image and estimates its diameter
     *
     * Blind mode searches the lower part of the eye for a dark, roughly circular
     * blob. Hinted mode trusts an external center and only measures the diameter
     * of the blob under it. Coordinates are always local to the eye image.
     */
    class PupilLocator
    {
    private:
        PupilConfig config_;

        struct Candidate
        {
            std::vector<cv::Point> contour;
            double area;
            cv::Point2f centroid;
        };

        std::optional<PupilEstimate> locateBlind(const cv::Mat &gray, int threshold) const;
        PupilEstimate locateHinted(const cv::Mat &gray, int threshold, const cv::Point2f &hint) const;
        std::vector<Candidate> filterCandidates(const std::vector<std::vector<cv::Point>> &contours,
                                                const cv::Size &region) const;
        double scoreCandidate(const Candidate &candidate, const cv::Size &region) const;

    public:
        explicit PupilLocator(const PupilConfig &config);

        /**
         * @brief Locate the pupil in an eye image
         * @param eye_image grayscale or BGR eye crop
         * @param threshold intensity ceiling for pupil pixels, 255 disables it
         * @param hint optional pupil center from an external landmark source
         * @return estimate, or std::nullopt when nothing usable was found
         */
        std::optional<PupilEstimate> locate(const cv::Mat &eye_image, int threshold,
                                            const std::optional<cv::Point2f> &hint = std::nullopt) const;

        // Binary foreground mask: bilateral filter, adaptive threshold, close then open.
        static cv::Mat binarize(const cv::Mat &gray, int threshold);

        // Mean of circle, bounding box, equal-area and ellipse diameters; absent if all are zero.
        static std::optional<double> estimateDiameter(const std::vector<cv::Point> &contour);

        // Index of the contour containing `hint` (boundary included), else of the
        // nearest one within `max_distance` pixels.
        static std::optional<size_t> selectContourForHint(const std::vector<std::vector<cv::Point>> &contours,
                                                          const cv::Point2f &hint, double max_distance);

        const PupilConfig &getConfig() const { return config_; }
    };
}

#endif // GAZE_GUARD_PUPIL_LOCATOR_H
