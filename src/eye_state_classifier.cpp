#include "../include/eye_state_classifier.h"
#include "../include/constants.h"
#include <iostream>
#include <cmath>

namespace GazeGuard
{
    namespace
    {
        cv::Mat toGray(const cv::Mat &image)
        {
            cv::Mat gray;
            if (image.channels() == 3)
                cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
            else
                gray = image;
            if (gray.depth() != CV_8U)
                gray.convertTo(gray, CV_8U);
            return gray;
        }
    }

    EyeStateClassifier::EyeStateClassifier(const EyeStateConfig &config) : config_(config)
    {
        config_.validate();
        buildDecisionTable();
    }

    void EyeStateClassifier::buildDecisionTable()
    {
        const bool use_tracker = config_.use_tracker_eye_state;
        const bool multi_method = config_.use_multi_method_detection;

        rules_ = {
            {DecisionRule::PUPIL_LOCATED,
             [](const EyeEvidence &e)
             { return e.pupil_located; },
             EyeState::OPEN},
            {DecisionRule::TRACKER_OPEN,
             [use_tracker](const EyeEvidence &e)
             { return use_tracker && e.tracker_state == EyeState::OPEN; },
             EyeState::OPEN},
            // tracker CLOSED is never trusted on its own
            {DecisionRule::TRACKER_CLOSED_CONFIRMED,
             [this, use_tracker, multi_method](const EyeEvidence &e)
             {
                 return use_tracker && e.tracker_state == EyeState::CLOSED && opennessIndicatesClosed(e) &&
                        (!multi_method || secondaryCorroborates(e));
             },
             EyeState::CLOSED},
            {DecisionRule::OPENNESS_CLOSED,
             [this, multi_method](const EyeEvidence &e)
             { return !multi_method && opennessIndicatesClosed(e); },
             EyeState::CLOSED},
            {DecisionRule::OPENNESS_CLOSED_CORROBORATED,
             [this, multi_method](const EyeEvidence &e)
             { return multi_method && opennessIndicatesClosed(e) && secondaryCorroborates(e); },
             EyeState::CLOSED},
            {DecisionRule::DEFAULT_OPEN,
             [](const EyeEvidence &)
             { return true; },
             EyeState::OPEN},
        };
    }

    bool EyeStateClassifier::opennessIndicatesClosed(const EyeEvidence &evidence) const
    {
        return evidence.openness_ratio && *evidence.openness_ratio < config_.ear_threshold_closed;
    }

    bool EyeStateClassifier::secondaryCorroborates(const EyeEvidence &evidence) const
    {
        bool flat_histogram = evidence.histogram_variance &&
                              *evidence.histogram_variance < config_.histogram_threshold;
        bool little_foreground = evidence.contour_area_ratio &&
                                 *evidence.contour_area_ratio < config_.contour_area_threshold;
        return flat_histogram || little_foreground;
    }

    EyeEvidence EyeStateClassifier::gatherEvidence(const cv::Mat &eye_image, const std::optional<PupilEstimate> &pupil,
                                                   const std::optional<EyeState> &tracker_state) const
    {
        EyeEvidence evidence;
        evidence.pupil_located = pupil.has_value();
        evidence.tracker_state = tracker_state;

        if (eye_image.empty())
            return evidence;

        try
        {
            cv::Mat gray = toGray(eye_image);
            evidence.openness_ratio = opennessRatio(gray);
            if (config_.use_multi_method_detection)
            {
                evidence.histogram_variance = histogramVariance(gray);
                evidence.contour_area_ratio = contourAreaRatio(gray);
            }
        }
        catch (const cv::Exception &e)
        {
            std::cerr << "EyeStateClassifier: Error while analyzing eye image: " << e.what() << std::endl;
        }
        return evidence;
    }

    EyeStateDecision EyeStateClassifier::decide(const EyeEvidence &evidence) const
    {
        for (const auto &rule : rules_)
        {
            if (rule.matches(evidence))
                return {rule.verdict, rule.id};
        }
        return {EyeState::OPEN, DecisionRule::DEFAULT_OPEN};
    }

    EyeState EyeStateClassifier::classify(const cv::Mat &eye_image, const std::optional<PupilEstimate> &pupil,
                                          const std::optional<EyeState> &tracker_state) const
    {
        return decide(gatherEvidence(eye_image, pupil, tracker_state)).state;
    }

    EyeState EyeStateClassifier::fuse(EyeState left, EyeState right)
    {
        return (left == EyeState::CLOSED || right == EyeState::CLOSED) ? EyeState::CLOSED : EyeState::OPEN;
    }

    std::optional<double> EyeStateClassifier::opennessRatio(const cv::Mat &gray)
    {
        if (gray.empty() || gray.rows < 2 || gray.cols == 0)
            return std::nullopt;

        // one sum per row
        cv::Mat projection;
        cv::reduce(gray, projection, 1, cv::REDUCE_SUM, CV_64F);

        int mid = gray.rows / 2;
        double top_max = 0.0, bottom_max = 0.0;
        cv::minMaxLoc(projection.rowRange(0, mid), nullptr, &top_max);
        cv::minMaxLoc(projection.rowRange(mid, gray.rows), nullptr, &bottom_max);

        double mean = cv::mean(projection)[0];
        double vertical = std::abs(top_max - bottom_max) / (mean + Constants::EPSILON);
        double width = static_cast<double>(gray.cols);

        double ratio = vertical / (2.0 * width);
        return ratio * (gray.rows / width);
    }

    std::optional<double> EyeStateClassifier::histogramVariance(const cv::Mat &gray)
    {
        if (gray.empty())
            return std::nullopt;

        double max_value = 0.0;
        cv::minMaxLoc(gray, nullptr, &max_value);
        if (max_value <= 0.0)
            return std::nullopt;

        cv::Scalar mean, stddev;
        cv::meanStdDev(gray, mean, stddev);
        return (stddev[0] * stddev[0]) / (max_value + Constants::EPSILON);
    }

    std::optional<double> EyeStateClassifier::contourAreaRatio(const cv::Mat &gray)
    {
        if (gray.empty())
            return std::nullopt;

        cv::Mat binary;
        cv::threshold(gray, binary, 0, Constants::MAX_PIXEL_VALUE, cv::THRESH_BINARY | cv::THRESH_OTSU);

        std::vector<std::vector<cv::Point>> contours;
        cv::findContours(binary, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
        if (contours.empty())
            return std::nullopt;

        double total_area = 0.0;
        for (const auto &contour : contours)
            total_area += cv::contourArea(contour);
        return total_area / static_cast<double>(gray.total());
    }

    std::string EyeStateClassifier::ruleToString(DecisionRule rule)
    {
        switch (rule)
        {
        case DecisionRule::PUPIL_LOCATED:
            return "PUPIL_LOCATED";
        case DecisionRule::TRACKER_OPEN:
            return "TRACKER_OPEN";
        case DecisionRule::TRACKER_CLOSED_CONFIRMED:
            return "TRACKER_CLOSED_CONFIRMED";
        case DecisionRule::OPENNESS_CLOSED:
            return "OPENNESS_CLOSED";
        case DecisionRule::OPENNESS_CLOSED_CORROBORATED:
            return "OPENNESS_CLOSED_CORROBORATED";
        case DecisionRule::DEFAULT_OPEN:
            return "DEFAULT_OPEN";
        default:
            return "UNKNOWN";
        }
    }
}
