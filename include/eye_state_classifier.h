#ifndef GAZE_GUARD_EYE_STATE_CLASSIFIER_H
#define GAZE_GUARD_EYE_STATE_CLASSIFIER_H

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/opencv.hpp>
#include "config.h"
#include "eye_types.h"

namespace GazeGuard
{
    // Rules of the eye-state decision table, in evaluation order.
    enum class DecisionRule
    {
        PUPIL_LOCATED,
        TRACKER_OPEN,
        TRACKER_CLOSED_CONFIRMED,
        OPENNESS_CLOSED,
        OPENNESS_CLOSED_CORROBORATED,
        DEFAULT_OPEN
    };

    // Signals gathered for one eye in one frame. Absent means "not available".
    struct EyeEvidence
    {
        bool pupil_located = false;
        std::optional<EyeState> tracker_state;
        std::optional<double> openness_ratio;
        std::optional<double> histogram_variance;
        std::optional<double> contour_area_ratio;
    };

    struct EyeStateDecision
    {
        EyeState state;
        DecisionRule rule;
    };

    /**
     * @brief Open/closed classification for a single eye, fused across both eyes
     *
     * Defaults to OPEN: a false CLOSED feeds the drowsiness alarm, so CLOSED is
     * only reported when the image signals agree.
     */
    class EyeStateClassifier
    {
    private:
        struct Rule
        {
            DecisionRule id;
            std::function<bool(const EyeEvidence &)> matches;
            EyeState verdict;
        };

        EyeStateConfig config_;
        std::vector<Rule> rules_;

        void buildDecisionTable();
        bool opennessIndicatesClosed(const EyeEvidence &evidence) const;
        bool secondaryCorroborates(const EyeEvidence &evidence) const;

    public:
        explicit EyeStateClassifier(const EyeStateConfig &config);

        // Rules capture `this`
        EyeStateClassifier(const EyeStateClassifier &) = delete;
        EyeStateClassifier &operator=(const EyeStateClassifier &) = delete;

        EyeEvidence gatherEvidence(const cv::Mat &eye_image, const std::optional<PupilEstimate> &pupil,
                                   const std::optional<EyeState> &tracker_state) const;
        EyeStateDecision decide(const EyeEvidence &evidence) const;

        EyeState classify(const cv::Mat &eye_image, const std::optional<PupilEstimate> &pupil,
                          const std::optional<EyeState> &tracker_state = std::nullopt) const;

        // CLOSED if either eye is closed.
        static EyeState fuse(EyeState left, EyeState right);

        // Horizontal projection openness ratio; absent for degenerate images.
        static std::optional<double> opennessRatio(const cv::Mat &gray);
        static std::optional<double> histogramVariance(const cv::Mat &gray);
        static std::optional<double> contourAreaRatio(const cv::Mat &gray);

        static std::string ruleToString(DecisionRule rule);

        bool usesTrackerState() const { return config_.use_tracker_eye_state; }
    };
}

#endif // GAZE_GUARD_EYE_STATE_CLASSIFIER_H
