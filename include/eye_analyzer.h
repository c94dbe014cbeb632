#ifndef GAZE_GUARD_EYE_ANALYZER_H
#define GAZE_GUARD_EYE_ANALYZER_H

#include <optional>
#include <opencv2/opencv.hpp>
#include "config.h"
#include "eye_types.h"
#include "eye_state_classifier.h"
#include "pupil_locator.h"
#include "tracker.h"

namespace GazeGuard
{
    struct EyeAnalysis
    {
        EyeRegion region;
        std::optional<PupilEstimate> pupil;
        EyeStateDecision decision{EyeState::OPEN, DecisionRule::DEFAULT_OPEN};

        // Pupil center in frame coordinates
        std::optional<cv::Point> pupilInFrame() const;
    };

    struct FrameAnalysis
    {
        std::optional<cv::Rect> face;
        std::optional<EyeAnalysis> left;
        std::optional<EyeAnalysis> right;
        EyeState fused_state = EyeState::OPEN;

        bool faceDetected() const { return face.has_value(); }
    };

    /**
     * @brief Per-frame perception: tracker, pupil locator and eye-state classifier
     *
     * The tracker is borrowed; it must outlive the analyzer.
     */
    class EyeAnalyzer
    {
    private:
        Tracker &tracker_;
        PupilLocator pupil_locator_;
        EyeStateClassifier classifier_;
        int pupil_threshold_;
        bool use_pupil_hint_;

        EyeAnalysis analyzeEye(const cv::Mat &frame, const cv::Rect &face, const EyeRegion &region);

    public:
        EyeAnalyzer(Tracker &tracker, const Config &config);

        FrameAnalysis analyze(const cv::Mat &frame);

        Tracker &tracker() { return tracker_; }
    };
}

#endif // GAZE_GUARD_EYE_ANALYZER_H
