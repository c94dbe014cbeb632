#include "../include/eye_analyzer.h"

namespace GazeGuard
{
    std::optional<cv::Point> EyeAnalysis::pupilInFrame() const
    {
        if (!pupil)
            return std::nullopt;
        return cv::Point(region.origin.x + cvRound(pupil->center.x),
                         region.origin.y + cvRound(pupil->center.y));
    }

    EyeAnalyzer::EyeAnalyzer(Tracker &tracker, const Config &config)
        : tracker_(tracker),
          pupil_locator_(config.pupil),
          classifier_(config.eye_state),
          pupil_threshold_(config.pupil.detection_threshold),
          use_pupil_hint_(config.use_tracker_pupil_hint)
    {
    }

    FrameAnalysis EyeAnalyzer::analyze(const cv::Mat &frame)
    {
        FrameAnalysis analysis;
        if (frame.empty())
            return analysis;

        analysis.face = tracker_.detectFace(frame);
        if (!analysis.face)
            return analysis;

        EyeRegions regions = tracker_.detectEyes(frame, *analysis.face);
        if (regions.left && regions.left->isValid())
            analysis.left = analyzeEye(frame, *analysis.face, *regions.left);
        if (regions.right && regions.right->isValid())
            analysis.right = analyzeEye(frame, *analysis.face, *regions.right);

        // A missing eye gives no evidence of closure
        EyeState left = analysis.left ? analysis.left->decision.state : EyeState::OPEN;
        EyeState right = analysis.right ? analysis.right->decision.state : EyeState::OPEN;
        analysis.fused_state = EyeStateClassifier::fuse(left, right);
        return analysis;
    }

    EyeAnalysis EyeAnalyzer::analyzeEye(const cv::Mat &frame, const cv::Rect &face, const EyeRegion &region)
    {
        EyeAnalysis eye;
        eye.region = region;

        std::optional<PupilHint> hint;
        if (use_pupil_hint_)
            hint = tracker_.getPupilLocation(frame, face, region.side);

        if (hint && hint->diameter && *hint->diameter > 0.0)
        {
            eye.pupil = PupilEstimate{hint->center, hint->diameter};
        }
        else
        {
            std::optional<cv::Point2f> hint_center;
            if (hint)
                hint_center = hint->center;
            eye.pupil = pupil_locator_.locate(region.image, pupil_threshold_, hint_center);
        }

        std::optional<EyeState> tracker_state;
        if (classifier_.usesTrackerState())
            tracker_state = tracker_.getEyeState(region);

        eye.decision = classifier_.decide(classifier_.gatherEvidence(region.image, eye.pupil, tracker_state));
        return eye;
    }
}
