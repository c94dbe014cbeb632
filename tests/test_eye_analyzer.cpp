#include <gtest/gtest.h>
#include "eye_analyzer.h"

using namespace GazeGuard;

namespace
{
    // Scripted backend: a fixed face and eye crops taken from fixed boxes
    class FakeTracker : public Tracker
    {
    public:
        std::optional<cv::Rect> face;
        cv::Rect left_box{200, 150, 60, 40};
        cv::Rect right_box{100, 150, 60, 40};
        bool provide_right = true;
        std::optional<EyeState> eye_state;
        std::optional<PupilHint> pupil_hint;
        int eye_state_calls = 0;
        int pupil_calls = 0;

        std::string name() const override { return "fake"; }
        bool initialize(const Config &) override { return true; }

        std::optional<cv::Rect> detectFace(const cv::Mat &) override { return face; }

        EyeRegions detectEyes(const cv::Mat &frame, const cv::Rect &) override
        {
            cv::Mat gray;
            cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
            EyeRegions regions;
            regions.left = EyeRegion{gray(left_box).clone(), left_box.tl(), EyeSide::LEFT};
            if (provide_right)
                regions.right = EyeRegion{gray(right_box).clone(), right_box.tl(), EyeSide::RIGHT};
            return regions;
        }

        std::optional<EyeState> getEyeState(const EyeRegion &) override
        {
            ++eye_state_calls;
            return eye_state;
        }

        std::optional<PupilHint> getPupilLocation(const cv::Mat &, const cv::Rect &, EyeSide) override
        {
            ++pupil_calls;
            return pupil_hint;
        }
    };

    // Frame with an open eye (dark pupil on bright sclera) in both eye boxes
    cv::Mat openEyesFrame(const FakeTracker &tracker)
    {
        cv::Mat frame(480, 640, CV_8UC3, cv::Scalar(200, 200, 200));
        for (const cv::Rect &box : {tracker.left_box, tracker.right_box})
            cv::circle(frame, box.tl() + cv::Point(30, 26), 5, cv::Scalar(20, 20, 20), cv::FILLED);
        return frame;
    }
}

TEST(EyeAnalyzerTest, NoFaceMeansNoEyesAndOpenState)
{
    FakeTracker tracker;
    EyeAnalyzer analyzer(tracker, Config());

    FrameAnalysis analysis = analyzer.analyze(openEyesFrame(tracker));
    EXPECT_FALSE(analysis.faceDetected());
    EXPECT_FALSE(analysis.left.has_value());
    EXPECT_FALSE(analysis.right.has_value());
    EXPECT_EQ(analysis.fused_state, EyeState::OPEN);
}

TEST(EyeAnalyzerTest, EmptyFrameIsSkipped)
{
    FakeTracker tracker;
    tracker.face = cv::Rect(80, 100, 220, 200);
    EyeAnalyzer analyzer(tracker, Config());
    EXPECT_FALSE(analyzer.analyze(cv::Mat()).faceDetected());
}

TEST(EyeAnalyzerTest, LocatesPupilsInFrameCoordinates)
{
    FakeTracker tracker;
    tracker.face = cv::Rect(80, 100, 220, 200);
    EyeAnalyzer analyzer(tracker, Config());

    FrameAnalysis analysis = analyzer.analyze(openEyesFrame(tracker));
    ASSERT_TRUE(analysis.faceDetected());
    ASSERT_TRUE(analysis.left.has_value());
    ASSERT_TRUE(analysis.left->pupil.has_value());

    auto pupil = analysis.left->pupilInFrame();
    ASSERT_TRUE(pupil.has_value());
    EXPECT_NEAR(pupil->x, 230, 2);
    EXPECT_NEAR(pupil->y, 176, 2);
    EXPECT_EQ(analysis.left->decision.rule, DecisionRule::PUPIL_LOCATED);
    EXPECT_EQ(analysis.fused_state, EyeState::OPEN);
}

TEST(EyeAnalyzerTest, FeaturelessEyesAreClosed)
{
    FakeTracker tracker;
    tracker.face = cv::Rect(80, 100, 220, 200);
    EyeAnalyzer analyzer(tracker, Config());

    cv::Mat frame(480, 640, CV_8UC3, cv::Scalar(150, 150, 150));
    FrameAnalysis analysis = analyzer.analyze(frame);
    ASSERT_TRUE(analysis.left.has_value());
    EXPECT_FALSE(analysis.left->pupil.has_value());
    EXPECT_EQ(analysis.left->decision.state, EyeState::CLOSED);
    EXPECT_EQ(analysis.fused_state, EyeState::CLOSED);
}

TEST(EyeAnalyzerTest, MissingEyeCountsAsOpen)
{
    FakeTracker tracker;
    tracker.face = cv::Rect(80, 100, 220, 200);
    tracker.provide_right = false;
    EyeAnalyzer analyzer(tracker, Config());

    FrameAnalysis analysis = analyzer.analyze(openEyesFrame(tracker));
    EXPECT_FALSE(analysis.right.has_value());
    EXPECT_EQ(analysis.fused_state, EyeState::OPEN);
}

TEST(EyeAnalyzerTest, TrackerCapabilitiesOnlyQueriedWhenEnabled)
{
    FakeTracker tracker;
    tracker.face = cv::Rect(80, 100, 220, 200);
    EyeAnalyzer analyzer(tracker, Config());
    analyzer.analyze(openEyesFrame(tracker));

    EXPECT_EQ(tracker.eye_state_calls, 0);
    EXPECT_EQ(tracker.pupil_calls, 0);
}

TEST(EyeAnalyzerTest, TrackerDiameterIsUsedDirectly)
{
    FakeTracker tracker;
    tracker.face = cv::Rect(80, 100, 220, 200);
    tracker.pupil_hint = PupilHint{cv::Point2f(12.0f, 14.0f), 6.5};

    Config config;
    config.use_tracker_pupil_hint = true;
    EyeAnalyzer analyzer(tracker, config);

    FrameAnalysis analysis = analyzer.analyze(openEyesFrame(tracker));
    ASSERT_TRUE(analysis.left.has_value());
    ASSERT_TRUE(analysis.left->pupil.has_value());
    EXPECT_FLOAT_EQ(analysis.left->pupil->center.x, 12.0f);
    ASSERT_TRUE(analysis.left->pupil->diameter.has_value());
    EXPECT_DOUBLE_EQ(*analysis.left->pupil->diameter, 6.5);
    EXPECT_EQ(tracker.pupil_calls, 2);
}

TEST(EyeAnalyzerTest, HintWithoutDiameterIsMeasured)
{
    FakeTracker tracker;
    tracker.face = cv::Rect(80, 100, 220, 200);
    tracker.pupil_hint = PupilHint{cv::Point2f(30.0f, 26.0f), std::nullopt};

    Config config;
    config.use_tracker_pupil_hint = true;
    EyeAnalyzer analyzer(tracker, config);

    FrameAnalysis analysis = analyzer.analyze(openEyesFrame(tracker));
    ASSERT_TRUE(analysis.left->pupil.has_value());
    EXPECT_FLOAT_EQ(analysis.left->pupil->center.x, 30.0f);
    ASSERT_TRUE(analysis.left->pupil->diameter.has_value());
    EXPECT_GT(*analysis.left->pupil->diameter, 0.0);
}

TEST(EyeAnalyzerTest, TrackerClosedNeedsImageAgreement)
{
    FakeTracker tracker;
    tracker.face = cv::Rect(80, 100, 220, 200);
    tracker.eye_state = EyeState::CLOSED;

    Config config;
    config.eye_state.use_tracker_eye_state = true;
    EyeAnalyzer analyzer(tracker, config);

    // Pupil visible: the tracker verdict is overruled
    FrameAnalysis open = analyzer.analyze(openEyesFrame(tracker));
    EXPECT_EQ(open.fused_state, EyeState::OPEN);
    EXPECT_GT(tracker.eye_state_calls, 0);

    cv::Mat featureless(480, 640, CV_8UC3, cv::Scalar(150, 150, 150));
    FrameAnalysis closed = analyzer.analyze(featureless);
    ASSERT_TRUE(closed.left.has_value());
    EXPECT_EQ(closed.left->decision.rule, DecisionRule::TRACKER_CLOSED_CONFIRMED);
    EXPECT_EQ(closed.fused_state, EyeState::CLOSED);
}
