#include <gtest/gtest.h>
#include "pupil_locator.h"

using namespace GazeGuard;

namespace
{
    // 60x40 bright eye with a dark disc; default pupil at (30, 26), inside the searched lower band
    cv::Mat makeEye(cv::Point pupil = cv::Point(30, 26), int radius = 5, int intensity = 20)
    {
        cv::Mat eye(40, 60, CV_8UC1, cv::Scalar(200));
        cv::circle(eye, pupil, radius, cv::Scalar(intensity), cv::FILLED);
        return eye;
    }

    std::vector<std::vector<cv::Point>> squareContour()
    {
        return {{cv::Point(10, 10), cv::Point(20, 10), cv::Point(20, 20), cv::Point(10, 20)}};
    }
}

TEST(PupilLocatorTest, FindsDarkDiscInBlindMode)
{
    PupilLocator locator{PupilConfig()};
    auto estimate = locator.locate(makeEye(), 50);

    ASSERT_TRUE(estimate.has_value());
    EXPECT_NEAR(estimate->center.x, 30.0, 1.5);
    EXPECT_NEAR(estimate->center.y, 26.0, 1.5);
    ASSERT_TRUE(estimate->diameter.has_value());
    EXPECT_GT(*estimate->diameter, 7.0);
    EXPECT_LT(*estimate->diameter, 14.0);
}

TEST(PupilLocatorTest, AcceptsColorInput)
{
    PupilLocator locator{PupilConfig()};
    cv::Mat bgr;
    cv::cvtColor(makeEye(), bgr, cv::COLOR_GRAY2BGR);

    auto estimate = locator.locate(bgr, 50);
    ASSERT_TRUE(estimate.has_value());
    EXPECT_NEAR(estimate->center.x, 30.0, 1.5);
}

TEST(PupilLocatorTest, UniformImageHasNoPupil)
{
    PupilLocator locator{PupilConfig()};
    cv::Mat eye(40, 60, CV_8UC1, cv::Scalar(200));
    EXPECT_FALSE(locator.locate(eye, 50).has_value());
}

TEST(PupilLocatorTest, EmptyImageHasNoPupil)
{
    PupilLocator locator{PupilConfig()};
    EXPECT_FALSE(locator.locate(cv::Mat(), 50).has_value());
}

TEST(PupilLocatorTest, IntensityCeilingRejectsGreyBlob)
{
    PupilLocator locator{PupilConfig()};
    cv::Mat eye = makeEye(cv::Point(30, 26), 5, 120);

    EXPECT_FALSE(locator.locate(eye, 50).has_value());
    EXPECT_TRUE(locator.locate(eye, 255).has_value());
}

TEST(PupilLocatorTest, DefaultThresholdAcceptsBrightPupil)
{
    PupilConfig config;
    PupilLocator locator{config};
    cv::Mat eye = makeEye(cv::Point(30, 26), 5, 120);
    EXPECT_TRUE(locator.locate(eye, config.detection_threshold).has_value());
}

TEST(PupilLocatorTest, RejectsBlobFarFromHorizontalCenter)
{
    PupilLocator locator{PupilConfig()};
    // |8 - 30| exceeds 40% of the 30 px half-width
    EXPECT_FALSE(locator.locate(makeEye(cv::Point(8, 26)), 50).has_value());
}

TEST(PupilLocatorTest, IgnoresBlobAboveSearchBand)
{
    PupilLocator locator{PupilConfig()};
    cv::Mat eye(40, 60, CV_8UC1, cv::Scalar(200));
    cv::circle(eye, cv::Point(30, 6), 4, cv::Scalar(20), cv::FILLED);
    EXPECT_FALSE(locator.locate(eye, 50).has_value());
}

TEST(PupilLocatorTest, HintedModeKeepsHintAsCenter)
{
    PupilLocator locator{PupilConfig()};
    auto estimate = locator.locate(makeEye(), 50, cv::Point2f(31.0f, 25.0f));

    ASSERT_TRUE(estimate.has_value());
    EXPECT_FLOAT_EQ(estimate->center.x, 31.0f);
    EXPECT_FLOAT_EQ(estimate->center.y, 25.0f);
    ASSERT_TRUE(estimate->diameter.has_value());
    EXPECT_GT(*estimate->diameter, 0.0);
}

TEST(PupilLocatorTest, HintedModeWithoutBlobHasNoDiameter)
{
    PupilLocator locator{PupilConfig()};
    cv::Mat eye(40, 60, CV_8UC1, cv::Scalar(200));
    auto estimate = locator.locate(eye, 50, cv::Point2f(30.0f, 20.0f));

    ASSERT_TRUE(estimate.has_value());
    EXPECT_FLOAT_EQ(estimate->center.x, 30.0f);
    EXPECT_FALSE(estimate->diameter.has_value());
}

TEST(PupilLocatorTest, HintOnContourBoundaryIsAccepted)
{
    auto index = PupilLocator::selectContourForHint(squareContour(), cv::Point2f(10.0f, 15.0f), 5.0);
    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(*index, 0u);
}

TEST(PupilLocatorTest, HintNearContourWithinDistanceIsAccepted)
{
    auto index = PupilLocator::selectContourForHint(squareContour(), cv::Point2f(23.0f, 15.0f), 5.0);
    EXPECT_TRUE(index.has_value());
}

TEST(PupilLocatorTest, HintFarFromContoursIsRejected)
{
    EXPECT_FALSE(PupilLocator::selectContourForHint(squareContour(), cv::Point2f(30.0f, 15.0f), 5.0).has_value());
    EXPECT_FALSE(PupilLocator::selectContourForHint({}, cv::Point2f(10.0f, 10.0f), 5.0).has_value());
}

TEST(PupilLocatorTest, HintPrefersContainingContour)
{
    auto contours = squareContour();
    std::vector<cv::Point> small{cv::Point(40, 10), cv::Point(44, 10), cv::Point(44, 14), cv::Point(40, 14)};
    contours.insert(contours.begin(), small);
    auto index = PupilLocator::selectContourForHint(contours, cv::Point2f(15.0f, 15.0f), 50.0);
    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(*index, 1u);
}

TEST(PupilLocatorTest, DiameterAveragesAvailableEstimators)
{
    // circle 14.14, box 11, equal-area 11.28; too few points for an ellipse, so the circle counts twice
    auto diameter = PupilLocator::estimateDiameter(squareContour()[0]);
    ASSERT_TRUE(diameter.has_value());
    EXPECT_NEAR(*diameter, 12.64, 0.05);
}

TEST(PupilLocatorTest, EmptyContourHasNoDiameter)
{
    EXPECT_FALSE(PupilLocator::estimateDiameter({}).has_value());
}

TEST(PupilLocatorTest, DiameterIsNeverZeroOrNegative)
{
    PupilLocator locator{PupilConfig()};
    for (int radius = 2; radius <= 9; ++radius)
    {
        for (int threshold : {30, 50, 255})
        {
            auto estimate = locator.locate(makeEye(cv::Point(30, 27), radius), threshold);
            if (estimate && estimate->diameter)
                EXPECT_GT(*estimate->diameter, 0.0) << "radius " << radius << " threshold " << threshold;
        }
    }
}

TEST(PupilLocatorTest, RejectsInvalidConfig)
{
    PupilConfig config;
    config.min_area_ratio = 0.5;
    config.max_area_ratio = 0.1;
    EXPECT_THROW(PupilLocator{config}, ConfigurationError);

    PupilConfig bad_threshold;
    bad_threshold.detection_threshold = 300;
    EXPECT_THROW(PupilLocator{bad_threshold}, ConfigurationError);
}
