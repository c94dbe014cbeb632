#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <filesystem>
#include <fstream>
#include "config.h"

using namespace GazeGuard;

namespace
{
    class ConfigFileTest : public ::testing::Test
    {
    protected:
        std::filesystem::path path_;

        void SetUp() override
        {
            const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
            path_ = std::filesystem::temp_directory_path() /
                    (std::string("gaze_guard_") + info->name() + ".json");
        }

        void TearDown() override
        {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
        }

        void write(const std::string &contents)
        {
            std::ofstream file(path_);
            file << contents;
        }
    };
}

TEST(ConfigTest, DefaultsAreValid)
{
    Config config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.pupil.detection_threshold, 255);
    EXPECT_DOUBLE_EQ(config.pupil.max_center_offset, 0.4);
    EXPECT_DOUBLE_EQ(config.eye_state.ear_threshold_closed, 0.02);
    EXPECT_FALSE(config.eye_state.use_multi_method_detection);
    EXPECT_EQ(config.safety.out_of_frame_threshold, 5);
    EXPECT_DOUBLE_EQ(config.safety.perclos_threshold, 0.7);
    EXPECT_EQ(config.safety.window_size, 120);
    EXPECT_DOUBLE_EQ(config.safety.sustained_seconds, 3.0);
    EXPECT_DOUBLE_EQ(config.safety.cooldown_seconds, 10.0);
    EXPECT_EQ(config.fps_window_size, 30);
}

TEST(ConfigTest, SafetyBoundsAreChecked)
{
    SafetyConfig safety;
    safety.perclos_threshold = 1.0;
    safety.sustained_seconds = 0.0;
    safety.cooldown_seconds = 0.0;
    safety.window_size = 1;
    safety.out_of_frame_threshold = 1;
    EXPECT_NO_THROW(safety.validate());

    safety.perclos_threshold = 1.01;
    EXPECT_THROW(safety.validate(), ConfigurationError);
}

TEST(ConfigTest, DurationsMustFitTheClock)
{
    SafetyConfig safety;
    safety.cooldown_seconds = 1.0e9;
    EXPECT_NO_THROW(safety.validate());

    safety.cooldown_seconds = 1.0e12;
    EXPECT_THROW(safety.validate(), ConfigurationError);
    safety.cooldown_seconds = 10.0;

    safety.sustained_seconds = 1.0e11;
    EXPECT_THROW(safety.validate(), ConfigurationError);
    safety.sustained_seconds = std::numeric_limits<double>::infinity();
    EXPECT_THROW(safety.validate(), ConfigurationError);
    safety.sustained_seconds = std::nan("");
    EXPECT_THROW(safety.validate(), ConfigurationError);
}

TEST(ConfigTest, ApplicationFieldsAreChecked)
{
    Config config;
    config.log_format = "xml";
    EXPECT_THROW(config.validate(), ConfigurationError);

    config = Config();
    config.fps_window_size = 0;
    EXPECT_THROW(config.validate(), ConfigurationError);

    config = Config();
    config.eye_state.contour_area_threshold = 2.0;
    EXPECT_THROW(config.validate(), ConfigurationError);
}

TEST_F(ConfigFileTest, OverridesOnlyGivenFields)
{
    write(R"({
        "tracker_type": "haar",
        "log_format": "csv",
        "enable_publishing": true,
        "danger_color": [10, 20, 30],
        "pupil": {"detection_threshold": 70},
        "eye_state": {"use_multi_method_detection": true},
        "safety": {"window_size": 60, "sustained_seconds": 1.5}
    })");

    Config config = loadConfig(path_.string());
    EXPECT_EQ(config.tracker_type, "haar");
    EXPECT_EQ(config.log_format, "csv");
    EXPECT_TRUE(config.enable_publishing_);
    EXPECT_EQ(config.danger_color, cv::Scalar(10, 20, 30));
    EXPECT_EQ(config.pupil.detection_threshold, 70);
    EXPECT_TRUE(config.eye_state.use_multi_method_detection);
    EXPECT_EQ(config.safety.window_size, 60);
    EXPECT_DOUBLE_EQ(config.safety.sustained_seconds, 1.5);

    EXPECT_DOUBLE_EQ(config.safety.perclos_threshold, 0.7);
    EXPECT_DOUBLE_EQ(config.pupil.min_circularity, 0.3);
}

TEST_F(ConfigFileTest, MalformedJsonIsConfigurationError)
{
    write("{ \"tracker_type\": ");
    EXPECT_THROW(loadConfig(path_.string()), ConfigurationError);
}

TEST_F(ConfigFileTest, WrongFieldTypeIsConfigurationError)
{
    write(R"({"safety": {"window_size": "large"}})");
    EXPECT_THROW(loadConfig(path_.string()), ConfigurationError);
}

TEST_F(ConfigFileTest, OutOfRangeValueIsConfigurationError)
{
    write(R"({"safety": {"perclos_threshold": 3.0}})");
    EXPECT_THROW(loadConfig(path_.string()), ConfigurationError);
}

TEST_F(ConfigFileTest, BadColorIsConfigurationError)
{
    write(R"({"pupil_color": [1, 2]})");
    EXPECT_THROW(loadConfig(path_.string()), ConfigurationError);
}

TEST(ConfigTest, MissingFileIsConfigurationError)
{
    EXPECT_THROW(loadConfig("/nonexistent/gaze_guard.json"), ConfigurationError);
}
