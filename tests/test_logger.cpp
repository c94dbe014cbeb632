#include <gtest/gtest.h>
#include <sstream>
#include "logger.h"

using namespace GazeGuard;

namespace
{
    FrameRecord sampleRecord()
    {
        FrameRecord record;
        record.tracker_method = "dlib";
        record.left_pupil = cv::Point(230, 176);
        record.left_diameter = 9.5;
        record.eye_state = EyeState::CLOSED;
        record.drowsiness_score = 0.75;
        record.fps = 29.97;
        record.face_detected = true;
        record.processing_latency_ms = 12.3456;
        return record;
    }

    std::vector<std::string> splitCsv(const std::string &line)
    {
        std::vector<std::string> fields;
        std::stringstream ss(line);
        std::string field;
        while (std::getline(ss, field, ','))
            fields.push_back(field);
        if (!line.empty() && line.back() == ',')
            fields.push_back("");
        return fields;
    }
}

TEST(LoggerFormatTest, CsvHeaderColumnOrder)
{
    std::vector<std::string> expected = {
        "timestamp", "tracker_method", "left_pupil_x", "left_pupil_y", "right_pupil_x", "right_pupil_y",
        "left_pupil_diameter", "right_pupil_diameter", "eye_state", "drowsiness_score", "fps",
        "face_detected", "processing_latency_ms"};
    EXPECT_EQ(splitCsv(Logger::csvHeader()), expected);
}

TEST(LoggerFormatTest, CsvRowLeavesMissingValuesEmpty)
{
    std::vector<std::string> fields = splitCsv(Logger::frameRecordToCsvRow(sampleRecord()));
    ASSERT_EQ(fields.size(), 13u);
    EXPECT_EQ(fields[1], "dlib");
    EXPECT_EQ(fields[2], "230");
    EXPECT_EQ(fields[3], "176");
    EXPECT_EQ(fields[4], "");
    EXPECT_EQ(fields[5], "");
    EXPECT_EQ(fields[6], "9.500");
    EXPECT_EQ(fields[7], "");
    EXPECT_EQ(fields[8], "0");
    EXPECT_EQ(fields[9], "0.7500");
    EXPECT_EQ(fields[10], "29.97");
    EXPECT_EQ(fields[11], "1");
    EXPECT_EQ(fields[12], "12.346");
}

TEST(LoggerFormatTest, JsonRecordUsesNullForMissingValues)
{
    nlohmann::ordered_json j = Logger::frameRecordToJson(sampleRecord());
    EXPECT_EQ(j["tracker_method"], "dlib");
    EXPECT_EQ(j["left_pupil"], nlohmann::ordered_json::array({230, 176}));
    EXPECT_TRUE(j["right_pupil"].is_null());
    EXPECT_DOUBLE_EQ(j["left_pupil_diameter"].get<double>(), 9.5);
    EXPECT_TRUE(j["right_pupil_diameter"].is_null());
    EXPECT_EQ(j["eye_state"], 0);
    EXPECT_EQ(j["face_detected"], true);
    EXPECT_TRUE(j.contains("timestamp"));
    EXPECT_TRUE(j.contains("processing_latency_ms"));
}

TEST(LoggerFormatTest, JsonRecordKeysFollowColumnOrder)
{
    nlohmann::ordered_json j = Logger::frameRecordToJson(sampleRecord());
    std::vector<std::string> keys;
    for (const auto &item : j.items())
        keys.push_back(item.key());

    std::vector<std::string> expected = {
        "timestamp", "tracker_method", "left_pupil", "right_pupil", "left_pupil_diameter",
        "right_pupil_diameter", "eye_state", "drowsiness_score", "fps", "face_detected",
        "processing_latency_ms"};
    EXPECT_EQ(keys, expected);

    std::string line = j.dump();
    EXPECT_EQ(line.find("\"timestamp\""), 1u);
    EXPECT_LT(line.find("\"eye_state\""), line.find("\"drowsiness_score\""));
}

TEST(LoggerFormatTest, AlarmEventJsonKeyOrder)
{
    AlarmEvent event;
    event.type = AlarmType::DROWSINESS;
    event.active = false;
    event.image_filename = "snapshots/drowsy.jpg";

    std::vector<std::string> keys;
    for (const auto &item : Logger::alarmEventToJson(event).items())
        keys.push_back(item.key());
    std::vector<std::string> expected = {"timestamp", "alarm", "active", "drowsiness_score", "image"};
    EXPECT_EQ(keys, expected);
}

TEST(LoggerFormatTest, AlarmEventJson)
{
    AlarmEvent event;
    event.type = AlarmType::OUT_OF_FRAME;
    event.active = true;
    event.drowsiness_score = 0.25;

    nlohmann::ordered_json j = Logger::alarmEventToJson(event);
    EXPECT_EQ(j["alarm"], "OUT_OF_FRAME");
    EXPECT_EQ(j["active"], true);
    EXPECT_DOUBLE_EQ(j["drowsiness_score"].get<double>(), 0.25);
    EXPECT_FALSE(j.contains("image"));

    event.image_filename = "snapshots/out_of_frame.jpg";
    EXPECT_EQ(Logger::alarmEventToJson(event)["image"], "snapshots/out_of_frame.jpg");
}

TEST(LoggerFormatTest, TimestampHasMilliseconds)
{
    auto tp = std::chrono::system_clock::time_point(std::chrono::milliseconds(1234567890123));
    std::string formatted = Logger::formatLogTimestamp(tp);
    ASSERT_GE(formatted.size(), 4u);
    EXPECT_EQ(formatted.substr(formatted.size() - 4), ".123");
    EXPECT_NE(formatted.find('T'), std::string::npos);
}

TEST(LoggerFormatTest, AlarmTypeNames)
{
    EXPECT_EQ(Logger::alarmTypeToString(AlarmType::DROWSINESS), "DROWSINESS");
    EXPECT_EQ(Logger::alarmTypeToString(AlarmType::OUT_OF_FRAME), "OUT_OF_FRAME");
}

TEST(LoggerTest, UninitializedLoggerWarnsAtMostOnce)
{
    Logger::shutdown();
    ASSERT_FALSE(Logger::getInstance().isInitialized());

    testing::internal::CaptureStderr();
    for (int i = 0; i < 50; ++i)
        Logger::logFrame(sampleRecord());
    Logger::logAlarm(AlarmEvent(), cv::Mat());
    std::string output = testing::internal::GetCapturedStderr();

    size_t warnings = 0;
    for (size_t pos = output.find("not initialized"); pos != std::string::npos;
         pos = output.find("not initialized", pos + 1))
        ++warnings;
    EXPECT_LE(warnings, 1u);
}
