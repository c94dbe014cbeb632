#include "include/gaze_guard_system.h"
#include "include/logger.h"
#include "include/config.h"
#include "include/tracker.h"
#include <iostream>

namespace
{
    const char *const kKeys =
        "{help h usage ? |      | print this message}"
        "{config c       |      | JSON configuration file}"
        "{tracker t      |      | tracker backend (dlib, haar)}"
        "{video v        |      | video file to process instead of the camera}"
        "{camera         | -1   | camera index}"
        "{log-format     |      | frame log format (jsonl, csv)}"
        "{headless       |      | run without a display window}";
}

int main(int argc, char **argv)
{
    cv::CommandLineParser parser(argc, argv, kKeys);
    parser.about("Gaze Guard: pupil tracking with out-of-frame and drowsiness alarms");
    if (parser.has("help"))
    {
        parser.printMessage();
        std::cout << "Available trackers:";
        for (const auto &name : GazeGuard::TrackerRegistry::instance().available())
            std::cout << " " << name;
        std::cout << std::endl;
        return 0;
    }

    try
    {
        GazeGuard::Config config;
        if (parser.has("config"))
            config = GazeGuard::loadConfig(parser.get<std::string>("config"));
        if (parser.has("tracker"))
            config.tracker_type = parser.get<std::string>("tracker");
        if (parser.has("video"))
            config.video_path = parser.get<std::string>("video");
        if (parser.get<int>("camera") >= 0)
            config.camera_index = parser.get<int>("camera");
        if (parser.has("log-format"))
            config.log_format = parser.get<std::string>("log-format");
        if (parser.has("headless"))
            config.show_window = false;

        if (!parser.check())
        {
            parser.printErrors();
            return -1;
        }

        // Create and initialize the system before the logger opens any files
        GazeGuard::GazeGuardSystem system(config);
        if (!system.initialize())
        {
            std::cerr << "Failed to initialize gaze guard system" << std::endl;
            return -1;
        }

        GazeGuard::Logger::getInstance().setupConfig(config);
        return system.run();
    }
    catch (const GazeGuard::ConfigurationError &e)
    {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return -1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        GazeGuard::Logger::shutdown();
        return -1;
    }
}
