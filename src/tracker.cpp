#include "../include/tracker.h"
#include "../include/facial_landmark_detector.h"
#include "../include/haar_face_detector.h"
#include <sstream>

namespace GazeGuard
{
    TrackerRegistry &TrackerRegistry::instance()
    {
        static TrackerRegistry registry = []()
        {
            TrackerRegistry r;
            r.registerTracker("dlib", []()
                              { return std::make_unique<FacialLandmarkDetector>(); });
            r.registerTracker("haar", []()
                              { return std::make_unique<HaarFaceDetector>(); });
            return r;
        }();
        return registry;
    }

    void TrackerRegistry::registerTracker(const std::string &name, Factory factory)
    {
        factories_[name] = std::move(factory);
    }

    std::unique_ptr<Tracker> TrackerRegistry::create(const std::string &name) const
    {
        auto it = factories_.find(name);
        if (it == factories_.end())
        {
            std::ostringstream oss;
            oss << "Unknown tracker type: '" << name << "'. Available types: ";
            std::vector<std::string> names = available();
            for (size_t i = 0; i < names.size(); ++i)
                oss << (i ? ", " : "") << names[i];
            throw ConfigurationError(oss.str());
        }
        return it->second();
    }

    std::vector<std::string> TrackerRegistry::available() const
    {
        std::vector<std::string> names;
        for (const auto &entry : factories_)
            names.push_back(entry.first);
        return names;
    }

    bool TrackerRegistry::contains(const std::string &name) const
    {
        return factories_.count(name) > 0;
    }
}
