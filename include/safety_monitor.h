#ifndef GAZE_GUARD_SAFETY_MONITOR_H
#define GAZE_GUARD_SAFETY_MONITOR_H

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "config.h"
#include "eye_types.h"

namespace GazeGuard
{
    using Clock = std::chrono::steady_clock;
    using Timestamp = Clock::time_point;

    // Value snapshot handed to display and logging.
    struct SafetyStatus
    {
        bool out_of_frame_alarm = false;
        bool drowsiness_alarm = false;
        double drowsiness_score = 0.0;

        bool operator==(const SafetyStatus &other) const
        {
            return out_of_frame_alarm == other.out_of_frame_alarm &&
                   drowsiness_alarm == other.drowsiness_alarm &&
                   drowsiness_score == other.drowsiness_score;
        }
    };

    // Fixed-capacity ring buffer of fused eye-state samples.
    class DrowsinessWindow
    {
    private:
        std::vector<EyeState> samples_;
        size_t capacity_;
        size_t head_ = 0;  // next write position
        size_t size_ = 0;
        size_t closed_count_ = 0;

    public:
        explicit DrowsinessWindow(size_t capacity);

        void push(EyeState state);
        void clear();

        // Closed samples / samples held, 0 when empty.
        double perclos() const;

        size_t size() const { return size_; }
        size_t capacity() const { return capacity_; }
        size_t closedCount() const { return closed_count_; }

        // Oldest first.
        std::vector<EyeState> snapshot() const;
    };

    enum class OutOfFrameState
    {
        TRACKING,
        ALARMED
    };

    class OutOfFrameMonitor
    {
    private:
        int threshold_;
        int consecutive_misses_ = 0;
        OutOfFrameState state_ = OutOfFrameState::TRACKING;

    public:
        explicit OutOfFrameMonitor(int threshold);

        void update(bool face_detected);
        void reset();

        bool isAlarmActive() const { return state_ == OutOfFrameState::ALARMED; }
        OutOfFrameState getState() const { return state_; }
        int getConsecutiveMisses() const { return consecutive_misses_; }
    };

    enum class DrowsinessState
    {
        NORMAL,
        CONFIRMING,
        ALARMED,
        COOLDOWN
    };

    class DrowsinessMonitor
    {
    private:
        double perclos_threshold_;
        Clock::duration sustained_;
        Clock::duration cooldown_;

        DrowsinessWindow window_;
        DrowsinessState state_ = DrowsinessState::NORMAL;
        double perclos_ = 0.0;
        std::optional<Timestamp> drowsy_since_;
        std::optional<Timestamp> cleared_at_;
        std::optional<Timestamp> last_timestamp_;
        size_t clock_regressions_ = 0;

        Timestamp effectiveTime(Timestamp timestamp);

    public:
        DrowsinessMonitor(double perclos_threshold, double sustained_seconds, double cooldown_seconds,
                          size_t window_size);

        void update(EyeState eye_state, Timestamp timestamp);
        void reset();

        bool isAlarmActive() const { return state_ == DrowsinessState::ALARMED; }
        bool isDrowsyConditionMet() const { return perclos_ >= perclos_threshold_; }
        double getDrowsinessScore() const { return perclos_; }
        DrowsinessState getState() const { return state_; }
        const DrowsinessWindow &getWindow() const { return window_; }
        std::optional<Timestamp> getDrowsySince() const { return drowsy_since_; }
        std::optional<Timestamp> getClearedAt() const { return cleared_at_; }

        // Updates whose timestamp went backwards; those are clamped to the latest seen.
        size_t getClockRegressions() const { return clock_regressions_; }
    };

    /**
     * @brief Per-frame alarm state machines for one monitored stream
     *
     * Owns an out-of-frame monitor and a PERCLOS drowsiness monitor. Both are
     * advanced by update() and read through getStatus(), which never mutates.
     */
    class SafetyMonitor
    {
    private:
        SafetyConfig config_;
        OutOfFrameMonitor out_of_frame_;
        DrowsinessMonitor drowsiness_;

    public:
        explicit SafetyMonitor(const SafetyConfig &config);

        void update(bool face_detected, EyeState eye_state, Timestamp timestamp);
        void reset();

        SafetyStatus getStatus() const;

        const OutOfFrameMonitor &outOfFrameMonitor() const { return out_of_frame_; }
        const DrowsinessMonitor &drowsinessMonitor() const { return drowsiness_; }
        const SafetyConfig &getConfig() const { return config_; }
    };

    std::string drowsinessStateToString(DrowsinessState state);
}

#endif // GAZE_GUARD_SAFETY_MONITOR_H
