#include "../include/safety_monitor.h"
#include "../include/constants.h"
#include <cmath>

namespace GazeGuard
{
    namespace
    {
        Clock::duration toDuration(double seconds, const char *what)
        {
            if (!std::isfinite(seconds) || seconds < 0.0 || seconds > Constants::MAX_DURATION_SECONDS)
                throw ConfigurationError(std::string(what) + " must be in [0, 1e9] seconds");
            return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
        }

        const SafetyConfig &validated(const SafetyConfig &config)
        {
            config.validate();
            return config;
        }
    }

    // ---------------------------------------------------------------- window

    DrowsinessWindow::DrowsinessWindow(size_t capacity) : capacity_(capacity)
    {
        if (capacity_ == 0)
            throw ConfigurationError("DrowsinessWindow capacity must be >= 1");
        samples_.resize(capacity_, EyeState::OPEN);
    }

    void DrowsinessWindow::push(EyeState state)
    {
        if (size_ == capacity_)
        {
            // evict the oldest sample, which sits at the write position
            if (samples_[head_] == EyeState::CLOSED)
                --closed_count_;
        }
        else
        {
            ++size_;
        }

        samples_[head_] = state;
        if (state == EyeState::CLOSED)
            ++closed_count_;
        head_ = (head_ + 1) % capacity_;
    }

    void DrowsinessWindow::clear()
    {
        head_ = 0;
        size_ = 0;
        closed_count_ = 0;
    }

    double DrowsinessWindow::perclos() const
    {
        if (size_ == 0)
            return 0.0;
        return static_cast<double>(closed_count_) / static_cast<double>(size_);
    }

    std::vector<EyeState> DrowsinessWindow::snapshot() const
    {
        std::vector<EyeState> ordered;
        ordered.reserve(size_);
        size_t start = (head_ + capacity_ - size_) % capacity_;
        for (size_t i = 0; i < size_; ++i)
            ordered.push_back(samples_[(start + i) % capacity_]);
        return ordered;
    }

    // ---------------------------------------------------------- out of frame

    OutOfFrameMonitor::OutOfFrameMonitor(int threshold) : threshold_(threshold)
    {
        if (threshold_ < 1)
            throw ConfigurationError("Out-of-frame threshold must be >= 1");
    }

    void OutOfFrameMonitor::update(bool face_detected)
    {
        if (face_detected)
        {
            consecutive_misses_ = 0;
            state_ = OutOfFrameState::TRACKING;
            return;
        }

        ++consecutive_misses_;
        if (consecutive_misses_ >= threshold_)
            state_ = OutOfFrameState::ALARMED;
    }

    void OutOfFrameMonitor::reset()
    {
        consecutive_misses_ = 0;
        state_ = OutOfFrameState::TRACKING;
    }

    // ------------------------------------------------------------ drowsiness

    DrowsinessMonitor::DrowsinessMonitor(double perclos_threshold, double sustained_seconds,
                                         double cooldown_seconds, size_t window_size)
        : perclos_threshold_(perclos_threshold),
          sustained_(toDuration(sustained_seconds, "Sustained duration")),
          cooldown_(toDuration(cooldown_seconds, "Cooldown duration")),
          window_(window_size)
    {
        if (!(perclos_threshold >= 0.0 && perclos_threshold <= 1.0))
            throw ConfigurationError("PERCLOS threshold must be in [0, 1]");
    }

    Timestamp DrowsinessMonitor::effectiveTime(Timestamp timestamp)
    {
        if (last_timestamp_ && timestamp < *last_timestamp_)
        {
            ++clock_regressions_;
            return *last_timestamp_;
        }
        last_timestamp_ = timestamp;
        return timestamp;
    }

    void DrowsinessMonitor::update(EyeState eye_state, Timestamp timestamp)
    {
        Timestamp now = effectiveTime(timestamp);

        window_.push(eye_state);
        perclos_ = window_.perclos();
        const bool drowsy = isDrowsyConditionMet();

        if (state_ == DrowsinessState::COOLDOWN)
        {
            if (now - *cleared_at_ < cooldown_)
                return;
            state_ = DrowsinessState::NORMAL;
        }

        if (state_ == DrowsinessState::NORMAL && drowsy)
        {
            drowsy_since_ = now;
            state_ = DrowsinessState::CONFIRMING;
        }

        if (state_ == DrowsinessState::CONFIRMING)
        {
            if (!drowsy)
            {
                drowsy_since_.reset();
                state_ = DrowsinessState::NORMAL;
            }
            else if (now - *drowsy_since_ >= sustained_)
            {
                state_ = DrowsinessState::ALARMED;
            }
            return;
        }

        if (state_ == DrowsinessState::ALARMED && !drowsy)
        {
            cleared_at_ = now;
            drowsy_since_.reset();
            state_ = DrowsinessState::COOLDOWN;
        }
    }

    void DrowsinessMonitor::reset()
    {
        window_.clear();
        state_ = DrowsinessState::NORMAL;
        perclos_ = 0.0;
        drowsy_since_.reset();
        cleared_at_.reset();
        last_timestamp_.reset();
        clock_regressions_ = 0;
    }

    // ---------------------------------------------------------------- facade

    SafetyMonitor::SafetyMonitor(const SafetyConfig &config)
        : config_(validated(config)),
          out_of_frame_(config.out_of_frame_threshold),
          drowsiness_(config.perclos_threshold, config.sustained_seconds, config.cooldown_seconds,
                      static_cast<size_t>(config.window_size))
    {
    }

    void SafetyMonitor::update(bool face_detected, EyeState eye_state, Timestamp timestamp)
    {
        out_of_frame_.update(face_detected);
        drowsiness_.update(eye_state, timestamp);
    }

    void SafetyMonitor::reset()
    {
        out_of_frame_.reset();
        drowsiness_.reset();
    }

    SafetyStatus SafetyMonitor::getStatus() const
    {
        SafetyStatus status;
        status.out_of_frame_alarm = out_of_frame_.isAlarmActive();
        status.drowsiness_alarm = drowsiness_.isAlarmActive();
        status.drowsiness_score = drowsiness_.getDrowsinessScore();
        return status;
    }

    std::string drowsinessStateToString(DrowsinessState state)
    {
        switch (state)
        {
        case DrowsinessState::NORMAL:
            return "NORMAL";
        case DrowsinessState::CONFIRMING:
            return "CONFIRMING";
        case DrowsinessState::ALARMED:
            return "ALARMED";
        case DrowsinessState::COOLDOWN:
            return "COOLDOWN";
        default:
            return "UNKNOWN";
        }
    }
}
