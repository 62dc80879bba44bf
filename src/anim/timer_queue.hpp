#pragma once

#include <cstdint>
#include <functional>
#include <vector>

namespace sheetscape
{

using TimerId = uint64_t;

inline constexpr TimerId INVALID_TIMER_ID = 0;

// Cooperative timers on their own clock. Nothing fires until the host calls
// advance(); due timers then run in due-time order (ties by creation order),
// and a repeating timer may fire several times within one advance.
class TimerQueue
{
   public:
    using OneShotCallback = std::function<void()>;
    // Return false to stop repeating.
    using RepeatingCallback = std::function<bool()>;

    static constexpr double MIN_INTERVAL = 1e-3;

    TimerId schedule_once(double delay_sec, OneShotCallback cb);
    TimerId schedule_repeating(double interval_sec, RepeatingCallback cb);

    bool cancel(TimerId id);
    bool is_pending(TimerId id) const;

    // Returns the number of callbacks fired.
    size_t advance(double dt);

    double now() const { return now_; }
    size_t pending_count() const;
    void   clear() { timers_.clear(); }

   private:
    struct Timer
    {
        TimerId           id       = INVALID_TIMER_ID;
        double            due      = 0.0;
        double            interval = 0.0;
        bool              repeating = false;
        bool              finished  = false;
        OneShotCallback   once;
        RepeatingCallback repeat;
    };

    Timer* find(TimerId id);
    Timer* next_due(double limit);

    std::vector<Timer> timers_;
    double             now_     = 0.0;
    TimerId            next_id_ = 1;
};

}   // namespace sheetscape
