#include "timer_queue.hpp"

#include <algorithm>
#include <sheetscape/logger.hpp>

namespace sheetscape
{

static constexpr double DUE_EPSILON = 1e-9;

TimerId TimerQueue::schedule_once(double delay_sec, OneShotCallback cb)
{
    Timer t;
    t.id   = next_id_++;
    t.due  = now_ + std::max(0.0, delay_sec);
    t.once = std::move(cb);
    timers_.push_back(std::move(t));
    return timers_.back().id;
}

TimerId TimerQueue::schedule_repeating(double interval_sec, RepeatingCallback cb)
{
    Timer t;
    t.id        = next_id_++;
    t.interval  = std::max(MIN_INTERVAL, interval_sec);
    t.due       = now_ + t.interval;
    t.repeating = true;
    t.repeat    = std::move(cb);
    timers_.push_back(std::move(t));
    return timers_.back().id;
}

bool TimerQueue::cancel(TimerId id)
{
    Timer* t = find(id);
    if (!t || t->finished)
        return false;
    t->finished = true;
    return true;
}

bool TimerQueue::is_pending(TimerId id) const
{
    for (const auto& t : timers_)
    {
        if (t.id == id)
            return !t.finished;
    }
    return false;
}

size_t TimerQueue::pending_count() const
{
    return static_cast<size_t>(
        std::count_if(timers_.begin(), timers_.end(), [](const Timer& t) { return !t.finished; }));
}

TimerQueue::Timer* TimerQueue::find(TimerId id)
{
    for (auto& t : timers_)
    {
        if (t.id == id)
            return &t;
    }
    return nullptr;
}

TimerQueue::Timer* TimerQueue::next_due(double limit)
{
    Timer* best = nullptr;
    for (auto& t : timers_)
    {
        if (t.finished || t.due > limit + DUE_EPSILON)
            continue;
        if (!best || t.due < best->due)
            best = &t;
    }
    return best;
}

size_t TimerQueue::advance(double dt)
{
    if (dt < 0.0)
        dt = 0.0;
    double target = now_ + dt;
    size_t fired  = 0;

    // Callbacks may schedule or cancel timers, so entries are re-resolved
    // by id after every call.
    while (Timer* t = next_due(target))
    {
        now_       = std::max(now_, t->due);
        TimerId id = t->id;

        if (!t->repeating)
        {
            auto cb     = std::move(t->once);
            t->finished = true;
            if (cb)
                cb();
        }
        else
        {
            // The callback runs outside the entry and is put back afterwards,
            // so state captured by a mutable lambda survives across firings.
            auto cb    = std::move(t->repeat);
            bool again = cb ? cb() : false;
            if (Timer* after = find(id); after && !after->finished)
            {
                after->repeat = std::move(cb);
                if (again)
                    after->due += after->interval;
                else
                    after->finished = true;
            }
        }
        ++fired;
    }

    now_ = std::max(now_, target);
    std::erase_if(timers_, [](const Timer& t) { return t.finished; });

    if (fired > 0)
        SHEETSCAPE_LOG_TRACE("timer", "advance to {}: {} fired", now_, fired);
    return fired;
}

}   // namespace sheetscape
