#include "frame_scheduler.hpp"

#include <sheetscape/logger.hpp>
#include <thread>

namespace sheetscape
{

FrameScheduler::FrameScheduler(float target_fps, Mode mode) : target_fps_(target_fps), mode_(mode)
{
    reset();
}

void FrameScheduler::set_target_fps(float fps)
{
    if (fps > 0.0f)
        target_fps_ = fps;
}

void FrameScheduler::set_fixed_timestep(float dt)
{
    if (dt <= 0.0f)
        return;
    use_fixed_timestep_ = true;
    fixed_dt_           = dt;
}

void FrameScheduler::clear_fixed_timestep()
{
    use_fixed_timestep_ = false;
}

void FrameScheduler::begin_frame()
{
    frame_start_ = Clock::now();

    if (first_frame_)
    {
        first_frame_      = false;
        last_frame_start_ = frame_start_;
        frame_            = Frame{};
        return;
    }

    Duration raw = frame_start_ - last_frame_start_;
    last_frame_start_ = frame_start_;
    step(static_cast<float>(raw.count()));
}

const Frame& FrameScheduler::step(float raw_dt)
{
    if (raw_dt < 0.0f)
        raw_dt = 0.0f;
    if (raw_dt > MAX_DT)
        raw_dt = MAX_DT;

    float target_ms = target_fps_ > 0.0f ? 1000.0f / target_fps_ : 16.667f;
    if (raw_dt * 1000.0f > target_ms * 2.0f)
    {
        ++hitch_count_;
        SHEETSCAPE_LOG_DEBUG("scheduler",
                             "frame {} hitch: {}ms (target {}ms)",
                             frame_.number + 1,
                             raw_dt * 1000.0f,
                             target_ms);
    }

    frame_.dt = use_fixed_timestep_ ? fixed_dt_ : raw_dt;
    frame_.elapsed_sec += frame_.dt;
    frame_.number++;
    return frame_;
}

void FrameScheduler::end_frame()
{
    if (mode_ != Mode::TargetFPS || target_fps_ <= 0.0f)
        return;

    Duration target_frame_time{1.0 / static_cast<double>(target_fps_)};
    Duration frame_duration = Clock::now() - frame_start_;
    if (frame_duration < target_frame_time)
    {
        std::this_thread::sleep_for(std::chrono::duration_cast<std::chrono::microseconds>(
            target_frame_time - frame_duration));
    }
}

void FrameScheduler::reset()
{
    first_frame_ = true;
    frame_       = Frame{};
    hitch_count_ = 0;
}

}   // namespace sheetscape
