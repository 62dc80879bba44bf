#pragma once

#include <chrono>
#include <cstdint>
#include <sheetscape/frame.hpp>

namespace sheetscape
{

// Produces the per-frame dt that drives animation and timers. Raw frame
// times are clamped so a stall (window drag, breakpoint) cannot launch every
// pose and timer forward in one step.
class FrameScheduler
{
   public:
    enum class Mode
    {
        TargetFPS,   // Sleep to hit target FPS
        Uncapped,    // Present pacing is left to the swapchain
    };

    static constexpr float MAX_DT = 0.25f;

    explicit FrameScheduler(float target_fps = 60.0f, Mode mode = Mode::TargetFPS);

    void  set_target_fps(float fps);
    float target_fps() const { return target_fps_; }

    void set_mode(Mode mode) { mode_ = mode; }
    Mode mode() const { return mode_; }

    // Fixed timestep for deterministic playback
    void set_fixed_timestep(float dt);
    void clear_fixed_timestep();
    bool has_fixed_timestep() const { return use_fixed_timestep_; }

    // Wall-clock driven frame boundaries
    void begin_frame();
    void end_frame();

    // Headless driving: feeds a raw frame time through the same clamping.
    const Frame& step(float raw_dt);

    void reset();

    const Frame& current_frame() const { return frame_; }
    float        dt() const { return frame_.dt; }
    uint64_t     frame_number() const { return frame_.number; }
    uint32_t     hitch_count() const { return hitch_count_; }

   private:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::duration<double>;

    float target_fps_ = 60.0f;
    Mode  mode_       = Mode::TargetFPS;

    bool  use_fixed_timestep_ = false;
    float fixed_dt_           = 1.0f / 60.0f;

    TimePoint frame_start_;
    TimePoint last_frame_start_;
    bool      first_frame_ = true;

    Frame    frame_;
    uint32_t hitch_count_ = 0;
};

}   // namespace sheetscape
