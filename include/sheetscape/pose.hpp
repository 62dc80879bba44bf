#pragma once

#include <sheetscape/math3d.hpp>

namespace sheetscape
{

// Animatable state of a board. Rotation is Euler (x, y, z) in radians; only
// yaw is driven by the placement strategies. Width and height are the board
// extent in world units before scale is applied.
struct Pose
{
    vec3  position;
    vec3  rotation;
    float scale   = 1.0f;
    float opacity = 1.0f;
    float width   = 0.0f;
    float height  = 0.0f;

    bool operator==(const Pose& o) const
    {
        return position == o.position && rotation == o.rotation && scale == o.scale
               && opacity == o.opacity && width == o.width && height == o.height;
    }
    bool operator!=(const Pose& o) const { return !(*this == o); }
};

// One exponential-decay step of every component of `current` toward `target`.
// The blend factor is min(1, rate * dt); non-positive dt or rate leaves
// `current` unchanged, so the step can never overshoot.
Pose advance_pose(const Pose& current, const Pose& target, float dt, float rate);

// Largest absolute component difference between two poses.
double pose_distance(const Pose& a, const Pose& b);

}   // namespace sheetscape
