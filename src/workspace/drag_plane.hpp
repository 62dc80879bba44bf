#pragma once

#include <optional>
#include <sheetscape/math3d.hpp>

namespace sheetscape
{

// Ray-plane projection shared by the drag, resize and clip gestures. The
// plane is fixed at begin(); delta() reports how far the pointer has moved
// across it since then.
class DragPlane
{
   public:
    // False when the ray misses the plane; the gesture does not start.
    bool begin(const vec3& anchor, const Ray& ray, const vec3& normal = {0.0, 0.0, 1.0});
    void end() { active_ = false; }

    std::optional<vec3> delta(const Ray& ray) const;

    bool         active() const { return active_; }
    const Plane& plane() const { return plane_; }
    const vec3&  start_point() const { return start_; }

   private:
    Plane plane_;
    vec3  start_;
    bool  active_ = false;
};

}   // namespace sheetscape
