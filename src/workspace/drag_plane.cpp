#include "drag_plane.hpp"

namespace sheetscape
{

bool DragPlane::begin(const vec3& anchor, const Ray& ray, const vec3& normal)
{
    plane_ = Plane{anchor, vec3_normalize(normal)};
    auto hit = ray_plane_intersect(ray, plane_);
    if (!hit)
    {
        active_ = false;
        return false;
    }
    start_  = *hit;
    active_ = true;
    return true;
}

std::optional<vec3> DragPlane::delta(const Ray& ray) const
{
    if (!active_)
        return std::nullopt;
    auto hit = ray_plane_intersect(ray, plane_);
    if (!hit)
        return std::nullopt;
    return *hit - start_;
}

}   // namespace sheetscape
