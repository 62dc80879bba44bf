#include "scene_description.hpp"

#include <cmath>

namespace sheetscape
{

static vec3 rotate_y(const vec3& v, float yaw)
{
    double c = std::cos(yaw);
    double s = std::sin(yaw);
    return {c * v.x + s * v.z, v.y, -s * v.x + c * v.z};
}

void SceneDescription::clear()
{
    boxes.clear();
    texts.clear();
    spheres.clear();
    hits.clear();
    diagnostic = false;
    diagnostic_message.clear();
}

std::optional<PickResult> SceneDescription::pick(const Ray& ray) const
{
    std::optional<PickResult> best;
    for (const auto& region : hits)
    {
        vec3 normal = rotate_y({0.0, 0.0, 1.0}, region.yaw);
        auto hit    = ray_plane_intersect(ray, Plane{region.center, normal});
        if (!hit)
            continue;

        vec3   local  = *hit - region.center;
        vec3   x_axis = rotate_y({1.0, 0.0, 0.0}, region.yaw);
        double u      = vec3_dot(local, x_axis);
        if (std::fabs(u) > region.width * 0.5 || std::fabs(local.y) > region.height * 0.5)
            continue;

        double dist = vec3_length(*hit - ray.origin);
        if (!best || dist <= best->distance)
            best = PickResult{&region, dist};
    }
    return best;
}

vec3 BoardFrame::to_world(const vec3& local) const
{
    return origin + rotate_y(local * scale, yaw);
}

BoardFrame BoardFrame::child(const vec3& offset, float extra_yaw) const
{
    return BoardFrame{to_world(offset), yaw + extra_yaw, scale};
}

}   // namespace sheetscape
