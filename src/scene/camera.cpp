#include <cmath>
#include <sheetscape/camera.hpp>

#include "layout/viewport_partitioner.hpp"

namespace sheetscape
{

mat4 Camera::view_matrix() const
{
    return mat4_look_at(position, target, up);
}

mat4 Camera::projection_matrix(float aspect_ratio) const
{
    if (aspect_ratio <= 0.0f)
        aspect_ratio = 1.0f;
    return mat4_perspective(deg_to_rad(fov), aspect_ratio, near_clip, far_clip);
}

mat4 Camera::view_projection(float width_px, float height_px) const
{
    float aspect = height_px > 0.0f ? width_px / height_px : 1.0f;
    return mat4_mul(projection_matrix(aspect), view_matrix());
}

Ray Camera::screen_ray(float x_px, float y_px, float width_px, float height_px) const
{
    mat4 inv = mat4_inverse(view_projection(width_px, height_px));
    return unproject(x_px, y_px, inv, width_px, height_px);
}

std::optional<ScreenPoint> Camera::project(const vec3& world, float width_px, float height_px) const
{
    vec4 clip = mat4_mul_vec4(view_projection(width_px, height_px), vec4{world, 1.0});
    if (clip.w <= 1e-6)
        return std::nullopt;

    double ndc_x = clip.x / clip.w;
    double ndc_y = clip.y / clip.w;
    double ndc_z = clip.z / clip.w;

    ScreenPoint p;
    p.x     = static_cast<float>((ndc_x + 1.0) * 0.5 * width_px);
    p.y     = static_cast<float>((ndc_y + 1.0) * 0.5 * height_px);
    p.depth = static_cast<float>(ndc_z);
    return p;
}

ViewportInfo Camera::visible_region(float width_px, float height_px, double plane_z) const
{
    ViewportInfo info;
    info.pixel_width = width_px;

    Plane plane{{0.0, 0.0, plane_z}, {0.0, 0.0, 1.0}};
    auto  hit_at = [&](float x, float y)
    { return ray_plane_intersect(screen_ray(x, y, width_px, height_px), plane); };

    auto left   = hit_at(0.0f, height_px * 0.5f);
    auto right  = hit_at(width_px, height_px * 0.5f);
    auto top    = hit_at(width_px * 0.5f, 0.0f);
    auto bottom = hit_at(width_px * 0.5f, height_px);

    if (left && right && top && bottom)
    {
        info.world_width  = right->x - left->x;
        info.world_height = top->y - bottom->y;
        info.center_x     = (left->x + right->x) * 0.5;
        info.center_y     = (top->y + bottom->y) * 0.5;
        return info;
    }

    // Plane edge not visible: fall back to the extent at the target distance.
    double dist       = vec3_length(target - position);
    double aspect     = height_px > 0.0f ? width_px / height_px : 1.0;
    info.world_height = 2.0 * dist * std::tan(deg_to_rad(fov) * 0.5);
    info.world_width  = info.world_height * aspect;
    info.center_x     = target.x;
    info.center_y     = target.y;
    return info;
}

}   // namespace sheetscape
