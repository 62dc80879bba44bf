#pragma once

#include <optional>
#include <sheetscape/math3d.hpp>

namespace sheetscape
{

struct ViewportInfo;

// Screen position in pixels (origin top-left) and NDC depth in [0,1].
struct ScreenPoint
{
    float x     = 0.0f;
    float y     = 0.0f;
    float depth = 0.0f;
};

// Fixed perspective camera looking at the workspace.
class Camera
{
   public:
    vec3 position{0.0, 5.0, 15.0};
    vec3 target{0.0, 4.0, 0.0};
    vec3 up{0.0, 1.0, 0.0};

    float fov       = 45.0f;   // vertical, degrees
    float near_clip = 0.1f;
    float far_clip  = 100.0f;

    mat4 view_matrix() const;
    mat4 projection_matrix(float aspect_ratio) const;
    mat4 view_projection(float width_px, float height_px) const;

    Ray screen_ray(float x_px, float y_px, float width_px, float height_px) const;

    // Empty for points behind the camera.
    std::optional<ScreenPoint> project(const vec3& world, float width_px, float height_px) const;

    // World-space rectangle visible on the plane z = plane_z.
    ViewportInfo visible_region(float width_px, float height_px, double plane_z = 0.0) const;
};

}   // namespace sheetscape
