#ifdef SHEETSCAPE_USE_IMGUI

    #include "imgui_scene_renderer.hpp"

    #include <algorithm>
    #include <cfloat>
    #include <cmath>
    #include <imgui.h>

    #include "scene/diagnostic_boundary.hpp"

namespace sheetscape
{

namespace
{

constexpr float MIN_TEXT_PX = 3.0f;
constexpr float MIN_ALPHA   = 1.0f / 255.0f;

ImU32 to_imu32(const Color& c)
{
    return ImGui::ColorConvertFloat4ToU32(ImVec4(c.r, c.g, c.b, c.a));
}

vec3 rotate_y(const vec3& v, float yaw)
{
    double c = std::cos(yaw);
    double s = std::sin(yaw);
    return {c * v.x + s * v.z, v.y, -s * v.x + c * v.z};
}

float cross(const ImVec2& o, const ImVec2& a, const ImVec2& b)
{
    return (a.x - o.x) * (b.y - o.y) - (a.y - o.y) * (b.x - o.x);
}

// Andrew's monotone chain; returns the hull in counter-clockwise order.
int convex_hull(ImVec2* pts, int n, ImVec2* out)
{
    std::sort(pts, pts + n, [](const ImVec2& a, const ImVec2& b)
              { return a.x < b.x || (a.x == b.x && a.y < b.y); });

    int k = 0;
    for (int i = 0; i < n; ++i)
    {
        while (k >= 2 && cross(out[k - 2], out[k - 1], pts[i]) <= 0.0f)
            --k;
        out[k++] = pts[i];
    }
    for (int i = n - 2, lower = k + 1; i >= 0; --i)
    {
        while (k >= lower && cross(out[k - 2], out[k - 1], pts[i]) <= 0.0f)
            --k;
        out[k++] = pts[i];
    }
    return k > 1 ? k - 1 : k;
}

}   // namespace

void ImGuiSceneRenderer::render(const SceneDescription& scene,
                                const Camera&           camera,
                                const RenderViewport&   viewport)
{
    ImDrawList* dl = ImGui::GetBackgroundDrawList();
    drawn_         = 0;

    if (scene.diagnostic)
    {
        draw_diagnostic(dl, scene, viewport);
        return;
    }

    items_.clear();
    items_.reserve(scene.item_count());

    auto depth_of = [&](const vec3& p) -> std::optional<float>
    {
        auto sp = camera.project(p, viewport.width, viewport.height);
        if (!sp)
            return std::nullopt;
        return sp->depth;
    };

    for (size_t i = 0; i < scene.boxes.size(); ++i)
    {
        if (auto d = depth_of(scene.boxes[i].center))
            items_.push_back({*d, ItemKind::Box, i});
    }
    for (size_t i = 0; i < scene.spheres.size(); ++i)
    {
        if (auto d = depth_of(scene.spheres[i].center))
            items_.push_back({*d, ItemKind::Sphere, i});
    }
    for (size_t i = 0; i < scene.texts.size(); ++i)
    {
        if (auto d = depth_of(scene.texts[i].position))
            items_.push_back({*d, ItemKind::Text, i});
    }

    std::stable_sort(items_.begin(), items_.end(), [](const Item& a, const Item& b) { return a.depth > b.depth; });

    for (const auto& item : items_)
    {
        switch (item.kind)
        {
            case ItemKind::Box:
                draw_box(dl, scene.boxes[item.index], camera, viewport);
                break;
            case ItemKind::Text:
                draw_text(dl, scene.texts[item.index], camera, viewport);
                break;
            case ItemKind::Sphere:
                draw_sphere(dl, scene.spheres[item.index], camera, viewport);
                break;
        }
    }
}

void ImGuiSceneRenderer::draw_box(ImDrawList*           dl,
                                  const DrawBox&        box,
                                  const Camera&         camera,
                                  const RenderViewport& vp)
{
    if (box.color.a < MIN_ALPHA)
        return;

    ImVec2 pts[8];
    vec3   half = box.size * 0.5;
    int    n    = 0;
    for (int sx = -1; sx <= 1; sx += 2)
    {
        for (int sy = -1; sy <= 1; sy += 2)
        {
            for (int sz = -1; sz <= 1; sz += 2)
            {
                vec3 corner = box.center + rotate_y({half.x * sx, half.y * sy, half.z * sz}, box.yaw);
                auto sp     = camera.project(corner, vp.width, vp.height);
                if (!sp)
                    return;
                pts[n++] = ImVec2(sp->x, sp->y);
            }
        }
    }

    ImVec2 hull[16];
    int    count = convex_hull(pts, n, hull);
    if (count >= 3)
    {
        dl->AddConvexPolyFilled(hull, count, to_imu32(box.color));
        ++drawn_;
    }
}

void ImGuiSceneRenderer::draw_text(ImDrawList*           dl,
                                   const DrawText&       text,
                                   const Camera&         camera,
                                   const RenderViewport& vp)
{
    if (text.text.empty() || text.color.a < MIN_ALPHA)
        return;

    auto base = camera.project(text.position, vp.width, vp.height);
    auto top  = camera.project(text.position + vec3{0.0, text.size, 0.0}, vp.width, vp.height);
    if (!base || !top)
        return;

    float px = std::fabs(base->y - top->y);
    if (px < MIN_TEXT_PX)
        return;

    float wrap = 0.0f;
    if (text.max_width > 0.0f)
        wrap = px * text.max_width / text.size;

    ImFont* font = ImGui::GetFont();
    ImVec2  size = font->CalcTextSizeA(px, FLT_MAX, wrap, text.text.c_str());

    ImVec2 pos(base->x, base->y);
    if (text.align == TextAlign::Center)
        pos.x -= size.x * 0.5f;
    else if (text.align == TextAlign::Right)
        pos.x -= size.x;
    if (!text.top)
        pos.y -= size.y * 0.5f;

    dl->AddText(font, px, pos, to_imu32(text.color), text.text.c_str(), nullptr, wrap);
    ++drawn_;
}

void ImGuiSceneRenderer::draw_sphere(ImDrawList*           dl,
                                     const DrawSphere&     sphere,
                                     const Camera&         camera,
                                     const RenderViewport& vp)
{
    if (sphere.color.a < MIN_ALPHA)
        return;

    auto c = camera.project(sphere.center, vp.width, vp.height);
    auto e = camera.project(sphere.center + vec3{sphere.radius, 0.0, 0.0}, vp.width, vp.height);
    if (!c || !e)
        return;

    float r = std::max(1.0f, std::hypot(e->x - c->x, e->y - c->y));
    dl->AddCircleFilled(ImVec2(c->x, c->y), r, to_imu32(sphere.color));
    ++drawn_;
}

void ImGuiSceneRenderer::draw_diagnostic(ImDrawList* dl, const SceneDescription& scene, const RenderViewport& vp)
{
    dl->AddRectFilled(ImVec2(0.0f, 0.0f), ImVec2(vp.width, vp.height), to_imu32(scene.clear_color));

    ImFont* font     = ImGui::GetFont();
    float   headline = 32.0f;
    float   body     = 16.0f;

    ImVec2 hs = font->CalcTextSizeA(headline, FLT_MAX, 0.0f, DiagnosticBoundary::HEADLINE);
    ImVec2 at((vp.width - hs.x) * 0.5f, vp.height * 0.4f);
    dl->AddText(font, headline, at, IM_COL32(248, 113, 113, 255), DiagnosticBoundary::HEADLINE);

    const char* msg = scene.diagnostic_message.c_str();
    ImVec2      ms  = font->CalcTextSizeA(body, FLT_MAX, vp.width * 0.8f, msg);
    dl->AddText(font,
                body,
                ImVec2((vp.width - ms.x) * 0.5f, at.y + hs.y + 16.0f),
                IM_COL32(148, 163, 184, 255),
                msg,
                nullptr,
                vp.width * 0.8f);
    drawn_ = 2;
}

}   // namespace sheetscape

#endif   // SHEETSCAPE_USE_IMGUI
