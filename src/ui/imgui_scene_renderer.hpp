#pragma once

#ifdef SHEETSCAPE_USE_IMGUI

    #include <vector>

    #include "scene/renderer.hpp"

struct ImDrawList;

namespace sheetscape
{

// Projects the scene into the ImGui background draw list. Boxes become the
// convex hull of their projected corners and everything is painted back to
// front by NDC depth.
class ImGuiSceneRenderer : public SceneRenderer
{
   public:
    void render(const SceneDescription& scene,
                const Camera&           camera,
                const RenderViewport&   viewport) override;

    size_t last_item_count() const { return drawn_; }

   private:
    enum class ItemKind
    {
        Box,
        Text,
        Sphere,
    };

    struct Item
    {
        float    depth;
        ItemKind kind;
        size_t   index;
    };

    void draw_box(ImDrawList* dl, const DrawBox& box, const Camera& camera, const RenderViewport& vp);
    void draw_text(ImDrawList* dl, const DrawText& text, const Camera& camera, const RenderViewport& vp);
    void draw_sphere(ImDrawList* dl, const DrawSphere& sphere, const Camera& camera, const RenderViewport& vp);
    void draw_diagnostic(ImDrawList* dl, const SceneDescription& scene, const RenderViewport& vp);

    std::vector<Item> items_;
    size_t            drawn_ = 0;
};

}   // namespace sheetscape

#endif   // SHEETSCAPE_USE_IMGUI
