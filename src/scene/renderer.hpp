#pragma once

#include <sheetscape/camera.hpp>

#include "scene_description.hpp"

namespace sheetscape
{

struct RenderViewport
{
    float width  = 0.0f;   // pixels
    float height = 0.0f;
};

// Consumes one frame of scene description. Implementations must honor
// per-item alpha; the description is rebuilt every frame.
class SceneRenderer
{
   public:
    virtual ~SceneRenderer() = default;

    virtual void render(const SceneDescription& scene,
                        const Camera&           camera,
                        const RenderViewport&   viewport) = 0;
};

}   // namespace sheetscape
