#pragma once

#ifdef SHEETSCAPE_USE_IMGUI

namespace sheetscape
{

class WorkspaceScene;

// Right-hand ImGui panel: analysis run buttons (overlay interaction only)
// and the strategy radio groups.
class ControlPanel
{
   public:
    static constexpr float WIDTH  = 320.0f;
    static constexpr float MARGIN = 16.0f;

    // Returns true when a persisted setting changed this frame.
    bool draw(WorkspaceScene& scene, float viewport_width);
};

}   // namespace sheetscape

#endif   // SHEETSCAPE_USE_IMGUI
