#pragma once

#include <sheetscape/artifact.hpp>
#include <sheetscape/pose.hpp>
#include <string>

#include "scene_description.hpp"
#include "theme.hpp"

namespace sheetscape
{

class GridSurface;
class PlotPanel;

struct BoardView
{
    bool             active    = false;
    bool             hovered   = false;
    bool             tab_strip = false;   // inactive under the tabs layout
    const PlotPanel* panel     = nullptr;
};

// Turns workspace state into draw items and hit regions. Board content is
// laid out in board-local units and mapped through the board's pose.
class SceneBuilder
{
   public:
    // Board geometry in board-local units.
    static constexpr double BACKPLATE_DEPTH   = 0.1;
    static constexpr double CONTENT_Z         = 0.06;
    static constexpr double PROGRESS_WIDTH    = 4.0;
    static constexpr double PROGRESS_HEIGHT   = 0.2;
    static constexpr double BAR_WIDTH         = 0.2;
    static constexpr double BAR_GAP           = 0.05;
    static constexpr double PLOT_HEIGHT       = 2.0;
    static constexpr double SCATTER_WIDTH     = 2.5;
    static constexpr float  POINT_RADIUS      = 0.08f;
    static constexpr int    TAB_TITLE_CHARS   = 10;
    static constexpr double EXPANDED_COL_STEP = 4.0;
    static constexpr double EXPANDED_ROW_STEP = 3.8;

    explicit SceneBuilder(const ThemeColors& theme = default_theme()) : theme_(theme) {}

    void begin(SceneDescription& scene) const;

    void add_floor(SceneDescription& scene, double floor_y) const;

    void add_board(SceneDescription& scene,
                   const Artifact&   artifact,
                   const Pose&       pose,
                   const BoardView&  view) const;

    void add_grid(SceneDescription& scene, const GridSurface& grid) const;

    // Bar or scatter plot with its origin at the frame origin.
    void add_plot(SceneDescription& scene,
                  const PlotData&   plot,
                  const BoardFrame& frame,
                  float             opacity) const;

    // "42% Complete"
    static std::string progress_label(double progress);

    // Titles longer than TAB_TITLE_CHARS are cut and suffixed with "...".
    static std::string tab_title(const std::string& title);

    // Sample x positions across `width`, centered on 0. A single sample sits
    // in the middle.
    static double scatter_x(size_t index, size_t count, double width);

   private:
    void add_box(SceneDescription& scene,
                 const BoardFrame& frame,
                 const vec3&       local,
                 const vec3&       size,
                 const Color&      color) const;
    void add_text(SceneDescription&  scene,
                  const BoardFrame&  frame,
                  const vec3&        local,
                  const std::string& text,
                  float              size,
                  const Color&       color,
                  TextAlign          align     = TextAlign::Center,
                  bool               top       = false,
                  float              max_width = 0.0f) const;
    void add_hit(SceneDescription& scene,
                 const BoardFrame& frame,
                 const vec3&       local,
                 double            width,
                 double            height,
                 HitKind           kind,
                 const ArtifactId& artifact,
                 int               index = -1) const;

    void add_pending(SceneDescription& scene,
                     const Artifact&   artifact,
                     const BoardFrame& frame,
                     float             opacity) const;
    void add_plot_viewer(SceneDescription& scene,
                         const Artifact&   artifact,
                         const Pose&       pose,
                         const BoardFrame& frame,
                         const BoardView&  view) const;
    void add_pagination(SceneDescription& scene,
                        const Artifact&   artifact,
                        const PlotPanel&  panel,
                        const BoardFrame& frame,
                        float             opacity) const;

    const ThemeColors& theme_;
};

}   // namespace sheetscape
