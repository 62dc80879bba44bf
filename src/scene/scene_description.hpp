#pragma once

#include <optional>
#include <sheetscape/artifact.hpp>
#include <sheetscape/color.hpp>
#include <sheetscape/math3d.hpp>
#include <string>
#include <vector>

namespace sheetscape
{

// Oriented box in world space. Only yaw is supported.
struct DrawBox
{
    vec3  center;
    vec3  size;
    float yaw = 0.0f;
    Color color;
};

enum class TextAlign
{
    Left,
    Center,
    Right,
};

struct DrawText
{
    vec3        position;
    std::string text;
    float       size      = 0.2f;   // glyph height, world units
    float       max_width = 0.0f;   // wrap width, 0 = no wrap
    float       yaw       = 0.0f;
    TextAlign   align     = TextAlign::Center;
    bool        top       = false;  // position is the top edge, else the middle
    Color       color;
};

struct DrawSphere
{
    vec3  center;
    float radius = 0.08f;
    Color color;
};

enum class HitKind
{
    ActivateArtifact,
    FocusPlot,
    ToggleExpand,
    PrevPage,
    NextPage,
    MenuEntry,
};

// Clickable rectangle facing +Z after yaw.
struct HitRegion
{
    HitKind    kind = HitKind::ActivateArtifact;
    ArtifactId artifact;
    int        index  = -1;
    vec3       center;
    double     width  = 0.0;
    double     height = 0.0;
    float      yaw    = 0.0f;
};

struct PickResult
{
    const HitRegion* region   = nullptr;
    double           distance = 0.0;
};

// Everything a renderer needs for one frame, rebuilt from workspace state.
struct SceneDescription
{
    Color                   clear_color;
    std::vector<DrawBox>    boxes;
    std::vector<DrawText>   texts;
    std::vector<DrawSphere> spheres;
    std::vector<HitRegion>  hits;

    // Error screen in place of the scene.
    bool        diagnostic = false;
    std::string diagnostic_message;

    void clear();

    // Nearest region along the ray; later regions win exact ties.
    std::optional<PickResult> pick(const Ray& ray) const;

    size_t item_count() const { return boxes.size() + texts.size() + spheres.size(); }
};

// Local-to-world mapping of a board (or a sub-group on it).
struct BoardFrame
{
    vec3  origin;
    float yaw   = 0.0f;
    float scale = 1.0f;

    vec3 to_world(const vec3& local) const;

    // Frame for a child group at `offset` with an extra yaw.
    BoardFrame child(const vec3& offset, float extra_yaw = 0.0f) const;
};

}   // namespace sheetscape
