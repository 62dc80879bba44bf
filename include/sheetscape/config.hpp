#pragma once

#include <cstdint>
#include <optional>
#include <sheetscape/logger.hpp>
#include <string>
#include <string_view>

namespace sheetscape
{

enum class VisualizationStrategy
{
    Sidebar,
    Tabs,
    Grouping,
    Gallery,
};

enum class InteractionStrategy
{
    Overlay,
    ContextualMenu,
};

enum class ProgressStrategy
{
    None,
    FixedDelay,
    Streaming,
};

const char* to_string(VisualizationStrategy s);
const char* to_string(InteractionStrategy s);
const char* to_string(ProgressStrategy s);

std::optional<VisualizationStrategy> parse_visualization(std::string_view name);
std::optional<InteractionStrategy>   parse_interaction(std::string_view name);
std::optional<ProgressStrategy>      parse_progress(std::string_view name);

// Workspace settings selected from the control surface, plus the tuning
// constants of the animation and lifecycle timers. Persisted as JSON.
struct WorkspaceConfig
{
    static constexpr int VERSION = 1;

    VisualizationStrategy visualization = VisualizationStrategy::Sidebar;
    InteractionStrategy   interaction   = InteractionStrategy::Overlay;
    ProgressStrategy      progress      = ProgressStrategy::None;

    float animation_rate      = 6.0f;    // per second
    float fixed_delay_sec     = 1.5f;
    float stream_interval_sec = 0.15f;
    float stream_step         = 0.1f;
    float reserved_panel_px   = 352.0f;

    int      panel_count   = 0;   // 0 = backend default
    uint32_t seed          = 42;
    int      window_width  = 1600;
    int      window_height = 900;
    LogLevel log_level     = LogLevel::Info;

    std::string serialize() const;

    // Reads a document produced by serialize(). Unknown keys are ignored and
    // unreadable values keep their current setting. Returns false on empty
    // input or a newer version.
    bool deserialize(const std::string& json);

    bool save(const std::string& path) const;
    bool load(const std::string& path);

    // ~/.config/sheetscape/workspace.json
    static std::string default_path();
};

}   // namespace sheetscape
