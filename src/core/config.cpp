#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sheetscape/config.hpp>
#include <sstream>

namespace sheetscape
{

// ─── Enum names ──────────────────────────────────────────────────────────────

const char* to_string(VisualizationStrategy s)
{
    switch (s)
    {
        case VisualizationStrategy::Sidebar:
            return "sidebar";
        case VisualizationStrategy::Tabs:
            return "tabs";
        case VisualizationStrategy::Grouping:
            return "grouping";
        case VisualizationStrategy::Gallery:
            return "gallery";
    }
    return "sidebar";
}

const char* to_string(InteractionStrategy s)
{
    switch (s)
    {
        case InteractionStrategy::Overlay:
            return "spreadsheet-overlay";
        case InteractionStrategy::ContextualMenu:
            return "contextual-menu";
    }
    return "spreadsheet-overlay";
}

const char* to_string(ProgressStrategy s)
{
    switch (s)
    {
        case ProgressStrategy::None:
            return "none";
        case ProgressStrategy::FixedDelay:
            return "fixed-delay";
        case ProgressStrategy::Streaming:
            return "streaming";
    }
    return "none";
}

std::optional<VisualizationStrategy> parse_visualization(std::string_view name)
{
    if (name == "sidebar")
        return VisualizationStrategy::Sidebar;
    if (name == "tabs")
        return VisualizationStrategy::Tabs;
    if (name == "grouping")
        return VisualizationStrategy::Grouping;
    if (name == "gallery")
        return VisualizationStrategy::Gallery;
    return std::nullopt;
}

std::optional<InteractionStrategy> parse_interaction(std::string_view name)
{
    if (name == "spreadsheet-overlay" || name == "overlay")
        return InteractionStrategy::Overlay;
    if (name == "contextual-menu")
        return InteractionStrategy::ContextualMenu;
    return std::nullopt;
}

std::optional<ProgressStrategy> parse_progress(std::string_view name)
{
    if (name == "none")
        return ProgressStrategy::None;
    if (name == "fixed-delay" || name == "spreadsheet-overlay")
        return ProgressStrategy::FixedDelay;
    if (name == "streaming")
        return ProgressStrategy::Streaming;
    return std::nullopt;
}

// ─── JSON serialization ──────────────────────────────────────────────────────

std::string WorkspaceConfig::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << VERSION << ",\n";
    os << "  \"visualization\": \"" << to_string(visualization) << "\",\n";
    os << "  \"interaction\": \"" << to_string(interaction) << "\",\n";
    os << "  \"progress\": \"" << to_string(progress) << "\",\n";
    os << "  \"animation_rate\": " << animation_rate << ",\n";
    os << "  \"fixed_delay_sec\": " << fixed_delay_sec << ",\n";
    os << "  \"stream_interval_sec\": " << stream_interval_sec << ",\n";
    os << "  \"stream_step\": " << stream_step << ",\n";
    os << "  \"reserved_panel_px\": " << reserved_panel_px << ",\n";
    os << "  \"panel_count\": " << panel_count << ",\n";
    os << "  \"seed\": " << seed << ",\n";
    os << "  \"window_width\": " << window_width << ",\n";
    os << "  \"window_height\": " << window_height << ",\n";
    os << "  \"log_level\": \"" << Logger::level_to_string(log_level) << "\"\n";
    os << "}\n";
    return os.str();
}

// Minimal reader for the flat object written above.
static std::optional<std::string> read_json_string(const std::string& json, const std::string& key)
{
    std::string search = "\"" + key + "\"";
    auto        pos    = json.find(search);
    if (pos == std::string::npos)
        return std::nullopt;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        return std::nullopt;
    auto open = json.find_first_not_of(" \t\r\n", pos + 1);
    if (open == std::string::npos || json[open] != '"')
        return std::nullopt;
    auto close = json.find('"', open + 1);
    if (close == std::string::npos)
        return std::nullopt;
    return json.substr(open + 1, close - open - 1);
}

static std::optional<double> read_json_number(const std::string& json, const std::string& key)
{
    std::string search = "\"" + key + "\"";
    auto        pos    = json.find(search);
    if (pos == std::string::npos)
        return std::nullopt;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        return std::nullopt;
    const char* begin = json.c_str() + pos + 1;
    char*       end   = nullptr;
    double      value = std::strtod(begin, &end);
    if (end == begin)
        return std::nullopt;
    return value;
}

static void read_positive(const std::string& json, const std::string& key, float& out)
{
    auto v = read_json_number(json, key);
    if (v && *v > 0.0)
        out = static_cast<float>(*v);
}

bool WorkspaceConfig::deserialize(const std::string& json)
{
    if (json.empty())
        return false;

    if (auto ver = read_json_number(json, "version"))
    {
        if (static_cast<int>(*ver) > VERSION)
            return false;
    }

    if (auto s = read_json_string(json, "visualization"))
        visualization = parse_visualization(*s).value_or(visualization);
    if (auto s = read_json_string(json, "interaction"))
        interaction = parse_interaction(*s).value_or(interaction);
    if (auto s = read_json_string(json, "progress"))
        progress = parse_progress(*s).value_or(progress);

    read_positive(json, "animation_rate", animation_rate);
    read_positive(json, "fixed_delay_sec", fixed_delay_sec);
    read_positive(json, "stream_interval_sec", stream_interval_sec);
    read_positive(json, "stream_step", stream_step);

    if (auto v = read_json_number(json, "reserved_panel_px"); v && *v >= 0.0)
        reserved_panel_px = static_cast<float>(*v);
    if (auto v = read_json_number(json, "panel_count"); v && *v >= 0.0)
        panel_count = static_cast<int>(*v);
    if (auto v = read_json_number(json, "seed"); v && *v >= 0.0)
        seed = static_cast<uint32_t>(*v);
    if (auto v = read_json_number(json, "window_width"); v && *v > 0.0)
        window_width = static_cast<int>(*v);
    if (auto v = read_json_number(json, "window_height"); v && *v > 0.0)
        window_height = static_cast<int>(*v);
    if (auto s = read_json_string(json, "log_level"))
        log_level = Logger::level_from_string(*s).value_or(log_level);

    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool WorkspaceConfig::save(const std::string& path) const
{
    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            SHEETSCAPE_LOG_WARN("config", "cannot create {}: {}", dir.string(), ec.message());
            return false;
        }
    }

    std::ofstream f(path);
    if (!f.is_open())
        return false;
    f << serialize();
    return f.good();
}

bool WorkspaceConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return false;
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (!deserialize(json))
    {
        SHEETSCAPE_LOG_WARN("config", "ignoring unreadable config {}", path);
        return false;
    }
    SHEETSCAPE_LOG_INFO("config", "loaded {}", path);
    return true;
}

std::string WorkspaceConfig::default_path()
{
    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "workspace.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "sheetscape";
    return (dir / "workspace.json").string();
}

}   // namespace sheetscape
