#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace sheetscape
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

// Process-wide logger. Messages below the minimum level are dropped before
// formatting; everything else is fanned out to the registered sinks.
class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;
    bool     is_enabled(LogLevel level) const;

    void   add_sink(LogSink sink);
    void   clear_sinks();
    size_t sink_count() const;

    void log(LogLevel level, std::string_view category, std::string_view message);

    // "{}" placeholders are replaced left to right; surplus arguments are dropped.
    template <typename... Args>
    void log_formatted(LogLevel level, std::string_view category, std::string_view format,
                       Args&&... args)
    {
        if (!is_enabled(level))
            return;
        log(level, category, format_message(format, std::forward<Args>(args)...));
    }

    static std::string             level_to_string(LogLevel level);
    static std::optional<LogLevel> level_from_string(std::string_view name);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

    template <typename... Args>
    static std::string format_message(std::string_view format, Args&&... args)
    {
        std::string result(format);
        size_t      cursor = 0;
        auto        substitute = [&](auto&& arg)
        {
            auto pos = result.find("{}", cursor);
            if (pos == std::string::npos)
                return;
            std::string text = to_text(std::forward<decltype(arg)>(arg));
            result.replace(pos, 2, text);
            cursor = pos + text.size();
        };
        (substitute(std::forward<Args>(args)), ...);
        return result;
    }

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    template <typename T>
    static std::string to_text(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, std::string>)
            return v;
        else if constexpr (std::is_same_v<D, std::string_view>)
            return std::string(v);
        else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
            return v ? std::string(v) : std::string("(null)");
        else if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else if constexpr (std::is_same_v<D, char>)
            return std::string(1, v);
        else
            return std::to_string(v);
    }

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Info;
    std::vector<LogSink> sinks_;
};

namespace sinks
{
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();
}   // namespace sinks

}   // namespace sheetscape

#define SHEETSCAPE_LOG_AT(level, category, ...)                                        \
    do                                                                                 \
    {                                                                                  \
        if (::sheetscape::Logger::instance().is_enabled(level))                        \
        {                                                                              \
            ::sheetscape::Logger::instance().log_formatted(level, category, __VA_ARGS__); \
        }                                                                              \
    } while (0)

#define SHEETSCAPE_LOG_TRACE(category, ...) \
    SHEETSCAPE_LOG_AT(::sheetscape::LogLevel::Trace, category, __VA_ARGS__)
#define SHEETSCAPE_LOG_DEBUG(category, ...) \
    SHEETSCAPE_LOG_AT(::sheetscape::LogLevel::Debug, category, __VA_ARGS__)
#define SHEETSCAPE_LOG_INFO(category, ...) \
    SHEETSCAPE_LOG_AT(::sheetscape::LogLevel::Info, category, __VA_ARGS__)
#define SHEETSCAPE_LOG_WARN(category, ...) \
    SHEETSCAPE_LOG_AT(::sheetscape::LogLevel::Warning, category, __VA_ARGS__)
#define SHEETSCAPE_LOG_ERROR(category, ...) \
    SHEETSCAPE_LOG_AT(::sheetscape::LogLevel::Error, category, __VA_ARGS__)
#define SHEETSCAPE_LOG_CRITICAL(category, ...) \
    SHEETSCAPE_LOG_AT(::sheetscape::LogLevel::Critical, category, __VA_ARGS__)
