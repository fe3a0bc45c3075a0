#pragma once

#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace rayshell
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5
};

// Enables or disables every category starting with `target`.
struct LogTargetFilter
{
    std::string target;
    bool        enabled = true;

    bool operator==(const LogTargetFilter&) const = default;
};

class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           thread;
        std::string                           message;
        std::string                           file;
        int                                   line;
        std::string                           function;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    void add_sink(LogSink sink);
    void clear_sinks();

    // First matching filter wins; categories with no matching filter are logged.
    void                         set_target_filters(std::vector<LogTargetFilter> filters);
    std::vector<LogTargetFilter> target_filters() const;

    void log(LogLevel         level,
             std::string_view category,
             std::string_view message,
             std::string_view file     = "",
             int              line     = 0,
             std::string_view function = "");

    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    bool is_enabled(LogLevel level) const;
    bool is_enabled(LogLevel level, std::string_view category) const;

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    bool category_enabled_locked(std::string_view category) const;

    mutable std::mutex           mutex_;
    LogLevel                     min_level_ = LogLevel::Info;
    std::vector<LogSink>         sinks_;
    std::vector<LogTargetFilter> filters_;

    template <typename T>
    static std::string arg_to_string(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, std::string>)
            return v;
        else if constexpr (std::is_same_v<D, std::string_view>)
            return std::string(v);
        else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
        {
            const char* p = v;
            return p ? std::string(p) : std::string("(null)");
        }
        else if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else
            return std::to_string(v);
    }

    static std::string format_message(std::string_view format, auto&&... args)
    {
        std::string result(format);
        if constexpr (sizeof...(args) > 0)
        {
            size_t search_from  = 0;
            auto   replace_next = [&](auto&& arg)
            {
                auto pos = result.find("{}", search_from);
                if (pos != std::string::npos)
                {
                    std::string text = arg_to_string(std::forward<decltype(arg)>(arg));
                    result.replace(pos, 2, text);
                    search_from = pos + text.size();
                }
            };
            (replace_next(std::forward<decltype(args)>(args)), ...);
        }
        return result;
    }

   public:
    static std::string level_to_string(LogLevel level);
    // Accepts the names level_to_string() produces, case-insensitive.
    static bool        level_from_string(std::string_view text, LogLevel& out);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);
};

// Name attached to every entry logged from the calling thread.
void               set_current_thread_name(std::string name);
const std::string& current_thread_name();

// Template definitions must be in the header
template <typename... Args>
void Logger::log_formatted(LogLevel         level,
                           std::string_view category,
                           std::string_view format,
                           Args&&... args)
{
    if (!is_enabled(level, category))
    {
        return;
    }

    try
    {
        std::string formatted = format_message(format, std::forward<Args>(args)...);
        log(level, category, formatted);
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "rayshell::logger", std::string("Format error: ") + e.what());
    }
}

namespace sinks
{
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();
}   // namespace sinks

#define RAYSHELL_LOG_AT(level, category, ...)                                              \
    do                                                                                     \
    {                                                                                      \
        if (::rayshell::Logger::instance().is_enabled(level, category))                    \
        {                                                                                  \
            ::rayshell::Logger::instance().log_formatted(level, category, __VA_ARGS__);    \
        }                                                                                  \
    } while (0)

#define RAYSHELL_LOG_TRACE(category, ...) \
    RAYSHELL_LOG_AT(::rayshell::LogLevel::Trace, category, __VA_ARGS__)

#define RAYSHELL_LOG_DEBUG(category, ...) \
    RAYSHELL_LOG_AT(::rayshell::LogLevel::Debug, category, __VA_ARGS__)

#define RAYSHELL_LOG_INFO(category, ...) \
    RAYSHELL_LOG_AT(::rayshell::LogLevel::Info, category, __VA_ARGS__)

#define RAYSHELL_LOG_WARN(category, ...) \
    RAYSHELL_LOG_AT(::rayshell::LogLevel::Warning, category, __VA_ARGS__)

#define RAYSHELL_LOG_ERROR(category, ...) \
    RAYSHELL_LOG_AT(::rayshell::LogLevel::Error, category, __VA_ARGS__)

#define RAYSHELL_LOG_CRITICAL(category, ...) \
    RAYSHELL_LOG_AT(::rayshell::LogLevel::Critical, category, __VA_ARGS__)

#define RAYSHELL_LOG_DEBUG_HERE(category, ...) \
    RAYSHELL_LOG_DEBUG(category, __VA_ARGS__ " [{}:{}:{}]", __FILE__, __LINE__, __FUNCTION__)

#define RAYSHELL_LOG_ERROR_HERE(category, ...) \
    RAYSHELL_LOG_ERROR(category, __VA_ARGS__ " [{}:{}:{}]", __FILE__, __LINE__, __FUNCTION__)

}   // namespace rayshell
