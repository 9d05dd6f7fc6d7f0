#pragma once

#include <chrono>
#include <functional>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace smoothie
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

// Process-wide logger. Sinks are invoked under the logger mutex, so a sink
// must not log itself. Filters never log from update(); only construction,
// attach, reset and configuration failures are reported.
class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
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

    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

    // Replaces each "{}" in `format`, left to right, with the next argument.
    template <typename... Args>
    static std::string format_message(std::string_view format, Args&&... args)
    {
        std::string result(format);
        std::size_t cursor = 0;
        auto        replace_next = [&](auto&& arg)
        {
            auto pos = result.find("{}", cursor);
            if (pos == std::string::npos)
                return;
            std::string text = arg_to_string(std::forward<decltype(arg)>(arg));
            result.replace(pos, 2, text);
            cursor = pos + text.size();
        };
        (replace_next(std::forward<Args>(args)), ...);
        return result;
    }

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Info;
    std::vector<LogSink> sinks_;

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
        else if constexpr (std::is_floating_point_v<D>)
        {
            std::ostringstream ss;
            ss << v;
            return ss.str();
        }
        else
            return std::to_string(v);
    }
};

template <typename... Args>
void Logger::log_formatted(LogLevel         level,
                           std::string_view category,
                           std::string_view format,
                           Args&&... args)
{
    if (!is_enabled(level))
        return;

    try
    {
        log(level, category, format_message(format, std::forward<Args>(args)...));
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "logger", std::string("Format error: ") + e.what());
    }
}

// Parses "trace", "debug", "info", "warn"/"warning", "error", "critical"
// (case-insensitive).
std::optional<LogLevel> parse_log_level(std::string_view text);

// Applies SMOOTHIE_LOG_LEVEL from the environment when set and valid.
// Returns true if the level was changed.
bool configure_logger_from_env();

namespace sinks
{
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink ostream_sink(std::ostream& os);
Logger::LogSink null_sink();
}   // namespace sinks

}   // namespace smoothie

#define SMOOTHIE_LOG(lvl, category, ...)                                                   \
    do                                                                                     \
    {                                                                                      \
        if (::smoothie::Logger::instance().is_enabled(lvl))                                \
        {                                                                                  \
            ::smoothie::Logger::instance().log_formatted(lvl, category, __VA_ARGS__);      \
        }                                                                                  \
    } while (0)

#define SMOOTHIE_LOG_TRACE(category, ...) \
    SMOOTHIE_LOG(::smoothie::LogLevel::Trace, category, __VA_ARGS__)
#define SMOOTHIE_LOG_DEBUG(category, ...) \
    SMOOTHIE_LOG(::smoothie::LogLevel::Debug, category, __VA_ARGS__)
#define SMOOTHIE_LOG_INFO(category, ...) \
    SMOOTHIE_LOG(::smoothie::LogLevel::Info, category, __VA_ARGS__)
#define SMOOTHIE_LOG_WARN(category, ...) \
    SMOOTHIE_LOG(::smoothie::LogLevel::Warning, category, __VA_ARGS__)
#define SMOOTHIE_LOG_ERROR(category, ...) \
    SMOOTHIE_LOG(::smoothie::LogLevel::Error, category, __VA_ARGS__)
#define SMOOTHIE_LOG_CRITICAL(category, ...) \
    SMOOTHIE_LOG(::smoothie::LogLevel::Critical, category, __VA_ARGS__)

#define SMOOTHIE_LOG_DEBUG_HERE(category, ...) \
    SMOOTHIE_LOG_DEBUG(category, __VA_ARGS__ " [{}:{}:{}]", __FILE__, __LINE__, __FUNCTION__)

#define SMOOTHIE_LOG_WARN_HERE(category, ...) \
    SMOOTHIE_LOG_WARN(category, __VA_ARGS__ " [{}:{}:{}]", __FILE__, __LINE__, __FUNCTION__)

#define SMOOTHIE_LOG_ERROR_HERE(category, ...) \
    SMOOTHIE_LOG_ERROR(category, __VA_ARGS__ " [{}:{}:{}]", __FILE__, __LINE__, __FUNCTION__)
