#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace sparkline
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

// Process-wide logger. Rendering itself is single-threaded, but sinks may be
// installed from any thread, so sink and level access is serialized.
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

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel level, std::string_view category, std::string_view message);

    // Replaces each "{}" in `format` with the next argument, left to right.
    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    bool is_enabled(LogLevel level) const;

    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Warning;
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
        else if constexpr (std::is_enum_v<D>)
            return std::to_string(static_cast<std::underlying_type_t<D>>(v));
        else
            return std::to_string(v);
    }

    static std::string format_message(std::string_view format, auto&&... args)
    {
        std::string result(format);
        size_t      cursor = 0;
        auto        replace_next = [&](auto&& arg)
        {
            auto pos = result.find("{}", cursor);
            if (pos == std::string::npos)
                return;
            std::string text = arg_to_string(std::forward<decltype(arg)>(arg));
            result.replace(pos, 2, text);
            cursor = pos + text.size();
        };
        (replace_next(std::forward<decltype(args)>(args)), ...);
        return result;
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
    log(level, category, format_message(format, std::forward<Args>(args)...));
}

// Restores the previous level on scope exit.
class ScopedLogLevel
{
   public:
    explicit ScopedLogLevel(LogLevel level) : previous_(Logger::instance().get_level())
    {
        Logger::instance().set_level(level);
    }
    ~ScopedLogLevel() { Logger::instance().set_level(previous_); }

    ScopedLogLevel(const ScopedLogLevel&)            = delete;
    ScopedLogLevel& operator=(const ScopedLogLevel&) = delete;

   private:
    LogLevel previous_;
};

namespace sinks
{
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();
// Appends every entry to `entries`; the vector must outlive the sink.
Logger::LogSink memory_sink(std::vector<Logger::LogEntry>& entries);
}   // namespace sinks

}   // namespace sparkline

#define SPARKLINE_LOG(level, category, ...)                                              \
    do                                                                                   \
    {                                                                                    \
        if (::sparkline::Logger::instance().is_enabled(level))                           \
        {                                                                                \
            ::sparkline::Logger::instance().log_formatted(level, category, __VA_ARGS__); \
        }                                                                                \
    } while (0)

#define SPARKLINE_LOG_TRACE(category, ...) \
    SPARKLINE_LOG(::sparkline::LogLevel::Trace, category, __VA_ARGS__)
#define SPARKLINE_LOG_DEBUG(category, ...) \
    SPARKLINE_LOG(::sparkline::LogLevel::Debug, category, __VA_ARGS__)
#define SPARKLINE_LOG_INFO(category, ...) \
    SPARKLINE_LOG(::sparkline::LogLevel::Info, category, __VA_ARGS__)
#define SPARKLINE_LOG_WARN(category, ...) \
    SPARKLINE_LOG(::sparkline::LogLevel::Warning, category, __VA_ARGS__)
#define SPARKLINE_LOG_ERROR(category, ...) \
    SPARKLINE_LOG(::sparkline::LogLevel::Error, category, __VA_ARGS__)
#define SPARKLINE_LOG_CRITICAL(category, ...) \
    SPARKLINE_LOG(::sparkline::LogLevel::Critical, category, __VA_ARGS__)
