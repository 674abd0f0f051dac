#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace kara
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

namespace detail
{

// Floats are playhead times almost everywhere, so they print with
// millisecond precision instead of std::to_string's six digits.
std::string format_fixed3(double value);

template <typename T>
std::string to_log_text(const T& value)
{
    if constexpr (std::is_same_v<T, bool>)
        return value ? "true" : "false";
    else if constexpr (std::is_floating_point_v<T>)
        return format_fixed3(static_cast<double>(value));
    else if constexpr (std::is_arithmetic_v<T>)
        return std::to_string(value);
    else if constexpr (std::is_convertible_v<const T&, std::string_view>)
        return std::string(std::string_view(value));
    else
        return std::string(value);
}

inline std::string to_log_text(const char* value)
{
    return value ? std::string(value) : std::string("(null)");
}

// Substitutes each "{}" in order. Surplus placeholders stay verbatim and
// substituted text is never rescanned.
template <typename... Args>
std::string format_braces(std::string_view format, const Args&... args)
{
    std::string out;
    out.reserve(format.size() + 16 * sizeof...(Args));

    size_t cursor = 0;
    auto   emit   = [&](const std::string& text)
    {
        size_t hole = format.find("{}", cursor);
        if (hole == std::string_view::npos)
            return;
        out.append(format.substr(cursor, hole - cursor));
        out.append(text);
        cursor = hole + 2;
    };
    (emit(to_log_text(args)), ...);

    out.append(format.substr(cursor));
    return out;
}

}   // namespace detail

// Process-wide logger. The library never installs a sink on its own, so
// nothing is printed until the host adds one. stdout is never used: the
// executable writes the exported document there.
class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level = LogLevel::Info;
        std::string                           category;
        std::string                           message;
        std::string                           file;
        int                                   line = 0;
        std::string                           function;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;
    bool     is_enabled(LogLevel level) const;

    void   add_sink(LogSink sink);
    void   clear_sinks();
    size_t sink_count() const;

    void log(LogLevel         level,
             std::string_view category,
             std::string_view message,
             std::string_view file     = "",
             int              line     = 0,
             std::string_view function = "");

    template <typename... Args>
    void logf(LogLevel level, std::string_view category, std::string_view format,
              const Args&... args)
    {
        if (is_enabled(level))
            log(level, category, detail::format_braces(format, args...));
    }

    static std::string             level_to_string(LogLevel level);
    static std::optional<LogLevel> level_from_string(std::string_view name);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

   private:
    Logger()                         = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Info;
    std::vector<LogSink> sinks_;
};

namespace sinks
{
// Colored single-line entries on std::cerr.
Logger::LogSink console_sink();
// Plain entries appended to a file; silently inactive if the file cannot open.
Logger::LogSink file_sink(const std::string& filename);
// Plain entries written to a caller-owned stream (must outlive the sink).
Logger::LogSink stream_sink(std::ostream& out);
Logger::LogSink null_sink();
}   // namespace sinks

}   // namespace kara

#define KARA_LOG_AT(level, category, ...) \
    ::kara::Logger::instance().logf(level, category, __VA_ARGS__)

#define KARA_LOG_TRACE(category, ...) KARA_LOG_AT(::kara::LogLevel::Trace, category, __VA_ARGS__)
#define KARA_LOG_DEBUG(category, ...) KARA_LOG_AT(::kara::LogLevel::Debug, category, __VA_ARGS__)
#define KARA_LOG_INFO(category, ...)  KARA_LOG_AT(::kara::LogLevel::Info, category, __VA_ARGS__)
#define KARA_LOG_WARN(category, ...) \
    KARA_LOG_AT(::kara::LogLevel::Warning, category, __VA_ARGS__)
#define KARA_LOG_ERROR(category, ...) KARA_LOG_AT(::kara::LogLevel::Error, category, __VA_ARGS__)
#define KARA_LOG_CRITICAL(category, ...) \
    KARA_LOG_AT(::kara::LogLevel::Critical, category, __VA_ARGS__)
