#include <array>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <kara/logger.hpp>
#include <memory>
#include <string>

namespace kara
{

namespace
{

struct LevelInfo
{
    LogLevel    level;
    const char* name;
    const char* color;   // ANSI escape used by the console sink
};

constexpr std::array<LevelInfo, 6> LEVELS = {{
    {LogLevel::Trace, "TRACE", "\033[37m"},
    {LogLevel::Debug, "DEBUG", "\033[36m"},
    {LogLevel::Info, "INFO", "\033[32m"},
    {LogLevel::Warning, "WARN", "\033[33m"},
    {LogLevel::Error, "ERROR", "\033[31m"},
    {LogLevel::Critical, "CRITICAL", "\033[35m"},
}};

const LevelInfo* find_level(LogLevel level)
{
    for (const auto& info : LEVELS)
    {
        if (info.level == level)
            return &info;
    }
    return nullptr;
}

}   // namespace

namespace detail
{

std::string format_fixed3(double value)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.3f", value);
    return buf;
}

}   // namespace detail

// ─── Logger ──────────────────────────────────────────────────────────────────

Logger& Logger::instance()
{
    static Logger the_logger;
    return the_logger;
}

void Logger::set_level(LogLevel level)
{
    std::scoped_lock lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_level() const
{
    std::scoped_lock lock(mutex_);
    return min_level_;
}

bool Logger::is_enabled(LogLevel level) const
{
    std::scoped_lock lock(mutex_);
    return static_cast<int>(level) >= static_cast<int>(min_level_);
}

void Logger::add_sink(LogSink sink)
{
    std::scoped_lock lock(mutex_);
    sinks_.emplace_back(std::move(sink));
}

void Logger::clear_sinks()
{
    std::scoped_lock lock(mutex_);
    sinks_.clear();
}

size_t Logger::sink_count() const
{
    std::scoped_lock lock(mutex_);
    return sinks_.size();
}

void Logger::log(LogLevel         level,
                 std::string_view category,
                 std::string_view message,
                 std::string_view file,
                 int              line,
                 std::string_view function)
{
    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level     = level;
    entry.category.assign(category);
    entry.message.assign(message);
    entry.file.assign(file);
    entry.line = line;
    entry.function.assign(function);

    std::scoped_lock lock(mutex_);
    if (static_cast<int>(level) < static_cast<int>(min_level_))
        return;
    for (auto& sink : sinks_)
        sink(entry);
}

std::string Logger::level_to_string(LogLevel level)
{
    const LevelInfo* info = find_level(level);
    return info ? info->name : "UNKNOWN";
}

std::optional<LogLevel> Logger::level_from_string(std::string_view name)
{
    auto iequals = [](std::string_view a, std::string_view b)
    {
        if (a.size() != b.size())
            return false;
        for (size_t i = 0; i < a.size(); ++i)
        {
            if (std::tolower(static_cast<unsigned char>(a[i]))
                != std::tolower(static_cast<unsigned char>(b[i])))
                return false;
        }
        return true;
    };

    if (iequals(name, "warning"))
        return LogLevel::Warning;
    for (const auto& info : LEVELS)
    {
        if (iequals(name, info.name))
            return info.level;
    }
    return std::nullopt;
}

std::string Logger::timestamp_to_string(const std::chrono::system_clock::time_point& tp)
{
    using namespace std::chrono;

    std::time_t secs   = system_clock::to_time_t(tp);
    auto        millis = duration_cast<milliseconds>(tp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&secs, &local);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%s.%03d", date, static_cast<int>(millis));
    return buf;
}

// ─── Sinks ───────────────────────────────────────────────────────────────────

namespace sinks
{

namespace
{

// "2024-01-01 12:00:00.000 INFO [category] message (file:line in function)"
void write_entry(std::ostream& out, const Logger::LogEntry& entry)
{
    out << Logger::timestamp_to_string(entry.timestamp) << ' '
        << Logger::level_to_string(entry.level) << " [" << entry.category << "] "
        << entry.message;
    if (!entry.file.empty())
    {
        out << " (" << entry.file << ':' << entry.line;
        if (!entry.function.empty())
            out << " in " << entry.function;
        out << ')';
    }
    out << '\n';
}

}   // namespace

Logger::LogSink console_sink()
{
    return [](const Logger::LogEntry& entry)
    {
        const LevelInfo* info = find_level(entry.level);
        std::cerr << (info ? info->color : "");
        write_entry(std::cerr, entry);
        std::cerr << "\033[0m" << std::flush;
    };
}

Logger::LogSink file_sink(const std::string& filename)
{
    auto stream = std::make_shared<std::ofstream>(filename, std::ios::app);
    if (!stream->is_open())
        return null_sink();
    return [stream](const Logger::LogEntry& entry)
    {
        write_entry(*stream, entry);
        stream->flush();
    };
}

Logger::LogSink stream_sink(std::ostream& out)
{
    return [&out](const Logger::LogEntry& entry) { write_entry(out, entry); };
}

Logger::LogSink null_sink()
{
    return [](const Logger::LogEntry&) {};
}

}   // namespace sinks

}   // namespace kara
