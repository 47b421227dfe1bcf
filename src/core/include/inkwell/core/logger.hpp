#pragma once

#include "types.hpp"
#include "string.hpp"
#include <string_view>
#include <chrono>
#include <cstdio>
#include <vector>
#include <memory>
#include <format>
#include <source_location>

namespace inkwell {

// ============================================================================
// Severity
// ============================================================================

// Trace lets every record through; Off silences a logger entirely.
enum class LogLevel : u8 {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

[[nodiscard]] constexpr std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

// One message on its way to the sinks. The views live only for the write call.
struct LogRecord {
    LogLevel level;
    std::string_view message;
    std::string_view logger_name;
    std::source_location location;
    std::chrono::system_clock::time_point timestamp;
};

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

// Writes to stderr so log lines never mix with typed output on stdout.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);
    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool m_use_colors;
};

// Appends plain lines to a file. A path that cannot be opened leaves the sink closed
// and every write a no-op.
class FileSink : public LogSink {
public:
    explicit FileSink(const char* path);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    [[nodiscard]] bool is_open() const { return m_file != nullptr; }

    void write(const LogRecord& record) override;
    void flush() override;

private:
    std::FILE* m_file{nullptr};
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    explicit Logger(std::string_view name);

    void debug(std::string_view msg, std::source_location loc = std::source_location::current());
    void info(std::string_view msg, std::source_location loc = std::source_location::current());
    void warn(std::string_view msg, std::source_location loc = std::source_location::current());
    void error(std::string_view msg, std::source_location loc = std::source_location::current());

    // std::format variants; the message is only built when the level passes
    template<typename... Args>
    void debug_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(LogLevel::Debug)) debug(std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void warn_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(LogLevel::Warn)) warn(std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void error_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(LogLevel::Error)) error(std::format(fmt, std::forward<Args>(args)...));
    }

    void set_level(LogLevel level) { m_level = level; }
    [[nodiscard]] LogLevel level() const { return m_level; }
    [[nodiscard]] std::string_view name() const { return m_name; }

    [[nodiscard]] bool is_enabled(LogLevel level) const { return level >= m_level; }

private:
    void emit(LogLevel level, std::string_view message, std::source_location loc);

    std::string m_name;
    LogLevel m_level{LogLevel::Trace};
};

// ============================================================================
// Process-wide configuration
// ============================================================================

namespace logging {

// Installs a colored console sink. Does nothing when already initialized.
void init();
void init(std::vector<std::unique_ptr<LogSink>> sinks);

// Flushes and drops every sink. Named loggers survive.
void shutdown();

void add_sink(std::unique_ptr<LogSink> sink);

// Minimum level for every logger, checked after the logger's own level
void set_level(LogLevel level);
[[nodiscard]] LogLevel level();

[[nodiscard]] Logger& get(std::string_view name);
[[nodiscard]] Logger& default_logger();

} // namespace logging

#define INKWELL_LOG_INFO(msg) ::inkwell::logging::default_logger().info(msg)
#define INKWELL_LOG_WARN(msg) ::inkwell::logging::default_logger().warn(msg)
#define INKWELL_LOG_DEBUG_FMT(fmt, ...) ::inkwell::logging::default_logger().debug_fmt(fmt, ##__VA_ARGS__)

} // namespace inkwell

template<>
struct std::formatter<inkwell::String> : std::formatter<std::string_view> {
    auto format(const inkwell::String& s, std::format_context& ctx) const {
        return std::formatter<std::string_view>::format(s.view(), ctx);
    }
};
