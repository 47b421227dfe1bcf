#include "inkwell/core/logger.hpp"
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <ctime>

namespace inkwell {

namespace {

constexpr std::string_view DEFAULT_LOGGER_NAME = "inkwell";

struct Registry {
    std::recursive_mutex mutex;
    std::vector<std::unique_ptr<LogSink>> sinks;
    std::unordered_map<std::string, std::unique_ptr<Logger>> loggers;
    std::unique_ptr<Logger> fallback;
    LogLevel threshold{LogLevel::Info};
    bool ready{false};

    // Caller holds the mutex
    void install(std::vector<std::unique_ptr<LogSink>> initial) {
        sinks = std::move(initial);
        fallback = std::make_unique<Logger>(DEFAULT_LOGGER_NAME);
        ready = true;
    }

    void install_console() {
        std::vector<std::unique_ptr<LogSink>> initial;
        initial.push_back(std::make_unique<ConsoleSink>());
        install(std::move(initial));
    }
};

Registry& registry() {
    static Registry r;
    return r;
}

// "2026-01-31 12:00:00.042"
std::string wall_clock(std::chrono::system_clock::time_point tp) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    char date[24];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);
    return std::format("{}.{:03}", date, millis);
}

// Everything after the level tag: "[name] message (file:line)"
std::string record_tail(const LogRecord& record, bool with_location) {
    std::string tail;
    if (!record.logger_name.empty()) {
        tail = std::format("[{}] ", record.logger_name);
    }
    tail += record.message;
    if (with_location) {
        tail += std::format(" ({}:{})", record.location.file_name(), record.location.line());
    }
    return tail;
}

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Off:   break;
    }
    return "";
}

} // anonymous namespace

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors) : m_use_colors(use_colors) {}

void ConsoleSink::write(const LogRecord& record) {
    std::string_view color = m_use_colors ? level_color(record.level) : "";
    std::string_view reset = m_use_colors ? "\033[0m" : "";

    // Source locations only help when chasing debug output
    std::cerr << std::format("[{}] {}[{}]{} {}\n",
                             wall_clock(record.timestamp), color, log_level_name(record.level), reset,
                             record_tail(record, record.level <= LogLevel::Debug));
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const char* path) : m_file(std::fopen(path, "a")) {}

FileSink::~FileSink() {
    if (m_file) std::fclose(m_file);
}

void FileSink::write(const LogRecord& record) {
    if (!m_file) return;
    std::string line = std::format("[{}] [{}] {}\n",
                                   wall_clock(record.timestamp), log_level_name(record.level),
                                   record_tail(record, true));
    std::fwrite(line.data(), 1, line.size(), m_file);
}

void FileSink::flush() {
    if (m_file) std::fflush(m_file);
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(std::string_view name) : m_name(name) {}

void Logger::debug(std::string_view msg, std::source_location loc) { emit(LogLevel::Debug, msg, loc); }
void Logger::info(std::string_view msg, std::source_location loc) { emit(LogLevel::Info, msg, loc); }
void Logger::warn(std::string_view msg, std::source_location loc) { emit(LogLevel::Warn, msg, loc); }
void Logger::error(std::string_view msg, std::source_location loc) { emit(LogLevel::Error, msg, loc); }

void Logger::emit(LogLevel level, std::string_view message, std::source_location loc) {
    if (!is_enabled(level)) return;

    auto& r = registry();
    std::lock_guard lock(r.mutex);
    if (level < r.threshold) return;

    // Engines may log before a tool calls init()
    if (!r.ready) r.install_console();

    const LogRecord record{
        .level = level,
        .message = message,
        .logger_name = m_name,
        .location = loc,
        .timestamp = std::chrono::system_clock::now()
    };
    for (auto& sink : r.sinks) {
        sink->write(record);
    }
}

// ============================================================================
// logging::
// ============================================================================

namespace logging {

void init() {
    auto& r = registry();
    std::lock_guard lock(r.mutex);
    if (!r.ready) r.install_console();
}

void init(std::vector<std::unique_ptr<LogSink>> sinks) {
    auto& r = registry();
    std::lock_guard lock(r.mutex);
    if (!r.ready) r.install(std::move(sinks));
}

void shutdown() {
    auto& r = registry();
    std::lock_guard lock(r.mutex);
    for (auto& sink : r.sinks) {
        sink->flush();
    }
    r.sinks.clear();
    r.fallback.reset();
    r.ready = false;
}

void add_sink(std::unique_ptr<LogSink> sink) {
    auto& r = registry();
    std::lock_guard lock(r.mutex);
    if (!r.ready) r.install_console();
    r.sinks.push_back(std::move(sink));
}

void set_level(LogLevel level) {
    auto& r = registry();
    std::lock_guard lock(r.mutex);
    r.threshold = level;
}

LogLevel level() {
    auto& r = registry();
    std::lock_guard lock(r.mutex);
    return r.threshold;
}

Logger& get(std::string_view name) {
    auto& r = registry();
    std::lock_guard lock(r.mutex);

    auto [it, inserted] = r.loggers.try_emplace(std::string(name));
    if (inserted) {
        it->second = std::make_unique<Logger>(name);
    }
    return *it->second;
}

Logger& default_logger() {
    auto& r = registry();
    std::lock_guard lock(r.mutex);
    if (!r.ready) r.install_console();
    return *r.fallback;
}

} // namespace logging

} // namespace inkwell
