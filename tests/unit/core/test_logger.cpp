#include <gtest/gtest.h>
#include "inkwell/core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace inkwell;

namespace {

struct CapturedRecord {
    LogLevel level;
    std::string logger_name;
    std::string message;
};

class CaptureSink : public LogSink {
public:
    explicit CaptureSink(std::shared_ptr<std::vector<CapturedRecord>> records)
        : m_records(std::move(records)) {}

    void write(const LogRecord& record) override {
        m_records->push_back({record.level, std::string(record.logger_name), std::string(record.message)});
    }

    void flush() override { ++flushes; }

    int flushes{0};

private:
    std::shared_ptr<std::vector<CapturedRecord>> m_records;
};

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logging::shutdown();
        records = std::make_shared<std::vector<CapturedRecord>>();
        std::vector<std::unique_ptr<LogSink>> sinks;
        sinks.push_back(std::make_unique<CaptureSink>(records));
        logging::init(std::move(sinks));
        logging::set_level(LogLevel::Trace);
    }

    void TearDown() override {
        logging::shutdown();
        logging::set_level(LogLevel::Info);
    }

    std::shared_ptr<std::vector<CapturedRecord>> records;
};

} // namespace

// ============================================================================
// Logger Tests
// ============================================================================

TEST_F(LoggerTest, NamedLoggerWritesToSinks) {
    auto& logger = logging::get("typewriter");
    logger.warn("Unknown directive 'foo'. It will be ignored.");

    ASSERT_EQ(records->size(), 1u);
    EXPECT_EQ((*records)[0].level, LogLevel::Warn);
    EXPECT_EQ((*records)[0].logger_name, "typewriter");
    EXPECT_EQ((*records)[0].message, "Unknown directive 'foo'. It will be ignored.");
}

TEST_F(LoggerTest, GetReturnsSameLogger) {
    auto& first = logging::get("engine");
    auto& second = logging::get("engine");
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(first.name(), "engine");
}

TEST_F(LoggerTest, GlobalLevelFilters) {
    logging::set_level(LogLevel::Warn);
    auto& logger = logging::get("filter");
    logger.debug("dropped");
    logger.info("dropped");
    logger.error("kept");

    ASSERT_EQ(records->size(), 1u);
    EXPECT_EQ((*records)[0].message, "kept");
}

TEST_F(LoggerTest, LoggerLevelFilters) {
    auto& logger = logging::get("quiet");
    logger.set_level(LogLevel::Error);
    logger.warn("dropped");
    logger.error("kept");
    logger.set_level(LogLevel::Trace);

    ASSERT_EQ(records->size(), 1u);
    EXPECT_EQ((*records)[0].level, LogLevel::Error);
}

TEST_F(LoggerTest, FormatWithInkwellString) {
    auto& logger = logging::get("format");
    String name("greet");
    logger.error_fmt("Function '{}' is not defined or not callable.", name);

    ASSERT_EQ(records->size(), 1u);
    EXPECT_EQ((*records)[0].message, "Function 'greet' is not defined or not callable.");
}

TEST_F(LoggerTest, WarnFormatSkipsDisabledLevels) {
    auto& logger = logging::get("stale");
    logger.warn_fmt("Asynchronous function '{}' failed after its session ended: {}", String("load"), "late");
    logger.set_level(LogLevel::Off);
    logger.warn_fmt("dropped {}", 1);
    logger.error_fmt("dropped {}", 2);
    logger.set_level(LogLevel::Trace);

    ASSERT_EQ(records->size(), 1u);
    EXPECT_EQ((*records)[0].level, LogLevel::Warn);
    EXPECT_EQ((*records)[0].message, "Asynchronous function 'load' failed after its session ended: late");
}

TEST_F(LoggerTest, DefaultLoggerMacros) {
    INKWELL_LOG_INFO("started");
    INKWELL_LOG_DEBUG_FMT("speed {}", 25);
    INKWELL_LOG_WARN("halted");

    ASSERT_EQ(records->size(), 3u);
    EXPECT_EQ((*records)[0].logger_name, "inkwell");
    EXPECT_EQ((*records)[1].message, "speed 25");
    EXPECT_EQ((*records)[2].level, LogLevel::Warn);
}

TEST_F(LoggerTest, AddedSinkReceivesLaterRecords) {
    auto extra = std::make_shared<std::vector<CapturedRecord>>();
    logging::get("early").info("before");
    logging::add_sink(std::make_unique<CaptureSink>(extra));
    logging::get("late").info("after");

    EXPECT_EQ(records->size(), 2u);
    ASSERT_EQ(extra->size(), 1u);
    EXPECT_EQ((*extra)[0].message, "after");
}

// ============================================================================
// FileSink Tests
// ============================================================================

TEST_F(LoggerTest, FileSinkAppendsLines) {
    auto path = std::filesystem::temp_directory_path() / "inkwell_file_sink_test.log";
    std::filesystem::remove(path);

    auto sink = std::make_unique<FileSink>(path.string().c_str());
    ASSERT_TRUE(sink->is_open());
    logging::add_sink(std::move(sink));

    logging::get("typewriter").warn("Unknown directive 'foo'. It will be ignored.");
    logging::get("typewriter").error_fmt("Function '{}' is not defined or not callable.", "greet");
    logging::shutdown();

    std::ifstream in(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) {
        lines.push_back(line);
    }
    in.close();
    std::filesystem::remove(path);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("[WARN] [typewriter] Unknown directive 'foo'. It will be ignored."), std::string::npos);
    EXPECT_NE(lines[1].find("[ERROR] [typewriter] Function 'greet' is not defined or not callable."),
              std::string::npos);
    EXPECT_NE(lines[0].find("test_logger.cpp:"), std::string::npos);
}

TEST(FileSinkTest, UnopenablePathLeavesSinkClosed) {
    auto path = std::filesystem::temp_directory_path() / "inkwell_missing_dir" / "nested" / "out.log";
    FileSink sink(path.string().c_str());
    EXPECT_FALSE(sink.is_open());

    LogRecord record{
        .level = LogLevel::Error,
        .message = "ignored",
        .logger_name = "typewriter",
        .location = std::source_location::current(),
        .timestamp = std::chrono::system_clock::now()
    };
    sink.write(record);
    sink.flush();
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(LogLevelTest, Names) {
    EXPECT_EQ(log_level_name(LogLevel::Trace), "TRACE");
    EXPECT_EQ(log_level_name(LogLevel::Warn), "WARN");
    EXPECT_EQ(log_level_name(LogLevel::Error), "ERROR");
    EXPECT_EQ(log_level_name(LogLevel::Off), "OFF");
}
