#include <catch2/catch_test_macros.hpp>

#include "mcpenum/log/logger.hpp"
#include "mocks/capture_logger.hpp"

#include <memory>

using namespace mcpenum;
using mcpenum::testing::CaptureLogger;

// Restores the NullLogger when a test that installs a logger finishes
struct GlobalLoggerGuard {
    ~GlobalLoggerGuard() { set_logger(nullptr); }
};

TEST_CASE("LogLevel to_string returns correct names", "[log]") {
    CHECK(to_string(LogLevel::Trace) == "TRACE");
    CHECK(to_string(LogLevel::Debug) == "DEBUG");
    CHECK(to_string(LogLevel::Info) == "INFO");
    CHECK(to_string(LogLevel::Warn) == "WARN");
    CHECK(to_string(LogLevel::Error) == "ERROR");
    CHECK(to_string(LogLevel::Fatal) == "FATAL");
    CHECK(to_string(LogLevel::Off) == "OFF");
}

TEST_CASE("parse_log_level accepts names in any case", "[log]") {
    CHECK(parse_log_level("debug") == LogLevel::Debug);
    CHECK(parse_log_level("INFO") == LogLevel::Info);
    CHECK(parse_log_level("Warning") == LogLevel::Warn);
    CHECK(parse_log_level("err") == LogLevel::Error);
    CHECK(parse_log_level("critical") == LogLevel::Fatal);
    CHECK(parse_log_level("off") == LogLevel::Off);
    CHECK(parse_log_level("verbose").has_value() == false);
    CHECK(parse_log_level("").has_value() == false);
}

TEST_CASE("NullLogger discards all messages", "[log]") {
    NullLogger logger;

    CHECK(logger.should_log(LogLevel::Trace) == false);
    CHECK(logger.should_log(LogLevel::Fatal) == false);
    logger.error("dropped");
}

TEST_CASE("Formatted helpers respect the minimum level", "[log]") {
    CaptureLogger logger(LogLevel::Info);

    logger.debug_fmt("hidden {}", 1);
    logger.info_fmt("Server '{}': {} tools", "files", 3);
    logger.warn_fmt("retrying in {}ms", 200);

    const auto records = logger.records();
    REQUIRE(records.size() == 2);
    CHECK(records[0].level == LogLevel::Info);
    CHECK(records[0].message == "Server 'files': 3 tools");
    CHECK(records[1].message == "retrying in 200ms");
}

TEST_CASE("LogRecord captures source location", "[log]") {
    CaptureLogger logger;
    logger.info("located");

    const auto records = logger.records();
    REQUIRE(records.size() == 1);
    CHECK(std::string(records[0].location.file_name()).find("logger_test.cpp") != std::string::npos);
    CHECK(records[0].location.line() > 0);
}

TEST_CASE("Global logger can be swapped and reset", "[log]") {
    GlobalLoggerGuard guard;

    auto capture = std::make_unique<CaptureLogger>();
    auto* raw = capture.get();
    set_logger(std::move(capture));

    get_logger().warn("through the global");
    MCPENUM_LOG_INFO("through the macro");
    CHECK(raw->contains("through the global"));
    CHECK(raw->contains("through the macro"));

    set_logger(nullptr);
    CHECK(get_logger().should_log(LogLevel::Fatal) == false);
}
