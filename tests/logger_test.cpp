#include <catch2/catch_test_macros.hpp>

#include "statmcp/log/logger.hpp"

#include <vector>

using namespace statmcp;

// ─────────────────────────────────────────────────────────────────────────────
// Test Logger - Captures log records for verification
// ─────────────────────────────────────────────────────────────────────────────

class TestLogger final : public ILogger {
public:
    explicit TestLogger(LogLevel min_level = LogLevel::Trace)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override {
        records_.push_back(record);
    }

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    [[nodiscard]] const std::vector<LogRecord>& records() const noexcept {
        return records_;
    }

private:
    LogLevel min_level_;
    std::vector<LogRecord> records_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Tests
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("LogLevel to_string returns upper-case names", "[log]") {
    REQUIRE(to_string(LogLevel::Trace) == "TRACE");
    REQUIRE(to_string(LogLevel::Info) == "INFO");
    REQUIRE(to_string(LogLevel::Warn) == "WARN");
    REQUIRE(to_string(LogLevel::Fatal) == "FATAL");
    REQUIRE(to_string(LogLevel::Off) == "OFF");
}

TEST_CASE("parse_log_level accepts config spellings", "[log]") {
    REQUIRE(parse_log_level("debug") == LogLevel::Debug);
    REQUIRE(parse_log_level("INFO") == LogLevel::Info);
    REQUIRE(parse_log_level("Warning") == LogLevel::Warn);
    REQUIRE(parse_log_level("warn") == LogLevel::Warn);
    REQUIRE(parse_log_level("critical") == LogLevel::Fatal);
    REQUIRE(parse_log_level("off") == LogLevel::Off);

    REQUIRE_FALSE(parse_log_level("verbose").has_value());
    REQUIRE_FALSE(parse_log_level("").has_value());
}

TEST_CASE("NullLogger discards all messages", "[log]") {
    NullLogger logger;

    REQUIRE(logger.should_log(LogLevel::Trace) == false);
    REQUIRE(logger.should_log(LogLevel::Fatal) == false);

    logger.info("dropped");
    logger.fatal("dropped");
}

TEST_CASE("ILogger filters below the minimum level", "[log]") {
    TestLogger logger(LogLevel::Warn);

    logger.debug("debug message");
    logger.info("info message");
    logger.warn("warn message");
    logger.error("error message");

    REQUIRE(logger.records().size() == 2);
    REQUIRE(logger.records()[0].level == LogLevel::Warn);
    REQUIRE(logger.records()[0].message == "warn message");
    REQUIRE(logger.records()[1].level == LogLevel::Error);
}

TEST_CASE("LogRecord captures source location", "[log]") {
    TestLogger logger;
    logger.info("located");

    REQUIRE(logger.records().size() == 1);
    const std::string_view filename(logger.records()[0].location.file_name());
    REQUIRE(filename.find("logger_test") != std::string_view::npos);
    REQUIRE(logger.records()[0].location.line() > 0);
}

TEST_CASE("Global logger can be swapped and reset", "[log]") {
    auto test_logger = std::make_unique<TestLogger>(LogLevel::Debug);
    auto* raw = test_logger.get();
    set_logger(std::move(test_logger));

    STATMCP_LOG_TRACE("trace");  // filtered
    STATMCP_LOG_DEBUG("debug");
    STATMCP_LOG_INFO("info");
    STATMCP_LOG_WARN("warn");
    STATMCP_LOG_ERROR("error");

    REQUIRE(raw->records().size() == 4);
    REQUIRE(raw->records()[0].level == LogLevel::Debug);
    REQUIRE(raw->records()[3].level == LogLevel::Error);

    set_logger(nullptr);
    REQUIRE(get_logger().should_log(LogLevel::Fatal) == false);
}
