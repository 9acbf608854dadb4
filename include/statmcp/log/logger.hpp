#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace statmcp {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,  // Recoverable issues (dropped frames, slow reaps)
    Error = 4,  // A request or session failed
    Fatal = 5,  // The server cannot continue
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as written in config files and on the command line.
/// Accepts lower or upper case, plus "warning" and "critical" aliases.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Interface
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    // Check before formatting anything expensive
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Trace, msg, loc);
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Debug, msg, loc);
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Info, msg, loc);
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Warn, msg, loc);
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Error, msg, loc);
    }

    void fatal(std::string_view msg, std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Fatal, msg, loc);
    }

private:
    void emit(LogLevel level, std::string_view msg, std::source_location loc) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - default sink, discards everything
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

// Defaults to NullLogger until the entry point installs one
[[nodiscard]] ILogger& get_logger() noexcept;

// Takes ownership; nullptr restores the NullLogger
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

#define STATMCP_LOG_TRACE(msg) \
    do { if (::statmcp::get_logger().should_log(::statmcp::LogLevel::Trace)) \
         ::statmcp::get_logger().trace(msg); } while(false)

#define STATMCP_LOG_DEBUG(msg) \
    do { if (::statmcp::get_logger().should_log(::statmcp::LogLevel::Debug)) \
         ::statmcp::get_logger().debug(msg); } while(false)

#define STATMCP_LOG_INFO(msg) \
    do { if (::statmcp::get_logger().should_log(::statmcp::LogLevel::Info)) \
         ::statmcp::get_logger().info(msg); } while(false)

#define STATMCP_LOG_WARN(msg) \
    do { if (::statmcp::get_logger().should_log(::statmcp::LogLevel::Warn)) \
         ::statmcp::get_logger().warn(msg); } while(false)

#define STATMCP_LOG_ERROR(msg) \
    do { if (::statmcp::get_logger().should_log(::statmcp::LogLevel::Error)) \
         ::statmcp::get_logger().error(msg); } while(false)

#define STATMCP_LOG_FATAL(msg) \
    do { if (::statmcp::get_logger().should_log(::statmcp::LogLevel::Fatal)) \
         ::statmcp::get_logger().fatal(msg); } while(false)

}  // namespace statmcp
