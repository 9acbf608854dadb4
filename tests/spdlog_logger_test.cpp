// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "statmcp/log/spdlog_logger.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace statmcp;

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

std::filesystem::path temp_log(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove(path);
    return path;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Levels
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger respects minimum log level", "[log][spdlog]") {
    auto logger = make_spdlog_stderr_logger(LogLevel::Warn);

    REQUIRE_FALSE(logger->should_log(LogLevel::Debug));
    REQUIRE_FALSE(logger->should_log(LogLevel::Info));
    REQUIRE(logger->should_log(LogLevel::Warn));
    REQUIRE(logger->should_log(LogLevel::Fatal));

    logger->set_level(LogLevel::Debug);
    REQUIRE(logger->should_log(LogLevel::Debug));
}

TEST_CASE("SpdlogLogger level conversion round-trips", "[log][spdlog]") {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                       LogLevel::Error, LogLevel::Fatal, LogLevel::Off}) {
        REQUIRE(SpdlogLogger::from_spdlog_level(SpdlogLogger::to_spdlog_level(level)) == level);
    }
}

TEST_CASE("SpdlogLogger rejects a null spdlog logger", "[log][spdlog]") {
    REQUIRE_THROWS_AS(SpdlogLogger(std::shared_ptr<spdlog::logger>{}), std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════════════════════
// Sinks
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger writes through a wrapped ostream sink", "[log][spdlog]") {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto raw = std::make_shared<spdlog::logger>("statmcp_ostream_test", sink);
    raw->set_pattern("%l %v");
    raw->set_level(spdlog::level::debug);

    SpdlogLogger logger(raw);
    REQUIRE(logger.should_log(LogLevel::Debug));

    logger.info("engine pid 42 reaped");
    logger.trace("filtered");
    logger.flush();

    REQUIRE(out.str().find("info engine pid 42 reaped") != std::string::npos);
    REQUIRE(out.str().find("filtered") == std::string::npos);
}

TEST_CASE("SpdlogLogger file logger respects log level", "[log][spdlog][file]") {
    const auto path = temp_log("statmcp_spdlog_level.log");

    {
        SpdlogLogger logger(path.string(), LogLevel::Warn);
        logger.info("This should not appear");
        logger.warn("This should appear");
        logger.flush();
    }

    const std::string content = read_file(path);
    REQUIRE(content.find("This should not appear") == std::string::npos);
    REQUIRE(content.find("This should appear") != std::string::npos);

    std::filesystem::remove(path);
}

TEST_CASE("stderr+file logger can be installed globally", "[log][spdlog][integration]") {
    const auto path = temp_log("statmcp_spdlog_global.log");

    {
        auto logger = make_spdlog_stderr_file_logger(path.string(), LogLevel::Info);
        auto* spdlog_ptr = logger.get();
        set_logger(std::move(logger));

        STATMCP_LOG_INFO("Session abc started");
        STATMCP_LOG_DEBUG("not written");
        spdlog_ptr->flush();
    }

    const std::string content = read_file(path);
    REQUIRE(content.find("Session abc started") != std::string::npos);
    REQUIRE(content.find("not written") == std::string::npos);

    set_logger(nullptr);
    std::filesystem::remove(path);
}
