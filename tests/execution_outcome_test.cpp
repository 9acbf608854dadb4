#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlohmann/json.hpp>

#include "statmcp/execution/execution_outcome.hpp"

using namespace statmcp;
using json = nlohmann::json;

namespace {

ProcessReport exited(int code, std::string out, std::string err = {}) {
    ProcessReport report;
    report.exit_code = code;
    report.stdout_text = std::move(out);
    report.stderr_text = std::move(err);
    report.limit = std::chrono::milliseconds(1000);
    return report;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Output parsing
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("split_stdout takes the last non-empty line as payload", "[execution][outcome]") {
    auto split = split_stdout("Correlation matrix\n  a  b\n{\"r\": 0.5}\n\n");

    REQUIRE(split.payload.has_value());
    REQUIRE((*split.payload)["r"] == 0.5);
    REQUIRE(split.formatted_text == "Correlation matrix\n  a  b");
}

TEST_CASE("split_stdout leaves a non-object last line unparsed", "[execution][outcome]") {
    auto array_line = split_stdout("[1, 2, 3]\n");
    REQUIRE_FALSE(array_line.payload.has_value());
    REQUIRE(array_line.last_line == "[1, 2, 3]");

    auto empty = split_stdout("\n\n");
    REQUIRE_FALSE(empty.payload.has_value());
    REQUIRE(empty.last_line.empty());
}

TEST_CASE("extract_r_diagnostic stops at the trailer lines", "[execution][outcome]") {
    const std::string stderr_text =
        "Loading required package: stats\n"
        "Error in lm(formula) : object 'x' not found\n"
        "  in the model frame\n"
        "Calls: lm -> eval -> eval\n"
        "Execution halted\n";

    auto diagnostic = extract_r_diagnostic(stderr_text);
    REQUIRE(diagnostic.has_value());
    REQUIRE(*diagnostic == "Error in lm(formula) : object 'x' not found\n  in the model frame");

    REQUIRE_FALSE(extract_r_diagnostic("Warning message:\nsomething odd\n").has_value());
}

TEST_CASE("excerpt keeps the tail without splitting a code point", "[execution][outcome]") {
    REQUIRE(excerpt("short", 10) == "short");
    REQUIRE(excerpt("0123456789", 4) == "...6789");

    // "é" is two bytes; a cut inside it moves forward to the next character
    REQUIRE(excerpt("ab\xC3\xA9z", 2) == "...z");
}

// ═══════════════════════════════════════════════════════════════════════════
// Classification
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("classify applies precedence to the process report", "[execution][outcome]") {
    SECTION("cancelled beats everything") {
        auto report = exited(0, "{\"ok\":1}\n");
        report.cancelled = true;
        report.timed_out = true;
        REQUIRE(std::holds_alternative<outcome::Cancelled>(classify(report, 100)));
    }
    SECTION("timeout carries the limit") {
        auto report = exited(0, "");
        report.timed_out = true;
        auto result = classify(report, 100);
        REQUIRE(std::holds_alternative<outcome::Timeout>(result));
        REQUIRE(std::get<outcome::Timeout>(result).limit == std::chrono::milliseconds(1000));
    }
    SECTION("signal is a process failure") {
        ProcessReport report;
        report.term_signal = 9;
        auto result = classify(report, 100);
        REQUIRE(std::holds_alternative<outcome::ProcessFailure>(result));
        REQUIRE(std::get<outcome::ProcessFailure>(result).exit_code == -9);
    }
    SECTION("non-zero exit with an R error") {
        auto result = classify(exited(1, "", "Error: bad input\nExecution halted\n"), 100);
        REQUIRE(std::holds_alternative<outcome::ScriptError>(result));
        REQUIRE(std::get<outcome::ScriptError>(result).diagnostic == "Error: bad input");
    }
    SECTION("non-zero exit with an error payload") {
        auto result = classify(exited(1, "{\"error\": \"variable 'z' not found\"}\n"), 100);
        REQUIRE(std::holds_alternative<outcome::ScriptError>(result));
        REQUIRE(std::get<outcome::ScriptError>(result).message == "variable 'z' not found");
    }
    SECTION("non-zero exit without a diagnostic") {
        auto result = classify(exited(3, "", "segfault-ish noise"), 100);
        REQUIRE(std::holds_alternative<outcome::ProcessFailure>(result));
        REQUIRE(std::get<outcome::ProcessFailure>(result).exit_code == 3);
        REQUIRE(std::get<outcome::ProcessFailure>(result).stderr_excerpt == "segfault-ish noise");
    }
    SECTION("clean exit without JSON") {
        auto result = classify(exited(0, "just text\n"), 100);
        REQUIRE(std::holds_alternative<outcome::MalformedOutput>(result));
        REQUIRE(std::get<outcome::MalformedOutput>(result).raw == "just text");
    }
    SECTION("clean exit with an error payload") {
        auto result = classify(exited(0, "{\"error\": {\"code\": 2}}\n"), 100);
        REQUIRE(std::holds_alternative<outcome::ScriptError>(result));
    }
    SECTION("success") {
        auto result = classify(exited(0, "Summary\n{\"mean\": 2.5, \"error\": null}\n"), 100);
        REQUIRE(std::holds_alternative<outcome::Success>(result));
        REQUIRE(std::get<outcome::Success>(result).formatted_text == "Summary");
        REQUIRE(outcome_name(result) == "success");
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Error mapping
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("to_server_error maps outcomes onto the taxonomy", "[execution][outcome]") {
    const auto script = to_server_error(outcome::ScriptError{"failed", "Error: x"}, "t_test");
    REQUIRE(script.kind == ErrorKind::ToolExecution);
    REQUIRE((*script.data)["kind"] == "script_error");
    REQUIRE_THAT(script.message, Catch::Matchers::ContainsSubstring("t_test"));

    const auto timeout = to_server_error(outcome::Timeout{std::chrono::milliseconds(250)}, "t_test");
    REQUIRE(timeout.kind == ErrorKind::ToolTimeout);
    REQUIRE(timeout.code() == -32003);

    const auto malformed = to_server_error(outcome::MalformedOutput{"garbage"}, "lm");
    REQUIRE((*malformed.data)["output"] == "garbage");

    const auto failure = to_server_error(outcome::ProcessFailure{-9, ""}, "lm");
    REQUIRE((*failure.data)["exitCode"] == -9);

    REQUIRE(to_server_error(outcome::Cancelled{}, "lm").kind == ErrorKind::Cancelled);
}
