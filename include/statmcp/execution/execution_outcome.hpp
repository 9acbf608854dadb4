#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Execution Outcome
// ═══════════════════════════════════════════════════════════════════════════
// What became of one engine subprocess, and the rules that decide it from
// the raw process report.

#include "statmcp/protocol/errors.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace statmcp {

using Json = nlohmann::json;

namespace outcome {

struct Success {
    Json payload;                // last stdout line, a JSON object
    std::string formatted_text;  // everything printed before it
};

struct ScriptError {
    std::string message;
    std::string diagnostic;
};

struct Timeout {
    std::chrono::milliseconds limit;
};

struct MalformedOutput {
    std::string raw;
};

struct ProcessFailure {
    int exit_code;  // negative signal number when killed by a signal
    std::string stderr_excerpt;
};

struct Cancelled {};

}  // namespace outcome

using ExecutionOutcome = std::variant<
    outcome::Success,
    outcome::ScriptError,
    outcome::Timeout,
    outcome::MalformedOutput,
    outcome::ProcessFailure,
    outcome::Cancelled
>;

[[nodiscard]] std::string_view outcome_name(const ExecutionOutcome& result) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Classification
// ─────────────────────────────────────────────────────────────────────────────

/// Everything known about a finished (reaped) subprocess
struct ProcessReport {
    bool cancelled{false};
    bool timed_out{false};
    std::optional<int> exit_code;    // set when the process exited normally
    std::optional<int> term_signal;  // set when a signal ended it
    std::string stdout_text;
    std::string stderr_text;
    std::chrono::milliseconds limit{0};
};

struct SplitOutput {
    std::optional<Json> payload;  // nullopt when the last line is not a JSON object
    std::string formatted_text;
    std::string last_line;
};

/// Separate the JSON payload (last non-empty line) from the text before it.
[[nodiscard]] SplitOutput split_stdout(std::string_view stdout_text);

/// The "Error..." block R writes to stderr, cut before the trailer lines
/// (Calls:, Execution halted, Traceback, In addition:). nullopt if absent.
[[nodiscard]] std::optional<std::string> extract_r_diagnostic(std::string_view stderr_text);

/// Tail of `text` no longer than `max_bytes`
[[nodiscard]] std::string excerpt(std::string_view text, std::size_t max_bytes);

/// Order: cancelled, timed out, signalled, non-zero exit (script error when a
/// diagnostic exists, else process failure), unparseable payload, payload
/// carrying "error", success.
[[nodiscard]] ExecutionOutcome classify(const ProcessReport& report, std::size_t excerpt_bytes);

/// Error response for a non-Success outcome. Cancelled maps to
/// ServerError::cancelled(); the server never sends that one.
[[nodiscard]] ServerError to_server_error(const ExecutionOutcome& result, std::string_view tool);

}  // namespace statmcp
