#include "statmcp/execution/execution_outcome.hpp"

#include <array>
#include <type_traits>
#include <vector>

namespace statmcp {
namespace {

constexpr std::array<std::string_view, 4> kDiagnosticTrailers = {
    "Calls:", "Execution halted", "Traceback", "In addition:"
};

std::string_view trim(std::string_view s) {
    while ((s.empty() == false) && ((s.front() == ' ') || (s.front() == '\t') ||
                                    (s.front() == '\n') || (s.front() == '\r'))) {
        s.remove_prefix(1);
    }
    while ((s.empty() == false) && ((s.back() == ' ') || (s.back() == '\t') ||
                                    (s.back() == '\n') || (s.back() == '\r'))) {
        s.remove_suffix(1);
    }
    return s;
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view line = text.substr(start, end - start);
        if ((line.empty() == false) && (line.back() == '\r')) {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

bool starts_with_trailer(std::string_view line) {
    const std::string_view trimmed = trim(line);
    for (const auto& trailer : kDiagnosticTrailers) {
        if (trimmed.starts_with(trailer)) {
            return true;
        }
    }
    return false;
}

// "error" member of a payload, rendered as text
std::optional<std::string> payload_error(const Json& payload) {
    if ((payload.is_object() == false) || (payload.contains("error") == false)) {
        return std::nullopt;
    }
    const Json& error = payload["error"];
    if (error.is_null()) {
        return std::nullopt;
    }
    if (error.is_string()) {
        return error.get<std::string>();
    }
    return error.dump();
}

}  // namespace

std::string_view outcome_name(const ExecutionOutcome& result) noexcept {
    switch (result.index()) {
        case 0: return "success";
        case 1: return "script_error";
        case 2: return "timeout";
        case 3: return "malformed_output";
        case 4: return "process_failure";
        case 5: return "cancelled";
        default: return "unknown";
    }
}

SplitOutput split_stdout(std::string_view stdout_text) {
    SplitOutput out;
    const auto lines = split_lines(stdout_text);

    std::size_t last = lines.size();
    while (last > 0) {
        if (trim(lines[last - 1]).empty() == false) {
            break;
        }
        --last;
    }
    if (last == 0) {
        return out;
    }

    const std::string_view payload_line = trim(lines[last - 1]);
    out.last_line = std::string(payload_line);

    // Not a throwing parse; garbage simply yields a discarded value
    Json parsed = Json::parse(out.last_line, nullptr, false);
    if (parsed.is_object()) {
        out.payload = std::move(parsed);
    }

    std::string text;
    for (std::size_t i = 0; i + 1 < last; ++i) {
        text.append(lines[i]);
        text.push_back('\n');
    }
    out.formatted_text = std::string(trim(text));
    return out;
}

std::optional<std::string> extract_r_diagnostic(std::string_view stderr_text) {
    const auto lines = split_lines(stderr_text);

    std::size_t first = lines.size();
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].starts_with("Error")) {
            first = i;
            break;
        }
    }
    if (first == lines.size()) {
        return std::nullopt;
    }

    std::string block;
    for (std::size_t i = first; i < lines.size(); ++i) {
        if ((i > first) && starts_with_trailer(lines[i])) {
            break;
        }
        if (block.empty() == false) {
            block.push_back('\n');
        }
        block.append(lines[i]);
    }

    const std::string_view trimmed = trim(block);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return std::string(trimmed);
}

std::string excerpt(std::string_view text, std::size_t max_bytes) {
    text = trim(text);
    if (text.size() <= max_bytes) {
        return std::string(text);
    }
    std::size_t start = text.size() - max_bytes;
    // Do not begin in the middle of a UTF-8 sequence
    while ((start < text.size()) && ((static_cast<unsigned char>(text[start]) & 0xC0u) == 0x80u)) {
        ++start;
    }
    return "..." + std::string(text.substr(start));
}

ExecutionOutcome classify(const ProcessReport& report, std::size_t excerpt_bytes) {
    if (report.cancelled) {
        return outcome::Cancelled{};
    }
    if (report.timed_out) {
        return outcome::Timeout{report.limit};
    }
    if (report.term_signal.has_value()) {
        return outcome::ProcessFailure{-*report.term_signal, excerpt(report.stderr_text, excerpt_bytes)};
    }

    const SplitOutput output = split_stdout(report.stdout_text);
    const int exit_code = report.exit_code.value_or(-1);

    if (exit_code != 0) {
        if (auto diagnostic = extract_r_diagnostic(report.stderr_text)) {
            return outcome::ScriptError{"script exited with status " + std::to_string(exit_code),
                                        std::move(*diagnostic)};
        }
        if (output.payload.has_value()) {
            if (auto error = payload_error(*output.payload)) {
                return outcome::ScriptError{*error, *error};
            }
        }
        return outcome::ProcessFailure{exit_code, excerpt(report.stderr_text, excerpt_bytes)};
    }

    if (output.payload.has_value() == false) {
        const std::string_view raw = output.last_line.empty()
            ? std::string_view(report.stdout_text)
            : std::string_view(output.last_line);
        return outcome::MalformedOutput{excerpt(raw, excerpt_bytes)};
    }

    if (auto error = payload_error(*output.payload)) {
        return outcome::ScriptError{*error, *error};
    }

    return outcome::Success{*output.payload, output.formatted_text};
}

ServerError to_server_error(const ExecutionOutcome& result, std::string_view tool) {
    const std::string name(tool);
    return std::visit([&](const auto& value) -> ServerError {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, outcome::ScriptError>) {
            return ServerError::tool_execution(
                "Tool '" + name + "' failed: " + value.message,
                Json{{"kind", "script_error"}, {"diagnostic", value.diagnostic}});
        } else if constexpr (std::is_same_v<T, outcome::ProcessFailure>) {
            return ServerError::tool_execution(
                "Tool '" + name + "' process failed with status " + std::to_string(value.exit_code),
                Json{{"kind", "process_failure"}, {"exitCode", value.exit_code}, {"stderr", value.stderr_excerpt}});
        } else if constexpr (std::is_same_v<T, outcome::MalformedOutput>) {
            return ServerError::tool_execution(
                "Tool '" + name + "' produced no JSON result",
                Json{{"kind", "malformed_output"}, {"output", value.raw}});
        } else if constexpr (std::is_same_v<T, outcome::Timeout>) {
            return ServerError::tool_timeout(tool, value.limit);
        } else if constexpr (std::is_same_v<T, outcome::Cancelled>) {
            return ServerError::cancelled();
        } else {
            return ServerError::internal("tool '" + name + "' succeeded but was reported as an error");
        }
    }, result);
}

}  // namespace statmcp
