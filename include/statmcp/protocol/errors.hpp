#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Server Error Taxonomy
// ═══════════════════════════════════════════════════════════════════════════
// Every failure a request can hit is a ServerError value. The dispatch
// boundary converts it to a JSON-RPC error object; nothing here throws.

#include "statmcp/protocol/json_rpc.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace statmcp {

// Standard JSON-RPC codes plus the server-defined range
namespace ErrorCode {
    inline constexpr int ParseError = -32700;
    inline constexpr int InvalidRequest = -32600;
    inline constexpr int MethodNotFound = -32601;
    inline constexpr int InvalidParams = -32602;
    inline constexpr int InternalError = -32603;

    inline constexpr int SessionState = -32000;
    inline constexpr int ToolExecution = -32001;
    inline constexpr int ResourceNotFound = -32002;
    inline constexpr int ToolTimeout = -32003;
    inline constexpr int ToolNotFound = -32004;
    inline constexpr int PromptNotFound = -32005;

    // Never sent: cancelled requests get no response at all
    inline constexpr int RequestCancelled = -32800;
}

enum class ErrorKind {
    ParseError,
    InvalidRequest,
    MethodNotFound,
    InvalidParams,
    InternalError,
    SessionState,
    ToolNotFound,
    ResourceNotFound,
    PromptNotFound,
    ToolExecution,
    ToolTimeout,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::ParseError:       return "ParseError";
        case ErrorKind::InvalidRequest:   return "InvalidRequest";
        case ErrorKind::MethodNotFound:   return "MethodNotFound";
        case ErrorKind::InvalidParams:    return "InvalidParams";
        case ErrorKind::InternalError:    return "InternalError";
        case ErrorKind::SessionState:     return "SessionStateError";
        case ErrorKind::ToolNotFound:     return "ToolNotFound";
        case ErrorKind::ResourceNotFound: return "ResourceNotFound";
        case ErrorKind::PromptNotFound:   return "PromptNotFound";
        case ErrorKind::ToolExecution:    return "ToolExecutionError";
        case ErrorKind::ToolTimeout:      return "ToolTimeout";
        case ErrorKind::Cancelled:        return "Cancelled";
    }
    return "Unknown";
}

[[nodiscard]] constexpr int error_code(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::ParseError:       return ErrorCode::ParseError;
        case ErrorKind::InvalidRequest:   return ErrorCode::InvalidRequest;
        case ErrorKind::MethodNotFound:   return ErrorCode::MethodNotFound;
        case ErrorKind::InvalidParams:    return ErrorCode::InvalidParams;
        case ErrorKind::InternalError:    return ErrorCode::InternalError;
        case ErrorKind::SessionState:     return ErrorCode::SessionState;
        case ErrorKind::ToolNotFound:     return ErrorCode::ToolNotFound;
        case ErrorKind::ResourceNotFound: return ErrorCode::ResourceNotFound;
        case ErrorKind::PromptNotFound:   return ErrorCode::PromptNotFound;
        case ErrorKind::ToolExecution:    return ErrorCode::ToolExecution;
        case ErrorKind::ToolTimeout:      return ErrorCode::ToolTimeout;
        case ErrorKind::Cancelled:        return ErrorCode::RequestCancelled;
    }
    return ErrorCode::InternalError;
}

struct ServerError {
    ErrorKind kind{ErrorKind::InternalError};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] int code() const noexcept { return error_code(kind); }

    [[nodiscard]] JsonRpcError to_rpc_error() const {
        return JsonRpcError{code(), message, data};
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static ServerError parse_error(std::string detail) {
        return {ErrorKind::ParseError, "Parse error: " + detail, std::nullopt};
    }

    [[nodiscard]] static ServerError invalid_request(std::string detail) {
        return {ErrorKind::InvalidRequest, "Invalid request: " + detail, std::nullopt};
    }

    [[nodiscard]] static ServerError method_not_found(std::string_view method) {
        return {ErrorKind::MethodNotFound,
                "Method not found: " + std::string(method),
                Json{{"method", std::string(method)}}};
    }

    [[nodiscard]] static ServerError invalid_params(std::string detail,
                                                    std::optional<Json> data = std::nullopt) {
        return {ErrorKind::InvalidParams, "Invalid params: " + detail, std::move(data)};
    }

    [[nodiscard]] static ServerError internal(std::string detail, std::optional<Json> data = std::nullopt) {
        return {ErrorKind::InternalError, "Internal error: " + detail, std::move(data)};
    }

    [[nodiscard]] static ServerError session_state(std::string_view method, std::string_view state) {
        return {ErrorKind::SessionState,
                "Method '" + std::string(method) + "' is not valid in session state " + std::string(state),
                Json{{"method", std::string(method)}, {"state", std::string(state)}}};
    }

    [[nodiscard]] static ServerError tool_not_found(std::string_view name) {
        return {ErrorKind::ToolNotFound, "Unknown tool: " + std::string(name), Json{{"name", std::string(name)}}};
    }

    [[nodiscard]] static ServerError resource_not_found(std::string_view uri) {
        return {ErrorKind::ResourceNotFound, "Resource not found: " + std::string(uri), Json{{"uri", std::string(uri)}}};
    }

    [[nodiscard]] static ServerError prompt_not_found(std::string_view name) {
        return {ErrorKind::PromptNotFound, "Unknown prompt: " + std::string(name), Json{{"name", std::string(name)}}};
    }

    [[nodiscard]] static ServerError tool_execution(std::string message, Json data) {
        return {ErrorKind::ToolExecution, std::move(message), std::move(data)};
    }

    [[nodiscard]] static ServerError tool_timeout(std::string_view tool, std::chrono::milliseconds limit) {
        return {ErrorKind::ToolTimeout,
                "Tool '" + std::string(tool) + "' timed out after " + std::to_string(limit.count()) + " ms",
                Json{{"timeoutMs", limit.count()}}};
    }

    [[nodiscard]] static ServerError cancelled() {
        return {ErrorKind::Cancelled, "Request was cancelled", std::nullopt};
    }
};

template <typename T>
using ServerResult = tl::expected<T, ServerError>;

}  // namespace statmcp
