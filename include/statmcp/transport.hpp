#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Interface
// ═══════════════════════════════════════════════════════════════════════════
// Moves whole JSON-RPC frames between the server and one client connection.
// Implementations know nothing about message semantics.
//
// Implementations:
//   - StdioTransport       (newline-delimited JSON on stdin/stdout)
//   - HttpSessionTransport (one per Mcp-Session-Id, fed by HttpServerTransport)

#include <nlohmann/json.hpp>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <optional>
#include <string>

#include <tl/expected.hpp>

namespace statmcp {

using Json = nlohmann::json;

/// Error type for transport operations.
/// Network means the connection is gone and the session must end;
/// Protocol means one frame was bad and the stream is still usable.
struct TransportError {
    enum class Category { Network, Timeout, Protocol };

    Category category{};
    std::string message;
    std::optional<int> status_code{};
};

template <typename T>
using TransportResult = tl::expected<T, TransportError>;

[[nodiscard]] inline TransportError end_of_stream_error() {
    return TransportError{TransportError::Category::Network, "end of stream", std::nullopt};
}

class ITransport {
public:
    virtual ~ITransport() = default;

    [[nodiscard]] virtual asio::any_io_executor get_executor() = 0;

    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_start() = 0;

    /// Stop accepting input and release the connection. Idempotent.
    [[nodiscard]] virtual asio::awaitable<void> async_stop() = 0;

    /// Write one frame
    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_send(Json message) = 0;

    /// Next complete frame, or a Network error once the stream has ended
    [[nodiscard]] virtual asio::awaitable<TransportResult<Json>> async_receive() = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /// The server will never answer this request id (it was cancelled).
    /// Request/response transports use this to release the waiting caller.
    virtual void on_request_abandoned(const Json& /*id*/) {}

    /// Session id the transport already handed to the client, if any.
    /// The server adopts it instead of generating its own.
    [[nodiscard]] virtual std::optional<std::string> session_id() const { return std::nullopt; }
};

}  // namespace statmcp
