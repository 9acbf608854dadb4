#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// HTTP Server Transport
// ═══════════════════════════════════════════════════════════════════════════
// Streamable-HTTP style endpoint without the SSE half, served by cpp-httplib:
//
//   POST   <endpoint>   one JSON-RPC message per body
//                       request      -> 200 + JSON response body
//                       notification -> 202, empty body
//   DELETE <endpoint>   ends the session (204)
//   GET    <endpoint>   405, no server-initiated stream
//
// Every POSTed initialize without an Mcp-Session-Id opens a new session; the
// id is issued on its successful response and required on every later
// request for that session: missing -> 400, unknown or ended -> 404.
//
// HttpServerTransport is the listener. Each session it opens is an
// HttpSessionTransport handed to the SessionRunner (Server::serve in the
// binary), so one process serves any number of clients over its lifetime.
//
// httplib answers on its own worker threads; each handler hands the request
// to the executor and blocks on the result, so sessions and the listener's
// bookkeeping are touched only from the executor, which must be
// single-threaded.

#include "statmcp/config/server_config.hpp"
#include "statmcp/transport.hpp"

#include <asio/awaitable.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/steady_timer.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

namespace httplib {
class Server;
struct Response;
}  // namespace httplib

namespace statmcp {

inline constexpr std::string_view kSessionHeader = "Mcp-Session-Id";

/// What an HTTP handler writes back
struct HttpReply {
    int status{200};
    std::optional<Json> body;
    std::optional<std::string> session_id;  // sets Mcp-Session-Id when present
};

// ─────────────────────────────────────────────────────────────────────────────
// HttpSessionTransport
// ─────────────────────────────────────────────────────────────────────────────
// The ITransport of one HTTP session. POSTed frames come in through submit();
// a request's POST stays parked until the server answers it (or abandons it
// after a cancellation, which the client sees as 204).

class HttpSessionTransport final : public ITransport {
public:
    HttpSessionTransport(asio::any_io_executor executor, std::string id, std::size_t capacity);

    HttpSessionTransport(const HttpSessionTransport&) = delete;
    HttpSessionTransport& operator=(const HttpSessionTransport&) = delete;

    [[nodiscard]] asio::any_io_executor get_executor() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_start() override;
    [[nodiscard]] asio::awaitable<void> async_stop() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(Json message) override;
    [[nodiscard]] asio::awaitable<TransportResult<Json>> async_receive() override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] std::optional<std::string> session_id() const override;
    void on_request_abandoned(const Json& id) override;

    [[nodiscard]] const std::string& id() const noexcept { return id_; }

    /// Deliver one POSTed message and produce the HTTP answer for it
    asio::awaitable<HttpReply> submit(Json payload);

    /// The client is done with the session; the server sees end of input
    void end();

private:
    using FrameChannel = asio::experimental::channel<void(asio::error_code, TransportResult<Json>)>;

    // A POSTed request parked until the server answers it
    struct PendingReply {
        explicit PendingReply(asio::any_io_executor ex);

        asio::steady_timer signal;
        std::optional<Json> response;
        bool abandoned{false};
    };

    asio::awaitable<bool> deliver(TransportResult<Json> frame);

    asio::any_io_executor executor_;
    std::string id_;
    FrameChannel channel_;
    std::unordered_map<std::string, std::shared_ptr<PendingReply>> pending_;
    bool running_{false};
    bool ended_{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// HttpServerTransport
// ─────────────────────────────────────────────────────────────────────────────

class HttpServerTransport {
public:
    /// Runs one session to completion
    using SessionRunner = std::function<asio::awaitable<void>(ITransport&)>;

    HttpServerTransport(asio::any_io_executor executor, HttpServerConfig config, SessionRunner runner);
    ~HttpServerTransport();

    HttpServerTransport(const HttpServerTransport&) = delete;
    HttpServerTransport& operator=(const HttpServerTransport&) = delete;

    /// Bind and serve until stop(); then end every session, wait for them to
    /// close and shut the listener down. Fails only when the bind fails.
    asio::awaitable<TransportResult<void>> run();

    /// Call on the executor
    void stop();

    /// Port actually bound (differs from config when port 0 was requested)
    [[nodiscard]] std::uint16_t local_port() const noexcept { return bound_port_; }

    /// Sessions whose runner has not returned yet
    [[nodiscard]] std::size_t session_count() const noexcept { return active_sessions_; }

private:
    void install_routes();
    void answer(httplib::Response& response, asio::awaitable<HttpReply> work);

    asio::awaitable<HttpReply> handle_post(std::string body, std::optional<std::string> session_header);
    asio::awaitable<HttpReply> handle_delete(std::optional<std::string> session_header);

    std::shared_ptr<HttpSessionTransport> open_session();
    void close_session(const std::string& id);
    asio::awaitable<void> run_session(std::shared_ptr<HttpSessionTransport> session);
    asio::awaitable<void> wait_signal();

    static std::string generate_session_id();

    HttpServerConfig config_;
    asio::any_io_executor executor_;
    SessionRunner runner_;
    std::unique_ptr<httplib::Server> http_;
    std::thread listener_;

    std::unordered_map<std::string, std::shared_ptr<HttpSessionTransport>> sessions_;
    asio::steady_timer signal_;
    std::size_t active_sessions_{0};
    std::uint16_t bound_port_{0};
    bool stop_requested_{false};
    bool listener_done_{false};
};

}  // namespace statmcp
