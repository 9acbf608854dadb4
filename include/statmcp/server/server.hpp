#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Server
// ═══════════════════════════════════════════════════════════════════════════
// The protocol engine. Owns the registries, the execution bridge and the
// lifespan; serve() drives one session over one transport until it closes.
// serve() may run any number of times, concurrently or one after another:
// each call gets its own Session while the registries, bridge and lifespan
// are shared.
//
// Every inbound request runs in its own coroutine, so the read loop keeps
// consuming frames (notifications/cancelled in particular) while tool calls
// are in flight. All coroutines run on the executor given at creation, which
// must be single-threaded.
//
// Session shutdown (a `shutdown` request or end of input):
//   Draining -> wait up to drain_grace for in-flight requests -> cancel the
//   rest and wait for them -> Closed -> transport stopped
//
// request_stop() shuts every session down the same way; the lifespan is torn
// down once the last of them has closed (or when the Server is destroyed).

#include "statmcp/config/server_config.hpp"
#include "statmcp/context/lifespan.hpp"
#include "statmcp/execution/execution_bridge.hpp"
#include "statmcp/protocol/errors.hpp"
#include "statmcp/protocol/json_rpc.hpp"
#include "statmcp/registry/prompt_registry.hpp"
#include "statmcp/registry/resource_registry.hpp"
#include "statmcp/registry/tool_registry.hpp"
#include "statmcp/server/session.hpp"
#include "statmcp/transport.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>

#include <tl/expected.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace statmcp {

class Server {
public:
    [[nodiscard]] static tl::expected<std::unique_ptr<Server>, ServerError> create(
        asio::any_io_executor executor,
        ServerConfig config);

    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Run one session to completion. Returns at once after request_stop().
    asio::awaitable<void> serve(ITransport& transport);

    /// Drain every session, as if each client had sent `shutdown`, and
    /// refuse new ones
    void request_stop();

    [[nodiscard]] bool stop_requested() const noexcept { return stop_requested_; }

    [[nodiscard]] ToolRegistry& tools() noexcept { return tools_; }
    [[nodiscard]] ResourceRegistry& resources() noexcept { return resources_; }
    [[nodiscard]] PromptRegistry& prompts() noexcept { return prompts_; }
    [[nodiscard]] ExecutionBridge& bridge() noexcept { return bridge_; }
    [[nodiscard]] const Lifespan& lifespan() const noexcept { return *lifespan_; }
    [[nodiscard]] const ServerConfig& config() const noexcept { return config_; }

    /// The most recently started session; null until serve() first runs
    [[nodiscard]] const Session* session() const noexcept;

    /// Sessions currently being served
    [[nodiscard]] std::size_t session_count() const noexcept { return connections_.size(); }

    /// In-flight requests across all sessions
    [[nodiscard]] std::size_t active_requests() const noexcept { return active_requests_; }

    /// {"tools": [...], "resources": [...], "prompts": [...]}
    [[nodiscard]] Json describe_capabilities() const;

    [[nodiscard]] ServerCapabilities capabilities() const;

private:
    // Per-session state; shared with the request coroutines of the session
    struct Connection {
        Connection(asio::any_io_executor executor, ITransport& transport, std::string session_id);

        void request_stop();

        Session session;
        ITransport* transport;  // null once the session has closed
        asio::steady_timer stop_signal;
        asio::steady_timer idle_signal;
        bool stop_requested{false};
        std::size_t active_requests{0};
    };
    using ConnectionPtr = std::shared_ptr<Connection>;

    using Handler = asio::awaitable<ServerResult<Json>> (Server::*)(RequestContext&, const Json&);

    Server(asio::any_io_executor executor, ServerConfig config, std::unique_ptr<Lifespan> lifespan);

    static const std::unordered_map<std::string_view, Handler>& dispatch_table();

    // ─────────────────────────────────────────────────────────────────────────
    // Message flow
    // ─────────────────────────────────────────────────────────────────────────

    asio::awaitable<std::optional<TransportResult<Json>>> receive_or_stop(const ConnectionPtr& connection);
    static asio::awaitable<void> wait_for_stop(ConnectionPtr connection);
    void on_frame(const ConnectionPtr& connection, Json payload);
    void on_request(const ConnectionPtr& connection, JsonRpcRequest request);
    void on_notification(Connection& connection, const JsonRpcNotification& notification);
    asio::awaitable<void> run_request(ConnectionPtr connection,
                                      JsonRpcRequest request,
                                      Handler handler,
                                      std::shared_ptr<CancellationToken> token);

    void respond(const ConnectionPtr& connection, const JsonRpcId& id, ServerResult<Json> result);
    void respond_error(const ConnectionPtr& connection, std::optional<JsonRpcId> id, const ServerError& error);
    void post_frame(const ConnectionPtr& connection, Json frame);
    static asio::awaitable<void> send(ConnectionPtr connection, Json frame);
    void notify_list_changed(std::string_view method);

    asio::awaitable<void> drain(const ConnectionPtr& connection);
    static asio::awaitable<void> wait_until_idle(Connection& connection, std::chrono::steady_clock::duration limit);
    void release(const ConnectionPtr& connection);

    // ─────────────────────────────────────────────────────────────────────────
    // Methods
    // ─────────────────────────────────────────────────────────────────────────

    ServerResult<Json> handle_initialize(Session& session, const JsonRpcRequest& request);

    asio::awaitable<ServerResult<Json>> handle_ping(RequestContext& context, const Json& params);
    asio::awaitable<ServerResult<Json>> handle_tools_list(RequestContext& context, const Json& params);
    asio::awaitable<ServerResult<Json>> handle_tools_call(RequestContext& context, const Json& params);
    asio::awaitable<ServerResult<Json>> handle_resources_list(RequestContext& context, const Json& params);
    asio::awaitable<ServerResult<Json>> handle_resources_read(RequestContext& context, const Json& params);
    asio::awaitable<ServerResult<Json>> handle_prompts_list(RequestContext& context, const Json& params);
    asio::awaitable<ServerResult<Json>> handle_prompts_get(RequestContext& context, const Json& params);
    asio::awaitable<ServerResult<Json>> handle_set_level(RequestContext& context, const Json& params);
    asio::awaitable<ServerResult<Json>> handle_shutdown(RequestContext& context, const Json& params);

    asio::any_io_executor executor_;
    ServerConfig config_;
    std::unique_ptr<Lifespan> lifespan_;
    ToolRegistry tools_;
    ResourceRegistry resources_;
    PromptRegistry prompts_;
    ExecutionBridge bridge_;

    std::vector<ConnectionPtr> connections_;
    ConnectionPtr last_connection_;

    bool stop_requested_{false};
    std::size_t active_requests_{0};
};

}  // namespace statmcp
