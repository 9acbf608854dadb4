#include "statmcp/server/server.hpp"
#include "statmcp/log/logger.hpp"
#include "statmcp/protocol/mcp_types.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/post.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>

#include <iomanip>
#include <random>
#include <sstream>

namespace statmcp {

using namespace asio::experimental::awaitable_operators;

namespace {

constexpr std::string_view kInstructions =
    "Statistical analysis tools backed by R. Pass data as an object of equal-length "
    "columns; each tool returns a markdown summary, the engine's formatted output and "
    "the full result as JSON.";

std::string generate_session_id() {
    std::random_device device;
    std::mt19937_64 engine(device());
    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (int i = 0; i < 2; ++i) {
        out << std::setw(16) << engine();
    }
    return out.str();
}

ServerResult<std::optional<std::string>> read_cursor(const Json& params) {
    if (params.contains("cursor") == false || params["cursor"].is_null()) {
        return std::optional<std::string>{};
    }
    if (params["cursor"].is_string() == false) {
        return tl::unexpected(ServerError::invalid_params("cursor must be a string"));
    }
    return std::optional<std::string>{params["cursor"].get<std::string>()};
}

ServerResult<std::string> read_string(const Json& params, const char* field, std::string_view method) {
    if ((params.contains(field) == false) || (params[field].is_string() == false)) {
        return tl::unexpected(ServerError::invalid_params(
            std::string(method) + " requires a string '" + field + "'"));
    }
    return params[field].get<std::string>();
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

tl::expected<std::unique_ptr<Server>, ServerError> Server::create(asio::any_io_executor executor,
                                                                  ServerConfig config) {
    auto lifespan = Lifespan::create(config);
    if (!lifespan) {
        return tl::unexpected(lifespan.error());
    }
    return std::unique_ptr<Server>(new Server(std::move(executor), std::move(config), std::move(*lifespan)));
}

Server::Server(asio::any_io_executor executor, ServerConfig config, std::unique_ptr<Lifespan> lifespan)
    : executor_(executor),
      config_(std::move(config)),
      lifespan_(std::move(lifespan)),
      bridge_(executor, config_.runtime) {
    bridge_.set_scratch_dir(lifespan_->scratch_dir());

    tools_.set_change_listener([this] { notify_list_changed("notifications/tools/list_changed"); });
    resources_.set_change_listener([this] { notify_list_changed("notifications/resources/list_changed"); });
    prompts_.set_change_listener([this] { notify_list_changed("notifications/prompts/list_changed"); });
}

Server::Connection::Connection(asio::any_io_executor executor, ITransport& transport_ref, std::string session_id)
    : session(std::move(session_id)),
      transport(&transport_ref),
      stop_signal(executor, asio::steady_timer::time_point::max()),
      idle_signal(executor) {}

void Server::Connection::request_stop() {
    if (stop_requested) {
        return;
    }
    stop_requested = true;
    stop_signal.cancel();
}

Server::~Server() {
    lifespan_->teardown();
}

const Session* Server::session() const noexcept {
    return last_connection_ ? &last_connection_->session : nullptr;
}

ServerCapabilities Server::capabilities() const {
    ServerCapabilities caps;
    caps.tools = ServerCapabilities::Tools{true};
    caps.resources = ServerCapabilities::Resources{false, true};
    caps.prompts = ServerCapabilities::Prompts{true};
    caps.logging = ServerCapabilities::Logging{};
    return caps;
}

Json Server::describe_capabilities() const {
    Json tools = Json::array();
    for (const auto& tool : tools_.all()) {
        tools.push_back(tool.to_json());
    }
    Json resources = Json::array();
    for (const auto& resource : resources_.all()) {
        resources.push_back(resource.to_json());
    }
    Json prompts = Json::array();
    for (const auto& prompt : prompts_.all()) {
        prompts.push_back(prompt.to_json());
    }
    return {
        {"tools", std::move(tools)},
        {"resources", std::move(resources)},
        {"prompts", std::move(prompts)}
    };
}

const std::unordered_map<std::string_view, Server::Handler>& Server::dispatch_table() {
    static const std::unordered_map<std::string_view, Handler> table = {
        {"ping", &Server::handle_ping},
        {"tools/list", &Server::handle_tools_list},
        {"tools/call", &Server::handle_tools_call},
        {"resources/list", &Server::handle_resources_list},
        {"resources/read", &Server::handle_resources_read},
        {"prompts/list", &Server::handle_prompts_list},
        {"prompts/get", &Server::handle_prompts_get},
        {"logging/setLevel", &Server::handle_set_level},
        {"shutdown", &Server::handle_shutdown},
    };
    return table;
}

// ═══════════════════════════════════════════════════════════════════════════
// Session loop
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> Server::serve(ITransport& transport) {
    if (stop_requested_) {
        STATMCP_LOG_WARN("Server is stopping; refusing a new session");
        co_return;
    }

    auto connection = std::make_shared<Connection>(
        executor_, transport, transport.session_id().value_or(generate_session_id()));
    connections_.push_back(connection);
    last_connection_ = connection;
    STATMCP_LOG_INFO("Session " + connection->session.id() + " started (" +
                     std::to_string(connections_.size()) + " active)");

    auto started = co_await transport.async_start();
    if (!started) {
        STATMCP_LOG_ERROR("Transport failed to start: " + started.error().message);
        connection->stop_requested = true;
    }

    while (connection->stop_requested == false) {
        auto frame = co_await receive_or_stop(connection);
        if (frame.has_value() == false) {
            break;  // stop requested
        }
        if (frame->has_value() == false) {
            const TransportError& error = frame->error();
            if (error.category == TransportError::Category::Network) {
                STATMCP_LOG_INFO("Input closed: " + error.message);
                break;
            }
            STATMCP_LOG_WARN("Skipping bad frame: " + error.message);
            continue;
        }
        on_frame(connection, std::move(**frame));
    }

    co_await drain(connection);
    release(connection);
}

void Server::request_stop() {
    if (stop_requested_) {
        return;
    }
    stop_requested_ = true;
    for (const auto& connection : connections_) {
        connection->request_stop();
    }
    if (connections_.empty()) {
        lifespan_->teardown();
    }
}

void Server::release(const ConnectionPtr& connection) {
    std::erase(connections_, connection);
    if (stop_requested_ && connections_.empty()) {
        lifespan_->teardown();
    }
}

asio::awaitable<std::optional<TransportResult<Json>>> Server::receive_or_stop(const ConnectionPtr& connection) {
    auto result = co_await (connection->transport->async_receive() || wait_for_stop(connection));
    if (result.index() == 1) {
        co_return std::nullopt;
    }
    co_return std::move(std::get<0>(result));
}

asio::awaitable<void> Server::wait_for_stop(ConnectionPtr connection) {
    asio::error_code ec;
    co_await connection->stop_signal.async_wait(asio::redirect_error(asio::use_awaitable, ec));
}

void Server::on_frame(const ConnectionPtr& connection, Json payload) {
    if (payload.is_array()) {
        respond_error(connection, std::nullopt, ServerError::invalid_request("batch requests are not supported"));
        return;
    }

    auto message = parse_message(payload);
    if (!message) {
        if (auto id = recover_id(payload)) {
            respond_error(connection, *id, ServerError::invalid_request(message.error().message));
        } else {
            STATMCP_LOG_WARN("Dropping malformed message: " + message.error().message);
        }
        return;
    }

    if (auto* request = std::get_if<JsonRpcRequest>(&*message)) {
        on_request(connection, std::move(*request));
    } else if (auto* notification = std::get_if<JsonRpcNotification>(&*message)) {
        on_notification(*connection, *notification);
    } else {
        STATMCP_LOG_DEBUG("Ignoring response from client");
    }
}

void Server::on_request(const ConnectionPtr& connection, JsonRpcRequest request) {
    Session& session = connection->session;
    session.count_accepted();
    const std::string& method = request.method();
    const SessionState state = session.state();
    STATMCP_LOG_DEBUG("<- " + method + " (" + request.id().key() + ")");

    if (method == "initialize") {
        respond(connection, request.id(), handle_initialize(session, request));
        return;
    }

    if ((state != SessionState::Ready) && (method != "ping")) {
        respond_error(connection, request.id(), ServerError::session_state(method, to_string(state)));
        return;
    }

    const auto& table = dispatch_table();
    const auto entry = table.find(method);
    if (entry == table.end()) {
        respond_error(connection, request.id(), ServerError::method_not_found(method));
        return;
    }

    if (request.params().has_value() && (request.params()->is_object() == false)) {
        respond_error(connection, request.id(), ServerError::invalid_params("params must be an object"));
        return;
    }

    auto token = std::make_shared<CancellationToken>();
    if (session.track(request.id(), token) == false) {
        respond_error(connection, request.id(), ServerError::invalid_request(
            "request id " + request.id().to_json().dump() + " is already in flight"));
        return;
    }

    ++active_requests_;
    ++connection->active_requests;
    asio::co_spawn(executor_,
                   run_request(connection, std::move(request), entry->second, std::move(token)),
                   asio::detached);
}

void Server::on_notification(Connection& connection, const JsonRpcNotification& notification) {
    const std::string& method = notification.method();

    if (method == "notifications/initialized") {
        STATMCP_LOG_INFO("Client reported initialized");
        return;
    }

    if (method == "notifications/cancelled") {
        auto cancelled = CancelledNotification::from_json(notification.params().value_or(Json::object()));
        if (!cancelled) {
            STATMCP_LOG_WARN("Bad cancellation notice: " + cancelled.error().message);
            return;
        }
        const std::string reason = cancelled->reason.value_or("no reason given");
        if (connection.session.cancel(cancelled->request_id)) {
            STATMCP_LOG_INFO("Cancelled request " + cancelled->request_id.key() + ": " + reason);
        } else {
            STATMCP_LOG_DEBUG("Cancellation for " + cancelled->request_id.key() + " which is not in flight");
        }
        return;
    }

    STATMCP_LOG_DEBUG("Ignoring notification " + method);
}

asio::awaitable<void> Server::run_request(ConnectionPtr connection,
                                          JsonRpcRequest request,
                                          Handler handler,
                                          std::shared_ptr<CancellationToken> token) {
    const JsonRpcId id = request.id();
    const Json params = request.params().value_or(Json::object());

    RequestContext context(id, connection->session, *lifespan_, token, [this, connection](Json frame) {
        post_frame(connection, std::move(frame));
    });

    ServerResult<Json> result;
    try {
        result = co_await (this->*handler)(context, params);
    } catch (const std::exception& e) {
        STATMCP_LOG_ERROR("Unhandled exception in " + request.method() + ": " + e.what());
        result = tl::unexpected(ServerError::internal(e.what()));
    }

    connection->session.untrack(id);

    const bool cancelled = token->is_cancelled() ||
                           ((result.has_value() == false) && (result.error().kind == ErrorKind::Cancelled));
    if (cancelled) {
        // No response for a cancelled request; late results are discarded
        STATMCP_LOG_DEBUG("Request " + id.key() + " abandoned after cancellation");
        if (connection->transport != nullptr) {
            connection->transport->on_request_abandoned(id.to_json());
        }
    } else if (result) {
        co_await send(connection, JsonRpcResponse::success(id, std::move(*result)).to_json());
    } else {
        STATMCP_LOG_DEBUG("Request " + id.key() + " failed: " + result.error().message);
        co_await send(connection, JsonRpcResponse::failure(id, result.error().to_rpc_error()).to_json());
    }

    if (request.method() == "shutdown") {
        connection->request_stop();
    }

    --active_requests_;
    if (--connection->active_requests == 0) {
        connection->idle_signal.cancel();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Outbound
// ═══════════════════════════════════════════════════════════════════════════

void Server::respond(const ConnectionPtr& connection, const JsonRpcId& id, ServerResult<Json> result) {
    if (result) {
        post_frame(connection, JsonRpcResponse::success(id, std::move(*result)).to_json());
    } else {
        respond_error(connection, id, result.error());
    }
}

void Server::respond_error(const ConnectionPtr& connection, std::optional<JsonRpcId> id, const ServerError& error) {
    post_frame(connection, JsonRpcResponse::failure(std::move(id), error.to_rpc_error()).to_json());
}

void Server::post_frame(const ConnectionPtr& connection, Json frame) {
    asio::co_spawn(executor_, send(connection, std::move(frame)), asio::detached);
}

asio::awaitable<void> Server::send(ConnectionPtr connection, Json frame) {
    if (connection->transport == nullptr) {
        co_return;
    }
    auto sent = co_await connection->transport->async_send(std::move(frame));
    if (!sent) {
        STATMCP_LOG_WARN("Send failed: " + sent.error().message);
        if (sent.error().category == TransportError::Category::Network) {
            connection->request_stop();
        }
    }
}

void Server::notify_list_changed(std::string_view method) {
    for (const auto& connection : connections_) {
        if (connection->session.state() == SessionState::Ready) {
            post_frame(connection, JsonRpcNotification(std::string(method)).to_json());
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Drain
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> Server::wait_until_idle(Connection& connection, std::chrono::steady_clock::duration limit) {
    connection.idle_signal.expires_after(limit);
    while (connection.active_requests > 0) {
        asio::error_code ec;
        co_await connection.idle_signal.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (!ec) {
            break;  // limit reached
        }
    }
}

asio::awaitable<void> Server::drain(const ConnectionPtr& connection) {
    Session& session = connection->session;
    connection->stop_requested = true;
    session.transition(SessionState::Draining);

    if (connection->active_requests > 0) {
        STATMCP_LOG_INFO("Draining " + std::to_string(connection->active_requests) + " in-flight requests");
        co_await wait_until_idle(*connection, config_.drain_grace);
    }

    if (connection->active_requests > 0) {
        const std::size_t cancelled = session.cancel_all();
        STATMCP_LOG_WARN("Drain grace elapsed; cancelled " + std::to_string(cancelled) + " requests");
        // Cancelled calls kill their processes and finish promptly
        while (connection->active_requests > 0) {
            co_await wait_until_idle(*connection, std::chrono::seconds(1));
        }
    }

    // Let frames already queued reach the transport before it stops
    co_await asio::post(executor_, asio::use_awaitable);

    session.transition(SessionState::Closed);
    co_await connection->transport->async_stop();
    connection->transport = nullptr;

    const auto stats = bridge_.stats();
    STATMCP_LOG_INFO("Session " + session.id() + " closed (" + std::to_string(session.accepted_requests()) +
                     " requests; " + std::to_string(stats.spawned) + " processes spawned, " +
                     std::to_string(stats.reaped) + " reaped so far)");
}

// ═══════════════════════════════════════════════════════════════════════════
// Methods
// ═══════════════════════════════════════════════════════════════════════════

ServerResult<Json> Server::handle_initialize(Session& session, const JsonRpcRequest& request) {
    if (session.transition(SessionState::Initializing) == false) {
        return tl::unexpected(ServerError::session_state("initialize", to_string(session.state())));
    }

    auto params = InitializeParams::from_json(request.params().value_or(Json::object()));
    if (!params) {
        session.transition(SessionState::Uninitialized);
        return tl::unexpected(ServerError::invalid_params(params.error().message));
    }

    const std::string version = negotiate_protocol_version(params->protocol_version);
    if (version != params->protocol_version) {
        STATMCP_LOG_INFO("Client asked for protocol " + params->protocol_version + "; offering " + version);
    }
    session.record_initialize(version, params->client_info, params->capabilities);
    session.transition(SessionState::Ready);

    STATMCP_LOG_INFO("Initialized with " +
                     (params->client_info.name.empty() ? std::string("unnamed client") : params->client_info.name) +
                     " (protocol " + version + ")");

    InitializeResult result;
    result.protocol_version = version;
    result.capabilities = capabilities();
    result.server_info = Implementation{config_.server_name, config_.server_version};
    result.instructions = std::string(kInstructions);
    return result.to_json();
}

asio::awaitable<ServerResult<Json>> Server::handle_ping(RequestContext& /*context*/, const Json& /*params*/) {
    co_return Json::object();
}

asio::awaitable<ServerResult<Json>> Server::handle_tools_list(RequestContext& /*context*/, const Json& params) {
    auto cursor = read_cursor(params);
    if (!cursor) {
        co_return tl::unexpected(cursor.error());
    }
    co_return tools_.list(*cursor, config_.page_size);
}

asio::awaitable<ServerResult<Json>> Server::handle_tools_call(RequestContext& context, const Json& params) {
    auto name = read_string(params, "name", "tools/call");
    if (!name) {
        co_return tl::unexpected(name.error());
    }

    Json arguments = Json::object();
    if (params.contains("arguments") && (params["arguments"].is_null() == false)) {
        if (params["arguments"].is_object() == false) {
            co_return tl::unexpected(ServerError::invalid_params("tools/call arguments must be an object"));
        }
        arguments = params["arguments"];
    }

    STATMCP_LOG_INFO("Calling tool " + *name + " (" + context.request_id().key() + ")");
    auto result = co_await tools_.invoke(*name, context, std::move(arguments));
    if (!result) {
        co_return tl::unexpected(result.error());
    }
    co_return result->to_json();
}

asio::awaitable<ServerResult<Json>> Server::handle_resources_list(RequestContext& /*context*/, const Json& params) {
    auto cursor = read_cursor(params);
    if (!cursor) {
        co_return tl::unexpected(cursor.error());
    }
    co_return resources_.list(*cursor, config_.page_size);
}

asio::awaitable<ServerResult<Json>> Server::handle_resources_read(RequestContext& context, const Json& params) {
    auto uri = read_string(params, "uri", "resources/read");
    if (!uri) {
        co_return tl::unexpected(uri.error());
    }
    auto contents = resources_.read(*uri, context);
    if (!contents) {
        co_return tl::unexpected(contents.error());
    }
    co_return contents->to_json();
}

asio::awaitable<ServerResult<Json>> Server::handle_prompts_list(RequestContext& /*context*/, const Json& params) {
    auto cursor = read_cursor(params);
    if (!cursor) {
        co_return tl::unexpected(cursor.error());
    }
    co_return prompts_.list(*cursor, config_.page_size);
}

asio::awaitable<ServerResult<Json>> Server::handle_prompts_get(RequestContext& context, const Json& params) {
    auto name = read_string(params, "name", "prompts/get");
    if (!name) {
        co_return tl::unexpected(name.error());
    }
    const Json arguments = params.contains("arguments") ? params["arguments"] : Json();
    auto prompt = prompts_.get(*name, context, arguments);
    if (!prompt) {
        co_return tl::unexpected(prompt.error());
    }
    co_return prompt->to_json();
}

asio::awaitable<ServerResult<Json>> Server::handle_set_level(RequestContext& context, const Json& params) {
    auto name = read_string(params, "level", "logging/setLevel");
    if (!name) {
        co_return tl::unexpected(name.error());
    }
    auto level = logging_level_from_string(*name);
    if (level.has_value() == false) {
        co_return tl::unexpected(ServerError::invalid_params("unknown logging level '" + *name + "'"));
    }
    context.session().set_logging_level(*level);
    STATMCP_LOG_DEBUG("Client logging level set to " + *name);
    co_return Json::object();
}

asio::awaitable<ServerResult<Json>> Server::handle_shutdown(RequestContext& /*context*/, const Json& /*params*/) {
    STATMCP_LOG_INFO("Shutdown requested by client");
    co_return Json(nullptr);
}

}  // namespace statmcp
