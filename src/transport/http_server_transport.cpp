#include "statmcp/transport/http_server_transport.hpp"
#include "statmcp/log/logger.hpp"
#include "statmcp/protocol/errors.hpp"

#include <httplib.h>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/use_future.hpp>

#include <iomanip>
#include <random>
#include <sstream>

namespace statmcp {
namespace {

HttpReply status_only(int status) {
    HttpReply reply;
    reply.status = status;
    return reply;
}

HttpReply rpc_failure(int status, const ServerError& error) {
    HttpReply reply;
    reply.status = status;
    reply.body = JsonRpcResponse::failure(std::nullopt, error.to_rpc_error()).to_json();
    return reply;
}

bool is_method(const Json& payload, std::string_view method) {
    if ((payload.is_object() == false) || (payload.contains("method") == false)) {
        return false;
    }
    const Json& node = payload.at("method");
    return node.is_string() && (node.get_ref<const std::string&>() == method);
}

std::optional<std::string> session_header(const httplib::Request& request) {
    const std::string name(kSessionHeader);
    if (request.has_header(name) == false) {
        return std::nullopt;
    }
    return request.get_header_value(name);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// HttpSessionTransport
// ═══════════════════════════════════════════════════════════════════════════

HttpSessionTransport::PendingReply::PendingReply(asio::any_io_executor ex)
    : signal(ex, asio::steady_timer::time_point::max()) {}

HttpSessionTransport::HttpSessionTransport(asio::any_io_executor executor, std::string id, std::size_t capacity)
    : executor_(std::move(executor)),
      id_(std::move(id)),
      channel_(executor_, capacity) {}

asio::any_io_executor HttpSessionTransport::get_executor() {
    return executor_;
}

bool HttpSessionTransport::is_running() const {
    return running_;
}

std::optional<std::string> HttpSessionTransport::session_id() const {
    return id_;
}

asio::awaitable<TransportResult<void>> HttpSessionTransport::async_start() {
    running_ = true;
    co_return TransportResult<void>{};
}

asio::awaitable<void> HttpSessionTransport::async_stop() {
    running_ = false;
    ended_ = true;
    channel_.close();

    // Parked POSTs wake up without a response and get 503
    for (auto& [key, reply] : pending_) {
        reply->signal.cancel();
    }
    co_return;
}

asio::awaitable<TransportResult<void>> HttpSessionTransport::async_send(Json message) {
    const bool is_response = message.is_object()
        && message.contains("id")
        && (message.contains("result") || message.contains("error"));
    if (is_response == false) {
        STATMCP_LOG_DEBUG("No server-to-client stream; dropping outbound notification");
        co_return TransportResult<void>{};
    }

    auto id = JsonRpcId::from_json(message.at("id"));
    if (id.has_value() == false) {
        STATMCP_LOG_WARN("Dropping response without a correlatable id");
        co_return TransportResult<void>{};
    }

    const auto it = pending_.find(id->key());
    if (it == pending_.end()) {
        STATMCP_LOG_WARN("Response for id " + id->key() + " has no waiting HTTP request");
        co_return TransportResult<void>{};
    }

    it->second->response = std::move(message);
    it->second->signal.cancel();
    co_return TransportResult<void>{};
}

asio::awaitable<TransportResult<Json>> HttpSessionTransport::async_receive() {
    if (channel_.is_open() == false) {
        co_return tl::unexpected(end_of_stream_error());
    }
    try {
        auto result = co_await channel_.async_receive(asio::use_awaitable);
        co_return result;
    } catch (const std::system_error& e) {
        co_return tl::unexpected(TransportError{
            TransportError::Category::Network,
            "receive failed: " + std::string(e.what())});
    }
}

void HttpSessionTransport::on_request_abandoned(const Json& id) {
    auto parsed = JsonRpcId::from_json(id);
    if (parsed.has_value() == false) {
        return;
    }
    const auto it = pending_.find(parsed->key());
    if (it != pending_.end()) {
        it->second->abandoned = true;
        it->second->signal.cancel();
    }
}

void HttpSessionTransport::end() {
    if (ended_) {
        return;
    }
    ended_ = true;
    asio::co_spawn(executor_, deliver(tl::unexpected(end_of_stream_error())), asio::detached);
}

asio::awaitable<bool> HttpSessionTransport::deliver(TransportResult<Json> frame) {
    if (channel_.is_open() == false) {
        co_return false;
    }
    try {
        co_await channel_.async_send(asio::error_code{}, std::move(frame), asio::use_awaitable);
    } catch (const std::system_error& e) {
        STATMCP_LOG_DEBUG("Inbound frame not delivered: " + std::string(e.what()));
        co_return false;
    }
    co_return true;
}

asio::awaitable<HttpReply> HttpSessionTransport::submit(Json payload) {
    if (ended_) {
        co_return status_only(404);
    }

    const bool is_request = payload.is_object() && payload.contains("method") && payload.contains("id");
    if (is_request == false) {
        if (co_await deliver(std::move(payload)) == false) {
            co_return status_only(503);
        }
        co_return status_only(202);
    }

    auto id = JsonRpcId::from_json(payload.at("id"));
    if (id.has_value() == false) {
        co_return rpc_failure(400, ServerError::invalid_request(id.error().message));
    }

    const std::string key = id->key();
    if (pending_.contains(key)) {
        HttpReply duplicate;
        duplicate.body = JsonRpcResponse::failure(
            *id, ServerError::invalid_request("duplicate request id").to_rpc_error()).to_json();
        co_return duplicate;
    }

    auto reply = std::make_shared<PendingReply>(executor_);
    pending_.emplace(key, reply);

    if (co_await deliver(std::move(payload)) == false) {
        pending_.erase(key);
        co_return status_only(503);
    }

    asio::error_code ec;
    co_await reply->signal.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    pending_.erase(key);

    if (reply->response.has_value()) {
        HttpReply answered;
        answered.body = std::move(*reply->response);
        co_return answered;
    }
    if (reply->abandoned) {
        co_return status_only(204);
    }
    co_return status_only(503);
}

// ═══════════════════════════════════════════════════════════════════════════
// HttpServerTransport
// ═══════════════════════════════════════════════════════════════════════════

HttpServerTransport::HttpServerTransport(asio::any_io_executor executor,
                                         HttpServerConfig config,
                                         SessionRunner runner)
    : config_(std::move(config)),
      executor_(std::move(executor)),
      runner_(std::move(runner)),
      http_(std::make_unique<httplib::Server>()),
      signal_(executor_, asio::steady_timer::time_point::max()) {
    http_->set_payload_max_length(config_.max_body_size);
    install_routes();
}

HttpServerTransport::~HttpServerTransport() {
    if (listener_.joinable()) {
        http_->stop();
        listener_.join();
    }
}

void HttpServerTransport::install_routes() {
    http_->Post(config_.endpoint, [this](const httplib::Request& request, httplib::Response& response) {
        answer(response, handle_post(request.body, session_header(request)));
    });

    http_->Delete(config_.endpoint, [this](const httplib::Request& request, httplib::Response& response) {
        answer(response, handle_delete(session_header(request)));
    });

    http_->Get(config_.endpoint, [](const httplib::Request& /*request*/, httplib::Response& response) {
        response.status = 405;
        response.set_header("Allow", "POST, DELETE");
    });
}

void HttpServerTransport::answer(httplib::Response& response, asio::awaitable<HttpReply> work) {
    HttpReply reply;
    try {
        reply = asio::co_spawn(executor_, std::move(work), asio::use_future).get();
    } catch (const std::exception& e) {
        STATMCP_LOG_WARN("HTTP request failed: " + std::string(e.what()));
        reply = status_only(503);
    }

    response.status = reply.status;
    if (reply.session_id.has_value()) {
        response.set_header(std::string(kSessionHeader), *reply.session_id);
    }
    if (reply.body.has_value()) {
        response.set_content(reply.body->dump(), "application/json");
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<void> HttpServerTransport::wait_signal() {
    signal_.expires_at(asio::steady_timer::time_point::max());
    asio::error_code ec;
    co_await signal_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
}

asio::awaitable<TransportResult<void>> HttpServerTransport::run() {
    int port = config_.port;
    if (port == 0) {
        port = http_->bind_to_any_port(config_.host);
    } else if (http_->bind_to_port(config_.host, port) == false) {
        port = -1;
    }
    if (port < 0) {
        co_return tl::unexpected(TransportError{
            TransportError::Category::Network,
            "failed to listen on " + config_.host + ":" + std::to_string(config_.port)});
    }
    bound_port_ = static_cast<std::uint16_t>(port);

    listener_ = std::thread([this] {
        if (http_->listen_after_bind() == false) {
            STATMCP_LOG_ERROR("HTTP listener stopped unexpectedly");
        }
        asio::post(executor_, [this] {
            listener_done_ = true;
            signal_.cancel();
        });
    });
    STATMCP_LOG_INFO("Listening on http://" + config_.host + ":" + std::to_string(bound_port_) + config_.endpoint);

    while ((stop_requested_ == false) && (listener_done_ == false)) {
        co_await wait_signal();
    }
    stop_requested_ = true;

    // Ending a session is the same as its client sending DELETE
    for (const auto& [id, session] : sessions_) {
        session->end();
    }
    sessions_.clear();
    while (active_sessions_ > 0) {
        co_await wait_signal();
    }

    http_->stop();
    while (listener_done_ == false) {
        co_await wait_signal();
    }
    listener_.join();

    STATMCP_LOG_INFO("HTTP listener stopped");
    co_return TransportResult<void>{};
}

void HttpServerTransport::stop() {
    stop_requested_ = true;
    signal_.cancel();
}

// ─────────────────────────────────────────────────────────────────────────────
// Sessions
// ─────────────────────────────────────────────────────────────────────────────

std::shared_ptr<HttpSessionTransport> HttpServerTransport::open_session() {
    auto session = std::make_shared<HttpSessionTransport>(executor_, generate_session_id(), config_.channel_capacity);
    sessions_.emplace(session->id(), session);
    ++active_sessions_;
    asio::co_spawn(executor_, run_session(session), asio::detached);
    return session;
}

void HttpServerTransport::close_session(const std::string& id) {
    const auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return;
    }
    it->second->end();
    sessions_.erase(it);
}

asio::awaitable<void> HttpServerTransport::run_session(std::shared_ptr<HttpSessionTransport> session) {
    try {
        co_await runner_(*session);
    } catch (const std::exception& e) {
        STATMCP_LOG_ERROR("HTTP session " + session->id() + " failed: " + e.what());
    }
    co_await session->async_stop();

    const auto it = sessions_.find(session->id());
    if ((it != sessions_.end()) && (it->second == session)) {
        sessions_.erase(it);
    }
    if (--active_sessions_ == 0) {
        signal_.cancel();
    }
    STATMCP_LOG_DEBUG("HTTP session " + session->id() + " finished");
}

asio::awaitable<HttpReply> HttpServerTransport::handle_post(std::string body,
                                                            std::optional<std::string> session_header) {
    Json payload;
    try {
        payload = Json::parse(body);
    } catch (const Json::parse_error& err) {
        co_return rpc_failure(400, ServerError::parse_error(err.what()));
    }

    std::shared_ptr<HttpSessionTransport> session;
    bool opened = false;
    if (session_header.has_value()) {
        const auto it = sessions_.find(*session_header);
        if (it == sessions_.end()) {
            co_return status_only(404);
        }
        session = it->second;
    } else if (is_method(payload, "initialize")) {
        if (stop_requested_) {
            co_return status_only(503);
        }
        session = open_session();
        opened = true;
    } else {
        co_return rpc_failure(400, ServerError::invalid_request("missing Mcp-Session-Id header"));
    }

    HttpReply reply = co_await session->submit(std::move(payload));
    if (opened) {
        const bool initialized = reply.body.has_value() && reply.body->contains("result");
        if (initialized) {
            reply.session_id = session->id();
            STATMCP_LOG_INFO("HTTP session established: " + session->id());
        } else {
            // The client retries with a fresh initialize
            close_session(session->id());
        }
    }
    co_return reply;
}

asio::awaitable<HttpReply> HttpServerTransport::handle_delete(std::optional<std::string> session_header) {
    if (session_header.has_value() == false) {
        co_return rpc_failure(400, ServerError::invalid_request("missing Mcp-Session-Id header"));
    }
    if (sessions_.contains(*session_header) == false) {
        co_return status_only(404);
    }

    STATMCP_LOG_INFO("HTTP session terminated by client: " + *session_header);
    close_session(*session_header);
    co_return status_only(204);
}

std::string HttpServerTransport::generate_session_id() {
    std::random_device device;
    std::mt19937_64 engine(device());
    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (int i = 0; i < 2; ++i) {
        out << std::setw(16) << engine();
    }
    return out.str();
}

}  // namespace statmcp
