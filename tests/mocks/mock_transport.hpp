#ifndef STATMCP_TESTS_MOCK_TRANSPORT_HPP
#define STATMCP_TESTS_MOCK_TRANSPORT_HPP

#include "statmcp/transport.hpp"

#include <asio/experimental/channel.hpp>
#include <asio/use_awaitable.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace statmcp::testing {

// ─────────────────────────────────────────────────────────────────────────────
// MockTransport
// ─────────────────────────────────────────────────────────────────────────────
// In-memory ITransport for driving a Server from a test:
//
//   MockTransport transport(io.get_executor());
//   transport.push(initialize_request);
//   transport.close_input();          // end of stream after queued frames
//   co_spawn(io, server->serve(transport), detached);
//   io.run();
//   transport.sent();                 // everything the server wrote
//
// Frames pushed before close_input() are delivered in order.

class MockTransport final : public ITransport {
public:
    explicit MockTransport(asio::any_io_executor executor, std::size_t capacity = 256)
        : executor_(std::move(executor)),
          inbound_(executor_, capacity) {}

    void push(Json frame) {
        inbound_.try_send(asio::error_code{}, TransportResult<Json>(std::move(frame)));
    }

    void push_error(TransportError error) {
        inbound_.try_send(asio::error_code{}, TransportResult<Json>(tl::unexpected(std::move(error))));
    }

    void close_input() {
        push_error(end_of_stream_error());
    }

    /// Called for every frame the server sends, after it is recorded
    void on_sent(std::function<void(const Json&)> hook) {
        hook_ = std::move(hook);
    }

    void fail_sends(bool fail) noexcept { fail_sends_ = fail; }

    /// Session id reported to the server, as an HTTP session would
    void assign_session_id(std::string id) { session_id_ = std::move(id); }

    [[nodiscard]] const std::vector<Json>& sent() const noexcept { return sent_; }
    [[nodiscard]] const std::vector<Json>& abandoned() const noexcept { return abandoned_; }
    [[nodiscard]] int start_count() const noexcept { return starts_; }
    [[nodiscard]] int stop_count() const noexcept { return stops_; }

    /// First sent response carrying `id`, or null
    [[nodiscard]] Json response_for(const Json& id) const {
        for (const auto& frame : sent_) {
            if (frame.contains("id") && (frame["id"] == id) && (frame.contains("method") == false)) {
                return frame;
            }
        }
        return Json();
    }

    [[nodiscard]] std::vector<Json> notifications(const std::string& method) const {
        std::vector<Json> found;
        for (const auto& frame : sent_) {
            if (frame.value("method", "") == method) {
                found.push_back(frame);
            }
        }
        return found;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // ITransport
    // ─────────────────────────────────────────────────────────────────────────

    asio::any_io_executor get_executor() override { return executor_; }

    asio::awaitable<TransportResult<void>> async_start() override {
        ++starts_;
        running_ = true;
        co_return TransportResult<void>{};
    }

    asio::awaitable<void> async_stop() override {
        ++stops_;
        running_ = false;
        co_return;
    }

    asio::awaitable<TransportResult<void>> async_send(Json message) override {
        if (fail_sends_) {
            co_return tl::unexpected(TransportError{TransportError::Category::Network, "peer gone", std::nullopt});
        }
        sent_.push_back(message);
        if (hook_) {
            hook_(sent_.back());
        }
        co_return TransportResult<void>{};
    }

    asio::awaitable<TransportResult<Json>> async_receive() override {
        co_return co_await inbound_.async_receive(asio::use_awaitable);
    }

    bool is_running() const override { return running_; }

    std::optional<std::string> session_id() const override { return session_id_; }

    void on_request_abandoned(const Json& id) override {
        abandoned_.push_back(id);
    }

private:
    using FrameChannel = asio::experimental::channel<void(asio::error_code, TransportResult<Json>)>;

    asio::any_io_executor executor_;
    FrameChannel inbound_;
    std::vector<Json> sent_;
    std::vector<Json> abandoned_;
    std::function<void(const Json&)> hook_;
    std::optional<std::string> session_id_;
    bool fail_sends_{false};
    bool running_{false};
    int starts_{0};
    int stops_{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// Frame builders
// ─────────────────────────────────────────────────────────────────────────────

inline Json request(Json id, std::string method, Json params = Json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", std::move(id)}, {"method", std::move(method)}, {"params", std::move(params)}};
}

inline Json notification(std::string method, Json params = Json::object()) {
    return {{"jsonrpc", "2.0"}, {"method", std::move(method)}, {"params", std::move(params)}};
}

inline Json initialize_request(Json id = 0, std::string version = "2025-06-18") {
    return request(std::move(id), "initialize", {
        {"protocolVersion", std::move(version)},
        {"capabilities", Json::object()},
        {"clientInfo", {{"name", "test-client"}, {"version", "1.0"}}}
    });
}

}  // namespace statmcp::testing

#endif  // STATMCP_TESTS_MOCK_TRANSPORT_HPP
