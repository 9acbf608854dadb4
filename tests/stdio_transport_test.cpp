#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>
#include <asio/use_future.hpp>
#include <sstream>
#include <future>
#include <thread>
#include <chrono>
#include <condition_variable>
#include <mutex>

#include "statmcp/transport/stdio_transport.hpp"

using json = nlohmann::json;
using namespace std::chrono_literals;

// ─────────────────────────────────────────────────────────────────────────────
// MockPipeStream - Simulates a pipe with blocking reads and controlled writes
// ─────────────────────────────────────────────────────────────────────────────

class MockPipeStream : public std::iostream {
public:
    MockPipeStream() : std::iostream(&buffer_) {}

    void write_data(const std::string& data) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_data_ += data;
        cv_.notify_all();
    }

    // Unblocks readers with EOF
    void close_pipe() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        cv_.notify_all();
    }

private:
    class PipeStreamBuf : public std::streambuf {
    public:
        explicit PipeStreamBuf(MockPipeStream& parent) : parent_(parent) {}

    protected:
        int underflow() override {
            std::unique_lock<std::mutex> lock(parent_.mutex_);
            parent_.cv_.wait(lock, [this] {
                return !parent_.pending_data_.empty() || parent_.closed_;
            });

            if (parent_.pending_data_.empty() && parent_.closed_) {
                return traits_type::eof();
            }

            read_buffer_ = std::move(parent_.pending_data_);
            parent_.pending_data_.clear();
            setg(read_buffer_.data(), read_buffer_.data(), read_buffer_.data() + read_buffer_.size());
            return traits_type::to_int_type(*gptr());
        }

    private:
        MockPipeStream& parent_;
        std::string read_buffer_;
    };

    PipeStreamBuf buffer_{*this};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::string pending_data_;
    bool closed_ = false;
};

namespace {

statmcp::StdioTransportConfig make_config(std::istream& in, std::ostream& out) {
    statmcp::StdioTransportConfig config;
    config.input = &in;
    config.output = &out;
    return config;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Synchronous framing
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("StdioTransport::send writes one line per frame", "[transport][stdio]") {
    asio::io_context io;
    std::stringstream source;
    std::stringstream sink;
    statmcp::StdioTransport transport{io.get_executor(), make_config(source, sink)};

    json payload = {{"jsonrpc", "2.0"}, {"method", "tools/list"}, {"id", 7}};
    REQUIRE(transport.send(payload).has_value());
    REQUIRE(transport.send(json{{"jsonrpc", "2.0"}, {"result", json::object()}, {"id", 7}}).has_value());

    std::string first;
    std::string second;
    REQUIRE(std::getline(sink, first));
    REQUIRE(std::getline(sink, second));
    REQUIRE(first == payload.dump());
    REQUIRE(json::parse(second)["id"] == 7);
}

TEST_CASE("StdioTransport::send replaces invalid UTF-8 instead of failing", "[transport][stdio]") {
    asio::io_context io;
    std::stringstream source;
    std::stringstream sink;
    statmcp::StdioTransport transport{io.get_executor(), make_config(source, sink)};

    json payload = {{"text", std::string("bad \xff byte")}};
    REQUIRE(transport.send(payload).has_value());
    REQUIRE(json::parse(sink.str())["text"].get<std::string>().find("bad") == 0);
}

TEST_CASE("StdioTransport::read_frame parses newline-delimited JSON", "[transport][stdio]") {
    asio::io_context io;
    std::stringstream source{
        "{\"jsonrpc\":\"2.0\",\"method\":\"ping\",\"id\":1}\r\n"
        "\n"
        "   \n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"};
    std::stringstream sink;
    statmcp::StdioTransport transport{io.get_executor(), make_config(source, sink)};

    auto first = transport.read_frame();
    REQUIRE(first.has_value());
    REQUIRE(first->at("method") == "ping");
    REQUIRE(first->at("id") == 1);

    auto second = transport.read_frame();
    REQUIRE(second.has_value());
    REQUIRE(second->at("method") == "notifications/initialized");
    REQUIRE_FALSE(second->contains("id"));

    auto end = transport.read_frame();
    REQUIRE_FALSE(end.has_value());
    REQUIRE(end.error().category == statmcp::TransportError::Category::Network);
}

TEST_CASE("StdioTransport::read_frame surfaces malformed lines", "[transport][stdio]") {
    asio::io_context io;
    std::stringstream source{"{\"jsonrpc\":\"2.0\",\n"};
    std::stringstream sink;
    statmcp::StdioTransport transport{io.get_executor(), make_config(source, sink)};

    auto result = transport.read_frame();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().category == statmcp::TransportError::Category::Protocol);
}

TEST_CASE("StdioTransport::read_frame rejects oversized lines", "[transport][stdio]") {
    asio::io_context io;
    std::stringstream source{"{\"data\":\"" + std::string(64, 'x') + "\"}\n"};
    std::stringstream sink;
    auto config = make_config(source, sink);
    config.max_line_length = 16;
    statmcp::StdioTransport transport{io.get_executor(), config};

    auto result = transport.read_frame();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().category == statmcp::TransportError::Category::Protocol);
}

// ═══════════════════════════════════════════════════════════════════════════
// Async reader
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("StdioTransport async receive drops bad lines and reports end of stream",
          "[transport][stdio][async]") {
    asio::io_context io;
    std::stringstream source{
        "{\"jsonrpc\":\"2.0\",\"method\":\"first\",\"id\":1}\n"
        "this is not json\n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"second\",\"id\":2}\n"};
    std::stringstream sink;
    statmcp::StdioTransport transport{io.get_executor(), make_config(source, sink)};

    auto fut = asio::co_spawn(
        io,
        [&transport]() -> asio::awaitable<void> {
            auto started = co_await transport.async_start();
            REQUIRE(started.has_value());

            auto first = co_await transport.async_receive();
            REQUIRE(first.has_value());
            REQUIRE(first->at("method") == "first");

            auto second = co_await transport.async_receive();
            REQUIRE(second.has_value());
            REQUIRE(second->at("method") == "second");

            auto end = co_await transport.async_receive();
            REQUIRE_FALSE(end.has_value());
            REQUIRE(end.error().category == statmcp::TransportError::Category::Network);

            co_await transport.async_stop();
        },
        asio::use_future);

    io.run();
    REQUIRE_NOTHROW(fut.get());
    REQUIRE(transport.dropped_frames() == 1);
    REQUIRE_FALSE(transport.is_running());
}

TEST_CASE("StdioTransport async send and receive over a pipe", "[transport][stdio][async]") {
    asio::io_context io;
    MockPipeStream mock_input;
    std::stringstream sink;
    statmcp::StdioTransport transport{io.get_executor(), make_config(mock_input, sink)};

    const json outbound = {{"jsonrpc", "2.0"}, {"result", json::object()}, {"id", 99}};

    std::thread writer([&mock_input]() {
        std::this_thread::sleep_for(50ms);
        mock_input.write_data("{\"jsonrpc\":\"2.0\",\"method\":\"ping\",\"id\":3}\n");
    });

    auto fut = asio::co_spawn(
        io,
        [&transport, outbound]() -> asio::awaitable<void> {
            auto started = co_await transport.async_start();
            REQUIRE(started.has_value());

            auto sent = co_await transport.async_send(outbound);
            REQUIRE(sent.has_value());

            auto received = co_await transport.async_receive();
            REQUIRE(received.has_value());
            REQUIRE(received->at("method") == "ping");
        },
        asio::use_future);

    io.run();
    REQUIRE_NOTHROW(fut.get());
    REQUIRE(sink.str() == outbound.dump() + "\n");

    writer.join();
    mock_input.close_pipe();  // unblock the reader thread
    std::this_thread::sleep_for(50ms);
    asio::io_context stop_io;
    auto stopped = asio::co_spawn(stop_io, transport.async_stop(), asio::use_future);
    stop_io.run();
    stopped.get();
}

TEST_CASE("StdioTransport refuses to start twice or without streams", "[transport][stdio][async]") {
    asio::io_context io;
    std::stringstream source;
    std::stringstream sink;
    statmcp::StdioTransport transport{io.get_executor(), make_config(source, sink)};
    statmcp::StdioTransport unbound{io.get_executor(), statmcp::StdioTransportConfig{}};

    auto fut = asio::co_spawn(
        io,
        [&]() -> asio::awaitable<void> {
            auto first = co_await transport.async_start();
            REQUIRE(first.has_value());
            auto second = co_await transport.async_start();
            REQUIRE_FALSE(second.has_value());

            auto missing = co_await unbound.async_start();
            REQUIRE_FALSE(missing.has_value());
            REQUIRE(missing.error().category == statmcp::TransportError::Category::Protocol);

            co_await transport.async_stop();
        },
        asio::use_future);

    io.run();
    REQUIRE_NOTHROW(fut.get());
}
