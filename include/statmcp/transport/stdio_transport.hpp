#pragma once

#include <atomic>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/strand.hpp>

#include "statmcp/transport.hpp"

namespace statmcp {

struct StdioTransportConfig {
    std::istream* input{nullptr};
    std::ostream* output{nullptr};
    bool auto_flush{true};
    std::size_t max_line_length{4u << 20};  // 4 MiB; data frames can be large
    std::size_t channel_capacity{64};
};

/// Newline-delimited JSON over a pair of streams (stdin/stdout in production).
///
/// std::istream cannot be awaited, so a dedicated reader thread performs the
/// blocking reads and hands complete frames to the executor through a channel.
/// Malformed lines are logged and dropped; end of input is reported once as a
/// Network error.
class StdioTransport final : public ITransport {
public:
    StdioTransport(asio::any_io_executor executor, StdioTransportConfig config);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Synchronous helpers (usable without start())
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] TransportResult<void> send(const Json& message);

    /// Blocking read of the next non-blank line from the input stream
    [[nodiscard]] TransportResult<Json> read_frame();

    // ─────────────────────────────────────────────────────────────────────────
    // ITransport
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::any_io_executor get_executor() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_start() override;
    [[nodiscard]] asio::awaitable<void> async_stop() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(Json message) override;
    [[nodiscard]] asio::awaitable<TransportResult<Json>> async_receive() override;
    [[nodiscard]] bool is_running() const override;

    [[nodiscard]] std::size_t dropped_frames() const noexcept;
    [[nodiscard]] const StdioTransportConfig& config() const noexcept;

private:
    using FrameChannel = asio::experimental::channel<void(asio::error_code, TransportResult<Json>)>;

    // Everything the reader thread touches. Shared so that a reader still
    // blocked in getline() at shutdown can be detached safely.
    struct ReaderState {
        ReaderState(asio::any_io_executor ex, std::istream* in, std::size_t max_line, std::size_t capacity);

        asio::any_io_executor executor;
        std::istream* input;
        std::size_t max_line_length;
        FrameChannel channel;
        std::atomic<bool> running{false};
        std::atomic<bool> finished{false};
        std::atomic<std::size_t> dropped{0};
    };

    static void reader_loop(std::shared_ptr<ReaderState> state);
    void shutdown();

    StdioTransportConfig config_;
    asio::any_io_executor executor_;
    asio::strand<asio::any_io_executor> write_strand_;
    std::shared_ptr<ReaderState> reader_;
    std::thread reader_thread_;
    std::mutex write_mutex_;
};

}  // namespace statmcp
