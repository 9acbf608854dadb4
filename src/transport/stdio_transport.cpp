#include "statmcp/transport/stdio_transport.hpp"
#include "statmcp/log/logger.hpp"

#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/use_awaitable.hpp>

#include <istream>
#include <ostream>
#include <utility>

namespace statmcp {
namespace {

TransportResult<Json> protocol_error(std::string message) {
    return tl::unexpected(TransportError{
        TransportError::Category::Protocol,
        std::move(message)});
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t") == std::string::npos;
}

TransportResult<Json> read_line_frame(std::istream& input, std::size_t max_line_length) {
    std::string line;
    while (true) {
        if (!std::getline(input, line)) {
            return tl::unexpected(end_of_stream_error());
        }
        if ((line.empty() == false) && (line.back() == '\r')) {
            line.pop_back();
        }
        if (is_blank(line) == false) {
            break;
        }
    }

    if (line.size() > max_line_length) {
        return protocol_error("frame of " + std::to_string(line.size()) +
                              " bytes exceeds max_line_length");
    }

    try {
        return Json::parse(line);
    } catch (const Json::parse_error& err) {
        return protocol_error(std::string("invalid JSON: ") + err.what());
    }
}

}  // namespace

StdioTransport::ReaderState::ReaderState(asio::any_io_executor ex,
                                         std::istream* in,
                                         std::size_t max_line,
                                         std::size_t capacity)
    : executor(ex),
      input(in),
      max_line_length(max_line),
      channel(ex, capacity) {}

StdioTransport::StdioTransport(asio::any_io_executor executor, StdioTransportConfig config)
    : config_(std::move(config)),
      executor_(std::move(executor)),
      write_strand_(asio::make_strand(executor_)),
      reader_(std::make_shared<ReaderState>(
          executor_, config_.input, config_.max_line_length, config_.channel_capacity)) {}

StdioTransport::~StdioTransport() {
    shutdown();
}

const StdioTransportConfig& StdioTransport::config() const noexcept {
    return config_;
}

std::size_t StdioTransport::dropped_frames() const noexcept {
    return reader_->dropped.load();
}

asio::any_io_executor StdioTransport::get_executor() {
    return executor_;
}

bool StdioTransport::is_running() const {
    return reader_->running.load();
}

// ─────────────────────────────────────────────────────────────────────────────
// Synchronous I/O
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> StdioTransport::send(const Json& message) {
    if (config_.output == nullptr) {
        return tl::unexpected(TransportError{
            TransportError::Category::Protocol,
            "output stream is not set"});
    }

    // Invalid UTF-8 from a script must not take the session down
    const std::string body = message.dump(-1, ' ', false, Json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(write_mutex_);
    *config_.output << body << '\n';
    if (config_.auto_flush == true) {
        config_.output->flush();
    }

    if (config_.output->fail()) {
        return tl::unexpected(TransportError{
            TransportError::Category::Network,
            "failed to write to output stream"});
    }
    return TransportResult<void>{};
}

TransportResult<Json> StdioTransport::read_frame() {
    if (config_.input == nullptr) {
        return protocol_error("input stream is not set");
    }
    return read_line_frame(*config_.input, config_.max_line_length);
}

// ─────────────────────────────────────────────────────────────────────────────
// ITransport
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<TransportResult<void>> StdioTransport::async_start() {
    const bool input_is_null = (config_.input == nullptr);
    const bool output_is_null = (config_.output == nullptr);
    if ((input_is_null == true) || (output_is_null == true)) {
        co_return tl::unexpected(TransportError{
            TransportError::Category::Protocol,
            "StdioTransport requires non-null input and output streams"});
    }
    if (reader_->running.exchange(true)) {
        co_return tl::unexpected(TransportError{
            TransportError::Category::Protocol,
            "transport already running"});
    }

    reader_thread_ = std::thread(&StdioTransport::reader_loop, reader_);
    STATMCP_LOG_DEBUG("StdioTransport started");
    co_return TransportResult<void>{};
}

asio::awaitable<void> StdioTransport::async_stop() {
    shutdown();
    co_return;
}

asio::awaitable<TransportResult<void>> StdioTransport::async_send(Json message) {
    co_await asio::post(write_strand_, asio::use_awaitable);
    co_return send(message);
}

asio::awaitable<TransportResult<Json>> StdioTransport::async_receive() {
    if (reader_->channel.is_open() == false) {
        co_return tl::unexpected(end_of_stream_error());
    }
    try {
        auto result = co_await reader_->channel.async_receive(asio::use_awaitable);
        co_return result;
    } catch (const std::system_error& e) {
        co_return tl::unexpected(TransportError{
            TransportError::Category::Network,
            "receive failed: " + std::string(e.what())});
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Reader thread
// ─────────────────────────────────────────────────────────────────────────────

void StdioTransport::reader_loop(std::shared_ptr<ReaderState> state) {
    auto deliver = [&state](TransportResult<Json> frame) {
        asio::post(state->executor, [state, frame = std::move(frame)]() mutable {
            // Sends queue in post order, which keeps frames in stream order
            state->channel.async_send(asio::error_code{}, std::move(frame), asio::detached);
        });
    };

    while (state->running.load()) {
        auto frame = read_line_frame(*state->input, state->max_line_length);
        if (state->running.load() == false) {
            break;
        }

        if (frame.has_value() == false) {
            const bool stream_ended =
                (frame.error().category == TransportError::Category::Network);
            if (stream_ended) {
                deliver(std::move(frame));
                break;
            }
            state->dropped.fetch_add(1);
            STATMCP_LOG_WARN("Dropping malformed frame: " + frame.error().message);
            continue;
        }

        deliver(std::move(frame));
    }
    state->finished = true;
}

void StdioTransport::shutdown() {
    const bool was_running = reader_->running.exchange(false);
    if (was_running) {
        reader_->channel.close();
        STATMCP_LOG_DEBUG("StdioTransport stopped");
    }

    if (reader_thread_.joinable()) {
        if (reader_->finished.load()) {
            reader_thread_.join();
        } else {
            // Blocked in getline() on a stream nobody will close; the thread
            // owns only shared state and exits at the next line or EOF.
            reader_thread_.detach();
        }
    }
}

}  // namespace statmcp
