#include "statmcp/execution/execution_bridge.hpp"
#include "statmcp/execution/async_process.hpp"
#include "statmcp/log/logger.hpp"

#include <asio/buffer.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <signal.h>

#include <algorithm>
#include <array>
#include <mutex>

namespace statmcp {
namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds(10);
constexpr int kPipeTasks = 3;  // stdin writer, stdout reader, stderr reader

// State shared by one call and its pipe coroutines
struct RunState {
    explicit RunState(asio::any_io_executor ex)
        : wake(ex) {}

    asio::steady_timer wake;
    std::string input;
    std::string out;
    std::string err;
    bool out_truncated{false};
    bool err_truncated{false};
    int pipes_open{kPipeTasks};
    bool cancelled{false};

    void pipe_finished() {
        if (--pipes_open == 0) {
            wake.cancel();
        }
    }

    [[nodiscard]] bool settled() const noexcept {
        return cancelled || (pipes_open == 0);
    }
};

// `child` is held only to keep the descriptor alive until the read completes
asio::awaitable<void> drain_pipe(std::shared_ptr<ChildProcess> child,
                                 std::shared_ptr<RunState> state,
                                 asio::posix::stream_descriptor& pipe,
                                 std::string& sink,
                                 bool& truncated,
                                 std::size_t cap) {
    std::array<char, 8192> chunk{};
    for (;;) {
        asio::error_code ec;
        const std::size_t n = co_await pipe.async_read_some(
            asio::buffer(chunk), asio::redirect_error(asio::use_awaitable, ec));
        if (n > 0) {
            const std::size_t room = (sink.size() < cap) ? (cap - sink.size()) : 0;
            sink.append(chunk.data(), std::min(n, room));
            if (n > room) {
                truncated = true;
            }
        }
        if (ec) {
            break;  // eof, or the pipe was closed on kill
        }
    }
    state->pipe_finished();
}

asio::awaitable<void> feed_stdin(std::shared_ptr<ChildProcess> child, std::shared_ptr<RunState> state) {
    asio::error_code ec;
    co_await asio::async_write(child->stdin_pipe(), asio::buffer(state->input),
                               asio::redirect_error(asio::use_awaitable, ec));
    if (ec && (ec != asio::error::operation_aborted)) {
        // EPIPE: the engine exited without reading its arguments
        STATMCP_LOG_DEBUG("Writing arguments to pid " + std::to_string(child->pid()) +
                          " failed: " + ec.message());
    }
    child->close_stdin();
    state->pipe_finished();
}

void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        // A child that exits before reading stdin must not take the server down
        ::signal(SIGPIPE, SIG_IGN);
    });
}

}  // namespace

ExecutionBridge::ExecutionBridge(asio::any_io_executor executor, RuntimeConfig config)
    : executor_(std::move(executor)),
      config_(std::move(config)),
      counters_(std::make_shared<Counters>()) {
    ignore_sigpipe_once();
}

void ExecutionBridge::set_scratch_dir(std::filesystem::path dir) {
    scratch_dir_ = std::move(dir);
}

ExecutionStats ExecutionBridge::stats() const noexcept {
    ExecutionStats s;
    s.spawned = counters_->spawned.load();
    s.reaped = counters_->reaped.load();
    s.timed_out = counters_->timed_out.load();
    s.cancelled = counters_->cancelled.load();
    return s;
}

std::filesystem::path ExecutionBridge::script_path(const std::string& script) const {
    return config_.script_root / (script + ".R");
}

asio::awaitable<ExecutionOutcome> ExecutionBridge::execute(Invocation invocation,
                                                           std::shared_ptr<CancellationToken> token) {
    if (token == nullptr) {
        token = std::make_shared<CancellationToken>();
    }
    if (token->is_cancelled()) {
        co_return outcome::Cancelled{};
    }

    const auto limit = invocation.timeout.value_or(config_.default_timeout);
    const auto script = script_path(invocation.script);

    std::error_code fs_ec;
    if (std::filesystem::is_regular_file(script, fs_ec) == false) {
        STATMCP_LOG_ERROR("Engine script missing: " + script.string());
        co_return outcome::ProcessFailure{-1, "script not found: " + script.string()};
    }

    ProcessSpec spec;
    spec.command = config_.command;
    spec.args = config_.args;
    spec.args.push_back(script.string());
    if (scratch_dir_.empty() == false) {
        spec.env.emplace_back("STATMCP_SCRATCH_DIR", scratch_dir_.string());
    }

    auto counters = counters_;
    auto spawned = ChildProcess::spawn(executor_, spec, [counters](const ExitStatus&) {
        counters->reaped.fetch_add(1);
    });
    if (!spawned) {
        STATMCP_LOG_ERROR("Spawning engine for " + invocation.script + " failed: " + spawned.error());
        co_return outcome::ProcessFailure{-1, spawned.error()};
    }
    std::shared_ptr<ChildProcess> child = std::move(*spawned);
    counters_->spawned.fetch_add(1);

    auto state = std::make_shared<RunState>(executor_);
    state->input = invocation.arguments.dump(-1, ' ', false, Json::error_handler_t::replace);
    state->input.push_back('\n');

    // Cancellation may arrive from any thread; hop onto our executor
    const auto registration = token->on_cancel([state, ex = executor_] {
        asio::post(ex, [state] {
            state->cancelled = true;
            state->wake.cancel();
        });
    });

    asio::co_spawn(executor_, drain_pipe(child, state, child->stdout_pipe(), state->out,
                                         state->out_truncated, config_.max_output_bytes), asio::detached);
    asio::co_spawn(executor_, drain_pipe(child, state, child->stderr_pipe(), state->err,
                                         state->err_truncated, config_.max_output_bytes), asio::detached);
    asio::co_spawn(executor_, feed_stdin(child, state), asio::detached);

    // ─────────────────────────────────────────────────────────────────────
    // Wait for the pipes to close, the deadline, or cancellation
    // ─────────────────────────────────────────────────────────────────────

    bool timed_out = false;
    state->wake.expires_after(limit);
    while (state->settled() == false) {
        asio::error_code ec;
        co_await state->wake.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (!ec && (state->settled() == false)) {
            timed_out = true;
            break;
        }
    }

    if (state->cancelled || timed_out) {
        child->kill_group(SIGKILL);
        child->close_pipes();
        child->reap_blocking();
    } else {
        // Pipes are closed; give the process reap_grace to exit on its own
        const auto deadline = std::chrono::steady_clock::now() + config_.reap_grace;
        asio::steady_timer poll(executor_);
        while ((child->try_reap().has_value() == false) && (state->cancelled == false)) {
            if (std::chrono::steady_clock::now() >= deadline) {
                STATMCP_LOG_WARN("pid " + std::to_string(child->pid()) +
                                 " closed its output but did not exit; killing");
                break;
            }
            poll.expires_after(kReapPollInterval);
            asio::error_code ignored;
            co_await poll.async_wait(asio::redirect_error(asio::use_awaitable, ignored));
        }
        if (child->reaped() == false) {
            child->kill_group(SIGKILL);
            child->reap_blocking();
        }
    }

    token->remove(registration);

    if (state->out_truncated || state->err_truncated) {
        STATMCP_LOG_WARN("Output of " + invocation.script + " exceeded " +
                         std::to_string(config_.max_output_bytes) + " bytes and was truncated");
    }

    ProcessReport report;
    report.cancelled = state->cancelled;
    report.timed_out = timed_out;
    report.exit_code = child->status()->exit_code;
    report.term_signal = child->status()->term_signal;
    report.stdout_text = std::move(state->out);
    report.stderr_text = std::move(state->err);
    report.limit = limit;

    if (report.cancelled) {
        counters_->cancelled.fetch_add(1);
    } else if (report.timed_out) {
        counters_->timed_out.fetch_add(1);
    }

    ExecutionOutcome result = classify(report, config_.stderr_excerpt_bytes);
    STATMCP_LOG_DEBUG("Engine " + invocation.script + " (pid " + std::to_string(child->pid()) +
                      ") finished: " + std::string(outcome_name(result)));
    co_return result;
}

}  // namespace statmcp
