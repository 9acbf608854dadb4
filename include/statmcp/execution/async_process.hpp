#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Child Process
// ═══════════════════════════════════════════════════════════════════════════
// One fork/exec'd engine process in its own process group, with stdin,
// stdout and stderr on separate pipes wrapped as asio descriptors.
//
// Reaping happens exactly once: through try_reap(), reap_blocking() or, as a
// last resort, the destructor (which SIGKILLs the group first). The reap
// hook fires on that one reap.

#include <asio/any_io_executor.hpp>
#include <asio/posix/stream_descriptor.hpp>

#include <sys/types.h>

#include <tl/expected.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace statmcp {

struct ProcessSpec {
    std::string command;               // looked up on PATH
    std::vector<std::string> args;     // not including argv[0]
    std::vector<std::pair<std::string, std::string>> env;  // added to the inherited environment
};

struct ExitStatus {
    std::optional<int> exit_code;    // WIFEXITED
    std::optional<int> term_signal;  // WIFSIGNALED
};

class ChildProcess {
public:
    using ReapHook = std::function<void(const ExitStatus&)>;

    [[nodiscard]] static tl::expected<std::shared_ptr<ChildProcess>, std::string> spawn(
        asio::any_io_executor executor,
        const ProcessSpec& spec,
        ReapHook on_reaped = {});

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    [[nodiscard]] asio::posix::stream_descriptor& stdin_pipe() noexcept { return stdin_; }
    [[nodiscard]] asio::posix::stream_descriptor& stdout_pipe() noexcept { return stdout_; }
    [[nodiscard]] asio::posix::stream_descriptor& stderr_pipe() noexcept { return stderr_; }

    void close_stdin();

    /// Close all pipes; pending reads and writes complete with operation_aborted
    void close_pipes();

    /// Signal the whole process group. No-op once reaped.
    void kill_group(int signal_number);

    /// waitpid(WNOHANG); the status once the child has exited
    [[nodiscard]] std::optional<ExitStatus> try_reap();

    /// waitpid without WNOHANG
    ExitStatus reap_blocking();

    [[nodiscard]] bool reaped() const noexcept { return status_.has_value(); }
    [[nodiscard]] const std::optional<ExitStatus>& status() const noexcept { return status_; }

private:
    ChildProcess(asio::any_io_executor executor, pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd,
                 ReapHook on_reaped);

    void record(int raw_status);

    pid_t pid_;
    asio::posix::stream_descriptor stdin_;
    asio::posix::stream_descriptor stdout_;
    asio::posix::stream_descriptor stderr_;
    ReapHook on_reaped_;
    std::optional<ExitStatus> status_;
};

}  // namespace statmcp
