#include "statmcp/execution/async_process.hpp"
#include "statmcp/log/logger.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

extern char** environ;

namespace statmcp {
namespace {

void close_pair(int fds[2]) {
    if (fds[0] != -1) ::close(fds[0]);
    if (fds[1] != -1) ::close(fds[1]);
}

// EINTR-safe waitpid
pid_t wait_for(pid_t pid, int* status, int options) {
    pid_t result;
    do {
        result = ::waitpid(pid, status, options);
    } while ((result == -1) && (errno == EINTR));
    return result;
}

}  // namespace

ChildProcess::ChildProcess(asio::any_io_executor executor, pid_t pid, int stdin_fd, int stdout_fd,
                           int stderr_fd, ReapHook on_reaped)
    : pid_(pid),
      stdin_(executor, stdin_fd),
      stdout_(executor, stdout_fd),
      stderr_(executor, stderr_fd),
      on_reaped_(std::move(on_reaped)) {}

ChildProcess::~ChildProcess() {
    close_pipes();
    if (reaped() == false) {
        STATMCP_LOG_WARN("Child " + std::to_string(pid_) + " still unreaped at release; killing");
        kill_group(SIGKILL);
        reap_blocking();
    }
}

tl::expected<std::shared_ptr<ChildProcess>, std::string> ChildProcess::spawn(
    asio::any_io_executor executor,
    const ProcessSpec& spec,
    ReapHook on_reaped) {
    // CRITICAL: Pre-allocate argv and envp BEFORE fork(). After fork() only
    // the calling thread exists in the child; if another thread held the
    // malloc mutex at that moment any allocation in the child deadlocks.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(spec.args.size() + 1);
    argv_storage.push_back(spec.command);
    for (const auto& arg : spec.args) {
        argv_storage.push_back(arg);
    }

    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& str : argv_storage) {
        argv.push_back(str.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    for (char** entry = environ; (entry != nullptr) && (*entry != nullptr); ++entry) {
        const std::string_view current(*entry);
        bool overridden = false;
        for (const auto& [name, value] : spec.env) {
            if (current.starts_with(name + "=")) {
                overridden = true;
                break;
            }
        }
        if (overridden == false) {
            env_storage.emplace_back(current);
        }
    }
    for (const auto& [name, value] : spec.env) {
        env_storage.push_back(name + "=" + value);
    }

    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto& str : env_storage) {
        envp.push_back(str.data());
    }
    envp.push_back(nullptr);

    // Message for a failed exec, written with write(2) from the child
    const std::string exec_failure = "statmcp: cannot execute '" + spec.command + "'\n";

    // O_CLOEXEC: concurrently spawned children must not inherit each
    // other's pipe ends, or a stdin would never see EOF
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if ((::pipe2(stdin_pipe, O_CLOEXEC) == -1) ||
        (::pipe2(stdout_pipe, O_CLOEXEC) == -1) ||
        (::pipe2(stderr_pipe, O_CLOEXEC) == -1)) {
        const std::string reason = std::strerror(errno);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return tl::unexpected("Failed to create pipes: " + reason);
    }

    const pid_t pid = ::fork();

    if (pid == -1) {
        const std::string reason = std::strerror(errno);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return tl::unexpected("Failed to fork: " + reason);
    }

    if (pid == 0) {
        // Child process - async-signal-safe calls only
        ::setpgid(0, 0);

        ::dup2(stdin_pipe[0], STDIN_FILENO);
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);

        // Undo the parent's SIGPIPE disposition for the engine
        ::signal(SIGPIPE, SIG_DFL);

        environ = envp.data();
        ::execvp(argv[0], argv.data());

        const ssize_t ignored = ::write(STDERR_FILENO, exec_failure.data(), exec_failure.size());
        (void)ignored;
        ::_exit(127);
    }

    // Parent process. Also set the group here so kill_group() works even if
    // the child has not run yet.
    ::setpgid(pid, pid);

    ::close(stdin_pipe[0]);
    ::close(stdout_pipe[1]);
    ::close(stderr_pipe[1]);

    STATMCP_LOG_DEBUG("Spawned " + spec.command + " as pid " + std::to_string(pid));

    return std::shared_ptr<ChildProcess>(new ChildProcess(
        std::move(executor), pid, stdin_pipe[1], stdout_pipe[0], stderr_pipe[0], std::move(on_reaped)));
}

void ChildProcess::close_stdin() {
    asio::error_code ignored;
    stdin_.close(ignored);
}

void ChildProcess::close_pipes() {
    asio::error_code ignored;
    stdin_.close(ignored);
    stdout_.close(ignored);
    stderr_.close(ignored);
}

void ChildProcess::kill_group(int signal_number) {
    if (reaped()) {
        return;
    }
    if (::kill(-pid_, signal_number) == -1) {
        ::kill(pid_, signal_number);
    }
}

std::optional<ExitStatus> ChildProcess::try_reap() {
    if (status_.has_value()) {
        return status_;
    }
    int raw = 0;
    const pid_t result = wait_for(pid_, &raw, WNOHANG);
    if (result == pid_) {
        record(raw);
        return status_;
    }
    if (result == -1) {
        // ECHILD: someone else reaped it; nothing more can be learned
        STATMCP_LOG_WARN("waitpid(" + std::to_string(pid_) + ") failed: " + std::strerror(errno));
        status_ = ExitStatus{};
        if (on_reaped_) {
            on_reaped_(*status_);
        }
        return status_;
    }
    return std::nullopt;
}

ExitStatus ChildProcess::reap_blocking() {
    if (status_.has_value()) {
        return *status_;
    }
    int raw = 0;
    if (wait_for(pid_, &raw, 0) == pid_) {
        record(raw);
    } else {
        STATMCP_LOG_WARN("waitpid(" + std::to_string(pid_) + ") failed: " + std::strerror(errno));
        status_ = ExitStatus{};
        if (on_reaped_) {
            on_reaped_(*status_);
        }
    }
    return *status_;
}

void ChildProcess::record(int raw_status) {
    ExitStatus status;
    if (WIFEXITED(raw_status)) {
        status.exit_code = WEXITSTATUS(raw_status);
    } else if (WIFSIGNALED(raw_status)) {
        status.term_signal = WTERMSIG(raw_status);
    }
    status_ = status;
    STATMCP_LOG_DEBUG("Reaped pid " + std::to_string(pid_));
    if (on_reaped_) {
        on_reaped_(status);
    }
}

}  // namespace statmcp
