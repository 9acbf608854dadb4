#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Execution Bridge
// ═══════════════════════════════════════════════════════════════════════════
// Runs one engine script per call:
//
//   <command> <args...> <script_root>/<script>.R   < arguments as JSON
//
// in a fresh process group with a per-call timeout, capturing stdout and
// stderr separately, and classifies the result. Every spawned process is
// reaped before execute() completes, whatever the path out.
//
// The executor must be single-threaded (or a strand): run state is shared
// between the call and its pipe coroutines without locking.

#include "statmcp/config/server_config.hpp"
#include "statmcp/context/cancellation.hpp"
#include "statmcp/execution/execution_outcome.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace statmcp {

struct Invocation {
    std::string script;  // file name under script_root, without ".R"
    Json arguments = Json::object();
    std::optional<std::chrono::milliseconds> timeout;
};

struct ExecutionStats {
    std::uint64_t spawned{0};
    std::uint64_t reaped{0};
    std::uint64_t timed_out{0};
    std::uint64_t cancelled{0};

    [[nodiscard]] std::uint64_t running() const noexcept { return spawned - reaped; }
};

class ExecutionBridge {
public:
    ExecutionBridge(asio::any_io_executor executor, RuntimeConfig config);

    ExecutionBridge(const ExecutionBridge&) = delete;
    ExecutionBridge& operator=(const ExecutionBridge&) = delete;

    /// Exported to the engine as STATMCP_SCRATCH_DIR
    void set_scratch_dir(std::filesystem::path dir);

    [[nodiscard]] asio::awaitable<ExecutionOutcome> execute(Invocation invocation,
                                                            std::shared_ptr<CancellationToken> token);

    [[nodiscard]] ExecutionStats stats() const noexcept;

    [[nodiscard]] const RuntimeConfig& config() const noexcept { return config_; }

    [[nodiscard]] std::filesystem::path script_path(const std::string& script) const;

private:
    struct Counters {
        std::atomic<std::uint64_t> spawned{0};
        std::atomic<std::uint64_t> reaped{0};
        std::atomic<std::uint64_t> timed_out{0};
        std::atomic<std::uint64_t> cancelled{0};
    };

    asio::any_io_executor executor_;
    RuntimeConfig config_;
    std::filesystem::path scratch_dir_;
    std::shared_ptr<Counters> counters_;
};

}  // namespace statmcp
