#pragma once

#include "statmcp/log/logger.hpp"

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace statmcp {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Runtime (external statistical engine) settings
// ─────────────────────────────────────────────────────────────────────────────

struct RuntimeConfig {
    std::string command{"Rscript"};
    std::vector<std::string> args{"--vanilla"};

    /// Directory holding <tool>.R scripts
    std::filesystem::path script_root{"r_scripts"};

    std::chrono::milliseconds default_timeout{std::chrono::seconds(30)};

    /// Per-stream capture cap; output beyond it is discarded
    std::size_t max_output_bytes{4u << 20};

    /// How much stderr is quoted back to the client on failure
    std::size_t stderr_excerpt_bytes{2048};

    /// Wait for exit after the pipes close before escalating to SIGKILL
    std::chrono::milliseconds reap_grace{std::chrono::seconds(2)};
};

// ─────────────────────────────────────────────────────────────────────────────
// HTTP listener settings (serve-http)
// ─────────────────────────────────────────────────────────────────────────────

struct HttpServerConfig {
    std::string host{"127.0.0.1"};
    std::uint16_t port{8080};  // 0 picks an ephemeral port
    std::string endpoint{"/mcp"};
    std::size_t max_body_size{16u << 20};
    std::size_t channel_capacity{64};  // inbound frames queued per session
};

// ─────────────────────────────────────────────────────────────────────────────
// Server configuration
// ─────────────────────────────────────────────────────────────────────────────

struct ServerConfig {
    std::string server_name{"statmcp"};
    std::string server_version{"0.3.0"};

    std::vector<std::filesystem::path> allowed_paths;
    std::optional<std::filesystem::path> cache_root;
    bool read_only{true};
    LogLevel log_level{LogLevel::Info};

    RuntimeConfig runtime;

    /// In-flight calls get this long to finish on shutdown before being cancelled
    std::chrono::milliseconds drain_grace{std::chrono::seconds(5)};

    /// list results per page; 0 returns everything at once
    std::size_t page_size{0};

    HttpServerConfig http;
};

struct ConfigError {
    std::string source;   // file path, "environment" or "json"
    std::string message;
};

template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

/// Overlay the keys present in `document` onto `base`.
/// Recognized keys: allowedPaths, cacheRoot, readOnly, logLevel, rCommand,
/// rArgs, scriptRoot, timeoutSeconds, drainGraceSeconds, pageSize,
/// http.host, http.port, http.endpoint.
[[nodiscard]] ConfigResult<ServerConfig> apply_config_json(ServerConfig base, const Json& document);

/// Read a JSON config file and overlay it onto `base`.
[[nodiscard]] ConfigResult<ServerConfig> load_config_file(ServerConfig base,
                                                          const std::filesystem::path& path);

/// Environment lookup, injectable for tests
using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

[[nodiscard]] std::optional<std::string> process_env(const char* name);

/// Overlay STATMCP_* environment variables onto `base`.
[[nodiscard]] ConfigResult<ServerConfig> apply_environment(ServerConfig base,
                                                           const EnvLookup& lookup = process_env);

/// The configuration bundle in its wire shape (used by the env resource)
[[nodiscard]] Json to_json(const ServerConfig& config);

}  // namespace statmcp
