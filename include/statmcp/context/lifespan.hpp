#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Lifespan
// ═══════════════════════════════════════════════════════════════════════════
// Process-wide resources acquired once at server start and released exactly
// once, in reverse order of acquisition. Immutable after create() except for
// the cleanup list.

#include "statmcp/config/server_config.hpp"
#include "statmcp/protocol/errors.hpp"

#include <tl/expected.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace statmcp {

class Lifespan {
public:
    using Cleanup = std::function<void()>;

    /// Acquire, in order: canonical allowed roots, the cache root, a scratch
    /// directory. On failure everything already acquired is released.
    [[nodiscard]] static tl::expected<std::unique_ptr<Lifespan>, ServerError> create(ServerConfig config);

    ~Lifespan();

    Lifespan(const Lifespan&) = delete;
    Lifespan& operator=(const Lifespan&) = delete;

    [[nodiscard]] const ServerConfig& config() const noexcept { return config_; }

    [[nodiscard]] const std::vector<std::filesystem::path>& allowed_roots() const noexcept {
        return allowed_roots_;
    }

    [[nodiscard]] const std::optional<std::filesystem::path>& cache_dir() const noexcept {
        return cache_dir_;
    }

    [[nodiscard]] const std::filesystem::path& scratch_dir() const noexcept { return scratch_dir_; }

    [[nodiscard]] bool read_only() const noexcept { return config_.read_only; }

    /// True if `path` (resolved against the cwd, weakly canonical) lies under
    /// an allowed root. No roots means nothing is allowed.
    [[nodiscard]] bool is_path_allowed(const std::filesystem::path& path) const;

    /// Extra release step, run before the built-in ones (reverse order).
    void add_cleanup(std::string name, Cleanup fn);

    /// Release everything. Only the first call does work.
    void teardown();

    [[nodiscard]] bool torn_down() const noexcept;

private:
    explicit Lifespan(ServerConfig config);

    struct Step {
        std::string name;
        Cleanup fn;
    };

    ServerConfig config_;
    std::vector<std::filesystem::path> allowed_roots_;
    std::optional<std::filesystem::path> cache_dir_;
    std::filesystem::path scratch_dir_;

    mutable std::mutex mutex_;
    std::vector<Step> cleanups_;
    bool torn_down_{false};
};

}  // namespace statmcp
