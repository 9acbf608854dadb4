#include "statmcp/context/lifespan.hpp"
#include "statmcp/log/logger.hpp"

#include <unistd.h>

#include <algorithm>
#include <random>
#include <system_error>

namespace statmcp {
namespace {

namespace fs = std::filesystem;

// True if every component of `root` is a prefix of `candidate`
bool is_under(const fs::path& candidate, const fs::path& root) {
    auto c = candidate.begin();
    for (auto r = root.begin(); r != root.end(); ++r, ++c) {
        if (r->empty()) {
            continue;  // trailing separator
        }
        if ((c == candidate.end()) || (*c != *r)) {
            return false;
        }
    }
    return true;
}

std::string scratch_name() {
    std::random_device device;
    std::mt19937 engine(device());
    return "statmcp-" + std::to_string(::getpid()) + "-" + std::to_string(engine() % 1000000u);
}

}  // namespace

Lifespan::Lifespan(ServerConfig config)
    : config_(std::move(config)) {}

Lifespan::~Lifespan() {
    teardown();
}

tl::expected<std::unique_ptr<Lifespan>, ServerError> Lifespan::create(ServerConfig config) {
    std::unique_ptr<Lifespan> lifespan(new Lifespan(std::move(config)));
    std::error_code ec;

    // 1. Allowed roots
    for (const auto& root : lifespan->config_.allowed_paths) {
        auto canonical = fs::canonical(root, ec);
        if (ec) {
            return tl::unexpected(ServerError::invalid_params(
                "allowed path '" + root.string() + "' is not accessible: " + ec.message()));
        }
        lifespan->allowed_roots_.push_back(std::move(canonical));
    }
    lifespan->add_cleanup("allowed-roots", [raw = lifespan.get()] {
        raw->allowed_roots_.clear();
    });

    // 2. Cache root
    if (lifespan->config_.cache_root.has_value()) {
        const fs::path& cache = *lifespan->config_.cache_root;
        if ((fs::exists(cache, ec) == false) && (lifespan->config_.read_only == false)) {
            fs::create_directories(cache, ec);
            if (ec) {
                return tl::unexpected(ServerError::internal(
                    "cannot create cache root '" + cache.string() + "': " + ec.message()));
            }
            STATMCP_LOG_INFO("Created cache root " + cache.string());
        }
        lifespan->cache_dir_ = cache;
        lifespan->add_cleanup("cache-root", [raw = lifespan.get()] {
            raw->cache_dir_.reset();
        });
    }

    // 3. Scratch directory
    fs::path scratch = fs::temp_directory_path(ec);
    if (ec) {
        return tl::unexpected(ServerError::internal("no temp directory: " + ec.message()));
    }
    scratch /= scratch_name();
    fs::create_directories(scratch, ec);
    if (ec) {
        return tl::unexpected(ServerError::internal(
            "cannot create scratch directory '" + scratch.string() + "': " + ec.message()));
    }
    lifespan->scratch_dir_ = scratch;
    lifespan->add_cleanup("scratch-dir", [scratch] {
        std::error_code remove_ec;
        fs::remove_all(scratch, remove_ec);
        if (remove_ec) {
            STATMCP_LOG_WARN("Failed to remove scratch directory " + scratch.string() + ": " +
                             remove_ec.message());
        }
    });

    STATMCP_LOG_DEBUG("Lifespan ready: " + std::to_string(lifespan->allowed_roots_.size()) +
                      " allowed roots, scratch " + scratch.string());
    return lifespan;
}

bool Lifespan::is_path_allowed(const std::filesystem::path& path) const {
    if (allowed_roots_.empty() || path.empty()) {
        return false;
    }

    std::error_code ec;
    const fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        return false;
    }
    const fs::path resolved = fs::weakly_canonical(absolute, ec);
    if (ec) {
        return false;
    }

    return std::any_of(allowed_roots_.begin(), allowed_roots_.end(), [&](const fs::path& root) {
        return is_under(resolved, root);
    });
}

void Lifespan::add_cleanup(std::string name, Cleanup fn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (torn_down_ == false) {
            cleanups_.push_back(Step{std::move(name), std::move(fn)});
            return;
        }
    }
    STATMCP_LOG_WARN("Cleanup '" + name + "' registered after teardown; running now");
    fn();
}

void Lifespan::teardown() {
    std::vector<Step> steps;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (torn_down_) {
            return;
        }
        torn_down_ = true;
        steps.swap(cleanups_);
    }

    for (auto it = steps.rbegin(); it != steps.rend(); ++it) {
        try {
            it->fn();
        } catch (const std::exception& e) {
            STATMCP_LOG_ERROR("Cleanup '" + it->name + "' failed: " + e.what());
        }
    }
    STATMCP_LOG_DEBUG("Lifespan torn down (" + std::to_string(steps.size()) + " steps)");
}

bool Lifespan::torn_down() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return torn_down_;
}

}  // namespace statmcp
