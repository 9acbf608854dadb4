#include "statmcp/config/server_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace statmcp {
namespace {

ConfigError json_error(std::string message) {
    return ConfigError{"json", std::move(message)};
}

ConfigError env_error(std::string message) {
    return ConfigError{"environment", std::move(message)};
}

std::optional<bool> parse_bool(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if ((value == "1") || (value == "true") || (value == "yes") || (value == "on")) {
        return true;
    }
    if ((value == "0") || (value == "false") || (value == "no") || (value == "off")) {
        return false;
    }
    return std::nullopt;
}

std::vector<std::filesystem::path> split_paths(const std::string& joined) {
    std::vector<std::filesystem::path> paths;
    std::size_t start = 0;
    while (start <= joined.size()) {
        auto end = joined.find(':', start);
        if (end == std::string::npos) {
            end = joined.size();
        }
        if (end > start) {
            paths.emplace_back(joined.substr(start, end - start));
        }
        start = end + 1;
    }
    return paths;
}

template <typename T>
ConfigResult<T> typed(const Json& document, const char* key) {
    try {
        return document.at(key).get<T>();
    } catch (const Json::exception&) {
        return tl::unexpected(json_error(std::string("'") + key + "' has the wrong type"));
    }
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// JSON document
// ─────────────────────────────────────────────────────────────────────────────

ConfigResult<ServerConfig> apply_config_json(ServerConfig base, const Json& document) {
    if (document.is_object() == false) {
        return tl::unexpected(json_error("configuration must be a JSON object"));
    }

    if (document.contains("allowedPaths")) {
        auto paths = typed<std::vector<std::string>>(document, "allowedPaths");
        if (!paths) return tl::unexpected(paths.error());
        base.allowed_paths.assign(paths->begin(), paths->end());
    }

    if (document.contains("cacheRoot")) {
        if (document.at("cacheRoot").is_null()) {
            base.cache_root.reset();
        } else {
            auto root = typed<std::string>(document, "cacheRoot");
            if (!root) return tl::unexpected(root.error());
            base.cache_root = *root;
        }
    }

    if (document.contains("readOnly")) {
        auto read_only = typed<bool>(document, "readOnly");
        if (!read_only) return tl::unexpected(read_only.error());
        base.read_only = *read_only;
    }

    if (document.contains("logLevel")) {
        auto name = typed<std::string>(document, "logLevel");
        if (!name) return tl::unexpected(name.error());
        auto level = parse_log_level(*name);
        if (level.has_value() == false) {
            return tl::unexpected(json_error("unknown logLevel '" + *name + "'"));
        }
        base.log_level = *level;
    }

    if (document.contains("rCommand")) {
        auto command = typed<std::string>(document, "rCommand");
        if (!command) return tl::unexpected(command.error());
        base.runtime.command = *command;
    }

    if (document.contains("rArgs")) {
        auto args = typed<std::vector<std::string>>(document, "rArgs");
        if (!args) return tl::unexpected(args.error());
        base.runtime.args = *args;
    }

    if (document.contains("scriptRoot")) {
        auto root = typed<std::string>(document, "scriptRoot");
        if (!root) return tl::unexpected(root.error());
        base.runtime.script_root = *root;
    }

    if (document.contains("timeoutSeconds")) {
        auto seconds = typed<double>(document, "timeoutSeconds");
        if (!seconds) return tl::unexpected(seconds.error());
        if (*seconds <= 0.0) {
            return tl::unexpected(json_error("timeoutSeconds must be positive"));
        }
        base.runtime.default_timeout =
            std::chrono::milliseconds(static_cast<std::int64_t>(*seconds * 1000.0));
    }

    if (document.contains("drainGraceSeconds")) {
        auto seconds = typed<double>(document, "drainGraceSeconds");
        if (!seconds) return tl::unexpected(seconds.error());
        if (*seconds < 0.0) {
            return tl::unexpected(json_error("drainGraceSeconds must not be negative"));
        }
        base.drain_grace = std::chrono::milliseconds(static_cast<std::int64_t>(*seconds * 1000.0));
    }

    if (document.contains("pageSize")) {
        auto page_size = typed<std::size_t>(document, "pageSize");
        if (!page_size) return tl::unexpected(page_size.error());
        base.page_size = *page_size;
    }

    if (document.contains("http")) {
        const Json& http = document.at("http");
        if (http.is_object() == false) {
            return tl::unexpected(json_error("'http' must be an object"));
        }
        if (http.contains("host")) {
            auto host = typed<std::string>(http, "host");
            if (!host) return tl::unexpected(host.error());
            base.http.host = *host;
        }
        if (http.contains("port")) {
            auto port = typed<std::uint16_t>(http, "port");
            if (!port) return tl::unexpected(port.error());
            base.http.port = *port;
        }
        if (http.contains("endpoint")) {
            auto endpoint = typed<std::string>(http, "endpoint");
            if (!endpoint) return tl::unexpected(endpoint.error());
            base.http.endpoint = *endpoint;
        }
    }

    return base;
}

ConfigResult<ServerConfig> load_config_file(ServerConfig base, const std::filesystem::path& path) {
    std::ifstream in(path);
    if (in.is_open() == false) {
        return tl::unexpected(ConfigError{path.string(), "cannot open configuration file"});
    }

    Json document;
    try {
        document = Json::parse(in);
    } catch (const Json::parse_error& err) {
        return tl::unexpected(ConfigError{path.string(), std::string("invalid JSON: ") + err.what()});
    }

    auto applied = apply_config_json(std::move(base), document);
    if (applied.has_value() == false) {
        return tl::unexpected(ConfigError{path.string(), applied.error().message});
    }
    return applied;
}

// ─────────────────────────────────────────────────────────────────────────────
// Environment
// ─────────────────────────────────────────────────────────────────────────────

std::optional<std::string> process_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

ConfigResult<ServerConfig> apply_environment(ServerConfig base, const EnvLookup& lookup) {
    if (auto paths = lookup("STATMCP_ALLOWED_PATHS")) {
        base.allowed_paths = split_paths(*paths);
    }
    if (auto root = lookup("STATMCP_CACHE_ROOT")) {
        base.cache_root = *root;
    }
    if (auto read_only = lookup("STATMCP_READ_ONLY")) {
        auto parsed = parse_bool(*read_only);
        if (parsed.has_value() == false) {
            return tl::unexpected(env_error("STATMCP_READ_ONLY must be a boolean, got '" + *read_only + "'"));
        }
        base.read_only = *parsed;
    }
    if (auto level_name = lookup("STATMCP_LOG_LEVEL")) {
        auto level = parse_log_level(*level_name);
        if (level.has_value() == false) {
            return tl::unexpected(env_error("unknown STATMCP_LOG_LEVEL '" + *level_name + "'"));
        }
        base.log_level = *level;
    }
    if (auto command = lookup("STATMCP_R_COMMAND")) {
        base.runtime.command = *command;
    }
    if (auto root = lookup("STATMCP_SCRIPT_ROOT")) {
        base.runtime.script_root = *root;
    }
    return base;
}

Json to_json(const ServerConfig& config) {
    Json paths = Json::array();
    for (const auto& p : config.allowed_paths) {
        paths.push_back(p.string());
    }

    std::string level(to_string(config.log_level));
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return {
        {"allowedPaths", std::move(paths)},
        {"cacheRoot", config.cache_root ? Json(config.cache_root->string()) : Json(nullptr)},
        {"readOnly", config.read_only},
        {"logLevel", level}
    };
}

}  // namespace statmcp
