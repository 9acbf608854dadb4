// ─────────────────────────────────────────────────────────────────────────────
// statmcp-server - Statistical analysis MCP server
// ─────────────────────────────────────────────────────────────────────────────
// Serves R-backed statistical tools to MCP clients.
//
// Usage:
//   # stdio (launched by the client)
//   statmcp-server serve --allowed-path ~/data
//
//   # HTTP with an Mcp-Session-Id header
//   statmcp-server serve-http --host 127.0.0.1 --port 8080
//
//   # Print the tool, resource and prompt catalogs
//   statmcp-server list-capabilities
//
// Configuration precedence: defaults < --config file < STATMCP_* environment
// < command-line flags. Logs go to stderr (and --log-file); stdout belongs to
// the stdio transport.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "statmcp/config/server_config.hpp"
#include "statmcp/log/spdlog_logger.hpp"
#include "statmcp/server/server.hpp"
#include "statmcp/tools/statistical_tools.hpp"
#include "statmcp/transport/http_server_transport.hpp"
#include "statmcp/transport/stdio_transport.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <csignal>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

using namespace statmcp;
using Json = nlohmann::json;

namespace {

void print_error(const std::string& message) {
    std::cerr << "statmcp-server: " << message << "\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════

ConfigResult<ServerConfig> apply_flags(ServerConfig config, const cxxopts::ParseResult& args) {
    if (args.count("allowed-path")) {
        config.allowed_paths.clear();
        for (const auto& path : args["allowed-path"].as<std::vector<std::string>>()) {
            config.allowed_paths.emplace_back(path);
        }
    }
    if (args.count("cache-root")) {
        config.cache_root = args["cache-root"].as<std::string>();
    }
    if (args.count("read-write")) {
        config.read_only = false;
    }
    if (args.count("log-level")) {
        const std::string name = args["log-level"].as<std::string>();
        auto level = parse_log_level(name);
        if (level.has_value() == false) {
            return tl::unexpected(ConfigError{"command line", "unknown log level '" + name + "'"});
        }
        config.log_level = *level;
    }
    if (args.count("r-command")) {
        config.runtime.command = args["r-command"].as<std::string>();
    }
    if (args.count("script-root")) {
        config.runtime.script_root = args["script-root"].as<std::string>();
    }
    if (args.count("timeout")) {
        const int seconds = args["timeout"].as<int>();
        if (seconds <= 0) {
            return tl::unexpected(ConfigError{"command line", "--timeout must be positive"});
        }
        config.runtime.default_timeout = std::chrono::seconds(seconds);
    }
    if (args.count("host")) {
        config.http.host = args["host"].as<std::string>();
    }
    if (args.count("port")) {
        const int port = args["port"].as<int>();
        if ((port < 0) || (port > std::numeric_limits<std::uint16_t>::max())) {
            return tl::unexpected(ConfigError{"command line", "--port must be between 0 and 65535"});
        }
        config.http.port = static_cast<std::uint16_t>(port);
    }
    return config;
}

ConfigResult<ServerConfig> load_config(const cxxopts::ParseResult& args) {
    ConfigResult<ServerConfig> config = ServerConfig{};
    if (args.count("config")) {
        config = load_config_file(std::move(*config), args["config"].as<std::string>());
        if (!config) {
            return config;
        }
    }
    config = apply_environment(std::move(*config));
    if (!config) {
        return config;
    }
    return apply_flags(std::move(*config), args);
}

void install_logger(const ServerConfig& config, const cxxopts::ParseResult& args) {
    if (args.count("log-file")) {
        set_logger(make_spdlog_stderr_file_logger(args["log-file"].as<std::string>(), config.log_level));
    } else {
        set_logger(make_spdlog_stderr_logger(config.log_level));
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Serving
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> run_stdio(Server& server, StdioTransport& transport, asio::signal_set& signals) {
    co_await server.serve(transport);
    signals.cancel();
}

asio::awaitable<void> run_http(HttpServerTransport& http, asio::signal_set& signals, int& status) {
    auto served = co_await http.run();
    if (!served) {
        STATMCP_LOG_ERROR(served.error().message);
        status = 1;
    }
    signals.cancel();
}

int serve_stdio(asio::io_context& io, Server& server) {
    StdioTransportConfig stdio;
    stdio.input = &std::cin;
    stdio.output = &std::cout;
    StdioTransport transport(io.get_executor(), stdio);

    asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&server](const asio::error_code& ec, int signal_number) {
        if (ec) {
            return;  // session ended first
        }
        STATMCP_LOG_INFO("Received signal " + std::to_string(signal_number) + "; draining");
        server.request_stop();
    });

    asio::co_spawn(io, run_stdio(server, transport, signals), asio::detached);
    io.run();
    return 0;
}

int serve_http(asio::io_context& io, Server& server) {
    HttpServerTransport http(io.get_executor(), server.config().http, [&server](ITransport& transport) {
        return server.serve(transport);
    });

    asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&server, &http](const asio::error_code& ec, int signal_number) {
        if (ec) {
            return;  // listener ended first
        }
        STATMCP_LOG_INFO("Received signal " + std::to_string(signal_number) + "; draining every session");
        server.request_stop();
        http.stop();
    });

    int status = 0;
    asio::co_spawn(io, run_http(http, signals, status), asio::detached);
    io.run();
    return status;
}

}  // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("statmcp-server", "Statistical analysis MCP server");
    options.positional_help("<serve|serve-http|list-capabilities>");

    options.add_options()
        ("command", "serve, serve-http or list-capabilities",
            cxxopts::value<std::string>()->default_value("serve"))

        // Configuration
        ("config", "JSON configuration file", cxxopts::value<std::string>())
        ("allowed-path", "Directory tools may read (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("cache-root", "Directory for cached results", cxxopts::value<std::string>())
        ("read-write", "Allow writing to the cache root")

        // Logging
        ("log-level", "trace, debug, info, warn, error or off", cxxopts::value<std::string>())
        ("log-file", "Also append logs to this file", cxxopts::value<std::string>())

        // Statistical runtime
        ("r-command", "R interpreter to run (default Rscript)", cxxopts::value<std::string>())
        ("script-root", "Directory holding the tool scripts", cxxopts::value<std::string>())
        ("timeout", "Per-call timeout in seconds", cxxopts::value<int>())

        // HTTP transport
        ("host", "Address to listen on (serve-http)", cxxopts::value<std::string>())
        ("port", "Port to listen on (serve-http)", cxxopts::value<int>())

        ("h,help", "Print usage");

    options.parse_positional({"command"});

    try {
        auto args = options.parse(argc, argv);

        if (args.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        const std::string command = args["command"].as<std::string>();
        if ((command != "serve") && (command != "serve-http") && (command != "list-capabilities")) {
            print_error("unknown command '" + command + "'");
            std::cerr << options.help() << "\n";
            return 1;
        }

        auto config = load_config(args);
        if (!config) {
            print_error(config.error().source + ": " + config.error().message);
            return 1;
        }

        install_logger(*config, args);
        std::signal(SIGPIPE, SIG_IGN);

        asio::io_context io;
        auto server = Server::create(io.get_executor(), *config);
        if (!server) {
            print_error(server.error().message);
            return 1;
        }

        auto registered = register_builtins(**server);
        if (!registered) {
            print_error(registered.error().message);
            return 1;
        }

        if (command == "list-capabilities") {
            std::cout << (*server)->describe_capabilities().dump(2) << "\n";
            return 0;
        }

        if (command == "serve-http") {
            return serve_http(io, **server);
        }
        return serve_stdio(io, **server);

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
