#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlohmann/json.hpp>

#include "statmcp/execution/execution_bridge.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/use_future.hpp>

#include <filesystem>
#include <fstream>

using namespace statmcp;
using namespace std::chrono_literals;
using json = nlohmann::json;
namespace fs = std::filesystem;

// ─────────────────────────────────────────────────────────────────────────────
// Fake engines: shell scripts saved under the .R names the bridge expects
// ─────────────────────────────────────────────────────────────────────────────

namespace {

class FakeEngines {
public:
    FakeEngines()
        : root_(fs::temp_directory_path() / "statmcp_fake_engines") {
        fs::remove_all(root_);
        fs::create_directories(root_);

        write("echo_args",
              "read input\n"
              "echo 'Formatted output'\n"
              "echo \"{\\\"received\\\": $input, \\\"scratch\\\": \\\"$STATMCP_SCRATCH_DIR\\\"}\"\n");
        write("script_error",
              "echo 'Error in eval(expr): object not found' >&2\n"
              "echo 'Execution halted' >&2\n"
              "exit 1\n");
        write("slow", "sleep 10\necho '{}'\n");
        write("not_json", "echo 'no payload here'\n");
        write("error_payload", "echo '{\"error\": \"column missing\"}'\nexit 1\n");
        write("crash", "echo 'boom' >&2\nexit 7\n");
    }

    ~FakeEngines() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    [[nodiscard]] RuntimeConfig runtime() const {
        RuntimeConfig config;
        config.command = "/bin/sh";
        config.args = {};
        config.script_root = root_;
        config.default_timeout = 5s;
        config.reap_grace = 1s;
        return config;
    }

private:
    void write(const std::string& name, const std::string& body) {
        std::ofstream(root_ / (name + ".R")) << body;
    }

    fs::path root_;
};

ExecutionOutcome run(ExecutionBridge& bridge, asio::io_context& io, Invocation invocation,
                     std::shared_ptr<CancellationToken> token = nullptr) {
    auto future = asio::co_spawn(io, bridge.execute(std::move(invocation), std::move(token)),
                                 asio::use_future);
    io.run();
    io.restart();
    return future.get();
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Outcomes
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ExecutionBridge passes arguments on stdin and parses the payload", "[execution][bridge]") {
    FakeEngines engines;
    asio::io_context io;
    ExecutionBridge bridge(io.get_executor(), engines.runtime());
    bridge.set_scratch_dir("/tmp/statmcp-scratch");

    auto result = run(bridge, io, Invocation{"echo_args", json{{"variables", json::array({"a", "b"})}}, {}});

    REQUIRE(std::holds_alternative<outcome::Success>(result));
    const auto& success = std::get<outcome::Success>(result);
    REQUIRE(success.payload["received"]["variables"][1] == "b");
    REQUIRE(success.payload["scratch"] == "/tmp/statmcp-scratch");
    REQUIRE(success.formatted_text == "Formatted output");

    const auto stats = bridge.stats();
    REQUIRE(stats.spawned == 1);
    REQUIRE(stats.reaped == 1);
    REQUIRE(stats.running() == 0);
}

TEST_CASE("ExecutionBridge reports script errors with the R diagnostic", "[execution][bridge]") {
    FakeEngines engines;
    asio::io_context io;
    ExecutionBridge bridge(io.get_executor(), engines.runtime());

    auto result = run(bridge, io, Invocation{"script_error", json::object(), {}});

    REQUIRE(std::holds_alternative<outcome::ScriptError>(result));
    REQUIRE(std::get<outcome::ScriptError>(result).diagnostic == "Error in eval(expr): object not found");
}

TEST_CASE("ExecutionBridge classifies other failures", "[execution][bridge]") {
    FakeEngines engines;
    asio::io_context io;
    ExecutionBridge bridge(io.get_executor(), engines.runtime());

    SECTION("no JSON on stdout") {
        auto result = run(bridge, io, Invocation{"not_json", json::object(), {}});
        REQUIRE(std::holds_alternative<outcome::MalformedOutput>(result));
    }
    SECTION("error payload") {
        auto result = run(bridge, io, Invocation{"error_payload", json::object(), {}});
        REQUIRE(std::holds_alternative<outcome::ScriptError>(result));
        REQUIRE(std::get<outcome::ScriptError>(result).message == "column missing");
    }
    SECTION("non-zero exit") {
        auto result = run(bridge, io, Invocation{"crash", json::object(), {}});
        REQUIRE(std::holds_alternative<outcome::ProcessFailure>(result));
        REQUIRE(std::get<outcome::ProcessFailure>(result).exit_code == 7);
        REQUIRE(std::get<outcome::ProcessFailure>(result).stderr_excerpt == "boom");
    }
    SECTION("missing script") {
        auto result = run(bridge, io, Invocation{"does_not_exist", json::object(), {}});
        REQUIRE(std::holds_alternative<outcome::ProcessFailure>(result));
        REQUIRE_THAT(std::get<outcome::ProcessFailure>(result).stderr_excerpt,
                     Catch::Matchers::ContainsSubstring("does_not_exist.R"));
        REQUIRE(bridge.stats().spawned == 0);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Deadlines and cancellation
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ExecutionBridge kills and reaps a call that overruns its timeout", "[execution][bridge][timeout]") {
    FakeEngines engines;
    asio::io_context io;
    ExecutionBridge bridge(io.get_executor(), engines.runtime());

    const auto started = std::chrono::steady_clock::now();
    auto result = run(bridge, io, Invocation{"slow", json::object(), 200ms});
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(std::holds_alternative<outcome::Timeout>(result));
    REQUIRE(std::get<outcome::Timeout>(result).limit == 200ms);
    REQUIRE(elapsed < 5s);

    const auto stats = bridge.stats();
    REQUIRE(stats.timed_out == 1);
    REQUIRE(stats.running() == 0);
}

TEST_CASE("ExecutionBridge stops a call when its token is cancelled", "[execution][bridge][cancel]") {
    FakeEngines engines;
    asio::io_context io;
    ExecutionBridge bridge(io.get_executor(), engines.runtime());
    auto token = std::make_shared<CancellationToken>();

    asio::co_spawn(io, [token]() -> asio::awaitable<void> {
        asio::steady_timer timer(co_await asio::this_coro::executor, 150ms);
        co_await timer.async_wait(asio::use_awaitable);
        token->cancel();
    }, asio::detached);

    auto result = run(bridge, io, Invocation{"slow", json::object(), {}}, token);

    REQUIRE(std::holds_alternative<outcome::Cancelled>(result));
    REQUIRE(bridge.stats().cancelled == 1);
    REQUIRE(bridge.stats().running() == 0);
}

TEST_CASE("ExecutionBridge does not spawn for an already cancelled token", "[execution][bridge][cancel]") {
    FakeEngines engines;
    asio::io_context io;
    ExecutionBridge bridge(io.get_executor(), engines.runtime());
    auto token = std::make_shared<CancellationToken>();
    token->cancel();

    auto result = run(bridge, io, Invocation{"echo_args", json::object(), {}}, token);

    REQUIRE(std::holds_alternative<outcome::Cancelled>(result));
    REQUIRE(bridge.stats().spawned == 0);
}

TEST_CASE("ExecutionBridge runs concurrent calls independently", "[execution][bridge]") {
    FakeEngines engines;
    asio::io_context io;
    ExecutionBridge bridge(io.get_executor(), engines.runtime());

    auto first = asio::co_spawn(io, bridge.execute(Invocation{"echo_args", json{{"n", 1}}, {}}, nullptr),
                                asio::use_future);
    auto second = asio::co_spawn(io, bridge.execute(Invocation{"echo_args", json{{"n", 2}}, {}}, nullptr),
                                 asio::use_future);
    io.run();

    auto a = first.get();
    auto b = second.get();
    REQUIRE(std::get<outcome::Success>(a).payload["received"]["n"] == 1);
    REQUIRE(std::get<outcome::Success>(b).payload["received"]["n"] == 2);
    REQUIRE(bridge.stats().reaped == 2);
}
