#include <catch2/catch_test_macros.hpp>

#include "statmcp/context/lifespan.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

using namespace statmcp;
namespace fs = std::filesystem;

namespace {

fs::path make_temp_dir(const std::string& name) {
    const auto dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

}  // namespace

TEST_CASE("Lifespan acquires a scratch directory and releases it", "[lifespan]") {
    auto created = Lifespan::create(ServerConfig{});
    REQUIRE(created.has_value());
    auto lifespan = std::move(*created);

    const fs::path scratch = lifespan->scratch_dir();
    REQUIRE(fs::is_directory(scratch));
    REQUIRE_FALSE(lifespan->torn_down());

    lifespan->teardown();
    REQUIRE(lifespan->torn_down());
    REQUIRE_FALSE(fs::exists(scratch));
}

TEST_CASE("Lifespan teardown runs cleanups once in reverse order", "[lifespan]") {
    auto created = Lifespan::create(ServerConfig{});
    REQUIRE(created.has_value());
    auto lifespan = std::move(*created);

    std::vector<std::string> order;
    lifespan->add_cleanup("first", [&order] { order.push_back("first"); });
    lifespan->add_cleanup("second", [&order] { order.push_back("second"); });
    lifespan->add_cleanup("throws", [] { throw std::runtime_error("boom"); });

    lifespan->teardown();
    lifespan->teardown();

    REQUIRE(order == std::vector<std::string>{"second", "first"});

    // Registered after teardown: runs straight away
    lifespan->add_cleanup("late", [&order] { order.push_back("late"); });
    REQUIRE(order.back() == "late");
}

TEST_CASE("Lifespan fails on an inaccessible allowed path", "[lifespan]") {
    ServerConfig config;
    config.allowed_paths = {"/nonexistent/statmcp/data"};

    auto created = Lifespan::create(config);
    REQUIRE_FALSE(created.has_value());
    REQUIRE(created.error().kind == ErrorKind::InvalidParams);
}

TEST_CASE("Lifespan creates the cache root only when writable", "[lifespan]") {
    const auto base = make_temp_dir("statmcp_lifespan_cache");

    ServerConfig read_only;
    read_only.cache_root = base / "ro";
    auto first = Lifespan::create(read_only);
    REQUIRE(first.has_value());
    REQUIRE_FALSE(fs::exists(base / "ro"));

    ServerConfig writable;
    writable.read_only = false;
    writable.cache_root = base / "rw";
    auto second = Lifespan::create(writable);
    REQUIRE(second.has_value());
    REQUIRE(fs::is_directory(base / "rw"));
    REQUIRE((*second)->cache_dir() == base / "rw");

    fs::remove_all(base);
}

TEST_CASE("is_path_allowed confines paths to the allowed roots", "[lifespan]") {
    const auto root = make_temp_dir("statmcp_lifespan_roots");
    fs::create_directories(root / "data");

    ServerConfig config;
    config.allowed_paths = {root / "data"};
    auto created = Lifespan::create(config);
    REQUIRE(created.has_value());
    const auto& lifespan = **created;

    REQUIRE(lifespan.is_path_allowed(root / "data" / "sales.csv"));
    REQUIRE(lifespan.is_path_allowed(root / "data" / "nested" / "deep.csv"));
    REQUIRE_FALSE(lifespan.is_path_allowed(root / "data" / ".." / "secret.csv"));
    REQUIRE_FALSE(lifespan.is_path_allowed(root / "database.csv"));
    REQUIRE_FALSE(lifespan.is_path_allowed("/etc/passwd"));
    REQUIRE_FALSE(lifespan.is_path_allowed(""));

    fs::remove_all(root);
}

TEST_CASE("No allowed roots means no paths are allowed", "[lifespan]") {
    auto created = Lifespan::create(ServerConfig{});
    REQUIRE(created.has_value());
    REQUIRE_FALSE((*created)->is_path_allowed(fs::temp_directory_path()));
}
