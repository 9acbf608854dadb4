#ifndef STATMCP_TESTS_TEST_CONTEXT_HPP
#define STATMCP_TESTS_TEST_CONTEXT_HPP

// ─────────────────────────────────────────────────────────────────────────────
// TestContext - Lifespan + Session + RequestContext for handler-level tests
// ─────────────────────────────────────────────────────────────────────────────

#include "statmcp/context/lifespan.hpp"
#include "statmcp/context/request_context.hpp"
#include "statmcp/server/session.hpp"

#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>
#include <asio/use_future.hpp>

#include <stdexcept>
#include <vector>

namespace statmcp::testing {

class TestContext {
public:
    explicit TestContext(ServerConfig config = {})
        : lifespan_(make_lifespan(std::move(config))),
          session_("test-session"),
          context_(JsonRpcId::integer(1), session_, *lifespan_, nullptr,
                   [this](Json notification) { notifications_.push_back(std::move(notification)); })
    {}

    [[nodiscard]] RequestContext& context() noexcept { return context_; }
    [[nodiscard]] Session& session() noexcept { return session_; }
    [[nodiscard]] Lifespan& lifespan() noexcept { return *lifespan_; }
    [[nodiscard]] const std::vector<Json>& notifications() const noexcept { return notifications_; }

private:
    static std::unique_ptr<Lifespan> make_lifespan(ServerConfig config) {
        auto created = Lifespan::create(std::move(config));
        if (!created) {
            throw std::runtime_error(created.error().message);
        }
        return std::move(*created);
    }

    std::unique_ptr<Lifespan> lifespan_;
    Session session_;
    std::vector<Json> notifications_;
    RequestContext context_;
};

/// Drive one awaitable to completion on a private io_context
template <typename T>
T run_awaitable(asio::awaitable<T> awaitable) {
    asio::io_context io;
    auto future = asio::co_spawn(io, std::move(awaitable), asio::use_future);
    io.run();
    return future.get();
}

}  // namespace statmcp::testing

#endif  // STATMCP_TESTS_TEST_CONTEXT_HPP
