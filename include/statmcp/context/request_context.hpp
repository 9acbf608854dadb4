#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Request Context
// ═══════════════════════════════════════════════════════════════════════════
// Built per inbound request inside its coroutine. Holds references only and
// must not outlive the request.

#include "statmcp/context/cancellation.hpp"
#include "statmcp/protocol/json_rpc.hpp"
#include "statmcp/protocol/mcp_types.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace statmcp {

class Lifespan;
class Session;

class RequestContext {
public:
    /// Delivers a server-to-client notification frame
    using Notifier = std::function<void(Json notification)>;

    RequestContext(JsonRpcId request_id,
                   Session& session,
                   const Lifespan& lifespan,
                   std::shared_ptr<CancellationToken> token,
                   Notifier notifier = {});

    [[nodiscard]] const JsonRpcId& request_id() const noexcept { return request_id_; }
    [[nodiscard]] const std::string& session_id() const noexcept;
    [[nodiscard]] Session& session() noexcept { return session_; }
    [[nodiscard]] const Lifespan& lifespan() const noexcept { return lifespan_; }

    [[nodiscard]] CancellationToken& token() noexcept { return *token_; }
    [[nodiscard]] const std::shared_ptr<CancellationToken>& shared_token() const noexcept { return token_; }
    [[nodiscard]] bool is_cancelled() const noexcept { return token_->is_cancelled(); }

    /// Send notifications/message if `level` is at or above the level the
    /// client selected with logging/setLevel. Returns whether it was sent.
    bool log(LoggingLevel level, Json data, std::optional<std::string> logger = std::nullopt);

private:
    JsonRpcId request_id_;
    Session& session_;
    const Lifespan& lifespan_;
    std::shared_ptr<CancellationToken> token_;
    Notifier notifier_;
};

}  // namespace statmcp
