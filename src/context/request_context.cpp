#include "statmcp/context/request_context.hpp"
#include "statmcp/context/lifespan.hpp"
#include "statmcp/server/session.hpp"

namespace statmcp {

RequestContext::RequestContext(JsonRpcId request_id,
                               Session& session,
                               const Lifespan& lifespan,
                               std::shared_ptr<CancellationToken> token,
                               Notifier notifier)
    : request_id_(std::move(request_id)),
      session_(session),
      lifespan_(lifespan),
      token_(token ? std::move(token) : std::make_shared<CancellationToken>()),
      notifier_(std::move(notifier)) {}

const std::string& RequestContext::session_id() const noexcept {
    return session_.id();
}

bool RequestContext::log(LoggingLevel level, Json data, std::optional<std::string> logger) {
    if ((notifier_ == nullptr) || (level < session_.logging_level())) {
        return false;
    }

    Json params = {
        {"level", std::string(to_string(level))},
        {"data", std::move(data)}
    };
    if (logger) {
        params["logger"] = *logger;
    }
    notifier_(JsonRpcNotification("notifications/message", std::move(params)).to_json());
    return true;
}

}  // namespace statmcp
