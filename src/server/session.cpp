#include "statmcp/server/session.hpp"
#include "statmcp/log/logger.hpp"

#include <vector>

namespace statmcp {

Session::Session(std::string id)
    : id_(std::move(id)) {}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool Session::transition(SessionState to) {
    SessionState from;
    StateListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        from = state_;
        if (is_valid_transition(from, to) == false) {
            return false;
        }
        state_ = to;
        listener = listener_;
    }

    STATMCP_LOG_DEBUG("Session " + id_ + ": " + std::string(to_string(from)) + " -> " +
                      std::string(to_string(to)));
    if (listener) {
        listener(from, to);
    }
    return true;
}

void Session::set_state_listener(StateListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void Session::record_initialize(std::string protocol_version,
                                Implementation client_info,
                                ClientCapabilities capabilities) {
    protocol_version_ = std::move(protocol_version);
    client_info_ = std::move(client_info);
    client_capabilities_ = std::move(capabilities);
}

LoggingLevel Session::logging_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logging_level_;
}

void Session::set_logging_level(LoggingLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    logging_level_ = level;
}

bool Session::track(const JsonRpcId& id, std::shared_ptr<CancellationToken> token) {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.emplace(id.key(), std::move(token)).second;
}

void Session::untrack(const JsonRpcId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(id.key());
}

bool Session::cancel(const JsonRpcId& id) {
    std::shared_ptr<CancellationToken> token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = in_flight_.find(id.key());
        if (it == in_flight_.end()) {
            return false;
        }
        token = it->second;
    }
    // Callbacks kill subprocesses; never run them under our lock
    token->cancel();
    return true;
}

std::size_t Session::cancel_all() {
    std::vector<std::shared_ptr<CancellationToken>> tokens;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tokens.reserve(in_flight_.size());
        for (const auto& [key, token] : in_flight_) {
            tokens.push_back(token);
        }
    }

    std::size_t cancelled = 0;
    for (auto& token : tokens) {
        if (token->cancel()) {
            ++cancelled;
        }
    }
    return cancelled;
}

bool Session::is_in_flight(const JsonRpcId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.contains(id.key());
}

std::size_t Session::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

std::uint64_t Session::accepted_requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accepted_;
}

void Session::count_accepted() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++accepted_;
}

}  // namespace statmcp
