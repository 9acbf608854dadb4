#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Session
// ═══════════════════════════════════════════════════════════════════════════
// Per-connection protocol state: the lifecycle state machine, what was
// negotiated at initialize, and the in-flight table that correlates request
// ids with their cancellation tokens.
//
//   Uninitialized -> Initializing -> Ready -> Draining -> Closed
//                 <-  (bad params)
//
// Any state before Closed may move to Draining.

#include "statmcp/context/cancellation.hpp"
#include "statmcp/protocol/json_rpc.hpp"
#include "statmcp/protocol/mcp_types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace statmcp {

enum class SessionState {
    Uninitialized,
    Initializing,
    Ready,
    Draining,
    Closed
};

[[nodiscard]] constexpr std::string_view to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Uninitialized: return "Uninitialized";
        case SessionState::Initializing:  return "Initializing";
        case SessionState::Ready:         return "Ready";
        case SessionState::Draining:      return "Draining";
        case SessionState::Closed:        return "Closed";
    }
    return "Unknown";
}

[[nodiscard]] constexpr bool is_valid_transition(SessionState from, SessionState to) noexcept {
    switch (to) {
        case SessionState::Initializing:
            return from == SessionState::Uninitialized;
        case SessionState::Uninitialized:
            return from == SessionState::Initializing;
        case SessionState::Ready:
            return from == SessionState::Initializing;
        case SessionState::Draining:
            return (from != SessionState::Draining) && (from != SessionState::Closed);
        case SessionState::Closed:
            return from == SessionState::Draining;
    }
    return false;
}

class Session {
public:
    using StateListener = std::function<void(SessionState from, SessionState to)>;

    explicit Session(std::string id);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] const std::string& id() const noexcept { return id_; }

    [[nodiscard]] SessionState state() const;

    /// Returns false (and changes nothing) for an illegal transition.
    bool transition(SessionState to);

    void set_state_listener(StateListener listener);

    // ─────────────────────────────────────────────────────────────────────────
    // Negotiated at initialize
    // ─────────────────────────────────────────────────────────────────────────

    void record_initialize(std::string protocol_version,
                           Implementation client_info,
                           ClientCapabilities capabilities);

    [[nodiscard]] const std::string& protocol_version() const noexcept { return protocol_version_; }
    [[nodiscard]] const Implementation& client_info() const noexcept { return client_info_; }
    [[nodiscard]] const ClientCapabilities& client_capabilities() const noexcept { return client_capabilities_; }

    [[nodiscard]] LoggingLevel logging_level() const;
    void set_logging_level(LoggingLevel level);

    // ─────────────────────────────────────────────────────────────────────────
    // In-flight table
    // ─────────────────────────────────────────────────────────────────────────

    /// Returns false if the id is already in flight.
    bool track(const JsonRpcId& id, std::shared_ptr<CancellationToken> token);

    void untrack(const JsonRpcId& id);

    /// Returns false if no request with this id is in flight.
    bool cancel(const JsonRpcId& id);

    /// Cancels every in-flight request; returns how many were cancelled.
    std::size_t cancel_all();

    [[nodiscard]] bool is_in_flight(const JsonRpcId& id) const;
    [[nodiscard]] std::size_t in_flight() const;

    /// Requests that passed envelope checks and were dispatched
    [[nodiscard]] std::uint64_t accepted_requests() const;
    void count_accepted();

private:
    const std::string id_;
    std::string protocol_version_;
    Implementation client_info_;
    ClientCapabilities client_capabilities_;

    mutable std::mutex mutex_;
    SessionState state_{SessionState::Uninitialized};
    LoggingLevel logging_level_{LoggingLevel::Info};
    StateListener listener_;
    std::unordered_map<std::string, std::shared_ptr<CancellationToken>> in_flight_;
    std::uint64_t accepted_{0};
};

}  // namespace statmcp
