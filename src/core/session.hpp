#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace jitstreamer {

/**
 * SessionState - Lifecycle of one activation attempt.
 *
 *   Submitted -> Dispatched -> Succeeded | Failed | TimedOut
 *
 * Cancelled is terminal as well and is only reached through pool shutdown
 * (or a job that could not be submitted).
 */
enum class SessionState {
    Submitted,
    Dispatched,
    Succeeded,
    Failed,
    TimedOut,
    Cancelled
};

[[nodiscard]] constexpr bool is_terminal(SessionState state) noexcept {
    return state == SessionState::Succeeded || state == SessionState::Failed ||
           state == SessionState::TimedOut || state == SessionState::Cancelled;
}

[[nodiscard]] constexpr std::string_view to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Submitted: return "submitted";
        case SessionState::Dispatched: return "dispatched";
        case SessionState::Succeeded: return "succeeded";
        case SessionState::Failed: return "failed";
        case SessionState::TimedOut: return "timed_out";
        case SessionState::Cancelled: return "cancelled";
    }
    return "unknown";
}

/**
 * Outcome - What a worker job ended with.
 */
struct Outcome {
    enum class Kind { Succeeded, Failed, TimedOut, Cancelled };

    Kind kind = Kind::Failed;
    std::string detail;

    [[nodiscard]] static Outcome succeeded() { return {Kind::Succeeded, {}}; }
    [[nodiscard]] static Outcome failed(std::string detail) { return {Kind::Failed, std::move(detail)}; }
    [[nodiscard]] static Outcome timed_out(std::string detail = {}) { return {Kind::TimedOut, std::move(detail)}; }
    [[nodiscard]] static Outcome cancelled(std::string detail = {}) { return {Kind::Cancelled, std::move(detail)}; }

    [[nodiscard]] bool ok() const noexcept { return kind == Kind::Succeeded; }

    bool operator==(const Outcome&) const = default;
};

[[nodiscard]] constexpr SessionState terminal_state_for(Outcome::Kind kind) noexcept {
    switch (kind) {
        case Outcome::Kind::Succeeded: return SessionState::Succeeded;
        case Outcome::Kind::Failed: return SessionState::Failed;
        case Outcome::Kind::TimedOut: return SessionState::TimedOut;
        case Outcome::Kind::Cancelled: return SessionState::Cancelled;
    }
    return SessionState::Failed;
}

/**
 * Stable client-facing status for a finished activation.
 */
[[nodiscard]] constexpr std::string_view status_string(Outcome::Kind kind) noexcept {
    switch (kind) {
        case Outcome::Kind::Succeeded: return "activated";
        case Outcome::Kind::Failed: return "failed";
        case Outcome::Kind::TimedOut: return "timed_out";
        case Outcome::Kind::Cancelled: return "cancelled";
    }
    return "failed";
}

/**
 * Outcome as the taxonomy error it corresponds to (nullopt on success).
 */
[[nodiscard]] inline std::optional<Error> outcome_error(const Outcome& outcome) {
    switch (outcome.kind) {
        case Outcome::Kind::Succeeded: return std::nullopt;
        case Outcome::Kind::Failed: return Error{outcome.detail, ErrorCode::WorkerFailed};
        case Outcome::Kind::TimedOut: return Error{outcome.detail, ErrorCode::TimedOut};
        case Outcome::Kind::Cancelled: return Error{outcome.detail, ErrorCode::Cancelled};
    }
    return Error{outcome.detail};
}

/**
 * SessionSnapshot - Point-in-time copy of a session, safe to hand out.
 */
struct SessionSnapshot {
    Uuid id;
    std::string device_identifier;
    SessionState state = SessionState::Submitted;
    Timestamp created_at;
    std::optional<Timestamp> finished_at;
    std::optional<Outcome> outcome;
};

} // namespace jitstreamer
