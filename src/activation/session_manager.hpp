#pragma once

#include "core/result.hpp"
#include "core/session.hpp"
#include "core/types.hpp"
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace jitstreamer::activation {

/**
 * SessionHandle - What a caller holds on to after admission.
 * Every caller attached to the same session shares the same future.
 */
struct SessionHandle {
    Uuid id;
    std::string device_identifier;
    std::shared_future<Outcome> outcome;
};

/**
 * Admission - Result of asking to start an activation for a device.
 */
struct Admission {
    enum class Kind {
        Created,    // fresh session, caller must dispatch it
        Coalesced,  // attached to the session already in flight
        TooSoon     // cooldown still applies, nothing created
    };

    Kind kind = Kind::Created;
    std::optional<SessionHandle> handle;
    std::chrono::milliseconds retry_after{0};
};

/**
 * SessionManager - Owns every activation session.
 *
 * Holds at most one non-terminal session per device identifier. Admission
 * for one identifier is serialized on that device's lock; different
 * identifiers never wait on each other beyond brief map lookups.
 *
 * Terminal sessions are kept for `retention` after they finish so clients
 * can still poll them, and the latest session of a device is kept at least
 * as long as its cooldown applies.
 */
class SessionManager {
public:
    using Clock = std::function<Timestamp()>;
    using Observer = std::function<void(const SessionSnapshot&)>;

    SessionManager(std::chrono::milliseconds cooldown,
                   std::chrono::milliseconds retention,
                   Clock clock = &Timestamp::now);

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    [[nodiscard]] Admission admit(const std::string& identifier);

    /**
     * Submitted -> Dispatched. Fails if the session is unknown or has
     * already moved on.
     */
    [[nodiscard]] Result<void, Error> mark_dispatched(const Uuid& id);

    /**
     * Record the terminal outcome. Only the first completion counts; later
     * ones return an error and change nothing.
     */
    [[nodiscard]] Result<void, Error> complete(const Uuid& id, Outcome outcome);

    /**
     * Block until the session is terminal or `timeout` elapses.
     * Giving up never affects the session.
     */
    [[nodiscard]] std::optional<Outcome> await(const SessionHandle& handle,
                                               std::chrono::milliseconds timeout) const;

    [[nodiscard]] Res<SessionSnapshot> poll(const Uuid& id) const;

    /**
     * Call `observer` once with the terminal snapshot. It runs on the
     * completing thread, or right away if the session already finished.
     */
    [[nodiscard]] Result<void, Error> on_finished(const Uuid& id, Observer observer);

    /**
     * Most recent session for a device, if one is still retained.
     */
    [[nodiscard]] std::optional<SessionSnapshot> latest_for(const std::string& identifier) const;

    /**
     * Drop terminal sessions past the retention window. Returns the number
     * of sessions removed.
     */
    size_t prune();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t active_count() const;

    [[nodiscard]] std::chrono::milliseconds cooldown() const { return cooldown_; }
    [[nodiscard]] std::chrono::milliseconds retention() const { return retention_; }

private:
    struct Session {
        Uuid id;
        std::string device_identifier;
        Timestamp created_at;

        mutable std::mutex mutex;
        SessionState state = SessionState::Submitted;
        std::optional<Timestamp> finished_at;
        std::optional<Outcome> outcome;
        bool superseded = false;

        std::promise<Outcome> promise;
        std::shared_future<Outcome> future;
        std::vector<Observer> observers;

        [[nodiscard]] SessionSnapshot snapshot() const;
    };

    struct DeviceSlot {
        std::mutex mutex;
        std::shared_ptr<Session> latest;
    };

    std::chrono::milliseconds cooldown_;
    std::chrono::milliseconds retention_;
    Clock clock_;

    // Guards the two maps, never a session's fields.
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<DeviceSlot>> slots_;
    std::unordered_map<Uuid, std::shared_ptr<Session>> sessions_;

    [[nodiscard]] std::shared_ptr<DeviceSlot> slot_for(const std::string& identifier);
    [[nodiscard]] std::shared_ptr<Session> find(const Uuid& id) const;
};

} // namespace jitstreamer::activation
