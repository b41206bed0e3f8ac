#include "activation/session_manager.hpp"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(jitstreamerSessionsLog, "jitstreamer.sessions")

namespace jitstreamer::activation {

SessionSnapshot SessionManager::Session::snapshot() const {
    std::lock_guard lock(mutex);
    return SessionSnapshot{
        .id = id,
        .device_identifier = device_identifier,
        .state = state,
        .created_at = created_at,
        .finished_at = finished_at,
        .outcome = outcome
    };
}

SessionManager::SessionManager(std::chrono::milliseconds cooldown,
                               std::chrono::milliseconds retention,
                               Clock clock)
    : cooldown_(cooldown)
    , retention_(retention)
    , clock_(std::move(clock)) {}

std::shared_ptr<SessionManager::DeviceSlot> SessionManager::slot_for(const std::string& identifier) {
    std::lock_guard lock(mutex_);
    auto& slot = slots_[identifier];
    if (!slot) {
        slot = std::make_shared<DeviceSlot>();
    }
    return slot;
}

std::shared_ptr<SessionManager::Session> SessionManager::find(const Uuid& id) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

Admission SessionManager::admit(const std::string& identifier) {
    auto slot = slot_for(identifier);
    std::lock_guard slot_lock(slot->mutex);
    const auto now = clock_();

    if (auto previous = slot->latest) {
        std::unique_lock session_lock(previous->mutex);
        if (!is_terminal(previous->state)) {
            qCDebug(jitstreamerSessionsLog) << "Coalescing request for" << identifier.c_str()
                                            << "onto" << previous->id.to_string().c_str();
            return Admission{
                .kind = Admission::Kind::Coalesced,
                .handle = SessionHandle{previous->id, identifier, previous->future}
            };
        }
        const auto ready_at = *previous->finished_at + cooldown_;
        if (now < ready_at) {
            return Admission{
                .kind = Admission::Kind::TooSoon,
                .handle = std::nullopt,
                .retry_after = ready_at - now
            };
        }
        previous->superseded = true;
    }

    auto session = std::make_shared<Session>();
    session->id = Uuid::generate();
    session->device_identifier = identifier;
    session->created_at = now;
    session->future = session->promise.get_future().share();

    slot->latest = session;
    {
        std::lock_guard lock(mutex_);
        sessions_.emplace(session->id, session);
    }

    qCInfo(jitstreamerSessionsLog) << "Session" << session->id.to_string().c_str()
                                   << "created for" << identifier.c_str();
    return Admission{
        .kind = Admission::Kind::Created,
        .handle = SessionHandle{session->id, identifier, session->future}
    };
}

Result<void, Error> SessionManager::mark_dispatched(const Uuid& id) {
    auto session = find(id);
    if (!session) {
        return Result<void, Error>::err(Error{"Unknown session " + id.to_string(), ErrorCode::NotFound});
    }
    std::lock_guard lock(session->mutex);
    if (session->state != SessionState::Submitted) {
        return Result<void, Error>::err(Error{
            "Session " + id.to_string() + " is " + std::string(to_string(session->state)) +
            ", cannot dispatch", ErrorCode::Internal});
    }
    session->state = SessionState::Dispatched;
    return Result<void, Error>::ok();
}

Result<void, Error> SessionManager::complete(const Uuid& id, Outcome outcome) {
    auto session = find(id);
    if (!session) {
        return Result<void, Error>::err(Error{"Unknown session " + id.to_string(), ErrorCode::NotFound});
    }

    std::vector<Observer> observers;
    {
        std::lock_guard lock(session->mutex);
        if (is_terminal(session->state)) {
            return Result<void, Error>::err(Error{
                "Session " + id.to_string() + " already " + std::string(to_string(session->state)),
                ErrorCode::Internal});
        }

        session->state = terminal_state_for(outcome.kind);
        session->finished_at = clock_();
        session->outcome = outcome;
        session->promise.set_value(std::move(outcome));
        observers.swap(session->observers);

        qCInfo(jitstreamerSessionsLog) << "Session" << id.to_string().c_str() << "for"
                                       << session->device_identifier.c_str() << "finished:"
                                       << to_string(session->state).data();
    }

    if (!observers.empty()) {
        const auto snapshot = session->snapshot();
        for (const auto& observer : observers) {
            observer(snapshot);
        }
    }
    return Result<void, Error>::ok();
}

Result<void, Error> SessionManager::on_finished(const Uuid& id, Observer observer) {
    auto session = find(id);
    if (!session) {
        return Result<void, Error>::err(Error{"Unknown session " + id.to_string(), ErrorCode::NotFound});
    }
    {
        std::lock_guard lock(session->mutex);
        if (!is_terminal(session->state)) {
            session->observers.push_back(std::move(observer));
            return Result<void, Error>::ok();
        }
    }
    observer(session->snapshot());
    return Result<void, Error>::ok();
}

std::optional<Outcome> SessionManager::await(const SessionHandle& handle,
                                             std::chrono::milliseconds timeout) const {
    if (!handle.outcome.valid()) {
        return std::nullopt;
    }
    if (handle.outcome.wait_for(timeout) != std::future_status::ready) {
        return std::nullopt;
    }
    return handle.outcome.get();
}

Res<SessionSnapshot> SessionManager::poll(const Uuid& id) const {
    auto session = find(id);
    if (!session) {
        return fail<SessionSnapshot>(ErrorCode::NotFound, "Unknown session " + id.to_string());
    }
    return Res<SessionSnapshot>::ok(session->snapshot());
}

std::optional<SessionSnapshot> SessionManager::latest_for(const std::string& identifier) const {
    std::shared_ptr<DeviceSlot> slot;
    {
        std::lock_guard lock(mutex_);
        auto it = slots_.find(identifier);
        if (it == slots_.end()) return std::nullopt;
        slot = it->second;
    }

    std::shared_ptr<Session> latest;
    {
        std::lock_guard slot_lock(slot->mutex);
        latest = slot->latest;
    }
    if (!latest || !find(latest->id)) {
        return std::nullopt;
    }
    return latest->snapshot();
}

size_t SessionManager::prune() {
    const auto now = clock_();
    size_t removed = 0;

    std::lock_guard lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        const auto& session = it->second;
        bool drop = false;
        {
            std::lock_guard session_lock(session->mutex);
            if (is_terminal(session->state)) {
                const auto finished = *session->finished_at;
                const bool expired = finished + retention_ <= now;
                const bool cooling = !session->superseded && now < finished + cooldown_;
                drop = expired && !cooling;
            }
        }
        if (drop) {
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        qCDebug(jitstreamerSessionsLog) << "Pruned" << removed << "sessions";
    }
    return removed;
}

size_t SessionManager::size() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

size_t SessionManager::active_count() const {
    std::lock_guard lock(mutex_);
    size_t active = 0;
    for (const auto& [id, session] : sessions_) {
        std::lock_guard session_lock(session->mutex);
        if (!is_terminal(session->state)) ++active;
    }
    return active;
}

} // namespace jitstreamer::activation
