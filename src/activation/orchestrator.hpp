#pragma once

#include "activation/session_manager.hpp"
#include "activation/worker_pool.hpp"
#include "core/device.hpp"
#include "core/result.hpp"
#include "provision/peer_provisioner.hpp"
#include "registry/device_registry.hpp"
#include "storage/pairing_store.hpp"
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace jitstreamer::activation {

/**
 * WorkerCommand - How to launch the activation worker.
 *
 * `{udid}`, `{address}` and `{pairing_file}` in the arguments are replaced
 * per job. The same values are exported as JITSTREAMER_UDID,
 * JITSTREAMER_ADDRESS and JITSTREAMER_PAIRING_FILE.
 */
struct WorkerCommand {
    QString program;
    QStringList arguments;
    std::chrono::milliseconds timeout{60000};
};

/**
 * ActivationTicket - Immediate answer to activate(); the worker result
 * arrives later through await() or poll().
 */
struct ActivationTicket {
    enum class Kind { Started, Coalesced, TooSoon };

    Kind kind = Kind::Started;
    Device device;
    std::optional<SessionHandle> session;
    std::chrono::milliseconds retry_after{0};

    /**
     * "pending" while a session runs, "too_soon" during cooldown.
     */
    [[nodiscard]] std::string_view status() const {
        return kind == Kind::TooSoon ? "too_soon" : "pending";
    }
};

/**
 * Orchestrator - Entry point for every client request.
 *
 *   activate -> registry lookup (register when a credential is supplied)
 *            -> session admission (coalesce / cooldown)
 *            -> touch -> worker job -> session completion
 *
 * activate() returns once the job is queued; it never waits on a worker.
 */
class Orchestrator {
public:
    Orchestrator(registry::DeviceRegistry& registry,
                 provision::PeerProvisioner& provisioner,
                 storage::PairingStore& pairing_store,
                 SessionManager& sessions,
                 WorkerPool& pool,
                 WorkerCommand command);

    /**
     * Shuts the pool down first: job callbacks refer back to this object.
     */
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * Start (or join) an activation for `identifier`. A credential issued
     * for `identifier` lets an unknown device register on the spot; under
     * the direct policy it registers at `caller_address`. The stored
     * credential of a known device is never replaced.
     *
     * Errors: InvalidArgument, NotFound, RegistrationDisabled, PoolExhausted,
     * UpstreamUnavailable, Storage.
     */
    [[nodiscard]] Res<ActivationTicket> activate(const std::string& identifier,
                                                 const std::optional<QByteArray>& credential = std::nullopt,
                                                 const std::optional<std::string>& caller_address = std::nullopt);

    /**
     * activate() for the device bound to a tunnel address.
     */
    [[nodiscard]] Res<ActivationTicket> activate_by_address(const std::string& address);

    /**
     * Store the credential and issue the device's VPN configuration.
     * `identifier` may be empty when the credential carries a UDID; if both
     * are given they must agree. Under the direct policy the device is
     * bound to `caller_address` and gets no VPN peer.
     */
    [[nodiscard]] Res<provision::ProvisionResult> register_device(
        const std::string& identifier,
        const QByteArray& credential,
        const std::optional<std::string>& caller_address = std::nullopt);

    [[nodiscard]] std::optional<Outcome> await(const SessionHandle& handle,
                                               std::chrono::milliseconds timeout) const;
    [[nodiscard]] Res<SessionSnapshot> poll(const Uuid& session_id) const;

    /**
     * See SessionManager::on_finished.
     */
    [[nodiscard]] Result<void, Error> on_finished(const Uuid& session_id, SessionManager::Observer observer);

    /**
     * Latest retained session of a device.
     */
    [[nodiscard]] std::optional<SessionSnapshot> status_for(const std::string& identifier) const;

    /**
     * Worker queue state of the device's latest session.
     */
    [[nodiscard]] Res<JobStatus> queue_status(const std::string& identifier) const;

    size_t prune_sessions();

    /**
     * Stop the pool. Queued and running jobs finish as Cancelled.
     */
    void shutdown();

private:
    registry::DeviceRegistry& registry_;
    provision::PeerProvisioner& provisioner_;
    storage::PairingStore& pairing_store_;
    SessionManager& sessions_;
    WorkerPool& pool_;
    WorkerCommand command_;

    mutable std::mutex jobs_mutex_;
    std::map<Uuid, uint64_t> jobs_;

    [[nodiscard]] Res<Device> resolve(const std::string& identifier,
                                      const std::optional<QByteArray>& credential,
                                      const std::optional<std::string>& caller_address);
    [[nodiscard]] Res<Device> register_new(const std::string& identifier,
                                           const std::optional<std::string>& caller_address);
    [[nodiscard]] Res<provision::ProvisionResult> register_in_place(
        const std::string& identifier,
        const std::optional<std::string>& caller_address);
    [[nodiscard]] WorkerJob make_job(const Device& device, const Uuid& session_id);
    void dispatch(const Device& device, const SessionHandle& session);
};

} // namespace jitstreamer::activation
