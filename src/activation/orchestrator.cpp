#include "activation/orchestrator.hpp"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(jitstreamerOrchestratorLog, "jitstreamer.orchestrator")

namespace jitstreamer::activation {

Orchestrator::Orchestrator(registry::DeviceRegistry& registry,
                           provision::PeerProvisioner& provisioner,
                           storage::PairingStore& pairing_store,
                           SessionManager& sessions,
                           WorkerPool& pool,
                           WorkerCommand command)
    : registry_(registry)
    , provisioner_(provisioner)
    , pairing_store_(pairing_store)
    , sessions_(sessions)
    , pool_(pool)
    , command_(std::move(command)) {}

Orchestrator::~Orchestrator() {
    pool_.shutdown();
}

namespace {

// The UDID the credential was issued for; must match `identifier` if given.
Res<std::string> credential_owner(const std::string& identifier, const QByteArray& credential) {
    auto embedded = storage::extract_identifier(credential);
    if (embedded.is_err()) {
        return embedded;
    }
    if (!identifier.empty() && identifier != embedded.unwrap()) {
        return fail<std::string>(ErrorCode::InvalidArgument,
            "Pairing file belongs to " + embedded.unwrap() + ", not " + identifier);
    }
    return embedded;
}

} // namespace

Res<Device> Orchestrator::register_new(const std::string& identifier,
                                       const std::optional<std::string>& caller_address) {
    if (!registers_direct(registry_.policy())) {
        return provisioner_.ensure_registered(identifier);
    }
    if (!caller_address || caller_address->empty()) {
        return fail<Device>(ErrorCode::InvalidArgument, "Direct registration needs the caller's address");
    }
    return provisioner_.register_direct(identifier, *caller_address);
}

Res<Device> Orchestrator::resolve(const std::string& identifier,
                                  const std::optional<QByteArray>& credential,
                                  const std::optional<std::string>& caller_address) {
    auto existing = registry_.lookup(identifier);
    if (existing.is_err() && !existing.unwrap_err().is(ErrorCode::NotFound)) {
        return existing;
    }
    if (!credential) {
        return existing;
    }

    auto owner = credential_owner(identifier, *credential);
    if (owner.is_err()) {
        return Res<Device>::err(owner.unwrap_err());
    }

    // A known device keeps the record it registered with.
    if (existing.is_ok() && pairing_store_.contains(identifier)) {
        return existing;
    }

    auto device = existing.is_ok() ? std::move(existing) : register_new(identifier, caller_address);
    if (device.is_err()) {
        return device;
    }

    // Written only once the device is in, so a refused registration
    // leaves nothing on disk.
    auto saved = pairing_store_.save(identifier, *credential);
    if (saved.is_err()) {
        return Res<Device>::err(saved.unwrap_err());
    }
    return device;
}

WorkerJob Orchestrator::make_job(const Device& device, const Uuid& session_id) {
    const auto udid = QString::fromStdString(device.identifier);
    const auto address = QString::fromStdString(device.address);
    const auto pairing_file = pairing_store_.path_for(device.identifier);

    QStringList arguments;
    arguments.reserve(command_.arguments.size());
    for (auto arg : command_.arguments) {
        arg.replace(QStringLiteral("{udid}"), udid);
        arg.replace(QStringLiteral("{address}"), address);
        arg.replace(QStringLiteral("{pairing_file}"), pairing_file);
        arguments << arg;
    }

    WorkerJob job;
    job.session_id = session_id;
    job.program = command_.program;
    job.arguments = std::move(arguments);
    job.environment.insert(QStringLiteral("JITSTREAMER_UDID"), udid);
    job.environment.insert(QStringLiteral("JITSTREAMER_ADDRESS"), address);
    job.environment.insert(QStringLiteral("JITSTREAMER_PAIRING_FILE"), pairing_file);
    job.timeout = command_.timeout;
    job.on_complete = [this, session_id](const Outcome& outcome) {
        sessions_.complete(session_id, outcome).inspect_err([&](const Error& e) {
            qCWarning(jitstreamerOrchestratorLog) << "Dropping late outcome:" << e.message.c_str();
        });
    };
    return job;
}

void Orchestrator::dispatch(const Device& device, const SessionHandle& session) {
    auto dispatched = sessions_.mark_dispatched(session.id);
    if (dispatched.is_err()) {
        qCWarning(jitstreamerOrchestratorLog) << "Cannot dispatch" << session.id.to_string().c_str()
                                              << ":" << dispatched.unwrap_err().message.c_str();
        return;
    }

    auto submitted = pool_.submit(make_job(device, session.id));
    if (submitted.is_err()) {
        qCWarning(jitstreamerOrchestratorLog) << "Job for" << device.identifier.c_str()
                                              << "not submitted:" << submitted.unwrap_err().message.c_str();
        sessions_.complete(session.id, Outcome::cancelled(submitted.unwrap_err().message))
            .inspect_err([&](const Error& e) {
                qCWarning(jitstreamerOrchestratorLog) << "Cancel failed:" << e.message.c_str();
            });
        return;
    }

    std::lock_guard lock(jobs_mutex_);
    jobs_[session.id] = submitted.unwrap().id;
}

Res<ActivationTicket> Orchestrator::activate(const std::string& identifier,
                                             const std::optional<QByteArray>& credential,
                                             const std::optional<std::string>& caller_address) {
    auto valid = validate_identifier(identifier);
    if (valid.is_err()) {
        return Res<ActivationTicket>::err(valid.unwrap_err());
    }

    auto resolved = resolve(identifier, credential, caller_address);
    if (resolved.is_err()) {
        qCInfo(jitstreamerOrchestratorLog) << "Activation for" << identifier.c_str() << "refused:"
                                           << resolved.unwrap_err().message.c_str();
        return Res<ActivationTicket>::err(resolved.unwrap_err());
    }
    const auto device = std::move(resolved).unwrap();

    auto admission = sessions_.admit(identifier);
    if (admission.kind == Admission::Kind::TooSoon) {
        return Res<ActivationTicket>::ok(ActivationTicket{
            .kind = ActivationTicket::Kind::TooSoon,
            .device = device,
            .session = std::nullopt,
            .retry_after = admission.retry_after
        });
    }

    registry_.touch(identifier).inspect_err([&](const Error& e) {
        qCWarning(jitstreamerOrchestratorLog) << "Could not update last-seen for"
                                              << identifier.c_str() << ":" << e.message.c_str();
    });

    const auto& session = *admission.handle;
    if (admission.kind == Admission::Kind::Created) {
        qCInfo(jitstreamerOrchestratorLog) << "Activating" << identifier.c_str()
                                           << "at" << device.address.c_str();
        dispatch(device, session);
    }

    return Res<ActivationTicket>::ok(ActivationTicket{
        .kind = admission.kind == Admission::Kind::Created ? ActivationTicket::Kind::Started
                                                           : ActivationTicket::Kind::Coalesced,
        .device = device,
        .session = session
    });
}

Res<ActivationTicket> Orchestrator::activate_by_address(const std::string& address) {
    auto device = registry_.lookup_by_address(address);
    if (device.is_err()) {
        return Res<ActivationTicket>::err(device.unwrap_err());
    }
    return activate(device.unwrap().identifier);
}

Res<provision::ProvisionResult> Orchestrator::register_device(const std::string& identifier,
                                                              const QByteArray& credential,
                                                              const std::optional<std::string>& caller_address) {
    std::string udid = identifier;
    if (!credential.isEmpty()) {
        auto owner = credential_owner(identifier, credential);
        if (owner.is_err()) {
            return Res<provision::ProvisionResult>::err(owner.unwrap_err());
        }
        udid = owner.unwrap();
    }

    auto valid = validate_identifier(udid);
    if (valid.is_err()) {
        return Res<provision::ProvisionResult>::err(valid.unwrap_err());
    }

    auto provisioned = registers_direct(registry_.policy())
        ? register_in_place(udid, caller_address)
        : provisioner_.provision(udid);
    if (provisioned.is_err()) {
        return provisioned;
    }

    if (!credential.isEmpty()) {
        auto saved = pairing_store_.save(udid, credential);
        if (saved.is_err()) {
            return Res<provision::ProvisionResult>::err(saved.unwrap_err());
        }
    }
    return provisioned;
}

Res<provision::ProvisionResult> Orchestrator::register_in_place(const std::string& identifier,
                                                                const std::optional<std::string>& caller_address) {
    const bool known = registry_.lookup(identifier).is_ok();
    auto device = register_new(identifier, caller_address);
    if (device.is_err()) {
        return Res<provision::ProvisionResult>::err(device.unwrap_err());
    }

    const auto& registered = device.unwrap();
    provision::PeerConfig config;
    config.identifier = registered.identifier;
    config.address = registered.address;
    config.server = provisioner_.server();
    return Res<provision::ProvisionResult>::ok(provision::ProvisionResult{
        .config = std::move(config),
        .allocated = !known,
        .direct = true
    });
}

std::optional<Outcome> Orchestrator::await(const SessionHandle& handle,
                                           std::chrono::milliseconds timeout) const {
    return sessions_.await(handle, timeout);
}

Res<SessionSnapshot> Orchestrator::poll(const Uuid& session_id) const {
    return sessions_.poll(session_id);
}

Result<void, Error> Orchestrator::on_finished(const Uuid& session_id, SessionManager::Observer observer) {
    return sessions_.on_finished(session_id, std::move(observer));
}

std::optional<SessionSnapshot> Orchestrator::status_for(const std::string& identifier) const {
    return sessions_.latest_for(identifier);
}

Res<JobStatus> Orchestrator::queue_status(const std::string& identifier) const {
    auto latest = sessions_.latest_for(identifier);
    if (!latest) {
        return fail<JobStatus>(ErrorCode::NotFound, "No activation for " + identifier);
    }

    uint64_t job_id = 0;
    {
        std::lock_guard lock(jobs_mutex_);
        auto it = jobs_.find(latest->id);
        if (it == jobs_.end()) {
            return fail<JobStatus>(ErrorCode::NotFound, "No job for session " + latest->id.to_string());
        }
        job_id = it->second;
    }
    return pool_.status(job_id);
}

size_t Orchestrator::prune_sessions() {
    const auto removed = sessions_.prune();

    std::lock_guard lock(jobs_mutex_);
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        if (sessions_.poll(it->first).is_err()) {
            it = jobs_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

void Orchestrator::shutdown() {
    qCInfo(jitstreamerOrchestratorLog) << "Shutting down;" << sessions_.active_count()
                                       << "activations in flight";
    pool_.shutdown();
}

} // namespace jitstreamer::activation
