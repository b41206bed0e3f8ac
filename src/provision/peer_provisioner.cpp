#include "provision/peer_provisioner.hpp"

#include "crypto/keys.hpp"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(jitstreamerProvisionLog, "jitstreamer.provision")

namespace jitstreamer::provision {

PeerProvisioner::PeerProvisioner(registry::DeviceRegistry& registry,
                                 VpnControl& vpn,
                                 AddressPool pool,
                                 ServerPeerSettings server)
    : registry_(registry)
    , vpn_(vpn)
    , pool_(std::move(pool))
    , server_(std::move(server)) {}

Res<registry::Allocation> PeerProvisioner::allocate(const std::string& identifier,
                                                    const std::string& public_key) {
    // The row is committed before the peer goes out, so the registry is
    // never locked across a wg call. A failed apply removes the row again;
    // a crash in between is repaired by resync() on the next start.
    auto allocation = registry_.allocate_and_register(identifier, pool_, public_key, {});
    if (allocation.is_err() || !allocation.unwrap().allocated || public_key.empty()) {
        return allocation;
    }

    const auto& device = allocation.unwrap().device;
    auto applied = vpn_.apply_peer(public_key, device.address, pool_.host_prefix());
    if (applied.is_err()) {
        qCWarning(jitstreamerProvisionLog) << "Releasing" << device.address.c_str() << "after failed peer setup for"
                                           << identifier.c_str() << ":" << applied.unwrap_err().message.c_str();
        registry_.remove(identifier).inspect_err([&](const Error& e) {
            qCWarning(jitstreamerProvisionLog) << "Could not release" << device.address.c_str()
                                               << ":" << e.message.c_str();
        });
        return Res<registry::Allocation>::err(applied.unwrap_err());
    }
    return allocation;
}

Res<Device> PeerProvisioner::register_direct(const std::string& identifier, const std::string& address) {
    auto valid = validate_identifier(identifier);
    if (valid.is_err()) {
        return Res<Device>::err(valid.unwrap_err());
    }

    auto device = registry_.register_device(identifier, address);
    if (device.is_ok()) {
        qCInfo(jitstreamerProvisionLog) << "Registered" << identifier.c_str()
                                        << "directly at" << device.unwrap().address.c_str();
    }
    return device;
}

Res<ProvisionResult> PeerProvisioner::rotate(const Device& device) {
    auto keys = crypto::generate_keypair();
    const auto public_key = crypto::to_base64(keys.public_key);
    const int prefix = pool_.host_prefix();

    auto applied = vpn_.apply_peer(public_key, device.address, prefix);
    if (applied.is_err()) {
        return Res<ProvisionResult>::err(applied.unwrap_err());
    }

    auto stored = registry_.set_public_key(device.identifier, public_key);
    if (stored.is_err()) {
        vpn_.remove_peer(public_key).inspect_err([&](const Error& e) {
            qCWarning(jitstreamerProvisionLog) << "Could not withdraw new peer for"
                                               << device.identifier.c_str() << ":" << e.message.c_str();
        });
        return Res<ProvisionResult>::err(stored.unwrap_err());
    }

    if (!device.public_key.empty() && device.public_key != public_key) {
        vpn_.remove_peer(device.public_key).inspect_err([&](const Error& e) {
            qCWarning(jitstreamerProvisionLog) << "Stale peer left for"
                                               << device.identifier.c_str() << ":" << e.message.c_str();
        });
    }

    qCInfo(jitstreamerProvisionLog) << "Rotated peer key for" << device.identifier.c_str()
                                    << "at" << device.address.c_str();
    auto updated = with_public_key(device, public_key);
    return Res<ProvisionResult>::ok(ProvisionResult{
        .config = make_peer_config(updated, keys, prefix, server_),
        .allocated = false
    });
}

Res<ProvisionResult> PeerProvisioner::provision(const std::string& identifier) {
    auto valid = validate_identifier(identifier);
    if (valid.is_err()) {
        return Res<ProvisionResult>::err(valid.unwrap_err());
    }

    std::lock_guard lock(mutex_);

    auto existing = registry_.lookup(identifier);
    if (existing.is_ok()) {
        return rotate(existing.unwrap());
    }
    if (!existing.unwrap_err().is(ErrorCode::NotFound)) {
        return Res<ProvisionResult>::err(existing.unwrap_err());
    }

    auto keys = crypto::generate_keypair();
    const auto public_key = crypto::to_base64(keys.public_key);

    auto allocation = allocate(identifier, public_key);
    if (allocation.is_err()) {
        qCWarning(jitstreamerProvisionLog) << "Provisioning" << identifier.c_str() << "failed:"
                                           << allocation.unwrap_err().message.c_str();
        return Res<ProvisionResult>::err(allocation.unwrap_err());
    }

    const auto& [device, allocated] = allocation.unwrap();
    if (!allocated) {
        // Registered concurrently through another path; give it fresh keys.
        return rotate(device);
    }

    qCInfo(jitstreamerProvisionLog) << "Registered" << identifier.c_str() << "at" << device.address.c_str();
    return Res<ProvisionResult>::ok(ProvisionResult{
        .config = make_peer_config(device, keys, pool_.host_prefix(), server_),
        .allocated = true
    });
}

Res<Device> PeerProvisioner::ensure_registered(const std::string& identifier) {
    auto valid = validate_identifier(identifier);
    if (valid.is_err()) {
        return Res<Device>::err(valid.unwrap_err());
    }

    auto existing = registry_.lookup(identifier);
    if (existing.is_ok() || !existing.unwrap_err().is(ErrorCode::NotFound)) {
        return existing;
    }

    // No peer yet: the private key would have nowhere to go. The first
    // provision() call issues one. Allocation is atomic in the registry, so
    // this path does not wait for a provision() talking to the VPN.
    auto allocation = allocate(identifier, {});
    if (allocation.is_err()) {
        return Res<Device>::err(allocation.unwrap_err());
    }
    if (allocation.unwrap().allocated) {
        qCInfo(jitstreamerProvisionLog) << "Registered" << identifier.c_str()
                                        << "at" << allocation.unwrap().device.address.c_str();
    }
    return Res<Device>::ok(allocation.unwrap().device);
}

Res<uint64_t> PeerProvisioner::resync() {
    auto devices = registry_.list();
    if (devices.is_err()) {
        return Res<uint64_t>::err(devices.unwrap_err());
    }

    std::lock_guard lock(mutex_);
    uint64_t applied = 0;
    for (const auto& device : devices.unwrap()) {
        if (device.public_key.empty()) continue;
        auto result = vpn_.apply_peer(device.public_key, device.address, pool_.host_prefix());
        if (result.is_err()) {
            return Res<uint64_t>::err(result.unwrap_err());
        }
        ++applied;
    }
    qCInfo(jitstreamerProvisionLog) << "Re-applied" << applied << "peers";
    return Res<uint64_t>::ok(applied);
}

} // namespace jitstreamer::provision
