#pragma once

#include "core/address_pool.hpp"
#include "core/device.hpp"
#include "core/result.hpp"
#include "provision/peer_config.hpp"
#include "provision/vpn_control.hpp"
#include "registry/device_registry.hpp"
#include <mutex>
#include <string>

namespace jitstreamer::provision {

/**
 * ProvisionResult - The peer configuration handed back to a client.
 * `allocated` is true when this call assigned the device its address.
 * `direct` registrations carry an address but no keys.
 */
struct ProvisionResult {
    PeerConfig config;
    bool allocated = false;
    bool direct = false;
};

/**
 * PeerProvisioner - Lookup-or-create of a device's VPN identity.
 *
 * New devices get the lowest free pool address and a fresh key pair. The
 * address is committed first and the peer applied after, outside the
 * registry lock; a daemon failure removes the record again. Known devices
 * keep their address and get a new key pair on every provision().
 */
class PeerProvisioner {
public:
    PeerProvisioner(registry::DeviceRegistry& registry,
                    VpnControl& vpn,
                    AddressPool pool,
                    ServerPeerSettings server);

    /**
     * Issue a peer configuration for `identifier`, registering it if new.
     *
     * Errors: InvalidArgument, RegistrationDisabled, PoolExhausted,
     * UpstreamUnavailable, Storage.
     */
    [[nodiscard]] Res<ProvisionResult> provision(const std::string& identifier);

    /**
     * Make sure `identifier` has an address. New devices are registered
     * without a VPN peer; existing devices are returned as-is.
     */
    [[nodiscard]] Res<Device> ensure_registered(const std::string& identifier);

    /**
     * Register `identifier` at the address its request came from, with no
     * VPN peer. Used when the registration policy is direct.
     */
    [[nodiscard]] Res<Device> register_direct(const std::string& identifier, const std::string& address);

    /**
     * Re-apply every stored peer to the VPN daemon. Returns the number of
     * peers applied; devices without a public key are skipped.
     */
    [[nodiscard]] Res<uint64_t> resync();

    [[nodiscard]] const AddressPool& pool() const { return pool_; }
    [[nodiscard]] const ServerPeerSettings& server() const { return server_; }

private:
    registry::DeviceRegistry& registry_;
    VpnControl& vpn_;
    AddressPool pool_;
    ServerPeerSettings server_;
    std::mutex mutex_;

    [[nodiscard]] Res<registry::Allocation> allocate(const std::string& identifier,
                                                     const std::string& public_key);
    [[nodiscard]] Res<ProvisionResult> rotate(const Device& device);
};

} // namespace jitstreamer::provision
