#pragma once

#include "core/device.hpp"
#include "crypto/keys.hpp"
#include <cstdint>
#include <string>

namespace jitstreamer::provision {

/**
 * ServerPeerSettings - The server side of every client tunnel.
 */
struct ServerPeerSettings {
    std::string public_key;
    std::string endpoint = "jitstreamer.jkcoxson.com";
    uint16_t port = 51869;
    std::string allowed_ips = "fd00::/64";
    int persistent_keepalive = 20;
};

/**
 * PeerConfig - A device's VPN identity, as handed back to the client.
 *
 * Only the public key is persisted (in the registry). The private key
 * exists in this struct and in the rendered file, nowhere else.
 */
struct PeerConfig {
    std::string identifier;
    std::string address;
    int prefix = 128;
    std::string private_key;
    std::string public_key;
    ServerPeerSettings server;
};

/**
 * Bind a freshly generated key pair to a registered device.
 */
[[nodiscard]] PeerConfig make_peer_config(const Device& device,
                                          const crypto::KeyPair& keys,
                                          int prefix,
                                          const ServerPeerSettings& server);

/**
 * WireGuard client configuration (wg-quick format).
 */
[[nodiscard]] std::string render_client_config(const PeerConfig& config);

/**
 * host:port, bracketing IPv6 literals.
 */
[[nodiscard]] std::string format_endpoint(const std::string& host, uint16_t port);

} // namespace jitstreamer::provision
