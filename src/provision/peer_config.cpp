#include "provision/peer_config.hpp"

#include <sstream>

namespace jitstreamer::provision {

PeerConfig make_peer_config(const Device& device,
                            const crypto::KeyPair& keys,
                            int prefix,
                            const ServerPeerSettings& server) {
    return PeerConfig{
        .identifier = device.identifier,
        .address = device.address,
        .prefix = prefix,
        .private_key = crypto::to_base64(keys.secret_key),
        .public_key = crypto::to_base64(keys.public_key),
        .server = server
    };
}

std::string format_endpoint(const std::string& host, uint16_t port) {
    const bool bare_ipv6 = !host.empty() && host.front() != '[' &&
                           host.find(':') != std::string::npos;
    std::string out = bare_ipv6 ? "[" + host + "]" : host;
    return out + ":" + std::to_string(port);
}

std::string render_client_config(const PeerConfig& config) {
    std::ostringstream out;
    out << "[Interface]\n"
        << "PrivateKey = " << config.private_key << "\n"
        << "Address = " << config.address << "/" << config.prefix << "\n"
        << "\n"
        << "[Peer]\n"
        << "PublicKey = " << config.server.public_key << "\n"
        << "AllowedIPs = " << config.server.allowed_ips << "\n"
        << "Endpoint = " << format_endpoint(config.server.endpoint, config.server.port) << "\n";
    if (config.server.persistent_keepalive > 0) {
        out << "PersistentKeepalive = " << config.server.persistent_keepalive << "\n";
    }
    return out.str();
}

} // namespace jitstreamer::provision
