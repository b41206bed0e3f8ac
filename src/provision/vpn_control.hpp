#pragma once

#include "core/result.hpp"
#include <QString>
#include <QStringList>
#include <chrono>
#include <string>

namespace jitstreamer::provision {

/**
 * VpnControl - Control plane of the VPN daemon.
 *
 * Implementations report UpstreamUnavailable when the daemon cannot be
 * reached or refuses the change.
 */
class VpnControl {
public:
    virtual ~VpnControl() = default;

    /**
     * Add or update the peer `public_key`, routing `address`/`prefix` to it.
     */
    [[nodiscard]] virtual Result<void, Error> apply_peer(const std::string& public_key,
                                                         const std::string& address,
                                                         int prefix) = 0;

    [[nodiscard]] virtual Result<void, Error> remove_peer(const std::string& public_key) = 0;
};

/**
 * WgCommandControl - Drives a WireGuard interface with the `wg` tool.
 *
 *   wg set <iface> peer <key> allowed-ips <addr>/<prefix> persistent-keepalive 20
 *   wg set <iface> peer <key> remove
 *   wg show <iface> public-key
 */
class WgCommandControl final : public VpnControl {
public:
    explicit WgCommandControl(QString interface_name,
                              QString wg_program = QStringLiteral("wg"),
                              std::chrono::milliseconds timeout = std::chrono::seconds(5),
                              int persistent_keepalive = 20);

    [[nodiscard]] Result<void, Error> apply_peer(const std::string& public_key,
                                                 const std::string& address,
                                                 int prefix) override;
    [[nodiscard]] Result<void, Error> remove_peer(const std::string& public_key) override;

    /**
     * Public key of the server interface, for client configs.
     */
    [[nodiscard]] Result<std::string, Error> server_public_key();

private:
    QString interface_;
    QString program_;
    std::chrono::milliseconds timeout_;
    int keepalive_;

    [[nodiscard]] Result<QByteArray, Error> run(const QStringList& arguments);
};

/**
 * NullVpnControl - Accepts every change without a VPN daemon. Used when
 * devices reach the server directly (no tunnel to manage).
 */
class NullVpnControl final : public VpnControl {
public:
    [[nodiscard]] Result<void, Error> apply_peer(const std::string&, const std::string&, int) override {
        return Result<void, Error>::ok();
    }
    [[nodiscard]] Result<void, Error> remove_peer(const std::string&) override {
        return Result<void, Error>::ok();
    }
};

} // namespace jitstreamer::provision
