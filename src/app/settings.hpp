#pragma once

#include "activation/orchestrator.hpp"
#include "core/device.hpp"
#include "core/result.hpp"
#include "provision/peer_config.hpp"
#include <QCommandLineParser>
#include <QProcessEnvironment>
#include <QString>
#include <chrono>
#include <cstdint>

namespace jitstreamer::app {

/**
 * Settings - Everything the server process is configured with.
 *
 * Environment variables are read first, command-line options override
 * them. Defaults match a stock deployment.
 */
struct Settings {
    uint16_t port = 9172;
    QString db_path = QStringLiteral("jitstreamer.db");
    QString log_file;
    bool verbose = false;

    size_t runners = 10;
    std::chrono::milliseconds job_timeout{60000};
    std::chrono::milliseconds cooldown{10000};
    std::chrono::milliseconds retention{300000};
    std::chrono::milliseconds kill_grace{2000};

    RegistrationPolicy registration = RegistrationPolicy::enabled();
    QString address_pool = QStringLiteral("fd00::2-fd00::ffff");
    QString worker = QStringLiteral("python3 runners/launch.py {udid} {address}");
    QString pairing_dir = QStringLiteral("/var/lib/lockdown");

    bool vpn_enabled = true;
    QString wireguard_interface = QStringLiteral("jitstreamer");
    provision::ServerPeerSettings server;
};

/**
 * Register the command-line options load_settings() understands.
 */
void add_options(QCommandLineParser& parser);

/**
 * Build Settings from `env` and an already-parsed `parser`.
 * Invalid values fail with InvalidArgument naming the variable or option.
 */
[[nodiscard]] Res<Settings> load_settings(const QCommandLineParser& parser,
                                          const QProcessEnvironment& env = QProcessEnvironment::systemEnvironment());

/**
 * Split the worker command line into program and arguments.
 */
[[nodiscard]] Res<activation::WorkerCommand> worker_command(const Settings& settings);

} // namespace jitstreamer::app
