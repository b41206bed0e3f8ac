#include <QCoreApplication>
#include <QCommandLineParser>
#include <QHostAddress>
#include <QLoggingCategory>
#include <QSocketNotifier>
#include <QTimer>
#include <algorithm>
#include <csignal>
#include <memory>
#include <sys/socket.h>
#include <unistd.h>

#include "activation/orchestrator.hpp"
#include "activation/session_manager.hpp"
#include "activation/worker_pool.hpp"
#include "app/logging.hpp"
#include "app/settings.hpp"
#include "crypto/keys.hpp"
#include "network/request_server.hpp"
#include "provision/peer_provisioner.hpp"
#include "provision/vpn_control.hpp"
#include "registry/sqlite_device_registry.hpp"
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/pairing_store.hpp"

Q_LOGGING_CATEGORY(jitstreamerMainLog, "jitstreamer.main")

namespace {

int signal_fds[2] = {-1, -1};

// Only async-signal-safe work here; the event loop picks up the byte.
void forward_signal(int) {
    const char byte = 1;
    [[maybe_unused]] auto written = ::write(signal_fds[0], &byte, 1);
}

} // namespace

int main(int argc, char *argv[])
{
    using namespace jitstreamer;

    QCoreApplication app(argc, argv);
    app.setApplicationName("jitstreamer");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("JIT activation server"));
    parser.addHelpOption();
    parser.addVersionOption();
    app::add_options(parser);
    parser.process(app);

    auto settings_result = app::load_settings(parser);
    if (settings_result.is_err()) {
        qCritical() << "Invalid configuration:" << settings_result.unwrap_err().message.c_str();
        return 2;
    }
    auto settings = std::move(settings_result).unwrap();

    auto logging = app::install_logging(settings.log_file);
    if (logging.is_err()) {
        qCritical() << logging.unwrap_err().message.c_str();
        return 2;
    }
    if (settings.verbose) {
        app::enable_debug_logging();
    }

    auto crypto_result = crypto::init();
    if (crypto_result.is_err()) {
        qCritical() << "Failed to initialize crypto:" << crypto_result.unwrap_err().message.c_str();
        return 1;
    }

    auto pool_result = AddressPool::parse(settings.address_pool.toStdString());
    if (pool_result.is_err()) {
        qCritical() << "Invalid address pool:" << pool_result.unwrap_err().message.c_str();
        return 2;
    }
    auto command_result = app::worker_command(settings);
    if (command_result.is_err()) {
        qCritical() << command_result.unwrap_err().message.c_str();
        return 2;
    }

    auto db_result = storage::Database::open(settings.db_path.toStdString());
    if (db_result.is_err()) {
        qCritical() << "Cannot open" << settings.db_path << ":" << db_result.unwrap_err().message.c_str();
        return 1;
    }
    auto db = std::move(db_result).unwrap();
    auto migrated = storage::initialize_database(db);
    if (migrated.is_err()) {
        qCritical() << "Schema migration failed:" << migrated.unwrap_err().message.c_str();
        return 1;
    }

    registry::SqliteDeviceRegistry registry(db);
    registry.allow_registration(settings.registration);

    std::unique_ptr<provision::VpnControl> vpn;
    if (settings.vpn_enabled) {
        auto wg = std::make_unique<provision::WgCommandControl>(settings.wireguard_interface);
        if (settings.server.public_key.empty()) {
            auto key = wg->server_public_key();
            if (key.is_err()) {
                qCritical() << "Cannot read the server's WireGuard key:" << key.unwrap_err().message.c_str();
                return 1;
            }
            settings.server.public_key = key.unwrap();
        }
        vpn = std::move(wg);
    } else {
        qCInfo(jitstreamerMainLog) << "VPN peer management disabled";
        vpn = std::make_unique<provision::NullVpnControl>();
    }

    provision::PeerProvisioner provisioner(registry, *vpn, pool_result.unwrap(), settings.server);
    auto resynced = provisioner.resync();
    if (resynced.is_err()) {
        qCWarning(jitstreamerMainLog) << "Could not restore VPN peers:" << resynced.unwrap_err().message.c_str();
    }

    storage::PairingStore pairing_store(settings.pairing_dir);
    activation::SessionManager sessions(settings.cooldown, settings.retention);
    activation::WorkerPool workers(activation::WorkerPool::Options{
        .capacity = settings.runners,
        .kill_grace = settings.kill_grace
    });
    activation::Orchestrator orchestrator(registry, provisioner, pairing_store, sessions, workers,
                                          command_result.unwrap());

    network::RequestServer server(orchestrator);
    auto listening = server.listen(QHostAddress::Any, settings.port);
    if (listening.is_err()) {
        qCritical() << listening.unwrap_err().message.c_str();
        return 1;
    }

    QTimer prune_timer;
    const auto prune_every = std::max<int64_t>(1000, settings.retention.count() / 4);
    prune_timer.setInterval(static_cast<int>(std::min<int64_t>(prune_every, 60000)));
    QObject::connect(&prune_timer, &QTimer::timeout, [&orchestrator]() {
        orchestrator.prune_sessions();
    });
    prune_timer.start();

    std::unique_ptr<QSocketNotifier> signal_notifier;
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, signal_fds) == 0) {
        signal_notifier = std::make_unique<QSocketNotifier>(signal_fds[1], QSocketNotifier::Read);
        QObject::connect(signal_notifier.get(), &QSocketNotifier::activated, [&]() {
            char byte = 0;
            [[maybe_unused]] auto got = ::read(signal_fds[1], &byte, 1);
            qCInfo(jitstreamerMainLog) << "Termination requested";
            QCoreApplication::quit();
        });
        std::signal(SIGINT, forward_signal);
        std::signal(SIGTERM, forward_signal);
    } else {
        qCWarning(jitstreamerMainLog) << "No signal socket; SIGTERM will not shut down cleanly";
    }
    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() {
        server.close();
        orchestrator.shutdown();
    });

    qCInfo(jitstreamerMainLog) << "jitstreamer ready:" << settings.runners << "runners, pool"
                               << settings.address_pool << "registration"
                               << to_string(settings.registration).c_str();
    return app.exec();
}
