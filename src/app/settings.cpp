#include "app/settings.hpp"

#include <QProcess>
#include <limits>

namespace jitstreamer::app {

namespace {

const QCommandLineOption& port_option() {
    static const QCommandLineOption opt(QStringList{QStringLiteral("p"), QStringLiteral("port")},
        QStringLiteral("TCP port to listen on (JITSTREAMER_PORT)."), QStringLiteral("port"));
    return opt;
}

const QCommandLineOption& db_option() {
    static const QCommandLineOption opt(QStringList{QStringLiteral("db")},
        QStringLiteral("Device registry database (JITSTREAMER_DB_PATH)."), QStringLiteral("path"));
    return opt;
}

const QCommandLineOption& log_file_option() {
    static const QCommandLineOption opt(QStringList{QStringLiteral("log-file")},
        QStringLiteral("Also append log lines to this file (JITSTREAMER_LOG_FILE)."), QStringLiteral("path"));
    return opt;
}

const QCommandLineOption& runners_option() {
    static const QCommandLineOption opt(QStringList{QStringLiteral("runners")},
        QStringLiteral("Concurrent activation workers (RUNNER_COUNT)."), QStringLiteral("count"));
    return opt;
}

const QCommandLineOption& job_timeout_option() {
    static const QCommandLineOption opt(QStringList{QStringLiteral("job-timeout")},
        QStringLiteral("Worker deadline in ms (JITSTREAMER_JOB_TIMEOUT_MS)."), QStringLiteral("ms"));
    return opt;
}

const QCommandLineOption& cooldown_option() {
    static const QCommandLineOption opt(QStringList{QStringLiteral("cooldown")},
        QStringLiteral("Minimum ms between activations of one device (JITSTREAMER_COOLDOWN_MS)."),
        QStringLiteral("ms"));
    return opt;
}

const QCommandLineOption& registration_option() {
    static const QCommandLineOption opt(QStringList{QStringLiteral("registration")},
        QStringLiteral("disabled, enabled, direct or enabled_with_cap:N (ALLOW_REGISTRATION)."),
        QStringLiteral("policy"));
    return opt;
}

const QCommandLineOption& pool_option() {
    static const QCommandLineOption opt(QStringList{QStringLiteral("pool")},
        QStringLiteral("Tunnel address pool, e.g. fd00::2-fd00::ffff (JITSTREAMER_ADDRESS_POOL)."),
        QStringLiteral("range"));
    return opt;
}

const QCommandLineOption& worker_option() {
    static const QCommandLineOption opt(QStringList{QStringLiteral("worker")},
        QStringLiteral("Activation worker command (JITSTREAMER_WORKER)."), QStringLiteral("command"));
    return opt;
}

const QCommandLineOption& pairing_dir_option() {
    static const QCommandLineOption opt(QStringList{QStringLiteral("pairing-dir")},
        QStringLiteral("Where pairing files are stored (PLIST_STORAGE)."), QStringLiteral("dir"));
    return opt;
}

const QCommandLineOption& no_vpn_option() {
    static const QCommandLineOption opt(QStringList{QStringLiteral("no-vpn")},
        QStringLiteral("Do not manage WireGuard peers (JITSTREAMER_VPN=none)."));
    return opt;
}

const QCommandLineOption& verbose_option() {
    static const QCommandLineOption opt(QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
        QStringLiteral("Enable debug logging."));
    return opt;
}

Res<uint64_t> parse_number(const QString& text, const QString& name, uint64_t min, uint64_t max) {
    bool ok = false;
    const auto value = text.trimmed().toULongLong(&ok);
    if (!ok || value < min || value > max) {
        return fail<uint64_t>(ErrorCode::InvalidArgument,
            name.toStdString() + " must be a number between " + std::to_string(min) +
            " and " + std::to_string(max) + ", got '" + text.toStdString() + "'");
    }
    return Res<uint64_t>::ok(value);
}

/**
 * Value from the command line if given, else from the environment.
 * `name` is set to whichever source supplied the value.
 */
std::optional<QString> lookup(const QCommandLineParser& parser,
                              const QCommandLineOption* option,
                              const QProcessEnvironment& env,
                              const QString& variable,
                              QString& name) {
    if (option && parser.isSet(*option)) {
        name = QStringLiteral("--") + option->names().last();
        return parser.value(*option);
    }
    if (env.contains(variable) && !env.value(variable).isEmpty()) {
        name = variable;
        return env.value(variable);
    }
    return std::nullopt;
}

Result<void, Error> read_number(const QCommandLineParser& parser,
                                const QCommandLineOption* option,
                                const QProcessEnvironment& env,
                                const QString& variable,
                                uint64_t min, uint64_t max,
                                uint64_t& out) {
    QString name;
    auto text = lookup(parser, option, env, variable, name);
    if (!text) {
        return Result<void, Error>::ok();
    }
    auto value = parse_number(*text, name, min, max);
    if (value.is_err()) {
        return Result<void, Error>::err(value.unwrap_err());
    }
    out = value.unwrap();
    return Result<void, Error>::ok();
}

Result<void, Error> read_millis(const QCommandLineParser& parser,
                                const QCommandLineOption* option,
                                const QProcessEnvironment& env,
                                const QString& variable,
                                std::chrono::milliseconds& out) {
    uint64_t value = static_cast<uint64_t>(out.count());
    auto read = read_number(parser, option, env, variable, 0,
                            static_cast<uint64_t>(std::numeric_limits<int>::max()), value);
    if (read.is_ok()) {
        out = std::chrono::milliseconds(static_cast<int64_t>(value));
    }
    return read;
}

QString read_string(const QCommandLineParser& parser,
                    const QCommandLineOption* option,
                    const QProcessEnvironment& env,
                    const QString& variable,
                    const QString& fallback) {
    QString name;
    return lookup(parser, option, env, variable, name).value_or(fallback);
}

} // namespace

void add_options(QCommandLineParser& parser) {
    parser.addOption(port_option());
    parser.addOption(db_option());
    parser.addOption(log_file_option());
    parser.addOption(runners_option());
    parser.addOption(job_timeout_option());
    parser.addOption(cooldown_option());
    parser.addOption(registration_option());
    parser.addOption(pool_option());
    parser.addOption(worker_option());
    parser.addOption(pairing_dir_option());
    parser.addOption(no_vpn_option());
    parser.addOption(verbose_option());
}

Res<Settings> load_settings(const QCommandLineParser& parser, const QProcessEnvironment& env) {
    Settings s;

    uint64_t port = s.port;
    uint64_t runners = s.runners;
    uint64_t wg_port = s.server.port;
    for (auto read : {
             read_number(parser, &port_option(), env, QStringLiteral("JITSTREAMER_PORT"), 0, 65535, port),
             read_number(parser, &runners_option(), env, QStringLiteral("RUNNER_COUNT"), 1, 1024, runners),
             read_number(parser, nullptr, env, QStringLiteral("WIREGUARD_PORT"), 1, 65535, wg_port),
             read_millis(parser, &job_timeout_option(), env, QStringLiteral("JITSTREAMER_JOB_TIMEOUT_MS"), s.job_timeout),
             read_millis(parser, &cooldown_option(), env, QStringLiteral("JITSTREAMER_COOLDOWN_MS"), s.cooldown),
             read_millis(parser, nullptr, env, QStringLiteral("JITSTREAMER_RETENTION_MS"), s.retention),
             read_millis(parser, nullptr, env, QStringLiteral("JITSTREAMER_KILL_GRACE_MS"), s.kill_grace)}) {
        if (read.is_err()) {
            return Res<Settings>::err(read.unwrap_err());
        }
    }
    s.port = static_cast<uint16_t>(port);
    s.runners = static_cast<size_t>(runners);
    s.server.port = static_cast<uint16_t>(wg_port);

    if (s.job_timeout.count() == 0) {
        return fail<Settings>(ErrorCode::InvalidArgument, "Job timeout must be positive");
    }

    QString policy_name;
    if (auto text = lookup(parser, &registration_option(), env, QStringLiteral("ALLOW_REGISTRATION"), policy_name)) {
        auto policy = parse_registration_policy(text->trimmed().toStdString());
        if (policy.is_err()) {
            return fail<Settings>(ErrorCode::InvalidArgument,
                policy_name.toStdString() + ": " + policy.unwrap_err().message);
        }
        s.registration = policy.unwrap();
    }
    uint64_t cap = 0;
    QString cap_name;
    if (auto text = lookup(parser, nullptr, env, QStringLiteral("JITSTREAMER_REGISTRATION_CAP"), cap_name)) {
        auto parsed = parse_number(*text, cap_name, 0, std::numeric_limits<uint32_t>::max());
        if (parsed.is_err()) {
            return Res<Settings>::err(parsed.unwrap_err());
        }
        cap = parsed.unwrap();
        // A cap only bounds pool registrations.
        if (s.registration.mode == RegistrationPolicy::Mode::Enabled ||
            s.registration.mode == RegistrationPolicy::Mode::EnabledWithCap) {
            s.registration = RegistrationPolicy::enabled_with_cap(cap);
        }
    }

    s.db_path = read_string(parser, &db_option(), env, QStringLiteral("JITSTREAMER_DB_PATH"), s.db_path);
    s.log_file = read_string(parser, &log_file_option(), env, QStringLiteral("JITSTREAMER_LOG_FILE"), s.log_file);
    s.address_pool = read_string(parser, &pool_option(), env, QStringLiteral("JITSTREAMER_ADDRESS_POOL"), s.address_pool);
    s.worker = read_string(parser, &worker_option(), env, QStringLiteral("JITSTREAMER_WORKER"), s.worker);
    s.pairing_dir = read_string(parser, &pairing_dir_option(), env, QStringLiteral("PLIST_STORAGE"), s.pairing_dir);
    s.wireguard_interface = read_string(parser, nullptr, env, QStringLiteral("WIREGUARD_CONFIG_NAME"),
                                        s.wireguard_interface);
    s.server.endpoint = read_string(parser, nullptr, env, QStringLiteral("WIREGUARD_ENDPOINT"),
                                    QString::fromStdString(s.server.endpoint)).toStdString();
    s.server.allowed_ips = read_string(parser, nullptr, env, QStringLiteral("WIREGUARD_SERVER_ALLOWED_IPS"),
                                       QString::fromStdString(s.server.allowed_ips)).toStdString();
    s.server.public_key = read_string(parser, nullptr, env, QStringLiteral("WIREGUARD_SERVER_PUBLIC_KEY"),
                                      QString{}).toStdString();

    const auto vpn = read_string(parser, nullptr, env, QStringLiteral("JITSTREAMER_VPN"), QStringLiteral("wg"));
    if (vpn != QStringLiteral("wg") && vpn != QStringLiteral("none")) {
        return fail<Settings>(ErrorCode::InvalidArgument,
            "JITSTREAMER_VPN must be 'wg' or 'none', got '" + vpn.toStdString() + "'");
    }
    s.vpn_enabled = vpn == QStringLiteral("wg") && !parser.isSet(no_vpn_option());
    s.verbose = parser.isSet(verbose_option());

    if (s.address_pool.trimmed().isEmpty()) {
        return fail<Settings>(ErrorCode::InvalidArgument, "Address pool must not be empty");
    }
    return Res<Settings>::ok(std::move(s));
}

Res<activation::WorkerCommand> worker_command(const Settings& settings) {
    auto parts = QProcess::splitCommand(settings.worker);
    if (parts.isEmpty()) {
        return fail<activation::WorkerCommand>(ErrorCode::InvalidArgument, "Worker command is empty");
    }
    activation::WorkerCommand command;
    command.program = parts.takeFirst();
    command.arguments = std::move(parts);
    command.timeout = settings.job_timeout;
    return Res<activation::WorkerCommand>::ok(std::move(command));
}

} // namespace jitstreamer::app
