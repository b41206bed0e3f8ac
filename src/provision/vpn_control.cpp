#include "provision/vpn_control.hpp"

#include <QLoggingCategory>
#include <QProcess>

Q_LOGGING_CATEGORY(jitstreamerVpnLog, "jitstreamer.provision.vpn")

namespace jitstreamer::provision {

WgCommandControl::WgCommandControl(QString interface_name,
                                   QString wg_program,
                                   std::chrono::milliseconds timeout,
                                   int persistent_keepalive)
    : interface_(std::move(interface_name))
    , program_(std::move(wg_program))
    , timeout_(timeout)
    , keepalive_(persistent_keepalive) {}

Result<QByteArray, Error> WgCommandControl::run(const QStringList& arguments) {
    QProcess process;
    process.setProgram(program_);
    process.setArguments(arguments);
    process.start();

    const int timeout_ms = static_cast<int>(timeout_.count());
    if (!process.waitForStarted(timeout_ms)) {
        return fail<QByteArray>(ErrorCode::UpstreamUnavailable,
            "Cannot start " + program_.toStdString() + ": " + process.errorString().toStdString());
    }
    if (!process.waitForFinished(timeout_ms)) {
        process.kill();
        process.waitForFinished(timeout_ms);
        return fail<QByteArray>(ErrorCode::UpstreamUnavailable,
            program_.toStdString() + " did not finish in time");
    }
    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        const auto stderr_text = QString::fromUtf8(process.readAllStandardError()).trimmed();
        return fail<QByteArray>(ErrorCode::UpstreamUnavailable,
            program_.toStdString() + " " + arguments.join(QLatin1Char(' ')).toStdString() +
            " failed: " + stderr_text.toStdString(), process.exitCode());
    }
    return Result<QByteArray, Error>::ok(process.readAllStandardOutput());
}

Result<void, Error> WgCommandControl::apply_peer(const std::string& public_key,
                                                 const std::string& address,
                                                 int prefix) {
    QStringList args{
        QStringLiteral("set"), interface_,
        QStringLiteral("peer"), QString::fromStdString(public_key),
        QStringLiteral("allowed-ips"), QString::fromStdString(address) + QLatin1Char('/') + QString::number(prefix)
    };
    if (keepalive_ > 0) {
        args << QStringLiteral("persistent-keepalive") << QString::number(keepalive_);
    }

    auto result = run(args);
    if (result.is_err()) {
        qCWarning(jitstreamerVpnLog) << "wg set failed for" << address.c_str() << ":"
                                     << result.unwrap_err().message.c_str();
        return Result<void, Error>::err(result.unwrap_err());
    }
    qCDebug(jitstreamerVpnLog) << "Applied peer" << public_key.c_str() << "->" << address.c_str();
    return Result<void, Error>::ok();
}

Result<void, Error> WgCommandControl::remove_peer(const std::string& public_key) {
    auto result = run({QStringLiteral("set"), interface_,
                       QStringLiteral("peer"), QString::fromStdString(public_key),
                       QStringLiteral("remove")});
    if (result.is_err()) {
        return Result<void, Error>::err(result.unwrap_err());
    }
    qCDebug(jitstreamerVpnLog) << "Removed peer" << public_key.c_str();
    return Result<void, Error>::ok();
}

Result<std::string, Error> WgCommandControl::server_public_key() {
    auto result = run({QStringLiteral("show"), interface_, QStringLiteral("public-key")});
    if (result.is_err()) {
        return Result<std::string, Error>::err(result.unwrap_err());
    }
    const auto key = QString::fromUtf8(result.unwrap()).trimmed();
    if (key.isEmpty()) {
        return fail<std::string>(ErrorCode::UpstreamUnavailable,
            "Interface " + interface_.toStdString() + " reported no public key");
    }
    return Result<std::string, Error>::ok(key.toStdString());
}

} // namespace jitstreamer::provision
