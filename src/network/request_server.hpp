#pragma once

#include "activation/orchestrator.hpp"
#include "core/result.hpp"
#include <QHostAddress>
#include <QJsonObject>
#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>
#include <chrono>
#include <memory>

namespace jitstreamer::network {

/**
 * Oldest client version the server still talks to.
 */
inline constexpr const char* MINIMUM_CLIENT_VERSION = "0.0.1";

/**
 * Component-wise version comparison ("0.1" >= "0.0.9"). Unparseable
 * versions are never supported.
 */
[[nodiscard]] bool version_supported(const QString& client_version,
                                     const QString& minimum = QString::fromLatin1(MINIMUM_CLIENT_VERSION));

/**
 * Failure reply: {"ok": false, "status": <stable status>, "error": <message>}.
 */
[[nodiscard]] QJsonObject error_reply(const Error& error);

/**
 * RequestServer - Line-delimited JSON front end for the orchestrator.
 *
 * One request object per line, one reply object per line:
 *
 *   {"cmd":"version","version":"0.1.0"}
 *   {"cmd":"register","udid":"...","pairing":"<base64 plist>"}
 *   {"cmd":"activate","udid":"..."}             (or "address", or neither)
 *   {"cmd":"activate","pairing":"<base64 plist>"}  (UDID read from the plist)
 *   {"cmd":"status","session":"<uuid>"}
 *   {"cmd":"await","session":"<uuid>","timeout_ms":30000}
 *   {"cmd":"queue","udid":"..."}
 *
 * An activate without udid or address resolves the device from the
 * connection's source address, which is the device's tunnel address.
 * "await" replies asynchronously; every other command answers inline.
 */
class RequestServer : public QObject {
    Q_OBJECT

public:
    static constexpr qsizetype MAX_LINE_BYTES = 1 << 20;
    static constexpr std::chrono::milliseconds MAX_AWAIT{120000};

    explicit RequestServer(activation::Orchestrator& orchestrator, QObject* parent = nullptr);
    ~RequestServer() override;

    /**
     * Start listening.
     * @return The actual port (useful with port 0)
     */
    Result<uint16_t, Error> listen(const QHostAddress& address, uint16_t port);

    void close();

    [[nodiscard]] uint16_t port() const;
    [[nodiscard]] bool isListening() const;

    /**
     * Answer one request synchronously. "await" is answered with the
     * session's current state (no waiting).
     */
    [[nodiscard]] QJsonObject handle(const QJsonObject& request, const QHostAddress& peer);

signals:
    void requestHandled(const QString& command, const QString& status);

private slots:
    void onNewConnection();

private:
    activation::Orchestrator& orchestrator_;
    std::unique_ptr<QTcpServer> server_;

    void onReadyRead(QTcpSocket* socket);
    void processLine(QTcpSocket* socket, const QByteArray& line);
    void beginAwait(QTcpSocket* socket, const QJsonObject& request);
    void reply(QTcpSocket* socket, const QJsonObject& response);

    [[nodiscard]] QJsonObject handleVersion(const QJsonObject& request);
    [[nodiscard]] QJsonObject handleRegister(const QJsonObject& request, const QHostAddress& peer);
    [[nodiscard]] QJsonObject handleActivate(const QJsonObject& request, const QHostAddress& peer);
    [[nodiscard]] QJsonObject handleStatus(const QJsonObject& request);
    [[nodiscard]] QJsonObject handleQueue(const QJsonObject& request);
};

} // namespace jitstreamer::network
