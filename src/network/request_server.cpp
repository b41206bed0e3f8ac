#include "network/request_server.hpp"

#include "core/session.hpp"
#include <QFutureWatcher>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QPromise>
#include <QRegularExpression>
#include <QTimer>
#include <QVersionNumber>
#include <algorithm>
#include <memory>

Q_LOGGING_CATEGORY(jitstreamerServerLog, "jitstreamer.server")

namespace jitstreamer::network {

namespace {

QJsonObject invalid(const QString& message) {
    return error_reply(Error{message.toStdString(), ErrorCode::InvalidArgument});
}

QString qstr(std::string_view text) {
    return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
}

QJsonObject snapshot_to_json(const SessionSnapshot& snapshot) {
    QJsonObject obj;
    obj[QStringLiteral("ok")] = true;
    obj[QStringLiteral("session")] = QString::fromStdString(snapshot.id.to_string());
    obj[QStringLiteral("udid")] = QString::fromStdString(snapshot.device_identifier);
    obj[QStringLiteral("state")] = qstr(to_string(snapshot.state));
    obj[QStringLiteral("created_at")] = QString::fromStdString(snapshot.created_at.to_iso_string());
    if (snapshot.outcome) {
        obj[QStringLiteral("status")] = qstr(status_string(snapshot.outcome->kind));
        if (!snapshot.outcome->detail.empty()) {
            obj[QStringLiteral("detail")] = QString::fromStdString(snapshot.outcome->detail);
        }
    } else {
        obj[QStringLiteral("status")] = QStringLiteral("pending");
    }
    if (snapshot.finished_at) {
        obj[QStringLiteral("finished_at")] = QString::fromStdString(snapshot.finished_at->to_iso_string());
    }
    return obj;
}

std::optional<Uuid> session_id_of(const QJsonObject& request) {
    return Uuid::parse(request.value(QStringLiteral("session")).toString().toStdString());
}

QHostAddress unmapped(const QHostAddress& address) {
    bool is_v4 = false;
    const quint32 v4 = address.toIPv4Address(&is_v4);
    return is_v4 ? QHostAddress(v4) : address;
}

} // namespace

bool version_supported(const QString& client_version, const QString& minimum) {
    static const QRegularExpression pattern(QStringLiteral("^\\d+(\\.\\d+)*$"));
    const auto text = client_version.trimmed();
    if (!pattern.match(text).hasMatch()) {
        return false;
    }
    return QVersionNumber::compare(QVersionNumber::fromString(text),
                                   QVersionNumber::fromString(minimum)) >= 0;
}

QJsonObject error_reply(const Error& error) {
    QJsonObject obj;
    obj[QStringLiteral("ok")] = false;
    obj[QStringLiteral("status")] = qstr(to_string(error.code));
    obj[QStringLiteral("error")] = QString::fromStdString(error.message);
    return obj;
}

RequestServer::RequestServer(activation::Orchestrator& orchestrator, QObject* parent)
    : QObject(parent)
    , orchestrator_(orchestrator)
    , server_(std::make_unique<QTcpServer>(this))
{
    connect(server_.get(), &QTcpServer::newConnection,
            this, &RequestServer::onNewConnection);
}

RequestServer::~RequestServer() {
    close();
}

Result<uint16_t, Error> RequestServer::listen(const QHostAddress& address, uint16_t port) {
    if (!server_->listen(address, port)) {
        return fail<uint16_t>(ErrorCode::Internal,
            "Cannot listen on port " + std::to_string(port) + ": " + server_->errorString().toStdString());
    }
    qCInfo(jitstreamerServerLog) << "Listening on" << address.toString() << server_->serverPort();
    return Result<uint16_t, Error>::ok(server_->serverPort());
}

void RequestServer::close() {
    server_->close();
}

uint16_t RequestServer::port() const {
    return server_->serverPort();
}

bool RequestServer::isListening() const {
    return server_->isListening();
}

void RequestServer::onNewConnection() {
    while (server_->hasPendingConnections()) {
        QTcpSocket* socket = server_->nextPendingConnection();
        connect(socket, &QTcpSocket::readyRead, this, [this, socket]() { onReadyRead(socket); });
        connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
        qCDebug(jitstreamerServerLog) << "Connection from" << socket->peerAddress().toString();
    }
}

void RequestServer::onReadyRead(QTcpSocket* socket) {
    while (socket->canReadLine()) {
        const auto line = socket->readLine().trimmed();
        if (!line.isEmpty()) {
            processLine(socket, line);
        }
    }
    if (socket->bytesAvailable() > MAX_LINE_BYTES) {
        reply(socket, invalid(QStringLiteral("Request line too long")));
        socket->disconnectFromHost();
    }
}

void RequestServer::processLine(QTcpSocket* socket, const QByteArray& line) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(line, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        reply(socket, invalid(QStringLiteral("Malformed JSON: ") + err.errorString()));
        return;
    }

    const auto request = doc.object();
    if (request.value(QStringLiteral("cmd")).toString() == QStringLiteral("await")) {
        beginAwait(socket, request);
        return;
    }
    reply(socket, handle(request, unmapped(socket->peerAddress())));
}

void RequestServer::reply(QTcpSocket* socket, const QJsonObject& response) {
    if (socket->state() != QAbstractSocket::ConnectedState) {
        return;
    }
    socket->write(QJsonDocument(response).toJson(QJsonDocument::Compact));
    socket->write("\n");
    socket->flush();
}

QJsonObject RequestServer::handle(const QJsonObject& request, const QHostAddress& peer) {
    const auto cmd = request.value(QStringLiteral("cmd")).toString();
    QJsonObject response;
    if (cmd == QStringLiteral("version")) {
        response = handleVersion(request);
    } else if (cmd == QStringLiteral("register")) {
        response = handleRegister(request, peer);
    } else if (cmd == QStringLiteral("activate")) {
        response = handleActivate(request, peer);
    } else if (cmd == QStringLiteral("status") || cmd == QStringLiteral("await")) {
        response = handleStatus(request);
    } else if (cmd == QStringLiteral("queue")) {
        response = handleQueue(request);
    } else {
        response = invalid(QStringLiteral("Unknown command: ") + cmd);
    }

    emit requestHandled(cmd, response.value(QStringLiteral("status")).toString());
    return response;
}

QJsonObject RequestServer::handleVersion(const QJsonObject& request) {
    const auto version = request.value(QStringLiteral("version")).toString();
    const bool ok = version_supported(version);
    QJsonObject obj;
    obj[QStringLiteral("ok")] = ok;
    obj[QStringLiteral("status")] = ok ? QStringLiteral("supported") : QStringLiteral("unsupported");
    obj[QStringLiteral("minimum")] = QString::fromLatin1(MINIMUM_CLIENT_VERSION);
    return obj;
}

QJsonObject RequestServer::handleRegister(const QJsonObject& request, const QHostAddress& peer) {
    const auto udid = request.value(QStringLiteral("udid")).toString().toStdString();
    const auto encoded = request.value(QStringLiteral("pairing")).toString().toLatin1();
    if (encoded.isEmpty()) {
        return invalid(QStringLiteral("Missing pairing file"));
    }
    auto decoded = QByteArray::fromBase64Encoding(encoded, QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded) {
        return invalid(QStringLiteral("Pairing file is not valid Base64"));
    }

    auto result = orchestrator_.register_device(udid, *decoded, peer.toString().toStdString());
    if (result.is_err()) {
        return error_reply(result.unwrap_err());
    }

    const auto& provisioned = result.unwrap();
    QJsonObject obj;
    obj[QStringLiteral("ok")] = true;
    obj[QStringLiteral("status")] = QStringLiteral("registered");
    obj[QStringLiteral("udid")] = QString::fromStdString(provisioned.config.identifier);
    obj[QStringLiteral("address")] = QString::fromStdString(provisioned.config.address);
    obj[QStringLiteral("allocated")] = provisioned.allocated;
    // Direct registrations have no tunnel; the client is told its address.
    obj[QStringLiteral("config")] = provisioned.direct
        ? QString::fromStdString(provisioned.config.address)
        : QString::fromStdString(provision::render_client_config(provisioned.config));
    return obj;
}

QJsonObject RequestServer::handleActivate(const QJsonObject& request, const QHostAddress& peer) {
    auto udid = request.value(QStringLiteral("udid")).toString().toStdString();
    const auto address = request.value(QStringLiteral("address")).toString().toStdString();

    std::optional<QByteArray> credential;
    if (request.contains(QStringLiteral("pairing"))) {
        auto decoded = QByteArray::fromBase64Encoding(
            request.value(QStringLiteral("pairing")).toString().toLatin1(),
            QByteArray::AbortOnBase64DecodingErrors);
        if (!decoded || decoded->isEmpty()) {
            return invalid(QStringLiteral("Pairing file is not valid Base64"));
        }
        credential = *decoded;

        if (udid.empty()) {
            auto owner = storage::extract_identifier(*credential);
            if (owner.is_err()) {
                return error_reply(owner.unwrap_err());
            }
            udid = owner.unwrap();
        }
    }

    Res<activation::ActivationTicket> ticket = [&]() {
        if (!udid.empty()) {
            return orchestrator_.activate(udid, credential, peer.toString().toStdString());
        }
        if (!address.empty()) {
            return orchestrator_.activate_by_address(address);
        }
        return orchestrator_.activate_by_address(peer.toString().toStdString());
    }();

    if (ticket.is_err()) {
        return error_reply(ticket.unwrap_err());
    }

    const auto& t = ticket.unwrap();
    QJsonObject obj;
    obj[QStringLiteral("ok")] = true;
    obj[QStringLiteral("status")] = qstr(t.status());
    obj[QStringLiteral("udid")] = QString::fromStdString(t.device.identifier);
    obj[QStringLiteral("address")] = QString::fromStdString(t.device.address);
    if (t.session) {
        obj[QStringLiteral("session")] = QString::fromStdString(t.session->id.to_string());
        obj[QStringLiteral("coalesced")] = t.kind == activation::ActivationTicket::Kind::Coalesced;
    }
    if (t.kind == activation::ActivationTicket::Kind::TooSoon) {
        obj[QStringLiteral("retry_after_ms")] = static_cast<qint64>(t.retry_after.count());
    }
    return obj;
}

QJsonObject RequestServer::handleStatus(const QJsonObject& request) {
    const auto id = session_id_of(request);
    if (!id) {
        return invalid(QStringLiteral("Missing or malformed session id"));
    }
    auto snapshot = orchestrator_.poll(*id);
    if (snapshot.is_err()) {
        return error_reply(snapshot.unwrap_err());
    }
    return snapshot_to_json(snapshot.unwrap());
}

QJsonObject RequestServer::handleQueue(const QJsonObject& request) {
    const auto udid = request.value(QStringLiteral("udid")).toString().toStdString();
    if (udid.empty()) {
        return invalid(QStringLiteral("Missing udid"));
    }
    auto status = orchestrator_.queue_status(udid);
    if (status.is_err()) {
        return error_reply(status.unwrap_err());
    }

    const auto& s = status.unwrap();
    QJsonObject obj;
    obj[QStringLiteral("ok")] = true;
    obj[QStringLiteral("state")] = qstr(activation::to_string(s.state));
    obj[QStringLiteral("position")] = static_cast<qint64>(s.queue_position);
    obj[QStringLiteral("status")] = s.outcome ? qstr(status_string(s.outcome->kind))
                                              : QStringLiteral("pending");
    return obj;
}

void RequestServer::beginAwait(QTcpSocket* socket, const QJsonObject& request) {
    const auto id = session_id_of(request);
    if (!id) {
        reply(socket, invalid(QStringLiteral("Missing or malformed session id")));
        return;
    }

    const auto requested = request.value(QStringLiteral("timeout_ms")).toInteger(30000);
    const auto timeout = std::clamp<qint64>(requested, 0, MAX_AWAIT.count());

    auto current = orchestrator_.poll(*id);
    if (current.is_err()) {
        reply(socket, error_reply(current.unwrap_err()));
        return;
    }
    if (is_terminal(current.unwrap().state) || timeout == 0) {
        reply(socket, snapshot_to_json(current.unwrap()));
        return;
    }

    // The session finishes on a worker thread; the promise hands the
    // snapshot to this one. Watcher and deadline belong to the socket, so a
    // client that goes away drops both.
    auto promise = std::make_shared<QPromise<SessionSnapshot>>();
    promise->start();
    auto* watcher = new QFutureWatcher<SessionSnapshot>(socket);
    auto* deadline = new QTimer(watcher);
    deadline->setSingleShot(true);

    auto finish = [this, socket, watcher, deadline](const QJsonObject& response) {
        deadline->stop();
        watcher->disconnect();
        reply(socket, response);
        watcher->deleteLater();
    };
    auto reply_current = [this, id = *id, finish]() {
        auto snapshot = orchestrator_.poll(id);
        finish(snapshot.is_ok() ? snapshot_to_json(snapshot.unwrap()) : error_reply(snapshot.unwrap_err()));
    };

    connect(watcher, &QFutureWatcherBase::finished, watcher, [watcher, finish, reply_current]() {
        const auto future = watcher->future();
        if (future.isCanceled() || future.resultCount() == 0) {
            // Dropped without an outcome (sessions torn down).
            reply_current();
            return;
        }
        finish(snapshot_to_json(future.result()));
    });
    connect(deadline, &QTimer::timeout, watcher, reply_current);
    watcher->setFuture(promise->future());
    deadline->start(static_cast<int>(timeout));

    auto observed = orchestrator_.on_finished(*id, [promise](const SessionSnapshot& snapshot) {
        promise->addResult(snapshot);
        promise->finish();
    });
    if (observed.is_err()) {
        finish(error_reply(observed.unwrap_err()));
    }
}

} // namespace jitstreamer::network
