#include <catch2/catch_test_macros.hpp>
#include "network/request_server.hpp"
#include "server_stack.hpp"
#include <QJsonDocument>
#include <QTcpSocket>

using namespace jitstreamer;
using namespace jitstreamer::network;
using namespace std::chrono_literals;
using jitstreamer::testing::ServerStack;
using jitstreamer::testing::pairing_plist;
using jitstreamer::testing::spin_until;

namespace {

QJsonObject request(std::initializer_list<std::pair<const char*, QJsonValue>> fields) {
    QJsonObject obj;
    for (const auto& [key, value] : fields) {
        obj.insert(QString::fromUtf8(key), value);
    }
    return obj;
}

QString status_of(const QJsonObject& reply) {
    return reply.value(QStringLiteral("status")).toString();
}

const QHostAddress NO_PEER(QHostAddress::LocalHost);

} // namespace

TEST_CASE("Client version check", "[server][version]") {
    REQUIRE(version_supported(QStringLiteral("0.0.1")));
    REQUIRE(version_supported(QStringLiteral("0.1")));
    REQUIRE(version_supported(QStringLiteral("1.10"), QStringLiteral("1.9")));
    REQUIRE_FALSE(version_supported(QStringLiteral("0.0.0")));
    REQUIRE_FALSE(version_supported(QStringLiteral("")));
    REQUIRE_FALSE(version_supported(QStringLiteral("1.0-beta")));
    REQUIRE_FALSE(version_supported(QStringLiteral("latest")));

    ServerStack stack;
    RequestServer server(stack.orchestrator);

    auto ok = server.handle(request({{"cmd", "version"}, {"version", "0.1.0"}}), NO_PEER);
    REQUIRE(ok.value(QStringLiteral("ok")).toBool());
    REQUIRE(status_of(ok) == QStringLiteral("supported"));

    auto old = server.handle(request({{"cmd", "version"}, {"version", "0.0.0"}}), NO_PEER);
    REQUIRE_FALSE(old.value(QStringLiteral("ok")).toBool());
    REQUIRE(status_of(old) == QStringLiteral("unsupported"));
    REQUIRE(old.value(QStringLiteral("minimum")).toString() == QStringLiteral("0.0.1"));
}

TEST_CASE("Malformed requests", "[server]") {
    ServerStack stack;
    RequestServer server(stack.orchestrator);

    REQUIRE(status_of(server.handle(request({{"cmd", "reboot"}}), NO_PEER)) == QStringLiteral("invalid_request"));
    REQUIRE(status_of(server.handle(QJsonObject(), NO_PEER)) == QStringLiteral("invalid_request"));
    REQUIRE(status_of(server.handle(request({{"cmd", "status"}, {"session", "nope"}}), NO_PEER)) ==
            QStringLiteral("invalid_request"));
    REQUIRE(status_of(server.handle(request({{"cmd", "register"}, {"pairing", "%%%"}}), NO_PEER)) ==
            QStringLiteral("invalid_request"));
    REQUIRE(status_of(server.handle(request({{"cmd", "queue"}}), NO_PEER)) == QStringLiteral("invalid_request"));

    auto error = server.handle(request({{"cmd", "register"}}), NO_PEER);
    REQUIRE_FALSE(error.value(QStringLiteral("ok")).toBool());
    REQUIRE_FALSE(error.value(QStringLiteral("error")).toString().isEmpty());
}

TEST_CASE("Register then activate", "[server]") {
    ServerStack stack;
    RequestServer server(stack.orchestrator);

    const auto pairing = QString::fromLatin1(pairing_plist("udid-a").toBase64());
    auto registered = server.handle(request({{"cmd", "register"}, {"pairing", pairing}}), NO_PEER);
    REQUIRE(status_of(registered) == QStringLiteral("registered"));
    REQUIRE(registered.value(QStringLiteral("udid")).toString() == QStringLiteral("udid-a"));
    REQUIRE(registered.value(QStringLiteral("address")).toString() == QStringLiteral("fd00::2"));
    REQUIRE(registered.value(QStringLiteral("allocated")).toBool());
    REQUIRE(registered.value(QStringLiteral("config")).toString().contains(QStringLiteral("Address = fd00::2/128")));

    auto activated = server.handle(request({{"cmd", "activate"}, {"udid", "udid-a"}}), NO_PEER);
    REQUIRE(status_of(activated) == QStringLiteral("pending"));
    REQUIRE_FALSE(activated.value(QStringLiteral("coalesced")).toBool());
    const auto session = activated.value(QStringLiteral("session")).toString();
    REQUIRE_FALSE(session.isEmpty());

    REQUIRE(jitstreamer::testing::wait_until([&] {
        auto status = server.handle(request({{"cmd", "status"}, {"session", session}}), NO_PEER);
        return status.value(QStringLiteral("state")).toString() == QStringLiteral("succeeded");
    }));
    auto status = server.handle(request({{"cmd", "status"}, {"session", session}}), NO_PEER);
    REQUIRE(status_of(status) == QStringLiteral("activated"));
    REQUIRE(status.value(QStringLiteral("udid")).toString() == QStringLiteral("udid-a"));
    REQUIRE(status.contains(QStringLiteral("finished_at")));

    auto queue = server.handle(request({{"cmd", "queue"}, {"udid", "udid-a"}}), NO_PEER);
    REQUIRE(queue.value(QStringLiteral("state")).toString() == QStringLiteral("finished"));
    REQUIRE(status_of(queue) == QStringLiteral("activated"));
}

TEST_CASE("Activation errors map to stable statuses", "[server]") {
    ServerStack::Options options;
    options.cooldown = 60s;
    ServerStack stack(options);
    RequestServer server(stack.orchestrator);

    REQUIRE(status_of(server.handle(request({{"cmd", "activate"}, {"udid", "udid-x"}}), NO_PEER)) ==
            QStringLiteral("not_found"));

    REQUIRE(stack.registry.register_device("udid-x", "fd00::10").is_ok());
    auto first = server.handle(request({{"cmd", "activate"}, {"udid", "udid-x"}}), NO_PEER);
    const auto session = Uuid::parse(first.value(QStringLiteral("session")).toString().toStdString());
    REQUIRE(session.has_value());
    REQUIRE(jitstreamer::testing::wait_until([&] {
        return is_terminal(stack.orchestrator.poll(*session).unwrap().state);
    }));

    auto again = server.handle(request({{"cmd", "activate"}, {"udid", "udid-x"}}), NO_PEER);
    REQUIRE(again.value(QStringLiteral("ok")).toBool());
    REQUIRE(status_of(again) == QStringLiteral("too_soon"));
    REQUIRE(again.value(QStringLiteral("retry_after_ms")).toInteger() > 0);

    stack.registry.allow_registration(RegistrationPolicy::disabled());
    const auto pairing = QString::fromLatin1(pairing_plist("udid-y").toBase64());
    REQUIRE(status_of(server.handle(request({{"cmd", "register"}, {"pairing", pairing}}), NO_PEER)) ==
            QStringLiteral("registration_disabled"));
}

TEST_CASE("Activation falls back to the peer address", "[server]") {
    ServerStack::Options options;
    options.script = QStringLiteral("sleep 0.5");
    ServerStack stack(options);
    RequestServer server(stack.orchestrator);
    REQUIRE(stack.registry.register_device("udid-a", "fd00::10").is_ok());

    auto by_peer = server.handle(request({{"cmd", "activate"}}), QHostAddress(QStringLiteral("fd00::10")));
    REQUIRE(by_peer.value(QStringLiteral("udid")).toString() == QStringLiteral("udid-a"));

    auto by_field = server.handle(request({{"cmd", "activate"}, {"address", "fd00::10"}}), NO_PEER);
    REQUIRE(by_field.value(QStringLiteral("session")) == by_peer.value(QStringLiteral("session")));
    REQUIRE(by_field.value(QStringLiteral("coalesced")).toBool());

    auto stranger = server.handle(request({{"cmd", "activate"}}), QHostAddress(QStringLiteral("fd00::99")));
    REQUIRE(status_of(stranger) == QStringLiteral("not_found"));
}

TEST_CASE("Activation with only a pairing file", "[server]") {
    ServerStack stack;
    RequestServer server(stack.orchestrator);
    REQUIRE(stack.registry.register_device("udid-a", "fd00::10").is_ok());

    const auto pairing = QString::fromLatin1(pairing_plist("udid-a").toBase64());
    auto activated = server.handle(request({{"cmd", "activate"}, {"pairing", pairing}}), NO_PEER);
    REQUIRE(status_of(activated) == QStringLiteral("pending"));
    REQUIRE(activated.value(QStringLiteral("udid")).toString() == QStringLiteral("udid-a"));

    const auto junk = QString::fromLatin1(QByteArray("not a property list").toBase64());
    auto refused = server.handle(request({{"cmd", "activate"}, {"pairing", junk}}), NO_PEER);
    REQUIRE(status_of(refused) == QStringLiteral("invalid_request"));
}

TEST_CASE("Direct registration replies with the caller's address", "[server][direct]") {
    ServerStack stack;
    stack.registry.allow_registration(RegistrationPolicy::direct());
    RequestServer server(stack.orchestrator);

    const auto pairing = QString::fromLatin1(pairing_plist("udid-a").toBase64());
    auto registered = server.handle(request({{"cmd", "register"}, {"pairing", pairing}}),
                                    QHostAddress(QStringLiteral("192.0.2.10")));
    REQUIRE(status_of(registered) == QStringLiteral("registered"));
    REQUIRE(registered.value(QStringLiteral("address")).toString() == QStringLiteral("192.0.2.10"));
    REQUIRE(registered.value(QStringLiteral("config")).toString() == QStringLiteral("192.0.2.10"));
    REQUIRE(stack.vpn.apply_calls() == 0);

    auto by_peer = server.handle(request({{"cmd", "activate"}}), QHostAddress(QStringLiteral("192.0.2.10")));
    REQUIRE(by_peer.value(QStringLiteral("udid")).toString() == QStringLiteral("udid-a"));
}

TEST_CASE("Line protocol over TCP", "[server][tcp]") {
    ServerStack::Options options;
    options.script = QStringLiteral("sleep 0.3");
    ServerStack stack(options);
    RequestServer server(stack.orchestrator);
    REQUIRE(stack.registry.register_device("udid-a", "fd00::10").is_ok());

    auto listening = server.listen(QHostAddress::LocalHost, 0);
    if (listening.is_err()) {
        SKIP("TCP listen not permitted in this environment");
    }
    REQUIRE(server.port() == listening.unwrap());

    QTcpSocket client;
    client.connectToHost(QHostAddress::LocalHost, server.port());
    REQUIRE(spin_until([&] { return client.state() == QAbstractSocket::ConnectedState; }));

    auto exchange = [&](const QByteArray& line) {
        client.write(line + "\n");
        REQUIRE(spin_until([&] { return client.canReadLine(); }));
        return QJsonDocument::fromJson(client.readLine()).object();
    };

    SECTION("Garbage gets an error reply and the connection stays usable") {
        auto bad = exchange("{not json");
        REQUIRE(status_of(bad) == QStringLiteral("invalid_request"));

        auto version = exchange(R"({"cmd":"version","version":"1.0"})");
        REQUIRE(status_of(version) == QStringLiteral("supported"));
    }

    SECTION("Await replies once the worker finishes") {
        auto activated = exchange(R"({"cmd":"activate","udid":"udid-a"})");
        const auto session = activated.value(QStringLiteral("session")).toString();
        REQUIRE_FALSE(session.isEmpty());

        auto awaited = exchange(QStringLiteral(R"({"cmd":"await","session":"%1","timeout_ms":10000})")
                                    .arg(session).toUtf8());
        REQUIRE(awaited.value(QStringLiteral("state")).toString() == QStringLiteral("succeeded"));
        REQUIRE(status_of(awaited) == QStringLiteral("activated"));
    }

    SECTION("Await replies at the deadline while the worker still runs") {
        auto activated = exchange(R"({"cmd":"activate","udid":"udid-a"})");
        const auto session = activated.value(QStringLiteral("session")).toString();

        auto awaited = exchange(QStringLiteral(R"({"cmd":"await","session":"%1","timeout_ms":50})")
                                    .arg(session).toUtf8());
        REQUIRE(status_of(awaited) == QStringLiteral("pending"));

        auto finished = exchange(QStringLiteral(R"({"cmd":"await","session":"%1","timeout_ms":10000})")
                                     .arg(session).toUtf8());
        REQUIRE(status_of(finished) == QStringLiteral("activated"));
    }

    SECTION("Await gives up at the deadline without touching the session") {
        auto activated = exchange(R"({"cmd":"activate","udid":"udid-a"})");
        const auto session = activated.value(QStringLiteral("session")).toString();

        auto awaited = exchange(QStringLiteral(R"({"cmd":"await","session":"%1","timeout_ms":0})")
                                    .arg(session).toUtf8());
        REQUIRE(status_of(awaited) == QStringLiteral("pending"));

        REQUIRE(jitstreamer::testing::wait_until([&] {
            auto id = Uuid::parse(session.toStdString());
            return is_terminal(stack.orchestrator.poll(*id).unwrap().state);
        }));
    }

    client.disconnectFromHost();
    server.close();
    REQUIRE_FALSE(server.isListening());
}
