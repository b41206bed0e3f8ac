#include <QCoreApplication>
#include <QDir>
#include <catch2/catch_session.hpp>

#include "crypto/keys.hpp"

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("jitstreamer_tests");
    const auto testHome = QDir::tempPath() + QStringLiteral("/jitstreamer_tests_home");
    QDir().mkpath(testHome);
    qputenv("HOME", testHome.toUtf8());

    if (jitstreamer::crypto::init().is_err()) {
        return 1;
    }

    Catch::Session session;
    return session.run(argc, argv);
}
