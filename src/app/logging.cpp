#include "app/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMutex>
#include <QtGlobal>
#include <cstdio>

namespace jitstreamer::app {
namespace {

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile file;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    const auto line = (format_log_line(type, ctx.category, msg) + QLatin1Char('\n')).toUtf8();

    auto& s = state();
    QMutexLocker lock(&s.mu);
    std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
    std::fflush(stderr);
    if (s.file.isOpen()) {
        s.file.write(line);
        s.file.flush();
    }
}

} // namespace

QString format_log_line(QtMsgType type, const char* category, const QString& message) {
    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = category ? QString::fromLatin1(category) : QString{};
    return QStringLiteral("%1 %2 %3 %4").arg(ts, QString::fromLatin1(level_tag(type)), cat, message);
}

Result<void, Error> install_logging(const QString& log_file) {
    if (!log_file.isEmpty()) {
        auto& s = state();
        QMutexLocker lock(&s.mu);
        if (s.file.isOpen()) {
            s.file.close();
        }

        QDir dir(QFileInfo(log_file).absolutePath());
        if (!dir.mkpath(QStringLiteral("."))) {
            return Result<void, Error>::err(Error{
                "Cannot create log directory " + dir.absolutePath().toStdString(), ErrorCode::InvalidArgument});
        }
        s.file.setFileName(log_file);
        if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            return Result<void, Error>::err(Error{
                "Cannot open log file " + log_file.toStdString() + ": " + s.file.errorString().toStdString(),
                ErrorCode::InvalidArgument});
        }
    }

    qInstallMessageHandler(message_handler);
    return Result<void, Error>::ok();
}

void enable_debug_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("jitstreamer.*.debug=true\n"));
}

} // namespace jitstreamer::app
