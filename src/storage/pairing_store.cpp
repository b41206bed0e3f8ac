#include "storage/pairing_store.hpp"
#include "core/device.hpp"

#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QXmlStreamReader>

namespace jitstreamer::storage {

PairingStore::PairingStore(QString directory)
    : directory_(std::move(directory)) {}

QString PairingStore::path_for(const std::string& identifier) const {
    return QDir(directory_).filePath(QString::fromStdString(identifier) + QStringLiteral(".plist"));
}

bool PairingStore::contains(const std::string& identifier) const {
    return QFile::exists(path_for(identifier));
}

Result<QString, Error> PairingStore::save(const std::string& identifier, const QByteArray& credential) {
    auto valid = validate_identifier(identifier);
    if (valid.is_err()) {
        return Result<QString, Error>::err(valid.unwrap_err());
    }
    if (credential.isEmpty()) {
        return fail<QString>(ErrorCode::InvalidArgument, "Pairing credential is empty");
    }
    if (!QDir().mkpath(directory_)) {
        return fail<QString>(ErrorCode::Storage,
            "Cannot create pairing directory " + directory_.toStdString());
    }

    const auto path = path_for(identifier);
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return fail<QString>(ErrorCode::Storage,
            "Cannot open " + path.toStdString() + ": " + file.errorString().toStdString());
    }
    if (file.write(credential) != credential.size()) {
        file.cancelWriting();
        return fail<QString>(ErrorCode::Storage,
            "Short write to " + path.toStdString() + ": " + file.errorString().toStdString());
    }
    if (!file.commit()) {
        return fail<QString>(ErrorCode::Storage,
            "Cannot commit " + path.toStdString() + ": " + file.errorString().toStdString());
    }
    return Result<QString, Error>::ok(path);
}

Result<QByteArray, Error> PairingStore::load(const std::string& identifier) const {
    QFile file(path_for(identifier));
    if (!file.exists()) {
        return fail<QByteArray>(ErrorCode::NotFound, "No pairing record for " + identifier);
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return fail<QByteArray>(ErrorCode::Storage, file.errorString().toStdString());
    }
    return Result<QByteArray, Error>::ok(file.readAll());
}

Result<void, Error> PairingStore::remove(const std::string& identifier) {
    QFile file(path_for(identifier));
    if (!file.exists()) {
        return Result<void, Error>::ok();
    }
    if (!file.remove()) {
        return fail<void>(ErrorCode::Storage, file.errorString().toStdString());
    }
    return Result<void, Error>::ok();
}

Result<std::string, Error> extract_identifier(const QByteArray& credential) {
    if (credential.startsWith("bplist")) {
        return fail<std::string>(ErrorCode::InvalidArgument, "Binary property lists are not supported");
    }

    QXmlStreamReader xml(credential);
    int dict_depth = 0;
    bool next_is_udid = false;

    while (!xml.atEnd()) {
        const auto token = xml.readNext();
        if (token == QXmlStreamReader::StartElement) {
            const auto name = xml.name();
            if (next_is_udid) {
                if (name != QLatin1String("string")) {
                    return fail<std::string>(ErrorCode::InvalidArgument, "UDID is not a string");
                }
                return validate_identifier(xml.readElementText().trimmed().toStdString());
            }
            if (name == QLatin1String("dict")) {
                ++dict_depth;
            } else if (name == QLatin1String("key") && dict_depth == 1) {
                next_is_udid = xml.readElementText() == QLatin1String("UDID");
            }
        } else if (token == QXmlStreamReader::EndElement && xml.name() == QLatin1String("dict")) {
            --dict_depth;
        }
    }

    if (xml.hasError()) {
        return fail<std::string>(ErrorCode::InvalidArgument,
            "Bad property list: " + xml.errorString().toStdString());
    }
    return fail<std::string>(ErrorCode::InvalidArgument, "Property list has no UDID");
}

} // namespace jitstreamer::storage
