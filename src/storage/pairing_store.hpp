#pragma once

#include "core/result.hpp"
#include <QByteArray>
#include <QString>
#include <string>

namespace jitstreamer::storage {

/**
 * PairingStore - Pairing credentials on disk, one <identifier>.plist per
 * device, in the directory the device muxer reads lockdown records from.
 *
 * Writes are atomic (write to a temporary file, then rename).
 */
class PairingStore {
public:
    explicit PairingStore(QString directory);

    [[nodiscard]] const QString& directory() const { return directory_; }
    [[nodiscard]] QString path_for(const std::string& identifier) const;
    [[nodiscard]] bool contains(const std::string& identifier) const;

    [[nodiscard]] Result<QString, Error> save(const std::string& identifier, const QByteArray& credential);
    [[nodiscard]] Result<QByteArray, Error> load(const std::string& identifier) const;
    [[nodiscard]] Result<void, Error> remove(const std::string& identifier);

private:
    QString directory_;
};

/**
 * Read the top-level "UDID" string out of an XML property list.
 * Binary property lists are rejected.
 */
[[nodiscard]] Result<std::string, Error> extract_identifier(const QByteArray& credential);

} // namespace jitstreamer::storage
