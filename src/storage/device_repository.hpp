#pragma once

#include "storage/database.hpp"
#include "core/device.hpp"
#include "core/result.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace jitstreamer::storage {

/**
 * DeviceRepository - Data access for the devices table.
 *
 * Plain SQL with no policy; the registry decides what is allowed.
 */
class DeviceRepository {
public:
    explicit DeviceRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<Device>, Error> get(const std::string& identifier);
    [[nodiscard]] Result<std::optional<Device>, Error> get_by_address(const std::string& address);
    [[nodiscard]] Result<std::vector<Device>, Error> get_all();
    [[nodiscard]] Result<std::set<std::string>, Error> addresses();
    [[nodiscard]] Result<int64_t, Error> count();

    [[nodiscard]] Result<void, Error> insert(const Device& device);
    [[nodiscard]] Result<bool, Error> update_last_seen(const std::string& identifier, Timestamp last_seen);
    [[nodiscard]] Result<bool, Error> update_public_key(const std::string& identifier, const std::string& public_key);
    [[nodiscard]] Result<bool, Error> remove(const std::string& identifier);

private:
    Database& db_;

    [[nodiscard]] static Device row_to_device(Statement& stmt);
    [[nodiscard]] Result<std::optional<Device>, Error> get_where(const char* column, const std::string& value);
};

} // namespace jitstreamer::storage
