#include "storage/device_repository.hpp"

namespace jitstreamer::storage {

namespace {

constexpr const char* DEVICE_COLUMNS =
    "identifier, address, public_key, registered_at, last_seen";

// Runs a single UPDATE/DELETE; true when at least one row changed.
template<typename... Args>
Result<bool, Error> run_update(Database& db, const std::string& sql, const Args&... args) {
    auto stmt_result = db.prepare(sql);
    if (stmt_result.is_err()) {
        return Result<bool, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(args...);
    if (bind_result.is_err()) {
        return Result<bool, Error>::err(bind_result.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<bool, Error>::err(step_result.unwrap_err());
    }
    return Result<bool, Error>::ok(db.changes() > 0);
}

} // namespace

Device DeviceRepository::row_to_device(Statement& stmt) {
    return Device{
        .identifier = stmt.column_text(0),
        .address = stmt.column_text(1),
        .public_key = stmt.column_text(2),
        .registered_at = Timestamp(stmt.column_int64(3)),
        .last_seen = Timestamp(stmt.column_int64(4))
    };
}

Result<std::optional<Device>, Error> DeviceRepository::get_where(const char* column,
                                                                 const std::string& value) {
    auto stmt_result = db_.prepare(std::string("SELECT ") + DEVICE_COLUMNS +
                                   " FROM devices WHERE " + column + " = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<Device>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(value);
    if (bind_result.is_err()) {
        return Result<std::optional<Device>, Error>::err(bind_result.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<Device>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<Device>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<Device>, Error>::ok(row_to_device(stmt));
}

Result<std::optional<Device>, Error> DeviceRepository::get(const std::string& identifier) {
    return get_where("identifier", identifier);
}

Result<std::optional<Device>, Error> DeviceRepository::get_by_address(const std::string& address) {
    return get_where("address", address);
}

Result<std::vector<Device>, Error> DeviceRepository::get_all() {
    std::vector<Device> devices;
    auto result = db_.query(std::string("SELECT ") + DEVICE_COLUMNS +
                            " FROM devices ORDER BY registered_at, identifier;",
                            [&](Statement& stmt) { devices.push_back(row_to_device(stmt)); });
    if (result.is_err()) {
        return Result<std::vector<Device>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<Device>, Error>::ok(std::move(devices));
}

Result<std::set<std::string>, Error> DeviceRepository::addresses() {
    std::set<std::string> used;
    auto result = db_.query("SELECT address FROM devices;",
                            [&](Statement& stmt) { used.insert(stmt.column_text(0)); });
    if (result.is_err()) {
        return Result<std::set<std::string>, Error>::err(result.unwrap_err());
    }
    return Result<std::set<std::string>, Error>::ok(std::move(used));
}

Result<int64_t, Error> DeviceRepository::count() {
    int64_t total = 0;
    auto result = db_.query("SELECT COUNT(*) FROM devices;",
                            [&](Statement& stmt) { total = stmt.column_int64(0); });
    if (result.is_err()) {
        return Result<int64_t, Error>::err(result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(total);
}

Result<void, Error> DeviceRepository::insert(const Device& device) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO devices (identifier, address, public_key, registered_at, last_seen)
        VALUES (?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(device.identifier, device.address, device.public_key,
                                     device.registered_at.millis(), device.last_seen.millis());
    if (bind_result.is_err()) {
        return bind_result;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<bool, Error> DeviceRepository::update_last_seen(const std::string& identifier,
                                                       Timestamp last_seen) {
    return run_update(db_, "UPDATE devices SET last_seen = ? WHERE identifier = ?;",
                      last_seen.millis(), identifier);
}

Result<bool, Error> DeviceRepository::update_public_key(const std::string& identifier,
                                                        const std::string& public_key) {
    return run_update(db_, "UPDATE devices SET public_key = ? WHERE identifier = ?;",
                      public_key, identifier);
}

Result<bool, Error> DeviceRepository::remove(const std::string& identifier) {
    return run_update(db_, "DELETE FROM devices WHERE identifier = ?;", identifier);
}

} // namespace jitstreamer::storage
