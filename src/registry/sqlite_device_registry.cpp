#include "registry/sqlite_device_registry.hpp"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(jitstreamerRegistryLog, "jitstreamer.registry")

namespace jitstreamer::registry {

namespace {

Res<Device> found_or_not_found(Result<std::optional<Device>, Error> row, const std::string& key) {
    if (row.is_err()) {
        return Res<Device>::err(row.unwrap_err());
    }
    if (!row.unwrap().has_value()) {
        return fail<Device>(ErrorCode::NotFound, "No device registered for " + key);
    }
    return Res<Device>::ok(*row.unwrap());
}

Result<void, Error> begin_error(const storage::TransactionGuard& tx) {
    if (tx.begin_error()) {
        return Result<void, Error>::err(*tx.begin_error());
    }
    return Result<void, Error>::ok();
}

} // namespace

Res<Device> SqliteDeviceRegistry::lookup(const std::string& identifier) {
    std::lock_guard lock(mutex_);
    return found_or_not_found(repo_.get(identifier), identifier);
}

Res<Device> SqliteDeviceRegistry::lookup_by_address(const std::string& address) {
    auto canonical = canonical_address(address);
    if (canonical.is_err()) {
        return Res<Device>::err(canonical.unwrap_err());
    }
    std::lock_guard lock(mutex_);
    return found_or_not_found(repo_.get_by_address(canonical.unwrap()), canonical.unwrap());
}

Res<Device> SqliteDeviceRegistry::register_device(const std::string& identifier,
                                                  const std::string& address,
                                                  const std::string& public_key) {
    auto valid = validate_identifier(identifier);
    if (valid.is_err()) return Res<Device>::err(valid.unwrap_err());
    auto canonical = canonical_address(address);
    if (canonical.is_err()) return Res<Device>::err(canonical.unwrap_err());
    const auto& addr = canonical.unwrap();

    std::lock_guard lock(mutex_);
    return db_.transaction([&]() -> Res<Device> {
        auto existing = repo_.get(identifier);
        if (existing.is_err()) return Res<Device>::err(existing.unwrap_err());
        if (existing.unwrap().has_value()) {
            const auto& device = *existing.unwrap();
            if (device.address != addr) {
                return fail<Device>(ErrorCode::AlreadyRegistered,
                    identifier + " is already registered at " + device.address);
            }
            return Res<Device>::ok(device);
        }

        auto holder = repo_.get_by_address(addr);
        if (holder.is_err()) return Res<Device>::err(holder.unwrap_err());
        if (holder.unwrap().has_value()) {
            return fail<Device>(ErrorCode::AlreadyRegistered,
                "Address " + addr + " is already assigned to " + holder.unwrap()->identifier);
        }

        auto total = repo_.count();
        if (total.is_err()) return Res<Device>::err(total.unwrap_err());
        auto allowed = check_policy(static_cast<uint64_t>(total.unwrap()));
        if (allowed.is_err()) return Res<Device>::err(allowed.unwrap_err());

        auto device = create_device(identifier, addr, public_key);
        auto inserted = repo_.insert(device);
        if (inserted.is_err()) return Res<Device>::err(inserted.unwrap_err());

        qCInfo(jitstreamerRegistryLog) << "Registered" << identifier.c_str() << "at" << addr.c_str();
        return Res<Device>::ok(device);
    });
}

Result<void, Error> SqliteDeviceRegistry::touch(const std::string& identifier) {
    std::lock_guard lock(mutex_);
    auto updated = repo_.update_last_seen(identifier, Timestamp::now());
    if (updated.is_err()) {
        return Result<void, Error>::err(updated.unwrap_err());
    }
    if (!updated.unwrap()) {
        return fail<void>(ErrorCode::NotFound, "No device registered for " + identifier);
    }
    return Result<void, Error>::ok();
}

Res<Allocation> SqliteDeviceRegistry::allocate_and_register(const std::string& identifier,
                                                            const AddressPool& pool,
                                                            const std::string& public_key,
                                                            const AllocationHook& hook) {
    auto valid = validate_identifier(identifier);
    if (valid.is_err()) return Res<Allocation>::err(valid.unwrap_err());

    std::lock_guard lock(mutex_);
    storage::TransactionGuard tx(db_);
    if (auto began = begin_error(tx); began.is_err()) {
        return Res<Allocation>::err(began.unwrap_err());
    }

    auto existing = repo_.get(identifier);
    if (existing.is_err()) return Res<Allocation>::err(existing.unwrap_err());
    if (existing.unwrap().has_value()) {
        return Res<Allocation>::ok(Allocation{.device = *existing.unwrap(), .allocated = false});
    }

    auto total = repo_.count();
    if (total.is_err()) return Res<Allocation>::err(total.unwrap_err());
    auto allowed = check_policy(static_cast<uint64_t>(total.unwrap()));
    if (allowed.is_err()) return Res<Allocation>::err(allowed.unwrap_err());

    auto used = repo_.addresses();
    if (used.is_err()) return Res<Allocation>::err(used.unwrap_err());
    auto address = pool.first_free(used.unwrap());
    if (!address) {
        return fail<Allocation>(ErrorCode::PoolExhausted,
            "No free address in " + pool.first() + "-" + pool.last());
    }

    auto device = create_device(identifier, *address, public_key);
    auto inserted = repo_.insert(device);
    if (inserted.is_err()) return Res<Allocation>::err(inserted.unwrap_err());

    if (hook) {
        auto hooked = hook(device);
        if (hooked.is_err()) {
            qCWarning(jitstreamerRegistryLog) << "Releasing" << address->c_str() << "after failed allocation for"
                                              << identifier.c_str() << ":" << hooked.unwrap_err().message.c_str();
            auto rolled_back = tx.rollback();
            if (rolled_back.is_err()) {
                auto error = hooked.unwrap_err();
                error.message += " (rollback failed: " + rolled_back.unwrap_err().message + ")";
                return Res<Allocation>::err(std::move(error));
            }
            return Res<Allocation>::err(hooked.unwrap_err());
        }
    }

    auto committed = tx.commit();
    if (committed.is_err()) return Res<Allocation>::err(committed.unwrap_err());

    qCInfo(jitstreamerRegistryLog) << "Allocated" << address->c_str() << "to" << identifier.c_str();
    return Res<Allocation>::ok(Allocation{.device = device, .allocated = true});
}

Result<void, Error> SqliteDeviceRegistry::set_public_key(const std::string& identifier,
                                                         const std::string& public_key) {
    std::lock_guard lock(mutex_);
    auto updated = repo_.update_public_key(identifier, public_key);
    if (updated.is_err()) {
        return Result<void, Error>::err(updated.unwrap_err());
    }
    if (!updated.unwrap()) {
        return fail<void>(ErrorCode::NotFound, "No device registered for " + identifier);
    }
    return Result<void, Error>::ok();
}

Result<void, Error> SqliteDeviceRegistry::remove(const std::string& identifier) {
    std::lock_guard lock(mutex_);
    auto removed = repo_.remove(identifier);
    if (removed.is_err()) {
        return Result<void, Error>::err(removed.unwrap_err());
    }
    if (!removed.unwrap()) {
        return fail<void>(ErrorCode::NotFound, "No device registered for " + identifier);
    }
    qCInfo(jitstreamerRegistryLog) << "Removed" << identifier.c_str();
    return Result<void, Error>::ok();
}

Res<std::vector<Device>> SqliteDeviceRegistry::list() {
    std::lock_guard lock(mutex_);
    return repo_.get_all();
}

Res<uint64_t> SqliteDeviceRegistry::count() {
    std::lock_guard lock(mutex_);
    return repo_.count().map([](int64_t n) { return static_cast<uint64_t>(n); });
}

} // namespace jitstreamer::registry
