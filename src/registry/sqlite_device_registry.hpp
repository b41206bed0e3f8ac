#pragma once

#include "registry/device_registry.hpp"
#include "storage/database.hpp"
#include "storage/device_repository.hpp"
#include <mutex>

namespace jitstreamer::registry {

/**
 * SqliteDeviceRegistry - DeviceRegistry over the `devices` table.
 *
 * The database must already be migrated. All calls share one connection
 * and are serialized by an internal mutex; each mutation runs in its own
 * transaction.
 */
class SqliteDeviceRegistry final : public DeviceRegistry {
public:
    explicit SqliteDeviceRegistry(storage::Database& db) : db_(db), repo_(db) {}

    [[nodiscard]] Res<Device> lookup(const std::string& identifier) override;
    [[nodiscard]] Res<Device> lookup_by_address(const std::string& address) override;
    [[nodiscard]] Res<Device> register_device(const std::string& identifier,
                                              const std::string& address,
                                              const std::string& public_key = {}) override;
    [[nodiscard]] Result<void, Error> touch(const std::string& identifier) override;
    [[nodiscard]] Res<Allocation> allocate_and_register(const std::string& identifier,
                                                        const AddressPool& pool,
                                                        const std::string& public_key,
                                                        const AllocationHook& hook) override;
    [[nodiscard]] Result<void, Error> set_public_key(const std::string& identifier,
                                                     const std::string& public_key) override;
    [[nodiscard]] Result<void, Error> remove(const std::string& identifier) override;
    [[nodiscard]] Res<std::vector<Device>> list() override;
    [[nodiscard]] Res<uint64_t> count() override;

private:
    storage::Database& db_;
    storage::DeviceRepository repo_;
    std::mutex mutex_;
};

} // namespace jitstreamer::registry
