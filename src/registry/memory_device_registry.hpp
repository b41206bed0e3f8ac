#pragma once

#include "registry/device_registry.hpp"
#include <map>
#include <mutex>

namespace jitstreamer::registry {

/**
 * MemoryDeviceRegistry - Volatile DeviceRegistry for tests and for running
 * without a database. Same semantics as the SQLite registry.
 */
class MemoryDeviceRegistry final : public DeviceRegistry {
public:
    MemoryDeviceRegistry() = default;

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
    std::mutex mutex_;
    std::map<std::string, Device> devices_;
    std::map<std::string, std::string> by_address_;  // address -> identifier
};

} // namespace jitstreamer::registry
