#include "registry/memory_device_registry.hpp"

#include <algorithm>
#include <set>

namespace jitstreamer::registry {

namespace {
Error not_found(const std::string& key) {
    return Error{"No device registered for " + key, ErrorCode::NotFound};
}
} // namespace

Res<Device> MemoryDeviceRegistry::lookup(const std::string& identifier) {
    std::lock_guard lock(mutex_);
    auto it = devices_.find(identifier);
    if (it == devices_.end()) return Res<Device>::err(not_found(identifier));
    return Res<Device>::ok(it->second);
}

Res<Device> MemoryDeviceRegistry::lookup_by_address(const std::string& address) {
    auto canonical = canonical_address(address);
    if (canonical.is_err()) return Res<Device>::err(canonical.unwrap_err());

    std::lock_guard lock(mutex_);
    auto it = by_address_.find(canonical.unwrap());
    if (it == by_address_.end()) return Res<Device>::err(not_found(canonical.unwrap()));
    return Res<Device>::ok(devices_.at(it->second));
}

Res<Device> MemoryDeviceRegistry::register_device(const std::string& identifier,
                                                  const std::string& address,
                                                  const std::string& public_key) {
    auto valid = validate_identifier(identifier);
    if (valid.is_err()) return Res<Device>::err(valid.unwrap_err());
    auto canonical = canonical_address(address);
    if (canonical.is_err()) return Res<Device>::err(canonical.unwrap_err());
    const auto& addr = canonical.unwrap();

    std::lock_guard lock(mutex_);
    if (auto it = devices_.find(identifier); it != devices_.end()) {
        if (it->second.address != addr) {
            return fail<Device>(ErrorCode::AlreadyRegistered,
                identifier + " is already registered at " + it->second.address);
        }
        return Res<Device>::ok(it->second);
    }
    if (auto it = by_address_.find(addr); it != by_address_.end()) {
        return fail<Device>(ErrorCode::AlreadyRegistered,
            "Address " + addr + " is already assigned to " + it->second);
    }
    auto allowed = check_policy(devices_.size());
    if (allowed.is_err()) return Res<Device>::err(allowed.unwrap_err());

    auto device = create_device(identifier, addr, public_key);
    devices_.emplace(identifier, device);
    by_address_.emplace(addr, identifier);
    return Res<Device>::ok(device);
}

Result<void, Error> MemoryDeviceRegistry::touch(const std::string& identifier) {
    std::lock_guard lock(mutex_);
    auto it = devices_.find(identifier);
    if (it == devices_.end()) return Result<void, Error>::err(not_found(identifier));
    it->second = with_last_seen(it->second, Timestamp::now());
    return Result<void, Error>::ok();
}

Res<Allocation> MemoryDeviceRegistry::allocate_and_register(const std::string& identifier,
                                                            const AddressPool& pool,
                                                            const std::string& public_key,
                                                            const AllocationHook& hook) {
    auto valid = validate_identifier(identifier);
    if (valid.is_err()) return Res<Allocation>::err(valid.unwrap_err());

    std::lock_guard lock(mutex_);
    if (auto it = devices_.find(identifier); it != devices_.end()) {
        return Res<Allocation>::ok(Allocation{.device = it->second, .allocated = false});
    }
    auto allowed = check_policy(devices_.size());
    if (allowed.is_err()) return Res<Allocation>::err(allowed.unwrap_err());

    std::set<std::string> used;
    for (const auto& [address, owner] : by_address_) {
        used.insert(address);
    }
    auto address = pool.first_free(used);
    if (!address) {
        return fail<Allocation>(ErrorCode::PoolExhausted,
            "No free address in " + pool.first() + "-" + pool.last());
    }

    auto device = create_device(identifier, *address, public_key);
    devices_.emplace(identifier, device);
    by_address_.emplace(*address, identifier);

    if (hook) {
        auto hooked = hook(device);
        if (hooked.is_err()) {
            devices_.erase(identifier);
            by_address_.erase(*address);
            return Res<Allocation>::err(hooked.unwrap_err());
        }
    }
    return Res<Allocation>::ok(Allocation{.device = device, .allocated = true});
}

Result<void, Error> MemoryDeviceRegistry::set_public_key(const std::string& identifier,
                                                         const std::string& public_key) {
    std::lock_guard lock(mutex_);
    auto it = devices_.find(identifier);
    if (it == devices_.end()) return Result<void, Error>::err(not_found(identifier));
    it->second = with_public_key(it->second, public_key);
    return Result<void, Error>::ok();
}

Result<void, Error> MemoryDeviceRegistry::remove(const std::string& identifier) {
    std::lock_guard lock(mutex_);
    auto it = devices_.find(identifier);
    if (it == devices_.end()) return Result<void, Error>::err(not_found(identifier));
    by_address_.erase(it->second.address);
    devices_.erase(it);
    return Result<void, Error>::ok();
}

Res<std::vector<Device>> MemoryDeviceRegistry::list() {
    std::lock_guard lock(mutex_);
    std::vector<Device> devices;
    devices.reserve(devices_.size());
    for (const auto& [identifier, device] : devices_) {
        devices.push_back(device);
    }
    std::stable_sort(devices.begin(), devices.end(), [](const Device& a, const Device& b) {
        return a.registered_at < b.registered_at;
    });
    return Res<std::vector<Device>>::ok(std::move(devices));
}

Res<uint64_t> MemoryDeviceRegistry::count() {
    std::lock_guard lock(mutex_);
    return Res<uint64_t>::ok(devices_.size());
}

} // namespace jitstreamer::registry
