#pragma once

#include "core/address_pool.hpp"
#include "core/device.hpp"
#include "core/result.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace jitstreamer::registry {

/**
 * Allocation - Result of allocate_and_register.
 * `allocated` is false when the device already existed and nothing changed.
 */
struct Allocation {
    Device device;
    bool allocated = false;
};

/**
 * Runs inside the allocation step, after the row is written but before it
 * is committed. An error here rolls the row back and frees the address.
 */
using AllocationHook = std::function<Result<void, Error>(const Device&)>;

/**
 * DeviceRegistry - Authoritative identifier -> tunnel address mapping.
 *
 * Callers depend only on this interface; SqliteDeviceRegistry and
 * MemoryDeviceRegistry are interchangeable. Every mutating call is durable
 * (for the persistent implementation) before it returns Ok.
 *
 * Error codes:
 *   NotFound              lookup/touch/remove of an unknown device
 *   AlreadyRegistered     identifier bound to another address, or the
 *                         address bound to another identifier
 *   RegistrationDisabled  the policy refuses new devices
 *   PoolExhausted         no free address left in the pool
 *   InvalidArgument       malformed identifier or address
 *   Storage               the backing store failed
 */
class DeviceRegistry {
public:
    virtual ~DeviceRegistry() = default;

    [[nodiscard]] virtual Res<Device> lookup(const std::string& identifier) = 0;
    [[nodiscard]] virtual Res<Device> lookup_by_address(const std::string& address) = 0;

    /**
     * Bind `identifier` to `address`. Idempotent for the same pair.
     */
    [[nodiscard]] virtual Res<Device> register_device(const std::string& identifier,
                                                      const std::string& address,
                                                      const std::string& public_key = {}) = 0;

    /**
     * Update last-seen to now.
     */
    [[nodiscard]] virtual Result<void, Error> touch(const std::string& identifier) = 0;

    /**
     * Atomically pick the lowest free address in `pool`, bind it to
     * `identifier` and run `hook`. Existing devices are returned untouched
     * (the hook is not run).
     */
    [[nodiscard]] virtual Res<Allocation> allocate_and_register(const std::string& identifier,
                                                                const AddressPool& pool,
                                                                const std::string& public_key,
                                                                const AllocationHook& hook) = 0;

    [[nodiscard]] virtual Result<void, Error> set_public_key(const std::string& identifier,
                                                             const std::string& public_key) = 0;
    [[nodiscard]] virtual Result<void, Error> remove(const std::string& identifier) = 0;
    [[nodiscard]] virtual Res<std::vector<Device>> list() = 0;
    [[nodiscard]] virtual Res<uint64_t> count() = 0;

    /**
     * Process-wide registration switch. Defaults to enabled (unlimited).
     */
    void allow_registration(RegistrationPolicy policy) {
        std::lock_guard lock(policy_mutex_);
        policy_ = policy;
    }

    [[nodiscard]] RegistrationPolicy policy() const {
        std::lock_guard lock(policy_mutex_);
        return policy_;
    }

protected:
    /**
     * Ok when one more device may join a registry that holds `registered`.
     */
    [[nodiscard]] Result<void, Error> check_policy(uint64_t registered) const {
        auto current = policy();
        if (!admits_new_device(current, registered)) {
            return Result<void, Error>::err(registration_refused(current));
        }
        return Result<void, Error>::ok();
    }

private:
    mutable std::mutex policy_mutex_;
    RegistrationPolicy policy_ = RegistrationPolicy::enabled();
};

} // namespace jitstreamer::registry
