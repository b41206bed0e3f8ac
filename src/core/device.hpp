#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace jitstreamer {

/**
 * Device - A registered device and the tunnel address bound to it.
 *
 * identifier -> address never changes once assigned. The public key is
 * the WireGuard peer key currently applied for the device and is empty
 * for devices registered without a VPN peer.
 */
struct Device {
    std::string identifier;
    std::string address;
    std::string public_key;
    Timestamp registered_at;
    Timestamp last_seen;

    bool operator==(const Device&) const = default;
};

/**
 * RegistrationPolicy - Process-wide switch for accepting new devices.
 *
 * Direct registers a device at the address its request came from instead
 * of a pool address, and gives it no VPN peer.
 */
struct RegistrationPolicy {
    enum class Mode { Disabled, Enabled, EnabledWithCap, Direct };

    Mode mode = Mode::Enabled;
    uint64_t cap = 0;  // Only meaningful for EnabledWithCap

    [[nodiscard]] static RegistrationPolicy disabled() { return {Mode::Disabled, 0}; }
    [[nodiscard]] static RegistrationPolicy enabled() { return {Mode::Enabled, 0}; }
    [[nodiscard]] static RegistrationPolicy enabled_with_cap(uint64_t n) {
        return {Mode::EnabledWithCap, n};
    }
    [[nodiscard]] static RegistrationPolicy direct() { return {Mode::Direct, 0}; }

    bool operator==(const RegistrationPolicy&) const = default;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

[[nodiscard]] inline Device create_device(
    std::string identifier,
    std::string address,
    std::string public_key = {}
) {
    auto now = Timestamp::now();
    return Device{
        .identifier = std::move(identifier),
        .address = std::move(address),
        .public_key = std::move(public_key),
        .registered_at = now,
        .last_seen = now
    };
}

[[nodiscard]] inline Device with_last_seen(Device device, Timestamp last_seen) {
    device.last_seen = last_seen;
    return device;
}

[[nodiscard]] inline Device with_public_key(Device device, std::string public_key) {
    device.public_key = std::move(public_key);
    return device;
}

/**
 * Whether one more device may be registered when `registered` already exist.
 */
[[nodiscard]] inline bool admits_new_device(const RegistrationPolicy& policy, uint64_t registered) {
    switch (policy.mode) {
        case RegistrationPolicy::Mode::Disabled: return false;
        case RegistrationPolicy::Mode::Enabled: return true;
        case RegistrationPolicy::Mode::EnabledWithCap: return registered < policy.cap;
        case RegistrationPolicy::Mode::Direct: return true;
    }
    return false;
}

[[nodiscard]] inline bool registers_direct(const RegistrationPolicy& policy) {
    return policy.mode == RegistrationPolicy::Mode::Direct;
}

/**
 * Error returned when the policy refuses a registration.
 */
[[nodiscard]] inline Error registration_refused(const RegistrationPolicy& policy) {
    if (policy.mode == RegistrationPolicy::Mode::EnabledWithCap) {
        return Error{"Registration cap of " + std::to_string(policy.cap) + " devices reached",
                     ErrorCode::RegistrationDisabled};
    }
    return Error{"Registration is disabled", ErrorCode::RegistrationDisabled};
}

/**
 * Parse "disabled", "enabled", "direct", "enabled_with_cap:<n>" (or
 * "cap:<n>"). The numeric forms used by ALLOW_REGISTRATION are accepted
 * too: 0 = disabled, 1 = enabled, 2 = direct.
 */
[[nodiscard]] inline Res<RegistrationPolicy> parse_registration_policy(std::string_view text) {
    if (text == "disabled" || text == "0") {
        return Res<RegistrationPolicy>::ok(RegistrationPolicy::disabled());
    }
    if (text == "enabled" || text == "1") {
        return Res<RegistrationPolicy>::ok(RegistrationPolicy::enabled());
    }
    if (text == "direct" || text == "2") {
        return Res<RegistrationPolicy>::ok(RegistrationPolicy::direct());
    }
    for (std::string_view prefix : {std::string_view("enabled_with_cap:"), std::string_view("cap:")}) {
        if (text.substr(0, prefix.size()) != prefix) continue;
        auto digits = text.substr(prefix.size());
        if (digits.empty()) break;
        uint64_t cap = 0;
        for (char c : digits) {
            if (c < '0' || c > '9') {
                return fail<RegistrationPolicy>(ErrorCode::InvalidArgument,
                    "Invalid registration cap: " + std::string(digits));
            }
            const auto digit = static_cast<uint64_t>(c - '0');
            if (cap > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
                return fail<RegistrationPolicy>(ErrorCode::InvalidArgument,
                    "Registration cap out of range: " + std::string(digits));
            }
            cap = cap * 10 + digit;
        }
        return Res<RegistrationPolicy>::ok(RegistrationPolicy::enabled_with_cap(cap));
    }
    return fail<RegistrationPolicy>(ErrorCode::InvalidArgument,
        "Unknown registration policy: " + std::string(text));
}

[[nodiscard]] inline std::string to_string(const RegistrationPolicy& policy) {
    switch (policy.mode) {
        case RegistrationPolicy::Mode::Disabled: return "disabled";
        case RegistrationPolicy::Mode::Enabled: return "enabled";
        case RegistrationPolicy::Mode::EnabledWithCap:
            return "enabled_with_cap:" + std::to_string(policy.cap);
        case RegistrationPolicy::Mode::Direct: return "direct";
    }
    return "enabled";
}

/**
 * Device identifiers become file names (<identifier>.plist) and process
 * arguments, so they are restricted to a conservative character set.
 */
[[nodiscard]] inline Res<std::string> validate_identifier(std::string_view identifier) {
    if (identifier.empty() || identifier.size() > 128) {
        return fail<std::string>(ErrorCode::InvalidArgument, "Device identifier must be 1-128 characters");
    }
    for (char c : identifier) {
        bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
                  (c >= 'A' && c <= 'Z') || c == '-' || c == '_' || c == '.';
        if (!ok) {
            return fail<std::string>(ErrorCode::InvalidArgument,
                "Device identifier contains invalid character");
        }
    }
    if (identifier == "." || identifier == "..") {
        return fail<std::string>(ErrorCode::InvalidArgument, "Device identifier is reserved");
    }
    return Res<std::string>::ok(std::string(identifier));
}

} // namespace jitstreamer
