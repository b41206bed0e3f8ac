#pragma once

#include "core/result.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace jitstreamer {

/**
 * Normalize an IPv4/IPv6 address to its canonical text form
 * ("FD00:0::02" -> "fd00::2"). Fails with InvalidArgument.
 */
[[nodiscard]] Res<std::string> canonical_address(std::string_view text);

/**
 * AddressPool - An inclusive range of tunnel addresses.
 *
 * Accepted forms:
 *   "fd00::2-fd00::ffff"   explicit range
 *   "10.7.0.0/24"          subnet; the network address (and the IPv4
 *                          broadcast address) are excluded
 *   "fd00::5"              a single address
 *
 * The pool itself holds no allocation state; the registry's address column
 * is the source of truth and is passed in as the `used` set.
 */
class AddressPool {
public:
    using Bytes = std::array<uint8_t, 16>;

    [[nodiscard]] static Res<AddressPool> parse(std::string_view pool_text);

    [[nodiscard]] bool is_ipv6() const noexcept { return ipv6_; }

    /**
     * Number of addresses, saturating at UINT64_MAX for huge IPv6 ranges.
     */
    [[nodiscard]] uint64_t size() const noexcept { return size_; }

    /**
     * Host-route prefix used for WireGuard AllowedIPs (128 or 32).
     */
    [[nodiscard]] int host_prefix() const noexcept { return ipv6_ ? 128 : 32; }

    [[nodiscard]] std::optional<std::string> address_at(uint64_t index) const;
    [[nodiscard]] bool contains(std::string_view address) const;

    /**
     * Lowest address in the pool that is not in `used`.
     */
    [[nodiscard]] std::optional<std::string> first_free(const std::set<std::string>& used) const;

    [[nodiscard]] std::string first() const { return address_at(0).value_or(std::string{}); }
    [[nodiscard]] std::string last() const { return address_at(size_ - 1).value_or(std::string{}); }

private:
    AddressPool(Bytes base, uint64_t size, bool ipv6) : base_(base), size_(size), ipv6_(ipv6) {}

    Bytes base_{};
    uint64_t size_ = 0;
    bool ipv6_ = true;
};

} // namespace jitstreamer
