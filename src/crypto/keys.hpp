#pragma once

#include "core/result.hpp"
#include <sodium.h>
#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace jitstreamer::crypto {

// Curve25519 key sizes, as used by WireGuard.
constexpr size_t PUBLIC_KEY_SIZE = crypto_scalarmult_curve25519_BYTES;
constexpr size_t SECRET_KEY_SIZE = crypto_scalarmult_curve25519_SCALARBYTES;

using PublicKey = std::array<uint8_t, PUBLIC_KEY_SIZE>;
using SecretKey = std::array<uint8_t, SECRET_KEY_SIZE>;

/**
 * KeyPair - An X25519 key pair. The secret half is wiped on destruction.
 */
struct KeyPair {
    PublicKey public_key{};
    SecretKey secret_key{};

    KeyPair() = default;
    KeyPair(const KeyPair&) = default;
    KeyPair& operator=(const KeyPair&) = default;
    ~KeyPair() { sodium_memzero(secret_key.data(), secret_key.size()); }
};

/**
 * Initialize libsodium. Safe to call more than once.
 */
[[nodiscard]] inline Result<void, Error> init() {
    if (sodium_init() < 0) {
        return Result<void, Error>::err(Error{"Failed to initialize libsodium"});
    }
    return Result<void, Error>::ok();
}

/**
 * Generate a WireGuard key pair.
 *
 * The secret key is clamped the way `wg genkey` clamps it, so the base64
 * form matches what WireGuard tooling would produce for the same scalar.
 */
[[nodiscard]] inline KeyPair generate_keypair() {
    KeyPair kp;
    crypto_box_keypair(kp.public_key.data(), kp.secret_key.data());
    kp.secret_key[0] &= 248;
    kp.secret_key[31] &= 127;
    kp.secret_key[31] |= 64;
    return kp;
}

/**
 * Derive the public key for a secret key (`wg pubkey`).
 */
[[nodiscard]] inline Res<PublicKey> public_key_from_secret(const SecretKey& secret) {
    PublicKey pk{};
    if (crypto_scalarmult_curve25519_base(pk.data(), secret.data()) != 0) {
        return fail<PublicKey>(ErrorCode::InvalidArgument, "Secret key yields a degenerate public key");
    }
    return Res<PublicKey>::ok(pk);
}

/**
 * Standard (padded) Base64, the encoding WireGuard uses for keys.
 */
[[nodiscard]] inline std::string to_base64(const uint8_t* data, size_t size) {
    const size_t encoded_len = sodium_base64_ENCODED_LEN(size, sodium_base64_VARIANT_ORIGINAL);
    std::string out(encoded_len, '\0');
    sodium_bin2base64(out.data(), out.size(), data, size, sodium_base64_VARIANT_ORIGINAL);
    out.resize(encoded_len - 1);  // drop the terminator
    return out;
}

template<size_t N>
[[nodiscard]] std::string to_base64(const std::array<uint8_t, N>& bytes) {
    return to_base64(bytes.data(), bytes.size());
}

[[nodiscard]] inline std::string to_base64(const std::vector<uint8_t>& bytes) {
    return to_base64(bytes.data(), bytes.size());
}

[[nodiscard]] inline Res<std::vector<uint8_t>> from_base64(std::string_view b64) {
    std::vector<uint8_t> out(b64.size() / 4 * 3 + 3);
    size_t decoded = 0;
    if (sodium_base642bin(out.data(), out.size(), b64.data(), b64.size(),
                          " \t\r\n", &decoded, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0) {
        return fail<std::vector<uint8_t>>(ErrorCode::InvalidArgument, "Invalid Base64");
    }
    out.resize(decoded);
    return Res<std::vector<uint8_t>>::ok(std::move(out));
}

/**
 * Parse a Base64 WireGuard public key (exactly 32 bytes).
 */
[[nodiscard]] inline Res<PublicKey> parse_public_key(std::string_view b64) {
    auto bytes = from_base64(b64);
    if (bytes.is_err()) {
        return Res<PublicKey>::err(bytes.unwrap_err());
    }
    if (bytes.unwrap().size() != PUBLIC_KEY_SIZE) {
        return fail<PublicKey>(ErrorCode::InvalidArgument, "Public key must be 32 bytes");
    }
    PublicKey key{};
    std::copy(bytes.unwrap().begin(), bytes.unwrap().end(), key.begin());
    return Res<PublicKey>::ok(key);
}

} // namespace jitstreamer::crypto
