#pragma once

#include <sodium.h>

#include <array>
#include <chrono>
#include <compare>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace jitstreamer {

/**
 * Uuid - 128-bit random identifier (RFC 4122 version 4).
 *
 * Used as the session handle handed to clients, so the bytes come from
 * libsodium's CSPRNG rather than a seeded PRNG.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    constexpr Uuid() noexcept : bytes_{} {}
    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    [[nodiscard]] static Uuid generate() {
        Bytes bytes;
        randombytes_buf(bytes.data(), bytes.size());
        bytes[6] = (bytes[6] & 0x0F) | 0x40;
        bytes[8] = (bytes[8] & 0x3F) | 0x80;
        return Uuid(bytes);
    }

    /**
     * Parse hyphenated or bare hex. Returns nullopt on any malformed input.
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view str) {
        std::string clean;
        clean.reserve(32);
        for (char c : str) {
            if (c != '-') clean += c;
        }
        if (clean.size() != 32) return std::nullopt;

        Bytes bytes;
        for (size_t i = 0; i < BYTE_SIZE; ++i) {
            int hi = hex_value(clean[i * 2]);
            int lo = hex_value(clean[i * 2 + 1]);
            if (hi < 0 || lo < 0) return std::nullopt;
            bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
        }
        return Uuid(bytes);
    }

    [[nodiscard]] std::string to_string() const {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (size_t i = 0; i < BYTE_SIZE; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                oss << '-';
            }
            oss << std::setw(2) << static_cast<int>(bytes_[i]);
        }
        return oss.str();
    }

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept { return bytes_; }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    static constexpr int hex_value(char c) noexcept {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    Bytes bytes_;
};

/**
 * Timestamp - Milliseconds since the Unix epoch (the unit stored in SQLite).
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::duration_cast<Duration>(
            Clock::now().time_since_epoch()).count());
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept { return millis_; }

    [[nodiscard]] std::string to_iso_string() const {
        auto time_t = Clock::to_time_t(TimePoint(Duration(millis_)));
        std::tm tm{};
        gmtime_r(&time_t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << (millis_ % 1000) << 'Z';
        return oss.str();
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const { return Timestamp(millis_ + d.count()); }
    Timestamp operator-(Duration d) const { return Timestamp(millis_ - d.count()); }
    Duration operator-(const Timestamp& other) const { return Duration(millis_ - other.millis_); }

private:
    int64_t millis_;
};

} // namespace jitstreamer

namespace std {
    template<>
    struct hash<jitstreamer::Uuid> {
        size_t operator()(const jitstreamer::Uuid& uuid) const noexcept {
            const auto& bytes = uuid.bytes();
            size_t h = 0;
            for (size_t i = 0; i < bytes.size(); i += sizeof(size_t)) {
                size_t chunk = 0;
                for (size_t j = 0; j < sizeof(size_t) && i + j < bytes.size(); ++j) {
                    chunk |= static_cast<size_t>(bytes[i + j]) << (j * 8);
                }
                h ^= chunk + 0x9e3779b9 + (h << 6) + (h >> 2);
            }
            return h;
        }
    };
}
