#include "core/address_pool.hpp"

#include <QHostAddress>
#include <QString>
#include <limits>

namespace jitstreamer {

namespace {

using Bytes = AddressPool::Bytes;
constexpr uint64_t SATURATED = std::numeric_limits<uint64_t>::max();

std::optional<std::pair<Bytes, bool>> to_bytes(const QHostAddress& address) {
    Bytes bytes{};
    if (address.protocol() == QAbstractSocket::IPv4Protocol) {
        const quint32 v4 = address.toIPv4Address();
        bytes[12] = static_cast<uint8_t>(v4 >> 24);
        bytes[13] = static_cast<uint8_t>(v4 >> 16);
        bytes[14] = static_cast<uint8_t>(v4 >> 8);
        bytes[15] = static_cast<uint8_t>(v4);
        return std::make_pair(bytes, false);
    }
    if (address.protocol() == QAbstractSocket::IPv6Protocol) {
        const Q_IPV6ADDR v6 = address.toIPv6Address();
        for (size_t i = 0; i < bytes.size(); ++i) {
            bytes[i] = v6[static_cast<int>(i)];
        }
        return std::make_pair(bytes, true);
    }
    return std::nullopt;
}

QHostAddress from_bytes(const Bytes& bytes, bool ipv6) {
    if (!ipv6) {
        const quint32 v4 = (static_cast<quint32>(bytes[12]) << 24) |
                           (static_cast<quint32>(bytes[13]) << 16) |
                           (static_cast<quint32>(bytes[14]) << 8) |
                           static_cast<quint32>(bytes[15]);
        return QHostAddress(v4);
    }
    Q_IPV6ADDR v6;
    for (size_t i = 0; i < bytes.size(); ++i) {
        v6[static_cast<int>(i)] = bytes[i];
    }
    return QHostAddress(v6);
}

// Big-endian add; returns nullopt on overflow past the family's width.
std::optional<Bytes> add(Bytes bytes, uint64_t offset, bool ipv6) {
    unsigned carry = 0;
    for (int i = 15; i >= 0; --i) {
        unsigned sum = bytes[i] + static_cast<unsigned>(offset & 0xFF) + carry;
        bytes[i] = static_cast<uint8_t>(sum & 0xFF);
        carry = sum >> 8;
        offset >>= 8;
    }
    if (carry != 0 || offset != 0) return std::nullopt;
    if (!ipv6) {
        for (int i = 0; i < 12; ++i) {
            if (bytes[i] != 0) return std::nullopt;
        }
    }
    return bytes;
}

// last - first + 1, saturating. Requires first <= last.
uint64_t span(const Bytes& first, const Bytes& last) {
    uint64_t hi = 0;
    uint64_t lo = 0;
    int borrow = 0;
    for (int i = 15; i >= 0; --i) {
        int diff = static_cast<int>(last[i]) - static_cast<int>(first[i]) - borrow;
        borrow = diff < 0 ? 1 : 0;
        if (diff < 0) diff += 256;
        if (i >= 8) {
            lo |= static_cast<uint64_t>(diff) << ((15 - i) * 8);
        } else {
            hi |= static_cast<uint64_t>(diff) << ((7 - i) * 8);
        }
    }
    if (hi != 0 || lo == SATURATED) return SATURATED;
    return lo + 1;
}

Res<std::pair<Bytes, bool>> parse_address(const QString& text) {
    QHostAddress address;
    if (!address.setAddress(text.trimmed())) {
        return fail<std::pair<Bytes, bool>>(ErrorCode::InvalidArgument,
            "Invalid address: " + text.toStdString());
    }
    auto bytes = to_bytes(address);
    if (!bytes) {
        return fail<std::pair<Bytes, bool>>(ErrorCode::InvalidArgument,
            "Unsupported address family: " + text.toStdString());
    }
    return Res<std::pair<Bytes, bool>>::ok(*bytes);
}

} // namespace

Res<std::string> canonical_address(std::string_view text) {
    auto parsed = parse_address(QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size())));
    if (parsed.is_err()) {
        return Res<std::string>::err(parsed.unwrap_err());
    }
    const auto& [bytes, ipv6] = parsed.unwrap();
    return Res<std::string>::ok(from_bytes(bytes, ipv6).toString().toStdString());
}

Res<AddressPool> AddressPool::parse(std::string_view pool_text) {
    const auto text = QString::fromUtf8(pool_text.data(), static_cast<qsizetype>(pool_text.size())).trimmed();
    if (text.isEmpty()) {
        return fail<AddressPool>(ErrorCode::InvalidArgument, "Empty address pool");
    }

    if (text.contains(QLatin1Char('-'))) {
        const auto parts = text.split(QLatin1Char('-'));
        if (parts.size() != 2) {
            return fail<AddressPool>(ErrorCode::InvalidArgument,
                "Address range must be <first>-<last>: " + std::string(pool_text));
        }
        auto first = parse_address(parts[0]);
        if (first.is_err()) return Res<AddressPool>::err(first.unwrap_err());
        auto last = parse_address(parts[1]);
        if (last.is_err()) return Res<AddressPool>::err(last.unwrap_err());

        const auto& [first_bytes, first_v6] = first.unwrap();
        const auto& [last_bytes, last_v6] = last.unwrap();
        if (first_v6 != last_v6) {
            return fail<AddressPool>(ErrorCode::InvalidArgument,
                "Address range mixes IPv4 and IPv6: " + std::string(pool_text));
        }
        if (last_bytes < first_bytes) {
            return fail<AddressPool>(ErrorCode::InvalidArgument,
                "Address range is reversed: " + std::string(pool_text));
        }
        return Res<AddressPool>::ok(AddressPool(first_bytes, span(first_bytes, last_bytes), first_v6));
    }

    if (text.contains(QLatin1Char('/'))) {
        const auto subnet = QHostAddress::parseSubnet(text);
        if (subnet.first.isNull() || subnet.second < 0) {
            return fail<AddressPool>(ErrorCode::InvalidArgument,
                "Invalid subnet: " + std::string(pool_text));
        }
        auto network = to_bytes(subnet.first);
        if (!network) {
            return fail<AddressPool>(ErrorCode::InvalidArgument,
                "Unsupported address family: " + std::string(pool_text));
        }
        auto [bytes, ipv6] = *network;
        const int width = ipv6 ? 128 : 32;
        const int host_bits = width - subnet.second;

        // Mask off host bits.
        for (int bit = 0; bit < host_bits; ++bit) {
            const int byte = 15 - bit / 8;
            bytes[byte] = static_cast<uint8_t>(bytes[byte] & ~(1u << (bit % 8)));
        }

        if (host_bits == 0) {
            return Res<AddressPool>::ok(AddressPool(bytes, 1, ipv6));
        }
        auto first = add(bytes, 1, ipv6);
        if (!first) {
            return fail<AddressPool>(ErrorCode::InvalidArgument, "Invalid subnet: " + std::string(pool_text));
        }
        uint64_t count = host_bits >= 64 ? SATURATED : (uint64_t{1} << host_bits) - 1;
        if (!ipv6 && host_bits >= 2) {
            count -= 1;  // broadcast
        }
        return Res<AddressPool>::ok(AddressPool(*first, count, ipv6));
    }

    auto single = parse_address(text);
    if (single.is_err()) return Res<AddressPool>::err(single.unwrap_err());
    const auto& [bytes, ipv6] = single.unwrap();
    return Res<AddressPool>::ok(AddressPool(bytes, 1, ipv6));
}

std::optional<std::string> AddressPool::address_at(uint64_t index) const {
    if (index >= size_) return std::nullopt;
    auto bytes = add(base_, index, ipv6_);
    if (!bytes) return std::nullopt;
    return from_bytes(*bytes, ipv6_).toString().toStdString();
}

bool AddressPool::contains(std::string_view address) const {
    auto parsed = parse_address(QString::fromUtf8(address.data(), static_cast<qsizetype>(address.size())));
    if (parsed.is_err()) return false;
    const auto& [bytes, ipv6] = parsed.unwrap();
    if (ipv6 != ipv6_ || bytes < base_) return false;
    return span(base_, bytes) <= size_;
}

std::optional<std::string> AddressPool::first_free(const std::set<std::string>& used) const {
    // Each miss consumes a distinct member of `used`, so this ends after at
    // most used.size() + 1 candidates.
    for (uint64_t i = 0; i < size_; ++i) {
        auto candidate = address_at(i);
        if (!candidate) return std::nullopt;
        if (used.find(*candidate) == used.end()) {
            return candidate;
        }
    }
    return std::nullopt;
}

} // namespace jitstreamer
