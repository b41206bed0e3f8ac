#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/address_pool.hpp"
#include "registry/memory_device_registry.hpp"
#include <algorithm>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using namespace jitstreamer;

namespace {

std::string fd00(int host) {
    std::ostringstream out;
    out << "fd00::" << std::hex << host;
    return out.str();
}

AddressPool range_of(int first, int size) {
    return AddressPool::parse(fd00(first) + "-" + fd00(first + size - 1)).unwrap();
}

} // namespace

TEST_CASE("Property: first_free is the lowest unused address", "[property][address_pool]") {
    rc::check("first_free skips exactly the used addresses",
        []() {
            const int first = *rc::gen::inRange(1, 9000);
            const int size = *rc::gen::inRange(1, 64);
            const auto pool = range_of(first, size);
            const auto taken = *rc::gen::container<std::vector<bool>>(size, rc::gen::arbitrary<bool>());

            std::set<std::string> used;
            std::optional<std::string> expected;
            for (int i = 0; i < size; ++i) {
                auto address = pool.address_at(static_cast<uint64_t>(i));
                RC_ASSERT(address.has_value());
                if (taken[i]) {
                    used.insert(*address);
                } else if (!expected) {
                    expected = address;
                }
            }

            RC_ASSERT(pool.first_free(used).value_or("") == expected.value_or(""));
            return true;
        }
    );
}

TEST_CASE("Property: pool membership matches its index range", "[property][address_pool]") {
    rc::check("contains(address_at(i)) iff i < size",
        []() {
            const int first = *rc::gen::inRange(2, 9000);
            const int size = *rc::gen::inRange(1, 200);
            const auto pool = range_of(first, size);

            RC_ASSERT(pool.size() == static_cast<uint64_t>(size));
            RC_ASSERT(pool.contains(*pool.address_at(0)));
            RC_ASSERT(pool.contains(pool.last()));
            RC_ASSERT(!pool.address_at(static_cast<uint64_t>(size)).has_value());

            // Neighbours just outside the range.
            RC_ASSERT(!pool.contains(fd00(first - 1)));
            RC_ASSERT(!pool.contains(fd00(first + size)));
            return true;
        }
    );
}

TEST_CASE("Property: IPv4 subnets hold 2^host_bits - 2 hosts", "[property][address_pool]") {
    rc::check("network and broadcast are excluded",
        []() {
            const int prefix = *rc::gen::inRange(16, 31);
            const auto pool = AddressPool::parse("10.0.0.0/" + std::to_string(prefix)).unwrap();
            const uint64_t hosts = (uint64_t{1} << (32 - prefix)) - 2;

            RC_ASSERT(pool.size() == hosts);
            RC_ASSERT(pool.first() == "10.0.0.1");
            RC_ASSERT(!pool.contains("10.0.0.0"));
            return true;
        }
    );
}

TEST_CASE("Property: allocation never hands out an address twice", "[property][registry]") {
    rc::check("allocated addresses are distinct, in the pool, and bounded by its size",
        []() {
            const int size = *rc::gen::inRange(1, 16);
            const int devices = *rc::gen::inRange(0, 24);
            const auto pool = range_of(2, size);

            registry::MemoryDeviceRegistry registry;
            std::set<std::string> addresses;
            int exhausted = 0;
            for (int i = 0; i < devices; ++i) {
                auto allocation = registry.allocate_and_register("udid-" + std::to_string(i), pool, {}, {});
                if (allocation.is_err()) {
                    RC_ASSERT(allocation.unwrap_err().is(ErrorCode::PoolExhausted));
                    ++exhausted;
                    continue;
                }
                RC_ASSERT(pool.contains(allocation.unwrap().device.address));
                RC_ASSERT(addresses.insert(allocation.unwrap().device.address).second);
            }

            RC_ASSERT(addresses.size() == static_cast<size_t>(std::min(size, devices)));
            RC_ASSERT(exhausted == std::max(0, devices - size));
            return true;
        }
    );
}
