#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>
#include "registry/memory_device_registry.hpp"
#include "registry/sqlite_device_registry.hpp"
#include "storage/migrations.hpp"

using namespace jitstreamer;
using namespace jitstreamer::registry;

namespace {

storage::Database migrated_memory_db() {
    auto db = storage::Database::open_memory().unwrap();
    storage::initialize_database(db).unwrap();
    return db;
}

struct SqliteBacked {
    storage::Database db = migrated_memory_db();
    SqliteDeviceRegistry registry{db};
};

struct MemoryBacked {
    MemoryDeviceRegistry registry;
};

AddressPool small_pool() {
    return AddressPool::parse("fd00::2-fd00::4").unwrap();
}

} // namespace

TEMPLATE_TEST_CASE("Registering devices", "[registry]", SqliteBacked, MemoryBacked) {
    TestType backend;
    DeviceRegistry& registry = backend.registry;

    auto first = registry.register_device("udid-a", "FD00::2");
    REQUIRE(first.is_ok());
    REQUIRE(first.unwrap().address == "fd00::2");

    SECTION("Same pair is idempotent") {
        auto again = registry.register_device("udid-a", "fd00::2");
        REQUIRE(again.is_ok());
        REQUIRE(again.unwrap().registered_at == first.unwrap().registered_at);
        REQUIRE(registry.count().unwrap() == 1);
    }

    SECTION("Identifier cannot move to another address") {
        auto moved = registry.register_device("udid-a", "fd00::3");
        REQUIRE(moved.unwrap_err().is(ErrorCode::AlreadyRegistered));
        REQUIRE(registry.lookup("udid-a").unwrap().address == "fd00::2");
    }

    SECTION("Address cannot be shared") {
        auto shared = registry.register_device("udid-b", "fd00::2");
        REQUIRE(shared.unwrap_err().is(ErrorCode::AlreadyRegistered));
        REQUIRE(registry.lookup("udid-b").unwrap_err().is(ErrorCode::NotFound));
    }

    SECTION("Lookups by identifier and address agree") {
        REQUIRE(registry.lookup("udid-a").unwrap() == registry.lookup_by_address("fd00:0::2").unwrap());
        REQUIRE(registry.lookup_by_address("fd00::9").unwrap_err().is(ErrorCode::NotFound));
        REQUIRE(registry.lookup_by_address("not an address").unwrap_err().is(ErrorCode::InvalidArgument));
    }

    SECTION("Malformed input is rejected") {
        REQUIRE(registry.register_device("../x", "fd00::5").unwrap_err().is(ErrorCode::InvalidArgument));
        REQUIRE(registry.register_device("udid-c", "nowhere").unwrap_err().is(ErrorCode::InvalidArgument));
    }

    SECTION("Touch and remove") {
        REQUIRE(registry.touch("udid-a").is_ok());
        REQUIRE(registry.lookup("udid-a").unwrap().last_seen >= first.unwrap().last_seen);
        REQUIRE(registry.touch("udid-z").unwrap_err().is(ErrorCode::NotFound));

        REQUIRE(registry.remove("udid-a").is_ok());
        REQUIRE(registry.remove("udid-a").unwrap_err().is(ErrorCode::NotFound));
        REQUIRE(registry.register_device("udid-b", "fd00::2").is_ok());
    }

    SECTION("Public key updates") {
        REQUIRE(registry.set_public_key("udid-a", "KEY=").is_ok());
        REQUIRE(registry.lookup("udid-a").unwrap().public_key == "KEY=");
        REQUIRE(registry.set_public_key("udid-z", "KEY=").unwrap_err().is(ErrorCode::NotFound));
    }
}

TEMPLATE_TEST_CASE("Registration policy is enforced", "[registry]", SqliteBacked, MemoryBacked) {
    TestType backend;
    DeviceRegistry& registry = backend.registry;

    SECTION("Disabled refuses new devices but keeps existing ones") {
        REQUIRE(registry.register_device("udid-a", "fd00::2").is_ok());
        registry.allow_registration(RegistrationPolicy::disabled());

        REQUIRE(registry.register_device("udid-b", "fd00::3").unwrap_err().is(ErrorCode::RegistrationDisabled));
        REQUIRE(registry.allocate_and_register("udid-b", small_pool(), {}, {})
                    .unwrap_err().is(ErrorCode::RegistrationDisabled));
        REQUIRE(registry.register_device("udid-a", "fd00::2").is_ok());
        REQUIRE(registry.lookup("udid-a").is_ok());
    }

    SECTION("Cap counts registered devices") {
        registry.allow_registration(RegistrationPolicy::enabled_with_cap(2));
        REQUIRE(registry.register_device("udid-a", "fd00::2").is_ok());
        REQUIRE(registry.register_device("udid-b", "fd00::3").is_ok());
        REQUIRE(registry.register_device("udid-c", "fd00::4").unwrap_err().is(ErrorCode::RegistrationDisabled));

        REQUIRE(registry.remove("udid-a").is_ok());
        REQUIRE(registry.register_device("udid-c", "fd00::4").is_ok());
    }
}

TEMPLATE_TEST_CASE("Address allocation", "[registry][allocation]", SqliteBacked, MemoryBacked) {
    TestType backend;
    DeviceRegistry& registry = backend.registry;
    const auto pool = small_pool();

    SECTION("Lowest free address wins") {
        REQUIRE(registry.register_device("manual", "fd00::3").is_ok());

        auto a = registry.allocate_and_register("udid-a", pool, "KA=", {}).unwrap();
        REQUIRE(a.allocated);
        REQUIRE(a.device.address == "fd00::2");
        REQUIRE(a.device.public_key == "KA=");

        auto b = registry.allocate_and_register("udid-b", pool, {}, {}).unwrap();
        REQUIRE(b.device.address == "fd00::4");
    }

    SECTION("Existing devices keep their address and skip the hook") {
        auto a = registry.allocate_and_register("udid-a", pool, {}, {}).unwrap();

        bool hook_ran = false;
        auto again = registry.allocate_and_register("udid-a", pool, {}, [&](const Device&) {
            hook_ran = true;
            return Result<void, Error>::ok();
        }).unwrap();

        REQUIRE_FALSE(again.allocated);
        REQUIRE(again.device.address == a.device.address);
        REQUIRE_FALSE(hook_ran);
    }

    SECTION("Hook sees the new device") {
        std::string seen;
        auto a = registry.allocate_and_register("udid-a", pool, {}, [&](const Device& device) {
            seen = device.identifier + "@" + device.address;
            return Result<void, Error>::ok();
        });
        REQUIRE(a.is_ok());
        REQUIRE(seen == "udid-a@fd00::2");
    }

    SECTION("Hook failure releases the address") {
        auto failed = registry.allocate_and_register("udid-a", pool, {}, [](const Device&) {
            return Result<void, Error>::err(Error{"wg set failed", ErrorCode::UpstreamUnavailable});
        });
        REQUIRE(failed.unwrap_err().is(ErrorCode::UpstreamUnavailable));
        REQUIRE(registry.lookup("udid-a").unwrap_err().is(ErrorCode::NotFound));
        REQUIRE(registry.count().unwrap() == 0);

        auto b = registry.allocate_and_register("udid-b", pool, {}, {}).unwrap();
        REQUIRE(b.device.address == "fd00::2");
    }

    SECTION("Exhausted pool") {
        for (const char* id : {"udid-a", "udid-b", "udid-c"}) {
            REQUIRE(registry.allocate_and_register(id, pool, {}, {}).is_ok());
        }
        auto d = registry.allocate_and_register("udid-d", pool, {}, {});
        REQUIRE(d.unwrap_err().is(ErrorCode::PoolExhausted));
        REQUIRE(registry.count().unwrap() == 3);

        auto existing = registry.allocate_and_register("udid-b", pool, {}, {});
        REQUIRE(existing.is_ok());
        REQUIRE(existing.unwrap().device.address == "fd00::3");
    }

    SECTION("Listing follows registration order") {
        REQUIRE(registry.allocate_and_register("udid-a", pool, {}, {}).is_ok());
        REQUIRE(registry.allocate_and_register("udid-b", pool, {}, {}).is_ok());

        auto devices = registry.list().unwrap();
        REQUIRE(devices.size() == 2);
        REQUIRE(devices[0].address == "fd00::2");
        REQUIRE(devices[1].address == "fd00::3");
    }
}
