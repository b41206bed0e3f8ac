#include <catch2/catch_test_macros.hpp>
#include "core/device.hpp"
#include "core/session.hpp"
#include "core/types.hpp"
#include <limits>
#include <set>

using namespace jitstreamer;

TEST_CASE("Uuid generation and parsing", "[types]") {
    auto a = Uuid::generate();
    auto b = Uuid::generate();

    REQUIRE_FALSE(a.is_nil());
    REQUIRE(a != b);

    const auto text = a.to_string();
    REQUIRE(text.size() == 36);
    REQUIRE(text[14] == '4');  // version nibble

    auto parsed = Uuid::parse(text);
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == a);

    REQUIRE_FALSE(Uuid::parse("not-a-uuid").has_value());
    REQUIRE_FALSE(Uuid::parse("").has_value());
    REQUIRE(Uuid().is_nil());
}

TEST_CASE("Timestamp arithmetic and formatting", "[types]") {
    Timestamp t(1'700'000'000'123);

    REQUIRE((t + std::chrono::milliseconds(10)).millis() == 1'700'000'000'133);
    REQUIRE((t - std::chrono::milliseconds(23)).millis() == 1'700'000'000'100);
    REQUIRE((Timestamp(5000) - Timestamp(2000)) == std::chrono::milliseconds(3000));
    REQUIRE(t.to_iso_string() == "2023-11-14T22:13:20.123Z");
    REQUIRE(Timestamp(1) < Timestamp(2));
}

TEST_CASE("Registration policy admission", "[types][device]") {
    REQUIRE_FALSE(admits_new_device(RegistrationPolicy::disabled(), 0));
    REQUIRE(admits_new_device(RegistrationPolicy::enabled(), 1'000'000));
    REQUIRE(admits_new_device(RegistrationPolicy::enabled_with_cap(2), 1));
    REQUIRE_FALSE(admits_new_device(RegistrationPolicy::enabled_with_cap(2), 2));
    REQUIRE_FALSE(admits_new_device(RegistrationPolicy::enabled_with_cap(0), 0));

    REQUIRE(registration_refused(RegistrationPolicy::disabled()).is(ErrorCode::RegistrationDisabled));
}

TEST_CASE("Registration policy parsing", "[types][device]") {
    REQUIRE(parse_registration_policy("disabled").unwrap() == RegistrationPolicy::disabled());
    REQUIRE(parse_registration_policy("0").unwrap() == RegistrationPolicy::disabled());
    REQUIRE(parse_registration_policy("enabled").unwrap() == RegistrationPolicy::enabled());
    REQUIRE(parse_registration_policy("1").unwrap() == RegistrationPolicy::enabled());
    REQUIRE(parse_registration_policy("2").unwrap() == RegistrationPolicy::direct());
    REQUIRE(parse_registration_policy("direct").unwrap() == RegistrationPolicy::direct());
    REQUIRE(parse_registration_policy("enabled_with_cap:25").unwrap() == RegistrationPolicy::enabled_with_cap(25));
    REQUIRE(parse_registration_policy("cap:3").unwrap() == RegistrationPolicy::enabled_with_cap(3));

    REQUIRE(parse_registration_policy("cap:").is_err());
    REQUIRE(parse_registration_policy("cap:x1").unwrap_err().is(ErrorCode::InvalidArgument));
    REQUIRE(parse_registration_policy("sometimes").is_err());

    SECTION("Caps beyond 64 bits are refused") {
        REQUIRE(parse_registration_policy("cap:18446744073709551615").unwrap() ==
                RegistrationPolicy::enabled_with_cap(std::numeric_limits<uint64_t>::max()));
        REQUIRE(parse_registration_policy("cap:18446744073709551616").unwrap_err().is(ErrorCode::InvalidArgument));
        REQUIRE(parse_registration_policy("enabled_with_cap:99999999999999999999").is_err());
    }

    REQUIRE(to_string(RegistrationPolicy::enabled_with_cap(4)) == "enabled_with_cap:4");
    REQUIRE(to_string(RegistrationPolicy::direct()) == "direct");
    REQUIRE(admits_new_device(RegistrationPolicy::direct(), 1'000'000));
    REQUIRE(registers_direct(RegistrationPolicy::direct()));
    REQUIRE_FALSE(registers_direct(RegistrationPolicy::enabled()));
}

TEST_CASE("Device identifiers are restricted", "[types][device]") {
    REQUIRE(validate_identifier("00008030-001A2B3C4D5E802E").is_ok());
    REQUIRE(validate_identifier("a.b_c-d").is_ok());

    for (const char* bad : {"", ".", "..", "../etc/passwd", "a/b", "a b", "a\\b"}) {
        INFO(bad);
        REQUIRE(validate_identifier(bad).unwrap_err().is(ErrorCode::InvalidArgument));
    }
    REQUIRE(validate_identifier(std::string(129, 'a')).is_err());
    REQUIRE(validate_identifier(std::string(128, 'a')).is_ok());
}

TEST_CASE("Device transformations", "[types][device]") {
    auto device = create_device("udid-1", "fd00::2");
    REQUIRE(device.registered_at == device.last_seen);
    REQUIRE(device.public_key.empty());

    auto seen = with_last_seen(device, device.last_seen + std::chrono::seconds(5));
    REQUIRE(seen.last_seen.millis() == device.last_seen.millis() + 5000);
    REQUIRE(seen.registered_at == device.registered_at);

    REQUIRE(with_public_key(device, "key").public_key == "key");
}

TEST_CASE("Session outcome helpers", "[types][session]") {
    REQUIRE_FALSE(is_terminal(SessionState::Submitted));
    REQUIRE_FALSE(is_terminal(SessionState::Dispatched));
    REQUIRE(is_terminal(SessionState::Succeeded));
    REQUIRE(is_terminal(SessionState::Cancelled));

    REQUIRE(terminal_state_for(Outcome::Kind::TimedOut) == SessionState::TimedOut);
    REQUIRE(status_string(Outcome::Kind::Succeeded) == "activated");
    REQUIRE(status_string(Outcome::Kind::Failed) == "failed");

    REQUIRE_FALSE(outcome_error(Outcome::succeeded()).has_value());
    auto failed = outcome_error(Outcome::failed("device locked"));
    REQUIRE(failed->is(ErrorCode::WorkerFailed));
    REQUIRE(failed->message == "device locked");
    REQUIRE(outcome_error(Outcome::timed_out())->is(ErrorCode::TimedOut));
}
