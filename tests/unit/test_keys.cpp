#include <catch2/catch_test_macros.hpp>
#include "crypto/keys.hpp"

using namespace jitstreamer;
using namespace jitstreamer::crypto;

TEST_CASE("Generated keys are WireGuard-clamped", "[crypto]") {
    auto kp = generate_keypair();

    REQUIRE((kp.secret_key[0] & 7) == 0);
    REQUIRE((kp.secret_key[31] & 128) == 0);
    REQUIRE((kp.secret_key[31] & 64) == 64);
}

TEST_CASE("Public key matches the secret key", "[crypto]") {
    auto kp = generate_keypair();
    auto derived = public_key_from_secret(kp.secret_key);

    REQUIRE(derived.is_ok());
    REQUIRE(derived.unwrap() == kp.public_key);
}

TEST_CASE("Key pairs differ", "[crypto]") {
    auto a = generate_keypair();
    auto b = generate_keypair();
    REQUIRE(a.public_key != b.public_key);
}

TEST_CASE("Base64 keys are 44 characters", "[crypto]") {
    auto kp = generate_keypair();
    const auto text = to_base64(kp.public_key);

    REQUIRE(text.size() == 44);
    REQUIRE(text.back() == '=');

    auto parsed = parse_public_key(text);
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.unwrap() == kp.public_key);
}

TEST_CASE("Known Base64 vectors", "[crypto]") {
    REQUIRE(to_base64(std::vector<uint8_t>{'f', 'o', 'o'}) == "Zm9v");
    REQUIRE(to_base64(std::vector<uint8_t>{'f', 'o'}) == "Zm8=");
    REQUIRE(from_base64("Zm9vYg==").unwrap() == std::vector<uint8_t>{'f', 'o', 'o', 'b'});
}

TEST_CASE("Malformed public keys are rejected", "[crypto]") {
    REQUIRE(parse_public_key("not base64!").unwrap_err().is(ErrorCode::InvalidArgument));
    REQUIRE(parse_public_key("Zm9v").unwrap_err().is(ErrorCode::InvalidArgument));
}
