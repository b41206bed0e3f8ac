#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

using namespace jitstreamer;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err carries message and code", "[result]") {
    auto result = Result<int>::err(Error{"no such device", ErrorCode::NotFound});

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message == "no such device");
    REQUIRE(result.unwrap_err().is(ErrorCode::NotFound));
    REQUIRE(result.unwrap_err().native == 0);
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<int>::err(Error{"error"});

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
}

TEST_CASE("Result::value_or returns default on error", "[result]") {
    REQUIRE(Result<int>::ok(42).value_or(0) == 42);
    REQUIRE(Result<int>::err(Error{"error"}).value_or(0) == 0);
}

TEST_CASE("Result::map transforms success and keeps errors", "[result]") {
    auto mapped = Result<int>::ok(21).map([](int x) { return x * 2; });
    REQUIRE(mapped.unwrap() == 42);

    auto failed = Result<int>::err(Error{"error", ErrorCode::Storage}).map([](int x) { return x * 2; });
    REQUIRE(failed.is_err());
    REQUIRE(failed.unwrap_err().is(ErrorCode::Storage));
}

TEST_CASE("Result::and_then chains and short-circuits", "[result]") {
    auto divide = [](int x) -> Result<int> {
        if (x == 0) return Result<int>::err(Error{"division by zero", ErrorCode::InvalidArgument});
        return Result<int>::ok(100 / x);
    };

    REQUIRE(Result<int>::ok(5).and_then(divide).unwrap() == 20);
    REQUIRE(Result<int>::ok(0).and_then(divide).unwrap_err().is(ErrorCode::InvalidArgument));
    REQUIRE(Result<int>::err(Error{"initial error"}).and_then(divide).unwrap_err().message == "initial error");
}

TEST_CASE("Result::map_err transforms error", "[result]") {
    auto result = Result<int>::err(Error{"error", ErrorCode::Storage});
    auto mapped = result.map_err([](const Error& e) {
        return Error{e.message + " (transformed)", ErrorCode::Internal};
    });

    REQUIRE(mapped.unwrap_err().message == "error (transformed)");
    REQUIRE(mapped.unwrap_err().is(ErrorCode::Internal));
}

TEST_CASE("Result::inspect_err only sees errors", "[result]") {
    int seen = 0;
    Result<int>::ok(1).inspect_err([&](const Error&) { ++seen; });
    Result<int>::err(Error{"x"}).inspect_err([&](const Error&) { ++seen; });
    Result<void>::err(Error{"y"}).inspect_err([&](const Error&) { ++seen; });
    REQUIRE(seen == 2);
}

TEST_CASE("Result<void> works correctly", "[result]") {
    auto ok_result = Result<void>::ok();
    auto err_result = Result<void>::err(Error{"error"});

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());
    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE_THROWS(err_result.unwrap());
}

TEST_CASE("Result allows the same type for value and error", "[result]") {
    auto ok = Result<std::string, std::string>::ok("value");
    auto err = Result<std::string, std::string>::err("error");

    REQUIRE(ok.unwrap() == "value");
    REQUIRE(err.unwrap_err() == "error");
}

TEST_CASE("fail builds an error with a taxonomy code", "[result]") {
    auto result = fail<int>(ErrorCode::PoolExhausted, "pool full", 7);

    REQUIRE(result.unwrap_err().is(ErrorCode::PoolExhausted));
    REQUIRE(result.unwrap_err().native == 7);
}

TEST_CASE("Error codes map to stable status strings", "[result]") {
    REQUIRE(to_string(ErrorCode::NotFound) == "not_found");
    REQUIRE(to_string(ErrorCode::AlreadyRegistered) == "already_registered");
    REQUIRE(to_string(ErrorCode::PoolExhausted) == "pool_exhausted");
    REQUIRE(to_string(ErrorCode::UpstreamUnavailable) == "upstream_unavailable");
    REQUIRE(to_string(ErrorCode::TooSoon) == "too_soon");
    REQUIRE(to_string(ErrorCode::WorkerFailed) == "failed");
    REQUIRE(to_string(ErrorCode::TimedOut) == "timed_out");
    REQUIRE(to_string(ErrorCode::Cancelled) == "cancelled");
    REQUIRE(to_string(ErrorCode::RegistrationDisabled) == "registration_disabled");
    REQUIRE(to_string(ErrorCode::InvalidArgument) == "invalid_request");
    REQUIRE(to_string(ErrorCode::Storage) == "internal_error");
}
