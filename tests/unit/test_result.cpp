#include <catch2/catch_test_macros.hpp>
#include "phivault/core/result.hpp"
#include "phivault/core/failures.hpp"
#include <optional>
#include <string>
using namespace phivault::keystore;
TEST_CASE("Result<T, E> - Basic Operations", "[result][core]") {
    SECTION("Ok construction and queries") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Err construction and queries") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(result.IsErr());
        REQUIRE_FALSE(result.IsOk());
        REQUIRE(result.UnwrapErr() == "error");
    }
    SECTION("Unit type for void results") {
        auto result = Result<Unit, std::string>::Ok(unit);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == unit);
    }
    SECTION("Unwrap on Err throws") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE_THROWS_AS(result.Unwrap(), std::runtime_error);
    }
    SECTION("UnwrapErr on Ok throws") {
        auto result = Result<int, std::string>::Ok(1);
        REQUIRE_THROWS_AS(result.UnwrapErr(), std::runtime_error);
    }
}
TEST_CASE("Result<T, E> - Monadic Operations", "[result][core]") {
    SECTION("Map transforms Ok value") {
        auto result = Result<int, std::string>::Ok(21);
        auto mapped = std::move(result).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsOk());
        REQUIRE(mapped.Unwrap() == 42);
    }
    SECTION("Map preserves Err") {
        auto result = Result<int, std::string>::Err("error");
        auto mapped = std::move(result).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr() == "error");
    }
    SECTION("MapErr transforms Err value") {
        auto result = Result<int, std::string>::Err("error");
        auto mapped = std::move(result).MapErr([](std::string s) {
            return s + "!";
        });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr() == "error!");
    }
    SECTION("Bind chains operations") {
        auto result = Result<int, std::string>::Ok(10);
        auto bound = std::move(result).Bind([](int x) {
            if (x > 5) {
                return Result<int, std::string>::Ok(x * 2);
            }
            return Result<int, std::string>::Err("too small");
        });
        REQUIRE(bound.IsOk());
        REQUIRE(bound.Unwrap() == 20);
    }
    SECTION("InspectErr sees the error without consuming it") {
        auto result = Result<int, std::string>::Err("boom");
        std::string seen;
        result.InspectErr([&seen](const std::string& e) { seen = e; });
        REQUIRE(seen == "boom");
        REQUIRE(result.UnwrapErr() == "boom");
    }
}
TEST_CASE("Result<T, E> - FromOptional and IsErrAnd", "[result][core]") {
    SECTION("FromOptional with a value") {
        auto result = Result<int, std::string>::FromOptional(std::optional<int>(7), "none");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == 7);
    }
    SECTION("FromOptional without a value") {
        auto result = Result<int, std::string>::FromOptional(std::nullopt, "none");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr() == "none");
    }
    SECTION("IsErrAnd matches on failure kind") {
        auto result = Result<Unit, VaultFailure>::Err(VaultFailure::IntegrityFailure("tag"));
        REQUIRE(result.IsErrAnd([](const VaultFailure& f) {
            return f.type == VaultFailureType::IntegrityFailure;
        }));
        REQUIRE_FALSE(result.IsErrAnd([](const VaultFailure& f) {
            return f.type == VaultFailureType::InvalidInput;
        }));
    }
}
TEST_CASE("VaultFailure - User-facing messages", "[result][core]") {
    SECTION("Wrong secret and corrupted key read the same") {
        const auto failure = VaultFailure::AuthenticationFailure("internal detail");
        REQUIRE(failure.UserMessage() == "Incorrect password");
    }
    SECTION("Integrity failures never leak the internal message") {
        const auto failure = VaultFailure::IntegrityFailure("tag mismatch at offset 12");
        REQUIRE(failure.UserMessage() == "This record could not be read");
    }
    SECTION("Newer formats ask for an update") {
        REQUIRE(VaultFailure::UnsupportedFormat("v9").UserMessage() == "Update required");
    }
    SECTION("Sodium failures map to Generic") {
        const auto failure = VaultFailure::FromSodiumFailure(SodiumFailure::AllocationFailed("oom"));
        REQUIRE(failure.type == VaultFailureType::Generic);
        REQUIRE(failure.message == "oom");
    }
}
