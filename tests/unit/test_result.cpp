#include <catch2/catch_test_macros.hpp>
#include "chachamir/core/result.hpp"
#include "chachamir/core/failures.hpp"
#include <string>
#include <vector>
using namespace chachamir;
namespace {
Result<int, std::string> ParsePositive(const int value) {
    if (value <= 0) {
        return Result<int, std::string>::Err("not positive");
    }
    return Result<int, std::string>::Ok(value);
}

Result<std::string, std::string> Describe(const int value) {
    CHACHAMIR_TRY(ParsePositive(value));
    return Result<std::string, std::string>::Ok("value " + std::to_string(value));
}

Result<Unit, ChachamirFailure> FailWithTruncated() {
    return Result<Unit, ChachamirFailure>::Err(ChachamirFailure::Truncated("short"));
}

Result<std::vector<uint8_t>, ChachamirFailure> ForwardFailure() {
    CHACHAMIR_TRY(FailWithTruncated());
    return Result<std::vector<uint8_t>, ChachamirFailure>::Ok({});
}
}
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
TEST_CASE("Result<T, E> - Error propagation", "[result][core]") {
    SECTION("CHACHAMIR_TRY passes through on Ok") {
        auto result = Describe(3);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == "value 3");
    }
    SECTION("CHACHAMIR_TRY returns the error across success types") {
        auto result = Describe(-1);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr() == "not positive");
    }
    SECTION("Failure type survives propagation") {
        auto result = ForwardFailure();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == FailureType::Truncated);
        REQUIRE(result.UnwrapErr().message == "short");
    }
    SECTION("PropagateErr converts into any Result") {
        Result<double, std::string> converted = PropagateErr(std::string("boom"));
        REQUIRE(converted.IsErr());
        REQUIRE(converted.UnwrapErr() == "boom");
    }
}
TEST_CASE("ChachamirFailure - Classification", "[result][core]") {
    SECTION("Sodium failures become generic failures") {
        const auto failure = ChachamirFailure::FromSodiumFailure(
            SodiumFailure::AllocationFailed("no memory"));
        REQUIRE(failure.type == FailureType::Generic);
        REQUIRE(failure.message == "no memory");
    }
    SECTION("Type names are stable") {
        REQUIRE(FailureTypeName(FailureType::MissingMagic) == "FormatError::MissingMagic");
        REQUIRE(FailureTypeName(FailureType::SignatureMismatch) == "AuthenticationError::SignatureMismatch");
        REQUIRE(FailureTypeName(FailureType::InsufficientShares) == "InsufficientShares");
    }
}
