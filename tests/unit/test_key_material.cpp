#include <catch2/catch_test_macros.hpp>
#include "chachamir/models/key_material.hpp"
#include "chachamir/crypto/sodium_interop.hpp"
#include "chachamir/core/constants.hpp"
#include "../helpers/random_bytes.hpp"
#include <algorithm>
#include <vector>
using namespace chachamir;
using namespace chachamir::crypto;
using namespace chachamir::models;

namespace {
std::vector<uint8_t> CopyOut(const KeyMaterial& key) {
    return key.Use([](std::span<const uint8_t> bytes) {
        return Result<std::vector<uint8_t>, ChachamirFailure>::Ok(
            std::vector<uint8_t>(bytes.begin(), bytes.end()));
    }).Unwrap();
}
}

TEST_CASE("KeyMaterial - Generation", "[models][key]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Generated key has the cipher key size") {
        auto key = KeyMaterial::Generate();
        REQUIRE(key.IsOk());
        REQUIRE(key.Unwrap().Size() == Constants::KEY_SIZE);
    }
    SECTION("Two keys differ") {
        auto first = KeyMaterial::Generate().Unwrap();
        auto second = KeyMaterial::Generate().Unwrap();
        REQUIRE_FALSE(first.Matches(second).Unwrap());
        REQUIRE(first.Matches(first).Unwrap());
    }
}

TEST_CASE("KeyMaterial - Adopt", "[models][key]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Adopt copies and wipes the source") {
        auto bytes = test_helpers::RandomBytes(Constants::KEY_SIZE);
        const auto expected = bytes;
        auto key = KeyMaterial::Adopt(bytes);
        REQUIRE(key.IsOk());
        REQUIRE(std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; }));
        REQUIRE(CopyOut(key.Unwrap()) == expected);
    }
    SECTION("Wrong size is rejected and still wiped") {
        std::vector<uint8_t> bytes(Constants::KEY_SIZE - 1, 0x5A);
        auto key = KeyMaterial::Adopt(bytes);
        REQUIRE(key.IsErr());
        REQUIRE(key.UnwrapErr().type == FailureType::InvalidInput);
        REQUIRE(std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("Adopted copies of the same bytes match") {
        auto bytes = test_helpers::RandomBytes(Constants::KEY_SIZE);
        auto copy = bytes;
        auto first = KeyMaterial::Adopt(bytes).Unwrap();
        auto second = KeyMaterial::Adopt(copy).Unwrap();
        REQUIRE(first.Matches(second).Unwrap());
    }
}

TEST_CASE("KeyMaterial - Scoped use", "[models][key]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto key = KeyMaterial::Generate().Unwrap();
    SECTION("Errors from the callback pass through") {
        auto result = key.Use([](std::span<const uint8_t>) {
            return Result<int, ChachamirFailure>::Err(ChachamirFailure::Generic("inner"));
        });
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().message == "inner");
    }
    SECTION("Moved-from key reports an error") {
        auto moved = std::move(key);
        auto result = key.Use([](std::span<const uint8_t>) {
            return Result<int, ChachamirFailure>::Ok(1);
        });
        REQUIRE(result.IsErr());
        REQUIRE(moved.Size() == Constants::KEY_SIZE);
    }
}
