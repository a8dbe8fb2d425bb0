#include "chachamir/models/key_material.hpp"
#include "chachamir/crypto/sodium_interop.hpp"
#include "chachamir/core/constants.hpp"
#include "chachamir/core/format.hpp"

namespace chachamir::models {
    using crypto::SecureMemoryHandle;
    using crypto::SodiumInterop;

    Result<KeyMaterial, ChachamirFailure> KeyMaterial::Generate() {
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<KeyMaterial, ChachamirFailure>::Err(
                ChachamirFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        auto handle_result = SecureMemoryHandle::Allocate(Constants::KEY_SIZE);
        if (handle_result.IsErr()) {
            return Result<KeyMaterial, ChachamirFailure>::Err(
                ChachamirFailure::KeyGeneration(handle_result.UnwrapErr().message));
        }
        auto handle = std::move(handle_result).Unwrap();
        auto fill_result = handle.WithWriteAccess([](std::span<uint8_t> key) {
            SodiumInterop::FillRandom(key);
            return unit;
        });
        if (fill_result.IsErr()) {
            return Result<KeyMaterial, ChachamirFailure>::Err(
                ChachamirFailure::KeyGeneration(fill_result.UnwrapErr().message));
        }
        return Result<KeyMaterial, ChachamirFailure>::Ok(KeyMaterial(std::move(handle)));
    }

    Result<KeyMaterial, ChachamirFailure> KeyMaterial::Adopt(std::span<uint8_t> bytes) {
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<KeyMaterial, ChachamirFailure>::Err(
                ChachamirFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        if (bytes.size() != Constants::KEY_SIZE) {
            { auto __wipe = SodiumInterop::SecureWipe(bytes); (void)__wipe; }
            return Result<KeyMaterial, ChachamirFailure>::Err(
                ChachamirFailure::InvalidInput(
                    compat::format("Key must be {} bytes, got {}", Constants::KEY_SIZE, bytes.size())));
        }
        auto handle_result = SecureMemoryHandle::Allocate(bytes.size());
        if (handle_result.IsErr()) {
            { auto __wipe = SodiumInterop::SecureWipe(bytes); (void)__wipe; }
            return Result<KeyMaterial, ChachamirFailure>::Err(
                ChachamirFailure::FromSodiumFailure(handle_result.UnwrapErr()));
        }
        auto handle = std::move(handle_result).Unwrap();
        auto write_result = handle.Write(bytes);
        { auto __wipe = SodiumInterop::SecureWipe(bytes); (void)__wipe; }
        if (write_result.IsErr()) {
            return Result<KeyMaterial, ChachamirFailure>::Err(
                ChachamirFailure::FromSodiumFailure(write_result.UnwrapErr()));
        }
        return Result<KeyMaterial, ChachamirFailure>::Ok(KeyMaterial(std::move(handle)));
    }

    Result<bool, ChachamirFailure> KeyMaterial::Matches(const KeyMaterial& other) const {
        return Use([&other](std::span<const uint8_t> mine) {
            return other.Use([mine](std::span<const uint8_t> theirs) {
                auto cmp = SodiumInterop::ConstantTimeEquals(mine, theirs);
                if (cmp.IsErr()) {
                    return Result<bool, ChachamirFailure>::Err(
                        ChachamirFailure::FromSodiumFailure(cmp.UnwrapErr()));
                }
                return Result<bool, ChachamirFailure>::Ok(cmp.Unwrap());
            });
        });
    }
}
