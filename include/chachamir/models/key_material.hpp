#pragma once
#include "chachamir/core/result.hpp"
#include "chachamir/core/failures.hpp"
#include "chachamir/crypto/sodium_secure_memory_handle.hpp"
#include <cstdint>
#include <span>
#include <type_traits>
namespace chachamir::models {

/**
 * @brief The per-file symmetric key
 *
 * Lives only in guarded memory and is zeroed when the owning operation
 * releases it, whichever path it leaves by. Never serialized.
 */
class KeyMaterial {
public:
    /// Fresh random key of Constants::KEY_SIZE bytes.
    static Result<KeyMaterial, ChachamirFailure> Generate();

    /// Moves bytes into guarded memory and wipes the source buffer, also on failure.
    static Result<KeyMaterial, ChachamirFailure> Adopt(std::span<uint8_t> bytes);

    KeyMaterial(KeyMaterial&&) noexcept = default;
    KeyMaterial& operator=(KeyMaterial&&) noexcept = default;
    KeyMaterial(const KeyMaterial&) = delete;
    KeyMaterial& operator=(const KeyMaterial&) = delete;

    /**
     * @brief Runs func with a read-only view of the key
     *
     * func must return Result<T, ChachamirFailure>; that result is passed
     * through unchanged.
     */
    template<typename F>
    auto Use(F&& func) const -> std::invoke_result_t<F, std::span<const uint8_t>> {
        using R = std::invoke_result_t<F, std::span<const uint8_t>>;
        auto access = handle_.WithReadAccess(std::forward<F>(func));
        if (access.IsErr()) {
            return R::Err(ChachamirFailure::FromSodiumFailure(access.UnwrapErr()));
        }
        return std::move(access).Unwrap();
    }

    /// Constant-time comparison against another key.
    [[nodiscard]] Result<bool, ChachamirFailure> Matches(const KeyMaterial& other) const;

    [[nodiscard]] size_t Size() const noexcept { return handle_.Size(); }

private:
    explicit KeyMaterial(crypto::SecureMemoryHandle handle) noexcept
        : handle_(std::move(handle)) {}

    crypto::SecureMemoryHandle handle_;
};

}
