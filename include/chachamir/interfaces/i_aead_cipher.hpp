#pragma once
#include "chachamir/core/result.hpp"
#include "chachamir/core/failures.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
namespace chachamir::interfaces {

/// Authenticated encryption primitive. Ciphertexts carry their tag.
class IAeadCipher {
public:
    virtual ~IAeadCipher() = default;
    [[nodiscard]] virtual size_t KeySize() const noexcept = 0;
    [[nodiscard]] virtual size_t NonceSize() const noexcept = 0;
    [[nodiscard]] virtual size_t TagSize() const noexcept = 0;
    [[nodiscard]] virtual Result<std::vector<uint8_t>, ChachamirFailure> Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext) const = 0;
    [[nodiscard]] virtual Result<std::vector<uint8_t>, ChachamirFailure> Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext) const = 0;
};
}
