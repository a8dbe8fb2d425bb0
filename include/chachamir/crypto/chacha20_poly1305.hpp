#pragma once
#include "chachamir/core/result.hpp"
#include "chachamir/core/failures.hpp"
#include "chachamir/interfaces/i_aead_cipher.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
namespace chachamir::crypto {

/**
 * ChaCha20-Poly1305 (IETF variant, RFC 8439) backed by libsodium.
 *
 * 256-bit key, 96-bit nonce, 128-bit tag appended to the ciphertext. No
 * associated data is bound. The primitive is stateless: it neither tracks
 * nor detects nonce reuse, which stays the caller's invariant.
 *
 * Decrypt reports every failure with the same message so callers cannot
 * learn why a ciphertext was rejected.
 */
class ChaCha20Poly1305 final : public interfaces::IAeadCipher {
public:
    [[nodiscard]] size_t KeySize() const noexcept override;
    [[nodiscard]] size_t NonceSize() const noexcept override;
    [[nodiscard]] size_t TagSize() const noexcept override;

    [[nodiscard]] Result<std::vector<uint8_t>, ChachamirFailure> Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext) const override;

    [[nodiscard]] Result<std::vector<uint8_t>, ChachamirFailure> Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext) const override;
};
}
