#pragma once
#include "chachamir/core/result.hpp"
#include "chachamir/core/failures.hpp"
#include "chachamir/interfaces/i_aead_cipher.hpp"
#include "chachamir/models/container_headers.hpp"
#include "chachamir/models/key_material.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace chachamir::container {

/**
 * @brief Encrypts and decrypts container payloads with the file key
 *
 * Seal decrypts what it just produced and compares it with the input in
 * constant time, so a ciphertext that would not open is never returned.
 * Open reports every failure as the same Authentication error.
 */
class PayloadCipher {
public:
    explicit PayloadCipher(const interfaces::IAeadCipher& aead) noexcept;

    [[nodiscard]] Result<std::vector<uint8_t>, ChachamirFailure> Seal(
        const models::KeyMaterial& key,
        const models::Nonce& nonce,
        std::span<const uint8_t> plaintext) const;

    [[nodiscard]] Result<std::vector<uint8_t>, ChachamirFailure> Open(
        const models::KeyMaterial& key,
        const models::Nonce& nonce,
        std::span<const uint8_t> ciphertext) const;

private:
    const interfaces::IAeadCipher& aead_;
};
}
