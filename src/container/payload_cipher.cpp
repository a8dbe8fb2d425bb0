#include "chachamir/container/payload_cipher.hpp"
#include "chachamir/crypto/sodium_interop.hpp"
#include "chachamir/core/constants.hpp"
#include <string>

namespace chachamir::container {
using crypto::SodiumInterop;
using models::KeyMaterial;
using models::Nonce;

PayloadCipher::PayloadCipher(const interfaces::IAeadCipher& aead) noexcept
    : aead_(aead) {
}

Result<std::vector<uint8_t>, ChachamirFailure> PayloadCipher::Seal(
    const KeyMaterial& key,
    const Nonce& nonce,
    std::span<const uint8_t> plaintext) const {
    using CipherResult = Result<std::vector<uint8_t>, ChachamirFailure>;

    auto sealed = key.Use([this, &nonce, plaintext](std::span<const uint8_t> key_bytes) {
        return aead_.Encrypt(key_bytes, nonce, plaintext);
    });
    if (sealed.IsErr()) {
        return sealed;
    }
    auto ciphertext = std::move(sealed).Unwrap();

    auto reopened = Open(key, nonce, ciphertext);
    if (reopened.IsErr()) {
        return CipherResult::Err(ChachamirFailure::InternalConsistency(
            "Freshly encrypted payload failed to decrypt"));
    }
    auto roundtrip = std::move(reopened).Unwrap();

    auto cmp = SodiumInterop::ConstantTimeEquals(roundtrip, plaintext);
    const bool identical = cmp.IsOk() && cmp.Unwrap();
    { auto __wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(roundtrip)); (void)__wipe; }

    if (!identical) {
        return CipherResult::Err(ChachamirFailure::InternalConsistency(
            "Freshly encrypted payload does not decrypt to the original plaintext"));
    }
    return CipherResult::Ok(std::move(ciphertext));
}

Result<std::vector<uint8_t>, ChachamirFailure> PayloadCipher::Open(
    const KeyMaterial& key,
    const Nonce& nonce,
    std::span<const uint8_t> ciphertext) const {
    auto opened = key.Use([this, &nonce, ciphertext](std::span<const uint8_t> key_bytes) {
        return aead_.Decrypt(key_bytes, nonce, ciphertext);
    });
    if (opened.IsErr()) {
        return Result<std::vector<uint8_t>, ChachamirFailure>::Err(
            ChachamirFailure::Authentication(std::string(ErrorMessages::DECRYPTION_FAILED)));
    }
    return opened;
}
}
