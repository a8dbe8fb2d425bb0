#include "chachamir/crypto/chacha20_poly1305.hpp"
#include "chachamir/crypto/sodium_interop.hpp"
#include "chachamir/core/constants.hpp"
#include "chachamir/core/format.hpp"
#include <sodium.h>
#include <string>

namespace chachamir::crypto {
namespace {
    static_assert(crypto_aead_chacha20poly1305_ietf_KEYBYTES == Constants::KEY_SIZE);
    static_assert(crypto_aead_chacha20poly1305_ietf_NPUBBYTES == Constants::NONCE_SIZE);
    static_assert(crypto_aead_chacha20poly1305_ietf_ABYTES == Constants::AEAD_TAG_SIZE);

    Result<Unit, ChachamirFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != Constants::KEY_SIZE) {
            return Result<Unit, ChachamirFailure>::Err(
                ChachamirFailure::InvalidInput(
                    compat::format("ChaCha20-Poly1305 key must be {} bytes, got {}",
                        Constants::KEY_SIZE, key.size())));
        }
        if (nonce.size() != Constants::NONCE_SIZE) {
            return Result<Unit, ChachamirFailure>::Err(
                ChachamirFailure::InvalidInput(
                    compat::format("ChaCha20-Poly1305 nonce must be {} bytes, got {}",
                        Constants::NONCE_SIZE, nonce.size())));
        }
        return Result<Unit, ChachamirFailure>::Ok(unit);
    }
}

size_t ChaCha20Poly1305::KeySize() const noexcept {
    return Constants::KEY_SIZE;
}

size_t ChaCha20Poly1305::NonceSize() const noexcept {
    return Constants::NONCE_SIZE;
}

size_t ChaCha20Poly1305::TagSize() const noexcept {
    return Constants::AEAD_TAG_SIZE;
}

Result<std::vector<uint8_t>, ChachamirFailure> ChaCha20Poly1305::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext) const {
    using CipherResult = Result<std::vector<uint8_t>, ChachamirFailure>;

    CHACHAMIR_TRY(ValidateKeyAndNonce(key, nonce));
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return CipherResult::Err(ChachamirFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    std::vector<uint8_t> output(plaintext.size() + Constants::AEAD_TAG_SIZE);
    unsigned long long ciphertext_len = 0;
    if (crypto_aead_chacha20poly1305_ietf_encrypt(
            output.data(), &ciphertext_len,
            plaintext.data(), plaintext.size(),
            nullptr, 0,
            nullptr,
            nonce.data(), key.data()) != SodiumConstants::SUCCESS) {
        { auto __wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(output)); (void)__wipe; }
        return CipherResult::Err(ChachamirFailure::Generic("Failure when encrypting file"));
    }
    output.resize(static_cast<size_t>(ciphertext_len));
    return CipherResult::Ok(std::move(output));
}

Result<std::vector<uint8_t>, ChachamirFailure> ChaCha20Poly1305::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext) const {
    using PlainResult = Result<std::vector<uint8_t>, ChachamirFailure>;

    CHACHAMIR_TRY(ValidateKeyAndNonce(key, nonce));
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return PlainResult::Err(ChachamirFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    if (ciphertext.size() < Constants::AEAD_TAG_SIZE) {
        return PlainResult::Err(
            ChachamirFailure::Authentication(std::string(ErrorMessages::DECRYPTION_FAILED)));
    }

    std::vector<uint8_t> output(ciphertext.size() - Constants::AEAD_TAG_SIZE);
    unsigned long long plaintext_len = 0;
    if (crypto_aead_chacha20poly1305_ietf_decrypt(
            output.data(), &plaintext_len,
            nullptr,
            ciphertext.data(), ciphertext.size(),
            nullptr, 0,
            nonce.data(), key.data()) != SodiumConstants::SUCCESS) {
        { auto __wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(output)); (void)__wipe; }
        return PlainResult::Err(
            ChachamirFailure::Authentication(std::string(ErrorMessages::DECRYPTION_FAILED)));
    }
    output.resize(static_cast<size_t>(plaintext_len));
    return PlainResult::Ok(std::move(output));
}
}
