#include "chachamir/crypto/ed25519_signature.hpp"
#include "chachamir/crypto/sodium_interop.hpp"
#include "chachamir/crypto/sodium_secure_memory_handle.hpp"
#include "chachamir/core/constants.hpp"
#include <sodium.h>

namespace chachamir::crypto {
namespace {
    static_assert(crypto_sign_PUBLICKEYBYTES == Constants::ED_25519_PUBLIC_KEY_SIZE);
    static_assert(crypto_sign_SECRETKEYBYTES == Constants::ED_25519_SECRET_KEY_SIZE);
    static_assert(crypto_sign_BYTES == Constants::ED_25519_SIGNATURE_SIZE);

    // S occupies the last 32 bytes; a reduced scalar never sets the top 3 bits.
    constexpr uint8_t kScalarHighBitsMask = 0xE0;
}

Result<models::SigningIdentity, ChachamirFailure> Ed25519Signature::GenerateIdentity() const {
    using IdentityResult = Result<models::SigningIdentity, ChachamirFailure>;

    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return IdentityResult::Err(ChachamirFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    auto sk_handle_result = SecureMemoryHandle::Allocate(Constants::ED_25519_SECRET_KEY_SIZE);
    if (sk_handle_result.IsErr()) {
        return IdentityResult::Err(ChachamirFailure::FromSodiumFailure(sk_handle_result.UnwrapErr()));
    }
    SecureMemoryHandle sk_handle = std::move(sk_handle_result).Unwrap();

    models::PublicKeyBytes public_key{};
    auto keygen_result = sk_handle.WithWriteAccess([&public_key](std::span<uint8_t> secret_key) {
        return crypto_sign_keypair(public_key.data(), secret_key.data());
    });
    if (keygen_result.IsErr()) {
        return IdentityResult::Err(ChachamirFailure::FromSodiumFailure(keygen_result.UnwrapErr()));
    }
    if (keygen_result.Unwrap() != SodiumConstants::SUCCESS) {
        return IdentityResult::Err(ChachamirFailure::KeyGeneration("Failed to generate Ed25519 key pair"));
    }

    return IdentityResult::Ok(models::SigningIdentity(std::move(sk_handle), public_key));
}

Result<models::SignatureBytes, ChachamirFailure> Ed25519Signature::Sign(
    const models::SigningIdentity& identity,
    std::span<const uint8_t> message) const {
    using SignResult = Result<models::SignatureBytes, ChachamirFailure>;

    models::SignatureBytes signature{};
    auto sign_result = identity.GetSecretKeyHandle().WithReadAccess(
        [&signature, message](std::span<const uint8_t> secret_key) {
            return crypto_sign_detached(
                signature.data(), nullptr,
                message.data(), message.size(),
                secret_key.data());
        });
    if (sign_result.IsErr()) {
        return SignResult::Err(ChachamirFailure::FromSodiumFailure(sign_result.UnwrapErr()));
    }
    if (sign_result.Unwrap() != SodiumConstants::SUCCESS) {
        return SignResult::Err(ChachamirFailure::Generic("Ed25519 signing failed"));
    }
    return SignResult::Ok(signature);
}

bool Ed25519Signature::Verify(
    const models::PublicKeyBytes& public_key,
    std::span<const uint8_t> message,
    const models::SignatureBytes& signature) const {
    if (SodiumInterop::Initialize().IsErr()) {
        return false;
    }
    return crypto_sign_verify_detached(
               signature.data(),
               message.data(), message.size(),
               public_key.data()) == SodiumConstants::SUCCESS;
}

bool Ed25519Signature::IsValidPublicKey(std::span<const uint8_t> public_key) {
    if (public_key.size() != Constants::ED_25519_PUBLIC_KEY_SIZE) {
        return false;
    }
    return crypto_core_ed25519_is_valid_point(public_key.data()) == 1;
}

bool Ed25519Signature::IsWellFormedSignature(std::span<const uint8_t> signature) {
    if (signature.size() != Constants::ED_25519_SIGNATURE_SIZE) {
        return false;
    }
    return (signature.back() & kScalarHighBitsMask) == 0;
}
}
