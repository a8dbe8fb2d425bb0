#pragma once
#include "chachamir/crypto/sodium_secure_memory_handle.hpp"
#include "chachamir/models/container_headers.hpp"
#include <cstdint>
namespace chachamir::models {

/// One-time Ed25519 keypair created for a single encryption. The secret
/// half lives in guarded memory and disappears with the object; only the
/// public half is ever written into containers.
class SigningIdentity {
public:
    SigningIdentity(
        crypto::SecureMemoryHandle secret_key_handle,
        const PublicKeyBytes& public_key);
    SigningIdentity(SigningIdentity&&) noexcept = default;
    SigningIdentity& operator=(SigningIdentity&&) noexcept = default;
    SigningIdentity(const SigningIdentity&) = delete;
    SigningIdentity& operator=(const SigningIdentity&) = delete;
    [[nodiscard]] const crypto::SecureMemoryHandle& GetSecretKeyHandle() const noexcept {
        return secret_key_handle_;
    }
    [[nodiscard]] const PublicKeyBytes& GetPublicKey() const noexcept {
        return public_key_;
    }
private:
    crypto::SecureMemoryHandle secret_key_handle_;
    PublicKeyBytes public_key_;
};
}
