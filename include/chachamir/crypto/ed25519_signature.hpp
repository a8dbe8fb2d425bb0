#pragma once
#include "chachamir/core/result.hpp"
#include "chachamir/core/failures.hpp"
#include "chachamir/interfaces/i_signature_scheme.hpp"
#include "chachamir/models/container_headers.hpp"
#include <cstdint>
#include <span>
namespace chachamir::crypto {

/// Ed25519 detached signatures backed by libsodium's crypto_sign API.
class Ed25519Signature final : public interfaces::ISignatureScheme {
public:
    [[nodiscard]] Result<models::SigningIdentity, ChachamirFailure> GenerateIdentity() const override;

    [[nodiscard]] Result<models::SignatureBytes, ChachamirFailure> Sign(
        const models::SigningIdentity& identity,
        std::span<const uint8_t> message) const override;

    [[nodiscard]] bool Verify(
        const models::PublicKeyBytes& public_key,
        std::span<const uint8_t> message,
        const models::SignatureBytes& signature) const override;

    /// true if the bytes decode to a canonical point outside the small-order subgroup.
    [[nodiscard]] static bool IsValidPublicKey(std::span<const uint8_t> public_key);

    /// true unless the high bits of the S half rule out a reduced scalar.
    [[nodiscard]] static bool IsWellFormedSignature(std::span<const uint8_t> signature);
};
}
