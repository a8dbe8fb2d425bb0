#pragma once
#include "chachamir/core/result.hpp"
#include "chachamir/core/failures.hpp"
#include "chachamir/models/container_headers.hpp"
#include "chachamir/models/signing_identity.hpp"
#include <cstdint>
#include <span>
namespace chachamir::interfaces {

/// Detached-signature primitive with ephemeral identities.
class ISignatureScheme {
public:
    virtual ~ISignatureScheme() = default;
    [[nodiscard]] virtual Result<models::SigningIdentity, ChachamirFailure> GenerateIdentity() const = 0;
    [[nodiscard]] virtual Result<models::SignatureBytes, ChachamirFailure> Sign(
        const models::SigningIdentity& identity,
        std::span<const uint8_t> message) const = 0;
    [[nodiscard]] virtual bool Verify(
        const models::PublicKeyBytes& public_key,
        std::span<const uint8_t> message,
        const models::SignatureBytes& signature) const = 0;
};
}
