#pragma once
#include "chachamir/core/result.hpp"
#include "chachamir/core/failures.hpp"
#include "chachamir/interfaces/i_signature_scheme.hpp"
#include "chachamir/models/container_headers.hpp"
#include "chachamir/models/reconciliation_records.hpp"
#include "chachamir/models/signing_identity.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace chachamir::container {

/**
 * @brief Binds containers to a one-time signing identity
 *
 * The signed message is always rebuilt from header fields:
 *
 *   share : magic | version | threshold | 1 | nonce | padding | pubkey | share bytes
 *   file  : magic | version | threshold | 1 | nonce | pubkey | ciphertext
 *
 * Verification never looks at raw container bytes, so anything appended
 * after the parsed fields is not covered and cannot be passed off as signed.
 */
class SignatureBinder {
public:
    explicit SignatureBinder(const interfaces::ISignatureScheme& scheme) noexcept;

    [[nodiscard]] Result<models::SigningIdentity, ChachamirFailure> CreateIdentity() const;

    [[nodiscard]] Result<models::SignatureBytes, ChachamirFailure> SignShare(
        const models::SigningIdentity& identity,
        const models::ShareHeader& header,
        std::span<const uint8_t> share) const;

    [[nodiscard]] Result<models::SignatureBytes, ChachamirFailure> SignFile(
        const models::SigningIdentity& identity,
        const models::FileHeader& header,
        std::span<const uint8_t> ciphertext) const;

    /// false for unsigned headers.
    [[nodiscard]] bool VerifyShare(
        const models::ShareHeader& header,
        std::span<const uint8_t> share) const;

    /// false for unsigned headers.
    [[nodiscard]] bool VerifyFile(
        const models::FileHeader& header,
        std::span<const uint8_t> ciphertext) const;

    /**
     * @brief Every signature problem between a share and its file
     *
     * Empty when both are unsigned, or both are signed with the same key
     * and the share's own signature verifies.
     */
    [[nodiscard]] std::vector<models::SignatureIssue> CrossCheckShare(
        const models::FileHeader& file_header,
        const models::ShareHeader& share_header,
        std::span<const uint8_t> share) const;

private:
    const interfaces::ISignatureScheme& scheme_;
};
}
