#pragma once
#include "chachamir/core/result.hpp"
#include "chachamir/core/failures.hpp"
#include "chachamir/core/constants.hpp"
#include "chachamir/models/container_headers.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
namespace chachamir::container {

/**
 * @brief Fixed-layout codec for file and share container headers
 *
 * Decoding never trusts a constant header length: the length is always
 * derived from the signed flag before the payload is sliced off. Decoded
 * views borrow from the input buffer, which must outlive them.
 *
 * Decode failures:
 * - MissingMagic : prefix does not match the container's magic exactly
 * - Truncated    : fewer bytes than the header implies
 * - BadPublicKey : embedded key is not a valid Ed25519 point
 * - BadSignature : embedded signature has a non-canonical scalar half
 */
class HeaderCodec {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ChachamirFailure> EncodeFileHeader(
        const models::FileHeader& header);

    [[nodiscard]] static Result<models::FileContainerView, ChachamirFailure> DecodeFileHeader(
        std::span<const uint8_t> container);

    [[nodiscard]] static Result<std::vector<uint8_t>, ChachamirFailure> EncodeShareHeader(
        const models::ShareHeader& header);

    [[nodiscard]] static Result<models::ShareContainerView, ChachamirFailure> DecodeShareHeader(
        std::span<const uint8_t> container);

    /// Nonce of a share container, read without decoding its signature block.
    /// Empty when the magic is missing or the base header is cut short.
    [[nodiscard]] static std::optional<models::Nonce> PeekShareNonce(std::span<const uint8_t> container);

    /// Base file header with the signed flag set, followed by public_key.
    [[nodiscard]] static std::vector<uint8_t> EncodeFileSignable(
        const models::FileHeader& header,
        const models::PublicKeyBytes& public_key);

    /// Base share header (padding included) with the signed flag set, followed by public_key.
    [[nodiscard]] static std::vector<uint8_t> EncodeShareSignable(
        const models::ShareHeader& header,
        const models::PublicKeyBytes& public_key);

    [[nodiscard]] static constexpr size_t FileHeaderLength(const bool is_signed) noexcept {
        return ContainerConstants::FILE_HEADER_BASE_SIZE +
               (is_signed ? ContainerConstants::SIGNATURE_BLOCK_SIZE : 0);
    }

    [[nodiscard]] static constexpr size_t ShareHeaderLength(const bool is_signed) noexcept {
        return ContainerConstants::SHARE_HEADER_BASE_SIZE +
               (is_signed ? ContainerConstants::SIGNATURE_BLOCK_SIZE : 0);
    }

private:
    HeaderCodec() = delete;
};
}
