#pragma once
#include "chachamir/core/constants.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
namespace chachamir::models {

using Nonce = std::array<uint8_t, Constants::NONCE_SIZE>;
using PublicKeyBytes = std::array<uint8_t, Constants::ED_25519_PUBLIC_KEY_SIZE>;
using SignatureBytes = std::array<uint8_t, Constants::ED_25519_SIGNATURE_SIZE>;

/// Public key and detached signature carried by a signed container.
struct SignatureBlock {
    PublicKeyBytes public_key{};
    SignatureBytes signature{};

    bool operator==(const SignatureBlock&) const = default;
};

/// Header of an encrypted-file container. The container is signed exactly
/// when signature_block is present.
struct FileHeader {
    uint8_t version = ContainerConstants::ALGORITHM_VERSION;
    uint8_t threshold = 0;
    Nonce nonce{};
    std::optional<SignatureBlock> signature_block;

    [[nodiscard]] bool IsSigned() const noexcept { return signature_block.has_value(); }

    bool operator==(const FileHeader&) const = default;
};

/// Header of a share container. threshold is informational: it must agree
/// with the file's threshold but reconstruction never relies on it.
struct ShareHeader {
    uint8_t version = ContainerConstants::ALGORITHM_VERSION;
    uint8_t threshold = 0;
    Nonce nonce{};
    uint8_t padding = ContainerConstants::SHARE_PADDING;
    std::optional<SignatureBlock> signature_block;

    [[nodiscard]] bool IsSigned() const noexcept { return signature_block.has_value(); }

    bool operator==(const ShareHeader&) const = default;
};

/// Decoded file container. ciphertext borrows from the decoded buffer.
struct FileContainerView {
    FileHeader header;
    size_t header_length = 0;
    std::span<const uint8_t> ciphertext;
};

/// Decoded share container. share borrows from the decoded buffer.
struct ShareContainerView {
    ShareHeader header;
    size_t header_length = 0;
    std::span<const uint8_t> share;
};

}
