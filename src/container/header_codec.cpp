#include "chachamir/container/header_codec.hpp"
#include "chachamir/crypto/ed25519_signature.hpp"
#include "chachamir/core/format.hpp"
#include <algorithm>

namespace chachamir::container {
using models::FileContainerView;
using models::FileHeader;
using models::PublicKeyBytes;
using models::ShareContainerView;
using models::ShareHeader;
using models::SignatureBlock;

namespace {
    template<size_t N>
    bool HasMagic(std::span<const uint8_t> bytes, const std::array<uint8_t, N>& magic) {
        return bytes.size() >= N && std::equal(magic.begin(), magic.end(), bytes.begin());
    }

    template<typename Header>
    void AppendBaseFields(std::vector<uint8_t>& out, const Header& header, const bool is_signed) {
        out.push_back(header.version);
        out.push_back(header.threshold);
        out.push_back(is_signed ? ContainerConstants::SIGNED_FLAG : ContainerConstants::UNSIGNED_FLAG);
        out.insert(out.end(), header.nonce.begin(), header.nonce.end());
    }

    void AppendSignatureBlock(std::vector<uint8_t>& out, const SignatureBlock& block) {
        out.insert(out.end(), block.public_key.begin(), block.public_key.end());
        out.insert(out.end(), block.signature.begin(), block.signature.end());
    }

    Result<Unit, ChachamirFailure> ValidateThreshold(const uint8_t threshold) {
        if (threshold < SharingConstants::MIN_THRESHOLD) {
            return Result<Unit, ChachamirFailure>::Err(
                ChachamirFailure::InvalidInput("Cannot encode a header with threshold zero"));
        }
        return Result<Unit, ChachamirFailure>::Ok(unit);
    }

    Result<SignatureBlock, ChachamirFailure> DecodeSignatureBlock(std::span<const uint8_t> bytes) {
        const auto key_bytes = bytes.first(Constants::ED_25519_PUBLIC_KEY_SIZE);
        const auto sig_bytes = bytes.subspan(
            Constants::ED_25519_PUBLIC_KEY_SIZE, Constants::ED_25519_SIGNATURE_SIZE);

        if (!crypto::Ed25519Signature::IsValidPublicKey(key_bytes)) {
            return Result<SignatureBlock, ChachamirFailure>::Err(
                ChachamirFailure::BadPublicKey("Embedded public key is not a valid Ed25519 point"));
        }
        if (!crypto::Ed25519Signature::IsWellFormedSignature(sig_bytes)) {
            return Result<SignatureBlock, ChachamirFailure>::Err(
                ChachamirFailure::BadSignature("Embedded signature is not a canonical Ed25519 signature"));
        }

        SignatureBlock block;
        std::copy(key_bytes.begin(), key_bytes.end(), block.public_key.begin());
        std::copy(sig_bytes.begin(), sig_bytes.end(), block.signature.begin());
        return Result<SignatureBlock, ChachamirFailure>::Ok(block);
    }
}

Result<std::vector<uint8_t>, ChachamirFailure> HeaderCodec::EncodeFileHeader(const FileHeader& header) {
    CHACHAMIR_TRY(ValidateThreshold(header.threshold));

    std::vector<uint8_t> out;
    out.reserve(FileHeaderLength(header.IsSigned()));
    out.insert(out.end(), ContainerConstants::FILE_MAGIC.begin(), ContainerConstants::FILE_MAGIC.end());
    AppendBaseFields(out, header, header.IsSigned());
    if (header.signature_block.has_value()) {
        AppendSignatureBlock(out, *header.signature_block);
    }
    return Result<std::vector<uint8_t>, ChachamirFailure>::Ok(std::move(out));
}

Result<FileContainerView, ChachamirFailure> HeaderCodec::DecodeFileHeader(std::span<const uint8_t> container) {
    using ViewResult = Result<FileContainerView, ChachamirFailure>;

    if (!HasMagic(container, ContainerConstants::FILE_MAGIC)) {
        return ViewResult::Err(ChachamirFailure::MissingMagic("Missing encrypted file header"));
    }
    if (container.size() < ContainerConstants::FILE_HEADER_BASE_SIZE) {
        return ViewResult::Err(ChachamirFailure::Truncated(
            compat::format("File header needs {} bytes, found {}",
                ContainerConstants::FILE_HEADER_BASE_SIZE, container.size())));
    }

    FileContainerView view;
    view.header.version = container[ContainerConstants::FILE_VERSION_OFFSET];
    view.header.threshold = container[ContainerConstants::FILE_THRESHOLD_OFFSET];
    const bool is_signed = container[ContainerConstants::FILE_SIGNED_OFFSET] != ContainerConstants::UNSIGNED_FLAG;
    const auto nonce = container.subspan(ContainerConstants::FILE_NONCE_OFFSET, Constants::NONCE_SIZE);
    std::copy(nonce.begin(), nonce.end(), view.header.nonce.begin());

    view.header_length = FileHeaderLength(is_signed);
    if (container.size() < view.header_length) {
        return ViewResult::Err(ChachamirFailure::Truncated(
            compat::format("Signed file header needs {} bytes, found {}",
                view.header_length, container.size())));
    }

    if (is_signed) {
        auto block = DecodeSignatureBlock(
            container.subspan(ContainerConstants::FILE_HEADER_BASE_SIZE, ContainerConstants::SIGNATURE_BLOCK_SIZE));
        if (block.IsErr()) {
            return PropagateErr(std::move(block).UnwrapErr());
        }
        view.header.signature_block = block.Unwrap();
    }

    view.ciphertext = container.subspan(view.header_length);
    return ViewResult::Ok(view);
}

Result<std::vector<uint8_t>, ChachamirFailure> HeaderCodec::EncodeShareHeader(const ShareHeader& header) {
    CHACHAMIR_TRY(ValidateThreshold(header.threshold));

    std::vector<uint8_t> out;
    out.reserve(ShareHeaderLength(header.IsSigned()));
    out.insert(out.end(), ContainerConstants::SHARE_MAGIC.begin(), ContainerConstants::SHARE_MAGIC.end());
    AppendBaseFields(out, header, header.IsSigned());
    out.push_back(ContainerConstants::SHARE_PADDING);
    if (header.signature_block.has_value()) {
        AppendSignatureBlock(out, *header.signature_block);
    }
    return Result<std::vector<uint8_t>, ChachamirFailure>::Ok(std::move(out));
}

Result<ShareContainerView, ChachamirFailure> HeaderCodec::DecodeShareHeader(std::span<const uint8_t> container) {
    using ViewResult = Result<ShareContainerView, ChachamirFailure>;

    if (!HasMagic(container, ContainerConstants::SHARE_MAGIC)) {
        return ViewResult::Err(ChachamirFailure::MissingMagic("Missing share header"));
    }
    if (container.size() < ContainerConstants::SHARE_HEADER_BASE_SIZE) {
        return ViewResult::Err(ChachamirFailure::Truncated(
            compat::format("Share header needs {} bytes, found {}",
                ContainerConstants::SHARE_HEADER_BASE_SIZE, container.size())));
    }

    ShareContainerView view;
    view.header.version = container[ContainerConstants::SHARE_VERSION_OFFSET];
    view.header.threshold = container[ContainerConstants::SHARE_THRESHOLD_OFFSET];
    const bool is_signed = container[ContainerConstants::SHARE_SIGNED_OFFSET] != ContainerConstants::UNSIGNED_FLAG;
    const auto nonce = container.subspan(ContainerConstants::SHARE_NONCE_OFFSET, Constants::NONCE_SIZE);
    std::copy(nonce.begin(), nonce.end(), view.header.nonce.begin());
    view.header.padding = container[ContainerConstants::SHARE_PADDING_OFFSET];

    view.header_length = ShareHeaderLength(is_signed);
    if (container.size() < view.header_length) {
        return ViewResult::Err(ChachamirFailure::Truncated(
            compat::format("Signed share header needs {} bytes, found {}",
                view.header_length, container.size())));
    }

    if (is_signed) {
        auto block = DecodeSignatureBlock(
            container.subspan(ContainerConstants::SHARE_HEADER_BASE_SIZE, ContainerConstants::SIGNATURE_BLOCK_SIZE));
        if (block.IsErr()) {
            return PropagateErr(std::move(block).UnwrapErr());
        }
        view.header.signature_block = block.Unwrap();
    }

    view.share = container.subspan(view.header_length);
    return ViewResult::Ok(view);
}

std::optional<models::Nonce> HeaderCodec::PeekShareNonce(std::span<const uint8_t> container) {
    if (!HasMagic(container, ContainerConstants::SHARE_MAGIC) ||
        container.size() < ContainerConstants::SHARE_HEADER_BASE_SIZE) {
        return std::nullopt;
    }
    models::Nonce nonce{};
    const auto bytes = container.subspan(ContainerConstants::SHARE_NONCE_OFFSET, Constants::NONCE_SIZE);
    std::copy(bytes.begin(), bytes.end(), nonce.begin());
    return nonce;
}

std::vector<uint8_t> HeaderCodec::EncodeFileSignable(
    const FileHeader& header,
    const PublicKeyBytes& public_key) {
    std::vector<uint8_t> out;
    out.reserve(ContainerConstants::FILE_HEADER_BASE_SIZE + public_key.size());
    out.insert(out.end(), ContainerConstants::FILE_MAGIC.begin(), ContainerConstants::FILE_MAGIC.end());
    AppendBaseFields(out, header, true);
    out.insert(out.end(), public_key.begin(), public_key.end());
    return out;
}

std::vector<uint8_t> HeaderCodec::EncodeShareSignable(
    const ShareHeader& header,
    const PublicKeyBytes& public_key) {
    std::vector<uint8_t> out;
    out.reserve(ContainerConstants::SHARE_HEADER_BASE_SIZE + public_key.size());
    out.insert(out.end(), ContainerConstants::SHARE_MAGIC.begin(), ContainerConstants::SHARE_MAGIC.end());
    AppendBaseFields(out, header, true);
    out.push_back(header.padding);
    out.insert(out.end(), public_key.begin(), public_key.end());
    return out;
}
}
