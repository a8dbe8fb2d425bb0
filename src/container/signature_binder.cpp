#include "chachamir/container/signature_binder.hpp"
#include "chachamir/container/header_codec.hpp"

namespace chachamir::container {
using models::FileHeader;
using models::ShareHeader;
using models::SignatureBytes;
using models::SignatureIssue;
using models::SigningIdentity;

namespace {
    std::vector<uint8_t> Concat(std::vector<uint8_t> prefix, std::span<const uint8_t> body) {
        prefix.insert(prefix.end(), body.begin(), body.end());
        return prefix;
    }
}

SignatureBinder::SignatureBinder(const interfaces::ISignatureScheme& scheme) noexcept
    : scheme_(scheme) {
}

Result<SigningIdentity, ChachamirFailure> SignatureBinder::CreateIdentity() const {
    return scheme_.GenerateIdentity();
}

Result<SignatureBytes, ChachamirFailure> SignatureBinder::SignShare(
    const SigningIdentity& identity,
    const ShareHeader& header,
    std::span<const uint8_t> share) const {
    const auto message = Concat(HeaderCodec::EncodeShareSignable(header, identity.GetPublicKey()), share);
    return scheme_.Sign(identity, message);
}

Result<SignatureBytes, ChachamirFailure> SignatureBinder::SignFile(
    const SigningIdentity& identity,
    const FileHeader& header,
    std::span<const uint8_t> ciphertext) const {
    const auto message = Concat(HeaderCodec::EncodeFileSignable(header, identity.GetPublicKey()), ciphertext);
    return scheme_.Sign(identity, message);
}

bool SignatureBinder::VerifyShare(const ShareHeader& header, std::span<const uint8_t> share) const {
    if (!header.signature_block.has_value()) {
        return false;
    }
    const auto& block = *header.signature_block;
    const auto message = Concat(HeaderCodec::EncodeShareSignable(header, block.public_key), share);
    return scheme_.Verify(block.public_key, message, block.signature);
}

bool SignatureBinder::VerifyFile(const FileHeader& header, std::span<const uint8_t> ciphertext) const {
    if (!header.signature_block.has_value()) {
        return false;
    }
    const auto& block = *header.signature_block;
    const auto message = Concat(HeaderCodec::EncodeFileSignable(header, block.public_key), ciphertext);
    return scheme_.Verify(block.public_key, message, block.signature);
}

std::vector<SignatureIssue> SignatureBinder::CrossCheckShare(
    const FileHeader& file_header,
    const ShareHeader& share_header,
    std::span<const uint8_t> share) const {
    std::vector<SignatureIssue> issues;
    if (file_header.IsSigned() && !share_header.IsSigned()) {
        issues.push_back(SignatureIssue::ShareNotSigned);
        return issues;
    }
    if (!file_header.IsSigned() && share_header.IsSigned()) {
        issues.push_back(SignatureIssue::FileNotSigned);
        return issues;
    }
    if (!file_header.IsSigned()) {
        return issues;
    }

    if (!VerifyShare(share_header, share)) {
        issues.push_back(SignatureIssue::ShareSignatureInvalid);
    }
    if (file_header.signature_block->public_key != share_header.signature_block->public_key) {
        issues.push_back(SignatureIssue::PublicKeyMismatch);
    }
    return issues;
}
}
