#include "chachamir/container/container_system.hpp"
#include "chachamir/container/header_codec.hpp"
#include "chachamir/container/key_split_engine.hpp"
#include "chachamir/container/payload_cipher.hpp"
#include "chachamir/container/signature_binder.hpp"
#include "chachamir/crypto/chacha20_poly1305.hpp"
#include "chachamir/crypto/ed25519_signature.hpp"
#include "chachamir/crypto/shamir_secret_sharing.hpp"
#include "chachamir/crypto/sodium_interop.hpp"
#include "chachamir/debug/hex.hpp"
#include "chachamir/core/constants.hpp"
#include "chachamir/core/format.hpp"
#include <optional>

namespace chachamir::container {
using configuration::DecryptConfig;
using configuration::EncryptConfig;
using crypto::SodiumInterop;
using models::FileHeader;
using models::KeyMaterial;
using models::Nonce;
using models::ShareHeader;
using models::SignatureBlock;
using models::SigningIdentity;

ContainerSystem::ContainerSystem(
    std::unique_ptr<interfaces::ISecretSharing> sharing,
    std::unique_ptr<interfaces::IAeadCipher> aead,
    std::unique_ptr<interfaces::ISignatureScheme> signatures)
    : sharing_(std::move(sharing))
    , aead_(std::move(aead))
    , signatures_(std::move(signatures)) {
}

std::unique_ptr<ContainerSystem> ContainerSystem::CreateDefault() {
    return std::make_unique<ContainerSystem>(
        std::make_unique<crypto::ShamirSecretSharing>(),
        std::make_unique<crypto::ChaCha20Poly1305>(),
        std::make_unique<crypto::Ed25519Signature>());
}

std::string ContainerSystem::ShareFileName(const uint8_t index, const Nonce& nonce) {
    return compat::format("{}-{}{}", index, debug::ToHex(nonce), ContainerConstants::SHARE_FILE_EXTENSION);
}

Result<EncryptedBundle, ChachamirFailure> ContainerSystem::Encrypt(
    std::span<const uint8_t> plaintext,
    const EncryptConfig& config,
    interfaces::IContainerEventHandler& events) const {
    using BundleResult = Result<EncryptedBundle, ChachamirFailure>;

    CHACHAMIR_TRY(config.Validate());
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return BundleResult::Err(ChachamirFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    const auto threshold = static_cast<uint8_t>(config.threshold);
    const auto players = static_cast<uint8_t>(config.players);

    auto key_result = KeyMaterial::Generate();
    if (key_result.IsErr()) {
        return PropagateErr(std::move(key_result).UnwrapErr());
    }
    const KeyMaterial key = std::move(key_result).Unwrap();
    events.OnStage("Key generated");

    EncryptedBundle bundle;
    bundle.is_signed = config.sign;
    SodiumInterop::FillRandom(bundle.nonce);
    events.OnStage("Nonce generated");
    CHACHAMIR_TRACE_BYTES("encrypt", "nonce", std::span<const uint8_t>(bundle.nonce));

    const SignatureBinder binder(*signatures_);
    std::optional<SigningIdentity> identity;
    if (config.sign) {
        auto identity_result = binder.CreateIdentity();
        if (identity_result.IsErr()) {
            return PropagateErr(std::move(identity_result).UnwrapErr());
        }
        identity.emplace(std::move(identity_result).Unwrap());
        CHACHAMIR_TRACE_BYTES("encrypt", "public key", std::span<const uint8_t>(identity->GetPublicKey()));
    }

    const KeySplitEngine engine(*sharing_);
    auto split_result = engine.Split(key, threshold, players);
    if (split_result.IsErr()) {
        return PropagateErr(std::move(split_result).UnwrapErr());
    }
    auto raw_shares = std::move(split_result).Unwrap();
    events.OnStage(compat::format("Derived {} share(s) from key | threshold {}", raw_shares.size(), threshold));
    events.OnStage("Share recovery succeeded");

    ShareHeader share_header;
    share_header.threshold = threshold;
    share_header.nonce = bundle.nonce;
    auto share_files = BuildShareFiles(raw_shares, share_header, identity ? &*identity : nullptr, events);
    KeySplitEngine::WipeShares(raw_shares);
    if (share_files.IsErr()) {
        return PropagateErr(std::move(share_files).UnwrapErr());
    }
    bundle.shares = std::move(share_files).Unwrap();

    const PayloadCipher cipher(*aead_);
    auto sealed = cipher.Seal(key, bundle.nonce, plaintext);
    if (sealed.IsErr()) {
        return PropagateErr(std::move(sealed).UnwrapErr());
    }
    const auto ciphertext = std::move(sealed).Unwrap();
    events.OnStage("Payload encrypted and verified");

    FileHeader file_header;
    file_header.threshold = threshold;
    file_header.nonce = bundle.nonce;
    if (identity) {
        auto signature = binder.SignFile(*identity, file_header, ciphertext);
        if (signature.IsErr()) {
            return PropagateErr(std::move(signature).UnwrapErr());
        }
        file_header.signature_block = SignatureBlock{identity->GetPublicKey(), signature.Unwrap()};
        events.OnStage("Signed encrypted file");
    }

    auto encoded_header = HeaderCodec::EncodeFileHeader(file_header);
    if (encoded_header.IsErr()) {
        return PropagateErr(std::move(encoded_header).UnwrapErr());
    }
    bundle.file_container = std::move(encoded_header).Unwrap();
    bundle.file_container.insert(bundle.file_container.end(), ciphertext.begin(), ciphertext.end());
    return BundleResult::Ok(std::move(bundle));
}

Result<std::vector<ShareFile>, ChachamirFailure> ContainerSystem::BuildShareFiles(
    std::span<const std::vector<uint8_t>> shares,
    const ShareHeader& header,
    const SigningIdentity* identity,
    interfaces::IContainerEventHandler& events) const {
    using FilesResult = Result<std::vector<ShareFile>, ChachamirFailure>;

    const SignatureBinder binder(*signatures_);
    std::vector<ShareFile> files;
    files.reserve(shares.size());
    for (size_t i = 0; i < shares.size(); ++i) {
        const auto index = static_cast<uint8_t>(i + 1);
        ShareHeader share_header = header;
        if (identity != nullptr) {
            auto signature = binder.SignShare(*identity, share_header, shares[i]);
            if (signature.IsErr()) {
                return PropagateErr(std::move(signature).UnwrapErr());
            }
            share_header.signature_block = SignatureBlock{identity->GetPublicKey(), signature.Unwrap()};
            events.OnStage(compat::format("Signed share # {}", index));
        }

        auto encoded = HeaderCodec::EncodeShareHeader(share_header);
        if (encoded.IsErr()) {
            return PropagateErr(std::move(encoded).UnwrapErr());
        }
        ShareFile file{index, ShareFileName(index, header.nonce), std::move(encoded).Unwrap()};
        file.bytes.insert(file.bytes.end(), shares[i].begin(), shares[i].end());
        files.push_back(std::move(file));
    }
    return FilesResult::Ok(std::move(files));
}

Result<DecryptionOutcome, ChachamirFailure> ContainerSystem::Decrypt(
    std::span<const uint8_t> file_container,
    interfaces::IShareSource& shares,
    const DecryptConfig& config,
    interfaces::IReconciliationPolicy& policy,
    interfaces::IContainerEventHandler& events) const {
    using OutcomeResult = Result<DecryptionOutcome, ChachamirFailure>;

    CHACHAMIR_TRY(config.Validate());
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return OutcomeResult::Err(ChachamirFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    auto decoded = HeaderCodec::DecodeFileHeader(file_container);
    if (decoded.IsErr()) {
        const auto& failure = decoded.UnwrapErr();
        return OutcomeResult::Err(ChachamirFailure(failure.type,
            compat::format("Target file failed validation: {}", failure.message)));
    }
    const auto view = decoded.Unwrap();

    DecryptionOutcome outcome;
    outcome.report.file_header = view.header;
    events.OnStage(compat::format("Target file is encrypted; algorithm version {}", view.header.version));
    if (view.header.IsSigned()) {
        events.OnStage("Target file is signed");
    }
    events.OnStage(compat::format("{} shares needed to decrypt", view.header.threshold));
    events.OnStage(compat::format("Target file nonce: {}", debug::ToHex(view.header.nonce)));

    const SignatureBinder binder(*signatures_);
    ShareReconciliation reconciliation(binder, config, policy, events);
    auto gathered = reconciliation.Gather(view.header, shares);
    if (gathered.IsErr()) {
        return PropagateErr(std::move(gathered).UnwrapErr());
    }
    SharePool pool = std::move(gathered).Unwrap();

    if (view.header.IsSigned()) {
        if (binder.VerifyFile(view.header, view.ciphertext)) {
            outcome.report.file_signature = FileSignatureStatus::Verified;
            events.OnStage("Target file signature verified");
        } else {
            outcome.report.file_signature = FileSignatureStatus::Invalid;
            const models::SignatureWarning warning{
                "target file",
                models::SignatureIssue::FileSignatureInvalid,
                view.header.signature_block->public_key,
                std::nullopt};
            pool.report.warnings.push_back(warning);
            if (auto applied = reconciliation.ApplySignaturePolicy(warning); applied.IsErr()) {
                KeySplitEngine::WipeShares(pool.shares);
                return PropagateErr(std::move(applied).UnwrapErr());
            }
        }
    }

    const uint8_t threshold = pool.report.effective_threshold;
    events.OnStage(compat::format("Recovering key from {} share(s) | threshold {}", pool.shares.size(), threshold));
    const KeySplitEngine engine(*sharing_);
    auto key_result = engine.Reconstruct(pool.shares, threshold);
    KeySplitEngine::WipeShares(pool.shares);
    if (key_result.IsErr()) {
        return PropagateErr(std::move(key_result).UnwrapErr());
    }
    const KeyMaterial key = std::move(key_result).Unwrap();
    events.OnStage("Key recovered");

    const PayloadCipher cipher(*aead_);
    auto opened = cipher.Open(key, view.header.nonce, view.ciphertext);
    if (opened.IsErr()) {
        return PropagateErr(std::move(opened).UnwrapErr());
    }
    outcome.plaintext = std::move(opened).Unwrap();
    outcome.report.shares = std::move(pool.report);
    events.OnStage("Payload decrypted");
    return OutcomeResult::Ok(std::move(outcome));
}
}
