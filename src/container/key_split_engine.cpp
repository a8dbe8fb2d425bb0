#include "chachamir/container/key_split_engine.hpp"
#include "chachamir/crypto/sodium_interop.hpp"
#include "chachamir/core/constants.hpp"
#include "chachamir/core/format.hpp"

namespace chachamir::container {
using models::KeyMaterial;

KeySplitEngine::KeySplitEngine(const interfaces::ISecretSharing& sharing) noexcept
    : sharing_(sharing) {
}

Result<Unit, ChachamirFailure> KeySplitEngine::ValidateParameters(
    const uint32_t threshold,
    const uint32_t players) {
    if (players < SharingConstants::MIN_PLAYERS) {
        return Result<Unit, ChachamirFailure>::Err(
            ChachamirFailure::Configuration("Number of shares cannot be zero"));
    }
    if (threshold < SharingConstants::MIN_THRESHOLD) {
        return Result<Unit, ChachamirFailure>::Err(
            ChachamirFailure::Configuration("Threshold of shares cannot be zero"));
    }
    if (players > SharingConstants::MAX_PLAYERS) {
        return Result<Unit, ChachamirFailure>::Err(
            ChachamirFailure::Configuration(
                compat::format("Number of shares cannot exceed {}", SharingConstants::MAX_PLAYERS)));
    }
    if (threshold > players) {
        return Result<Unit, ChachamirFailure>::Err(
            ChachamirFailure::Configuration(
                "Share threshold exceeds maximum number of players. File would be unrecoverable!"));
    }
    return Result<Unit, ChachamirFailure>::Ok(unit);
}

Result<std::vector<std::vector<uint8_t>>, ChachamirFailure> KeySplitEngine::Split(
    const KeyMaterial& key,
    const uint8_t threshold,
    const uint8_t players) const {
    using SharesResult = Result<std::vector<std::vector<uint8_t>>, ChachamirFailure>;

    CHACHAMIR_TRY(ValidateParameters(threshold, players));

    auto split_result = key.Use([this, threshold, players](std::span<const uint8_t> secret) {
        return sharing_.Split(secret, threshold, players);
    });
    if (split_result.IsErr()) {
        return split_result;
    }
    auto shares = std::move(split_result).Unwrap();
    if (shares.size() != players) {
        WipeShares(shares);
        return SharesResult::Err(ChachamirFailure::InternalConsistency(
            compat::format("Expected {} shares from the splitter, got {}", players, shares.size())));
    }

    const std::span<const std::vector<uint8_t>> all_shares(shares);
    const auto head = all_shares.first(threshold);
    const auto tail = all_shares.last(threshold);
    for (const auto quorum : {head, tail}) {
        auto recovered = Reconstruct(quorum, threshold);
        if (recovered.IsErr()) {
            WipeShares(shares);
            return SharesResult::Err(ChachamirFailure::InternalConsistency(
                compat::format("Unable to recover the key from fresh shares: {}",
                    recovered.UnwrapErr().message)));
        }
        auto matches = recovered.Unwrap().Matches(key);
        if (matches.IsErr()) {
            WipeShares(shares);
            return PropagateErr(std::move(matches).UnwrapErr());
        }
        if (!matches.Unwrap()) {
            WipeShares(shares);
            return SharesResult::Err(ChachamirFailure::InternalConsistency(
                "Key recovered from fresh shares differs from the original"));
        }
    }

    return SharesResult::Ok(std::move(shares));
}

Result<KeyMaterial, ChachamirFailure> KeySplitEngine::Reconstruct(
    std::span<const std::vector<uint8_t>> shares,
    const uint8_t threshold) const {
    for (const auto& share : shares) {
        if (share.size() != Constants::SHARE_SIZE) {
            return Result<KeyMaterial, ChachamirFailure>::Err(
                ChachamirFailure::CorruptShares(
                    compat::format("Share carries {} bytes, expected {}", share.size(), Constants::SHARE_SIZE)));
        }
    }

    auto secret_result = sharing_.Reconstruct(shares, threshold);
    if (secret_result.IsErr()) {
        return PropagateErr(std::move(secret_result).UnwrapErr());
    }
    auto secret = std::move(secret_result).Unwrap();
    return KeyMaterial::Adopt(secret);
}

void KeySplitEngine::WipeShares(std::vector<std::vector<uint8_t>>& shares) {
    for (auto& share : shares) {
        { auto __wipe = crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(share)); (void)__wipe; }
    }
    shares.clear();
}
}
