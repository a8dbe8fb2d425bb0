#include "chachamir/crypto/shamir_secret_sharing.hpp"
#include "chachamir/crypto/sodium_interop.hpp"
#include "chachamir/core/constants.hpp"
#include "chachamir/core/format.hpp"
#include <array>
#include <string>
#include <vector>

namespace chachamir::crypto {
namespace {
constexpr uint8_t kPoly = SharingConstants::GF256_REDUCTION;

uint8_t Gf256Mul(uint8_t a, uint8_t b) {
    uint8_t p = 0;
    for (int i = 0; i < 8; ++i) {
        const uint8_t mask = static_cast<uint8_t>(-(static_cast<int>(b & 1u)));
        p ^= a & mask;
        const uint8_t hi = static_cast<uint8_t>(a & 0x80);
        a <<= 1;
        const uint8_t reduction = static_cast<uint8_t>(-(static_cast<int>(hi >> 7))) & kPoly;
        a ^= reduction;
        b >>= 1;
    }
    return p;
}

// a^254 == a^-1 in GF(2^8)
uint8_t Gf256Inv(uint8_t a) {
    if (a == 0) {
        return 0;
    }
    const uint8_t a2 = Gf256Mul(a, a);
    const uint8_t a4 = Gf256Mul(a2, a2);
    const uint8_t a8 = Gf256Mul(a4, a4);
    const uint8_t a16 = Gf256Mul(a8, a8);
    const uint8_t a32 = Gf256Mul(a16, a16);
    const uint8_t a64 = Gf256Mul(a32, a32);
    const uint8_t a128 = Gf256Mul(a64, a64);

    uint8_t result = Gf256Mul(a128, a64);
    result = Gf256Mul(result, a32);
    result = Gf256Mul(result, a16);
    result = Gf256Mul(result, a8);
    result = Gf256Mul(result, a4);
    result = Gf256Mul(result, a2);
    return result;
}

uint8_t EvaluatePolynomial(std::span<const uint8_t> coeffs, const uint8_t x) {
    uint8_t result = 0;
    uint8_t x_power = 1;
    for (const uint8_t coeff : coeffs) {
        result ^= Gf256Mul(coeff, x_power);
        x_power = Gf256Mul(x_power, x);
    }
    return result;
}

Result<Unit, ChachamirFailure> ValidateShare(const std::vector<uint8_t>& share, const size_t expected_length) {
    if (share.size() < ShamirSecretSharing::MIN_SHARE_LENGTH) {
        return Result<Unit, ChachamirFailure>::Err(
            ChachamirFailure::CorruptShares(
                compat::format("A share must be at least {} bytes long",
                    ShamirSecretSharing::MIN_SHARE_LENGTH)));
    }
    if (share.size() != expected_length) {
        return Result<Unit, ChachamirFailure>::Err(
            ChachamirFailure::CorruptShares("All shares must have the same length"));
    }
    if (share.front() == 0) {
        return Result<Unit, ChachamirFailure>::Err(
            ChachamirFailure::CorruptShares("Share evaluation point must be non-zero"));
    }
    return Result<Unit, ChachamirFailure>::Ok(unit);
}
}

Result<std::vector<std::vector<uint8_t>>, ChachamirFailure> ShamirSecretSharing::Split(
    std::span<const uint8_t> secret,
    const uint8_t threshold,
    const uint8_t share_count) const {
    using SplitResult = Result<std::vector<std::vector<uint8_t>>, ChachamirFailure>;

    if (secret.empty()) {
        return SplitResult::Err(ChachamirFailure::InvalidInput("Secret must not be empty"));
    }

    if (secret.size() > MAX_SECRET_LENGTH) {
        return SplitResult::Err(ChachamirFailure::InvalidInput("Secret exceeds maximum length"));
    }

    if (share_count < SharingConstants::MIN_PLAYERS) {
        return SplitResult::Err(ChachamirFailure::Configuration("Number of shares cannot be zero"));
    }

    if (threshold < SharingConstants::MIN_THRESHOLD) {
        return SplitResult::Err(ChachamirFailure::Configuration("Threshold of shares cannot be zero"));
    }

    if (threshold > share_count) {
        return SplitResult::Err(ChachamirFailure::Configuration(
            "Share threshold exceeds maximum number of players"));
    }

    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return SplitResult::Err(ChachamirFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    const size_t share_length = Constants::SHARE_X_SIZE + secret.size();
    std::vector<std::vector<uint8_t>> shares(share_count);
    for (size_t i = 0; i < share_count; ++i) {
        shares[i].assign(share_length, 0);
        shares[i][0] = static_cast<uint8_t>(i + 1);
    }

    std::vector<uint8_t> coeffs(threshold);
    for (size_t byte_index = 0; byte_index < secret.size(); ++byte_index) {
        coeffs[0] = secret[byte_index];
        SodiumInterop::FillRandom(std::span<uint8_t>(coeffs).subspan(1));

        for (size_t share_index = 0; share_index < share_count; ++share_index) {
            const uint8_t x = shares[share_index][0];
            shares[share_index][Constants::SHARE_X_SIZE + byte_index] = EvaluatePolynomial(coeffs, x);
        }
    }
    { auto __wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(coeffs)); (void)__wipe; }

    return SplitResult::Ok(std::move(shares));
}

Result<std::vector<uint8_t>, ChachamirFailure> ShamirSecretSharing::Reconstruct(
    std::span<const std::vector<uint8_t>> shares,
    const uint8_t threshold) const {
    using SecretResult = Result<std::vector<uint8_t>, ChachamirFailure>;

    if (threshold < SharingConstants::MIN_THRESHOLD) {
        return SecretResult::Err(ChachamirFailure::Configuration("Threshold of shares cannot be zero"));
    }

    if (shares.empty()) {
        return SecretResult::Err(ChachamirFailure::InsufficientShares("No shares provided"));
    }

    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return SecretResult::Err(ChachamirFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    std::array<bool, 256> seen_points{};
    std::vector<const std::vector<uint8_t>*> quorum;
    quorum.reserve(threshold);
    for (const auto& share : shares) {
        if (quorum.size() == threshold) {
            break;
        }
        // Shares past the quorum are never inspected.
        CHACHAMIR_TRY(ValidateShare(share,
            quorum.empty() ? share.size() : quorum.front()->size()));
        if (seen_points[share.front()]) {
            continue;
        }
        seen_points[share.front()] = true;
        quorum.push_back(&share);
    }

    if (quorum.size() < threshold) {
        return SecretResult::Err(
            ChachamirFailure::InsufficientShares(
                compat::format("Not enough shares to recover original secret: {} distinct, {} required",
                    quorum.size(), threshold)));
    }

    std::vector<uint8_t> lagrange_coeffs(quorum.size(), 0);
    for (size_t i = 0; i < quorum.size(); ++i) {
        const uint8_t x_i = quorum[i]->front();
        uint8_t numerator = 1;
        uint8_t denominator = 1;
        for (size_t j = 0; j < quorum.size(); ++j) {
            if (i == j) {
                continue;
            }
            const uint8_t x_j = quorum[j]->front();
            numerator = Gf256Mul(numerator, x_j);
            denominator = Gf256Mul(denominator, static_cast<uint8_t>(x_j ^ x_i));
        }
        lagrange_coeffs[i] = Gf256Mul(numerator, Gf256Inv(denominator));
    }

    const size_t secret_length = quorum.front()->size() - Constants::SHARE_X_SIZE;
    std::vector<uint8_t> secret(secret_length);
    for (size_t byte_index = 0; byte_index < secret_length; ++byte_index) {
        uint8_t value = 0;
        for (size_t i = 0; i < quorum.size(); ++i) {
            const uint8_t y = (*quorum[i])[Constants::SHARE_X_SIZE + byte_index];
            value ^= Gf256Mul(lagrange_coeffs[i], y);
        }
        secret[byte_index] = value;
    }

    return SecretResult::Ok(std::move(secret));
}
}
