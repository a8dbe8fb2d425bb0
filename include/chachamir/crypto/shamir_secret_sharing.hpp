#pragma once
#include "chachamir/core/result.hpp"
#include "chachamir/core/failures.hpp"
#include "chachamir/interfaces/i_secret_sharing.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace chachamir::crypto {

/**
 * Byte-wise Shamir secret sharing over GF(2^8).
 *
 * Each share is encoded as x | y[0..n) where x is the non-zero evaluation
 * point (1..255, assigned in order) and y[i] is the evaluation of the
 * polynomial whose constant term is secret[i]. Reconstruction interpolates
 * at zero using the first `threshold` shares with distinct x.
 */
class ShamirSecretSharing final : public interfaces::ISecretSharing {
public:
    static constexpr size_t MAX_SECRET_LENGTH = 1024 * 1024;
    static constexpr size_t MIN_SHARE_LENGTH = 2;

    [[nodiscard]] Result<std::vector<std::vector<uint8_t>>, ChachamirFailure> Split(
        std::span<const uint8_t> secret,
        uint8_t threshold,
        uint8_t share_count) const override;

    [[nodiscard]] Result<std::vector<uint8_t>, ChachamirFailure> Reconstruct(
        std::span<const std::vector<uint8_t>> shares,
        uint8_t threshold) const override;
};
}
