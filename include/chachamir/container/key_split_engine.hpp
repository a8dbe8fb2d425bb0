#pragma once
#include "chachamir/core/result.hpp"
#include "chachamir/core/failures.hpp"
#include "chachamir/interfaces/i_secret_sharing.hpp"
#include "chachamir/models/key_material.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace chachamir::container {

/**
 * @brief Splits the file key into threshold shares and recovers it
 *
 * Split verifies its own output before returning: the key is recovered
 * from the first and from the last `threshold` shares and compared in
 * constant time. A mismatch means the sharing primitive is broken and is
 * reported as InternalConsistency; no share leaves the engine.
 */
class KeySplitEngine {
public:
    explicit KeySplitEngine(const interfaces::ISecretSharing& sharing) noexcept;

    /// 1 <= threshold <= players <= 255, otherwise Configuration.
    [[nodiscard]] static Result<Unit, ChachamirFailure> ValidateParameters(
        uint32_t threshold,
        uint32_t players);

    [[nodiscard]] Result<std::vector<std::vector<uint8_t>>, ChachamirFailure> Split(
        const models::KeyMaterial& key,
        uint8_t threshold,
        uint8_t players) const;

    [[nodiscard]] Result<models::KeyMaterial, ChachamirFailure> Reconstruct(
        std::span<const std::vector<uint8_t>> shares,
        uint8_t threshold) const;

    /// Zeroes and releases every share buffer.
    static void WipeShares(std::vector<std::vector<uint8_t>>& shares);

private:
    const interfaces::ISecretSharing& sharing_;
};
}
