#pragma once
#include "chachamir/core/result.hpp"
#include "chachamir/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace chachamir::interfaces {

/// Threshold secret-sharing primitive. Share encodings are opaque to callers.
class ISecretSharing {
public:
    virtual ~ISecretSharing() = default;
    [[nodiscard]] virtual Result<std::vector<std::vector<uint8_t>>, ChachamirFailure> Split(
        std::span<const uint8_t> secret,
        uint8_t threshold,
        uint8_t share_count) const = 0;
    /// Caller owns the returned secret and must wipe it.
    [[nodiscard]] virtual Result<std::vector<uint8_t>, ChachamirFailure> Reconstruct(
        std::span<const std::vector<uint8_t>> shares,
        uint8_t threshold) const = 0;
};
}
