#pragma once
#include "chachamir/core/result.hpp"
#include "chachamir/core/failures.hpp"
#include <cstdint>
#include <optional>
#include <string_view>
namespace chachamir::configuration {

/// Parameters of one encryption. players and threshold are kept wide so
/// out-of-range operator input reaches Validate() instead of wrapping.
struct EncryptConfig {
    uint32_t players = 0;
    uint32_t threshold = 0;
    bool sign = false;

    [[nodiscard]] static EncryptConfig Unsigned(const uint32_t players, const uint32_t threshold) noexcept {
        return {players, threshold, false};
    }

    [[nodiscard]] static EncryptConfig Signed(const uint32_t players, const uint32_t threshold) noexcept {
        return {players, threshold, true};
    }

    /// 1 <= threshold <= players <= 255, otherwise Configuration.
    [[nodiscard]] Result<Unit, ChachamirFailure> Validate() const;
};

/// What to do when a share records a different threshold than its file.
enum class ThresholdMismatchPolicy : uint8_t {
    /// Consult IReconciliationPolicy for every conflict.
    Ask,
    /// Keep the file's threshold.
    UseFile,
    /// Switch to DecryptConfig::threshold_override.
    UseOverride,
    /// Fail with ThresholdMismatch.
    Abort
};

struct DecryptConfig {
    /// Treat every file in the share source as a candidate, not only *.ccms.
    bool accept_all_files = false;
    /// Any signature problem on a signed file aborts instead of warning.
    bool strict = false;
    ThresholdMismatchPolicy threshold_policy = ThresholdMismatchPolicy::Ask;
    std::optional<uint32_t> threshold_override;

    [[nodiscard]] static DecryptConfig Lenient() noexcept {
        return {};
    }

    [[nodiscard]] static DecryptConfig Strict() noexcept {
        DecryptConfig config;
        config.strict = true;
        return config;
    }

    /// UseOverride requires an override; any override must lie in 1..255.
    [[nodiscard]] Result<Unit, ChachamirFailure> Validate() const;
};

[[nodiscard]] std::optional<ThresholdMismatchPolicy> ParseThresholdMismatchPolicy(std::string_view name);

[[nodiscard]] constexpr std::string_view ThresholdMismatchPolicyName(const ThresholdMismatchPolicy policy) noexcept {
    switch (policy) {
        case ThresholdMismatchPolicy::Ask: return "ask";
        case ThresholdMismatchPolicy::UseFile: return "file";
        case ThresholdMismatchPolicy::UseOverride: return "override";
        case ThresholdMismatchPolicy::Abort: return "abort";
    }
    return "unknown";
}
}
