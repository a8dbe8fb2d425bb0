#include "chachamir/configuration/container_config.hpp"
#include "chachamir/container/key_split_engine.hpp"
#include "chachamir/core/constants.hpp"
#include "chachamir/core/format.hpp"

namespace chachamir::configuration {

Result<Unit, ChachamirFailure> EncryptConfig::Validate() const {
    return container::KeySplitEngine::ValidateParameters(threshold, players);
}

Result<Unit, ChachamirFailure> DecryptConfig::Validate() const {
    if (threshold_policy == ThresholdMismatchPolicy::UseOverride && !threshold_override.has_value()) {
        return Result<Unit, ChachamirFailure>::Err(
            ChachamirFailure::Configuration("Threshold policy 'override' needs an override threshold"));
    }
    if (threshold_override.has_value() &&
        (*threshold_override < SharingConstants::MIN_THRESHOLD ||
         *threshold_override > SharingConstants::MAX_PLAYERS)) {
        return Result<Unit, ChachamirFailure>::Err(
            ChachamirFailure::Configuration(
                compat::format("Override threshold must be between {} and {}, got {}",
                    SharingConstants::MIN_THRESHOLD, SharingConstants::MAX_PLAYERS, *threshold_override)));
    }
    return Result<Unit, ChachamirFailure>::Ok(unit);
}

std::optional<ThresholdMismatchPolicy> ParseThresholdMismatchPolicy(const std::string_view name) {
    for (const auto policy : {ThresholdMismatchPolicy::Ask, ThresholdMismatchPolicy::UseFile,
                              ThresholdMismatchPolicy::UseOverride, ThresholdMismatchPolicy::Abort}) {
        if (ThresholdMismatchPolicyName(policy) == name) {
            return policy;
        }
    }
    return std::nullopt;
}
}
