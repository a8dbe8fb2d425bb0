#pragma once
#include "chachamir/core/result.hpp"
#include "chachamir/core/failures.hpp"
#include "chachamir/configuration/container_config.hpp"
#include "chachamir/container/signature_binder.hpp"
#include "chachamir/interfaces/i_container_event_handler.hpp"
#include "chachamir/interfaces/i_reconciliation_policy.hpp"
#include "chachamir/interfaces/i_share_source.hpp"
#include "chachamir/models/container_headers.hpp"
#include "chachamir/models/reconciliation_records.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace chachamir::container {

/**
 * @brief Threshold bookkeeping for one decryption
 *
 * The file's declared threshold never changes. An override only comes
 * from a recorded resolution, and the threshold used for reconstruction
 * is always read back from here.
 */
class ReconciliationState {
public:
    explicit ReconciliationState(uint8_t declared_threshold) noexcept;

    [[nodiscard]] uint8_t DeclaredThreshold() const noexcept { return declared_threshold_; }
    [[nodiscard]] std::optional<uint8_t> OverrideThreshold() const noexcept { return override_threshold_; }
    [[nodiscard]] uint8_t EffectiveThreshold() const noexcept;

    void Record(const models::ThresholdResolution& resolution);

    [[nodiscard]] const std::vector<models::ThresholdResolution>& History() const noexcept { return history_; }

private:
    uint8_t declared_threshold_;
    std::optional<uint8_t> override_threshold_;
    std::vector<models::ThresholdResolution> history_;
};

struct ReconciliationReport {
    /// Accepted shares without signature issues, in scan order.
    std::vector<std::string> accepted;
    /// Accepted shares that carried a signature issue, in scan order.
    std::vector<std::string> flagged;
    std::vector<models::ShareRejection> rejected;
    std::vector<models::SignatureWarning> warnings;
    std::vector<models::ThresholdResolution> threshold_resolutions;
    uint8_t declared_threshold = 0;
    uint8_t effective_threshold = 0;
};

/// Share payloads ready for reconstruction; clean shares come first.
struct SharePool {
    std::vector<std::vector<uint8_t>> shares;
    ReconciliationReport report;
};

/**
 * @brief Gathers the shares that belong to one encrypted file
 *
 * Every candidate goes through filter, read, header match, nonce match,
 * threshold cross-check and signature cross-check. A candidate failing a
 * step is recorded as rejected and the scan moves on. The scan itself
 * only fails when a policy decides to abort the whole operation.
 */
class ShareReconciliation {
public:
    ShareReconciliation(
        const SignatureBinder& binder,
        const configuration::DecryptConfig& config,
        interfaces::IReconciliationPolicy& policy,
        interfaces::IContainerEventHandler& events) noexcept;

    /// Names ending in .ccms, or any name when accept_all_files is set.
    [[nodiscard]] static bool IsCandidateName(std::string_view name, bool accept_all_files);

    [[nodiscard]] Result<SharePool, ChachamirFailure> Gather(
        const models::FileHeader& file_header,
        interfaces::IShareSource& source);

    /**
     * @brief Applies the strict or lenient signature policy to one warning
     *
     * Reports the warning, then fails with SignatureMismatch in strict
     * mode or Aborted when the policy declines to continue.
     */
    [[nodiscard]] Result<Unit, ChachamirFailure> ApplySignaturePolicy(
        const models::SignatureWarning& warning);

private:
    enum class Verdict : uint8_t {
        Rejected,
        Accepted,
        Flagged
    };

    [[nodiscard]] Result<Verdict, ChachamirFailure> Consider(
        const models::FileHeader& file_header,
        const std::string& name,
        std::span<const uint8_t> bytes,
        ReconciliationState& state,
        SharePool& pool,
        std::vector<std::vector<uint8_t>>& flagged_shares);

    [[nodiscard]] Result<Unit, ChachamirFailure> ResolveThreshold(
        const models::ThresholdConflict& conflict,
        ReconciliationState& state);

    void Reject(SharePool& pool, std::string label, models::ShareRejectionReason reason, std::string detail);

    const SignatureBinder& binder_;
    const configuration::DecryptConfig& config_;
    interfaces::IReconciliationPolicy& policy_;
    interfaces::IContainerEventHandler& events_;
};
}
