#include "chachamir/container/share_reconciliation.hpp"
#include "chachamir/container/header_codec.hpp"
#include "chachamir/container/key_split_engine.hpp"
#include "chachamir/crypto/sodium_interop.hpp"
#include "chachamir/core/constants.hpp"
#include "chachamir/core/format.hpp"
#include <algorithm>
#include <iterator>

namespace chachamir::container {
using configuration::ThresholdMismatchPolicy;
using models::FileHeader;
using models::ShareRejection;
using models::ShareRejectionReason;
using models::SignatureIssue;
using models::SignatureWarning;
using models::ThresholdConflict;
using models::ThresholdDecision;
using models::ThresholdDecisionKind;
using models::ThresholdResolution;

ReconciliationState::ReconciliationState(const uint8_t declared_threshold) noexcept
    : declared_threshold_(declared_threshold) {
}

uint8_t ReconciliationState::EffectiveThreshold() const noexcept {
    return override_threshold_.value_or(declared_threshold_);
}

void ReconciliationState::Record(const ThresholdResolution& resolution) {
    switch (resolution.decision.kind) {
        case ThresholdDecisionKind::UseOverride:
            override_threshold_ = resolution.decision.override_threshold;
            break;
        case ThresholdDecisionKind::UseFileThreshold:
            override_threshold_.reset();
            break;
        case ThresholdDecisionKind::Abort:
            break;
    }
    history_.push_back(resolution);
    history_.back().effective_threshold = EffectiveThreshold();
}

ShareReconciliation::ShareReconciliation(
    const SignatureBinder& binder,
    const configuration::DecryptConfig& config,
    interfaces::IReconciliationPolicy& policy,
    interfaces::IContainerEventHandler& events) noexcept
    : binder_(binder)
    , config_(config)
    , policy_(policy)
    , events_(events) {
}

bool ShareReconciliation::IsCandidateName(const std::string_view name, const bool accept_all_files) {
    if (accept_all_files) {
        return true;
    }
    const auto extension = ContainerConstants::SHARE_FILE_EXTENSION;
    return name.size() > extension.size() && name.ends_with(extension);
}

Result<SharePool, ChachamirFailure> ShareReconciliation::Gather(
    const FileHeader& file_header,
    interfaces::IShareSource& source) {
    auto names_result = source.ListCandidates();
    if (names_result.IsErr()) {
        return PropagateErr(std::move(names_result).UnwrapErr());
    }

    ReconciliationState state(file_header.threshold);
    SharePool pool;
    pool.report.declared_threshold = file_header.threshold;
    std::vector<std::vector<uint8_t>> flagged_shares;

    for (const auto& name : names_result.Unwrap()) {
        if (!IsCandidateName(name, config_.accept_all_files)) {
            Reject(pool, name, ShareRejectionReason::NotCandidate,
                compat::format("name does not end in {}", ContainerConstants::SHARE_FILE_EXTENSION));
            continue;
        }

        auto loaded = source.Load(name);
        if (loaded.IsErr()) {
            Reject(pool, name, ShareRejectionReason::Unreadable, loaded.UnwrapErr().message);
            continue;
        }
        auto bytes = std::move(loaded).Unwrap();

        auto verdict = Consider(file_header, name, bytes, state, pool, flagged_shares);
        { auto __wipe = crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(bytes)); (void)__wipe; }
        if (verdict.IsErr()) {
            KeySplitEngine::WipeShares(pool.shares);
            KeySplitEngine::WipeShares(flagged_shares);
            return PropagateErr(std::move(verdict).UnwrapErr());
        }
    }

    pool.shares.insert(pool.shares.end(),
        std::make_move_iterator(flagged_shares.begin()),
        std::make_move_iterator(flagged_shares.end()));
    pool.report.threshold_resolutions = state.History();
    pool.report.effective_threshold = state.EffectiveThreshold();
    return Result<SharePool, ChachamirFailure>::Ok(std::move(pool));
}

Result<ShareReconciliation::Verdict, ChachamirFailure> ShareReconciliation::Consider(
    const FileHeader& file_header,
    const std::string& name,
    std::span<const uint8_t> bytes,
    ReconciliationState& state,
    SharePool& pool,
    std::vector<std::vector<uint8_t>>& flagged_shares) {
    using VerdictResult = Result<Verdict, ChachamirFailure>;

    if (bytes.size() < ContainerConstants::SHARE_HEADER_BASE_SIZE) {
        Reject(pool, name, ShareRejectionReason::Malformed, "Invalid share (file smaller than CCMS header)");
        return VerdictResult::Ok(Verdict::Rejected);
    }

    // Correlate before the signature block is decoded.
    if (const auto nonce = HeaderCodec::PeekShareNonce(bytes); nonce.has_value() && *nonce != file_header.nonce) {
        Reject(pool, name, ShareRejectionReason::WrongFile, "Share nonce does not match the encrypted file");
        return VerdictResult::Ok(Verdict::Rejected);
    }

    auto decoded = HeaderCodec::DecodeShareHeader(bytes);
    if (decoded.IsErr()) {
        const auto& failure = decoded.UnwrapErr();
        Reject(pool, name,
            failure.type == FailureType::MissingMagic ? ShareRejectionReason::NotAShare : ShareRejectionReason::Malformed,
            failure.message);
        return VerdictResult::Ok(Verdict::Rejected);
    }
    const auto& view = decoded.Unwrap();

    if (view.share.size() != Constants::SHARE_SIZE) {
        Reject(pool, name, ShareRejectionReason::Malformed,
            compat::format("Share payload is {} bytes, expected {}", view.share.size(), Constants::SHARE_SIZE));
        return VerdictResult::Ok(Verdict::Rejected);
    }

    if (view.share.front() == 0) {
        Reject(pool, name, ShareRejectionReason::Malformed, "Share evaluation point must be non-zero");
        return VerdictResult::Ok(Verdict::Rejected);
    }

    if (view.header.threshold != state.DeclaredThreshold()) {
        CHACHAMIR_TRY(ResolveThreshold(
            ThresholdConflict{name, state.DeclaredThreshold(), view.header.threshold}, state));
    }

    const auto issues = binder_.CrossCheckShare(file_header, view.header, view.share);
    for (const auto issue : issues) {
        SignatureWarning warning{name, issue, std::nullopt, std::nullopt};
        if (file_header.signature_block.has_value()) {
            warning.file_public_key = file_header.signature_block->public_key;
        }
        if (view.header.signature_block.has_value()) {
            warning.share_public_key = view.header.signature_block->public_key;
        }
        pool.report.warnings.push_back(warning);

        // Signed state disagreeing between file and share is only ever reported.
        if (issue == SignatureIssue::FileNotSigned || issue == SignatureIssue::ShareNotSigned) {
            events_.OnSignatureWarning(warning);
            continue;
        }
        CHACHAMIR_TRY(ApplySignaturePolicy(warning));
    }

    std::vector<uint8_t> share(view.share.begin(), view.share.end());
    events_.OnShareAccepted(name);
    if (issues.empty()) {
        pool.shares.push_back(std::move(share));
        pool.report.accepted.push_back(name);
        return VerdictResult::Ok(Verdict::Accepted);
    }
    flagged_shares.push_back(std::move(share));
    pool.report.flagged.push_back(name);
    return VerdictResult::Ok(Verdict::Flagged);
}

Result<Unit, ChachamirFailure> ShareReconciliation::ResolveThreshold(
    const ThresholdConflict& conflict,
    ReconciliationState& state) {
    using UnitResult = Result<Unit, ChachamirFailure>;

    ThresholdDecision decision;
    switch (config_.threshold_policy) {
        case ThresholdMismatchPolicy::UseFile:
            decision = ThresholdDecision::UseFile();
            break;
        case ThresholdMismatchPolicy::UseOverride:
            if (!config_.threshold_override.has_value()) {
                return UnitResult::Err(ChachamirFailure::Configuration(
                    "Threshold policy 'override' needs an override threshold"));
            }
            decision = ThresholdDecision::Override(static_cast<uint8_t>(*config_.threshold_override));
            break;
        case ThresholdMismatchPolicy::Abort:
            return UnitResult::Err(ChachamirFailure::ThresholdMismatch(
                compat::format("Threshold mismatch from share {} (file: {}, share: {})",
                    conflict.label, conflict.file_threshold, conflict.share_threshold)));
        case ThresholdMismatchPolicy::Ask:
            decision = policy_.ResolveThresholdMismatch(conflict);
            break;
    }

    if (decision.kind == ThresholdDecisionKind::Abort) {
        return UnitResult::Err(ChachamirFailure::Aborted(std::string(ErrorMessages::OPERATOR_ABORT)));
    }
    if (decision.kind == ThresholdDecisionKind::UseOverride &&
        decision.override_threshold < SharingConstants::MIN_THRESHOLD) {
        return UnitResult::Err(ChachamirFailure::Configuration("Override threshold cannot be zero"));
    }

    state.Record(ThresholdResolution{conflict, decision, 0});
    events_.OnThresholdResolved(state.History().back());
    return UnitResult::Ok(unit);
}

Result<Unit, ChachamirFailure> ShareReconciliation::ApplySignaturePolicy(const SignatureWarning& warning) {
    events_.OnSignatureWarning(warning);
    if (config_.strict) {
        return Result<Unit, ChachamirFailure>::Err(ChachamirFailure::SignatureMismatch(
            compat::format("{} ({}): {}", ErrorMessages::STRICT_ABORT, warning.label,
                models::SignatureIssueDescription(warning.issue))));
    }
    if (!policy_.ConfirmContinue(warning)) {
        return Result<Unit, ChachamirFailure>::Err(
            ChachamirFailure::Aborted(std::string(ErrorMessages::OPERATOR_ABORT)));
    }
    return Result<Unit, ChachamirFailure>::Ok(unit);
}

void ShareReconciliation::Reject(
    SharePool& pool,
    std::string label,
    const ShareRejectionReason reason,
    std::string detail) {
    pool.report.rejected.push_back(ShareRejection{std::move(label), reason, std::move(detail)});
    events_.OnShareRejected(pool.report.rejected.back());
}
}
