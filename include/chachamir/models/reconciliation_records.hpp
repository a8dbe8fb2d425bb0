#pragma once
#include "chachamir/models/container_headers.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
namespace chachamir::models {

enum class ShareRejectionReason : uint8_t {
    NotCandidate,
    Unreadable,
    Malformed,
    NotAShare,
    WrongFile
};

struct ShareRejection {
    std::string label;
    ShareRejectionReason reason;
    std::string detail;
};

enum class SignatureIssue : uint8_t {
    ShareNotSigned,
    FileNotSigned,
    PublicKeyMismatch,
    ShareSignatureInvalid,
    FileSignatureInvalid
};

/// A signature problem surfaced to the operator. Keys are filled in when
/// the containers involved carry them.
struct SignatureWarning {
    std::string label;
    SignatureIssue issue;
    std::optional<PublicKeyBytes> file_public_key;
    std::optional<PublicKeyBytes> share_public_key;
};

struct ThresholdConflict {
    std::string label;
    uint8_t file_threshold;
    uint8_t share_threshold;
};

enum class ThresholdDecisionKind : uint8_t {
    UseFileThreshold,
    UseOverride,
    Abort
};

struct ThresholdDecision {
    ThresholdDecisionKind kind = ThresholdDecisionKind::UseFileThreshold;
    uint8_t override_threshold = 0;

    static ThresholdDecision UseFile() noexcept {
        return {ThresholdDecisionKind::UseFileThreshold, 0};
    }
    static ThresholdDecision Override(const uint8_t threshold) noexcept {
        return {ThresholdDecisionKind::UseOverride, threshold};
    }
    static ThresholdDecision AbortOperation() noexcept {
        return {ThresholdDecisionKind::Abort, 0};
    }
};

struct ThresholdResolution {
    ThresholdConflict conflict;
    ThresholdDecision decision;
    uint8_t effective_threshold;
};

[[nodiscard]] constexpr std::string_view RejectionReasonName(const ShareRejectionReason reason) noexcept {
    switch (reason) {
        case ShareRejectionReason::NotCandidate: return "not a share candidate";
        case ShareRejectionReason::Unreadable: return "unreadable";
        case ShareRejectionReason::Malformed: return "malformed share";
        case ShareRejectionReason::NotAShare: return "not a share";
        case ShareRejectionReason::WrongFile: return "share belongs to another file";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view SignatureIssueDescription(const SignatureIssue issue) noexcept {
    switch (issue) {
        case SignatureIssue::ShareNotSigned:
            return "Share is not signed, its integrity cannot be verified";
        case SignatureIssue::FileNotSigned:
            return "Encrypted file is not signed, but this share believes it should be";
        case SignatureIssue::PublicKeyMismatch:
            return "File and share do not use the same public key";
        case SignatureIssue::ShareSignatureInvalid:
            return "Share verification from public key failed";
        case SignatureIssue::FileSignatureInvalid:
            return "Signature verification against file's public key failed";
    }
    return "Unknown signature issue";
}

}
