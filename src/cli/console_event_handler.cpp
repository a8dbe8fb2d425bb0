#include "chachamir/cli/console_event_handler.hpp"
#include "chachamir/debug/hex.hpp"

namespace chachamir::cli {
using models::ShareRejectionReason;
using models::SignatureIssue;
using models::ThresholdDecisionKind;

ConsoleEventHandler::ConsoleEventHandler(std::ostream& out, std::ostream& err) noexcept
    : out_(out)
    , err_(err) {
}

void ConsoleEventHandler::OnStage(const std::string_view message) {
    out_ << "[-] " << message << std::endl;
}

void ConsoleEventHandler::OnShareAccepted(const std::string& label) {
    out_ << "[%] Share retrieved from " << label << std::endl;
}

void ConsoleEventHandler::OnShareRejected(const models::ShareRejection& rejection) {
    if (rejection.reason == ShareRejectionReason::NotCandidate) {
        return;
    }
    err_ << "[^] Skipping " << rejection.label << " | "
         << models::RejectionReasonName(rejection.reason) << ": " << rejection.detail << std::endl;
}

void ConsoleEventHandler::OnThresholdResolved(const models::ThresholdResolution& resolution) {
    err_ << "[#] Threshold mismatch from share " << resolution.conflict.label
         << " (file: " << static_cast<int>(resolution.conflict.file_threshold)
         << ", share: " << static_cast<int>(resolution.conflict.share_threshold) << ")" << std::endl;
    if (resolution.decision.kind == ThresholdDecisionKind::UseOverride) {
        err_ << "[#] Using threshold of " << static_cast<int>(resolution.effective_threshold)
             << " -- this might fail!" << std::endl;
    } else {
        err_ << "[#] Keeping the file's threshold of " << static_cast<int>(resolution.effective_threshold)
             << std::endl;
    }
}

void ConsoleEventHandler::OnSignatureWarning(const models::SignatureWarning& warning) {
    err_ << std::endl;
    if (warning.issue == SignatureIssue::FileSignatureInvalid) {
        err_ << "[#] Signing mismatch with encrypted file!" << std::endl;
    } else {
        err_ << "[#] Signing mismatch from share " << warning.label << std::endl;
    }
    err_ << "[#] " << models::SignatureIssueDescription(warning.issue) << std::endl;
    if (warning.file_public_key.has_value()) {
        err_ << "[#] File public key:  " << debug::ToHex(*warning.file_public_key) << std::endl;
    }
    if (warning.share_public_key.has_value()) {
        err_ << "[#] Share public key: " << debug::ToHex(*warning.share_public_key) << std::endl;
    }
    if (warning.issue == SignatureIssue::FileSignatureInvalid) {
        err_ << "[#] -----------------------------------------------------" << std::endl;
        err_ << "[#] WARNING: THIS FILE MAY BE CORRUPTED OR TAMPERED WITH " << std::endl;
        err_ << "[#] -----------------------------------------------------" << std::endl;
    }
}
}
