#include "chachamir/cli/console_policy.hpp"
#include "chachamir/core/constants.hpp"
#include <charconv>
#include <string>
#include <system_error>

namespace chachamir::cli {
using models::ThresholdDecision;

namespace {
    std::optional<std::string> ReadLine(std::istream& in) {
        std::string line;
        if (!std::getline(in, line)) {
            return std::nullopt;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return line;
    }
}

ConsolePolicy::ConsolePolicy(std::istream& in, std::ostream& err) noexcept
    : in_(in)
    , err_(err) {
}

ThresholdDecision ConsolePolicy::ResolveThresholdMismatch(const models::ThresholdConflict& conflict) {
    err_ << std::endl;
    err_ << "[#] Threshold mismatch from share " << conflict.label << std::endl;
    err_ << "[#] File:  " << static_cast<int>(conflict.file_threshold) << std::endl;
    err_ << "[#] Share: " << static_cast<int>(conflict.share_threshold) << std::endl;
    err_ << "[#] Would you like to continue?" << std::endl;
    err_ << "[#] If so, which threshold should we use?" << std::endl;
    err_ << "[#] (provide threshold to use instead; empty for file's threshold; anything else aborts)" << std::endl;

    const auto answer = ReadLine(in_);
    if (!answer.has_value()) {
        return ThresholdDecision::AbortOperation();
    }
    if (answer->empty()) {
        err_ << "[#] Okay. Continuing..." << std::endl;
        return ThresholdDecision::UseFile();
    }

    unsigned int threshold = 0;
    const auto* last = answer->data() + answer->size();
    const auto [ptr, ec] = std::from_chars(answer->data(), last, threshold);
    if (ec != std::errc() || ptr != last ||
        threshold < SharingConstants::MIN_THRESHOLD || threshold > SharingConstants::MAX_PLAYERS) {
        err_ << "[!] That's not a threshold number" << std::endl;
        return ThresholdDecision::AbortOperation();
    }
    return ThresholdDecision::Override(static_cast<uint8_t>(threshold));
}

bool ConsolePolicy::ConfirmContinue(const models::SignatureWarning&) {
    err_ << std::endl;
    err_ << "[#] Are you certain you wish to continue?" << std::endl;
    err_ << "[#] (Enter to continue; anything else aborts)" << std::endl;

    const auto answer = ReadLine(in_);
    if (!answer.has_value()) {
        return false;
    }
    return answer->empty() || *answer == "y" || *answer == "yes";
}

Result<std::filesystem::path, ChachamirFailure> ResolveShareDirectory(
    const std::optional<std::filesystem::path>& provided,
    std::istream& in,
    std::ostream& out) {
    using PathResult = Result<std::filesystem::path, ChachamirFailure>;

    if (provided.has_value()) {
        return PathResult::Ok(*provided);
    }

    std::error_code ec;
    auto default_dir = std::filesystem::current_path(ec);
    if (ec) {
        return PathResult::Err(ChachamirFailure::Io(
            "Could not determine the current working directory: " + ec.message()));
    }

    out << "[+] Shares directory not provided... using current working directory" << std::endl;
    out << std::endl;
    out << "[#] Would you like to continue," << std::endl;
    out << "[#] using " << default_dir.string() << " as the share directory?" << std::endl;
    out << "[#] (provide path to use that instead; empty for default)" << std::endl;

    const auto answer = ReadLine(in);
    if (!answer.has_value()) {
        return PathResult::Err(ChachamirFailure::Aborted(std::string(ErrorMessages::OPERATOR_ABORT)));
    }
    if (answer->empty()) {
        return PathResult::Ok(std::move(default_dir));
    }
    return PathResult::Ok(std::filesystem::path(*answer));
}
}
