#pragma once
#include "chachamir/core/result.hpp"
#include "chachamir/core/failures.hpp"
#include "chachamir/interfaces/i_reconciliation_policy.hpp"
#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>
namespace chachamir::cli {

/// Answers reconciliation questions by prompting on a terminal. Closed
/// input counts as declining.
class ConsolePolicy final : public interfaces::IReconciliationPolicy {
public:
    ConsolePolicy(std::istream& in, std::ostream& err) noexcept;

    /// Empty line keeps the file's threshold, a number overrides it, anything else aborts.
    models::ThresholdDecision ResolveThresholdMismatch(const models::ThresholdConflict& conflict) override;

    /// Empty line or "y"/"yes" continues.
    bool ConfirmContinue(const models::SignatureWarning& warning) override;

private:
    std::istream& in_;
    std::ostream& err_;
};

/**
 * @brief Picks the share directory
 *
 * Returns provided when set. Otherwise offers the current working
 * directory; an entered path replaces it and closed input aborts.
 */
[[nodiscard]] Result<std::filesystem::path, ChachamirFailure> ResolveShareDirectory(
    const std::optional<std::filesystem::path>& provided,
    std::istream& in,
    std::ostream& out);
}
