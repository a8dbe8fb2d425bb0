#pragma once
#include "chachamir/interfaces/i_container_event_handler.hpp"
#include <ostream>
namespace chachamir::cli {

/**
 * Prints container events for an operator.
 *
 *   [-] progress        [%] share accepted     [^] share skipped
 *   [#] needs attention (threshold and signature problems)
 *
 * Progress goes to out, everything else to err. Candidates skipped only
 * because of their name are not printed.
 */
class ConsoleEventHandler final : public interfaces::IContainerEventHandler {
public:
    ConsoleEventHandler(std::ostream& out, std::ostream& err) noexcept;

    void OnStage(std::string_view message) override;
    void OnShareAccepted(const std::string& label) override;
    void OnShareRejected(const models::ShareRejection& rejection) override;
    void OnThresholdResolved(const models::ThresholdResolution& resolution) override;
    void OnSignatureWarning(const models::SignatureWarning& warning) override;

private:
    std::ostream& out_;
    std::ostream& err_;
};
}
