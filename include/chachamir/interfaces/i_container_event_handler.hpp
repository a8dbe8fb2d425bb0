#pragma once
#include "chachamir/models/reconciliation_records.hpp"
#include <string>
#include <string_view>
namespace chachamir::interfaces {

/// Receives progress and diagnostics from the container system. Handlers
/// only observe; decisions go through IReconciliationPolicy.
class IContainerEventHandler {
public:
    virtual ~IContainerEventHandler() = default;
    virtual void OnStage(std::string_view message) = 0;
    virtual void OnShareAccepted(const std::string& label) = 0;
    virtual void OnShareRejected(const models::ShareRejection& rejection) = 0;
    virtual void OnThresholdResolved(const models::ThresholdResolution& resolution) = 0;
    virtual void OnSignatureWarning(const models::SignatureWarning& warning) = 0;
};

class NullContainerEventHandler final : public IContainerEventHandler {
public:
    void OnStage(std::string_view) override {}
    void OnShareAccepted(const std::string&) override {}
    void OnShareRejected(const models::ShareRejection&) override {}
    void OnThresholdResolved(const models::ThresholdResolution&) override {}
    void OnSignatureWarning(const models::SignatureWarning&) override {}
};
}
