#pragma once
#include "chachamir/models/reconciliation_records.hpp"
namespace chachamir::interfaces {

/// Operator decisions needed while gathering shares. A console front end
/// prompts; tests and batch callers answer from a script.
class IReconciliationPolicy {
public:
    virtual ~IReconciliationPolicy() = default;
    /// Consulted when a share's recorded threshold disagrees with the file's.
    virtual models::ThresholdDecision ResolveThresholdMismatch(
        const models::ThresholdConflict& conflict) = 0;
    /// Consulted after a signature warning outside strict mode. false aborts.
    virtual bool ConfirmContinue(const models::SignatureWarning& warning) = 0;
};
}
