#pragma once
#include "chachamir/core/result.hpp"
#include "chachamir/core/failures.hpp"
#include <cstdint>
#include <string>
#include <vector>
namespace chachamir::interfaces {

/// Named byte blobs that may hold shares, typically the files of one
/// directory. Names only label diagnostics and drive the candidate filter;
/// their content is never inferred from them.
class IShareSource {
public:
    virtual ~IShareSource() = default;
    /// Failing to list is fatal for the operation.
    [[nodiscard]] virtual Result<std::vector<std::string>, ChachamirFailure> ListCandidates() = 0;
    /// Failing to load only excludes that candidate.
    [[nodiscard]] virtual Result<std::vector<uint8_t>, ChachamirFailure> Load(const std::string& name) = 0;
};
}
