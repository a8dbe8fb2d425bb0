#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
namespace chachamir::utilities {

/// Guesses a MIME type from leading magic bytes. Only used to tell the
/// operator what a recovered file probably is.
class ContentSniffer {
public:
    [[nodiscard]] static std::optional<std::string_view> Detect(std::span<const uint8_t> content);

    /// Detect(), or a fixed placeholder when nothing matched.
    [[nodiscard]] static std::string_view Describe(std::span<const uint8_t> content);

    static constexpr std::string_view UNKNOWN_CONTENT = "unknown (text? binary?)";

private:
    ContentSniffer() = delete;
};
}
