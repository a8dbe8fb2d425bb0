#include "chachamir/utilities/content_sniffer.hpp"
#include <algorithm>
#include <array>

namespace chachamir::utilities {
namespace {
    using namespace std::string_view_literals;

    struct MagicSignature {
        size_t offset;
        std::string_view magic;
        std::string_view mime;
    };

    constexpr std::array<MagicSignature, 18> kSignatures = {{
        {0, "\x89PNG\r\n\x1a\n"sv, "image/png"},
        {0, "\xff\xd8\xff"sv, "image/jpeg"},
        {0, "GIF8"sv, "image/gif"},
        {0, "BM"sv, "image/bmp"},
        {0, "%PDF-"sv, "application/pdf"},
        {0, "PK\x03\x04"sv, "application/zip"},
        {0, "\x1f\x8b"sv, "application/gzip"},
        {0, "BZh"sv, "application/x-bzip2"},
        {0, "7z\xbc\xaf\x27\x1c"sv, "application/x-7z-compressed"},
        {0, "\xfd" "7zXZ\0"sv, "application/x-xz"},
        {0, "\x28\xb5\x2f\xfd"sv, "application/zstd"},
        {0, "\x7f" "ELF"sv, "application/x-executable"},
        {0, "ID3"sv, "audio/mpeg"},
        {0, "OggS"sv, "audio/ogg"},
        {0, "fLaC"sv, "audio/x-flac"},
        {0, "SQLite format 3\0"sv, "application/vnd.sqlite3"},
        {4, "ftyp"sv, "video/mp4"},
        {257, "ustar"sv, "application/x-tar"},
    }};

    bool Matches(std::span<const uint8_t> content, const size_t offset, const std::string_view magic) {
        if (content.size() < offset + magic.size()) {
            return false;
        }
        return std::equal(magic.begin(), magic.end(), content.begin() + static_cast<std::ptrdiff_t>(offset),
            [](const char expected, const uint8_t actual) {
                return static_cast<uint8_t>(expected) == actual;
            });
    }

    // RIFF containers share a prefix; the form type at offset 8 tells them apart.
    std::optional<std::string_view> DetectRiff(std::span<const uint8_t> content) {
        if (!Matches(content, 0, "RIFF"sv)) {
            return std::nullopt;
        }
        if (Matches(content, 8, "WEBP"sv)) {
            return "image/webp"sv;
        }
        if (Matches(content, 8, "WAVE"sv)) {
            return "audio/x-wav"sv;
        }
        if (Matches(content, 8, "AVI "sv)) {
            return "video/x-msvideo"sv;
        }
        return std::nullopt;
    }
}

std::optional<std::string_view> ContentSniffer::Detect(std::span<const uint8_t> content) {
    if (auto riff = DetectRiff(content)) {
        return riff;
    }
    for (const auto& signature : kSignatures) {
        if (Matches(content, signature.offset, signature.magic)) {
            return signature.mime;
        }
    }
    return std::nullopt;
}

std::string_view ContentSniffer::Describe(std::span<const uint8_t> content) {
    return Detect(content).value_or(UNKNOWN_CONTENT);
}
}
