#pragma once
#include "chachamir/core/result.hpp"
#include "chachamir/core/failures.hpp"
#include "chachamir/interfaces/i_share_source.hpp"
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>
namespace chachamir::utilities {

/// Whole-file reads and writes. Every failure is an Io failure naming the path.
class FileStore {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ChachamirFailure> Read(const std::filesystem::path& path);

    /// Creates or truncates path.
    [[nodiscard]] static Result<Unit, ChachamirFailure> Write(
        const std::filesystem::path& path,
        std::span<const uint8_t> contents);

    /// File names (not paths) of the regular files directly inside directory, sorted.
    [[nodiscard]] static Result<std::vector<std::string>, ChachamirFailure> ListRegularFiles(
        const std::filesystem::path& directory);

private:
    FileStore() = delete;
};

/// Share source over the files of one directory. Files are read on demand.
class DirectoryShareSource final : public interfaces::IShareSource {
public:
    explicit DirectoryShareSource(std::filesystem::path directory);

    [[nodiscard]] Result<std::vector<std::string>, ChachamirFailure> ListCandidates() override;
    [[nodiscard]] Result<std::vector<uint8_t>, ChachamirFailure> Load(const std::string& name) override;

    [[nodiscard]] const std::filesystem::path& Directory() const noexcept { return directory_; }

private:
    std::filesystem::path directory_;
};
}
