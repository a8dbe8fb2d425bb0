#pragma once
#include "chachamir/core/result.hpp"
#include "chachamir/core/failures.hpp"
#include "chachamir/configuration/container_config.hpp"
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
namespace chachamir::cli {

enum class CommandKind : uint8_t {
    Encrypt,
    Decrypt,
    Licenses,
    Help,
    Version
};

struct CliOptions {
    CommandKind command = CommandKind::Help;
    std::filesystem::path file;
    std::optional<std::filesystem::path> share_dir;
    configuration::EncryptConfig encrypt;
    configuration::DecryptConfig decrypt;
};

/**
 * @brief Parses the command line, program name excluded
 *
 *   encrypt <file> <players> <threshold> [-s|--share-dir DIR] [--sign]
 *   decrypt <file> [-a|--all] [-s|--share-dir DIR] [--strict]
 *                  [--threshold-policy ask|file|override|abort] [--threshold N]
 *   licenses
 *   --help | --version
 *
 * Options may follow positionals in any order. --threshold without an
 * explicit policy selects the override policy. Ranges are not checked
 * here; EncryptConfig/DecryptConfig::Validate() does that.
 */
[[nodiscard]] Result<CliOptions, ChachamirFailure> ParseArguments(std::span<const std::string_view> args);

[[nodiscard]] std::string UsageText();
}
