#pragma once
#include "chachamir/cli/arguments.hpp"
#include <filesystem>
#include <istream>
#include <ostream>
#include <span>
#include <string_view>
namespace chachamir::cli {

inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_FAILURE_STATUS = 1;

/// Parses args (program name excluded), prints the banner and runs the command.
int Run(std::span<const std::string_view> args, std::istream& in, std::ostream& out, std::ostream& err);

int RunEncrypt(const CliOptions& options, std::istream& in, std::ostream& out, std::ostream& err);

int RunDecrypt(const CliOptions& options, std::istream& in, std::ostream& out, std::ostream& err);

void PrintBanner(std::ostream& out);

void PrintLicenses(std::ostream& out);

/// target + ".ccm"
[[nodiscard]] std::filesystem::path EncryptedPathFor(const std::filesystem::path& target);

/// target without a trailing ".ccm"; target + ".decrypted" when there is none.
[[nodiscard]] std::filesystem::path DecryptedPathFor(const std::filesystem::path& encrypted);
}
