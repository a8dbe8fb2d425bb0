#include "chachamir/cli/commands.hpp"
#include "chachamir/cli/console_event_handler.hpp"
#include "chachamir/cli/console_policy.hpp"
#include "chachamir/container/container_system.hpp"
#include "chachamir/crypto/sodium_interop.hpp"
#include "chachamir/utilities/content_sniffer.hpp"
#include "chachamir/utilities/file_store.hpp"
#include "chachamir/core/constants.hpp"
#include "chachamir/version.hpp"
#include <string>

namespace chachamir::cli {
using utilities::FileStore;

namespace {
    int Fail(std::ostream& err, const ChachamirFailure& failure) {
        err << std::endl;
        err << "[!] " << FailureTypeName(failure.type) << ": " << failure.message << std::endl;
        err << "[!] Aborting" << std::endl;
        return EXIT_FAILURE_STATUS;
    }

    constexpr std::string_view kDecryptedSuffix = ".decrypted";

    constexpr std::string_view kLicenseText =
        "chachamir is provided as is, without warranty of any kind.\n"
        "See the LICENSE file shipped with this program for the terms of use.\n";

    constexpr std::string_view kDependencyLicenses =
        "libsodium   ISC License       Copyright (c) 2013-2024 Frank Denis\n"
        "{fmt}       MIT License       Copyright (c) 2012-present Victor Zverovich\n";
}

void PrintBanner(std::ostream& out) {
    out << "  ___  _  _   __    ___  _  _   __   _  _  __  ____ " << std::endl;
    out << " / __)/ )( \\ / _\\  / __)/ )( \\ / _\\ ( \\/ )(  )(  _ \\" << std::endl;
    out << "( (__ ) __ (/    \\( (__ ) __ (/    \\/ \\/ \\ )(  )   /" << std::endl;
    out << " \\___)\\_)(_/\\_/\\_/ \\___)\\_)(_/\\_/\\_/\\_)(_/(__)(__\\_)" << std::endl;
    out << "----" << std::endl;
    out << "version " << VERSION << std::endl;
    out << std::endl;
}

void PrintLicenses(std::ostream& out) {
    out << kLicenseText << std::endl;
    out << "---" << std::endl;
    out << "Dependency licenses" << std::endl;
    out << "---" << std::endl;
    out << std::endl;
    out << kDependencyLicenses << std::endl;
}

std::filesystem::path EncryptedPathFor(const std::filesystem::path& target) {
    auto encrypted = target;
    encrypted += std::string(ContainerConstants::ENCRYPTED_FILE_EXTENSION);
    return encrypted;
}

std::filesystem::path DecryptedPathFor(const std::filesystem::path& encrypted) {
    const std::string name = encrypted.string();
    const auto extension = ContainerConstants::ENCRYPTED_FILE_EXTENSION;
    if (name.size() > extension.size() && std::string_view(name).ends_with(extension)) {
        return std::filesystem::path(name.substr(0, name.size() - extension.size()));
    }
    auto decrypted = encrypted;
    decrypted += std::string(kDecryptedSuffix);
    return decrypted;
}

int RunEncrypt(const CliOptions& options, std::istream& in, std::ostream& out, std::ostream& err) {
    out << "[*] Chose to encrypt a file..." << std::endl;
    out << std::endl;

    if (auto valid = options.encrypt.Validate(); valid.IsErr()) {
        return Fail(err, valid.UnwrapErr());
    }

    out << "[+] File: " << options.file.string() << std::endl;
    auto share_dir = ResolveShareDirectory(options.share_dir, in, out);
    if (share_dir.IsErr()) {
        return Fail(err, share_dir.UnwrapErr());
    }
    const auto& shares_dir = share_dir.Unwrap();
    out << "[+] Storing shares at " << shares_dir.string() << std::endl;

    // Read first so an unreadable target never leaves orphaned shares behind.
    auto plaintext = FileStore::Read(options.file);
    if (plaintext.IsErr()) {
        return Fail(err, plaintext.UnwrapErr());
    }

    ConsoleEventHandler events(out, err);
    const auto system = container::ContainerSystem::CreateDefault();
    auto bundle_result = system->Encrypt(plaintext.Unwrap(), options.encrypt, events);
    { auto __wipe = crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(plaintext.Unwrap())); (void)__wipe; }
    if (bundle_result.IsErr()) {
        return Fail(err, bundle_result.UnwrapErr());
    }
    const auto& bundle = bundle_result.Unwrap();

    out << std::endl;
    for (const auto& share : bundle.shares) {
        out << "[&] Writing share # " << static_cast<int>(share.index) << "..." << std::endl;
        if (auto written = FileStore::Write(shares_dir / share.file_name, share.bytes); written.IsErr()) {
            return Fail(err, written.UnwrapErr());
        }
    }
    out << std::endl;

    const auto encrypted_path = EncryptedPathFor(options.file);
    if (auto written = FileStore::Write(encrypted_path, bundle.file_container); written.IsErr()) {
        return Fail(err, written.UnwrapErr());
    }
    out << "[&] Encrypted file written to " << encrypted_path.string() << std::endl;
    out << std::endl;
    out << "[*] Encryption complete! Have a nice day." << std::endl;
    return EXIT_OK;
}

int RunDecrypt(const CliOptions& options, std::istream& in, std::ostream& out, std::ostream& err) {
    out << "[*] Chose to decrypt a file..." << std::endl;
    out << std::endl;

    if (auto valid = options.decrypt.Validate(); valid.IsErr()) {
        return Fail(err, valid.UnwrapErr());
    }

    out << "[+] File: " << options.file.string() << std::endl;
    auto share_dir = ResolveShareDirectory(options.share_dir, in, out);
    if (share_dir.IsErr()) {
        return Fail(err, share_dir.UnwrapErr());
    }
    out << "[+] Shares directory: " << share_dir.Unwrap().string() << std::endl;
    out << std::endl;

    auto file_bytes = FileStore::Read(options.file);
    if (file_bytes.IsErr()) {
        return Fail(err, file_bytes.UnwrapErr());
    }

    utilities::DirectoryShareSource source(share_dir.Unwrap());
    ConsolePolicy policy(in, err);
    ConsoleEventHandler events(out, err);
    const auto system = container::ContainerSystem::CreateDefault();
    auto outcome_result = system->Decrypt(file_bytes.Unwrap(), source, options.decrypt, policy, events);
    if (outcome_result.IsErr()) {
        return Fail(err, outcome_result.UnwrapErr());
    }
    auto& outcome = outcome_result.Unwrap();
    const auto& report = outcome.report.shares;

    out << std::endl;
    out << "[+] Shares used: " << report.accepted.size() << " verified, "
        << report.flagged.size() << " flagged, " << report.rejected.size() << " skipped" << std::endl;
    out << "[-] File decrypted -- MIME type: " << utilities::ContentSniffer::Describe(outcome.plaintext) << std::endl;
    out << std::endl;

    const auto decrypted_path = DecryptedPathFor(options.file);
    auto written = FileStore::Write(decrypted_path, outcome.plaintext);
    { auto __wipe = crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(outcome.plaintext)); (void)__wipe; }
    if (written.IsErr()) {
        return Fail(err, written.UnwrapErr());
    }
    out << "[&] Decrypted file written to " << decrypted_path.string() << std::endl;
    out << std::endl;
    out << "[*] Decryption complete! Have a nice day." << std::endl;
    return EXIT_OK;
}

int Run(std::span<const std::string_view> args, std::istream& in, std::ostream& out, std::ostream& err) {
    PrintBanner(out);

    auto parsed = ParseArguments(args);
    if (parsed.IsErr()) {
        err << "[!] " << parsed.UnwrapErr().message << std::endl;
        err << std::endl;
        err << UsageText();
        return EXIT_FAILURE_STATUS;
    }
    const auto& options = parsed.Unwrap();

    switch (options.command) {
        case CommandKind::Help:
            out << UsageText();
            return EXIT_OK;
        case CommandKind::Version:
            return EXIT_OK;
        case CommandKind::Licenses:
            PrintLicenses(out);
            return EXIT_OK;
        case CommandKind::Encrypt:
            return RunEncrypt(options, in, out, err);
        case CommandKind::Decrypt:
            return RunDecrypt(options, in, out, err);
    }
    return EXIT_FAILURE_STATUS;
}
}
