#include "chachamir/cli/arguments.hpp"
#include "chachamir/core/format.hpp"
#include <charconv>
#include <vector>

namespace chachamir::cli {
using configuration::ThresholdMismatchPolicy;

namespace {
    Result<uint32_t, ChachamirFailure> ParseCount(const std::string_view text, const std::string_view what) {
        uint32_t value = 0;
        const auto* first = text.data();
        const auto* last = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(first, last, value);
        if (text.empty() || ec != std::errc() || ptr != last) {
            return Result<uint32_t, ChachamirFailure>::Err(ChachamirFailure::Configuration(
                compat::format("'{}' is not a valid {}", text, what)));
        }
        return Result<uint32_t, ChachamirFailure>::Ok(value);
    }

    Result<std::string_view, ChachamirFailure> TakeValue(
        std::span<const std::string_view> args,
        size_t& index,
        const std::string_view option) {
        if (index + 1 >= args.size()) {
            return Result<std::string_view, ChachamirFailure>::Err(ChachamirFailure::Configuration(
                compat::format("Option {} needs a value", option)));
        }
        ++index;
        return Result<std::string_view, ChachamirFailure>::Ok(args[index]);
    }

    Result<Unit, ChachamirFailure> ExpectPositionals(
        const std::vector<std::string_view>& positionals,
        const size_t expected,
        const std::string_view command) {
        if (positionals.size() != expected) {
            return Result<Unit, ChachamirFailure>::Err(ChachamirFailure::Configuration(
                compat::format("'{}' takes {} argument(s), got {}", command, expected, positionals.size())));
        }
        return Result<Unit, ChachamirFailure>::Ok(unit);
    }
}

Result<CliOptions, ChachamirFailure> ParseArguments(std::span<const std::string_view> args) {
    using OptionsResult = Result<CliOptions, ChachamirFailure>;

    if (args.empty()) {
        return OptionsResult::Err(ChachamirFailure::Configuration("No command given"));
    }

    CliOptions options;
    const std::string_view command = args.front();
    if (command == "--help" || command == "-h" || command == "help") {
        options.command = CommandKind::Help;
        return OptionsResult::Ok(std::move(options));
    }
    if (command == "--version" || command == "-V") {
        options.command = CommandKind::Version;
        return OptionsResult::Ok(std::move(options));
    }
    if (command == "licenses") {
        options.command = CommandKind::Licenses;
        return OptionsResult::Ok(std::move(options));
    }
    if (command == "encrypt") {
        options.command = CommandKind::Encrypt;
    } else if (command == "decrypt") {
        options.command = CommandKind::Decrypt;
    } else {
        return OptionsResult::Err(ChachamirFailure::Configuration(
            compat::format("Unknown command '{}'", command)));
    }

    const bool encrypting = options.command == CommandKind::Encrypt;
    bool policy_given = false;
    std::vector<std::string_view> positionals;
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string_view arg = args[i];
        if (arg == "-s" || arg == "--share-dir") {
            auto value = TakeValue(args, i, arg);
            if (value.IsErr()) {
                return PropagateErr(std::move(value).UnwrapErr());
            }
            options.share_dir = std::filesystem::path(std::string(value.Unwrap()));
        } else if (encrypting && arg == "--sign") {
            options.encrypt.sign = true;
        } else if (!encrypting && (arg == "-a" || arg == "--all")) {
            options.decrypt.accept_all_files = true;
        } else if (!encrypting && arg == "--strict") {
            options.decrypt.strict = true;
        } else if (!encrypting && arg == "--threshold-policy") {
            auto value = TakeValue(args, i, arg);
            if (value.IsErr()) {
                return PropagateErr(std::move(value).UnwrapErr());
            }
            const auto policy = configuration::ParseThresholdMismatchPolicy(value.Unwrap());
            if (!policy.has_value()) {
                return OptionsResult::Err(ChachamirFailure::Configuration(
                    compat::format("Unknown threshold policy '{}'", value.Unwrap())));
            }
            options.decrypt.threshold_policy = *policy;
            policy_given = true;
        } else if (!encrypting && arg == "--threshold") {
            auto value = TakeValue(args, i, arg);
            if (value.IsErr()) {
                return PropagateErr(std::move(value).UnwrapErr());
            }
            auto threshold = ParseCount(value.Unwrap(), "threshold");
            if (threshold.IsErr()) {
                return PropagateErr(std::move(threshold).UnwrapErr());
            }
            options.decrypt.threshold_override = threshold.Unwrap();
        } else if (arg.size() > 1 && arg.front() == '-') {
            return OptionsResult::Err(ChachamirFailure::Configuration(
                compat::format("Unknown option '{}' for '{}'", arg, command)));
        } else {
            positionals.push_back(arg);
        }
    }

    if (encrypting) {
        CHACHAMIR_TRY(ExpectPositionals(positionals, 3, command));
        auto players = ParseCount(positionals[1], "number of players");
        if (players.IsErr()) {
            return PropagateErr(std::move(players).UnwrapErr());
        }
        auto threshold = ParseCount(positionals[2], "threshold");
        if (threshold.IsErr()) {
            return PropagateErr(std::move(threshold).UnwrapErr());
        }
        options.encrypt.players = players.Unwrap();
        options.encrypt.threshold = threshold.Unwrap();
    } else {
        CHACHAMIR_TRY(ExpectPositionals(positionals, 1, command));
        if (options.decrypt.threshold_override.has_value() && !policy_given) {
            options.decrypt.threshold_policy = ThresholdMismatchPolicy::UseOverride;
        }
    }
    options.file = std::filesystem::path(std::string(positionals[0]));
    return OptionsResult::Ok(std::move(options));
}

std::string UsageText() {
    return
        "Usage:\n"
        "  chachamir encrypt <file> <players> <threshold> [-s|--share-dir DIR] [--sign]\n"
        "  chachamir decrypt <file> [-a|--all] [-s|--share-dir DIR] [--strict]\n"
        "                           [--threshold-policy ask|file|override|abort] [--threshold N]\n"
        "  chachamir licenses\n"
        "  chachamir --help | --version\n"
        "\n"
        "encrypt   Encrypt <file> into <file>.ccm and split its key into <players> shares,\n"
        "          any <threshold> of which recover it. --sign binds the file and every\n"
        "          share to a one-time Ed25519 key.\n"
        "decrypt   Recover the key from the shares in the share directory and decrypt.\n"
        "          --all considers every file, not only *.ccms. --strict aborts on any\n"
        "          signature problem instead of asking.\n"
        "licenses  Print license information.\n";
}
}
