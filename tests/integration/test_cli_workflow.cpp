#include <catch2/catch_test_macros.hpp>
#include "chachamir/cli/commands.hpp"
#include "chachamir/crypto/sodium_interop.hpp"
#include "chachamir/utilities/file_store.hpp"
#include "../helpers/container_fixtures.hpp"
#include "../helpers/temp_directory.hpp"
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

using namespace chachamir;
using namespace chachamir::cli;
using namespace chachamir::crypto;
using namespace chachamir::test_helpers;
using utilities::FileStore;

namespace {
    struct CliRun {
        int status = -1;
        std::string out;
        std::string err;
    };

    CliRun RunCli(const std::vector<std::string>& args, const std::string& input = "") {
        std::vector<std::string_view> views(args.begin(), args.end());
        std::istringstream in(input);
        std::ostringstream out;
        std::ostringstream err;
        CliRun run;
        run.status = Run(views, in, out, err);
        run.out = out.str();
        run.err = err.str();
        return run;
    }

    size_t CountShareFiles(const std::filesystem::path& directory) {
        size_t count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(directory)) {
            if (entry.path().extension() == ".ccms") {
                ++count;
            }
        }
        return count;
    }
}

TEST_CASE("CLI Workflow - Encrypt then decrypt on disk", "[integration][cli]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory workspace;
    const auto shares_dir = workspace / "shares";
    std::filesystem::create_directories(shares_dir);
    const auto target = workspace / "secret.txt";
    const std::string text = "the quick brown fox jumps over the lazy dog\n";
    const std::vector<uint8_t> plaintext(text.begin(), text.end());
    REQUIRE(FileStore::Write(target, plaintext).IsOk());

    SECTION("Signed five of three") {
        auto encrypted = RunCli({"encrypt", target.string(), "5", "3", "-s", shares_dir.string(), "--sign"});
        REQUIRE(encrypted.status == EXIT_OK);
        REQUIRE(encrypted.out.find("Encryption complete") != std::string::npos);
        REQUIRE(std::filesystem::exists(workspace / "secret.txt.ccm"));
        REQUIRE(CountShareFiles(shares_dir) == 5);

        std::filesystem::remove(target);
        // Two players lose their shares.
        size_t removed = 0;
        for (const auto& entry : std::filesystem::directory_iterator(shares_dir)) {
            if (removed < 2) {
                std::filesystem::remove(entry.path());
                ++removed;
            }
        }
        REQUIRE(CountShareFiles(shares_dir) == 3);

        auto decrypted = RunCli({"decrypt", (workspace / "secret.txt.ccm").string(),
            "--share-dir", shares_dir.string(), "--strict"});
        REQUIRE(decrypted.status == EXIT_OK);
        REQUIRE(decrypted.out.find("Decryption complete") != std::string::npos);
        REQUIRE(decrypted.out.find("MIME type") != std::string::npos);
        REQUIRE(FileStore::Read(target).Unwrap() == plaintext);
    }

    SECTION("Too few shares fails without writing output") {
        REQUIRE(RunCli({"encrypt", target.string(), "3", "3", "-s", shares_dir.string()}).status == EXIT_OK);
        std::filesystem::remove(target);
        std::filesystem::remove(*std::filesystem::directory_iterator(shares_dir));

        auto decrypted = RunCli({"decrypt", (workspace / "secret.txt.ccm").string(), "-s", shares_dir.string()});
        REQUIRE(decrypted.status == EXIT_FAILURE_STATUS);
        REQUIRE(decrypted.err.find("InsufficientShares") != std::string::npos);
        REQUIRE_FALSE(std::filesystem::exists(target));
    }

    SECTION("Default share directory is confirmed on stdin") {
        const auto previous = std::filesystem::current_path();
        std::filesystem::current_path(shares_dir);
        auto encrypted = RunCli({"encrypt", target.string(), "2", "2"}, "\n");
        std::filesystem::current_path(previous);
        REQUIRE(encrypted.status == EXIT_OK);
        REQUIRE(encrypted.out.find("using current working directory") != std::string::npos);
        REQUIRE(CountShareFiles(shares_dir) == 2);
    }

    SECTION("Closed stdin aborts the share directory prompt") {
        auto encrypted = RunCli({"encrypt", target.string(), "2", "2"});
        REQUIRE(encrypted.status == EXIT_FAILURE_STATUS);
        REQUIRE(encrypted.err.find("Operation aborted by operator") != std::string::npos);
        REQUIRE_FALSE(std::filesystem::exists(workspace / "secret.txt.ccm"));
    }

    SECTION("Bad parameters never touch the disk") {
        auto encrypted = RunCli({"encrypt", target.string(), "2", "3", "-s", shares_dir.string()});
        REQUIRE(encrypted.status == EXIT_FAILURE_STATUS);
        REQUIRE(encrypted.err.find("ConfigurationError") != std::string::npos);
        REQUIRE(CountShareFiles(shares_dir) == 0);
    }

    SECTION("Missing target") {
        auto encrypted = RunCli({"encrypt", (workspace / "absent.bin").string(), "2", "2", "-s", shares_dir.string()});
        REQUIRE(encrypted.status == EXIT_FAILURE_STATUS);
        REQUIRE(encrypted.err.find("IoError") != std::string::npos);
        REQUIRE(CountShareFiles(shares_dir) == 0);
    }

    SECTION("Decrypting a plain file") {
        auto decrypted = RunCli({"decrypt", target.string(), "-s", shares_dir.string()});
        REQUIRE(decrypted.status == EXIT_FAILURE_STATUS);
        REQUIRE(decrypted.err.find("Target file failed validation") != std::string::npos);
        REQUIRE_FALSE(std::filesystem::exists(workspace / "secret.txt.decrypted"));
    }
}

TEST_CASE("CLI Workflow - Tampered share prompts the operator", "[integration][cli][signature]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory workspace;
    const auto bundle = MakeBundle(2, 2, true);
    const auto target = workspace / "data.bin.ccm";
    REQUIRE(FileStore::Write(target, bundle.file_container).IsOk());
    REQUIRE(FileStore::Write(workspace / bundle.shares[0].file_name, bundle.shares[0].bytes).IsOk());
    const auto intruder = FreshIdentity();
    REQUIRE(FileStore::Write(workspace / bundle.shares[1].file_name, RewriteShare(bundle.shares[1].bytes,
        [](models::ShareHeader&, std::vector<uint8_t>&) {}, &intruder)).IsOk());

    SECTION("Operator accepts") {
        auto decrypted = RunCli({"decrypt", target.string(), "-s", workspace.Path().string()}, "y\n");
        REQUIRE(decrypted.status == EXIT_OK);
        REQUIRE(decrypted.err.find("Are you certain you wish to continue?") != std::string::npos);
        REQUIRE(decrypted.out.find("1 verified, 1 flagged") != std::string::npos);
        REQUIRE(std::filesystem::exists(workspace / "data.bin"));
    }

    SECTION("Operator declines") {
        auto decrypted = RunCli({"decrypt", target.string(), "-s", workspace.Path().string()}, "no\n");
        REQUIRE(decrypted.status == EXIT_FAILURE_STATUS);
        REQUIRE(decrypted.err.find("Operation aborted by operator") != std::string::npos);
        REQUIRE_FALSE(std::filesystem::exists(workspace / "data.bin"));
    }

    SECTION("Strict mode does not ask") {
        auto decrypted = RunCli({"decrypt", target.string(), "-s", workspace.Path().string(), "--strict"});
        REQUIRE(decrypted.status == EXIT_FAILURE_STATUS);
        REQUIRE(decrypted.err.find("SignatureMismatch") != std::string::npos);
        REQUIRE(decrypted.err.find("Are you certain") == std::string::npos);
    }
}

TEST_CASE("CLI Workflow - Informational commands", "[integration][cli]") {
    SECTION("Licenses") {
        auto run = RunCli({"licenses"});
        REQUIRE(run.status == EXIT_OK);
        REQUIRE(run.out.find("libsodium") != std::string::npos);
    }

    SECTION("Help") {
        auto run = RunCli({"--help"});
        REQUIRE(run.status == EXIT_OK);
        REQUIRE(run.out.find("encrypt") != std::string::npos);
    }

    SECTION("Unknown command prints usage") {
        auto run = RunCli({"shred", "file"});
        REQUIRE(run.status == EXIT_FAILURE_STATUS);
        REQUIRE_FALSE(run.err.empty());
    }
}
