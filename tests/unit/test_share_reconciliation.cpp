#include <catch2/catch_test_macros.hpp>
#include "chachamir/container/share_reconciliation.hpp"
#include "chachamir/container/key_split_engine.hpp"
#include "chachamir/crypto/ed25519_signature.hpp"
#include "chachamir/crypto/shamir_secret_sharing.hpp"
#include "chachamir/crypto/sodium_interop.hpp"
#include "../helpers/container_fixtures.hpp"
#include "../helpers/memory_share_source.hpp"
#include "../helpers/random_bytes.hpp"
#include "../helpers/scripted_policy.hpp"
#include <algorithm>
using namespace chachamir;
using namespace chachamir::configuration;
using namespace chachamir::container;
using namespace chachamir::crypto;
using namespace chachamir::models;
using namespace chachamir::test_helpers;

namespace {
struct Harness {
    Ed25519Signature scheme;
    SignatureBinder binder{scheme};
    DecryptConfig config = DecryptConfig::Lenient();
    ScriptedPolicy policy;
    RecordingEventHandler events;

    Result<SharePool, ChachamirFailure> Gather(const FileHeader& header, MemoryShareSource& source) {
        ShareReconciliation reconciliation(binder, config, policy, events);
        return reconciliation.Gather(header, source);
    }
};

std::vector<uint8_t> PayloadOf(const std::vector<uint8_t>& share_bytes) {
    const auto view = HeaderCodec::DecodeShareHeader(share_bytes).Unwrap();
    return {view.share.begin(), view.share.end()};
}
}

TEST_CASE("ShareReconciliation - Candidate names", "[container][reconciliation]") {
    SECTION("Only names ending in the share extension") {
        REQUIRE(ShareReconciliation::IsCandidateName("1-00ff.ccms", false));
        REQUIRE_FALSE(ShareReconciliation::IsCandidateName(".ccms", false));
        REQUIRE_FALSE(ShareReconciliation::IsCandidateName("file.ccm", false));
        REQUIRE_FALSE(ShareReconciliation::IsCandidateName("share.ccms.bak", false));
    }
    SECTION("Accept all takes anything") {
        REQUIRE(ShareReconciliation::IsCandidateName("notes.txt", true));
        REQUIRE(ShareReconciliation::IsCandidateName(".ccms", true));
    }
}

TEST_CASE("ShareReconciliation - Gathering", "[container][reconciliation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto bundle = MakeBundle(5, 3, false);
    const auto file_header = FileHeaderOf(bundle);
    Harness harness;
    MemoryShareSource source;
    for (const auto& share : bundle.shares) {
        source.PutShare(share);
    }

    SECTION("All shares of the file are accepted") {
        auto pool = harness.Gather(file_header, source);
        REQUIRE(pool.IsOk());
        REQUIRE(pool.Unwrap().shares.size() == 5);
        REQUIRE(pool.Unwrap().report.accepted.size() == 5);
        REQUIRE(pool.Unwrap().report.rejected.empty());
        REQUIRE(pool.Unwrap().report.declared_threshold == 3);
        REQUIRE(pool.Unwrap().report.effective_threshold == 3);
        REQUIRE(harness.events.accepted.size() == 5);
    }

    SECTION("Names outside the filter are skipped") {
        source.PutRandom("notes.txt", 64);
        auto pool = harness.Gather(file_header, source).Unwrap();
        REQUIRE(pool.shares.size() == 5);
        REQUIRE(harness.events.WasRejectedFor("notes.txt", ShareRejectionReason::NotCandidate));
    }

    SECTION("Accept all inspects every file") {
        harness.config.accept_all_files = true;
        source.Put("notes.txt", std::vector<uint8_t>(64, 'a'));
        auto pool = harness.Gather(file_header, source).Unwrap();
        REQUIRE(pool.shares.size() == 5);
        REQUIRE(harness.events.WasRejectedFor("notes.txt", ShareRejectionReason::NotAShare));
    }

    SECTION("Encrypted file itself is not a share") {
        harness.config.accept_all_files = true;
        source.Put("secret.ccm", bundle.file_container);
        auto pool = harness.Gather(file_header, source).Unwrap();
        REQUIRE(pool.shares.size() == 5);
        REQUIRE(harness.events.WasRejectedFor("secret.ccm", ShareRejectionReason::NotAShare));
    }

    SECTION("File smaller than a share header") {
        source.Put("tiny.ccms", std::vector<uint8_t>{'C', 'C', 'M', 'S', 1});
        auto pool = harness.Gather(file_header, source).Unwrap();
        REQUIRE(harness.events.WasRejectedFor("tiny.ccms", ShareRejectionReason::Malformed));
        REQUIRE(pool.report.rejected.size() == 1);
    }

    SECTION("Share of another file") {
        const auto other = MakeBundle(2, 2, false);
        source.PutShare(other.shares[0]);
        auto pool = harness.Gather(file_header, source).Unwrap();
        REQUIRE(pool.shares.size() == 5);
        REQUIRE(harness.events.WasRejectedFor(other.shares[0].file_name, ShareRejectionReason::WrongFile));
    }

    SECTION("Payload of the wrong length") {
        source.Put("long.ccms", RewriteShare(bundle.shares[0].bytes,
            [](ShareHeader&, std::vector<uint8_t>& payload) { payload.push_back(0); }));
        auto pool = harness.Gather(file_header, source).Unwrap();
        REQUIRE(pool.shares.size() == 5);
        REQUIRE(harness.events.WasRejectedFor("long.ccms", ShareRejectionReason::Malformed));
    }

    SECTION("Share of another file with a damaged signature block") {
        const auto other = MakeBundle(2, 2, true);
        auto damaged = other.shares[0].bytes;
        damaged[ContainerConstants::SHARE_HEADER_BASE_SIZE + ContainerConstants::SIGNATURE_BLOCK_SIZE - 1] = 0xFF;
        REQUIRE(HeaderCodec::DecodeShareHeader(damaged).UnwrapErr().type == FailureType::BadSignature);
        source.Put(other.shares[0].file_name, damaged);
        auto pool = harness.Gather(file_header, source).Unwrap();
        REQUIRE(pool.shares.size() == 5);
        REQUIRE(harness.events.WasRejectedFor(other.shares[0].file_name, ShareRejectionReason::WrongFile));
    }

    SECTION("Damaged signature block on a share of this file") {
        const auto signed_bundle = MakeBundle(2, 2, true);
        auto damaged = RewriteShare(signed_bundle.shares[0].bytes,
            [&](ShareHeader& header, std::vector<uint8_t>&) { header.nonce = file_header.nonce; });
        damaged[ContainerConstants::SHARE_HEADER_BASE_SIZE + ContainerConstants::SIGNATURE_BLOCK_SIZE - 1] = 0xFF;
        source.Put("damaged.ccms", damaged);
        auto pool = harness.Gather(file_header, source).Unwrap();
        REQUIRE(pool.shares.size() == 5);
        REQUIRE(harness.events.WasRejectedFor("damaged.ccms", ShareRejectionReason::Malformed));
    }

    SECTION("Zero evaluation point") {
        source.Put("0-zero.ccms", RewriteShare(bundle.shares[0].bytes,
            [](ShareHeader&, std::vector<uint8_t>& payload) { payload.front() = 0; }));
        auto pool = harness.Gather(file_header, source).Unwrap();
        REQUIRE(pool.shares.size() == 5);
        REQUIRE(pool.report.accepted.size() == 5);
        REQUIRE(harness.events.WasRejectedFor("0-zero.ccms", ShareRejectionReason::Malformed));
    }

    SECTION("Unreadable candidates are skipped") {
        source.MarkUnreadable("locked.ccms");
        auto pool = harness.Gather(file_header, source).Unwrap();
        REQUIRE(pool.shares.size() == 5);
        REQUIRE(harness.events.WasRejectedFor("locked.ccms", ShareRejectionReason::Unreadable));
    }

    SECTION("Listing failure is fatal") {
        source.FailListing();
        auto pool = harness.Gather(file_header, source);
        REQUIRE(pool.IsErr());
        REQUIRE(pool.UnwrapErr().type == FailureType::Io);
    }
}

TEST_CASE("ShareReconciliation - Threshold mismatch", "[container][reconciliation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto bundle = MakeBundle(5, 3, false);
    const auto file_header = FileHeaderOf(bundle);
    Harness harness;
    MemoryShareSource source;
    for (const auto& share : bundle.shares) {
        source.PutShare(share);
    }
    const auto set_threshold = [&](const size_t index, const uint8_t threshold) {
        source.Put(bundle.shares[index].file_name, RewriteShare(bundle.shares[index].bytes,
            [threshold](ShareHeader& header, std::vector<uint8_t>&) { header.threshold = threshold; }));
    };
    set_threshold(1, 4);

    SECTION("Keeping the file threshold") {
        harness.config.threshold_policy = ThresholdMismatchPolicy::UseFile;
        auto pool = harness.Gather(file_header, source).Unwrap();
        REQUIRE(pool.shares.size() == 5);
        REQUIRE(pool.report.effective_threshold == 3);
        REQUIRE(pool.report.threshold_resolutions.size() == 1);
        REQUIRE(pool.report.threshold_resolutions[0].conflict.file_threshold == 3);
        REQUIRE(pool.report.threshold_resolutions[0].conflict.share_threshold == 4);
        REQUIRE(harness.policy.conflicts_seen.empty());
    }

    SECTION("Configured override") {
        harness.config.threshold_policy = ThresholdMismatchPolicy::UseOverride;
        harness.config.threshold_override = 2;
        auto pool = harness.Gather(file_header, source).Unwrap();
        REQUIRE(pool.report.declared_threshold == 3);
        REQUIRE(pool.report.effective_threshold == 2);
        REQUIRE(harness.events.resolutions.size() == 1);
        REQUIRE(harness.events.resolutions[0].effective_threshold == 2);
    }

    SECTION("Configured abort") {
        harness.config.threshold_policy = ThresholdMismatchPolicy::Abort;
        auto pool = harness.Gather(file_header, source);
        REQUIRE(pool.IsErr());
        REQUIRE(pool.UnwrapErr().type == FailureType::ThresholdMismatch);
    }

    SECTION("Asking the operator") {
        harness.policy.QueueThresholdDecision(ThresholdDecision::Override(4));
        auto pool = harness.Gather(file_header, source).Unwrap();
        REQUIRE(harness.policy.conflicts_seen.size() == 1);
        REQUIRE(harness.policy.conflicts_seen[0].label == bundle.shares[1].file_name);
        REQUIRE(pool.report.effective_threshold == 4);
    }

    SECTION("Operator abort") {
        harness.policy.QueueThresholdDecision(ThresholdDecision::AbortOperation());
        auto pool = harness.Gather(file_header, source);
        REQUIRE(pool.IsErr());
        REQUIRE(pool.UnwrapErr().type == FailureType::Aborted);
    }

    SECTION("Operator override of zero") {
        harness.policy.QueueThresholdDecision(ThresholdDecision::Override(0));
        auto pool = harness.Gather(file_header, source);
        REQUIRE(pool.IsErr());
        REQUIRE(pool.UnwrapErr().type == FailureType::Configuration);
    }

    SECTION("A later decision for the file threshold clears an override") {
        set_threshold(3, 5);
        harness.policy.QueueThresholdDecision(ThresholdDecision::Override(5));
        harness.policy.QueueThresholdDecision(ThresholdDecision::UseFile());
        auto pool = harness.Gather(file_header, source).Unwrap();
        REQUIRE(pool.report.threshold_resolutions.size() == 2);
        REQUIRE(pool.report.threshold_resolutions[0].effective_threshold == 5);
        REQUIRE(pool.report.threshold_resolutions[1].effective_threshold == 3);
        REQUIRE(pool.report.effective_threshold == 3);
    }
}

TEST_CASE("ReconciliationState - Bookkeeping", "[container][reconciliation]") {
    ReconciliationState state(3);
    REQUIRE(state.DeclaredThreshold() == 3);
    REQUIRE_FALSE(state.OverrideThreshold().has_value());
    REQUIRE(state.EffectiveThreshold() == 3);

    state.Record(ThresholdResolution{ThresholdConflict{"a", 3, 2}, ThresholdDecision::Override(2), 0});
    REQUIRE(state.EffectiveThreshold() == 2);
    REQUIRE(state.DeclaredThreshold() == 3);
    REQUIRE(state.History().back().effective_threshold == 2);

    state.Record(ThresholdResolution{ThresholdConflict{"b", 3, 4}, ThresholdDecision::UseFile(), 0});
    REQUIRE(state.EffectiveThreshold() == 3);
    REQUIRE(state.History().size() == 2);
}

TEST_CASE("ShareReconciliation - Signature policy", "[container][reconciliation][signature]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto bundle = MakeBundle(4, 2, true);
    const auto file_header = FileHeaderOf(bundle);
    Harness harness;
    MemoryShareSource source;
    for (const auto& share : bundle.shares) {
        source.PutShare(share);
    }
    const auto intruder = FreshIdentity();
    // Sorts first, so ordering of flagged shares is observable.
    const std::string foreign_name = "0-foreign.ccms";
    source.Put(foreign_name, RewriteShare(bundle.shares[3].bytes,
        [](ShareHeader&, std::vector<uint8_t>&) {}, &intruder));

    SECTION("Clean signed shares produce no warnings") {
        MemoryShareSource clean;
        for (const auto& share : bundle.shares) {
            clean.PutShare(share);
        }
        auto pool = harness.Gather(file_header, clean).Unwrap();
        REQUIRE(pool.report.warnings.empty());
        REQUIRE(pool.report.flagged.empty());
        REQUIRE(pool.shares.size() == 4);
    }

    SECTION("Strict mode aborts on a foreign key") {
        harness.config.strict = true;
        auto pool = harness.Gather(file_header, source);
        REQUIRE(pool.IsErr());
        REQUIRE(pool.UnwrapErr().type == FailureType::SignatureMismatch);
        REQUIRE(harness.policy.warnings_seen.empty());
    }

    SECTION("Lenient mode asks and keeps the share last") {
        harness.policy = ScriptedPolicy::AlwaysContinue();
        auto pool = harness.Gather(file_header, source).Unwrap();
        REQUIRE(harness.policy.warnings_seen.size() == 1);
        REQUIRE(harness.policy.warnings_seen[0].issue == SignatureIssue::PublicKeyMismatch);
        REQUIRE(harness.policy.warnings_seen[0].share_public_key == intruder.GetPublicKey());
        REQUIRE(pool.report.flagged == std::vector<std::string>{foreign_name});
        REQUIRE(pool.report.accepted.size() == 4);
        REQUIRE(pool.shares.size() == 5);
        REQUIRE(pool.shares.back() == PayloadOf(bundle.shares[3].bytes));
    }

    SECTION("Lenient mode honours a refusal") {
        harness.policy.QueueContinue(false);
        auto pool = harness.Gather(file_header, source);
        REQUIRE(pool.IsErr());
        REQUIRE(pool.UnwrapErr().type == FailureType::Aborted);
    }

    SECTION("Unsigned share of a signed file only warns, also in strict mode") {
        MemoryShareSource stripped;
        stripped.Put("1-stripped.ccms", RewriteShare(bundle.shares[0].bytes,
            [](ShareHeader& header, std::vector<uint8_t>&) { header.signature_block.reset(); }));
        stripped.PutShare(bundle.shares[1]);
        harness.config.strict = true;
        auto strict = harness.Gather(file_header, stripped);
        REQUIRE(strict.IsOk());
        REQUIRE(strict.Unwrap().report.warnings.size() == 1);
        REQUIRE(strict.Unwrap().report.warnings[0].issue == SignatureIssue::ShareNotSigned);
        REQUIRE(strict.Unwrap().report.flagged == std::vector<std::string>{"1-stripped.ccms"});
        REQUIRE(strict.Unwrap().shares.size() == 2);
        REQUIRE(strict.Unwrap().shares.back() == PayloadOf(bundle.shares[0].bytes));
        REQUIRE(harness.events.warnings.size() == 1);
        REQUIRE(harness.policy.warnings_seen.empty());

        harness.config.strict = false;
        auto lenient = harness.Gather(file_header, stripped);
        REQUIRE(lenient.IsOk());
        REQUIRE(lenient.Unwrap().report.flagged.size() == 1);
        REQUIRE(harness.policy.warnings_seen.empty());
    }

    SECTION("Tampered payload under a valid key") {
        MemoryShareSource tampered;
        tampered.Put("1-tampered.ccms", RewriteShare(bundle.shares[0].bytes,
            [](ShareHeader&, std::vector<uint8_t>& payload) { payload[7] ^= 0x04; }));
        harness.config.strict = true;
        auto pool = harness.Gather(file_header, tampered);
        REQUIRE(pool.UnwrapErr().type == FailureType::SignatureMismatch);
    }
}

TEST_CASE("ShareReconciliation - Signed share of an unsigned file", "[container][reconciliation][signature]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto bundle = MakeBundle(3, 2, false);
    const auto file_header = FileHeaderOf(bundle);
    const auto signer = FreshIdentity();
    Harness harness;
    harness.config.strict = true;
    MemoryShareSource source;
    source.Put(bundle.shares[0].file_name, RewriteShare(bundle.shares[0].bytes,
        [](ShareHeader&, std::vector<uint8_t>&) {}, &signer));
    source.PutShare(bundle.shares[1]);

    auto pool = harness.Gather(file_header, source);
    REQUIRE(pool.IsOk());
    REQUIRE(pool.Unwrap().report.warnings.size() == 1);
    REQUIRE(pool.Unwrap().report.warnings[0].issue == SignatureIssue::FileNotSigned);
    REQUIRE(harness.events.warnings.size() == 1);
    REQUIRE(harness.policy.warnings_seen.empty());
    REQUIRE(pool.Unwrap().shares.size() == 2);
}

TEST_CASE("ShareReconciliation - Zero evaluation point does not block recovery", "[container][reconciliation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto plaintext = RandomBytes(128);
    const auto bundle = MakeBundle(3, 2, false, plaintext);
    const auto file_header = FileHeaderOf(bundle);
    Harness harness;
    MemoryShareSource source;
    for (const auto& share : bundle.shares) {
        source.PutShare(share);
    }
    // Sorts ahead of the genuine shares.
    source.Put("0-zero.ccms", RewriteShare(bundle.shares[1].bytes,
        [](ShareHeader&, std::vector<uint8_t>& payload) { payload.front() = 0; }));

    SECTION("Gathering rejects it") {
        auto pool = harness.Gather(file_header, source).Unwrap();
        REQUIRE(pool.shares.size() == 3);
        REQUIRE(pool.report.rejected.size() == 1);
        REQUIRE(pool.report.rejected[0].reason == ShareRejectionReason::Malformed);

        const ShamirSecretSharing sharing;
        const KeySplitEngine engine(sharing);
        REQUIRE(engine.Reconstruct(pool.shares, pool.report.effective_threshold).IsOk());
    }

    SECTION("Decryption succeeds") {
        const auto system = ContainerSystem::CreateDefault();
        auto outcome = system->Decrypt(bundle.file_container, source, harness.config, harness.policy, harness.events);
        REQUIRE(outcome.IsOk());
        REQUIRE(outcome.Unwrap().plaintext == plaintext);
        REQUIRE(outcome.Unwrap().report.shares.accepted.size() == 3);
    }
}
