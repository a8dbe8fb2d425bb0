#include <catch2/catch_test_macros.hpp>
#include "chachamir/container/signature_binder.hpp"
#include "chachamir/container/header_codec.hpp"
#include "chachamir/crypto/ed25519_signature.hpp"
#include "chachamir/crypto/sodium_interop.hpp"
#include "chachamir/core/constants.hpp"
#include "../helpers/random_bytes.hpp"
#include <vector>
using namespace chachamir;
using namespace chachamir::container;
using namespace chachamir::crypto;
using namespace chachamir::models;

TEST_CASE("Ed25519Signature - Sign and verify", "[crypto][signature]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const Ed25519Signature scheme;
    auto identity = scheme.GenerateIdentity().Unwrap();
    const std::vector<uint8_t> message{1, 2, 3, 4};

    SECTION("Identity keys") {
        REQUIRE(identity.GetSecretKeyHandle().Size() == Constants::ED_25519_SECRET_KEY_SIZE);
        REQUIRE(Ed25519Signature::IsValidPublicKey(identity.GetPublicKey()));
        auto other = scheme.GenerateIdentity().Unwrap();
        REQUIRE(other.GetPublicKey() != identity.GetPublicKey());
    }

    SECTION("Signature verifies and is well formed") {
        auto signature = scheme.Sign(identity, message).Unwrap();
        REQUIRE(Ed25519Signature::IsWellFormedSignature(signature));
        REQUIRE(scheme.Verify(identity.GetPublicKey(), message, signature));
    }

    SECTION("Changed message fails") {
        auto signature = scheme.Sign(identity, message).Unwrap();
        const std::vector<uint8_t> changed{1, 2, 3, 5};
        REQUIRE_FALSE(scheme.Verify(identity.GetPublicKey(), changed, signature));
    }

    SECTION("Another key fails") {
        auto signature = scheme.Sign(identity, message).Unwrap();
        auto other = scheme.GenerateIdentity().Unwrap();
        REQUIRE_FALSE(scheme.Verify(other.GetPublicKey(), message, signature));
    }

    SECTION("Key and signature shape checks") {
        const PublicKeyBytes zero_key{};
        REQUIRE_FALSE(Ed25519Signature::IsValidPublicKey(zero_key));
        const std::vector<uint8_t> short_key(16, 1);
        REQUIRE_FALSE(Ed25519Signature::IsValidPublicKey(short_key));
        SignatureBytes high_scalar{};
        high_scalar.back() = 0xE0;
        REQUIRE_FALSE(Ed25519Signature::IsWellFormedSignature(high_scalar));
    }
}

TEST_CASE("SignatureBinder - Containers", "[container][signature]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const Ed25519Signature scheme;
    const SignatureBinder binder(scheme);
    auto identity = binder.CreateIdentity().Unwrap();

    FileHeader file_header;
    file_header.threshold = 2;
    SodiumInterop::FillRandom(file_header.nonce);
    const auto ciphertext = test_helpers::RandomBytes(64);

    ShareHeader share_header;
    share_header.threshold = 2;
    share_header.nonce = file_header.nonce;
    const auto share = test_helpers::RandomBytes(Constants::SHARE_SIZE);

    const auto sign_file = [&](FileHeader header) {
        header.signature_block = SignatureBlock{
            identity.GetPublicKey(), binder.SignFile(identity, header, ciphertext).Unwrap()};
        return header;
    };
    const auto sign_share = [&](ShareHeader header, const SigningIdentity& signer) {
        header.signature_block = SignatureBlock{
            signer.GetPublicKey(), binder.SignShare(signer, header, share).Unwrap()};
        return header;
    };

    SECTION("Signed file verifies") {
        const auto header = sign_file(file_header);
        REQUIRE(binder.VerifyFile(header, ciphertext));
    }

    SECTION("Unsigned headers never verify") {
        REQUIRE_FALSE(binder.VerifyFile(file_header, ciphertext));
        REQUIRE_FALSE(binder.VerifyShare(share_header, share));
    }

    SECTION("Header fields are covered") {
        auto header = sign_file(file_header);
        header.threshold = 3;
        REQUIRE_FALSE(binder.VerifyFile(header, ciphertext));
        auto renonced = sign_file(file_header);
        renonced.nonce[0] ^= 0x01;
        REQUIRE_FALSE(binder.VerifyFile(renonced, ciphertext));
    }

    SECTION("Ciphertext is covered") {
        const auto header = sign_file(file_header);
        auto tampered = ciphertext;
        tampered[0] ^= 0x01;
        REQUIRE_FALSE(binder.VerifyFile(header, tampered));
    }

    SECTION("Share signature covers the parsed padding") {
        auto header = sign_share(share_header, identity);
        REQUIRE(binder.VerifyShare(header, share));
        header.padding = 1;
        REQUIRE_FALSE(binder.VerifyShare(header, share));
    }

    SECTION("Cross check of matching signed containers is clean") {
        const auto file = sign_file(file_header);
        const auto signed_share = sign_share(share_header, identity);
        REQUIRE(binder.CrossCheckShare(file, signed_share, share).empty());
    }

    SECTION("Cross check of two unsigned containers is clean") {
        REQUIRE(binder.CrossCheckShare(file_header, share_header, share).empty());
    }

    SECTION("Unsigned share of a signed file") {
        const auto file = sign_file(file_header);
        REQUIRE(binder.CrossCheckShare(file, share_header, share) ==
                std::vector<SignatureIssue>{SignatureIssue::ShareNotSigned});
    }

    SECTION("Signed share of an unsigned file") {
        const auto signed_share = sign_share(share_header, identity);
        REQUIRE(binder.CrossCheckShare(file_header, signed_share, share) ==
                std::vector<SignatureIssue>{SignatureIssue::FileNotSigned});
    }

    SECTION("Share re-signed under another key") {
        const auto file = sign_file(file_header);
        auto other = binder.CreateIdentity().Unwrap();
        const auto foreign = sign_share(share_header, other);
        REQUIRE(binder.CrossCheckShare(file, foreign, share) ==
                std::vector<SignatureIssue>{SignatureIssue::PublicKeyMismatch});
    }

    SECTION("Tampered share under the file key") {
        const auto file = sign_file(file_header);
        const auto signed_share = sign_share(share_header, identity);
        auto tampered = share;
        tampered[5] ^= 0x10;
        REQUIRE(binder.CrossCheckShare(file, signed_share, tampered) ==
                std::vector<SignatureIssue>{SignatureIssue::ShareSignatureInvalid});
    }
}
