#pragma once
#include "chachamir/core/result.hpp"
#include "chachamir/core/failures.hpp"
#include "chachamir/configuration/container_config.hpp"
#include "chachamir/container/share_reconciliation.hpp"
#include "chachamir/interfaces/i_aead_cipher.hpp"
#include "chachamir/interfaces/i_container_event_handler.hpp"
#include "chachamir/interfaces/i_reconciliation_policy.hpp"
#include "chachamir/interfaces/i_secret_sharing.hpp"
#include "chachamir/interfaces/i_share_source.hpp"
#include "chachamir/interfaces/i_signature_scheme.hpp"
#include "chachamir/models/container_headers.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace chachamir::container {

struct ShareFile {
    /// 1-based, matches the share's evaluation point.
    uint8_t index = 0;
    std::string file_name;
    std::vector<uint8_t> bytes;
};

/// Everything one encryption produces. Nothing has been written yet.
struct EncryptedBundle {
    std::vector<uint8_t> file_container;
    models::Nonce nonce{};
    bool is_signed = false;
    std::vector<ShareFile> shares;
};

enum class FileSignatureStatus : uint8_t {
    Unsigned,
    Verified,
    Invalid
};

struct DecryptionReport {
    models::FileHeader file_header;
    FileSignatureStatus file_signature = FileSignatureStatus::Unsigned;
    ReconciliationReport shares;
};

struct DecryptionOutcome {
    std::vector<uint8_t> plaintext;
    DecryptionReport report;
};

/**
 * @brief Runs the encrypt and decrypt paths over the container protocol
 *
 * Encrypt: validate → key and nonce → split (self-checked) → optional
 * one-time identity signs every share and the file → encrypt (self-checked).
 *
 * Decrypt: parse the target header → gather shares → verify the file
 * signature → reconstruct the key → decrypt.
 *
 * The key exists only inside one call and is wiped on every exit path.
 * Primitives are owned and can be swapped for testing.
 */
class ContainerSystem {
public:
    ContainerSystem(
        std::unique_ptr<interfaces::ISecretSharing> sharing,
        std::unique_ptr<interfaces::IAeadCipher> aead,
        std::unique_ptr<interfaces::ISignatureScheme> signatures);

    /// Shamir over GF(2^8), ChaCha20-Poly1305 IETF and Ed25519.
    [[nodiscard]] static std::unique_ptr<ContainerSystem> CreateDefault();

    [[nodiscard]] Result<EncryptedBundle, ChachamirFailure> Encrypt(
        std::span<const uint8_t> plaintext,
        const configuration::EncryptConfig& config,
        interfaces::IContainerEventHandler& events) const;

    [[nodiscard]] Result<DecryptionOutcome, ChachamirFailure> Decrypt(
        std::span<const uint8_t> file_container,
        interfaces::IShareSource& shares,
        const configuration::DecryptConfig& config,
        interfaces::IReconciliationPolicy& policy,
        interfaces::IContainerEventHandler& events) const;

    /// "<index>-<hex nonce>.ccms"
    [[nodiscard]] static std::string ShareFileName(uint8_t index, const models::Nonce& nonce);

    ContainerSystem(ContainerSystem&&) noexcept = default;
    ContainerSystem& operator=(ContainerSystem&&) noexcept = default;
    ContainerSystem(const ContainerSystem&) = delete;
    ContainerSystem& operator=(const ContainerSystem&) = delete;
    ~ContainerSystem() = default;

private:
    [[nodiscard]] Result<std::vector<ShareFile>, ChachamirFailure> BuildShareFiles(
        std::span<const std::vector<uint8_t>> shares,
        const models::ShareHeader& header,
        const models::SigningIdentity* identity,
        interfaces::IContainerEventHandler& events) const;

    std::unique_ptr<interfaces::ISecretSharing> sharing_;
    std::unique_ptr<interfaces::IAeadCipher> aead_;
    std::unique_ptr<interfaces::ISignatureScheme> signatures_;
};
}
