#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace chachamir {
struct Constants {
    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t NONCE_SIZE = 12;
    static constexpr size_t AEAD_TAG_SIZE = 16;
    static constexpr size_t ED_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t ED_25519_SECRET_KEY_SIZE = 64;
    static constexpr size_t ED_25519_SIGNATURE_SIZE = 64;
    static constexpr size_t SHARE_X_SIZE = 1;
    static constexpr size_t SHARE_SIZE = SHARE_X_SIZE + KEY_SIZE;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
};

/*
 * Container layouts (offsets from the start of the file):
 *
 *   file  : 'C' 'C' 'M'     VV TT SS NN*12           [PK*32 SG*64] ciphertext
 *   share : 'C' 'C' 'M' 'S' VV TT SS NN*12 00        [PK*32 SG*64] share
 *
 *   VV = algorithm version, TT = threshold, SS = signed flag, NN = nonce,
 *   PK/SG are present only when SS != 0.
 */
struct ContainerConstants {
    static constexpr std::array<uint8_t, 3> FILE_MAGIC = {'C', 'C', 'M'};
    static constexpr std::array<uint8_t, 4> SHARE_MAGIC = {'C', 'C', 'M', 'S'};
    static constexpr uint8_t ALGORITHM_VERSION = 1;
    static constexpr uint8_t SIGNED_FLAG = 1;
    static constexpr uint8_t UNSIGNED_FLAG = 0;
    static constexpr uint8_t SHARE_PADDING = 0;
    static constexpr size_t SHARE_PADDING_SIZE = 1;
    static constexpr size_t FILE_VERSION_OFFSET = FILE_MAGIC.size();
    static constexpr size_t FILE_THRESHOLD_OFFSET = FILE_VERSION_OFFSET + 1;
    static constexpr size_t FILE_SIGNED_OFFSET = FILE_THRESHOLD_OFFSET + 1;
    static constexpr size_t FILE_NONCE_OFFSET = FILE_SIGNED_OFFSET + 1;
    static constexpr size_t FILE_HEADER_BASE_SIZE = FILE_NONCE_OFFSET + Constants::NONCE_SIZE;
    static constexpr size_t SHARE_VERSION_OFFSET = SHARE_MAGIC.size();
    static constexpr size_t SHARE_THRESHOLD_OFFSET = SHARE_VERSION_OFFSET + 1;
    static constexpr size_t SHARE_SIGNED_OFFSET = SHARE_THRESHOLD_OFFSET + 1;
    static constexpr size_t SHARE_NONCE_OFFSET = SHARE_SIGNED_OFFSET + 1;
    static constexpr size_t SHARE_PADDING_OFFSET = SHARE_NONCE_OFFSET + Constants::NONCE_SIZE;
    static constexpr size_t SHARE_HEADER_BASE_SIZE = SHARE_PADDING_OFFSET + SHARE_PADDING_SIZE;
    static constexpr size_t SIGNATURE_BLOCK_SIZE =
        Constants::ED_25519_PUBLIC_KEY_SIZE + Constants::ED_25519_SIGNATURE_SIZE;
    static constexpr std::string_view ENCRYPTED_FILE_EXTENSION = ".ccm";
    static constexpr std::string_view SHARE_FILE_EXTENSION = ".ccms";
};
static_assert(ContainerConstants::FILE_HEADER_BASE_SIZE == 18);
static_assert(ContainerConstants::SHARE_HEADER_BASE_SIZE == 20);

struct SharingConstants {
    static constexpr uint8_t MIN_THRESHOLD = 1;
    static constexpr uint8_t MIN_PLAYERS = 1;
    static constexpr uint8_t MAX_PLAYERS = 255;
    // x^8 + x^4 + x^3 + x^2 + 1
    static constexpr uint8_t GF256_REDUCTION = 0x1D;
};

struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
};

struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view DECRYPTION_FAILED = "Decryption failed [reason obfuscated]";
    static constexpr std::string_view STRICT_ABORT = "Will not decrypt using tampered data in strict mode";
    static constexpr std::string_view OPERATOR_ABORT = "Operation aborted by operator";
};
}
