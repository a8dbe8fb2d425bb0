#pragma once
#include <string>
#include <string_view>
namespace chachamir {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    ComparisonFailed,
    InvalidOperation
};
enum class FailureType {
    Generic,
    InvalidInput,
    Configuration,
    MissingMagic,
    Truncated,
    BadPublicKey,
    BadSignature,
    WrongFile,
    ThresholdMismatch,
    SignatureMismatch,
    Authentication,
    InsufficientShares,
    CorruptShares,
    InternalConsistency,
    KeyGeneration,
    Aborted,
    Io
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/// Error value carried by every fallible chachamir operation.
///
/// The type groups failures the way callers react to them: configuration
/// problems are reported before any key material exists, format and
/// correlation failures concern a single container, and authentication,
/// reconstruction and consistency failures abort the whole operation.
class ChachamirFailure {
public:
    FailureType type;
    std::string message;
    ChachamirFailure(const FailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static ChachamirFailure Generic(std::string msg) {
        return {FailureType::Generic, std::move(msg)};
    }
    static ChachamirFailure InvalidInput(std::string msg) {
        return {FailureType::InvalidInput, std::move(msg)};
    }
    static ChachamirFailure Configuration(std::string msg) {
        return {FailureType::Configuration, std::move(msg)};
    }
    static ChachamirFailure MissingMagic(std::string msg) {
        return {FailureType::MissingMagic, std::move(msg)};
    }
    static ChachamirFailure Truncated(std::string msg) {
        return {FailureType::Truncated, std::move(msg)};
    }
    static ChachamirFailure BadPublicKey(std::string msg) {
        return {FailureType::BadPublicKey, std::move(msg)};
    }
    static ChachamirFailure BadSignature(std::string msg) {
        return {FailureType::BadSignature, std::move(msg)};
    }
    static ChachamirFailure WrongFile(std::string msg) {
        return {FailureType::WrongFile, std::move(msg)};
    }
    static ChachamirFailure ThresholdMismatch(std::string msg) {
        return {FailureType::ThresholdMismatch, std::move(msg)};
    }
    static ChachamirFailure SignatureMismatch(std::string msg) {
        return {FailureType::SignatureMismatch, std::move(msg)};
    }
    static ChachamirFailure Authentication(std::string msg) {
        return {FailureType::Authentication, std::move(msg)};
    }
    static ChachamirFailure InsufficientShares(std::string msg) {
        return {FailureType::InsufficientShares, std::move(msg)};
    }
    static ChachamirFailure CorruptShares(std::string msg) {
        return {FailureType::CorruptShares, std::move(msg)};
    }
    static ChachamirFailure InternalConsistency(std::string msg) {
        return {FailureType::InternalConsistency, std::move(msg)};
    }
    static ChachamirFailure KeyGeneration(std::string msg) {
        return {FailureType::KeyGeneration, std::move(msg)};
    }
    static ChachamirFailure Aborted(std::string msg) {
        return {FailureType::Aborted, std::move(msg)};
    }
    static ChachamirFailure Io(std::string msg) {
        return {FailureType::Io, std::move(msg)};
    }
    static ChachamirFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
};

[[nodiscard]] constexpr std::string_view FailureTypeName(const FailureType type) noexcept {
    switch (type) {
        case FailureType::Generic: return "Generic";
        case FailureType::InvalidInput: return "InvalidInput";
        case FailureType::Configuration: return "ConfigurationError";
        case FailureType::MissingMagic: return "FormatError::MissingMagic";
        case FailureType::Truncated: return "FormatError::Truncated";
        case FailureType::BadPublicKey: return "FormatError::BadPublicKey";
        case FailureType::BadSignature: return "FormatError::BadSignature";
        case FailureType::WrongFile: return "CorrelationError::WrongFile";
        case FailureType::ThresholdMismatch: return "CorrelationError::ThresholdMismatch";
        case FailureType::SignatureMismatch: return "AuthenticationError::SignatureMismatch";
        case FailureType::Authentication: return "AuthenticationError";
        case FailureType::InsufficientShares: return "InsufficientShares";
        case FailureType::CorruptShares: return "CorruptShares";
        case FailureType::InternalConsistency: return "InternalConsistencyError";
        case FailureType::KeyGeneration: return "KeyGeneration";
        case FailureType::Aborted: return "Aborted";
        case FailureType::Io: return "IoError";
    }
    return "Unknown";
}
}
