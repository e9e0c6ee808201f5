#pragma once
#include <string>
#include <string_view>
namespace phivault::keystore {
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
enum class VaultFailureType {
    Generic,
    InvalidInput,
    AuthenticationFailure,
    IntegrityFailure,
    NotInitialized,
    UnsupportedFormat,
    KeyGeneration,
    DeriveKey,
    Encode,
    Decode,
    InvalidState,
    StorageConflict,
    NotFound
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

/**
 * @brief Failure value carried by every fallible keystore operation
 *
 * The first five kinds form the public taxonomy surfaced to callers:
 * - InvalidInput: malformed parameters (caller bug, not user-facing)
 * - AuthenticationFailure: wrong secret or corrupted wrapped DEK
 * - IntegrityFailure: tampered or corrupted ciphertext
 * - NotInitialized: operation outside the Active session state
 * - UnsupportedFormat: blob or KDF version newer than this build
 *
 * The remaining kinds describe internal or backend conditions.
 */
class VaultFailure {
public:
    VaultFailureType type;
    std::string message;
    VaultFailure(const VaultFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static VaultFailure Generic(std::string msg) {
        return {VaultFailureType::Generic, std::move(msg)};
    }
    static VaultFailure InvalidInput(std::string msg) {
        return {VaultFailureType::InvalidInput, std::move(msg)};
    }
    static VaultFailure AuthenticationFailure(std::string msg) {
        return {VaultFailureType::AuthenticationFailure, std::move(msg)};
    }
    static VaultFailure IntegrityFailure(std::string msg) {
        return {VaultFailureType::IntegrityFailure, std::move(msg)};
    }
    static VaultFailure NotInitialized(std::string msg) {
        return {VaultFailureType::NotInitialized, std::move(msg)};
    }
    static VaultFailure UnsupportedFormat(std::string msg) {
        return {VaultFailureType::UnsupportedFormat, std::move(msg)};
    }
    static VaultFailure KeyGeneration(std::string msg) {
        return {VaultFailureType::KeyGeneration, std::move(msg)};
    }
    static VaultFailure DeriveKey(std::string msg) {
        return {VaultFailureType::DeriveKey, std::move(msg)};
    }
    static VaultFailure Encode(std::string msg) {
        return {VaultFailureType::Encode, std::move(msg)};
    }
    static VaultFailure Decode(std::string msg) {
        return {VaultFailureType::Decode, std::move(msg)};
    }
    static VaultFailure InvalidState(std::string msg) {
        return {VaultFailureType::InvalidState, std::move(msg)};
    }
    static VaultFailure StorageConflict(std::string msg) {
        return {VaultFailureType::StorageConflict, std::move(msg)};
    }
    static VaultFailure NotFound(std::string msg) {
        return {VaultFailureType::NotFound, std::move(msg)};
    }
    static VaultFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }

    /// Text safe to show an end user. Never more specific than the kind,
    /// so wrong-password and corrupted-key cases stay indistinguishable.
    [[nodiscard]] std::string_view UserMessage() const noexcept {
        switch (type) {
            case VaultFailureType::AuthenticationFailure:
                return "Incorrect password";
            case VaultFailureType::IntegrityFailure:
            case VaultFailureType::Decode:
                return "This record could not be read";
            case VaultFailureType::UnsupportedFormat:
                return "Update required";
            case VaultFailureType::NotFound:
                return "Record not found";
            case VaultFailureType::StorageConflict:
                return "Your keys were changed elsewhere; sign in again";
            default:
                return "Something went wrong";
        }
    }
};
}
