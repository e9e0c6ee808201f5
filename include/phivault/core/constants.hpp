#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace phivault::keystore {

inline constexpr size_t kSaltBytes = 16;
inline constexpr size_t kKekBytes = 32;
inline constexpr size_t kDekBytes = 32;
inline constexpr size_t kRecoveryKeyBytes = 32;

inline constexpr size_t kAesKeyBytes = 32;
inline constexpr size_t kAesGcmNonceBytes = 12;
inline constexpr size_t kAesGcmTagBytes = 16;

// Argon2id cost schedule. Version 2 matches the backend's account hashing cost.
inline constexpr uint32_t kKdfVersionInteractive = 1;
inline constexpr uint32_t kKdfVersionStandard = 2;
inline constexpr uint32_t kCurrentKdfVersion = kKdfVersionStandard;
inline constexpr uint64_t kKdfV1OpsLimit = 2;
inline constexpr size_t kKdfV1MemLimitBytes = 64ull * 1024 * 1024;
inline constexpr uint64_t kKdfV2OpsLimit = 3;
inline constexpr size_t kKdfV2MemLimitBytes = 64ull * 1024 * 1024;

// Floor below which no parameter set is accepted (Argon2id "interactive").
inline constexpr uint64_t kKdfMinOpsLimit = 2;
inline constexpr size_t kKdfMinMemLimitBytes = 64ull * 1024 * 1024;

// Recovery entries are not password derived.
inline constexpr uint32_t kKdfVersionNone = 0;

inline constexpr uint32_t kRecordFormatV1 = 1;
inline constexpr uint32_t kCurrentRecordFormatVersion = kRecordFormatV1;

inline constexpr size_t kDefaultMaxRecordBytes = 10 * 1024 * 1024;
inline constexpr size_t kMaxContextFieldBytes = 1024;

inline constexpr std::string_view kDekWrapLabel = "PhiVault-DEK-Wrap-v1";
inline constexpr std::string_view kRecordLabel = "PhiVault-Record-v1";

inline constexpr size_t kSmallBufferThreshold = 1024;
inline constexpr size_t kOpenSslErrorBufferSize = 256;
inline constexpr int kOpenSslSuccess = 1;

struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view SESSION_NOT_ACTIVE = "Session key store is not active";
    static constexpr std::string_view UNLOCK_FAILED = "Unable to unlock protected data";
    static constexpr std::string_view RECORD_UNREADABLE = "Record failed authentication";
};

}  // namespace phivault::keystore
