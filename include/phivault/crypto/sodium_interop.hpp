#pragma once

#include "phivault/core/result.hpp"
#include "phivault/core/failures.hpp"
#include "phivault/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace phivault::keystore::crypto {

/**
 * @brief Interop layer for libsodium
 *
 * Initialization, CSPRNG, secure wiping, constant-time comparison,
 * guarded allocations and base64 for the wire format.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium library
     *
     * Must be called before any other keystore operation.
     * Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Volatile byte loop for small buffers, sodium_memzero for large ones.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * @return Ok(true) if equal, Ok(false) if different
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    /**
     * @brief Generate cryptographically secure random bytes
     */
    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /**
     * @brief Fill a caller-owned buffer (e.g. secure memory) with random bytes
     */
    static void FillRandom(std::span<uint8_t> buffer) noexcept;

    // ========================================================================
    // Base64 (RFC 4648, standard alphabet with padding)
    // ========================================================================

    static std::string ToBase64(std::span<const uint8_t> data);

    static Result<std::vector<uint8_t>, SodiumFailure> FromBase64(std::string_view encoded);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate secure memory using sodium_malloc
     *
     * Guard-paged, locked in RAM, zeroed on free.
     *
     * @return Pointer to secure memory, or nullptr on failure
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace phivault::keystore::crypto
