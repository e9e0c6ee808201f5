#pragma once

#include "phivault/core/result.hpp"
#include "phivault/core/failures.hpp"
#include "phivault/crypto/secure_memory_handle.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace phivault::keystore::crypto {

struct SealedPayload {
    std::vector<uint8_t> ciphertext;   // includes the 16-byte tag
    std::vector<uint8_t> nonce;
};

/**
 * @brief Seal/open with a fresh random nonce per call
 *
 * AES-256-GCM with a 96-bit nonce from the libsodium CSPRNG. Associated data
 * is authenticated but not encrypted, and must be presented unchanged to Open.
 *
 * Open fails closed: a tag mismatch, a malformed nonce or a truncated
 * ciphertext all yield IntegrityFailure and no plaintext. A key that is not
 * 32 bytes yields InvalidInput.
 */
class AuthenticatedCipher {
public:
    [[nodiscard]] static Result<SealedPayload, VaultFailure> Seal(
        const SecureMemoryHandle& key,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});

    [[nodiscard]] static Result<std::vector<uint8_t>, VaultFailure> Open(
        const SecureMemoryHandle& key,
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> associated_data = {});

    /// Same as Open, but the plaintext is written into a fresh secure buffer.
    /// Used for unwrapping key material.
    [[nodiscard]] static Result<SecureMemoryHandle, VaultFailure> OpenToSecure(
        const SecureMemoryHandle& key,
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> associated_data = {});

private:
    AuthenticatedCipher() = delete;
};

} // namespace phivault::keystore::crypto
