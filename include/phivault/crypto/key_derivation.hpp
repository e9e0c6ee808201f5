#pragma once
#include "phivault/core/result.hpp"
#include "phivault/core/failures.hpp"
#include "phivault/configuration/kdf_params.hpp"
#include "phivault/crypto/secure_memory_handle.hpp"
#include <vector>
#include <string_view>
#include <span>
#include <cstdint>
namespace phivault::keystore::crypto {

/**
 * Password-based derivation of the key-encryption key (Argon2id).
 *
 * Same secret, salt and parameters always give the same KEK; changing any
 * one bit of the secret or salt gives an unrelated KEK. The secret is read
 * only for the duration of the call and never copied.
 */
class KeyDerivation {
public:
    /// InvalidInput if the secret is empty, the salt is not 16 bytes, or the
    /// parameters are below the Argon2id floor.
    [[nodiscard]] static Result<SecureMemoryHandle, VaultFailure> DeriveKek(
        std::span<const uint8_t> secret,
        std::span<const uint8_t> salt,
        const configuration::KdfParams& params);

    [[nodiscard]] static Result<SecureMemoryHandle, VaultFailure> DeriveKek(
        std::string_view secret,
        std::span<const uint8_t> salt,
        const configuration::KdfParams& params);

    /// Resolves @p kdf_version first; unknown versions are UnsupportedFormat.
    [[nodiscard]] static Result<SecureMemoryHandle, VaultFailure> DeriveKek(
        std::string_view secret,
        std::span<const uint8_t> salt,
        uint32_t kdf_version);

    [[nodiscard]] static std::vector<uint8_t> GenerateSalt();
private:
    KeyDerivation() = delete;
};
}
