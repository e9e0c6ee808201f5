#include "phivault/crypto/key_derivation.hpp"
#include "phivault/crypto/sodium_interop.hpp"
#include "phivault/core/constants.hpp"
#include "phivault/core/format.hpp"
#include "phivault/debug/event_logger.hpp"
#include <sodium.h>

namespace phivault::keystore::crypto {
    using configuration::KdfParams;
    using debug::Component;

    static_assert(kSaltBytes == crypto_pwhash_SALTBYTES, "salt size must match Argon2id");

    Result<SecureMemoryHandle, VaultFailure> KeyDerivation::DeriveKek(
        const std::span<const uint8_t> secret,
        const std::span<const uint8_t> salt,
        const KdfParams& params) {
        if (secret.empty()) {
            return Result<SecureMemoryHandle, VaultFailure>::Err(
                VaultFailure::InvalidInput("Secret must not be empty"));
        }
        if (salt.size() != kSaltBytes) {
            return Result<SecureMemoryHandle, VaultFailure>::Err(
                VaultFailure::InvalidInput(
                    compat::format("Salt must be {} bytes, got {}", kSaltBytes, salt.size())));
        }
        if (auto valid = params.Validate(); valid.IsErr()) {
            return Result<SecureMemoryHandle, VaultFailure>::Err(std::move(valid).UnwrapErr());
        }
        if (params.MemLimitBytes() > crypto_pwhash_MEMLIMIT_MAX ||
            params.OpsLimit() > crypto_pwhash_OPSLIMIT_MAX) {
            return Result<SecureMemoryHandle, VaultFailure>::Err(
                VaultFailure::InvalidInput("Argon2id parameters exceed the supported maximum"));
        }
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<SecureMemoryHandle, VaultFailure>::Err(
                VaultFailure::FromSodiumFailure(init.UnwrapErr()));
        }

        auto kek_result = SecureMemoryHandle::Allocate(kKekBytes);
        if (kek_result.IsErr()) {
            return Result<SecureMemoryHandle, VaultFailure>::Err(
                VaultFailure::FromSodiumFailure(kek_result.UnwrapErr()));
        }
        auto kek = std::move(kek_result).Unwrap();

        PV_LOG_VALUE(Component::KeyDerivation, "DeriveKek", "kdf_version", params.Version());
        auto derived = kek.WithWriteAccess([&](std::span<uint8_t> out) {
            return crypto_pwhash(
                out.data(), out.size(),
                reinterpret_cast<const char*>(secret.data()), secret.size(),
                salt.data(),
                params.OpsLimit(), params.MemLimitBytes(),
                crypto_pwhash_ALG_ARGON2ID13);
        });
        if (derived.IsErr()) {
            return Result<SecureMemoryHandle, VaultFailure>::Err(
                VaultFailure::FromSodiumFailure(derived.UnwrapErr()));
        }
        if (derived.Unwrap() != 0) {
            return Result<SecureMemoryHandle, VaultFailure>::Err(
                VaultFailure::DeriveKey("Argon2id derivation failed (insufficient memory)"));
        }
        return Result<SecureMemoryHandle, VaultFailure>::Ok(std::move(kek));
    }

    Result<SecureMemoryHandle, VaultFailure> KeyDerivation::DeriveKek(
        const std::string_view secret,
        const std::span<const uint8_t> salt,
        const KdfParams& params) {
        return DeriveKek(
            std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(secret.data()), secret.size()),
            salt, params);
    }

    Result<SecureMemoryHandle, VaultFailure> KeyDerivation::DeriveKek(
        const std::string_view secret,
        const std::span<const uint8_t> salt,
        const uint32_t kdf_version) {
        auto params = KdfParams::ForVersion(kdf_version);
        if (params.IsErr()) {
            return Result<SecureMemoryHandle, VaultFailure>::Err(std::move(params).UnwrapErr());
        }
        return DeriveKek(secret, salt, params.Unwrap());
    }

    std::vector<uint8_t> KeyDerivation::GenerateSalt() {
        return SodiumInterop::GetRandomBytes(kSaltBytes);
    }
}
