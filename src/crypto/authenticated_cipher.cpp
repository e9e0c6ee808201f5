#include "phivault/crypto/authenticated_cipher.hpp"
#include "phivault/crypto/aes_gcm.hpp"
#include "phivault/crypto/sodium_interop.hpp"
#include "phivault/core/constants.hpp"
#include "phivault/core/format.hpp"
#include "phivault/debug/event_logger.hpp"

namespace phivault::keystore::crypto {

using debug::Component;

namespace {

Result<Unit, VaultFailure> CheckKey(const SecureMemoryHandle& key) {
    if (key.IsInvalid()) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::InvalidInput("Cipher key handle is empty"));
    }
    if (key.Size() != kAesKeyBytes) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::InvalidInput(
                compat::format("Cipher key must be {} bytes, got {}", kAesKeyBytes, key.Size())));
    }
    return Result<Unit, VaultFailure>::Ok(unit);
}

}

Result<SealedPayload, VaultFailure> AuthenticatedCipher::Seal(
    const SecureMemoryHandle& key,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto key_check = CheckKey(key); key_check.IsErr()) {
        return Result<SealedPayload, VaultFailure>::Err(std::move(key_check).UnwrapErr());
    }

    SealedPayload sealed;
    sealed.nonce = SodiumInterop::GetRandomBytes(kAesGcmNonceBytes);

    auto encrypted = key.WithReadAccess([&](std::span<const uint8_t> key_bytes) {
        return AesGcm::Encrypt(key_bytes, sealed.nonce, plaintext, associated_data);
    });
    if (encrypted.IsErr()) {
        return Result<SealedPayload, VaultFailure>::Err(
            VaultFailure::FromSodiumFailure(encrypted.UnwrapErr()));
    }
    auto ciphertext = std::move(encrypted).Unwrap();
    if (ciphertext.IsErr()) {
        return Result<SealedPayload, VaultFailure>::Err(std::move(ciphertext).UnwrapErr());
    }
    sealed.ciphertext = std::move(ciphertext).Unwrap();

    PV_LOG_PUBLIC_BYTES(Component::Cipher, "Seal", "nonce", std::span<const uint8_t>(sealed.nonce));
    PV_LOG_VALUE(Component::Cipher, "Seal", "ciphertext_bytes", sealed.ciphertext.size());
    return Result<SealedPayload, VaultFailure>::Ok(std::move(sealed));
}

Result<std::vector<uint8_t>, VaultFailure> AuthenticatedCipher::Open(
    const SecureMemoryHandle& key,
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> associated_data) {
    if (auto key_check = CheckKey(key); key_check.IsErr()) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(std::move(key_check).UnwrapErr());
    }

    auto decrypted = key.WithReadAccess([&](std::span<const uint8_t> key_bytes) {
        return AesGcm::Decrypt(key_bytes, nonce, ciphertext, associated_data);
    });
    if (decrypted.IsErr()) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(
            VaultFailure::FromSodiumFailure(decrypted.UnwrapErr()));
    }
    auto plaintext = std::move(decrypted).Unwrap();
    if (plaintext.IsErr()) {
        PV_LOG_EVENT(Component::Cipher, "Open", "rejected: " + plaintext.UnwrapErr().message);
    }
    return plaintext;
}

Result<SecureMemoryHandle, VaultFailure> AuthenticatedCipher::OpenToSecure(
    const SecureMemoryHandle& key,
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> associated_data) {
    auto opened = Open(key, ciphertext, nonce, associated_data);
    if (opened.IsErr()) {
        return Result<SecureMemoryHandle, VaultFailure>::Err(std::move(opened).UnwrapErr());
    }
    auto plaintext = std::move(opened).Unwrap();
    auto handle = SecureMemoryHandle::FromBytes(plaintext);
    { auto __wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(plaintext)); (void)__wipe; }
    if (handle.IsErr()) {
        return Result<SecureMemoryHandle, VaultFailure>::Err(
            VaultFailure::FromSodiumFailure(handle.UnwrapErr()));
    }
    return Result<SecureMemoryHandle, VaultFailure>::Ok(std::move(handle).Unwrap());
}

} // namespace phivault::keystore::crypto
