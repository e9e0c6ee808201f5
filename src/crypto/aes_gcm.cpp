#include "phivault/crypto/aes_gcm.hpp"
#include "phivault/crypto/sodium_interop.hpp"
#include "phivault/core/constants.hpp"
#include "phivault/core/format.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <algorithm>
#include <climits>
#include <memory>
namespace phivault::keystore::crypto {
namespace {
    using Bytes = std::vector<uint8_t>;
    using CipherResult = Result<Bytes, VaultFailure>;

    struct CipherCtxDeleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

    std::string LastOpenSslError() {
        const unsigned long err = ERR_get_error();
        if (err == 0) {
            return "unknown OpenSSL error";
        }
        char buffer[kOpenSslErrorBufferSize];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }

    CipherResult OpenSslFailure(std::string_view step) {
        return CipherResult::Err(
            VaultFailure::Generic(compat::format("{}: {}", step, LastOpenSslError())));
    }

    void Wipe(Bytes& buffer) {
        auto __wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
        (void)__wipe;
    }

    /// Shared setup for both directions: cipher, IV length, key and nonce, AAD.
    bool InitContext(EVP_CIPHER_CTX* ctx, const bool encrypt,
                     std::span<const uint8_t> key,
                     std::span<const uint8_t> nonce,
                     std::span<const uint8_t> associated_data) {
        const auto init = encrypt ? EVP_EncryptInit_ex : EVP_DecryptInit_ex;
        const auto update = encrypt ? EVP_EncryptUpdate : EVP_DecryptUpdate;
        if (init(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != kOpenSslSuccess) {
            return false;
        }
        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN,
                                static_cast<int>(nonce.size()), nullptr) != kOpenSslSuccess) {
            return false;
        }
        if (init(ctx, nullptr, nullptr, key.data(), nonce.data()) != kOpenSslSuccess) {
            return false;
        }
        if (!associated_data.empty()) {
            int outlen = 0;
            if (update(ctx, nullptr, &outlen, associated_data.data(),
                       static_cast<int>(associated_data.size())) != kOpenSslSuccess) {
                return false;
            }
        }
        return true;
    }
}

CipherResult AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (key.size() != kAesKeyBytes) {
        return CipherResult::Err(VaultFailure::InvalidInput(
            compat::format("AES-256-GCM key must be {} bytes, got {}", kAesKeyBytes, key.size())));
    }
    if (nonce.size() != kAesGcmNonceBytes) {
        return CipherResult::Err(VaultFailure::InvalidInput(
            compat::format("AES-GCM nonce must be {} bytes, got {}", kAesGcmNonceBytes, nonce.size())));
    }
    if (plaintext.size() > static_cast<size_t>(INT_MAX) - kAesGcmTagBytes ||
        associated_data.size() > static_cast<size_t>(INT_MAX)) {
        return CipherResult::Err(VaultFailure::InvalidInput("AES-GCM input too large"));
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return OpenSslFailure("Failed to create cipher context");
    }
    if (!InitContext(ctx.get(), true, key, nonce, associated_data)) {
        return OpenSslFailure("Failed to initialize AES-256-GCM encryption");
    }

    Bytes output(plaintext.size() + kAesGcmTagBytes);
    int ciphertext_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                          plaintext.data(), static_cast<int>(plaintext.size())) != kOpenSslSuccess) {
        Wipe(output);
        return OpenSslFailure("Encryption failed");
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != kOpenSslSuccess) {
        Wipe(output);
        return OpenSslFailure("Encryption finalization failed");
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kAesGcmTagBytes),
                            output.data() + ciphertext_len) != kOpenSslSuccess) {
        Wipe(output);
        return OpenSslFailure("Failed to get authentication tag");
    }
    output.resize(static_cast<size_t>(ciphertext_len) + kAesGcmTagBytes);
    return CipherResult::Ok(std::move(output));
}

CipherResult AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (key.size() != kAesKeyBytes) {
        return CipherResult::Err(VaultFailure::InvalidInput(
            compat::format("AES-256-GCM key must be {} bytes, got {}", kAesKeyBytes, key.size())));
    }
    // Malformed nonces and truncated input are indistinguishable from tampering
    if (nonce.size() != kAesGcmNonceBytes) {
        return CipherResult::Err(VaultFailure::IntegrityFailure(
            compat::format("AES-GCM nonce must be {} bytes, got {}", kAesGcmNonceBytes, nonce.size())));
    }
    if (ciphertext_with_tag.size() < kAesGcmTagBytes) {
        return CipherResult::Err(VaultFailure::IntegrityFailure(
            compat::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                           ciphertext_with_tag.size(), kAesGcmTagBytes)));
    }
    if (ciphertext_with_tag.size() > static_cast<size_t>(INT_MAX) ||
        associated_data.size() > static_cast<size_t>(INT_MAX)) {
        return CipherResult::Err(VaultFailure::InvalidInput("AES-GCM input too large"));
    }

    const size_t ciphertext_len = ciphertext_with_tag.size() - kAesGcmTagBytes;
    const auto ciphertext = ciphertext_with_tag.first(ciphertext_len);
    Bytes tag(ciphertext_with_tag.begin() + static_cast<std::ptrdiff_t>(ciphertext_len),
              ciphertext_with_tag.end());

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return OpenSslFailure("Failed to create cipher context");
    }
    if (!InitContext(ctx.get(), false, key, nonce, associated_data)) {
        return OpenSslFailure("Failed to initialize AES-256-GCM decryption");
    }

    Bytes output(std::max<size_t>(ciphertext_len, 1));
    int plaintext_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                          ciphertext.data(), static_cast<int>(ciphertext.size())) != kOpenSslSuccess) {
        Wipe(output);
        return OpenSslFailure("Decryption failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(kAesGcmTagBytes), tag.data()) != kOpenSslSuccess) {
        Wipe(output);
        return OpenSslFailure("Failed to set authentication tag");
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != kOpenSslSuccess) {
        Wipe(output);
        ERR_clear_error();
        return CipherResult::Err(VaultFailure::IntegrityFailure(
            "Authentication tag verification failed"));
    }
    output.resize(static_cast<size_t>(plaintext_len + final_len));
    return CipherResult::Ok(std::move(output));
}
}
