#pragma once
#include "phivault/core/result.hpp"
#include "phivault/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace phivault::keystore::crypto {

/**
 * AES-256-GCM over OpenSSL EVP
 *
 * Stateless primitive: nonce management belongs to the caller. The keystore
 * only reaches this through AuthenticatedCipher, which draws a fresh random
 * 96-bit nonce per call. With random nonces a single key must not seal more
 * than 2^32 messages (NIST SP 800-38D).
 *
 * Output of Encrypt is ciphertext || 16-byte tag. Decrypt wipes its output
 * buffer on any failure and returns IntegrityFailure when the tag does not
 * verify.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, VaultFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, VaultFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
