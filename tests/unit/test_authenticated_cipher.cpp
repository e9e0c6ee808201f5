#include <catch2/catch_test_macros.hpp>
#include "phivault/crypto/authenticated_cipher.hpp"
#include "phivault/crypto/secure_memory_handle.hpp"
#include "phivault/crypto/sodium_interop.hpp"
#include "phivault/core/constants.hpp"
#include "helpers/vault_fixtures.hpp"
#include <set>
#include <vector>
using namespace phivault::keystore;
using namespace phivault::keystore::crypto;
using phivault::keystore::test_helpers::HandleBytes;
namespace {
SecureMemoryHandle RandomKey() {
    auto key = SecureMemoryHandle::Allocate(kAesKeyBytes).Unwrap();
    REQUIRE(key.WithWriteAccess([](std::span<uint8_t> bytes) {
        SodiumInterop::FillRandom(bytes);
    }).IsOk());
    return key;
}
}
TEST_CASE("AuthenticatedCipher - Seal and Open", "[cipher][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto key = RandomKey();
    const std::vector<uint8_t> plaintext = {'r', 'o', 's', 't', 'e', 'r'};
    const std::vector<uint8_t> ad = {'o', 'w', 'n', 'e', 'r'};
    SECTION("Open returns the sealed plaintext") {
        auto sealed = AuthenticatedCipher::Seal(key, plaintext, ad);
        REQUIRE(sealed.IsOk());
        const auto& payload = sealed.Unwrap();
        REQUIRE(payload.nonce.size() == kAesGcmNonceBytes);
        REQUIRE(payload.ciphertext.size() == plaintext.size() + kAesGcmTagBytes);
        auto opened = AuthenticatedCipher::Open(key, payload.ciphertext, payload.nonce, ad);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == plaintext);
    }
    SECTION("Every seal draws a fresh nonce") {
        std::set<std::vector<uint8_t>> nonces;
        std::set<std::vector<uint8_t>> ciphertexts;
        for (int i = 0; i < 64; ++i) {
            auto sealed = AuthenticatedCipher::Seal(key, plaintext).Unwrap();
            nonces.insert(sealed.nonce);
            ciphertexts.insert(sealed.ciphertext);
        }
        REQUIRE(nonces.size() == 64);
        REQUIRE(ciphertexts.size() == 64);
    }
    SECTION("OpenToSecure places the plaintext in guarded memory") {
        auto sealed = AuthenticatedCipher::Seal(key, plaintext).Unwrap();
        auto opened = AuthenticatedCipher::OpenToSecure(key, sealed.ciphertext, sealed.nonce);
        REQUIRE(opened.IsOk());
        REQUIRE(HandleBytes(opened.Unwrap()) == plaintext);
    }
}
TEST_CASE("AuthenticatedCipher - Failures", "[cipher][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto key = RandomKey();
    const std::vector<uint8_t> plaintext = {1, 2, 3, 4};
    auto sealed = AuthenticatedCipher::Seal(key, plaintext).Unwrap();
    SECTION("Different key is an integrity failure") {
        auto other = RandomKey();
        auto opened = AuthenticatedCipher::Open(other, sealed.ciphertext, sealed.nonce);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == VaultFailureType::IntegrityFailure);
    }
    SECTION("Malformed nonce is an integrity failure") {
        std::vector<uint8_t> short_nonce(sealed.nonce.begin(), sealed.nonce.begin() + 8);
        auto opened = AuthenticatedCipher::Open(key, sealed.ciphertext, short_nonce);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == VaultFailureType::IntegrityFailure);
    }
    SECTION("Key of the wrong size is invalid input") {
        auto short_key = SecureMemoryHandle::Allocate(16).Unwrap();
        REQUIRE(AuthenticatedCipher::Seal(short_key, plaintext).UnwrapErr().type ==
                VaultFailureType::InvalidInput);
        REQUIRE(AuthenticatedCipher::Open(short_key, sealed.ciphertext, sealed.nonce).UnwrapErr().type ==
                VaultFailureType::InvalidInput);
    }
    SECTION("Empty key handle is invalid input") {
        SecureMemoryHandle empty;
        REQUIRE(AuthenticatedCipher::Seal(empty, plaintext).UnwrapErr().type ==
                VaultFailureType::InvalidInput);
    }
}
