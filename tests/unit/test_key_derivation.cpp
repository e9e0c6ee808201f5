#include <catch2/catch_test_macros.hpp>
#include "phivault/crypto/key_derivation.hpp"
#include "phivault/crypto/sodium_interop.hpp"
#include "phivault/configuration/kdf_params.hpp"
#include "phivault/core/constants.hpp"
#include "helpers/vault_fixtures.hpp"
#include <sodium.h>
#include <string>
#include <vector>
using namespace phivault::keystore;
using namespace phivault::keystore::crypto;
using phivault::keystore::configuration::KdfParams;

namespace {
const std::vector<uint8_t> kFixedSalt = {
    0x00, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77,
    0x88, 0x99, 0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF
};

std::vector<uint8_t> KekBytes(const SecureMemoryHandle& kek) {
    return test_helpers::HandleBytes(kek);
}
}

TEST_CASE("KeyDerivation - Determinism", "[kdf][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Same secret, salt and version give the same KEK") {
        auto a = KeyDerivation::DeriveKek("correct-horse", kFixedSalt, kCurrentKdfVersion);
        auto b = KeyDerivation::DeriveKek("correct-horse", kFixedSalt, kCurrentKdfVersion);
        REQUIRE(a.IsOk());
        REQUIRE(b.IsOk());
        REQUIRE(a.Unwrap().Size() == kKekBytes);
        REQUIRE(a.Unwrap().ConstantTimeEquals(b.Unwrap()).Unwrap());
    }

    SECTION("Output matches Argon2id called directly") {
        const std::string secret = "correct-horse";
        const auto params = KdfParams::Current();
        std::vector<uint8_t> expected(kKekBytes);
        REQUIRE(crypto_pwhash(expected.data(), expected.size(),
                              secret.data(), secret.size(), kFixedSalt.data(),
                              params.OpsLimit(), params.MemLimitBytes(),
                              crypto_pwhash_ALG_ARGON2ID13) == 0);
        auto kek = KeyDerivation::DeriveKek(secret, kFixedSalt, params);
        REQUIRE(kek.IsOk());
        REQUIRE(KekBytes(kek.Unwrap()) == expected);
    }

    SECTION("Byte and text secrets derive the same key") {
        const std::string secret = "pässwörd";
        const std::vector<uint8_t> secret_bytes(secret.begin(), secret.end());
        auto from_text = KeyDerivation::DeriveKek(std::string_view(secret), kFixedSalt, KdfParams::Current());
        auto from_bytes = KeyDerivation::DeriveKek(std::span<const uint8_t>(secret_bytes), kFixedSalt,
                                                   KdfParams::Current());
        REQUIRE(KekBytes(from_text.Unwrap()) == KekBytes(from_bytes.Unwrap()));
    }
}

TEST_CASE("KeyDerivation - Sensitivity", "[kdf][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto base = KekBytes(
        KeyDerivation::DeriveKek("correct-horse", kFixedSalt, kCurrentKdfVersion).Unwrap());

    SECTION("Different secret gives a different KEK") {
        auto other = KeyDerivation::DeriveKek("wrong-horse", kFixedSalt, kCurrentKdfVersion);
        REQUIRE(KekBytes(other.Unwrap()) != base);
    }

    SECTION("One salt bit changes the KEK") {
        auto salt = kFixedSalt;
        salt[0] ^= 0x01;
        auto other = KeyDerivation::DeriveKek("correct-horse", salt, kCurrentKdfVersion);
        REQUIRE(KekBytes(other.Unwrap()) != base);
    }

    SECTION("Different cost version changes the KEK") {
        auto other = KeyDerivation::DeriveKek("correct-horse", kFixedSalt, kKdfVersionInteractive);
        REQUIRE(KekBytes(other.Unwrap()) != base);
    }
}

TEST_CASE("KeyDerivation - Rejected Inputs", "[kdf][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Empty secret") {
        auto result = KeyDerivation::DeriveKek("", kFixedSalt, kCurrentKdfVersion);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == VaultFailureType::InvalidInput);
    }

    SECTION("Salt of the wrong length") {
        const std::vector<uint8_t> short_salt(8, 0x01);
        auto result = KeyDerivation::DeriveKek("correct-horse", short_salt, kCurrentKdfVersion);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == VaultFailureType::InvalidInput);
    }

    SECTION("Unknown version") {
        auto result = KeyDerivation::DeriveKek("correct-horse", kFixedSalt, 42u);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == VaultFailureType::UnsupportedFormat);
    }
}

TEST_CASE("KeyDerivation - Salt Generation", "[kdf][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto a = KeyDerivation::GenerateSalt();
    const auto b = KeyDerivation::GenerateSalt();
    REQUIRE(a.size() == kSaltBytes);
    REQUIRE(b.size() == kSaltBytes);
    REQUIRE(a != b);
}
