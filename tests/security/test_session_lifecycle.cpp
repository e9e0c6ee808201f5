#include <catch2/catch_test_macros.hpp>
#include "phivault/session/session_key_store.hpp"
#include "phivault/crypto/envelope_manager.hpp"
#include "phivault/crypto/key_derivation.hpp"
#include "phivault/core/constants.hpp"
#include "helpers/vault_fixtures.hpp"
#include <google/protobuf/util/message_differencer.h>
#include <string>

using namespace phivault::keystore;
using namespace phivault::keystore::session;
using namespace phivault::keystore::test_helpers;
using google::protobuf::util::MessageDifferencer;
namespace proto = phivault::proto;

namespace {
bool Is(const VaultFailure& f, VaultFailureType type) {
    return f.type == type;
}

std::span<const uint8_t> AsBytes(const std::string& s) {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}
}

TEST_CASE("Session Lifecycle - Uninitialized Store", "[security][session]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SessionKeyStore store(kFastConfig);
    REQUIRE(store.State() == SessionState::Uninitialized);
    REQUIRE_FALSE(store.IsActive());

    SECTION("Encrypt is refused") {
        auto result = store.EncryptRecord(SampleRoster());
        REQUIRE(result.IsErr());
        REQUIRE(Is(result.UnwrapErr(), VaultFailureType::NotInitialized));
    }

    SECTION("Decrypt is refused") {
        proto::EncryptedBlob blob;
        blob.set_format_version(kRecordFormatV1);
        REQUIRE(Is(store.DecryptRecord(blob).UnwrapErr(), VaultFailureType::NotInitialized));
    }

    SECTION("Recovery entry cannot be created") {
        REQUIRE(Is(store.CreateRecoveryEntry().UnwrapErr(), VaultFailureType::NotInitialized));
    }

    SECTION("Clear moves straight to Cleared") {
        store.Clear();
        REQUIRE(store.State() == SessionState::Cleared);
    }
}

TEST_CASE("Session Lifecycle - First Use and Unlock", "[security][session]") {
    auto enrolled = EnrollStore("correct-horse");
    REQUIRE(enrolled.store->IsActive());
    REQUIRE(enrolled.wrapped_dek.slot() == proto::KEY_SLOT_PRIMARY);
    REQUIRE(enrolled.wrapped_dek.kdf_version() == enrolled.salt_record.kdf_version());

    auto blob = enrolled.store->EncryptRecord(SampleDocument());
    REQUIRE(blob.IsOk());
    REQUIRE(blob.Unwrap().format_version() == kRecordFormatV1);

    SECTION("A second session unlocks the same DEK") {
        SessionKeyStore second(kFastConfig);
        auto unlocked = second.Initialize("correct-horse", enrolled.salt_record, enrolled.wrapped_dek);
        REQUIRE(unlocked.IsOk());
        REQUIRE_FALSE(unlocked.Unwrap().has_value());
        REQUIRE(second.IsActive());

        auto record = second.DecryptRecord(blob.Unwrap());
        REQUIRE(record.IsOk());
        REQUIRE(record.Unwrap().document().fields().at("name").string_value() == "Alex");
    }

    SECTION("Wrong secret leaves the store unlockable") {
        SessionKeyStore second(kFastConfig);
        auto rejected = second.Initialize("wrong-horse", enrolled.salt_record, enrolled.wrapped_dek);
        REQUIRE(rejected.IsErr());
        REQUIRE(Is(rejected.UnwrapErr(), VaultFailureType::AuthenticationFailure));
        REQUIRE(second.State() == SessionState::Uninitialized);

        REQUIRE(second.Initialize("correct-horse", enrolled.salt_record, enrolled.wrapped_dek).IsOk());
        REQUIRE(second.IsActive());
    }

    SECTION("Initialize on an active store is an invalid state") {
        auto again = enrolled.store->Initialize("correct-horse", enrolled.salt_record, enrolled.wrapped_dek);
        REQUIRE(again.IsErr());
        REQUIRE(Is(again.UnwrapErr(), VaultFailureType::InvalidState));
        REQUIRE(enrolled.store->IsActive());
    }

    SECTION("Version mismatch between salt and wrapped entry is rejected") {
        auto relabelled = enrolled.wrapped_dek;
        relabelled.set_kdf_version(kKdfVersionStandard);
        SessionKeyStore second(kFastConfig);
        auto result = second.Initialize("correct-horse", enrolled.salt_record, relabelled);
        REQUIRE(Is(result.UnwrapErr(), VaultFailureType::AuthenticationFailure));
    }

    SECTION("Unknown KDF version is UnsupportedFormat") {
        auto salt = enrolled.salt_record;
        salt.set_kdf_version(42);
        auto wrapped = enrolled.wrapped_dek;
        wrapped.set_kdf_version(42);
        SessionKeyStore second(kFastConfig);
        auto result = second.Initialize("correct-horse", salt, wrapped);
        REQUIRE(Is(result.UnwrapErr(), VaultFailureType::UnsupportedFormat));
    }

    SECTION("Malformed parameters are invalid input") {
        SessionKeyStore second(kFastConfig);
        REQUIRE(Is(second.Initialize("", enrolled.salt_record, enrolled.wrapped_dek).UnwrapErr(),
                   VaultFailureType::InvalidInput));
        auto short_salt = enrolled.salt_record;
        short_salt.set_salt("short");
        REQUIRE(Is(second.Initialize("correct-horse", short_salt, enrolled.wrapped_dek).UnwrapErr(),
                   VaultFailureType::InvalidInput));
        REQUIRE(second.State() == SessionState::Uninitialized);
    }
}

TEST_CASE("Session Lifecycle - Clear", "[security][session]") {
    auto enrolled = EnrollStore("correct-horse");
    auto blob = enrolled.store->EncryptRecord(SampleRoster()).Unwrap();

    enrolled.store->Clear();
    REQUIRE(enrolled.store->State() == SessionState::Cleared);

    SECTION("Cleared store refuses record operations") {
        REQUIRE(Is(enrolled.store->EncryptRecord(SampleRoster()).UnwrapErr(), VaultFailureType::NotInitialized));
        REQUIRE(Is(enrolled.store->DecryptRecord(blob).UnwrapErr(), VaultFailureType::NotInitialized));
    }

    SECTION("Cleared is terminal") {
        auto again = enrolled.store->Initialize("correct-horse", enrolled.salt_record, enrolled.wrapped_dek);
        REQUIRE(Is(again.UnwrapErr(), VaultFailureType::NotInitialized));
        REQUIRE(enrolled.store->State() == SessionState::Cleared);
    }

    SECTION("Clear is idempotent") {
        enrolled.store->Clear();
        enrolled.store->Clear();
        REQUIRE(enrolled.store->State() == SessionState::Cleared);
    }

    SECTION("A fresh store reads what the cleared one wrote") {
        SessionKeyStore next(kFastConfig);
        REQUIRE(next.Initialize("correct-horse", enrolled.salt_record, enrolled.wrapped_dek).IsOk());
        auto record = next.DecryptRecord(blob);
        REQUIRE(record.IsOk());
        REQUIRE(MessageDifferencer::Equals(record.Unwrap(), SampleRoster()));
    }
}

TEST_CASE("Session Lifecycle - Secret Rotation", "[security][session][rotation]") {
    auto enrolled = EnrollStore("correct-horse");
    auto blob = enrolled.store->EncryptRecord(SampleRoster()).Unwrap();

    SECTION("Rotated entry unlocks with the new secret and old records stay readable") {
        auto rotation = enrolled.store->RotateSecret(
            "correct-horse", enrolled.salt_record, "battery-staple", enrolled.wrapped_dek);
        REQUIRE(rotation.IsOk());
        const auto& rotated = rotation.Unwrap();
        REQUIRE(rotated.salt_record.salt() != enrolled.salt_record.salt());
        REQUIRE(rotated.salt_record.kdf_version() == kFastConfig.EnrollmentKdfVersion());
        REQUIRE(enrolled.store->IsActive());

        SessionKeyStore next(kFastConfig);
        REQUIRE(next.Initialize("battery-staple", rotated.salt_record, rotated.wrapped_dek).IsOk());
        REQUIRE(next.DecryptRecord(blob).IsOk());

        SessionKeyStore stale(kFastConfig);
        auto old_secret = stale.Initialize("correct-horse", rotated.salt_record, rotated.wrapped_dek);
        REQUIRE(Is(old_secret.UnwrapErr(), VaultFailureType::AuthenticationFailure));
    }

    SECTION("Wrong old secret is an authentication failure") {
        auto rotation = enrolled.store->RotateSecret(
            "wrong-horse", enrolled.salt_record, "battery-staple", enrolled.wrapped_dek);
        REQUIRE(Is(rotation.UnwrapErr(), VaultFailureType::AuthenticationFailure));
        REQUIRE(enrolled.store->IsActive());
    }

    SECTION("Empty new secret is invalid input") {
        auto rotation = enrolled.store->RotateSecret(
            "correct-horse", enrolled.salt_record, "", enrolled.wrapped_dek);
        REQUIRE(Is(rotation.UnwrapErr(), VaultFailureType::InvalidInput));
    }

    SECTION("Stored entry holding a different DEK is a conflict") {
        auto kek = crypto::KeyDerivation::DeriveKek(
            "correct-horse", AsBytes(enrolled.salt_record.salt()), enrolled.salt_record.kdf_version());
        REQUIRE(kek.IsOk());
        auto foreign = crypto::EnvelopeManager::WrapNewDek(kek.Unwrap(), enrolled.salt_record.kdf_version());
        REQUIRE(foreign.IsOk());

        auto rotation = enrolled.store->RotateSecret(
            "correct-horse", enrolled.salt_record, "battery-staple", foreign.Unwrap().record);
        REQUIRE(Is(rotation.UnwrapErr(), VaultFailureType::StorageConflict));
    }

    SECTION("Rotation needs an active session") {
        enrolled.store->Clear();
        auto rotation = enrolled.store->RotateSecret(
            "correct-horse", enrolled.salt_record, "battery-staple", enrolled.wrapped_dek);
        REQUIRE(Is(rotation.UnwrapErr(), VaultFailureType::NotInitialized));
    }

    SECTION("EnrollNewSecret wraps the live DEK without the old secret") {
        auto enrollment = enrolled.store->EnrollNewSecret("battery-staple");
        REQUIRE(enrollment.IsOk());
        SessionKeyStore next(kFastConfig);
        REQUIRE(next.Initialize("battery-staple", enrollment.Unwrap().salt_record,
                                enrollment.Unwrap().wrapped_dek).IsOk());
        REQUIRE(next.DecryptRecord(blob).IsOk());
    }
}

TEST_CASE("Session Lifecycle - Recovery", "[security][session][recovery]") {
    auto enrolled = EnrollStore("correct-horse");
    auto blob = enrolled.store->EncryptRecord(SampleDocument()).Unwrap();
    auto entry = enrolled.store->CreateRecoveryEntry();
    REQUIRE(entry.IsOk());
    const auto& recovery = entry.Unwrap();
    REQUIRE(recovery.wrapped_dek.slot() == proto::KEY_SLOT_RECOVERY);

    SECTION("Recovery key unlocks the DEK") {
        SessionKeyStore next(kFastConfig);
        REQUIRE(next.InitializeWithRecoveryKey(recovery.recovery_key, recovery.wrapped_dek).IsOk());
        REQUIRE(next.IsActive());
        REQUIRE(next.DecryptRecord(blob).IsOk());
    }

    SECTION("Another recovery key is an authentication failure") {
        auto other_key = crypto::EnvelopeManager::GenerateRecoveryKey().Unwrap();
        auto other_text = crypto::EnvelopeManager::ExportRecoveryKey(other_key).Unwrap();
        SessionKeyStore next(kFastConfig);
        auto result = next.InitializeWithRecoveryKey(other_text, recovery.wrapped_dek);
        REQUIRE(Is(result.UnwrapErr(), VaultFailureType::AuthenticationFailure));
        REQUIRE(next.State() == SessionState::Uninitialized);
    }

    SECTION("Malformed recovery text is invalid input") {
        SessionKeyStore next(kFastConfig);
        auto result = next.InitializeWithRecoveryKey("not base64 at all", recovery.wrapped_dek);
        REQUIRE(Is(result.UnwrapErr(), VaultFailureType::InvalidInput));
    }

    SECTION("Primary entry cannot be opened with the recovery key") {
        SessionKeyStore next(kFastConfig);
        auto result = next.InitializeWithRecoveryKey(recovery.recovery_key, enrolled.wrapped_dek);
        REQUIRE(Is(result.UnwrapErr(), VaultFailureType::AuthenticationFailure));
    }
}

TEST_CASE("Session Lifecycle - Record Limits", "[security][session]") {
    auto enrolled = EnrollStore("correct-horse", kFastConfig.WithMaxRecordBytes(32));

    SECTION("Oversized record is invalid input") {
        auto result = enrolled.store->EncryptRecord(SampleRoster());
        REQUIRE(Is(result.UnwrapErr(), VaultFailureType::InvalidInput));
    }

    SECTION("Record within the limit is sealed") {
        REQUIRE(enrolled.store->EncryptRecord(SampleDocument("Al")).IsOk());
    }

    SECTION("Blob from a newer format is UnsupportedFormat") {
        auto blob = enrolled.store->EncryptRecord(SampleDocument("Al")).Unwrap();
        blob.set_format_version(2);
        REQUIRE(Is(enrolled.store->DecryptRecord(blob).UnwrapErr(), VaultFailureType::UnsupportedFormat));
    }
}
