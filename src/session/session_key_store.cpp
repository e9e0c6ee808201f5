#include "phivault/session/session_key_store.hpp"
#include "phivault/codec/blob_codec.hpp"
#include "phivault/configuration/kdf_params.hpp"
#include "phivault/crypto/authenticated_cipher.hpp"
#include "phivault/crypto/envelope_manager.hpp"
#include "phivault/crypto/key_derivation.hpp"
#include "phivault/crypto/sodium_interop.hpp"
#include "phivault/core/constants.hpp"
#include "phivault/core/format.hpp"
#include "phivault/debug/event_logger.hpp"
#include <mutex>

namespace phivault::keystore::session {

using codec::BlobCodec;
using configuration::KdfParams;
using crypto::AuthenticatedCipher;
using crypto::EnvelopeManager;
using crypto::KeyDerivation;
using crypto::SecureMemoryHandle;
using crypto::SodiumInterop;
using debug::Component;

namespace {

    std::span<const uint8_t> AsBytes(const std::string& s) {
        return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
    }

    /// Caller errors and version mismatches keep their kind; anything else
    /// that happens while unlocking is reported as a bad secret.
    VaultFailure AsUnlockFailure(VaultFailure failure) {
        switch (failure.type) {
            case VaultFailureType::InvalidInput:
            case VaultFailureType::UnsupportedFormat:
            case VaultFailureType::NotInitialized:
                return failure;
            default:
                return VaultFailure::AuthenticationFailure(std::string(ErrorMessages::UNLOCK_FAILED));
        }
    }

    void WipeBytes(std::vector<uint8_t>& bytes) {
        auto __wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(bytes));
        (void)__wipe;
    }

    [[maybe_unused]] const char* StateName(const SessionState state) {
        switch (state) {
            case SessionState::Uninitialized: return "Uninitialized";
            case SessionState::Active: return "Active";
            case SessionState::Cleared: return "Cleared";
        }
        return "Unknown";
    }
}

SessionKeyStore::SessionKeyStore(configuration::VaultConfig config)
    : config_(config) {}

SessionKeyStore::~SessionKeyStore() {
    Clear();
}

Result<proto::SaltRecord, VaultFailure> SessionKeyStore::NewSaltRecord(const uint32_t kdf_version) {
    if (!KdfParams::IsKnownVersion(kdf_version)) {
        return Result<proto::SaltRecord, VaultFailure>::Err(
            VaultFailure::UnsupportedFormat(compat::format("Unknown KDF version {}", kdf_version)));
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<proto::SaltRecord, VaultFailure>::Err(
            VaultFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    const auto salt = KeyDerivation::GenerateSalt();
    proto::SaltRecord record;
    record.set_salt(salt.data(), salt.size());
    record.set_kdf_version(kdf_version);
    return Result<proto::SaltRecord, VaultFailure>::Ok(std::move(record));
}

Result<Unit, VaultFailure> SessionKeyStore::RequireActive() const {
    if (state_ != SessionState::Active) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::NotInitialized(std::string(ErrorMessages::SESSION_NOT_ACTIVE)));
    }
    return Result<Unit, VaultFailure>::Ok(unit);
}

Result<Unit, VaultFailure> SessionKeyStore::RequireInitializable() const {
    switch (state_) {
        case SessionState::Uninitialized:
            return Result<Unit, VaultFailure>::Ok(unit);
        case SessionState::Active:
            return Result<Unit, VaultFailure>::Err(
                VaultFailure::InvalidState("Session key store is already active"));
        case SessionState::Cleared:
            break;
    }
    return Result<Unit, VaultFailure>::Err(
        VaultFailure::NotInitialized("Session key store has been cleared"));
}

Result<std::optional<proto::WrappedDekRecord>, VaultFailure> SessionKeyStore::Initialize(
    const std::string_view secret,
    const proto::SaltRecord& salt_record,
    const std::optional<proto::WrappedDekRecord>& wrapped_dek) {
    using InitResult = Result<std::optional<proto::WrappedDekRecord>, VaultFailure>;

    std::unique_lock guard(lock_);
    if (auto ready = RequireInitializable(); ready.IsErr()) {
        return InitResult::Err(std::move(ready).UnwrapErr());
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return InitResult::Err(VaultFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    if (wrapped_dek.has_value() &&
        wrapped_dek->kdf_version() != salt_record.kdf_version()) {
        return InitResult::Err(
            VaultFailure::AuthenticationFailure(std::string(ErrorMessages::UNLOCK_FAILED)));
    }

    auto kek_result = KeyDerivation::DeriveKek(secret, AsBytes(salt_record.salt()),
                                               salt_record.kdf_version());
    if (kek_result.IsErr()) {
        return InitResult::Err(AsUnlockFailure(std::move(kek_result).UnwrapErr()));
    }
    auto kek = std::move(kek_result).Unwrap();

    std::optional<proto::WrappedDekRecord> created;
    if (wrapped_dek.has_value()) {
        auto dek = EnvelopeManager::Unwrap(kek, *wrapped_dek);
        kek.Reset();
        if (dek.IsErr()) {
            PV_LOG_EVENT(Component::Session, "Initialize", "unwrap rejected");
            return InitResult::Err(AsUnlockFailure(std::move(dek).UnwrapErr()));
        }
        dek_ = std::move(dek).Unwrap();
    } else {
        auto generated = EnvelopeManager::WrapNewDek(kek, salt_record.kdf_version());
        kek.Reset();
        if (generated.IsErr()) {
            return InitResult::Err(std::move(generated).UnwrapErr());
        }
        auto [dek, record] = std::move(generated).Unwrap();
        dek_ = std::move(dek);
        created = std::move(record);
        PV_LOG_EVENT(Component::Session, "Initialize", "created new DEK");
    }

    state_ = SessionState::Active;
    PV_LOG_EVENT(Component::Session, "Initialize", StateName(state_));
    return InitResult::Ok(std::move(created));
}

Result<Unit, VaultFailure> SessionKeyStore::InitializeWithRecoveryKey(
    const std::string_view recovery_key,
    const proto::WrappedDekRecord& recovery_entry) {
    std::unique_lock guard(lock_);
    if (auto ready = RequireInitializable(); ready.IsErr()) {
        return ready;
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<Unit, VaultFailure>::Err(VaultFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    auto key_result = EnvelopeManager::ImportRecoveryKey(recovery_key);
    if (key_result.IsErr()) {
        return Result<Unit, VaultFailure>::Err(std::move(key_result).UnwrapErr());
    }
    auto key = std::move(key_result).Unwrap();
    auto dek = EnvelopeManager::UnwrapWithRecoveryKey(key, recovery_entry);
    key.Reset();
    if (dek.IsErr()) {
        return Result<Unit, VaultFailure>::Err(AsUnlockFailure(std::move(dek).UnwrapErr()));
    }

    dek_ = std::move(dek).Unwrap();
    state_ = SessionState::Active;
    PV_LOG_EVENT(Component::Session, "InitializeWithRecoveryKey", StateName(state_));
    return Result<Unit, VaultFailure>::Ok(unit);
}

Result<proto::EncryptedBlob, VaultFailure> SessionKeyStore::EncryptRecord(
    const proto::ProtectedRecord& record,
    const models::RecordContext& context) const {
    std::shared_lock guard(lock_);
    if (auto active = RequireActive(); active.IsErr()) {
        return Result<proto::EncryptedBlob, VaultFailure>::Err(std::move(active).UnwrapErr());
    }

    const uint32_t format_version = config_.RecordFormatVersion();
    auto ad_result = BlobCodec::BuildRecordAssociatedData(format_version, context);
    if (ad_result.IsErr()) {
        return Result<proto::EncryptedBlob, VaultFailure>::Err(std::move(ad_result).UnwrapErr());
    }
    auto encoded = BlobCodec::Encode(record, format_version);
    if (encoded.IsErr()) {
        return Result<proto::EncryptedBlob, VaultFailure>::Err(std::move(encoded).UnwrapErr());
    }
    auto plaintext = std::move(encoded).Unwrap();
    if (plaintext.size() > config_.MaxRecordBytes()) {
        WipeBytes(plaintext);
        return Result<proto::EncryptedBlob, VaultFailure>::Err(
            VaultFailure::InvalidInput(
                compat::format("Record exceeds the maximum of {} bytes", config_.MaxRecordBytes())));
    }

    auto sealed = AuthenticatedCipher::Seal(dek_, plaintext, ad_result.Unwrap());
    WipeBytes(plaintext);
    if (sealed.IsErr()) {
        return Result<proto::EncryptedBlob, VaultFailure>::Err(std::move(sealed).UnwrapErr());
    }
    const auto& payload = sealed.Unwrap();

    proto::EncryptedBlob blob;
    blob.set_ciphertext(payload.ciphertext.data(), payload.ciphertext.size());
    blob.set_nonce(payload.nonce.data(), payload.nonce.size());
    blob.set_format_version(format_version);
    PV_LOG_VALUE(Component::Session, "EncryptRecord", "ciphertext_bytes", payload.ciphertext.size());
    return Result<proto::EncryptedBlob, VaultFailure>::Ok(std::move(blob));
}

Result<proto::ProtectedRecord, VaultFailure> SessionKeyStore::DecryptRecord(
    const proto::EncryptedBlob& blob,
    const models::RecordContext& context) const {
    std::shared_lock guard(lock_);
    if (auto active = RequireActive(); active.IsErr()) {
        return Result<proto::ProtectedRecord, VaultFailure>::Err(std::move(active).UnwrapErr());
    }
    if (!BlobCodec::IsSupportedFormat(blob.format_version())) {
        return Result<proto::ProtectedRecord, VaultFailure>::Err(
            VaultFailure::UnsupportedFormat(
                compat::format("Unsupported record format version {}", blob.format_version())));
    }

    auto ad_result = BlobCodec::BuildRecordAssociatedData(blob.format_version(), context);
    if (ad_result.IsErr()) {
        return Result<proto::ProtectedRecord, VaultFailure>::Err(std::move(ad_result).UnwrapErr());
    }
    auto opened = AuthenticatedCipher::Open(
        dek_, AsBytes(blob.ciphertext()), AsBytes(blob.nonce()), ad_result.Unwrap());
    if (opened.IsErr()) {
        return Result<proto::ProtectedRecord, VaultFailure>::Err(std::move(opened).UnwrapErr());
    }
    auto plaintext = std::move(opened).Unwrap();
    auto decoded = BlobCodec::Decode(plaintext, blob.format_version());
    WipeBytes(plaintext);
    return decoded;
}

Result<SessionKeyStore::SecretRotation, VaultFailure> SessionKeyStore::WrapUnderNewSecret(
    const std::string_view new_secret) {
    auto salt_result = NewSaltRecord(config_.EnrollmentKdfVersion());
    if (salt_result.IsErr()) {
        return Result<SecretRotation, VaultFailure>::Err(std::move(salt_result).UnwrapErr());
    }
    auto salt_record = std::move(salt_result).Unwrap();

    auto kek_result = KeyDerivation::DeriveKek(
        new_secret, AsBytes(salt_record.salt()), salt_record.kdf_version());
    if (kek_result.IsErr()) {
        return Result<SecretRotation, VaultFailure>::Err(std::move(kek_result).UnwrapErr());
    }
    auto kek = std::move(kek_result).Unwrap();
    auto wrapped = EnvelopeManager::Wrap(kek, dek_, salt_record.kdf_version());
    kek.Reset();
    if (wrapped.IsErr()) {
        return Result<SecretRotation, VaultFailure>::Err(std::move(wrapped).UnwrapErr());
    }
    return Result<SecretRotation, VaultFailure>::Ok(
        SecretRotation{std::move(salt_record), std::move(wrapped).Unwrap()});
}

Result<SessionKeyStore::SecretRotation, VaultFailure> SessionKeyStore::RotateSecret(
    const std::string_view old_secret,
    const proto::SaltRecord& old_salt_record,
    const std::string_view new_secret,
    const proto::WrappedDekRecord& current_wrapped_dek) {
    std::unique_lock guard(lock_);
    if (auto active = RequireActive(); active.IsErr()) {
        return Result<SecretRotation, VaultFailure>::Err(std::move(active).UnwrapErr());
    }
    if (new_secret.empty()) {
        return Result<SecretRotation, VaultFailure>::Err(
            VaultFailure::InvalidInput("New secret must not be empty"));
    }

    auto old_kek_result = KeyDerivation::DeriveKek(
        old_secret, AsBytes(old_salt_record.salt()), old_salt_record.kdf_version());
    if (old_kek_result.IsErr()) {
        return Result<SecretRotation, VaultFailure>::Err(
            AsUnlockFailure(std::move(old_kek_result).UnwrapErr()));
    }
    auto old_kek = std::move(old_kek_result).Unwrap();

    auto salt_result = NewSaltRecord(config_.EnrollmentKdfVersion());
    if (salt_result.IsErr()) {
        return Result<SecretRotation, VaultFailure>::Err(std::move(salt_result).UnwrapErr());
    }
    auto new_salt_record = std::move(salt_result).Unwrap();
    auto new_kek_result = KeyDerivation::DeriveKek(
        new_secret, AsBytes(new_salt_record.salt()), new_salt_record.kdf_version());
    if (new_kek_result.IsErr()) {
        return Result<SecretRotation, VaultFailure>::Err(std::move(new_kek_result).UnwrapErr());
    }
    auto new_kek = std::move(new_kek_result).Unwrap();

    auto rewrapped = EnvelopeManager::Rewrap(
        old_kek, new_kek, current_wrapped_dek, new_salt_record.kdf_version());
    old_kek.Reset();
    if (rewrapped.IsErr()) {
        return Result<SecretRotation, VaultFailure>::Err(
            AsUnlockFailure(std::move(rewrapped).UnwrapErr()));
    }
    auto new_record = std::move(rewrapped).Unwrap();

    auto check = EnvelopeManager::Unwrap(new_kek, new_record);
    new_kek.Reset();
    if (check.IsErr()) {
        return Result<SecretRotation, VaultFailure>::Err(std::move(check).UnwrapErr());
    }
    auto same = check.Unwrap().ConstantTimeEquals(dek_);
    if (same.IsErr()) {
        return Result<SecretRotation, VaultFailure>::Err(
            VaultFailure::FromSodiumFailure(same.UnwrapErr()));
    }
    if (!same.Unwrap()) {
        return Result<SecretRotation, VaultFailure>::Err(
            VaultFailure::StorageConflict("Stored data key does not match the active session"));
    }

    PV_LOG_VALUE(Component::Session, "RotateSecret", "kdf_version", new_salt_record.kdf_version());
    return Result<SecretRotation, VaultFailure>::Ok(
        SecretRotation{std::move(new_salt_record), std::move(new_record)});
}

Result<SessionKeyStore::SecretRotation, VaultFailure> SessionKeyStore::EnrollNewSecret(
    const std::string_view new_secret) {
    std::unique_lock guard(lock_);
    if (auto active = RequireActive(); active.IsErr()) {
        return Result<SecretRotation, VaultFailure>::Err(std::move(active).UnwrapErr());
    }
    return WrapUnderNewSecret(new_secret);
}

Result<SessionKeyStore::RecoveryEntry, VaultFailure> SessionKeyStore::CreateRecoveryEntry() const {
    std::unique_lock guard(lock_);
    if (auto active = RequireActive(); active.IsErr()) {
        return Result<RecoveryEntry, VaultFailure>::Err(std::move(active).UnwrapErr());
    }

    auto key_result = EnvelopeManager::GenerateRecoveryKey();
    if (key_result.IsErr()) {
        return Result<RecoveryEntry, VaultFailure>::Err(std::move(key_result).UnwrapErr());
    }
    auto key = std::move(key_result).Unwrap();
    auto wrapped = EnvelopeManager::WrapForRecovery(dek_, key);
    if (wrapped.IsErr()) {
        return Result<RecoveryEntry, VaultFailure>::Err(std::move(wrapped).UnwrapErr());
    }
    auto exported = EnvelopeManager::ExportRecoveryKey(key);
    if (exported.IsErr()) {
        return Result<RecoveryEntry, VaultFailure>::Err(std::move(exported).UnwrapErr());
    }
    PV_LOG_EVENT(Component::Session, "CreateRecoveryEntry", "recovery slot wrapped");
    return Result<RecoveryEntry, VaultFailure>::Ok(
        RecoveryEntry{std::move(exported).Unwrap(), std::move(wrapped).Unwrap()});
}

void SessionKeyStore::Clear() {
    std::unique_lock guard(lock_);
    dek_.Reset();
    if (state_ != SessionState::Cleared) {
        state_ = SessionState::Cleared;
        PV_LOG_EVENT(Component::Session, "Clear", StateName(state_));
    }
}

SessionState SessionKeyStore::State() const {
    std::shared_lock guard(lock_);
    return state_;
}

bool SessionKeyStore::IsActive() const {
    return State() == SessionState::Active;
}

}
