#pragma once
#include "phivault/core/failures.hpp"
#include "phivault/core/result.hpp"
#include "phivault/configuration/vault_config.hpp"
#include "phivault/crypto/secure_memory_handle.hpp"
#include "phivault/models/record_context.hpp"
#include "phivault/keystore.pb.h"
#include "phivault/records.pb.h"
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace phivault::keystore::session {

enum class SessionState : uint8_t {
    Uninitialized = 0,
    Active = 1,
    Cleared = 2
};

/// Holds the unwrapped DEK for one logical session.
///
/// Uninitialized -> Active -> Cleared. Cleared is terminal: a new session
/// needs a new store. The KEK never outlives Initialize/RotateSecret; the DEK
/// lives in guarded memory and is wiped on Clear() or destruction.
///
/// Thread Safety: EncryptRecord/DecryptRecord take a shared lock and may run
/// concurrently. Every method that changes key material or state takes the
/// exclusive lock.
class SessionKeyStore {
public:
    struct SecretRotation {
        proto::SaltRecord salt_record;
        proto::WrappedDekRecord wrapped_dek;
    };

    struct RecoveryEntry {
        std::string recovery_key;   ///< base64, shown to the user once
        proto::WrappedDekRecord wrapped_dek;
    };

    explicit SessionKeyStore(
        configuration::VaultConfig config = configuration::VaultConfig::Default());

    /// Fresh random salt tagged with @p kdf_version. UnsupportedFormat for
    /// unknown versions.
    [[nodiscard]] static Result<proto::SaltRecord, VaultFailure> NewSaltRecord(uint32_t kdf_version);

    /// Derive the KEK and unwrap @p wrapped_dek, or create a DEK when
    /// @p wrapped_dek is empty (first use). Returns the new WrappedDekRecord
    /// on first use, std::nullopt otherwise.
    ///
    /// Wrong secret or corrupted entry: AuthenticationFailure, state unchanged.
    [[nodiscard]] Result<std::optional<proto::WrappedDekRecord>, VaultFailure> Initialize(
        std::string_view secret,
        const proto::SaltRecord& salt_record,
        const std::optional<proto::WrappedDekRecord>& wrapped_dek);

    [[nodiscard]] Result<Unit, VaultFailure> InitializeWithRecoveryKey(
        std::string_view recovery_key,
        const proto::WrappedDekRecord& recovery_entry);

    [[nodiscard]] Result<proto::EncryptedBlob, VaultFailure> EncryptRecord(
        const proto::ProtectedRecord& record,
        const models::RecordContext& context = {}) const;

    [[nodiscard]] Result<proto::ProtectedRecord, VaultFailure> DecryptRecord(
        const proto::EncryptedBlob& blob,
        const models::RecordContext& context = {}) const;

    /// Re-derives the current KEK from @p old_secret, rewraps the DEK under a
    /// KEK from @p new_secret with a fresh salt, and checks the stored entry
    /// holds the live DEK (StorageConflict if not). The session stays Active.
    [[nodiscard]] Result<SecretRotation, VaultFailure> RotateSecret(
        std::string_view old_secret,
        const proto::SaltRecord& old_salt_record,
        std::string_view new_secret,
        const proto::WrappedDekRecord& current_wrapped_dek);

    /// Wrap the live DEK under a new secret without the old one. Used after
    /// unlocking through the recovery slot.
    [[nodiscard]] Result<SecretRotation, VaultFailure> EnrollNewSecret(std::string_view new_secret);

    [[nodiscard]] Result<RecoveryEntry, VaultFailure> CreateRecoveryEntry() const;

    /// Wipes the DEK. Idempotent.
    void Clear();

    [[nodiscard]] SessionState State() const;
    [[nodiscard]] bool IsActive() const;
    [[nodiscard]] const configuration::VaultConfig& Config() const noexcept { return config_; }

    SessionKeyStore(const SessionKeyStore&) = delete;
    SessionKeyStore& operator=(const SessionKeyStore&) = delete;
    SessionKeyStore(SessionKeyStore&&) = delete;
    SessionKeyStore& operator=(SessionKeyStore&&) = delete;
    ~SessionKeyStore();

private:
    [[nodiscard]] Result<Unit, VaultFailure> RequireActive() const;
    [[nodiscard]] Result<Unit, VaultFailure> RequireInitializable() const;
    [[nodiscard]] Result<SecretRotation, VaultFailure> WrapUnderNewSecret(std::string_view new_secret);

    configuration::VaultConfig config_;
    SessionState state_ = SessionState::Uninitialized;
    crypto::SecureMemoryHandle dek_;
    mutable std::shared_mutex lock_;
};

}
