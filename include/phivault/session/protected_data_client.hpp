#pragma once
#include "phivault/core/failures.hpp"
#include "phivault/core/result.hpp"
#include "phivault/configuration/vault_config.hpp"
#include "phivault/interfaces/i_protected_storage.hpp"
#include "phivault/session/session_key_store.hpp"
#include "phivault/keystore.pb.h"
#include "phivault/records.pb.h"
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace phivault::keystore::session {

/// Client-side flows for one owner against a storage backend.
///
/// Enroll/Unlock start a session, Lock ends it. Everything the backend
/// receives is a salt, a wrapped key, ciphertext or non-protected metadata.
/// Records are bound to (owner id, record id), so a blob moved to another
/// record id fails with IntegrityFailure.
///
/// Thread Safety: record operations may run concurrently; lifecycle
/// operations are exclusive.
class ProtectedDataClient {
public:
    /// InvalidInput for a null backend, an empty or oversized owner id, or a
    /// config naming unsupported versions
    [[nodiscard]] static Result<std::unique_ptr<ProtectedDataClient>, VaultFailure> Create(
        std::shared_ptr<interfaces::IProtectedStorage> storage,
        std::string owner_id,
        configuration::VaultConfig config = configuration::VaultConfig::Default());

    /// First sign-in: new salt, new DEK, both persisted. Leaves the session Active.
    [[nodiscard]] Result<Unit, VaultFailure> Enroll(std::string_view secret);

    [[nodiscard]] Result<Unit, VaultFailure> Unlock(std::string_view secret);

    /// Wipes the DEK. Safe to call in any state.
    void Lock();

    /// Rewraps the DEK under @p new_secret and swaps the stored entry
    /// atomically. Existing records stay readable without re-encryption.
    [[nodiscard]] Result<Unit, VaultFailure> ChangeSecret(
        std::string_view old_secret, std::string_view new_secret);

    /// Returns the base64 recovery key; the backend only receives the wrapped entry.
    [[nodiscard]] Result<std::string, VaultFailure> SetupRecovery();

    /// Unlock through the recovery entry, then re-enroll @p new_secret.
    [[nodiscard]] Result<Unit, VaultFailure> RecoverWithKey(
        std::string_view recovery_key, std::string_view new_secret);

    /// Encrypts and stores a new record under a generated id.
    [[nodiscard]] Result<proto::RecordMetadata, VaultFailure> CreateRecord(
        std::string display_name, const proto::ProtectedRecord& record);

    /// Encrypts and stores @p record under @p record_id, keeping created_at
    /// if the record already exists.
    [[nodiscard]] Result<proto::RecordMetadata, VaultFailure> SaveRecord(
        const std::string& record_id,
        std::string display_name,
        const proto::ProtectedRecord& record);

    [[nodiscard]] Result<proto::ProtectedRecord, VaultFailure> LoadRecord(const std::string& record_id);

    [[nodiscard]] Result<std::vector<proto::RecordMetadata>, VaultFailure> ListRecords();

    [[nodiscard]] Result<Unit, VaultFailure> DeleteRecord(const std::string& record_id);

    [[nodiscard]] SessionState State() const;
    [[nodiscard]] const std::string& OwnerId() const noexcept { return owner_id_; }

    ProtectedDataClient(const ProtectedDataClient&) = delete;
    ProtectedDataClient& operator=(const ProtectedDataClient&) = delete;
    ~ProtectedDataClient();

private:
    ProtectedDataClient(
        std::shared_ptr<interfaces::IProtectedStorage> storage,
        std::string owner_id,
        configuration::VaultConfig config);

    /// Swap in a fresh store if the current one is Cleared
    void PrepareStore();

    [[nodiscard]] models::RecordContext ContextFor(const std::string& record_id) const;

    std::shared_ptr<interfaces::IProtectedStorage> storage_;
    std::string owner_id_;
    configuration::VaultConfig config_;
    std::unique_ptr<SessionKeyStore> store_;
    mutable std::shared_mutex lock_;
};

}
