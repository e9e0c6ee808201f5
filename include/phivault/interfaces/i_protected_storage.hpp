#pragma once
#include "phivault/core/result.hpp"
#include "phivault/core/failures.hpp"
#include "phivault/keystore.pb.h"
#include <optional>
#include <string>
#include <vector>
namespace phivault::keystore::interfaces {

/// Backend seam. Implementations only ever see salts, wrapped keys,
/// ciphertext and non-protected metadata; they never inspect a blob.
///
/// Missing entries are NotFound; writes that would clobber an existing
/// enrollment, or a compare-and-swap against a stale value, are
/// StorageConflict.
class IProtectedStorage {
public:
    virtual ~IProtectedStorage() = default;

    [[nodiscard]] virtual Result<Unit, VaultFailure> StoreEnrollment(
        const std::string& owner_id,
        const proto::SaltRecord& salt_record) = 0;
    [[nodiscard]] virtual Result<proto::SaltRecord, VaultFailure> FetchEnrollment(
        const std::string& owner_id) = 0;

    /// Salt, primary entry and recovery entry read together, so a concurrent
    /// ReplaceWrappedDek is seen either entirely or not at all
    [[nodiscard]] virtual Result<proto::EnrollmentState, VaultFailure> FetchEnrollmentState(
        const std::string& owner_id) = 0;

    /// First-use write of the primary entry
    [[nodiscard]] virtual Result<Unit, VaultFailure> StoreWrappedDek(
        const std::string& owner_id,
        const proto::WrappedDekRecord& wrapped_dek) = 0;
    /// std::nullopt when the owner is enrolled but no DEK exists yet
    [[nodiscard]] virtual Result<std::optional<proto::WrappedDekRecord>, VaultFailure> FetchWrappedDek(
        const std::string& owner_id) = 0;

    /// Replace salt and primary entry together, only if the stored entry still
    /// equals @p expected. All-or-nothing.
    [[nodiscard]] virtual Result<Unit, VaultFailure> ReplaceWrappedDek(
        const std::string& owner_id,
        const proto::WrappedDekRecord& expected,
        const proto::SaltRecord& replacement_salt,
        const proto::WrappedDekRecord& replacement) = 0;

    [[nodiscard]] virtual Result<Unit, VaultFailure> StoreRecoveryEntry(
        const std::string& owner_id,
        const proto::WrappedDekRecord& recovery_entry) = 0;
    [[nodiscard]] virtual Result<proto::WrappedDekRecord, VaultFailure> FetchRecoveryEntry(
        const std::string& owner_id) = 0;

    /// Insert or replace, keyed by metadata.owner_id and metadata.record_id
    [[nodiscard]] virtual Result<Unit, VaultFailure> PutRecord(const proto::StoredRecord& record) = 0;
    [[nodiscard]] virtual Result<proto::StoredRecord, VaultFailure> GetRecord(
        const std::string& owner_id,
        const std::string& record_id) = 0;
    [[nodiscard]] virtual Result<std::vector<proto::RecordMetadata>, VaultFailure> ListRecords(
        const std::string& owner_id) = 0;
    [[nodiscard]] virtual Result<Unit, VaultFailure> DeleteRecord(
        const std::string& owner_id,
        const std::string& record_id) = 0;
};
}
