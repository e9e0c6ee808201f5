#pragma once
#include "phivault/interfaces/i_protected_storage.hpp"
#include <map>
#include <mutex>
#include <string>

namespace phivault::keystore::storage {

/// Thread-safe in-process backend. Stands in for the server store in the
/// example and the tests.
class InMemoryProtectedStorage final : public interfaces::IProtectedStorage {
public:
    InMemoryProtectedStorage() = default;

    [[nodiscard]] Result<Unit, VaultFailure> StoreEnrollment(
        const std::string& owner_id,
        const proto::SaltRecord& salt_record) override;
    [[nodiscard]] Result<proto::SaltRecord, VaultFailure> FetchEnrollment(
        const std::string& owner_id) override;
    [[nodiscard]] Result<proto::EnrollmentState, VaultFailure> FetchEnrollmentState(
        const std::string& owner_id) override;

    [[nodiscard]] Result<Unit, VaultFailure> StoreWrappedDek(
        const std::string& owner_id,
        const proto::WrappedDekRecord& wrapped_dek) override;
    [[nodiscard]] Result<std::optional<proto::WrappedDekRecord>, VaultFailure> FetchWrappedDek(
        const std::string& owner_id) override;

    [[nodiscard]] Result<Unit, VaultFailure> ReplaceWrappedDek(
        const std::string& owner_id,
        const proto::WrappedDekRecord& expected,
        const proto::SaltRecord& replacement_salt,
        const proto::WrappedDekRecord& replacement) override;

    [[nodiscard]] Result<Unit, VaultFailure> StoreRecoveryEntry(
        const std::string& owner_id,
        const proto::WrappedDekRecord& recovery_entry) override;
    [[nodiscard]] Result<proto::WrappedDekRecord, VaultFailure> FetchRecoveryEntry(
        const std::string& owner_id) override;

    [[nodiscard]] Result<Unit, VaultFailure> PutRecord(const proto::StoredRecord& record) override;
    [[nodiscard]] Result<proto::StoredRecord, VaultFailure> GetRecord(
        const std::string& owner_id,
        const std::string& record_id) override;
    [[nodiscard]] Result<std::vector<proto::RecordMetadata>, VaultFailure> ListRecords(
        const std::string& owner_id) override;
    [[nodiscard]] Result<Unit, VaultFailure> DeleteRecord(
        const std::string& owner_id,
        const std::string& record_id) override;

    [[nodiscard]] size_t RecordCount() const;

private:
    std::map<std::string, proto::EnrollmentState> enrollments_;
    std::map<std::string, std::map<std::string, proto::StoredRecord>> records_;
    mutable std::mutex lock_;
};

}
