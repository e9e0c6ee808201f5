#pragma once
#include "phivault/interfaces/i_protected_storage.hpp"
#include "phivault/storage/in_memory_protected_storage.hpp"
#include <functional>
#include <memory>
#include <utility>

namespace phivault::keystore::test_helpers {

using interfaces::IProtectedStorage;
using storage::InMemoryProtectedStorage;

/// Forwards to an in-memory backend, but runs one-shot hooks right after the
/// next FetchEnrollmentState or right before the next ReplaceWrappedDek. Used
/// to interleave a second device's write.
class RacingStorage : public IProtectedStorage {
public:
    RacingStorage() : inner_(std::make_shared<InMemoryProtectedStorage>()) {}

    void BeforeNextReplace(std::function<void()> hook) {
        hook_ = std::move(hook);
    }

    void AfterNextStateFetch(std::function<void()> hook) {
        fetch_hook_ = std::move(hook);
    }

    [[nodiscard]] size_t ReplaceCalls() const noexcept { return replace_calls_; }

    Result<Unit, VaultFailure> StoreEnrollment(
        const std::string& owner_id, const proto::SaltRecord& salt_record) override {
        return inner_->StoreEnrollment(owner_id, salt_record);
    }
    Result<proto::SaltRecord, VaultFailure> FetchEnrollment(const std::string& owner_id) override {
        return inner_->FetchEnrollment(owner_id);
    }
    Result<proto::EnrollmentState, VaultFailure> FetchEnrollmentState(const std::string& owner_id) override {
        auto state = inner_->FetchEnrollmentState(owner_id);
        if (fetch_hook_) {
            auto hook = std::move(fetch_hook_);
            fetch_hook_ = nullptr;
            hook();
        }
        return state;
    }
    Result<Unit, VaultFailure> StoreWrappedDek(
        const std::string& owner_id, const proto::WrappedDekRecord& wrapped_dek) override {
        return inner_->StoreWrappedDek(owner_id, wrapped_dek);
    }
    Result<std::optional<proto::WrappedDekRecord>, VaultFailure> FetchWrappedDek(
        const std::string& owner_id) override {
        return inner_->FetchWrappedDek(owner_id);
    }
    Result<Unit, VaultFailure> ReplaceWrappedDek(
        const std::string& owner_id,
        const proto::WrappedDekRecord& expected,
        const proto::SaltRecord& replacement_salt,
        const proto::WrappedDekRecord& replacement) override {
        ++replace_calls_;
        if (hook_) {
            auto hook = std::move(hook_);
            hook_ = nullptr;
            hook();
        }
        return inner_->ReplaceWrappedDek(owner_id, expected, replacement_salt, replacement);
    }
    Result<Unit, VaultFailure> StoreRecoveryEntry(
        const std::string& owner_id, const proto::WrappedDekRecord& recovery_entry) override {
        return inner_->StoreRecoveryEntry(owner_id, recovery_entry);
    }
    Result<proto::WrappedDekRecord, VaultFailure> FetchRecoveryEntry(const std::string& owner_id) override {
        return inner_->FetchRecoveryEntry(owner_id);
    }
    Result<Unit, VaultFailure> PutRecord(const proto::StoredRecord& record) override {
        return inner_->PutRecord(record);
    }
    Result<proto::StoredRecord, VaultFailure> GetRecord(
        const std::string& owner_id, const std::string& record_id) override {
        return inner_->GetRecord(owner_id, record_id);
    }
    Result<std::vector<proto::RecordMetadata>, VaultFailure> ListRecords(const std::string& owner_id) override {
        return inner_->ListRecords(owner_id);
    }
    Result<Unit, VaultFailure> DeleteRecord(
        const std::string& owner_id, const std::string& record_id) override {
        return inner_->DeleteRecord(owner_id, record_id);
    }

    ~RacingStorage() override = default;

private:
    std::shared_ptr<InMemoryProtectedStorage> inner_;
    std::function<void()> hook_;
    std::function<void()> fetch_hook_;
    size_t replace_calls_ = 0;
};

}
