#include "phivault/storage/in_memory_protected_storage.hpp"
#include "phivault/core/format.hpp"
#include "phivault/debug/event_logger.hpp"
#include <google/protobuf/util/message_differencer.h>
#include <algorithm>

namespace phivault::keystore::storage {

using debug::Component;
using google::protobuf::util::MessageDifferencer;

namespace {
    VaultFailure NotEnrolled(const std::string& owner_id) {
        return VaultFailure::NotFound(compat::format("No enrollment for owner '{}'", owner_id));
    }
}

Result<Unit, VaultFailure> InMemoryProtectedStorage::StoreEnrollment(
    const std::string& owner_id,
    const proto::SaltRecord& salt_record) {
    if (owner_id.empty()) {
        return Result<Unit, VaultFailure>::Err(VaultFailure::InvalidInput("Owner id must not be empty"));
    }
    std::lock_guard guard(lock_);
    if (enrollments_.contains(owner_id)) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::StorageConflict(compat::format("Owner '{}' is already enrolled", owner_id)));
    }
    proto::EnrollmentState state;
    *state.mutable_salt() = salt_record;
    enrollments_.emplace(owner_id, std::move(state));
    PV_LOG_EVENT(Component::Storage, "StoreEnrollment", owner_id);
    return Result<Unit, VaultFailure>::Ok(unit);
}

Result<proto::SaltRecord, VaultFailure> InMemoryProtectedStorage::FetchEnrollment(
    const std::string& owner_id) {
    std::lock_guard guard(lock_);
    const auto it = enrollments_.find(owner_id);
    if (it == enrollments_.end()) {
        return Result<proto::SaltRecord, VaultFailure>::Err(NotEnrolled(owner_id));
    }
    return Result<proto::SaltRecord, VaultFailure>::Ok(it->second.salt());
}

Result<proto::EnrollmentState, VaultFailure> InMemoryProtectedStorage::FetchEnrollmentState(
    const std::string& owner_id) {
    std::lock_guard guard(lock_);
    const auto it = enrollments_.find(owner_id);
    if (it == enrollments_.end()) {
        return Result<proto::EnrollmentState, VaultFailure>::Err(NotEnrolled(owner_id));
    }
    return Result<proto::EnrollmentState, VaultFailure>::Ok(it->second);
}

Result<Unit, VaultFailure> InMemoryProtectedStorage::StoreWrappedDek(
    const std::string& owner_id,
    const proto::WrappedDekRecord& wrapped_dek) {
    std::lock_guard guard(lock_);
    const auto it = enrollments_.find(owner_id);
    if (it == enrollments_.end()) {
        return Result<Unit, VaultFailure>::Err(NotEnrolled(owner_id));
    }
    if (it->second.has_primary()) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::StorageConflict("A data key is already stored for this owner"));
    }
    *it->second.mutable_primary() = wrapped_dek;
    return Result<Unit, VaultFailure>::Ok(unit);
}

Result<std::optional<proto::WrappedDekRecord>, VaultFailure> InMemoryProtectedStorage::FetchWrappedDek(
    const std::string& owner_id) {
    using FetchResult = Result<std::optional<proto::WrappedDekRecord>, VaultFailure>;
    std::lock_guard guard(lock_);
    const auto it = enrollments_.find(owner_id);
    if (it == enrollments_.end()) {
        return FetchResult::Err(NotEnrolled(owner_id));
    }
    if (!it->second.has_primary()) {
        return FetchResult::Ok(std::nullopt);
    }
    return FetchResult::Ok(it->second.primary());
}

Result<Unit, VaultFailure> InMemoryProtectedStorage::ReplaceWrappedDek(
    const std::string& owner_id,
    const proto::WrappedDekRecord& expected,
    const proto::SaltRecord& replacement_salt,
    const proto::WrappedDekRecord& replacement) {
    std::lock_guard guard(lock_);
    const auto it = enrollments_.find(owner_id);
    if (it == enrollments_.end()) {
        return Result<Unit, VaultFailure>::Err(NotEnrolled(owner_id));
    }
    if (!it->second.has_primary() || !MessageDifferencer::Equals(it->second.primary(), expected)) {
        PV_LOG_EVENT(Component::Storage, "ReplaceWrappedDek", "stale expected value");
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::StorageConflict("Stored data key changed since it was read"));
    }
    *it->second.mutable_salt() = replacement_salt;
    *it->second.mutable_primary() = replacement;
    return Result<Unit, VaultFailure>::Ok(unit);
}

Result<Unit, VaultFailure> InMemoryProtectedStorage::StoreRecoveryEntry(
    const std::string& owner_id,
    const proto::WrappedDekRecord& recovery_entry) {
    std::lock_guard guard(lock_);
    const auto it = enrollments_.find(owner_id);
    if (it == enrollments_.end()) {
        return Result<Unit, VaultFailure>::Err(NotEnrolled(owner_id));
    }
    *it->second.mutable_recovery() = recovery_entry;
    return Result<Unit, VaultFailure>::Ok(unit);
}

Result<proto::WrappedDekRecord, VaultFailure> InMemoryProtectedStorage::FetchRecoveryEntry(
    const std::string& owner_id) {
    std::lock_guard guard(lock_);
    const auto it = enrollments_.find(owner_id);
    if (it == enrollments_.end()) {
        return Result<proto::WrappedDekRecord, VaultFailure>::Err(NotEnrolled(owner_id));
    }
    if (!it->second.has_recovery()) {
        return Result<proto::WrappedDekRecord, VaultFailure>::Err(
            VaultFailure::NotFound("No recovery entry for this owner"));
    }
    return Result<proto::WrappedDekRecord, VaultFailure>::Ok(it->second.recovery());
}

Result<Unit, VaultFailure> InMemoryProtectedStorage::PutRecord(const proto::StoredRecord& record) {
    const auto& metadata = record.metadata();
    if (metadata.owner_id().empty() || metadata.record_id().empty()) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::InvalidInput("Stored record needs an owner id and a record id"));
    }
    std::lock_guard guard(lock_);
    records_[metadata.owner_id()][metadata.record_id()] = record;
    PV_LOG_EVENT(Component::Storage, "PutRecord", metadata.record_id());
    return Result<Unit, VaultFailure>::Ok(unit);
}

Result<proto::StoredRecord, VaultFailure> InMemoryProtectedStorage::GetRecord(
    const std::string& owner_id,
    const std::string& record_id) {
    std::lock_guard guard(lock_);
    const auto owner_it = records_.find(owner_id);
    if (owner_it != records_.end()) {
        const auto it = owner_it->second.find(record_id);
        if (it != owner_it->second.end()) {
            return Result<proto::StoredRecord, VaultFailure>::Ok(it->second);
        }
    }
    return Result<proto::StoredRecord, VaultFailure>::Err(
        VaultFailure::NotFound(compat::format("Record '{}' not found", record_id)));
}

Result<std::vector<proto::RecordMetadata>, VaultFailure> InMemoryProtectedStorage::ListRecords(
    const std::string& owner_id) {
    std::vector<proto::RecordMetadata> listing;
    {
        std::lock_guard guard(lock_);
        const auto owner_it = records_.find(owner_id);
        if (owner_it != records_.end()) {
            listing.reserve(owner_it->second.size());
            for (const auto& [record_id, stored] : owner_it->second) {
                listing.push_back(stored.metadata());
            }
        }
    }
    std::stable_sort(listing.begin(), listing.end(),
        [](const proto::RecordMetadata& a, const proto::RecordMetadata& b) {
            if (a.created_at().seconds() != b.created_at().seconds()) {
                return a.created_at().seconds() < b.created_at().seconds();
            }
            return a.created_at().nanos() < b.created_at().nanos();
        });
    return Result<std::vector<proto::RecordMetadata>, VaultFailure>::Ok(std::move(listing));
}

Result<Unit, VaultFailure> InMemoryProtectedStorage::DeleteRecord(
    const std::string& owner_id,
    const std::string& record_id) {
    std::lock_guard guard(lock_);
    const auto owner_it = records_.find(owner_id);
    if (owner_it == records_.end() || owner_it->second.erase(record_id) == 0) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::NotFound(compat::format("Record '{}' not found", record_id)));
    }
    return Result<Unit, VaultFailure>::Ok(unit);
}

size_t InMemoryProtectedStorage::RecordCount() const {
    std::lock_guard guard(lock_);
    size_t total = 0;
    for (const auto& [owner_id, owned] : records_) {
        total += owned.size();
    }
    return total;
}

}
