#include "phivault/session/protected_data_client.hpp"
#include "phivault/crypto/sodium_interop.hpp"
#include "phivault/core/constants.hpp"
#include "phivault/core/format.hpp"
#include "phivault/debug/event_logger.hpp"
#include <google/protobuf/util/time_util.h>
#include <sodium.h>
#include <mutex>
#include <optional>

namespace phivault::keystore::session {

using crypto::SodiumInterop;
using debug::Component;

namespace {

    constexpr size_t kRecordIdRandomBytes = 16;

    std::string GenerateRecordId() {
        const auto raw = SodiumInterop::GetRandomBytes(kRecordIdRandomBytes);
        std::string hex(raw.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), raw.data(), raw.size());
        hex.resize(raw.size() * 2);
        return hex;
    }

    Result<proto::RecordKind, VaultFailure> KindOf(const proto::ProtectedRecord& record) {
        switch (record.payload_case()) {
            case proto::ProtectedRecord::kRoster:
                return Result<proto::RecordKind, VaultFailure>::Ok(proto::RECORD_KIND_ROSTER);
            case proto::ProtectedRecord::kSeatingChart:
                return Result<proto::RecordKind, VaultFailure>::Ok(proto::RECORD_KIND_SEATING_CHART);
            case proto::ProtectedRecord::kDocument:
                return Result<proto::RecordKind, VaultFailure>::Ok(proto::RECORD_KIND_DOCUMENT);
            case proto::ProtectedRecord::PAYLOAD_NOT_SET:
                break;
        }
        return Result<proto::RecordKind, VaultFailure>::Err(
            VaultFailure::InvalidInput("Record has no payload"));
    }
}

ProtectedDataClient::ProtectedDataClient(
    std::shared_ptr<interfaces::IProtectedStorage> storage,
    std::string owner_id,
    configuration::VaultConfig config)
    : storage_(std::move(storage))
    , owner_id_(std::move(owner_id))
    , config_(config)
    , store_(std::make_unique<SessionKeyStore>(config)) {}

Result<std::unique_ptr<ProtectedDataClient>, VaultFailure> ProtectedDataClient::Create(
    std::shared_ptr<interfaces::IProtectedStorage> storage,
    std::string owner_id,
    configuration::VaultConfig config) {
    using CreateResult = Result<std::unique_ptr<ProtectedDataClient>, VaultFailure>;
    if (!storage) {
        return CreateResult::Err(VaultFailure::InvalidInput("Storage backend must not be null"));
    }
    if (owner_id.empty() || owner_id.size() > kMaxContextFieldBytes) {
        return CreateResult::Err(VaultFailure::InvalidInput(
            compat::format("Owner id must be 1 to {} bytes", kMaxContextFieldBytes)));
    }
    if (!config.IsValid()) {
        return CreateResult::Err(VaultFailure::InvalidInput("Vault configuration is not supported"));
    }
    return CreateResult::Ok(std::unique_ptr<ProtectedDataClient>(
        new ProtectedDataClient(std::move(storage), std::move(owner_id), config)));
}

ProtectedDataClient::~ProtectedDataClient() {
    Lock();
}

void ProtectedDataClient::PrepareStore() {
    if (store_->State() == SessionState::Cleared) {
        store_ = std::make_unique<SessionKeyStore>(config_);
    }
}

models::RecordContext ProtectedDataClient::ContextFor(const std::string& record_id) const {
    return models::RecordContext{owner_id_, record_id};
}

Result<Unit, VaultFailure> ProtectedDataClient::Enroll(const std::string_view secret) {
    std::unique_lock guard(lock_);
    if (secret.empty()) {
        return Result<Unit, VaultFailure>::Err(VaultFailure::InvalidInput("Secret must not be empty"));
    }
    PrepareStore();

    auto salt_result = SessionKeyStore::NewSaltRecord(config_.EnrollmentKdfVersion());
    if (salt_result.IsErr()) {
        return Result<Unit, VaultFailure>::Err(std::move(salt_result).UnwrapErr());
    }
    const auto salt_record = std::move(salt_result).Unwrap();

    auto initialized = store_->Initialize(secret, salt_record, std::nullopt);
    if (initialized.IsErr()) {
        return Result<Unit, VaultFailure>::Err(std::move(initialized).UnwrapErr());
    }
    const auto& wrapped_dek = initialized.Unwrap();

    auto stored = storage_->StoreEnrollment(owner_id_, salt_record);
    if (stored.IsOk() && wrapped_dek.has_value()) {
        stored = storage_->StoreWrappedDek(owner_id_, *wrapped_dek);
    }
    if (stored.IsErr()) {
        store_->Clear();
        return stored;
    }
    PV_LOG_EVENT(Component::Client, "Enroll", owner_id_);
    return Result<Unit, VaultFailure>::Ok(unit);
}

Result<Unit, VaultFailure> ProtectedDataClient::Unlock(const std::string_view secret) {
    std::unique_lock guard(lock_);
    PrepareStore();

    auto snapshot = storage_->FetchEnrollmentState(owner_id_);
    if (snapshot.IsErr()) {
        return Result<Unit, VaultFailure>::Err(std::move(snapshot).UnwrapErr());
    }
    const auto& enrollment = snapshot.Unwrap();
    std::optional<proto::WrappedDekRecord> wrapped_dek;
    if (enrollment.has_primary()) {
        wrapped_dek = enrollment.primary();
    }

    auto initialized = store_->Initialize(secret, enrollment.salt(), wrapped_dek);
    if (initialized.IsErr()) {
        return Result<Unit, VaultFailure>::Err(std::move(initialized).UnwrapErr());
    }
    if (const auto& created = initialized.Unwrap(); created.has_value()) {
        if (auto stored = storage_->StoreWrappedDek(owner_id_, *created); stored.IsErr()) {
            store_->Clear();
            return stored;
        }
    }
    PV_LOG_EVENT(Component::Client, "Unlock", owner_id_);
    return Result<Unit, VaultFailure>::Ok(unit);
}

void ProtectedDataClient::Lock() {
    std::unique_lock guard(lock_);
    store_->Clear();
}

Result<Unit, VaultFailure> ProtectedDataClient::ChangeSecret(
    const std::string_view old_secret, const std::string_view new_secret) {
    std::unique_lock guard(lock_);
    if (!store_->IsActive()) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::NotInitialized(std::string(ErrorMessages::SESSION_NOT_ACTIVE)));
    }
    auto snapshot = storage_->FetchEnrollmentState(owner_id_);
    if (snapshot.IsErr()) {
        return Result<Unit, VaultFailure>::Err(std::move(snapshot).UnwrapErr());
    }
    const auto& enrollment = snapshot.Unwrap();
    if (!enrollment.has_primary()) {
        return Result<Unit, VaultFailure>::Err(VaultFailure::NotFound("No data key stored"));
    }
    const auto& expected = enrollment.primary();

    auto rotation = store_->RotateSecret(old_secret, enrollment.salt(), new_secret, expected);
    if (rotation.IsErr()) {
        return Result<Unit, VaultFailure>::Err(std::move(rotation).UnwrapErr());
    }
    const auto& rotated = rotation.Unwrap();
    auto replaced = storage_->ReplaceWrappedDek(
        owner_id_, expected, rotated.salt_record, rotated.wrapped_dek);
    if (replaced.IsOk()) {
        PV_LOG_EVENT(Component::Client, "ChangeSecret", owner_id_);
    }
    return replaced;
}

Result<std::string, VaultFailure> ProtectedDataClient::SetupRecovery() {
    std::unique_lock guard(lock_);
    auto entry = store_->CreateRecoveryEntry();
    if (entry.IsErr()) {
        return Result<std::string, VaultFailure>::Err(std::move(entry).UnwrapErr());
    }
    auto recovery = std::move(entry).Unwrap();
    if (auto stored = storage_->StoreRecoveryEntry(owner_id_, recovery.wrapped_dek); stored.IsErr()) {
        return Result<std::string, VaultFailure>::Err(std::move(stored).UnwrapErr());
    }
    return Result<std::string, VaultFailure>::Ok(std::move(recovery.recovery_key));
}

Result<Unit, VaultFailure> ProtectedDataClient::RecoverWithKey(
    const std::string_view recovery_key, const std::string_view new_secret) {
    std::unique_lock guard(lock_);
    if (new_secret.empty()) {
        return Result<Unit, VaultFailure>::Err(VaultFailure::InvalidInput("New secret must not be empty"));
    }
    PrepareStore();

    auto snapshot = storage_->FetchEnrollmentState(owner_id_);
    if (snapshot.IsErr()) {
        return Result<Unit, VaultFailure>::Err(std::move(snapshot).UnwrapErr());
    }
    const auto& enrollment = snapshot.Unwrap();
    if (!enrollment.has_recovery()) {
        return Result<Unit, VaultFailure>::Err(VaultFailure::NotFound("No recovery entry for this owner"));
    }
    if (!enrollment.has_primary()) {
        return Result<Unit, VaultFailure>::Err(VaultFailure::NotFound("No data key stored"));
    }

    if (auto unlocked = store_->InitializeWithRecoveryKey(recovery_key, enrollment.recovery());
        unlocked.IsErr()) {
        return unlocked;
    }
    auto enrolled = store_->EnrollNewSecret(new_secret);
    if (enrolled.IsErr()) {
        store_->Clear();
        return Result<Unit, VaultFailure>::Err(std::move(enrolled).UnwrapErr());
    }
    const auto& rotated = enrolled.Unwrap();
    auto replaced = storage_->ReplaceWrappedDek(
        owner_id_, enrollment.primary(), rotated.salt_record, rotated.wrapped_dek);
    if (replaced.IsErr()) {
        store_->Clear();
        return replaced;
    }
    PV_LOG_EVENT(Component::Client, "RecoverWithKey", owner_id_);
    return Result<Unit, VaultFailure>::Ok(unit);
}

Result<proto::RecordMetadata, VaultFailure> ProtectedDataClient::CreateRecord(
    std::string display_name, const proto::ProtectedRecord& record) {
    return SaveRecord(GenerateRecordId(), std::move(display_name), record);
}

Result<proto::RecordMetadata, VaultFailure> ProtectedDataClient::SaveRecord(
    const std::string& record_id,
    std::string display_name,
    const proto::ProtectedRecord& record) {
    using MetadataResult = Result<proto::RecordMetadata, VaultFailure>;
    if (record_id.empty()) {
        return MetadataResult::Err(VaultFailure::InvalidInput("Record id must not be empty"));
    }
    auto kind = KindOf(record);
    if (kind.IsErr()) {
        return MetadataResult::Err(std::move(kind).UnwrapErr());
    }

    std::shared_lock guard(lock_);
    auto blob = store_->EncryptRecord(record, ContextFor(record_id));
    if (blob.IsErr()) {
        return MetadataResult::Err(std::move(blob).UnwrapErr());
    }

    const auto now = google::protobuf::util::TimeUtil::GetCurrentTime();
    proto::StoredRecord stored;
    auto* metadata = stored.mutable_metadata();
    metadata->set_owner_id(owner_id_);
    metadata->set_record_id(record_id);
    metadata->set_kind(kind.Unwrap());
    metadata->set_display_name(std::move(display_name));
    *metadata->mutable_updated_at() = now;

    auto existing = storage_->GetRecord(owner_id_, record_id);
    if (existing.IsOk()) {
        *metadata->mutable_created_at() = existing.Unwrap().metadata().created_at();
    } else if (existing.UnwrapErr().type == VaultFailureType::NotFound) {
        *metadata->mutable_created_at() = now;
    } else {
        return MetadataResult::Err(std::move(existing).UnwrapErr());
    }
    *stored.mutable_blob() = std::move(blob).Unwrap();

    if (auto put = storage_->PutRecord(stored); put.IsErr()) {
        return MetadataResult::Err(std::move(put).UnwrapErr());
    }
    return MetadataResult::Ok(stored.metadata());
}

Result<proto::ProtectedRecord, VaultFailure> ProtectedDataClient::LoadRecord(const std::string& record_id) {
    std::shared_lock guard(lock_);
    if (!store_->IsActive()) {
        return Result<proto::ProtectedRecord, VaultFailure>::Err(
            VaultFailure::NotInitialized(std::string(ErrorMessages::SESSION_NOT_ACTIVE)));
    }
    auto stored = storage_->GetRecord(owner_id_, record_id);
    if (stored.IsErr()) {
        return Result<proto::ProtectedRecord, VaultFailure>::Err(std::move(stored).UnwrapErr());
    }
    return store_->DecryptRecord(stored.Unwrap().blob(), ContextFor(record_id));
}

Result<std::vector<proto::RecordMetadata>, VaultFailure> ProtectedDataClient::ListRecords() {
    std::shared_lock guard(lock_);
    return storage_->ListRecords(owner_id_);
}

Result<Unit, VaultFailure> ProtectedDataClient::DeleteRecord(const std::string& record_id) {
    std::shared_lock guard(lock_);
    return storage_->DeleteRecord(owner_id_, record_id);
}

SessionState ProtectedDataClient::State() const {
    std::shared_lock guard(lock_);
    return store_->State();
}

}
