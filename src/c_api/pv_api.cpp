#include "phivault/c_api/pv_api.h"
#include "pv_internal.hpp"
#include "phivault/configuration/vault_config.hpp"
#include "phivault/crypto/sodium_interop.hpp"
#include "phivault/models/record_context.hpp"
#include "phivault/session/session_key_store.hpp"
#include "phivault/keystore.pb.h"
#include "phivault/records.pb.h"
#include <atomic>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>

using namespace phivault::keystore;
using crypto::SodiumInterop;
using configuration::VaultConfig;
using session::SessionKeyStore;
using session::SessionState;

namespace pv::internal {

PvErrorCode EnsureInitialized() {
    static std::once_flag init_flag;
    static std::atomic init_success{false};

    std::call_once(init_flag, [] {
        const auto result = SodiumInterop::Initialize();
        init_success.store(result.IsOk(), std::memory_order_release);
    });

    return init_success.load(std::memory_order_acquire)
               ? PV_SUCCESS
               : PV_ERROR_SODIUM_FAILURE;
}

void fill_error(PvError* out_error, const PvErrorCode code, const std::string& message) {
    if (out_error) {
        out_error->code = code;
#ifdef _WIN32
        out_error->message = _strdup(message.c_str());
#else
        out_error->message = strdup(message.c_str());
#endif
    }
}

PvErrorCode fill_error_from_failure(PvError* out_error, const VaultFailure& failure) {
    PvErrorCode code = PV_ERROR_GENERIC;

    switch (failure.type) {
        case VaultFailureType::InvalidInput:
            code = PV_ERROR_INVALID_INPUT;
            break;
        case VaultFailureType::AuthenticationFailure:
            code = PV_ERROR_AUTHENTICATION_FAILURE;
            break;
        case VaultFailureType::IntegrityFailure:
            code = PV_ERROR_INTEGRITY_FAILURE;
            break;
        case VaultFailureType::NotInitialized:
            code = PV_ERROR_NOT_INITIALIZED;
            break;
        case VaultFailureType::UnsupportedFormat:
            code = PV_ERROR_UNSUPPORTED_FORMAT;
            break;
        case VaultFailureType::KeyGeneration:
            code = PV_ERROR_KEY_GENERATION;
            break;
        case VaultFailureType::DeriveKey:
            code = PV_ERROR_DERIVE_KEY;
            break;
        case VaultFailureType::Encode:
            code = PV_ERROR_ENCODE;
            break;
        case VaultFailureType::Decode:
            code = PV_ERROR_DECODE;
            break;
        case VaultFailureType::InvalidState:
            code = PV_ERROR_INVALID_STATE;
            break;
        case VaultFailureType::StorageConflict:
            code = PV_ERROR_STORAGE_CONFLICT;
            break;
        case VaultFailureType::NotFound:
            code = PV_ERROR_NOT_FOUND;
            break;
        default:
            code = PV_ERROR_GENERIC;
            break;
    }

    if (out_error) {
        fill_error(out_error, code, failure.message);
    }
    return code;
}

bool validate_buffer_param(const uint8_t* data, const size_t length, PvError* out_error) {
    if (!data && length > 0) {
        fill_error(out_error, PV_ERROR_NULL_POINTER, "Buffer data is null but length is non-zero");
        return false;
    }
    return true;
}

bool validate_output_handle(const void* handle, PvError* out_error) {
    if (!handle) {
        fill_error(out_error, PV_ERROR_NULL_POINTER, "Output handle pointer is null");
        return false;
    }
    return true;
}

bool copy_to_buffer(const std::span<const uint8_t> input, PvBuffer* out_buffer, PvError* out_error) {
    if (!out_buffer) {
        fill_error(out_error, PV_ERROR_NULL_POINTER, "Output buffer is null");
        return false;
    }

    auto* data = new(std::nothrow) uint8_t[input.size()];
    if (!data) {
        fill_error(out_error, PV_ERROR_OUT_OF_MEMORY, "Failed to allocate output buffer");
        return false;
    }
    if (!input.empty()) {
        std::memcpy(data, input.data(), input.size());
    }
    out_buffer->data = data;
    out_buffer->length = input.size();
    return true;
}

bool parse_message(const uint8_t* data, const size_t length,
                   google::protobuf::MessageLite* message, const char* what, PvError* out_error) {
    if (length > static_cast<size_t>(INT_MAX)) {
        fill_error(out_error, PV_ERROR_INVALID_INPUT, std::string(what) + " is too large");
        return false;
    }
    if (!message->ParseFromArray(data, static_cast<int>(length))) {
        fill_error(out_error, PV_ERROR_DECODE, std::string("Failed to parse ") + what);
        return false;
    }
    return true;
}

bool serialize_to_buffer(const google::protobuf::MessageLite& message,
                         PvBuffer* out_buffer, PvError* out_error) {
    if (!out_buffer) {
        fill_error(out_error, PV_ERROR_NULL_POINTER, "Output buffer is null");
        return false;
    }
    const size_t size = message.ByteSizeLong();
    if (size > static_cast<size_t>(INT_MAX)) {
        fill_error(out_error, PV_ERROR_ENCODE, "Message is too large to serialize");
        return false;
    }

    auto* data = new(std::nothrow) uint8_t[size];
    if (!data) {
        fill_error(out_error, PV_ERROR_OUT_OF_MEMORY, "Failed to allocate output buffer");
        return false;
    }
    if (!message.SerializeToArray(data, static_cast<int>(size))) {
        delete[] data;
        fill_error(out_error, PV_ERROR_ENCODE, "Failed to serialize message");
        return false;
    }
    out_buffer->data = data;
    out_buffer->length = size;
    return true;
}

} // namespace pv::internal

using namespace pv::internal;

namespace {

    models::RecordContext ContextFrom(const char* owner_id, const char* record_id) {
        return models::RecordContext{
            owner_id ? std::string(owner_id) : std::string(),
            record_id ? std::string(record_id) : std::string()
        };
    }

    bool validate_store_handle(const PvKeyStoreHandle* handle, PvError* out_error) {
        if (!handle || !handle->store) {
            fill_error(out_error, PV_ERROR_NULL_POINTER, "Key store handle is null");
            return false;
        }
        return true;
    }
}

extern "C" {

const char* pv_version(void) {
    return "1.0.0";
}

PvErrorCode pv_init(void) {
    const auto result = SodiumInterop::Initialize();
    if (result.IsErr()) {
        return PV_ERROR_SODIUM_FAILURE;
    }
    return PV_SUCCESS;
}

void pv_shutdown(void) {
}

PvErrorCode pv_keystore_create(
    const uint32_t enrollment_kdf_version,
    PvKeyStoreHandle** out_handle,
    PvError* out_error) {
    if (const auto err = EnsureInitialized(); err != PV_SUCCESS) {
        fill_error(out_error, err, "Failed to initialize libsodium");
        return err;
    }
    if (!validate_output_handle(out_handle, out_error)) {
        return PV_ERROR_NULL_POINTER;
    }

    auto config = VaultConfig::Default();
    if (enrollment_kdf_version != 0) {
        config = config.WithEnrollmentKdfVersion(enrollment_kdf_version);
    }
    if (!config.IsValid()) {
        fill_error(out_error, PV_ERROR_UNSUPPORTED_FORMAT,
                   "Unsupported KDF version " + std::to_string(enrollment_kdf_version));
        return PV_ERROR_UNSUPPORTED_FORMAT;
    }

    auto* handle = new(std::nothrow) PvKeyStoreHandle{
        std::make_unique<SessionKeyStore>(config)
    };
    if (!handle) {
        fill_error(out_error, PV_ERROR_OUT_OF_MEMORY, "Failed to allocate key store handle");
        return PV_ERROR_OUT_OF_MEMORY;
    }

    *out_handle = handle;
    return PV_SUCCESS;
}

void pv_keystore_destroy(PvKeyStoreHandle* handle) {
    delete handle;
}

PvErrorCode pv_new_salt_record(
    const uint32_t kdf_version,
    PvBuffer* out_salt_record,
    PvError* out_error) {
    if (const auto err = EnsureInitialized(); err != PV_SUCCESS) {
        fill_error(out_error, err, "Failed to initialize libsodium");
        return err;
    }
    if (!validate_output_handle(out_salt_record, out_error)) {
        return PV_ERROR_NULL_POINTER;
    }

    auto result = SessionKeyStore::NewSaltRecord(kdf_version);
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, std::move(result).UnwrapErr());
    }
    if (!serialize_to_buffer(result.Unwrap(), out_salt_record, out_error)) {
        return out_error ? out_error->code : PV_ERROR_ENCODE;
    }
    return PV_SUCCESS;
}

PvErrorCode pv_keystore_initialize(
    PvKeyStoreHandle* handle,
    const uint8_t* secret,
    const size_t secret_length,
    const uint8_t* salt_record,
    const size_t salt_record_length,
    const uint8_t* wrapped_dek,
    const size_t wrapped_dek_length,
    PvBuffer* out_new_wrapped_dek,
    PvError* out_error) {
    if (!validate_store_handle(handle, out_error) ||
        !validate_output_handle(out_new_wrapped_dek, out_error)) {
        return PV_ERROR_NULL_POINTER;
    }
    if (!validate_buffer_param(secret, secret_length, out_error) ||
        !validate_buffer_param(salt_record, salt_record_length, out_error) ||
        !validate_buffer_param(wrapped_dek, wrapped_dek_length, out_error)) {
        return PV_ERROR_NULL_POINTER;
    }

    proto::SaltRecord salt;
    if (!parse_message(salt_record, salt_record_length, &salt, "salt record", out_error)) {
        return out_error ? out_error->code : PV_ERROR_DECODE;
    }

    std::optional<proto::WrappedDekRecord> existing;
    if (wrapped_dek && wrapped_dek_length > 0) {
        proto::WrappedDekRecord parsed;
        if (!parse_message(wrapped_dek, wrapped_dek_length, &parsed, "wrapped DEK record", out_error)) {
            return out_error ? out_error->code : PV_ERROR_DECODE;
        }
        existing = std::move(parsed);
    }

    const std::string_view secret_view(reinterpret_cast<const char*>(secret), secret_length);
    auto result = handle->store->Initialize(secret_view, salt, existing);
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, std::move(result).UnwrapErr());
    }

    out_new_wrapped_dek->data = nullptr;
    out_new_wrapped_dek->length = 0;
    if (const auto& created = result.Unwrap(); created.has_value()) {
        if (!serialize_to_buffer(*created, out_new_wrapped_dek, out_error)) {
            handle->store->Clear();
            return out_error ? out_error->code : PV_ERROR_ENCODE;
        }
    }
    return PV_SUCCESS;
}

PvErrorCode pv_keystore_encrypt_record(
    const PvKeyStoreHandle* handle,
    const uint8_t* record,
    const size_t record_length,
    const char* owner_id,
    const char* record_id,
    PvBuffer* out_blob,
    PvError* out_error) {
    if (!validate_store_handle(handle, out_error) ||
        !validate_output_handle(out_blob, out_error) ||
        !validate_buffer_param(record, record_length, out_error)) {
        return PV_ERROR_NULL_POINTER;
    }

    proto::ProtectedRecord parsed;
    if (!parse_message(record, record_length, &parsed, "protected record", out_error)) {
        return out_error ? out_error->code : PV_ERROR_DECODE;
    }

    auto result = handle->store->EncryptRecord(parsed, ContextFrom(owner_id, record_id));
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, std::move(result).UnwrapErr());
    }
    if (!serialize_to_buffer(result.Unwrap(), out_blob, out_error)) {
        return out_error ? out_error->code : PV_ERROR_ENCODE;
    }
    return PV_SUCCESS;
}

PvErrorCode pv_keystore_decrypt_record(
    const PvKeyStoreHandle* handle,
    const uint8_t* blob,
    const size_t blob_length,
    const char* owner_id,
    const char* record_id,
    PvBuffer* out_record,
    PvError* out_error) {
    if (!validate_store_handle(handle, out_error) ||
        !validate_output_handle(out_record, out_error) ||
        !validate_buffer_param(blob, blob_length, out_error)) {
        return PV_ERROR_NULL_POINTER;
    }

    proto::EncryptedBlob parsed;
    if (!parse_message(blob, blob_length, &parsed, "encrypted blob", out_error)) {
        return out_error ? out_error->code : PV_ERROR_DECODE;
    }

    auto result = handle->store->DecryptRecord(parsed, ContextFrom(owner_id, record_id));
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, std::move(result).UnwrapErr());
    }
    if (!serialize_to_buffer(result.Unwrap(), out_record, out_error)) {
        return out_error ? out_error->code : PV_ERROR_ENCODE;
    }
    return PV_SUCCESS;
}

void pv_keystore_clear(PvKeyStoreHandle* handle) {
    if (handle && handle->store) {
        handle->store->Clear();
    }
}

PvSessionState pv_keystore_state(const PvKeyStoreHandle* handle) {
    if (!handle || !handle->store) {
        return PV_STATE_UNINITIALIZED;
    }
    switch (handle->store->State()) {
        case SessionState::Active: return PV_STATE_ACTIVE;
        case SessionState::Cleared: return PV_STATE_CLEARED;
        case SessionState::Uninitialized: return PV_STATE_UNINITIALIZED;
    }
    return PV_STATE_UNINITIALIZED;
}

void pv_buffer_free(PvBuffer* buffer) {
    if (buffer && buffer->data) {
        auto __wipe = SodiumInterop::SecureWipe(std::span(buffer->data, buffer->length));
        (void)__wipe;
        delete[] buffer->data;
        buffer->data = nullptr;
        buffer->length = 0;
    }
}

void pv_error_free(PvError* error) {
    if (error && error->message) {
        free(error->message);
        error->message = nullptr;
    }
}

const char* pv_error_string(const PvErrorCode code) {
    switch (code) {
        case PV_SUCCESS: return "Success";
        case PV_ERROR_GENERIC: return "Generic error";
        case PV_ERROR_INVALID_INPUT: return "Invalid input";
        case PV_ERROR_AUTHENTICATION_FAILURE: return "Authentication failed";
        case PV_ERROR_INTEGRITY_FAILURE: return "Integrity check failed";
        case PV_ERROR_NOT_INITIALIZED: return "Session not initialized";
        case PV_ERROR_UNSUPPORTED_FORMAT: return "Unsupported format version";
        case PV_ERROR_KEY_GENERATION: return "Key generation failed";
        case PV_ERROR_DERIVE_KEY: return "Key derivation failed";
        case PV_ERROR_ENCODE: return "Encoding failed";
        case PV_ERROR_DECODE: return "Decoding failed";
        case PV_ERROR_INVALID_STATE: return "Invalid state";
        case PV_ERROR_STORAGE_CONFLICT: return "Storage conflict";
        case PV_ERROR_NOT_FOUND: return "Not found";
        case PV_ERROR_OUT_OF_MEMORY: return "Out of memory";
        case PV_ERROR_SODIUM_FAILURE: return "Sodium library failure";
        case PV_ERROR_NULL_POINTER: return "Null pointer";
        default: return "Unknown error";
    }
}

PvErrorCode pv_secure_wipe(uint8_t* data, const size_t length) {
    if (!data && length > 0) {
        return PV_ERROR_NULL_POINTER;
    }

    if (length > 0) {
        if (const auto err = EnsureInitialized(); err != PV_SUCCESS) {
            return err;
        }
        auto __wipe = SodiumInterop::SecureWipe(std::span(data, length));
        (void)__wipe;
    }

    return PV_SUCCESS;
}

} // extern "C"
