#pragma once

#include "phivault/c_api/pv_export.h"

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#define PV_API_VERSION_MAJOR 1
#define PV_API_VERSION_MINOR 0
#define PV_API_VERSION_PATCH 0

typedef enum {
    PV_SUCCESS = 0,
    PV_ERROR_GENERIC = 1,
    PV_ERROR_INVALID_INPUT = 2,
    PV_ERROR_AUTHENTICATION_FAILURE = 3,
    PV_ERROR_INTEGRITY_FAILURE = 4,
    PV_ERROR_NOT_INITIALIZED = 5,
    PV_ERROR_UNSUPPORTED_FORMAT = 6,
    PV_ERROR_KEY_GENERATION = 7,
    PV_ERROR_DERIVE_KEY = 8,
    PV_ERROR_ENCODE = 9,
    PV_ERROR_DECODE = 10,
    PV_ERROR_INVALID_STATE = 11,
    PV_ERROR_STORAGE_CONFLICT = 12,
    PV_ERROR_NOT_FOUND = 13,
    PV_ERROR_OUT_OF_MEMORY = 14,
    PV_ERROR_SODIUM_FAILURE = 15,
    PV_ERROR_NULL_POINTER = 16
} PvErrorCode;

typedef enum {
    PV_STATE_UNINITIALIZED = 0,
    PV_STATE_ACTIVE = 1,
    PV_STATE_CLEARED = 2
} PvSessionState;

typedef struct PvKeyStoreHandle PvKeyStoreHandle;

typedef struct PvBuffer {
    uint8_t* data;
    size_t length;
} PvBuffer;

typedef struct PvError {
    PvErrorCode code;
    char* message;
} PvError;

PV_API const char* pv_version(void);

PV_API PvErrorCode pv_init(void);

PV_API void pv_shutdown(void);

// Messages cross this boundary as serialized protobuf bytes
// (phivault.proto.SaltRecord, WrappedDekRecord, EncryptedBlob, ProtectedRecord).

// enrollment_kdf_version 0 selects the current default.
PV_API PvErrorCode pv_keystore_create(
    uint32_t enrollment_kdf_version,
    PvKeyStoreHandle** out_handle,
    PvError* out_error);

PV_API void pv_keystore_destroy(PvKeyStoreHandle* handle);

// Fresh SaltRecord for a first enrollment.
PV_API PvErrorCode pv_new_salt_record(
    uint32_t kdf_version,
    PvBuffer* out_salt_record,
    PvError* out_error);

// Unlock with an existing WrappedDekRecord, or pass NULL/0 to create a DEK.
// On first use out_new_wrapped_dek receives the record to persist; otherwise
// it is left empty (data NULL, length 0).
PV_API PvErrorCode pv_keystore_initialize(
    PvKeyStoreHandle* handle,
    const uint8_t* secret,
    size_t secret_length,
    const uint8_t* salt_record,
    size_t salt_record_length,
    const uint8_t* wrapped_dek,
    size_t wrapped_dek_length,
    PvBuffer* out_new_wrapped_dek,
    PvError* out_error);

// owner_id and record_id may be NULL for records not bound to an identity.
PV_API PvErrorCode pv_keystore_encrypt_record(
    const PvKeyStoreHandle* handle,
    const uint8_t* record,
    size_t record_length,
    const char* owner_id,
    const char* record_id,
    PvBuffer* out_blob,
    PvError* out_error);

PV_API PvErrorCode pv_keystore_decrypt_record(
    const PvKeyStoreHandle* handle,
    const uint8_t* blob,
    size_t blob_length,
    const char* owner_id,
    const char* record_id,
    PvBuffer* out_record,
    PvError* out_error);

PV_API void pv_keystore_clear(PvKeyStoreHandle* handle);

PV_API PvSessionState pv_keystore_state(const PvKeyStoreHandle* handle);

// Wipes and releases the data; the PvBuffer struct itself is caller-owned.
PV_API void pv_buffer_free(PvBuffer* buffer);

PV_API void pv_error_free(PvError* error);

PV_API const char* pv_error_string(PvErrorCode code);

PV_API PvErrorCode pv_secure_wipe(uint8_t* data, size_t length);

#ifdef __cplusplus
}
#endif
