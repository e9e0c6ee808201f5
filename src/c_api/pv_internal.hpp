/**
 * @file pv_internal.hpp
 * @brief Internal helpers for the PhiVault C API
 *
 * This header is NOT part of the public API.
 */

#ifndef PV_INTERNAL_HPP
#define PV_INTERNAL_HPP

#include "phivault/c_api/pv_api.h"
#include "phivault/core/failures.hpp"
#include "phivault/session/session_key_store.hpp"
#include <google/protobuf/message_lite.h>
#include <memory>
#include <span>
#include <string>

/**
 * @brief Opaque handle wrapping a SessionKeyStore
 */
struct PvKeyStoreHandle {
    std::unique_ptr<phivault::keystore::session::SessionKeyStore> store;
};

namespace pv::internal {

using phivault::keystore::VaultFailure;

/**
 * @brief Ensure libsodium is initialized
 * @return PV_SUCCESS if initialized, error code otherwise
 */
PvErrorCode EnsureInitialized();

void fill_error(PvError* out_error, PvErrorCode code, const std::string& message);

/**
 * @brief Map a VaultFailure to its error code and fill the error struct
 * @return The corresponding PvErrorCode
 */
PvErrorCode fill_error_from_failure(PvError* out_error, const VaultFailure& failure);

bool validate_buffer_param(const uint8_t* data, size_t length, PvError* out_error);

bool validate_output_handle(const void* handle, PvError* out_error);

/**
 * @brief Copy data to an output buffer (allocates memory)
 * @return true on success, false on failure (fills out_error)
 */
bool copy_to_buffer(std::span<const uint8_t> input, PvBuffer* out_buffer, PvError* out_error);

/**
 * @brief Parse serialized protobuf bytes into @p message
 * @return true on success, false on failure (fills out_error with PV_ERROR_DECODE)
 */
bool parse_message(const uint8_t* data, size_t length,
                   google::protobuf::MessageLite* message, const char* what, PvError* out_error);

/**
 * @brief Serialize @p message into a newly allocated output buffer
 */
bool serialize_to_buffer(const google::protobuf::MessageLite& message,
                         PvBuffer* out_buffer, PvError* out_error);

} // namespace pv::internal

#endif // PV_INTERNAL_HPP
