#pragma once

#include "phivault/core/result.hpp"
#include "phivault/core/failures.hpp"
#include "phivault/models/record_context.hpp"
#include "phivault/records.pb.h"

#include <google/protobuf/message.h>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace phivault::keystore::codec {

/**
 * @brief Record <-> canonical bytes, and wire messages <-> JSON
 *
 * Canonical bytes are the deterministic protobuf serialization of a
 * ProtectedRecord, so equal records always encode to equal bytes. The format
 * version is an explicit argument: only versions this build knows are
 * accepted in either direction.
 */
class BlobCodec {
public:
    [[nodiscard]] static bool IsSupportedFormat(uint32_t format_version) noexcept;

    [[nodiscard]] static Result<std::vector<uint8_t>, VaultFailure> Encode(
        const proto::ProtectedRecord& record,
        uint32_t format_version);

    /// UnsupportedFormat for unknown versions, Decode for unparsable bytes
    [[nodiscard]] static Result<proto::ProtectedRecord, VaultFailure> Decode(
        std::span<const uint8_t> bytes,
        uint32_t format_version);

    /// Protobuf JSON mapping with original field names; bytes fields are base64.
    [[nodiscard]] static Result<std::string, VaultFailure> ToWireJson(
        const google::protobuf::Message& message);

    [[nodiscard]] static Result<Unit, VaultFailure> FromWireJson(
        std::string_view json,
        google::protobuf::Message* message);

    /// Associated data for a record blob:
    /// label || u32 format_version || u32 len || owner_id || u32 len || record_id
    /// (integers little-endian). InvalidInput if an id exceeds 1 KiB.
    [[nodiscard]] static Result<std::vector<uint8_t>, VaultFailure> BuildRecordAssociatedData(
        uint32_t format_version,
        const models::RecordContext& context);

private:
    BlobCodec() = delete;
};

} // namespace phivault::keystore::codec
