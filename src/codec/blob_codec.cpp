#include "phivault/codec/blob_codec.hpp"
#include "phivault/core/constants.hpp"
#include "phivault/crypto/sodium_interop.hpp"
#include "phivault/core/format.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/util/json_util.h>

#include <climits>

namespace phivault::keystore::codec {

namespace {

void AppendU32(std::vector<uint8_t>& out, const uint32_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

void AppendField(std::vector<uint8_t>& out, const std::string& field) {
    AppendU32(out, static_cast<uint32_t>(field.size()));
    out.insert(out.end(), field.begin(), field.end());
}

Result<Unit, VaultFailure> RequireSupported(const uint32_t format_version) {
    if (!BlobCodec::IsSupportedFormat(format_version)) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::UnsupportedFormat(
                compat::format("Unsupported record format version {}", format_version)));
    }
    return Result<Unit, VaultFailure>::Ok(unit);
}

}

bool BlobCodec::IsSupportedFormat(const uint32_t format_version) noexcept {
    return format_version == kRecordFormatV1;
}

Result<std::vector<uint8_t>, VaultFailure> BlobCodec::Encode(
    const proto::ProtectedRecord& record,
    const uint32_t format_version) {
    if (auto supported = RequireSupported(format_version); supported.IsErr()) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(std::move(supported).UnwrapErr());
    }

    std::string output;
    {
        google::protobuf::io::StringOutputStream stream(&output);
        google::protobuf::io::CodedOutputStream coded_out(&stream);
        coded_out.SetSerializationDeterministic(true);
        if (!record.SerializeToCodedStream(&coded_out) || coded_out.HadError()) {
            return Result<std::vector<uint8_t>, VaultFailure>::Err(
                VaultFailure::Encode("Failed to serialize record"));
        }
    }
    std::vector<uint8_t> bytes(output.begin(), output.end());
    { auto __wipe = crypto::SodiumInterop::SecureWipe(
          std::span<uint8_t>(reinterpret_cast<uint8_t*>(output.data()), output.size())); (void)__wipe; }
    return Result<std::vector<uint8_t>, VaultFailure>::Ok(std::move(bytes));
}

Result<proto::ProtectedRecord, VaultFailure> BlobCodec::Decode(
    std::span<const uint8_t> bytes,
    const uint32_t format_version) {
    if (auto supported = RequireSupported(format_version); supported.IsErr()) {
        return Result<proto::ProtectedRecord, VaultFailure>::Err(std::move(supported).UnwrapErr());
    }
    if (bytes.size() > static_cast<size_t>(INT_MAX)) {
        return Result<proto::ProtectedRecord, VaultFailure>::Err(
            VaultFailure::Decode("Record exceeds the maximum parsable size"));
    }

    proto::ProtectedRecord record;
    if (!record.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<proto::ProtectedRecord, VaultFailure>::Err(
            VaultFailure::Decode("Record bytes are not a valid ProtectedRecord"));
    }
    return Result<proto::ProtectedRecord, VaultFailure>::Ok(std::move(record));
}

Result<std::string, VaultFailure> BlobCodec::ToWireJson(const google::protobuf::Message& message) {
    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;

    std::string json;
    const auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
    if (!status.ok()) {
        return Result<std::string, VaultFailure>::Err(
            VaultFailure::Encode(compat::format("JSON encoding failed: {}", status.ToString())));
    }
    return Result<std::string, VaultFailure>::Ok(std::move(json));
}

Result<Unit, VaultFailure> BlobCodec::FromWireJson(
    const std::string_view json,
    google::protobuf::Message* message) {
    if (message == nullptr) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::InvalidInput("Target message must not be null"));
    }
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    const std::string input(json);
    const auto status = google::protobuf::util::JsonStringToMessage(input, message, options);
    if (!status.ok()) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::Decode(compat::format("JSON decoding failed: {}", status.ToString())));
    }
    return Result<Unit, VaultFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, VaultFailure> BlobCodec::BuildRecordAssociatedData(
    const uint32_t format_version,
    const models::RecordContext& context) {
    if (context.owner_id.size() > kMaxContextFieldBytes ||
        context.record_id.size() > kMaxContextFieldBytes) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(
            VaultFailure::InvalidInput(
                compat::format("Record identifiers must not exceed {} bytes", kMaxContextFieldBytes)));
    }

    std::vector<uint8_t> ad(kRecordLabel.begin(), kRecordLabel.end());
    ad.reserve(ad.size() + 12 + context.owner_id.size() + context.record_id.size());
    AppendU32(ad, format_version);
    AppendField(ad, context.owner_id);
    AppendField(ad, context.record_id);
    return Result<std::vector<uint8_t>, VaultFailure>::Ok(std::move(ad));
}

} // namespace phivault::keystore::codec
