#pragma once

#include "phivault/core/constants.hpp"
#include "phivault/configuration/kdf_params.hpp"

#include <cstddef>
#include <cstdint>

namespace phivault::keystore::configuration {

/// Tunables for a session key store and the client built on it
///
/// - enrollment KDF version: cost used for new SaltRecords (rotation and
///   recovery re-enrollment included). Existing records keep their own version.
/// - record format version: written into every new EncryptedBlob.
/// - max record bytes: upper bound on a canonical record before sealing.
///
/// ```cpp
/// constexpr auto config = VaultConfig::Default().WithMaxRecordBytes(1024 * 1024);
/// SessionKeyStore store(config);
/// ```
class VaultConfig {
public:
    [[nodiscard]] static constexpr VaultConfig Default() noexcept {
        return VaultConfig(kCurrentKdfVersion, kCurrentRecordFormatVersion, kDefaultMaxRecordBytes);
    }

    [[nodiscard]] constexpr VaultConfig WithEnrollmentKdfVersion(uint32_t version) const noexcept {
        VaultConfig copy = *this;
        copy.enrollment_kdf_version_ = version;
        return copy;
    }

    [[nodiscard]] constexpr VaultConfig WithRecordFormatVersion(uint32_t version) const noexcept {
        VaultConfig copy = *this;
        copy.record_format_version_ = version;
        return copy;
    }

    [[nodiscard]] constexpr VaultConfig WithMaxRecordBytes(size_t max_bytes) const noexcept {
        VaultConfig copy = *this;
        copy.max_record_bytes_ = max_bytes;
        return copy;
    }

    [[nodiscard]] constexpr uint32_t EnrollmentKdfVersion() const noexcept {
        return enrollment_kdf_version_;
    }

    [[nodiscard]] constexpr uint32_t RecordFormatVersion() const noexcept {
        return record_format_version_;
    }

    [[nodiscard]] constexpr size_t MaxRecordBytes() const noexcept {
        return max_record_bytes_;
    }

    /// True when every field names something this build supports
    [[nodiscard]] constexpr bool IsValid() const noexcept {
        return KdfParams::IsKnownVersion(enrollment_kdf_version_) &&
               record_format_version_ == kRecordFormatV1 &&
               max_record_bytes_ > 0;
    }

private:
    constexpr VaultConfig(uint32_t enrollment_kdf_version,
                          uint32_t record_format_version,
                          size_t max_record_bytes) noexcept
        : enrollment_kdf_version_(enrollment_kdf_version)
        , record_format_version_(record_format_version)
        , max_record_bytes_(max_record_bytes) {}

    uint32_t enrollment_kdf_version_;
    uint32_t record_format_version_;
    size_t max_record_bytes_;
};

static_assert(VaultConfig::Default().IsValid());

} // namespace phivault::keystore::configuration
