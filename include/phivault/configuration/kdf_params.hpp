#pragma once

#include "phivault/core/constants.hpp"
#include "phivault/core/failures.hpp"
#include "phivault/core/result.hpp"

#include <cstddef>
#include <cstdint>

namespace phivault::keystore::configuration {

/// Versioned Argon2id cost parameters
///
/// The version number travels with the SaltRecord and WrappedDekRecord, so a
/// KEK can always be re-derived with the exact cost it was created with.
///
/// | version | opslimit | memlimit |
/// |---------|----------|----------|
/// | 1       | 2        | 64 MiB   |
/// | 2       | 3        | 64 MiB   |
///
/// ```cpp
/// auto params = KdfParams::ForVersion(salt_record.kdf_version());
/// if (params.IsErr()) {
///     return Err(params.UnwrapErr());   // UnsupportedFormat
/// }
/// ```
class KdfParams {
public:
    /// Parameters registered for @p version; UnsupportedFormat when this
    /// build does not know the version
    [[nodiscard]] static Result<KdfParams, VaultFailure> ForVersion(uint32_t version);

    /// Parameters used for new enrollments and rotations
    [[nodiscard]] static constexpr KdfParams Current() noexcept {
        return KdfParams(kKdfVersionStandard, kKdfV2OpsLimit, kKdfV2MemLimitBytes);
    }

    /// Build a parameter set outside the registry. Rejected with InvalidInput
    /// if either cost is below the floor.
    [[nodiscard]] static Result<KdfParams, VaultFailure> Custom(
        uint32_t version, uint64_t ops_limit, size_t mem_limit_bytes);

    [[nodiscard]] static constexpr bool IsKnownVersion(uint32_t version) noexcept {
        return version == kKdfVersionInteractive || version == kKdfVersionStandard;
    }

    /// Ok when both costs meet the floor
    [[nodiscard]] Result<Unit, VaultFailure> Validate() const;

    [[nodiscard]] constexpr uint32_t Version() const noexcept { return version_; }
    [[nodiscard]] constexpr uint64_t OpsLimit() const noexcept { return ops_limit_; }
    [[nodiscard]] constexpr size_t MemLimitBytes() const noexcept { return mem_limit_bytes_; }

    constexpr bool operator==(const KdfParams&) const noexcept = default;

private:
    constexpr KdfParams(uint32_t version, uint64_t ops_limit, size_t mem_limit_bytes) noexcept
        : version_(version)
        , ops_limit_(ops_limit)
        , mem_limit_bytes_(mem_limit_bytes) {}

    uint32_t version_;
    uint64_t ops_limit_;
    size_t mem_limit_bytes_;
};

} // namespace phivault::keystore::configuration
