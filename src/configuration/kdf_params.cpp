#include "phivault/configuration/kdf_params.hpp"
#include "phivault/core/format.hpp"

namespace phivault::keystore::configuration {

Result<KdfParams, VaultFailure> KdfParams::ForVersion(const uint32_t version) {
    switch (version) {
        case kKdfVersionInteractive:
            return Result<KdfParams, VaultFailure>::Ok(
                KdfParams(kKdfVersionInteractive, kKdfV1OpsLimit, kKdfV1MemLimitBytes));
        case kKdfVersionStandard:
            return Result<KdfParams, VaultFailure>::Ok(Current());
        default:
            return Result<KdfParams, VaultFailure>::Err(
                VaultFailure::UnsupportedFormat(
                    compat::format("Unknown KDF version {}", version)));
    }
}

Result<KdfParams, VaultFailure> KdfParams::Custom(
    const uint32_t version, const uint64_t ops_limit, const size_t mem_limit_bytes) {
    KdfParams params(version, ops_limit, mem_limit_bytes);
    if (auto valid = params.Validate(); valid.IsErr()) {
        return Result<KdfParams, VaultFailure>::Err(std::move(valid).UnwrapErr());
    }
    return Result<KdfParams, VaultFailure>::Ok(params);
}

Result<Unit, VaultFailure> KdfParams::Validate() const {
    if (ops_limit_ < kKdfMinOpsLimit) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::InvalidInput(
                compat::format("Argon2id opslimit {} is below the minimum of {}",
                               ops_limit_, kKdfMinOpsLimit)));
    }
    if (mem_limit_bytes_ < kKdfMinMemLimitBytes) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::InvalidInput(
                compat::format("Argon2id memlimit {} bytes is below the minimum of {}",
                               mem_limit_bytes_, kKdfMinMemLimitBytes)));
    }
    return Result<Unit, VaultFailure>::Ok(unit);
}

} // namespace phivault::keystore::configuration
