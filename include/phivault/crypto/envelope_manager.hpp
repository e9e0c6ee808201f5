#pragma once

#include "phivault/core/result.hpp"
#include "phivault/core/failures.hpp"
#include "phivault/crypto/secure_memory_handle.hpp"
#include "phivault/keystore.pb.h"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace phivault::keystore::crypto {

struct GeneratedDek {
    SecureMemoryHandle dek;
    proto::WrappedDekRecord record;
};

/**
 * @brief Envelope wrapping of the data-encryption key
 *
 * The DEK is sealed under a KEK (primary slot) or under a random recovery key
 * (recovery slot). The slot and KDF version are bound as associated data, so
 * an entry cannot be replayed into the other slot or relabelled with a
 * different cost version.
 *
 * Every unwrap failure (wrong secret, corrupted or relabelled entry, missing
 * fields) is reported as AuthenticationFailure. A successful unwrap always
 * yields the key that was wrapped.
 */
class EnvelopeManager {
public:
    /// Fresh random DEK wrapped under @p kek with a fresh nonce
    [[nodiscard]] static Result<GeneratedDek, VaultFailure> WrapNewDek(
        const SecureMemoryHandle& kek, uint32_t kdf_version);

    [[nodiscard]] static Result<proto::WrappedDekRecord, VaultFailure> Wrap(
        const SecureMemoryHandle& kek,
        const SecureMemoryHandle& dek,
        uint32_t kdf_version);

    [[nodiscard]] static Result<SecureMemoryHandle, VaultFailure> Unwrap(
        const SecureMemoryHandle& kek,
        const proto::WrappedDekRecord& record);

    /// Same DEK under @p new_kek. The old entry stays valid until replaced.
    [[nodiscard]] static Result<proto::WrappedDekRecord, VaultFailure> Rewrap(
        const SecureMemoryHandle& old_kek,
        const SecureMemoryHandle& new_kek,
        const proto::WrappedDekRecord& record,
        uint32_t new_kdf_version);

    [[nodiscard]] static Result<proto::WrappedDekRecord, VaultFailure> WrapForRecovery(
        const SecureMemoryHandle& dek,
        const SecureMemoryHandle& recovery_key);

    [[nodiscard]] static Result<SecureMemoryHandle, VaultFailure> UnwrapWithRecoveryKey(
        const SecureMemoryHandle& recovery_key,
        const proto::WrappedDekRecord& record);

    [[nodiscard]] static Result<SecureMemoryHandle, VaultFailure> GenerateRecoveryKey();

    /// Base64 text handed to the user once at recovery setup
    [[nodiscard]] static Result<std::string, VaultFailure> ExportRecoveryKey(
        const SecureMemoryHandle& recovery_key);

    /// InvalidInput if the text is not base64 of exactly 32 bytes
    [[nodiscard]] static Result<SecureMemoryHandle, VaultFailure> ImportRecoveryKey(
        std::string_view encoded);

    [[nodiscard]] static std::vector<uint8_t> BuildWrapAssociatedData(
        proto::KeySlot slot, uint32_t kdf_version);

private:
    [[nodiscard]] static Result<proto::WrappedDekRecord, VaultFailure> WrapInto(
        const SecureMemoryHandle& wrapping_key,
        const SecureMemoryHandle& dek,
        proto::KeySlot slot,
        uint32_t kdf_version);

    [[nodiscard]] static Result<SecureMemoryHandle, VaultFailure> UnwrapFrom(
        const SecureMemoryHandle& wrapping_key,
        const proto::WrappedDekRecord& record,
        proto::KeySlot expected_slot);

    EnvelopeManager() = delete;
};

} // namespace phivault::keystore::crypto
