#include "phivault/crypto/envelope_manager.hpp"
#include "phivault/crypto/authenticated_cipher.hpp"
#include "phivault/crypto/sodium_interop.hpp"
#include "phivault/configuration/kdf_params.hpp"
#include "phivault/core/constants.hpp"
#include "phivault/core/format.hpp"
#include "phivault/debug/event_logger.hpp"

namespace phivault::keystore::crypto {

using debug::Component;

namespace {

void AppendU32(std::vector<uint8_t>& out, const uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

std::span<const uint8_t> AsBytes(const std::string& s) {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

VaultFailure UnwrapRejected() {
    return VaultFailure::AuthenticationFailure(std::string(ErrorMessages::UNLOCK_FAILED));
}

}

std::vector<uint8_t> EnvelopeManager::BuildWrapAssociatedData(
    const proto::KeySlot slot, const uint32_t kdf_version) {
    std::vector<uint8_t> ad(kDekWrapLabel.begin(), kDekWrapLabel.end());
    AppendU32(ad, static_cast<uint32_t>(slot));
    AppendU32(ad, kdf_version);
    return ad;
}

Result<proto::WrappedDekRecord, VaultFailure> EnvelopeManager::WrapInto(
    const SecureMemoryHandle& wrapping_key,
    const SecureMemoryHandle& dek,
    const proto::KeySlot slot,
    const uint32_t kdf_version) {
    if (dek.IsInvalid() || dek.Size() != kDekBytes) {
        return Result<proto::WrappedDekRecord, VaultFailure>::Err(
            VaultFailure::InvalidInput(compat::format("DEK must be {} bytes", kDekBytes)));
    }

    const auto ad = BuildWrapAssociatedData(slot, kdf_version);
    auto sealed = dek.WithReadAccess([&](std::span<const uint8_t> dek_bytes) {
        return AuthenticatedCipher::Seal(wrapping_key, dek_bytes, ad);
    });
    if (sealed.IsErr()) {
        return Result<proto::WrappedDekRecord, VaultFailure>::Err(
            VaultFailure::FromSodiumFailure(sealed.UnwrapErr()));
    }
    auto payload = std::move(sealed).Unwrap();
    if (payload.IsErr()) {
        return Result<proto::WrappedDekRecord, VaultFailure>::Err(std::move(payload).UnwrapErr());
    }
    auto [ciphertext, nonce] = std::move(payload).Unwrap();

    proto::WrappedDekRecord record;
    record.mutable_wrapped_dek()->set_ciphertext(ciphertext.data(), ciphertext.size());
    record.mutable_wrapped_dek()->set_nonce(nonce.data(), nonce.size());
    record.set_kdf_version(kdf_version);
    record.set_slot(slot);
    return Result<proto::WrappedDekRecord, VaultFailure>::Ok(std::move(record));
}

Result<SecureMemoryHandle, VaultFailure> EnvelopeManager::UnwrapFrom(
    const SecureMemoryHandle& wrapping_key,
    const proto::WrappedDekRecord& record,
    const proto::KeySlot expected_slot) {
    if (!record.has_wrapped_dek() || record.slot() != expected_slot) {
        return Result<SecureMemoryHandle, VaultFailure>::Err(UnwrapRejected());
    }

    const auto ad = BuildWrapAssociatedData(record.slot(), record.kdf_version());
    auto opened = AuthenticatedCipher::OpenToSecure(
        wrapping_key,
        AsBytes(record.wrapped_dek().ciphertext()),
        AsBytes(record.wrapped_dek().nonce()),
        ad);
    if (opened.IsErr()) {
        const auto& failure = opened.UnwrapErr();
        if (failure.type == VaultFailureType::InvalidInput) {
            return Result<SecureMemoryHandle, VaultFailure>::Err(failure);
        }
        PV_LOG_EVENT(Component::Envelope, "Unwrap", "rejected");
        return Result<SecureMemoryHandle, VaultFailure>::Err(UnwrapRejected());
    }
    auto dek = std::move(opened).Unwrap();
    if (dek.Size() != kDekBytes) {
        return Result<SecureMemoryHandle, VaultFailure>::Err(UnwrapRejected());
    }
    return Result<SecureMemoryHandle, VaultFailure>::Ok(std::move(dek));
}

Result<GeneratedDek, VaultFailure> EnvelopeManager::WrapNewDek(
    const SecureMemoryHandle& kek, const uint32_t kdf_version) {
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<GeneratedDek, VaultFailure>::Err(
            VaultFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    auto dek_result = SecureMemoryHandle::Allocate(kDekBytes);
    if (dek_result.IsErr()) {
        return Result<GeneratedDek, VaultFailure>::Err(
            VaultFailure::KeyGeneration(dek_result.UnwrapErr().message));
    }
    auto dek = std::move(dek_result).Unwrap();
    if (auto filled = dek.WithWriteAccess([](std::span<uint8_t> bytes) {
            SodiumInterop::FillRandom(bytes);
        }); filled.IsErr()) {
        return Result<GeneratedDek, VaultFailure>::Err(
            VaultFailure::KeyGeneration(filled.UnwrapErr().message));
    }

    auto wrapped = Wrap(kek, dek, kdf_version);
    if (wrapped.IsErr()) {
        return Result<GeneratedDek, VaultFailure>::Err(std::move(wrapped).UnwrapErr());
    }
    PV_LOG_VALUE(Component::Envelope, "WrapNewDek", "kdf_version", kdf_version);
    return Result<GeneratedDek, VaultFailure>::Ok(
        GeneratedDek{std::move(dek), std::move(wrapped).Unwrap()});
}

Result<proto::WrappedDekRecord, VaultFailure> EnvelopeManager::Wrap(
    const SecureMemoryHandle& kek,
    const SecureMemoryHandle& dek,
    const uint32_t kdf_version) {
    if (!configuration::KdfParams::IsKnownVersion(kdf_version)) {
        return Result<proto::WrappedDekRecord, VaultFailure>::Err(
            VaultFailure::UnsupportedFormat(
                compat::format("Unknown KDF version {}", kdf_version)));
    }
    return WrapInto(kek, dek, proto::KEY_SLOT_PRIMARY, kdf_version);
}

Result<SecureMemoryHandle, VaultFailure> EnvelopeManager::Unwrap(
    const SecureMemoryHandle& kek,
    const proto::WrappedDekRecord& record) {
    return UnwrapFrom(kek, record, proto::KEY_SLOT_PRIMARY);
}

Result<proto::WrappedDekRecord, VaultFailure> EnvelopeManager::Rewrap(
    const SecureMemoryHandle& old_kek,
    const SecureMemoryHandle& new_kek,
    const proto::WrappedDekRecord& record,
    const uint32_t new_kdf_version) {
    auto dek = Unwrap(old_kek, record);
    if (dek.IsErr()) {
        return Result<proto::WrappedDekRecord, VaultFailure>::Err(std::move(dek).UnwrapErr());
    }
    return Wrap(new_kek, dek.Unwrap(), new_kdf_version);
}

Result<proto::WrappedDekRecord, VaultFailure> EnvelopeManager::WrapForRecovery(
    const SecureMemoryHandle& dek,
    const SecureMemoryHandle& recovery_key) {
    return WrapInto(recovery_key, dek, proto::KEY_SLOT_RECOVERY, kKdfVersionNone);
}

Result<SecureMemoryHandle, VaultFailure> EnvelopeManager::UnwrapWithRecoveryKey(
    const SecureMemoryHandle& recovery_key,
    const proto::WrappedDekRecord& record) {
    return UnwrapFrom(recovery_key, record, proto::KEY_SLOT_RECOVERY);
}

Result<SecureMemoryHandle, VaultFailure> EnvelopeManager::GenerateRecoveryKey() {
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<SecureMemoryHandle, VaultFailure>::Err(
            VaultFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    auto key_result = SecureMemoryHandle::Allocate(kRecoveryKeyBytes);
    if (key_result.IsErr()) {
        return Result<SecureMemoryHandle, VaultFailure>::Err(
            VaultFailure::KeyGeneration(key_result.UnwrapErr().message));
    }
    auto key = std::move(key_result).Unwrap();
    if (auto filled = key.WithWriteAccess([](std::span<uint8_t> bytes) {
            SodiumInterop::FillRandom(bytes);
        }); filled.IsErr()) {
        return Result<SecureMemoryHandle, VaultFailure>::Err(
            VaultFailure::KeyGeneration(filled.UnwrapErr().message));
    }
    return Result<SecureMemoryHandle, VaultFailure>::Ok(std::move(key));
}

Result<std::string, VaultFailure> EnvelopeManager::ExportRecoveryKey(
    const SecureMemoryHandle& recovery_key) {
    if (recovery_key.Size() != kRecoveryKeyBytes) {
        return Result<std::string, VaultFailure>::Err(
            VaultFailure::InvalidInput("Recovery key handle has the wrong size"));
    }
    auto encoded = recovery_key.WithReadAccess([](std::span<const uint8_t> bytes) {
        return SodiumInterop::ToBase64(bytes);
    });
    if (encoded.IsErr()) {
        return Result<std::string, VaultFailure>::Err(
            VaultFailure::FromSodiumFailure(encoded.UnwrapErr()));
    }
    return Result<std::string, VaultFailure>::Ok(std::move(encoded).Unwrap());
}

Result<SecureMemoryHandle, VaultFailure> EnvelopeManager::ImportRecoveryKey(
    const std::string_view encoded) {
    auto decoded = SodiumInterop::FromBase64(encoded);
    if (decoded.IsErr()) {
        return Result<SecureMemoryHandle, VaultFailure>::Err(
            VaultFailure::InvalidInput("Recovery key is not valid base64"));
    }
    auto bytes = std::move(decoded).Unwrap();
    if (bytes.size() != kRecoveryKeyBytes) {
        { auto __wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(bytes)); (void)__wipe; }
        return Result<SecureMemoryHandle, VaultFailure>::Err(
            VaultFailure::InvalidInput(
                compat::format("Recovery key must decode to {} bytes", kRecoveryKeyBytes)));
    }
    auto handle = SecureMemoryHandle::FromBytes(bytes);
    { auto __wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(bytes)); (void)__wipe; }
    if (handle.IsErr()) {
        return Result<SecureMemoryHandle, VaultFailure>::Err(
            VaultFailure::FromSodiumFailure(handle.UnwrapErr()));
    }
    return Result<SecureMemoryHandle, VaultFailure>::Ok(std::move(handle).Unwrap());
}

} // namespace phivault::keystore::crypto
