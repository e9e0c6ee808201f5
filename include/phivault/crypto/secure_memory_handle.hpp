#pragma once

#include "phivault/core/result.hpp"
#include "phivault/core/failures.hpp"

#include <span>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace phivault::keystore::crypto {

/**
 * @brief Move-only owner of a sodium_malloc'd key buffer
 *
 * KEKs, DEKs and recovery keys live only inside these handles. The memory
 * is guard-paged, locked against swapping and zeroed when freed.
 *
 * @code
 * auto dek = SecureMemoryHandle::Allocate(kDekBytes).Unwrap();
 * dek.WithWriteAccess([](std::span<uint8_t> bytes) {
 *     SodiumInterop::FillRandom(bytes);
 * });
 * @endcode
 */
class SecureMemoryHandle {
    // Void-returning callbacks yield Unit
    template<typename F, typename Span>
    using AccessResult = std::conditional_t<
        std::is_void_v<std::invoke_result_t<F, Span>>, Unit, std::invoke_result_t<F, Span>>;

public:
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    /**
     * @brief Allocate a handle sized to @p bytes and copy them in
     *
     * The caller remains responsible for wiping its own copy.
     */
    static Result<SecureMemoryHandle, SodiumFailure> FromBytes(std::span<const uint8_t> bytes);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    Result<Unit, SodiumFailure> Read(std::span<uint8_t> output) const;

    /**
     * @brief Constant-time comparison of the contents of two handles
     */
    Result<bool, SodiumFailure> ConstantTimeEquals(const SecureMemoryHandle& other) const;

    /**
     * @brief Zero and free the buffer now, leaving an invalid handle
     */
    void Reset() noexcept;

    template<typename F>
    auto WithReadAccess(F&& func) const
        -> Result<AccessResult<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = AccessResult<F, std::span<const uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }
        const std::span<const uint8_t> view(static_cast<const uint8_t*>(ptr_), size_);
        if constexpr (std::is_void_v<std::invoke_result_t<F, std::span<const uint8_t>>>) {
            std::forward<F>(func)(view);
            return Result<T, SodiumFailure>::Ok(unit);
        } else {
            return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(view));
        }
    }

    template<typename F>
    auto WithWriteAccess(F&& func)
        -> Result<AccessResult<F, std::span<uint8_t>>, SodiumFailure> {
        using T = AccessResult<F, std::span<uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }
        const std::span<uint8_t> view(static_cast<uint8_t*>(ptr_), size_);
        if constexpr (std::is_void_v<std::invoke_result_t<F, std::span<uint8_t>>>) {
            std::forward<F>(func)(view);
            return Result<T, SodiumFailure>::Ok(unit);
        } else {
            return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(view));
        }
    }

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    void* ptr_;
    size_t size_;
};

} // namespace phivault::keystore::crypto
