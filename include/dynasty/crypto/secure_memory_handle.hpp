#pragma once

#include "dynasty/core/result.hpp"
#include "dynasty/core/failures.hpp"

#include <span>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <vector>

namespace dynasty::e2ee::crypto {

/**
 * @brief RAII wrapper for a libsodium guarded allocation
 *
 * Holds long-lived private keys (identity, signed pre-key, one-time
 * pre-keys, rotating keys). The region is guard-paged, locked in RAM
 * and zeroed by sodium_free() on destruction.
 *
 * Move-only. A moved-from or default-constructed handle is invalid and
 * every access returns SodiumFailure::InvalidOperation.
 */
class SecureMemoryHandle {
public:
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    /// Allocates exactly data.size() bytes and copies data in.
    static Result<SecureMemoryHandle, SodiumFailure> FromBytes(std::span<const uint8_t> data);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    Result<Unit, SodiumFailure> Read(std::span<uint8_t> output) const;

    Result<std::vector<uint8_t>, SodiumFailure> ReadBytes(size_t size) const;

    /// Deep copy into a new guarded allocation.
    Result<SecureMemoryHandle, SodiumFailure> Clone() const;

    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;

        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }

        std::span<const uint8_t> secure_span(
            static_cast<const uint8_t*>(ptr_),
            size_);

        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
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

}
