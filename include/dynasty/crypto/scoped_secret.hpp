#pragma once

#include <sodium.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace dynasty::e2ee::crypto {

/**
 * @brief Owning byte buffer for transient secret material.
 *
 * The buffer is zeroed with sodium_memzero when the object is destroyed,
 * reassigned or explicitly wiped. Copies are deep and carry the same
 * guarantee; a moved-from secret is empty.
 */
class ScopedSecret {
public:
    ScopedSecret() = default;

    explicit ScopedSecret(const size_t size)
        : bytes_(size, 0) {}

    /// Takes ownership of the vector's storage.
    explicit ScopedSecret(std::vector<uint8_t>&& bytes) noexcept
        : bytes_(std::move(bytes)) {}

    [[nodiscard]] static ScopedSecret Copy(std::span<const uint8_t> bytes) {
        ScopedSecret secret(bytes.size());
        std::copy(bytes.begin(), bytes.end(), secret.bytes_.begin());
        return secret;
    }

    ~ScopedSecret() {
        Wipe();
    }

    ScopedSecret(const ScopedSecret& other)
        : bytes_(other.bytes_) {}

    ScopedSecret& operator=(const ScopedSecret& other) {
        if (this != &other) {
            Wipe();
            bytes_ = other.bytes_;
        }
        return *this;
    }

    ScopedSecret(ScopedSecret&& other) noexcept
        : bytes_(std::move(other.bytes_)) {
        other.bytes_.clear();
    }

    ScopedSecret& operator=(ScopedSecret&& other) noexcept {
        if (this != &other) {
            Wipe();
            bytes_ = std::move(other.bytes_);
            other.bytes_.clear();
        }
        return *this;
    }

    void Wipe() noexcept {
        if (!bytes_.empty()) {
            sodium_memzero(bytes_.data(), bytes_.size());
            bytes_.clear();
        }
    }

    [[nodiscard]] std::span<const uint8_t> Span() const noexcept { return bytes_; }
    [[nodiscard]] std::span<uint8_t> MutableSpan() noexcept { return bytes_; }
    [[nodiscard]] const uint8_t* Data() const noexcept { return bytes_.data(); }
    [[nodiscard]] size_t Size() const noexcept { return bytes_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return bytes_.empty(); }

private:
    std::vector<uint8_t> bytes_;
};

}
