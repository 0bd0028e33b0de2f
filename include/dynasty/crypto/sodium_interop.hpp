#pragma once

#include "dynasty/core/result.hpp"
#include "dynasty/core/failures.hpp"
#include "dynasty/core/constants.hpp"
#include "dynasty/crypto/key_pair.hpp"
#include "dynasty/crypto/scoped_secret.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string_view>
#include <vector>

namespace dynasty::e2ee::crypto {

/**
 * @brief Interop layer for libsodium cryptographic operations
 *
 * Every primitive the engine needs from libsodium goes through here:
 * X25519 agreement, Ed25519 signatures, HMAC-SHA256, the CSPRNG and
 * guarded allocations.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Must be called before any other operation. Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Small buffers are cleared through a volatile pointer, larger ones
     * through sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    static Result<Unit, SodiumFailure> SecureWipe(std::span<const uint8_t> buffer);

    /**
     * @brief Constant-time comparison. Buffers of different length compare unequal.
     */
    static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    // ========================================================================
    // Key Generation and Agreement
    // ========================================================================

    /**
     * @brief Generate an X25519 key pair
     *
     * @param key_purpose Included in failure messages
     */
    static Result<KeyPair, ProtocolFailure> GenerateX25519KeyPair(std::string_view key_purpose);

    /**
     * @brief Generate an Ed25519 signing key pair (64-byte secret, 32-byte public)
     */
    static Result<KeyPair, ProtocolFailure> GenerateEd25519KeyPair();

    static Result<std::vector<uint8_t>, ProtocolFailure> DeriveX25519PublicKey(
        std::span<const uint8_t> private_key);

    /**
     * @brief X25519 agreement
     *
     * Fails when libsodium rejects the point or the shared secret is all
     * zeros (low-order peer key).
     */
    static Result<ScopedSecret, ProtocolFailure> ComputeX25519(
        std::span<const uint8_t> private_key,
        std::span<const uint8_t> public_key);

    // ========================================================================
    // Signatures and MACs
    // ========================================================================

    static Result<std::vector<uint8_t>, ProtocolFailure> SignDetached(
        std::span<const uint8_t> ed25519_secret_key,
        std::span<const uint8_t> message);

    [[nodiscard]] static bool VerifyDetached(
        std::span<const uint8_t> ed25519_public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature) noexcept;

    static Result<std::vector<uint8_t>, ProtocolFailure> HmacSha256(
        std::span<const uint8_t> key,
        std::span<const uint8_t> data);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static uint32_t GenerateRandomUInt32(bool ensure_non_zero = false);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guard-paged, locked memory via sodium_malloc
     *
     * @return nullptr when libsodium is not initialized or allocation fails
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

}
