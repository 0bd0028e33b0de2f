#include "dynasty/crypto/sodium_interop.hpp"
#include "dynasty/protocol/constants.hpp"

#include <fmt/core.h>


namespace dynasty::e2ee::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > Constants::MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                fmt::format("Buffer size {} exceeds maximum {}",
                            buffer.size(), Constants::MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<const uint8_t> buffer) {
    return SecureWipe(std::span<uint8_t>(
        const_cast<uint8_t*>(buffer.data()),
        buffer.size()));
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

// ============================================================================
// Key Generation and Agreement
// ============================================================================

Result<KeyPair, ProtocolFailure> SodiumInterop::GenerateX25519KeyPair(std::string_view key_purpose) {
    if (!IsInitialized()) {
        return Result<KeyPair, ProtocolFailure>::Err(
            ProtocolFailure::KeyGeneration(std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    KeyPair pair;
    pair.private_key = ScopedSecret(kX25519PrivateKeyBytes);
    pair.public_key.resize(kX25519PublicKeyBytes);
    if (crypto_box_keypair(pair.public_key.data(), pair.private_key.MutableSpan().data()) != 0) {
        return Result<KeyPair, ProtocolFailure>::Err(
            ProtocolFailure::KeyGeneration(
                fmt::format("Failed to generate {} key pair", key_purpose)));
    }
    return Result<KeyPair, ProtocolFailure>::Ok(std::move(pair));
}

Result<KeyPair, ProtocolFailure> SodiumInterop::GenerateEd25519KeyPair() {
    if (!IsInitialized()) {
        return Result<KeyPair, ProtocolFailure>::Err(
            ProtocolFailure::KeyGeneration(std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    KeyPair pair;
    pair.private_key = ScopedSecret(kEd25519SecretKeyBytes);
    pair.public_key.resize(kEd25519PublicKeyBytes);
    if (crypto_sign_keypair(pair.public_key.data(), pair.private_key.MutableSpan().data()) != 0) {
        return Result<KeyPair, ProtocolFailure>::Err(
            ProtocolFailure::KeyGeneration("Failed to generate Ed25519 key pair"));
    }
    return Result<KeyPair, ProtocolFailure>::Ok(std::move(pair));
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::DeriveX25519PublicKey(
    std::span<const uint8_t> private_key) {
    if (private_key.size() != kX25519PrivateKeyBytes) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                fmt::format("X25519 private key must be {} bytes, got {}",
                            kX25519PrivateKeyBytes, private_key.size())));
    }
    std::vector<uint8_t> public_key(kX25519PublicKeyBytes);
    if (crypto_scalarmult_base(public_key.data(), private_key.data()) != 0) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("Failed to derive X25519 public key"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(public_key));
}

Result<ScopedSecret, ProtocolFailure> SodiumInterop::ComputeX25519(
    std::span<const uint8_t> private_key,
    std::span<const uint8_t> public_key) {
    if (private_key.size() != kX25519PrivateKeyBytes ||
        public_key.size() != kX25519PublicKeyBytes) {
        return Result<ScopedSecret, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Invalid X25519 key sizes"));
    }
    ScopedSecret shared(kX25519SharedSecretBytes);
    if (crypto_scalarmult(shared.MutableSpan().data(), private_key.data(), public_key.data()) != 0) {
        return Result<ScopedSecret, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("X25519 agreement rejected the peer public key"));
    }
    if (sodium_is_zero(shared.Data(), shared.Size()) == 1) {
        return Result<ScopedSecret, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("X25519 agreement produced an all-zero secret"));
    }
    return Result<ScopedSecret, ProtocolFailure>::Ok(std::move(shared));
}

// ============================================================================
// Signatures and MACs
// ============================================================================

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::SignDetached(
    std::span<const uint8_t> ed25519_secret_key,
    std::span<const uint8_t> message) {
    if (ed25519_secret_key.size() != kEd25519SecretKeyBytes) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                fmt::format("Ed25519 secret key must be {} bytes, got {}",
                            kEd25519SecretKeyBytes, ed25519_secret_key.size())));
    }
    std::vector<uint8_t> signature(kEd25519SignatureBytes);
    if (crypto_sign_detached(signature.data(), nullptr,
                             message.data(), message.size(),
                             ed25519_secret_key.data()) != 0) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::KeyGeneration("Ed25519 signing failed"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(signature));
}

bool SodiumInterop::VerifyDetached(
    std::span<const uint8_t> ed25519_public_key,
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) noexcept {
    if (ed25519_public_key.size() != kEd25519PublicKeyBytes ||
        signature.size() != kEd25519SignatureBytes) {
        return false;
    }
    return crypto_sign_verify_detached(signature.data(),
                                       message.data(), message.size(),
                                       ed25519_public_key.data()) == 0;
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::HmacSha256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> data) {
    if (key.size() != crypto_auth_hmacsha256_KEYBYTES) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("HMAC key must be 32 bytes"));
    }
    std::vector<uint8_t> mac(crypto_auth_hmacsha256_BYTES);
    crypto_auth_hmacsha256_state state;
    crypto_auth_hmacsha256_init(&state, key.data(), key.size());
    crypto_auth_hmacsha256_update(&state, data.data(), data.size());
    crypto_auth_hmacsha256_final(&state, mac.data());
    sodium_memzero(&state, sizeof(state));
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(mac));
}

// ============================================================================
// Random Number Generation
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    if (size > 0) {
        randombytes_buf(buffer.data(), size);
    }
    return buffer;
}

uint32_t SodiumInterop::GenerateRandomUInt32(bool ensure_non_zero) {
    uint32_t value;
    do {
        value = randombytes_random();
    } while (ensure_non_zero && value == 0);
    return value;
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

}
