#include "dynasty/security/dh_validator.hpp"
#include "dynasty/crypto/sodium_interop.hpp"

#include <fmt/core.h>

namespace dynasty::e2ee::security {

Result<Unit, ProtocolFailure> DhValidator::ValidateX25519PublicKey(
    std::span<const uint8_t> public_key) {

    if (public_key.size() != kKeyBytes) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                fmt::format("Invalid X25519 public key size: expected {}, got {}",
                            kKeyBytes, public_key.size())));
    }

    if (HasSmallOrder(public_key)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                "X25519 public key is a small-order point"));
    }

    if (!IsReducedFieldElement(public_key)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                "X25519 public key is not a reduced Curve25519 field element"));
    }

    return Result<Unit, ProtocolFailure>::Ok(unit);
}

bool DhValidator::HasSmallOrder(std::span<const uint8_t> public_key) {
    bool found = false;
    for (const auto& point : SMALL_ORDER_POINTS) {
        found |= crypto::SodiumInterop::ConstantTimeEquals(public_key, point);
    }
    return found;
}

bool DhValidator::IsReducedFieldElement(std::span<const uint8_t> public_key) {
    // Compare from the most significant byte; the top bit is ignored by X25519.
    for (size_t i = kKeyBytes; i-- > 0;) {
        const uint8_t key_byte = i == kKeyBytes - 1 ? public_key[i] & 0x7F : public_key[i];
        const uint8_t prime_byte = CURVE_25519_PRIME[i];
        if (key_byte < prime_byte) {
            return true;
        }
        if (key_byte > prime_byte) {
            return false;
        }
    }
    return false;
}

}
