#pragma once
#include "dynasty/core/result.hpp"
#include "dynasty/core/failures.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace dynasty::e2ee::crypto {

struct SealedPayload {
    std::vector<uint8_t> ephemeral_key;
    std::vector<uint8_t> ciphertext;
};

/**
 * @brief Anonymous one-shot encryption to an X25519 public key
 *
 * A fresh ephemeral key is agreed with the recipient key; HKDF over the
 * shared secret (salted with both public keys) yields the AES-256-GCM key
 * and nonce. Both public keys are bound as associated data, so a payload
 * only opens under the exact recipient key it was sealed to.
 */
class SealedBox {
public:
    static Result<SealedPayload, ProtocolFailure> Seal(
        std::span<const uint8_t> recipient_public_key,
        std::span<const uint8_t> plaintext);

    /// Fails with AuthenticationFailed when the key does not match or the payload was altered.
    static Result<std::vector<uint8_t>, ProtocolFailure> Open(
        std::span<const uint8_t> recipient_private_key,
        std::span<const uint8_t> recipient_public_key,
        const SealedPayload& payload);

private:
    SealedBox() = delete;
};

}
