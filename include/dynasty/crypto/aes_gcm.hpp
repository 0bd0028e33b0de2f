#pragma once
#include "dynasty/core/result.hpp"
#include "dynasty/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>

namespace dynasty::e2ee::crypto {

class AesGcm {
public:
    /// AES-256-GCM. The 16-byte tag is appended to the returned ciphertext.
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});

    /// Fails with AuthenticationFailed when the tag does not verify.
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});

private:
    AesGcm() = delete;
};

}
