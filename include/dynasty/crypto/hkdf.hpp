#pragma once

#include "dynasty/core/result.hpp"
#include "dynasty/core/failures.hpp"

#include <span>
#include <string_view>
#include <vector>
#include <cstdint>

namespace dynasty::e2ee::crypto {

/**
 * @brief HKDF-SHA256 (RFC 5869) through OpenSSL 3 EVP_KDF
 */
class Hkdf {
public:
    /**
     * @brief Extract-and-expand into a caller-provided buffer
     *
     * @param ikm Input key material, must not be empty
     * @param output Receives output.size() bytes
     * @param salt Optional salt (empty means a zero-filled HashLen salt)
     * @param info Optional context string
     */
    static Result<Unit, ProtocolFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, ProtocolFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    /// Convenience overload taking the info label as text.
    static Result<std::vector<uint8_t>, ProtocolFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt,
        std::string_view info);

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

}
