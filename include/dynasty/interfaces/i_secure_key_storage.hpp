#pragma once
#include "dynasty/core/result.hpp"
#include "dynasty/core/failures.hpp"
#include "dynasty/crypto/scoped_secret.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace dynasty::e2ee::interfaces {

/// OS-backed key-value store with at-rest protection. Values may contain
/// private key material and are returned in wiping buffers.
class ISecureKeyStorage {
public:
    virtual ~ISecureKeyStorage() = default;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> Set(
        const std::string& key,
        std::span<const uint8_t> value) = 0;

    [[nodiscard]] virtual Result<std::optional<crypto::ScopedSecret>, ProtocolFailure> Get(
        const std::string& key) = 0;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> Delete(const std::string& key) = 0;
};

}
