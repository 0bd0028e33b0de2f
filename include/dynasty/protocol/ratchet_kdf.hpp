#pragma once
#include "dynasty/core/result.hpp"
#include "dynasty/core/failures.hpp"
#include "dynasty/crypto/scoped_secret.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace dynasty::e2ee::protocol {

struct RootStep {
    crypto::ScopedSecret root_key;
    crypto::ScopedSecret chain_key;
};

struct ChainStep {
    crypto::ScopedSecret message_key;
    crypto::ScopedSecret next_chain_key;
};

/// Per-message key material expanded from a single message key.
struct MessageKeys {
    crypto::ScopedSecret encryption_key;
    crypto::ScopedSecret mac_key;
    std::vector<uint8_t> iv;
};

/**
 * @brief HKDF-SHA256 derivations of the Double Ratchet
 *
 * Root step:    HKDF(ikm = dh, salt = rk, "Dynasty Root Key") -> rk' || ck
 * Chain step:   HKDF(ck, "Dynasty Message Key") -> mk,
 *               HKDF(ck, "Dynasty Chain Key") -> ck'
 * Message keys: HKDF(mk, "Dynasty Message Keys") -> enc || mac || iv
 */
class RatchetKdf {
public:
    [[nodiscard]] static Result<RootStep, ProtocolFailure> DeriveRoot(
        std::span<const uint8_t> root_key,
        std::span<const uint8_t> dh_output);

    [[nodiscard]] static Result<ChainStep, ProtocolFailure> AdvanceChain(
        std::span<const uint8_t> chain_key);

    [[nodiscard]] static Result<MessageKeys, ProtocolFailure> ExpandMessageKey(
        std::span<const uint8_t> message_key);

    /// dh || LE32(pn) || LE32(n)
    [[nodiscard]] static std::vector<uint8_t> EncodeHeader(
        std::span<const uint8_t> dh,
        uint32_t pn,
        uint32_t n);

private:
    RatchetKdf() = delete;
};

}
