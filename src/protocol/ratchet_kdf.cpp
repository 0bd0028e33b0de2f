#include "dynasty/protocol/ratchet_kdf.hpp"
#include "dynasty/crypto/hkdf.hpp"
#include "dynasty/protocol/constants.hpp"

#include <algorithm>

namespace dynasty::e2ee::protocol {
    using crypto::Hkdf;
    using crypto::ScopedSecret;

    namespace {
        void AppendLe32(std::vector<uint8_t>& out, const uint32_t value) {
            out.push_back(static_cast<uint8_t>(value & 0xFF));
            out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
            out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
            out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
        }
    }

    Result<RootStep, ProtocolFailure> RatchetKdf::DeriveRoot(
        std::span<const uint8_t> root_key,
        std::span<const uint8_t> dh_output) {
        if (root_key.size() != kRootKeyBytes) {
            return Result<RootStep, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Root key must be 32 bytes"));
        }
        auto derived = Hkdf::DeriveKeyBytes(dh_output, kRootKeyBytes + kChainKeyBytes, root_key, kRootKeyInfo);
        if (derived.IsErr()) {
            return Result<RootStep, ProtocolFailure>::Err(std::move(derived).UnwrapErr());
        }
        ScopedSecret output(std::move(derived).Unwrap());
        const auto bytes = output.Span();
        return Result<RootStep, ProtocolFailure>::Ok(RootStep{
            .root_key = ScopedSecret::Copy(bytes.first(kRootKeyBytes)),
            .chain_key = ScopedSecret::Copy(bytes.subspan(kRootKeyBytes, kChainKeyBytes))});
    }

    Result<ChainStep, ProtocolFailure> RatchetKdf::AdvanceChain(std::span<const uint8_t> chain_key) {
        if (chain_key.size() != kChainKeyBytes) {
            return Result<ChainStep, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Chain key must be 32 bytes"));
        }
        auto message_key = Hkdf::DeriveKeyBytes(chain_key, kMessageKeyBytes, {}, kMessageKeyInfo);
        if (message_key.IsErr()) {
            return Result<ChainStep, ProtocolFailure>::Err(std::move(message_key).UnwrapErr());
        }
        auto next_chain_key = Hkdf::DeriveKeyBytes(chain_key, kChainKeyBytes, {}, kChainKeyInfo);
        if (next_chain_key.IsErr()) {
            return Result<ChainStep, ProtocolFailure>::Err(std::move(next_chain_key).UnwrapErr());
        }
        return Result<ChainStep, ProtocolFailure>::Ok(ChainStep{
            .message_key = ScopedSecret(std::move(message_key).Unwrap()),
            .next_chain_key = ScopedSecret(std::move(next_chain_key).Unwrap())});
    }

    Result<MessageKeys, ProtocolFailure> RatchetKdf::ExpandMessageKey(std::span<const uint8_t> message_key) {
        if (message_key.size() != kMessageKeyBytes) {
            return Result<MessageKeys, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Message key must be 32 bytes"));
        }
        auto expanded = Hkdf::DeriveKeyBytes(message_key, kMessageKeyMaterialBytes, {}, kMessageKeysInfo);
        if (expanded.IsErr()) {
            return Result<MessageKeys, ProtocolFailure>::Err(std::move(expanded).UnwrapErr());
        }
        ScopedSecret material(std::move(expanded).Unwrap());
        const auto bytes = material.Span();
        const auto iv = bytes.subspan(kAesKeyBytes + kHmacBytes, kAesGcmNonceBytes);
        return Result<MessageKeys, ProtocolFailure>::Ok(MessageKeys{
            .encryption_key = ScopedSecret::Copy(bytes.first(kAesKeyBytes)),
            .mac_key = ScopedSecret::Copy(bytes.subspan(kAesKeyBytes, kHmacBytes)),
            .iv = std::vector<uint8_t>(iv.begin(), iv.end())});
    }

    std::vector<uint8_t> RatchetKdf::EncodeHeader(
        std::span<const uint8_t> dh,
        const uint32_t pn,
        const uint32_t n) {
        std::vector<uint8_t> header;
        header.reserve(dh.size() + 8);
        header.insert(header.end(), dh.begin(), dh.end());
        AppendLe32(header, pn);
        AppendLe32(header, n);
        return header;
    }
}
