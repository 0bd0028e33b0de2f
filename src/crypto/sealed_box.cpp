#include "dynasty/crypto/sealed_box.hpp"
#include "dynasty/crypto/aes_gcm.hpp"
#include "dynasty/crypto/hkdf.hpp"
#include "dynasty/crypto/sodium_interop.hpp"
#include "dynasty/protocol/constants.hpp"
#include "dynasty/security/dh_validator.hpp"

namespace dynasty::e2ee::crypto {

namespace {
    std::vector<uint8_t> BindKeys(
        std::span<const uint8_t> ephemeral_public,
        std::span<const uint8_t> recipient_public) {
        std::vector<uint8_t> bound;
        bound.reserve(ephemeral_public.size() + recipient_public.size());
        bound.insert(bound.end(), ephemeral_public.begin(), ephemeral_public.end());
        bound.insert(bound.end(), recipient_public.begin(), recipient_public.end());
        return bound;
    }

    Result<ScopedSecret, ProtocolFailure> DeriveBoxKey(
        const ScopedSecret& shared_secret,
        std::span<const uint8_t> bound_keys) {
        auto material = Hkdf::DeriveKeyBytes(
            shared_secret.Span(),
            kAesKeyBytes + kAesGcmNonceBytes,
            bound_keys,
            kSealedBoxInfo);
        if (material.IsErr()) {
            return Result<ScopedSecret, ProtocolFailure>::Err(std::move(material).UnwrapErr());
        }
        return Result<ScopedSecret, ProtocolFailure>::Ok(ScopedSecret(std::move(material).Unwrap()));
    }
}

Result<SealedPayload, ProtocolFailure> SealedBox::Seal(
    std::span<const uint8_t> recipient_public_key,
    std::span<const uint8_t> plaintext) {
    if (auto valid = security::DhValidator::ValidateX25519PublicKey(recipient_public_key); valid.IsErr()) {
        return Result<SealedPayload, ProtocolFailure>::Err(std::move(valid).UnwrapErr());
    }

    auto ephemeral_result = SodiumInterop::GenerateX25519KeyPair(kPurposeEphemeralX25519);
    if (ephemeral_result.IsErr()) {
        return Result<SealedPayload, ProtocolFailure>::Err(std::move(ephemeral_result).UnwrapErr());
    }
    KeyPair ephemeral = std::move(ephemeral_result).Unwrap();

    auto shared = SodiumInterop::ComputeX25519(ephemeral.private_key.Span(), recipient_public_key);
    if (shared.IsErr()) {
        return Result<SealedPayload, ProtocolFailure>::Err(std::move(shared).UnwrapErr());
    }

    const auto bound = BindKeys(ephemeral.public_key, recipient_public_key);
    auto box_key = DeriveBoxKey(shared.Unwrap(), bound);
    if (box_key.IsErr()) {
        return Result<SealedPayload, ProtocolFailure>::Err(std::move(box_key).UnwrapErr());
    }
    const auto key_span = box_key.Unwrap().Span();

    auto ciphertext = AesGcm::Encrypt(
        key_span.first(kAesKeyBytes),
        key_span.subspan(kAesKeyBytes, kAesGcmNonceBytes),
        plaintext,
        bound);
    if (ciphertext.IsErr()) {
        return Result<SealedPayload, ProtocolFailure>::Err(std::move(ciphertext).UnwrapErr());
    }

    return Result<SealedPayload, ProtocolFailure>::Ok(SealedPayload{
        .ephemeral_key = std::move(ephemeral.public_key),
        .ciphertext = std::move(ciphertext).Unwrap()});
}

Result<std::vector<uint8_t>, ProtocolFailure> SealedBox::Open(
    std::span<const uint8_t> recipient_private_key,
    std::span<const uint8_t> recipient_public_key,
    const SealedPayload& payload) {
    if (auto valid = security::DhValidator::ValidateX25519PublicKey(payload.ephemeral_key); valid.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::AuthenticationFailed(valid.UnwrapErr().message));
    }

    auto shared = SodiumInterop::ComputeX25519(recipient_private_key, payload.ephemeral_key);
    if (shared.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(shared).UnwrapErr());
    }

    const auto bound = BindKeys(payload.ephemeral_key, recipient_public_key);
    auto box_key = DeriveBoxKey(shared.Unwrap(), bound);
    if (box_key.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(box_key).UnwrapErr());
    }
    const auto key_span = box_key.Unwrap().Span();

    return AesGcm::Decrypt(
        key_span.first(kAesKeyBytes),
        key_span.subspan(kAesKeyBytes, kAesGcmNonceBytes),
        payload.ciphertext,
        bound);
}

}
