#include "dynasty/identity/identity_keys.hpp"
#include "dynasty/core/logging.hpp"
#include "dynasty/crypto/hkdf.hpp"
#include "dynasty/crypto/sodium_interop.hpp"
#include "dynasty/protocol/constants.hpp"
#include "core/proto_helpers.hpp"

#include <algorithm>
#include <array>

namespace dynasty::e2ee::identity {
    namespace pb = dynasty::proto::e2ee;
    using crypto::Hkdf;
    using crypto::KeyPair;
    using crypto::ScopedSecret;
    using crypto::SecureMemoryHandle;
    using crypto::SodiumInterop;

    namespace {
        constexpr std::string_view kTag = "x3dh";

        Result<SecureMemoryHandle, ProtocolFailure> ToHandle(std::span<const uint8_t> secret) {
            auto handle = SecureMemoryHandle::FromBytes(secret);
            if (handle.IsErr()) {
                return Result<SecureMemoryHandle, ProtocolFailure>::Err(
                    ProtocolFailure::FromSodiumFailure(handle.UnwrapErr()));
            }
            return Result<SecureMemoryHandle, ProtocolFailure>::Ok(std::move(handle).Unwrap());
        }

        Result<ScopedSecret, ProtocolFailure> ReadHandle(const SecureMemoryHandle& handle) {
            auto bytes = handle.ReadBytes(handle.Size());
            if (bytes.IsErr()) {
                return Result<ScopedSecret, ProtocolFailure>::Err(
                    ProtocolFailure::FromSodiumFailure(bytes.UnwrapErr()));
            }
            return Result<ScopedSecret, ProtocolFailure>::Ok(ScopedSecret(std::move(bytes).Unwrap()));
        }

        Result<ScopedSecret, ProtocolFailure> ComputeDh(
            std::span<const uint8_t> private_key,
            std::span<const uint8_t> public_key,
            std::string_view label) {
            auto shared = SodiumInterop::ComputeX25519(private_key, public_key);
            if (shared.IsErr()) {
                return Result<ScopedSecret, ProtocolFailure>::Err(
                    ProtocolFailure::DeriveKey(fmt::format("{} computation failed: {}",
                                                           label, shared.UnwrapErr().message)));
            }
            return shared;
        }
    }

    Result<IdentityKeys, ProtocolFailure> IdentityKeys::Create(
        const uint32_t one_time_key_count,
        const TimePoint now) {
        auto identity = SodiumInterop::GenerateX25519KeyPair(kPurposeIdentityX25519);
        if (identity.IsErr()) {
            return Result<IdentityKeys, ProtocolFailure>::Err(std::move(identity).UnwrapErr());
        }
        return CreateWithIdentity(identity.Unwrap(), one_time_key_count, now);
    }

    Result<IdentityKeys, ProtocolFailure> IdentityKeys::CreateWithIdentity(
        const KeyPair& identity,
        const uint32_t one_time_key_count,
        const TimePoint now) {
        IdentityKeys keys;
        if (auto replaced = keys.ReplaceIdentityKeyPair(identity); replaced.IsErr()) {
            return Result<IdentityKeys, ProtocolFailure>::Err(std::move(replaced).UnwrapErr());
        }
        if (auto generated = keys.GenerateSigningAndPreKeys(one_time_key_count, now); generated.IsErr()) {
            return Result<IdentityKeys, ProtocolFailure>::Err(std::move(generated).UnwrapErr());
        }
        keys.registration_id_ = SodiumInterop::GenerateRandomUInt32(true) & kRegistrationIdMask;
        if (keys.registration_id_ == 0) {
            keys.registration_id_ = 1;
        }
        keys.created_at_ = now;
        return Result<IdentityKeys, ProtocolFailure>::Ok(std::move(keys));
    }

    Result<Unit, ProtocolFailure> IdentityKeys::GenerateSigningAndPreKeys(
        const uint32_t one_time_key_count,
        const TimePoint now) {
        auto signing = SodiumInterop::GenerateEd25519KeyPair();
        if (signing.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(signing).UnwrapErr());
        }
        auto signing_pair = std::move(signing).Unwrap();

        auto spk = SodiumInterop::GenerateX25519KeyPair(kPurposeSignedPreKey);
        if (spk.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(spk).UnwrapErr());
        }
        auto spk_pair = std::move(spk).Unwrap();

        auto signature = SodiumInterop::SignDetached(signing_pair.private_key.Span(), spk_pair.public_key);
        if (signature.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(signature).UnwrapErr());
        }

        auto signing_handle = ToHandle(signing_pair.private_key.Span());
        if (signing_handle.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(signing_handle).UnwrapErr());
        }
        auto spk_handle = ToHandle(spk_pair.private_key.Span());
        if (spk_handle.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(spk_handle).UnwrapErr());
        }

        identity_ed25519_secret_key_handle_ = std::move(signing_handle).Unwrap();
        identity_ed25519_public_ = std::move(signing_pair.public_key);
        signed_pre_key_id_ = 1;
        signed_pre_key_secret_key_handle_ = std::move(spk_handle).Unwrap();
        signed_pre_key_public_ = std::move(spk_pair.public_key);
        signed_pre_key_signature_ = std::move(signature).Unwrap();
        signed_pre_key_created_at_ = now;

        one_time_pre_keys_.clear();
        next_one_time_pre_key_id_ = kFirstOneTimePreKeyId;
        return AppendOneTimePreKeys(one_time_key_count);
    }

    Result<Unit, ProtocolFailure> IdentityKeys::AppendOneTimePreKeys(const uint32_t count) {
        std::vector<OneTimePreKey> generated;
        generated.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            auto pair = SodiumInterop::GenerateX25519KeyPair(kPurposeOneTimePreKey);
            if (pair.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(std::move(pair).UnwrapErr());
            }
            auto key_pair = std::move(pair).Unwrap();
            auto handle = ToHandle(key_pair.private_key.Span());
            if (handle.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(std::move(handle).UnwrapErr());
            }
            generated.push_back(OneTimePreKey{
                .id = next_one_time_pre_key_id_ + i,
                .private_key = std::move(handle).Unwrap(),
                .public_key = std::move(key_pair.public_key)});
        }
        next_one_time_pre_key_id_ += count;
        for (auto& key : generated) {
            one_time_pre_keys_.push_back(std::move(key));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<IdentityKeys, ProtocolFailure> IdentityKeys::FromRecord(const pb::IdentityRecord& record) {
        if (record.identity_private_key().size() != kX25519PrivateKeyBytes ||
            record.identity_public_key().size() != kX25519PublicKeyBytes ||
            record.signing_private_key().size() != kEd25519SecretKeyBytes ||
            record.signing_public_key().size() != kEd25519PublicKeyBytes ||
            record.signed_pre_key().private_key().size() != kX25519PrivateKeyBytes ||
            record.signed_pre_key().public_key().size() != kX25519PublicKeyBytes) {
            return Result<IdentityKeys, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Stored identity record has malformed keys"));
        }

        IdentityKeys keys;
        auto identity_handle = ToHandle(detail::AsSpan(record.identity_private_key()));
        auto signing_handle = ToHandle(detail::AsSpan(record.signing_private_key()));
        auto spk_handle = ToHandle(detail::AsSpan(record.signed_pre_key().private_key()));
        if (identity_handle.IsErr()) {
            return Result<IdentityKeys, ProtocolFailure>::Err(std::move(identity_handle).UnwrapErr());
        }
        if (signing_handle.IsErr()) {
            return Result<IdentityKeys, ProtocolFailure>::Err(std::move(signing_handle).UnwrapErr());
        }
        if (spk_handle.IsErr()) {
            return Result<IdentityKeys, ProtocolFailure>::Err(std::move(spk_handle).UnwrapErr());
        }

        keys.identity_x25519_secret_key_handle_ = std::move(identity_handle).Unwrap();
        keys.identity_x25519_public_ = detail::ToBytes(record.identity_public_key());
        keys.identity_ed25519_secret_key_handle_ = std::move(signing_handle).Unwrap();
        keys.identity_ed25519_public_ = detail::ToBytes(record.signing_public_key());
        keys.signed_pre_key_id_ = record.signed_pre_key().id();
        keys.signed_pre_key_secret_key_handle_ = std::move(spk_handle).Unwrap();
        keys.signed_pre_key_public_ = detail::ToBytes(record.signed_pre_key().public_key());
        keys.signed_pre_key_signature_ = detail::ToBytes(record.signed_pre_key().signature());
        keys.signed_pre_key_created_at_ = detail::FromTimestamp(record.signed_pre_key().created_at());

        for (const auto& stored : record.one_time_pre_keys()) {
            if (stored.private_key().size() != kX25519PrivateKeyBytes ||
                stored.public_key().size() != kX25519PublicKeyBytes) {
                return Result<IdentityKeys, ProtocolFailure>::Err(
                    ProtocolFailure::Decode(fmt::format("One-time pre-key {} is malformed", stored.id())));
            }
            auto handle = ToHandle(detail::AsSpan(stored.private_key()));
            if (handle.IsErr()) {
                return Result<IdentityKeys, ProtocolFailure>::Err(std::move(handle).UnwrapErr());
            }
            keys.one_time_pre_keys_.push_back(OneTimePreKey{
                .id = stored.id(),
                .private_key = std::move(handle).Unwrap(),
                .public_key = detail::ToBytes(stored.public_key())});
        }
        keys.next_one_time_pre_key_id_ = std::max(record.next_one_time_pre_key_id(), kFirstOneTimePreKeyId);
        keys.registration_id_ = record.registration_id();
        keys.created_at_ = detail::FromTimestamp(record.created_at());
        return Result<IdentityKeys, ProtocolFailure>::Ok(std::move(keys));
    }

    Result<pb::IdentityRecord, ProtocolFailure> IdentityKeys::ToRecord() const {
        auto identity_private = ReadIdentityPrivate();
        if (identity_private.IsErr()) {
            return Result<pb::IdentityRecord, ProtocolFailure>::Err(std::move(identity_private).UnwrapErr());
        }
        auto signing_private = ReadHandle(identity_ed25519_secret_key_handle_);
        if (signing_private.IsErr()) {
            return Result<pb::IdentityRecord, ProtocolFailure>::Err(std::move(signing_private).UnwrapErr());
        }
        auto spk_private = ReadSignedPreKeyPrivate();
        if (spk_private.IsErr()) {
            return Result<pb::IdentityRecord, ProtocolFailure>::Err(std::move(spk_private).UnwrapErr());
        }

        pb::IdentityRecord record;
        const auto& identity_secret = identity_private.Unwrap();
        const auto& signing_secret = signing_private.Unwrap();
        const auto& spk_secret = spk_private.Unwrap();
        record.set_identity_private_key(identity_secret.Data(), identity_secret.Size());
        record.set_identity_public_key(identity_x25519_public_.data(), identity_x25519_public_.size());
        record.set_signing_private_key(signing_secret.Data(), signing_secret.Size());
        record.set_signing_public_key(identity_ed25519_public_.data(), identity_ed25519_public_.size());

        auto* spk = record.mutable_signed_pre_key();
        spk->set_id(signed_pre_key_id_);
        spk->set_private_key(spk_secret.Data(), spk_secret.Size());
        spk->set_public_key(signed_pre_key_public_.data(), signed_pre_key_public_.size());
        spk->set_signature(signed_pre_key_signature_.data(), signed_pre_key_signature_.size());
        detail::SetTimestamp(spk->mutable_created_at(), signed_pre_key_created_at_);

        for (const auto& opk : one_time_pre_keys_) {
            auto opk_private = ReadHandle(opk.private_key);
            if (opk_private.IsErr()) {
                return Result<pb::IdentityRecord, ProtocolFailure>::Err(std::move(opk_private).UnwrapErr());
            }
            auto* stored = record.add_one_time_pre_keys();
            stored->set_id(opk.id);
            stored->set_private_key(opk_private.Unwrap().Data(), opk_private.Unwrap().Size());
            stored->set_public_key(opk.public_key.data(), opk.public_key.size());
        }
        record.set_registration_id(registration_id_);
        record.set_next_one_time_pre_key_id(next_one_time_pre_key_id_);
        detail::SetTimestamp(record.mutable_created_at(), created_at_);
        return Result<pb::IdentityRecord, ProtocolFailure>::Ok(std::move(record));
    }

    Result<KeyPair, ProtocolFailure> IdentityKeys::ExportIdentityKeyPair() const {
        auto private_key = ReadIdentityPrivate();
        if (private_key.IsErr()) {
            return Result<KeyPair, ProtocolFailure>::Err(std::move(private_key).UnwrapErr());
        }
        return Result<KeyPair, ProtocolFailure>::Ok(KeyPair{
            .private_key = std::move(private_key).Unwrap(),
            .public_key = identity_x25519_public_});
    }

    Result<Unit, ProtocolFailure> IdentityKeys::ReplaceIdentityKeyPair(const KeyPair& identity) {
        if (identity.private_key.Size() != kX25519PrivateKeyBytes) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Identity private key must be 32 bytes"));
        }
        auto derived = SodiumInterop::DeriveX25519PublicKey(identity.private_key.Span());
        if (derived.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(derived).UnwrapErr());
        }
        if (!SodiumInterop::ConstantTimeEquals(derived.Unwrap(), identity.public_key)) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Identity public key does not match its private key"));
        }
        auto handle = ToHandle(identity.private_key.Span());
        if (handle.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(handle).UnwrapErr());
        }
        identity_x25519_secret_key_handle_ = std::move(handle).Unwrap();
        identity_x25519_public_ = identity.public_key;
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    const OneTimePreKey* IdentityKeys::FindOneTimePreKey(const uint32_t one_time_pre_key_id) const {
        const auto it = std::find_if(one_time_pre_keys_.begin(), one_time_pre_keys_.end(),
                                     [one_time_pre_key_id](const OneTimePreKey& key) {
                                         return key.id == one_time_pre_key_id;
                                     });
        return it == one_time_pre_keys_.end() ? nullptr : &*it;
    }

    Result<Unit, ProtocolFailure> IdentityKeys::ConsumeOneTimePreKey(const uint32_t one_time_pre_key_id) {
        const auto it = std::find_if(one_time_pre_keys_.begin(), one_time_pre_keys_.end(),
                                     [one_time_pre_key_id](const OneTimePreKey& key) {
                                         return key.id == one_time_pre_key_id;
                                     });
        if (it == one_time_pre_keys_.end()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::KeyExhausted(
                    fmt::format("One-time pre-key {} is not available", one_time_pre_key_id)));
        }
        one_time_pre_keys_.erase(it);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    bool IdentityKeys::VerifyRemoteSpkSignature(
        std::span<const uint8_t> remote_identity_ed25519,
        std::span<const uint8_t> remote_spk_public,
        std::span<const uint8_t> remote_spk_signature) {
        return SodiumInterop::VerifyDetached(remote_identity_ed25519, remote_spk_public, remote_spk_signature);
    }

    Result<ScopedSecret, ProtocolFailure> IdentityKeys::ReadIdentityPrivate() const {
        return ReadHandle(identity_x25519_secret_key_handle_);
    }

    Result<ScopedSecret, ProtocolFailure> IdentityKeys::ReadSignedPreKeyPrivate() const {
        return ReadHandle(signed_pre_key_secret_key_handle_);
    }

    Result<ScopedSecret, ProtocolFailure> IdentityKeys::DeriveInitiatorSecret(
        std::span<const uint8_t> ephemeral_private,
        std::span<const uint8_t> remote_identity,
        std::span<const uint8_t> remote_signed_pre_key,
        std::optional<std::span<const uint8_t>> remote_one_time_pre_key) const {
        auto identity_private = ReadIdentityPrivate();
        if (identity_private.IsErr()) {
            return identity_private;
        }

        std::vector<ScopedSecret> dh_results;
        dh_results.reserve(4);

        auto dh1 = ComputeDh(identity_private.Unwrap().Span(), remote_signed_pre_key, "DH1");
        if (dh1.IsErr()) {
            return dh1;
        }
        dh_results.push_back(std::move(dh1).Unwrap());

        auto dh2 = ComputeDh(ephemeral_private, remote_identity, "DH2");
        if (dh2.IsErr()) {
            return dh2;
        }
        dh_results.push_back(std::move(dh2).Unwrap());

        auto dh3 = ComputeDh(ephemeral_private, remote_signed_pre_key, "DH3");
        if (dh3.IsErr()) {
            return dh3;
        }
        dh_results.push_back(std::move(dh3).Unwrap());

        if (remote_one_time_pre_key.has_value()) {
            auto dh4 = ComputeDh(ephemeral_private, *remote_one_time_pre_key, "DH4");
            if (dh4.IsErr()) {
                return dh4;
            }
            dh_results.push_back(std::move(dh4).Unwrap());
        }

        DYNASTY_LOG_DEBUG(kTag, "initiator agreement with {} DH outputs, peer identity {}",
                          dh_results.size(), logging::Fingerprint(remote_identity));
        return FinishX3dh(dh_results);
    }

    Result<ScopedSecret, ProtocolFailure> IdentityKeys::DeriveResponderSecret(
        std::span<const uint8_t> remote_identity,
        std::span<const uint8_t> remote_ephemeral,
        std::optional<uint32_t> one_time_pre_key_id) const {
        auto spk_private = ReadSignedPreKeyPrivate();
        if (spk_private.IsErr()) {
            return spk_private;
        }
        auto identity_private = ReadIdentityPrivate();
        if (identity_private.IsErr()) {
            return identity_private;
        }

        std::vector<ScopedSecret> dh_results;
        dh_results.reserve(4);

        auto dh1 = ComputeDh(spk_private.Unwrap().Span(), remote_identity, "DH1");
        if (dh1.IsErr()) {
            return dh1;
        }
        dh_results.push_back(std::move(dh1).Unwrap());

        auto dh2 = ComputeDh(identity_private.Unwrap().Span(), remote_ephemeral, "DH2");
        if (dh2.IsErr()) {
            return dh2;
        }
        dh_results.push_back(std::move(dh2).Unwrap());

        auto dh3 = ComputeDh(spk_private.Unwrap().Span(), remote_ephemeral, "DH3");
        if (dh3.IsErr()) {
            return dh3;
        }
        dh_results.push_back(std::move(dh3).Unwrap());

        if (one_time_pre_key_id.has_value()) {
            const OneTimePreKey* opk = FindOneTimePreKey(*one_time_pre_key_id);
            if (opk == nullptr) {
                DYNASTY_LOG_WARN(kTag, "one-time pre-key {} requested by peer is not available",
                                 *one_time_pre_key_id);
                return Result<ScopedSecret, ProtocolFailure>::Err(
                    ProtocolFailure::KeyExhausted(
                        fmt::format("One-time pre-key {} is not available", *one_time_pre_key_id)));
            }
            auto opk_private = ReadHandle(opk->private_key);
            if (opk_private.IsErr()) {
                return opk_private;
            }
            auto dh4 = ComputeDh(opk_private.Unwrap().Span(), remote_ephemeral, "DH4");
            if (dh4.IsErr()) {
                return dh4;
            }
            dh_results.push_back(std::move(dh4).Unwrap());
        }

        DYNASTY_LOG_DEBUG(kTag, "responder agreement with {} DH outputs, peer identity {}",
                          dh_results.size(), logging::Fingerprint(remote_identity));
        return FinishX3dh(dh_results);
    }

    Result<ScopedSecret, ProtocolFailure> IdentityKeys::FinishX3dh(
        std::span<const ScopedSecret> dh_results) {
        ScopedSecret ikm(kX25519SharedSecretBytes * (dh_results.size() + 1));
        auto out = ikm.MutableSpan();
        std::fill_n(out.begin(), kX25519SharedSecretBytes, kX3dhPrefixByte);
        size_t offset = kX25519SharedSecretBytes;
        for (const auto& dh : dh_results) {
            std::copy(dh.Span().begin(), dh.Span().end(), out.begin() + static_cast<std::ptrdiff_t>(offset));
            offset += dh.Size();
        }

        const std::array<uint8_t, kRootKeyBytes> salt{};
        auto shared = Hkdf::DeriveKeyBytes(ikm.Span(), kRootKeyBytes, salt, kX3dhInfo);
        if (shared.IsErr()) {
            return Result<ScopedSecret, ProtocolFailure>::Err(std::move(shared).UnwrapErr());
        }
        return Result<ScopedSecret, ProtocolFailure>::Ok(ScopedSecret(std::move(shared).Unwrap()));
    }
}
