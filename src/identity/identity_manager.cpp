#include "dynasty/identity/identity_manager.hpp"
#include "dynasty/core/constants.hpp"
#include "dynasty/core/logging.hpp"
#include "dynasty/crypto/sealed_box.hpp"
#include "dynasty/protocol/constants.hpp"
#include "dynasty/security/dh_validator.hpp"
#include "core/proto_helpers.hpp"

#include <algorithm>

namespace dynasty::e2ee::identity {
    namespace pb = dynasty::proto::e2ee;
    using crypto::KeyPair;
    using crypto::ScopedSecret;
    using interfaces::AuditEventType;

    namespace {
        constexpr std::string_view kTag = "identity";

        ProtocolFailure NoIdentity() {
            return ProtocolFailure::InvalidState(std::string(ErrorMessages::NO_IDENTITY));
        }
    }

    IdentityManager::IdentityManager(
        KeyMaterialStore& store,
        security::AuditLogger& audit,
        configuration::IdentitySettings settings,
        ClockFn clock)
        : store_(store)
        , audit_(audit)
        , settings_(settings)
        , clock_(std::move(clock)) {}

    Result<bool, ProtocolFailure> IdentityManager::Load() {
        std::unique_lock lock(lock_);
        load_attempted_ = false;
        keys_.reset();
        if (auto loaded = EnsureLoadedLocked(); loaded.IsErr()) {
            return Result<bool, ProtocolFailure>::Err(std::move(loaded).UnwrapErr());
        }
        return Result<bool, ProtocolFailure>::Ok(keys_.has_value());
    }

    Result<Unit, ProtocolFailure> IdentityManager::EnsureLoadedLocked() {
        if (load_attempted_) {
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }
        auto stored = store_.LoadIdentity();
        if (stored.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(stored).UnwrapErr());
        }
        auto record = std::move(stored).Unwrap();
        if (record.has_value()) {
            auto keys = IdentityKeys::FromRecord(*record);
            if (keys.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(std::move(keys).UnwrapErr());
            }
            keys_.emplace(std::move(keys).Unwrap());
            DYNASTY_LOG_INFO(kTag, "loaded identity {}", logging::Fingerprint(keys_->IdentityPublic()));
        }
        load_attempted_ = true;
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> IdentityManager::PersistLocked(const IdentityKeys& keys) {
        auto record = keys.ToRecord();
        if (record.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(record).UnwrapErr());
        }
        auto saved = store_.SaveIdentity(record.Unwrap());
        auto& stored = record.Unwrap();
        detail::WipeString(*stored.mutable_identity_private_key());
        detail::WipeString(*stored.mutable_signing_private_key());
        detail::WipeString(*stored.mutable_signed_pre_key()->mutable_private_key());
        for (auto& opk : *stored.mutable_one_time_pre_keys()) {
            detail::WipeString(*opk.mutable_private_key());
        }
        return saved;
    }

    Result<KeyPair, ProtocolFailure> IdentityManager::GenerateIdentity() {
        bool replaced = false;
        KeyPair exported;
        {
            std::unique_lock lock(lock_);
            if (auto loaded = EnsureLoadedLocked(); loaded.IsErr()) {
                return Result<KeyPair, ProtocolFailure>::Err(std::move(loaded).UnwrapErr());
            }
            auto created = IdentityKeys::Create(settings_.one_time_pre_key_count, clock_());
            if (created.IsErr()) {
                const auto& failure = created.UnwrapErr();
                return Result<KeyPair, ProtocolFailure>::Err(
                    ProtocolFailure::KeyGeneration(fmt::format("Identity generation failed: {}", failure.message)));
            }
            auto keys = std::move(created).Unwrap();
            if (auto persisted = PersistLocked(keys); persisted.IsErr()) {
                return Result<KeyPair, ProtocolFailure>::Err(std::move(persisted).UnwrapErr());
            }
            auto pair = keys.ExportIdentityKeyPair();
            if (pair.IsErr()) {
                return pair;
            }
            exported = std::move(pair).Unwrap();
            replaced = keys_.has_value();
            keys_.emplace(std::move(keys));
            DYNASTY_LOG_INFO(kTag, "generated identity {}", logging::Fingerprint(exported.public_key));
        }
        if (replaced) {
            NotifyIdentityReplaced();
        }
        return Result<KeyPair, ProtocolFailure>::Ok(std::move(exported));
    }

    Result<std::optional<KeyPair>, ProtocolFailure> IdentityManager::GetIdentity() {
        std::unique_lock lock(lock_);
        if (auto loaded = EnsureLoadedLocked(); loaded.IsErr()) {
            return Result<std::optional<KeyPair>, ProtocolFailure>::Err(std::move(loaded).UnwrapErr());
        }
        if (!keys_) {
            return Result<std::optional<KeyPair>, ProtocolFailure>::Ok(std::nullopt);
        }
        auto pair = keys_->ExportIdentityKeyPair();
        if (pair.IsErr()) {
            return Result<std::optional<KeyPair>, ProtocolFailure>::Err(std::move(pair).UnwrapErr());
        }
        return Result<std::optional<KeyPair>, ProtocolFailure>::Ok(std::move(pair).Unwrap());
    }

    Result<Unit, ProtocolFailure> IdentityManager::RestoreIdentity(const KeyPair& pair) {
        if (auto valid = security::DhValidator::ValidateX25519PublicKey(pair.public_key); valid.IsErr()) {
            return valid;
        }
        {
            std::unique_lock lock(lock_);
            if (auto loaded = EnsureLoadedLocked(); loaded.IsErr()) {
                return loaded;
            }
            if (keys_) {
                auto previous = keys_->ExportIdentityKeyPair();
                if (previous.IsErr()) {
                    return Result<Unit, ProtocolFailure>::Err(std::move(previous).UnwrapErr());
                }
                if (auto replaced = keys_->ReplaceIdentityKeyPair(pair); replaced.IsErr()) {
                    return replaced;
                }
                if (auto persisted = PersistLocked(*keys_); persisted.IsErr()) {
                    if (auto rollback = keys_->ReplaceIdentityKeyPair(previous.Unwrap()); rollback.IsErr()) {
                        DYNASTY_LOG_ERROR(kTag, "rollback after failed restore failed: {}",
                                          rollback.UnwrapErr().Describe());
                    }
                    return persisted;
                }
            } else {
                auto created = IdentityKeys::CreateWithIdentity(
                    pair, settings_.one_time_pre_key_count, clock_());
                if (created.IsErr()) {
                    return Result<Unit, ProtocolFailure>::Err(std::move(created).UnwrapErr());
                }
                auto keys = std::move(created).Unwrap();
                if (auto persisted = PersistLocked(keys); persisted.IsErr()) {
                    return persisted;
                }
                keys_.emplace(std::move(keys));
            }
        }

        DYNASTY_LOG_INFO(kTag, "restored identity {}", logging::Fingerprint(pair.public_key));
        audit_.Record(AuditEventType::IdentityRestored, "Identity key restored from backup",
                      {{"identity", logging::Fingerprint(pair.public_key)}});
        NotifyIdentityReplaced();
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<KeyPair, ProtocolFailure> IdentityManager::ExportIdentity() {
        auto identity = GetIdentity();
        if (identity.IsErr()) {
            return Result<KeyPair, ProtocolFailure>::Err(std::move(identity).UnwrapErr());
        }
        auto pair = std::move(identity).Unwrap();
        if (!pair.has_value()) {
            return Result<KeyPair, ProtocolFailure>::Err(NoIdentity());
        }
        return Result<KeyPair, ProtocolFailure>::Ok(std::move(*pair));
    }

    Result<uint32_t, ProtocolFailure> IdentityManager::GetRegistrationId() {
        std::unique_lock lock(lock_);
        if (auto loaded = EnsureLoadedLocked(); loaded.IsErr()) {
            return Result<uint32_t, ProtocolFailure>::Err(std::move(loaded).UnwrapErr());
        }
        if (!keys_) {
            return Result<uint32_t, ProtocolFailure>::Err(NoIdentity());
        }
        return Result<uint32_t, ProtocolFailure>::Ok(keys_->RegistrationId());
    }

    Result<LocalPublicKeys, ProtocolFailure> IdentityManager::GetPublicKeys() {
        std::unique_lock lock(lock_);
        if (auto loaded = EnsureLoadedLocked(); loaded.IsErr()) {
            return Result<LocalPublicKeys, ProtocolFailure>::Err(std::move(loaded).UnwrapErr());
        }
        if (!keys_) {
            return Result<LocalPublicKeys, ProtocolFailure>::Err(NoIdentity());
        }
        return Result<LocalPublicKeys, ProtocolFailure>::Ok(LocalPublicKeys{
            .identity_key = keys_->IdentityPublic(),
            .signing_key = keys_->SigningPublic(),
            .signed_pre_key_id = keys_->SignedPreKeyId()});
    }

    Result<pb::DeviceRecord, ProtocolFailure> IdentityManager::CreateDeviceRecord(
        const models::LocalDevice& device,
        std::optional<std::span<const uint8_t>> identity_override) {
        std::unique_lock lock(lock_);
        if (auto loaded = EnsureLoadedLocked(); loaded.IsErr()) {
            return Result<pb::DeviceRecord, ProtocolFailure>::Err(std::move(loaded).UnwrapErr());
        }
        if (!keys_) {
            return Result<pb::DeviceRecord, ProtocolFailure>::Err(NoIdentity());
        }

        const TimePoint now = clock_();
        pb::DeviceRecord record;
        record.set_user_id(device.user_id);
        record.set_device_id(device.device_id);
        record.set_device_name(device.device_name);
        if (identity_override.has_value()) {
            record.set_identity_key(identity_override->data(), identity_override->size());
        } else {
            const auto& identity = keys_->IdentityPublic();
            record.set_identity_key(identity.data(), identity.size());
        }
        const auto& signing = keys_->SigningPublic();
        record.set_identity_signing_key(signing.data(), signing.size());

        auto* spk = record.mutable_signed_pre_key();
        spk->set_id(keys_->SignedPreKeyId());
        spk->set_public_key(keys_->SignedPreKeyPublic().data(), keys_->SignedPreKeyPublic().size());
        spk->set_signature(keys_->SignedPreKeySignature().data(), keys_->SignedPreKeySignature().size());
        detail::SetTimestamp(spk->mutable_timestamp(), keys_->SignedPreKeyCreatedAt());

        for (const auto& opk : keys_->OneTimePreKeys()) {
            auto* published = record.add_one_time_pre_keys();
            published->set_id(opk.id);
            published->set_public_key(opk.public_key.data(), opk.public_key.size());
        }
        record.set_registration_id(keys_->RegistrationId());
        detail::SetTimestamp(record.mutable_registered_at(), now);
        detail::SetTimestamp(record.mutable_last_seen_at(), now);
        return Result<pb::DeviceRecord, ProtocolFailure>::Ok(std::move(record));
    }

    Result<Unit, ProtocolFailure> IdentityManager::ReplenishOneTimePreKeys(const uint32_t count) {
        std::unique_lock lock(lock_);
        if (auto loaded = EnsureLoadedLocked(); loaded.IsErr()) {
            return loaded;
        }
        if (!keys_) {
            return Result<Unit, ProtocolFailure>::Err(NoIdentity());
        }
        auto record = keys_->ToRecord();
        if (record.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(record).UnwrapErr());
        }
        auto restored = IdentityKeys::FromRecord(record.Unwrap());
        if (restored.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(restored).UnwrapErr());
        }
        auto candidate = std::move(restored).Unwrap();
        if (auto appended = candidate.AppendOneTimePreKeys(count); appended.IsErr()) {
            return appended;
        }
        if (auto persisted = PersistLocked(candidate); persisted.IsErr()) {
            return persisted;
        }
        keys_.emplace(std::move(candidate));
        DYNASTY_LOG_DEBUG(kTag, "added {} one-time pre-keys, {} available",
                          count, keys_->OneTimePreKeys().size());
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<size_t, ProtocolFailure> IdentityManager::AvailableOneTimePreKeys() {
        std::unique_lock lock(lock_);
        if (auto loaded = EnsureLoadedLocked(); loaded.IsErr()) {
            return Result<size_t, ProtocolFailure>::Err(std::move(loaded).UnwrapErr());
        }
        if (!keys_) {
            return Result<size_t, ProtocolFailure>::Err(NoIdentity());
        }
        return Result<size_t, ProtocolFailure>::Ok(keys_->OneTimePreKeys().size());
    }

    Result<pb::SealedMessage, ProtocolFailure> IdentityManager::Seal(
        std::span<const uint8_t> recipient_identity_key,
        std::span<const uint8_t> plaintext) {
        auto sealed = crypto::SealedBox::Seal(recipient_identity_key, plaintext);
        if (sealed.IsErr()) {
            return Result<pb::SealedMessage, ProtocolFailure>::Err(std::move(sealed).UnwrapErr());
        }
        const auto& payload = sealed.Unwrap();
        pb::SealedMessage message;
        message.set_ephemeral_key(payload.ephemeral_key.data(), payload.ephemeral_key.size());
        message.set_ciphertext(payload.ciphertext.data(), payload.ciphertext.size());
        return Result<pb::SealedMessage, ProtocolFailure>::Ok(std::move(message));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> IdentityManager::OpenSealed(
        const pb::SealedMessage& message) {
        std::unique_lock lock(lock_);
        if (auto loaded = EnsureLoadedLocked(); loaded.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(loaded).UnwrapErr());
        }
        if (!keys_) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(NoIdentity());
        }
        auto private_key = keys_->ReadIdentityPrivate();
        if (private_key.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(private_key).UnwrapErr());
        }
        const crypto::SealedPayload payload{
            .ephemeral_key = detail::ToBytes(message.ephemeral_key()),
            .ciphertext = detail::ToBytes(message.ciphertext())};
        return crypto::SealedBox::Open(private_key.Unwrap().Span(), keys_->IdentityPublic(), payload);
    }

    Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> IdentityManager::OpenSealedWithKey(
        const KeyPair& candidate,
        const pb::SealedMessage& message) {
        using OptionalResult = Result<std::optional<std::vector<uint8_t>>, ProtocolFailure>;

        std::unique_lock lock(lock_);
        if (auto loaded = EnsureLoadedLocked(); loaded.IsErr()) {
            return OptionalResult::Err(std::move(loaded).UnwrapErr());
        }
        if (!keys_) {
            return OptionalResult::Err(NoIdentity());
        }
        auto original = keys_->ExportIdentityKeyPair();
        if (original.IsErr()) {
            return OptionalResult::Err(std::move(original).UnwrapErr());
        }
        if (auto swapped = keys_->ReplaceIdentityKeyPair(candidate); swapped.IsErr()) {
            return OptionalResult::Err(std::move(swapped).UnwrapErr());
        }

        auto private_key = keys_->ReadIdentityPrivate();
        std::optional<Result<std::vector<uint8_t>, ProtocolFailure>> opened;
        if (private_key.IsOk()) {
            const crypto::SealedPayload payload{
                .ephemeral_key = detail::ToBytes(message.ephemeral_key()),
                .ciphertext = detail::ToBytes(message.ciphertext())};
            opened.emplace(crypto::SealedBox::Open(private_key.Unwrap().Span(), keys_->IdentityPublic(), payload));
        }

        if (auto restored = keys_->ReplaceIdentityKeyPair(original.Unwrap()); restored.IsErr()) {
            DYNASTY_LOG_ERROR(kTag, "failed to restore identity after trial decryption: {}",
                              restored.UnwrapErr().Describe());
            return OptionalResult::Err(std::move(restored).UnwrapErr());
        }

        if (private_key.IsErr()) {
            return OptionalResult::Err(std::move(private_key).UnwrapErr());
        }
        if (opened->IsErr()) {
            if (opened->UnwrapErr().type == ProtocolFailureType::AuthenticationFailed) {
                return OptionalResult::Ok(std::nullopt);
            }
            return OptionalResult::Err(std::move(*opened).UnwrapErr());
        }
        return OptionalResult::Ok(std::move(*opened).Unwrap());
    }

    Result<Unit, ProtocolFailure> IdentityManager::AdoptRotatedKey(const KeyPair& pair) {
        std::unique_lock lock(lock_);
        if (auto loaded = EnsureLoadedLocked(); loaded.IsErr()) {
            return loaded;
        }
        if (!keys_) {
            return Result<Unit, ProtocolFailure>::Err(NoIdentity());
        }
        auto previous = keys_->ExportIdentityKeyPair();
        if (previous.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(previous).UnwrapErr());
        }
        if (auto replaced = keys_->ReplaceIdentityKeyPair(pair); replaced.IsErr()) {
            return replaced;
        }
        if (auto persisted = PersistLocked(*keys_); persisted.IsErr()) {
            if (auto rollback = keys_->ReplaceIdentityKeyPair(previous.Unwrap()); rollback.IsErr()) {
                DYNASTY_LOG_ERROR(kTag, "rollback after failed adoption failed: {}",
                                  rollback.UnwrapErr().Describe());
            }
            return persisted;
        }
        DYNASTY_LOG_INFO(kTag, "adopted rotated identity {}", logging::Fingerprint(pair.public_key));
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<ScopedSecret, ProtocolFailure> IdentityManager::DeriveInitiatorSecret(
        std::span<const uint8_t> ephemeral_private,
        std::span<const uint8_t> remote_identity,
        std::span<const uint8_t> remote_signed_pre_key,
        std::optional<std::span<const uint8_t>> remote_one_time_pre_key) {
        std::unique_lock lock(lock_);
        if (auto loaded = EnsureLoadedLocked(); loaded.IsErr()) {
            return Result<ScopedSecret, ProtocolFailure>::Err(std::move(loaded).UnwrapErr());
        }
        if (!keys_) {
            return Result<ScopedSecret, ProtocolFailure>::Err(NoIdentity());
        }
        return keys_->DeriveInitiatorSecret(
            ephemeral_private, remote_identity, remote_signed_pre_key, remote_one_time_pre_key);
    }

    Result<ScopedSecret, ProtocolFailure> IdentityManager::DeriveResponderSecret(
        std::span<const uint8_t> remote_identity,
        std::span<const uint8_t> remote_ephemeral,
        const uint32_t signed_pre_key_id,
        std::optional<uint32_t> one_time_pre_key_id,
        const KeyPair* retained_identity) {
        std::unique_lock lock(lock_);
        if (auto loaded = EnsureLoadedLocked(); loaded.IsErr()) {
            return Result<ScopedSecret, ProtocolFailure>::Err(std::move(loaded).UnwrapErr());
        }
        if (!keys_) {
            return Result<ScopedSecret, ProtocolFailure>::Err(NoIdentity());
        }
        if (signed_pre_key_id != keys_->SignedPreKeyId()) {
            return Result<ScopedSecret, ProtocolFailure>::Err(
                ProtocolFailure::KeyExhausted(
                    fmt::format("Signed pre-key {} is not the current signed pre-key", signed_pre_key_id)));
        }
        if (retained_identity == nullptr) {
            return keys_->DeriveResponderSecret(remote_identity, remote_ephemeral, one_time_pre_key_id);
        }

        auto original = keys_->ExportIdentityKeyPair();
        if (original.IsErr()) {
            return Result<ScopedSecret, ProtocolFailure>::Err(std::move(original).UnwrapErr());
        }
        if (auto swapped = keys_->ReplaceIdentityKeyPair(*retained_identity); swapped.IsErr()) {
            return Result<ScopedSecret, ProtocolFailure>::Err(std::move(swapped).UnwrapErr());
        }
        auto secret = keys_->DeriveResponderSecret(remote_identity, remote_ephemeral, one_time_pre_key_id);
        if (auto restored = keys_->ReplaceIdentityKeyPair(original.Unwrap()); restored.IsErr()) {
            DYNASTY_LOG_ERROR(kTag, "failed to restore identity after deriving with a retained key: {}",
                              restored.UnwrapErr().Describe());
            return Result<ScopedSecret, ProtocolFailure>::Err(std::move(restored).UnwrapErr());
        }
        return secret;
    }

    Result<Unit, ProtocolFailure> IdentityManager::ConsumeOneTimePreKey(const uint32_t one_time_pre_key_id) {
        std::unique_lock lock(lock_);
        if (auto loaded = EnsureLoadedLocked(); loaded.IsErr()) {
            return loaded;
        }
        if (!keys_) {
            return Result<Unit, ProtocolFailure>::Err(NoIdentity());
        }
        auto record = keys_->ToRecord();
        if (record.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(record).UnwrapErr());
        }
        auto restored = IdentityKeys::FromRecord(record.Unwrap());
        if (restored.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(restored).UnwrapErr());
        }
        auto candidate = std::move(restored).Unwrap();
        if (auto consumed = candidate.ConsumeOneTimePreKey(one_time_pre_key_id); consumed.IsErr()) {
            return consumed;
        }
        if (auto persisted = PersistLocked(candidate); persisted.IsErr()) {
            return persisted;
        }
        keys_.emplace(std::move(candidate));
        DYNASTY_LOG_DEBUG(kTag, "consumed one-time pre-key {}", one_time_pre_key_id);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<ScopedSecret, ProtocolFailure> IdentityManager::ReadSignedPreKeyPrivate() {
        std::unique_lock lock(lock_);
        if (auto loaded = EnsureLoadedLocked(); loaded.IsErr()) {
            return Result<ScopedSecret, ProtocolFailure>::Err(std::move(loaded).UnwrapErr());
        }
        if (!keys_) {
            return Result<ScopedSecret, ProtocolFailure>::Err(NoIdentity());
        }
        return keys_->ReadSignedPreKeyPrivate();
    }

    void IdentityManager::AddObserver(interfaces::IIdentityObserver* observer) {
        if (observer == nullptr) {
            return;
        }
        std::lock_guard guard(observers_lock_);
        if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end()) {
            observers_.push_back(observer);
        }
    }

    void IdentityManager::RemoveObserver(interfaces::IIdentityObserver* observer) {
        std::lock_guard guard(observers_lock_);
        observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
    }

    void IdentityManager::NotifyIdentityReplaced() {
        std::vector<interfaces::IIdentityObserver*> snapshot;
        {
            std::lock_guard guard(observers_lock_);
            snapshot = observers_;
        }
        for (auto* observer : snapshot) {
            observer->OnIdentityReplaced();
        }
    }
}
