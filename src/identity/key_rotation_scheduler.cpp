#include "dynasty/identity/key_rotation_scheduler.hpp"
#include "dynasty/core/logging.hpp"
#include "dynasty/crypto/sodium_interop.hpp"
#include "dynasty/protocol/constants.hpp"
#include "core/proto_helpers.hpp"

#include <algorithm>
#include <exception>

namespace dynasty::e2ee::identity {
    namespace pb = dynasty::proto::e2ee;
    using crypto::KeyPair;
    using crypto::SodiumInterop;
    using interfaces::AuditEventType;

    namespace {
        constexpr std::string_view kTag = "rotation";
        constexpr size_t kKeyIdRandomBytes = 4;

        RotatingKey FromRecord(const pb::RotatingKeyRecord& record) {
            return RotatingKey{
                .id = record.id(),
                .public_key = detail::ToBytes(record.public_key()),
                .created_at = detail::FromTimestamp(record.created_at()),
                .expires_at = detail::FromTimestamp(record.expires_at()),
                .version = record.version(),
                .is_active = record.is_active()};
        }

        pb::RotatingKeyRecord ToRecord(const RotatingKey& key, std::span<const uint8_t> private_key) {
            pb::RotatingKeyRecord record;
            record.set_id(key.id);
            record.set_private_key(private_key.data(), private_key.size());
            record.set_public_key(key.public_key.data(), key.public_key.size());
            detail::SetTimestamp(record.mutable_created_at(), key.created_at);
            detail::SetTimestamp(record.mutable_expires_at(), key.expires_at);
            record.set_version(key.version);
            record.set_is_active(key.is_active);
            return record;
        }

        Result<Unit, ProtocolFailure> SaveKey(
            KeyMaterialStore& store,
            const RotatingKey& key,
            std::span<const uint8_t> private_key) {
            auto record = ToRecord(key, private_key);
            auto saved = store.SaveRotatingKey(record);
            detail::WipeString(*record.mutable_private_key());
            return saved;
        }

        interfaces::AuditMetadata KeyMetadata(const RotatingKey& key) {
            return {{"key_id", key.id},
                    {"version", std::to_string(key.version)},
                    {"fingerprint", logging::Fingerprint(key.public_key)}};
        }
    }

    KeyRotationScheduler::KeyRotationScheduler(
        IdentityManager& identity,
        KeyMaterialStore& store,
        std::shared_ptr<interfaces::IDirectoryService> directory,
        security::AuditLogger& audit,
        configuration::RotationSettings settings,
        models::LocalDevice local_device,
        ClockFn clock)
        : identity_(identity)
        , store_(store)
        , directory_(std::move(directory))
        , audit_(audit)
        , settings_(settings)
        , local_device_(std::move(local_device))
        , clock_(std::move(clock)) {}

    std::string KeyRotationScheduler::NewKeyId(const TimePoint now) {
        return fmt::format("key_{}_{}", ToUnixMillis(now),
                           logging::ToHex(SodiumInterop::GetRandomBytes(kKeyIdRandomBytes)));
    }

    Result<RotationStatus, ProtocolFailure> KeyRotationScheduler::Initialize() {
        std::lock_guard rotation_guard(rotation_lock_);

        auto index = store_.LoadRotatingKeyIndex();
        if (index.IsErr()) {
            return Result<RotationStatus, ProtocolFailure>::Err(std::move(index).UnwrapErr());
        }

        std::vector<RotatingKey> loaded;
        std::optional<TimePoint> last_rotated_at;
        if (index.Unwrap().has_value()) {
            const auto& stored_index = *index.Unwrap();
            if (stored_index.has_last_rotated_at()) {
                last_rotated_at = detail::FromTimestamp(stored_index.last_rotated_at());
            }
            for (const auto& key_id : stored_index.key_ids()) {
                auto record = store_.LoadRotatingKey(key_id);
                if (record.IsErr()) {
                    return Result<RotationStatus, ProtocolFailure>::Err(std::move(record).UnwrapErr());
                }
                auto& stored = record.Unwrap();
                if (!stored.has_value()) {
                    DYNASTY_LOG_WARN(kTag, "index names missing key '{}'", key_id);
                    continue;
                }
                detail::WipeString(*stored->mutable_private_key());
                loaded.push_back(FromRecord(*stored));
            }
        }

        if (loaded.empty()) {
            auto identity = identity_.GetIdentity();
            if (identity.IsErr()) {
                return Result<RotationStatus, ProtocolFailure>::Err(std::move(identity).UnwrapErr());
            }
            const auto& pair = identity.Unwrap();
            if (pair.has_value()) {
                const TimePoint now = clock_();
                RotatingKey first{
                    .id = NewKeyId(now),
                    .public_key = pair->public_key,
                    .created_at = now,
                    .expires_at = now + settings_.rotation_interval,
                    .version = 1,
                    .is_active = true};
                DYNASTY_TRY(SaveKey(store_, first, pair->private_key.Span()));
                loaded.push_back(std::move(first));
                last_rotated_at = now;
                DYNASTY_LOG_INFO(kTag, "recorded current identity as rotating key version 1");
            }
        }

        {
            std::lock_guard state_guard(state_lock_);
            keys_ = std::move(loaded);
            last_rotated_at_ = last_rotated_at;
            if (!keys_.empty()) {
                DYNASTY_TRY(SaveIndexLocked());
            }
        }
        return Result<RotationStatus, ProtocolFailure>::Ok(GetStatus());
    }

    Result<RotatingKey, ProtocolFailure> KeyRotationScheduler::Rotate(std::stop_token stop) {
        std::lock_guard rotation_guard(rotation_lock_);
        {
            std::lock_guard state_guard(state_lock_);
            rotating_ = true;
        }
        auto rotated = RotateLocked(stop);
        {
            std::lock_guard state_guard(state_lock_);
            rotating_ = false;
        }
        return rotated;
    }

    Result<RotatingKey, ProtocolFailure> KeyRotationScheduler::RotateLocked(const std::stop_token& stop) {
        using RotateResult = Result<RotatingKey, ProtocolFailure>;

        const TimePoint now = clock_();
        if (stop.stop_requested()) {
            return RotateResult::Err(ProtocolFailure::Cancelled("Rotation cancelled before start"));
        }

        std::optional<RotatingKey> previous;
        {
            std::lock_guard state_guard(state_lock_);
            const auto active = std::find_if(keys_.begin(), keys_.end(),
                                             [](const RotatingKey& key) { return key.is_active; });
            if (active != keys_.end()) {
                previous = *active;
            }
        }
        const uint32_t version = previous.has_value() ? previous->version + 1 : 1;
        audit_.Record(AuditEventType::KeyRotationStarted, "Identity key rotation started",
                      {{"version", std::to_string(version)}});

        auto current = identity_.ExportIdentity();
        if (current.IsErr()) {
            return RotateResult::Err(RecordFailure(current.UnwrapErr().message, now));
        }
        const KeyPair previous_pair = std::move(current).Unwrap();

        auto generated = SodiumInterop::GenerateX25519KeyPair(kPurposeRotatingX25519);
        if (generated.IsErr()) {
            return RotateResult::Err(RecordFailure(generated.UnwrapErr().message, now));
        }
        const KeyPair candidate = std::move(generated).Unwrap();
        RotatingKey next{
            .id = NewKeyId(now),
            .public_key = candidate.public_key,
            .created_at = now,
            .expires_at = now + settings_.rotation_interval,
            .version = version,
            .is_active = false};

        auto bundle = identity_.CreateDeviceRecord(local_device_, std::span<const uint8_t>(candidate.public_key));
        if (bundle.IsErr()) {
            return RotateResult::Err(RecordFailure(bundle.UnwrapErr().message, now));
        }
        if (stop.stop_requested()) {
            DYNASTY_LOG_INFO(kTag, "rotation to version {} cancelled before publishing", version);
            audit_.Record(AuditEventType::KeyRotationFailed, "Identity key rotation cancelled",
                          {{"reason", "cancelled"}, {"version", std::to_string(version)}});
            return RotateResult::Err(ProtocolFailure::Cancelled("Rotation cancelled before publishing"));
        }
        if (auto saved = SaveKey(store_, next, candidate.private_key.Span()); saved.IsErr()) {
            return RotateResult::Err(RecordFailure(saved.UnwrapErr().message, now));
        }

        std::optional<ProtocolFailure> publish_failure;
        try {
            auto published = directory_->PublishDeviceBundle(bundle.Unwrap());
            if (published.IsErr()) {
                publish_failure = std::move(published).UnwrapErr();
            }
        } catch (const std::exception& ex) {
            publish_failure = ProtocolFailure::DirectoryUnavailable(ex.what());
        }
        if (publish_failure.has_value()) {
            if (auto removed = store_.DeleteRotatingKey(next.id); removed.IsErr()) {
                DYNASTY_LOG_WARN(kTag, "could not remove unpublished key '{}': {}",
                                 next.id, removed.UnwrapErr().message);
            }
            return RotateResult::Err(RecordFailure(
                fmt::format("Publishing the rotated key failed: {}", publish_failure->message), now));
        }

        next.is_active = true;
        if (auto committed = CommitRotation(previous, next, candidate, now); committed.IsErr()) {
            DYNASTY_LOG_ERROR(kTag, "published key version {} but could not commit it: {}",
                              version, committed.UnwrapErr().Describe());
            RevertRotation(previous, previous_pair, next.id);
            return RotateResult::Err(RecordFailure(
                fmt::format("Committing the rotated key failed: {}", committed.UnwrapErr().message), now));
        }

        {
            std::lock_guard state_guard(state_lock_);
            if (auto pruned = PruneLocked(now); pruned.IsErr()) {
                DYNASTY_LOG_WARN(kTag, "pruning after rotation failed: {}", pruned.UnwrapErr().Describe());
            }
        }

        DYNASTY_LOG_INFO(kTag, "rotated identity key to version {} ({})",
                         version, logging::Fingerprint(next.public_key));
        audit_.Record(AuditEventType::KeyRotationCompleted, "Identity key rotation completed", KeyMetadata(next));
        return RotateResult::Ok(std::move(next));
    }

    Result<Unit, ProtocolFailure> KeyRotationScheduler::CommitRotation(
        const std::optional<RotatingKey>& previous,
        const RotatingKey& next,
        const KeyPair& candidate,
        const TimePoint now) {
        DYNASTY_TRY(identity_.AdoptRotatedKey(candidate));
        DYNASTY_TRY(SaveKey(store_, next, candidate.private_key.Span()));
        if (previous.has_value()) {
            DYNASTY_TRY(SetStoredActive(previous->id, false));
        }

        std::vector<RotatingKey> updated;
        {
            std::lock_guard state_guard(state_lock_);
            updated = keys_;
        }
        for (auto& key : updated) {
            key.is_active = false;
        }
        updated.push_back(next);
        DYNASTY_TRY(SaveIndex(updated, now));

        std::lock_guard state_guard(state_lock_);
        keys_ = std::move(updated);
        last_rotated_at_ = now;
        next_retry_at_.reset();
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    void KeyRotationScheduler::RevertRotation(
        const std::optional<RotatingKey>& previous,
        const KeyPair& previous_pair,
        const std::string& candidate_id) {
        auto identity = identity_.ExportIdentity();
        if (identity.IsErr() ||
            !SodiumInterop::ConstantTimeEquals(identity.Unwrap().public_key, previous_pair.public_key)) {
            if (auto restored = identity_.AdoptRotatedKey(previous_pair); restored.IsErr()) {
                DYNASTY_LOG_ERROR(kTag, "could not restore the previous identity key: {}",
                                  restored.UnwrapErr().Describe());
            }
        }
        if (previous.has_value()) {
            if (auto reactivated = SetStoredActive(previous->id, true); reactivated.IsErr()) {
                DYNASTY_LOG_ERROR(kTag, "could not reactivate key '{}': {}",
                                  previous->id, reactivated.UnwrapErr().Describe());
            }
        }
        {
            std::lock_guard state_guard(state_lock_);
            if (auto indexed = SaveIndexLocked(); indexed.IsErr()) {
                DYNASTY_LOG_ERROR(kTag, "could not restore the key index: {}", indexed.UnwrapErr().Describe());
            }
        }
        if (auto removed = store_.DeleteRotatingKey(candidate_id); removed.IsErr()) {
            DYNASTY_LOG_ERROR(kTag, "could not remove uncommitted key '{}': {}",
                              candidate_id, removed.UnwrapErr().Describe());
        }

        auto bundle = identity_.CreateDeviceRecord(local_device_);
        if (bundle.IsErr()) {
            DYNASTY_LOG_ERROR(kTag, "could not rebuild the previous bundle: {}", bundle.UnwrapErr().Describe());
            return;
        }
        try {
            if (auto published = directory_->PublishDeviceBundle(bundle.Unwrap()); published.IsErr()) {
                DYNASTY_LOG_ERROR(kTag, "could not republish the previous bundle: {}", published.UnwrapErr().message);
            }
        } catch (const std::exception& ex) {
            DYNASTY_LOG_ERROR(kTag, "republishing the previous bundle threw: {}", ex.what());
        }
    }

    Result<Unit, ProtocolFailure> KeyRotationScheduler::SetStoredActive(const std::string& key_id, const bool active) {
        auto stored = store_.LoadRotatingKey(key_id);
        if (stored.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(stored).UnwrapErr());
        }
        auto& record = stored.Unwrap();
        if (!record.has_value()) {
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }
        record->set_is_active(active);
        auto saved = store_.SaveRotatingKey(*record);
        detail::WipeString(*record->mutable_private_key());
        return saved;
    }

    ProtocolFailure KeyRotationScheduler::RecordFailure(std::string reason, const TimePoint now) {
        {
            std::lock_guard state_guard(state_lock_);
            next_retry_at_ = now + settings_.retry_interval;
        }
        DYNASTY_LOG_WARN(kTag, "rotation failed, previous key stays active: {}", reason);
        audit_.Record(AuditEventType::KeyRotationFailed, "Identity key rotation failed",
                      {{"reason", reason}});
        return ProtocolFailure::RotationFailure(std::move(reason));
    }

    Result<Unit, ProtocolFailure> KeyRotationScheduler::PruneLocked(const TimePoint now) {
        const auto max_age = 2 * settings_.rotation_interval;
        std::vector<RotatingKey> kept;
        std::vector<RotatingKey> dropped;
        for (auto it = keys_.rbegin(); it != keys_.rend(); ++it) {
            if (it->is_active || kept.size() < settings_.max_active_keys || now - it->created_at < max_age) {
                kept.push_back(*it);
            } else {
                dropped.push_back(*it);
            }
        }
        if (dropped.empty()) {
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }
        std::reverse(kept.begin(), kept.end());
        keys_ = std::move(kept);
        DYNASTY_TRY(SaveIndexLocked());
        for (const auto& key : dropped) {
            DYNASTY_TRY(store_.DeleteRotatingKey(key.id));
            DYNASTY_LOG_INFO(kTag, "pruned key version {}", key.version);
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> KeyRotationScheduler::SaveIndexLocked() const {
        return SaveIndex(keys_, last_rotated_at_);
    }

    Result<Unit, ProtocolFailure> KeyRotationScheduler::SaveIndex(
        const std::vector<RotatingKey>& keys,
        const std::optional<TimePoint> last_rotated_at) const {
        pb::RotatingKeyIndex index;
        for (const auto& key : keys) {
            index.add_key_ids(key.id);
        }
        if (last_rotated_at.has_value()) {
            detail::SetTimestamp(index.mutable_last_rotated_at(), *last_rotated_at);
        }
        return store_.SaveRotatingKeyIndex(index);
    }

    Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> KeyRotationScheduler::DecryptWithAnyKey(
        const pb::SealedMessage& message) {
        using DecryptResult = Result<std::optional<std::vector<uint8_t>>, ProtocolFailure>;

        std::vector<std::string> key_ids;
        {
            std::lock_guard state_guard(state_lock_);
            for (auto it = keys_.rbegin(); it != keys_.rend(); ++it) {
                key_ids.push_back(it->id);
            }
        }

        for (const auto& key_id : key_ids) {
            auto record = store_.LoadRotatingKey(key_id);
            if (record.IsErr()) {
                return DecryptResult::Err(std::move(record).UnwrapErr());
            }
            auto& stored = record.Unwrap();
            if (!stored.has_value()) {
                continue;
            }
            KeyPair pair{
                .private_key = detail::ToSecret(stored->private_key()),
                .public_key = detail::ToBytes(stored->public_key())};
            detail::WipeString(*stored->mutable_private_key());

            auto opened = identity_.OpenSealedWithKey(pair, message);
            if (opened.IsErr()) {
                return opened;
            }
            if (opened.Unwrap().has_value()) {
                DYNASTY_LOG_DEBUG(kTag, "sealed message opened with key version {}", stored->version());
                return opened;
            }
        }
        DYNASTY_LOG_DEBUG(kTag, "no retained key opens the sealed message");
        return DecryptResult::Ok(std::nullopt);
    }

    Result<std::optional<KeyPair>, ProtocolFailure> KeyRotationScheduler::FindRetainedKey(
        std::span<const uint8_t> public_key) const {
        using FindResult = Result<std::optional<KeyPair>, ProtocolFailure>;

        std::optional<std::string> key_id;
        {
            std::lock_guard state_guard(state_lock_);
            const auto it = std::find_if(keys_.begin(), keys_.end(), [public_key](const RotatingKey& key) {
                return SodiumInterop::ConstantTimeEquals(key.public_key, public_key);
            });
            if (it != keys_.end()) {
                key_id = it->id;
            }
        }
        if (!key_id.has_value()) {
            return FindResult::Ok(std::nullopt);
        }

        auto record = store_.LoadRotatingKey(*key_id);
        if (record.IsErr()) {
            return FindResult::Err(std::move(record).UnwrapErr());
        }
        auto& stored = record.Unwrap();
        if (!stored.has_value()) {
            DYNASTY_LOG_WARN(kTag, "retained key '{}' is missing from storage", *key_id);
            return FindResult::Ok(std::nullopt);
        }
        KeyPair pair{
            .private_key = detail::ToSecret(stored->private_key()),
            .public_key = detail::ToBytes(stored->public_key())};
        detail::WipeString(*stored->mutable_private_key());
        return FindResult::Ok(std::move(pair));
    }

    Result<RotationState, ProtocolFailure> KeyRotationScheduler::Tick(const TimePoint now) {
        RotationState state;
        bool warn = false;
        std::optional<RotatingKey> active;
        {
            std::lock_guard state_guard(state_lock_);
            state = StateAtLocked(now);
            const auto it = std::find_if(keys_.begin(), keys_.end(),
                                         [](const RotatingKey& key) { return key.is_active; });
            if (it != keys_.end()) {
                active = *it;
            }
            if (state == RotationState::Warning && active.has_value() && warned_version_ != active->version) {
                warned_version_ = active->version;
                warn = true;
            }
            if (state == RotationState::Expired && next_retry_at_.has_value() && now < *next_retry_at_) {
                return Result<RotationState, ProtocolFailure>::Ok(state);
            }
        }

        if (warn) {
            DYNASTY_LOG_INFO(kTag, "key version {} expires soon", active->version);
            audit_.Record(AuditEventType::KeyRotationWarning, "Identity key approaching expiry", KeyMetadata(*active));
        }
        if (state == RotationState::Expired) {
            auto rotated = Rotate();
            if (rotated.IsErr() && rotated.UnwrapErr().type != ProtocolFailureType::RotationFailure) {
                return Result<RotationState, ProtocolFailure>::Err(std::move(rotated).UnwrapErr());
            }
        }
        return Result<RotationState, ProtocolFailure>::Ok(CurrentState());
    }

    RotationState KeyRotationScheduler::StateAtLocked(const TimePoint now) const {
        if (rotating_) {
            return RotationState::Rotating;
        }
        const auto active = std::find_if(keys_.begin(), keys_.end(),
                                         [](const RotatingKey& key) { return key.is_active; });
        if (active == keys_.end()) {
            return RotationState::NoKey;
        }
        if (now >= active->expires_at) {
            return RotationState::Expired;
        }
        if (now >= active->expires_at - settings_.warning_window) {
            return RotationState::Warning;
        }
        return RotationState::Active;
    }

    RotationState KeyRotationScheduler::CurrentState() const {
        const TimePoint now = clock_();
        std::lock_guard state_guard(state_lock_);
        return StateAtLocked(now);
    }

    RotationStatus KeyRotationScheduler::GetStatus() const {
        const TimePoint now = clock_();
        std::lock_guard state_guard(state_lock_);
        RotationStatus status;
        status.state = StateAtLocked(now);
        status.total_keys = keys_.size();
        status.last_rotated_at = last_rotated_at_;
        status.next_retry_at = next_retry_at_;
        const auto active = std::find_if(keys_.begin(), keys_.end(),
                                         [](const RotatingKey& key) { return key.is_active; });
        if (active != keys_.end()) {
            status.active_key_id = active->id;
            status.active_version = active->version;
            status.expires_at = active->expires_at;
        }
        return status;
    }

    std::vector<RotatingKey> KeyRotationScheduler::RetainedKeys() const {
        std::lock_guard state_guard(state_lock_);
        return keys_;
    }
}
