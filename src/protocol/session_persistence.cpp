#include "dynasty/protocol/session_persistence.hpp"
#include "dynasty/core/logging.hpp"
#include "dynasty/crypto/hkdf.hpp"
#include "dynasty/crypto/sodium_interop.hpp"
#include "dynasty/protocol/constants.hpp"
#include "core/proto_helpers.hpp"
#include "e2ee/session_state.pb.h"

#include <algorithm>

namespace dynasty::e2ee::protocol {
    namespace pb = dynasty::proto::e2ee;
    using crypto::Hkdf;
    using crypto::ScopedSecret;
    using crypto::SodiumInterop;

    namespace {
        constexpr std::string_view kTag = "session-store";

        std::string SessionKey(const std::string& session_id) {
            return std::string(kSessionKeyPrefix) + session_id;
        }

        void SetBytes(std::string* field, std::span<const uint8_t> bytes) {
            field->assign(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        }

        Result<std::vector<uint8_t>, ProtocolFailure> ComputeStateHmac(
            std::span<const uint8_t> root_key,
            std::span<const uint8_t> state_bytes) {
            auto mac_key = Hkdf::DeriveKeyBytes(root_key, kHmacBytes, {}, kStateHmacInfo);
            if (mac_key.IsErr()) {
                return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(mac_key).UnwrapErr());
            }
            const ScopedSecret key(std::move(mac_key).Unwrap());
            return SodiumInterop::HmacSha256(key.Span(), state_bytes);
        }

        void WipeState(pb::SessionState& state) {
            detail::WipeString(*state.mutable_root_key());
            detail::WipeString(*state.mutable_sending_chain()->mutable_key());
            detail::WipeString(*state.mutable_receiving_chain()->mutable_key());
            detail::WipeString(*state.mutable_sending_ratchet_private());
            for (auto& skipped : *state.mutable_skipped_message_keys()) {
                detail::WipeString(*skipped.mutable_message_key());
            }
        }
    }

    SessionPersistence::SessionPersistence(
        identity::KeyMaterialStore& store,
        security::AuditLogger& audit,
        configuration::RatchetSettings ratchet_settings,
        configuration::SessionSettings session_settings)
        : store_(store)
        , audit_(audit)
        , ratchet_settings_(ratchet_settings)
        , session_settings_(session_settings) {}

    SessionState SessionPersistence::NewState() const {
        return SessionState(ratchet_settings_.max_skipped_keys, ratchet_settings_.skipped_key_lifetime);
    }

    Result<pb::SessionRecord, ProtocolFailure> SessionPersistence::Encode(const SessionState& session) const {
        pb::SessionState state;
        state.set_session_id(session.session_id);
        state.set_peer_user_id(session.peer_user_id);
        state.set_peer_device_id(session.peer_device_id);
        state.set_is_initiator(session.is_initiator);
        SetBytes(state.mutable_root_key(), session.root_key.Span());

        state.mutable_sending_chain()->set_index(session.sending_chain.index);
        SetBytes(state.mutable_sending_chain()->mutable_key(), session.sending_chain.key.Span());
        if (session.receiving_chain.has_value()) {
            state.mutable_receiving_chain()->set_index(session.receiving_chain->index);
            SetBytes(state.mutable_receiving_chain()->mutable_key(), session.receiving_chain->key.Span());
        }
        SetBytes(state.mutable_sending_ratchet_private(), session.sending_ratchet.private_key.Span());
        SetBytes(state.mutable_sending_ratchet_public(), session.sending_ratchet.public_key);
        if (session.receiving_ratchet_key.has_value()) {
            SetBytes(state.mutable_receiving_ratchet_key(), *session.receiving_ratchet_key);
        }
        state.set_previous_counter(session.previous_counter);
        state.set_messages_sent(session.messages_sent);
        state.set_messages_received(session.messages_received);

        session.skipped_message_keys.ForEach(
            [&state](const SkippedKeyId& id, const ScopedSecret& message_key, const TimePoint stored_at) {
                auto* entry = state.add_skipped_message_keys();
                SetBytes(entry->mutable_dh(), id.first);
                entry->set_n(id.second);
                SetBytes(entry->mutable_message_key(), message_key.Span());
                detail::SetTimestamp(entry->mutable_stored_at(), stored_at);
            });

        SetBytes(state.mutable_associated_data(), session.associated_data);
        SetBytes(state.mutable_remote_identity_key(), session.remote_identity_key);
        SetBytes(state.mutable_handshake_ephemeral_key(), session.handshake_ephemeral_key);
        if (session.pending_hello.has_value()) {
            *state.mutable_pending_hello() = *session.pending_hello;
        }
        detail::SetTimestamp(state.mutable_created_at(), session.created_at);
        detail::SetTimestamp(state.mutable_last_activity(), session.last_activity);

        auto state_bytes = detail::SerializeDeterministic(state);
        WipeState(state);
        if (state_bytes.IsErr()) {
            return Result<pb::SessionRecord, ProtocolFailure>::Err(std::move(state_bytes).UnwrapErr());
        }
        const ScopedSecret serialized(std::move(state_bytes).Unwrap());

        auto hmac = ComputeStateHmac(session.root_key.Span(), serialized.Span());
        if (hmac.IsErr()) {
            return Result<pb::SessionRecord, ProtocolFailure>::Err(std::move(hmac).UnwrapErr());
        }

        pb::SessionRecord record;
        record.set_version(kSessionRecordVersion);
        SetBytes(record.mutable_state(), serialized.Span());
        SetBytes(record.mutable_hmac(), hmac.Unwrap());
        return Result<pb::SessionRecord, ProtocolFailure>::Ok(std::move(record));
    }

    Result<SessionState, ProtocolFailure> SessionPersistence::Decode(const pb::SessionRecord& record) const {
        if (record.version() != kSessionRecordVersion) {
            return Result<SessionState, ProtocolFailure>::Err(
                ProtocolFailure::Decode(fmt::format("Unsupported session record version {}", record.version())));
        }
        auto parsed = detail::ParseMessage<pb::SessionState>(detail::AsSpan(record.state()), "session state");
        if (parsed.IsErr()) {
            return Result<SessionState, ProtocolFailure>::Err(std::move(parsed).UnwrapErr());
        }
        auto state = std::move(parsed).Unwrap();

        if (state.root_key().size() != kRootKeyBytes ||
            state.sending_chain().key().size() != kChainKeyBytes ||
            state.sending_ratchet_private().size() != kX25519PrivateKeyBytes ||
            state.sending_ratchet_public().size() != kX25519PublicKeyBytes) {
            WipeState(state);
            return Result<SessionState, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Session state has malformed key fields"));
        }

        auto expected = ComputeStateHmac(detail::AsSpan(state.root_key()), detail::AsSpan(record.state()));
        if (expected.IsErr()) {
            WipeState(state);
            return Result<SessionState, ProtocolFailure>::Err(std::move(expected).UnwrapErr());
        }
        if (!SodiumInterop::ConstantTimeEquals(expected.Unwrap(), detail::AsSpan(record.hmac()))) {
            WipeState(state);
            return Result<SessionState, ProtocolFailure>::Err(
                ProtocolFailure::AuthenticationFailed("Session record integrity check failed"));
        }

        SessionState session = NewState();
        session.session_id = state.session_id();
        session.peer_user_id = state.peer_user_id();
        session.peer_device_id = state.peer_device_id();
        session.is_initiator = state.is_initiator();
        session.root_key = detail::ToSecret(state.root_key());
        session.sending_chain = ChainKey{
            .key = detail::ToSecret(state.sending_chain().key()),
            .index = state.sending_chain().index()};
        if (state.has_receiving_chain() && !state.receiving_chain().key().empty()) {
            session.receiving_chain = ChainKey{
                .key = detail::ToSecret(state.receiving_chain().key()),
                .index = state.receiving_chain().index()};
        }
        session.sending_ratchet.private_key = detail::ToSecret(state.sending_ratchet_private());
        session.sending_ratchet.public_key = detail::ToBytes(state.sending_ratchet_public());
        if (!state.receiving_ratchet_key().empty()) {
            session.receiving_ratchet_key = detail::ToBytes(state.receiving_ratchet_key());
        }
        session.previous_counter = state.previous_counter();
        session.messages_sent = state.messages_sent();
        session.messages_received = state.messages_received();

        // Stored oldest first, so re-inserting keeps the eviction order.
        for (const auto& skipped : state.skipped_message_keys()) {
            session.skipped_message_keys.Put(
                SkippedKeyId{detail::ToBytes(skipped.dh()), skipped.n()},
                detail::ToSecret(skipped.message_key()),
                detail::FromTimestamp(skipped.stored_at()));
        }

        session.associated_data = detail::ToBytes(state.associated_data());
        session.remote_identity_key = detail::ToBytes(state.remote_identity_key());
        session.handshake_ephemeral_key = detail::ToBytes(state.handshake_ephemeral_key());
        if (state.has_pending_hello()) {
            session.pending_hello = state.pending_hello();
        }
        session.created_at = detail::FromTimestamp(state.created_at());
        session.last_activity = detail::FromTimestamp(state.last_activity());
        WipeState(state);
        return Result<SessionState, ProtocolFailure>::Ok(std::move(session));
    }

    Result<Unit, ProtocolFailure> SessionPersistence::Save(const SessionState& session) {
        if (session.session_id.empty()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Session id must not be empty"));
        }
        auto record = Encode(session);
        if (record.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(record).UnwrapErr());
        }
        auto bytes = detail::SerializeDeterministic(record.Unwrap());
        detail::WipeString(*record.Unwrap().mutable_state());
        if (bytes.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(bytes).UnwrapErr());
        }
        const ScopedSecret serialized(std::move(bytes).Unwrap());
        if (auto saved = store_.SaveBlob(SessionKey(session.session_id), serialized.Span()); saved.IsErr()) {
            return saved;
        }
        {
            // The cache must never lag the stored blob.
            std::lock_guard guard(cache_lock_);
            cache_.insert_or_assign(session.session_id, session);
        }
        return UpdateIndex(session.session_id, true);
    }

    Result<std::optional<SessionState>, ProtocolFailure> SessionPersistence::Load(const std::string& session_id) {
        using LoadResult = Result<std::optional<SessionState>, ProtocolFailure>;
        {
            std::lock_guard guard(cache_lock_);
            if (const auto it = cache_.find(session_id); it != cache_.end()) {
                return LoadResult::Ok(it->second);
            }
        }

        auto blob = store_.LoadBlob(SessionKey(session_id));
        if (blob.IsErr()) {
            return LoadResult::Err(std::move(blob).UnwrapErr());
        }
        const auto stored = std::move(blob).Unwrap();
        if (!stored.has_value()) {
            return LoadResult::Ok(std::nullopt);
        }
        auto record = detail::ParseMessage<pb::SessionRecord>(stored->Span(), "session record");
        if (record.IsErr()) {
            return LoadResult::Err(std::move(record).UnwrapErr());
        }
        auto decoded = Decode(record.Unwrap());
        detail::WipeString(*record.Unwrap().mutable_state());
        if (decoded.IsErr()) {
            DYNASTY_LOG_WARN(kTag, "stored session '{}' rejected: {}", session_id, decoded.UnwrapErr().Describe());
            return LoadResult::Err(std::move(decoded).UnwrapErr());
        }
        auto session = std::move(decoded).Unwrap();
        if (session.session_id != session_id) {
            return LoadResult::Err(
                ProtocolFailure::AuthenticationFailed("Stored session belongs to a different session id"));
        }

        std::lock_guard guard(cache_lock_);
        cache_.insert_or_assign(session_id, session);
        return LoadResult::Ok(std::move(session));
    }

    Result<Unit, ProtocolFailure> SessionPersistence::Delete(const std::string& session_id) {
        {
            std::lock_guard guard(cache_lock_);
            cache_.erase(session_id);
        }
        if (auto deleted = store_.DeleteBlob(SessionKey(session_id)); deleted.IsErr()) {
            return deleted;
        }
        if (auto indexed = UpdateIndex(session_id, false); indexed.IsErr()) {
            return indexed;
        }
        DYNASTY_LOG_DEBUG(kTag, "deleted session '{}'", session_id);
        audit_.Record(interfaces::AuditEventType::SessionDeleted, "Session destroyed",
                      {{"session_id", session_id}});
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::vector<std::string>, ProtocolFailure> SessionPersistence::ListSessionIds() {
        std::lock_guard guard(index_lock_);
        return ReadIndexLocked();
    }

    Result<size_t, ProtocolFailure> SessionPersistence::ExpireInactive(const TimePoint now) {
        auto ids = ListSessionIds();
        if (ids.IsErr()) {
            return Result<size_t, ProtocolFailure>::Err(std::move(ids).UnwrapErr());
        }
        size_t removed = 0;
        for (const auto& session_id : ids.Unwrap()) {
            auto loaded = Load(session_id);
            if (loaded.IsErr()) {
                if (loaded.UnwrapErr().IsTransient()) {
                    return Result<size_t, ProtocolFailure>::Err(std::move(loaded).UnwrapErr());
                }
                DYNASTY_LOG_WARN(kTag, "dropping unreadable session '{}'", session_id);
            } else if (loaded.Unwrap().has_value() &&
                       now - loaded.Unwrap()->last_activity <= session_settings_.session_retention) {
                continue;
            }
            if (auto deleted = Delete(session_id); deleted.IsErr()) {
                return Result<size_t, ProtocolFailure>::Err(std::move(deleted).UnwrapErr());
            }
            ++removed;
        }
        if (removed > 0) {
            DYNASTY_LOG_INFO(kTag, "expired {} inactive sessions", removed);
        }
        return Result<size_t, ProtocolFailure>::Ok(removed);
    }

    void SessionPersistence::OnIdentityReplaced() {
        std::lock_guard guard(cache_lock_);
        DYNASTY_LOG_INFO(kTag, "identity replaced, dropping {} cached sessions", cache_.size());
        cache_.clear();
    }

    size_t SessionPersistence::CachedCount() const {
        std::lock_guard guard(cache_lock_);
        return cache_.size();
    }

    Result<std::vector<std::string>, ProtocolFailure> SessionPersistence::ReadIndexLocked() {
        auto blob = store_.LoadBlob(std::string(kSessionIndexStorageKey));
        if (blob.IsErr()) {
            return Result<std::vector<std::string>, ProtocolFailure>::Err(std::move(blob).UnwrapErr());
        }
        const auto stored = std::move(blob).Unwrap();
        if (!stored.has_value()) {
            return Result<std::vector<std::string>, ProtocolFailure>::Ok({});
        }
        auto index = detail::ParseMessage<pb::SessionIndex>(stored->Span(), "session index");
        if (index.IsErr()) {
            return Result<std::vector<std::string>, ProtocolFailure>::Err(std::move(index).UnwrapErr());
        }
        const auto& ids = index.Unwrap().session_ids();
        return Result<std::vector<std::string>, ProtocolFailure>::Ok(
            std::vector<std::string>(ids.begin(), ids.end()));
    }

    Result<Unit, ProtocolFailure> SessionPersistence::UpdateIndex(const std::string& session_id, const bool present) {
        std::lock_guard guard(index_lock_);
        auto current = ReadIndexLocked();
        if (current.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(current).UnwrapErr());
        }
        auto ids = std::move(current).Unwrap();
        const auto it = std::find(ids.begin(), ids.end(), session_id);
        if (present == (it != ids.end())) {
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }
        if (present) {
            ids.push_back(session_id);
        } else {
            ids.erase(it);
        }

        pb::SessionIndex index;
        for (const auto& id : ids) {
            index.add_session_ids(id);
        }
        auto bytes = detail::SerializeDeterministic(index);
        if (bytes.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(bytes).UnwrapErr());
        }
        return store_.SaveBlob(std::string(kSessionIndexStorageKey), bytes.Unwrap());
    }
}
