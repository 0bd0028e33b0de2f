#include "dynasty/protocol/ratchet_engine.hpp"
#include "dynasty/core/constants.hpp"
#include "dynasty/core/logging.hpp"
#include "dynasty/crypto/aes_gcm.hpp"
#include "dynasty/crypto/sodium_interop.hpp"
#include "dynasty/protocol/constants.hpp"
#include "dynasty/protocol/ratchet_kdf.hpp"
#include "dynasty/security/dh_validator.hpp"
#include "core/proto_helpers.hpp"

#include <limits>
#include <mutex>

namespace dynasty::e2ee::protocol {
    namespace pb = dynasty::proto::e2ee;
    using crypto::AesGcm;
    using crypto::ScopedSecret;
    using crypto::SodiumInterop;

    namespace {
        constexpr std::string_view kTag = "ratchet";

        std::vector<uint8_t> Concat(std::span<const uint8_t> first, std::span<const uint8_t> second) {
            std::vector<uint8_t> out;
            out.reserve(first.size() + second.size());
            out.insert(out.end(), first.begin(), first.end());
            out.insert(out.end(), second.begin(), second.end());
            return out;
        }

        void CommitReceived(SessionState& session, SessionState&& work, const TimePoint now) {
            work.messages_received += 1;
            work.last_activity = now;
            if (work.is_initiator) {
                work.pending_hello.reset();
            }
            session = std::move(work);
        }
    }

    RatchetEngine::RatchetEngine(
        SessionPersistence& persistence,
        security::SessionLockRegistry& locks,
        security::AuditLogger& audit,
        configuration::RatchetSettings settings,
        ClockFn clock)
        : persistence_(persistence)
        , locks_(locks)
        , audit_(audit)
        , settings_(settings)
        , clock_(std::move(clock)) {}

    Result<pb::EncryptedMessage, ProtocolFailure> RatchetEngine::Encrypt(
        SessionState& session,
        std::span<const uint8_t> plaintext) const {
        using EncryptResult = Result<pb::EncryptedMessage, ProtocolFailure>;

        if (session.sending_chain.key.Size() != kChainKeyBytes) {
            return EncryptResult::Err(ProtocolFailure::InvalidState("Session has no sending chain"));
        }
        if (session.sending_chain.index == std::numeric_limits<uint32_t>::max()) {
            return EncryptResult::Err(ProtocolFailure::InvalidState("Sending chain is exhausted"));
        }

        auto step = RatchetKdf::AdvanceChain(session.sending_chain.key.Span());
        if (step.IsErr()) {
            return EncryptResult::Err(std::move(step).UnwrapErr());
        }
        auto keys = RatchetKdf::ExpandMessageKey(step.Unwrap().message_key.Span());
        if (keys.IsErr()) {
            return EncryptResult::Err(std::move(keys).UnwrapErr());
        }
        const auto& message_keys = keys.Unwrap();

        const uint32_t index = session.sending_chain.index;
        const auto header_bytes = RatchetKdf::EncodeHeader(
            session.sending_ratchet.public_key, session.previous_counter, index);
        const auto aad = Concat(session.associated_data, header_bytes);

        auto ciphertext = AesGcm::Encrypt(message_keys.encryption_key.Span(), message_keys.iv, plaintext, aad);
        if (ciphertext.IsErr()) {
            return EncryptResult::Err(std::move(ciphertext).UnwrapErr());
        }
        auto mac = SodiumInterop::HmacSha256(
            message_keys.mac_key.Span(), Concat(header_bytes, ciphertext.Unwrap()));
        if (mac.IsErr()) {
            return EncryptResult::Err(std::move(mac).UnwrapErr());
        }

        pb::EncryptedMessage message;
        auto* header = message.mutable_header();
        header->set_dh(session.sending_ratchet.public_key.data(), session.sending_ratchet.public_key.size());
        header->set_pn(session.previous_counter);
        header->set_n(index);
        message.set_ciphertext(ciphertext.Unwrap().data(), ciphertext.Unwrap().size());
        message.set_mac(mac.Unwrap().data(), mac.Unwrap().size());
        if (session.pending_hello.has_value()) {
            *message.mutable_hello() = *session.pending_hello;
        }

        session.sending_chain.key = std::move(step.Unwrap().next_chain_key);
        session.sending_chain.index = index + 1;
        session.messages_sent += 1;
        session.last_activity = clock_();
        return EncryptResult::Ok(std::move(message));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> RatchetEngine::Decrypt(
        SessionState& session,
        const pb::EncryptedMessage& message) const {
        using DecryptResult = Result<std::vector<uint8_t>, ProtocolFailure>;

        if (!message.has_header() || message.header().dh().size() != kX25519PublicKeyBytes) {
            return DecryptResult::Err(ProtocolFailure::InvalidInput("Message carries no valid ratchet header"));
        }
        if (message.mac().size() != kHmacBytes) {
            return DecryptResult::Err(ReportAuthenticationFailure(
                session, ProtocolFailure::AuthenticationFailed(std::string(ErrorMessages::MAC_MISMATCH))));
        }

        const TimePoint now = clock_();
        const auto& header = message.header();
        const auto remote_dh = detail::ToBytes(header.dh());
        const uint32_t n = header.n();
        const auto header_bytes = RatchetKdf::EncodeHeader(remote_dh, header.pn(), n);

        SessionState work = session;

        if (auto cached = work.skipped_message_keys.Take(SkippedKeyId{remote_dh, n}, now); cached.has_value()) {
            auto plaintext = OpenWithMessageKey(work, cached->Span(), header_bytes, message);
            if (plaintext.IsErr()) {
                return DecryptResult::Err(ReportAuthenticationFailure(session, std::move(plaintext).UnwrapErr()));
            }
            DYNASTY_LOG_DEBUG(kTag, "session '{}' used skipped key {}", session.session_id, n);
            CommitReceived(session, std::move(work), now);
            return plaintext;
        }

        const bool new_chain = !work.receiving_chain.has_value() ||
                               !work.receiving_ratchet_key.has_value() ||
                               *work.receiving_ratchet_key != remote_dh;
        const uint64_t receive_index = new_chain ? 0 : work.receiving_chain->index;
        if (static_cast<uint64_t>(n) > receive_index + settings_.max_skip) {
            DYNASTY_LOG_WARN(kTag, "session '{}' rejected index {} (receiving at {}, max skip {})",
                             session.session_id, n, receive_index, settings_.max_skip);
            return DecryptResult::Err(ProtocolFailure::TooManySkippedMessages(
                fmt::format("Message index {} exceeds the skip window of {}", n, settings_.max_skip)));
        }

        if (new_chain) {
            if (security::DhValidator::ValidateX25519PublicKey(remote_dh).IsErr()) {
                return DecryptResult::Err(ReportAuthenticationFailure(
                    session, ProtocolFailure::AuthenticationFailed("Header carries an invalid ratchet key")));
            }
            if (auto stepped = StepDhRatchet(work, remote_dh, header.pn(), now); stepped.IsErr()) {
                return DecryptResult::Err(std::move(stepped).UnwrapErr());
            }
        }

        if (n < work.receiving_chain->index) {
            return DecryptResult::Err(ProtocolFailure::DuplicateMessage(
                fmt::format("Message key {} was already used or has expired", n)));
        }
        if (auto skipped = CacheSkippedKeys(work, n, now); skipped.IsErr()) {
            return DecryptResult::Err(std::move(skipped).UnwrapErr());
        }

        auto step = RatchetKdf::AdvanceChain(work.receiving_chain->key.Span());
        if (step.IsErr()) {
            return DecryptResult::Err(std::move(step).UnwrapErr());
        }
        work.receiving_chain->key = std::move(step.Unwrap().next_chain_key);
        work.receiving_chain->index = n + 1;

        auto plaintext = OpenWithMessageKey(work, step.Unwrap().message_key.Span(), header_bytes, message);
        if (plaintext.IsErr()) {
            return DecryptResult::Err(ReportAuthenticationFailure(session, std::move(plaintext).UnwrapErr()));
        }
        CommitReceived(session, std::move(work), now);
        return plaintext;
    }

    Result<Unit, ProtocolFailure> RatchetEngine::StepDhRatchet(
        SessionState& work,
        std::span<const uint8_t> remote_ratchet_key,
        const uint32_t previous_chain_length,
        const TimePoint now) const {
        if (work.receiving_chain.has_value() && work.receiving_ratchet_key.has_value()) {
            const uint64_t index = work.receiving_chain->index;
            if (static_cast<uint64_t>(previous_chain_length) > index + settings_.max_skip) {
                return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::TooManySkippedMessages(
                    fmt::format("Previous chain length {} exceeds the skip window", previous_chain_length)));
            }
            if (auto skipped = CacheSkippedKeys(work, previous_chain_length, now); skipped.IsErr()) {
                return skipped;
            }
        }

        auto receive_dh = SodiumInterop::ComputeX25519(work.sending_ratchet.private_key.Span(), remote_ratchet_key);
        if (receive_dh.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(receive_dh).UnwrapErr());
        }
        auto receive_root = RatchetKdf::DeriveRoot(work.root_key.Span(), receive_dh.Unwrap().Span());
        if (receive_root.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(receive_root).UnwrapErr());
        }

        auto next_ratchet = SodiumInterop::GenerateX25519KeyPair(kPurposeRatchetX25519);
        if (next_ratchet.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(next_ratchet).UnwrapErr());
        }
        auto send_dh = SodiumInterop::ComputeX25519(next_ratchet.Unwrap().private_key.Span(), remote_ratchet_key);
        if (send_dh.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(send_dh).UnwrapErr());
        }
        auto send_root = RatchetKdf::DeriveRoot(receive_root.Unwrap().root_key.Span(), send_dh.Unwrap().Span());
        if (send_root.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(send_root).UnwrapErr());
        }

        work.previous_counter = work.sending_chain.index;
        work.receiving_ratchet_key = std::vector<uint8_t>(remote_ratchet_key.begin(), remote_ratchet_key.end());
        work.receiving_chain = ChainKey{.key = std::move(receive_root.Unwrap().chain_key), .index = 0};
        work.sending_ratchet = std::move(next_ratchet).Unwrap();
        work.sending_chain = ChainKey{.key = std::move(send_root.Unwrap().chain_key), .index = 0};
        work.root_key = std::move(send_root.Unwrap().root_key);

        DYNASTY_LOG_DEBUG(kTag, "session '{}' DH step to peer key {}, previous chain {}",
                          work.session_id, logging::Fingerprint(remote_ratchet_key), work.previous_counter);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> RatchetEngine::CacheSkippedKeys(
        SessionState& work,
        const uint32_t until,
        const TimePoint now) const {
        if (!work.receiving_chain.has_value() || !work.receiving_ratchet_key.has_value()) {
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }
        auto& chain = *work.receiving_chain;
        size_t evicted = 0;
        while (chain.index < until) {
            auto step = RatchetKdf::AdvanceChain(chain.key.Span());
            if (step.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(std::move(step).UnwrapErr());
            }
            evicted += work.skipped_message_keys.Put(
                SkippedKeyId{*work.receiving_ratchet_key, chain.index},
                std::move(step.Unwrap().message_key),
                now);
            chain.key = std::move(step.Unwrap().next_chain_key);
            chain.index += 1;
        }
        if (evicted > 0) {
            DYNASTY_LOG_WARN(kTag, "session '{}' evicted {} skipped keys over capacity",
                             work.session_id, evicted);
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::vector<uint8_t>, ProtocolFailure> RatchetEngine::OpenWithMessageKey(
        const SessionState& work,
        std::span<const uint8_t> message_key,
        std::span<const uint8_t> header_bytes,
        const pb::EncryptedMessage& message) const {
        auto keys = RatchetKdf::ExpandMessageKey(message_key);
        if (keys.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(keys).UnwrapErr());
        }
        const auto& message_keys = keys.Unwrap();
        const auto ciphertext = detail::AsSpan(message.ciphertext());

        auto expected_mac = SodiumInterop::HmacSha256(message_keys.mac_key.Span(), Concat(header_bytes, ciphertext));
        if (expected_mac.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(expected_mac).UnwrapErr());
        }
        if (!SodiumInterop::ConstantTimeEquals(expected_mac.Unwrap(), detail::AsSpan(message.mac()))) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::AuthenticationFailed(std::string(ErrorMessages::MAC_MISMATCH)));
        }
        const auto aad = Concat(work.associated_data, header_bytes);
        return AesGcm::Decrypt(message_keys.encryption_key.Span(), message_keys.iv, ciphertext, aad);
    }

    ProtocolFailure RatchetEngine::ReportAuthenticationFailure(
        const SessionState& session,
        ProtocolFailure failure) const {
        if (failure.type != ProtocolFailureType::AuthenticationFailed) {
            return failure;
        }
        DYNASTY_LOG_WARN(kTag, "authentication failed on session '{}': {}", session.session_id, failure.message);
        audit_.Record(interfaces::AuditEventType::AuthenticationFailed,
                      "Inbound message failed authentication",
                      {{"session_id", session.session_id},
                       {"peer_user_id", session.peer_user_id},
                       {"peer_device_id", session.peer_device_id}});
        return failure;
    }

    Result<pb::EncryptedMessage, ProtocolFailure> RatchetEngine::EncryptForSession(
        const std::string& session_id,
        std::span<const uint8_t> plaintext) {
        using EncryptResult = Result<pb::EncryptedMessage, ProtocolFailure>;

        const auto session_lock = locks_.Acquire(session_id);
        std::lock_guard guard(*session_lock);

        auto loaded = persistence_.Load(session_id);
        if (loaded.IsErr()) {
            return EncryptResult::Err(std::move(loaded).UnwrapErr());
        }
        auto stored = std::move(loaded).Unwrap();
        if (!stored.has_value()) {
            return EncryptResult::Err(ProtocolFailure::SessionNotFound(
                fmt::format("No session '{}'", session_id)));
        }
        auto message = Encrypt(*stored, plaintext);
        if (message.IsErr()) {
            return message;
        }
        if (auto saved = persistence_.Save(*stored); saved.IsErr()) {
            return EncryptResult::Err(std::move(saved).UnwrapErr());
        }
        return message;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> RatchetEngine::DecryptForSession(
        const std::string& session_id,
        const pb::EncryptedMessage& message) {
        using DecryptResult = Result<std::vector<uint8_t>, ProtocolFailure>;

        const auto session_lock = locks_.Acquire(session_id);
        std::lock_guard guard(*session_lock);
        return DecryptStored(session_id, message);
    }

    Result<std::vector<uint8_t>, ProtocolFailure> RatchetEngine::DecryptStored(
        const std::string& session_id,
        const pb::EncryptedMessage& message) {
        using DecryptResult = Result<std::vector<uint8_t>, ProtocolFailure>;

        auto loaded = persistence_.Load(session_id);
        if (loaded.IsErr()) {
            return DecryptResult::Err(std::move(loaded).UnwrapErr());
        }
        auto stored = std::move(loaded).Unwrap();
        if (!stored.has_value()) {
            return DecryptResult::Err(ProtocolFailure::SessionNotFound(
                fmt::format("No session '{}'", session_id)));
        }
        auto plaintext = Decrypt(*stored, message);
        if (plaintext.IsErr()) {
            return plaintext;
        }
        if (auto saved = persistence_.Save(*stored); saved.IsErr()) {
            return DecryptResult::Err(std::move(saved).UnwrapErr());
        }
        return plaintext;
    }

    Result<SessionInfo, ProtocolFailure> RatchetEngine::GetSessionInfo(const std::string& session_id) {
        const auto session_lock = locks_.Acquire(session_id);
        std::lock_guard guard(*session_lock);

        auto loaded = persistence_.Load(session_id);
        if (loaded.IsErr()) {
            return Result<SessionInfo, ProtocolFailure>::Err(std::move(loaded).UnwrapErr());
        }
        const auto& stored = loaded.Unwrap();
        if (!stored.has_value()) {
            return Result<SessionInfo, ProtocolFailure>::Err(ProtocolFailure::SessionNotFound(
                fmt::format("No session '{}'", session_id)));
        }
        return Result<SessionInfo, ProtocolFailure>::Ok(Describe(*stored));
    }

    SessionInfo RatchetEngine::Describe(const SessionState& session) {
        return SessionInfo{
            .session_id = session.session_id,
            .peer_user_id = session.peer_user_id,
            .peer_device_id = session.peer_device_id,
            .is_initiator = session.is_initiator,
            .messages_sent = session.messages_sent,
            .messages_received = session.messages_received,
            .sending_index = session.sending_chain.index,
            .receiving_index = session.receiving_chain.has_value() ? session.receiving_chain->index : 0,
            .previous_counter = session.previous_counter,
            .skipped_key_count = session.skipped_message_keys.Size(),
            .awaiting_response = session.pending_hello.has_value(),
            .created_at = session.created_at,
            .last_activity = session.last_activity};
    }

    Result<size_t, ProtocolFailure> RatchetEngine::Tick(const TimePoint now) {
        auto ids = persistence_.ListSessionIds();
        if (ids.IsErr()) {
            return Result<size_t, ProtocolFailure>::Err(std::move(ids).UnwrapErr());
        }
        size_t purged = 0;
        for (const auto& session_id : ids.Unwrap()) {
            const auto session_lock = locks_.Acquire(session_id);
            std::lock_guard guard(*session_lock);

            auto loaded = persistence_.Load(session_id);
            if (loaded.IsErr()) {
                if (loaded.UnwrapErr().IsTransient()) {
                    return Result<size_t, ProtocolFailure>::Err(std::move(loaded).UnwrapErr());
                }
                DYNASTY_LOG_WARN(kTag, "skipping unreadable session '{}' during cleanup", session_id);
                continue;
            }
            auto stored = std::move(loaded).Unwrap();
            if (!stored.has_value()) {
                continue;
            }
            const size_t removed = stored->skipped_message_keys.Tick(now);
            if (removed == 0) {
                continue;
            }
            if (auto saved = persistence_.Save(*stored); saved.IsErr()) {
                return Result<size_t, ProtocolFailure>::Err(std::move(saved).UnwrapErr());
            }
            purged += removed;
        }
        if (purged > 0) {
            DYNASTY_LOG_INFO(kTag, "purged {} expired skipped keys", purged);
        }
        return Result<size_t, ProtocolFailure>::Ok(purged);
    }
}
