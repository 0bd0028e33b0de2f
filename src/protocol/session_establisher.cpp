#include "dynasty/protocol/session_establisher.hpp"
#include "dynasty/core/constants.hpp"
#include "dynasty/core/logging.hpp"
#include "dynasty/crypto/sodium_interop.hpp"
#include "dynasty/protocol/constants.hpp"
#include "dynasty/protocol/ratchet_kdf.hpp"
#include "dynasty/security/dh_validator.hpp"
#include "core/proto_helpers.hpp"

#include <exception>
#include <mutex>
#include <optional>
#include <vector>

namespace dynasty::e2ee::protocol {
    namespace pb = dynasty::proto::e2ee;
    using crypto::ScopedSecret;
    using crypto::SodiumInterop;
    using identity::IdentityKeys;
    using security::DhValidator;

    namespace {
        constexpr std::string_view kTag = "x3dh";

        Result<Unit, ProtocolFailure> CheckStop(const std::stop_token& stop, std::string_view stage) {
            if (stop.stop_requested()) {
                DYNASTY_LOG_INFO(kTag, "establishment cancelled {}", stage);
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::Cancelled(fmt::format("Session establishment cancelled {}", stage)));
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        Result<Unit, ProtocolFailure> ValidatePeerKey(std::span<const uint8_t> key, std::string_view what) {
            if (auto valid = DhValidator::ValidateX25519PublicKey(key); valid.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::PeerBundleInvalid(
                    fmt::format("Peer {} is invalid: {}", what, valid.UnwrapErr().message)));
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        Result<Unit, ProtocolFailure> ValidateBundle(const pb::DeviceRecord& bundle) {
            if (bundle.user_id().empty() || bundle.device_id().empty()) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::PeerBundleInvalid("Peer bundle has no user or device id"));
            }
            DYNASTY_TRY(ValidatePeerKey(detail::AsSpan(bundle.identity_key()), "identity key"));
            if (bundle.identity_signing_key().size() != kEd25519PublicKeyBytes) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::PeerBundleInvalid("Peer signing key must be 32 bytes"));
            }
            if (!bundle.has_signed_pre_key()) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::PeerBundleInvalid("Peer bundle has no signed pre-key"));
            }
            const auto& spk = bundle.signed_pre_key();
            DYNASTY_TRY(ValidatePeerKey(detail::AsSpan(spk.public_key()), "signed pre-key"));
            if (spk.signature().size() != kEd25519SignatureBytes ||
                !IdentityKeys::VerifyRemoteSpkSignature(
                    detail::AsSpan(bundle.identity_signing_key()),
                    detail::AsSpan(spk.public_key()),
                    detail::AsSpan(spk.signature()))) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::PeerBundleInvalid(std::string(ErrorMessages::SIGNED_PRE_KEY_FAILED)));
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        Result<ScopedSecret, ProtocolFailure> Agree(
            std::span<const uint8_t> private_key,
            std::span<const uint8_t> public_key) {
            return SodiumInterop::ComputeX25519(private_key, public_key);
        }

        std::vector<uint8_t> AssociatedData(std::span<const uint8_t> initiator_identity,
                                            std::span<const uint8_t> responder_identity) {
            std::vector<uint8_t> ad;
            ad.reserve(initiator_identity.size() + responder_identity.size());
            ad.insert(ad.end(), initiator_identity.begin(), initiator_identity.end());
            ad.insert(ad.end(), responder_identity.begin(), responder_identity.end());
            return ad;
        }
    }

    SessionEstablisher::SessionEstablisher(
        identity::IdentityManager& identity,
        std::shared_ptr<interfaces::IDirectoryService> directory,
        SessionPersistence& persistence,
        security::SessionLockRegistry& locks,
        security::AuditLogger& audit,
        models::LocalDevice local_device,
        ClockFn clock,
        const identity::KeyRotationScheduler* retained_keys)
        : identity_(identity)
        , directory_(std::move(directory))
        , persistence_(persistence)
        , locks_(locks)
        , audit_(audit)
        , local_device_(std::move(local_device))
        , clock_(std::move(clock))
        , retained_keys_(retained_keys) {}

    std::string SessionEstablisher::MakeSessionId(const std::string& peer_user_id, const std::string& peer_device_id) {
        return fmt::format("{}:{}", peer_user_id, peer_device_id);
    }

    Result<SessionState, ProtocolFailure> SessionEstablisher::Initiate(
        const std::string& session_id,
        const pb::DeviceRecord& peer_bundle,
        std::stop_token stop) {
        const auto session_lock = locks_.Acquire(session_id);
        std::lock_guard guard(*session_lock);
        return InitiateLocked(session_id, peer_bundle, stop);
    }

    Result<SessionState, ProtocolFailure> SessionEstablisher::InitiateLocked(
        const std::string& session_id,
        const pb::DeviceRecord& peer_bundle,
        const std::stop_token& stop) {
        using SessionResult = Result<SessionState, ProtocolFailure>;

        DYNASTY_TRY(CheckStop(stop, "before start"));
        if (session_id.empty()) {
            return SessionResult::Err(ProtocolFailure::InvalidInput("Session id must not be empty"));
        }
        if (auto valid = ValidateBundle(peer_bundle); valid.IsErr()) {
            DYNASTY_LOG_WARN(kTag, "rejected bundle of {}/{}: {}",
                             peer_bundle.user_id(), peer_bundle.device_id(), valid.UnwrapErr().message);
            return SessionResult::Err(std::move(valid).UnwrapErr());
        }

        std::optional<pb::OneTimePreKey> one_time_pre_key;
        if (peer_bundle.one_time_pre_keys_size() > 0) {
            one_time_pre_key = peer_bundle.one_time_pre_keys(0);
            DYNASTY_TRY(ValidatePeerKey(detail::AsSpan(one_time_pre_key->public_key()), "one-time pre-key"));
        }

        auto local = identity_.GetPublicKeys();
        if (local.IsErr()) {
            return SessionResult::Err(std::move(local).UnwrapErr());
        }
        const auto& local_keys = local.Unwrap();

        auto ephemeral = SodiumInterop::GenerateX25519KeyPair(kPurposeEphemeralX25519);
        if (ephemeral.IsErr()) {
            return SessionResult::Err(std::move(ephemeral).UnwrapErr());
        }
        const auto remote_identity = detail::AsSpan(peer_bundle.identity_key());
        const auto remote_spk = detail::AsSpan(peer_bundle.signed_pre_key().public_key());
        std::optional<std::span<const uint8_t>> remote_opk;
        if (one_time_pre_key.has_value()) {
            remote_opk = detail::AsSpan(one_time_pre_key->public_key());
        }

        auto shared_secret = identity_.DeriveInitiatorSecret(
            ephemeral.Unwrap().private_key.Span(), remote_identity, remote_spk, remote_opk);
        if (shared_secret.IsErr()) {
            return SessionResult::Err(std::move(shared_secret).UnwrapErr());
        }

        auto ratchet = SodiumInterop::GenerateX25519KeyPair(kPurposeRatchetX25519);
        if (ratchet.IsErr()) {
            return SessionResult::Err(std::move(ratchet).UnwrapErr());
        }
        auto ratchet_dh = Agree(ratchet.Unwrap().private_key.Span(), remote_spk);
        if (ratchet_dh.IsErr()) {
            return SessionResult::Err(std::move(ratchet_dh).UnwrapErr());
        }
        auto root = RatchetKdf::DeriveRoot(shared_secret.Unwrap().Span(), ratchet_dh.Unwrap().Span());
        if (root.IsErr()) {
            return SessionResult::Err(std::move(root).UnwrapErr());
        }

        const TimePoint now = clock_();
        SessionState session = persistence_.NewState();
        session.session_id = session_id;
        session.peer_user_id = peer_bundle.user_id();
        session.peer_device_id = peer_bundle.device_id();
        session.is_initiator = true;
        session.root_key = std::move(root.Unwrap().root_key);
        session.sending_chain = ChainKey{.key = std::move(root.Unwrap().chain_key), .index = 0};
        session.receiving_ratchet_key = std::vector<uint8_t>(remote_spk.begin(), remote_spk.end());
        session.associated_data = AssociatedData(local_keys.identity_key, remote_identity);
        session.remote_identity_key = detail::ToBytes(peer_bundle.identity_key());
        session.created_at = now;
        session.last_activity = now;

        pb::InitiatorHello hello;
        hello.set_identity_key(local_keys.identity_key.data(), local_keys.identity_key.size());
        hello.set_identity_signing_key(local_keys.signing_key.data(), local_keys.signing_key.size());
        hello.set_ephemeral_key(ephemeral.Unwrap().public_key.data(), ephemeral.Unwrap().public_key.size());
        hello.set_ratchet_key(ratchet.Unwrap().public_key.data(), ratchet.Unwrap().public_key.size());
        hello.set_signed_pre_key_id(peer_bundle.signed_pre_key().id());
        if (one_time_pre_key.has_value()) {
            hello.set_one_time_pre_key_id(one_time_pre_key->id());
        }
        hello.set_sender_user_id(local_device_.user_id);
        hello.set_sender_device_id(local_device_.device_id);
        hello.set_responder_identity_key(peer_bundle.identity_key());
        session.pending_hello = std::move(hello);
        session.sending_ratchet = std::move(ratchet).Unwrap();

        DYNASTY_TRY(CheckStop(stop, "before commit"));

        if (one_time_pre_key.has_value()) {
            try {
                auto reported = directory_->ConsumeOneTimePreKey(
                    peer_bundle.user_id(), peer_bundle.device_id(), one_time_pre_key->id());
                if (reported.IsErr()) {
                    DYNASTY_LOG_WARN(kTag, "could not report one-time pre-key {} of {}/{}: {}",
                                     one_time_pre_key->id(), peer_bundle.user_id(), peer_bundle.device_id(),
                                     reported.UnwrapErr().message);
                    return SessionResult::Err(std::move(reported).UnwrapErr());
                }
            } catch (const std::exception& ex) {
                return SessionResult::Err(ProtocolFailure::DirectoryUnavailable(
                    fmt::format("Directory threw while consuming a one-time pre-key: {}", ex.what())));
            }
        }

        DYNASTY_TRY(CommitLocked(session));
        DYNASTY_LOG_INFO(kTag, "initiated session '{}' with identity {}{}",
                         session_id, logging::Fingerprint(remote_identity),
                         one_time_pre_key.has_value() ? " using a one-time pre-key" : "");
        return SessionResult::Ok(std::move(session));
    }

    Result<SessionState, ProtocolFailure> SessionEstablisher::Accept(
        const std::string& session_id,
        const pb::InitiatorHello& hello,
        std::stop_token stop) {
        auto derived = DeriveAccepted(session_id, hello, stop);
        if (derived.IsErr()) {
            return derived;
        }
        auto session = std::move(derived).Unwrap();

        const auto session_lock = locks_.Acquire(session_id);
        std::lock_guard guard(*session_lock);
        DYNASTY_TRY(CommitAccepted(session, hello));
        return Result<SessionState, ProtocolFailure>::Ok(std::move(session));
    }

    Result<SessionState, ProtocolFailure> SessionEstablisher::DeriveAccepted(
        const std::string& session_id,
        const pb::InitiatorHello& hello,
        const std::stop_token& stop) {
        using SessionResult = Result<SessionState, ProtocolFailure>;

        DYNASTY_TRY(CheckStop(stop, "before start"));
        if (session_id.empty()) {
            return SessionResult::Err(ProtocolFailure::InvalidInput("Session id must not be empty"));
        }
        DYNASTY_TRY(ValidatePeerKey(detail::AsSpan(hello.identity_key()), "identity key"));
        DYNASTY_TRY(ValidatePeerKey(detail::AsSpan(hello.ephemeral_key()), "ephemeral key"));
        DYNASTY_TRY(ValidatePeerKey(detail::AsSpan(hello.ratchet_key()), "ratchet key"));

        auto local = identity_.GetPublicKeys();
        if (local.IsErr()) {
            return SessionResult::Err(std::move(local).UnwrapErr());
        }
        std::vector<uint8_t> local_identity = local.Unwrap().identity_key;

        // A hello built from a bundle published before our last rotation targets a retired key.
        std::optional<crypto::KeyPair> retained_identity;
        const auto targeted = detail::AsSpan(hello.responder_identity_key());
        if (!targeted.empty() && !SodiumInterop::ConstantTimeEquals(targeted, local_identity)) {
            std::optional<crypto::KeyPair> found;
            if (retained_keys_ != nullptr) {
                auto lookup = retained_keys_->FindRetainedKey(targeted);
                if (lookup.IsErr()) {
                    return SessionResult::Err(std::move(lookup).UnwrapErr());
                }
                found = std::move(lookup).Unwrap();
            }
            if (!found.has_value()) {
                DYNASTY_LOG_WARN(kTag, "hello for '{}' targets identity {} which is no longer retained",
                                 session_id, logging::Fingerprint(targeted));
                return SessionResult::Err(ProtocolFailure::AuthenticationFailed(
                    "Hello targets an identity key this device no longer holds"));
            }
            retained_identity = std::move(found);
            local_identity = retained_identity->public_key;
            DYNASTY_LOG_INFO(kTag, "accepting '{}' under retired identity {}",
                             session_id, logging::Fingerprint(local_identity));
        }

        std::optional<uint32_t> one_time_pre_key_id;
        if (hello.has_one_time_pre_key_id()) {
            one_time_pre_key_id = hello.one_time_pre_key_id();
        }
        const auto remote_identity = detail::AsSpan(hello.identity_key());
        const auto remote_ratchet = detail::AsSpan(hello.ratchet_key());

        auto shared_secret = identity_.DeriveResponderSecret(
            remote_identity, detail::AsSpan(hello.ephemeral_key()), hello.signed_pre_key_id(), one_time_pre_key_id,
            retained_identity.has_value() ? &*retained_identity : nullptr);
        if (shared_secret.IsErr()) {
            return SessionResult::Err(std::move(shared_secret).UnwrapErr());
        }

        auto spk_private = identity_.ReadSignedPreKeyPrivate();
        if (spk_private.IsErr()) {
            return SessionResult::Err(std::move(spk_private).UnwrapErr());
        }
        auto receive_dh = Agree(spk_private.Unwrap().Span(), remote_ratchet);
        spk_private.Unwrap().Wipe();
        if (receive_dh.IsErr()) {
            return SessionResult::Err(std::move(receive_dh).UnwrapErr());
        }
        auto receive_root = RatchetKdf::DeriveRoot(shared_secret.Unwrap().Span(), receive_dh.Unwrap().Span());
        if (receive_root.IsErr()) {
            return SessionResult::Err(std::move(receive_root).UnwrapErr());
        }

        auto ratchet = SodiumInterop::GenerateX25519KeyPair(kPurposeRatchetX25519);
        if (ratchet.IsErr()) {
            return SessionResult::Err(std::move(ratchet).UnwrapErr());
        }
        auto send_dh = Agree(ratchet.Unwrap().private_key.Span(), remote_ratchet);
        if (send_dh.IsErr()) {
            return SessionResult::Err(std::move(send_dh).UnwrapErr());
        }
        auto send_root = RatchetKdf::DeriveRoot(receive_root.Unwrap().root_key.Span(), send_dh.Unwrap().Span());
        if (send_root.IsErr()) {
            return SessionResult::Err(std::move(send_root).UnwrapErr());
        }

        const TimePoint now = clock_();
        SessionState session = persistence_.NewState();
        session.session_id = session_id;
        session.peer_user_id = hello.sender_user_id();
        session.peer_device_id = hello.sender_device_id();
        session.is_initiator = false;
        session.root_key = std::move(send_root.Unwrap().root_key);
        session.receiving_chain = ChainKey{.key = std::move(receive_root.Unwrap().chain_key), .index = 0};
        session.receiving_ratchet_key = std::vector<uint8_t>(remote_ratchet.begin(), remote_ratchet.end());
        session.sending_chain = ChainKey{.key = std::move(send_root.Unwrap().chain_key), .index = 0};
        session.sending_ratchet = std::move(ratchet).Unwrap();
        session.associated_data = AssociatedData(remote_identity, local_identity);
        session.remote_identity_key = detail::ToBytes(hello.identity_key());
        session.handshake_ephemeral_key = detail::ToBytes(hello.ephemeral_key());
        session.created_at = now;
        session.last_activity = now;

        DYNASTY_TRY(CheckStop(stop, "before commit"));
        return SessionResult::Ok(std::move(session));
    }

    Result<Unit, ProtocolFailure> SessionEstablisher::CommitAccepted(
        const SessionState& session,
        const pb::InitiatorHello& hello) {
        if (hello.has_one_time_pre_key_id()) {
            DYNASTY_TRY(identity_.ConsumeOneTimePreKey(hello.one_time_pre_key_id()));
        }
        DYNASTY_TRY(CommitLocked(session));
        DYNASTY_LOG_INFO(kTag, "accepted session '{}' from identity {}",
                         session.session_id, logging::Fingerprint(session.remote_identity_key));
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }


    Result<Unit, ProtocolFailure> SessionEstablisher::CommitLocked(const SessionState& session) {
        DYNASTY_TRY(persistence_.Save(session));
        audit_.Record(interfaces::AuditEventType::SessionCreated,
                      session.is_initiator ? "Session initiated" : "Session accepted",
                      {{"session_id", session.session_id},
                       {"peer_user_id", session.peer_user_id},
                       {"peer_device_id", session.peer_device_id}});
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}
