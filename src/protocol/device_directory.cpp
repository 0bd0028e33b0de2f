#include "dynasty/protocol/device_directory.hpp"
#include "dynasty/core/logging.hpp"
#include "core/proto_helpers.hpp"

#include <algorithm>
#include <exception>

namespace dynasty::e2ee::protocol {
    namespace pb = dynasty::proto::e2ee;
    using interfaces::AuditEventType;

    namespace {
        constexpr std::string_view kTag = "devices";

        Result<std::vector<pb::DeviceRecord>, ProtocolFailure> FetchBundles(
            interfaces::IDirectoryService& directory,
            const std::string& user_id) {
            try {
                auto fetched = directory.FetchDeviceBundles(user_id);
                if (fetched.IsErr() && !fetched.UnwrapErr().IsTransient() &&
                    !fetched.UnwrapErr().IsIntegrityFailure()) {
                    return Result<std::vector<pb::DeviceRecord>, ProtocolFailure>::Err(
                        ProtocolFailure::DirectoryUnavailable(fetched.UnwrapErr().message));
                }
                return fetched;
            } catch (const std::exception& ex) {
                return Result<std::vector<pb::DeviceRecord>, ProtocolFailure>::Err(
                    ProtocolFailure::DirectoryUnavailable(
                        fmt::format("Directory threw while fetching bundles: {}", ex.what())));
            }
        }
    }

    DeviceDirectory::DeviceDirectory(
        models::LocalDevice local_device,
        identity::IdentityManager& identity,
        SessionEstablisher& establisher,
        RatchetEngine& ratchet,
        SessionPersistence& persistence,
        security::SessionLockRegistry& locks,
        std::shared_ptr<interfaces::IDirectoryService> directory,
        std::shared_ptr<interfaces::IMessageSink> message_sink,
        security::AuditLogger& audit,
        configuration::SessionSettings settings,
        ClockFn clock)
        : local_device_(std::move(local_device))
        , identity_(identity)
        , establisher_(establisher)
        , ratchet_(ratchet)
        , persistence_(persistence)
        , locks_(locks)
        , directory_(std::move(directory))
        , message_sink_(std::move(message_sink))
        , audit_(audit)
        , settings_(settings)
        , clock_(std::move(clock))
        , active_sessions_(settings.max_cached_device_sessions, settings.device_session_lifetime) {}

    Result<pb::DeviceRecord, ProtocolFailure> DeviceDirectory::RegisterDevice(const std::string& device_name) {
        models::LocalDevice device;
        {
            std::lock_guard guard(cache_lock_);
            if (!device_name.empty()) {
                local_device_.device_name = device_name;
            }
            device = local_device_;
        }
        auto record = identity_.CreateDeviceRecord(device);
        if (record.IsErr()) {
            return record;
        }
        try {
            auto published = directory_->PublishDeviceBundle(record.Unwrap());
            if (published.IsErr()) {
                DYNASTY_LOG_WARN(kTag, "publishing bundle of {} failed: {}",
                                 device.device_id, published.UnwrapErr().message);
                return Result<pb::DeviceRecord, ProtocolFailure>::Err(std::move(published).UnwrapErr());
            }
        } catch (const std::exception& ex) {
            return Result<pb::DeviceRecord, ProtocolFailure>::Err(ProtocolFailure::DirectoryUnavailable(
                fmt::format("Directory threw while publishing a bundle: {}", ex.what())));
        }
        DYNASTY_LOG_INFO(kTag, "registered device {} ({}) with {} one-time pre-keys",
                         device.device_id, device.device_name, record.Unwrap().one_time_pre_keys_size());
        audit_.Record(AuditEventType::DeviceRegistered, "Device bundle published",
                      {{"user_id", device.user_id},
                       {"device_id", device.device_id},
                       {"device_name", device.device_name}});
        return record;
    }

    Result<std::string, ProtocolFailure> DeviceDirectory::EnsureSession(
        const pb::DeviceRecord& record,
        const std::stop_token& stop) {
        const std::string session_id = SessionEstablisher::MakeSessionId(record.user_id(), record.device_id());
        const TimePoint now = clock_();
        std::optional<TimePoint> identity_replaced_at;
        {
            std::lock_guard guard(cache_lock_);
            if (active_sessions_.Touch(session_id, now)) {
                return Result<std::string, ProtocolFailure>::Ok(session_id);
            }
            identity_replaced_at = identity_replaced_at_;
        }

        {
            const auto session_lock = locks_.Acquire(session_id);
            std::lock_guard session_guard(*session_lock);
            auto stored = persistence_.Load(session_id);
            if (stored.IsErr() && stored.UnwrapErr().IsTransient()) {
                return Result<std::string, ProtocolFailure>::Err(std::move(stored).UnwrapErr());
            }
            const bool reusable = stored.IsOk() && stored.Unwrap().has_value() &&
                                  now - stored.Unwrap()->last_activity <= settings_.device_session_lifetime &&
                                  (!identity_replaced_at.has_value() ||
                                   stored.Unwrap()->created_at > *identity_replaced_at);
            if (!reusable) {
                auto established = establisher_.InitiateLocked(session_id, record, stop);
                if (established.IsErr()) {
                    return Result<std::string, ProtocolFailure>::Err(std::move(established).UnwrapErr());
                }
            }
        }

        std::lock_guard guard(cache_lock_);
        active_sessions_.Put(session_id, now, now);
        return Result<std::string, ProtocolFailure>::Ok(session_id);
    }

    Result<DeviceCiphertexts, ProtocolFailure> DeviceDirectory::EncryptForAllDevices(
        std::span<const uint8_t> plaintext,
        const std::string& peer_user_id,
        std::stop_token stop) {
        if (stop.stop_requested()) {
            return Result<DeviceCiphertexts, ProtocolFailure>::Err(
                ProtocolFailure::Cancelled("Fan-out cancelled before start"));
        }
        auto fetched = FetchBundles(*directory_, peer_user_id);
        if (fetched.IsErr()) {
            return Result<DeviceCiphertexts, ProtocolFailure>::Err(std::move(fetched).UnwrapErr());
        }

        DeviceCiphertexts ciphertexts;
        for (auto& record : fetched.Unwrap()) {
            if (record.user_id().empty()) {
                record.set_user_id(peer_user_id);
            }
            if (record.user_id() == local_device_.user_id && record.device_id() == local_device_.device_id) {
                continue;
            }
            if (stop.stop_requested()) {
                return Result<DeviceCiphertexts, ProtocolFailure>::Err(
                    ProtocolFailure::Cancelled("Fan-out cancelled"));
            }

            auto session_id = EnsureSession(record, stop);
            if (session_id.IsErr()) {
                if (session_id.UnwrapErr().type == ProtocolFailureType::Cancelled) {
                    return Result<DeviceCiphertexts, ProtocolFailure>::Err(std::move(session_id).UnwrapErr());
                }
                DYNASTY_LOG_WARN(kTag, "skipping device {} of {}: {}",
                                 record.device_id(), peer_user_id, session_id.UnwrapErr().Describe());
                continue;
            }
            auto message = ratchet_.EncryptForSession(session_id.Unwrap(), plaintext);
            if (message.IsErr()) {
                DYNASTY_LOG_WARN(kTag, "encryption for device {} of {} failed: {}",
                                 record.device_id(), peer_user_id, message.UnwrapErr().Describe());
                continue;
            }
            ciphertexts.insert_or_assign(record.device_id(), std::move(message).Unwrap());
        }
        DYNASTY_LOG_DEBUG(kTag, "fan-out to {} produced {} ciphertexts", peer_user_id, ciphertexts.size());
        return Result<DeviceCiphertexts, ProtocolFailure>::Ok(std::move(ciphertexts));
    }

    Result<std::vector<std::string>, ProtocolFailure> DeviceDirectory::SendToAllDevices(
        std::span<const uint8_t> plaintext,
        const std::string& peer_user_id,
        std::stop_token stop) {
        if (!message_sink_) {
            return Result<std::vector<std::string>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("No message sink configured"));
        }
        auto ciphertexts = EncryptForAllDevices(plaintext, peer_user_id, stop);
        if (ciphertexts.IsErr()) {
            return Result<std::vector<std::string>, ProtocolFailure>::Err(std::move(ciphertexts).UnwrapErr());
        }

        std::vector<std::string> delivered;
        for (const auto& [device_id, message] : ciphertexts.Unwrap()) {
            try {
                auto sent = message_sink_->Deliver(peer_user_id, device_id, message);
                if (sent.IsErr()) {
                    DYNASTY_LOG_WARN(kTag, "delivery to device {} of {} failed: {}",
                                     device_id, peer_user_id, sent.UnwrapErr().message);
                    continue;
                }
            } catch (const std::exception& ex) {
                DYNASTY_LOG_WARN(kTag, "delivery to device {} of {} threw: {}", device_id, peer_user_id, ex.what());
                continue;
            }
            delivered.push_back(device_id);
        }
        return Result<std::vector<std::string>, ProtocolFailure>::Ok(std::move(delivered));
    }

    Result<DeviceDirectory::HelloDisposition, ProtocolFailure> DeviceDirectory::ClassifyHello(
        const std::string& session_id,
        const pb::InitiatorHello& hello) {
        using DispositionResult = Result<HelloDisposition, ProtocolFailure>;

        auto loaded = persistence_.Load(session_id);
        if (loaded.IsErr()) {
            if (loaded.UnwrapErr().IsTransient()) {
                return DispositionResult::Err(std::move(loaded).UnwrapErr());
            }
            DYNASTY_LOG_WARN(kTag, "replacing unreadable session '{}'", session_id);
            return DispositionResult::Ok(HelloDisposition::Accept);
        }
        const auto& existing = loaded.Unwrap();
        if (!existing.has_value()) {
            return DispositionResult::Ok(HelloDisposition::Accept);
        }
        const auto incoming = detail::ToBytes(hello.ephemeral_key());
        if (!existing->is_initiator) {
            return DispositionResult::Ok(existing->handshake_ephemeral_key == incoming
                                             ? HelloDisposition::Ignore
                                             : HelloDisposition::Accept);
        }
        if (existing->pending_hello.has_value()) {
            const auto ours = detail::ToBytes(existing->pending_hello->ephemeral_key());
            if (std::lexicographical_compare(ours.begin(), ours.end(), incoming.begin(), incoming.end())) {
                return DispositionResult::Ok(HelloDisposition::Reject);
            }
        }
        return DispositionResult::Ok(HelloDisposition::Accept);
    }

    Result<std::vector<uint8_t>, ProtocolFailure> DeviceDirectory::DecryptFromDevice(
        const std::string& peer_user_id,
        const std::string& peer_device_id,
        const pb::EncryptedMessage& message) {
        using DecryptResult = Result<std::vector<uint8_t>, ProtocolFailure>;
        const std::string session_id = SessionEstablisher::MakeSessionId(peer_user_id, peer_device_id);

        const auto session_lock = locks_.Acquire(session_id);
        std::lock_guard session_guard(*session_lock);

        std::optional<DecryptResult> plaintext;
        if (message.has_hello()) {
            auto disposition = ClassifyHello(session_id, message.hello());
            if (disposition.IsErr()) {
                return DecryptResult::Err(std::move(disposition).UnwrapErr());
            }
            switch (disposition.Unwrap()) {
                case HelloDisposition::Reject:
                    DYNASTY_LOG_INFO(kTag, "concurrent handshake from {}/{} lost the tie-break",
                                     peer_user_id, peer_device_id);
                    return DecryptResult::Err(ProtocolFailure::InvalidState(
                        "Message belongs to a handshake superseded by the local one"));
                case HelloDisposition::Accept: {
                    pb::InitiatorHello hello = message.hello();
                    hello.set_sender_user_id(peer_user_id);
                    hello.set_sender_device_id(peer_device_id);
                    auto derived = establisher_.DeriveAccepted(session_id, hello);
                    if (derived.IsErr()) {
                        return DecryptResult::Err(std::move(derived).UnwrapErr());
                    }
                    // The candidate replaces the stored session only if the message opens under it.
                    auto candidate = std::move(derived).Unwrap();
                    plaintext.emplace(ratchet_.Decrypt(candidate, message));
                    if (plaintext->IsErr()) {
                        DYNASTY_LOG_WARN(kTag, "hello from {}/{} discarded: {}",
                                         peer_user_id, peer_device_id, plaintext->UnwrapErr().Describe());
                        return std::move(*plaintext);
                    }
                    if (auto committed = establisher_.CommitAccepted(candidate, hello); committed.IsErr()) {
                        return DecryptResult::Err(std::move(committed).UnwrapErr());
                    }
                    break;
                }
                case HelloDisposition::Ignore:
                    break;
            }
        }

        if (!plaintext.has_value()) {
            plaintext.emplace(ratchet_.DecryptStored(session_id, message));
            if (plaintext->IsErr()) {
                return std::move(*plaintext);
            }
        }
        const TimePoint now = clock_();
        std::lock_guard guard(cache_lock_);
        active_sessions_.Put(session_id, now, now);
        return std::move(*plaintext);
    }

    Result<Unit, ProtocolFailure> DeviceDirectory::RemoveDevice(
        const std::string& peer_user_id,
        const std::string& peer_device_id) {
        const std::string session_id = SessionEstablisher::MakeSessionId(peer_user_id, peer_device_id);
        {
            std::lock_guard guard(cache_lock_);
            active_sessions_.Erase(session_id);
        }
        {
            const auto session_lock = locks_.Acquire(session_id);
            std::lock_guard guard(*session_lock);
            DYNASTY_TRY(persistence_.Delete(session_id));
        }
        DYNASTY_LOG_INFO(kTag, "removed device {} of {}", peer_device_id, peer_user_id);
        audit_.Record(AuditEventType::DeviceRemoved, "Device session destroyed",
                      {{"user_id", peer_user_id}, {"device_id", peer_device_id}});
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    size_t DeviceDirectory::Tick(const TimePoint now) {
        std::lock_guard guard(cache_lock_);
        return active_sessions_.Tick(now);
    }

    void DeviceDirectory::OnIdentityReplaced() {
        const TimePoint now = clock_();
        std::lock_guard guard(cache_lock_);
        active_sessions_.Clear();
        identity_replaced_at_ = now;
    }

    size_t DeviceDirectory::CachedSessionCount() const {
        std::lock_guard guard(cache_lock_);
        return active_sessions_.Size();
    }
}
