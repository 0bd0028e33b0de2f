#pragma once
#include "dynasty/configuration/engine_config.hpp"
#include "dynasty/core/bounded_ttl_cache.hpp"
#include "dynasty/core/clock.hpp"
#include "dynasty/core/result.hpp"
#include "dynasty/core/failures.hpp"
#include "dynasty/identity/identity_manager.hpp"
#include "dynasty/interfaces/i_directory_service.hpp"
#include "dynasty/interfaces/i_identity_observer.hpp"
#include "dynasty/interfaces/i_message_sink.hpp"
#include "dynasty/models/local_device.hpp"
#include "dynasty/protocol/ratchet_engine.hpp"
#include "dynasty/protocol/session_establisher.hpp"
#include "dynasty/protocol/session_persistence.hpp"
#include "dynasty/security/audit_logger.hpp"
#include "dynasty/security/session_lock_registry.hpp"
#include "e2ee/device.pb.h"
#include "e2ee/envelope.pb.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

namespace dynasty::e2ee::protocol {

using DeviceCiphertexts = std::map<std::string, dynasty::proto::e2ee::EncryptedMessage>;

/**
 * @brief Multi-device fan-out over per-device ratchet sessions
 *
 * A session with a peer device is reused while it has been active within
 * the device session lifetime; after that the next send re-establishes it
 * from a freshly fetched bundle. The reuse cache is cleared when the local
 * identity is replaced.
 *
 * Fan-out never aborts on a single device: a device that cannot be reached
 * is logged and left out of the result.
 */
class DeviceDirectory final : public interfaces::IIdentityObserver {
public:
    DeviceDirectory(
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
        ClockFn clock);

    /// Publishes the bundle of this device under the given name.
    [[nodiscard]] Result<dynasty::proto::e2ee::DeviceRecord, ProtocolFailure> RegisterDevice(
        const std::string& device_name);

    [[nodiscard]] Result<DeviceCiphertexts, ProtocolFailure> EncryptForAllDevices(
        std::span<const uint8_t> plaintext,
        const std::string& peer_user_id,
        std::stop_token stop = {});

    /// Encrypts for every device and hands each ciphertext to the message
    /// sink. Returns the ids of the devices the sink accepted.
    [[nodiscard]] Result<std::vector<std::string>, ProtocolFailure> SendToAllDevices(
        std::span<const uint8_t> plaintext,
        const std::string& peer_user_id,
        std::stop_token stop = {});

    /**
     * @brief Decrypts a message from one peer device
     *
     * A hello on the message is accepted when no session exists or when it
     * carries a different handshake than the current session; a repeated
     * hello for the current session is ignored. When both sides initiated
     * concurrently, the handshake with the smaller ephemeral key wins and
     * messages of the losing handshake are rejected with InvalidState.
     * A session derived from a hello is stored only if the message carrying
     * the hello decrypts under it; otherwise nothing changes. The whole call
     * runs under the session lock.
     */
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> DecryptFromDevice(
        const std::string& peer_user_id,
        const std::string& peer_device_id,
        const dynasty::proto::e2ee::EncryptedMessage& message);

    /// Destroys the session with a peer device and wipes its key material.
    [[nodiscard]] Result<Unit, ProtocolFailure> RemoveDevice(
        const std::string& peer_user_id,
        const std::string& peer_device_id);

    /// Drops reuse entries idle past the device session lifetime.
    size_t Tick(TimePoint now);

    void OnIdentityReplaced() override;

    [[nodiscard]] size_t CachedSessionCount() const;

private:
    [[nodiscard]] Result<std::string, ProtocolFailure> EnsureSession(
        const dynasty::proto::e2ee::DeviceRecord& record,
        const std::stop_token& stop);

    enum class HelloDisposition {
        Accept,
        Ignore,
        Reject
    };

    [[nodiscard]] Result<HelloDisposition, ProtocolFailure> ClassifyHello(
        const std::string& session_id,
        const dynasty::proto::e2ee::InitiatorHello& hello);

    models::LocalDevice local_device_;
    identity::IdentityManager& identity_;
    SessionEstablisher& establisher_;
    RatchetEngine& ratchet_;
    SessionPersistence& persistence_;
    security::SessionLockRegistry& locks_;
    std::shared_ptr<interfaces::IDirectoryService> directory_;
    std::shared_ptr<interfaces::IMessageSink> message_sink_;
    security::AuditLogger& audit_;
    configuration::SessionSettings settings_;
    ClockFn clock_;

    mutable std::mutex cache_lock_;
    // session id -> time of last use
    BoundedTtlCache<std::string, TimePoint> active_sessions_;
    // Stored sessions created at or before this point are not reused.
    std::optional<TimePoint> identity_replaced_at_;
};

}
