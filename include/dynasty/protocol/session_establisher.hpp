#pragma once
#include "dynasty/configuration/engine_config.hpp"
#include "dynasty/core/clock.hpp"
#include "dynasty/core/result.hpp"
#include "dynasty/core/failures.hpp"
#include "dynasty/identity/identity_manager.hpp"
#include "dynasty/identity/key_rotation_scheduler.hpp"
#include "dynasty/interfaces/i_directory_service.hpp"
#include "dynasty/models/local_device.hpp"
#include "dynasty/protocol/session.hpp"
#include "dynasty/protocol/session_persistence.hpp"
#include "dynasty/security/audit_logger.hpp"
#include "dynasty/security/session_lock_registry.hpp"
#include "e2ee/device.pb.h"
#include "e2ee/envelope.pb.h"

#include <memory>
#include <stop_token>
#include <string>

namespace dynasty::e2ee::protocol {

/**
 * @brief X3DH session establishment
 *
 * Initiate() runs the initiator side against a peer's published bundle and
 * Accept() the responder side against the InitiatorHello carried by the
 * peer's first messages. Both derive the full ratchet state before any side
 * effect; a stop request observed before the commit point leaves no trace.
 * The commit reports a used one-time pre-key (to the directory when
 * initiating, to the local identity when accepting), persists the session
 * and emits a SessionCreated audit event. Commits run under the session lock.
 *
 * The hello names the responder identity key it was built against. When that
 * key has since been rotated out, Accept() derives with the retained private
 * half from `retained_keys`, and fails with AuthenticationFailed once the key
 * has been pruned.
 */
class SessionEstablisher {
public:
    SessionEstablisher(
        identity::IdentityManager& identity,
        std::shared_ptr<interfaces::IDirectoryService> directory,
        SessionPersistence& persistence,
        security::SessionLockRegistry& locks,
        security::AuditLogger& audit,
        models::LocalDevice local_device,
        ClockFn clock,
        const identity::KeyRotationScheduler* retained_keys = nullptr);

    [[nodiscard]] Result<SessionState, ProtocolFailure> Initiate(
        const std::string& session_id,
        const dynasty::proto::e2ee::DeviceRecord& peer_bundle,
        std::stop_token stop = {});

    /// Initiate() for a caller already holding the session lock.
    [[nodiscard]] Result<SessionState, ProtocolFailure> InitiateLocked(
        const std::string& session_id,
        const dynasty::proto::e2ee::DeviceRecord& peer_bundle,
        const std::stop_token& stop);

    [[nodiscard]] Result<SessionState, ProtocolFailure> Accept(
        const std::string& session_id,
        const dynasty::proto::e2ee::InitiatorHello& hello,
        std::stop_token stop = {});

    /// Responder state for `hello` with no side effect. Nothing is consumed or stored.
    [[nodiscard]] Result<SessionState, ProtocolFailure> DeriveAccepted(
        const std::string& session_id,
        const dynasty::proto::e2ee::InitiatorHello& hello,
        const std::stop_token& stop = {});

    /// Consumes the one-time pre-key named by `hello` and stores `session`.
    /// The caller holds the session lock.
    [[nodiscard]] Result<Unit, ProtocolFailure> CommitAccepted(
        const SessionState& session,
        const dynasty::proto::e2ee::InitiatorHello& hello);

    [[nodiscard]] static std::string MakeSessionId(const std::string& peer_user_id, const std::string& peer_device_id);

private:
    [[nodiscard]] Result<Unit, ProtocolFailure> CommitLocked(const SessionState& session);

    identity::IdentityManager& identity_;
    std::shared_ptr<interfaces::IDirectoryService> directory_;
    SessionPersistence& persistence_;
    security::SessionLockRegistry& locks_;
    security::AuditLogger& audit_;
    models::LocalDevice local_device_;
    ClockFn clock_;
    const identity::KeyRotationScheduler* retained_keys_;
};

}
