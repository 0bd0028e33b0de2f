#pragma once
#include "dynasty/configuration/engine_config.hpp"
#include "dynasty/core/clock.hpp"
#include "dynasty/core/failures.hpp"
#include "dynasty/core/result.hpp"
#include "dynasty/identity/identity_manager.hpp"
#include "dynasty/identity/key_material_store.hpp"
#include "dynasty/identity/key_rotation_scheduler.hpp"
#include "dynasty/interfaces/i_audit_sink.hpp"
#include "dynasty/interfaces/i_directory_service.hpp"
#include "dynasty/interfaces/i_message_sink.hpp"
#include "dynasty/interfaces/i_secure_key_storage.hpp"
#include "dynasty/models/local_device.hpp"
#include "dynasty/protocol/device_directory.hpp"
#include "dynasty/protocol/ratchet_engine.hpp"
#include "dynasty/protocol/session_establisher.hpp"
#include "dynasty/protocol/session_persistence.hpp"
#include "dynasty/security/audit_logger.hpp"
#include "dynasty/security/session_lock_registry.hpp"

#include <cstddef>
#include <memory>

namespace dynasty::e2ee::protocol {

/// Counters of one cleanup pass.
struct CleanupReport {
    size_t purged_skipped_keys = 0;
    size_t evicted_device_sessions = 0;
    size_t expired_sessions = 0;
    size_t released_session_locks = 0;
    identity::RotationState rotation_state = identity::RotationState::NoKey;
};

/**
 * @brief Context object owning every engine component
 *
 * Constructed once per local device. Components reference each other and
 * the external collaborators handed in here; none of them is reachable
 * through global state.
 *
 * **Usage Example**:
 * ```cpp
 * auto engine = E2eeEngine::Create(local, storage, directory, audit_sink, nullptr,
 *                                  EngineConfig::Default()).Unwrap();
 * engine->Initialize();
 * auto ciphertexts = engine->Devices().EncryptForAllDevices(payload, "bob");
 * ```
 */
class E2eeEngine {
public:
    /// InvalidInput when the configuration or the local device is invalid.
    [[nodiscard]] static Result<std::unique_ptr<E2eeEngine>, ProtocolFailure> Create(
        models::LocalDevice local_device,
        std::shared_ptr<interfaces::ISecureKeyStorage> storage,
        std::shared_ptr<interfaces::IDirectoryService> directory,
        std::shared_ptr<interfaces::IAuditSink> audit_sink,
        std::shared_ptr<interfaces::IMessageSink> message_sink,
        configuration::EngineConfig config,
        ClockFn clock = SystemClock());

    ~E2eeEngine();

    E2eeEngine(const E2eeEngine&) = delete;
    E2eeEngine& operator=(const E2eeEngine&) = delete;

    /**
     * @brief Loads the stored identity, generating one on first run, and
     *        brings the rotation scheduler up.
     *
     * A freshly generated identity is not published; RegisterDevice() does that.
     */
    [[nodiscard]] Result<identity::RotationStatus, ProtocolFailure> Initialize();

    /// Periodic cleanup. Expected every EngineConfig::cleanup_interval.
    [[nodiscard]] Result<CleanupReport, ProtocolFailure> Tick();
    [[nodiscard]] Result<CleanupReport, ProtocolFailure> Tick(TimePoint now);

    [[nodiscard]] identity::IdentityManager& Identity() noexcept { return *identity_; }
    [[nodiscard]] identity::KeyRotationScheduler& Rotation() noexcept { return *rotation_; }
    [[nodiscard]] SessionEstablisher& Establisher() noexcept { return *establisher_; }
    [[nodiscard]] RatchetEngine& Ratchet() noexcept { return *ratchet_; }
    [[nodiscard]] SessionPersistence& Persistence() noexcept { return *persistence_; }
    [[nodiscard]] DeviceDirectory& Devices() noexcept { return *devices_; }
    [[nodiscard]] const configuration::EngineConfig& Config() const noexcept { return config_; }
    [[nodiscard]] const models::LocalDevice& GetLocalDevice() const noexcept { return local_device_; }

private:
    E2eeEngine(
        models::LocalDevice local_device,
        std::shared_ptr<interfaces::ISecureKeyStorage> storage,
        std::shared_ptr<interfaces::IDirectoryService> directory,
        std::shared_ptr<interfaces::IAuditSink> audit_sink,
        std::shared_ptr<interfaces::IMessageSink> message_sink,
        configuration::EngineConfig config,
        ClockFn clock);

    models::LocalDevice local_device_;
    configuration::EngineConfig config_;
    ClockFn clock_;

    std::unique_ptr<security::AuditLogger> audit_;
    std::unique_ptr<security::SessionLockRegistry> locks_;
    std::unique_ptr<identity::KeyMaterialStore> store_;
    std::unique_ptr<identity::IdentityManager> identity_;
    std::unique_ptr<SessionPersistence> persistence_;
    std::unique_ptr<RatchetEngine> ratchet_;
    std::unique_ptr<identity::KeyRotationScheduler> rotation_;
    std::unique_ptr<SessionEstablisher> establisher_;
    std::unique_ptr<DeviceDirectory> devices_;
};

}
