#include "dynasty/protocol/e2ee_engine.hpp"
#include "dynasty/core/logging.hpp"
#include "dynasty/crypto/sodium_interop.hpp"

namespace dynasty::e2ee::protocol {
    using crypto::SodiumInterop;

    namespace {
        constexpr std::string_view kTag = "engine";
    }

    Result<std::unique_ptr<E2eeEngine>, ProtocolFailure> E2eeEngine::Create(
        models::LocalDevice local_device,
        std::shared_ptr<interfaces::ISecureKeyStorage> storage,
        std::shared_ptr<interfaces::IDirectoryService> directory,
        std::shared_ptr<interfaces::IAuditSink> audit_sink,
        std::shared_ptr<interfaces::IMessageSink> message_sink,
        configuration::EngineConfig config,
        ClockFn clock) {
        using CreateResult = Result<std::unique_ptr<E2eeEngine>, ProtocolFailure>;

        DYNASTY_TRY(config.Validate());
        if (local_device.user_id.empty() || local_device.device_id.empty()) {
            return CreateResult::Err(ProtocolFailure::InvalidInput("Local user and device ids are required"));
        }
        if (!storage || !directory) {
            return CreateResult::Err(ProtocolFailure::InvalidInput("Key storage and directory are required"));
        }
        if (!clock) {
            return CreateResult::Err(ProtocolFailure::InvalidInput("Clock is required"));
        }
        if (auto sodium = SodiumInterop::Initialize(); sodium.IsErr()) {
            return CreateResult::Err(ProtocolFailure::FromSodiumFailure(sodium.UnwrapErr()));
        }

        return CreateResult::Ok(std::unique_ptr<E2eeEngine>(new E2eeEngine(
            std::move(local_device), std::move(storage), std::move(directory),
            std::move(audit_sink), std::move(message_sink), std::move(config), std::move(clock))));
    }

    E2eeEngine::E2eeEngine(
        models::LocalDevice local_device,
        std::shared_ptr<interfaces::ISecureKeyStorage> storage,
        std::shared_ptr<interfaces::IDirectoryService> directory,
        std::shared_ptr<interfaces::IAuditSink> audit_sink,
        std::shared_ptr<interfaces::IMessageSink> message_sink,
        configuration::EngineConfig config,
        ClockFn clock)
        : local_device_(std::move(local_device))
        , config_(std::move(config))
        , clock_(std::move(clock)) {
        audit_ = std::make_unique<security::AuditLogger>(std::move(audit_sink));
        locks_ = std::make_unique<security::SessionLockRegistry>();
        store_ = std::make_unique<identity::KeyMaterialStore>(std::move(storage));
        identity_ = std::make_unique<identity::IdentityManager>(
            *store_, *audit_, config_.identity, clock_);
        persistence_ = std::make_unique<SessionPersistence>(
            *store_, *audit_, config_.ratchet, config_.session);
        ratchet_ = std::make_unique<RatchetEngine>(
            *persistence_, *locks_, *audit_, config_.ratchet, clock_);
        rotation_ = std::make_unique<identity::KeyRotationScheduler>(
            *identity_, *store_, directory, *audit_, config_.rotation, local_device_, clock_);
        establisher_ = std::make_unique<SessionEstablisher>(
            *identity_, directory, *persistence_, *locks_, *audit_, local_device_, clock_, rotation_.get());
        devices_ = std::make_unique<DeviceDirectory>(
            local_device_, *identity_, *establisher_, *ratchet_, *persistence_, *locks_,
            std::move(directory), std::move(message_sink), *audit_, config_.session, clock_);

        identity_->AddObserver(persistence_.get());
        identity_->AddObserver(devices_.get());
    }

    E2eeEngine::~E2eeEngine() {
        identity_->RemoveObserver(devices_.get());
        identity_->RemoveObserver(persistence_.get());
    }

    Result<identity::RotationStatus, ProtocolFailure> E2eeEngine::Initialize() {
        auto loaded = identity_->Load();
        if (loaded.IsErr()) {
            return Result<identity::RotationStatus, ProtocolFailure>::Err(std::move(loaded).UnwrapErr());
        }
        if (!loaded.Unwrap()) {
            DYNASTY_LOG_INFO(kTag, "no stored identity for device '{}', generating one", local_device_.device_id);
            DYNASTY_TRY(identity_->GenerateIdentity());
        }
        auto status = rotation_->Initialize();
        if (status.IsOk()) {
            DYNASTY_LOG_INFO(kTag, "engine ready for {}:{} (rotation {})",
                             local_device_.user_id, local_device_.device_id,
                             identity::ToString(status.Unwrap().state));
        }
        return status;
    }

    Result<CleanupReport, ProtocolFailure> E2eeEngine::Tick() {
        return Tick(clock_());
    }

    Result<CleanupReport, ProtocolFailure> E2eeEngine::Tick(const TimePoint now) {
        CleanupReport report;

        auto purged = ratchet_->Tick(now);
        if (purged.IsErr()) {
            return Result<CleanupReport, ProtocolFailure>::Err(std::move(purged).UnwrapErr());
        }
        report.purged_skipped_keys = purged.Unwrap();

        report.evicted_device_sessions = devices_->Tick(now);

        auto expired = persistence_->ExpireInactive(now);
        if (expired.IsErr()) {
            return Result<CleanupReport, ProtocolFailure>::Err(std::move(expired).UnwrapErr());
        }
        report.expired_sessions = expired.Unwrap();

        report.released_session_locks = locks_->Tick();

        auto rotation = rotation_->Tick(now);
        if (rotation.IsErr()) {
            return Result<CleanupReport, ProtocolFailure>::Err(std::move(rotation).UnwrapErr());
        }
        report.rotation_state = rotation.Unwrap();

        DYNASTY_LOG_DEBUG(kTag, "cleanup: {} skipped keys, {} device sessions, {} sessions expired, {} locks",
                          report.purged_skipped_keys, report.evicted_device_sessions,
                          report.expired_sessions, report.released_session_locks);
        return Result<CleanupReport, ProtocolFailure>::Ok(report);
    }
}
