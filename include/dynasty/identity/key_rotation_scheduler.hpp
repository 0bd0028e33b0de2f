#pragma once
#include "dynasty/configuration/engine_config.hpp"
#include "dynasty/core/clock.hpp"
#include "dynasty/core/result.hpp"
#include "dynasty/core/failures.hpp"
#include "dynasty/identity/identity_manager.hpp"
#include "dynasty/identity/key_material_store.hpp"
#include "dynasty/interfaces/i_directory_service.hpp"
#include "dynasty/models/local_device.hpp"
#include "dynasty/security/audit_logger.hpp"
#include "e2ee/envelope.pb.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace dynasty::e2ee::identity {

enum class RotationState {
    NoKey,
    Active,
    Warning,
    Expired,
    Rotating
};

[[nodiscard]] constexpr std::string_view ToString(const RotationState state) noexcept {
    switch (state) {
        case RotationState::NoKey: return "NoKey";
        case RotationState::Active: return "Active";
        case RotationState::Warning: return "Warning";
        case RotationState::Expired: return "Expired";
        case RotationState::Rotating: return "Rotating";
    }
    return "Unknown";
}

/// Public view of a retained rotating key. The private half stays in storage.
struct RotatingKey {
    std::string id;
    std::vector<uint8_t> public_key;
    TimePoint created_at{};
    TimePoint expires_at{};
    uint32_t version = 0;
    bool is_active = false;
};

struct RotationStatus {
    RotationState state = RotationState::NoKey;
    std::optional<std::string> active_key_id;
    uint32_t active_version = 0;
    std::optional<TimePoint> expires_at;
    size_t total_keys = 0;
    std::optional<TimePoint> last_rotated_at;
    std::optional<TimePoint> next_retry_at;
};

/**
 * @brief Time-boxed rotation of the X25519 identity key
 *
 * State machine: NoKey -> Active -> Warning -> Expired/Rotating -> Active.
 *
 * Rotate() stores the candidate key, publishes a bundle carrying it and
 * only then adopts the candidate as the identity key and retires the
 * previous key (kept, marked inactive). A failed publish deletes the
 * candidate, keeps the previous key active and schedules a retry for Tick().
 * A failure after the publish also restores the previous identity, key
 * records and index, and republishes the previous bundle. A cancellation
 * observed after KeyRotationStarted is audited as KeyRotationFailed with
 * reason "cancelled" and schedules no retry.
 *
 * Pruning, newest first: a key is kept when it is active, when fewer than
 * max_active_keys keys have been kept so far, or when it is younger than
 * twice the rotation interval.
 */
class KeyRotationScheduler {
public:
    KeyRotationScheduler(
        IdentityManager& identity,
        KeyMaterialStore& store,
        std::shared_ptr<interfaces::IDirectoryService> directory,
        security::AuditLogger& audit,
        configuration::RotationSettings settings,
        models::LocalDevice local_device,
        ClockFn clock);

    /// Loads retained keys; records the current identity key as version 1 when none exist.
    [[nodiscard]] Result<RotationStatus, ProtocolFailure> Initialize();

    [[nodiscard]] Result<RotatingKey, ProtocolFailure> Rotate(std::stop_token stop = {});

    /// nullopt when no retained key opens the message.
    [[nodiscard]] Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> DecryptWithAnyKey(
        const dynasty::proto::e2ee::SealedMessage& message);

    /// Private half of the retained key whose public half is `public_key`, if still kept.
    [[nodiscard]] Result<std::optional<crypto::KeyPair>, ProtocolFailure> FindRetainedKey(
        std::span<const uint8_t> public_key) const;

    /// Emits the warning event once per key and rotates an expired key
    /// when no retry delay is pending. Rotation failures are absorbed.
    [[nodiscard]] Result<RotationState, ProtocolFailure> Tick(TimePoint now);

    [[nodiscard]] RotationStatus GetStatus() const;
    [[nodiscard]] RotationState CurrentState() const;
    [[nodiscard]] std::vector<RotatingKey> RetainedKeys() const;

private:
    [[nodiscard]] RotationState StateAtLocked(TimePoint now) const;
    [[nodiscard]] Result<Unit, ProtocolFailure> SaveIndexLocked() const;
    [[nodiscard]] Result<Unit, ProtocolFailure> SaveIndex(
        const std::vector<RotatingKey>& keys,
        std::optional<TimePoint> last_rotated_at) const;
    [[nodiscard]] Result<Unit, ProtocolFailure> SetStoredActive(const std::string& key_id, bool active);
    [[nodiscard]] Result<Unit, ProtocolFailure> CommitRotation(
        const std::optional<RotatingKey>& previous,
        const RotatingKey& next,
        const crypto::KeyPair& candidate,
        TimePoint now);
    // Best effort; each step that fails is logged.
    void RevertRotation(
        const std::optional<RotatingKey>& previous,
        const crypto::KeyPair& previous_pair,
        const std::string& candidate_id);
    [[nodiscard]] Result<Unit, ProtocolFailure> PruneLocked(TimePoint now);
    [[nodiscard]] ProtocolFailure RecordFailure(std::string reason, TimePoint now);
    [[nodiscard]] Result<RotatingKey, ProtocolFailure> RotateLocked(const std::stop_token& stop);
    [[nodiscard]] static std::string NewKeyId(TimePoint now);

    IdentityManager& identity_;
    KeyMaterialStore& store_;
    std::shared_ptr<interfaces::IDirectoryService> directory_;
    security::AuditLogger& audit_;
    configuration::RotationSettings settings_;
    models::LocalDevice local_device_;
    ClockFn clock_;

    std::mutex rotation_lock_;
    mutable std::mutex state_lock_;
    // Oldest first.
    std::vector<RotatingKey> keys_;
    bool rotating_ = false;
    std::optional<TimePoint> last_rotated_at_;
    std::optional<TimePoint> next_retry_at_;
    uint32_t warned_version_ = 0;
};

}
