#pragma once
#include "dynasty/configuration/engine_config.hpp"
#include "dynasty/core/clock.hpp"
#include "dynasty/core/result.hpp"
#include "dynasty/core/failures.hpp"
#include "dynasty/crypto/key_pair.hpp"
#include "dynasty/crypto/scoped_secret.hpp"
#include "dynasty/identity/identity_keys.hpp"
#include "dynasty/identity/key_material_store.hpp"
#include "dynasty/interfaces/i_identity_observer.hpp"
#include "dynasty/models/local_device.hpp"
#include "dynasty/security/audit_logger.hpp"
#include "e2ee/device.pb.h"
#include "e2ee/envelope.pb.h"

#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace dynasty::e2ee::identity {

/// Public half of the local identity, as placed in handshake hellos.
struct LocalPublicKeys {
    std::vector<uint8_t> identity_key;
    std::vector<uint8_t> signing_key;
    uint32_t signed_pre_key_id = 0;
};

/**
 * @brief Owner of the local device identity
 *
 * Keeps the IdentityKeys of this device in memory and persists every change
 * through KeyMaterialStore before it becomes visible. The identity is never
 * generated implicitly: GetIdentity() reports absence and the caller decides
 * whether to GenerateIdentity() or RestoreIdentity().
 *
 * Replacing the identity (generate over an existing one, restore) notifies
 * every registered IIdentityObserver so cached sessions derived from the old
 * key are dropped. Adopting a rotated key does not notify.
 *
 * Thread-safe. Observers are invoked after the internal lock is released.
 */
class IdentityManager {
public:
    IdentityManager(
        KeyMaterialStore& store,
        security::AuditLogger& audit,
        configuration::IdentitySettings settings,
        ClockFn clock);

    /// Loads a previously stored identity into memory. Absence is not an error.
    [[nodiscard]] Result<bool, ProtocolFailure> Load();

    [[nodiscard]] Result<crypto::KeyPair, ProtocolFailure> GenerateIdentity();

    [[nodiscard]] Result<std::optional<crypto::KeyPair>, ProtocolFailure> GetIdentity();

    /// Overwrites the stored identity with a backed-up pair.
    [[nodiscard]] Result<Unit, ProtocolFailure> RestoreIdentity(const crypto::KeyPair& pair);

    [[nodiscard]] Result<crypto::KeyPair, ProtocolFailure> ExportIdentity();

    [[nodiscard]] Result<uint32_t, ProtocolFailure> GetRegistrationId();

    [[nodiscard]] Result<LocalPublicKeys, ProtocolFailure> GetPublicKeys();

    /**
     * @brief Public bundle for the directory
     *
     * @param identity_override Publishes this X25519 key instead of the
     *        current one; used while a rotation candidate is not yet adopted.
     */
    [[nodiscard]] Result<dynasty::proto::e2ee::DeviceRecord, ProtocolFailure> CreateDeviceRecord(
        const models::LocalDevice& device,
        std::optional<std::span<const uint8_t>> identity_override = std::nullopt);

    [[nodiscard]] Result<Unit, ProtocolFailure> ReplenishOneTimePreKeys(uint32_t count);

    [[nodiscard]] Result<size_t, ProtocolFailure> AvailableOneTimePreKeys();

    /// Seals a payload to an X25519 identity key.
    [[nodiscard]] static Result<dynasty::proto::e2ee::SealedMessage, ProtocolFailure> Seal(
        std::span<const uint8_t> recipient_identity_key,
        std::span<const uint8_t> plaintext);

    /// Opens a payload sealed to the current identity key.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> OpenSealed(
        const dynasty::proto::e2ee::SealedMessage& message);

    /**
     * @brief Opens a sealed payload with a retained key
     *
     * Under the exclusive lock the active identity pair is swapped for
     * `candidate`, the payload is opened, and the original pair is put back
     * before the lock is released. Returns nullopt when the payload does
     * not open under `candidate`.
     */
    [[nodiscard]] Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> OpenSealedWithKey(
        const crypto::KeyPair& candidate,
        const dynasty::proto::e2ee::SealedMessage& message);

    /// Makes a freshly rotated pair the identity key without notifying observers.
    [[nodiscard]] Result<Unit, ProtocolFailure> AdoptRotatedKey(const crypto::KeyPair& pair);

    [[nodiscard]] Result<crypto::ScopedSecret, ProtocolFailure> DeriveInitiatorSecret(
        std::span<const uint8_t> ephemeral_private,
        std::span<const uint8_t> remote_identity,
        std::span<const uint8_t> remote_signed_pre_key,
        std::optional<std::span<const uint8_t>> remote_one_time_pre_key);

    /**
     * @brief Responder half of X3DH
     *
     * @param retained_identity Derives with this retired identity pair
     *        instead of the current one; the current pair is swapped back
     *        before the lock is released.
     */
    [[nodiscard]] Result<crypto::ScopedSecret, ProtocolFailure> DeriveResponderSecret(
        std::span<const uint8_t> remote_identity,
        std::span<const uint8_t> remote_ephemeral,
        uint32_t signed_pre_key_id,
        std::optional<uint32_t> one_time_pre_key_id,
        const crypto::KeyPair* retained_identity = nullptr);

    /// Removes a local one-time pre-key after a handshake used it.
    [[nodiscard]] Result<Unit, ProtocolFailure> ConsumeOneTimePreKey(uint32_t one_time_pre_key_id);

    [[nodiscard]] Result<crypto::ScopedSecret, ProtocolFailure> ReadSignedPreKeyPrivate();

    /// The observer must outlive this manager or be removed first.
    void AddObserver(interfaces::IIdentityObserver* observer);
    void RemoveObserver(interfaces::IIdentityObserver* observer);

private:
    [[nodiscard]] Result<Unit, ProtocolFailure> EnsureLoadedLocked();
    [[nodiscard]] Result<Unit, ProtocolFailure> PersistLocked(const IdentityKeys& keys);
    void NotifyIdentityReplaced();

    KeyMaterialStore& store_;
    security::AuditLogger& audit_;
    configuration::IdentitySettings settings_;
    ClockFn clock_;

    std::mutex lock_;
    std::optional<IdentityKeys> keys_;
    bool load_attempted_ = false;

    std::mutex observers_lock_;
    std::vector<interfaces::IIdentityObserver*> observers_;
};

}
