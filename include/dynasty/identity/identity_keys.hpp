#pragma once
#include "dynasty/core/clock.hpp"
#include "dynasty/core/result.hpp"
#include "dynasty/core/failures.hpp"
#include "dynasty/crypto/key_pair.hpp"
#include "dynasty/crypto/scoped_secret.hpp"
#include "dynasty/crypto/secure_memory_handle.hpp"
#include "e2ee/key_material.pb.h"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace dynasty::e2ee::identity {

struct OneTimePreKey {
    uint32_t id;
    crypto::SecureMemoryHandle private_key;
    std::vector<uint8_t> public_key;
};

/**
 * @brief Long-lived key material of the local device
 *
 * Holds the Ed25519 signing pair, the X25519 identity pair, the signed
 * pre-key and the pool of one-time pre-keys. Private halves live in
 * guarded allocations and are copied out only into ScopedSecret buffers
 * for the duration of a single agreement.
 *
 * Not synchronized; IdentityManager serializes access.
 */
class IdentityKeys {
public:
    [[nodiscard]] static Result<IdentityKeys, ProtocolFailure> Create(
        uint32_t one_time_key_count,
        TimePoint now);

    /// Builds fresh signing and pre-key material around an existing X25519 identity pair.
    [[nodiscard]] static Result<IdentityKeys, ProtocolFailure> CreateWithIdentity(
        const crypto::KeyPair& identity,
        uint32_t one_time_key_count,
        TimePoint now);

    [[nodiscard]] static Result<IdentityKeys, ProtocolFailure> FromRecord(
        const dynasty::proto::e2ee::IdentityRecord& record);

    [[nodiscard]] Result<dynasty::proto::e2ee::IdentityRecord, ProtocolFailure> ToRecord() const;

    [[nodiscard]] const std::vector<uint8_t>& IdentityPublic() const noexcept { return identity_x25519_public_; }
    [[nodiscard]] const std::vector<uint8_t>& SigningPublic() const noexcept { return identity_ed25519_public_; }
    [[nodiscard]] uint32_t SignedPreKeyId() const noexcept { return signed_pre_key_id_; }
    [[nodiscard]] const std::vector<uint8_t>& SignedPreKeyPublic() const noexcept { return signed_pre_key_public_; }
    [[nodiscard]] const std::vector<uint8_t>& SignedPreKeySignature() const noexcept { return signed_pre_key_signature_; }
    [[nodiscard]] TimePoint SignedPreKeyCreatedAt() const noexcept { return signed_pre_key_created_at_; }
    [[nodiscard]] uint32_t RegistrationId() const noexcept { return registration_id_; }
    [[nodiscard]] const std::vector<OneTimePreKey>& OneTimePreKeys() const noexcept { return one_time_pre_keys_; }

    [[nodiscard]] Result<crypto::KeyPair, ProtocolFailure> ExportIdentityKeyPair() const;

    /// Replaces the X25519 identity pair. Signing and pre-key material is kept.
    [[nodiscard]] Result<Unit, ProtocolFailure> ReplaceIdentityKeyPair(const crypto::KeyPair& identity);

    [[nodiscard]] Result<Unit, ProtocolFailure> AppendOneTimePreKeys(uint32_t count);

    [[nodiscard]] Result<Unit, ProtocolFailure> ConsumeOneTimePreKey(uint32_t one_time_pre_key_id);

    [[nodiscard]] const OneTimePreKey* FindOneTimePreKey(uint32_t one_time_pre_key_id) const;

    [[nodiscard]] static bool VerifyRemoteSpkSignature(
        std::span<const uint8_t> remote_identity_ed25519,
        std::span<const uint8_t> remote_spk_public,
        std::span<const uint8_t> remote_spk_signature);

    /**
     * @brief X3DH shared secret on the initiating side
     *
     * DH1 = IK_A x SPK_B, DH2 = EK_A x IK_B, DH3 = EK_A x SPK_B and, when a
     * one-time pre-key is offered, DH4 = EK_A x OPK_B.
     */
    [[nodiscard]] Result<crypto::ScopedSecret, ProtocolFailure> DeriveInitiatorSecret(
        std::span<const uint8_t> ephemeral_private,
        std::span<const uint8_t> remote_identity,
        std::span<const uint8_t> remote_signed_pre_key,
        std::optional<std::span<const uint8_t>> remote_one_time_pre_key) const;

    /// Mirror of DeriveInitiatorSecret using the local signed and one-time pre-keys.
    [[nodiscard]] Result<crypto::ScopedSecret, ProtocolFailure> DeriveResponderSecret(
        std::span<const uint8_t> remote_identity,
        std::span<const uint8_t> remote_ephemeral,
        std::optional<uint32_t> one_time_pre_key_id) const;

    [[nodiscard]] Result<crypto::ScopedSecret, ProtocolFailure> ReadIdentityPrivate() const;
    [[nodiscard]] Result<crypto::ScopedSecret, ProtocolFailure> ReadSignedPreKeyPrivate() const;

    IdentityKeys(IdentityKeys&&) noexcept = default;
    IdentityKeys& operator=(IdentityKeys&&) noexcept = default;
    IdentityKeys(const IdentityKeys&) = delete;
    IdentityKeys& operator=(const IdentityKeys&) = delete;
    ~IdentityKeys() = default;

private:
    IdentityKeys() = default;

    [[nodiscard]] Result<Unit, ProtocolFailure> GenerateSigningAndPreKeys(
        uint32_t one_time_key_count,
        TimePoint now);

    [[nodiscard]] static Result<crypto::ScopedSecret, ProtocolFailure> FinishX3dh(
        std::span<const crypto::ScopedSecret> dh_results);

    crypto::SecureMemoryHandle identity_ed25519_secret_key_handle_;
    std::vector<uint8_t> identity_ed25519_public_;
    crypto::SecureMemoryHandle identity_x25519_secret_key_handle_;
    std::vector<uint8_t> identity_x25519_public_;
    uint32_t signed_pre_key_id_ = 1;
    crypto::SecureMemoryHandle signed_pre_key_secret_key_handle_;
    std::vector<uint8_t> signed_pre_key_public_;
    std::vector<uint8_t> signed_pre_key_signature_;
    TimePoint signed_pre_key_created_at_{};
    std::vector<OneTimePreKey> one_time_pre_keys_;
    uint32_t next_one_time_pre_key_id_ = 0;
    uint32_t registration_id_ = 0;
    TimePoint created_at_{};
};

}
