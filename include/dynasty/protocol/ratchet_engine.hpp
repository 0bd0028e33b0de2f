#pragma once
#include "dynasty/configuration/engine_config.hpp"
#include "dynasty/core/clock.hpp"
#include "dynasty/core/result.hpp"
#include "dynasty/core/failures.hpp"
#include "dynasty/protocol/session.hpp"
#include "dynasty/protocol/session_persistence.hpp"
#include "dynasty/security/audit_logger.hpp"
#include "dynasty/security/session_lock_registry.hpp"
#include "e2ee/envelope.pb.h"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace dynasty::e2ee::protocol {

/**
 * @brief Double Ratchet message processing
 *
 * Encrypt() and Decrypt() operate on a SessionState the caller owns. They
 * either complete and leave the state advanced, or fail and leave it exactly
 * as it was. The *ForSession variants load the session by id under its
 * per-session lock, run the operation and persist the result before the
 * lock is released.
 *
 * Message protection:
 * - AES-256-GCM under per-message keys, AAD = associated data || header
 * - HMAC-SHA256 over header || ciphertext, verified in constant time first
 *
 * Decrypt order:
 * 1. A cached skipped key for (header.dh, header.n) is used and removed.
 * 2. A new header.dh triggers a DH ratchet step; keys of the old receiving
 *    chain up to header.pn are cached first.
 * 3. header.n beyond the receiving index + max_skip is rejected with
 *    TooManySkippedMessages before any key is derived.
 * 4. header.n below the receiving index without a cached key is rejected
 *    with DuplicateMessage.
 * 5. Keys for skipped indices are cached, the key for header.n is derived,
 *    the MAC and the AEAD tag are verified.
 *
 * Authentication failures are reported to the audit sink.
 */
class RatchetEngine {
public:
    RatchetEngine(
        SessionPersistence& persistence,
        security::SessionLockRegistry& locks,
        security::AuditLogger& audit,
        configuration::RatchetSettings settings,
        ClockFn clock);

    [[nodiscard]] Result<dynasty::proto::e2ee::EncryptedMessage, ProtocolFailure> Encrypt(
        SessionState& session,
        std::span<const uint8_t> plaintext) const;

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Decrypt(
        SessionState& session,
        const dynasty::proto::e2ee::EncryptedMessage& message) const;

    [[nodiscard]] Result<dynasty::proto::e2ee::EncryptedMessage, ProtocolFailure> EncryptForSession(
        const std::string& session_id,
        std::span<const uint8_t> plaintext);

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> DecryptForSession(
        const std::string& session_id,
        const dynasty::proto::e2ee::EncryptedMessage& message);

    /// DecryptForSession for a caller already holding the session lock.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> DecryptStored(
        const std::string& session_id,
        const dynasty::proto::e2ee::EncryptedMessage& message);

    [[nodiscard]] Result<SessionInfo, ProtocolFailure> GetSessionInfo(const std::string& session_id);

    /// Purges expired skipped keys of every stored session and persists the
    /// sessions that changed. Returns the number of keys removed.
    [[nodiscard]] Result<size_t, ProtocolFailure> Tick(TimePoint now);

    [[nodiscard]] static SessionInfo Describe(const SessionState& session);

private:
    [[nodiscard]] Result<Unit, ProtocolFailure> StepDhRatchet(
        SessionState& work,
        std::span<const uint8_t> remote_ratchet_key,
        uint32_t previous_chain_length,
        TimePoint now) const;

    [[nodiscard]] Result<Unit, ProtocolFailure> CacheSkippedKeys(
        SessionState& work,
        uint32_t until,
        TimePoint now) const;

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> OpenWithMessageKey(
        const SessionState& work,
        std::span<const uint8_t> message_key,
        std::span<const uint8_t> header_bytes,
        const dynasty::proto::e2ee::EncryptedMessage& message) const;

    [[nodiscard]] ProtocolFailure ReportAuthenticationFailure(
        const SessionState& session,
        ProtocolFailure failure) const;

    SessionPersistence& persistence_;
    security::SessionLockRegistry& locks_;
    security::AuditLogger& audit_;
    configuration::RatchetSettings settings_;
    ClockFn clock_;
};

}
