#pragma once
#include "dynasty/configuration/engine_config.hpp"
#include "dynasty/core/clock.hpp"
#include "dynasty/core/result.hpp"
#include "dynasty/core/failures.hpp"
#include "dynasty/identity/key_material_store.hpp"
#include "dynasty/interfaces/i_identity_observer.hpp"
#include "dynasty/protocol/session.hpp"
#include "dynasty/security/audit_logger.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dynasty::e2ee::protocol {

/**
 * @brief Durable store of ratchet sessions
 *
 * Every session is serialized to a SessionRecord (protobuf) whose state
 * bytes are authenticated with HMAC-SHA256 under a key derived from the
 * session's root key, and written through KeyMaterialStore. The list of
 * known session ids is kept in a separate index record.
 *
 * Loaded sessions are cached in memory. The cache is dropped when the
 * local identity is replaced; persisted records are not touched by that.
 *
 * Callers serialize access per session id (SessionLockRegistry); this
 * class only guards its own cache and index.
 */
class SessionPersistence final : public interfaces::IIdentityObserver {
public:
    SessionPersistence(
        identity::KeyMaterialStore& store,
        security::AuditLogger& audit,
        configuration::RatchetSettings ratchet_settings,
        configuration::SessionSettings session_settings);

    [[nodiscard]] Result<Unit, ProtocolFailure> Save(const SessionState& session);

    [[nodiscard]] Result<std::optional<SessionState>, ProtocolFailure> Load(const std::string& session_id);

    /// Removes the record, its index entry and any cached copy.
    [[nodiscard]] Result<Unit, ProtocolFailure> Delete(const std::string& session_id);

    [[nodiscard]] Result<std::vector<std::string>, ProtocolFailure> ListSessionIds();

    /// Deletes every session idle for longer than the retention window. Returns the count removed.
    [[nodiscard]] Result<size_t, ProtocolFailure> ExpireInactive(TimePoint now);

    void OnIdentityReplaced() override;

    [[nodiscard]] size_t CachedCount() const;

    [[nodiscard]] SessionState NewState() const;

    [[nodiscard]] Result<dynasty::proto::e2ee::SessionRecord, ProtocolFailure> Encode(
        const SessionState& session) const;
    [[nodiscard]] Result<SessionState, ProtocolFailure> Decode(
        const dynasty::proto::e2ee::SessionRecord& record) const;

private:
    [[nodiscard]] Result<Unit, ProtocolFailure> UpdateIndex(const std::string& session_id, bool present);
    [[nodiscard]] Result<std::vector<std::string>, ProtocolFailure> ReadIndexLocked();

    identity::KeyMaterialStore& store_;
    security::AuditLogger& audit_;
    configuration::RatchetSettings ratchet_settings_;
    configuration::SessionSettings session_settings_;

    mutable std::mutex cache_lock_;
    std::map<std::string, SessionState> cache_;
    std::mutex index_lock_;
};

}
