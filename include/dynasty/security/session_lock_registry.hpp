#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace dynasty::e2ee::security {

/**
 * @brief One mutex per session id
 *
 * Every ratchet mutation of a session runs under the lock returned for its
 * id, so encrypt and decrypt on the same session are serialized while
 * different sessions proceed in parallel. Locks are shared_ptr-owned so an
 * entry dropped by Tick() stays valid for holders that still use it.
 */
class SessionLockRegistry {
public:
    [[nodiscard]] std::shared_ptr<std::mutex> Acquire(const std::string& session_id);

    /// Drops entries that no caller currently holds. Returns the number removed.
    size_t Tick();

    [[nodiscard]] size_t Size() const;

private:
    mutable std::mutex registry_lock_;
    std::map<std::string, std::shared_ptr<std::mutex>> locks_;
};

}
