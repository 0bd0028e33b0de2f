#include "dynasty/security/session_lock_registry.hpp"

namespace dynasty::e2ee::security {

    std::shared_ptr<std::mutex> SessionLockRegistry::Acquire(const std::string& session_id) {
        std::lock_guard guard(registry_lock_);
        auto& slot = locks_[session_id];
        if (!slot) {
            slot = std::make_shared<std::mutex>();
        }
        return slot;
    }

    size_t SessionLockRegistry::Tick() {
        std::lock_guard guard(registry_lock_);
        size_t removed = 0;
        for (auto it = locks_.begin(); it != locks_.end();) {
            if (it->second.use_count() == 1) {
                it = locks_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    size_t SessionLockRegistry::Size() const {
        std::lock_guard guard(registry_lock_);
        return locks_.size();
    }
}
