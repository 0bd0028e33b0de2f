#pragma once

#include "dynasty/core/result.hpp"
#include "dynasty/core/failures.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace dynasty::e2ee::configuration {

using Hours = std::chrono::hours;

/**
 * @brief Limits of the Double Ratchet skipped-key machinery
 *
 * **max_skip**: how far ahead of the receiving chain a single header may
 * point. A header beyond `received + max_skip` is rejected with
 * TooManySkippedMessages before any key is derived.
 *
 * **max_skipped_keys**: hard cap on cached skipped message keys per
 * session. Past the cap the oldest keys are evicted first.
 *
 * **skipped_key_lifetime**: age after which a cached skipped key is purged.
 */
struct RatchetSettings {
    uint32_t max_skip = 1000;
    size_t max_skipped_keys = 2000;
    Hours skipped_key_lifetime = Hours(24 * 7);
};

/**
 * @brief Session cache and retention windows
 *
 * **device_session_lifetime**: inactivity after which a device session is
 * no longer reused for fan-out and a new handshake is performed.
 *
 * **session_retention**: inactivity after which a persisted session is
 * destroyed by the cleanup pass and its key material wiped.
 */
struct SessionSettings {
    Hours device_session_lifetime = Hours(24 * 7);
    Hours session_retention = Hours(24 * 30);
    size_t max_cached_device_sessions = 1024;
};

/**
 * @brief Rotating key lifecycle
 *
 * A key enters the Warning state `warning_window` before it expires at
 * `created_at + rotation_interval`. Keys older than
 * `max(max_active_keys rotations, 2 * rotation_interval)` are pruned.
 * After a failed rotation the next attempt waits `retry_interval`.
 */
struct RotationSettings {
    Hours rotation_interval = Hours(24 * 30);
    uint32_t max_active_keys = 3;
    Hours warning_window = Hours(24 * 7);
    Hours retry_interval = Hours(1);
};

struct IdentitySettings {
    uint32_t one_time_pre_key_count = 100;
};

/**
 * @brief Root configuration handed to every engine component
 *
 * **Usage Example**:
 * ```cpp
 * auto config = EngineConfig::Default();
 * config.ratchet.max_skip = 500;
 * if (auto valid = config.Validate(); valid.IsErr()) { ... }
 * ```
 */
class EngineConfig {
public:
    RatchetSettings ratchet;
    SessionSettings session;
    RotationSettings rotation;
    IdentitySettings identity;
    Hours cleanup_interval = Hours(1);

    [[nodiscard]] static EngineConfig Default() noexcept {
        return EngineConfig{};
    }

    /**
     * @brief Tighter bounds for high-value deployments
     *
     * Smaller skip window and cache, shorter reuse and retention windows
     * and weekly rotation.
     */
    [[nodiscard]] static EngineConfig HighSecurity() noexcept {
        EngineConfig config;
        config.ratchet.max_skip = 100;
        config.ratchet.max_skipped_keys = 500;
        config.ratchet.skipped_key_lifetime = Hours(24);
        config.session.device_session_lifetime = Hours(24);
        config.session.session_retention = Hours(24 * 7);
        config.rotation.rotation_interval = Hours(24 * 7);
        config.rotation.warning_window = Hours(24);
        return config;
    }

    /// InvalidInput for zero limits or a warning window not shorter than the rotation interval.
    [[nodiscard]] Result<Unit, ProtocolFailure> Validate() const;
};

}
