#include "dynasty/configuration/engine_config.hpp"

namespace dynasty::e2ee::configuration {

Result<Unit, ProtocolFailure> EngineConfig::Validate() const {
    if (ratchet.max_skip == 0) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("ratchet.max_skip must be positive"));
    }
    if (ratchet.max_skipped_keys < ratchet.max_skip) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("ratchet.max_skipped_keys must be at least ratchet.max_skip"));
    }
    if (ratchet.skipped_key_lifetime <= Hours::zero()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("ratchet.skipped_key_lifetime must be positive"));
    }
    if (session.device_session_lifetime <= Hours::zero() ||
        session.session_retention < session.device_session_lifetime) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                "session.session_retention must be at least session.device_session_lifetime"));
    }
    if (session.max_cached_device_sessions == 0) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("session.max_cached_device_sessions must be positive"));
    }
    if (rotation.rotation_interval <= Hours::zero() ||
        rotation.warning_window >= rotation.rotation_interval) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                "rotation.warning_window must be shorter than rotation.rotation_interval"));
    }
    if (rotation.max_active_keys == 0) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("rotation.max_active_keys must be positive"));
    }
    if (rotation.retry_interval <= Hours::zero()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("rotation.retry_interval must be positive"));
    }
    if (identity.one_time_pre_key_count == 0) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("identity.one_time_pre_key_count must be positive"));
    }
    if (cleanup_interval <= Hours::zero()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("cleanup_interval must be positive"));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

}
