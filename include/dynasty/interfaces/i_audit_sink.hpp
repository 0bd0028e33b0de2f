#pragma once
#include "dynasty/core/result.hpp"
#include "dynasty/core/failures.hpp"

#include <map>
#include <string>
#include <string_view>

namespace dynasty::e2ee::interfaces {

enum class AuditEventType {
    SessionCreated,
    SessionDeleted,
    KeyRotationStarted,
    KeyRotationCompleted,
    KeyRotationFailed,
    KeyRotationWarning,
    AuthenticationFailed,
    IdentityRestored,
    DeviceRegistered,
    DeviceRemoved
};

[[nodiscard]] constexpr std::string_view ToString(const AuditEventType type) noexcept {
    switch (type) {
        case AuditEventType::SessionCreated: return "session_created";
        case AuditEventType::SessionDeleted: return "session_deleted";
        case AuditEventType::KeyRotationStarted: return "key_rotation_started";
        case AuditEventType::KeyRotationCompleted: return "key_rotation_completed";
        case AuditEventType::KeyRotationFailed: return "key_rotation_failed";
        case AuditEventType::KeyRotationWarning: return "key_rotation_warning";
        case AuditEventType::AuthenticationFailed: return "authentication_failed";
        case AuditEventType::IdentityRestored: return "identity_restored";
        case AuditEventType::DeviceRegistered: return "device_registered";
        case AuditEventType::DeviceRemoved: return "device_removed";
    }
    return "unknown";
}

using AuditMetadata = std::map<std::string, std::string>;

class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> LogEvent(
        AuditEventType type,
        const std::string& description,
        const AuditMetadata& metadata) = 0;
};

}
