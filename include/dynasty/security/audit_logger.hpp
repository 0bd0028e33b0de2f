#pragma once
#include "dynasty/interfaces/i_audit_sink.hpp"

#include <memory>
#include <string>

namespace dynasty::e2ee::security {

/// Forwards security events to the audit sink. Sink failures, including
/// thrown exceptions, are logged locally and never reach the caller.
class AuditLogger {
public:
    explicit AuditLogger(std::shared_ptr<interfaces::IAuditSink> sink);

    void Record(
        interfaces::AuditEventType type,
        const std::string& description,
        const interfaces::AuditMetadata& metadata = {}) const noexcept;

private:
    std::shared_ptr<interfaces::IAuditSink> sink_;
};

}
