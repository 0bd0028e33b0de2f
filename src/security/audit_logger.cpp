#include "dynasty/security/audit_logger.hpp"
#include "dynasty/core/logging.hpp"

#include <exception>

namespace dynasty::e2ee::security {
    namespace {
        constexpr std::string_view kTag = "audit";
    }

    AuditLogger::AuditLogger(std::shared_ptr<interfaces::IAuditSink> sink)
        : sink_(std::move(sink)) {}

    void AuditLogger::Record(
        const interfaces::AuditEventType type,
        const std::string& description,
        const interfaces::AuditMetadata& metadata) const noexcept {
        if (!sink_) {
            return;
        }
        try {
            auto result = sink_->LogEvent(type, description, metadata);
            if (result.IsErr()) {
                DYNASTY_LOG_WARN(kTag, "sink rejected {} event: {}",
                                 interfaces::ToString(type), result.UnwrapErr().Describe());
            }
        } catch (const std::exception& ex) {
            try {
                DYNASTY_LOG_WARN(kTag, "sink threw while recording {} event: {}",
                                 interfaces::ToString(type), ex.what());
            } catch (const std::exception&) {
                // Logging itself failed; the event is dropped.
            }
        }
    }
}
