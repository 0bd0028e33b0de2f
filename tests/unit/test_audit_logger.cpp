#include <catch2/catch_test_macros.hpp>
#include "dynasty/security/audit_logger.hpp"
#include "helpers/in_memory_fakes.hpp"

using namespace dynasty::e2ee;
using namespace dynasty::e2ee::security;
using namespace dynasty::e2ee::test_helpers;

TEST_CASE("AuditLogger - forwards events with metadata", "[audit]") {
    auto sink = std::make_shared<RecordingAuditSink>();
    const AuditLogger logger(sink);

    logger.Record(AuditEventType::SessionCreated, "session opened",
                  {{"session_id", "bob:laptop"}, {"role", "initiator"}});

    const auto events = sink->Events();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].type == AuditEventType::SessionCreated);
    REQUIRE(events[0].description == "session opened");
    REQUIRE(events[0].metadata.at("session_id") == "bob:laptop");
    REQUIRE(events[0].metadata.at("role") == "initiator");
}

TEST_CASE("AuditLogger - sink failures never reach the caller", "[audit]") {
    auto sink = std::make_shared<RecordingAuditSink>();
    const AuditLogger logger(sink);

    SECTION("rejected event") {
        sink->fail_log = true;
        REQUIRE_NOTHROW(logger.Record(AuditEventType::AuthenticationFailed, "bad mac"));
        REQUIRE(sink->Events().empty());
    }

    SECTION("throwing sink") {
        sink->throw_on_log = true;
        REQUIRE_NOTHROW(logger.Record(AuditEventType::KeyRotationFailed, "publish failed"));
        REQUIRE(sink->Events().empty());
    }

    SECTION("sink recovers") {
        sink->fail_log = true;
        logger.Record(AuditEventType::DeviceRemoved, "dropped");
        sink->fail_log = false;
        logger.Record(AuditEventType::DeviceRemoved, "kept");
        REQUIRE(sink->Count(AuditEventType::DeviceRemoved) == 1);
    }
}

TEST_CASE("AuditLogger - without a sink events are dropped", "[audit]") {
    const AuditLogger logger(nullptr);
    REQUIRE_NOTHROW(logger.Record(AuditEventType::IdentityRestored, "restored"));
}

TEST_CASE("AuditEventType - stable names", "[audit]") {
    REQUIRE(ToString(AuditEventType::SessionCreated) == "session_created");
    REQUIRE(ToString(AuditEventType::KeyRotationWarning) == "key_rotation_warning");
    REQUIRE(ToString(AuditEventType::DeviceRegistered) == "device_registered");
}
