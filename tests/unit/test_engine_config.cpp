#include <catch2/catch_test_macros.hpp>
#include "dynasty/configuration/engine_config.hpp"

using namespace dynasty::e2ee;
using namespace dynasty::e2ee::configuration;

TEST_CASE("EngineConfig - presets validate", "[config]") {
    REQUIRE(EngineConfig::Default().Validate().IsOk());
    REQUIRE(EngineConfig::HighSecurity().Validate().IsOk());

    const auto defaults = EngineConfig::Default();
    REQUIRE(defaults.ratchet.max_skip == 1000);
    REQUIRE(defaults.rotation.rotation_interval == Hours(24 * 30));
    REQUIRE(defaults.rotation.max_active_keys == 3);

    const auto strict = EngineConfig::HighSecurity();
    REQUIRE(strict.ratchet.max_skip < defaults.ratchet.max_skip);
    REQUIRE(strict.rotation.rotation_interval < defaults.rotation.rotation_interval);
}

TEST_CASE("EngineConfig - rejects inconsistent values", "[config]") {
    auto config = EngineConfig::Default();

    SECTION("zero skip window") {
        config.ratchet.max_skip = 0;
    }
    SECTION("skipped key cap below the skip window") {
        config.ratchet.max_skipped_keys = config.ratchet.max_skip - 1;
    }
    SECTION("warning window as long as the rotation interval") {
        config.rotation.warning_window = config.rotation.rotation_interval;
    }
    SECTION("retention shorter than the device session lifetime") {
        config.session.session_retention = config.session.device_session_lifetime - Hours(1);
    }
    SECTION("no retained keys") {
        config.rotation.max_active_keys = 0;
    }
    SECTION("empty pre-key pool") {
        config.identity.one_time_pre_key_count = 0;
    }

    auto validated = config.Validate();
    REQUIRE(validated.IsErr());
    REQUIRE(validated.UnwrapErr().type == ProtocolFailureType::InvalidInput);
}
