#pragma once
#include "helpers/in_memory_fakes.hpp"
#include "dynasty/configuration/engine_config.hpp"
#include "dynasty/protocol/e2ee_engine.hpp"
#include "dynasty/protocol/session.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace dynasty::e2ee::test_helpers {

inline std::vector<uint8_t> Bytes(std::string_view text) {
    return {text.begin(), text.end()};
}

inline std::string Text(const std::vector<uint8_t>& bytes) {
    return {bytes.begin(), bytes.end()};
}

/// One local device: its own storage and audit sink, a shared directory and clock.
struct TestDevice {
    models::LocalDevice local;
    std::shared_ptr<InMemoryKeyStorage> storage;
    std::shared_ptr<RecordingAuditSink> audit;
    std::shared_ptr<RecordingMessageSink> sink;
    std::unique_ptr<protocol::E2eeEngine> engine;

    [[nodiscard]] protocol::E2eeEngine& operator*() const { return *engine; }
    [[nodiscard]] protocol::E2eeEngine* operator->() const { return engine.get(); }
};

inline TestDevice MakeDevice(
    const std::string& user_id,
    const std::string& device_id,
    const std::shared_ptr<InMemoryDirectory>& directory,
    const ManualClock& clock,
    configuration::EngineConfig config = configuration::EngineConfig::Default(),
    const bool register_device = true,
    std::shared_ptr<InMemoryKeyStorage> storage = nullptr) {
    TestDevice device;
    device.local = models::LocalDevice{user_id, device_id, device_id + "-name"};
    device.storage = storage ? std::move(storage) : std::make_shared<InMemoryKeyStorage>();
    device.audit = std::make_shared<RecordingAuditSink>();
    device.sink = std::make_shared<RecordingMessageSink>();

    // Small pools keep key generation cheap.
    config.identity.one_time_pre_key_count = 5;
    auto created = protocol::E2eeEngine::Create(
        device.local, device.storage, directory, device.audit, device.sink, config, clock.Fn());
    REQUIRE(created.IsOk());
    device.engine = std::move(created).Unwrap();
    REQUIRE(device.engine->Initialize().IsOk());
    if (register_device) {
        REQUIRE(device.engine->Devices().RegisterDevice(device.local.device_name).IsOk());
    }
    return device;
}

struct SessionPair {
    protocol::SessionState initiator;
    protocol::SessionState responder;
};

/// Runs X3DH between two registered devices without going through fan-out.
inline SessionPair EstablishPair(TestDevice& initiator, TestDevice& responder, InMemoryDirectory& directory) {
    const auto bundle = directory.Find(responder.local.user_id, responder.local.device_id);
    REQUIRE(bundle.has_value());
    auto initiated = initiator->Establisher().Initiate(
        protocol::SessionEstablisher::MakeSessionId(responder.local.user_id, responder.local.device_id), *bundle);
    REQUIRE(initiated.IsOk());
    auto initiator_state = std::move(initiated).Unwrap();
    REQUIRE(initiator_state.pending_hello.has_value());

    auto hello = *initiator_state.pending_hello;
    auto accepted = responder->Establisher().Accept(
        protocol::SessionEstablisher::MakeSessionId(initiator.local.user_id, initiator.local.device_id), hello);
    REQUIRE(accepted.IsOk());
    return SessionPair{std::move(initiator_state), std::move(accepted).Unwrap()};
}

}
