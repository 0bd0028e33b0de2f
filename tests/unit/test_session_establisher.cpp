#include <catch2/catch_test_macros.hpp>
#include "dynasty/protocol/session_establisher.hpp"
#include "dynasty/protocol/constants.hpp"
#include "helpers/test_devices.hpp"

#include <algorithm>
#include <stop_token>

using namespace dynasty::e2ee;
using namespace dynasty::e2ee::protocol;
using namespace dynasty::e2ee::test_helpers;

namespace {

struct EstablisherFixture {
    EstablisherFixture()
        : directory(std::make_shared<InMemoryDirectory>())
        , alice(MakeDevice("alice", "phone", directory, clock))
        , bob(MakeDevice("bob", "laptop", directory, clock)) {}

    [[nodiscard]] pb::DeviceRecord BobBundle() const {
        auto bundle = directory->Find("bob", "laptop");
        REQUIRE(bundle.has_value());
        return *bundle;
    }

    ManualClock clock;
    std::shared_ptr<InMemoryDirectory> directory;
    TestDevice alice;
    TestDevice bob;
    const std::string to_bob = SessionEstablisher::MakeSessionId("bob", "laptop");
    const std::string to_alice = SessionEstablisher::MakeSessionId("alice", "phone");
};

void RequireNothingCommitted(TestDevice& device) {
    REQUIRE(device->Persistence().ListSessionIds().Unwrap().empty());
    REQUIRE(device.audit->Count(AuditEventType::SessionCreated) == 0);
}

}

TEST_CASE("SessionEstablisher - session ids name the peer device", "[x3dh]") {
    REQUIRE(SessionEstablisher::MakeSessionId("bob", "laptop") == "bob:laptop");
}

TEST_CASE("SessionEstablisher - initiating against a published bundle", "[x3dh]") {
    EstablisherFixture fixture;
    const auto bundle = fixture.BobBundle();
    const uint32_t first_opk = bundle.one_time_pre_keys(0).id();

    auto initiated = fixture.alice->Establisher().Initiate(fixture.to_bob, bundle);
    REQUIRE(initiated.IsOk());
    const auto& session = initiated.Unwrap();

    REQUIRE(session.is_initiator);
    REQUIRE(session.peer_user_id == "bob");
    REQUIRE(session.peer_device_id == "laptop");
    REQUIRE(session.associated_data.size() == 2 * kX25519PublicKeyBytes);
    REQUIRE_FALSE(session.receiving_chain.has_value());

    REQUIRE(session.pending_hello.has_value());
    const auto& hello = *session.pending_hello;
    REQUIRE(hello.sender_user_id() == "alice");
    REQUIRE(hello.sender_device_id() == "phone");
    REQUIRE(hello.has_one_time_pre_key_id());
    REQUIRE(hello.one_time_pre_key_id() == first_opk);
    REQUIRE(hello.signed_pre_key_id() == bundle.signed_pre_key().id());

    const auto consumed = fixture.directory->ConsumedKeyIds();
    REQUIRE(std::find(consumed.begin(), consumed.end(), first_opk) != consumed.end());
    REQUIRE(fixture.directory->Find("bob", "laptop")->one_time_pre_keys_size() == bundle.one_time_pre_keys_size() - 1);

    REQUIRE(fixture.alice.audit->Count(AuditEventType::SessionCreated) == 1);
    REQUIRE(fixture.alice->Persistence().Load(fixture.to_bob).Unwrap().has_value());

    SECTION("accepting consumes the local one-time pre-key") {
        const size_t before = fixture.bob->Identity().AvailableOneTimePreKeys().Unwrap();
        auto accepted = fixture.bob->Establisher().Accept(fixture.to_alice, hello);
        REQUIRE(accepted.IsOk());
        REQUIRE(accepted.Unwrap().peer_user_id == "alice");
        REQUIRE(accepted.Unwrap().peer_device_id == "phone");
        REQUIRE(accepted.Unwrap().associated_data == session.associated_data);
        REQUIRE(fixture.bob->Identity().AvailableOneTimePreKeys().Unwrap() == before - 1);
        REQUIRE(fixture.bob.audit->Count(AuditEventType::SessionCreated) == 1);

        SECTION("a replayed hello finds its one-time pre-key gone") {
            auto replayed = fixture.bob->Establisher().Accept("alice:other", hello);
            REQUIRE(replayed.IsErr());
            REQUIRE(replayed.UnwrapErr().type == ProtocolFailureType::KeyExhausted);
        }
    }
}

TEST_CASE("SessionEstablisher - bundle without one-time pre-keys", "[x3dh]") {
    EstablisherFixture fixture;
    auto bundle = fixture.BobBundle();
    bundle.clear_one_time_pre_keys();

    auto initiated = fixture.alice->Establisher().Initiate(fixture.to_bob, bundle);
    REQUIRE(initiated.IsOk());
    const auto hello = *initiated.Unwrap().pending_hello;
    REQUIRE_FALSE(hello.has_one_time_pre_key_id());
    REQUIRE(fixture.directory->ConsumedKeyIds().empty());

    const size_t before = fixture.bob->Identity().AvailableOneTimePreKeys().Unwrap();
    REQUIRE(fixture.bob->Establisher().Accept(fixture.to_alice, hello).IsOk());
    REQUIRE(fixture.bob->Identity().AvailableOneTimePreKeys().Unwrap() == before);
}

TEST_CASE("SessionEstablisher - invalid bundles are refused", "[x3dh][security]") {
    EstablisherFixture fixture;
    auto bundle = fixture.BobBundle();

    SECTION("forged signed pre-key signature") {
        auto* signature = bundle.mutable_signed_pre_key()->mutable_signature();
        (*signature)[0] = static_cast<char>((*signature)[0] ^ 0x01);
    }
    SECTION("signed pre-key replaced") {
        bundle.mutable_signed_pre_key()->set_public_key(bundle.one_time_pre_keys(0).public_key());
    }
    SECTION("zero identity key") {
        bundle.set_identity_key(std::string(kX25519PublicKeyBytes, '\0'));
    }
    SECTION("missing device id") {
        bundle.clear_device_id();
    }
    SECTION("missing signed pre-key") {
        bundle.clear_signed_pre_key();
    }

    auto initiated = fixture.alice->Establisher().Initiate(fixture.to_bob, bundle);
    REQUIRE(initiated.IsErr());
    REQUIRE(initiated.UnwrapErr().type == ProtocolFailureType::PeerBundleInvalid);
    REQUIRE(initiated.UnwrapErr().IsIntegrityFailure());
    REQUIRE(fixture.directory->ConsumedKeyIds().empty());
    RequireNothingCommitted(fixture.alice);
}

TEST_CASE("SessionEstablisher - cancellation leaves no trace", "[x3dh][cancel]") {
    EstablisherFixture fixture;
    std::stop_source stop;
    stop.request_stop();

    SECTION("initiator") {
        auto initiated = fixture.alice->Establisher().Initiate(fixture.to_bob, fixture.BobBundle(), stop.get_token());
        REQUIRE(initiated.IsErr());
        REQUIRE(initiated.UnwrapErr().type == ProtocolFailureType::Cancelled);
        REQUIRE(fixture.directory->ConsumedKeyIds().empty());
        RequireNothingCommitted(fixture.alice);
    }

    SECTION("responder") {
        auto initiated = fixture.alice->Establisher().Initiate(fixture.to_bob, fixture.BobBundle());
        REQUIRE(initiated.IsOk());
        const size_t before = fixture.bob->Identity().AvailableOneTimePreKeys().Unwrap();

        auto accepted = fixture.bob->Establisher().Accept(
            fixture.to_alice, *initiated.Unwrap().pending_hello, stop.get_token());
        REQUIRE(accepted.IsErr());
        REQUIRE(accepted.UnwrapErr().type == ProtocolFailureType::Cancelled);
        REQUIRE(fixture.bob->Identity().AvailableOneTimePreKeys().Unwrap() == before);
        RequireNothingCommitted(fixture.bob);
    }
}

TEST_CASE("SessionEstablisher - hello with an invalid ratchet key", "[x3dh][security]") {
    EstablisherFixture fixture;
    auto initiated = fixture.alice->Establisher().Initiate(fixture.to_bob, fixture.BobBundle());
    auto hello = *initiated.Unwrap().pending_hello;
    hello.set_ratchet_key(std::string(kX25519PublicKeyBytes, '\0'));

    auto accepted = fixture.bob->Establisher().Accept(fixture.to_alice, hello);
    REQUIRE(accepted.IsErr());
    REQUIRE(accepted.UnwrapErr().type == ProtocolFailureType::PeerBundleInvalid);
    RequireNothingCommitted(fixture.bob);
}

TEST_CASE("SessionEstablisher - directory refusing the one-time pre-key aborts", "[x3dh]") {
    EstablisherFixture fixture;

    class RefusingDirectory final : public interfaces::IDirectoryService {
    public:
        Result<Unit, ProtocolFailure> PublishDeviceBundle(const pb::DeviceRecord&) override {
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }
        Result<std::vector<pb::DeviceRecord>, ProtocolFailure> FetchDeviceBundles(const std::string&) override {
            return Result<std::vector<pb::DeviceRecord>, ProtocolFailure>::Ok({});
        }
        Result<Unit, ProtocolFailure> ConsumeOneTimePreKey(const std::string&, const std::string&, uint32_t) override {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::DirectoryUnavailable("offline"));
        }
    };

    auto storage = std::make_shared<InMemoryKeyStorage>();
    auto audit = std::make_shared<RecordingAuditSink>();
    auto config = configuration::EngineConfig::Default();
    config.identity.one_time_pre_key_count = 2;
    auto engine = E2eeEngine::Create(
        models::LocalDevice{"carol", "tablet", "tablet"}, storage, std::make_shared<RefusingDirectory>(),
        audit, nullptr, config, fixture.clock.Fn());
    REQUIRE(engine.IsOk());
    REQUIRE(engine.Unwrap()->Initialize().IsOk());

    auto initiated = engine.Unwrap()->Establisher().Initiate(fixture.to_bob, fixture.BobBundle());
    REQUIRE(initiated.IsErr());
    REQUIRE(initiated.UnwrapErr().type == ProtocolFailureType::DirectoryUnavailable);
    REQUIRE(engine.Unwrap()->Persistence().ListSessionIds().Unwrap().empty());
}
