#include <catch2/catch_test_macros.hpp>
#include "dynasty/protocol/device_directory.hpp"
#include "dynasty/crypto/sodium_interop.hpp"
#include "helpers/test_devices.hpp"

#include <stop_token>

using namespace dynasty::e2ee;
using namespace dynasty::e2ee::protocol;
using namespace dynasty::e2ee::test_helpers;
using dynasty::e2ee::crypto::SodiumInterop;

namespace {

struct DirectoryFixture {
    DirectoryFixture()
        : directory(std::make_shared<InMemoryDirectory>())
        , alice(MakeDevice("alice", "phone", directory, clock))
        , bob_laptop(MakeDevice("bob", "laptop", directory, clock))
        , bob_tablet(MakeDevice("bob", "tablet", directory, clock)) {}

    ManualClock clock;
    std::shared_ptr<InMemoryDirectory> directory;
    TestDevice alice;
    TestDevice bob_laptop;
    TestDevice bob_tablet;
};

}

TEST_CASE("DeviceDirectory - registration publishes the bundle", "[devices]") {
    DirectoryFixture fixture;
    auto published = fixture.directory->Find("bob", "laptop");
    REQUIRE(published.has_value());
    REQUIRE(published->device_name() == "laptop-name");
    REQUIRE(published->one_time_pre_keys_size() == 5);
    REQUIRE(fixture.bob_laptop.audit->Count(AuditEventType::DeviceRegistered) == 1);

    SECTION("renaming republishes") {
        auto renamed = fixture.bob_laptop->Devices().RegisterDevice("work laptop");
        REQUIRE(renamed.IsOk());
        REQUIRE(fixture.directory->Find("bob", "laptop")->device_name() == "work laptop");
    }

    SECTION("publish failure is reported") {
        fixture.directory->fail_publish = true;
        auto failed = fixture.bob_laptop->Devices().RegisterDevice("");
        REQUIRE(failed.IsErr());
        REQUIRE(failed.UnwrapErr().type == ProtocolFailureType::DirectoryUnavailable);
        REQUIRE(fixture.bob_laptop.audit->Count(AuditEventType::DeviceRegistered) == 1);
    }
}

TEST_CASE("DeviceDirectory - fan-out reaches every peer device", "[devices][fanout]") {
    DirectoryFixture fixture;
    auto ciphertexts = fixture.alice->Devices().EncryptForAllDevices(Bytes("to all of bob"), "bob");
    REQUIRE(ciphertexts.IsOk());
    REQUIRE(ciphertexts.Unwrap().size() == 2);
    REQUIRE(ciphertexts.Unwrap().contains("laptop"));
    REQUIRE(ciphertexts.Unwrap().contains("tablet"));
    REQUIRE(fixture.directory->ConsumedKeyIds().size() == 2);
    REQUIRE(fixture.alice->Devices().CachedSessionCount() == 2);

    auto on_laptop = fixture.bob_laptop->Devices().DecryptFromDevice(
        "alice", "phone", ciphertexts.Unwrap().at("laptop"));
    REQUIRE(on_laptop.IsOk());
    REQUIRE(Text(on_laptop.Unwrap()) == "to all of bob");
    auto on_tablet = fixture.bob_tablet->Devices().DecryptFromDevice(
        "alice", "phone", ciphertexts.Unwrap().at("tablet"));
    REQUIRE(Text(on_tablet.Unwrap()) == "to all of bob");

    SECTION("ciphertexts for one device do not open on another") {
        auto crossed = fixture.bob_tablet->Devices().DecryptFromDevice(
            "alice", "phone", ciphertexts.Unwrap().at("laptop"));
        REQUIRE(crossed.IsErr());
    }

    SECTION("live sessions are reused") {
        auto again = fixture.alice->Devices().EncryptForAllDevices(Bytes("second"), "bob");
        REQUIRE(again.Unwrap().size() == 2);
        REQUIRE(fixture.directory->ConsumedKeyIds().size() == 2);
        REQUIRE(again.Unwrap().at("laptop").header().n() == 1);
        REQUIRE(Text(fixture.bob_laptop->Devices().DecryptFromDevice(
            "alice", "phone", again.Unwrap().at("laptop")).Unwrap()) == "second");
    }

    SECTION("idle sessions are re-established") {
        fixture.clock.Advance(fixture.alice->Config().session.device_session_lifetime + std::chrono::hours(1));
        REQUIRE(fixture.alice->Devices().Tick(fixture.clock.Now()) == 2);
        REQUIRE(fixture.alice->Devices().CachedSessionCount() == 0);

        auto later = fixture.alice->Devices().EncryptForAllDevices(Bytes("after a week"), "bob");
        REQUIRE(later.Unwrap().size() == 2);
        REQUIRE(fixture.directory->ConsumedKeyIds().size() == 4);
        REQUIRE(Text(fixture.bob_laptop->Devices().DecryptFromDevice(
            "alice", "phone", later.Unwrap().at("laptop")).Unwrap()) == "after a week");
    }
}

TEST_CASE("DeviceDirectory - own device is left out", "[devices][fanout]") {
    DirectoryFixture fixture;
    auto alice_tablet = MakeDevice("alice", "tablet", fixture.directory, fixture.clock);
    auto bob_phone = MakeDevice("bob", "phone", fixture.directory, fixture.clock);

    auto own = fixture.alice->Devices().EncryptForAllDevices(Bytes("sync"), "alice");
    REQUIRE(own.IsOk());
    REQUIRE(own.Unwrap().size() == 1);
    REQUIRE(own.Unwrap().contains("tablet"));

    auto peer = fixture.alice->Devices().EncryptForAllDevices(Bytes("hi"), "bob");
    REQUIRE(peer.Unwrap().size() == 3);
    REQUIRE(peer.Unwrap().contains("phone"));
}

TEST_CASE("DeviceDirectory - one broken bundle does not stop the fan-out", "[devices][fanout]") {
    DirectoryFixture fixture;
    auto broken = *fixture.directory->Find("bob", "tablet");
    auto* signature = broken.mutable_signed_pre_key()->mutable_signature();
    (*signature)[0] = static_cast<char>((*signature)[0] ^ 0x01);
    fixture.directory->Put(broken);

    auto ciphertexts = fixture.alice->Devices().EncryptForAllDevices(Bytes("partial"), "bob");
    REQUIRE(ciphertexts.IsOk());
    REQUIRE(ciphertexts.Unwrap().size() == 1);
    REQUIRE(ciphertexts.Unwrap().contains("laptop"));
}

TEST_CASE("DeviceDirectory - directory outages fail the whole fan-out", "[devices][fanout]") {
    DirectoryFixture fixture;

    SECTION("reported") {
        fixture.directory->fail_fetch = true;
    }
    SECTION("thrown") {
        fixture.directory->throw_on_fetch = true;
    }

    auto ciphertexts = fixture.alice->Devices().EncryptForAllDevices(Bytes("lost"), "bob");
    REQUIRE(ciphertexts.IsErr());
    REQUIRE(ciphertexts.UnwrapErr().type == ProtocolFailureType::DirectoryUnavailable);
    REQUIRE(ciphertexts.UnwrapErr().IsTransient());
}

TEST_CASE("DeviceDirectory - unknown user has no devices", "[devices][fanout]") {
    DirectoryFixture fixture;
    auto ciphertexts = fixture.alice->Devices().EncryptForAllDevices(Bytes("anyone?"), "carol");
    REQUIRE(ciphertexts.IsOk());
    REQUIRE(ciphertexts.Unwrap().empty());
}

TEST_CASE("DeviceDirectory - cancelled fan-out", "[devices][cancel]") {
    DirectoryFixture fixture;
    std::stop_source stop;
    stop.request_stop();

    auto ciphertexts = fixture.alice->Devices().EncryptForAllDevices(Bytes("never"), "bob", stop.get_token());
    REQUIRE(ciphertexts.IsErr());
    REQUIRE(ciphertexts.UnwrapErr().type == ProtocolFailureType::Cancelled);
    REQUIRE(fixture.directory->ConsumedKeyIds().empty());
}

TEST_CASE("DeviceDirectory - delivery through the message sink", "[devices][send]") {
    DirectoryFixture fixture;
    fixture.alice.sink->reject_device_id = "tablet";

    auto delivered = fixture.alice->Devices().SendToAllDevices(Bytes("mail"), "bob");
    REQUIRE(delivered.IsOk());
    REQUIRE(delivered.Unwrap() == std::vector<std::string>{"laptop"});

    const auto messages = fixture.alice.sink->Delivered();
    REQUIRE(messages.size() == 1);
    REQUIRE(messages.front().user_id == "bob");
    REQUIRE(messages.front().device_id == "laptop");
    REQUIRE(Text(fixture.bob_laptop->Devices().DecryptFromDevice(
        "alice", "phone", messages.front().message).Unwrap()) == "mail");

    SECTION("no sink configured") {
        auto storage = std::make_shared<InMemoryKeyStorage>();
        auto config = configuration::EngineConfig::Default();
        config.identity.one_time_pre_key_count = 2;
        auto engine = E2eeEngine::Create(models::LocalDevice{"carol", "desk", "desk"}, storage, fixture.directory,
                                         std::make_shared<RecordingAuditSink>(), nullptr, config, fixture.clock.Fn());
        REQUIRE(engine.IsOk());
        REQUIRE(engine.Unwrap()->Initialize().IsOk());
        auto sent = engine.Unwrap()->Devices().SendToAllDevices(Bytes("mail"), "bob");
        REQUIRE(sent.IsErr());
        REQUIRE(sent.UnwrapErr().type == ProtocolFailureType::InvalidState);
    }
}

TEST_CASE("DeviceDirectory - repeated hello and reply", "[devices][hello]") {
    DirectoryFixture fixture;
    auto first = fixture.alice->Devices().EncryptForAllDevices(Bytes("one"), "bob").Unwrap().at("laptop");
    auto second = fixture.alice->Devices().EncryptForAllDevices(Bytes("two"), "bob").Unwrap().at("laptop");
    REQUIRE(first.has_hello());
    REQUIRE(second.has_hello());

    auto& laptop = fixture.bob_laptop->Devices();
    REQUIRE(Text(laptop.DecryptFromDevice("alice", "phone", first).Unwrap()) == "one");
    const size_t keys_after_accept = fixture.bob_laptop->Identity().AvailableOneTimePreKeys().Unwrap();
    REQUIRE(Text(laptop.DecryptFromDevice("alice", "phone", second).Unwrap()) == "two");
    REQUIRE(fixture.bob_laptop->Identity().AvailableOneTimePreKeys().Unwrap() == keys_after_accept);
    REQUIRE(fixture.bob_laptop.audit->Count(AuditEventType::SessionCreated) == 1);

    auto reply = laptop.EncryptForAllDevices(Bytes("got both"), "alice");
    REQUIRE(reply.IsOk());
    REQUIRE(reply.Unwrap().size() == 1);
    REQUIRE_FALSE(reply.Unwrap().at("phone").has_hello());
    REQUIRE(Text(fixture.alice->Devices().DecryptFromDevice(
        "bob", "laptop", reply.Unwrap().at("phone")).Unwrap()) == "got both");

    auto after_reply = fixture.alice->Devices().EncryptForAllDevices(Bytes("three"), "bob").Unwrap().at("laptop");
    REQUIRE_FALSE(after_reply.has_hello());
    REQUIRE(Text(laptop.DecryptFromDevice("alice", "phone", after_reply).Unwrap()) == "three");
}

TEST_CASE("DeviceDirectory - simultaneous handshakes settle on one session", "[devices][hello]") {
    DirectoryFixture fixture;
    auto from_alice = fixture.alice->Devices().EncryptForAllDevices(Bytes("from alice"), "bob").Unwrap().at("laptop");
    auto to_alice = fixture.bob_laptop->Devices().EncryptForAllDevices(Bytes("from bob"), "alice");
    REQUIRE(to_alice.Unwrap().size() == 1);
    auto from_bob = to_alice.Unwrap().at("phone");

    auto at_bob = fixture.bob_laptop->Devices().DecryptFromDevice("alice", "phone", from_alice);
    auto at_alice = fixture.alice->Devices().DecryptFromDevice("bob", "laptop", from_bob);

    REQUIRE(at_bob.IsOk() != at_alice.IsOk());
    auto& loser = at_bob.IsErr() ? at_bob : at_alice;
    REQUIRE(loser.UnwrapErr().type == ProtocolFailureType::InvalidState);

    // The winner's peer now answers on the surviving session.
    if (at_bob.IsOk()) {
        REQUIRE(Text(at_bob.Unwrap()) == "from alice");
        auto reply = fixture.bob_laptop->Devices().EncryptForAllDevices(Bytes("settled"), "alice");
        REQUIRE(Text(fixture.alice->Devices().DecryptFromDevice(
            "bob", "laptop", reply.Unwrap().at("phone")).Unwrap()) == "settled");
    } else {
        REQUIRE(Text(at_alice.Unwrap()) == "from bob");
        auto reply = fixture.alice->Devices().EncryptForAllDevices(Bytes("settled"), "bob");
        REQUIRE(Text(fixture.bob_laptop->Devices().DecryptFromDevice(
            "alice", "phone", reply.Unwrap().at("laptop")).Unwrap()) == "settled");
    }
}

TEST_CASE("DeviceDirectory - removing a device destroys its session", "[devices]") {
    DirectoryFixture fixture;
    REQUIRE(fixture.alice->Devices().EncryptForAllDevices(Bytes("hi"), "bob").IsOk());
    REQUIRE(fixture.directory->ConsumedKeyIds().size() == 2);

    REQUIRE(fixture.alice->Devices().RemoveDevice("bob", "laptop").IsOk());
    REQUIRE(fixture.alice.audit->Count(AuditEventType::DeviceRemoved) == 1);
    REQUIRE(fixture.alice.audit->Count(AuditEventType::SessionDeleted) == 1);
    REQUIRE_FALSE(fixture.alice->Persistence().Load("bob:laptop").Unwrap().has_value());
    REQUIRE(fixture.alice->Devices().CachedSessionCount() == 1);

    REQUIRE(fixture.alice->Devices().EncryptForAllDevices(Bytes("again"), "bob").IsOk());
    REQUIRE(fixture.directory->ConsumedKeyIds().size() == 3);
}

TEST_CASE("DeviceDirectory - replaced identity forces new handshakes", "[devices][identity]") {
    DirectoryFixture fixture;
    REQUIRE(fixture.alice->Devices().EncryptForAllDevices(Bytes("before"), "bob").IsOk());
    REQUIRE(fixture.directory->ConsumedKeyIds().size() == 2);

    auto backup = SodiumInterop::GenerateX25519KeyPair("backup").Unwrap();
    REQUIRE(fixture.alice->Identity().RestoreIdentity(backup).IsOk());
    REQUIRE(fixture.alice->Devices().CachedSessionCount() == 0);

    fixture.clock.Advance(std::chrono::seconds(1));
    auto after = fixture.alice->Devices().EncryptForAllDevices(Bytes("after"), "bob");
    REQUIRE(after.Unwrap().size() == 2);
    REQUIRE(fixture.directory->ConsumedKeyIds().size() == 4);

    auto opened = fixture.bob_laptop->Devices().DecryptFromDevice("alice", "phone", after.Unwrap().at("laptop"));
    REQUIRE(opened.IsOk());
    REQUIRE(Text(opened.Unwrap()) == "after");
}

TEST_CASE("DeviceDirectory - a hello whose message fails keeps the old session", "[devices][hello][security]") {
    DirectoryFixture fixture;
    auto first = fixture.alice->Devices().EncryptForAllDevices(Bytes("one"), "bob").Unwrap().at("laptop");
    auto second = fixture.alice->Devices().EncryptForAllDevices(Bytes("two"), "bob").Unwrap().at("laptop");
    auto& laptop = fixture.bob_laptop->Devices();
    REQUIRE(laptop.DecryptFromDevice("alice", "phone", first).IsOk());

    auto mallory = MakeDevice("mallory", "phone", fixture.directory, fixture.clock);
    auto forged = mallory->Devices().EncryptForAllDevices(Bytes("evil"), "bob").Unwrap().at("laptop");
    auto* ciphertext = forged.mutable_ciphertext();
    (*ciphertext)[0] = static_cast<char>((*ciphertext)[0] ^ 0x01);

    auto rejected = laptop.DecryptFromDevice("alice", "phone", forged);
    REQUIRE(rejected.IsErr());
    REQUIRE(rejected.UnwrapErr().type == ProtocolFailureType::AuthenticationFailed);

    auto genuine = laptop.DecryptFromDevice("alice", "phone", second);
    REQUIRE(genuine.IsOk());
    REQUIRE(Text(genuine.Unwrap()) == "two");
}

TEST_CASE("DeviceDirectory - a hello built before the responder rotated still opens", "[devices][hello][rotation]") {
    DirectoryFixture fixture;
    const auto stale = fixture.directory->Find("bob", "laptop");
    REQUIRE(stale.has_value());
    REQUIRE(fixture.bob_laptop->Rotation().Rotate().IsOk());
    REQUIRE(fixture.directory->Find("bob", "laptop")->identity_key() != stale->identity_key());

    REQUIRE(fixture.alice->Establisher().Initiate("bob:laptop", *stale).IsOk());
    auto message = fixture.alice->Ratchet().EncryptForSession("bob:laptop", Bytes("to the old key"));
    REQUIRE(message.IsOk());
    REQUIRE(message.Unwrap().hello().responder_identity_key() == stale->identity_key());

    auto opened = fixture.bob_laptop->Devices().DecryptFromDevice("alice", "phone", message.Unwrap());
    REQUIRE(opened.IsOk());
    REQUIRE(Text(opened.Unwrap()) == "to the old key");
    REQUIRE(fixture.bob_laptop.audit->Count(AuditEventType::AuthenticationFailed) == 0);

    auto reply = fixture.bob_laptop->Devices().EncryptForAllDevices(Bytes("answered"), "alice");
    REQUIRE(reply.IsOk());
    REQUIRE(Text(fixture.alice->Devices().DecryptFromDevice(
        "bob", "laptop", reply.Unwrap().at("phone")).Unwrap()) == "answered");
}

TEST_CASE("DeviceDirectory - a hello naming a key never held is refused", "[devices][hello][security]") {
    DirectoryFixture fixture;
    auto message = fixture.alice->Devices().EncryptForAllDevices(Bytes("hi"), "bob").Unwrap().at("laptop");
    const auto stranger = SodiumInterop::GenerateX25519KeyPair("stranger").Unwrap();
    message.mutable_hello()->set_responder_identity_key(
        std::string(stranger.public_key.begin(), stranger.public_key.end()));

    auto opened = fixture.bob_laptop->Devices().DecryptFromDevice("alice", "phone", message);
    REQUIRE(opened.IsErr());
    REQUIRE(opened.UnwrapErr().type == ProtocolFailureType::AuthenticationFailed);
    REQUIRE_FALSE(fixture.bob_laptop->Persistence().Load("alice:phone").Unwrap().has_value());
    REQUIRE(fixture.bob_laptop.audit->Count(AuditEventType::SessionCreated) == 0);
}
