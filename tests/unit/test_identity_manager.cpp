#include <catch2/catch_test_macros.hpp>
#include "dynasty/identity/identity_manager.hpp"
#include "dynasty/crypto/sodium_interop.hpp"
#include "dynasty/protocol/constants.hpp"
#include "helpers/in_memory_fakes.hpp"
#include "helpers/test_devices.hpp"

using namespace dynasty::e2ee;
using namespace dynasty::e2ee::identity;
using namespace dynasty::e2ee::test_helpers;
using dynasty::e2ee::crypto::SodiumInterop;

namespace {

class CountingObserver final : public interfaces::IIdentityObserver {
public:
    void OnIdentityReplaced() override { ++notifications; }
    int notifications = 0;
};

struct IdentityFixture {
    IdentityFixture()
        : storage(std::make_shared<InMemoryKeyStorage>())
        , sink(std::make_shared<RecordingAuditSink>())
        , store(storage)
        , audit(sink)
        , manager(store, audit, configuration::IdentitySettings{4}, clock.Fn()) {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        manager.AddObserver(&observer);
    }

    ~IdentityFixture() {
        manager.RemoveObserver(&observer);
    }

    ManualClock clock;
    std::shared_ptr<InMemoryKeyStorage> storage;
    std::shared_ptr<RecordingAuditSink> sink;
    KeyMaterialStore store;
    security::AuditLogger audit;
    IdentityManager manager;
    CountingObserver observer;
};

}

TEST_CASE("IdentityManager - identity is never generated implicitly", "[identity]") {
    IdentityFixture fixture;

    auto loaded = fixture.manager.Load();
    REQUIRE(loaded.IsOk());
    REQUIRE_FALSE(loaded.Unwrap());

    auto identity = fixture.manager.GetIdentity();
    REQUIRE(identity.IsOk());
    REQUIRE_FALSE(identity.Unwrap().has_value());

    auto exported = fixture.manager.ExportIdentity();
    REQUIRE(exported.IsErr());
    REQUIRE(exported.UnwrapErr().type == ProtocolFailureType::InvalidState);
    REQUIRE_FALSE(fixture.storage->Contains(std::string(kIdentityStorageKey)));
}

TEST_CASE("IdentityManager - generated identity survives a reload", "[identity]") {
    IdentityFixture fixture;
    auto generated = fixture.manager.GenerateIdentity();
    REQUIRE(generated.IsOk());
    REQUIRE(fixture.storage->Contains(std::string(kIdentityStorageKey)));
    REQUIRE(fixture.observer.notifications == 0);

    IdentityManager reloaded(fixture.store, fixture.audit, configuration::IdentitySettings{4}, fixture.clock.Fn());
    REQUIRE(reloaded.Load().Unwrap());
    auto identity = reloaded.GetIdentity();
    REQUIRE(identity.Unwrap().has_value());
    REQUIRE(identity.Unwrap()->public_key == generated.Unwrap().public_key);
    REQUIRE(reloaded.GetRegistrationId().Unwrap() == fixture.manager.GetRegistrationId().Unwrap());
    REQUIRE(reloaded.AvailableOneTimePreKeys().Unwrap() == 4);
}

TEST_CASE("IdentityManager - regenerating replaces the identity and notifies", "[identity]") {
    IdentityFixture fixture;
    auto first = fixture.manager.GenerateIdentity().Unwrap();
    auto second = fixture.manager.GenerateIdentity().Unwrap();

    REQUIRE(first.public_key != second.public_key);
    REQUIRE(fixture.observer.notifications == 1);
}

TEST_CASE("IdentityManager - restoring a backed-up identity", "[identity]") {
    IdentityFixture fixture;
    REQUIRE(fixture.manager.GenerateIdentity().IsOk());
    auto backup = SodiumInterop::GenerateX25519KeyPair("backup").Unwrap();

    SECTION("replaces the key, audits and notifies") {
        REQUIRE(fixture.manager.RestoreIdentity(backup).IsOk());
        REQUIRE(fixture.manager.ExportIdentity().Unwrap().public_key == backup.public_key);
        REQUIRE(fixture.sink->Count(AuditEventType::IdentityRestored) == 1);
        REQUIRE(fixture.observer.notifications == 1);
    }

    SECTION("a failed write leaves the old identity in place") {
        const auto before = fixture.manager.ExportIdentity().Unwrap().public_key;
        fixture.storage->fail_writes = true;

        auto restored = fixture.manager.RestoreIdentity(backup);
        REQUIRE(restored.IsErr());
        REQUIRE(restored.UnwrapErr().type == ProtocolFailureType::StorageFailure);
        REQUIRE(fixture.manager.ExportIdentity().Unwrap().public_key == before);
        REQUIRE(fixture.sink->Count(AuditEventType::IdentityRestored) == 0);
        REQUIRE(fixture.observer.notifications == 0);
    }

    SECTION("an invalid public key is refused") {
        backup.public_key.assign(kX25519PublicKeyBytes, 0);
        auto restored = fixture.manager.RestoreIdentity(backup);
        REQUIRE(restored.IsErr());
        REQUIRE(fixture.observer.notifications == 0);
    }
}

TEST_CASE("IdentityManager - restore on a fresh device builds the remaining keys", "[identity]") {
    IdentityFixture fixture;
    auto backup = SodiumInterop::GenerateX25519KeyPair("backup").Unwrap();

    REQUIRE(fixture.manager.RestoreIdentity(backup).IsOk());
    auto keys = fixture.manager.GetPublicKeys();
    REQUIRE(keys.IsOk());
    REQUIRE(keys.Unwrap().identity_key == backup.public_key);
    REQUIRE(keys.Unwrap().signing_key.size() == kEd25519PublicKeyBytes);
    REQUIRE(fixture.manager.AvailableOneTimePreKeys().Unwrap() == 4);
}

TEST_CASE("IdentityManager - device record carries a verifiable bundle", "[identity]") {
    IdentityFixture fixture;
    REQUIRE(fixture.manager.GenerateIdentity().IsOk());
    const models::LocalDevice device{.user_id = "alice", .device_id = "phone", .device_name = "Alice's phone"};

    auto record = fixture.manager.CreateDeviceRecord(device);
    REQUIRE(record.IsOk());
    const auto& bundle = record.Unwrap();
    REQUIRE(bundle.user_id() == "alice");
    REQUIRE(bundle.device_id() == "phone");
    REQUIRE(bundle.one_time_pre_keys_size() == 4);
    REQUIRE(bundle.signed_pre_key().id() == 1);
    REQUIRE(IdentityKeys::VerifyRemoteSpkSignature(
        Bytes(bundle.identity_signing_key()),
        Bytes(bundle.signed_pre_key().public_key()),
        Bytes(bundle.signed_pre_key().signature())));

    SECTION("identity override") {
        const std::vector<uint8_t> candidate(kX25519PublicKeyBytes, 0x42);
        auto overridden = fixture.manager.CreateDeviceRecord(device, std::span<const uint8_t>(candidate));
        REQUIRE(Bytes(overridden.Unwrap().identity_key()) == candidate);
    }
}

TEST_CASE("IdentityManager - one-time pre-key pool", "[identity]") {
    IdentityFixture fixture;
    REQUIRE(fixture.manager.GenerateIdentity().IsOk());

    REQUIRE(fixture.manager.ConsumeOneTimePreKey(kFirstOneTimePreKeyId).IsOk());
    REQUIRE(fixture.manager.AvailableOneTimePreKeys().Unwrap() == 3);

    auto again = fixture.manager.ConsumeOneTimePreKey(kFirstOneTimePreKeyId);
    REQUIRE(again.IsErr());
    REQUIRE(again.UnwrapErr().type == ProtocolFailureType::KeyExhausted);

    REQUIRE(fixture.manager.ReplenishOneTimePreKeys(5).IsOk());
    REQUIRE(fixture.manager.AvailableOneTimePreKeys().Unwrap() == 8);

    SECTION("replenish is not applied when the write fails") {
        fixture.storage->fail_writes = true;
        REQUIRE(fixture.manager.ReplenishOneTimePreKeys(5).IsErr());
        REQUIRE(fixture.manager.AvailableOneTimePreKeys().Unwrap() == 8);
    }
}

TEST_CASE("IdentityManager - sealed payloads", "[identity][sealed]") {
    IdentityFixture fixture;
    auto identity = fixture.manager.GenerateIdentity().Unwrap();
    const auto plaintext = Bytes("recovery blob");

    auto sealed = IdentityManager::Seal(identity.public_key, plaintext);
    REQUIRE(sealed.IsOk());
    auto opened = fixture.manager.OpenSealed(sealed.Unwrap());
    REQUIRE(opened.IsOk());
    REQUIRE(opened.Unwrap() == plaintext);

    SECTION("trial decryption with a retained key") {
        auto retained = SodiumInterop::GenerateX25519KeyPair("retained").Unwrap();
        auto to_retained = IdentityManager::Seal(retained.public_key, plaintext).Unwrap();

        auto with_retained = fixture.manager.OpenSealedWithKey(retained, to_retained);
        REQUIRE(with_retained.IsOk());
        REQUIRE(with_retained.Unwrap().has_value());
        REQUIRE(*with_retained.Unwrap() == plaintext);

        auto wrong_key = fixture.manager.OpenSealedWithKey(retained, sealed.Unwrap());
        REQUIRE(wrong_key.IsOk());
        REQUIRE_FALSE(wrong_key.Unwrap().has_value());

        REQUIRE(fixture.manager.ExportIdentity().Unwrap().public_key == identity.public_key);
    }

    SECTION("payload for another key does not open") {
        auto other = SodiumInterop::GenerateX25519KeyPair("other").Unwrap();
        auto foreign = IdentityManager::Seal(other.public_key, plaintext).Unwrap();
        auto result = fixture.manager.OpenSealed(foreign);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::AuthenticationFailed);
    }
}

TEST_CASE("IdentityManager - responder secret checks the signed pre-key id", "[identity][x3dh]") {
    IdentityFixture fixture;
    REQUIRE(fixture.manager.GenerateIdentity().IsOk());
    auto peer = SodiumInterop::GenerateX25519KeyPair("peer").Unwrap();
    auto ephemeral = SodiumInterop::GenerateX25519KeyPair("ephemeral").Unwrap();

    auto wrong = fixture.manager.DeriveResponderSecret(peer.public_key, ephemeral.public_key, 7, std::nullopt);
    REQUIRE(wrong.IsErr());
    REQUIRE(wrong.UnwrapErr().type == ProtocolFailureType::KeyExhausted);

    auto right = fixture.manager.DeriveResponderSecret(peer.public_key, ephemeral.public_key, 1, std::nullopt);
    REQUIRE(right.IsOk());
}
