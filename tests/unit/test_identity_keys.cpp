#include <catch2/catch_test_macros.hpp>
#include "dynasty/identity/identity_keys.hpp"
#include "dynasty/crypto/sodium_interop.hpp"
#include "dynasty/protocol/constants.hpp"

#include <optional>
#include <span>

using namespace dynasty::e2ee;
using namespace dynasty::e2ee::identity;
using dynasty::e2ee::crypto::SodiumInterop;

namespace {

IdentityKeys MakeKeys(const uint32_t one_time_keys = 4) {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto created = IdentityKeys::Create(one_time_keys, Clock::now());
    REQUIRE(created.IsOk());
    return std::move(created).Unwrap();
}

}

TEST_CASE("IdentityKeys - fresh material", "[identity][keys]") {
    auto keys = MakeKeys(4);

    REQUIRE(keys.IdentityPublic().size() == kX25519PublicKeyBytes);
    REQUIRE(keys.SigningPublic().size() == kEd25519PublicKeyBytes);
    REQUIRE(keys.RegistrationId() != 0);
    REQUIRE((keys.RegistrationId() & ~kRegistrationIdMask) == 0);
    REQUIRE(keys.OneTimePreKeys().size() == 4);
    REQUIRE(keys.OneTimePreKeys().front().id == kFirstOneTimePreKeyId);

    REQUIRE(IdentityKeys::VerifyRemoteSpkSignature(
        keys.SigningPublic(), keys.SignedPreKeyPublic(), keys.SignedPreKeySignature()));
}

TEST_CASE("IdentityKeys - record round trip keeps every key", "[identity][keys]") {
    auto keys = MakeKeys(3);
    auto record = keys.ToRecord();
    REQUIRE(record.IsOk());

    auto restored = IdentityKeys::FromRecord(record.Unwrap());
    REQUIRE(restored.IsOk());
    const auto& copy = restored.Unwrap();
    REQUIRE(copy.IdentityPublic() == keys.IdentityPublic());
    REQUIRE(copy.SigningPublic() == keys.SigningPublic());
    REQUIRE(copy.SignedPreKeyPublic() == keys.SignedPreKeyPublic());
    REQUIRE(copy.RegistrationId() == keys.RegistrationId());
    REQUIRE(copy.OneTimePreKeys().size() == 3);

    SECTION("truncated private key is rejected") {
        auto broken = record.Unwrap();
        broken.set_identity_private_key("short");
        auto decoded = IdentityKeys::FromRecord(broken);
        REQUIRE(decoded.IsErr());
    }
}

TEST_CASE("IdentityKeys - one-time pre-keys are consumed once", "[identity][keys]") {
    auto keys = MakeKeys(2);
    const uint32_t id = keys.OneTimePreKeys().front().id;

    REQUIRE(keys.ConsumeOneTimePreKey(id).IsOk());
    REQUIRE(keys.FindOneTimePreKey(id) == nullptr);

    auto again = keys.ConsumeOneTimePreKey(id);
    REQUIRE(again.IsErr());
    REQUIRE(again.UnwrapErr().type == ProtocolFailureType::KeyExhausted);

    REQUIRE(keys.AppendOneTimePreKeys(3).IsOk());
    REQUIRE(keys.OneTimePreKeys().size() == 4);
    REQUIRE(keys.FindOneTimePreKey(id) == nullptr);
}

TEST_CASE("IdentityKeys - X3DH secrets agree on both sides", "[identity][x3dh]") {
    auto alice = MakeKeys(1);
    auto bob = MakeKeys(2);
    auto ephemeral = SodiumInterop::GenerateX25519KeyPair("ephemeral").Unwrap();
    const auto& bob_opk = bob.OneTimePreKeys().front();

    SECTION("with a one-time pre-key") {
        auto initiator = alice.DeriveInitiatorSecret(
            ephemeral.private_key.Span(), bob.IdentityPublic(), bob.SignedPreKeyPublic(),
            std::span<const uint8_t>(bob_opk.public_key));
        auto responder = bob.DeriveResponderSecret(alice.IdentityPublic(), ephemeral.public_key, bob_opk.id);
        REQUIRE(initiator.IsOk());
        REQUIRE(responder.IsOk());
        REQUIRE(SodiumInterop::ConstantTimeEquals(initiator.Unwrap().Span(), responder.Unwrap().Span()));
    }

    SECTION("without a one-time pre-key") {
        auto initiator = alice.DeriveInitiatorSecret(
            ephemeral.private_key.Span(), bob.IdentityPublic(), bob.SignedPreKeyPublic(), std::nullopt);
        auto responder = bob.DeriveResponderSecret(alice.IdentityPublic(), ephemeral.public_key, std::nullopt);
        REQUIRE(SodiumInterop::ConstantTimeEquals(initiator.Unwrap().Span(), responder.Unwrap().Span()));
    }

    SECTION("a missing one-time pre-key is reported as exhausted") {
        auto responder = bob.DeriveResponderSecret(alice.IdentityPublic(), ephemeral.public_key, 9999u);
        REQUIRE(responder.IsErr());
        REQUIRE(responder.UnwrapErr().type == ProtocolFailureType::KeyExhausted);
    }
}

TEST_CASE("IdentityKeys - replacing the identity pair", "[identity][keys]") {
    auto keys = MakeKeys(1);
    auto fresh = SodiumInterop::GenerateX25519KeyPair("identity").Unwrap();
    const auto signing = keys.SigningPublic();

    REQUIRE(keys.ReplaceIdentityKeyPair(fresh).IsOk());
    REQUIRE(keys.IdentityPublic() == fresh.public_key);
    REQUIRE(keys.SigningPublic() == signing);

    auto mismatched = SodiumInterop::GenerateX25519KeyPair("identity").Unwrap();
    mismatched.public_key = fresh.public_key;
    mismatched.public_key[0] ^= 0x01;
    REQUIRE(keys.ReplaceIdentityKeyPair(mismatched).IsErr());
    REQUIRE(keys.IdentityPublic() == fresh.public_key);
}
