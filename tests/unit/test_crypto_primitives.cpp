#include <catch2/catch_test_macros.hpp>
#include "dynasty/crypto/aes_gcm.hpp"
#include "dynasty/crypto/hkdf.hpp"
#include "dynasty/crypto/scoped_secret.hpp"
#include "dynasty/crypto/sealed_box.hpp"
#include "dynasty/crypto/secure_memory_handle.hpp"
#include "dynasty/crypto/sodium_interop.hpp"
#include "dynasty/core/logging.hpp"

#include <string>
#include <string_view>
#include <vector>

using namespace dynasty::e2ee;
using namespace dynasty::e2ee::crypto;

namespace {

std::vector<uint8_t> FromHex(std::string_view hex) {
    std::vector<uint8_t> out;
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        out.push_back(static_cast<uint8_t>(std::stoi(std::string(hex.substr(i, 2)), nullptr, 16)));
    }
    return out;
}

std::vector<uint8_t> Bytes(std::string_view text) {
    return {text.begin(), text.end()};
}

}

TEST_CASE("Hkdf - RFC 5869 test case 1", "[crypto][hkdf]") {
    const std::vector<uint8_t> ikm(22, 0x0b);
    const auto salt = FromHex("000102030405060708090a0b0c");
    const auto info = FromHex("f0f1f2f3f4f5f6f7f8f9");

    auto okm = Hkdf::DeriveKeyBytes(ikm, 42, salt, info);
    REQUIRE(okm.IsOk());
    REQUIRE(logging::ToHex(okm.Unwrap()) ==
            "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf34007208d5b887185865");
}

TEST_CASE("Hkdf - rejects empty input key material", "[crypto][hkdf]") {
    auto okm = Hkdf::DeriveKeyBytes({}, 32);
    REQUIRE(okm.IsErr());
}

TEST_CASE("SodiumInterop - primitives", "[crypto][sodium]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("HMAC-SHA256 matches RFC 4231 test case 2") {
        auto mac = SodiumInterop::HmacSha256(Bytes("Jefe"), Bytes("what do ya want for nothing?"));
        REQUIRE(mac.IsOk());
        REQUIRE(logging::ToHex(mac.Unwrap()) ==
                "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
    }

    SECTION("X25519 agreement is symmetric") {
        auto alice = SodiumInterop::GenerateX25519KeyPair("alice").Unwrap();
        auto bob = SodiumInterop::GenerateX25519KeyPair("bob").Unwrap();
        auto ab = SodiumInterop::ComputeX25519(alice.private_key.Span(), bob.public_key);
        auto ba = SodiumInterop::ComputeX25519(bob.private_key.Span(), alice.public_key);
        REQUIRE(ab.IsOk());
        REQUIRE(ba.IsOk());
        REQUIRE(SodiumInterop::ConstantTimeEquals(ab.Unwrap().Span(), ba.Unwrap().Span()));

        auto derived = SodiumInterop::DeriveX25519PublicKey(alice.private_key.Span());
        REQUIRE(derived.Unwrap() == alice.public_key);
    }

    SECTION("Agreement with the all-zero point fails") {
        auto alice = SodiumInterop::GenerateX25519KeyPair("alice").Unwrap();
        const std::vector<uint8_t> zero(32, 0);
        REQUIRE(SodiumInterop::ComputeX25519(alice.private_key.Span(), zero).IsErr());
    }

    SECTION("Ed25519 detached signatures") {
        auto signer = SodiumInterop::GenerateEd25519KeyPair().Unwrap();
        const auto message = Bytes("signed pre-key");
        auto signature = SodiumInterop::SignDetached(signer.private_key.Span(), message);
        REQUIRE(signature.IsOk());
        REQUIRE(SodiumInterop::VerifyDetached(signer.public_key, message, signature.Unwrap()));

        auto forged = signature.Unwrap();
        forged[0] ^= 0x01;
        REQUIRE_FALSE(SodiumInterop::VerifyDetached(signer.public_key, message, forged));
    }

    SECTION("Constant-time comparison treats length mismatch as unequal") {
        const std::vector<uint8_t> a{1, 2, 3};
        const std::vector<uint8_t> b{1, 2};
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b));
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, a));
    }
}

TEST_CASE("AesGcm - authenticated encryption", "[crypto][aes]") {
    const std::vector<uint8_t> key(32, 0x42);
    const std::vector<uint8_t> nonce(12, 0x07);
    const auto aad = Bytes("header");
    const auto plaintext = Bytes("attack at dawn");

    auto ciphertext = AesGcm::Encrypt(key, nonce, plaintext, aad);
    REQUIRE(ciphertext.IsOk());
    REQUIRE(ciphertext.Unwrap().size() == plaintext.size() + 16);

    SECTION("Round trip") {
        auto opened = AesGcm::Decrypt(key, nonce, ciphertext.Unwrap(), aad);
        REQUIRE(opened.Unwrap() == plaintext);
    }

    SECTION("Modified ciphertext fails authentication") {
        auto tampered = ciphertext.Unwrap();
        tampered[3] ^= 0x80;
        auto opened = AesGcm::Decrypt(key, nonce, tampered, aad);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == ProtocolFailureType::AuthenticationFailed);
    }

    SECTION("Different associated data fails authentication") {
        auto opened = AesGcm::Decrypt(key, nonce, ciphertext.Unwrap(), Bytes("other"));
        REQUIRE(opened.UnwrapErr().type == ProtocolFailureType::AuthenticationFailed);
    }

    SECTION("Empty plaintext is supported") {
        auto empty = AesGcm::Encrypt(key, nonce, {}, aad);
        REQUIRE(empty.IsOk());
        REQUIRE(AesGcm::Decrypt(key, nonce, empty.Unwrap(), aad).Unwrap().empty());
    }

    SECTION("Wrong key length is rejected") {
        const std::vector<uint8_t> short_key(16, 0x42);
        REQUIRE(AesGcm::Encrypt(short_key, nonce, plaintext).IsErr());
    }
}

TEST_CASE("SealedBox - opens only under the recipient key", "[crypto][sealed]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto recipient = SodiumInterop::GenerateX25519KeyPair("recipient").Unwrap();
    auto stranger = SodiumInterop::GenerateX25519KeyPair("stranger").Unwrap();

    auto sealed = SealedBox::Seal(recipient.public_key, Bytes("backup blob"));
    REQUIRE(sealed.IsOk());

    auto opened = SealedBox::Open(recipient.private_key.Span(), recipient.public_key, sealed.Unwrap());
    REQUIRE(opened.Unwrap() == Bytes("backup blob"));

    auto wrong = SealedBox::Open(stranger.private_key.Span(), stranger.public_key, sealed.Unwrap());
    REQUIRE(wrong.IsErr());
    REQUIRE(wrong.UnwrapErr().type == ProtocolFailureType::AuthenticationFailed);
}

TEST_CASE("SecureMemoryHandle - guarded storage", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> secret{9, 8, 7, 6, 5, 4, 3, 2};

    auto handle = SecureMemoryHandle::FromBytes(secret);
    REQUIRE(handle.IsOk());
    REQUIRE(handle.Unwrap().ReadBytes(secret.size()).Unwrap() == secret);

    auto clone = handle.Unwrap().Clone();
    REQUIRE(clone.IsOk());
    REQUIRE(clone.Unwrap().ReadBytes(secret.size()).Unwrap() == secret);

    SecureMemoryHandle moved = std::move(handle).Unwrap();
    SecureMemoryHandle target = std::move(moved);
    REQUIRE(moved.IsInvalid());
    REQUIRE(moved.ReadBytes(1).IsErr());
    REQUIRE_FALSE(target.IsInvalid());
}

TEST_CASE("ScopedSecret - wipe and move semantics", "[crypto][memory]") {
    ScopedSecret secret = ScopedSecret::Copy(std::vector<uint8_t>{1, 2, 3});
    ScopedSecret copy = secret;
    REQUIRE(copy.Size() == 3);

    ScopedSecret moved = std::move(secret);
    REQUIRE(secret.Empty());
    REQUIRE(moved.Size() == 3);

    moved.Wipe();
    REQUIRE(moved.Empty());
    REQUIRE(copy.Size() == 3);
}
