#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace dynasty::e2ee {

inline constexpr uint32_t kSessionRecordVersion = 1;

inline constexpr size_t kX25519PublicKeyBytes = 32;
inline constexpr size_t kX25519PrivateKeyBytes = 32;
inline constexpr size_t kX25519SharedSecretBytes = 32;
inline constexpr size_t kEd25519PublicKeyBytes = 32;
inline constexpr size_t kEd25519SecretKeyBytes = 64;
inline constexpr size_t kEd25519SignatureBytes = 64;

inline constexpr size_t kRootKeyBytes = 32;
inline constexpr size_t kChainKeyBytes = 32;
inline constexpr size_t kMessageKeyBytes = 32;
inline constexpr size_t kHmacBytes = 32;

inline constexpr size_t kAesKeyBytes = 32;
inline constexpr size_t kAesGcmNonceBytes = 12;
inline constexpr size_t kAesGcmTagBytes = 16;

// encryption key || MAC key || IV
inline constexpr size_t kMessageKeyMaterialBytes = kAesKeyBytes + kHmacBytes + kAesGcmNonceBytes;
inline constexpr size_t kRatchetHeaderBytes = kX25519PublicKeyBytes + 4 + 4;

inline constexpr uint8_t kX3dhPrefixByte = 0xFF;

inline constexpr std::string_view kX3dhInfo = "Dynasty-X3DH";
inline constexpr std::string_view kRootKeyInfo = "Dynasty Root Key";
inline constexpr std::string_view kChainKeyInfo = "Dynasty Chain Key";
inline constexpr std::string_view kMessageKeyInfo = "Dynasty Message Key";
inline constexpr std::string_view kMessageKeysInfo = "Dynasty Message Keys";
inline constexpr std::string_view kStateHmacInfo = "Dynasty-State-HMAC";
inline constexpr std::string_view kSealedBoxInfo = "Dynasty-Sealed-Box";

inline constexpr std::string_view kPurposeIdentityX25519 = "identity-x25519";
inline constexpr std::string_view kPurposeSignedPreKey = "signed-pre-key";
inline constexpr std::string_view kPurposeOneTimePreKey = "one-time-pre-key";
inline constexpr std::string_view kPurposeEphemeralX25519 = "ephemeral-x25519";
inline constexpr std::string_view kPurposeRatchetX25519 = "ratchet-x25519";
inline constexpr std::string_view kPurposeRotatingX25519 = "rotating-x25519";

// Secure storage key layout
inline constexpr std::string_view kStoragePrefix = "e2e_";
inline constexpr std::string_view kIdentityStorageKey = "e2e_identity";
inline constexpr std::string_view kRotationIndexStorageKey = "e2e_rotation_list";
inline constexpr std::string_view kRotationKeyPrefix = "e2e_rotation_";
inline constexpr std::string_view kSessionIndexStorageKey = "e2e_session_index";
inline constexpr std::string_view kSessionKeyPrefix = "e2e_session_";

inline constexpr uint32_t kFirstOneTimePreKeyId = 2;
inline constexpr uint32_t kRegistrationIdMask = 0x7FFFFFFF;

}
