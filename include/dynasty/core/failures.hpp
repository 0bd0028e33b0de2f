#pragma once
#include <string>
#include <string_view>

namespace dynasty::e2ee {

enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    AllocationFailed,
    InvalidOperation
};

enum class ProtocolFailureType {
    KeyGeneration,
    PeerBundleInvalid,
    SessionNotFound,
    AuthenticationFailed,
    TooManySkippedMessages,
    KeyExhausted,
    RotationFailure,
    StorageFailure,
    DirectoryUnavailable,
    DuplicateMessage,
    Cancelled,
    InvalidInput,
    InvalidState,
    Encode,
    Decode,
    DeriveKey
};

[[nodiscard]] constexpr std::string_view ToString(const ProtocolFailureType type) noexcept {
    switch (type) {
        case ProtocolFailureType::KeyGeneration: return "KeyGeneration";
        case ProtocolFailureType::PeerBundleInvalid: return "PeerBundleInvalid";
        case ProtocolFailureType::SessionNotFound: return "SessionNotFound";
        case ProtocolFailureType::AuthenticationFailed: return "AuthenticationFailed";
        case ProtocolFailureType::TooManySkippedMessages: return "TooManySkippedMessages";
        case ProtocolFailureType::KeyExhausted: return "KeyExhausted";
        case ProtocolFailureType::RotationFailure: return "RotationFailure";
        case ProtocolFailureType::StorageFailure: return "StorageFailure";
        case ProtocolFailureType::DirectoryUnavailable: return "DirectoryUnavailable";
        case ProtocolFailureType::DuplicateMessage: return "DuplicateMessage";
        case ProtocolFailureType::Cancelled: return "Cancelled";
        case ProtocolFailureType::InvalidInput: return "InvalidInput";
        case ProtocolFailureType::InvalidState: return "InvalidState";
        case ProtocolFailureType::Encode: return "Encode";
        case ProtocolFailureType::Decode: return "Decode";
        case ProtocolFailureType::DeriveKey: return "DeriveKey";
    }
    return "Unknown";
}

class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;

    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/// Failure returned by every engine operation.
///
/// Integrity failures (tampering, bad signatures, replays) must stay
/// distinguishable from transient I/O failures so callers can decide between
/// retrying and raising a security event.
class ProtocolFailure {
public:
    ProtocolFailureType type;
    std::string message;

    ProtocolFailure(const ProtocolFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    [[nodiscard]] bool IsIntegrityFailure() const noexcept {
        return type == ProtocolFailureType::AuthenticationFailed ||
               type == ProtocolFailureType::PeerBundleInvalid ||
               type == ProtocolFailureType::DuplicateMessage;
    }

    [[nodiscard]] bool IsTransient() const noexcept {
        return type == ProtocolFailureType::StorageFailure ||
               type == ProtocolFailureType::DirectoryUnavailable;
    }

    [[nodiscard]] std::string Describe() const {
        return std::string(ToString(type)) + ": " + message;
    }

    static ProtocolFailure KeyGeneration(std::string msg) {
        return {ProtocolFailureType::KeyGeneration, std::move(msg)};
    }
    static ProtocolFailure PeerBundleInvalid(std::string msg) {
        return {ProtocolFailureType::PeerBundleInvalid, std::move(msg)};
    }
    static ProtocolFailure SessionNotFound(std::string msg) {
        return {ProtocolFailureType::SessionNotFound, std::move(msg)};
    }
    static ProtocolFailure AuthenticationFailed(std::string msg) {
        return {ProtocolFailureType::AuthenticationFailed, std::move(msg)};
    }
    static ProtocolFailure TooManySkippedMessages(std::string msg) {
        return {ProtocolFailureType::TooManySkippedMessages, std::move(msg)};
    }
    static ProtocolFailure KeyExhausted(std::string msg) {
        return {ProtocolFailureType::KeyExhausted, std::move(msg)};
    }
    static ProtocolFailure RotationFailure(std::string msg) {
        return {ProtocolFailureType::RotationFailure, std::move(msg)};
    }
    static ProtocolFailure StorageFailure(std::string msg) {
        return {ProtocolFailureType::StorageFailure, std::move(msg)};
    }
    static ProtocolFailure DirectoryUnavailable(std::string msg) {
        return {ProtocolFailureType::DirectoryUnavailable, std::move(msg)};
    }
    static ProtocolFailure DuplicateMessage(std::string msg) {
        return {ProtocolFailureType::DuplicateMessage, std::move(msg)};
    }
    static ProtocolFailure Cancelled(std::string msg) {
        return {ProtocolFailureType::Cancelled, std::move(msg)};
    }
    static ProtocolFailure InvalidInput(std::string msg) {
        return {ProtocolFailureType::InvalidInput, std::move(msg)};
    }
    static ProtocolFailure InvalidState(std::string msg) {
        return {ProtocolFailureType::InvalidState, std::move(msg)};
    }
    static ProtocolFailure Encode(std::string msg) {
        return {ProtocolFailureType::Encode, std::move(msg)};
    }
    static ProtocolFailure Decode(std::string msg) {
        return {ProtocolFailureType::Decode, std::move(msg)};
    }
    static ProtocolFailure DeriveKey(std::string msg) {
        return {ProtocolFailureType::DeriveKey, std::move(msg)};
    }

    static ProtocolFailure FromSodiumFailure(const SodiumFailure& sf) {
        if (sf.type == SodiumFailureType::AllocationFailed ||
            sf.type == SodiumFailureType::InitializationFailed) {
            return KeyGeneration(sf.message);
        }
        return InvalidState(sf.message);
    }
};

}
