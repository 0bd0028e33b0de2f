#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace dynasty::e2ee {

struct Constants {
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t MAX_BUFFER_SIZE = 64 * 1024 * 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
};

struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view ALGORITHM_HKDF = "HKDF";
    static constexpr std::string_view DIGEST_SHA256 = "SHA256";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};

struct SodiumConstants {
    static constexpr int SUCCESS = 0;
};

struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view SIGNED_PRE_KEY_FAILED = "Signed pre-key signature verification failed";
    static constexpr std::string_view MAC_MISMATCH = "Message authentication code mismatch";
    static constexpr std::string_view NO_IDENTITY = "No local identity has been generated or restored";
};

}
