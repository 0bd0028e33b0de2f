#include "dynasty/crypto/aes_gcm.hpp"
#include "dynasty/crypto/sodium_interop.hpp"
#include "dynasty/core/constants.hpp"
#include "dynasty/protocol/constants.hpp"
#include <fmt/core.h>
#include <openssl/evp.h>
#include <openssl/err.h>
#include <memory>

namespace dynasty::e2ee::crypto {
using OpenSSL = OpenSSLConstants;

namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;

    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }

    Result<Unit, ProtocolFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != kAesKeyBytes) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    fmt::format("AES-256-GCM key must be {} bytes, got {}", kAesKeyBytes, key.size())));
        }
        if (nonce.size() != kAesGcmNonceBytes) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    fmt::format("AES-GCM nonce must be {} bytes, got {}", kAesGcmNonceBytes, nonce.size())));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    void Wipe(std::vector<uint8_t>& buffer) {
        auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
        (void) _wipe;
    }
}

Result<std::vector<uint8_t>, ProtocolFailure>
AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto check = ValidateKeyAndNonce(key, nonce); check.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(check).UnwrapErr());
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(
                fmt::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(
                fmt::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &outlen,
                              associated_data.data(),
                              static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState(
                    fmt::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
    }
    std::vector<uint8_t> output(plaintext.size() + kAesGcmTagBytes);
    int ciphertext_len = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                          plaintext.data(),
                          static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(
                fmt::format("Encryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(
                fmt::format("Encryption finalization failed: {}", GetOpenSSLError())));
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(kAesGcmTagBytes),
                            output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(
                fmt::format("Failed to get authentication tag: {}", GetOpenSSLError())));
    }
    output.resize(static_cast<size_t>(ciphertext_len) + kAesGcmTagBytes);
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}

Result<std::vector<uint8_t>, ProtocolFailure>
AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (auto check = ValidateKeyAndNonce(key, nonce); check.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(check).UnwrapErr());
    }
    if (ciphertext_with_tag.size() < kAesGcmTagBytes) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::AuthenticationFailed(
                fmt::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                            ciphertext_with_tag.size(), kAesGcmTagBytes)));
    }
    const size_t ciphertext_len = ciphertext_with_tag.size() - kAesGcmTagBytes;
    const std::span<const uint8_t> ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
    const std::span<const uint8_t> tag = ciphertext_with_tag.subspan(ciphertext_len);

    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(
                fmt::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(
                fmt::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &outlen,
                              associated_data.data(),
                              static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState(
                    fmt::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
    }
    std::vector<uint8_t> output(ciphertext_len);
    int plaintext_len = 0;
    if (!ciphertext.empty() &&
        EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                          ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(
                fmt::format("Decryption failed: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> tag_copy(tag.begin(), tag.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(kAesGcmTagBytes),
                            tag_copy.data()) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(
                fmt::format("Failed to set authentication tag: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        ERR_clear_error();
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::AuthenticationFailed(
                "Authentication tag verification failed"));
    }
    plaintext_len += final_len;
    output.resize(static_cast<size_t>(plaintext_len));
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}

}
