#pragma once
#include "dynasty/core/result.hpp"
#include "dynasty/core/failures.hpp"
#include "dynasty/crypto/scoped_secret.hpp"
#include "dynasty/interfaces/i_secure_key_storage.hpp"
#include "e2ee/key_material.pb.h"

#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>

namespace dynasty::e2ee::identity {

/**
 * @brief The only component that writes private key bytes
 *
 * Identity records, rotating keys and serialized sessions all pass through
 * here on their way to ISecureKeyStorage. Serialized buffers are wiped as
 * soon as the storage call returns. Storage errors surface as
 * StorageFailure; an exception thrown by the storage backend is converted
 * to StorageFailure as well.
 */
class KeyMaterialStore {
public:
    explicit KeyMaterialStore(std::shared_ptr<interfaces::ISecureKeyStorage> storage);

    [[nodiscard]] Result<Unit, ProtocolFailure> SaveIdentity(
        const dynasty::proto::e2ee::IdentityRecord& record);
    [[nodiscard]] Result<std::optional<dynasty::proto::e2ee::IdentityRecord>, ProtocolFailure> LoadIdentity();

    [[nodiscard]] Result<Unit, ProtocolFailure> SaveRotatingKey(
        const dynasty::proto::e2ee::RotatingKeyRecord& record);
    [[nodiscard]] Result<std::optional<dynasty::proto::e2ee::RotatingKeyRecord>, ProtocolFailure> LoadRotatingKey(
        const std::string& key_id);
    [[nodiscard]] Result<Unit, ProtocolFailure> DeleteRotatingKey(const std::string& key_id);

    [[nodiscard]] Result<Unit, ProtocolFailure> SaveRotatingKeyIndex(
        const dynasty::proto::e2ee::RotatingKeyIndex& index);
    [[nodiscard]] Result<std::optional<dynasty::proto::e2ee::RotatingKeyIndex>, ProtocolFailure> LoadRotatingKeyIndex();

    /// Opaque records (serialized sessions and their index).
    [[nodiscard]] Result<Unit, ProtocolFailure> SaveBlob(const std::string& key, std::span<const uint8_t> bytes);
    [[nodiscard]] Result<std::optional<crypto::ScopedSecret>, ProtocolFailure> LoadBlob(const std::string& key);
    [[nodiscard]] Result<Unit, ProtocolFailure> DeleteBlob(const std::string& key);

private:
    template<typename Message>
    Result<Unit, ProtocolFailure> SaveMessage(const std::string& key, const Message& message);

    template<typename Message>
    Result<std::optional<Message>, ProtocolFailure> LoadMessage(const std::string& key, const char* what);

    std::shared_ptr<interfaces::ISecureKeyStorage> storage_;
    std::mutex lock_;
};

}
