#include "dynasty/identity/key_material_store.hpp"
#include "dynasty/protocol/constants.hpp"
#include "dynasty/core/logging.hpp"
#include "core/proto_helpers.hpp"

#include <stdexcept>

namespace dynasty::e2ee::identity {
    namespace pb = dynasty::proto::e2ee;

    namespace {
        constexpr std::string_view kTag = "key-store";

        std::string RotationKey(const std::string& key_id) {
            return std::string(kRotationKeyPrefix) + key_id;
        }
    }

    KeyMaterialStore::KeyMaterialStore(std::shared_ptr<interfaces::ISecureKeyStorage> storage)
        : storage_(std::move(storage)) {
        if (!storage_) {
            throw std::invalid_argument("KeyMaterialStore requires a secure key storage");
        }
    }

    Result<Unit, ProtocolFailure> KeyMaterialStore::SaveBlob(
        const std::string& key,
        std::span<const uint8_t> bytes) {
        std::lock_guard guard(lock_);
        try {
            auto result = storage_->Set(key, bytes);
            if (result.IsErr()) {
                DYNASTY_LOG_WARN(kTag, "write of '{}' failed: {}", key, result.UnwrapErr().message);
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::StorageFailure(std::move(result).UnwrapErr().message));
            }
            return result;
        } catch (const std::exception& ex) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::StorageFailure(fmt::format("Secure storage write threw: {}", ex.what())));
        }
    }

    Result<std::optional<crypto::ScopedSecret>, ProtocolFailure> KeyMaterialStore::LoadBlob(
        const std::string& key) {
        std::lock_guard guard(lock_);
        try {
            auto result = storage_->Get(key);
            if (result.IsErr()) {
                DYNASTY_LOG_WARN(kTag, "read of '{}' failed: {}", key, result.UnwrapErr().message);
                return Result<std::optional<crypto::ScopedSecret>, ProtocolFailure>::Err(
                    ProtocolFailure::StorageFailure(std::move(result).UnwrapErr().message));
            }
            return result;
        } catch (const std::exception& ex) {
            return Result<std::optional<crypto::ScopedSecret>, ProtocolFailure>::Err(
                ProtocolFailure::StorageFailure(fmt::format("Secure storage read threw: {}", ex.what())));
        }
    }

    Result<Unit, ProtocolFailure> KeyMaterialStore::DeleteBlob(const std::string& key) {
        std::lock_guard guard(lock_);
        try {
            auto result = storage_->Delete(key);
            if (result.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::StorageFailure(std::move(result).UnwrapErr().message));
            }
            return result;
        } catch (const std::exception& ex) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::StorageFailure(fmt::format("Secure storage delete threw: {}", ex.what())));
        }
    }

    template<typename Message>
    Result<Unit, ProtocolFailure> KeyMaterialStore::SaveMessage(
        const std::string& key,
        const Message& message) {
        auto bytes_result = detail::SerializeDeterministic(message);
        if (bytes_result.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(bytes_result).UnwrapErr());
        }
        crypto::ScopedSecret bytes(std::move(bytes_result).Unwrap());
        return SaveBlob(key, bytes.Span());
    }

    template<typename Message>
    Result<std::optional<Message>, ProtocolFailure> KeyMaterialStore::LoadMessage(
        const std::string& key,
        const char* what) {
        auto blob_result = LoadBlob(key);
        if (blob_result.IsErr()) {
            return Result<std::optional<Message>, ProtocolFailure>::Err(std::move(blob_result).UnwrapErr());
        }
        auto blob = std::move(blob_result).Unwrap();
        if (!blob.has_value()) {
            return Result<std::optional<Message>, ProtocolFailure>::Ok(std::nullopt);
        }
        auto parsed = detail::ParseMessage<Message>(blob->Span(), what);
        if (parsed.IsErr()) {
            return Result<std::optional<Message>, ProtocolFailure>::Err(std::move(parsed).UnwrapErr());
        }
        return Result<std::optional<Message>, ProtocolFailure>::Ok(std::move(parsed).Unwrap());
    }

    Result<Unit, ProtocolFailure> KeyMaterialStore::SaveIdentity(const pb::IdentityRecord& record) {
        return SaveMessage(std::string(kIdentityStorageKey), record);
    }

    Result<std::optional<pb::IdentityRecord>, ProtocolFailure> KeyMaterialStore::LoadIdentity() {
        return LoadMessage<pb::IdentityRecord>(std::string(kIdentityStorageKey), "identity record");
    }

    Result<Unit, ProtocolFailure> KeyMaterialStore::SaveRotatingKey(const pb::RotatingKeyRecord& record) {
        if (record.id().empty()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Rotating key record has no id"));
        }
        return SaveMessage(RotationKey(record.id()), record);
    }

    Result<std::optional<pb::RotatingKeyRecord>, ProtocolFailure> KeyMaterialStore::LoadRotatingKey(
        const std::string& key_id) {
        return LoadMessage<pb::RotatingKeyRecord>(RotationKey(key_id), "rotating key record");
    }

    Result<Unit, ProtocolFailure> KeyMaterialStore::DeleteRotatingKey(const std::string& key_id) {
        return DeleteBlob(RotationKey(key_id));
    }

    Result<Unit, ProtocolFailure> KeyMaterialStore::SaveRotatingKeyIndex(const pb::RotatingKeyIndex& index) {
        return SaveMessage(std::string(kRotationIndexStorageKey), index);
    }

    Result<std::optional<pb::RotatingKeyIndex>, ProtocolFailure> KeyMaterialStore::LoadRotatingKeyIndex() {
        return LoadMessage<pb::RotatingKeyIndex>(std::string(kRotationIndexStorageKey), "rotating key index");
    }
}
