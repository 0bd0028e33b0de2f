#pragma once
#include "dynasty/core/clock.hpp"
#include "dynasty/core/failures.hpp"
#include "dynasty/core/result.hpp"
#include "dynasty/crypto/scoped_secret.hpp"
#include "dynasty/interfaces/i_audit_sink.hpp"
#include "dynasty/interfaces/i_directory_service.hpp"
#include "dynasty/interfaces/i_message_sink.hpp"
#include "dynasty/interfaces/i_secure_key_storage.hpp"
#include "e2ee/device.pb.h"
#include "e2ee/envelope.pb.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace dynasty::e2ee::test_helpers {

using interfaces::AuditEventType;
using interfaces::AuditMetadata;
namespace pb = dynasty::proto::e2ee;

class ManualClock {
public:
    explicit ManualClock(TimePoint start = FromUnixMillis(1'700'000'000'000))
        : now_(std::make_shared<std::atomic<Clock::rep>>(start.time_since_epoch().count())) {}

    [[nodiscard]] TimePoint Now() const {
        return TimePoint(Clock::duration(now_->load()));
    }

    void Advance(const Clock::duration by) {
        now_->fetch_add(by.count());
    }

    [[nodiscard]] ClockFn Fn() const {
        auto now = now_;
        return [now] { return TimePoint(Clock::duration(now->load())); };
    }

private:
    std::shared_ptr<std::atomic<Clock::rep>> now_;
};

class InMemoryKeyStorage final : public interfaces::ISecureKeyStorage {
public:
    Result<Unit, ProtocolFailure> Set(const std::string& key, std::span<const uint8_t> value) override {
        std::lock_guard guard(lock_);
        if (fail_writes || failing_keys_.contains(key)) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::StorageFailure("injected write failure"));
        }
        if (throw_on_write) {
            throw std::runtime_error("keychain unavailable");
        }
        values_[key] = std::vector<uint8_t>(value.begin(), value.end());
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::optional<crypto::ScopedSecret>, ProtocolFailure> Get(const std::string& key) override {
        std::lock_guard guard(lock_);
        if (fail_reads) {
            return Result<std::optional<crypto::ScopedSecret>, ProtocolFailure>::Err(
                ProtocolFailure::StorageFailure("injected read failure"));
        }
        const auto it = values_.find(key);
        if (it == values_.end()) {
            return Result<std::optional<crypto::ScopedSecret>, ProtocolFailure>::Ok(std::nullopt);
        }
        return Result<std::optional<crypto::ScopedSecret>, ProtocolFailure>::Ok(
            crypto::ScopedSecret::Copy(it->second));
    }

    Result<Unit, ProtocolFailure> Delete(const std::string& key) override {
        std::lock_guard guard(lock_);
        if (fail_writes || failing_keys_.contains(key)) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::StorageFailure("injected delete failure"));
        }
        values_.erase(key);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    [[nodiscard]] bool Contains(const std::string& key) const {
        std::lock_guard guard(lock_);
        return values_.contains(key);
    }

    [[nodiscard]] std::optional<std::vector<uint8_t>> Raw(const std::string& key) const {
        std::lock_guard guard(lock_);
        const auto it = values_.find(key);
        if (it == values_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void PutRaw(const std::string& key, std::vector<uint8_t> value) {
        std::lock_guard guard(lock_);
        values_[key] = std::move(value);
    }

    [[nodiscard]] size_t CountWithPrefix(const std::string& prefix) const {
        std::lock_guard guard(lock_);
        return static_cast<size_t>(std::count_if(values_.begin(), values_.end(), [&prefix](const auto& entry) {
            return entry.first.starts_with(prefix);
        }));
    }

    /// Writes and deletes of this key fail until ClearFailures.
    void FailWritesTo(const std::string& key) {
        std::lock_guard guard(lock_);
        failing_keys_.insert(key);
    }

    void ClearFailures() {
        std::lock_guard guard(lock_);
        failing_keys_.clear();
    }

    std::atomic<bool> fail_writes{false};
    std::atomic<bool> fail_reads{false};
    std::atomic<bool> throw_on_write{false};

private:
    mutable std::mutex lock_;
    std::map<std::string, std::vector<uint8_t>> values_;
    std::set<std::string> failing_keys_;
};

/// Directory that hands out each one-time pre-key once, like the real service.
class InMemoryDirectory final : public interfaces::IDirectoryService {
public:
    Result<Unit, ProtocolFailure> PublishDeviceBundle(const pb::DeviceRecord& record) override {
        std::lock_guard guard(lock_);
        ++publish_calls_;
        if (fail_publish) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::DirectoryUnavailable("injected publish failure"));
        }
        records_[record.user_id()][record.device_id()] = record;
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::vector<pb::DeviceRecord>, ProtocolFailure> FetchDeviceBundles(const std::string& user_id) override {
        std::lock_guard guard(lock_);
        if (throw_on_fetch) {
            throw std::runtime_error("connection reset");
        }
        if (fail_fetch) {
            return Result<std::vector<pb::DeviceRecord>, ProtocolFailure>::Err(
                ProtocolFailure::DirectoryUnavailable("injected fetch failure"));
        }
        std::vector<pb::DeviceRecord> bundles;
        if (const auto it = records_.find(user_id); it != records_.end()) {
            for (const auto& [device_id, record] : it->second) {
                bundles.push_back(record);
            }
        }
        return Result<std::vector<pb::DeviceRecord>, ProtocolFailure>::Ok(std::move(bundles));
    }

    Result<Unit, ProtocolFailure> ConsumeOneTimePreKey(
        const std::string& user_id,
        const std::string& device_id,
        const uint32_t key_id) override {
        std::lock_guard guard(lock_);
        consumed_.push_back(key_id);
        auto& record = records_[user_id][device_id];
        auto* keys = record.mutable_one_time_pre_keys();
        for (int i = 0; i < keys->size(); ++i) {
            if (keys->Get(i).id() == key_id) {
                keys->DeleteSubrange(i, 1);
                break;
            }
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    /// Stores a record as-is, bypassing any engine.
    void Put(const pb::DeviceRecord& record) {
        std::lock_guard guard(lock_);
        records_[record.user_id()][record.device_id()] = record;
    }

    [[nodiscard]] std::optional<pb::DeviceRecord> Find(const std::string& user_id, const std::string& device_id) const {
        std::lock_guard guard(lock_);
        const auto user = records_.find(user_id);
        if (user == records_.end()) {
            return std::nullopt;
        }
        const auto device = user->second.find(device_id);
        if (device == user->second.end()) {
            return std::nullopt;
        }
        return device->second;
    }

    [[nodiscard]] std::vector<uint32_t> ConsumedKeyIds() const {
        std::lock_guard guard(lock_);
        return consumed_;
    }

    [[nodiscard]] size_t PublishCalls() const {
        std::lock_guard guard(lock_);
        return publish_calls_;
    }

    std::atomic<bool> fail_publish{false};
    std::atomic<bool> fail_fetch{false};
    std::atomic<bool> throw_on_fetch{false};

private:
    mutable std::mutex lock_;
    std::map<std::string, std::map<std::string, pb::DeviceRecord>> records_;
    std::vector<uint32_t> consumed_;
    size_t publish_calls_ = 0;
};

struct RecordedAuditEvent {
    AuditEventType type;
    std::string description;
    AuditMetadata metadata;
};

class RecordingAuditSink final : public interfaces::IAuditSink {
public:
    Result<Unit, ProtocolFailure> LogEvent(
        const AuditEventType type,
        const std::string& description,
        const AuditMetadata& metadata) override {
        if (throw_on_log) {
            throw std::runtime_error("audit backend offline");
        }
        if (fail_log) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::StorageFailure("audit log full"));
        }
        RecordedAuditEvent event{type, description, metadata};
        {
            std::lock_guard guard(lock_);
            events_.push_back(event);
        }
        if (on_event) {
            on_event(event);
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    [[nodiscard]] size_t Count(const AuditEventType type) const {
        std::lock_guard guard(lock_);
        return static_cast<size_t>(std::count_if(events_.begin(), events_.end(),
                                                 [type](const auto& event) { return event.type == type; }));
    }

    [[nodiscard]] std::vector<RecordedAuditEvent> Events() const {
        std::lock_guard guard(lock_);
        return events_;
    }

    std::atomic<bool> fail_log{false};
    std::atomic<bool> throw_on_log{false};
    // Set before the sink is shared; runs on the logging thread.
    std::function<void(const RecordedAuditEvent&)> on_event;

private:
    mutable std::mutex lock_;
    std::vector<RecordedAuditEvent> events_;
};

struct DeliveredMessage {
    std::string user_id;
    std::string device_id;
    pb::EncryptedMessage message;
};

class RecordingMessageSink final : public interfaces::IMessageSink {
public:
    Result<Unit, ProtocolFailure> Deliver(
        const std::string& recipient_user_id,
        const std::string& recipient_device_id,
        const pb::EncryptedMessage& message) override {
        std::lock_guard guard(lock_);
        if (recipient_device_id == reject_device_id) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::DirectoryUnavailable("mailbox unavailable"));
        }
        delivered_.push_back(DeliveredMessage{recipient_user_id, recipient_device_id, message});
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    [[nodiscard]] std::vector<DeliveredMessage> Delivered() const {
        std::lock_guard guard(lock_);
        return delivered_;
    }

    std::string reject_device_id;

private:
    mutable std::mutex lock_;
    std::vector<DeliveredMessage> delivered_;
};

}
