#pragma once

#include "dynasty/core/clock.hpp"
#include "dynasty/core/failures.hpp"
#include "dynasty/core/result.hpp"
#include "dynasty/crypto/scoped_secret.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/message_lite.h>
#include <google/protobuf/timestamp.pb.h>

#include <chrono>
#include <span>
#include <string>
#include <vector>

namespace dynasty::e2ee::detail {

inline void SetTimestamp(google::protobuf::Timestamp* timestamp, const TimePoint tp) {
    const auto epoch = tp.time_since_epoch();
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(epoch);
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(epoch - seconds);
    timestamp->set_seconds(seconds.count());
    timestamp->set_nanos(static_cast<int32_t>(nanos.count()));
}

[[nodiscard]] inline TimePoint FromTimestamp(const google::protobuf::Timestamp& timestamp) {
    const auto since_epoch = std::chrono::seconds(timestamp.seconds()) +
                             std::chrono::nanoseconds(timestamp.nanos());
    return TimePoint(std::chrono::duration_cast<Clock::duration>(since_epoch));
}

[[nodiscard]] inline std::vector<uint8_t> ToBytes(const std::string& field) {
    return {field.begin(), field.end()};
}

[[nodiscard]] inline crypto::ScopedSecret ToSecret(const std::string& field) {
    return crypto::ScopedSecret::Copy(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(field.data()), field.size()));
}

[[nodiscard]] inline std::span<const uint8_t> AsSpan(const std::string& field) {
    return {reinterpret_cast<const uint8_t*>(field.data()), field.size()};
}

inline void WipeString(std::string& value) {
    if (!value.empty()) {
        sodium_memzero(value.data(), value.size());
        value.clear();
    }
}

inline Result<std::vector<uint8_t>, ProtocolFailure> SerializeDeterministic(
    const google::protobuf::MessageLite& message) {
    std::string output;
    {
        google::protobuf::io::StringOutputStream stream(&output);
        google::protobuf::io::CodedOutputStream coded_out(&stream);
        coded_out.SetSerializationDeterministic(true);
        if (!message.SerializeToCodedStream(&coded_out) || coded_out.HadError()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Encode("Failed to serialize protobuf deterministically"));
        }
    }
    std::vector<uint8_t> bytes(output.begin(), output.end());
    WipeString(output);
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(bytes));
}

template<typename Message>
Result<Message, ProtocolFailure> ParseMessage(std::span<const uint8_t> bytes, const char* what) {
    Message message;
    if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<Message, ProtocolFailure>::Err(
            ProtocolFailure::Decode(std::string("Failed to parse ") + what));
    }
    return Result<Message, ProtocolFailure>::Ok(std::move(message));
}

}
