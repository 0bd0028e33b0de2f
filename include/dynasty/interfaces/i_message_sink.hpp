#pragma once
#include "dynasty/core/result.hpp"
#include "dynasty/core/failures.hpp"
#include "e2ee/envelope.pb.h"

#include <string>

namespace dynasty::e2ee::interfaces {

/// Delivery capability implemented by the messaging layer above the engine.
class IMessageSink {
public:
    virtual ~IMessageSink() = default;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> Deliver(
        const std::string& recipient_user_id,
        const std::string& recipient_device_id,
        const dynasty::proto::e2ee::EncryptedMessage& message) = 0;
};

}
