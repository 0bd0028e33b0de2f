#pragma once
#include "dynasty/core/result.hpp"
#include "dynasty/core/failures.hpp"
#include "e2ee/device.pb.h"

#include <cstdint>
#include <string>
#include <vector>

namespace dynasty::e2ee::interfaces {

/**
 * @brief Remote registry of published device bundles
 *
 * Calls may block on network I/O. Transport failures are reported as
 * DirectoryUnavailable.
 */
class IDirectoryService {
public:
    virtual ~IDirectoryService() = default;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> PublishDeviceBundle(
        const dynasty::proto::e2ee::DeviceRecord& record) = 0;

    [[nodiscard]] virtual Result<std::vector<dynasty::proto::e2ee::DeviceRecord>, ProtocolFailure>
    FetchDeviceBundles(const std::string& user_id) = 0;

    /// Marks a one-time pre-key as used so it is never handed out again.
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> ConsumeOneTimePreKey(
        const std::string& user_id,
        const std::string& device_id,
        uint32_t key_id) = 0;
};

}
