#pragma once

namespace dynasty::e2ee::interfaces {

class IIdentityObserver {
public:
    virtual ~IIdentityObserver() = default;
    virtual void OnIdentityReplaced() = 0;
};

}
