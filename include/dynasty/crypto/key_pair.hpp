#pragma once
#include "dynasty/crypto/scoped_secret.hpp"

#include <cstdint>
#include <vector>

namespace dynasty::e2ee::crypto {

/// X25519 key pair handed across component boundaries. The private half is
/// wiped when the pair goes out of scope.
struct KeyPair {
    ScopedSecret private_key;
    std::vector<uint8_t> public_key;
};

}
