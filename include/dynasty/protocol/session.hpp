#pragma once
#include "dynasty/core/bounded_ttl_cache.hpp"
#include "dynasty/core/clock.hpp"
#include "dynasty/crypto/key_pair.hpp"
#include "dynasty/crypto/scoped_secret.hpp"
#include "e2ee/envelope.pb.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dynasty::e2ee::protocol {

/// (sender ratchet public key, message index)
using SkippedKeyId = std::pair<std::vector<uint8_t>, uint32_t>;
using SkippedKeyCache = BoundedTtlCache<SkippedKeyId, crypto::ScopedSecret>;

struct ChainKey {
    crypto::ScopedSecret key;
    uint32_t index = 0;
};

/**
 * @brief Double Ratchet state of one session with one peer device
 *
 * `sending_chain.index` and `receiving_chain->index` are positions inside
 * the current chains and restart at zero on every DH ratchet step.
 * `messages_sent` and `messages_received` count every message over the
 * lifetime of the session and never decrease.
 *
 * Copyable so a decrypt attempt can run on a scratch copy that replaces
 * the original only when the message authenticates.
 */
struct SessionState {
    SessionState(const size_t max_skipped_keys, const Clock::duration skipped_key_lifetime)
        : skipped_message_keys(max_skipped_keys, skipped_key_lifetime) {}

    std::string session_id;
    std::string peer_user_id;
    std::string peer_device_id;
    bool is_initiator = false;

    crypto::ScopedSecret root_key;
    ChainKey sending_chain;
    std::optional<ChainKey> receiving_chain;
    crypto::KeyPair sending_ratchet;
    std::optional<std::vector<uint8_t>> receiving_ratchet_key;
    uint32_t previous_counter = 0;
    uint64_t messages_sent = 0;
    uint64_t messages_received = 0;
    SkippedKeyCache skipped_message_keys;

    // IK_initiator || IK_responder
    std::vector<uint8_t> associated_data;
    std::vector<uint8_t> remote_identity_key;
    // Responder side: ephemeral key of the hello the session was accepted from.
    std::vector<uint8_t> handshake_ephemeral_key;
    // Initiator side: attached to outbound messages until the peer answers.
    std::optional<dynasty::proto::e2ee::InitiatorHello> pending_hello;

    TimePoint created_at{};
    TimePoint last_activity{};
};

/// Read-only summary of a session.
struct SessionInfo {
    std::string session_id;
    std::string peer_user_id;
    std::string peer_device_id;
    bool is_initiator = false;
    uint64_t messages_sent = 0;
    uint64_t messages_received = 0;
    uint32_t sending_index = 0;
    uint32_t receiving_index = 0;
    uint32_t previous_counter = 0;
    size_t skipped_key_count = 0;
    bool awaiting_response = false;
    TimePoint created_at{};
    TimePoint last_activity{};
};

}
