#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <string>

namespace xchain {

// Kinds of decoded bridge events delivered by the upstream log decoder.
enum class observation_kind {
    sent,
    received,
    executed,
    execution_failed,
    transfer_sent,
    transfer_received
};

// One partial observation of a cross-chain message, already decoded from a
// chain log. Kind-specific fields stay in body.
struct observation {
    message_key key;
    chain_id chain = 0;
    block_number block = 0;
    observation_kind kind = observation_kind::sent;
    int64_t timestamp = 0;
    std::string tx_hash;
    nlohmann::json body = nlohmann::json::object();
};

std::optional<observation_kind> parse_observation_kind(const std::string& s);
std::string to_string(observation_kind kind);

// Decode a JSON observation. Throws std::exception on malformed input.
observation parse_observation(std::span<const char> payload);

} // namespace xchain
