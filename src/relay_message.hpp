#pragma once

#include "observation.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace xchain {

struct send_leg {
    chain_id chain = 0;
    int64_t timestamp = 0;
    std::string tx_hash;
    std::optional<chain_id> destination_chain;
    std::string native_id;
    std::string sender;
    std::string recipient;
    std::string payload;
};

struct receive_leg {
    chain_id chain = 0;
    int64_t timestamp = 0;
    std::string tx_hash;
};

struct execution_leg {
    bool succeeded = false;
    chain_id chain = 0;
    int64_t timestamp = 0;
    std::string tx_hash;
};

struct transfer_source {
    transfer_type type = transfer_type::erc20;
    std::string token_src_address;
    std::string token_dst_address;
    std::string amount;
    std::string sender;
    std::string recipient;
    std::vector<std::string> token_ids;
};

struct transfer_destination {
    std::string recipient;
    std::optional<std::string> amount;
};

struct token_transfer {
    std::optional<transfer_source> source;
    std::optional<transfer_destination> destination;

    bool is_complete() const { return source.has_value() && destination.has_value(); }
};

// Working state of a relayed message, built from observations on both the
// source and destination chains.
//
// Consolidatable once the send event is known (it provides init_timestamp).
// Final once execution succeeded and the token transfer, if any, has both
// legs. Failed executions stay non-final since they can be retried.
struct relay_message {
    std::optional<send_leg> send;
    std::optional<receive_leg> receive;
    std::optional<execution_leg> execution;
    std::optional<token_transfer> transfer;

    // Fold one observation into the state. Throws std::invalid_argument when
    // the observation body lacks required fields.
    void apply(const observation& obs);

    std::optional<consolidated_message> consolidate(const message_key& key) const;
};

// Returns true if s is a non-empty unsigned decimal integer.
bool is_decimal_amount(const std::string& s);

void to_json(nlohmann::json& j, const relay_message& m);
void from_json(const nlohmann::json& j, relay_message& m);

} // namespace xchain
