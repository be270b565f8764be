#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace xchain {

using bridge_id = int16_t;
using chain_id = uint64_t;
using block_number = uint64_t;
using time_point = std::chrono::system_clock::time_point;

// Identifies one cross-chain message within a bridge.
// The bridge indexer decides how message_id is derived from native ids.
struct message_key {
    int64_t message_id = 0;
    bridge_id bridge = 0;

    friend bool operator==(const message_key& a, const message_key& b) {
        return a.message_id == b.message_id && a.bridge == b.bridge;
    }
    friend bool operator!=(const message_key& a, const message_key& b) {
        return !(a == b);
    }
    friend bool operator<(const message_key& a, const message_key& b) {
        return std::tie(a.bridge, a.message_id) < std::tie(b.bridge, b.message_id);
    }
};

struct message_key_hash {
    std::size_t operator()(const message_key& k) const noexcept {
        auto h = std::hash<int64_t>{}(k.message_id);
        return h ^ (static_cast<std::size_t>(static_cast<uint16_t>(k.bridge)) * 0x9e3779b97f4a7c15ull);
    }
};

enum class message_status {
    initiated,
    completed,
    failed
};

enum class transfer_type {
    erc20,
    erc721,
    native,
    erc1155
};

// Final-storage projection of a message. Byte fields are hex strings.
struct crosschain_message {
    int64_t id = 0;
    bridge_id bridge = 0;
    message_status status = message_status::initiated;
    chain_id src_chain_id = 0;
    std::optional<chain_id> dst_chain_id;
    int64_t init_timestamp = 0;
    std::optional<int64_t> last_update_timestamp;
    std::optional<std::string> native_id;
    std::optional<std::string> src_tx_hash;
    std::optional<std::string> dst_tx_hash;
    std::optional<std::string> sender_address;
    std::optional<std::string> recipient_address;
    std::optional<std::string> payload;

    friend bool operator==(const crosschain_message&, const crosschain_message&) = default;
};

struct crosschain_transfer {
    int64_t message_id = 0;
    bridge_id bridge = 0;
    int16_t index = 0;
    std::optional<transfer_type> type;
    chain_id token_src_chain_id = 0;
    chain_id token_dst_chain_id = 0;
    std::string src_amount = "0";
    std::string dst_amount = "0";
    std::string token_src_address;
    std::string token_dst_address;
    std::optional<std::string> sender_address;
    std::optional<std::string> recipient_address;
    std::vector<std::string> token_ids;

    friend bool operator==(const crosschain_transfer&, const crosschain_transfer&) = default;
};

// Result of consolidating a buffered entry.
// is_final decides whether the entry leaves both tiers after the flush.
struct consolidated_message {
    bool is_final = false;
    crosschain_message message;
    std::vector<crosschain_transfer> transfers;
};

// Cold-tier row: serialized buffer item keyed by message.
struct pending_row {
    message_key key;
    std::string payload;
    time_point created_at;
};

// Apply an upsert to an existing final-storage row. Only the columns that
// may legitimately change after the first insert are overwritten.
crosschain_message merge_message_update(const crosschain_message& existing,
                                        const crosschain_message& incoming);

std::string to_string(message_status s);
std::optional<message_status> parse_message_status(const std::string& s);

std::string to_string(transfer_type t);
std::optional<transfer_type> parse_transfer_type(const std::string& s);

int64_t to_unix_millis(time_point t);
time_point from_unix_millis(int64_t ms);

void to_json(nlohmann::json& j, const message_key& k);
void from_json(const nlohmann::json& j, message_key& k);
void to_json(nlohmann::json& j, const crosschain_message& m);
void from_json(const nlohmann::json& j, crosschain_message& m);
void to_json(nlohmann::json& j, const crosschain_transfer& t);
void from_json(const nlohmann::json& j, crosschain_transfer& t);

} // namespace xchain
