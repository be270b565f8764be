#include "types.hpp"
#include <stdexcept>

namespace xchain {

namespace {

template <typename T>
void put_optional(nlohmann::json& j, const char* name, const std::optional<T>& v) {
    if (v) j[name] = *v;
    else   j[name] = nullptr;
}

template <typename T>
void get_optional(const nlohmann::json& j, const char* name, std::optional<T>& out) {
    auto it = j.find(name);
    if (it == j.end() || it->is_null()) {
        out.reset();
        return;
    }
    out = it->get<T>();
}

} // namespace

crosschain_message merge_message_update(const crosschain_message& existing,
                                        const crosschain_message& incoming) {
    crosschain_message merged = existing;
    merged.status = incoming.status;
    merged.dst_chain_id = incoming.dst_chain_id;
    merged.dst_tx_hash = incoming.dst_tx_hash;
    merged.last_update_timestamp = incoming.last_update_timestamp;
    merged.sender_address = incoming.sender_address;
    merged.recipient_address = incoming.recipient_address;
    merged.payload = incoming.payload;
    return merged;
}

std::string to_string(message_status s) {
    switch (s) {
        case message_status::initiated: return "initiated";
        case message_status::completed: return "completed";
        case message_status::failed:    return "failed";
    }
    return "initiated";
}

std::optional<message_status> parse_message_status(const std::string& s) {
    if (s == "initiated") return message_status::initiated;
    if (s == "completed") return message_status::completed;
    if (s == "failed")    return message_status::failed;
    return std::nullopt;
}

std::string to_string(transfer_type t) {
    switch (t) {
        case transfer_type::erc20:   return "erc20";
        case transfer_type::erc721:  return "erc721";
        case transfer_type::native:  return "native";
        case transfer_type::erc1155: return "erc1155";
    }
    return "erc20";
}

std::optional<transfer_type> parse_transfer_type(const std::string& s) {
    if (s == "erc20")   return transfer_type::erc20;
    if (s == "erc721")  return transfer_type::erc721;
    if (s == "native")  return transfer_type::native;
    if (s == "erc1155") return transfer_type::erc1155;
    return std::nullopt;
}

int64_t to_unix_millis(time_point t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()).count();
}

time_point from_unix_millis(int64_t ms) {
    return time_point(std::chrono::duration_cast<time_point::duration>(
        std::chrono::milliseconds(ms)));
}

void to_json(nlohmann::json& j, const message_key& k) {
    j = nlohmann::json{{"message_id", k.message_id}, {"bridge_id", k.bridge}};
}

void from_json(const nlohmann::json& j, message_key& k) {
    j.at("message_id").get_to(k.message_id);
    j.at("bridge_id").get_to(k.bridge);
}

void to_json(nlohmann::json& j, const crosschain_message& m) {
    j = nlohmann::json{
        {"id", m.id},
        {"bridge_id", m.bridge},
        {"status", to_string(m.status)},
        {"src_chain_id", m.src_chain_id},
        {"init_timestamp", m.init_timestamp},
    };
    put_optional(j, "dst_chain_id", m.dst_chain_id);
    put_optional(j, "last_update_timestamp", m.last_update_timestamp);
    put_optional(j, "native_id", m.native_id);
    put_optional(j, "src_tx_hash", m.src_tx_hash);
    put_optional(j, "dst_tx_hash", m.dst_tx_hash);
    put_optional(j, "sender_address", m.sender_address);
    put_optional(j, "recipient_address", m.recipient_address);
    put_optional(j, "payload", m.payload);
}

void from_json(const nlohmann::json& j, crosschain_message& m) {
    j.at("id").get_to(m.id);
    j.at("bridge_id").get_to(m.bridge);
    auto status = parse_message_status(j.at("status").get<std::string>());
    if (!status) throw std::runtime_error("invalid message status: " + j.at("status").get<std::string>());
    m.status = *status;
    j.at("src_chain_id").get_to(m.src_chain_id);
    j.at("init_timestamp").get_to(m.init_timestamp);
    get_optional(j, "dst_chain_id", m.dst_chain_id);
    get_optional(j, "last_update_timestamp", m.last_update_timestamp);
    get_optional(j, "native_id", m.native_id);
    get_optional(j, "src_tx_hash", m.src_tx_hash);
    get_optional(j, "dst_tx_hash", m.dst_tx_hash);
    get_optional(j, "sender_address", m.sender_address);
    get_optional(j, "recipient_address", m.recipient_address);
    get_optional(j, "payload", m.payload);
}

void to_json(nlohmann::json& j, const crosschain_transfer& t) {
    j = nlohmann::json{
        {"message_id", t.message_id},
        {"bridge_id", t.bridge},
        {"index", t.index},
        {"token_src_chain_id", t.token_src_chain_id},
        {"token_dst_chain_id", t.token_dst_chain_id},
        {"src_amount", t.src_amount},
        {"dst_amount", t.dst_amount},
        {"token_src_address", t.token_src_address},
        {"token_dst_address", t.token_dst_address},
        {"token_ids", t.token_ids},
    };
    if (t.type) j["type"] = to_string(*t.type);
    else        j["type"] = nullptr;
    put_optional(j, "sender_address", t.sender_address);
    put_optional(j, "recipient_address", t.recipient_address);
}

void from_json(const nlohmann::json& j, crosschain_transfer& t) {
    j.at("message_id").get_to(t.message_id);
    j.at("bridge_id").get_to(t.bridge);
    j.at("index").get_to(t.index);
    j.at("token_src_chain_id").get_to(t.token_src_chain_id);
    j.at("token_dst_chain_id").get_to(t.token_dst_chain_id);
    j.at("src_amount").get_to(t.src_amount);
    j.at("dst_amount").get_to(t.dst_amount);
    j.at("token_src_address").get_to(t.token_src_address);
    j.at("token_dst_address").get_to(t.token_dst_address);
    j.at("token_ids").get_to(t.token_ids);

    t.type.reset();
    if (auto it = j.find("type"); it != j.end() && !it->is_null()) {
        t.type = parse_transfer_type(it->get<std::string>());
        if (!t.type) throw std::runtime_error("invalid transfer type: " + it->get<std::string>());
    }
    get_optional(j, "sender_address", t.sender_address);
    get_optional(j, "recipient_address", t.recipient_address);
}

} // namespace xchain
