#include "relay_message.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace xchain {

namespace {

std::string required_string(const nlohmann::json& body, const char* name) {
    auto it = body.find(name);
    if (it == body.end() || !it->is_string()) {
        throw std::invalid_argument(std::string("observation field '") + name + "' is required");
    }
    return it->get<std::string>();
}

std::string optional_string(const nlohmann::json& body, const char* name) {
    auto it = body.find(name);
    if (it == body.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

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

crosschain_transfer build_transfer(const token_transfer& t, const message_key& key,
                                   chain_id src_chain, std::optional<chain_id> dst_chain) {
    crosschain_transfer out;
    out.message_id = key.message_id;
    out.bridge = key.bridge;
    // One transfer per relayed message.
    out.index = 0;
    out.token_src_chain_id = src_chain;
    out.token_dst_chain_id = dst_chain.value_or(src_chain);

    if (t.source) {
        const auto& src = *t.source;
        if (!is_decimal_amount(src.amount)) {
            throw std::invalid_argument("invalid transfer amount '" + src.amount + "' for message " +
                                        std::to_string(key.message_id));
        }
        out.type = src.type;
        out.src_amount = src.amount;
        out.dst_amount = src.amount;
        out.token_src_address = src.token_src_address;
        out.token_dst_address = src.token_dst_address;
        out.sender_address = src.sender;
        out.recipient_address = src.recipient;
        out.token_ids = src.token_ids;
    }

    if (t.destination) {
        out.recipient_address = t.destination->recipient;
        if (t.destination->amount) {
            if (!is_decimal_amount(*t.destination->amount)) {
                throw std::invalid_argument("invalid received amount '" + *t.destination->amount +
                                            "' for message " + std::to_string(key.message_id));
            }
            out.dst_amount = *t.destination->amount;
        }
    }

    return out;
}

} // namespace

bool is_decimal_amount(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

void relay_message::apply(const observation& obs) {
    const auto& body = obs.body;

    switch (obs.kind) {
        case observation_kind::sent: {
            send_leg leg;
            leg.chain = obs.chain;
            leg.timestamp = obs.timestamp;
            leg.tx_hash = obs.tx_hash;
            if (auto it = body.find("destination_chain_id"); it != body.end() && !it->is_null()) {
                leg.destination_chain = it->get<chain_id>();
            }
            leg.native_id = optional_string(body, "native_id");
            leg.sender = required_string(body, "sender");
            leg.recipient = required_string(body, "recipient");
            leg.payload = optional_string(body, "payload");
            send = std::move(leg);
            break;
        }
        case observation_kind::received:
            receive = receive_leg{obs.chain, obs.timestamp, obs.tx_hash};
            break;
        case observation_kind::executed:
            execution = execution_leg{true, obs.chain, obs.timestamp, obs.tx_hash};
            break;
        case observation_kind::execution_failed:
            // A retried execution may already have succeeded.
            if (!execution || !execution->succeeded) {
                execution = execution_leg{false, obs.chain, obs.timestamp, obs.tx_hash};
            }
            break;
        case observation_kind::transfer_sent: {
            transfer_source src;
            auto type_str = required_string(body, "transfer_type");
            auto type = parse_transfer_type(type_str);
            if (!type) throw std::invalid_argument("unknown transfer type: " + type_str);
            src.type = *type;
            src.token_src_address = required_string(body, "token_src_address");
            src.token_dst_address = optional_string(body, "token_dst_address");
            src.amount = required_string(body, "amount");
            if (!is_decimal_amount(src.amount)) {
                throw std::invalid_argument("invalid transfer amount: " + src.amount);
            }
            src.sender = optional_string(body, "sender");
            src.recipient = optional_string(body, "recipient");
            if (auto it = body.find("token_ids"); it != body.end() && it->is_array()) {
                src.token_ids = it->get<std::vector<std::string>>();
            }
            if (!transfer) transfer.emplace();
            transfer->source = std::move(src);
            break;
        }
        case observation_kind::transfer_received: {
            transfer_destination dst;
            dst.recipient = required_string(body, "recipient");
            if (auto it = body.find("amount"); it != body.end() && it->is_string()) {
                dst.amount = it->get<std::string>();
            }
            if (!transfer) transfer.emplace();
            transfer->destination = std::move(dst);
            break;
        }
    }
}

std::optional<consolidated_message> relay_message::consolidate(const message_key& key) const {
    if (!send) return std::nullopt;

    consolidated_message out;
    auto& m = out.message;
    m.id = key.message_id;
    m.bridge = key.bridge;
    m.src_chain_id = send->chain;
    m.init_timestamp = send->timestamp;
    m.native_id = send->native_id.empty() ? std::nullopt : std::optional<std::string>(send->native_id);
    m.src_tx_hash = send->tx_hash;
    m.sender_address = send->sender;
    m.recipient_address = send->recipient;
    m.payload = send->payload;
    m.dst_chain_id = send->destination_chain;

    if (execution) {
        m.status = execution->succeeded ? message_status::completed : message_status::failed;
    } else {
        m.status = message_status::initiated;
    }

    if (receive) {
        m.dst_chain_id = receive->chain;
        m.dst_tx_hash = receive->tx_hash;
        m.last_update_timestamp = receive->timestamp;
    }

    if (transfer) {
        out.transfers.push_back(build_transfer(*transfer, key, send->chain, m.dst_chain_id));
    }

    bool transfer_complete = !transfer || transfer->is_complete();
    out.is_final = execution && execution->succeeded && transfer_complete;
    return out;
}

void to_json(nlohmann::json& j, const relay_message& m) {
    j = nlohmann::json::object();

    if (m.send) {
        nlohmann::json s{
            {"chain", m.send->chain},
            {"timestamp", m.send->timestamp},
            {"tx_hash", m.send->tx_hash},
            {"native_id", m.send->native_id},
            {"sender", m.send->sender},
            {"recipient", m.send->recipient},
            {"payload", m.send->payload},
        };
        put_optional(s, "destination_chain", m.send->destination_chain);
        j["send"] = std::move(s);
    } else {
        j["send"] = nullptr;
    }

    if (m.receive) {
        j["receive"] = {{"chain", m.receive->chain},
                        {"timestamp", m.receive->timestamp},
                        {"tx_hash", m.receive->tx_hash}};
    } else {
        j["receive"] = nullptr;
    }

    if (m.execution) {
        j["execution"] = {{"succeeded", m.execution->succeeded},
                          {"chain", m.execution->chain},
                          {"timestamp", m.execution->timestamp},
                          {"tx_hash", m.execution->tx_hash}};
    } else {
        j["execution"] = nullptr;
    }

    if (m.transfer) {
        nlohmann::json t = nlohmann::json::object();
        if (const auto& src = m.transfer->source) {
            t["source"] = {{"type", to_string(src->type)},
                           {"token_src_address", src->token_src_address},
                           {"token_dst_address", src->token_dst_address},
                           {"amount", src->amount},
                           {"sender", src->sender},
                           {"recipient", src->recipient},
                           {"token_ids", src->token_ids}};
        } else {
            t["source"] = nullptr;
        }
        if (const auto& dst = m.transfer->destination) {
            nlohmann::json d{{"recipient", dst->recipient}};
            put_optional(d, "amount", dst->amount);
            t["destination"] = std::move(d);
        } else {
            t["destination"] = nullptr;
        }
        j["transfer"] = std::move(t);
    } else {
        j["transfer"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, relay_message& m) {
    m = relay_message{};

    if (auto it = j.find("send"); it != j.end() && !it->is_null()) {
        send_leg s;
        it->at("chain").get_to(s.chain);
        it->at("timestamp").get_to(s.timestamp);
        it->at("tx_hash").get_to(s.tx_hash);
        it->at("native_id").get_to(s.native_id);
        it->at("sender").get_to(s.sender);
        it->at("recipient").get_to(s.recipient);
        it->at("payload").get_to(s.payload);
        get_optional(*it, "destination_chain", s.destination_chain);
        m.send = std::move(s);
    }

    if (auto it = j.find("receive"); it != j.end() && !it->is_null()) {
        receive_leg r;
        it->at("chain").get_to(r.chain);
        it->at("timestamp").get_to(r.timestamp);
        it->at("tx_hash").get_to(r.tx_hash);
        m.receive = std::move(r);
    }

    if (auto it = j.find("execution"); it != j.end() && !it->is_null()) {
        execution_leg e;
        it->at("succeeded").get_to(e.succeeded);
        it->at("chain").get_to(e.chain);
        it->at("timestamp").get_to(e.timestamp);
        it->at("tx_hash").get_to(e.tx_hash);
        m.execution = std::move(e);
    }

    if (auto it = j.find("transfer"); it != j.end() && !it->is_null()) {
        token_transfer t;
        if (auto s = it->find("source"); s != it->end() && !s->is_null()) {
            transfer_source src;
            auto type = parse_transfer_type(s->at("type").get<std::string>());
            if (!type) throw std::invalid_argument("unknown transfer type in payload");
            src.type = *type;
            s->at("token_src_address").get_to(src.token_src_address);
            s->at("token_dst_address").get_to(src.token_dst_address);
            s->at("amount").get_to(src.amount);
            s->at("sender").get_to(src.sender);
            s->at("recipient").get_to(src.recipient);
            s->at("token_ids").get_to(src.token_ids);
            t.source = std::move(src);
        }
        if (auto d = it->find("destination"); d != it->end() && !d->is_null()) {
            transfer_destination dst;
            d->at("recipient").get_to(dst.recipient);
            get_optional(*d, "amount", dst.amount);
            t.destination = std::move(dst);
        }
        m.transfer = std::move(t);
    }
}

} // namespace xchain
