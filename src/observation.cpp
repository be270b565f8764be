#include "observation.hpp"
#include <cstdint>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace xchain {

namespace {

// Reads an integer field, rejecting values that do not fit Int instead of
// letting them wrap into a different id.
template <typename Int>
Int integer_field(const nlohmann::json& j, const char* name) {
    const auto& v = j.at(name);
    if (!v.is_number_integer()) {
        throw std::invalid_argument(std::string("observation field '") + name + "' must be an integer");
    }
    bool fits = v.is_number_unsigned() ? std::in_range<Int>(v.get<uint64_t>())
                                       : std::in_range<Int>(v.get<int64_t>());
    if (!fits) {
        throw std::invalid_argument(std::string("observation field '") + name + "' out of range: " + v.dump());
    }
    return v.get<Int>();
}

} // namespace

std::optional<observation_kind> parse_observation_kind(const std::string& s) {
    if (s == "sent")              return observation_kind::sent;
    if (s == "received")          return observation_kind::received;
    if (s == "executed")          return observation_kind::executed;
    if (s == "execution_failed")  return observation_kind::execution_failed;
    if (s == "transfer_sent")     return observation_kind::transfer_sent;
    if (s == "transfer_received") return observation_kind::transfer_received;
    return std::nullopt;
}

std::string to_string(observation_kind kind) {
    switch (kind) {
        case observation_kind::sent:              return "sent";
        case observation_kind::received:          return "received";
        case observation_kind::executed:          return "executed";
        case observation_kind::execution_failed:  return "execution_failed";
        case observation_kind::transfer_sent:     return "transfer_sent";
        case observation_kind::transfer_received: return "transfer_received";
    }
    return "sent";
}

observation parse_observation(std::span<const char> payload) {
    auto j = nlohmann::json::parse(std::string_view(payload.data(), payload.size()));
    if (!j.is_object()) throw std::invalid_argument("observation must be a JSON object");

    observation obs;
    obs.key.bridge = integer_field<bridge_id>(j, "bridge_id");
    obs.key.message_id = integer_field<int64_t>(j, "message_id");
    obs.chain = integer_field<chain_id>(j, "chain_id");
    obs.block = integer_field<block_number>(j, "block_number");

    auto kind_str = j.at("kind").get<std::string>();
    auto kind = parse_observation_kind(kind_str);
    if (!kind) throw std::invalid_argument("unknown observation kind: " + kind_str);
    obs.kind = *kind;

    obs.timestamp = j.value("timestamp", int64_t{0});
    obs.tx_hash = j.value("tx_hash", std::string{});

    for (const char* common : {"bridge_id", "message_id", "chain_id", "block_number",
                               "kind", "timestamp", "tx_hash"}) {
        j.erase(std::string(common));
    }
    obs.body = std::move(j);
    return obs;
}

} // namespace xchain
