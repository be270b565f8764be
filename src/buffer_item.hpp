#pragma once

#include "cursor.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace xchain {

using item_version = uint32_t;

// Working state of one in-flight message plus the bookkeeping the buffer
// needs to flush it safely.
template <typename T>
struct buffer_item {
    T inner{};

    // Blocks per chain whose observations were folded into this entry.
    // Feeds the cursor computation of the cycle that processes the entry.
    chain_blocks touched_blocks;

    // Bumped by every mutation; used for compare-and-remove.
    item_version version = 0;

    // Version of the last successful non-final flush.
    item_version last_flushed_version = 0;

    // When the entry was created or re-admitted from cold storage.
    // Not persisted in cold payloads.
    time_point hot_since{};

    buffer_item() = default;

    buffer_item(T value, time_point now)
        : inner(std::move(value)), hot_since(now) {}

    void record_block(chain_id chain, block_number block) {
        touched_blocks[chain].insert(block);
    }

    void touch() {
        if (version == std::numeric_limits<item_version>::max()) {
            throw std::overflow_error("version overflow in message buffer entry");
        }
        ++version;
    }

    void flushed_at(item_version v) { last_flushed_version = v; }

    bool is_dirty() const { return version > last_flushed_version; }
};

template <typename T>
void to_json(nlohmann::json& j, const buffer_item<T>& item) {
    nlohmann::json blocks = nlohmann::json::object();
    for (const auto& [chain, set] : item.touched_blocks) {
        blocks[std::to_string(chain)] = set;
    }
    j = nlohmann::json{
        {"inner", item.inner},
        {"touched_blocks", std::move(blocks)},
        {"version", item.version},
        {"last_flushed_version", item.last_flushed_version},
    };
}

template <typename T>
void from_json(const nlohmann::json& j, buffer_item<T>& item) {
    j.at("inner").get_to(item.inner);
    item.touched_blocks.clear();
    for (const auto& [chain, blocks] : j.at("touched_blocks").items()) {
        item.touched_blocks[std::stoull(chain)] = blocks.template get<std::set<block_number>>();
    }
    j.at("version").get_to(item.version);
    item.last_flushed_version = j.value("last_flushed_version", item_version{0});
}

} // namespace xchain
