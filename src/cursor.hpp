#pragma once

#include "types.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <unordered_map>
#include <vector>

namespace xchain {

// Cursor bookkeeping for bidirectional scanning of one chain.
//
// backward ("catchup") tracks how far historical backfill has progressed,
// forward ("realtime") tracks live processing. Both describe scan coverage,
// so gaps between cold blocks count as scanned-but-empty.
//
// Cold blocks come from entries that left the hot tier this cycle (offloaded
// or finalized). Hot blocks come from entries still in memory and act as
// barriers: a cursor never moves past a block with unconsolidated data.

struct cursor {
    block_number backward = 0;
    block_number forward = 0;

    friend bool operator==(const cursor&, const cursor&) = default;
};

struct bridge_chain {
    bridge_id bridge = 0;
    chain_id chain = 0;

    friend bool operator==(const bridge_chain&, const bridge_chain&) = default;
    friend bool operator<(const bridge_chain& a, const bridge_chain& b) {
        if (a.bridge != b.bridge) return a.bridge < b.bridge;
        return a.chain < b.chain;
    }
};

struct bridge_chain_hash {
    std::size_t operator()(const bridge_chain& k) const noexcept {
        return std::hash<uint64_t>{}(k.chain) ^
               (static_cast<std::size_t>(static_cast<uint16_t>(k.bridge)) << 48);
    }
};

using cursors = std::unordered_map<bridge_chain, cursor, bridge_chain_hash>;

// chain -> blocks that contributed to an entry
using chain_blocks = std::map<chain_id, std::set<block_number>>;

enum class scan_direction {
    backward,
    forward
};

// Walk cold blocks away from current_boundary in the given direction,
// bridging gaps, until a barrier is found:
// - a cold block that is also hot stops the walk before it
// - a hot block inside a gap moves the boundary next to that hot block
block_number extend_cursor_boundary(scan_direction direction,
                                    block_number current_boundary,
                                    const std::set<block_number>& cold,
                                    const std::set<block_number>& hot);

struct block_sets {
    std::set<block_number> cold;
    std::set<block_number> hot;

    cursor extend_cursor(cursor current) const;

    // Longest run of cold blocks not interrupted by hot blocks.
    // Used when a chain has no persisted cursor yet.
    std::optional<cursor> bootstrap_cursor() const;
};

class cursor_blocks_builder {
public:
    void merge_cold(bridge_id bridge, const chain_blocks& blocks);
    void merge_hot(bridge_id bridge, const chain_blocks& blocks);

    // New cursor values for every touched pair. Pairs without a persisted
    // cursor are bootstrapped; pairs that cannot be bootstrapped are omitted.
    cursors calculate_updates(const cursors& existing) const;

    std::vector<bridge_chain> keys() const;

    const block_sets* find(bridge_chain key) const;

    bool empty() const { return m_inner.empty(); }

private:
    std::map<bridge_chain, block_sets> m_inner;
};

} // namespace xchain
