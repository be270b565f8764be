#include "cursor.hpp"
#include <iterator>

namespace xchain {

block_number extend_cursor_boundary(scan_direction direction,
                                    block_number current_boundary,
                                    const std::set<block_number>& cold,
                                    const std::set<block_number>& hot) {
    block_number new_boundary = current_boundary;
    block_number last_scanned = current_boundary;

    if (direction == scan_direction::forward) {
        for (auto it = cold.upper_bound(current_boundary); it != cold.end(); ++it) {
            block_number block = *it;
            if (hot.count(block)) break;

            // lowest hot block in (last_scanned, block)
            auto barrier = hot.upper_bound(last_scanned);
            if (barrier != hot.end() && *barrier < block) {
                new_boundary = *barrier - 1;
                break;
            }

            new_boundary = block;
            last_scanned = block;
        }
        return new_boundary;
    }

    for (auto it = std::make_reverse_iterator(cold.lower_bound(current_boundary));
         it != cold.rend(); ++it) {
        block_number block = *it;
        if (hot.count(block)) break;

        // highest hot block in (block, last_scanned)
        auto barrier = hot.lower_bound(last_scanned);
        if (barrier != hot.begin()) {
            --barrier;
            if (*barrier > block) {
                new_boundary = *barrier + 1;
                break;
            }
        }

        new_boundary = block;
        last_scanned = block;
    }
    return new_boundary;
}

cursor block_sets::extend_cursor(cursor current) const {
    return {
        extend_cursor_boundary(scan_direction::backward, current.backward, cold, hot),
        extend_cursor_boundary(scan_direction::forward, current.forward, cold, hot),
    };
}

std::optional<cursor> block_sets::bootstrap_cursor() const {
    // Cold blocks that are also hot can never be part of a scannable range.
    std::vector<block_number> scannable;
    scannable.reserve(cold.size());
    for (auto b : cold) {
        if (!hot.count(b)) scannable.push_back(b);
    }
    if (scannable.empty()) return std::nullopt;

    block_number best_start = scannable[0];
    block_number best_end = scannable[0];
    block_number best_width = 0;
    block_number run_start = scannable[0];

    for (std::size_t i = 1; i < scannable.size(); ++i) {
        block_number prev = scannable[i - 1];
        block_number block = scannable[i];

        // A hot block between two cold blocks splits the run.
        auto barrier = hot.upper_bound(prev);
        if (barrier != hot.end() && *barrier < block) {
            run_start = block;
        }

        block_number width = block - run_start;
        if (width > best_width) {
            best_width = width;
            best_start = run_start;
            best_end = block;
        }
    }

    return cursor{best_start, best_end};
}

void cursor_blocks_builder::merge_cold(bridge_id bridge, const chain_blocks& blocks) {
    for (const auto& [chain, set] : blocks) {
        m_inner[bridge_chain{bridge, chain}].cold.insert(set.begin(), set.end());
    }
}

void cursor_blocks_builder::merge_hot(bridge_id bridge, const chain_blocks& blocks) {
    for (const auto& [chain, set] : blocks) {
        m_inner[bridge_chain{bridge, chain}].hot.insert(set.begin(), set.end());
    }
}

cursors cursor_blocks_builder::calculate_updates(const cursors& existing) const {
    cursors updates;
    for (const auto& [key, sets] : m_inner) {
        auto it = existing.find(key);
        if (it != existing.end()) {
            updates[key] = sets.extend_cursor(it->second);
        } else if (auto c = sets.bootstrap_cursor()) {
            updates[key] = *c;
        }
    }
    return updates;
}

std::vector<bridge_chain> cursor_blocks_builder::keys() const {
    std::vector<bridge_chain> out;
    out.reserve(m_inner.size());
    for (const auto& [key, sets] : m_inner) out.push_back(key);
    return out;
}

const block_sets* cursor_blocks_builder::find(bridge_chain key) const {
    auto it = m_inner.find(key);
    return it == m_inner.end() ? nullptr : &it->second;
}

} // namespace xchain
