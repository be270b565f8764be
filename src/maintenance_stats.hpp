#pragma once

#include "cursor.hpp"
#include "types.hpp"
#include <cstddef>
#include <map>

namespace xchain {

enum class eviction_reason {
    stale,
    finalized
};

// Per-bridge tallies for one maintenance cycle.
struct maintenance_counts {
    std::size_t finalized_messages = 0;
    std::size_t finalized_transfers = 0;
    std::size_t hot_entries = 0;
    std::size_t not_consolidatable = 0;
    std::size_t stale = 0;
    std::size_t consolidated_not_final = 0;
    std::size_t removed_stale = 0;
    std::size_t removed_finalized = 0;
    std::size_t skipped_modified = 0;

    maintenance_counts& operator+=(const maintenance_counts& rhs);

    friend bool operator==(const maintenance_counts&, const maintenance_counts&) = default;
};

maintenance_counts operator+(maintenance_counts lhs, const maintenance_counts& rhs);

class bridge_counts {
public:
    maintenance_counts& entry(bridge_id bridge) { return m_counts[bridge]; }

    maintenance_counts get(bridge_id bridge) const;

    maintenance_counts totals() const;

    const std::map<bridge_id, maintenance_counts>& all() const { return m_counts; }

private:
    std::map<bridge_id, maintenance_counts> m_counts;
};

// Outcome of one successful maintenance cycle.
struct cycle_report {
    bridge_counts stats;
    cursors new_cursors;
    std::size_t consolidated = 0;
    std::size_t partial = 0;
    std::size_t hot_len = 0;
};

} // namespace xchain
