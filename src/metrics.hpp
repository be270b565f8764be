#pragma once

#include "cursor.hpp"
#include "maintenance_stats.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>

namespace xchain {

// Observability sink fed once per maintenance cycle.
// Gauges are overwritten by each cycle, counters accumulate.
class buffer_metrics {
public:
    struct bridge_snapshot {
        // gauges
        std::size_t hot_entries = 0;
        std::size_t not_consolidatable = 0;
        std::size_t consolidated_not_final = 0;
        std::size_t stale = 0;
        // counters
        uint64_t finalized_messages = 0;
        uint64_t finalized_transfers = 0;
        uint64_t removed_stale = 0;
        uint64_t removed_finalized = 0;
        uint64_t skipped_modified = 0;
        uint64_t restore_hits = 0;
        uint64_t restore_misses = 0;
    };

    struct snapshot {
        std::map<bridge_id, bridge_snapshot> bridges;
        std::map<bridge_chain, cursor> cursors;
        uint64_t cycles = 0;
        uint64_t maintenance_errors = 0;
        std::chrono::milliseconds last_cycle_duration{0};
    };

    void record_cycle(const bridge_counts& stats, std::chrono::milliseconds duration);
    // Publish cursors written by a committed cycle. Pairs not touched since
    // startup have no gauge.
    void record_cursors(const cursors& values);
    void record_restore(bridge_id bridge, bool hit);
    void record_error();

    snapshot get() const;

private:
    mutable std::mutex m_mutex;
    snapshot m_snap;
};

} // namespace xchain
