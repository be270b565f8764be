#include "metrics.hpp"

namespace xchain {

void buffer_metrics::record_cycle(const bridge_counts& stats, std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(m_mutex);
    // A bridge absent from this cycle has nothing buffered.
    for (auto& [bridge, b] : m_snap.bridges) {
        b.hot_entries = b.not_consolidatable = b.consolidated_not_final = b.stale = 0;
    }
    for (const auto& [bridge, c] : stats.all()) {
        auto& b = m_snap.bridges[bridge];
        b.hot_entries = c.hot_entries;
        b.not_consolidatable = c.not_consolidatable;
        b.consolidated_not_final = c.consolidated_not_final;
        b.stale = c.stale;
        b.finalized_messages += c.finalized_messages;
        b.finalized_transfers += c.finalized_transfers;
        b.removed_stale += c.removed_stale;
        b.removed_finalized += c.removed_finalized;
        b.skipped_modified += c.skipped_modified;
    }
    ++m_snap.cycles;
    m_snap.last_cycle_duration = duration;
}

void buffer_metrics::record_cursors(const cursors& values) {
    std::lock_guard<std::mutex> lock(m_mutex);
    // Values were extended from the cursors read in the committed
    // transaction, so they are what storage now holds.
    for (const auto& [key, c] : values) m_snap.cursors[key] = c;
}

void buffer_metrics::record_restore(bridge_id bridge, bool hit) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& b = m_snap.bridges[bridge];
    if (hit) ++b.restore_hits;
    else     ++b.restore_misses;
}

void buffer_metrics::record_error() {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_snap.maintenance_errors;
}

buffer_metrics::snapshot buffer_metrics::get() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_snap;
}

} // namespace xchain
