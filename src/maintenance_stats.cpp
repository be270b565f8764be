#include "maintenance_stats.hpp"

namespace xchain {

maintenance_counts& maintenance_counts::operator+=(const maintenance_counts& rhs) {
    finalized_messages += rhs.finalized_messages;
    finalized_transfers += rhs.finalized_transfers;
    hot_entries += rhs.hot_entries;
    not_consolidatable += rhs.not_consolidatable;
    stale += rhs.stale;
    consolidated_not_final += rhs.consolidated_not_final;
    removed_stale += rhs.removed_stale;
    removed_finalized += rhs.removed_finalized;
    skipped_modified += rhs.skipped_modified;
    return *this;
}

maintenance_counts operator+(maintenance_counts lhs, const maintenance_counts& rhs) {
    lhs += rhs;
    return lhs;
}

maintenance_counts bridge_counts::get(bridge_id bridge) const {
    auto it = m_counts.find(bridge);
    if (it == m_counts.end()) return {};
    return it->second;
}

maintenance_counts bridge_counts::totals() const {
    maintenance_counts total;
    for (const auto& [bridge, counts] : m_counts) total += counts;
    return total;
}

} // namespace xchain
