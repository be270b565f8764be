#pragma once

#include "cursor.hpp"
#include "storage.hpp"
#include "types.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace xchain {

enum class maintenance_phase {
    begin,
    offload,
    flush,
    remove,
    cursor_fetch,
    cursor_upsert,
    commit
};

std::string to_string(maintenance_phase phase);

// A maintenance transaction failed; nothing from the cycle was committed.
class maintenance_error : public std::runtime_error {
public:
    maintenance_error(maintenance_phase phase, const std::string& cause);

    maintenance_phase phase() const { return m_phase; }

private:
    maintenance_phase m_phase;
};

// Storage effects of one maintenance cycle, independent of the entry type.
struct commit_batch {
    std::vector<pending_row> stale_entries;
    std::vector<consolidated_message> consolidated;
    std::vector<message_key> finalized_keys;
    cursor_blocks_builder cursor_blocks;
};

// Run all storage effects of a cycle inside one transaction:
// offload, flush, remove finalized pending rows, then recompute and upsert
// cursors. Returns the cursors written. Throws maintenance_error naming the
// failing phase; the transaction is rolled back in that case.
cursors commit_maintenance(storage& store, const commit_batch& batch);

} // namespace xchain
