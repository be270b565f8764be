#include "persistence.hpp"
#include <memory>

namespace xchain {

std::string to_string(maintenance_phase phase) {
    switch (phase) {
        case maintenance_phase::begin:         return "begin";
        case maintenance_phase::offload:       return "offload";
        case maintenance_phase::flush:         return "flush";
        case maintenance_phase::remove:        return "delete";
        case maintenance_phase::cursor_fetch:  return "cursor fetch";
        case maintenance_phase::cursor_upsert: return "cursor upsert";
        case maintenance_phase::commit:        return "commit";
    }
    return "unknown";
}

maintenance_error::maintenance_error(maintenance_phase phase, const std::string& cause)
    : std::runtime_error("maintenance transaction failed: " + to_string(phase) + ": " + cause),
      m_phase(phase)
{}

namespace {

template <typename Fn>
decltype(auto) in_phase(maintenance_phase phase, Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        throw maintenance_error(phase, e.what());
    }
}

} // namespace

cursors commit_maintenance(storage& store, const commit_batch& batch) {
    auto tx = in_phase(maintenance_phase::begin, [&] { return store.begin(); });

    in_phase(maintenance_phase::offload, [&] {
        if (!batch.stale_entries.empty()) tx->offload_pending(batch.stale_entries);
    });

    in_phase(maintenance_phase::flush, [&] {
        if (batch.consolidated.empty()) return;
        std::vector<crosschain_message> messages;
        std::vector<crosschain_transfer> transfers;
        messages.reserve(batch.consolidated.size());
        for (const auto& c : batch.consolidated) {
            messages.push_back(c.message);
            transfers.insert(transfers.end(), c.transfers.begin(), c.transfers.end());
        }
        // Transfers reference their message row, so messages go first.
        tx->upsert_messages(messages);
        if (!transfers.empty()) tx->upsert_transfers(transfers);
    });

    in_phase(maintenance_phase::remove, [&] {
        if (!batch.finalized_keys.empty()) tx->delete_pending(batch.finalized_keys);
    });

    auto old = in_phase(maintenance_phase::cursor_fetch, [&] {
        if (batch.cursor_blocks.empty()) return cursors{};
        return tx->fetch_cursors(batch.cursor_blocks.keys());
    });

    auto updated = batch.cursor_blocks.calculate_updates(old);

    in_phase(maintenance_phase::cursor_upsert, [&] {
        if (!updated.empty()) tx->upsert_cursors(updated);
    });

    in_phase(maintenance_phase::commit, [&] { tx->commit(); });

    return updated;
}

} // namespace xchain
