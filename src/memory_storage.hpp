#pragma once

#include "storage.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <tuple>

namespace xchain {

// Volatile storage backend. Writes are staged per transaction and applied
// atomically under a single mutex on commit.
class memory_storage : public storage {
public:
    std::unique_ptr<storage_transaction> begin() override;

    std::optional<pending_row> get_pending(const message_key& key) override;
    std::optional<crosschain_message> get_message(const message_key& key) override;
    std::vector<crosschain_transfer> get_transfers(const message_key& key) override;
    std::optional<cursor> get_cursor(bridge_chain key) override;

    std::size_t pending_count() override;
    std::size_t message_count() override;

    // Number of committed transactions, for tests.
    std::size_t commit_count() const;

private:
    friend class memory_transaction;

    using transfer_key = std::tuple<bridge_id, int64_t, int16_t>;

    struct state {
        std::map<message_key, pending_row> pending;
        std::map<message_key, crosschain_message> messages;
        std::map<transfer_key, crosschain_transfer> transfers;
        std::map<bridge_chain, cursor> cursors;
    };

    void apply(const std::vector<std::function<void(state&)>>& ops);

    mutable std::mutex m_mutex;
    state m_state;
    std::size_t m_commits = 0;
};

} // namespace xchain
