#include "memory_storage.hpp"
#include <algorithm>
#include <limits>

namespace xchain {

class memory_transaction : public storage_transaction {
public:
    explicit memory_transaction(memory_storage& owner) : m_owner(owner) {}

    void offload_pending(const std::vector<pending_row>& rows) override {
        m_ops.emplace_back([rows](memory_storage::state& s) {
            for (const auto& row : rows) {
                auto it = s.pending.find(row.key);
                if (it == s.pending.end()) s.pending.emplace(row.key, row);
                else it->second.payload = row.payload;
            }
        });
    }

    void delete_pending(const std::vector<message_key>& keys) override {
        m_ops.emplace_back([keys](memory_storage::state& s) {
            for (const auto& k : keys) s.pending.erase(k);
        });
    }

    void upsert_messages(const std::vector<crosschain_message>& messages) override {
        m_ops.emplace_back([messages](memory_storage::state& s) {
            for (const auto& m : messages) {
                message_key key{m.id, m.bridge};
                auto it = s.messages.find(key);
                if (it == s.messages.end()) s.messages.emplace(key, m);
                else it->second = merge_message_update(it->second, m);
            }
        });
    }

    void upsert_transfers(const std::vector<crosschain_transfer>& transfers) override {
        m_ops.emplace_back([transfers](memory_storage::state& s) {
            for (const auto& t : transfers) {
                s.transfers[{t.bridge, t.message_id, t.index}] = t;
            }
        });
    }

    cursors fetch_cursors(const std::vector<bridge_chain>& keys) override {
        std::lock_guard<std::mutex> lock(m_owner.m_mutex);
        cursors out;
        for (const auto& k : keys) {
            auto it = m_owner.m_state.cursors.find(k);
            if (it != m_owner.m_state.cursors.end()) out[k] = it->second;
        }
        return out;
    }

    void upsert_cursors(const cursors& values) override {
        m_ops.emplace_back([values](memory_storage::state& s) {
            for (const auto& [k, c] : values) {
                auto it = s.cursors.find(k);
                if (it == s.cursors.end()) {
                    s.cursors.emplace(k, c);
                    continue;
                }
                it->second.backward = std::min(it->second.backward, c.backward);
                it->second.forward = std::max(it->second.forward, c.forward);
            }
        });
    }

    void commit() override {
        if (m_done) throw storage_error("transaction already finished");
        m_owner.apply(m_ops);
        m_ops.clear();
        m_done = true;
    }

private:
    memory_storage& m_owner;
    std::vector<std::function<void(memory_storage::state&)>> m_ops;
    bool m_done = false;
};

std::unique_ptr<storage_transaction> memory_storage::begin() {
    return std::make_unique<memory_transaction>(*this);
}

void memory_storage::apply(const std::vector<std::function<void(state&)>>& ops) {
    std::lock_guard<std::mutex> lock(m_mutex);
    // Apply to a copy so a throwing op leaves committed state untouched.
    state next = m_state;
    for (const auto& op : ops) op(next);
    m_state = std::move(next);
    ++m_commits;
}

std::optional<pending_row> memory_storage::get_pending(const message_key& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_state.pending.find(key);
    if (it == m_state.pending.end()) return std::nullopt;
    return it->second;
}

std::optional<crosschain_message> memory_storage::get_message(const message_key& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_state.messages.find(key);
    if (it == m_state.messages.end()) return std::nullopt;
    return it->second;
}

std::vector<crosschain_transfer> memory_storage::get_transfers(const message_key& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<crosschain_transfer> out;
    auto it = m_state.transfers.lower_bound({key.bridge, key.message_id, std::numeric_limits<int16_t>::min()});
    for (; it != m_state.transfers.end(); ++it) {
        if (std::get<0>(it->first) != key.bridge || std::get<1>(it->first) != key.message_id) break;
        out.push_back(it->second);
    }
    return out;
}

std::optional<cursor> memory_storage::get_cursor(bridge_chain key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_state.cursors.find(key);
    if (it == m_state.cursors.end()) return std::nullopt;
    return it->second;
}

std::size_t memory_storage::pending_count() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.pending.size();
}

std::size_t memory_storage::message_count() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.messages.size();
}

std::size_t memory_storage::commit_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_commits;
}

} // namespace xchain
