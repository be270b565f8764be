#include "memory_storage.hpp"
#include "message_buffer.hpp"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <atomic>
#include <functional>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using xchain::maintenance_phase;

namespace {

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

// Minimal consolidation capability driven directly by the test.
struct test_message {
    bool ready = false;
    bool is_final = false;
    bool fail = false;
    int transfers = 0;
    int updates = 0;

    std::optional<xchain::consolidated_message> consolidate(const xchain::message_key& key) const {
        if (fail) throw std::runtime_error("cannot consolidate message " + std::to_string(key.message_id));
        if (!ready) return std::nullopt;

        xchain::consolidated_message c;
        c.is_final = is_final;
        c.message.id = key.message_id;
        c.message.bridge = key.bridge;
        c.message.src_chain_id = 1;
        c.message.last_update_timestamp = updates;
        c.message.status = is_final ? xchain::message_status::completed
                                    : xchain::message_status::initiated;
        for (int i = 0; i < transfers; ++i) {
            xchain::crosschain_transfer t;
            t.message_id = key.message_id;
            t.bridge = key.bridge;
            t.index = static_cast<int16_t>(i);
            t.src_amount = t.dst_amount = std::to_string(100 + i);
            c.transfers.push_back(t);
        }
        return c;
    }
};

void to_json(nlohmann::json& j, const test_message& m) {
    j = nlohmann::json{{"ready", m.ready}, {"is_final", m.is_final}, {"fail", m.fail},
                       {"transfers", m.transfers}, {"updates", m.updates}};
}

void from_json(const nlohmann::json& j, test_message& m) {
    j.at("ready").get_to(m.ready);
    j.at("is_final").get_to(m.is_final);
    j.at("fail").get_to(m.fail);
    j.at("transfers").get_to(m.transfers);
    j.at("updates").get_to(m.updates);
}

// Memory storage with fault injection and a hook that runs right before the
// transaction commits.
class hooked_storage : public xchain::storage {
public:
    std::optional<maintenance_phase> fail_at;
    std::function<void()> before_commit;
    xchain::memory_storage inner;

    std::unique_ptr<xchain::storage_transaction> begin() override;

    std::optional<xchain::pending_row> get_pending(const xchain::message_key& key) override {
        return inner.get_pending(key);
    }
    std::optional<xchain::crosschain_message> get_message(const xchain::message_key& key) override {
        return inner.get_message(key);
    }
    std::vector<xchain::crosschain_transfer> get_transfers(const xchain::message_key& key) override {
        return inner.get_transfers(key);
    }
    std::optional<xchain::cursor> get_cursor(xchain::bridge_chain key) override {
        return inner.get_cursor(key);
    }
    std::size_t pending_count() override { return inner.pending_count(); }
    std::size_t message_count() override { return inner.message_count(); }
};

class hooked_transaction : public xchain::storage_transaction {
public:
    hooked_transaction(hooked_storage& owner, std::unique_ptr<xchain::storage_transaction> inner)
        : m_owner(owner), m_inner(std::move(inner)) {}

    void offload_pending(const std::vector<xchain::pending_row>& rows) override {
        fail_if(maintenance_phase::offload);
        m_inner->offload_pending(rows);
    }
    void delete_pending(const std::vector<xchain::message_key>& keys) override {
        fail_if(maintenance_phase::remove);
        m_inner->delete_pending(keys);
    }
    void upsert_messages(const std::vector<xchain::crosschain_message>& messages) override {
        fail_if(maintenance_phase::flush);
        m_inner->upsert_messages(messages);
    }
    void upsert_transfers(const std::vector<xchain::crosschain_transfer>& transfers) override {
        m_inner->upsert_transfers(transfers);
    }
    xchain::cursors fetch_cursors(const std::vector<xchain::bridge_chain>& keys) override {
        fail_if(maintenance_phase::cursor_fetch);
        return m_inner->fetch_cursors(keys);
    }
    void upsert_cursors(const xchain::cursors& values) override {
        fail_if(maintenance_phase::cursor_upsert);
        m_inner->upsert_cursors(values);
    }
    void commit() override {
        fail_if(maintenance_phase::commit);
        if (m_owner.before_commit) m_owner.before_commit();
        m_inner->commit();
    }

private:
    void fail_if(maintenance_phase phase) {
        if (m_owner.fail_at == phase) throw xchain::storage_error("injected failure");
    }

    hooked_storage& m_owner;
    std::unique_ptr<xchain::storage_transaction> m_inner;
};

std::unique_ptr<xchain::storage_transaction> hooked_storage::begin() {
    return std::make_unique<hooked_transaction>(*this, inner.begin());
}

xchain::message_key key(int64_t id, xchain::bridge_id bridge = 1) {
    return xchain::message_key{id, bridge};
}

void make_ready(test_message& m) { m.ready = true; ++m.updates; }
void make_final(test_message& m) { m.ready = true; m.is_final = true; ++m.updates; }
void touch_only(test_message& m) { ++m.updates; }

class message_buffer_test : public ::testing::Test {
protected:
    static xchain::buffer_settings settings() {
        xchain::buffer_settings s;
        s.hot_ttl = 10s;
        s.shards = 8;
        return s;
    }

    void advance(std::chrono::milliseconds d) { now += d; }

    xchain::time_point now = xchain::from_unix_millis(1'700'000'000'000);
    hooked_storage store;
    xchain::buffer_metrics metrics;
    xchain::message_buffer<test_message> buffer{store, settings(), make_log(), &metrics,
                                                [this] { return now; }};
};

} // namespace

TEST_F(message_buffer_test, alter_creates_dirty_entry) {
    buffer.alter(key(1), 10, 100, touch_only);

    auto item = buffer.get(key(1));
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->version, 1u);
    EXPECT_TRUE(item->is_dirty());
    EXPECT_EQ(item->inner.updates, 1);
    EXPECT_EQ(item->hot_since, now);
    EXPECT_EQ(item->touched_blocks.at(10), (std::set<xchain::block_number>{100}));
}

TEST_F(message_buffer_test, alter_accumulates_blocks_and_versions) {
    buffer.alter(key(1), 10, 100, touch_only);
    advance(1s);
    buffer.alter(key(1), 20, 7, touch_only);
    buffer.alter(key(1), 10, 101, touch_only);

    auto item = buffer.get(key(1));
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->version, 3u);
    EXPECT_EQ(item->inner.updates, 3);
    // hot_since is set on creation only
    EXPECT_EQ(item->hot_since, now - 1s);
    EXPECT_EQ(item->touched_blocks.at(10), (std::set<xchain::block_number>{100, 101}));
    EXPECT_EQ(item->touched_blocks.at(20), (std::set<xchain::block_number>{7}));
}

TEST_F(message_buffer_test, not_ready_entry_stays_hot) {
    buffer.alter(key(1), 10, 100, touch_only);

    auto report = buffer.run();

    EXPECT_TRUE(buffer.contains(key(1)));
    EXPECT_EQ(report.stats.get(1).not_consolidatable, 1u);
    EXPECT_EQ(report.stats.get(1).hot_entries, 1u);
    EXPECT_EQ(report.consolidated, 0u);
    EXPECT_EQ(store.message_count(), 0u);
    EXPECT_EQ(store.pending_count(), 0u);
    // Only hot blocks were seen: no cursor can be derived yet
    EXPECT_FALSE(store.get_cursor({1, 10}).has_value());
    EXPECT_TRUE(buffer.get(key(1))->is_dirty());
}

TEST_F(message_buffer_test, complete_entry_is_flushed_and_evicted) {
    buffer.alter(key(1), 10, 100, [](test_message& m) { make_final(m); m.transfers = 2; });

    auto report = buffer.run();

    EXPECT_FALSE(buffer.contains(key(1)));
    EXPECT_EQ(buffer.hot_len(), 0u);
    EXPECT_EQ(store.pending_count(), 0u);
    EXPECT_EQ(store.message_count(), 1u);

    auto msg = store.get_message(key(1));
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->status, xchain::message_status::completed);
    EXPECT_EQ(store.get_transfers(key(1)).size(), 2u);

    auto counts = report.stats.get(1);
    EXPECT_EQ(counts.finalized_messages, 1u);
    EXPECT_EQ(counts.finalized_transfers, 2u);
    EXPECT_EQ(counts.removed_finalized, 1u);
    EXPECT_EQ(counts.skipped_modified, 0u);
    EXPECT_EQ(counts.hot_entries, 0u);
}

TEST_F(message_buffer_test, finalization_is_idempotent) {
    buffer.alter(key(1), 10, 100, [](test_message& m) { make_final(m); m.transfers = 1; });
    buffer.run();
    auto stored = store.get_message(key(1));

    auto report = buffer.run();

    EXPECT_EQ(report.consolidated, 0u);
    EXPECT_EQ(report.stats.totals().finalized_messages, 0u);
    EXPECT_EQ(store.message_count(), 1u);
    EXPECT_EQ(store.get_message(key(1)), stored);
    EXPECT_EQ(store.get_transfers(key(1)).size(), 1u);
    EXPECT_EQ(store.pending_count(), 0u);
}

TEST_F(message_buffer_test, complete_entry_is_evicted_even_when_stale) {
    buffer.alter(key(1), 10, 100, make_final);
    advance(1h);

    auto report = buffer.run();

    EXPECT_FALSE(buffer.contains(key(1)));
    EXPECT_EQ(store.pending_count(), 0u);
    EXPECT_EQ(report.stats.get(1).stale, 0u);
    EXPECT_EQ(report.stats.get(1).removed_finalized, 1u);
}

TEST_F(message_buffer_test, partial_stale_entry_moves_to_cold_storage) {
    buffer.alter(key(1), 10, 100, make_ready);
    buffer.alter(key(1), 20, 5, touch_only);
    advance(10s);

    auto report = buffer.run();

    EXPECT_FALSE(buffer.contains(key(1)));

    auto msg = store.get_message(key(1));
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->status, xchain::message_status::initiated);

    auto row = store.get_pending(key(1));
    ASSERT_TRUE(row.has_value());
    auto cold = nlohmann::json::parse(row->payload).get<xchain::buffer_item<test_message>>();
    EXPECT_EQ(cold.touched_blocks.at(10), (std::set<xchain::block_number>{100}));
    EXPECT_EQ(cold.touched_blocks.at(20), (std::set<xchain::block_number>{5}));
    EXPECT_EQ(cold.inner.updates, 2);

    auto counts = report.stats.get(1);
    EXPECT_EQ(counts.consolidated_not_final, 1u);
    EXPECT_EQ(counts.stale, 1u);
    EXPECT_EQ(counts.removed_stale, 1u);
    EXPECT_EQ(counts.hot_entries, 0u);
}

TEST_F(message_buffer_test, partial_fresh_entry_is_flushed_once) {
    buffer.alter(key(1), 10, 100, make_ready);

    auto first = buffer.run();
    EXPECT_EQ(first.consolidated, 1u);
    EXPECT_EQ(first.partial, 1u);
    EXPECT_TRUE(buffer.contains(key(1)));
    EXPECT_FALSE(buffer.get(key(1))->is_dirty());
    EXPECT_EQ(store.get_message(key(1))->last_update_timestamp, 1);

    // Nothing changed since: no reflush
    auto second = buffer.run();
    EXPECT_EQ(second.consolidated, 0u);
    EXPECT_EQ(second.stats.get(1).hot_entries, 1u);

    buffer.alter(key(1), 10, 101, make_ready);
    auto third = buffer.run();
    EXPECT_EQ(third.consolidated, 1u);
    EXPECT_EQ(store.get_message(key(1))->last_update_timestamp, 2);
    EXPECT_EQ(store.message_count(), 1u);
}

TEST_F(message_buffer_test, clean_stale_entry_is_offloaded) {
    buffer.alter(key(1), 10, 100, make_ready);
    buffer.run();
    advance(15s);

    auto report = buffer.run();

    EXPECT_FALSE(buffer.contains(key(1)));
    EXPECT_TRUE(store.get_pending(key(1)).has_value());
    EXPECT_EQ(report.consolidated, 0u);
    EXPECT_EQ(report.stats.get(1).stale, 1u);
    EXPECT_EQ(report.stats.get(1).removed_stale, 1u);
}

TEST_F(message_buffer_test, not_ready_stale_entry_is_offloaded) {
    buffer.alter(key(1), 10, 100, touch_only);
    advance(10s);

    auto report = buffer.run();

    EXPECT_FALSE(buffer.contains(key(1)));
    EXPECT_TRUE(store.get_pending(key(1)).has_value());
    EXPECT_EQ(store.message_count(), 0u);
    EXPECT_EQ(report.stats.get(1).not_consolidatable, 1u);
    EXPECT_EQ(report.stats.get(1).stale, 1u);
}

TEST_F(message_buffer_test, clock_going_backwards_is_not_stale) {
    buffer.alter(key(1), 10, 100, touch_only);
    advance(-5s);

    auto report = buffer.run();

    EXPECT_TRUE(buffer.contains(key(1)));
    EXPECT_EQ(report.stats.get(1).stale, 0u);
}

TEST_F(message_buffer_test, concurrent_mutation_wins_over_eviction) {
    buffer.alter(key(1), 10, 100, make_final);
    store.before_commit = [this] { buffer.alter(key(1), 10, 101, touch_only); };

    auto report = buffer.run();
    store.before_commit = nullptr;

    EXPECT_TRUE(buffer.contains(key(1)));
    auto counts = report.stats.get(1);
    EXPECT_EQ(counts.skipped_modified, 1u);
    EXPECT_EQ(counts.removed_finalized, 0u);
    EXPECT_EQ(counts.hot_entries, 1u);
    EXPECT_EQ(store.message_count(), 1u);

    // Next cycle sees the newer version and finishes the job
    auto next = buffer.run();
    EXPECT_FALSE(buffer.contains(key(1)));
    EXPECT_EQ(next.stats.get(1).removed_finalized, 1u);
}

TEST_F(message_buffer_test, concurrent_mutation_keeps_partial_entry_dirty) {
    buffer.alter(key(1), 10, 100, make_ready);
    store.before_commit = [this] { buffer.alter(key(1), 10, 101, make_ready); };

    buffer.run();
    store.before_commit = nullptr;

    auto item = buffer.get(key(1));
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->version, 2u);
    EXPECT_TRUE(item->is_dirty());

    auto report = buffer.run();
    EXPECT_EQ(report.consolidated, 1u);
    EXPECT_EQ(store.get_message(key(1))->last_update_timestamp, 2);
    EXPECT_FALSE(buffer.get(key(1))->is_dirty());
}

TEST_F(message_buffer_test, storage_failure_leaves_everything_untouched) {
    for (auto phase : {maintenance_phase::offload, maintenance_phase::flush,
                       maintenance_phase::remove, maintenance_phase::cursor_fetch,
                       maintenance_phase::cursor_upsert, maintenance_phase::commit}) {
        SCOPED_TRACE(xchain::to_string(phase));

        hooked_storage failing;
        xchain::message_buffer<test_message> buf(failing, settings(), make_log(), nullptr,
                                                 [this] { return now; });

        // A complete entry, a stale partial entry and a fresh partial entry
        // exercise every phase of the transaction.
        buf.alter(key(1), 10, 100, make_final);
        buf.alter(key(2), 10, 50, make_ready);
        now += 20s;
        buf.alter(key(3), 10, 70, make_ready);

        failing.fail_at = phase;
        try {
            buf.run();
            ADD_FAILURE() << "run() should have thrown";
        } catch (const xchain::maintenance_error& e) {
            EXPECT_EQ(e.phase(), phase);
            EXPECT_NE(std::string(e.what()).find(xchain::to_string(phase)), std::string::npos);
            EXPECT_NE(std::string(e.what()).find("injected failure"), std::string::npos);
        }

        EXPECT_EQ(failing.inner.commit_count(), 0u);
        EXPECT_EQ(failing.message_count(), 0u);
        EXPECT_EQ(failing.pending_count(), 0u);
        EXPECT_EQ(buf.hot_len(), 3u);
        for (int id : {1, 2, 3}) {
            EXPECT_TRUE(buf.get(key(id))->is_dirty());
        }

        // Retry after the fault clears
        failing.fail_at.reset();
        auto report = buf.run();
        EXPECT_EQ(report.consolidated, 3u);
        EXPECT_EQ(buf.hot_len(), 1u);
        EXPECT_TRUE(buf.contains(key(3)));
        EXPECT_EQ(failing.pending_count(), 1u);
        EXPECT_EQ(failing.message_count(), 3u);
    }
}

TEST_F(message_buffer_test, consolidation_error_aborts_cycle) {
    buffer.alter(key(1), 10, 100, make_final);
    buffer.alter(key(2), 10, 101, [](test_message& m) { m.fail = true; });

    EXPECT_THROW(buffer.run(), std::runtime_error);

    EXPECT_EQ(store.inner.commit_count(), 0u);
    EXPECT_TRUE(buffer.contains(key(1)));
    EXPECT_TRUE(buffer.contains(key(2)));

    buffer.alter(key(2), 10, 102, [](test_message& m) { m.fail = false; });
    buffer.run();
    EXPECT_FALSE(buffer.contains(key(1)));
    EXPECT_EQ(store.message_count(), 1u);
}

TEST_F(message_buffer_test, restore_from_cold_storage_resets_hot_since) {
    xchain::buffer_item<test_message> cold(test_message{}, now - 1h);
    cold.inner.updates = 5;
    cold.record_block(10, 90);
    cold.touch();
    cold.touch();
    cold.flushed_at(1);
    {
        auto tx = store.begin();
        tx->offload_pending({{key(1), nlohmann::json(cold).dump(), now - 1h}});
        tx->commit();
    }

    buffer.alter(key(1), 10, 91, touch_only);

    auto item = buffer.get(key(1));
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->inner.updates, 6);
    EXPECT_EQ(item->version, 3u);
    EXPECT_EQ(item->last_flushed_version, 1u);
    EXPECT_EQ(item->hot_since, now);
    EXPECT_EQ(item->touched_blocks.at(10), (std::set<xchain::block_number>{90, 91}));

    // Full TTL again: not stale on the next cycle
    auto report = buffer.run();
    EXPECT_TRUE(buffer.contains(key(1)));
    EXPECT_EQ(report.stats.get(1).stale, 0u);

    auto m = metrics.get();
    EXPECT_EQ(m.bridges.at(1).restore_hits, 1u);
}

TEST_F(message_buffer_test, restore_miss_creates_default_entry) {
    buffer.alter(key(1), 10, 1, touch_only);
    buffer.alter(key(1), 10, 2, touch_only);

    EXPECT_EQ(buffer.get(key(1))->inner.updates, 2);
    // Looked up once; the second alter finds the key hot
    EXPECT_EQ(metrics.get().bridges.at(1).restore_misses, 1u);
}

TEST_F(message_buffer_test, offloaded_entry_is_finalized_after_restore) {
    buffer.alter(key(1), 10, 100, make_ready);
    advance(10s);
    buffer.run();
    ASSERT_FALSE(buffer.contains(key(1)));
    ASSERT_TRUE(store.get_pending(key(1)).has_value());

    buffer.alter(key(1), 20, 300, make_final);
    auto report = buffer.run();

    EXPECT_FALSE(buffer.contains(key(1)));
    EXPECT_FALSE(store.get_pending(key(1)).has_value());
    EXPECT_EQ(store.get_message(key(1))->status, xchain::message_status::completed);
    EXPECT_EQ(report.stats.get(1).removed_finalized, 1u);

    // Blocks from before the offload still count for the cursor
    auto c = store.get_cursor({1, 10});
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->forward, 100u);
    EXPECT_TRUE(store.get_cursor({1, 20}).has_value());
}

TEST_F(message_buffer_test, cursor_stops_before_unresolved_blocks) {
    buffer.alter(key(1), 10, 100, make_final);
    auto first = buffer.run();
    EXPECT_EQ(first.new_cursors.at({1, 10}), (xchain::cursor{100, 100}));

    // 150 is still unresolved, 200 is final
    buffer.alter(key(2), 10, 150, touch_only);
    buffer.alter(key(3), 10, 200, make_final);
    auto second = buffer.run();
    EXPECT_EQ(second.new_cursors.at({1, 10}), (xchain::cursor{100, 149}));
    EXPECT_EQ(store.get_cursor({1, 10}), (xchain::cursor{100, 149}));

    // Backfill below the cursor
    buffer.alter(key(4), 10, 50, make_final);
    buffer.run();
    EXPECT_EQ(store.get_cursor({1, 10}), (xchain::cursor{50, 149}));

    // Resolving the barrier lets the cursor catch up
    buffer.alter(key(2), 10, 150, make_final);
    buffer.run();
    EXPECT_EQ(store.get_cursor({1, 10}), (xchain::cursor{50, 150}));

    auto m = metrics.get();
    EXPECT_EQ(m.cursors.at({1, 10}), (xchain::cursor{50, 150}));
}

TEST_F(message_buffer_test, cursors_never_regress) {
    buffer.alter(key(1), 10, 500, make_final);
    buffer.run();

    // A late, lower block on the realtime side must not move forward back
    buffer.alter(key(2), 10, 400, make_final);
    buffer.run();

    auto c = store.get_cursor({1, 10});
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->forward, 500u);
    EXPECT_EQ(c->backward, 400u);
}

TEST_F(message_buffer_test, counts_are_kept_per_bridge) {
    buffer.alter(key(1, 1), 10, 100, make_final);
    buffer.alter(key(1, 2), 10, 100, touch_only);
    buffer.alter(key(2, 2), 10, 101, make_ready);

    auto report = buffer.run();

    EXPECT_EQ(report.stats.get(1).finalized_messages, 1u);
    EXPECT_EQ(report.stats.get(2).finalized_messages, 0u);
    EXPECT_EQ(report.stats.get(2).not_consolidatable, 1u);
    EXPECT_EQ(report.stats.get(2).consolidated_not_final, 1u);
    EXPECT_EQ(report.stats.get(2).hot_entries, 2u);

    // Same chain, different bridges: separate cursors
    EXPECT_TRUE(store.get_cursor({1, 10}).has_value());
    EXPECT_FALSE(store.get_cursor({2, 10}).has_value());

    auto m = metrics.get();
    EXPECT_EQ(m.cycles, 1u);
    EXPECT_EQ(m.bridges.at(1).finalized_messages, 1u);
    EXPECT_EQ(m.bridges.at(2).hot_entries, 2u);
}

TEST_F(message_buffer_test, ingestion_runs_alongside_maintenance) {
    constexpr int writers = 4;
    constexpr int per_writer = 200;
    std::atomic<bool> done{false};

    std::thread maintenance([&] {
        while (!done.load()) buffer.run();
    });

    std::vector<std::thread> threads;
    for (int w = 0; w < writers; ++w) {
        threads.emplace_back([&, w] {
            for (int i = 0; i < per_writer; ++i) {
                auto k = key(w * per_writer + i);
                buffer.alter(k, 10, static_cast<xchain::block_number>(i + 1), touch_only);
                buffer.alter(k, 10, static_cast<xchain::block_number>(i + 1), make_final);
            }
        });
    }
    for (auto& t : threads) t.join();
    done = true;
    maintenance.join();

    buffer.run();

    EXPECT_EQ(buffer.hot_len(), 0u);
    EXPECT_EQ(store.message_count(), static_cast<std::size_t>(writers * per_writer));
    EXPECT_EQ(store.pending_count(), 0u);
}

TEST_F(message_buffer_test, ingestion_survives_evictions_to_cold_storage) {
    // Every entry is stale at once, so each cycle offloads and evicts the
    // key while the writer keeps updating it.
    xchain::buffer_settings s = settings();
    s.hot_ttl = 0ms;
    xchain::message_buffer<test_message> evicting(store, s, make_log(), nullptr,
                                                  [this] { return now; });

    constexpr int updates = 20000;
    std::atomic<bool> done{false};
    std::size_t cycles = 0;

    std::thread maintenance([&] {
        while (!done.load()) {
            evicting.run();
            ++cycles;
        }
    });

    for (int i = 0; i < updates; ++i) {
        evicting.alter(key(1), 10, static_cast<xchain::block_number>(i + 1), touch_only);
    }
    done = true;
    maintenance.join();

    evicting.run();
    EXPECT_FALSE(evicting.contains(key(1)));
    EXPECT_GT(cycles, 0u);

    evicting.alter(key(1), 10, static_cast<xchain::block_number>(updates + 1), touch_only);
    auto item = evicting.get(key(1));
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->inner.updates, updates + 1);
    EXPECT_EQ(item->version, static_cast<xchain::item_version>(updates + 1));
}

TEST_F(message_buffer_test, rejected_first_update_leaves_no_entry) {
    auto reject = [](test_message&) { throw std::invalid_argument("bad observation"); };

    EXPECT_THROW(buffer.alter(key(1), 10, 100, reject), std::invalid_argument);
    EXPECT_FALSE(buffer.contains(key(1)));

    buffer.alter(key(2), 10, 100, touch_only);
    EXPECT_THROW(buffer.alter(key(2), 10, 101, reject), std::invalid_argument);
    auto item = buffer.get(key(2));
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->version, 1u);
    EXPECT_EQ(item->touched_blocks.at(10), (std::set<xchain::block_number>{100}));
}

TEST_F(message_buffer_test, cursor_gauge_extends_persisted_cursor) {
    {
        auto tx = store.begin();
        tx->upsert_cursors({{{1, 10}, {100, 200}}});
        tx->commit();
    }

    buffer.alter(key(1), 10, 201, make_final);
    buffer.run();

    EXPECT_EQ(store.get_cursor({1, 10}), (xchain::cursor{100, 201}));
    EXPECT_EQ(metrics.get().cursors.at({1, 10}), (xchain::cursor{100, 201}));
}

TEST_F(message_buffer_test, overlapping_cycles_serialize) {
    for (int i = 0; i < 50; ++i) buffer.alter(key(i), 10, 100 + i, make_final);

    std::thread a([&] { buffer.run(); });
    std::thread b([&] { buffer.run(); });
    a.join();
    b.join();

    EXPECT_EQ(buffer.hot_len(), 0u);
    EXPECT_EQ(store.message_count(), 50u);
    EXPECT_EQ(metrics.get().cycles, 2u);
}
