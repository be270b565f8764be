#pragma once

#include "buffer_item.hpp"
#include "cursor.hpp"
#include "maintenance_stats.hpp"
#include "metrics.hpp"
#include "persistence.hpp"
#include "sharded_map.hpp"
#include "storage.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace xchain {

struct buffer_settings {
    // How long an entry may stay hot before it is offloaded to cold storage.
    std::chrono::milliseconds hot_ttl{10000};
    // How often the maintenance cycle runs.
    std::chrono::milliseconds maintenance_interval{500};
    // Lock stripes of the hot tier.
    std::size_t shards = 64;
};

using clock_fn = std::function<time_point()>;

// Two-tier staging area for cross-chain messages observed out of order.
//
// Hot tier: a sharded in-memory map mutated by ingestion through alter().
// Cold tier: the storage pending table, holding entries that outlived the
// hot TTL before becoming final.
//
// run() performs one maintenance cycle: classify every hot entry from a
// snapshot, write the resulting effects in one storage transaction, then
// evict committed entries with a version check so concurrent updates are
// never discarded.
//
// T is the per-message working state. It must be default constructible,
// convertible to/from nlohmann::json, and provide
//   std::optional<consolidated_message> consolidate(const message_key&) const
// returning nullopt while the message is not consolidatable yet.
template <typename T>
class message_buffer {
public:
    using item_type = buffer_item<T>;

    message_buffer(storage& store,
                   buffer_settings settings,
                   std::shared_ptr<spdlog::logger> log,
                   buffer_metrics* metrics = nullptr,
                   clock_fn clock = {})
        : m_store(store),
          m_settings(settings),
          m_log(std::move(log)),
          m_metrics(metrics),
          m_clock(clock ? std::move(clock) : clock_fn([] { return std::chrono::system_clock::now(); })),
          m_hot(settings.shards)
    {}

    // Get-or-create the entry, apply mutator to its state and record the
    // block that produced the update. Missing entries are first looked up in
    // cold storage. Never waits for a running maintenance cycle.
    //
    // The mutation only ever lands on an entry that is in the hot tier under
    // the shard lock. A cold row is admitted only if no eviction happened in
    // its shard since the row was read: an evicted entry may have been
    // offloaded after that read, making the row outdated.
    template <typename Mutator>
    void alter(const message_key& key, chain_id chain, block_number block, Mutator&& mutator) {
        auto apply = [&](item_type& item) {
            mutator(item.inner);
            item.record_block(chain, block);
            item.touch();
        };

        bool created = false;
        for (;;) {
            try {
                if (m_hot.alter_if_present(key, apply)) return;
            } catch (...) {
                // A rejected first update must not leave an empty entry behind.
                if (created) {
                    m_hot.remove_if(key, [](const item_type& item) { return item.version == 0; });
                }
                throw;
            }

            auto epoch = m_hot.removal_epoch(key);
            auto restored = restore(key);
            bool from_cold = restored.has_value();
            item_type item = from_cold ? std::move(*restored) : item_type(T{}, m_clock());
            created = m_hot.try_insert_at_epoch(key, std::move(item), epoch) && !from_cold;
        }
    }

    // Run one maintenance cycle. At most one cycle runs at a time.
    // Throws on consolidation failure or maintenance_error; in both cases
    // neither storage nor the hot tier has been changed.
    cycle_report run() {
        std::lock_guard<std::mutex> cycle_lock(m_cycle_mutex);
        auto started = std::chrono::steady_clock::now();

        auto p = plan_maintenance();

        auto new_cursors = commit_maintenance(m_store, p.batch);
        if (m_metrics) m_metrics->record_cursors(new_cursors);

        mark_flushed_versions(p.keys_to_mark_flushed);
        remove_from_hot_if_unchanged(p.hot_evictions, p.stats);

        cycle_report report;
        report.consolidated = p.batch.consolidated.size();
        report.partial = p.keys_to_mark_flushed.size();
        report.hot_len = m_hot.size();
        report.new_cursors = std::move(new_cursors);
        report.stats = std::move(p.stats);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        auto totals = report.stats.totals();
        m_log->info("maintenance completed: hot_len={} consolidated={} partial={} stale={} "
                    "finalized={} not_consolidatable={} removed_stale={} removed_finalized={} "
                    "skipped={} duration_ms={}",
                    report.hot_len, report.consolidated, report.partial, totals.stale,
                    totals.finalized_messages, totals.not_consolidatable, totals.removed_stale,
                    totals.removed_finalized, totals.skipped_modified, elapsed.count());

        if (m_metrics) m_metrics->record_cycle(report.stats, elapsed);
        return report;
    }

    std::size_t hot_len() const { return m_hot.size(); }

    std::optional<item_type> get(const message_key& key) const { return m_hot.get(key); }

    bool contains(const message_key& key) const { return m_hot.contains(key); }

    // Admit a prepared entry as-is. Returns false if the key is already hot.
    bool insert(const message_key& key, item_type item) {
        return m_hot.try_insert(key, std::move(item));
    }

    const buffer_settings& settings() const { return m_settings; }

private:
    enum class outcome_kind {
        unchanged,
        not_ready,
        partial,
        complete
    };

    struct outcome {
        outcome_kind kind = outcome_kind::unchanged;
        std::optional<consolidated_message> message;
    };

    struct flush_mark {
        message_key key;
        item_version version;
    };

    struct eviction {
        message_key key;
        item_version version;
        eviction_reason reason;
    };

    struct plan {
        commit_batch batch;
        std::vector<flush_mark> keys_to_mark_flushed;
        std::vector<eviction> hot_evictions;
        bridge_counts stats;

        void collect_stale(const message_key& key, const item_type& item) {
            batch.stale_entries.push_back(
                pending_row{key, nlohmann::json(item).dump(), item.hot_since});
            hot_evictions.push_back({key, item.version, eviction_reason::stale});
            stats.entry(key.bridge).stale += 1;
            batch.cursor_blocks.merge_cold(key.bridge, item.touched_blocks);
        }

        void collect_hot(const message_key& key, const item_type& item) {
            stats.entry(key.bridge).hot_entries += 1;
            batch.cursor_blocks.merge_hot(key.bridge, item.touched_blocks);
        }

        void collect(const message_key& key, const item_type& item, outcome o, bool is_stale) {
            switch (o.kind) {
                case outcome_kind::unchanged:
                    break;
                case outcome_kind::not_ready:
                    stats.entry(key.bridge).not_consolidatable += 1;
                    break;
                case outcome_kind::partial:
                    batch.consolidated.push_back(std::move(*o.message));
                    keys_to_mark_flushed.push_back({key, item.version});
                    stats.entry(key.bridge).consolidated_not_final += 1;
                    break;
                case outcome_kind::complete: {
                    auto transfer_count = o.message->transfers.size();
                    batch.consolidated.push_back(std::move(*o.message));
                    batch.finalized_keys.push_back(key);
                    hot_evictions.push_back({key, item.version, eviction_reason::finalized});
                    auto& s = stats.entry(key.bridge);
                    s.finalized_messages += 1;
                    s.finalized_transfers += transfer_count;
                    batch.cursor_blocks.merge_cold(key.bridge, item.touched_blocks);
                    // Finality is one-way: staleness does not matter.
                    return;
                }
            }

            if (is_stale) collect_stale(key, item);
            else          collect_hot(key, item);
        }
    };

    static outcome classify(const message_key& key, const item_type& item) {
        if (!item.is_dirty()) return {outcome_kind::unchanged, std::nullopt};

        auto message = item.inner.consolidate(key);
        if (!message) return {outcome_kind::not_ready, std::nullopt};
        auto kind = message->is_final ? outcome_kind::complete : outcome_kind::partial;
        return {kind, std::move(message)};
    }

    plan plan_maintenance() const {
        auto now = m_clock();
        plan p;
        m_hot.for_each_snapshot([&](const message_key& key, const item_type& item) {
            auto age = now - item.hot_since;
            if (age < time_point::duration::zero()) age = time_point::duration::zero();
            bool is_stale = age >= m_settings.hot_ttl;
            p.collect(key, item, classify(key, item), is_stale);
        });
        return p;
    }

    void mark_flushed_versions(const std::vector<flush_mark>& marks) {
        for (const auto& m : marks) {
            // Only when unchanged since planning; a newer version stays dirty.
            m_hot.alter_if_present(m.key, [&](item_type& item) {
                if (item.version == m.version) item.flushed_at(m.version);
            });
        }
    }

    void remove_from_hot_if_unchanged(const std::vector<eviction>& evictions, bridge_counts& stats) {
        for (const auto& e : evictions) {
            bool removed = m_hot.remove_if(e.key, [&](const item_type& item) {
                return item.version == e.version;
            });
            auto& s = stats.entry(e.key.bridge);
            if (removed) {
                if (e.reason == eviction_reason::stale) ++s.removed_stale;
                else                                    ++s.removed_finalized;
                continue;
            }
            ++s.skipped_modified;
            ++s.hot_entries;
            m_log->debug("eviction skipped for message {} (bridge {}): modified concurrently",
                         e.key.message_id, e.key.bridge);
        }
    }

    std::optional<item_type> restore(const message_key& key) {
        auto row = m_store.get_pending(key);
        if (m_metrics) m_metrics->record_restore(key.bridge, row.has_value());
        if (!row) {
            m_log->debug("restore miss for message {} (bridge {})", key.message_id, key.bridge);
            return std::nullopt;
        }

        auto item = nlohmann::json::parse(row->payload).get<item_type>();
        // Re-admitted entries get a full TTL in memory.
        item.hot_since = m_clock();
        m_log->debug("restored message {} (bridge {}) from cold storage at version {}",
                     key.message_id, key.bridge, item.version);
        return item;
    }

    storage& m_store;
    buffer_settings m_settings;
    std::shared_ptr<spdlog::logger> m_log;
    buffer_metrics* m_metrics;
    clock_fn m_clock;

    sharded_map<message_key, item_type, message_key_hash> m_hot;

    // Held for a whole maintenance cycle; ingestion never takes it.
    std::mutex m_cycle_mutex;
};

} // namespace xchain
