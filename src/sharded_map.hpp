#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace xchain {

// Concurrent map striped by key hash. Every operation locks exactly one
// shard, so writers on unrelated keys never contend on a common mutex.
//
// Callbacks run while the shard lock is held: they must not call back into
// the same map.
template <typename K, typename V, typename Hash = std::hash<K>>
class sharded_map {
public:
    explicit sharded_map(std::size_t shard_count = 64)
        : m_shards(shard_count == 0 ? 1 : shard_count)
    {
        for (auto& s : m_shards) s = std::make_unique<shard>();
    }

    sharded_map(const sharded_map&) = delete;
    sharded_map& operator=(const sharded_map&) = delete;

    // Insert value if key is absent. Returns false if the key already exists.
    bool try_insert(const K& key, V value) {
        auto& s = shard_for(key);
        std::lock_guard<std::mutex> lock(s.mutex);
        return s.map.try_emplace(key, std::move(value)).second;
    }

    // Removal counter of key's shard. Pair with try_insert_at_epoch to admit
    // a value built outside the lock only if nothing left the shard meanwhile.
    uint64_t removal_epoch(const K& key) const {
        auto& s = shard_for(key);
        std::lock_guard<std::mutex> lock(s.mutex);
        return s.removals;
    }

    // Insert value if key is absent and no removal happened in its shard
    // since epoch was read.
    bool try_insert_at_epoch(const K& key, V value, uint64_t epoch) {
        auto& s = shard_for(key);
        std::lock_guard<std::mutex> lock(s.mutex);
        if (s.removals != epoch) return false;
        return s.map.try_emplace(key, std::move(value)).second;
    }

    // Exclusive in-place update of an existing entry. Returns false if absent.
    template <typename Fn>
    bool alter_if_present(const K& key, Fn&& fn) {
        auto& s = shard_for(key);
        std::lock_guard<std::mutex> lock(s.mutex);
        auto it = s.map.find(key);
        if (it == s.map.end()) return false;
        fn(it->second);
        return true;
    }

    // Remove the entry only if pred(value) holds at the time of removal.
    template <typename Pred>
    bool remove_if(const K& key, Pred&& pred) {
        auto& s = shard_for(key);
        std::lock_guard<std::mutex> lock(s.mutex);
        auto it = s.map.find(key);
        if (it == s.map.end() || !pred(it->second)) return false;
        s.map.erase(it);
        ++s.removals;
        return true;
    }

    std::optional<V> get(const K& key) const {
        auto& s = shard_for(key);
        std::lock_guard<std::mutex> lock(s.mutex);
        auto it = s.map.find(key);
        if (it == s.map.end()) return std::nullopt;
        return it->second;
    }

    bool contains(const K& key) const {
        auto& s = shard_for(key);
        std::lock_guard<std::mutex> lock(s.mutex);
        return s.map.count(key) != 0;
    }

    // Visit a copy of every entry. Shards are copied one at a time, so each
    // value is consistent as of its read instant and other shards stay
    // writable meanwhile. fn runs without any lock held.
    template <typename Fn>
    void for_each_snapshot(Fn&& fn) const {
        std::vector<std::pair<K, V>> batch;
        for (const auto& s : m_shards) {
            batch.clear();
            {
                std::lock_guard<std::mutex> lock(s->mutex);
                batch.reserve(s->map.size());
                for (const auto& [k, v] : s->map) batch.emplace_back(k, v);
            }
            for (const auto& [k, v] : batch) fn(k, v);
        }
    }

    std::size_t size() const {
        std::size_t total = 0;
        for (const auto& s : m_shards) {
            std::lock_guard<std::mutex> lock(s->mutex);
            total += s->map.size();
        }
        return total;
    }

    std::size_t shard_count() const { return m_shards.size(); }

private:
    struct shard {
        mutable std::mutex mutex;
        std::unordered_map<K, V, Hash> map;
        uint64_t removals = 0;
    };

    shard& shard_for(const K& key) const {
        return *m_shards[Hash{}(key) % m_shards.size()];
    }

    std::vector<std::unique_ptr<shard>> m_shards;
};

} // namespace xchain
