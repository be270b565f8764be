#include "rocksdb_storage.hpp"
#include <rocksdb/options.h>
#include <rocksdb/utilities/transaction.h>
#include <nlohmann/json.hpp>
#include <algorithm>

namespace xchain {

namespace {

constexpr const char* kPendingCF   = "pending";
constexpr const char* kMessagesCF  = "messages";
constexpr const char* kTransfersCF = "transfers";
constexpr const char* kCursorsCF   = "cursors";

void put_be16(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>(v >> 8));
    out.push_back(static_cast<char>(v & 0xff));
}

void put_be64(std::string& out, uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<char>((v >> shift) & 0xff));
    }
}

// Flip the sign bit so negative values sort before positive ones.
uint16_t ordered(int16_t v) { return static_cast<uint16_t>(v) ^ 0x8000u; }
uint64_t ordered(int64_t v) { return static_cast<uint64_t>(v) ^ 0x8000000000000000ull; }

std::string encode_key(const message_key& k) {
    std::string out;
    out.reserve(10);
    put_be16(out, ordered(k.bridge));
    put_be64(out, ordered(k.message_id));
    return out;
}

std::string encode_transfer_key(bridge_id bridge, int64_t message_id, int16_t index) {
    auto out = encode_key(message_key{message_id, bridge});
    put_be16(out, ordered(index));
    return out;
}

std::string encode_key(const bridge_chain& k) {
    std::string out;
    out.reserve(10);
    put_be16(out, ordered(k.bridge));
    put_be64(out, k.chain);
    return out;
}

void check(const rocksdb::Status& s, const char* what) {
    if (!s.ok()) throw storage_error(std::string(what) + ": " + s.ToString());
}

std::string encode_pending(const pending_row& row) {
    return nlohmann::json{
        {"payload", row.payload},
        {"created_at", to_unix_millis(row.created_at)},
    }.dump();
}

pending_row decode_pending(const message_key& key, const std::string& raw) {
    try {
        auto j = nlohmann::json::parse(raw);
        return pending_row{key, j.at("payload").get<std::string>(),
                           from_unix_millis(j.at("created_at").get<int64_t>())};
    } catch (const nlohmann::json::exception& e) {
        throw storage_error(std::string("corrupt pending row: ") + e.what());
    }
}

std::string encode_cursor(const cursor& c) {
    return nlohmann::json{{"backward", c.backward}, {"forward", c.forward}}.dump();
}

cursor decode_cursor(const std::string& raw) {
    try {
        auto j = nlohmann::json::parse(raw);
        return cursor{j.at("backward").get<block_number>(), j.at("forward").get<block_number>()};
    } catch (const nlohmann::json::exception& e) {
        throw storage_error(std::string("corrupt cursor row: ") + e.what());
    }
}

template <typename T>
T decode(const std::string& raw, const char* what) {
    try {
        return nlohmann::json::parse(raw).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw storage_error(std::string("corrupt ") + what + " row: " + e.what());
    }
}

} // namespace

class rocksdb_transaction : public storage_transaction {
public:
    rocksdb_transaction(rocksdb_storage& owner, rocksdb::Transaction* txn)
        : m_owner(owner), m_txn(txn) {}

    ~rocksdb_transaction() override {
        if (m_done) return;
        auto s = m_txn->Rollback();
        if (!s.ok()) m_owner.m_log->warn("rocksdb rollback failed: {}", s.ToString());
    }

    void offload_pending(const std::vector<pending_row>& rows) override {
        for (const auto& row : rows) {
            auto key = encode_key(row.key);
            pending_row stored = row;

            // Keep the original creation time; only the payload is replaced.
            std::string existing;
            auto s = m_txn->GetForUpdate(m_ro, m_owner.m_pending_cf, key, &existing);
            if (s.ok()) {
                stored.created_at = decode_pending(row.key, existing).created_at;
            } else if (!s.IsNotFound()) {
                check(s, "pending lookup");
            }

            check(m_txn->Put(m_owner.m_pending_cf, key, encode_pending(stored)), "pending put");
        }
    }

    void delete_pending(const std::vector<message_key>& keys) override {
        for (const auto& k : keys) {
            check(m_txn->Delete(m_owner.m_pending_cf, encode_key(k)), "pending delete");
        }
    }

    void upsert_messages(const std::vector<crosschain_message>& messages) override {
        for (const auto& m : messages) {
            auto key = encode_key(message_key{m.id, m.bridge});

            std::string existing;
            auto s = m_txn->GetForUpdate(m_ro, m_owner.m_messages_cf, key, &existing);
            crosschain_message stored = m;
            if (s.ok()) {
                stored = merge_message_update(decode<crosschain_message>(existing, "message"), m);
            } else if (!s.IsNotFound()) {
                check(s, "message lookup");
            }

            check(m_txn->Put(m_owner.m_messages_cf, key, nlohmann::json(stored).dump()),
                  "message put");
        }
    }

    void upsert_transfers(const std::vector<crosschain_transfer>& transfers) override {
        for (const auto& t : transfers) {
            auto key = encode_transfer_key(t.bridge, t.message_id, t.index);
            check(m_txn->Put(m_owner.m_transfers_cf, key, nlohmann::json(t).dump()),
                  "transfer put");
        }
    }

    cursors fetch_cursors(const std::vector<bridge_chain>& keys) override {
        cursors out;
        for (const auto& k : keys) {
            std::string raw;
            auto s = m_txn->GetForUpdate(m_ro, m_owner.m_cursors_cf, encode_key(k), &raw);
            if (s.IsNotFound()) continue;
            check(s, "cursor lookup");
            out[k] = decode_cursor(raw);
        }
        return out;
    }

    void upsert_cursors(const cursors& values) override {
        for (const auto& [k, c] : values) {
            auto key = encode_key(k);
            cursor stored = c;

            std::string raw;
            auto s = m_txn->GetForUpdate(m_ro, m_owner.m_cursors_cf, key, &raw);
            if (s.ok()) {
                auto old = decode_cursor(raw);
                stored.backward = std::min(old.backward, c.backward);
                stored.forward = std::max(old.forward, c.forward);
            } else if (!s.IsNotFound()) {
                check(s, "cursor lookup");
            }

            check(m_txn->Put(m_owner.m_cursors_cf, key, encode_cursor(stored)), "cursor put");
        }
    }

    void commit() override {
        if (m_done) throw storage_error("transaction already finished");
        check(m_txn->Commit(), "commit");
        m_done = true;
    }

private:
    rocksdb_storage& m_owner;
    std::unique_ptr<rocksdb::Transaction> m_txn;
    rocksdb::ReadOptions m_ro;
    bool m_done = false;
};

rocksdb_storage::rocksdb_storage(std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log))
{}

rocksdb_storage::~rocksdb_storage() {
    close();
}

std::unique_ptr<rocksdb_storage> rocksdb_storage::open(const std::string& path,
                                                       std::shared_ptr<spdlog::logger> log) {
    auto store = std::unique_ptr<rocksdb_storage>(new rocksdb_storage(std::move(log)));

    rocksdb::Options options;
    options.create_if_missing = true;
    options.create_missing_column_families = true;

    rocksdb::TransactionDBOptions txn_opts;

    std::vector<rocksdb::ColumnFamilyDescriptor> cfs;
    cfs.emplace_back(rocksdb::kDefaultColumnFamilyName, rocksdb::ColumnFamilyOptions());
    cfs.emplace_back(kPendingCF, rocksdb::ColumnFamilyOptions());
    cfs.emplace_back(kMessagesCF, rocksdb::ColumnFamilyOptions());
    cfs.emplace_back(kTransfersCF, rocksdb::ColumnFamilyOptions());
    cfs.emplace_back(kCursorsCF, rocksdb::ColumnFamilyOptions());

    std::vector<rocksdb::ColumnFamilyHandle*> handles;
    rocksdb::TransactionDB* db = nullptr;

    auto s = rocksdb::TransactionDB::Open(options, txn_opts, path, cfs, &handles, &db);
    if (!s.ok()) {
        for (auto* h : handles) delete h;
        throw storage_error("failed to open rocksdb at '" + path + "': " + s.ToString());
    }

    store->m_db = db;
    store->m_handles = std::move(handles);

    // Descriptor order = handle order
    store->m_pending_cf   = store->m_handles[1];
    store->m_messages_cf  = store->m_handles[2];
    store->m_transfers_cf = store->m_handles[3];
    store->m_cursors_cf   = store->m_handles[4];

    store->m_log->info("Opened rocksdb storage at '{}'", path);
    return store;
}

void rocksdb_storage::close() {
    if (!m_db) return;
    for (auto* h : m_handles) delete h;
    m_handles.clear();
    delete m_db;
    m_db = nullptr;
    m_pending_cf = m_messages_cf = m_transfers_cf = m_cursors_cf = nullptr;
}

std::unique_ptr<storage_transaction> rocksdb_storage::begin() {
    rocksdb::WriteOptions wo;
    rocksdb::TransactionOptions to;
    auto* txn = m_db->BeginTransaction(wo, to);
    if (!txn) throw storage_error("BeginTransaction returned null");
    return std::make_unique<rocksdb_transaction>(*this, txn);
}

std::optional<std::string> rocksdb_storage::get_raw(rocksdb::ColumnFamilyHandle* cf,
                                                    const std::string& key) {
    std::string raw;
    auto s = m_db->Get(rocksdb::ReadOptions(), cf, key, &raw);
    if (s.IsNotFound()) return std::nullopt;
    check(s, "get");
    return raw;
}

std::size_t rocksdb_storage::count(rocksdb::ColumnFamilyHandle* cf) {
    std::size_t n = 0;
    std::unique_ptr<rocksdb::Iterator> it(m_db->NewIterator(rocksdb::ReadOptions(), cf));
    for (it->SeekToFirst(); it->Valid(); it->Next()) ++n;
    check(it->status(), "iterate");
    return n;
}

std::optional<pending_row> rocksdb_storage::get_pending(const message_key& key) {
    auto raw = get_raw(m_pending_cf, encode_key(key));
    if (!raw) return std::nullopt;
    return decode_pending(key, *raw);
}

std::optional<crosschain_message> rocksdb_storage::get_message(const message_key& key) {
    auto raw = get_raw(m_messages_cf, encode_key(key));
    if (!raw) return std::nullopt;
    return decode<crosschain_message>(*raw, "message");
}

std::vector<crosschain_transfer> rocksdb_storage::get_transfers(const message_key& key) {
    std::vector<crosschain_transfer> out;
    auto prefix = encode_key(key);
    rocksdb::Slice prefix_slice(prefix);

    std::unique_ptr<rocksdb::Iterator> it(m_db->NewIterator(rocksdb::ReadOptions(), m_transfers_cf));
    for (it->Seek(prefix_slice); it->Valid(); it->Next()) {
        if (!it->key().starts_with(prefix_slice)) break;
        out.push_back(decode<crosschain_transfer>(it->value().ToString(), "transfer"));
    }
    check(it->status(), "iterate transfers");
    return out;
}

std::optional<cursor> rocksdb_storage::get_cursor(bridge_chain key) {
    auto raw = get_raw(m_cursors_cf, encode_key(key));
    if (!raw) return std::nullopt;
    return decode_cursor(*raw);
}

std::size_t rocksdb_storage::pending_count() {
    return count(m_pending_cf);
}

std::size_t rocksdb_storage::message_count() {
    return count(m_messages_cf);
}

} // namespace xchain
