#pragma once

#include "storage.hpp"
#include <rocksdb/utilities/transaction_db.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <vector>

namespace xchain {

// Durable storage backend on a RocksDB TransactionDB.
//
// One column family per table: pending, messages, transfers, cursors.
// Keys are fixed-width big-endian encodings of the composite primary key
// (signed fields with the sign bit flipped) so iteration follows key order.
// Values are JSON.
class rocksdb_storage : public storage {
public:
    // Open or create the database at path. Throws storage_error.
    static std::unique_ptr<rocksdb_storage> open(const std::string& path,
                                                 std::shared_ptr<spdlog::logger> log);
    ~rocksdb_storage() override;

    rocksdb_storage(const rocksdb_storage&) = delete;
    rocksdb_storage& operator=(const rocksdb_storage&) = delete;

    std::unique_ptr<storage_transaction> begin() override;

    std::optional<pending_row> get_pending(const message_key& key) override;
    std::optional<crosschain_message> get_message(const message_key& key) override;
    std::vector<crosschain_transfer> get_transfers(const message_key& key) override;
    std::optional<cursor> get_cursor(bridge_chain key) override;

    std::size_t pending_count() override;
    std::size_t message_count() override;

private:
    friend class rocksdb_transaction;

    explicit rocksdb_storage(std::shared_ptr<spdlog::logger> log);

    std::optional<std::string> get_raw(rocksdb::ColumnFamilyHandle* cf, const std::string& key);
    std::size_t count(rocksdb::ColumnFamilyHandle* cf);
    void close();

    std::shared_ptr<spdlog::logger> m_log;
    rocksdb::TransactionDB* m_db = nullptr;
    std::vector<rocksdb::ColumnFamilyHandle*> m_handles;

    rocksdb::ColumnFamilyHandle* m_pending_cf = nullptr;
    rocksdb::ColumnFamilyHandle* m_messages_cf = nullptr;
    rocksdb::ColumnFamilyHandle* m_transfers_cf = nullptr;
    rocksdb::ColumnFamilyHandle* m_cursors_cf = nullptr;
};

} // namespace xchain
