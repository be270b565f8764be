#pragma once

#include "cursor.hpp"
#include "types.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace xchain {

// Thrown by storage backends on any I/O or encoding failure.
class storage_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One atomic unit of work against durable storage.
// Destroying a transaction that was not committed rolls it back.
class storage_transaction {
public:
    virtual ~storage_transaction() = default;

    // Cold tier: upsert serialized entries (payload replaced on conflict).
    virtual void offload_pending(const std::vector<pending_row>& rows) = 0;

    // Cold tier: drop rows for keys that reached final storage.
    virtual void delete_pending(const std::vector<message_key>& keys) = 0;

    // Final storage: idempotent upsert of messages and their transfers.
    virtual void upsert_messages(const std::vector<crosschain_message>& messages) = 0;
    virtual void upsert_transfers(const std::vector<crosschain_transfer>& transfers) = 0;

    // Persisted cursors for the requested pairs; missing pairs are absent.
    virtual cursors fetch_cursors(const std::vector<bridge_chain>& keys) = 0;

    // Upsert cursors. Never moves forward back or backward up.
    virtual void upsert_cursors(const cursors& values) = 0;

    virtual void commit() = 0;
};

class storage {
public:
    virtual ~storage() = default;

    virtual std::unique_ptr<storage_transaction> begin() = 0;

    // Cold-tier lookup used to re-admit an entry into the hot tier.
    virtual std::optional<pending_row> get_pending(const message_key& key) = 0;

    virtual std::optional<crosschain_message> get_message(const message_key& key) = 0;
    virtual std::vector<crosschain_transfer> get_transfers(const message_key& key) = 0;
    virtual std::optional<cursor> get_cursor(bridge_chain key) = 0;

    virtual std::size_t pending_count() = 0;
    virtual std::size_t message_count() = 0;
};

} // namespace xchain
