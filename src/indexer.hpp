#pragma once

#include "config.hpp"
#include "message_buffer.hpp"
#include "metrics.hpp"
#include "storage.hpp"
#include "worker_pool.hpp"
#include <nats_asio/nats_asio.hpp>
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/thread_pool.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

namespace xchain {

// Wires NATS ingestion, the worker pool and the periodic maintenance of the
// message buffer together.
class indexer_engine {
public:
    indexer_engine(asio::io_context& ioc, const config& cfg,
                   storage& store, std::shared_ptr<spdlog::logger> log);
    ~indexer_engine();

    // Called once the NATS connection is established.
    // Subscribes to the input subject and starts workers and background loops.
    asio::awaitable<void> start(nats_asio::iconnection_sptr conn);

    // Stop the maintenance and stats loops. Must run on the io_context.
    void stop_loops();

    // Stop the worker pool. Called during shutdown before ioc cleanup.
    void stop_workers();

    // One last maintenance cycle. Called during shutdown after the workers
    // have drained.
    void run_final_cycle();

    relay_buffer& buffer() { return m_buffer; }
    const buffer_metrics& metrics() const { return m_metrics; }

private:
    // Callback: incoming observation on the input subject
    asio::awaitable<void> on_data_message(
        std::string_view subject,
        std::optional<std::string_view> reply_to,
        std::span<const char> payload);

    // Periodic maintenance cycle, executed on m_maintenance_pool
    asio::awaitable<void> maintenance_loop();

    // Periodic stats logging
    asio::awaitable<void> stats_loop();

    asio::io_context& m_ioc;
    config m_cfg;
    std::shared_ptr<spdlog::logger> m_log;

    nats_asio::iconnection_sptr m_conn;
    buffer_metrics m_metrics;
    relay_buffer m_buffer;
    std::unique_ptr<worker_pool> m_worker_pool;

    // Storage calls block; keep them off the I/O thread.
    asio::thread_pool m_maintenance_pool{1};
    asio::steady_timer m_maintenance_timer;
    asio::steady_timer m_stats_timer;
    std::atomic<bool> m_stopping{false};

    // Only m_messages_received is tracked here (at enqueue time).
    // All other ingestion stats come from worker_pool::get_stats().
    std::atomic<uint64_t> m_messages_received{0};
};

} // namespace xchain
