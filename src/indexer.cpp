#include "indexer.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>
#include <exception>

namespace xchain {

indexer_engine::indexer_engine(asio::io_context& ioc, const config& cfg,
                               storage& store, std::shared_ptr<spdlog::logger> log)
    : m_ioc(ioc), m_cfg(cfg), m_log(std::move(log)),
      m_buffer(store, cfg.buffer, m_log, &m_metrics),
      m_worker_pool(std::make_unique<worker_pool>(m_cfg, m_buffer, m_log)),
      m_maintenance_timer(ioc),
      m_stats_timer(ioc)
{}

indexer_engine::~indexer_engine() {
    m_maintenance_pool.join();
}

asio::awaitable<void> indexer_engine::start(nats_asio::iconnection_sptr conn) {
    m_conn = std::move(conn);

    // Subscribe to the input data subject
    nats_asio::subscribe_options data_opts;
    if (!m_cfg.input_queue_group.empty()) {
        data_opts.queue_group = m_cfg.input_queue_group;
    }

    auto [data_sub, data_status] = co_await m_conn->subscribe(
        m_cfg.input_subject,
        [this](auto subject, auto reply_to, auto payload) {
            return on_data_message(subject, reply_to, payload);
        },
        data_opts
    );

    if (data_status.failed()) {
        m_log->error("Failed to subscribe to input subject '{}': {}",
                    m_cfg.input_subject, data_status.error());
        m_ioc.stop();
        co_return;
    }
    m_log->info("Subscribed to input subject '{}'", m_cfg.input_subject);

    m_worker_pool->start();

    asio::co_spawn(m_ioc, maintenance_loop(), asio::detached);
    asio::co_spawn(m_ioc, stats_loop(), asio::detached);

    m_log->info("Indexer engine started (hot_ttl={}ms, interval={}ms, shards={})",
               m_cfg.buffer.hot_ttl.count(), m_cfg.buffer.maintenance_interval.count(),
               m_cfg.buffer.shards);
}

void indexer_engine::stop_loops() {
    m_stopping = true;
    m_maintenance_timer.cancel();
    m_stats_timer.cancel();
}

void indexer_engine::stop_workers() {
    if (m_worker_pool) {
        m_worker_pool->stop();
    }
}

void indexer_engine::run_final_cycle() {
    try {
        auto report = m_buffer.run();
        m_log->info("Final maintenance cycle done, {} entries left in memory", report.hot_len);
    } catch (const std::exception& e) {
        m_metrics.record_error();
        m_log->error("Final maintenance cycle failed: {}", e.what());
    }
}

asio::awaitable<void> indexer_engine::on_data_message(
    std::string_view /*subject*/,
    std::optional<std::string_view> /*reply_to*/,
    std::span<const char> payload)
{
    m_messages_received++;

    // Skip empty payloads; an empty vector is the workers' poison pill
    if (payload.empty()) co_return;

    std::vector<char> payload_copy(payload.begin(), payload.end());
    m_worker_pool->enqueue(std::move(payload_copy));
}

asio::awaitable<void> indexer_engine::maintenance_loop() {
    while (!m_stopping) {
        asio::error_code ec;
        m_maintenance_timer.expires_after(m_cfg.buffer.maintenance_interval);
        co_await m_maintenance_timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec || m_stopping) break;

        try {
            co_await asio::co_spawn(
                m_maintenance_pool,
                [this]() -> asio::awaitable<cycle_report> { co_return m_buffer.run(); },
                asio::use_awaitable);
        } catch (const std::exception& e) {
            // Nothing was committed or evicted; the next tick retries.
            m_metrics.record_error();
            m_log->error("Maintenance cycle failed: {}", e.what());
        }
    }
    m_log->debug("Maintenance loop stopped");
}

asio::awaitable<void> indexer_engine::stats_loop() {
    while (!m_stopping) {
        asio::error_code ec;
        m_stats_timer.expires_after(std::chrono::seconds(m_cfg.stats_interval_seconds));
        co_await m_stats_timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec || m_stopping) break;

        auto ws = m_worker_pool->get_stats();
        auto ms = m_metrics.get();

        m_log->info("stats: received={} processed={} applied={} parse_failures={} apply_failures={} "
                   "queue_depth={} hot_len={} cycles={} maintenance_errors={} last_cycle_ms={}",
                   m_messages_received.load(),
                   ws.processed,
                   ws.applied,
                   ws.parse_failures,
                   ws.apply_failures,
                   ws.queue_depth,
                   m_buffer.hot_len(),
                   ms.cycles,
                   ms.maintenance_errors,
                   ms.last_cycle_duration.count());

        for (const auto& [bridge, b] : ms.bridges) {
            m_log->info("stats: bridge={} hot={} not_consolidatable={} partial={} stale={} "
                       "finalized={} transfers={} removed_stale={} removed_finalized={} skipped={} "
                       "restore_hits={} restore_misses={}",
                       bridge, b.hot_entries, b.not_consolidatable, b.consolidated_not_final,
                       b.stale, b.finalized_messages, b.finalized_transfers, b.removed_stale,
                       b.removed_finalized, b.skipped_modified, b.restore_hits, b.restore_misses);
        }
        for (const auto& [key, c] : ms.cursors) {
            m_log->debug("stats: cursor bridge={} chain={} backward={} forward={}",
                        key.bridge, key.chain, c.backward, c.forward);
        }
    }
}

} // namespace xchain
