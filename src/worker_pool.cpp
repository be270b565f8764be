#include "worker_pool.hpp"
#include "observation.hpp"
#include <chrono>
#include <exception>

namespace xchain {

worker_pool::worker_pool(const config& cfg, relay_buffer& buffer,
                         std::shared_ptr<spdlog::logger> log)
    : m_buffer(buffer), m_log(std::move(log)),
      m_thread_count(cfg.worker_threads > 0 ? cfg.worker_threads
                                            : std::thread::hardware_concurrency())
{
    if (m_thread_count == 0) m_thread_count = 1;
}

worker_pool::~worker_pool() {
    stop();
}

void worker_pool::start() {
    if (m_running.exchange(true)) return; // already started

    m_threads.reserve(m_thread_count);
    for (unsigned int i = 0; i < m_thread_count; ++i) {
        m_threads.emplace_back(&worker_pool::worker_loop, this, i);
    }
    m_log->info("Worker pool started with {} threads", m_thread_count);
}

void worker_pool::stop() {
    if (!m_running.exchange(false)) return; // already stopped

    // Poison pills (empty vectors), one per thread
    for (unsigned int i = 0; i < m_thread_count; ++i) {
        m_queue.enqueue(std::vector<char>{});
    }

    for (auto& t : m_threads) {
        if (t.joinable()) t.join();
    }
    m_threads.clear();

    // Whatever is still queued was received before shutdown: apply it so the
    // final maintenance cycle sees it.
    std::vector<char> payload;
    while (m_queue.try_dequeue(payload)) {
        if (!payload.empty()) process(payload);
    }
    m_log->info("Worker pool stopped");
}

void worker_pool::enqueue(std::vector<char> payload) {
    m_queue.enqueue(std::move(payload));
}

std::size_t worker_pool::queue_depth() const {
    return m_queue.size_approx();
}

worker_pool::stats worker_pool::get_stats() const {
    return {
        m_processed.load(std::memory_order_relaxed),
        m_applied.load(std::memory_order_relaxed),
        m_parse_failures.load(std::memory_order_relaxed),
        m_apply_failures.load(std::memory_order_relaxed),
        m_queue.size_approx()
    };
}

bool worker_pool::process(std::span<const char> payload) {
    m_processed.fetch_add(1, std::memory_order_relaxed);

    observation obs;
    try {
        obs = parse_observation(payload);
    } catch (const std::exception& e) {
        m_parse_failures.fetch_add(1, std::memory_order_relaxed);
        m_log->debug("Dropping malformed observation: {}", e.what());
        return false;
    }

    try {
        m_buffer.alter(obs.key, obs.chain, obs.block,
                       [&](relay_message& msg) { msg.apply(obs); });
    } catch (const std::exception& e) {
        m_apply_failures.fetch_add(1, std::memory_order_relaxed);
        m_log->warn("Failed to apply {} observation for message {} (bridge {}): {}",
                    to_string(obs.kind), obs.key.message_id, obs.key.bridge, e.what());
        return false;
    }

    m_applied.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void worker_pool::worker_loop(unsigned int worker_id) {
    m_log->debug("Worker {} started", worker_id);

    std::vector<char> payload;
    while (m_running.load(std::memory_order_relaxed)) {
        // Block with timeout to allow checking m_running for graceful shutdown
        bool got = m_queue.wait_dequeue_timed(
            payload, std::chrono::milliseconds(100));

        if (!got) continue;

        // Empty payload = poison pill
        if (payload.empty()) break;

        process(std::span<const char>(payload.data(), payload.size()));
        payload.clear();
    }

    m_log->debug("Worker {} stopped", worker_id);
}

} // namespace xchain
