#pragma once

#include "config.hpp"
#include "message_buffer.hpp"
#include "relay_message.hpp"
#include <concurrentqueue/moodycamel/blockingconcurrentqueue.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <span>
#include <thread>
#include <vector>

namespace xchain {

using relay_buffer = message_buffer<relay_message>;

// Decodes observation payloads off the I/O thread and folds them into the
// message buffer.
class worker_pool {
public:
    struct stats {
        uint64_t processed = 0;
        uint64_t applied = 0;
        uint64_t parse_failures = 0;
        uint64_t apply_failures = 0;
        std::size_t queue_depth = 0;
    };

    worker_pool(const config& cfg, relay_buffer& buffer,
                std::shared_ptr<spdlog::logger> log);
    ~worker_pool();

    // Spawn N worker threads. Must be called once.
    void start();

    // Signal workers to stop, drain the queue, and join threads.
    void stop();

    // Enqueue a payload for worker processing (move semantics).
    void enqueue(std::vector<char> payload);

    // Approximate queue depth.
    std::size_t queue_depth() const;

    // Atomically read aggregate stats from all workers.
    stats get_stats() const;

    // Decode one payload and apply it to the buffer. Returns false if the
    // payload was rejected. Used by the workers; exposed for tests.
    bool process(std::span<const char> payload);

private:
    void worker_loop(unsigned int worker_id);

    relay_buffer& m_buffer;
    std::shared_ptr<spdlog::logger> m_log;

    unsigned int m_thread_count;
    std::atomic<bool> m_running{false};

    moodycamel::BlockingConcurrentQueue<std::vector<char>> m_queue;
    std::vector<std::thread> m_threads;

    // Aggregate stats (relaxed atomics)
    std::atomic<uint64_t> m_processed{0};
    std::atomic<uint64_t> m_applied{0};
    std::atomic<uint64_t> m_parse_failures{0};
    std::atomic<uint64_t> m_apply_failures{0};
};

} // namespace xchain
