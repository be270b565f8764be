#pragma once

#include "message_buffer.hpp"
#include <string>
#include <cstdint>
#include <optional>

namespace xchain {

// Supported durable storage backends
enum class storage_backend {
    memory,
    rocksdb
};

struct config {
    // NATS connection
    std::string nats_address = "127.0.0.1";
    uint16_t nats_port = 4222;
    std::string tls_cert;
    std::string tls_key;
    std::string tls_ca;

    // Input stream - core NATS subject carrying JSON observations
    std::string input_subject;
    std::string input_queue_group;  // optional load-balancing across indexers

    // Storage
    storage_backend backend = storage_backend::rocksdb;
    std::string storage_path = "./xchain-buffer-db";

    // Message buffer tuning
    buffer_settings buffer;

    // Operational
    int stats_interval_seconds = 10;
    std::string log_level = "info";

    // Worker threads for parallel observation processing (0 = hardware_concurrency)
    unsigned int worker_threads = 0;
};

// Parse config from YAML file. Throws on error.
config load_config(const std::string& path);

// Parse storage_backend from string. Returns nullopt if invalid.
std::optional<storage_backend> parse_storage_backend(const std::string& s);

std::string to_string(storage_backend b);

} // namespace xchain
