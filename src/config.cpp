#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdint>
#include <stdexcept>

namespace xchain {

std::optional<storage_backend> parse_storage_backend(const std::string& s) {
    if (s == "memory")  return storage_backend::memory;
    if (s == "rocksdb") return storage_backend::rocksdb;
    return std::nullopt;
}

std::string to_string(storage_backend b) {
    switch (b) {
        case storage_backend::memory:  return "memory";
        case storage_backend::rocksdb: return "rocksdb";
    }
    return "rocksdb";
}

config load_config(const std::string& path) {
    YAML::Node root = YAML::LoadFile(path);
    config cfg;

    // NATS connection
    if (auto n = root["nats_address"]) cfg.nats_address = n.as<std::string>();
    if (auto n = root["nats_port"])    cfg.nats_port = n.as<uint16_t>();
    if (auto n = root["tls_cert"])     cfg.tls_cert = n.as<std::string>();
    if (auto n = root["tls_key"])      cfg.tls_key  = n.as<std::string>();
    if (auto n = root["tls_ca"])       cfg.tls_ca   = n.as<std::string>();

    // Input
    if (auto n = root["input_subject"]) {
        cfg.input_subject = n.as<std::string>();
    } else {
        throw std::runtime_error("config: 'input_subject' is required");
    }
    if (cfg.input_subject.empty()) {
        throw std::runtime_error("config: 'input_subject' must not be empty");
    }

    if (auto n = root["input_queue_group"]) cfg.input_queue_group = n.as<std::string>();

    // Storage
    if (auto st = root["storage"]) {
        if (!st.IsMap()) throw std::runtime_error("config: 'storage' must be a map");
        if (auto n = st["backend"]) {
            auto backend = parse_storage_backend(n.as<std::string>());
            if (!backend) throw std::runtime_error("config: invalid 'storage.backend': " + n.as<std::string>());
            cfg.backend = *backend;
        }
        if (auto n = st["path"]) cfg.storage_path = n.as<std::string>();
    }
    if (cfg.backend == storage_backend::rocksdb && cfg.storage_path.empty()) {
        throw std::runtime_error("config: 'storage.path' is required for the rocksdb backend");
    }

    // Buffer
    if (auto buf = root["buffer"]) {
        if (!buf.IsMap()) throw std::runtime_error("config: 'buffer' must be a map");
        if (auto n = buf["hot_ttl_ms"]) {
            cfg.buffer.hot_ttl = std::chrono::milliseconds(n.as<int64_t>());
        }
        if (auto n = buf["maintenance_interval_ms"]) {
            cfg.buffer.maintenance_interval = std::chrono::milliseconds(n.as<int64_t>());
        }
        if (auto n = buf["shards"]) cfg.buffer.shards = n.as<std::size_t>();
    }

    if (cfg.buffer.hot_ttl.count() <= 0) {
        throw std::runtime_error("config: 'buffer.hot_ttl_ms' must be positive");
    }
    if (cfg.buffer.maintenance_interval.count() <= 0) {
        throw std::runtime_error("config: 'buffer.maintenance_interval_ms' must be positive");
    }
    if (cfg.buffer.shards == 0) {
        throw std::runtime_error("config: 'buffer.shards' must not be zero");
    }

    // Operational
    if (auto n = root["stats_interval_seconds"]) cfg.stats_interval_seconds = n.as<int>();
    if (auto n = root["log_level"])              cfg.log_level = n.as<std::string>();
    if (auto n = root["worker_threads"])         cfg.worker_threads = n.as<unsigned int>();

    if (cfg.stats_interval_seconds <= 0) {
        throw std::runtime_error("config: 'stats_interval_seconds' must be positive");
    }

    return cfg;
}

} // namespace xchain
