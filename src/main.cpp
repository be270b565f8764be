#include "config.hpp"
#include "indexer.hpp"
#include "memory_storage.hpp"
#include "rocksdb_storage.hpp"
#include <nats_asio/nats_asio.hpp>
#include <asio/io_context.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

namespace {

spdlog::level::level_enum parse_log_level(const std::string& s) {
    if (s == "debug") return spdlog::level::debug;
    if (s == "warn")  return spdlog::level::warn;
    if (s == "error") return spdlog::level::err;
    return spdlog::level::info;
}

std::unique_ptr<xchain::storage> open_storage(const xchain::config& cfg,
                                              std::shared_ptr<spdlog::logger> log) {
    if (cfg.backend == xchain::storage_backend::memory) {
        log->warn("Using in-memory storage: pending entries and cursors are lost on exit");
        return std::make_unique<xchain::memory_storage>();
    }
    return xchain::rocksdb_storage::open(cfg.storage_path, log);
}

std::optional<nats_asio::ssl_config> make_ssl_config(const xchain::config& cfg) {
    if (cfg.tls_cert.empty()) return std::nullopt;
    nats_asio::ssl_config sc;
    sc.cert = cfg.tls_cert;
    sc.key  = cfg.tls_key;
    sc.ca   = cfg.tls_ca;
    sc.verify = true;
    return sc;
}

nats_asio::iconnection_sptr connect_nats(asio::io_context& ioc, const xchain::config& cfg,
                                         std::shared_ptr<spdlog::logger> log) {
    auto on_connected = [log, address = cfg.nats_address, port = cfg.nats_port](
                            nats_asio::iconnection&) -> asio::awaitable<void> {
        log->info("Connected to NATS at {}:{}", address, port);
        co_return;
    };
    auto on_disconnected = [log](nats_asio::iconnection&) -> asio::awaitable<void> {
        log->warn("Disconnected from NATS, observations are not being received");
        co_return;
    };
    auto on_error = [log](nats_asio::iconnection&, std::string_view err) -> asio::awaitable<void> {
        log->error("NATS connection error: {}", err);
        co_return;
    };

    auto conn = nats_asio::create_connection(
        ioc, on_connected, on_disconnected, on_error, make_ssl_config(cfg));

    nats_asio::connect_config nats_cfg;
    nats_cfg.address = cfg.nats_address;
    nats_cfg.port = cfg.nats_port;
    conn->start(nats_cfg);
    return conn;
}

// Starts ingestion once the first connection is up.
asio::awaitable<void> start_when_connected(std::shared_ptr<xchain::indexer_engine> engine,
                                           nats_asio::iconnection_sptr conn) {
    asio::steady_timer timer(co_await asio::this_coro::executor);
    while (!conn->is_connected()) {
        timer.expires_after(std::chrono::milliseconds(100));
        co_await timer.async_wait(asio::use_awaitable);
    }
    co_await engine->start(conn);
}

} // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("xchain_buffer",
        "Cross-chain message consolidation buffer fed from NATS");

    options.add_options()
        ("c,config", "Path to YAML config file", cxxopts::value<std::string>())
        ("a,address", "NATS server address (overrides config)", cxxopts::value<std::string>())
        ("p,port", "NATS server port (overrides config)", cxxopts::value<uint16_t>())
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print help");

    auto result = options.parse(argc, argv);

    if (result.count("help") || !result.count("config")) {
        std::cout << options.help() << std::endl;
        return result.count("help") ? 0 : 1;
    }

    auto console = spdlog::stdout_color_mt("xchain");

    xchain::config cfg;
    try {
        cfg = xchain::load_config(result["config"].as<std::string>());
    } catch (const std::exception& e) {
        console->error("Failed to load config: {}", e.what());
        return 1;
    }

    if (result.count("address")) cfg.nats_address = result["address"].as<std::string>();
    if (result.count("port"))    cfg.nats_port = result["port"].as<uint16_t>();
    if (result.count("verbose")) cfg.log_level = "debug";

    spdlog::set_level(parse_log_level(cfg.log_level));

    unsigned int workers = cfg.worker_threads > 0
        ? cfg.worker_threads
        : std::max(1u, std::thread::hardware_concurrency());

    console->info("xchain_buffer starting: nats={}:{} subject='{}' group='{}' workers={}",
                  cfg.nats_address, cfg.nats_port, cfg.input_subject,
                  cfg.input_queue_group, workers);
    console->info("storage={} path='{}' hot_ttl={}ms interval={}ms shards={}",
                  xchain::to_string(cfg.backend), cfg.storage_path,
                  cfg.buffer.hot_ttl.count(), cfg.buffer.maintenance_interval.count(),
                  cfg.buffer.shards);

    // Declared before the io_context: engine callbacks hold references to it.
    std::unique_ptr<xchain::storage> store;
    try {
        store = open_storage(cfg, console);
    } catch (const std::exception& e) {
        console->error("Failed to open storage: {}", e.what());
        return 1;
    }

    // NATS I/O and timers; storage work runs on the engine's own pool.
    asio::io_context ioc(1);

    auto engine = std::make_shared<xchain::indexer_engine>(ioc, cfg, *store, console);

    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](auto, int signo) {
        console->info("Received signal {}, shutting down", signo);
        engine->stop_loops();
        ioc.stop();
    });

    auto conn = connect_nats(ioc, cfg, console);
    asio::co_spawn(ioc, start_when_connected(engine, conn), asio::detached);

    ioc.run();

    // Observations already received are applied before the last cycle so
    // everything consolidatable reaches storage.
    engine->stop_workers();
    engine->run_final_cycle();

    // Let the cancelled loops unwind without waiting on the connection.
    ioc.restart();
    ioc.poll();

    console->info("xchain_buffer stopped");
    return 0;
}
