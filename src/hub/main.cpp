#include "common/env.hpp"
#include "common/logging.hpp"
#include "hub/broadcast_engine.hpp"
#include "hub/config.hpp"
#include "hub/hub_server.hpp"
#include "hub/ingest_service.hpp"
#include "hub/key_source.hpp"
#include "hub/rate_limiter.hpp"
#include "hub/signature_verifier.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <asio/redirect_error.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <asio/thread_pool.hpp>
#include <asio/use_awaitable.hpp>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace {

// Runs `fn` every `interval` until the timer is cancelled.
template <typename Fn>
asio::awaitable<void> periodic(asio::steady_timer& timer, std::chrono::seconds interval, Fn fn) {
    while (true) {
        timer.expires_after(interval);
        asio::error_code ec;
        co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec) co_return;
        fn();
    }
}

std::shared_ptr<beacon::key_source> make_key_source(const beacon::hub_config& cfg) {
    if (!cfg.key_endpoint.empty()) {
        return std::make_shared<beacon::http_key_source>(
            cfg.key_endpoint, cfg.key_endpoint_api_key, std::chrono::seconds(10));
    }
    return std::make_shared<beacon::static_key_source>(cfg.public_keys);
}

int run_hub(const beacon::hub_config& cfg, std::shared_ptr<spdlog::logger> console) {
    if (cfg.unsafe_no_auth) {
        console->warn("==============================================================");
        console->warn("UNSAFE MODE: signatures and subscriber tokens are NOT checked.");
        console->warn("Anyone can publish and subscribe. Local development only.");
        console->warn("==============================================================");
    }

    auto keys = make_key_source(cfg);
    auto verifier = std::make_shared<beacon::signature_verifier>(keys, console);
    if (!cfg.unsafe_no_auth || !cfg.public_keys.empty() || !cfg.key_endpoint.empty()) {
        verifier->load_initial(cfg.key_fetch_attempts,
                               std::chrono::milliseconds(cfg.key_fetch_base_delay_ms),
                               std::chrono::milliseconds(cfg.key_fetch_max_delay_ms));
    }

    beacon::rate_limit_options limits;
    limits.source_rate = cfg.source_rate;
    limits.source_capacity = cfg.source_burst;
    limits.global_rate = cfg.global_rate;
    limits.global_capacity = cfg.global_burst;
    limits.idle_timeout = std::chrono::seconds(cfg.bucket_idle_seconds);

    unsigned int threads = cfg.worker_threads > 0
        ? cfg.worker_threads
        : std::thread::hardware_concurrency();
    if (threads == 0) threads = 1;

    asio::io_context ioc(static_cast<int>(threads));
    auto work = asio::make_work_guard(ioc);

    auto ctx = std::make_shared<beacon::hub_context>();
    ctx->cfg = cfg;
    ctx->log = console;
    ctx->verifier = verifier;
    ctx->limiter = std::make_shared<beacon::rate_limiter>(limits);
    ctx->broadcaster = std::make_shared<beacon::broadcast_engine>(
        ioc.get_executor(), cfg.subscriber_buffer_size, console);

    auto ingest = std::make_shared<beacon::ingest_service>(ctx);
    beacon::hub_server server(ctx, ingest);

    console->info("beacon_hub starting");
    console->info("  listen:      {}:{}", cfg.bind_address, cfg.port);
    console->info("  keys:        {} ({} loaded)", keys->describe(), verifier->key_count());
    console->info("  rate:        {}/s per source, {}/s global", cfg.source_rate, cfg.global_rate);
    console->info("  buffer:      {} events per subscriber", cfg.subscriber_buffer_size);

    // Key fetches block, so they run off the io threads
    asio::thread_pool key_pool(1);
    asio::steady_timer key_timer(key_pool);
    if (verifier->refreshable() && cfg.key_refresh_seconds > 0) {
        asio::co_spawn(key_pool,
            periodic(key_timer, std::chrono::seconds(cfg.key_refresh_seconds),
                     [verifier] { verifier->refresh(); }),
            asio::detached);
    }

    asio::steady_timer cleanup_timer(ioc);
    asio::co_spawn(ioc,
        periodic(cleanup_timer, std::chrono::seconds(cfg.bucket_cleanup_seconds),
                 [ctx] {
                     auto removed = ctx->limiter->cleanup_idle();
                     if (removed > 0) ctx->log->debug("removed {} idle rate-limit buckets", removed);
                 }),
        asio::detached);

    asio::steady_timer stats_timer(ioc);
    if (cfg.stats_interval_seconds > 0) {
        asio::co_spawn(ioc,
            periodic(stats_timer, std::chrono::seconds(cfg.stats_interval_seconds),
                     [ctx, ingest] {
                         auto is = ingest->get_stats();
                         auto bs = ctx->broadcaster->get_stats();
                         ctx->log->info("stats: accepted={} events={} rejected_auth={} rejected_rate={} "
                                        "rejected_format={} rejected_subs={} subscribers={} delivered={} lagged={} buckets={}",
                                        is.accepted_batches,
                                        is.accepted_events,
                                        is.rejected_auth,
                                        is.rejected_rate,
                                        is.rejected_format,
                                        is.rejected_subscribers,
                                        bs.subscribers,
                                        bs.delivered,
                                        bs.lagged,
                                        ctx->limiter->bucket_count());
                     }),
            asio::detached);
    }

    std::promise<void> stop_requested;
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const asio::error_code& ec, int) {
        if (ec) return;
        console->info("Shutting down...");
        stop_requested.set_value();
    });

    std::vector<std::thread> pool;
    for (unsigned int i = 0; i < threads; ++i) {
        pool.emplace_back([&ioc] { ioc.run(); });
    }

    try {
        server.run();
    } catch (const std::exception& e) {
        console->error("Failed to start server: {}", e.what());
        work.reset();
        ioc.stop();
        for (auto& t : pool) t.join();
        key_pool.stop();
        key_pool.join();
        return 1;
    }

    stop_requested.get_future().wait();
    server.shutdown();

    asio::post(key_pool, [&] { key_timer.cancel(); });
    asio::post(ioc, [&] {
        cleanup_timer.cancel();
        stats_timer.cancel();
    });
    work.reset();
    key_pool.join();
    ioc.stop();
    for (auto& t : pool) t.join();

    console->info("beacon_hub stopped");
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("beacon_hub",
        "Verifies signed activity batches and broadcasts them to WebSocket subscribers");

    options.add_options()
        ("c,config", "Path to YAML config file", cxxopts::value<std::string>())
        ("p,port", "Listen port (overrides config and PORT)", cxxopts::value<uint16_t>())
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print help");

    std::optional<cxxopts::ParseResult> parsed;
    try {
        parsed.emplace(options.parse(argc, argv));
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n" << options.help() << std::endl;
        return 1;
    }
    auto& result = *parsed;

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    auto console = beacon::make_console_logger("hub");

    beacon::hub_config cfg;
    try {
        if (result.count("config")) {
            beacon::load_hub_config_file(cfg, result["config"].as<std::string>());
        }
        beacon::apply_hub_env(cfg, beacon::process_env);

        if (result.count("port")) cfg.port = result["port"].as<uint16_t>();
        if (result.count("verbose")) cfg.log_level = "debug";

        beacon::validate_hub_config(cfg);
    } catch (const std::exception& e) {
        console->error("Failed to load config: {}", e.what());
        return 1;
    }

    console->set_level(beacon::parse_log_level(cfg.log_level));
    spdlog::set_level(beacon::parse_log_level(cfg.log_level));

    try {
        return run_hub(cfg, console);
    } catch (const std::exception& e) {
        console->error("{}", e.what());
        return 1;
    }
}
