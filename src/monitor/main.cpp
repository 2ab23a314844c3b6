#include "common/env.hpp"
#include "common/logging.hpp"
#include "monitor/config.hpp"
#include "monitor/http_transport.hpp"
#include "monitor/monitor_engine.hpp"
#include "monitor/signer.hpp"
#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace {

int cmd_init(const beacon::monitor_config& cfg, bool force, spdlog::logger& console) {
    auto sig = beacon::signer::initialize(cfg.key_dir, force);
    console.info("Generated Ed25519 keypair in {}", cfg.key_dir);
    std::cout << "Source ID:   " << cfg.source_id << "\n"
              << "Public key:  " << sig.public_key_base64() << "\n"
              << "Fingerprint: " << sig.fingerprint() << "\n\n"
              << "Register it with the hub, e.g.\n"
              << "  BEACON_PUBLIC_KEYS=\"" << cfg.source_id << ":" << sig.public_key_base64() << "\"\n";
    return 0;
}

int cmd_export_key(const beacon::monitor_config& cfg) {
    auto sig = beacon::signer::load(cfg.key_dir, beacon::process_env);
    // Only the key goes to stdout so it can be piped into a secret store
    std::cout << sig.private_key_base64() << std::endl;
    return 0;
}

int cmd_run(const beacon::monitor_config& cfg, std::shared_ptr<spdlog::logger> console) {
    auto sig = beacon::signer::load(cfg.key_dir, beacon::process_env);

    unsigned int threads = cfg.worker_threads > 0
        ? cfg.worker_threads
        : std::thread::hardware_concurrency();
    if (threads == 0) threads = 1;

    console->info("beacon_monitor starting");
    console->info("  hub:         {}", cfg.hub_url);
    console->info("  source:      {}", cfg.source_id);
    console->info("  key:         {}", sig.fingerprint());
    console->info("  watch root:  {}", cfg.watch_root);
    console->info("  buffer:      {} events, batch {} / {}ms", cfg.buffer_capacity,
                  cfg.max_batch_size, cfg.flush_interval_ms);
    console->info("  allowlist:   {}", cfg.basename_allowlist
                      ? std::to_string(cfg.basename_allowlist->size()) + " extensions"
                      : std::string("off"));
    console->info("  threads:     {}", threads);

    asio::io_context ioc(static_cast<int>(threads));

    auto transport = std::make_shared<beacon::http_transport>(
        cfg.hub_url, cfg.source_id, std::chrono::seconds(cfg.request_timeout_seconds), console);
    auto engine = std::make_shared<beacon::monitor_engine>(ioc, cfg, sig, transport, console);

    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    asio::steady_timer watchdog(ioc);

    engine->start([&] {
        asio::post(ioc, [&] {
            watchdog.cancel();
            signals.cancel();
        });
    });

    signals.async_wait([&](const asio::error_code& ec, int) {
        if (ec) return;
        console->info("Shutting down, flushing pending events...");
        engine->stop();

        // Hard bound on the final flush
        watchdog.expires_after(std::chrono::seconds(cfg.shutdown_timeout_seconds + 1));
        watchdog.async_wait([&](const asio::error_code& wec) {
            if (wec) return;
            console->warn("Final flush did not finish in time, exiting");
            transport->cancel();
            ioc.stop();
        });
    });

    std::vector<std::thread> pool;
    for (unsigned int i = 1; i < threads; ++i) {
        pool.emplace_back([&ioc] { ioc.run(); });
    }
    ioc.run();
    for (auto& t : pool) t.join();

    console->info("beacon_monitor stopped");
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("beacon_monitor",
        "Tails assistant session logs and forwards signed, privacy-filtered activity events");

    options.add_options()
        ("command", "init | run | export-key", cxxopts::value<std::string>()->default_value("run"))
        ("c,config", "Path to YAML config file", cxxopts::value<std::string>())
        ("u,hub-url", "Hub URL (overrides config and BEACON_HUB_URL)", cxxopts::value<std::string>())
        ("k,key-dir", "Key directory (overrides config and BEACON_KEY_PATH)", cxxopts::value<std::string>())
        ("f,force", "Overwrite an existing key (init)")
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print help");
    options.parse_positional({"command"});
    options.positional_help("[init|run|export-key]");

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

    auto command = result["command"].as<std::string>();
    if (command != "init" && command != "run" && command != "export-key") {
        std::cerr << "unknown command '" << command << "'\n" << options.help() << std::endl;
        return 1;
    }

    auto console = beacon::make_console_logger("monitor");

    beacon::monitor_config cfg;
    try {
        cfg = beacon::default_monitor_config(beacon::process_env);
        if (result.count("config")) {
            beacon::load_monitor_config_file(cfg, result["config"].as<std::string>());
        }
        beacon::apply_monitor_env(cfg, beacon::process_env);

        if (result.count("hub-url")) cfg.hub_url = result["hub-url"].as<std::string>();
        if (result.count("key-dir")) cfg.key_dir = result["key-dir"].as<std::string>();
        if (result.count("verbose")) cfg.log_level = "debug";

        beacon::validate_monitor_config(cfg, command == "run");
    } catch (const std::exception& e) {
        console->error("Failed to load config: {}", e.what());
        return 1;
    }

    console->set_level(beacon::parse_log_level(cfg.log_level));
    spdlog::set_level(beacon::parse_log_level(cfg.log_level));

    try {
        if (command == "init") return cmd_init(cfg, result.count("force") > 0, *console);
        if (command == "export-key") return cmd_export_key(cfg);
        return cmd_run(cfg, console);
    } catch (const std::exception& e) {
        console->error("{}", e.what());
        return 1;
    }
}
