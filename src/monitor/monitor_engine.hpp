#pragma once

#include "monitor/config.hpp"
#include "monitor/file_watcher.hpp"
#include "monitor/log_parser.hpp"
#include "monitor/privacy_filter.hpp"
#include "monitor/sender.hpp"
#include "monitor/signer.hpp"
#include "monitor/transport.hpp"
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <string_view>

namespace beacon {

// Wires watcher -> parser -> privacy filter -> sender and reports stats.
class monitor_engine {
public:
    monitor_engine(asio::io_context& ioc, const monitor_config& cfg,
                   const signer& sig, std::shared_ptr<event_transport> transport,
                   std::shared_ptr<spdlog::logger> log);

    // Starts the watcher, the delivery loop and the stats loop. on_stopped runs
    // once the delivery loop has finished its final flush.
    // Throws if the watcher cannot be set up.
    void start(std::function<void()> on_stopped = {});

    // Stops the watcher and asks the sender for its final flush.
    void stop();

    // Parse, filter and hand over one log line. Returns true once the
    // file's session has ended.
    bool on_line(const std::filesystem::path& file, std::string_view line);

    sender& delivery() { return m_sender; }

private:
    asio::awaitable<void> stats_loop();

    asio::io_context& m_ioc;
    monitor_config m_cfg;
    std::shared_ptr<spdlog::logger> m_log;

    log_parser m_parser;
    privacy_filter m_filter;
    sender m_sender;
    std::unique_ptr<file_watcher> m_watcher;
    asio::steady_timer m_stats_timer;

    std::atomic<uint64_t> m_events_parsed{0};
};

} // namespace beacon
