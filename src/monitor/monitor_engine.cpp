#include "monitor/monitor_engine.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/redirect_error.hpp>
#include <asio/strand.hpp>
#include <asio/use_awaitable.hpp>
#include <exception>

namespace beacon {

static delivery_options delivery_options_from(const monitor_config& cfg) {
    delivery_options o;
    o.capacity = cfg.buffer_capacity;
    o.max_batch_size = cfg.max_batch_size;
    o.flush_interval = std::chrono::milliseconds(cfg.flush_interval_ms);
    o.backoff.initial = std::chrono::milliseconds(cfg.initial_retry_delay_ms);
    o.backoff.max = std::chrono::milliseconds(cfg.max_retry_delay_ms);
    o.max_attempts = cfg.max_retry_attempts;
    return o;
}

monitor_engine::monitor_engine(asio::io_context& ioc, const monitor_config& cfg,
                               const signer& sig, std::shared_ptr<event_transport> transport,
                               std::shared_ptr<spdlog::logger> log)
    : m_ioc(ioc), m_cfg(cfg), m_log(std::move(log)),
      m_parser(cfg.source_id, cfg.max_tracked_sessions, m_log),
      m_filter(cfg.basename_allowlist),
      m_sender(ioc.get_executor(), delivery_options_from(cfg), sig,
               std::move(transport), cfg.channel_capacity, m_log),
      m_stats_timer(asio::make_strand(ioc))
{}

bool monitor_engine::on_line(const std::filesystem::path& file, std::string_view line) {
    auto parsed = m_parser.parse_line(file, line);
    for (auto& e : parsed.events) {
        m_events_parsed.fetch_add(1, std::memory_order_relaxed);
        m_sender.offer(m_filter.apply(std::move(e)));
    }
    return parsed.session_finished;
}

void monitor_engine::start(std::function<void()> on_stopped) {
    m_watcher = std::make_unique<file_watcher>(
        m_ioc.get_executor(), m_cfg.watch_root, m_cfg.file_extension, m_cfg.max_watches,
        [this](const std::filesystem::path& file, std::string_view line) {
            return on_line(file, line);
        },
        m_log);
    m_watcher->start();

    asio::co_spawn(m_watcher->strand(), m_watcher->run(), asio::detached);
    asio::co_spawn(m_sender.strand(),
                   m_sender.run(std::chrono::seconds(m_cfg.shutdown_timeout_seconds)),
                   [log = m_log, on_stopped = std::move(on_stopped)](std::exception_ptr ep) {
                       if (ep) {
                           try {
                               std::rethrow_exception(ep);
                           } catch (const std::exception& e) {
                               log->error("delivery loop failed: {}", e.what());
                           }
                       }
                       if (on_stopped) on_stopped();
                   });
    if (m_cfg.stats_interval_seconds > 0) {
        asio::co_spawn(m_stats_timer.get_executor(), stats_loop(), asio::detached);
    }

    m_log->info("monitor engine started (source={}, root={})", m_cfg.source_id, m_cfg.watch_root);
}

void monitor_engine::stop() {
    if (m_watcher) m_watcher->stop();
    m_sender.stop();
    asio::post(m_stats_timer.get_executor(), [this] { m_stats_timer.cancel(); });
}

asio::awaitable<void> monitor_engine::stats_loop() {
    while (true) {
        m_stats_timer.expires_after(std::chrono::seconds(m_cfg.stats_interval_seconds));
        asio::error_code ec;
        co_await m_stats_timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec) co_return;

        auto ws = m_watcher ? m_watcher->get_stats() : file_watcher::stats{};
        auto ss = m_sender.get_stats();

        m_log->info("stats: lines={} events={} queued={} delivered={} dropped={} evicted={} "
                    "channel_dropped={} retries={} files={} watches={}{}",
                   ws.lines,
                   m_events_parsed.load(),
                   ss.queued,
                   ss.delivered,
                   ss.dropped,
                   ss.evicted,
                   ss.channel_dropped,
                   ss.retries,
                   ws.tracked_files,
                   ws.watched_dirs,
                   ws.degraded ? " (degraded)" : "");
    }
}

} // namespace beacon
