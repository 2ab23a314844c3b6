#include "monitor/sender.hpp"
#include <asio/post.hpp>
#include <asio/redirect_error.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>

namespace beacon {

using clock = std::chrono::steady_clock;

// Upper bound on how long a freshly offered event waits before the loop notices it
static constexpr std::chrono::milliseconds channel_poll_interval{50};

std::string serialize_batch(const std::vector<event>& events) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& e : events) arr.push_back(e);
    return arr.dump();
}

sender::sender(asio::any_io_executor ex,
               delivery_options opts,
               const signer& sig,
               std::shared_ptr<event_transport> transport,
               std::size_t channel_capacity,
               std::shared_ptr<spdlog::logger> log)
    : m_strand(asio::make_strand(ex)),
      m_timer(m_strand),
      m_buffer(opts, log),
      m_signer(sig),
      m_transport(std::move(transport)),
      m_channel_capacity(channel_capacity > 0 ? channel_capacity : 1),
      m_log(std::move(log))
{}

bool sender::offer(event e) {
    if (m_channel.size_approx() >= m_channel_capacity) {
        auto dropped = m_channel_dropped.fetch_add(1, std::memory_order_relaxed) + 1;
        if (dropped == 1 || dropped % 100 == 0) {
            m_log->warn("sender: channel full ({} events), dropped {} events so far",
                       m_channel_capacity, dropped);
        }
        return false;
    }
    m_channel.enqueue(std::move(e));
    m_offered.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void sender::stop() {
    asio::post(m_strand, [this] {
        m_stopping.store(true);
        m_timer.cancel();
    });
}

void sender::drain_channel() {
    event items[64];
    auto now = clock::now();
    while (std::size_t n = m_channel.try_dequeue_bulk(items, std::size(items))) {
        for (std::size_t i = 0; i < n; ++i) {
            if (!m_buffer.enqueue(std::move(items[i]), now)) {
                m_evicted.fetch_add(1, std::memory_order_relaxed);
            }
        }
    }
}

bool sender::prepare(batch& b) {
    try {
        b.body = serialize_batch(b.events);
        b.signature = m_signer.sign(b.body);
        return true;
    } catch (const std::exception& e) {
        m_log->error("sender: failed to sign batch {}: {}", b.id, e.what());
        m_buffer.abandon_current(e.what());
        return false;
    }
}

asio::awaitable<void> sender::attempt() {
    batch* b = m_buffer.current_batch();
    if (!b) co_return;

    m_buffer.mark_in_flight();
    auto result = co_await m_transport->submit(b->body, b->signature);

    auto decision = m_buffer.record_result(result, clock::now());
    if (decision.outcome == delivery_outcome::retry_scheduled) {
        m_retries.fetch_add(1, std::memory_order_relaxed);
    }
    publish_stats();
}

void sender::publish_stats() {
    auto s = m_buffer.get_stats();
    m_delivered.store(s.delivered_events, std::memory_order_relaxed);
    m_dropped.store(s.dropped_events, std::memory_order_relaxed);
    m_queued.store(s.queued, std::memory_order_relaxed);
}

asio::awaitable<void> sender::run(std::chrono::milliseconds shutdown_budget) {
    m_log->info("sender: delivery loop started");

    while (!m_stopping.load()) {
        drain_channel();

        auto now = clock::now();
        if (m_buffer.flush_due(now)) {
            if (batch* b = m_buffer.begin_batch(now)) prepare(*b);
        }
        if (m_buffer.attempt_due(now)) {
            co_await attempt();
            continue;
        }
        publish_stats();

        auto deadline = std::min(m_buffer.next_deadline(now), now + channel_poll_interval);
        m_timer.expires_at(deadline);
        asio::error_code ec;
        co_await m_timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }

    co_await final_flush(shutdown_budget);
    m_log->info("sender: delivery loop stopped");
}

asio::awaitable<void> sender::final_flush(std::chrono::milliseconds budget) {
    auto deadline = clock::now() + budget;
    drain_channel();

    while (!m_buffer.empty()) {
        if (clock::now() >= deadline) {
            auto remaining = m_buffer.queued() +
                (m_buffer.current_batch() ? m_buffer.current_batch()->events.size() : 0);
            m_log->warn("sender: shutdown budget exhausted, {} events not delivered", remaining);
            m_buffer.abandon_current("shutdown");
            break;
        }

        batch* b = m_buffer.current_batch();
        if (!b) {
            b = m_buffer.begin_batch(clock::now());
            if (!b || !prepare(*b)) continue;
        }

        co_await attempt();
        // No backoff during shutdown: one attempt per batch
        if (m_buffer.current_batch()) m_buffer.abandon_current("shutdown");
    }
    publish_stats();
}

sender::stats sender::get_stats() const {
    return {
        m_offered.load(std::memory_order_relaxed),
        m_channel_dropped.load(std::memory_order_relaxed),
        m_evicted.load(std::memory_order_relaxed),
        m_delivered.load(std::memory_order_relaxed),
        m_dropped.load(std::memory_order_relaxed),
        m_retries.load(std::memory_order_relaxed),
        m_queued.load(std::memory_order_relaxed)
    };
}

} // namespace beacon
