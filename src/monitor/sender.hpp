#pragma once

#include "monitor/delivery_buffer.hpp"
#include "monitor/signer.hpp"
#include "monitor/transport.hpp"
#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>
#include <concurrentqueue/moodycamel/concurrentqueue.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <memory>

namespace beacon {

// Owns the delivery buffer and all network I/O. The watcher side hands events
// over through a bounded lock-free channel and is never blocked by delivery.
class sender {
public:
    struct stats {
        uint64_t offered = 0;
        uint64_t channel_dropped = 0;
        uint64_t evicted = 0;
        uint64_t delivered = 0;
        uint64_t dropped = 0;
        uint64_t retries = 0;
        std::size_t queued = 0;
    };

    sender(asio::any_io_executor ex,
           delivery_options opts,
           const signer& sig,
           std::shared_ptr<event_transport> transport,
           std::size_t channel_capacity,
           std::shared_ptr<spdlog::logger> log);

    // Thread-safe, non-blocking. Returns false if the channel is full and the
    // event was dropped.
    bool offer(event e);

    // Delivery loop. Returns after stop() once the final flush has finished or
    // shutdown_budget has elapsed.
    asio::awaitable<void> run(std::chrono::milliseconds shutdown_budget);

    // Thread-safe. Ends the loop and triggers the final flush.
    void stop();

    asio::strand<asio::any_io_executor>& strand() { return m_strand; }

    stats get_stats() const;

private:
    void drain_channel();
    // Serializes and signs the new batch. False if signing failed and the batch was dropped.
    bool prepare(batch& b);
    asio::awaitable<void> attempt();
    asio::awaitable<void> final_flush(std::chrono::milliseconds budget);
    void publish_stats();

    asio::strand<asio::any_io_executor> m_strand;
    asio::steady_timer m_timer;
    delivery_buffer m_buffer;
    const signer& m_signer;
    std::shared_ptr<event_transport> m_transport;
    std::size_t m_channel_capacity;
    std::shared_ptr<spdlog::logger> m_log;

    moodycamel::ConcurrentQueue<event> m_channel;
    std::atomic<bool> m_stopping{false};

    std::atomic<uint64_t> m_offered{0};
    std::atomic<uint64_t> m_channel_dropped{0};
    std::atomic<uint64_t> m_evicted{0};
    std::atomic<uint64_t> m_delivered{0};
    std::atomic<uint64_t> m_dropped{0};
    std::atomic<uint64_t> m_retries{0};
    std::atomic<std::size_t> m_queued{0};
};

// Serialized batch body: a JSON array of event envelopes.
std::string serialize_batch(const std::vector<event>& events);

} // namespace beacon
