#pragma once

#include "common/event.hpp"
#include "hub/broadcast_channel.hpp"
#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace beacon {

// Conjunction of optional predicates; an unset field matches everything.
struct subscriber_filter {
    std::optional<std::string> source;
    std::optional<event_type> type;
    std::optional<std::string> project;

    bool matches(const event& e) const;
};

// Outbound side of one subscriber connection.
class subscriber_sink {
public:
    virtual ~subscriber_sink() = default;

    // Sends one serialized event and completes once it has been written out.
    // Completing late is how a slow consumer shows up. Returns false once
    // the connection is gone.
    virtual asio::awaitable<bool> deliver(std::shared_ptr<const std::string> json) = 0;

    // Closes the connection with a WebSocket status code.
    virtual void close(uint16_t code, const std::string& reason) = 0;
};

// What travels through the channel: the event for filtering and its JSON,
// serialized once for all subscribers.
struct broadcast_item {
    std::shared_ptr<const event> evt;
    std::shared_ptr<const std::string> json;
};

// Fans accepted events out to subscribers. Each subscriber is pumped by its
// own coroutine on its own strand, reading the shared channel at its own pace.
class broadcast_engine {
public:
    struct stats {
        uint64_t published = 0;
        uint64_t delivered = 0;
        uint64_t lagged = 0;
        std::size_t subscribers = 0;
    };

    broadcast_engine(asio::any_io_executor ex, std::size_t buffer_size,
                     std::shared_ptr<spdlog::logger> log);
    ~broadcast_engine();

    // Thread-safe. Events from one caller are delivered in publish order.
    void publish(const event& e);

    // Registers a subscriber starting at the next published event.
    uint64_t subscribe(subscriber_filter filter, std::shared_ptr<subscriber_sink> sink);

    // Idempotent. Returns true if the subscriber was registered.
    bool unsubscribe(uint64_t id);

    // Closes every subscriber connection and removes all registrations.
    void close_all(uint16_t code, const std::string& reason);

    std::size_t subscriber_count() const;
    stats get_stats() const;

private:
    struct subscription {
        subscription(uint64_t id, subscriber_filter filter,
                     std::shared_ptr<subscriber_sink> sink,
                     asio::any_io_executor ex, uint64_t cursor);

        uint64_t id;
        subscriber_filter filter;
        std::shared_ptr<subscriber_sink> sink;
        asio::strand<asio::any_io_executor> strand;
        asio::steady_timer wakeup;
        uint64_t cursor;
        std::atomic<bool> active{true};
        std::chrono::system_clock::time_point connected_at;
    };

    asio::awaitable<void> pump(std::shared_ptr<subscription> sub);
    static void wake(const std::shared_ptr<subscription>& sub);

    asio::any_io_executor m_ex;
    std::shared_ptr<spdlog::logger> m_log;
    broadcast_channel<broadcast_item> m_channel;

    mutable std::mutex m_subs_mutex;
    std::unordered_map<uint64_t, std::shared_ptr<subscription>> m_subs;
    uint64_t m_next_id = 1;

    std::atomic<uint64_t> m_published{0};
    std::atomic<uint64_t> m_delivered{0};
    std::atomic<uint64_t> m_lagged{0};
};

} // namespace beacon
