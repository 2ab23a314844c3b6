#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace beacon {

enum class recv_status { ok, empty, lagged, closed };

// Multi-producer, multi-consumer broadcast ring. Every value gets a sequence
// number; each receiver keeps its own cursor. The ring keeps the newest
// `capacity` values, so a receiver that falls further behind skips ahead and
// is told how many values it missed. Senders never wait for receivers.
template <typename T>
class broadcast_channel {
public:
    struct recv_result {
        recv_status status = recv_status::empty;
        T value{};
        uint64_t missed = 0;
    };

    explicit broadcast_channel(std::size_t capacity)
        : m_capacity(capacity > 0 ? capacity : 1), m_ring(m_capacity)
    {}

    // Appends value and wakes every registered waiter. Returns the sequence
    // number. Values sent after close() are discarded.
    uint64_t send(T value) {
        std::vector<std::function<void()>> wake;
        uint64_t seq;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) return m_next_seq;
            seq = m_next_seq++;
            m_ring[seq % m_capacity] = std::move(value);
            wake.swap(m_waiters);
        }
        for (auto& w : wake) w();
        return seq;
    }

    // Reads the value at cursor and advances it. A cursor older than the ring
    // jumps to the oldest retained value and reports lagged.
    recv_result try_recv(uint64_t& cursor) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        recv_result r;
        if (cursor >= m_next_seq) {
            r.status = m_closed ? recv_status::closed : recv_status::empty;
            return r;
        }
        uint64_t oldest = m_next_seq > m_capacity ? m_next_seq - m_capacity : 0;
        if (cursor < oldest) {
            r.status = recv_status::lagged;
            r.missed = oldest - cursor;
            cursor = oldest;
            return r;
        }
        r.status = recv_status::ok;
        r.value = m_ring[cursor % m_capacity];
        ++cursor;
        return r;
    }

    // Registers a one-shot callback for the next send(). Returns false, and
    // registers nothing, if a value is already readable at cursor or the
    // channel is closed.
    bool add_waiter(uint64_t cursor, std::function<void()> fn) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed || cursor < m_next_seq) return false;
        m_waiters.push_back(std::move(fn));
        return true;
    }

    // Sequence number the next send() will get. New receivers start here.
    uint64_t head() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_next_seq;
    }

    void close() {
        std::vector<std::function<void()>> wake;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
            wake.swap(m_waiters);
        }
        for (auto& w : wake) w();
    }

    std::size_t capacity() const { return m_capacity; }

private:
    const std::size_t m_capacity;
    mutable std::mutex m_mutex;
    std::vector<T> m_ring;
    uint64_t m_next_seq = 0;
    bool m_closed = false;
    std::vector<std::function<void()>> m_waiters;
};

} // namespace beacon
