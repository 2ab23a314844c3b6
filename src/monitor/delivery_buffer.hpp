#pragma once

#include "common/event.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace beacon {

// Exponential backoff: initial * 2^(attempt-1), jittered by +/- jitter, capped at max.
struct backoff_policy {
    std::chrono::milliseconds initial{1000};
    std::chrono::milliseconds max{60000};
    double jitter = 0.25;

    // Unjittered delay after the given failed attempt (1-based).
    std::chrono::milliseconds ideal_delay(uint32_t attempt) const;

    // unit_random in [0, 1) selects the point inside the jitter band.
    std::chrono::milliseconds next_delay(uint32_t attempt, double unit_random) const;
};

struct delivery_options {
    std::size_t capacity = 1000;
    std::size_t max_batch_size = 1000;
    std::chrono::milliseconds flush_interval{1000};
    backoff_policy backoff;
    uint32_t max_attempts = 10;
};

// Outcome of one submission attempt. status 0 means the request never got a
// response (connect failure, timeout).
struct submit_result {
    int status = 0;
    std::optional<std::chrono::seconds> retry_after;
    std::string error;
};

enum class batch_state { queued, in_flight, delivered, retrying, dropped };

const char* to_string(batch_state s);

struct batch {
    uint64_t id = 0;
    std::vector<event> events;
    // Exact bytes that were signed; retries resend them unchanged
    std::string body;
    std::string signature;
    batch_state state = batch_state::queued;
    uint32_t attempts = 0;
    std::string last_error;
    std::chrono::steady_clock::time_point next_attempt;
};

enum class delivery_outcome { delivered, retry_scheduled, dropped };

struct delivery_decision {
    delivery_outcome outcome;
    std::chrono::milliseconds delay{0};
};

// Bounded event FIFO plus the retry state machine for the batch being delivered:
//
//   queued -> in_flight -> delivered
//                       -> retrying -> in_flight ...
//                       -> dropped
//
// Only one batch exists at a time. The capacity bounds events still waiting in
// the FIFO; overflow evicts the oldest event. No I/O and no clock reads: the
// caller passes `now` in, which keeps every transition testable.
class delivery_buffer {
public:
    using clock = std::chrono::steady_clock;

    struct stats {
        uint64_t enqueued = 0;
        uint64_t evicted = 0;
        uint64_t delivered_events = 0;
        uint64_t dropped_events = 0;
        uint64_t batches_delivered = 0;
        uint64_t batches_dropped = 0;
        uint64_t retries = 0;
        std::size_t queued = 0;
    };

    delivery_buffer(delivery_options opts, std::shared_ptr<spdlog::logger> log,
                    uint64_t seed = std::random_device{}());

    // Appends an event. Returns false if the oldest queued event had to be evicted.
    bool enqueue(event e, clock::time_point now);

    // No current batch, and either max_batch_size events are waiting or the
    // oldest waiting event has been queued for flush_interval.
    bool flush_due(clock::time_point now) const;

    // Moves up to max_batch_size events into a new batch. Returns the batch, or
    // nullptr if one is already pending or nothing is queued.
    batch* begin_batch(clock::time_point now);

    batch* current_batch() { return m_current ? &*m_current : nullptr; }
    const batch* current_batch() const { return m_current ? &*m_current : nullptr; }

    // Current batch is queued/retrying and its next attempt time has come.
    bool attempt_due(clock::time_point now) const;

    // queued/retrying -> in_flight
    void mark_in_flight();

    // in_flight -> delivered | retrying | dropped
    delivery_decision record_result(const submit_result& result, clock::time_point now);

    // Drop the current batch without further attempts (shutdown).
    void abandon_current(const std::string& reason);

    // Next time the sender has something to do.
    clock::time_point next_deadline(clock::time_point now) const;

    std::size_t queued() const { return m_queue.size(); }
    bool empty() const { return m_queue.empty() && !m_current; }
    const std::deque<event>& queued_events() const { return m_queue; }
    stats get_stats() const;

    static bool is_retryable(int status);

private:
    void drop_current(const std::string& reason);

    delivery_options m_opts;
    std::shared_ptr<spdlog::logger> m_log;
    std::mt19937_64 m_rng;

    std::deque<event> m_queue;
    std::optional<clock::time_point> m_oldest_enqueued;
    std::optional<batch> m_current;
    uint64_t m_next_batch_id = 1;

    // Capacity pressure episode: warned at 80%, errored on first eviction.
    bool m_pressure_warned = false;
    bool m_overflow_logged = false;

    stats m_stats;
};

} // namespace beacon
