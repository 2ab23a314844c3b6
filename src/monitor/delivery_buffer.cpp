#include "monitor/delivery_buffer.hpp"
#include <algorithm>
#include <cmath>

namespace beacon {

using namespace std::chrono;

const char* to_string(batch_state s) {
    switch (s) {
        case batch_state::queued:    return "queued";
        case batch_state::in_flight: return "in_flight";
        case batch_state::delivered: return "delivered";
        case batch_state::retrying:  return "retrying";
        case batch_state::dropped:   return "dropped";
    }
    return "unknown";
}

milliseconds backoff_policy::ideal_delay(uint32_t attempt) const {
    if (attempt == 0) attempt = 1;
    auto delay = initial;
    for (uint32_t i = 1; i < attempt && delay < max; ++i) {
        delay *= 2;
    }
    return std::min(delay, max);
}

milliseconds backoff_policy::next_delay(uint32_t attempt, double unit_random) const {
    double ideal = static_cast<double>(ideal_delay(attempt).count());
    double factor = 1.0 + jitter * (2.0 * std::clamp(unit_random, 0.0, 1.0) - 1.0);
    auto jittered = milliseconds(static_cast<int64_t>(std::llround(ideal * factor)));
    return std::clamp(jittered, milliseconds(1), max);
}

delivery_buffer::delivery_buffer(delivery_options opts, std::shared_ptr<spdlog::logger> log,
                                 uint64_t seed)
    : m_opts(opts), m_log(std::move(log)), m_rng(seed)
{
    if (m_opts.capacity == 0) m_opts.capacity = 1;
    if (m_opts.max_batch_size == 0) m_opts.max_batch_size = 1;
    if (m_opts.max_attempts == 0) m_opts.max_attempts = 1;
}

bool delivery_buffer::enqueue(event e, clock::time_point now) {
    bool evicted = false;
    if (m_queue.size() >= m_opts.capacity) {
        m_queue.pop_front();
        ++m_stats.evicted;
        evicted = true;
        if (!m_overflow_logged) {
            m_log->error("delivery buffer full ({} events), evicting oldest events", m_opts.capacity);
            m_overflow_logged = true;
        }
    }

    if (m_queue.empty()) m_oldest_enqueued = now;
    m_queue.push_back(std::move(e));
    ++m_stats.enqueued;

    if (!m_pressure_warned && m_queue.size() * 5 >= m_opts.capacity * 4) {
        m_log->warn("delivery buffer at {}/{} events (80% threshold)", m_queue.size(), m_opts.capacity);
        m_pressure_warned = true;
    }
    return !evicted;
}

bool delivery_buffer::flush_due(clock::time_point now) const {
    if (m_current || m_queue.empty()) return false;
    if (m_queue.size() >= m_opts.max_batch_size) return true;
    return m_oldest_enqueued && now - *m_oldest_enqueued >= m_opts.flush_interval;
}

batch* delivery_buffer::begin_batch(clock::time_point now) {
    if (m_current || m_queue.empty()) return nullptr;

    batch b;
    b.id = m_next_batch_id++;
    std::size_t n = std::min(m_queue.size(), m_opts.max_batch_size);
    b.events.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        b.events.push_back(std::move(m_queue.front()));
        m_queue.pop_front();
    }
    b.state = batch_state::queued;
    b.next_attempt = now;
    m_current = std::move(b);

    m_oldest_enqueued = m_queue.empty() ? std::nullopt : std::optional<clock::time_point>(now);
    if (m_queue.size() * 5 < m_opts.capacity * 4) {
        m_pressure_warned = false;
        m_overflow_logged = false;
    }
    return &*m_current;
}

bool delivery_buffer::attempt_due(clock::time_point now) const {
    if (!m_current) return false;
    if (m_current->state != batch_state::queued && m_current->state != batch_state::retrying) {
        return false;
    }
    return now >= m_current->next_attempt;
}

void delivery_buffer::mark_in_flight() {
    if (!m_current) return;
    m_current->state = batch_state::in_flight;
    ++m_current->attempts;
}

bool delivery_buffer::is_retryable(int status) {
    return status == 0 || status == 408 || status == 429 || status >= 500;
}

void delivery_buffer::drop_current(const std::string& reason) {
    m_current->state = batch_state::dropped;
    m_stats.dropped_events += m_current->events.size();
    ++m_stats.batches_dropped;
    m_log->warn("dropping batch {} ({} events) after {} attempts: {}",
               m_current->id, m_current->events.size(), m_current->attempts, reason);
    m_current.reset();
}

delivery_decision delivery_buffer::record_result(const submit_result& result, clock::time_point now) {
    if (!m_current) return {delivery_outcome::dropped, milliseconds(0)};

    if (result.status >= 200 && result.status < 300) {
        m_current->state = batch_state::delivered;
        m_stats.delivered_events += m_current->events.size();
        ++m_stats.batches_delivered;
        m_log->debug("batch {} delivered ({} events, attempt {})",
                    m_current->id, m_current->events.size(), m_current->attempts);
        m_current.reset();
        return {delivery_outcome::delivered, milliseconds(0)};
    }

    m_current->last_error = result.error.empty()
        ? "HTTP " + std::to_string(result.status)
        : result.error;

    if (!is_retryable(result.status)) {
        m_log->error("hub rejected batch {} with HTTP {}: {}",
                    m_current->id, result.status, m_current->last_error);
        drop_current(m_current->last_error);
        return {delivery_outcome::dropped, milliseconds(0)};
    }

    if (m_current->attempts >= m_opts.max_attempts) {
        drop_current(m_current->last_error);
        return {delivery_outcome::dropped, milliseconds(0)};
    }

    std::uniform_real_distribution<double> dist(0.0, 1.0);
    auto delay = m_opts.backoff.next_delay(m_current->attempts, dist(m_rng));
    if (result.retry_after) {
        delay = std::max(delay, duration_cast<milliseconds>(*result.retry_after));
    }

    m_current->state = batch_state::retrying;
    m_current->next_attempt = now + delay;
    ++m_stats.retries;
    m_log->info("batch {} attempt {} failed ({}), retrying in {}ms",
               m_current->id, m_current->attempts, m_current->last_error, delay.count());
    return {delivery_outcome::retry_scheduled, delay};
}

void delivery_buffer::abandon_current(const std::string& reason) {
    if (m_current) drop_current(reason);
}

delivery_buffer::clock::time_point delivery_buffer::next_deadline(clock::time_point now) const {
    if (m_current) {
        return std::max(now, m_current->next_attempt);
    }
    if (!m_queue.empty()) {
        if (m_queue.size() >= m_opts.max_batch_size || !m_oldest_enqueued) return now;
        return std::max(now, *m_oldest_enqueued + m_opts.flush_interval);
    }
    return now + m_opts.flush_interval;
}

delivery_buffer::stats delivery_buffer::get_stats() const {
    auto s = m_stats;
    s.queued = m_queue.size();
    return s;
}

} // namespace beacon
