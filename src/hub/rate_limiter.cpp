#include "hub/rate_limiter.hpp"
#include <algorithm>
#include <cmath>

namespace beacon {

token_bucket::token_bucket(double rate_per_second, double capacity, clock::time_point now)
    : m_rate(rate_per_second), m_capacity(capacity), m_tokens(capacity),
      m_last_refill(now), m_last_used(now)
{}

void token_bucket::refill(clock::time_point now) {
    if (now <= m_last_refill) return;
    std::chrono::duration<double> elapsed = now - m_last_refill;
    m_tokens = std::min(m_capacity, m_tokens + elapsed.count() * m_rate);
    m_last_refill = now;
}

bool token_bucket::try_consume(double cost, clock::time_point now) {
    refill(now);
    m_last_used = std::max(m_last_used, now);
    if (m_tokens < cost) return false;
    m_tokens -= cost;
    return true;
}

void token_bucket::refund(double cost) {
    m_tokens = std::min(m_capacity, m_tokens + cost);
}

std::chrono::seconds token_bucket::retry_after(double cost, clock::time_point now) {
    refill(now);
    double needed = cost - m_tokens;
    if (needed <= 0 || m_rate <= 0) return std::chrono::seconds(1);
    auto secs = static_cast<long long>(std::ceil(needed / m_rate));
    return std::chrono::seconds(std::max(1LL, secs));
}

double token_bucket::tokens(clock::time_point now) {
    refill(now);
    return m_tokens;
}

rate_limiter::rate_limiter(rate_limit_options opts, now_fn now)
    : m_opts(opts), m_now(std::move(now)),
      m_global(opts.global_rate, opts.global_capacity, m_now())
{}

rate_limiter::shard& rate_limiter::shard_for(const std::string& source_id) {
    return m_shards[std::hash<std::string>{}(source_id) % shard_count];
}

rate_decision rate_limiter::check(const std::string& source_id, double cost) {
    auto now = m_now();
    auto& s = shard_for(source_id);
    std::lock_guard<std::mutex> lock(s.mutex);

    auto it = s.buckets.find(source_id);
    if (it == s.buckets.end()) {
        it = s.buckets.emplace(source_id,
            token_bucket(m_opts.source_rate, m_opts.source_capacity, now)).first;
    }
    auto& bucket = it->second;

    if (!bucket.try_consume(cost, now)) {
        return {false, bucket.retry_after(cost, now), false};
    }

    // Lock order is always shard -> global
    std::lock_guard<std::mutex> global_lock(m_global_mutex);
    if (!m_global.try_consume(cost, now)) {
        bucket.refund(cost);
        return {false, m_global.retry_after(cost, now), true};
    }
    return {true, std::chrono::seconds(0), false};
}

std::size_t rate_limiter::cleanup_idle() {
    auto now = m_now();
    std::size_t removed = 0;
    for (auto& s : m_shards) {
        std::lock_guard<std::mutex> lock(s.mutex);
        for (auto it = s.buckets.begin(); it != s.buckets.end();) {
            if (now - it->second.last_used() > m_opts.idle_timeout) {
                it = s.buckets.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    return removed;
}

std::size_t rate_limiter::bucket_count() const {
    std::size_t n = 0;
    for (const auto& s : m_shards) {
        std::lock_guard<std::mutex> lock(s.mutex);
        n += s.buckets.size();
    }
    return n;
}

} // namespace beacon
