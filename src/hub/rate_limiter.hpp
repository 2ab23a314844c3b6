#pragma once

#include <array>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace beacon {

// Continuous-refill token bucket. Not synchronized; rate_limiter guards it.
class token_bucket {
public:
    using clock = std::chrono::steady_clock;

    token_bucket(double rate_per_second, double capacity, clock::time_point now);

    // Refills, then takes cost tokens if that many are available. All or nothing.
    bool try_consume(double cost, clock::time_point now);

    // Returns tokens taken by a request that was rejected further down the line.
    void refund(double cost);

    // Whole seconds until cost tokens are available, at least 1.
    std::chrono::seconds retry_after(double cost, clock::time_point now);

    double tokens(clock::time_point now);
    clock::time_point last_used() const { return m_last_used; }

private:
    void refill(clock::time_point now);

    double m_rate;
    double m_capacity;
    double m_tokens;
    clock::time_point m_last_refill;
    clock::time_point m_last_used;
};

struct rate_limit_options {
    double source_rate = 100.0;
    double source_capacity = 100.0;
    double global_rate = 1000.0;
    double global_capacity = 1000.0;
    std::chrono::seconds idle_timeout{60};
};

struct rate_decision {
    bool allowed = true;
    std::chrono::seconds retry_after{0};
    // Rejected by the hub-wide bucket rather than the source's own
    bool global = false;
};

// One bucket per source plus a hub-wide bucket. Source buckets live in 16
// mutex-guarded shards so unrelated sources do not contend.
class rate_limiter {
public:
    using clock = token_bucket::clock;
    using now_fn = std::function<clock::time_point()>;

    explicit rate_limiter(rate_limit_options opts, now_fn now = &clock::now);

    // Admits or rejects one ingestion request costing `cost` tokens.
    rate_decision check(const std::string& source_id, double cost = 1.0);

    // Drops buckets idle for longer than idle_timeout. Returns how many went.
    std::size_t cleanup_idle();

    std::size_t bucket_count() const;

private:
    static constexpr std::size_t shard_count = 16;

    struct shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, token_bucket> buckets;
    };

    shard& shard_for(const std::string& source_id);

    rate_limit_options m_opts;
    now_fn m_now;
    std::array<shard, shard_count> m_shards;

    std::mutex m_global_mutex;
    token_bucket m_global;
};

} // namespace beacon
