#include "hub/rate_limiter.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using namespace std::chrono;

namespace {

// Manually advanced clock shared with the limiter
struct manual_clock {
    beacon::rate_limiter::clock::time_point now{seconds(1000)};

    beacon::rate_limiter::now_fn fn() {
        return [this] { return now; };
    }
};

} // namespace

TEST(token_bucket, starts_full_and_refills_continuously) {
    manual_clock clk;
    beacon::token_bucket b(10.0, 5.0, clk.now);

    for (int i = 0; i < 5; ++i) EXPECT_TRUE(b.try_consume(1, clk.now));
    EXPECT_FALSE(b.try_consume(1, clk.now));

    clk.now += milliseconds(100);
    EXPECT_TRUE(b.try_consume(1, clk.now));
    EXPECT_FALSE(b.try_consume(1, clk.now));
}

TEST(token_bucket, never_exceeds_capacity) {
    manual_clock clk;
    beacon::token_bucket b(100.0, 10.0, clk.now);
    clk.now += hours(1);
    EXPECT_DOUBLE_EQ(b.tokens(clk.now), 10.0);

    b.refund(50);
    EXPECT_DOUBLE_EQ(b.tokens(clk.now), 10.0);
}

TEST(token_bucket, consumption_is_all_or_nothing) {
    manual_clock clk;
    beacon::token_bucket b(1.0, 5.0, clk.now);
    EXPECT_FALSE(b.try_consume(6, clk.now));
    EXPECT_DOUBLE_EQ(b.tokens(clk.now), 5.0);
}

TEST(token_bucket, retry_after_rounds_up) {
    manual_clock clk;
    beacon::token_bucket b(0.5, 1.0, clk.now);
    ASSERT_TRUE(b.try_consume(1, clk.now));
    EXPECT_EQ(b.retry_after(1, clk.now), seconds(2));

    beacon::token_bucket fast(100.0, 100.0, clk.now);
    ASSERT_TRUE(fast.try_consume(100, clk.now));
    EXPECT_EQ(fast.retry_after(1, clk.now), seconds(1));
}

TEST(rate_limiter, hundred_and_first_request_rejected) {
    manual_clock clk;
    beacon::rate_limiter limiter({}, clk.fn());

    for (int i = 1; i <= 100; ++i) {
        ASSERT_TRUE(limiter.check("m1").allowed) << "request " << i;
    }
    auto d = limiter.check("m1");
    EXPECT_FALSE(d.allowed);
    EXPECT_FALSE(d.global);
    EXPECT_GT(d.retry_after.count(), 0);
}

TEST(rate_limiter, sources_are_independent) {
    manual_clock clk;
    beacon::rate_limiter limiter({}, clk.fn());

    for (int i = 0; i < 100; ++i) limiter.check("m1");
    EXPECT_FALSE(limiter.check("m1").allowed);
    EXPECT_TRUE(limiter.check("m2").allowed);
    EXPECT_EQ(limiter.bucket_count(), 2u);
}

TEST(rate_limiter, refills_over_time) {
    manual_clock clk;
    beacon::rate_limiter limiter({}, clk.fn());

    for (int i = 0; i < 100; ++i) limiter.check("m1");
    EXPECT_FALSE(limiter.check("m1").allowed);

    clk.now += milliseconds(50);
    int admitted = 0;
    while (limiter.check("m1").allowed) ++admitted;
    EXPECT_EQ(admitted, 5);
}

TEST(rate_limiter, global_bucket_caps_all_sources) {
    manual_clock clk;
    beacon::rate_limit_options opts;
    opts.global_rate = 10;
    opts.global_capacity = 10;
    beacon::rate_limiter limiter(opts, clk.fn());

    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(limiter.check("source-" + std::to_string(i)).allowed);
    }
    auto d = limiter.check("m-new");
    EXPECT_FALSE(d.allowed);
    EXPECT_TRUE(d.global);
    EXPECT_GE(d.retry_after, seconds(1));
}

TEST(rate_limiter, global_rejection_refunds_source_bucket) {
    manual_clock clk;
    beacon::rate_limit_options opts;
    opts.source_rate = 0.001;
    opts.source_capacity = 2;
    opts.global_rate = 1;
    opts.global_capacity = 1;
    beacon::rate_limiter limiter(opts, clk.fn());

    ASSERT_TRUE(limiter.check("a").allowed);
    // Global is empty now; "b" must not lose its own tokens to the rejection
    EXPECT_TRUE(limiter.check("b").global);
    EXPECT_TRUE(limiter.check("b").global);

    clk.now += seconds(1);
    EXPECT_TRUE(limiter.check("b").allowed);
    clk.now += seconds(1);
    EXPECT_TRUE(limiter.check("b").allowed);
}

TEST(rate_limiter, cleanup_removes_idle_buckets) {
    manual_clock clk;
    beacon::rate_limiter limiter({}, clk.fn());

    limiter.check("stale");
    clk.now += seconds(45);
    limiter.check("active");
    clk.now += seconds(20);

    EXPECT_EQ(limiter.cleanup_idle(), 1u);
    EXPECT_EQ(limiter.bucket_count(), 1u);
}

TEST(rate_limiter, concurrent_checks_admit_exactly_capacity) {
    beacon::rate_limit_options opts;
    opts.source_rate = 0.001;
    opts.source_capacity = 100;
    auto frozen = beacon::rate_limiter::clock::now();
    beacon::rate_limiter limiter(opts, [frozen] { return frozen; });

    std::atomic<int> admitted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                if (limiter.check("m1").allowed) ++admitted;
            }
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(admitted.load(), 100);
}
