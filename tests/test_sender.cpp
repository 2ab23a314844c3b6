#include "monitor/sender.hpp"
#include "common/base64.hpp"
#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>
#include <gtest/gtest.h>
#include <spdlog/sinks/null_sink.h>
#include <functional>

using namespace std::chrono;

namespace {

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

// Replies with scripted statuses, then 202 for everything after.
class scripted_transport : public beacon::event_transport {
public:
    struct call {
        std::string body;
        std::string signature;
    };

    explicit scripted_transport(std::vector<int> statuses = {}) : m_statuses(std::move(statuses)) {}

    asio::awaitable<beacon::submit_result> submit(std::string body, std::string signature) override {
        calls.push_back({std::move(body), std::move(signature)});
        int status = m_next < m_statuses.size() ? m_statuses[m_next++] : 202;
        beacon::submit_result r;
        r.status = status;
        if (status == 0) r.error = "connection refused";
        co_return r;
    }

    std::vector<call> calls;

private:
    std::vector<int> m_statuses;
    std::size_t m_next = 0;
};

beacon::event numbered_event(int n) {
    beacon::event e;
    e.id = "evt_" + std::to_string(n);
    e.source = "m1";
    e.timestamp = system_clock::time_point(milliseconds(1736937000000 + n));
    e.payload = beacon::activity_payload{"s1", std::string("beacon")};
    return e;
}

beacon::delivery_options fast_options() {
    beacon::delivery_options o;
    o.capacity = 100;
    o.max_batch_size = 50;
    o.flush_interval = milliseconds(10);
    o.backoff.initial = milliseconds(10);
    o.backoff.max = milliseconds(40);
    o.max_attempts = 5;
    return o;
}

void run_until(asio::io_context& ioc, const std::function<bool()>& done,
               milliseconds timeout = milliseconds(3000)) {
    auto deadline = steady_clock::now() + timeout;
    while (!done() && steady_clock::now() < deadline) {
        if (ioc.stopped()) ioc.restart();
        ioc.run_for(milliseconds(5));
    }
}

class sender_test : public ::testing::Test {
protected:
    void start(beacon::sender& s, milliseconds budget = milliseconds(500)) {
        asio::co_spawn(s.strand(), s.run(budget), [this](std::exception_ptr ep) {
            m_error = ep;
            m_finished = true;
        });
    }

    asio::io_context m_ioc;
    beacon::signer m_signer{beacon::ed25519_keypair::generate()};
    bool m_finished = false;
    std::exception_ptr m_error;
};

} // namespace

TEST(serialize_batch, produces_json_array_of_envelopes) {
    auto body = beacon::serialize_batch({numbered_event(1), numbered_event(2)});
    auto j = nlohmann::json::parse(body);
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0]["id"], "evt_1");
    EXPECT_EQ(j[1]["type"], "activity");
}

TEST_F(sender_test, delivers_signed_batch) {
    auto transport = std::make_shared<scripted_transport>();
    beacon::sender s(m_ioc.get_executor(), fast_options(), m_signer, transport, 100, make_log());
    start(s);

    for (int i = 0; i < 3; ++i) EXPECT_TRUE(s.offer(numbered_event(i)));
    run_until(m_ioc, [&] { return !transport->calls.empty(); });

    ASSERT_EQ(transport->calls.size(), 1u);
    const auto& c = transport->calls[0];
    auto events = nlohmann::json::parse(c.body);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0]["id"], "evt_0");
    EXPECT_EQ(events[2]["id"], "evt_2");

    auto sig = beacon::base64_decode(c.signature);
    ASSERT_TRUE(sig.has_value());
    EXPECT_TRUE(beacon::ed25519_verify(m_signer.key().public_key(), c.body, *sig));

    s.stop();
    run_until(m_ioc, [&] { return m_finished; });
    EXPECT_TRUE(m_finished);
    EXPECT_FALSE(m_error);
    EXPECT_EQ(s.get_stats().delivered, 3u);
}

TEST_F(sender_test, retries_resend_identical_bytes) {
    auto transport = std::make_shared<scripted_transport>(std::vector<int>{503, 0, 202});
    beacon::sender s(m_ioc.get_executor(), fast_options(), m_signer, transport, 100, make_log());
    start(s);

    s.offer(numbered_event(7));
    run_until(m_ioc, [&] { return transport->calls.size() >= 3; });

    ASSERT_EQ(transport->calls.size(), 3u);
    EXPECT_EQ(transport->calls[0].body, transport->calls[2].body);
    EXPECT_EQ(transport->calls[0].signature, transport->calls[2].signature);

    s.stop();
    run_until(m_ioc, [&] { return m_finished; });
    auto stats = s.get_stats();
    EXPECT_EQ(stats.retries, 2u);
    EXPECT_EQ(stats.delivered, 1u);
    EXPECT_EQ(stats.dropped, 0u);
}

TEST_F(sender_test, rejected_batch_is_dropped_and_loop_continues) {
    auto transport = std::make_shared<scripted_transport>(std::vector<int>{401});
    beacon::sender s(m_ioc.get_executor(), fast_options(), m_signer, transport, 100, make_log());
    start(s);

    s.offer(numbered_event(1));
    run_until(m_ioc, [&] { return transport->calls.size() == 1; });
    s.offer(numbered_event(2));
    run_until(m_ioc, [&] { return transport->calls.size() == 2; });

    ASSERT_EQ(transport->calls.size(), 2u);
    EXPECT_EQ(nlohmann::json::parse(transport->calls[1].body)[0]["id"], "evt_2");

    s.stop();
    run_until(m_ioc, [&] { return m_finished; });
    EXPECT_EQ(s.get_stats().dropped, 1u);
    EXPECT_EQ(s.get_stats().delivered, 1u);
}

TEST_F(sender_test, stop_flushes_pending_events) {
    auto opts = fast_options();
    opts.flush_interval = hours(1);
    auto transport = std::make_shared<scripted_transport>();
    beacon::sender s(m_ioc.get_executor(), opts, m_signer, transport, 100, make_log());
    start(s);

    s.offer(numbered_event(1));
    s.offer(numbered_event(2));
    run_until(m_ioc, [] { return false; }, milliseconds(60));
    EXPECT_TRUE(transport->calls.empty());

    s.stop();
    run_until(m_ioc, [&] { return m_finished; });

    ASSERT_TRUE(m_finished);
    ASSERT_EQ(transport->calls.size(), 1u);
    EXPECT_EQ(nlohmann::json::parse(transport->calls[0].body).size(), 2u);
    EXPECT_EQ(s.get_stats().delivered, 2u);
}

TEST_F(sender_test, final_flush_makes_one_attempt_per_batch) {
    auto opts = fast_options();
    opts.flush_interval = hours(1);
    auto transport = std::make_shared<scripted_transport>(std::vector<int>(10, 503));
    beacon::sender s(m_ioc.get_executor(), opts, m_signer, transport, 100, make_log());
    start(s);

    s.offer(numbered_event(1));
    s.stop();
    run_until(m_ioc, [&] { return m_finished; });

    ASSERT_TRUE(m_finished);
    EXPECT_EQ(transport->calls.size(), 1u);
    EXPECT_EQ(s.get_stats().dropped, 1u);
}

TEST_F(sender_test, full_channel_drops_new_events) {
    auto transport = std::make_shared<scripted_transport>();
    beacon::sender s(m_ioc.get_executor(), fast_options(), m_signer, transport, 2, make_log());

    EXPECT_TRUE(s.offer(numbered_event(1)));
    EXPECT_TRUE(s.offer(numbered_event(2)));
    EXPECT_FALSE(s.offer(numbered_event(3)));
    EXPECT_EQ(s.get_stats().channel_dropped, 1u);
    EXPECT_EQ(s.get_stats().offered, 2u);
}
