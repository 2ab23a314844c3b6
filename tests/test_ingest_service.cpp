#include "hub/ingest_service.hpp"
#include "common/base64.hpp"
#include <asio/io_context.hpp>
#include <gtest/gtest.h>
#include <spdlog/sinks/null_sink.h>

using namespace std::chrono;

namespace {

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

class collecting_sink : public beacon::subscriber_sink {
public:
    asio::awaitable<bool> deliver(std::shared_ptr<const std::string> json) override {
        received.push_back(*json);
        co_return true;
    }
    void close(uint16_t, const std::string&) override {}

    std::vector<std::string> received;
};

beacon::event tool_event(const std::string& source, int n) {
    beacon::event e;
    e.id = "evt_" + std::to_string(n);
    e.source = source;
    e.timestamp = system_clock::time_point(milliseconds(1736937000000 + n));
    beacon::tool_payload t;
    t.session_id = "s1";
    t.tool = "Edit";
    t.status = beacon::tool_status::started;
    t.context = "main.rs";
    t.project = "beacon";
    e.payload = t;
    return e;
}

class ingest_service_test : public ::testing::Test {
protected:
    void SetUp() override {
        m_keys["m1"] = beacon::base64_encode(m_m1.public_key());
        m_keys["m2"] = beacon::base64_encode(m_m2.public_key());
        build();
    }

    void build() {
        auto ctx = std::make_shared<beacon::hub_context>();
        ctx->cfg = m_cfg;
        ctx->cfg.public_keys = m_keys;
        ctx->log = make_log();
        ctx->verifier = std::make_shared<beacon::signature_verifier>(
            std::make_shared<beacon::static_key_source>(m_keys), ctx->log);
        ctx->verifier->load_initial(1, milliseconds(1), milliseconds(1));

        beacon::rate_limit_options limits;
        limits.source_rate = m_cfg.source_rate;
        limits.source_capacity = m_cfg.source_burst;
        limits.global_rate = m_cfg.global_rate;
        limits.global_capacity = m_cfg.global_burst;
        auto frozen = beacon::rate_limiter::clock::now();
        ctx->limiter = std::make_shared<beacon::rate_limiter>(limits, [frozen] { return frozen; });

        ctx->broadcaster = std::make_shared<beacon::broadcast_engine>(
            m_ioc.get_executor(), m_cfg.subscriber_buffer_size, ctx->log);
        m_ctx = ctx;
        m_svc = std::make_unique<beacon::ingest_service>(ctx);
    }

    std::shared_ptr<collecting_sink> subscribe(beacon::subscriber_filter f = {}) {
        auto sink = std::make_shared<collecting_sink>();
        m_ctx->broadcaster->subscribe(std::move(f), sink);
        m_ioc.poll();
        return sink;
    }

    static std::string body_of(const std::vector<beacon::event>& events) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& e : events) arr.push_back(e);
        return arr.dump();
    }

    static std::string sign(const beacon::ed25519_keypair& kp, const std::string& body) {
        return beacon::base64_encode(kp.sign(body));
    }

    static std::string code_of(const beacon::http_reply& r) {
        return nlohmann::json::parse(r.body).value("code", "");
    }

    asio::io_context m_ioc;
    beacon::hub_config m_cfg;
    beacon::public_key_map m_keys;
    beacon::ed25519_keypair m_m1 = beacon::ed25519_keypair::generate();
    beacon::ed25519_keypair m_m2 = beacon::ed25519_keypair::generate();
    std::shared_ptr<beacon::hub_context> m_ctx;
    std::unique_ptr<beacon::ingest_service> m_svc;
};

} // namespace

TEST_F(ingest_service_test, signed_batch_is_accepted_and_broadcast) {
    auto sink = subscribe();
    auto e = tool_event("m1", 1);
    auto body = body_of({e});

    auto reply = m_svc->submit(std::string("m1"), sign(m_m1, body), body);
    EXPECT_EQ(reply.status, 202);
    EXPECT_EQ(nlohmann::json::parse(reply.body)["accepted"], 1);

    m_ioc.poll();
    ASSERT_EQ(sink->received.size(), 1u);
    auto got = nlohmann::json::parse(sink->received[0]).get<beacon::event>();
    EXPECT_EQ(got, e);
}

TEST_F(ingest_service_test, single_object_body_is_accepted) {
    auto sink = subscribe();
    std::string body = nlohmann::json(tool_event("m1", 1)).dump();

    auto reply = m_svc->submit(std::string("m1"), sign(m_m1, body), body);
    EXPECT_EQ(reply.status, 202);
    m_ioc.poll();
    EXPECT_EQ(sink->received.size(), 1u);
}

TEST_F(ingest_service_test, bad_signature_is_rejected_without_broadcast) {
    auto sink = subscribe();
    auto body = body_of({tool_event("m1", 1)});

    auto wrong_key = m_svc->submit(std::string("m1"), sign(m_m2, body), body);
    EXPECT_EQ(wrong_key.status, 401);
    EXPECT_EQ(code_of(wrong_key), "invalid_signature");

    auto tampered = m_svc->submit(std::string("m1"), sign(m_m1, body), body + " ");
    EXPECT_EQ(tampered.status, 401);

    auto unknown = m_svc->submit(std::string("m9"), sign(m_m1, body), body);
    EXPECT_EQ(unknown.status, 401);
    EXPECT_EQ(code_of(unknown), "unknown_source");

    m_ioc.poll();
    EXPECT_TRUE(sink->received.empty());
    EXPECT_EQ(m_svc->get_stats().rejected_auth, 3u);
}

TEST_F(ingest_service_test, missing_headers_are_rejected) {
    auto body = body_of({tool_event("m1", 1)});
    auto no_source = m_svc->submit(std::nullopt, sign(m_m1, body), body);
    EXPECT_EQ(no_source.status, 401);
    EXPECT_EQ(code_of(no_source), "missing_source");

    auto no_sig = m_svc->submit(std::string("m1"), std::nullopt, body);
    EXPECT_EQ(no_sig.status, 401);
    EXPECT_EQ(code_of(no_sig), "missing_signature");
}

TEST_F(ingest_service_test, burst_beyond_bucket_gets_429) {
    auto body = body_of({tool_event("m1", 1)});
    auto sig = sign(m_m1, body);

    int accepted = 0;
    int limited = 0;
    for (int i = 0; i < 150; ++i) {
        auto r = m_svc->submit(std::string("m1"), sig, body);
        if (r.status == 202) {
            ++accepted;
        } else if (r.status == 429) {
            ++limited;
            EXPECT_GE(std::stoi(r.headers.at("Retry-After")), 1);
            EXPECT_EQ(code_of(r), "rate_limited");
        }
    }
    EXPECT_EQ(accepted, 100);
    EXPECT_EQ(limited, 50);

    // Another source still has its own budget
    auto other_body = body_of({tool_event("m2", 2)});
    EXPECT_EQ(m_svc->submit(std::string("m2"), sign(m_m2, other_body), other_body).status, 202);
}

TEST_F(ingest_service_test, malformed_bodies_are_rejected) {
    for (std::string body : {std::string("{not json"), std::string("[]"), std::string("42"),
                             std::string(R"([{"id":"evt_1","type":"tool"}])")}) {
        auto r = m_svc->submit(std::string("m1"), sign(m_m1, body), body);
        EXPECT_EQ(r.status, 400) << body;
        EXPECT_EQ(code_of(r), "invalid_format") << body;
    }
}

TEST_F(ingest_service_test, event_source_must_match_header) {
    auto sink = subscribe();
    auto body = body_of({tool_event("m1", 1), tool_event("m2", 2)});

    auto r = m_svc->submit(std::string("m1"), sign(m_m1, body), body);
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(code_of(r), "source_mismatch");

    m_ioc.poll();
    EXPECT_TRUE(sink->received.empty());
}

TEST_F(ingest_service_test, oversized_body_is_rejected) {
    m_cfg.max_body_bytes = 64;
    build();
    auto body = body_of({tool_event("m1", 1)});
    auto r = m_svc->submit(std::string("m1"), sign(m_m1, body), body);
    EXPECT_EQ(r.status, 413);
}

TEST_F(ingest_service_test, unsafe_mode_skips_authentication) {
    m_cfg.unsafe_no_auth = true;
    build();
    auto body = body_of({tool_event("dev-box", 1)});
    EXPECT_EQ(m_svc->submit(std::nullopt, std::nullopt, body).status, 202);
    EXPECT_TRUE(m_svc->authorize_subscriber(std::nullopt));
}

TEST_F(ingest_service_test, subscriber_token_checked) {
    m_cfg.subscriber_token = "s3cret";
    build();
    EXPECT_TRUE(m_svc->authorize_subscriber(std::string("s3cret")));
    EXPECT_FALSE(m_svc->authorize_subscriber(std::string("s3cre")));
    EXPECT_FALSE(m_svc->authorize_subscriber(std::string("")));
    EXPECT_FALSE(m_svc->authorize_subscriber(std::nullopt));
}

TEST_F(ingest_service_test, parse_filter_reads_query_values) {
    auto f = beacon::ingest_service::parse_filter(std::string("m1"), std::string("tool"), std::nullopt);
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->source, std::optional<std::string>("m1"));
    EXPECT_EQ(f->type, beacon::event_type::tool);
    EXPECT_FALSE(f->project.has_value());

    EXPECT_FALSE(beacon::ingest_service::parse_filter(std::nullopt, std::string("bogus"), std::nullopt));

    auto empty = beacon::ingest_service::parse_filter(std::string(""), std::nullopt, std::nullopt);
    ASSERT_TRUE(empty.has_value());
    EXPECT_FALSE(empty->source.has_value());
}

TEST_F(ingest_service_test, health_reports_connections) {
    auto sink = subscribe();
    auto r = m_svc->health();
    EXPECT_EQ(r.status, 200);
    auto j = nlohmann::json::parse(r.body);
    EXPECT_EQ(j["status"], "ok");
    EXPECT_EQ(j["connections"], 1);
    EXPECT_TRUE(j.contains("uptime_seconds"));
}

TEST_F(ingest_service_test, shutdown_refuses_new_submissions) {
    auto body = body_of({tool_event("m1", 1)});
    m_svc->begin_shutdown();
    EXPECT_FALSE(m_svc->accepting());

    auto r = m_svc->submit(std::string("m1"), sign(m_m1, body), body);
    EXPECT_EQ(r.status, 503);
    EXPECT_TRUE(m_svc->wait_idle(milliseconds(10)));
}

TEST_F(ingest_service_test, bad_subscriber_token_gets_401_body) {
    m_cfg.subscriber_token = "s3cret";
    build();

    auto a = m_svc->admit_subscriber(std::string("wrong"), std::nullopt, std::nullopt, std::nullopt);
    EXPECT_FALSE(a.admitted);
    EXPECT_EQ(a.rejection.status, 401);
    EXPECT_EQ(a.rejection.headers["Content-Type"], "application/json");
    auto j = nlohmann::json::parse(a.rejection.body);
    EXPECT_EQ(j["code"], "unauthorized");
    EXPECT_FALSE(j["error"].get<std::string>().empty());

    auto missing = m_svc->admit_subscriber(std::nullopt, std::nullopt, std::nullopt, std::nullopt);
    EXPECT_EQ(missing.rejection.status, 401);
    EXPECT_EQ(m_svc->get_stats().rejected_subscribers, 2u);
}

TEST_F(ingest_service_test, unknown_type_filter_gets_400) {
    m_cfg.subscriber_token = "s3cret";
    build();

    auto a = m_svc->admit_subscriber(std::string("s3cret"), std::nullopt, std::string("bogus"), std::nullopt);
    EXPECT_FALSE(a.admitted);
    EXPECT_EQ(a.rejection.status, 400);
    EXPECT_EQ(code_of(a.rejection), "invalid_filter");
}

TEST_F(ingest_service_test, admitted_subscriber_carries_filter) {
    m_cfg.subscriber_token = "s3cret";
    build();

    auto a = m_svc->admit_subscriber(std::string("s3cret"), std::string("m1"), std::string("summary"),
                                     std::string("beacon"));
    ASSERT_TRUE(a.admitted);
    EXPECT_EQ(a.filter.source, std::optional<std::string>("m1"));
    EXPECT_EQ(a.filter.type, beacon::event_type::summary);
    EXPECT_EQ(a.filter.project, std::optional<std::string>("beacon"));
    EXPECT_EQ(m_svc->get_stats().rejected_subscribers, 0u);
}

TEST_F(ingest_service_test, shutdown_refuses_new_subscribers) {
    m_cfg.subscriber_token = "s3cret";
    build();
    m_svc->begin_shutdown();

    auto a = m_svc->admit_subscriber(std::string("s3cret"), std::nullopt, std::nullopt, std::nullopt);
    EXPECT_FALSE(a.admitted);
    EXPECT_EQ(a.rejection.status, 503);
    EXPECT_EQ(code_of(a.rejection), "shutting_down");
}
