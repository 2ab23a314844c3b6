#include "hub/hub_server.hpp"
#include "common/base64.hpp"
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>
#include <spdlog/sinks/null_sink.h>
#include <functional>
#include <thread>

using namespace std::chrono;

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;

namespace {

using ws_client = websocket::stream<beast::tcp_stream>;

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

bool wait_for(const std::function<bool()>& done, milliseconds timeout = milliseconds(3000)) {
    auto deadline = steady_clock::now() + timeout;
    while (!done()) {
        if (steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(milliseconds(5));
    }
    return true;
}

beacon::event tool_event(int n, std::string context = "main.cpp") {
    beacon::event e;
    e.id = "evt_" + std::to_string(n);
    e.source = "m1";
    e.timestamp = system_clock::time_point(milliseconds(1736937000000 + n));
    beacon::tool_payload t;
    t.session_id = "s1";
    t.tool = "Read";
    t.status = beacon::tool_status::started;
    t.context = std::move(context);
    t.project = "beacon";
    e.payload = t;
    return e;
}

class hub_server_test : public ::testing::Test {
protected:
    void SetUp() override {
        m_keys["m1"] = beacon::base64_encode(m_m1.public_key());

        auto ctx = std::make_shared<beacon::hub_context>();
        ctx->cfg.bind_address = "127.0.0.1";
        ctx->cfg.port = 0;
        ctx->cfg.worker_threads = 2;
        ctx->cfg.subscriber_token = "s3cret";
        ctx->cfg.public_keys = m_keys;
        ctx->cfg.max_body_bytes = 4096;
        ctx->cfg.shutdown_grace_seconds = 1;
        ctx->cfg.subscriber_buffer_size = 4;
        ctx->log = make_log();
        ctx->verifier = std::make_shared<beacon::signature_verifier>(
            std::make_shared<beacon::static_key_source>(m_keys), ctx->log);
        ctx->verifier->load_initial(1, milliseconds(1), milliseconds(1));
        ctx->limiter = std::make_shared<beacon::rate_limiter>(beacon::rate_limit_options{});
        ctx->broadcaster = std::make_shared<beacon::broadcast_engine>(
            m_pump_ioc.get_executor(), ctx->cfg.subscriber_buffer_size, ctx->log);
        m_ctx = ctx;

        m_pump_thread = std::thread([this] { m_pump_ioc.run(); });

        m_ingest = std::make_shared<beacon::ingest_service>(m_ctx);
        m_server = std::make_unique<beacon::hub_server>(m_ctx, m_ingest);
        m_server->run();
        ASSERT_NE(m_server->port(), 0);
    }

    void TearDown() override {
        m_server.reset();
        m_ingest.reset();
        m_pump_work.reset();
        m_pump_ioc.stop();
        if (m_pump_thread.joinable()) m_pump_thread.join();
    }

    net::ip::tcp::endpoint endpoint() const {
        return {net::ip::make_address("127.0.0.1"), m_server->port()};
    }

    http::response<http::string_body> send(http::request<http::string_body> req) {
        beast::tcp_stream stream(m_client_ioc);
        stream.connect(endpoint());
        req.set(http::field::host, "127.0.0.1");
        http::write(stream, req);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(stream, buffer, res);
        beast::error_code ec;
        stream.socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
        return res;
    }

    http::response<http::string_body> get(const std::string& target) {
        http::request<http::string_body> req{http::verb::get, target, 11};
        return send(std::move(req));
    }

    http::response<http::string_body> post_events(const std::string& body) {
        http::request<http::string_body> req{http::verb::post, "/events", 11};
        req.set("X-Source-ID", "m1");
        req.set("X-Signature", beacon::base64_encode(m_m1.sign(body)));
        req.set(http::field::content_type, "application/json");
        req.body() = body;
        req.prepare_payload();
        return send(std::move(req));
    }

    std::unique_ptr<ws_client> subscribe(const std::string& target) {
        auto ws = std::make_unique<ws_client>(m_client_ioc);
        beast::get_lowest_layer(*ws).connect(endpoint());
        ws->handshake("127.0.0.1", target);
        return ws;
    }

    // Next text frame, or nullopt on close, error or timeout
    std::optional<std::string> read_frame(ws_client& ws, milliseconds timeout = milliseconds(3000)) {
        beast::flat_buffer buffer;
        std::optional<beast::error_code> result;
        ws.async_read(buffer, [&](beast::error_code ec, std::size_t) { result = ec; });
        m_client_ioc.restart();
        m_client_ioc.run_for(timeout);
        if (!result) {
            beast::get_lowest_layer(ws).cancel();
            m_client_ioc.restart();
            m_client_ioc.run_for(milliseconds(500));
            m_last_read_error = net::error::timed_out;
            return std::nullopt;
        }
        m_last_read_error = *result;
        if (*result) return std::nullopt;
        return beast::buffers_to_string(buffer.data());
    }

    static std::string code_of(const http::response<http::string_body>& res) {
        return nlohmann::json::parse(res.body()).value("code", "");
    }

    asio::io_context m_pump_ioc;
    asio::executor_work_guard<asio::io_context::executor_type> m_pump_work{m_pump_ioc.get_executor()};
    std::thread m_pump_thread;

    net::io_context m_client_ioc;
    beast::error_code m_last_read_error;

    beacon::public_key_map m_keys;
    beacon::ed25519_keypair m_m1 = beacon::ed25519_keypair::generate();
    std::shared_ptr<beacon::hub_context> m_ctx;
    std::shared_ptr<beacon::ingest_service> m_ingest;
    std::unique_ptr<beacon::hub_server> m_server;
};

} // namespace

TEST_F(hub_server_test, health_answers_json) {
    auto res = get("/health");
    EXPECT_EQ(res.result_int(), 200);
    EXPECT_EQ(res[http::field::content_type], "application/json");
    EXPECT_EQ(nlohmann::json::parse(res.body())["status"], "ok");
}

TEST_F(hub_server_test, unknown_path_and_wrong_method) {
    auto missing = get("/nope");
    EXPECT_EQ(missing.result_int(), 404);
    EXPECT_EQ(code_of(missing), "not_found");

    auto wrong = get("/events");
    EXPECT_EQ(wrong.result_int(), 405);
    EXPECT_EQ(wrong[http::field::allow], "POST");
}

TEST_F(hub_server_test, oversized_body_gets_413) {
    http::request<http::string_body> req{http::verb::post, "/events", 11};
    req.set("X-Source-ID", "m1");
    req.set("X-Signature", "c2ln");
    // Declared length alone exceeds the limit; the parser stops at the header
    req.set(http::field::content_length, "8192");
    auto res = send(std::move(req));
    EXPECT_EQ(res.result_int(), 413);
    EXPECT_EQ(code_of(res), "payload_too_large");
}

TEST_F(hub_server_test, ws_without_upgrade_needs_token_then_upgrade) {
    auto no_token = get("/ws");
    EXPECT_EQ(no_token.result_int(), 401);

    auto plain = get("/ws?token=s3cret");
    EXPECT_EQ(plain.result_int(), 426);
    EXPECT_EQ(code_of(plain), "upgrade_required");
}

TEST_F(hub_server_test, bad_token_upgrade_gets_401_json) {
    // Raw upgrade request so the whole rejection body can be read back
    http::request<http::string_body> req{http::verb::get, "/ws?token=wrong", 11};
    req.set(http::field::connection, "Upgrade");
    req.set(http::field::upgrade, "websocket");
    req.set(http::field::sec_websocket_version, "13");
    req.set(http::field::sec_websocket_key, "dGhlIHNhbXBsZSBub25jZQ==");
    auto res = send(std::move(req));

    EXPECT_EQ(res.result_int(), 401);
    EXPECT_EQ(res[http::field::content_type], "application/json");
    auto body = nlohmann::json::parse(res.body());
    EXPECT_EQ(body["code"], "unauthorized");
    EXPECT_TRUE(body.contains("error"));
    EXPECT_EQ(m_ctx->broadcaster->subscriber_count(), 0u);
}

TEST_F(hub_server_test, websocket_client_sees_declined_handshake) {
    ws_client ws(m_client_ioc);
    beast::get_lowest_layer(ws).connect(endpoint());

    websocket::response_type res;
    beast::error_code ec;
    ws.handshake(res, "127.0.0.1", "/ws?token=wrong", ec);
    EXPECT_EQ(ec, websocket::error::upgrade_declined);
    EXPECT_EQ(res.result_int(), 401);

    ws_client filtered(m_client_ioc);
    beast::get_lowest_layer(filtered).connect(endpoint());
    websocket::response_type res2;
    filtered.handshake(res2, "127.0.0.1", "/ws?token=s3cret&type=bogus", ec);
    EXPECT_EQ(ec, websocket::error::upgrade_declined);
    EXPECT_EQ(res2.result_int(), 400);
    EXPECT_EQ(m_ingest->get_stats().rejected_subscribers, 2u);
}

TEST_F(hub_server_test, signed_event_reaches_subscriber) {
    auto ws = subscribe("/ws?token=s3cret&source=m1");
    ASSERT_TRUE(wait_for([this] { return m_ctx->broadcaster->subscriber_count() == 1; }));
    EXPECT_EQ(m_server->session_count(), 1u);

    auto e = tool_event(7);
    nlohmann::json batch = nlohmann::json::array({e});
    auto res = post_events(batch.dump());
    ASSERT_EQ(res.result_int(), 202) << res.body();

    auto frame = read_frame(*ws);
    ASSERT_TRUE(frame.has_value()) << m_last_read_error.message();
    auto got = nlohmann::json::parse(*frame).get<beacon::event>();
    EXPECT_EQ(got, e);
}

TEST_F(hub_server_test, subscriber_that_stops_reading_lags_instead_of_buffering) {
    auto ws = subscribe("/ws?token=s3cret");
    ASSERT_TRUE(wait_for([this] { return m_ctx->broadcaster->subscriber_count() == 1; }));

    // Far more than the socket buffers hold while the client is not reading
    const int total = 200;
    const std::string big(256 * 1024, 'x');
    for (int i = 0; i < total; ++i) m_ctx->broadcaster->publish(tool_event(i, big));
    std::this_thread::sleep_for(milliseconds(300));

    // A stalled peer is not a disconnect
    EXPECT_EQ(m_ctx->broadcaster->subscriber_count(), 1u);
    EXPECT_EQ(m_server->session_count(), 1u);

    std::vector<int> received;
    while (auto frame = read_frame(*ws, milliseconds(1000))) {
        auto id = nlohmann::json::parse(*frame)["id"].get<std::string>();
        received.push_back(std::stoi(id.substr(4)));
    }

    auto stats = m_ctx->broadcaster->get_stats();
    EXPECT_GT(stats.lagged, 0u);
    EXPECT_LT(received.size(), static_cast<std::size_t>(total));
    EXPECT_EQ(received.size() + stats.lagged, static_cast<std::size_t>(total));
    ASSERT_FALSE(received.empty());
    EXPECT_EQ(received.back(), total - 1);
}

TEST_F(hub_server_test, shutdown_closes_subscribers_with_going_away) {
    auto ws = subscribe("/ws?token=s3cret");
    ASSERT_TRUE(wait_for([this] { return m_ctx->broadcaster->subscriber_count() == 1; }));

    std::thread stopper([this] { m_server->shutdown(); });
    auto frame = read_frame(*ws, milliseconds(5000));
    stopper.join();

    EXPECT_FALSE(frame.has_value());
    EXPECT_EQ(m_last_read_error, websocket::error::closed);
    EXPECT_EQ(ws->reason().code, 1001);
    EXPECT_EQ(m_server->session_count(), 0u);
    EXPECT_FALSE(m_ingest->accepting());
}
