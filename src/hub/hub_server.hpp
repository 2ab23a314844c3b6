#pragma once

#include "common/url.hpp"
#include "hub/ingest_service.hpp"
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace beacon {

class ws_session;

// HTTP and WebSocket front end: POST /events, GET /health and GET /ws.
// Request handling lives in ingest_service; this class owns the sockets.
// It runs its own io_context, separate from the one driving broadcast pumps.
class hub_server {
public:
    hub_server(std::shared_ptr<hub_context> ctx, std::shared_ptr<ingest_service> ingest);
    ~hub_server();

    hub_server(const hub_server&) = delete;
    hub_server& operator=(const hub_server&) = delete;

    // Binds, listens and starts the I/O threads.
    // Throws std::runtime_error("server: ...") if the listener cannot be set up.
    void run();

    // Stop admitting work, drain submissions for up to the grace period,
    // close subscriptions with 1001 "going away", then stop the I/O threads.
    void shutdown();

    // Bound port; differs from the configured one when that was 0.
    uint16_t port() const { return m_port.load(); }

    std::size_t session_count() const;

private:
    using request = boost::beast::http::request<boost::beast::http::string_body>;

    boost::asio::awaitable<void> accept_loop();
    boost::asio::awaitable<void> serve(boost::beast::tcp_stream stream);
    boost::asio::awaitable<void> open_subscription(boost::beast::tcp_stream stream, request req,
                                                   subscriber_filter filter);
    http_reply route(const request& req, const request_target& target);
    void stop_io();

    std::shared_ptr<hub_context> m_ctx;
    std::shared_ptr<ingest_service> m_ingest;

    boost::asio::io_context m_ioc;
    boost::asio::ip::tcp::acceptor m_acceptor;
    std::vector<std::thread> m_threads;
    std::atomic<uint16_t> m_port{0};

    mutable std::mutex m_sessions_mutex;
    std::unordered_map<uint64_t, std::shared_ptr<ws_session>> m_sessions;
};

} // namespace beacon
