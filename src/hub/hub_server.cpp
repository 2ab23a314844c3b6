#include "hub/hub_server.hpp"
#include "hub/write_signal.hpp"
#include <asio/this_coro.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/websocket.hpp>
#include <exception>
#include <optional>
#include <stdexcept>

namespace beacon {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

// Outbound side of one WebSocket subscriber. deliver() resolves only once
// the frame has been written to the socket, so a peer that stops reading
// holds back its own pump and falls behind in the broadcast ring while
// every other subscriber keeps going.
//
// A broadcast pump may keep the session alive after the connection is gone,
// so release_stream() drops every socket and strand reference first.
class ws_session : public subscriber_sink, public std::enable_shared_from_this<ws_session> {
public:
    ws_session(beast::tcp_stream stream, std::shared_ptr<spdlog::logger> log)
        : m_log(std::move(log))
    {
        m_ex = stream.get_executor();
        m_ws.emplace(std::move(stream));
    }

    net::awaitable<bool> accept(const http::request<http::string_body>& req) {
        beast::get_lowest_layer(*m_ws).expires_never();

        // Keep-alive pings let a listen-only client satisfy the idle timeout
        auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::server);
        timeouts.keep_alive_pings = true;
        m_ws->set_option(timeouts);
        m_ws->set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(http::field::server, "beacon_hub");
        }));
        m_ws->read_message_max(64 * 1024);
        m_ws->text(true);

        beast::error_code ec;
        co_await m_ws->async_accept(req, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            m_log->debug("websocket handshake failed: {}", ec.message());
            co_return false;
        }
        co_return true;
    }

    // Subscribers only listen; reading keeps ping, pong and close handling going.
    net::awaitable<void> read_until_closed() {
        beast::flat_buffer buffer;
        while (true) {
            beast::error_code ec;
            co_await m_ws->async_read(buffer, net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                if (ec != websocket::error::closed) {
                    m_log->debug("subscriber connection ended: {}", ec.message());
                }
                break;
            }
            buffer.consume(buffer.size());
        }
    }

    asio::awaitable<bool> deliver(std::shared_ptr<const std::string> json) override {
        auto signal = std::make_shared<write_signal>(co_await asio::this_coro::executor);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_released) co_return false;
            m_pending = signal;
            net::post(m_ex, [self = shared_from_this(), json, signal] {
                if (!self->m_ws) {
                    signal->complete(false);
                    return;
                }
                self->m_ws->async_write(net::buffer(*json),
                    [json, signal](beast::error_code ec, std::size_t) {
                        signal->complete(!ec);
                    });
            });
        }
        co_return co_await signal->wait();
    }

    void close(uint16_t code, const std::string& reason) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_released) return;
        net::post(m_ex, [self = shared_from_this(), code, reason] {
            if (!self->m_ws || self->m_closing || !self->m_ws->is_open()) return;
            self->m_closing = true;
            self->m_ws->async_close(websocket::close_reason(code, reason),
                [self](beast::error_code ec) {
                    if (ec) self->m_log->debug("close handshake failed: {}", ec.message());
                });
        });
    }

    // Fails the write in progress, if any, and destroys the socket. Runs on
    // the session strand, or after the I/O threads have stopped.
    void release_stream() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_released) return;
        m_released = true;
        if (auto pending = m_pending.lock()) pending->complete(false);
        m_ws.reset();
        m_ex = net::any_io_executor();
    }

private:
    std::optional<websocket::stream<beast::tcp_stream>> m_ws;
    std::shared_ptr<spdlog::logger> m_log;
    bool m_closing = false;

    // Guards m_ex against release_stream()
    std::mutex m_mutex;
    net::any_io_executor m_ex;
    bool m_released = false;
    std::weak_ptr<write_signal> m_pending;
};

static std::optional<std::string> header_value(const http::request<http::string_body>& req, const char* name) {
    auto it = req.find(name);
    if (it == req.end() || it->value().empty()) return std::nullopt;
    return std::string(it->value().data(), it->value().size());
}

static http::response<http::string_body> to_response(const http_reply& reply, unsigned version, bool keep_alive) {
    http::response<http::string_body> res{static_cast<http::status>(reply.status), version};
    res.set(http::field::server, "beacon_hub");
    for (const auto& [name, value] : reply.headers) res.set(name, value);
    res.keep_alive(keep_alive);
    res.body() = reply.body;
    res.prepare_payload();
    return res;
}

static std::string remote_of(const beast::tcp_stream& stream) {
    beast::error_code ec;
    auto ep = stream.socket().remote_endpoint(ec);
    return ec ? std::string("unknown") : ep.address().to_string();
}

hub_server::hub_server(std::shared_ptr<hub_context> ctx, std::shared_ptr<ingest_service> ingest)
    : m_ctx(std::move(ctx)), m_ingest(std::move(ingest)), m_acceptor(m_ioc)
{}

hub_server::~hub_server() {
    stop_io();
}

void hub_server::run() {
    beast::error_code ec;
    auto address = net::ip::make_address(m_ctx->cfg.bind_address, ec);
    if (ec) {
        throw std::runtime_error("server: invalid bind address '" + m_ctx->cfg.bind_address + "'");
    }
    tcp::endpoint endpoint(address, m_ctx->cfg.port);
    auto where = m_ctx->cfg.bind_address + ":" + std::to_string(m_ctx->cfg.port);

    m_acceptor.open(endpoint.protocol(), ec);
    if (!ec) m_acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) m_acceptor.bind(endpoint, ec);
    if (!ec) m_acceptor.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        throw std::runtime_error("server: cannot listen on " + where + ": " + ec.message());
    }
    m_port.store(m_acceptor.local_endpoint().port());

    net::co_spawn(m_ioc, accept_loop(), [log = m_ctx->log](std::exception_ptr ep) {
        if (!ep) return;
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            log->error("accept loop failed: {}", e.what());
        }
    });

    unsigned int threads = m_ctx->cfg.worker_threads > 0
        ? m_ctx->cfg.worker_threads
        : std::thread::hardware_concurrency();
    if (threads == 0) threads = 1;
    for (unsigned int i = 0; i < threads; ++i) {
        m_threads.emplace_back([this] { m_ioc.run(); });
    }
    m_ctx->log->info("listening on {}:{} ({} threads)", m_ctx->cfg.bind_address, port(), threads);
}

net::awaitable<void> hub_server::accept_loop() {
    while (true) {
        beast::error_code ec;
        auto socket = co_await m_acceptor.async_accept(net::make_strand(m_ioc),
                                                       net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (ec == net::error::operation_aborted || !m_acceptor.is_open()) co_return;
            m_ctx->log->warn("accept failed: {}", ec.message());
            continue;
        }

        beast::tcp_stream stream(std::move(socket));
        auto ex = stream.get_executor();
        net::co_spawn(ex, serve(std::move(stream)), [log = m_ctx->log](std::exception_ptr ep) {
            if (!ep) return;
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                log->warn("connection failed: {}", e.what());
            }
        });
    }
}

net::awaitable<void> hub_server::serve(beast::tcp_stream stream) {
    beast::flat_buffer buffer;
    beast::error_code ec;

    while (true) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(m_ctx->cfg.max_body_bytes);
        stream.expires_after(std::chrono::seconds(30));

        co_await http::async_read(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
        if (ec == http::error::end_of_stream) break;
        if (ec == http::error::body_limit) {
            auto res = to_response(ingest_service::error_reply(413, "request body too large", "payload_too_large"),
                                   11, false);
            co_await http::async_write(stream, res, net::redirect_error(net::use_awaitable, ec));
            break;
        }
        if (ec) {
            m_ctx->log->debug("dropping connection from {}: {}", remote_of(stream), ec.message());
            break;
        }

        auto req = parser.release();
        auto target = parse_target(std::string_view(req.target().data(), req.target().size()));

        if (target.path == "/ws" && websocket::is_upgrade(req)) {
            auto admission = m_ingest->admit_subscriber(target.param("token"), target.param("source"),
                                                        target.param("type"), target.param("project"));
            if (admission.admitted) {
                co_await open_subscription(std::move(stream), std::move(req), std::move(admission.filter));
                co_return;
            }
            m_ctx->log->warn("rejected subscriber from {}: {}", remote_of(stream), admission.rejection.status);
            auto res = to_response(admission.rejection, req.version(), false);
            co_await http::async_write(stream, res, net::redirect_error(net::use_awaitable, ec));
            break;
        }

        auto res = to_response(route(req, target), req.version(), req.keep_alive());
        co_await http::async_write(stream, res, net::redirect_error(net::use_awaitable, ec));
        if (ec || !res.keep_alive()) break;
    }

    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

http_reply hub_server::route(const request& req, const request_target& target) {
    auto method_not_allowed = [](const char* allow) {
        auto r = ingest_service::error_reply(405, "method not allowed", "method_not_allowed");
        r.headers["Allow"] = allow;
        return r;
    };

    if (target.path == "/events") {
        if (req.method() != http::verb::post) return method_not_allowed("POST");
        return m_ingest->submit(header_value(req, "X-Source-ID"), header_value(req, "X-Signature"), req.body());
    }
    if (target.path == "/health") {
        if (req.method() != http::verb::get) return method_not_allowed("GET");
        return m_ingest->health();
    }
    if (target.path == "/ws") {
        // Credentials are checked even without an upgrade so a bad token reads 401
        auto admission = m_ingest->admit_subscriber(target.param("token"), target.param("source"),
                                                    target.param("type"), target.param("project"));
        if (!admission.admitted) return admission.rejection;
        auto r = ingest_service::error_reply(426, "websocket upgrade required", "upgrade_required");
        r.headers["Upgrade"] = "websocket";
        return r;
    }
    return ingest_service::error_reply(404, "not found", "not_found");
}

net::awaitable<void> hub_server::open_subscription(beast::tcp_stream stream, request req,
                                                   subscriber_filter filter) {
    auto session = std::make_shared<ws_session>(std::move(stream), m_ctx->log);
    if (!co_await session->accept(req)) co_return;

    auto id = m_ctx->broadcaster->subscribe(std::move(filter), session);
    {
        std::lock_guard<std::mutex> lock(m_sessions_mutex);
        m_sessions.emplace(id, session);
    }
    // Raced with shutdown between the admission check and the handshake
    if (!m_ingest->accepting()) session->close(1001, "going away");

    co_await session->read_until_closed();

    {
        std::lock_guard<std::mutex> lock(m_sessions_mutex);
        m_sessions.erase(id);
    }
    m_ctx->broadcaster->unsubscribe(id);
    session->release_stream();
}

void hub_server::shutdown() {
    m_ingest->begin_shutdown();

    auto grace = std::chrono::seconds(m_ctx->cfg.shutdown_grace_seconds);
    if (!m_ingest->wait_idle(grace)) {
        m_ctx->log->warn("submissions still in flight after {}s grace period", grace.count());
    }

    m_ctx->broadcaster->close_all(1001, "going away");

    // Give close handshakes a moment before the sockets go away
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
    while (session_count() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    stop_io();
    m_ctx->log->info("server stopped");
}

void hub_server::stop_io() {
    net::post(m_ioc, [this] {
        beast::error_code ec;
        m_acceptor.close(ec);
    });
    m_ioc.stop();
    for (auto& t : m_threads) {
        if (t.joinable()) t.join();
    }
    m_threads.clear();

    // Sessions that never finished closing may still be referenced by
    // broadcast pumps; drop their sockets while the io_context is alive.
    // Sessions whose handshake was in progress die with their coroutine frames.
    std::lock_guard<std::mutex> lock(m_sessions_mutex);
    for (auto& [id, session] : m_sessions) session->release_stream();
    m_sessions.clear();
}

std::size_t hub_server::session_count() const {
    std::lock_guard<std::mutex> lock(m_sessions_mutex);
    return m_sessions.size();
}

} // namespace beacon
