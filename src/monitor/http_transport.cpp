#include "monitor/http_transport.hpp"
#include <httplib.h>
#include <asio/co_spawn.hpp>
#include <asio/use_awaitable.hpp>
#include <charconv>
#include <stdexcept>

namespace beacon {

std::optional<std::chrono::seconds> parse_retry_after(const std::string& value) {
    long long secs = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), secs);
    if (ec != std::errc{} || ptr != value.data() + value.size() || secs < 0) {
        return std::nullopt;
    }
    return std::chrono::seconds(secs);
}

http_transport::http_transport(const std::string& hub_url, std::string source_id,
                               std::chrono::seconds request_timeout,
                               std::shared_ptr<spdlog::logger> log)
    : m_source_id(std::move(source_id)), m_log(std::move(log))
{
    auto parts = split_url(hub_url);
    if (!parts) throw std::runtime_error("transport: invalid hub url '" + hub_url + "'");

    std::string base = parts->path;
    if (!base.empty() && base.back() == '/') base.pop_back();
    m_events_path = base + "/events";

    m_client = std::make_unique<httplib::Client>(parts->origin);
    m_client->set_connection_timeout(request_timeout);
    m_client->set_read_timeout(request_timeout);
    m_client->set_write_timeout(request_timeout);
    m_client->set_keep_alive(true);
    m_log->debug("transport: posting to {}{}", parts->origin, m_events_path);
}

http_transport::~http_transport() {
    cancel();
    m_pool.join();
}

void http_transport::cancel() {
    if (m_client) m_client->stop();
}

submit_result http_transport::post(const std::string& body, const std::string& signature) {
    httplib::Headers headers{
        {"X-Source-ID", m_source_id},
        {"X-Signature", signature}
    };

    auto res = m_client->Post(m_events_path, headers, body, "application/json");
    if (!res) {
        m_log->debug("transport: POST {} failed: {}", m_events_path, httplib::to_string(res.error()));
        return {0, std::nullopt, "request failed: " + httplib::to_string(res.error())};
    }

    submit_result r;
    r.status = res->status;
    if (res->has_header("Retry-After")) {
        r.retry_after = parse_retry_after(res->get_header_value("Retry-After"));
    }
    if (r.status < 200 || r.status >= 300) {
        r.error = "HTTP " + std::to_string(r.status);
        if (!res->body.empty()) r.error += ": " + res->body.substr(0, 256);
        m_log->debug("transport: POST {} answered {}", m_events_path, r.status);
    }
    return r;
}

asio::awaitable<submit_result> http_transport::submit(std::string body, std::string signature) {
    co_return co_await asio::co_spawn(
        m_pool,
        [this, body = std::move(body), signature = std::move(signature)]()
            -> asio::awaitable<submit_result> {
            try {
                co_return post(body, signature);
            } catch (const std::exception& e) {
                co_return submit_result{0, std::nullopt, e.what()};
            }
        },
        asio::use_awaitable);
}

} // namespace beacon
