#pragma once

#include "monitor/transport.hpp"
#include "common/url.hpp"
#include <asio/thread_pool.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace httplib { class Client; }

namespace beacon {

// Parses a Retry-After header given in delta-seconds.
std::optional<std::chrono::seconds> parse_retry_after(const std::string& value);

// POST <hub_url>/events with X-Source-ID / X-Signature headers, via cpp-httplib.
// The blocking client runs on a private single-thread pool so the caller's
// io_context is never blocked.
class http_transport : public event_transport {
public:
    http_transport(const std::string& hub_url, std::string source_id,
                   std::chrono::seconds request_timeout,
                   std::shared_ptr<spdlog::logger> log);
    ~http_transport() override;

    asio::awaitable<submit_result> submit(std::string body, std::string signature) override;
    void cancel() override;

private:
    submit_result post(const std::string& body, const std::string& signature);

    std::string m_source_id;
    std::string m_events_path;
    std::shared_ptr<spdlog::logger> m_log;
    std::unique_ptr<httplib::Client> m_client;
    asio::thread_pool m_pool{1};
};

} // namespace beacon
