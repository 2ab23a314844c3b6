#pragma once

#include "hub/broadcast_engine.hpp"
#include "hub/config.hpp"
#include "hub/rate_limiter.hpp"
#include "hub/signature_verifier.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace beacon {

struct http_reply {
    int status = 200;
    std::string body;
    std::map<std::string, std::string> headers;
};

// Shared state injected into the ingest service and the server.
struct hub_context {
    hub_config cfg;
    std::shared_ptr<spdlog::logger> log;
    std::shared_ptr<signature_verifier> verifier;
    std::shared_ptr<rate_limiter> limiter;
    std::shared_ptr<broadcast_engine> broadcaster;
    std::chrono::steady_clock::time_point started_at = std::chrono::steady_clock::now();
};

// Outcome of the pre-upgrade check on GET /ws. When not admitted, the
// rejection is written as a plain HTTP response instead of the upgrade.
struct subscriber_admission {
    bool admitted = false;
    subscriber_filter filter;
    http_reply rejection;
};

// Transport-independent request handling for the hub. The HTTP layer only
// extracts headers and body and writes back the returned reply.
class ingest_service {
public:
    struct stats {
        uint64_t accepted_batches = 0;
        uint64_t accepted_events = 0;
        uint64_t rejected_auth = 0;
        uint64_t rejected_rate = 0;
        uint64_t rejected_format = 0;
        uint64_t rejected_subscribers = 0;
    };

    explicit ingest_service(std::shared_ptr<hub_context> ctx);

    // POST /events. Checks run in order: shutdown, size, authentication,
    // rate limit, format, source match, deadline. Nothing is published
    // unless every check passes.
    http_reply submit(const std::optional<std::string>& source_id,
                      const std::optional<std::string>& signature,
                      const std::string& body);

    // GET /health
    http_reply health() const;

    // GET /ws, before the upgrade: 503 while shutting down, 401 for a bad
    // or missing token, 400 for an unknown type filter.
    subscriber_admission admit_subscriber(const std::optional<std::string>& token,
                                          const std::optional<std::string>& source,
                                          const std::optional<std::string>& type,
                                          const std::optional<std::string>& project);

    // Subscriber credential check for GET /ws.
    bool authorize_subscriber(const std::optional<std::string>& token) const;

    // Builds a filter from the query parameters. nullopt if `type` is not a
    // known event type.
    static std::optional<subscriber_filter> parse_filter(const std::optional<std::string>& source,
                                                         const std::optional<std::string>& type,
                                                         const std::optional<std::string>& project);

    // Stops admitting submissions and subscriptions.
    void begin_shutdown();
    bool accepting() const { return m_accepting.load(); }

    // Waits until no submission is in progress. Returns false on timeout.
    bool wait_idle(std::chrono::milliseconds timeout);

    stats get_stats() const;

    // {"error": message, "code": code} with a JSON content type
    static http_reply error_reply(int status, std::string_view message, std::string_view code);

private:
    // Counts a submission in progress for the lifetime of the guard
    class in_flight_guard {
    public:
        explicit in_flight_guard(ingest_service& svc);
        ~in_flight_guard();
        in_flight_guard(const in_flight_guard&) = delete;
        in_flight_guard& operator=(const in_flight_guard&) = delete;
    private:
        ingest_service& m_svc;
    };

    std::shared_ptr<hub_context> m_ctx;
    std::atomic<bool> m_accepting{true};

    std::mutex m_idle_mutex;
    std::condition_variable m_idle_cv;
    std::size_t m_in_flight = 0;

    std::atomic<uint64_t> m_accepted_batches{0};
    std::atomic<uint64_t> m_accepted_events{0};
    std::atomic<uint64_t> m_rejected_auth{0};
    std::atomic<uint64_t> m_rejected_rate{0};
    std::atomic<uint64_t> m_rejected_format{0};
    std::atomic<uint64_t> m_rejected_subscribers{0};
};

} // namespace beacon
