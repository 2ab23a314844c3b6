#include "hub/ingest_service.hpp"
#include "common/ed25519.hpp"
#include <nlohmann/json.hpp>
#include <exception>
#include <stdexcept>
#include <vector>

namespace beacon {

ingest_service::in_flight_guard::in_flight_guard(ingest_service& svc) : m_svc(svc) {
    std::lock_guard<std::mutex> lock(m_svc.m_idle_mutex);
    ++m_svc.m_in_flight;
}

ingest_service::in_flight_guard::~in_flight_guard() {
    {
        std::lock_guard<std::mutex> lock(m_svc.m_idle_mutex);
        --m_svc.m_in_flight;
    }
    m_svc.m_idle_cv.notify_all();
}

ingest_service::ingest_service(std::shared_ptr<hub_context> ctx)
    : m_ctx(std::move(ctx))
{}

http_reply ingest_service::error_reply(int status, std::string_view message, std::string_view code) {
    http_reply r;
    r.status = status;
    r.body = nlohmann::json{{"error", std::string(message)}, {"code", std::string(code)}}.dump();
    r.headers["Content-Type"] = "application/json";
    return r;
}

http_reply ingest_service::submit(const std::optional<std::string>& source_id,
                                  const std::optional<std::string>& signature,
                                  const std::string& body) {
    auto deadline = std::chrono::steady_clock::now()
        + std::chrono::milliseconds(m_ctx->cfg.request_timeout_ms);

    if (!m_accepting.load()) {
        return error_reply(503, "hub is shutting down", "shutting_down");
    }
    in_flight_guard guard(*this);

    if (body.size() > m_ctx->cfg.max_body_bytes) {
        m_rejected_format.fetch_add(1, std::memory_order_relaxed);
        return error_reply(413, "request body too large", "payload_too_large");
    }

    const auto& cfg = m_ctx->cfg;
    if (!cfg.unsafe_no_auth) {
        if (!source_id || source_id->empty()) {
            m_rejected_auth.fetch_add(1, std::memory_order_relaxed);
            return error_reply(401, "missing X-Source-ID header", "missing_source");
        }
        if (!signature || signature->empty()) {
            m_rejected_auth.fetch_add(1, std::memory_order_relaxed);
            return error_reply(401, "missing X-Signature header", "missing_signature");
        }
        auto status = m_ctx->verifier->verify(*source_id, *signature, body);
        if (status != verify_status::valid) {
            m_rejected_auth.fetch_add(1, std::memory_order_relaxed);
            m_ctx->log->warn("rejected batch from '{}': {}", *source_id, to_string(status));
            return error_reply(401, "authentication failed", to_string(status));
        }
    }

    std::string bucket_key = source_id.value_or("anonymous");
    auto decision = m_ctx->limiter->check(bucket_key);
    if (!decision.allowed) {
        m_rejected_rate.fetch_add(1, std::memory_order_relaxed);
        m_ctx->log->debug("rate limited '{}' ({}), retry after {}s", bucket_key,
                          decision.global ? "global" : "source", decision.retry_after.count());
        auto r = error_reply(429, "rate limit exceeded", "rate_limited");
        r.headers["Retry-After"] = std::to_string(decision.retry_after.count());
        return r;
    }

    std::vector<event> events;
    try {
        auto doc = nlohmann::json::parse(body);
        if (doc.is_array()) {
            events.reserve(doc.size());
            for (const auto& item : doc) events.push_back(item.get<event>());
        } else if (doc.is_object()) {
            events.push_back(doc.get<event>());
        } else {
            throw std::invalid_argument("expected an event object or array");
        }
    } catch (const std::exception& e) {
        m_rejected_format.fetch_add(1, std::memory_order_relaxed);
        return error_reply(400, std::string("invalid event batch: ") + e.what(), "invalid_format");
    }
    if (events.empty()) {
        m_rejected_format.fetch_add(1, std::memory_order_relaxed);
        return error_reply(400, "empty event batch", "invalid_format");
    }

    if (source_id) {
        for (const auto& e : events) {
            if (e.source != *source_id) {
                m_rejected_format.fetch_add(1, std::memory_order_relaxed);
                return error_reply(400, "event source does not match X-Source-ID", "source_mismatch");
            }
        }
    }

    if (std::chrono::steady_clock::now() > deadline) {
        m_ctx->log->warn("batch from '{}' exceeded the {}ms processing budget",
                         bucket_key, cfg.request_timeout_ms);
        return error_reply(503, "request processing timed out", "timeout");
    }

    for (const auto& e : events) m_ctx->broadcaster->publish(e);

    m_accepted_batches.fetch_add(1, std::memory_order_relaxed);
    m_accepted_events.fetch_add(events.size(), std::memory_order_relaxed);
    m_ctx->log->debug("accepted {} events from '{}'", events.size(), bucket_key);

    http_reply r;
    r.status = 202;
    r.body = nlohmann::json{{"accepted", events.size()}}.dump();
    r.headers["Content-Type"] = "application/json";
    return r;
}

http_reply ingest_service::health() const {
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - m_ctx->started_at);
    http_reply r;
    r.body = nlohmann::json{
        {"status", "ok"},
        {"connections", m_ctx->broadcaster->subscriber_count()},
        {"uptime_seconds", uptime.count()}
    }.dump();
    r.headers["Content-Type"] = "application/json";
    return r;
}

subscriber_admission ingest_service::admit_subscriber(const std::optional<std::string>& token,
                                                      const std::optional<std::string>& source,
                                                      const std::optional<std::string>& type,
                                                      const std::optional<std::string>& project) {
    subscriber_admission out;
    if (!m_accepting.load()) {
        out.rejection = error_reply(503, "hub is shutting down", "shutting_down");
        return out;
    }
    if (!authorize_subscriber(token)) {
        m_rejected_subscribers.fetch_add(1, std::memory_order_relaxed);
        out.rejection = error_reply(401, "invalid or missing subscriber token", "unauthorized");
        return out;
    }
    auto filter = parse_filter(source, type, project);
    if (!filter) {
        m_rejected_subscribers.fetch_add(1, std::memory_order_relaxed);
        out.rejection = error_reply(400, "unknown event type filter: " + type.value_or(""), "invalid_filter");
        return out;
    }
    out.admitted = true;
    out.filter = std::move(*filter);
    return out;
}

bool ingest_service::authorize_subscriber(const std::optional<std::string>& token) const {
    if (m_ctx->cfg.unsafe_no_auth) return true;
    if (!token || token->empty() || m_ctx->cfg.subscriber_token.empty()) return false;
    return constant_time_equals(*token, m_ctx->cfg.subscriber_token);
}

std::optional<subscriber_filter> ingest_service::parse_filter(const std::optional<std::string>& source,
                                                              const std::optional<std::string>& type,
                                                              const std::optional<std::string>& project) {
    subscriber_filter f;
    if (source && !source->empty()) f.source = *source;
    if (project && !project->empty()) f.project = *project;
    if (type && !type->empty()) {
        auto t = parse_event_type(*type);
        if (!t) return std::nullopt;
        f.type = *t;
    }
    return f;
}

void ingest_service::begin_shutdown() {
    if (m_accepting.exchange(false)) {
        m_ctx->log->info("no longer accepting submissions or subscriptions");
    }
}

bool ingest_service::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_idle_mutex);
    return m_idle_cv.wait_for(lock, timeout, [this] { return m_in_flight == 0; });
}

ingest_service::stats ingest_service::get_stats() const {
    return {
        m_accepted_batches.load(std::memory_order_relaxed),
        m_accepted_events.load(std::memory_order_relaxed),
        m_rejected_auth.load(std::memory_order_relaxed),
        m_rejected_rate.load(std::memory_order_relaxed),
        m_rejected_format.load(std::memory_order_relaxed),
        m_rejected_subscribers.load(std::memory_order_relaxed)
    };
}

} // namespace beacon
