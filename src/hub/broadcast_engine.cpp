#include "hub/broadcast_engine.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>
#include <nlohmann/json.hpp>

namespace beacon {

bool subscriber_filter::matches(const event& e) const {
    if (source && e.source != *source) return false;
    if (type && e.type() != *type) return false;
    if (project) {
        auto p = project_of(e);
        if (!p || *p != *project) return false;
    }
    return true;
}

broadcast_engine::subscription::subscription(uint64_t id_, subscriber_filter filter_,
                                             std::shared_ptr<subscriber_sink> sink_,
                                             asio::any_io_executor ex, uint64_t cursor_)
    : id(id_), filter(std::move(filter_)), sink(std::move(sink_)),
      strand(asio::make_strand(ex)), wakeup(strand), cursor(cursor_),
      connected_at(std::chrono::system_clock::now())
{}

broadcast_engine::broadcast_engine(asio::any_io_executor ex, std::size_t buffer_size,
                                   std::shared_ptr<spdlog::logger> log)
    : m_ex(std::move(ex)), m_log(std::move(log)), m_channel(buffer_size)
{}

broadcast_engine::~broadcast_engine() {
    m_channel.close();
}

void broadcast_engine::publish(const event& e) {
    broadcast_item item;
    item.evt = std::make_shared<const event>(e);
    item.json = std::make_shared<const std::string>(nlohmann::json(e).dump());
    m_channel.send(std::move(item));
    m_published.fetch_add(1, std::memory_order_relaxed);
}

void broadcast_engine::wake(const std::shared_ptr<subscription>& sub) {
    asio::post(sub->strand, [sub] { sub->wakeup.cancel(); });
}

uint64_t broadcast_engine::subscribe(subscriber_filter filter, std::shared_ptr<subscriber_sink> sink) {
    std::shared_ptr<subscription> sub;
    {
        std::lock_guard<std::mutex> lock(m_subs_mutex);
        uint64_t id = m_next_id++;
        sub = std::make_shared<subscription>(id, std::move(filter), std::move(sink),
                                             m_ex, m_channel.head());
        m_subs.emplace(id, sub);
    }

    asio::co_spawn(sub->strand, pump(sub), asio::detached);
    m_log->info("subscriber {} connected ({} active)", sub->id, subscriber_count());
    return sub->id;
}

bool broadcast_engine::unsubscribe(uint64_t id) {
    std::shared_ptr<subscription> sub;
    std::size_t remaining;
    {
        std::lock_guard<std::mutex> lock(m_subs_mutex);
        auto it = m_subs.find(id);
        if (it == m_subs.end()) return false;
        sub = std::move(it->second);
        m_subs.erase(it);
        remaining = m_subs.size();
    }

    sub->active.store(false);
    wake(sub);
    auto connected_for = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now() - sub->connected_at);
    m_log->info("subscriber {} disconnected after {}s ({} active)", id, connected_for.count(), remaining);
    return true;
}

void broadcast_engine::close_all(uint16_t code, const std::string& reason) {
    std::unordered_map<uint64_t, std::shared_ptr<subscription>> subs;
    {
        std::lock_guard<std::mutex> lock(m_subs_mutex);
        subs.swap(m_subs);
    }
    for (auto& [id, sub] : subs) {
        sub->active.store(false);
        sub->sink->close(code, reason);
        wake(sub);
    }
    if (!subs.empty()) {
        m_log->info("closed {} subscribers: {}", subs.size(), reason);
    }
}

std::size_t broadcast_engine::subscriber_count() const {
    std::lock_guard<std::mutex> lock(m_subs_mutex);
    return m_subs.size();
}

broadcast_engine::stats broadcast_engine::get_stats() const {
    return {
        m_published.load(std::memory_order_relaxed),
        m_delivered.load(std::memory_order_relaxed),
        m_lagged.load(std::memory_order_relaxed),
        subscriber_count()
    };
}

asio::awaitable<void> broadcast_engine::pump(std::shared_ptr<subscription> sub) {
    std::weak_ptr<subscription> weak = sub;

    while (sub->active.load()) {
        auto r = m_channel.try_recv(sub->cursor);

        if (r.status == recv_status::ok) {
            if (!sub->filter.matches(*r.value.evt)) continue;
            bool alive = co_await sub->sink->deliver(r.value.json);
            if (!alive) {
                unsubscribe(sub->id);
                break;
            }
            m_delivered.fetch_add(1, std::memory_order_relaxed);
            continue;
        }
        if (r.status == recv_status::lagged) {
            m_lagged.fetch_add(r.missed, std::memory_order_relaxed);
            m_log->warn("subscriber {} lagged, skipped {} events", sub->id, r.missed);
            continue;
        }
        if (r.status == recv_status::closed) break;

        // Empty: park until the next publish or an unsubscribe
        sub->wakeup.expires_at(asio::steady_timer::time_point::max());
        bool parked = m_channel.add_waiter(sub->cursor, [weak] {
            if (auto s = weak.lock()) wake(s);
        });
        if (!parked) continue;

        asio::error_code ec;
        co_await sub->wakeup.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }
}

} // namespace beacon
