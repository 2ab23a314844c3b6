#pragma once

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/post.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <memory>

namespace beacon {

// One-shot result of an operation that finishes on another executor (a
// socket write), handed back to the coroutine waiting for it. The waiting
// coroutine must run on `ex`, which must be a strand or single-threaded.
class write_signal : public std::enable_shared_from_this<write_signal> {
public:
    explicit write_signal(asio::any_io_executor ex)
        : m_timer(ex, asio::steady_timer::time_point::max())
    {}

    // Thread-safe. Only the first call counts.
    void complete(bool ok) {
        asio::post(m_timer.get_executor(), [self = shared_from_this(), ok] {
            if (self->m_done) return;
            self->m_done = true;
            self->m_ok = ok;
            self->m_timer.cancel();
        });
    }

    // Suspends until complete() and returns its value.
    asio::awaitable<bool> wait() {
        while (!m_done) {
            asio::error_code ec;
            co_await m_timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        }
        co_return m_ok;
    }

    bool done() const { return m_done; }

private:
    asio::steady_timer m_timer;
    bool m_done = false;
    bool m_ok = false;
};

} // namespace beacon
