#include "monitor/file_watcher.hpp"
#include <asio/post.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>
#include <sys/inotify.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace beacon {

namespace fs = std::filesystem;

static constexpr uint32_t dir_mask =
    IN_MODIFY | IN_CREATE | IN_MOVED_TO | IN_DELETE | IN_MOVED_FROM | IN_DELETE_SELF;

std::size_t file_watcher::host_watch_limit() {
    std::ifstream in("/proc/sys/fs/inotify/max_user_watches");
    std::size_t limit = 0;
    if (in >> limit && limit > 0) return limit;
    return 8192;
}

file_watcher::file_watcher(asio::any_io_executor ex,
                           fs::path root,
                           std::string extension,
                           std::size_t max_watches,
                           line_handler handler,
                           std::shared_ptr<spdlog::logger> log)
    : m_strand(asio::make_strand(ex)),
      m_inotify(m_strand),
      m_root(std::move(root)),
      m_extension(std::move(extension)),
      m_handler(std::move(handler)),
      m_log(std::move(log))
{
    // Leave headroom for other inotify users on the host
    m_watch_budget = max_watches > 0 ? max_watches : host_watch_limit() * 9 / 10;
    if (m_watch_budget == 0) m_watch_budget = 1;
}

file_watcher::~file_watcher() {
    asio::error_code ec;
    m_inotify.close(ec);
}

void file_watcher::start() {
    int fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        throw std::runtime_error(std::string("watcher: inotify_init1 failed: ") + std::strerror(errno));
    }
    m_inotify.assign(fd);

    std::error_code ec;
    if (!fs::is_directory(m_root, ec)) {
        fs::create_directories(m_root, ec);
        if (ec) {
            throw std::runtime_error("watcher: cannot create " + m_root.string() + ": " + ec.message());
        }
        m_log->info("watcher: created missing watch root {}", m_root.string());
    }

    scan(m_root, true);
    m_log->info("watcher: watching {} ({} directories, {} files, budget {})",
               m_root.string(), m_watched.load(), m_tracked.load(), m_watch_budget);
}

bool file_watcher::is_log_file(const fs::path& p) const {
    return p.extension() == m_extension;
}

bool file_watcher::add_watch(const fs::path& dir) {
    if (m_dir_to_wd.count(dir.string())) return true;

    if (m_wd_to_dir.size() >= m_watch_budget) {
        m_skipped_dirs.fetch_add(1, std::memory_order_relaxed);
        m_degraded.store(true);
        if (!m_degraded_logged) {
            m_log->warn("watcher: watch budget of {} reached, continuing in degraded mode "
                        "(new subdirectories are not watched)", m_watch_budget);
            m_degraded_logged = true;
        }
        return false;
    }

    int wd = inotify_add_watch(m_inotify.native_handle(), dir.c_str(), dir_mask);
    if (wd < 0) {
        int err = errno;
        if (err == ENOSPC) {
            m_skipped_dirs.fetch_add(1, std::memory_order_relaxed);
            m_degraded.store(true);
            if (!m_degraded_logged) {
                m_log->warn("watcher: host inotify watch limit reached at {} watches, "
                            "continuing in degraded mode", m_wd_to_dir.size());
                m_degraded_logged = true;
            }
        } else {
            m_log->warn("watcher: cannot watch {}: {}", dir.string(), std::strerror(err));
        }
        return false;
    }

    m_wd_to_dir[wd] = dir;
    m_dir_to_wd[dir.string()] = wd;
    m_watched.store(m_wd_to_dir.size());
    return true;
}

void file_watcher::scan(const fs::path& dir, bool initial) {
    if (!add_watch(dir)) return;

    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& path = it->path();
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            scan(path, initial);
        } else if (it->is_regular_file(type_ec) && is_log_file(path)) {
            if (m_cursors.contains(path)) continue;
            if (initial) {
                m_cursors.track_at_end(path);
            } else {
                m_cursors.track_from_start(path);
                read_file(path);
            }
        }
    }
    if (ec) m_log->warn("watcher: cannot list {}: {}", dir.string(), ec.message());
    m_tracked.store(m_cursors.size());
}

void file_watcher::read_file(const fs::path& file) {
    auto result = m_cursors.read_new_lines(file);
    if (result.missing) {
        m_cursors.forget(file);
        m_tracked.store(m_cursors.size());
        return;
    }
    if (result.truncated) {
        m_log->info("watcher: {} was truncated, reading from the start", file.filename().string());
    }

    for (const auto& line : result.lines) {
        m_lines.fetch_add(1, std::memory_order_relaxed);
        if (m_handler(file, line)) {
            m_cursors.retire(file);
            m_log->debug("watcher: {} finished, no longer reading", file.filename().string());
            return;
        }
    }

    // Large append: finish it in slices so other files get their turn
    if (result.more) {
        asio::post(m_strand, [this, file] {
            if (!m_stopping) read_file(file);
        });
    }
}

void file_watcher::rescan() {
    m_log->warn("watcher: inotify queue overflowed, rescanning {}", m_root.string());
    scan(m_root, false);
    std::vector<fs::path> files;
    for (const auto& [dir, wd] : m_dir_to_wd) {
        std::error_code ec;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            if (is_log_file(it->path())) files.push_back(it->path());
        }
    }
    for (const auto& f : files) read_file(f);
    m_cursors.prune();
    m_tracked.store(m_cursors.size());
}

void file_watcher::handle_event(const inotify_event& ev) {
    if (ev.mask & IN_Q_OVERFLOW) {
        rescan();
        return;
    }

    auto dir_it = m_wd_to_dir.find(ev.wd);
    if (dir_it == m_wd_to_dir.end()) return;

    if (ev.mask & IN_IGNORED) {
        m_dir_to_wd.erase(dir_it->second.string());
        m_wd_to_dir.erase(dir_it);
        m_watched.store(m_wd_to_dir.size());
        return;
    }
    if (ev.len == 0) return;

    fs::path path = dir_it->second / ev.name;

    if (ev.mask & IN_ISDIR) {
        if (ev.mask & (IN_CREATE | IN_MOVED_TO)) scan(path, false);
        return;
    }
    if (!is_log_file(path)) return;

    if (ev.mask & (IN_DELETE | IN_MOVED_FROM)) {
        m_cursors.forget(path);
    } else if (ev.mask & (IN_CREATE | IN_MOVED_TO)) {
        if (!m_cursors.contains(path)) m_cursors.track_from_start(path);
        read_file(path);
    } else if (ev.mask & IN_MODIFY) {
        read_file(path);
    }
    m_tracked.store(m_cursors.size());
}

asio::awaitable<void> file_watcher::run() {
    alignas(inotify_event) char buf[64 * 1024];

    while (!m_stopping) {
        asio::error_code ec;
        co_await m_inotify.async_wait(asio::posix::stream_descriptor::wait_read,
                                      asio::redirect_error(asio::use_awaitable, ec));
        if (ec || m_stopping) break;

        while (true) {
            ssize_t n = ::read(m_inotify.native_handle(), buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR) continue;
                if (errno != EAGAIN) {
                    m_log->error("watcher: inotify read failed: {}", std::strerror(errno));
                }
                break;
            }
            if (n == 0) break;

            for (char* p = buf; p < buf + n;) {
                auto* ev = reinterpret_cast<inotify_event*>(p);
                handle_event(*ev);
                p += sizeof(inotify_event) + ev->len;
            }
        }
    }
    m_log->info("watcher: stopped");
}

void file_watcher::stop() {
    asio::post(m_strand, [this] {
        m_stopping = true;
        asio::error_code ec;
        m_inotify.cancel(ec);
    });
}

file_watcher::stats file_watcher::get_stats() const {
    return {
        m_watched.load(),
        m_tracked.load(),
        m_lines.load(std::memory_order_relaxed),
        m_skipped_dirs.load(std::memory_order_relaxed),
        m_degraded.load()
    };
}

} // namespace beacon
