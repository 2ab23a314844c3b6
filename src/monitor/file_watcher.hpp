#pragma once

#include "monitor/file_cursor.hpp"
#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <asio/strand.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

struct inotify_event;

namespace beacon {

// Tails every log file under a root directory using inotify directory watches.
// Files present at startup are read from their current end; files that appear
// later are read from the beginning. When the watch budget runs out the
// watcher keeps going with the directories it already has (degraded mode).
class file_watcher {
public:
    // Returns true when the file is finished and should no longer be read.
    using line_handler = std::function<bool(const std::filesystem::path&, std::string_view)>;

    struct stats {
        std::size_t watched_dirs = 0;
        std::size_t tracked_files = 0;
        uint64_t lines = 0;
        uint64_t skipped_dirs = 0;
        bool degraded = false;
    };

    file_watcher(asio::any_io_executor ex,
                 std::filesystem::path root,
                 std::string extension,
                 std::size_t max_watches,
                 line_handler handler,
                 std::shared_ptr<spdlog::logger> log);
    ~file_watcher();

    file_watcher(const file_watcher&) = delete;
    file_watcher& operator=(const file_watcher&) = delete;

    // Creates the inotify instance, scans the tree and registers watches.
    // Throws std::runtime_error if inotify is unavailable.
    void start();

    // Event loop; run on strand(). Returns after stop().
    asio::awaitable<void> run();

    // Thread-safe.
    void stop();

    asio::strand<asio::any_io_executor>& strand() { return m_strand; }

    stats get_stats() const;

    // Host ceiling from /proc/sys/fs/inotify/max_user_watches, 8192 if unreadable.
    static std::size_t host_watch_limit();

private:
    void scan(const std::filesystem::path& dir, bool initial);
    bool add_watch(const std::filesystem::path& dir);
    void handle_event(const inotify_event& ev);
    void read_file(const std::filesystem::path& file);
    void rescan();
    bool is_log_file(const std::filesystem::path& p) const;

    asio::strand<asio::any_io_executor> m_strand;
    asio::posix::stream_descriptor m_inotify;
    std::filesystem::path m_root;
    std::string m_extension;
    std::size_t m_watch_budget;
    line_handler m_handler;
    std::shared_ptr<spdlog::logger> m_log;

    file_cursor_map m_cursors;
    std::unordered_map<int, std::filesystem::path> m_wd_to_dir;
    std::unordered_map<std::string, int> m_dir_to_wd;
    bool m_stopping = false;
    bool m_degraded_logged = false;

    std::atomic<std::size_t> m_watched{0};
    std::atomic<std::size_t> m_tracked{0};
    std::atomic<uint64_t> m_lines{0};
    std::atomic<uint64_t> m_skipped_dirs{0};
    std::atomic<bool> m_degraded{false};
};

} // namespace beacon
