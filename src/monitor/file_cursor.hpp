#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace beacon {

struct file_cursor {
    uint64_t offset = 0;
    // Bytes after the last newline, held until the line is completed
    std::string partial;
    // Set once a terminal line was seen; further appends are ignored
    bool retired = false;
};

struct read_result {
    std::vector<std::string> lines;
    bool truncated = false;
    bool missing = false;
    // The read stopped at max_read_bytes; call again for the rest
    bool more = false;
};

// Per-file read positions, keyed by path. Entries for files that disappear
// are evicted by prune(); no OS handle is kept between reads.
class file_cursor_map {
public:
    // Start at the current end of file (no backlog replay).
    void track_at_end(const std::filesystem::path& path);

    // Start at offset 0 (file created after startup).
    void track_from_start(const std::filesystem::path& path);

    // Reads bytes appended since the last call and returns the complete lines.
    // A file shorter than the stored offset was truncated: reading restarts at 0.
    // Untracked files are tracked from the start.
    read_result read_new_lines(const std::filesystem::path& path);

    void retire(const std::filesystem::path& path);
    void forget(const std::filesystem::path& path);

    // Removes entries whose files no longer exist. Returns how many were removed.
    std::size_t prune();

    bool contains(const std::filesystem::path& path) const;
    const file_cursor* find(const std::filesystem::path& path) const;
    std::size_t size() const { return m_cursors.size(); }

    // Upper bound on a single read, to keep one busy file from starving the rest.
    // Callers loop while read_result::more is set.
    static constexpr std::size_t max_read_bytes = 4 * 1024 * 1024;

private:
    std::unordered_map<std::string, file_cursor> m_cursors;
};

} // namespace beacon
