#include "monitor/file_cursor.hpp"
#include <fstream>
#include <system_error>

namespace beacon {

namespace fs = std::filesystem;

void file_cursor_map::track_at_end(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    file_cursor c;
    c.offset = ec ? 0 : size;
    m_cursors[path.string()] = std::move(c);
}

void file_cursor_map::track_from_start(const fs::path& path) {
    m_cursors[path.string()] = file_cursor{};
}

read_result file_cursor_map::read_new_lines(const fs::path& path) {
    read_result out;
    auto& cur = m_cursors[path.string()];
    if (cur.retired) return out;

    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        out.missing = true;
        return out;
    }

    if (size < cur.offset) {
        cur.offset = 0;
        cur.partial.clear();
        out.truncated = true;
    }
    if (size == cur.offset) return out;

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        out.missing = true;
        return out;
    }
    in.seekg(static_cast<std::streamoff>(cur.offset));

    std::size_t want = static_cast<std::size_t>(size - cur.offset);
    if (want > max_read_bytes) want = max_read_bytes;
    std::string chunk(want, '\0');
    in.read(chunk.data(), static_cast<std::streamsize>(want));
    chunk.resize(static_cast<std::size_t>(in.gcount()));
    cur.offset += chunk.size();
    out.more = chunk.size() == want && cur.offset < size;

    std::string data = std::move(cur.partial);
    data += chunk;
    cur.partial.clear();

    std::size_t start = 0;
    while (true) {
        auto nl = data.find('\n', start);
        if (nl == std::string::npos) break;
        std::size_t end = nl;
        if (end > start && data[end - 1] == '\r') --end;
        if (end > start) out.lines.emplace_back(data, start, end - start);
        start = nl + 1;
    }
    cur.partial = data.substr(start);
    if (cur.partial.size() > max_read_bytes) cur.partial.clear();
    return out;
}

void file_cursor_map::retire(const fs::path& path) {
    auto it = m_cursors.find(path.string());
    if (it == m_cursors.end()) return;
    it->second.retired = true;
    it->second.partial.clear();
}

void file_cursor_map::forget(const fs::path& path) {
    m_cursors.erase(path.string());
}

std::size_t file_cursor_map::prune() {
    std::size_t removed = 0;
    for (auto it = m_cursors.begin(); it != m_cursors.end();) {
        std::error_code ec;
        if (!fs::exists(it->first, ec)) {
            it = m_cursors.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

bool file_cursor_map::contains(const fs::path& path) const {
    return m_cursors.count(path.string()) > 0;
}

const file_cursor* file_cursor_map::find(const fs::path& path) const {
    auto it = m_cursors.find(path.string());
    return it == m_cursors.end() ? nullptr : &it->second;
}

} // namespace beacon
