#pragma once

#include "common/event.hpp"
#include "common/url.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <list>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace beacon {

struct parse_result {
    std::vector<event> events;
    // A terminal summary line was seen; the file can be retired.
    bool session_finished = false;
};

// Turns assistant session log lines (one JSON object per line) into events.
//
//   assistant + tool_use blocks   -> tool started (and agent "spawned" for Task/Agent)
//   progress + PostToolUse        -> tool completed
//   user                          -> activity
//   summary                       -> summary, then session ended
//   system with level "error"     -> error
//
// The first event of a session not seen before is preceded by a synthetic
// session started event. Output still carries raw paths, commands and patterns;
// privacy_filter must run before anything leaves the process.
//
// Not thread-safe: driven from the watcher strand only.
class log_parser {
public:
    log_parser(std::string source_id, std::size_t max_tracked_sessions,
               std::shared_ptr<spdlog::logger> log);

    // Never throws. Malformed or unrecognized lines produce an empty result.
    parse_result parse_line(const std::filesystem::path& file, std::string_view line);

    std::size_t tracked_sessions() const { return m_seen.size(); }
    uint64_t skipped_lines() const { return m_skipped; }

private:
    // True if the session was not tracked before.
    bool touch_session(const std::string& session_id);
    void forget_session(const std::string& session_id);

    event make_event(std::chrono::system_clock::time_point ts,
                     event_payload payload) const;

    std::string m_source_id;
    std::size_t m_max_tracked;
    std::shared_ptr<spdlog::logger> m_log;

    // LRU of session ids, most recent at the front
    std::list<std::string> m_lru;
    std::unordered_map<std::string, std::list<std::string>::iterator> m_seen;
    uint64_t m_skipped = 0;
};

// Project name for a log file: URL-decoded name of its parent directory.
std::string project_from_path(const std::filesystem::path& file);

} // namespace beacon
