#include "monitor/log_parser.hpp"
#include "common/env.hpp"
#include "common/time_format.hpp"
#include "common/url.hpp"
#include <nlohmann/json.hpp>

namespace beacon {

namespace {

// Input fields that may carry a file path, in lookup order
constexpr const char* path_fields[] = {"file_path", "path", "filename", "file", "notebook_path"};

std::optional<std::string> string_field(const nlohmann::json& j, const char* key) {
    if (!j.is_object()) return std::nullopt;
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    auto s = it->get<std::string>();
    if (s.empty()) return std::nullopt;
    return s;
}

// Raw context for a tool invocation. Sensitive values are kept here on purpose
// so privacy_filter sees exactly what the log contained.
tool_payload tool_started(const std::string& session_id, const std::string& name,
                          const nlohmann::json& input, const std::optional<std::string>& project) {
    tool_payload t;
    t.session_id = session_id;
    t.tool = name;
    t.status = tool_status::started;
    t.project = project;

    if (name == "Bash") {
        t.context = string_field(input, "command");
        t.description = string_field(input, "description");
    } else if (name == "Grep" || name == "Glob") {
        t.context = string_field(input, "pattern");
    } else if (name == "WebFetch") {
        t.context = string_field(input, "url");
    } else if (name == "WebSearch") {
        t.context = string_field(input, "query");
    } else {
        for (const char* field : path_fields) {
            if (auto v = string_field(input, field)) {
                t.context = std::move(v);
                break;
            }
        }
    }
    return t;
}

} // namespace

std::string project_from_path(const std::filesystem::path& file) {
    auto dir = file.parent_path().filename().string();
    return url_decode(dir);
}

log_parser::log_parser(std::string source_id, std::size_t max_tracked_sessions,
                       std::shared_ptr<spdlog::logger> log)
    : m_source_id(std::move(source_id)),
      m_max_tracked(max_tracked_sessions > 0 ? max_tracked_sessions : 1),
      m_log(std::move(log))
{}

bool log_parser::touch_session(const std::string& session_id) {
    auto it = m_seen.find(session_id);
    if (it != m_seen.end()) {
        m_lru.splice(m_lru.begin(), m_lru, it->second);
        return false;
    }

    m_lru.push_front(session_id);
    m_seen.emplace(session_id, m_lru.begin());
    if (m_seen.size() > m_max_tracked) {
        m_seen.erase(m_lru.back());
        m_lru.pop_back();
    }
    return true;
}

void log_parser::forget_session(const std::string& session_id) {
    auto it = m_seen.find(session_id);
    if (it == m_seen.end()) return;
    m_lru.erase(it->second);
    m_seen.erase(it);
}

event log_parser::make_event(std::chrono::system_clock::time_point ts,
                             event_payload payload) const {
    return event{generate_event_id(), m_source_id, ts, std::move(payload)};
}

parse_result log_parser::parse_line(const std::filesystem::path& file, std::string_view line) {
    parse_result result;

    line = trim(line);
    if (line.empty()) return result;

    nlohmann::json raw = nlohmann::json::parse(line, nullptr, false);
    if (raw.is_discarded() || !raw.is_object()) {
        ++m_skipped;
        m_log->warn("parser: skipping malformed line in {}", file.filename().string());
        return result;
    }

    auto kind = string_field(raw, "type");
    if (!kind) {
        ++m_skipped;
        m_log->warn("parser: skipping line without type in {}", file.filename().string());
        return result;
    }

    std::string session_id = string_field(raw, "sessionId").value_or(file.stem().string());

    std::optional<std::string> project;
    if (auto cwd = string_field(raw, "cwd")) {
        project = std::filesystem::path(*cwd).filename().string();
    }
    if (!project || project->empty()) project = project_from_path(file);

    auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    std::chrono::system_clock::time_point ts = now;
    if (auto t = string_field(raw, "timestamp")) {
        if (auto parsed = parse_rfc3339(*t)) ts = *parsed;
    }

    std::vector<event_payload> payloads;

    try {
        if (*kind == "assistant") {
            auto msg = raw.find("message");
            if (msg != raw.end() && msg->is_object()) {
                auto content = msg->find("content");
                if (content != msg->end() && content->is_array()) {
                    for (const auto& block : *content) {
                        if (string_field(block, "type") != "tool_use") continue;
                        auto name = string_field(block, "name");
                        if (!name) continue;
                        static const nlohmann::json empty = nlohmann::json::object();
                        auto input = block.find("input");
                        const auto& in = (input != block.end()) ? *input : empty;

                        payloads.emplace_back(tool_started(session_id, *name, in, project));
                        if (*name == "Task" || *name == "Agent") {
                            payloads.emplace_back(agent_payload{session_id, "spawned"});
                        }
                    }
                }
            }
        } else if (*kind == "progress") {
            auto progress = raw.find("progress");
            if (progress != raw.end() && string_field(*progress, "type") == "PostToolUse") {
                if (auto name = string_field(*progress, "tool_name")) {
                    tool_payload t;
                    t.session_id = session_id;
                    t.tool = *name;
                    t.status = tool_status::completed;
                    t.project = project;
                    payloads.emplace_back(std::move(t));
                }
            }
        } else if (*kind == "user") {
            payloads.emplace_back(activity_payload{session_id, project});
        } else if (*kind == "summary") {
            payloads.emplace_back(summary_payload{session_id, string_field(raw, "summary").value_or("")});
            payloads.emplace_back(session_payload{session_id, session_action::ended, *project});
            result.session_finished = true;
        } else if (*kind == "system") {
            if (string_field(raw, "level") == "error") {
                payloads.emplace_back(error_payload{session_id, string_field(raw, "subtype").value_or("unknown")});
            }
        } else {
            m_log->debug("parser: ignoring line type '{}'", *kind);
        }
    } catch (const nlohmann::json::exception& e) {
        ++m_skipped;
        m_log->warn("parser: skipping line in {}: {}", file.filename().string(), e.what());
        return result;
    }

    if (payloads.empty()) return result;

    if (touch_session(session_id)) {
        result.events.push_back(make_event(ts,
            session_payload{session_id, session_action::started, *project}));
    }
    for (auto& p : payloads) {
        result.events.push_back(make_event(ts, std::move(p)));
    }

    if (result.session_finished) forget_session(session_id);
    return result;
}

} // namespace beacon
