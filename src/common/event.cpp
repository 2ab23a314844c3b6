#include "common/event.hpp"
#include "common/time_format.hpp"
#include <openssl/rand.h>
#include <stdexcept>

namespace beacon {

const char* to_string(event_type t) {
    switch (t) {
        case event_type::session:  return "session";
        case event_type::activity: return "activity";
        case event_type::tool:     return "tool";
        case event_type::agent:    return "agent";
        case event_type::summary:  return "summary";
        case event_type::error:    return "error";
    }
    return "unknown";
}

const char* to_string(session_action a) {
    return a == session_action::started ? "started" : "ended";
}

const char* to_string(tool_status s) {
    return s == tool_status::started ? "started" : "completed";
}

std::optional<event_type> parse_event_type(std::string_view s) {
    if (s == "session")  return event_type::session;
    if (s == "activity") return event_type::activity;
    if (s == "tool")     return event_type::tool;
    if (s == "agent")    return event_type::agent;
    if (s == "summary")  return event_type::summary;
    if (s == "error")    return event_type::error;
    return std::nullopt;
}

std::optional<session_action> parse_session_action(std::string_view s) {
    if (s == "started") return session_action::started;
    if (s == "ended")   return session_action::ended;
    return std::nullopt;
}

std::optional<tool_status> parse_tool_status(std::string_view s) {
    if (s == "started")   return tool_status::started;
    if (s == "completed") return tool_status::completed;
    return std::nullopt;
}

const std::string& event::session_id() const {
    return std::visit([](const auto& p) -> const std::string& { return p.session_id; }, payload);
}

namespace {

nlohmann::json payload_to_json(const event_payload& payload) {
    nlohmann::json j = nlohmann::json::object();
    std::visit([&j](const auto& p) { j["sessionId"] = p.session_id; }, payload);

    if (auto* s = std::get_if<session_payload>(&payload)) {
        j["action"] = to_string(s->action);
        j["project"] = s->project;
    } else if (auto* a = std::get_if<activity_payload>(&payload)) {
        if (a->project) j["project"] = *a->project;
    } else if (auto* t = std::get_if<tool_payload>(&payload)) {
        j["tool"] = t->tool;
        j["status"] = to_string(t->status);
        if (t->context) j["context"] = *t->context;
        if (t->project) j["project"] = *t->project;
    } else if (auto* ag = std::get_if<agent_payload>(&payload)) {
        j["state"] = ag->state;
    } else if (auto* su = std::get_if<summary_payload>(&payload)) {
        j["summary"] = su->summary;
    } else if (auto* er = std::get_if<error_payload>(&payload)) {
        j["category"] = er->category;
    }
    return j;
}

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<std::string>();
}

event_payload payload_from_json(event_type type, const nlohmann::json& j) {
    if (!j.is_object()) throw std::invalid_argument("payload must be an object");
    std::string session_id = j.at("sessionId").get<std::string>();

    switch (type) {
        case event_type::session: {
            auto action = parse_session_action(j.at("action").get<std::string>());
            if (!action) throw std::invalid_argument("invalid session action");
            return session_payload{session_id, *action, j.at("project").get<std::string>()};
        }
        case event_type::activity:
            return activity_payload{session_id, optional_string(j, "project")};
        case event_type::tool: {
            auto status = parse_tool_status(j.at("status").get<std::string>());
            if (!status) throw std::invalid_argument("invalid tool status");
            tool_payload t;
            t.session_id = session_id;
            t.tool = j.at("tool").get<std::string>();
            t.status = *status;
            t.context = optional_string(j, "context");
            t.project = optional_string(j, "project");
            return t;
        }
        case event_type::agent:
            return agent_payload{session_id, j.at("state").get<std::string>()};
        case event_type::summary:
            return summary_payload{session_id, j.at("summary").get<std::string>()};
        case event_type::error:
            return error_payload{session_id, j.at("category").get<std::string>()};
    }
    throw std::invalid_argument("unknown event type");
}

} // namespace

void to_json(nlohmann::json& j, const event& e) {
    j = nlohmann::json{
        {"id", e.id},
        {"source", e.source},
        {"timestamp", format_rfc3339(e.timestamp)},
        {"type", to_string(e.type())},
        {"payload", payload_to_json(e.payload)}
    };
}

void from_json(const nlohmann::json& j, event& e) {
    if (!j.is_object()) throw std::invalid_argument("event must be an object");

    e.id = j.at("id").get<std::string>();
    if (e.id.empty()) throw std::invalid_argument("event id must not be empty");
    e.source = j.at("source").get<std::string>();

    auto ts = parse_rfc3339(j.at("timestamp").get<std::string>());
    if (!ts) throw std::invalid_argument("invalid timestamp");
    e.timestamp = *ts;

    auto type = parse_event_type(j.at("type").get<std::string>());
    if (!type) throw std::invalid_argument("unknown event type");
    e.payload = payload_from_json(*type, j.at("payload"));
}

std::string generate_event_id() {
    static constexpr char alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    static constexpr std::size_t alphabet_size = sizeof(alphabet) - 1;
    // Largest multiple of 36 below 256, keeps the mapping unbiased
    static constexpr unsigned limit = 252;

    std::string id = "evt_";
    unsigned char buf[32];
    while (id.size() < 24) {
        if (RAND_bytes(buf, sizeof(buf)) != 1) {
            throw std::runtime_error("event id: RAND_bytes failed");
        }
        for (unsigned char b : buf) {
            if (b >= limit) continue;
            id.push_back(alphabet[b % alphabet_size]);
            if (id.size() == 24) break;
        }
    }
    return id;
}

std::optional<std::string> project_of(const event& e) {
    if (auto* s = std::get_if<session_payload>(&e.payload)) return s->project;
    if (auto* a = std::get_if<activity_payload>(&e.payload)) return a->project;
    if (auto* t = std::get_if<tool_payload>(&e.payload)) return t->project;
    return std::nullopt;
}

} // namespace beacon
